// main.cpp
#include <iostream>
#include <string>

#include <SOVEC/SOVEC.hpp>

using SOVEC::Containers::SmallVector;
using Tracked    = SOVEC::Memory::Tracking<SOVEC::Memory::SystemAllocator>;
using TrackedRef = SOVEC::Memory::AllocatorRef<Tracked>;

namespace
{
    template<class Vec>
    void Report(const char* label, const Vec& vec, const Tracked& tracked)
    {
        const auto& stats = tracked.GetStats();
        std::cout << "[" << label << "] size=" << vec.Size() << " capacity=" << vec.Capacity()
                  << (vec.IsInline() ? " (inline)" : " (heap)") << " liveBlocks=" << stats.currentCount
                  << " liveBytes=" << stats.currentBytes << "\n";
    }
}// namespace

int main()
{
    Tracked tracked;
    {
        SmallVector<char, TrackedRef> letters(TrackedRef {tracked});
        std::cout << "inline capacity for char: " << SmallVector<char, TrackedRef>::InlineCapacity << "\n";

        for (char c = 'a'; letters.Size() < letters.Capacity(); ++c)
            letters.Push(c);
        Report("filled inline", letters, tracked);

        letters.ReserveExact(8);
        Report("after ReserveExact(8)", letters, tracked);

        for (int i = 0; i < 8; ++i)
            letters.Push('!');
        letters.ShrinkToFit();
        Report("after ShrinkToFit", letters, tracked);

        std::string text(letters.begin(), letters.end());
        std::cout << "contents: " << text << "\n";

        while (auto last = letters.Pop())
        {
            if (*last != '!')
                break;
        }
        Report("after popping the tail", letters, tracked);
    }

    std::cout << "balanced after destruction: " << (tracked.IsBalanced() ? "yes" : "no") << "\n";
    return tracked.IsBalanced() ? 0 : 1;
}
