#pragma once
#include <SOVEC/Containers/HeapStore.hpp>
#include <SOVEC/Containers/InlineStore.hpp>
#include <SOVEC/Containers/SmallVector.hpp>
#include <SOVEC/Defines.hpp>
#include <SOVEC/Memory/AllocatorConcept.hpp>
#include <SOVEC/Memory/AllocatorRef.hpp>
#include <SOVEC/Memory/SystemAllocator.hpp>
#include <SOVEC/Memory/TrackingAllocator.hpp>
#include <SOVEC/Primitives.hpp>
