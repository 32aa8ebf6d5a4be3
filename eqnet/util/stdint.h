#pragma once

#include <cstddef>
#include <cstdint>


// Neuron ids and edge indices are int_, user-facing ids (which may be out of
// range and must be checked) are long_.
using int_ = std::int32_t;
using long_ = std::int64_t;
using ulong_ = std::uint64_t;
using size_ = std::size_t;

inline constexpr size_ operator"" _sz( unsigned long long n ) { return n; }
