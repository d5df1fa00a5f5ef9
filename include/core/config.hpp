// config.hpp
#pragma once
#include <cstddef>
#include <cstdint>

// Compile-time configuration for core facilities.
//
// Index and spin storage types are selectable so that very large sparse
// problems can trade memory for range. Extend here if additional knobs are
// needed by the engine.

#ifndef CORE_INDEX_T
#define CORE_INDEX_T std::uint32_t
#endif

#ifndef CORE_SPIN_T
#define CORE_SPIN_T std::int8_t
#endif

// Global hardening switch for optional runtime assertions in hot paths.
// Set via compile flag: -DCORE_HARDENED=1
#ifndef CORE_HARDENED
#define CORE_HARDENED 0
#endif

#if CORE_HARDENED
#include <stdexcept>
#define CORE_ASSERT_H(cond, msg) do { if(!(cond)) throw std::runtime_error(msg); } while(0)
#else
#define CORE_ASSERT_H(cond, msg) do { } while(0)
#endif

namespace core {

// Variable index as stored in adjacency tables.
using index_t = CORE_INDEX_T;
// Spin value, always -1 or +1 once stored.
using spin_t = CORE_SPIN_T;
using size_t = std::size_t;

inline constexpr spin_t spin_up   = static_cast<spin_t>(+1);
inline constexpr spin_t spin_down = static_cast<spin_t>(-1);

// Normalize any integer to a spin: non-negative -> +1, negative -> -1.
template <class T>
constexpr spin_t to_spin(T value) noexcept {
    return (value >= 0) ? spin_up : spin_down;
}

} // namespace core
