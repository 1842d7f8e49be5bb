#pragma once

/// @file structures.hpp
/// @brief Main include for critter_structures module
///
/// - FixedPool<T, N>: fixed-capacity swap-remove arena
///
/// @example Basic usage:
/// @code
/// #include <critter_engine/structures/structures.hpp>
///
/// using namespace critter_structures;
///
/// FixedPool<std::uint64_t, 20> pool(10);
/// pool.push(7);
/// pool.swap_remove(0);
/// @endcode

#include "fixed_pool.hpp"
