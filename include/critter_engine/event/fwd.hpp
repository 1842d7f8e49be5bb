#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for critter_event

#include <cstdint>

namespace critter_event {

// IDs
struct SubscriberId;

// Core types
template<typename E>
class EventLog;

} // namespace critter_event
