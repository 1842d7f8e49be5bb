#pragma once

/// @file event.hpp
/// @brief Main include header for critter_event
///
/// ```cpp
/// critter_event::EventLog<MyEvent> log;
///
/// auto sub_id = log.subscribe([](const MyEvent& e) {
///     // Handle event
/// });
///
/// log.publish(MyEvent{...});
/// log.process();             // deliver to subscribers
/// auto all = log.history();  // everything published so far
/// ```

#include "fwd.hpp"
#include "event_log.hpp"
