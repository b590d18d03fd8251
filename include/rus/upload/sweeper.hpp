#pragma once

#include "rus/events/event_bus.hpp"
#include "rus/upload/registry.hpp"
#include "rus/upload/storage.hpp"

#include <string>
#include <vector>

namespace rus::upload {

/**
 * @brief Remove every upload that expired at or before `now`, with its bytes
 *
 * Holds no state of its own; the caller decides when to run it (the server
 * drives it from a steady_timer). Emits UploadExpiredEvent per id when a bus
 * is given.
 *
 * @return ids that were removed
 */
std::vector<std::string> sweep_expired(UploadRegistry& registry,
                                       StorageBackend& storage,
                                       Clock::time_point now,
                                       events::EventBus* bus = nullptr);

} // namespace rus::upload
