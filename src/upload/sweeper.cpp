#include "rus/upload/sweeper.hpp"

#include "rus/events/events.hpp"

#include <spdlog/spdlog.h>

namespace rus::upload {

std::vector<std::string> sweep_expired(UploadRegistry& registry,
                                       StorageBackend& storage,
                                       Clock::time_point now,
                                       events::EventBus* bus) {
    auto expired = registry.sweep_expired(now);

    for (const auto& id : expired) {
        if (auto res = storage.remove(id); res.is_error()) {
            spdlog::warn("Expired upload {} left data behind: {}", id, res.error().message);
        }
        if (bus) {
            bus->emit(events::UploadExpiredEvent{id});
        }
    }

    if (!expired.empty()) {
        spdlog::info("Expiry sweep removed {} upload(s)", expired.size());
    }
    return expired;
}

} // namespace rus::upload
