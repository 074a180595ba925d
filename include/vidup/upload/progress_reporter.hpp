#pragma once

#include "vidup/events/event_bus.hpp"
#include "vidup/upload/types.hpp"

#include <cstdint>

namespace vidup::upload {

/**
 * @brief Derives a 0-100 completion value from a session and publishes it
 *
 * Holds no state of its own: the percentage is always recomputed from the
 * server-confirmed offset.
 */
class ProgressReporter {
public:
    explicit ProgressReporter(events::EventBus& bus) : bus_(bus) {}

    /// round(offset / total_size * 100), clamped to [0, 100]; 0 when total_size == 0
    static int percent(std::uint64_t offset, std::uint64_t total_size) noexcept;

    /// Publish an UploadProgressEvent for the session's current offset
    void report(const UploadSession& session) const;

private:
    events::EventBus& bus_;
};

} // namespace vidup::upload
