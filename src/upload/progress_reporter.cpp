#include "vidup/upload/progress_reporter.hpp"
#include "vidup/events/events.hpp"

#include <algorithm>
#include <cmath>

namespace vidup::upload {

int ProgressReporter::percent(std::uint64_t offset, std::uint64_t total_size) noexcept {
    if (total_size == 0) {
        return 0;
    }
    const double ratio = static_cast<double>(offset) / static_cast<double>(total_size);
    const auto rounded = static_cast<long long>(std::llround(ratio * 100.0));
    return static_cast<int>(std::clamp(rounded, 0LL, 100LL));
}

void ProgressReporter::report(const UploadSession& session) const {
    events::UploadProgressEvent event;
    event.session_id = session.session_id;
    event.offset = session.offset;
    event.total_size = session.total_size;
    event.percent = percent(session.offset, session.total_size);
    bus_.emit(event);
}

} // namespace vidup::upload
