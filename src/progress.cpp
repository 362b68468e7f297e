#include "progress.hpp"

#include <algorithm>

namespace ghbackup {

int percent_for(size_t completed, size_t total) {
    if (total == 0)
        return COMPLETE_PERCENT;
    completed = std::min(completed, total);
    const size_t span = COMPLETE_PERCENT - LISTING_DONE_PERCENT;
    return LISTING_DONE_PERCENT + static_cast<int>(completed * span / total);
}

void ProgressReporter::report(int percent) {
    percent = std::clamp(percent, 0, COMPLETE_PERCENT);
    if (percent < last_)
        return;
    last_ = percent;
    if (sink_)
        sink_(percent);
}

} // namespace ghbackup
