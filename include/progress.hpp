#ifndef PROGRESS_HPP
#define PROGRESS_HPP
#include <cstddef>
#include <functional>
#include <utility>

namespace ghbackup {

/// Progress reported before the directory service is queried.
constexpr int LISTING_START_PERCENT = 0;
/// Progress reported once the listing succeeded; the transfer phase starts here.
constexpr int LISTING_DONE_PERCENT = 10;
constexpr int COMPLETE_PERCENT = 100;

/**
 * @brief Percentage after @p completed of @p total repositories finished.
 *
 * Maps the transfer phase linearly onto (10, 100] using integer floor
 * division, so the last repository always lands on exactly 100. A
 * @p total of zero means nothing to transfer and yields 100.
 */
int percent_for(size_t completed, size_t total);

/**
 * @brief Forwards progress values, dropping any that would go backwards.
 */
class ProgressReporter {
  public:
    explicit ProgressReporter(std::function<void(int)> sink) : sink_(std::move(sink)) {}

    /** Emit @p percent (clamped to [0,100]) unless it is below the last value. */
    void report(int percent);

    /** @return Last value emitted, or -1 before the first report. */
    int last() const { return last_; }

  private:
    std::function<void(int)> sink_;
    int last_ = -1;
};

} // namespace ghbackup

#endif // PROGRESS_HPP
