//
// Created by Giuseppe Francione on 15/01/26.
//

#ifndef WEBPRESS_PROGRESS_HPP
#define WEBPRESS_PROGRESS_HPP

#include <optional>

namespace webpress {

/**
 * @brief Maps processed/total work units to a percentage.
 * @return std::nullopt when total <= 0, otherwise a value in [0, 100].
 */
[[nodiscard]] constexpr std::optional<int> progress_percent(const long long processed,
                                                            const long long total) noexcept {
    if (total <= 0) return std::nullopt;
    if (processed <= 0) return 0;
    if (processed >= total) return 100;
    return static_cast<int>(processed * 100 / total);
}

/**
 * @brief Keeps emitted percentages non-decreasing within one run.
 */
class ProgressTracker {
public:
    /**
     * @return The percentage to emit, or std::nullopt if it would not
     * advance past the last emitted value.
     */
    std::optional<int> update(const long long processed, const long long total) noexcept {
        const auto pct = progress_percent(processed, total);
        if (!pct) return std::nullopt;
        return advance_to(*pct);
    }

    std::optional<int> advance_to(const int percent) noexcept {
        if (percent <= last_) return std::nullopt;
        last_ = percent > 100 ? 100 : percent;
        return last_;
    }

    [[nodiscard]] int last() const noexcept { return last_; }

private:
    int last_ = -1;
};

} // namespace webpress

#endif // WEBPRESS_PROGRESS_HPP
