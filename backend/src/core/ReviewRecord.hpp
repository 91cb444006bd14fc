#pragma once
#include <limits>

// Per-card SM-2 scheduling state. Day values are indices relative to the
// SimulatedClock epoch.
struct ReviewRecord {
    // Longest interval the scheduler hands out (50 years)
    static constexpr int MAX_INTERVAL_DAYS = 365 * 50;
    // Latest day a record may be due on, so that day + interval fits in an int
    static constexpr int MAX_DAY = std::numeric_limits<int>::max() - MAX_INTERVAL_DAYS;

    double easiness_factor = 2.5;
    int interval_days = 0;
    int repetitions = 0;
    int next_review_day = 0;

    // Untouched record for a card added on `today`: due immediately.
    static ReviewRecord fresh(int today) {
        ReviewRecord r;
        r.next_review_day = today;
        return r;
    }

    bool isDue(int today) const { return next_review_day <= today; }

    bool operator==(const ReviewRecord& o) const {
        return easiness_factor == o.easiness_factor
            && interval_days == o.interval_days
            && repetitions == o.repetitions
            && next_review_day == o.next_review_day;
    }
    bool operator!=(const ReviewRecord& o) const { return !(*this == o); }
};
