#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include "ReviewRecord.hpp"

// SM-2 quality grades as shown to the learner.
enum class ReviewQuality {
    BLACKOUT = 0,
    INCORRECT = 1,
    INCORRECT_FAMILIAR = 2,
    DIFFICULT = 3,
    CORRECT = 4,
    PERFECT = 5
};

/*
  Classic SM-2 (SuperMemo 2) scheduler.
   - Easiness factor updates on every rating, floored at ease_min
   - Ratings >= pass_threshold grow the interval 1 -> 6 -> interval * EF
   - Failing ratings reset repetitions and bring the card back the next day
   - Intervals saturate at ReviewRecord::MAX_INTERVAL_DAYS and never push the
     review day past INT_MAX

  The scheduler is stateless after construction: schedule() is const, has no
  side effects and may be called from any thread.
*/
class Scheduler {
public:
    Scheduler();

    ReviewRecord schedule(const ReviewRecord& record, int quality, int today) const;
    ReviewRecord schedule(const ReviewRecord& record, ReviewQuality quality, int today) const;

    bool isPassing(int quality) const { return quality >= pass_threshold; }

    // Throws InvalidRating outside [0,5].
    static ReviewQuality qualityFromInt(int quality);
    static std::string qualityLabel(ReviewQuality quality);

    double ease_min;
    double ease_default;
    int pass_threshold;

private:
    double updatedEase(double ease, int quality) const;
    int passingInterval(int previousInterval, int newRepetitions, double newEase) const;
    int cappedInterval(long long interval, int today) const;
};
