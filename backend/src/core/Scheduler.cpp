#include "Scheduler.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

Scheduler::Scheduler()
    : ease_min(1.3),
    ease_default(2.5),
    pass_threshold(3)
{
    spdlog::debug("Scheduler (SM-2) initialized: ease_min={} pass_threshold={}", ease_min, pass_threshold);
}

ReviewQuality Scheduler::qualityFromInt(int quality) {
    if (quality < 0 || quality > 5) {
        throw InvalidRating(quality);
    }
    return static_cast<ReviewQuality>(quality);
}

std::string Scheduler::qualityLabel(ReviewQuality quality) {
    switch (quality) {
    case ReviewQuality::BLACKOUT: return "Blackout";
    case ReviewQuality::INCORRECT: return "Wrong";
    case ReviewQuality::INCORRECT_FAMILIAR: return "Wrong (familiar)";
    case ReviewQuality::DIFFICULT: return "Difficult";
    case ReviewQuality::CORRECT: return "Correct";
    case ReviewQuality::PERFECT: return "Perfect";
    }
    return "Unknown";
}

ReviewRecord Scheduler::schedule(const ReviewRecord& record, int quality, int today) const {
    return schedule(record, qualityFromInt(quality), today);
}

ReviewRecord Scheduler::schedule(const ReviewRecord& record, ReviewQuality grade, int today) const {
    const int quality = static_cast<int>(grade);

    ReviewRecord next;
    next.easiness_factor = updatedEase(record.easiness_factor, quality);

    long long interval = 1;
    if (isPassing(quality)) {
        const int reps = std::max(0, record.repetitions);
        next.repetitions = reps < std::numeric_limits<int>::max() ? reps + 1 : reps;
        interval = passingInterval(record.interval_days, next.repetitions, next.easiness_factor);
    }
    else {
        // Lapse: start over, due again on the next simulated day
        next.repetitions = 0;
    }

    next.interval_days = cappedInterval(interval, today);
    next.next_review_day = today + next.interval_days;

    spdlog::debug("SM-2: q={} ef {:.3f}->{:.3f} reps {}->{} interval {}->{} next_day={}",
        quality, record.easiness_factor, next.easiness_factor,
        record.repetitions, next.repetitions,
        record.interval_days, next.interval_days, next.next_review_day);

    return next;
}

int Scheduler::cappedInterval(long long interval, int today) const {
    long long capped = std::clamp(interval, 1LL, static_cast<long long>(ReviewRecord::MAX_INTERVAL_DAYS));

    // today + interval must stay representable
    const long long room = static_cast<long long>(std::numeric_limits<int>::max()) - std::max(0, today);
    if (capped > room) {
        spdlog::warn("Interval {} cut to {} to keep day {} in range", capped, room, today);
        capped = std::max(1LL, room);
    }
    return static_cast<int>(capped);
}

/* -------------------------
   Easiness factor
   -------------------------
   EF' = EF + (0.1 - (5 - q) * (0.08 + (5 - q) * 0.02))
   q=5 adds 0.1, q=4 keeps EF, q=3 subtracts 0.14, q=0 subtracts 0.8.
   Applied for failing ratings too.
*/
double Scheduler::updatedEase(double ease, int quality) const {
    const double miss = 5.0 - static_cast<double>(quality);
    double ef = ease + (0.1 - miss * (0.08 + miss * 0.02));
    return std::max(ease_min, ef);
}

int Scheduler::passingInterval(int previousInterval, int newRepetitions, double newEase) const {
    if (newRepetitions == 1) return 1;
    if (newRepetitions == 2) return 6;

    // Records imported with reps >= 2 but no interval still need to grow
    const double base = static_cast<double>(std::max(1, previousInterval));
    const double grown = base * newEase;
    if (!(grown < static_cast<double>(ReviewRecord::MAX_INTERVAL_DAYS))) {
        return ReviewRecord::MAX_INTERVAL_DAYS;
    }
    return static_cast<int>(std::lround(grown));
}
