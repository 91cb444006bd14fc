#include "SimulatedClock.hpp"
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

SimulatedClock::SimulatedClock(int startDay)
    : current_day(startDay)
{
    if (startDay < 0) {
        spdlog::error("Refusing negative start day {}", startDay);
        throw std::invalid_argument("simulated clock cannot start at day " + std::to_string(startDay));
    }
    spdlog::debug("SimulatedClock starting at day {}", current_day);
}

void SimulatedClock::advanceDay() {
    ++current_day;
    spdlog::info("Advanced simulated clock to day {}", current_day);
}
