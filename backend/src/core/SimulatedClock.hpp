#pragma once

// Simulated "current day". Only advanceDay() moves it, one day at a time.
// Owned by a single caller; not synchronized.
class SimulatedClock {
public:
    explicit SimulatedClock(int startDay = 0);

    int today() const { return current_day; }
    void advanceDay();

private:
    int current_day;
};
