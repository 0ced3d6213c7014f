#pragma once
#include "trade/IClock.hpp"
#include <chrono>

namespace sim {

// Wall-clock time, for running the simulator alongside real time.
class SystemClock : public trade::IClock {
public:
    trade::TimePoint now() const override { return std::chrono::system_clock::now(); }
};

// Time only moves when told to. Drives replays and tests deterministically.
class ManualClock : public trade::IClock {
public:
    explicit ManualClock(trade::TimePoint start = trade::TimePoint{}) : now_(start) {}

    trade::TimePoint now() const override { return now_; }

    void set(trade::TimePoint tp) { now_ = tp; }
    void advance(trade::Duration d) { now_ += d; }

private:
    trade::TimePoint now_;
};

}
