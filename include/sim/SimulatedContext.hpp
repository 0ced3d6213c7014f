#pragma once
#include "trade/IBarDataSource.hpp"
#include "trade/IClock.hpp"
#include <memory>
#include <stdexcept>

namespace sim {

// The outside world a simulated environment runs in: where time comes from
// and where historical prices come from. Both are shared so callers can keep
// driving the clock after handing it over.
class SimulatedContext {
public:
    SimulatedContext(std::shared_ptr<trade::IBarDataSource> bar_data_source,
                     std::shared_ptr<trade::IClock> clock)
        : bar_data_source_(std::move(bar_data_source)), clock_(std::move(clock)) {
        if (!bar_data_source_ || !clock_) {
            throw std::invalid_argument("SimulatedContext requires a bar data source and a clock");
        }
    }

    const trade::IClock& clock() const { return *clock_; }
    const trade::IBarDataSource& bar_data_source() const { return *bar_data_source_; }

private:
    std::shared_ptr<trade::IBarDataSource> bar_data_source_;
    std::shared_ptr<trade::IClock> clock_;
};

}
