#pragma once
#include "trade/MarketDataTypes.hpp"
#include <functional>
#include <string>
#include <vector>

namespace adapter {

/**
 * BarFileReader
 *
 * Loads historical bars from JSONL.GZ files, one bar per line:
 * {
 *   "pair": "BTC/USD",
 *   "time": 1765996200,          // bar open, unix seconds
 *   "duration": 60,              // bar width, seconds
 *   "open": "43500.5", "high": "43510", "low": "43490.25", "close": "43505"
 * }
 * Prices may be strings or JSON numbers.
 */
class BarFileReader {
public:
    explicit BarFileReader(std::string filepath) : _filepath(std::move(filepath)) {}

    /**
     * Decompress and parse the whole file.
     * Throws std::runtime_error if the file cannot be opened or read.
     * Lines that do not describe a bar are skipped and counted.
     */
    std::vector<trade::BarRecord> read_all();

    /**
     * Stream bars to a callback instead of collecting them.
     * @return Number of bars delivered
     */
    size_t for_each(const std::function<void(const trade::BarRecord&)>& on_bar);

    size_t skipped_lines() const { return _skipped; }
    const std::string& filepath() const { return _filepath; }

private:
    bool parse_line(const std::string& line, trade::BarRecord& out) const;

    std::string _filepath;
    size_t _skipped{0};
};

}
