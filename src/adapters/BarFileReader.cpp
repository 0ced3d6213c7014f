#include "adapters/BarFileReader.hpp"
#include "trade/Json.hpp"
#include <iostream>
#include <stdexcept>
#include <zlib.h>

namespace adapter {

using json = nlohmann::json;

std::vector<trade::BarRecord> BarFileReader::read_all() {
    std::vector<trade::BarRecord> result;
    for_each([&result](const trade::BarRecord& rec) { result.push_back(rec); });
    return result;
}

size_t BarFileReader::for_each(const std::function<void(const trade::BarRecord&)>& on_bar) {
    _skipped = 0;
    size_t delivered = 0;

    gzFile file = gzopen(_filepath.c_str(), "rb");
    if (!file) {
        throw std::runtime_error("Cannot open gzip file: " + _filepath);
    }

    auto handle_line = [&](std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) return;

        trade::BarRecord rec;
        if (parse_line(line, rec)) {
            on_bar(rec);
            ++delivered;
        } else {
            ++_skipped;
        }
    };

    try {
        char buffer[4096];
        std::string line_buffer;

        while (true) {
            int bytes_read = gzread(file, buffer, sizeof(buffer));
            if (bytes_read < 0) {
                int errnum = 0;
                const char* msg = gzerror(file, &errnum);
                throw std::runtime_error("Error reading gzip file " + _filepath + ": " + (msg ? msg : "unknown"));
            }
            if (bytes_read == 0) {
                break; // EOF
            }

            line_buffer.append(buffer, bytes_read);

            size_t pos = 0;
            while ((pos = line_buffer.find('\n')) != std::string::npos) {
                handle_line(line_buffer.substr(0, pos));
                line_buffer.erase(0, pos + 1);
            }
        }

        // last line without a trailing newline
        if (!line_buffer.empty()) {
            handle_line(line_buffer);
        }
    } catch (...) {
        gzclose(file);
        throw;
    }

    gzclose(file);

    std::cout << "[BarFileReader] Loaded " << delivered << " bars from " << _filepath;
    if (_skipped) {
        std::cout << " (skipped " << _skipped << " malformed lines)";
    }
    std::cout << "\n";
    return delivered;
}

bool BarFileReader::parse_line(const std::string& line, trade::BarRecord& out) const {
    try {
        json j = json::parse(line);

        out.pair = trade::AssetPair::parse(j.at("pair").get<std::string>());
        out.bar = j.get<trade::Bar>();
        if (!out.bar.has_positive_prices()) return false;

        long long seconds = j.at("duration").get<long long>();
        if (seconds <= 0) return false;
        out.duration = std::chrono::seconds(seconds);
        return true;
    } catch (const std::exception& e) {
#ifdef TRADE_DEBUG
        std::cerr << "[BarFileReader] Skipping line: " << e.what() << "\n";
#endif
        return false;
    }
}

}
