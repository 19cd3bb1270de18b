#pragma once
#include <random>
#include <sstream>
#include <string>
#include "core/time/timestamp.hpp"

namespace runvault::core::config {

    // Generates "<YYYY-MM-DD>-<flow_id>-<8 hex chars>". The sortable date prefix
    // doubles as the archive month bucket.
    inline std::string generate_run_id(const std::string& flow_id = "run") {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << core::time::utc_date(core::time::Clock::now()) << "-" << flow_id << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // First seven characters of a date-prefixed run id ("2025-01"), or the
    // current UTC month when the id is too short to carry a date.
    inline std::string archive_month_for(const std::string& run_id) {
        if (run_id.size() >= 7) {
            return run_id.substr(0, 7);
        }
        return core::time::utc_month(core::time::Clock::now());
    }

} // namespace runvault::core::config
