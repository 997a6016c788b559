#pragma once
#include <string>
#include <random>
#include <sstream>

namespace logcompact::core::config {

    // Generates a simple 8-character hex ID, e.g. "batch-3fa0c91e"
    inline std::string generate_id(const std::string& prefix) {
        std::random_device rd;
        std::mt19937 gen(rd()); // Standard mersenne_twister_engine
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace logcompact::core::config
