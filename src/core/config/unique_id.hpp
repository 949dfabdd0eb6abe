#pragma once
#include <string>
#include <random>
#include <sstream>

namespace vidmcp::core::config {

    // Generates an 8-character hex ID with the given prefix, e.g. "session-3fa91c0d"
    inline std::string generate_unique_id(const std::string& prefix) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix;
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace vidmcp::core::config
