#pragma once
#include <random>
#include <sstream>
#include <string>

namespace agentic::core::config {

    // "<prefix>_" followed by 8 random hex digits, e.g. "researcher_3fa9c01b".
    inline std::string generate_id(const std::string& prefix) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "_";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    inline std::string generate_session_id() {
        return generate_id("session");
    }

} // namespace agentic::core::config
