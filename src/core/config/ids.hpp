#pragma once
#include <random>
#include <sstream>
#include <string>

namespace hostbridge::core::config {

    // Generates "<prefix>-" followed by `digits` random hex characters
    inline std::string generate_id(const std::string& prefix, int digits = 8) {
        std::random_device rd;
        std::mt19937 gen(rd()); // Standard mersenne_twister_engine
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < digits; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // Tags one request/response cycle in the logs
    inline std::string generate_call_id() {
        return generate_id("call");
    }

    // 8-4-4-4-12 lowercase hex, the shape node-graph instance ids take
    inline std::string generate_guid() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << std::hex;
        bool first = true;
        for (const int group : {8, 4, 4, 4, 12}) {
            if (!first) {
                ss << "-";
            }
            first = false;
            for (int i = 0; i < group; ++i) {
                ss << dis(gen);
            }
        }
        return ss.str();
    }

    // Tags a bridge or gateway instance in the logs
    inline std::string generate_session_id() {
        return generate_id("session");
    }

} // namespace hostbridge::core::config
