#pragma once
#include <string>
#include <random>
#include <sstream>

namespace tclhub::core::config {

    // Random version-4 style identifier, e.g. "3f2b8c1e-9a4d-4c7e-b1f0-5e6d7c8b9a0f"
    inline std::string generate_tool_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);
        std::uniform_int_distribution<> variant_dis(8, 11);

        std::stringstream ss;
        ss << std::hex;
        for (int i = 0; i < 32; ++i) {
            if (i == 8 || i == 12 || i == 16 || i == 20) {
                ss << "-";
            }
            if (i == 12) {
                ss << 4;
            } else if (i == 16) {
                ss << variant_dis(gen);
            } else {
                ss << dis(gen);
            }
        }
        return ss.str();
    }

    // Short random suffix for scratch directories and similar
    inline std::string generate_short_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace tclhub::core::config
