#pragma once
#include <random>
#include <sstream>
#include <string>

namespace quotebridge::core::config {

    // Generates a random version-4 UUID in its canonical 8-4-4-4-12 text form.
    inline std::string generate_request_id() {
        static thread_local std::mt19937 gen(std::random_device{}());
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

} // namespace quotebridge::core::config
