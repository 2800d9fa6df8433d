#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <sstream>

namespace runbox::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline long long ElapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

// Random version 4 UUID in canonical 8-4-4-4-12 form.
std::string GenerateUuid();

}  // namespace runbox::utils
