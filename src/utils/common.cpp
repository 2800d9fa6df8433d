#include "utils/common.hpp"

#include <array>
#include <random>

namespace runbox::utils {

std::string GenerateUuid() {
    static const char* kChars = "0123456789abcdef";
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int> dist(0, 255);

    std::array<unsigned char, 16> bytes{};
    for (auto& b : bytes) {
        b = static_cast<unsigned char>(dist(gen));
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    std::string id;
    id.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            id.push_back('-');
        }
        id.push_back(kChars[bytes[i] >> 4]);
        id.push_back(kChars[bytes[i] & 0x0f]);
    }
    return id;
}

}  // namespace runbox::utils
