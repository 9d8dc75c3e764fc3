#pragma once

#include <array>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace agentrelay::core {

// UUID v4
class UUID {
public:
    UUID() : bytes_{} {}

    static UUID generate() {
        UUID uuid;

        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        uint64_t high = dist(gen);
        uint64_t low = dist(gen);

        // Version 4, RFC 4122 variant
        high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

        for (int i = 0; i < 8; ++i) {
            uuid.bytes_[i] = static_cast<uint8_t>((high >> (56 - i * 8)) & 0xFF);
            uuid.bytes_[i + 8] = static_cast<uint8_t>((low >> (56 - i * 8)) & 0xFF);
        }

        return uuid;
    }

    std::string to_string() const {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');

        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                ss << '-';
            }
            ss << std::setw(2) << static_cast<int>(bytes_[i]);
        }

        return ss.str();
    }

private:
    std::array<uint8_t, 16> bytes_;
};

// Prefixed short ids
inline std::string generate_turn_id() {
    return "turn_" + UUID::generate().to_string().substr(0, 8);
}

inline std::string generate_capture_id() {
    return "cap_" + UUID::generate().to_string().substr(0, 8);
}

inline std::string generate_artifact_id() {
    return "ctx_" + UUID::generate().to_string().substr(0, 8);
}

// Sentinel embedded in a submitted prompt; uppercase hex so it never reads like prose
inline std::string generate_sentinel() {
    std::string hex = UUID::generate().to_string().substr(0, 8);
    for (auto& c : hex) {
        if (c >= 'a' && c <= 'f') c = static_cast<char>(c - 'a' + 'A');
    }
    return "R-" + hex;
}

}  // namespace agentrelay::core
