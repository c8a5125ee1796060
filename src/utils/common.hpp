#pragma once

#include <chrono>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace codebox::utils {

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

inline std::string RandomHex(std::size_t length) {
    static const char* kChars = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string id;
    id.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        id.push_back(kChars[dist(gen)]);
    }
    return id;
}

inline long long ElapsedMs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

}  // namespace codebox::utils
