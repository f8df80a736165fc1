#include "common/utils.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>
#include <openssl/err.h>
#include <openssl/rand.h>

namespace utils {

std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> splitWhitespace(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

bool isValidIPv4(const std::string& address) {
    if (address.empty()) {
        return false;
    }
    struct in_addr parsed;
    return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

std::string randomHex(size_t length) {
    std::vector<unsigned char> bytes((length + 1) / 2);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        Logger::warning("RAND_bytes failed (" + std::to_string(ERR_get_error()) +
                        "), falling back to std::random_device");
        std::random_device rd;
        for (auto& b : bytes) {
            b = static_cast<unsigned char>(rd() & 0xff);
        }
    }

    std::stringstream ss;
    for (unsigned char b : bytes) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str().substr(0, length);
}

std::string baseName(const std::string& path) {
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string stem(const std::string& path) {
    std::string name = baseName(path);
    auto dot = name.find('.');
    return dot == std::string::npos || dot == 0 ? name : name.substr(0, dot);
}

} // namespace utils
