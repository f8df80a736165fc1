#include "common/size_units.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

namespace {

// Power of 1024 for a unit suffix, -1 when the suffix is unknown.
int unitExponent(const std::string& suffix) {
    if (suffix.empty() || suffix == "b") return 0;
    static const std::vector<std::string> prefixes = {"k", "m", "g", "t"};
    for (size_t i = 0; i < prefixes.size(); ++i) {
        const std::string& p = prefixes[i];
        if (suffix == p || suffix == p + "b" || suffix == p + "ib") {
            return static_cast<int>(i) + 1;
        }
    }
    return -1;
}

}  // namespace

Result<uint64_t> SizeUnits::toBytes(const std::string& spec) {
    std::string input = utils::trim(spec);
    if (input.empty()) {
        return makeError(ErrorKind::ParseError, "Empty size");
    }

    size_t pos = 0;
    bool seenDot = false;
    while (pos < input.size()) {
        char c = input[pos];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            ++pos;
        } else if (c == '.' && !seenDot) {
            seenDot = true;
            ++pos;
        } else {
            break;
        }
    }

    std::string number = input.substr(0, pos);
    std::string suffix = input.substr(pos);
    std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (number.empty() || number == ".") {
        return makeError(ErrorKind::ParseError, "Size has no numeric part: " + spec);
    }
    if (!std::all_of(suffix.begin(), suffix.end(), [](unsigned char c) { return std::isalpha(c); })) {
        return makeError(ErrorKind::ParseError, "Invalid size: " + spec);
    }

    int exponent = unitExponent(suffix);
    if (exponent < 0) {
        Logger::error("Invalid size suffix: " + suffix);
        return makeError(ErrorKind::ParseError, "Invalid size suffix '" + suffix + "' in " + spec);
    }

    uint64_t multiplier = 1;
    for (int i = 0; i < exponent; ++i) {
        multiplier *= 1024;
    }

    if (!seenDot) {
        uint64_t value = 0;
        for (char c : number) {
            uint64_t digit = static_cast<uint64_t>(c - '0');
            if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
                return makeError(ErrorKind::ParseError, "Size too large: " + spec);
            }
            value = value * 10 + digit;
        }
        if (value != 0 && multiplier > std::numeric_limits<uint64_t>::max() / value) {
            return makeError(ErrorKind::ParseError, "Size too large: " + spec);
        }
        return value * multiplier;
    }

    long double magnitude = std::strtold(number.c_str(), nullptr);
    long double bytes = std::floor(magnitude * static_cast<long double>(multiplier));
    if (bytes >= static_cast<long double>(std::numeric_limits<uint64_t>::max())) {
        return makeError(ErrorKind::ParseError, "Size too large: " + spec);
    }
    return static_cast<uint64_t>(bytes);
}

Result<uint64_t> SizeUnits::toDeltaBytes(const std::string& spec) {
    std::string input = utils::trim(spec);
    if (!input.empty() && input[0] == '+') {
        input.erase(0, 1);
    }
    return toBytes(input);
}

std::string SizeUnits::toHuman(uint64_t bytes, int startUnit, uint64_t base) {
    static const std::vector<std::string> units = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    size_t unit = static_cast<size_t>(std::max(0, std::min(startUnit, static_cast<int>(units.size()) - 1)));
    if (base < 2) {
        base = 1024;
    }

    long double value = static_cast<long double>(bytes);
    while (value >= static_cast<long double>(base) && unit + 1 < units.size()) {
        value /= static_cast<long double>(base);
        ++unit;
    }

    std::ostringstream out;
    if (value == std::floor(value)) {
        out << static_cast<uint64_t>(value);
    } else {
        out << std::fixed << std::setprecision(3) << static_cast<double>(value);
    }
    out << " " << units[unit];
    return out.str();
}
