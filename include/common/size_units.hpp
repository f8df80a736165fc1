#pragma once

#include <cstdint>
#include <string>
#include "common/result.hpp"

// Conversion between human entered sizes ("10G", "1.5TiB", "2048") and byte counts.
class SizeUnits {
public:
    // Grammar: <digits>[.<digits>][unit], unit in k|kb|kib|m|mb|mib|g|gb|gib|t|tb|tib,
    // case-insensitive. Bare digits are bytes. Anything else is a ParseError.
    static Result<uint64_t> toBytes(const std::string& spec);

    // Accepts an optional leading '+' in front of the size grammar above.
    static Result<uint64_t> toDeltaBytes(const std::string& spec);

    // 1024 -> "1 KiB", 1536 -> "1.500 KiB". startUnit indexes B, KiB, MiB, GiB, TiB, PiB.
    static std::string toHuman(uint64_t bytes, int startUnit = 0, uint64_t base = 1024);
};
