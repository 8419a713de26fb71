#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace obd {

// True iff s is non-empty and only contains 0-9 / A-F
bool is_hex(const std::string& s);

// "1B56" -> {"1B","56"}, "1B5" -> {"1B","5"}
// Spaces are dropped before grouping; an odd trailing digit stays its own group.
std::vector<std::string> group_bytes(const std::string& s);

// Parse one byte group ("1B" or "5"). Returns false on anything that isn't hex.
bool parse_byte(const std::string& group, uint8_t& out);

// Uppercase, zero padded: 0x0C -> "0C"
std::string byte_to_hex(uint8_t b);

} // namespace obd
