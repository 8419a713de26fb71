#include "hex_utils.hpp"
#include <iomanip>
#include <sstream>

namespace obd {

bool is_hex(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        const bool digit = (c >= '0' && c <= '9');
        const bool upper = (c >= 'A' && c <= 'F');
        if (!digit && !upper) return false;
    }
    return true;
}

std::vector<std::string> group_bytes(const std::string& s) {
    std::string flat;
    flat.reserve(s.size());
    for (char c : s) {
        if (c != ' ') flat.push_back(c);
    }

    std::vector<std::string> groups;
    groups.reserve((flat.size() + 1) / 2);
    for (size_t i = 0; i < flat.size(); i += 2) {
        groups.push_back(flat.substr(i, 2));
    }
    return groups;
}

bool parse_byte(const std::string& group, uint8_t& out) {
    if (group.empty() || group.size() > 2) return false;
    unsigned v = 0;
    for (char c : group) {
        v <<= 4;
        if (c >= '0' && c <= '9')      v |= static_cast<unsigned>(c - '0');
        else if (c >= 'A' && c <= 'F') v |= static_cast<unsigned>(c - 'A' + 10);
        else if (c >= 'a' && c <= 'f') v |= static_cast<unsigned>(c - 'a' + 10);
        else return false;
    }
    out = static_cast<uint8_t>(v);
    return true;
}

std::string byte_to_hex(uint8_t b) {
    std::ostringstream ss;
    ss << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<unsigned>(b);
    return ss.str();
}

} // namespace obd
