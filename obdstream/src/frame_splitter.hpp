#pragma once
#include <string>
#include <vector>

namespace obd {

// True once the adapter prompt has been received
bool has_prompt(const std::string& buffer);

// Split one complete adapter response into its command strings.
//   - '\n' is dropped, a literal backslash-r pair counts as '\r'
//   - lines are split on '\r'
//   - per line: prompt removed, spaces removed, whitespace trimmed
//   - empty lines are dropped
// Order follows the order the lines arrived in.
std::vector<std::string> split_frame(const std::string& frame);

} // namespace obd
