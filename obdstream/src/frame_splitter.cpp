#include "frame_splitter.hpp"
#include "constants.hpp"

namespace obd {

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n\v\f");
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(" \t\r\n\v\f");
    return s.substr(b, e - b + 1);
}

// Prompt removed (first occurrence only), then every space.
static std::string clean_line(std::string line) {
    auto p = line.find(kPromptDelimiter);
    if (p != std::string::npos) line.erase(p, 1);

    std::string out;
    out.reserve(line.size());
    for (char c : line) {
        if (c != ' ') out.push_back(c);
    }
    return trim(out);
}

bool has_prompt(const std::string& buffer) {
    return buffer.find(kPromptDelimiter) != std::string::npos;
}

std::vector<std::string> split_frame(const std::string& frame) {
    // Line feeds go first, then escaped "\r" becomes a real carriage return
    std::string no_lf;
    no_lf.reserve(frame.size());
    for (char c : frame) {
        if (c != '\n') no_lf.push_back(c);
    }

    std::string norm;
    norm.reserve(no_lf.size());
    for (size_t i = 0; i < no_lf.size(); ++i) {
        if (no_lf[i] == '\\' && i + 1 < no_lf.size() && no_lf[i + 1] == 'r') {
            norm.push_back('\r');
            ++i;
            continue;
        }
        norm.push_back(no_lf[i]);
    }

    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= norm.size()) {
        size_t end = norm.find('\r', start);
        if (end == std::string::npos) end = norm.size();

        std::string line = clean_line(norm.substr(start, end - start));
        if (!line.empty()) lines.push_back(std::move(line));

        start = end + 1;
    }
    return lines;
}

} // namespace obd
