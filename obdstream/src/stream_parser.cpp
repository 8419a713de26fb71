#include "stream_parser.hpp"
#include "frame_splitter.hpp"
#include <chrono>

namespace obd {

// Printable form of a chunk for the trace: "410C\r\r>" -> "410C\\r\\r>"
static std::string escaped(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\r')      out += "\\r";
        else if (c == '\n') out += "\\n";
        else                out.push_back(c);
    }
    return out;
}

double now_seconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

StreamParser::StreamParser(const PidRegistry& registry)
    : registry_(registry), clock_(now_seconds) {}

FeedResult StreamParser::feed(const uint8_t* data, size_t len) {
    return feed(std::string(data, data + len));
}

FeedResult StreamParser::feed(const std::string& chunk) {
    FeedResult out;
    if (log_) *log_ << "[parser] received data \"" << escaped(chunk) << "\"\n";

    buffer_ += chunk;

    if (!has_prompt(buffer_)) {
        if (log_) *log_ << "[parser] data was not a complete output\n";
        return out;
    }

    // Take the frame before running caller code; ready may feed() again
    std::string frame;
    frame.swap(buffer_);

    if (log_) *log_ << "[parser] serial output completed, parsing \"" << escaped(frame) << "\"\n";
    out.frame_complete = true;

    if (on_ready_) on_ready_();

    const std::vector<std::string> lines = split_frame(frame);
    if (log_) *log_ << "[parser] extracted " << lines.size() << " command string(s)\n";

    const double ts = clock_ ? clock_() : now_seconds();
    out.results.reserve(lines.size());
    for (const auto& line : lines) {
        out.results.push_back(decode_command(line, registry_, ts, log_));
    }
    return out;
}

void StreamParser::reset() {
    if (log_ && !buffer_.empty()) {
        *log_ << "[parser] discarding incomplete output \"" << escaped(buffer_) << "\"\n";
    }
    buffer_.clear();
}

} // namespace obd
