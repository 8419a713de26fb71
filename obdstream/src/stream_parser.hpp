#pragma once
#include "response_decoder.hpp"
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace obd {

struct FeedResult {
    bool frame_complete = false;
    std::vector<ParseResult> results;
};

// Reassembles adapter output into complete responses and decodes them.
// One instance per adapter connection. Not thread safe: feed() calls must be
// serialized by the caller. The registry must outlive the parser.
class StreamParser {
public:
    using ReadyCallback = std::function<void()>;
    using Clock = std::function<double()>;

    explicit StreamParser(const PidRegistry& registry);

    // Append a transport chunk. Results are only produced once the prompt
    // arrives; until then the chunk is kept and frame_complete is false.
    FeedResult feed(const std::string& chunk);
    FeedResult feed(const uint8_t* data, size_t len);

    // Drop any partially received response
    void reset();

    // Fired once per completed response, before its lines are decoded.
    // Tells the writer side the adapter is ready for the next command.
    void on_ready(ReadyCallback cb) { on_ready_ = std::move(cb); }

    // Seconds since epoch used to stamp results (defaults to system_clock)
    void set_clock(Clock clock) { clock_ = std::move(clock); }

    // Debug trace sink, nullptr disables
    void set_log(std::ostream* log) { log_ = log; }

    const std::string& buffer() const { return buffer_; }

private:
    const PidRegistry& registry_;
    std::string buffer_;
    ReadyCallback on_ready_;
    Clock clock_;
    std::ostream* log_ = nullptr;
};

// Wall clock in seconds since the Unix epoch
double now_seconds();

} // namespace obd
