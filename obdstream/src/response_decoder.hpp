#pragma once
#include "pid_registry.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace obd {

enum class ErrorKind {
    UnsupportedMode,   // first byte group isn't the service 01 reply
    NoConverter,       // no descriptor for the pid
    ConversionFailed,  // descriptor rejected the data bytes
};

struct ParseError {
    ErrorKind kind = ErrorKind::UnsupportedMode;
    std::string message;
    std::vector<std::string> byte_groups;  // UnsupportedMode
    std::string pid;                       // NoConverter, ConversionFailed
    std::string cause;                     // ConversionFailed
};

// One decoded adapter line. Generic (non-hex) output has neither value nor error.
struct ParseResult {
    double timestamp = 0.0;
    std::string raw;
    std::vector<std::string> byte_groups;
    std::string name;   // descriptor name, empty if none was found
    std::string unit;
    std::optional<PidValue> value;
    std::optional<ParseError> error;

    bool is_generic() const { return !value && !error; }
};

const char* to_string(ErrorKind k);

// Decode one command string against the registry.
// Never throws; failures are reported through ParseResult::error.
ParseResult decode_command(const std::string& cmd,
                           const PidRegistry& registry,
                           double timestamp,
                           std::ostream* log = nullptr);

// (timestamp): RAW: Name: value unit
void write_result(const ParseResult& r, std::ostream& os);

} // namespace obd
