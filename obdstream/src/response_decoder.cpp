#include "response_decoder.hpp"
#include "constants.hpp"
#include "hex_utils.hpp"
#include <iomanip>

namespace obd {

static std::string join(const std::vector<std::string>& groups) {
    std::string out;
    for (const auto& g : groups) {
        if (!out.empty()) out += ' ';
        out += g;
    }
    return out;
}

const char* to_string(ErrorKind k) {
    switch (k) {
    case ErrorKind::UnsupportedMode:  return "UnsupportedMode";
    case ErrorKind::NoConverter:      return "NoConverter";
    case ErrorKind::ConversionFailed: return "ConversionFailed";
    }
    return "Unknown";
}

ParseResult decode_command(const std::string& cmd,
                           const PidRegistry& registry,
                           double timestamp,
                           std::ostream* log) {
    ParseResult r;
    r.timestamp = timestamp;
    r.raw = cmd;
    r.byte_groups = group_bytes(cmd);

    if (!is_hex(cmd)) {
        if (log) *log << "[parser] generic output \"" << cmd << "\", not parsing\n";
        return r;
    }

    if (r.byte_groups[0] != kResponseModeMarker) {
        if (log) *log << "[parser] malformed output \"" << cmd << "\", not parsing\n";
        ParseError e;
        e.kind = ErrorKind::UnsupportedMode;
        e.byte_groups = r.byte_groups;
        e.message = "Unable to parse bytes for output \"" + join(r.byte_groups) +
                    "\"; mode \"" + r.byte_groups[0] + "\" not supported";
        r.error = std::move(e);
        return r;
    }

    const std::string pid = r.byte_groups.size() > 1 ? r.byte_groups[1] : std::string();
    const PidDescriptor* d = registry.lookup(pid);
    if (!d || !d->convert) {
        if (log) *log << "[parser] no converter for pid \"" << pid << "\"\n";
        ParseError e;
        e.kind = ErrorKind::NoConverter;
        e.pid = pid;
        e.message = "no converter was found for pid " + pid;
        r.error = std::move(e);
        return r;
    }

    r.name = d->name;
    r.unit = d->unit;

    // Data bytes only; bounded by the descriptor, not by the line length
    std::vector<std::string> data;
    for (size_t i = 2; i < d->byte_count && i < r.byte_groups.size(); ++i) {
        data.push_back(r.byte_groups[i]);
    }

    ConvertResult conv = d->convert(data);
    if (auto* failed = std::get_if<ConversionError>(&conv)) {
        ParseError e;
        e.kind = ErrorKind::ConversionFailed;
        e.pid = pid;
        e.cause = failed->message;
        e.message = "conversion failed for pid " + pid + ": " + failed->message;
        r.error = std::move(e);
    } else {
        r.value = std::get<PidValue>(std::move(conv));
    }

    if (log) {
        *log << "[parser] " << cmd << " -> "
             << (r.value ? to_string(*r.value) : r.error->message) << "\n";
    }
    return r;
}

void write_result(const ParseResult& r, std::ostream& os) {
    const auto flags = os.flags();
    const auto prec = os.precision();
    os << '(' << std::fixed << std::setprecision(3) << r.timestamp << "): " << r.raw;
    os.flags(flags);
    os.precision(prec);
    if (r.error) {
        os << ": error: " << r.error->message;
    } else if (r.value) {
        os << ": " << r.name << ": " << to_string(*r.value);
        if (!r.unit.empty()) os << ' ' << r.unit;
    }
    os << "\n";
}

} // namespace obd
