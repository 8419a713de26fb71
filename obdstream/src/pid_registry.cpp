#include "pid_registry.hpp"
#include "constants.hpp"
#include "hex_utils.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace obd {

void PidRegistry::add(PidDescriptor d) {
    std::string id = d.id;
    by_id_[id] = std::move(d);
}

const PidDescriptor* PidRegistry::lookup(const std::string& pid) const {
    auto it = by_id_.find(pid);
    if (it == by_id_.end()) return nullptr;
    return &it->second;
}

const PidDescriptor* PidRegistry::find_by_name(const std::string& name) const {
    for (const auto& kv : by_id_) {
        if (kv.second.name == name) return &kv.second;
    }
    return nullptr;
}

std::vector<std::string> PidRegistry::ids() const {
    std::vector<std::string> out;
    out.reserve(by_id_.size());
    for (const auto& kv : by_id_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

std::unique_ptr<dbcppp::INetwork> load_network(const std::string& path) {
    std::ifstream is(path);
    if (!is) return nullptr;
    return dbcppp::INetwork::LoadDBCFromIs(is);
}

std::unique_ptr<dbcppp::INetwork> load_network_from_string(const std::string& dbc) {
    std::istringstream is(dbc);
    return dbcppp::INetwork::LoadDBCFromIs(is);
}

// Index of the last frame byte the signal touches.
// Motorola signals start at their MSB and continue into the following bytes.
static size_t last_byte(const dbcppp::ISignal& sig) {
    const uint64_t start = sig.StartBit();
    const uint64_t len = sig.BitSize();
    if (len == 0) return start / 8;

    if (sig.ByteOrder() == dbcppp::ISignal::EByteOrder::LittleEndian) {
        return static_cast<size_t>((start + len - 1) / 8);
    }
    const uint64_t first = start % 8 + 1;   // bits available in the start byte
    if (len <= first) return static_cast<size_t>(start / 8);
    return static_cast<size_t>(start / 8 + (len - first + 7) / 8);
}

static ConvertFn make_signal_converter(std::shared_ptr<const dbcppp::INetwork> net,
                                       const dbcppp::ISignal* sig,
                                       uint8_t pid,
                                       size_t data_len) {
    return [net, sig, pid, data_len](const std::vector<std::string>& bytes) -> ConvertResult {
        if (bytes.size() < data_len) {
            return ConversionError{"PID " + byte_to_hex(pid) + " expects " +
                                   std::to_string(data_len) + " data bytes, got " +
                                   std::to_string(bytes.size())};
        }

        // Rebuild the response line the DBC describes: 41 <pid> <data...>
        uint8_t data_buf[64] = {0};
        data_buf[0] = 0x41;
        data_buf[1] = pid;
        const size_t ncopy = std::min(bytes.size(), sizeof(data_buf) - 2);
        for (size_t i = 0; i < ncopy; ++i) {
            if (!parse_byte(bytes[i], data_buf[i + 2])) {
                return ConversionError{"invalid byte group \"" + bytes[i] + "\""};
            }
        }

        const auto raw = sig->Decode(data_buf);
        if (sig->ValueEncodingDescriptions_Size() > 0) {
            for (const dbcppp::IValueEncodingDescription& ved : sig->ValueEncodingDescriptions()) {
                if (ved.Value() == static_cast<int64_t>(raw)) return PidValue{ved.Description()};
            }
            return ConversionError{"no " + sig->Name() + " description for value " +
                                   std::to_string(static_cast<int64_t>(raw))};
        }
        return PidValue{sig->RawToPhys(raw)};
    };
}

PidDescriptor supported_pids_descriptor(uint8_t base) {
    PidDescriptor d;
    d.id = byte_to_hex(base);
    std::ostringstream name;
    name << "SupportedPids" << d.id;
    d.name = name.str();
    d.description = "PIDs supported [" + byte_to_hex(static_cast<uint8_t>(base + 1)) +
                    "-" + byte_to_hex(static_cast<uint8_t>(base + 0x20)) + "]";
    d.byte_count = 6;
    d.convert = [base](const std::vector<std::string>& bytes) -> ConvertResult {
        if (bytes.size() < 4) {
            return ConversionError{"supported PID bitmap needs 4 data bytes, got " +
                                   std::to_string(bytes.size())};
        }
        std::vector<std::string> pids;
        for (unsigned i = 0; i < 32; ++i) {
            uint8_t b = 0;
            if (!parse_byte(bytes[i / 8], b)) {
                return ConversionError{"invalid byte group \"" + bytes[i / 8] + "\""};
            }
            // A7 (MSB of the first byte) is base+1
            if (b & (0x80u >> (i % 8))) {
                pids.push_back(byte_to_hex(static_cast<uint8_t>(base + i + 1)));
            }
        }
        return PidValue{pids};
    };
    return d;
}

bool load_registry(std::shared_ptr<const dbcppp::INetwork> net,
                   PidRegistry& out,
                   std::string* err) {
    if (!net) {
        if (err) *err = "no network";
        return false;
    }

    for (unsigned base = 0x00; base <= 0xC0; base += 0x20) {
        out.add(supported_pids_descriptor(static_cast<uint8_t>(base)));
    }

    size_t added = 0;
    for (const dbcppp::IMessage& msg : net->Messages()) {
        if (!msg.MuxSignal()) continue;

        for (const dbcppp::ISignal& sig : msg.Signals()) {
            if (sig.MultiplexerIndicator() != dbcppp::ISignal::EMultiplexer::MuxValue) continue;
            if (sig.MultiplexerSwitchValue() > 0xFF) continue;

            const uint8_t pid = static_cast<uint8_t>(sig.MultiplexerSwitchValue());
            PidDescriptor d;
            d.id = byte_to_hex(pid);
            d.name = sig.Name();
            d.unit = sig.Unit();
            d.description = sig.Comment();
            d.byte_count = last_byte(sig) + 1;
            const size_t data_len = d.byte_count > 2 ? d.byte_count - 2 : 0;
            d.convert = make_signal_converter(net, &sig, pid, data_len);
            out.add(std::move(d));
            ++added;
        }
    }

    if (added == 0) {
        if (err) *err = "network has no multiplexed PID signals";
        return false;
    }
    if (err) *err = "";
    return true;
}

bool load_default_registry(PidRegistry& out, std::string* err) {
    std::shared_ptr<const dbcppp::INetwork> net = load_network_from_string(builtin_dbc());
    if (!net) {
        if (err) *err = "built-in PID definitions failed to parse";
        return false;
    }
    return load_registry(std::move(net), out, err);
}

std::string request_for(const std::string& pid) {
    return std::string(kRequestModePrefix) + pid;
}

std::string to_string(const PidValue& v) {
    if (const double* d = std::get_if<double>(&v)) {
        std::ostringstream os;
        os << std::setprecision(15) << *d;
        return os.str();
    }
    if (const std::string* s = std::get_if<std::string>(&v)) return *s;

    std::string joined;
    for (const auto& p : std::get<std::vector<std::string>>(v)) {
        if (!joined.empty()) joined += ' ';
        joined += p;
    }
    return joined;
}

} // namespace obd
