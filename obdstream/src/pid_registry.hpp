#pragma once
#include <dbcppp/Network.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace obd {

// Decoded sensor reading: number, value-table text, or list of pid codes
using PidValue = std::variant<double, std::string, std::vector<std::string>>;

struct ConversionError {
    std::string message;
};

using ConvertResult = std::variant<PidValue, ConversionError>;

// Receives the data byte groups (everything after mode + pid)
using ConvertFn = std::function<ConvertResult(const std::vector<std::string>&)>;

struct PidDescriptor {
    std::string id;            // "0C"
    std::string name;          // "EngineRpm"
    std::string unit;
    std::string description;
    size_t byte_count = 0;     // whole response line, mode and pid included
    ConvertFn convert;
};

class PidRegistry {
public:
    // Replaces any descriptor already registered under the same id
    void add(PidDescriptor d);

    // nullptr if no descriptor for this pid code
    const PidDescriptor* lookup(const std::string& pid) const;
    const PidDescriptor* find_by_name(const std::string& name) const;

    size_t size() const { return by_id_.size(); }

    // Sorted pid codes
    std::vector<std::string> ids() const;

private:
    std::unordered_map<std::string, PidDescriptor> by_id_;
};

// Load a DBC from path / from text. nullptr on open or parse failure.
std::unique_ptr<dbcppp::INetwork> load_network(const std::string& path);
std::unique_ptr<dbcppp::INetwork> load_network_from_string(const std::string& dbc);

// Build descriptors from every multiplexed signal of the network:
// the mux switch value is the pid. Supported-PID bitmap descriptors
// (00, 20, ... C0) are always added; DBC signals override them.
// Returns false (and sets *err) if the network defines no multiplexed signal.
bool load_registry(std::shared_ptr<const dbcppp::INetwork> net,
                   PidRegistry& out,
                   std::string* err = nullptr);

// Registry from the built-in service 01 DBC
bool load_default_registry(PidRegistry& out, std::string* err = nullptr);

// Built-in service 01 definitions
const char* builtin_dbc();

// Descriptor for a "PIDs supported [base+1 .. base+32]" bitmap
PidDescriptor supported_pids_descriptor(uint8_t base);

// Adapter command requesting current data for pid: "010C"
std::string request_for(const std::string& pid);

std::string to_string(const PidValue& v);

} // namespace obd
