#pragma once
#include "Severity.h"
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace skill_scan {

// One decoded text file of a skill artifact. Binary content never reaches this type.
struct ScannedFile {
    std::string path;
    std::string text;
};

struct Finding {
    std::string id;
    Category category = Category::Exec;
    Severity severity = Severity::Low;
    std::string title;
    std::string evidence; // whitespace-collapsed, <= 240 chars
    std::string file_path;
    std::optional<int> line_start;
    std::optional<int> line_end;
    Confidence confidence = Confidence::Low;
};

enum class Capability { Network, FileWrite, FileDelete, ShellExec, ReadsEnv, DbAccess };

inline constexpr std::array<Capability, 6> kAllCapabilities = {
    Capability::Network, Capability::FileWrite, Capability::FileDelete,
    Capability::ShellExec, Capability::ReadsEnv, Capability::DbAccess
};

inline const char* capability_key(Capability c) {
    switch(c){
        case Capability::Network: return "network";
        case Capability::FileWrite: return "file_write";
        case Capability::FileDelete: return "file_delete";
        case Capability::ShellExec: return "shell_exec";
        case Capability::ReadsEnv: return "reads_env";
        case Capability::DbAccess: return "db_access";
    }
    return "";
}

// Monotone within a scan: flags are only ever raised.
struct CapabilityFlags {
    std::array<bool, kAllCapabilities.size()> bits{};

    void raise(Capability c) { bits[static_cast<size_t>(c)] = true; }
    bool has(Capability c) const { return bits[static_cast<size_t>(c)]; }
    void merge(const CapabilityFlags& other) { for(size_t i=0;i<bits.size();++i) bits[i] = bits[i] || other.bits[i]; }
    bool operator==(const CapabilityFlags& o) const { return bits == o.bits; }
    bool operator!=(const CapabilityFlags& o) const { return !(*this == o); }
};

struct ScanResult {
    std::vector<Finding> findings;
    int risk_score = 0; // 0..=200
    std::string trust_badge;
    CapabilityFlags capabilities;
};

struct ScanContext; // fwd

// A per-file pass. Passes run file by file, in registration order.
class Scanner {
public:
    virtual ~Scanner() = default;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual void scan(const ScannedFile& file, ScanContext& context) = 0;
};

using ScannerPtr = std::unique_ptr<Scanner>;

}
