#pragma once
#include "namespace_store.hpp"
#include "../config.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace mcpgate {

constexpr const char* kWritesDisabledMessage =
    "Error: MCP_READ_ONLY is enabled. Writes are disabled.";

enum class WriteMode { Append, Replace, Clear };

// Case-insensitive, whitespace-trimmed; anything unrecognized is Append.
WriteMode parse_write_mode(const std::string& s);
std::string write_mode_name(WriteMode mode);

enum class WriteStatus { Written, WriteDisabled };

// Either the persisted document, or WriteDisabled with a message.
struct WriteResult {
    WriteStatus status = WriteStatus::Written;
    NamespaceDocument document;
    std::string error;

    bool ok() const { return status == WriteStatus::Written; }
};

// get/write over a NamespaceStore, enforcing the read-only policy.
// Writes to the same namespace are serialized within one service instance.
class MemoryService {
public:
    // The store must outlive the service.
    MemoryService(NamespaceStore& store, MemoryConfig policy);

    // Latest `limit` entries (all when nullopt), oldest first.
    // Negative limits count as zero.
    NamespaceDocument get(const std::string& ns, std::optional<int64_t> limit) const;

    // Throws std::runtime_error when the store cannot persist the document.
    WriteResult write(const std::string& ns, const nlohmann::json& data, WriteMode mode);

    bool writes_allowed() const { return policy_.writes_allowed(); }

private:
    std::mutex& namespace_lock(const std::string& ns);

    NamespaceStore& store_;
    MemoryConfig policy_;

    std::mutex locks_mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> locks_;
};

} // namespace mcpgate
