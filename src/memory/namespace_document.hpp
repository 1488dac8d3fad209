#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpgate {

struct MemoryEntry {
    std::string timestamp;   // ISO 8601 UTC
    nlohmann::json data = nlohmann::json::object();
    // Item exactly as read from disk; null for entries created in-process.
    // A loaded entry is written back from this, untouched.
    nlohmann::json raw = nullptr;

    nlohmann::json to_json() const {
        if (!raw.is_null()) return raw;
        return {
            {"timestamp", timestamp},
            {"data", data}
        };
    }

    bool operator==(const MemoryEntry& o) const {
        return to_json() == o.to_json();
    }
};

// The persisted journal of one namespace. Entries keep insertion order.
struct NamespaceDocument {
    std::string updated_at;
    std::vector<MemoryEntry> entries;

    bool operator==(const NamespaceDocument& o) const {
        return updated_at == o.updated_at && entries == o.entries;
    }
};

// Shared JSON ↔ document conversion used by NamespaceStore and the memory tools.

inline MemoryEntry entry_from_json(const nlohmann::json& item) {
    MemoryEntry entry;
    entry.raw = item;
    if (!item.is_object()) {
        // Foreign shape written by hand; keep it rather than drop it.
        entry.data = item;
        return entry;
    }
    if (item.contains("timestamp") && item["timestamp"].is_string())
        entry.timestamp = item["timestamp"].get<std::string>();
    if (item.contains("data"))
        entry.data = item["data"];
    return entry;
}

inline nlohmann::json entry_to_json(const MemoryEntry& entry) {
    return entry.to_json();
}

inline nlohmann::json entries_to_json(const std::vector<MemoryEntry>& entries) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : entries) {
        arr.push_back(entry_to_json(e));
    }
    return arr;
}

inline nlohmann::json document_to_json(const NamespaceDocument& doc) {
    return {
        {"updated_at", doc.updated_at},
        {"entries", entries_to_json(doc.entries)}
    };
}

} // namespace mcpgate
