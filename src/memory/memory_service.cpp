#include "memory_service.hpp"
#include "../util.hpp"

#include <algorithm>
#include <iostream>

namespace mcpgate {

WriteMode parse_write_mode(const std::string& s) {
    std::string m = to_lower(trim(s));
    if (m == "clear")   return WriteMode::Clear;
    if (m == "replace") return WriteMode::Replace;
    return WriteMode::Append;
}

std::string write_mode_name(WriteMode mode) {
    switch (mode) {
        case WriteMode::Append:  return "append";
        case WriteMode::Replace: return "replace";
        case WriteMode::Clear:   return "clear";
    }
    return "append";
}

MemoryService::MemoryService(NamespaceStore& store, MemoryConfig policy)
    : store_(store), policy_(std::move(policy)) {}

NamespaceDocument MemoryService::get(const std::string& ns,
                                     std::optional<int64_t> limit) const {
    NamespaceDocument doc = store_.load(ns);
    if (limit) {
        size_t keep = static_cast<size_t>(std::max<int64_t>(*limit, 0));
        if (keep < doc.entries.size()) {
            doc.entries.erase(doc.entries.begin(),
                              doc.entries.end() - static_cast<std::ptrdiff_t>(keep));
        }
    }
    return doc;
}

std::mutex& MemoryService::namespace_lock(const std::string& ns) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = locks_[NamespaceStore::sanitize(ns)];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

WriteResult MemoryService::write(const std::string& ns, const nlohmann::json& data,
                                 WriteMode mode) {
    WriteResult result;
    if (!policy_.writes_allowed()) {
        result.status = WriteStatus::WriteDisabled;
        result.error = kWritesDisabledMessage;
        return result;
    }

    std::lock_guard<std::mutex> ns_lock(namespace_lock(ns));

    NamespaceDocument doc = store_.load(ns);
    std::string now = timestamp_now();
    nlohmann::json payload = data.is_null() ? nlohmann::json::object() : data;

    switch (mode) {
        case WriteMode::Clear:
            doc.entries.clear();
            break;
        case WriteMode::Replace:
            doc.entries.clear();
            doc.entries.push_back(MemoryEntry{now, std::move(payload)});
            break;
        case WriteMode::Append:
            doc.entries.push_back(MemoryEntry{now, std::move(payload)});
            break;
    }
    doc.updated_at = now;

    store_.save(ns, doc);
    std::cerr << "[memory] " << write_mode_name(mode) << " on '"
              << NamespaceStore::sanitize(ns) << "' (" << doc.entries.size()
              << " entries)\n";

    result.document = std::move(doc);
    return result;
}

} // namespace mcpgate
