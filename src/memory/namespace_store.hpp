#pragma once
#include "namespace_document.hpp"
#include <string>

namespace mcpgate {

constexpr const char* kDefaultNamespace = "default";

// One JSON file per namespace under a root directory.
class NamespaceStore {
public:
    explicit NamespaceStore(std::string root_dir);

    // Never fails: a missing, unreadable or corrupt file yields a fresh
    // empty document stamped with the current time.
    NamespaceDocument load(const std::string& ns) const;

    // Whole-document overwrite via temp file + rename in the same directory.
    // Throws std::runtime_error if the document cannot be persisted.
    void save(const std::string& ns, const NamespaceDocument& doc) const;

    // <root>/<sanitized>.json
    std::string path_for(const std::string& ns) const;

    const std::string& root() const { return root_; }

    // Runs of characters outside [A-Za-z0-9_.-] become "_"; empty -> "default".
    static std::string sanitize(const std::string& ns);

private:
    std::string root_;
};

} // namespace mcpgate
