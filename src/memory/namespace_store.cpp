#include "namespace_store.hpp"
#include "../util.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace mcpgate {

NamespaceStore::NamespaceStore(std::string root_dir) : root_(std::move(root_dir)) {}

static bool namespace_char(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '.' || c == '-';
}

std::string NamespaceStore::sanitize(const std::string& ns) {
    std::string out;
    out.reserve(ns.size());
    bool in_run = false;
    for (unsigned char c : trim(ns)) {
        if (namespace_char(c)) {
            out += static_cast<char>(c);
            in_run = false;
        } else if (!in_run) {
            out += '_';
            in_run = true;
        }
    }
    return out.empty() ? kDefaultNamespace : out;
}

std::string NamespaceStore::path_for(const std::string& ns) const {
    return (std::filesystem::path(root_) / (sanitize(ns) + ".json")).string();
}

static NamespaceDocument fresh_document() {
    NamespaceDocument doc;
    doc.updated_at = timestamp_now();
    return doc;
}

NamespaceDocument NamespaceStore::load(const std::string& ns) const {
    std::string path = path_for(ns);

    std::ifstream file(path);
    if (!file.is_open()) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            std::cerr << "[memory] Cannot read " << path << ": " << std::strerror(errno)
                      << "; starting fresh\n";
        }
        return fresh_document();
    }

    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object() ||
        !j.contains("entries") || !j["entries"].is_array()) {
        std::cerr << "[memory] Corrupt namespace file " << path << "; starting fresh\n";
        return fresh_document();
    }

    NamespaceDocument doc;
    if (j.contains("updated_at") && j["updated_at"].is_string()) {
        doc.updated_at = j["updated_at"].get<std::string>();
    } else {
        doc.updated_at = timestamp_now();
    }
    doc.entries.reserve(j["entries"].size());
    for (const auto& item : j["entries"]) {
        doc.entries.push_back(entry_from_json(item));
    }
    return doc;
}

void NamespaceStore::save(const std::string& ns, const NamespaceDocument& doc) const {
    std::string path = path_for(ns);
    std::string error;
    if (!atomic_write_file(path, document_to_json(doc).dump(2) + "\n", error)) {
        throw std::runtime_error("Failed to save namespace '" + sanitize(ns) + "': " + error);
    }
}

} // namespace mcpgate
