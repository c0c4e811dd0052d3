#pragma once

#include <chrono>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace sqlkit {

// Default time a caller waits for a pooled connection
constexpr std::chrono::milliseconds kDefaultCheckoutTimeout{5000};

// Default number of rows per chunk for streamed results
constexpr size_t kDefaultChunkSize = 2048;

// Explicit allow-list of column names a generic record may carry
class IdentifierSet {
public:
    IdentifierSet() = default;
    IdentifierSet(std::initializer_list<std::string> names) : m_names(names) {}
    explicit IdentifierSet(const std::vector<std::string>& names)
        : m_names(names.begin(), names.end()) {}

    void add(const std::string& name) { m_names.insert(name); }
    bool contains(const std::string& name) const { return m_names.count(name) > 0; }
    size_t size() const { return m_names.size(); }
    bool empty() const { return m_names.empty(); }

private:
    std::unordered_set<std::string> m_names;
};

struct MaterializeOptions {
    IdentifierSet knownColumns;
    // Accept any column name instead of checking knownColumns
    bool allowDynamicFieldCreation = false;
};

struct QueryOptions {
    bool cache = true;
    std::chrono::milliseconds timeout = kDefaultCheckoutTimeout;
    size_t chunkSize = kDefaultChunkSize;
    // Shown in one-row retrieval errors; defaults to the truncated SQL
    std::optional<std::string> label;
    MaterializeOptions materialize;
};

}  // namespace sqlkit
