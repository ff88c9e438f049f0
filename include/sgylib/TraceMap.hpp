#pragma once

#include <string>
#include <vector>
#include <optional>

struct sqlite3;
class SegyReader;

// Persistent index from a tuple of trace header values to trace indices,
// stored in SQLite next to the SEG-Y file.
class TraceMap {
public:
    // Keys must be trace header field names; the table is created if needed
    TraceMap(const std::string& db_path, const std::vector<std::string>& keys);
    ~TraceMap();

    TraceMap(const TraceMap&) = delete;
    TraceMap& operator=(const TraceMap&) = delete;

    // Replaces the stored index with one built from every trace in `reader`
    void build_map(const SegyReader& reader);
    // std::nullopt in key_values matches any value of that key.
    // Returns ascending trace indices.
    std::vector<int> find_trace_indices(const std::vector<std::optional<int>>& key_values) const;
    std::vector<int> get_unique_values(const std::string& key) const;

    const std::vector<std::string>& keys() const { return keys_; }

private:
    std::string db_path_;
    std::vector<std::string> keys_;
    sqlite3* db_ = nullptr;

    void open_db();
    void create_table();
};
