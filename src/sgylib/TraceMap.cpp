#include "sgylib/TraceMap.hpp"
#include "sgylib/SegyReader.hpp"
#include "sgylib/SegyUtil.hpp"
#include "sgylib/TraceFieldMap.hpp"
#include "Logger.hpp"
#include "util.hpp"
#include <algorithm>
#include <map>
#include <sstream>
#include <stdexcept>

#include <omp.h>
#include <sqlite3.h>

namespace {
    using KeyTuple = std::vector<int>;
    using Grouping = std::map<KeyTuple, std::vector<int>>;

    [[noreturn]] void sqlite_fail(sqlite3* db, const std::string& context) {
        throw std::runtime_error("SQLite error in " + context + ": " + sqlite3_errmsg(db));
    }

    void exec(sqlite3* db, const char* sql, const char* context) {
        if (sqlite3_exec(db, sql, nullptr, nullptr, nullptr) != SQLITE_OK) sqlite_fail(db, context);
    }

    // Prepared statement, finalized when it goes out of scope
    class Statement {
    public:
        Statement(sqlite3* db, const std::string& sql) : db_(db) {
            if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
                sqlite_fail(db_, "prepare '" + sql + "'");
            }
        }
        ~Statement() { sqlite3_finalize(stmt_); }
        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        void bind(int pos, int value) {
            if (sqlite3_bind_int(stmt_, pos, value) != SQLITE_OK) sqlite_fail(db_, "bind");
        }
        void bind(int pos, const std::vector<uint8_t>& blob) {
            if (sqlite3_bind_blob(stmt_, pos, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
                sqlite_fail(db_, "bind");
            }
        }
        // true while rows come back
        bool step() {
            int rc = sqlite3_step(stmt_);
            if (rc == SQLITE_ROW) return true;
            if (rc != SQLITE_DONE) sqlite_fail(db_, "step");
            return false;
        }
        void reset() {
            if (sqlite3_reset(stmt_) != SQLITE_OK) sqlite_fail(db_, "reset");
        }
        sqlite3_stmt* get() const { return stmt_; }

    private:
        sqlite3* db_;
        sqlite3_stmt* stmt_ = nullptr;
    };

    // Rolls back unless committed
    class Transaction {
    public:
        explicit Transaction(sqlite3* db) : db_(db) { exec(db_, "BEGIN TRANSACTION;", "begin transaction"); }
        ~Transaction() {
            if (!committed_ && sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
                log_warn(std::string("Trace map rollback failed: ") + sqlite3_errmsg(db_));
            }
        }
        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit() {
            exec(db_, "COMMIT;", "commit transaction");
            committed_ = true;
        }

    private:
        sqlite3* db_;
        bool committed_ = false;
    };

    std::string column_list(const std::vector<std::string>& keys) {
        std::string out;
        for (std::size_t i = 0; i < keys.size(); ++i) {
            if (i) out += ", ";
            out += "\"" + keys[i] + "\"";
        }
        return out;
    }

    // Trace indices are stored as big-endian int32 so the index file does
    // not depend on the host byte order
    std::vector<uint8_t> pack_indices(const std::vector<int>& indices) {
        std::vector<uint8_t> blob(indices.size() * 4);
        for (std::size_t i = 0; i < indices.size(); ++i) {
            set_i32_be(blob.data(), static_cast<int>(i * 4), indices[i]);
        }
        return blob;
    }

    std::vector<int> unpack_indices(const void* data, int size) {
        const auto* bytes = static_cast<const uint8_t*>(data);
        std::vector<int> indices(static_cast<std::size_t>(size) / 4);
        for (std::size_t i = 0; i < indices.size(); ++i) {
            indices[i] = get_i32_be(bytes, static_cast<int>(i * 4));
        }
        return indices;
    }
}

TraceMap::TraceMap(const std::string& db_path, const std::vector<std::string>& keys)
    : db_path_(db_path), keys_(keys)
{
    if (keys_.empty()) {
        throw std::invalid_argument("Trace map needs at least one key");
    }
    // Key names end up in SQL, so only known header fields are accepted
    for (const auto& key : keys_) {
        trace_field(key);
    }
    open_db();
    try {
        create_table();
    } catch (const std::runtime_error&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

TraceMap::~TraceMap() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void TraceMap::open_db() {
    if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open trace index " + db_path_ + ": " + msg);
    }
}

void TraceMap::create_table() {
    exec(db_, "PRAGMA journal_mode = WAL;", "journal mode");
    exec(db_, "PRAGMA synchronous = NORMAL;", "synchronous mode");

    std::ostringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS trace_map (";
    for (const auto& key : keys_) {
        sql << "\"" << key << "\" INTEGER NOT NULL, ";
    }
    sql << "indices BLOB NOT NULL, PRIMARY KEY (" << column_list(keys_) << "));";
    exec(db_, sql.str().c_str(), "create table");
}

void TraceMap::build_map(const SegyReader& reader) {
    const int n_traces = reader.num_traces();
    const std::size_t n_keys = keys_.size();
    std::vector<FieldInfo> fields;
    for (const auto& key : keys_) fields.push_back(trace_field(key));

    // Headers are read sequentially, the file stream is not shareable
    std::vector<KeyTuple> tuples(n_traces, KeyTuple(n_keys));
    for (int i = 0; i < n_traces; ++i) {
        auto header = reader.get_trace_header(i);
        for (std::size_t k = 0; k < n_keys; ++k) {
            tuples[i][k] = get_field_value(header.data(), fields[k]);
        }
        if (i % 1000 == 0 || i == n_traces - 1) {
            print_progress_bar("Reading trace headers", i + 1, n_traces);
        }
    }

    // Each thread groups a contiguous slice, so per-thread index lists are
    // already ascending and concatenating them in thread order keeps that
    std::vector<Grouping> partial;
    #pragma omp parallel
    {
        #pragma omp single
        partial.resize(omp_get_num_threads());

        Grouping& mine = partial[omp_get_thread_num()];
        #pragma omp for schedule(static)
        for (int i = 0; i < n_traces; ++i) {
            mine[tuples[i]].push_back(i);
        }
    }

    Grouping groups;
    for (auto& part : partial) {
        for (auto& [tuple, indices] : part) {
            auto& dst = groups[tuple];
            dst.insert(dst.end(), indices.begin(), indices.end());
        }
    }
    partial.clear();

    std::string insert = "INSERT INTO trace_map (" + column_list(keys_) + ", indices) VALUES (";
    for (std::size_t k = 0; k < n_keys; ++k) insert += "?, ";
    insert += "?);";

    Transaction tx(db_);
    exec(db_, "DELETE FROM trace_map;", "clear table");
    {
        Statement stmt(db_, insert);
        for (const auto& [tuple, indices] : groups) {
            for (std::size_t k = 0; k < n_keys; ++k) {
                stmt.bind(static_cast<int>(k) + 1, tuple[k]);
            }
            stmt.bind(static_cast<int>(n_keys) + 1, pack_indices(indices));
            stmt.step();
            stmt.reset();
        }
    }
    tx.commit();

    log_info("Trace map " + db_path_ + ": " + std::to_string(groups.size()) + " key tuples over " +
             std::to_string(n_traces) + " traces");
}

std::vector<int> TraceMap::find_trace_indices(const std::vector<std::optional<int>>& key_values) const {
    if (key_values.size() > keys_.size()) {
        throw std::invalid_argument("Too many key values: " + std::to_string(key_values.size()) +
                                    " for " + std::to_string(keys_.size()) + " keys");
    }

    std::string sql = "SELECT indices FROM trace_map";
    std::vector<int> bound;
    for (std::size_t k = 0; k < key_values.size(); ++k) {
        if (!key_values[k]) continue;
        sql += bound.empty() ? " WHERE " : " AND ";
        sql += "\"" + keys_[k] + "\" = ?";
        bound.push_back(*key_values[k]);
    }

    Statement stmt(db_, sql);
    for (std::size_t i = 0; i < bound.size(); ++i) {
        stmt.bind(static_cast<int>(i) + 1, bound[i]);
    }

    std::vector<int> result;
    while (stmt.step()) {
        auto indices = unpack_indices(sqlite3_column_blob(stmt.get(), 0), sqlite3_column_bytes(stmt.get(), 0));
        result.insert(result.end(), indices.begin(), indices.end());
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<int> TraceMap::get_unique_values(const std::string& key) const {
    if (std::find(keys_.begin(), keys_.end(), key) == keys_.end()) {
        throw std::invalid_argument("Key not in trace map: " + key);
    }

    Statement stmt(db_, "SELECT DISTINCT \"" + key + "\" FROM trace_map ORDER BY 1;");
    std::vector<int> values;
    while (stmt.step()) {
        values.push_back(sqlite3_column_int(stmt.get(), 0));
    }
    return values;
}
