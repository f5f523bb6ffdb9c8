/**
 * @file helpers.hpp
 * @brief PostgreSQL helper functions for consistent data access
 *
 * Consolidates common patterns for:
 * - Result value extraction (with null/type handling)
 * - Integer array literals ({1,2,3}) used for embeddings and histograms
 * - COPY text-format escaping
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <libpq-fe.h>

namespace polarity::db {

// =============================================================================
// Result Value Extraction Helpers
// =============================================================================

/**
 * Safe extraction of string value from PGresult.
 * Returns empty string if null or out of bounds.
 */
inline std::string get_string(PGresult* res, int row, int col) {
    if (!res || row >= PQntuples(res) || col >= PQnfields(res)) {
        return {};
    }
    if (PQgetisnull(res, row, col)) {
        return {};
    }
    const char* val = PQgetvalue(res, row, col);
    return val ? val : "";
}

/**
 * Safe extraction of int64 value from PGresult.
 * Returns default_val if null or empty; malformed text is a hard error.
 */
int64_t get_int64(PGresult* res, int row, int col, int64_t default_val = 0);

// =============================================================================
// Integer Arrays
// =============================================================================

// {v0,v1,...}
template<typename Container>
std::string format_int_array(const Container& values) {
    std::string out = "{";
    bool first = true;
    for (auto v : values) {
        if (!first) out += ',';
        out += std::to_string(static_cast<long long>(v));
        first = false;
    }
    out += '}';
    return out;
}

// Parses a one-dimensional integer array literal; nullopt when malformed
std::optional<std::vector<int64_t>> parse_int_array(std::string_view literal);

// =============================================================================
// COPY Text Format
// =============================================================================

// Escape backslash, tab, newline and carriage return for COPY ... FROM STDIN
std::string copy_escape(std::string_view text);

// =============================================================================
// Query Execution Helpers
// =============================================================================

/**
 * RAII wrapper for PGresult.
 */
class Result {
public:
    Result() : res_(nullptr) {}
    explicit Result(PGresult* res) : res_(res) {}
    ~Result() { if (res_) PQclear(res_); }

    // Move only
    Result(Result&& other) noexcept : res_(other.res_) { other.res_ = nullptr; }
    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            if (res_) PQclear(res_);
            res_ = other.res_;
            other.res_ = nullptr;
        }
        return *this;
    }
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    PGresult* get() const { return res_; }
    operator PGresult*() const { return res_; }

    bool ok() const {
        ExecStatusType status = PQresultStatus(res_);
        return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
    }

    ExecStatusType status() const { return PQresultStatus(res_); }

    int ntuples() const { return res_ ? PQntuples(res_) : 0; }

    std::string error_message() const {
        return res_ ? PQresultErrorMessage(res_) : "null result";
    }

    std::string str(int row, int col) const { return get_string(res_, row, col); }
    int64_t int64(int row, int col, int64_t def = 0) const { return get_int64(res_, row, col, def); }

private:
    PGresult* res_;
};

inline Result exec(PGconn* conn, const char* sql) {
    return Result(PQexec(conn, sql));
}

inline Result exec(PGconn* conn, const std::string& sql) {
    return exec(conn, sql.c_str());
}

} // namespace polarity::db
