#include "polarity/db/helpers.hpp"
#include "polarity/error.hpp"

#include <charconv>

namespace polarity::db {

int64_t get_int64(PGresult* res, int row, int col, int64_t default_val) {
    if (!res || row >= PQntuples(res) || col >= PQnfields(res)) {
        return default_val;
    }
    if (PQgetisnull(res, row, col)) {
        return default_val;
    }
    const char* val = PQgetvalue(res, row, col);
    if (!val || *val == '\0') {
        return default_val;
    }
    std::string_view text(val);
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        throw DatabaseError("Column value '" + std::string(text) + "' is not an integer",
                            "row " + std::to_string(row) + ", column " + std::to_string(col));
    }
    return out;
}

std::optional<std::vector<int64_t>> parse_int_array(std::string_view literal) {
    if (literal.size() < 2 || literal.front() != '{' || literal.back() != '}') {
        return std::nullopt;
    }
    std::string_view body = literal.substr(1, literal.size() - 2);

    std::vector<int64_t> values;
    if (body.empty()) return values;

    size_t pos = 0;
    while (pos <= body.size()) {
        size_t comma = body.find(',', pos);
        if (comma == std::string_view::npos) comma = body.size();

        std::string_view item = body.substr(pos, comma - pos);
        int64_t v = 0;
        auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), v);
        if (item.empty() || ec != std::errc() || ptr != item.data() + item.size()) {
            return std::nullopt;
        }
        values.push_back(v);
        pos = comma + 1;
    }
    return values;
}

std::string copy_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default: out += c; break;
        }
    }
    return out;
}

} // namespace polarity::db
