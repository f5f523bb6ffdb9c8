#pragma once

#include <string>
#include <libpq-fe.h>

#include "polarity/config.hpp"

namespace polarity::db {

// Database connection configuration
struct ConnectionConfig {
    std::string dbname;
    std::string host;
    std::string port;
    std::string user;
    std::string password;

    // Defaults come from the db.* configuration keys (PL_DB_* in the environment)
    ConnectionConfig() {
        const Config& config = Config::getInstance();
        dbname = config.get<std::string>("db.name", "polarity");
        host = config.get<std::string>("db.host", "localhost");
        port = config.get<std::string>("db.port", "5432");
        user = config.get<std::string>("db.user", "postgres");
        password = config.get<std::string>("db.password", "");
    }

    // Build libpq connection string
    std::string to_conninfo() const {
        std::string conninfo = "dbname=" + dbname;
        if (!host.empty()) conninfo += " host=" + host;
        if (!port.empty()) conninfo += " port=" + port;
        if (!user.empty()) conninfo += " user=" + user;
        if (!password.empty()) conninfo += " password=" + password;
        conninfo += " connect_timeout=5";
        return conninfo;
    }

    // Configuration key overridden by a command-line connection flag, or nullptr
    static const char* option_key(const std::string& arg) {
        if (arg == "-d" || arg == "--dbname") return "db.name";
        if (arg == "-h" || arg == "--host") return "db.host";
        if (arg == "-p" || arg == "--port") return "db.port";
        if (arg == "-U" || arg == "--user") return "db.user";
        if (arg == "-W" || arg == "--password") return "db.password";
        return nullptr;
    }
};

// RAII wrapper for PGconn
class Connection {
public:
    Connection() : conn_(nullptr) {}

    explicit Connection(const std::string& conninfo) {
        conn_ = PQconnectdb(conninfo.c_str());
    }

    explicit Connection(const ConnectionConfig& config)
        : Connection(config.to_conninfo()) {}

    ~Connection() {
        if (conn_) {
            PQfinish(conn_);
        }
    }

    // Move only
    Connection(Connection&& other) noexcept : conn_(other.conn_) {
        other.conn_ = nullptr;
    }

    Connection& operator=(Connection&& other) noexcept {
        if (this != &other) {
            if (conn_) PQfinish(conn_);
            conn_ = other.conn_;
            other.conn_ = nullptr;
        }
        return *this;
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    PGconn* get() const { return conn_; }
    operator PGconn*() const { return conn_; }

    bool ok() const {
        return conn_ && PQstatus(conn_) == CONNECTION_OK;
    }

    const char* error() const {
        return conn_ ? PQerrorMessage(conn_) : "No connection";
    }

private:
    PGconn* conn_;
};

} // namespace polarity::db
