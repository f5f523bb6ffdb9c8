#pragma once

#include "polarity/engine_state.hpp"

#include <string>
#include <vector>
#include <libpq-fe.h>

namespace polarity {

/**
 * Durable-state collaborator. Implementations store the complete
 * EngineState and read it back verbatim.
 */
class StateRepository {
public:
    virtual ~StateRepository() = default;

    virtual void save(const EngineState& state) = 0;
    virtual EngineState load() = 0;
    virtual bool has_state() = 0;
};

namespace db {

/**
 * PostgreSQL StateRepository.
 *
 * Tables (created by ensure_schema):
 *   pl_token, pl_class_weight, pl_cooccurrence, pl_domain,
 *   pl_user_context, pl_statistics, pl_phrase
 */
class PgStateRepository : public StateRepository {
public:
    explicit PgStateRepository(PGconn* conn) : conn_(conn) {}

    // CREATE TABLE IF NOT EXISTS for every table. Throws DatabaseError.
    void ensure_schema();

    /**
     * Replace the stored state with `state` inside one transaction
     * (TRUNCATE, then COPY each table). Rolls back and throws DatabaseError
     * on any failure.
     */
    void save(const EngineState& state) override;

    // Rebuild an EngineState from the stored tables. Throws DatabaseError.
    EngineState load() override;

    // True when pl_statistics holds a row
    bool has_state() override;

private:
    void exec_command(const char* sql, const char* what);
    void copy_rows(const char* table, const std::vector<std::string>& rows);

    PGconn* conn_;
};

} // namespace db
} // namespace polarity
