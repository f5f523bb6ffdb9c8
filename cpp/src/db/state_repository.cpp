#include "polarity/db/state_repository.hpp"
#include "polarity/db/helpers.hpp"
#include "polarity/error.hpp"
#include "polarity/logging.hpp"

#include <initializer_list>
#include <string>
#include <vector>

namespace polarity::db {

namespace {

const char* SCHEMA_SQL = R"SQL(
    CREATE TABLE IF NOT EXISTS pl_token (
        id                 INT PRIMARY KEY,
        word               TEXT NOT NULL,
        sentiment          INT NOT NULL,
        flags              SMALLINT NOT NULL,
        category           SMALLINT NOT NULL,
        secondary_category SMALLINT NOT NULL,
        weight             SMALLINT NOT NULL,
        domain_relevance   SMALLINT NOT NULL,
        domain_strength    SMALLINT NOT NULL,
        context_influence  SMALLINT NOT NULL,
        usage_count        BIGINT NOT NULL,
        cooccurrence_total BIGINT NOT NULL,
        semantic           INT[] NOT NULL,
        context            INT[] NOT NULL
    );
    CREATE TABLE IF NOT EXISTS pl_class_weight (
        class    SMALLINT PRIMARY KEY,
        semantic INT[] NOT NULL,
        context  INT[] NOT NULL
    );
    CREATE TABLE IF NOT EXISTS pl_cooccurrence (
        token_a INT NOT NULL,
        token_b INT NOT NULL,
        count   INT NOT NULL,
        PRIMARY KEY (token_a, token_b)
    );
    CREATE TABLE IF NOT EXISTS pl_domain (
        domain    SMALLINT PRIMARY KEY,
        intensity INT NOT NULL,
        bias      INT[] NOT NULL
    );
    CREATE TABLE IF NOT EXISTS pl_user_context (
        caller             TEXT PRIMARY KEY,
        last_interaction   BIGINT NOT NULL,
        last_input_token   INT NOT NULL,
        topic_buffer       INT[] NOT NULL,
        class_history      INT[] NOT NULL,
        total_interactions INT NOT NULL,
        sentiment_bias     INT NOT NULL,
        primary_domain     SMALLINT NOT NULL
    );
    CREATE TABLE IF NOT EXISTS pl_statistics (
        id                    SMALLINT PRIMARY KEY,
        vocab_size            INT NOT NULL,
        total_classifications BIGINT NOT NULL,
        correct_predictions   BIGINT NOT NULL,
        class_distribution    BIGINT[] NOT NULL
    );
    CREATE TABLE IF NOT EXISTS pl_phrase (
        phrase TEXT PRIMARY KEY,
        tokens INT[] NOT NULL
    );
)SQL";

template<typename Derived>
std::vector<int64_t> to_vector(const Eigen::MatrixBase<Derived>& v) {
    std::vector<int64_t> out(static_cast<size_t>(v.size()));
    for (Eigen::Index i = 0; i < v.size(); ++i) out[static_cast<size_t>(i)] = v(i);
    return out;
}

std::vector<int64_t> array_column(const Result& res, int row, int col, size_t expected, const char* what) {
    auto values = parse_int_array(res.str(row, col));
    if (!values || values->size() != expected) {
        throw DatabaseError(std::string("Malformed array in ") + what,
                            "row " + std::to_string(row) + ": '" + res.str(row, col) + "'");
    }
    return *values;
}

template<typename Vector>
Vector to_eigen(const std::vector<int64_t>& values) {
    Vector v;
    for (Eigen::Index i = 0; i < v.size(); ++i) v(i) = static_cast<typename Vector::Scalar>(values[static_cast<size_t>(i)]);
    return v;
}

std::string tsv(std::initializer_list<std::string> fields) {
    std::string line;
    bool first = true;
    for (const auto& f : fields) {
        if (!first) line += '\t';
        line += f;
        first = false;
    }
    line += '\n';
    return line;
}

} // namespace

void PgStateRepository::exec_command(const char* sql, const char* what) {
    Result res = exec(conn_, sql);
    if (!res.ok()) {
        throw DatabaseError(std::string(what) + " failed", PQerrorMessage(conn_));
    }
}

void PgStateRepository::ensure_schema() {
    exec_command(SCHEMA_SQL, "Schema creation");
}

bool PgStateRepository::has_state() {
    Result res = exec(conn_, "SELECT 1 FROM pl_statistics WHERE id = 1");
    return res.ok() && res.ntuples() > 0;
}

void PgStateRepository::copy_rows(const char* table, const std::vector<std::string>& rows) {
    std::string sql = std::string("COPY ") + table + " FROM STDIN";
    Result res = exec(conn_, sql);
    if (res.status() != PGRES_COPY_IN) {
        throw DatabaseError("COPY start failed", PQerrorMessage(conn_), ErrorCode::TRANSACTION_FAILED);
    }

    for (const auto& line : rows) {
        if (PQputCopyData(conn_, line.c_str(), static_cast<int>(line.size())) != 1) {
            throw DatabaseError("COPY data failed", PQerrorMessage(conn_), ErrorCode::TRANSACTION_FAILED);
        }
    }
    if (PQputCopyEnd(conn_, nullptr) != 1) {
        throw DatabaseError("COPY end failed", PQerrorMessage(conn_), ErrorCode::TRANSACTION_FAILED);
    }

    Result done(PQgetResult(conn_));
    if (done.status() != PGRES_COMMAND_OK) {
        throw DatabaseError(std::string("COPY into ") + table + " failed", done.error_message(),
                            ErrorCode::TRANSACTION_FAILED);
    }
    // Drain until libpq reports no more results
    while (PGresult* extra = PQgetResult(conn_)) {
        PQclear(extra);
    }
}

void PgStateRepository::save(const EngineState& state) {
    const VocabularyStore& vocab = state.vocabulary;

    std::vector<std::string> tokens;
    for (TokenId id = 0; id < constants::VOCAB_CAP; ++id) {
        const bool has_embedding = !vocab.semantic(id).isZero() || !vocab.context(id).isZero();
        if (id >= vocab.size() && !has_embedding) continue;

        const TokenMetadata& m = vocab.metadata(id);
        tokens.push_back(tsv({
            std::to_string(id), copy_escape(m.word), std::to_string(m.sentiment),
            std::to_string(m.flags), std::to_string(m.category), std::to_string(m.secondary_category),
            std::to_string(m.weight), std::to_string(m.domain_relevance), std::to_string(m.domain_strength),
            std::to_string(m.context_influence), std::to_string(m.usage_count),
            std::to_string(m.cooccurrence_total),
            format_int_array(to_vector(vocab.semantic(id))),
            format_int_array(to_vector(vocab.context(id))),
        }));
    }

    std::vector<std::string> class_weights;
    for (int c = 0; c < constants::NUM_CLASSES; ++c) {
        class_weights.push_back(tsv({
            std::to_string(c),
            format_int_array(to_vector(vocab.class_semantic(c))),
            format_int_array(to_vector(vocab.class_context(c))),
        }));
    }

    std::vector<std::string> cooccurrence;
    state.cooccurrence.for_each_nonzero([&](TokenId a, TokenId b, uint16_t count) {
        cooccurrence.push_back(tsv({std::to_string(a), std::to_string(b), std::to_string(count)}));
    });

    std::vector<std::string> domains;
    for (int d = 0; d < constants::NUM_DOMAINS; ++d) {
        const DomainModifier& m = state.domains.modifier(d);
        domains.push_back(tsv({std::to_string(d), std::to_string(m.intensity), format_int_array(m.bias)}));
    }

    std::vector<std::string> users;
    for (const auto& [caller, ctx] : state.users.all()) {
        users.push_back(tsv({
            copy_escape(caller), std::to_string(ctx.last_interaction), std::to_string(ctx.last_input_token),
            format_int_array(ctx.topic_buffer), format_int_array(ctx.class_history),
            std::to_string(ctx.total_interactions), std::to_string(ctx.sentiment_bias),
            std::to_string(ctx.primary_domain),
        }));
    }

    const GlobalStatistics& stats = state.statistics;
    std::vector<std::string> statistics{tsv({
        "1", std::to_string(vocab.size()), std::to_string(stats.total_classifications),
        std::to_string(stats.correct_predictions), format_int_array(stats.class_distribution),
    })};

    std::vector<std::string> phrases;
    for (const auto& [phrase, ids] : vocab.phrases()) {
        phrases.push_back(tsv({copy_escape(phrase), format_int_array(ids)}));
    }

    exec_command("BEGIN", "BEGIN");
    try {
        exec_command("TRUNCATE pl_token, pl_class_weight, pl_cooccurrence, pl_domain, "
                     "pl_user_context, pl_statistics, pl_phrase", "TRUNCATE");
        copy_rows("pl_token", tokens);
        copy_rows("pl_class_weight", class_weights);
        copy_rows("pl_cooccurrence", cooccurrence);
        copy_rows("pl_domain", domains);
        copy_rows("pl_user_context", users);
        copy_rows("pl_statistics", statistics);
        copy_rows("pl_phrase", phrases);
        exec_command("COMMIT", "COMMIT");
    } catch (const DatabaseError&) {
        Result rollback = exec(conn_, "ROLLBACK");
        if (!rollback.ok()) {
            LOG_ERROR("ROLLBACK failed: ", PQerrorMessage(conn_));
        }
        throw;
    }

    LOG_INFO("Saved state: ", tokens.size(), " tokens, ", cooccurrence.size(), " co-occurrence cells, ",
             users.size(), " user contexts");
}

EngineState PgStateRepository::load() {
    EngineState state;

    {
        Result res = exec(conn_, "SELECT id, word, sentiment, flags, category, secondary_category, weight, "
                                 "domain_relevance, domain_strength, context_influence, usage_count, "
                                 "cooccurrence_total, semantic, context FROM pl_token ORDER BY id");
        if (!res.ok()) throw DatabaseError("Loading pl_token failed", res.error_message());

        for (int r = 0; r < res.ntuples(); ++r) {
            TokenId id = static_cast<TokenId>(res.int64(r, 0));
            TokenMetadata m;
            m.word = res.str(r, 1);
            m.sentiment = static_cast<int32_t>(res.int64(r, 2));
            m.flags = static_cast<uint8_t>(res.int64(r, 3));
            m.category = static_cast<uint8_t>(res.int64(r, 4));
            m.secondary_category = static_cast<uint8_t>(res.int64(r, 5));
            m.weight = static_cast<uint8_t>(res.int64(r, 6));
            m.domain_relevance = static_cast<uint8_t>(res.int64(r, 7));
            m.domain_strength = static_cast<uint8_t>(res.int64(r, 8));
            m.context_influence = static_cast<uint8_t>(res.int64(r, 9));
            m.usage_count = static_cast<uint32_t>(res.int64(r, 10));
            m.cooccurrence_total = static_cast<uint32_t>(res.int64(r, 11));

            state.vocabulary.restore_token(id, m);
            state.vocabulary.set_embedding(
                id,
                to_eigen<SemanticVector>(array_column(res, r, 12, constants::SEMANTIC_DIM, "pl_token.semantic")),
                to_eigen<ContextVector>(array_column(res, r, 13, constants::CONTEXT_DIM, "pl_token.context")));
        }
    }

    {
        Result res = exec(conn_, "SELECT class, semantic, context FROM pl_class_weight ORDER BY class");
        if (!res.ok()) throw DatabaseError("Loading pl_class_weight failed", res.error_message());

        for (int r = 0; r < res.ntuples(); ++r) {
            state.vocabulary.set_class_weights(
                static_cast<int>(res.int64(r, 0)),
                to_eigen<SemanticVector>(array_column(res, r, 1, constants::SEMANTIC_DIM, "pl_class_weight.semantic")),
                to_eigen<ContextVector>(array_column(res, r, 2, constants::CONTEXT_DIM, "pl_class_weight.context")));
        }
    }

    {
        Result res = exec(conn_, "SELECT token_a, token_b, count FROM pl_cooccurrence");
        if (!res.ok()) throw DatabaseError("Loading pl_cooccurrence failed", res.error_message());

        for (int r = 0; r < res.ntuples(); ++r) {
            state.cooccurrence.set(static_cast<TokenId>(res.int64(r, 0)),
                                   static_cast<TokenId>(res.int64(r, 1)),
                                   static_cast<uint16_t>(res.int64(r, 2)));
        }
    }

    {
        Result res = exec(conn_, "SELECT domain, intensity, bias FROM pl_domain ORDER BY domain");
        if (!res.ok()) throw DatabaseError("Loading pl_domain failed", res.error_message());

        for (int r = 0; r < res.ntuples(); ++r) {
            DomainModifier m;
            m.intensity = static_cast<uint32_t>(res.int64(r, 1));
            auto bias = array_column(res, r, 2, constants::NUM_CLASSES, "pl_domain.bias");
            for (int c = 0; c < constants::NUM_CLASSES; ++c) m.bias[c] = static_cast<int32_t>(bias[c]);
            state.domains.set_modifier(static_cast<int>(res.int64(r, 0)), m);
        }
    }

    {
        Result res = exec(conn_, "SELECT caller, last_interaction, last_input_token, topic_buffer, class_history, "
                                 "total_interactions, sentiment_bias, primary_domain FROM pl_user_context");
        if (!res.ok()) throw DatabaseError("Loading pl_user_context failed", res.error_message());

        for (int r = 0; r < res.ntuples(); ++r) {
            UserContext& ctx = state.users.get_or_create(res.str(r, 0));
            ctx.last_interaction = res.int64(r, 1);
            ctx.last_input_token = static_cast<TokenId>(res.int64(r, 2));
            auto topics = array_column(res, r, 3, constants::TOPIC_SLOTS, "pl_user_context.topic_buffer");
            for (int s = 0; s < constants::TOPIC_SLOTS; ++s) ctx.topic_buffer[s] = static_cast<TokenId>(topics[s]);
            auto history = array_column(res, r, 4, constants::NUM_CLASSES, "pl_user_context.class_history");
            for (int c = 0; c < constants::NUM_CLASSES; ++c) ctx.class_history[c] = static_cast<uint8_t>(history[c]);
            ctx.total_interactions = static_cast<uint16_t>(res.int64(r, 5));
            ctx.sentiment_bias = static_cast<int32_t>(res.int64(r, 6));
            ctx.primary_domain = static_cast<uint8_t>(res.int64(r, 7));
        }
    }

    {
        Result res = exec(conn_, "SELECT vocab_size, total_classifications, correct_predictions, "
                                 "class_distribution FROM pl_statistics WHERE id = 1");
        if (!res.ok()) throw DatabaseError("Loading pl_statistics failed", res.error_message());

        if (res.ntuples() > 0) {
            state.vocabulary.restore_size(static_cast<uint32_t>(res.int64(0, 0)));
            state.statistics.total_classifications = static_cast<uint64_t>(res.int64(0, 1));
            state.statistics.correct_predictions = static_cast<uint64_t>(res.int64(0, 2));
            auto dist = array_column(res, 0, 3, constants::NUM_CLASSES, "pl_statistics.class_distribution");
            for (int c = 0; c < constants::NUM_CLASSES; ++c) {
                state.statistics.class_distribution[c] = static_cast<uint64_t>(dist[c]);
            }
        }
    }

    {
        Result res = exec(conn_, "SELECT phrase, tokens FROM pl_phrase");
        if (!res.ok()) throw DatabaseError("Loading pl_phrase failed", res.error_message());

        for (int r = 0; r < res.ntuples(); ++r) {
            auto ids = parse_int_array(res.str(r, 1));
            if (!ids) throw DatabaseError("Malformed array in pl_phrase.tokens", res.str(r, 0));
            std::vector<TokenId> tokens;
            for (int64_t v : *ids) tokens.push_back(static_cast<TokenId>(v));
            state.vocabulary.add_phrase(res.str(r, 0), tokens);
        }
    }

    LOG_INFO("Loaded state: vocabulary size ", state.vocabulary.size(), ", ",
             state.users.size(), " user contexts, ", state.statistics.total_classifications,
             " classifications");
    return state;
}

} // namespace polarity::db
