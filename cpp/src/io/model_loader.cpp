#include "polarity/io/model_loader.hpp"
#include "polarity/engine_state.hpp"
#include "polarity/error.hpp"
#include "polarity/logging.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <utility>

namespace polarity {
namespace io {

namespace {

// Yields (line number, fields) for every non-blank, non-comment line
template<typename Func>
void for_each_record(std::istream& in, Func&& func) {
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);

        std::istringstream ss(line);
        std::vector<std::string> fields;
        std::string field;
        while (ss >> field) fields.push_back(std::move(field));
        if (fields.empty()) continue;

        func(line_no, fields);
    }
}

[[noreturn]] void parse_error(size_t line_no, const std::string& what) {
    throw IOError("Line " + std::to_string(line_no) + ": " + what, "model file", ErrorCode::PARSE_FAILED);
}

int64_t to_int(const std::string& s, size_t line_no) {
    try {
        size_t used = 0;
        long long v = std::stoll(s, &used);
        if (used != s.size()) parse_error(line_no, "trailing characters in '" + s + "'");
        return v;
    } catch (const std::invalid_argument&) {
        parse_error(line_no, "'" + s + "' is not an integer");
    } catch (const std::out_of_range&) {
        parse_error(line_no, "'" + s + "' is out of range");
    }
}

uint32_t to_uint(const std::string& s, size_t line_no) {
    int64_t v = to_int(s, line_no);
    if (v < 0 || v > static_cast<int64_t>(UINT32_MAX)) {
        parse_error(line_no, "'" + s + "' must be a non-negative 32-bit value");
    }
    return static_cast<uint32_t>(v);
}

uint8_t to_byte(const std::string& s, size_t line_no) {
    uint32_t v = to_uint(s, line_no);
    if (v > 255) parse_error(line_no, "'" + s + "' does not fit in 8 bits");
    return static_cast<uint8_t>(v);
}

int32_t to_int32(const std::string& s, size_t line_no) {
    int64_t v = to_int(s, line_no);
    if (v < INT32_MIN || v > INT32_MAX) parse_error(line_no, "'" + s + "' does not fit in 32 bits");
    return static_cast<int32_t>(v);
}

constexpr size_t VECTOR_FIELDS = constants::SEMANTIC_DIM + constants::CONTEXT_DIM;

void read_vectors(const std::vector<std::string>& fields, size_t line_no,
                  SemanticVector& semantic, ContextVector& context) {
    if (fields.size() != 1 + VECTOR_FIELDS) {
        parse_error(line_no, "expected " + std::to_string(1 + VECTOR_FIELDS) + " columns, found " +
                    std::to_string(fields.size()));
    }
    for (int i = 0; i < constants::SEMANTIC_DIM; ++i) {
        semantic[i] = to_int32(fields[1 + i], line_no);
    }
    for (int i = 0; i < constants::CONTEXT_DIM; ++i) {
        context[i] = to_int32(fields[1 + constants::SEMANTIC_DIM + i], line_no);
    }
}

template<typename Parser>
auto open_and_parse(const std::filesystem::path& path, Parser&& parser) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open model file", path.string());
    }
    try {
        return parser(file);
    } catch (const IOError& e) {
        throw IOError(e.what(), path.string(), ErrorCode::PARSE_FAILED);
    }
}

} // namespace

VocabularyBatch parse_vocabulary(std::istream& in) {
    VocabularyBatch batch;
    bool with_strength = false;
    bool first = true;

    for_each_record(in, [&](size_t line_no, const std::vector<std::string>& f) {
        if (f.size() != 9 && f.size() != 10) {
            parse_error(line_no, "expected 9 or 10 columns, found " + std::to_string(f.size()));
        }
        if (first) {
            with_strength = f.size() == 10;
            first = false;
        } else if ((f.size() == 10) != with_strength) {
            parse_error(line_no, "domain strength column must be present on every line or none");
        }

        batch.ids.push_back(to_uint(f[0], line_no));
        batch.words.push_back(f[1]);
        batch.sentiments.push_back(to_int32(f[2], line_no));
        batch.flags.push_back(to_byte(f[3], line_no));
        batch.categories.push_back(to_byte(f[4], line_no));
        batch.weights.push_back(to_uint(f[5], line_no));
        batch.domain_relevance.push_back(to_uint(f[6], line_no));
        batch.secondary_categories.push_back(to_byte(f[7], line_no));
        batch.context_influence.push_back(to_uint(f[8], line_no));
        if (with_strength) {
            batch.domain_strengths.push_back(to_uint(f[9], line_no));
        }
    });

    return batch;
}

std::vector<EmbeddingRow> parse_embeddings(std::istream& in) {
    std::vector<EmbeddingRow> rows;
    for_each_record(in, [&](size_t line_no, const std::vector<std::string>& f) {
        EmbeddingRow row;
        read_vectors(f, line_no, row.semantic, row.context);
        row.id = to_uint(f[0], line_no);
        rows.push_back(row);
    });
    return rows;
}

std::vector<ClassWeightRow> parse_class_weights(std::istream& in) {
    std::vector<ClassWeightRow> rows;
    for_each_record(in, [&](size_t line_no, const std::vector<std::string>& f) {
        ClassWeightRow row;
        read_vectors(f, line_no, row.semantic, row.context);
        row.cls = static_cast<int>(to_uint(f[0], line_no));
        rows.push_back(row);
    });
    return rows;
}

std::vector<DomainRow> parse_domains(std::istream& in) {
    std::vector<DomainRow> rows;
    for_each_record(in, [&](size_t line_no, const std::vector<std::string>& f) {
        if (f.size() != 2 + constants::NUM_CLASSES) {
            parse_error(line_no, "expected " + std::to_string(2 + constants::NUM_CLASSES) +
                        " columns, found " + std::to_string(f.size()));
        }
        DomainRow row;
        row.domain = static_cast<int>(to_uint(f[0], line_no));
        row.modifier.intensity = to_uint(f[1], line_no);
        for (int c = 0; c < constants::NUM_CLASSES; ++c) {
            row.modifier.bias[c] = to_int32(f[2 + c], line_no);
        }
        rows.push_back(row);
    });
    return rows;
}

VocabularyBatch load_vocabulary(const std::filesystem::path& path) {
    return open_and_parse(path, [](std::istream& in) { return parse_vocabulary(in); });
}

std::vector<EmbeddingRow> load_embeddings(const std::filesystem::path& path) {
    return open_and_parse(path, [](std::istream& in) { return parse_embeddings(in); });
}

std::vector<ClassWeightRow> load_class_weights(const std::filesystem::path& path) {
    return open_and_parse(path, [](std::istream& in) { return parse_class_weights(in); });
}

std::vector<DomainRow> load_domains(const std::filesystem::path& path) {
    return open_and_parse(path, [](std::istream& in) { return parse_domains(in); });
}

void load_model(EngineState& state, const ModelPaths& paths) {
    EngineState staged = state;

    if (!paths.vocabulary.empty()) {
        VocabularyBatch batch = load_vocabulary(paths.vocabulary);
        staged.vocabulary.set_vocabulary(batch);
        LOG_INFO("Loaded ", batch.size(), " vocabulary entries from ", paths.vocabulary.string());
    }
    if (!paths.embeddings.empty()) {
        auto rows = load_embeddings(paths.embeddings);
        for (const auto& row : rows) {
            staged.vocabulary.set_embedding(row.id, row.semantic, row.context);
        }
        LOG_INFO("Loaded ", rows.size(), " embeddings from ", paths.embeddings.string());
    }
    if (!paths.class_weights.empty()) {
        auto rows = load_class_weights(paths.class_weights);
        for (const auto& row : rows) {
            staged.vocabulary.set_class_weights(row.cls, row.semantic, row.context);
        }
        LOG_INFO("Loaded ", rows.size(), " class weight rows from ", paths.class_weights.string());
    }
    if (!paths.domains.empty()) {
        auto rows = load_domains(paths.domains);
        for (const auto& row : rows) {
            staged.domains.set_modifier(row.domain, row.modifier);
        }
        LOG_INFO("Loaded ", rows.size(), " domain modifiers from ", paths.domains.string());
    }

    state = std::move(staged);
}

} // namespace io
} // namespace polarity
