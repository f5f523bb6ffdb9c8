// =============================================================================
// model_loader.hpp - Text model files -> validated engine inputs
// =============================================================================
// Whitespace-separated columns, one record per line, '#' starts a comment.
//
//   vocabulary:     id word sentiment flags category weight domain secondary influence [strength]
//   embeddings:     id s0 .. s23 c0 .. c7
//   class weights:  class s0 .. s23 c0 .. c7
//   domains:        domain intensity b0 .. b6
//
// Parsing only shapes the data; range checks stay with the stores so a file
// and an API call are validated by the same code.
// =============================================================================

#pragma once

#include "polarity/types.hpp"
#include "polarity/vocabulary.hpp"
#include "polarity/domain_model.hpp"

#include <filesystem>
#include <istream>
#include <vector>

namespace polarity {

struct EngineState;

namespace io {

struct EmbeddingRow {
    TokenId id = 0;
    SemanticVector semantic = SemanticVector::Zero();
    ContextVector context = ContextVector::Zero();
};

struct ClassWeightRow {
    int cls = 0;
    SemanticVector semantic = SemanticVector::Zero();
    ContextVector context = ContextVector::Zero();
};

struct DomainRow {
    int domain = 0;
    DomainModifier modifier;
};

// Stream parsers; throw IOError(PARSE_FAILED) naming the offending line
VocabularyBatch parse_vocabulary(std::istream& in);
std::vector<EmbeddingRow> parse_embeddings(std::istream& in);
std::vector<ClassWeightRow> parse_class_weights(std::istream& in);
std::vector<DomainRow> parse_domains(std::istream& in);

// File wrappers; throw IOError(FILE_NOT_FOUND) when the file cannot be opened
VocabularyBatch load_vocabulary(const std::filesystem::path& path);
std::vector<EmbeddingRow> load_embeddings(const std::filesystem::path& path);
std::vector<ClassWeightRow> load_class_weights(const std::filesystem::path& path);
std::vector<DomainRow> load_domains(const std::filesystem::path& path);

struct ModelPaths {
    std::filesystem::path vocabulary;
    std::filesystem::path embeddings;
    std::filesystem::path class_weights;
    std::filesystem::path domains;
};

/**
 * Apply every non-empty path to a fresh copy of state, then swap it in.
 * A failure in any file leaves state untouched.
 */
void load_model(EngineState& state, const ModelPaths& paths);

} // namespace io
} // namespace polarity
