#pragma once

#include "polarity/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace polarity {

/**
 * Parallel arrays for one bulk vocabulary upsert.
 * Every array must have the same length; domain_strengths may be left empty.
 */
struct VocabularyBatch {
    std::vector<TokenId> ids;
    std::vector<std::string> words;
    std::vector<int32_t> sentiments;
    std::vector<uint8_t> flags;
    std::vector<uint8_t> categories;
    std::vector<uint32_t> weights;
    std::vector<uint32_t> domain_relevance;
    std::vector<uint8_t> secondary_categories;
    std::vector<uint32_t> context_influence;
    std::vector<uint32_t> domain_strengths;

    size_t size() const { return ids.size(); }
};

/**
 * Vocabulary & Embedding Store
 *
 * Owns per-token metadata, semantic/context embeddings and the per-class
 * scoring templates. Token ids are dense in [0, VOCAB_CAP); the effective
 * vocabulary size only grows.
 */
class VocabularyStore {
public:
    VocabularyStore();

    /**
     * Bulk upsert. Validates the whole batch first and throws ValidationError
     * on the first violated constraint; nothing is applied in that case.
     * @return highest token id written
     */
    TokenId set_vocabulary(const VocabularyBatch& batch);

    // Direct validated overwrites
    void set_embedding(TokenId id, const SemanticVector& semantic, const ContextVector& context);
    void set_class_weights(int cls, const SemanticVector& semantic, const ContextVector& context);
    void add_phrase(const std::string& phrase, const std::vector<TokenId>& ids);

    uint32_t size() const noexcept { return vocab_size_; }
    bool empty() const noexcept { return vocab_size_ == 0; }
    bool contains(TokenId id) const noexcept { return id < vocab_size_; }

    const TokenMetadata& metadata(TokenId id) const { return tokens_.at(id); }
    const SemanticVector& semantic(TokenId id) const { return semantic_.at(id); }
    const ContextVector& context(TokenId id) const { return context_.at(id); }

    const SemanticVector& class_semantic(int cls) const { return class_semantic_.at(cls); }
    const ContextVector& class_context(int cls) const { return class_context_.at(cls); }

    std::string word(TokenId id) const;
    std::optional<TokenId> find(const std::string& word) const;

    size_t phrase_count() const noexcept { return phrases_.size(); }
    const std::unordered_map<std::string, std::vector<TokenId>>& phrases() const noexcept { return phrases_; }

    // Usage bookkeeping, driven by the classifier commit
    void record_usage(TokenId id);
    void record_cooccurrence(TokenId id);

    // Restore path for the durable-state repository; bypasses batch validation
    void restore_token(TokenId id, const TokenMetadata& meta);
    void restore_size(uint32_t size) { vocab_size_ = size; }

    // Space-joined words, used for notifications
    std::string reconstruct_text(const std::vector<TokenId>& ids) const;

private:
    using WordIndex = std::unordered_map<std::string, TokenId>;

    static void validate(const VocabularyBatch& batch);
    void release_word(WordIndex::iterator entry, TokenId released);

    std::vector<TokenMetadata> tokens_;
    std::vector<SemanticVector> semantic_;
    std::vector<ContextVector> context_;
    std::vector<SemanticVector> class_semantic_;
    std::vector<ContextVector> class_context_;
    WordIndex word_index_;
    std::unordered_map<std::string, std::vector<TokenId>> phrases_;
    uint32_t vocab_size_ = 0;
};

} // namespace polarity
