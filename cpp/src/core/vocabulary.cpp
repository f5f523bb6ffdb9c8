#include "polarity/vocabulary.hpp"
#include "polarity/error.hpp"

#include <algorithm>

namespace polarity {

namespace {

std::string at_index(const char* field, size_t i) {
    return std::string(field) + "[" + std::to_string(i) + "]";
}

} // namespace

VocabularyStore::VocabularyStore()
    : tokens_(constants::VOCAB_CAP)
    , semantic_(constants::VOCAB_CAP, SemanticVector::Zero())
    , context_(constants::VOCAB_CAP, ContextVector::Zero())
    , class_semantic_(constants::NUM_CLASSES, SemanticVector::Zero())
    , class_context_(constants::NUM_CLASSES, ContextVector::Zero()) {}

void VocabularyStore::validate(const VocabularyBatch& batch) {
    const size_t n = batch.ids.size();

    struct Field { const char* name; size_t len; };
    const Field fields[] = {
        {"words", batch.words.size()},
        {"sentiments", batch.sentiments.size()},
        {"flags", batch.flags.size()},
        {"categories", batch.categories.size()},
        {"weights", batch.weights.size()},
        {"domain_relevance", batch.domain_relevance.size()},
        {"secondary_categories", batch.secondary_categories.size()},
        {"context_influence", batch.context_influence.size()},
    };
    for (const auto& f : fields) {
        if (f.len != n) {
            throw ValidationError(ErrorCode::LENGTH_MISMATCH,
                                  "Array length mismatch: " + std::string(f.name) + " has " +
                                  std::to_string(f.len) + " entries, ids has " + std::to_string(n),
                                  "set_vocabulary");
        }
    }
    if (!batch.domain_strengths.empty() && batch.domain_strengths.size() != n) {
        throw ValidationError(ErrorCode::LENGTH_MISMATCH,
                              "Array length mismatch: domain_strengths has " +
                              std::to_string(batch.domain_strengths.size()) + " entries, ids has " +
                              std::to_string(n),
                              "set_vocabulary");
    }

    if (n == 0) {
        throw ValidationError(ErrorCode::EMPTY_INPUT, "Vocabulary batch is empty", "set_vocabulary");
    }
    if (n > constants::VOCAB_CAP) {
        throw ValidationError(ErrorCode::INPUT_TOO_LONG,
                              "Vocabulary batch of " + std::to_string(n) + " exceeds cap of " +
                              std::to_string(constants::VOCAB_CAP),
                              "set_vocabulary");
    }

    for (size_t i = 0; i < n; ++i) {
        if (batch.ids[i] >= constants::VOCAB_CAP) {
            throw ValidationError(ErrorCode::TOKEN_OUT_OF_RANGE,
                                  at_index("ids", i) + " = " + std::to_string(batch.ids[i]) +
                                  " is outside [0, " + std::to_string(constants::VOCAB_CAP) + ")",
                                  "set_vocabulary");
        }
        if (batch.weights[i] < constants::MIN_WEIGHT || batch.weights[i] > constants::MAX_WEIGHT) {
            throw ValidationError(ErrorCode::VALUE_OUT_OF_RANGE,
                                  at_index("weights", i) + " = " + std::to_string(batch.weights[i]) +
                                  " is outside [1, 10]",
                                  "set_vocabulary");
        }
        if (batch.context_influence[i] < constants::MIN_WEIGHT ||
            batch.context_influence[i] > constants::MAX_WEIGHT) {
            throw ValidationError(ErrorCode::VALUE_OUT_OF_RANGE,
                                  at_index("context_influence", i) + " = " +
                                  std::to_string(batch.context_influence[i]) + " is outside [1, 10]",
                                  "set_vocabulary");
        }
        if (batch.domain_relevance[i] >= static_cast<uint32_t>(constants::NUM_DOMAINS)) {
            throw ValidationError(ErrorCode::VALUE_OUT_OF_RANGE,
                                  at_index("domain_relevance", i) + " = " +
                                  std::to_string(batch.domain_relevance[i]) + " is outside [0, 10)",
                                  "set_vocabulary");
        }
        if (batch.categories[i] >= constants::NUM_CATEGORIES ||
            batch.secondary_categories[i] >= constants::NUM_CATEGORIES) {
            throw ValidationError(ErrorCode::VALUE_OUT_OF_RANGE,
                                  "categories/secondary_categories at index " + std::to_string(i) +
                                  " must be below " + std::to_string(constants::NUM_CATEGORIES),
                                  "set_vocabulary");
        }
        if (!batch.domain_strengths.empty() &&
            batch.domain_strengths[i] > constants::MAX_DOMAIN_STRENGTH) {
            throw ValidationError(ErrorCode::VALUE_OUT_OF_RANGE,
                                  at_index("domain_strengths", i) + " = " +
                                  std::to_string(batch.domain_strengths[i]) + " exceeds 100",
                                  "set_vocabulary");
        }
    }
}

TokenId VocabularyStore::set_vocabulary(const VocabularyBatch& batch) {
    validate(batch);

    TokenId highest = 0;
    for (size_t i = 0; i < batch.size(); ++i) {
        const TokenId id = batch.ids[i];

        auto stale = word_index_.find(tokens_[id].word);
        if (stale != word_index_.end() && stale->second == id) {
            release_word(stale, id);
        }

        TokenMetadata meta;
        meta.word = batch.words[i];
        meta.sentiment = batch.sentiments[i];
        meta.flags = batch.flags[i];
        meta.category = batch.categories[i];
        meta.secondary_category = batch.secondary_categories[i];
        meta.weight = static_cast<uint8_t>(batch.weights[i]);
        meta.domain_relevance = static_cast<uint8_t>(batch.domain_relevance[i]);
        meta.domain_strength = batch.domain_strengths.empty()
            ? 0 : static_cast<uint8_t>(batch.domain_strengths[i]);
        meta.context_influence = static_cast<uint8_t>(batch.context_influence[i]);
        tokens_[id] = std::move(meta);

        if (!tokens_[id].word.empty()) {
            word_index_[tokens_[id].word] = id;
        }
        highest = std::max(highest, id);
    }

    vocab_size_ = std::max(vocab_size_, highest + 1);
    return highest;
}

// Repoint a word at the lowest other id still holding it, or drop it
void VocabularyStore::release_word(WordIndex::iterator entry, TokenId released) {
    for (TokenId other = 0; other < constants::VOCAB_CAP; ++other) {
        if (other != released && tokens_[other].word == entry->first) {
            entry->second = other;
            return;
        }
    }
    word_index_.erase(entry);
}

void VocabularyStore::set_embedding(TokenId id, const SemanticVector& semantic, const ContextVector& context) {
    if (id >= constants::VOCAB_CAP) {
        throw ValidationError(ErrorCode::TOKEN_OUT_OF_RANGE,
                              "Token id " + std::to_string(id) + " is outside the vocabulary cap",
                              "set_embedding");
    }
    semantic_[id] = semantic;
    context_[id] = context;
}

void VocabularyStore::set_class_weights(int cls, const SemanticVector& semantic, const ContextVector& context) {
    POLARITY_CHECK_ARGUMENT(cls >= 0 && cls < constants::NUM_CLASSES,
                            "Class " + std::to_string(cls) + " is outside [0, 7)");
    class_semantic_[cls] = semantic;
    class_context_[cls] = context;
}

void VocabularyStore::add_phrase(const std::string& phrase, const std::vector<TokenId>& ids) {
    POLARITY_CHECK(!phrase.empty(), ErrorCode::EMPTY_INPUT, "Phrase text is empty");
    POLARITY_CHECK(!ids.empty() && ids.size() <= constants::MAX_INPUT_TOKENS,
                   ErrorCode::INPUT_TOO_LONG, "Phrase must map to 1..16 tokens");
    for (TokenId id : ids) {
        if (!contains(id)) {
            throw ValidationError(ErrorCode::TOKEN_OUT_OF_RANGE,
                                  "Phrase token " + std::to_string(id) + " is outside the vocabulary",
                                  "add_phrase");
        }
    }
    phrases_[phrase] = ids;
}

std::string VocabularyStore::word(TokenId id) const {
    return contains(id) ? tokens_[id].word : std::string();
}

std::optional<TokenId> VocabularyStore::find(const std::string& word) const {
    auto it = word_index_.find(word);
    if (it == word_index_.end()) return std::nullopt;
    return it->second;
}

void VocabularyStore::record_usage(TokenId id) {
    saturating_increment(tokens_[id].usage_count);
}

void VocabularyStore::record_cooccurrence(TokenId id) {
    saturating_increment(tokens_[id].cooccurrence_total);
}

void VocabularyStore::restore_token(TokenId id, const TokenMetadata& meta) {
    if (id >= constants::VOCAB_CAP) {
        throw ValidationError(ErrorCode::TOKEN_OUT_OF_RANGE,
                              "Stored token id " + std::to_string(id) + " exceeds the vocabulary cap",
                              "restore_token");
    }
    tokens_[id] = meta;
    if (!meta.word.empty()) {
        word_index_[meta.word] = id;
    }
}

std::string VocabularyStore::reconstruct_text(const std::vector<TokenId>& ids) const {
    std::string text;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) text += ' ';
        text += word(ids[i]);
    }
    return text;
}

} // namespace polarity
