#pragma once

#include <cstdint>
#include <array>
#include <string>
#include <vector>
#include <limits>

#include <Eigen/Dense>

namespace polarity {

// =============================================================================
// Engine Constants
// =============================================================================

namespace constants {

constexpr uint32_t VOCAB_CAP = 1024;
constexpr int SEMANTIC_DIM = 24;
constexpr int CONTEXT_DIM = 8;
constexpr int NUM_CLASSES = 7;
constexpr int NUM_DOMAINS = 10;
constexpr int NUM_CATEGORIES = 9;
constexpr int64_t SCALE = 1000;

constexpr size_t MIN_INPUT_TOKENS = 1;
constexpr size_t MAX_INPUT_TOKENS = 16;
constexpr int TOPIC_SLOTS = 3;

// Seconds
constexpr int64_t RECENCY_WINDOW = 3600;

constexpr uint16_t COOCCURRENCE_MAX = std::numeric_limits<uint16_t>::max();
constexpr uint8_t CLASS_HISTORY_MAX = std::numeric_limits<uint8_t>::max();
constexpr uint16_t INTERACTIONS_MAX = std::numeric_limits<uint16_t>::max();

constexpr uint32_t MIN_WEIGHT = 1;
constexpr uint32_t MAX_WEIGHT = 10;
constexpr uint32_t MAX_DOMAIN_STRENGTH = 100;
constexpr uint32_t MAX_DOMAIN_INTENSITY = 100;

constexpr int NEUTRAL_CLASS = 3;

} // namespace constants

// Token identifier in [0, vocabulary size)
using TokenId = uint32_t;

// Unix seconds, supplied by the replicated log
using Timestamp = int64_t;

// Opaque caller identity (account address, user handle, ...)
using CallerId = std::string;

// Fixed-point vectors, scale factor 1000
using SemanticVector = Eigen::Matrix<int32_t, constants::SEMANTIC_DIM, 1>;
using ContextVector = Eigen::Matrix<int32_t, constants::CONTEXT_DIM, 1>;

// Wide accumulators used during aggregation
using SemanticAccum = Eigen::Matrix<int64_t, constants::SEMANTIC_DIM, 1>;
using ContextAccum = Eigen::Matrix<int64_t, constants::CONTEXT_DIM, 1>;

// One running score per sentiment class
using ClassScores = std::array<int64_t, constants::NUM_CLASSES>;

// =============================================================================
// Sentiment Classes, Domains, Flags
// =============================================================================

enum class SentimentClass : uint8_t {
    VeryNegative = 0,
    Negative = 1,
    SlightlyNegative = 2,
    Neutral = 3,
    SlightlyPositive = 4,
    Positive = 5,
    VeryPositive = 6
};

enum class Domain : uint8_t {
    General = 0,
    Technology = 1,
    Finance = 2,
    Health = 3,
    Entertainment = 4,
    Sports = 5,
    Politics = 6,
    Food = 7,
    Travel = 8,
    Education = 9
};

// Non-exclusive token flags
namespace flags {
constexpr uint8_t POSITIVE          = 1u << 0;
constexpr uint8_t NEGATIVE          = 1u << 1;
constexpr uint8_t EMOTIONAL         = 1u << 2;
constexpr uint8_t DOMAIN_SPECIFIC   = 1u << 3;
constexpr uint8_t INTENSE           = 1u << 4;
constexpr uint8_t AMBIGUOUS         = 1u << 5;
constexpr uint8_t SARCASTIC         = 1u << 6;
constexpr uint8_t CONTEXT_DEPENDENT = 1u << 7;
} // namespace flags

const char* class_name(int cls) noexcept;
const char* domain_name(int domain) noexcept;

// =============================================================================
// Token Metadata
// =============================================================================

struct TokenMetadata {
    std::string word;
    int32_t sentiment = 0;
    uint8_t flags = 0;
    uint8_t category = 0;
    uint8_t secondary_category = 0;
    uint8_t weight = 0;
    uint8_t domain_relevance = 0;
    uint8_t domain_strength = 0;
    uint8_t context_influence = 0;
    uint32_t usage_count = 0;
    uint32_t cooccurrence_total = 0;
};

// =============================================================================
// Classification Result
// =============================================================================

struct ClassificationResult {
    int sentiment_class = constants::NEUTRAL_CLASS;
    int64_t confidence = 0;
    int domain = 0;
    std::string input_text;
};

// Saturating increment for any unsigned counter
template<typename T>
inline void saturating_increment(T& value, T cap = std::numeric_limits<T>::max()) noexcept {
    if (value < cap) ++value;
}

} // namespace polarity
