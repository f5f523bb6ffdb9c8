#include "polarity/types.hpp"

namespace polarity {

const char* class_name(int cls) noexcept {
    switch (static_cast<SentimentClass>(cls)) {
        case SentimentClass::VeryNegative:     return "very_negative";
        case SentimentClass::Negative:         return "negative";
        case SentimentClass::SlightlyNegative: return "slightly_negative";
        case SentimentClass::Neutral:          return "neutral";
        case SentimentClass::SlightlyPositive: return "slightly_positive";
        case SentimentClass::Positive:         return "positive";
        case SentimentClass::VeryPositive:     return "very_positive";
    }
    return "unknown";
}

const char* domain_name(int domain) noexcept {
    switch (static_cast<Domain>(domain)) {
        case Domain::General:       return "general";
        case Domain::Technology:    return "technology";
        case Domain::Finance:       return "finance";
        case Domain::Health:        return "health";
        case Domain::Entertainment: return "entertainment";
        case Domain::Sports:        return "sports";
        case Domain::Politics:      return "politics";
        case Domain::Food:          return "food";
        case Domain::Travel:        return "travel";
        case Domain::Education:     return "education";
    }
    return "unknown";
}

} // namespace polarity
