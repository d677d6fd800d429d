#pragma once

// Similarity Registry - every selectable comparison strategy in one table.
//
// When adding a strategy:
//   1. Add a SimilarityMetricType value in config.h
//   2. Implement a SimilarityMetric subclass in similarity_metric.h/.cpp
//   3. Add an entry to SIMILARITY_REGISTRY and a case in createSimilarityMetric()
//
// The CLI (--metric, --list-metrics) and config parsing pick it up from here.

#include "config.h"
#include "similarity/similarity_metric.h"

#include <array>
#include <memory>
#include <string_view>

namespace similarity {

struct SimilarityDef {
    SimilarityMetricType type;
    const char* name;        // Config / CLI identifier: "edit_distance"
    const char* short_name;  // Report label: "EditDist"
    const char* description;

    constexpr bool matches(std::string_view other) const {
        return std::string_view(name) == other;
    }
};

inline constexpr std::array<SimilarityDef, 4> SIMILARITY_REGISTRY = {{
    {SimilarityMetricType::Jaccard, "jaccard", "Jaccard",
     "Word-set overlap of lower-cased whitespace tokens"},

    {SimilarityMetricType::Length, "length", "Length",
     "Ratio of shorter to longer response length"},

    {SimilarityMetricType::EditDistance, "edit_distance", "EditDist",
     "One minus normalized Levenshtein distance"},

    {SimilarityMetricType::Cosine, "cosine", "Cosine",
     "Cosine of term-frequency vectors"},
}};

constexpr SimilarityDef const* findSimilarity(std::string_view name) {
    for (auto const& def : SIMILARITY_REGISTRY) {
        if (def.matches(name)) {
            return &def;
        }
    }
    return nullptr;
}

constexpr SimilarityDef const& getSimilarityDef(SimilarityMetricType type) {
    for (auto const& def : SIMILARITY_REGISTRY) {
        if (def.type == type) {
            return def;
        }
    }
    return SIMILARITY_REGISTRY[0];
}

std::unique_ptr<SimilarityMetric> createSimilarityMetric(SimilarityMetricType type);

} // namespace similarity
