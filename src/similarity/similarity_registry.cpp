#include "similarity/similarity_registry.h"

namespace similarity {

std::unique_ptr<SimilarityMetric> createSimilarityMetric(SimilarityMetricType type) {
    switch (type) {
    case SimilarityMetricType::Jaccard:
        return std::make_unique<JaccardSimilarity>();
    case SimilarityMetricType::Length:
        return std::make_unique<LengthSimilarity>();
    case SimilarityMetricType::EditDistance:
        return std::make_unique<EditDistanceSimilarity>();
    case SimilarityMetricType::Cosine:
        return std::make_unique<CosineSimilarity>();
    }
    return std::make_unique<JaccardSimilarity>();
}

} // namespace similarity
