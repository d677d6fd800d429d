#pragma once

#include <string>
#include <string_view>

namespace similarity {

// Abstract base class for pluggable response comparison strategies.
//
// Every implementation must be:
//   - bounded:   calculate(a, b) in [0, 1]
//   - symmetric: calculate(a, b) == calculate(b, a)
//   - reflexive: calculate(a, a) == 1.0, including for empty strings
//   - pure and total: no side effects, never throws for any text input
class SimilarityMetric {
public:
    virtual ~SimilarityMetric() = default;

    // Registry identifier ("jaccard", "length", ...)
    virtual std::string name() const = 0;

    // 1 = identical, 0 = completely different
    virtual double calculate(std::string_view a, std::string_view b) const = 0;
};

// Word-set overlap: |A ∩ B| / |A ∪ B| over lower-cased whitespace tokens
class JaccardSimilarity : public SimilarityMetric {
public:
    std::string name() const override { return "jaccard"; }
    double calculate(std::string_view a, std::string_view b) const override;
};

// Character length ratio: min(len) / max(len)
class LengthSimilarity : public SimilarityMetric {
public:
    std::string name() const override { return "length"; }
    double calculate(std::string_view a, std::string_view b) const override;
};

// 1 - levenshtein(a, b) / max(len), byte-wise
class EditDistanceSimilarity : public SimilarityMetric {
public:
    std::string name() const override { return "edit_distance"; }
    double calculate(std::string_view a, std::string_view b) const override;
};

// Cosine of lower-cased term-frequency vectors
class CosineSimilarity : public SimilarityMetric {
public:
    std::string name() const override { return "cosine"; }
    double calculate(std::string_view a, std::string_view b) const override;
};

} // namespace similarity
