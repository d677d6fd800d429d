#include "similarity/similarity_metric.h"
#include "similarity/similarity_registry.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace similarity;

namespace {

bool near(double a, double b, double eps = 1e-12) {
    return std::abs(a - b) < eps;
}

std::vector<std::string> const SAMPLES = {
    "",
    " ",
    "cats are great",
    "Cats   are GREAT",
    "dogs are nice",
    "a b",
    "a b c",
    "The quick brown fox jumps over the lazy dog",
    "kitten",
    "sitting",
    "héllo wörld",
};

std::vector<std::unique_ptr<SimilarityMetric>> allMetrics() {
    std::vector<std::unique_ptr<SimilarityMetric>> metrics;
    for (auto const& def : SIMILARITY_REGISTRY) {
        metrics.push_back(createSimilarityMetric(def.type));
    }
    return metrics;
}

} // namespace

void test_contract_all_metrics() {
    std::cout << "Testing metric contract (bounded, symmetric, reflexive)..." << std::endl;

    for (auto const& metric : allMetrics()) {
        for (auto const& a : SAMPLES) {
            assert(metric->calculate(a, a) == 1.0);
            for (auto const& b : SAMPLES) {
                double ab = metric->calculate(a, b);
                double ba = metric->calculate(b, a);
                assert(ab == ba);
                assert(ab >= 0.0 && ab <= 1.0);
            }
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_jaccard() {
    std::cout << "Testing JaccardSimilarity..." << std::endl;

    JaccardSimilarity jaccard;
    assert(jaccard.calculate("", "") == 1.0);
    assert(jaccard.calculate("a b", "a b c") == 2.0 / 3.0);
    assert(jaccard.calculate("x", "y") == 0.0);

    // Case and whitespace runs are ignored, duplicates collapse into a set
    assert(jaccard.calculate("Cats   are GREAT", "cats are great") == 1.0);
    assert(jaccard.calculate("a a a b", "a b") == 1.0);

    // Whitespace-only text has no words
    assert(jaccard.calculate(" \t\n", "") == 1.0);
    assert(jaccard.calculate("", "word") == 0.0);

    assert(near(jaccard.calculate("cats are great", "dogs are nice"), 1.0 / 5.0));

    std::cout << "  PASS" << std::endl;
}

void test_length() {
    std::cout << "Testing LengthSimilarity..." << std::endl;

    LengthSimilarity length;
    assert(length.calculate("", "") == 1.0);
    assert(length.calculate("ab", "abcd") == 0.5);
    assert(length.calculate("", "abc") == 0.0);
    assert(length.calculate("abc", "xyz") == 1.0);

    std::cout << "  PASS" << std::endl;
}

void test_edit_distance() {
    std::cout << "Testing EditDistanceSimilarity..." << std::endl;

    EditDistanceSimilarity edit;
    assert(edit.calculate("", "") == 1.0);
    assert(near(edit.calculate("kitten", "sitting"), 1.0 - 3.0 / 7.0));
    assert(edit.calculate("", "abc") == 0.0);
    assert(edit.calculate("abc", "xyz") == 0.0);
    assert(near(edit.calculate("abcd", "abce"), 0.75));

    std::cout << "  PASS" << std::endl;
}

void test_cosine() {
    std::cout << "Testing CosineSimilarity..." << std::endl;

    CosineSimilarity cosine;
    assert(cosine.calculate("", "") == 1.0);
    assert(cosine.calculate("", "a") == 0.0);
    assert(near(cosine.calculate("a a b", "a b b"), 0.8));
    assert(cosine.calculate("x y", "z") == 0.0);
    assert(cosine.calculate("Hello World", "world hello") == 1.0);

    std::cout << "  PASS" << std::endl;
}

void test_registry() {
    std::cout << "Testing similarity registry..." << std::endl;

    for (auto const& def : SIMILARITY_REGISTRY) {
        auto metric = createSimilarityMetric(def.type);
        assert(metric->name() == def.name);
        assert(findSimilarity(def.name) == &def);
        assert(&getSimilarityDef(def.type) == &def);
    }
    assert(findSimilarity("embedding") == nullptr);

    std::cout << "  PASS" << std::endl;
}

int main() {
    test_contract_all_metrics();
    test_jaccard();
    test_length();
    test_edit_distance();
    test_cosine();
    test_registry();

    std::cout << "\nAll similarity tests passed!" << std::endl;
    return 0;
}
