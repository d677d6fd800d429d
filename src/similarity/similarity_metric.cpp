#include "similarity/similarity_metric.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace similarity {

namespace {

// Lower-case and split on runs of whitespace
std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += static_cast<char>(std::tolower(uc));
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

std::unordered_map<std::string, int64_t> termFrequencies(std::string_view text) {
    std::unordered_map<std::string, int64_t> tf;
    for (auto& token : tokenize(text)) {
        tf[std::move(token)]++;
    }
    return tf;
}

} // namespace

double JaccardSimilarity::calculate(std::string_view a, std::string_view b) const {
    auto tokens_a = tokenize(a);
    auto tokens_b = tokenize(b);
    std::unordered_set<std::string> words_a(tokens_a.begin(), tokens_a.end());
    std::unordered_set<std::string> words_b(tokens_b.begin(), tokens_b.end());

    // Two empty responses are identical by convention
    if (words_a.empty() && words_b.empty()) {
        return 1.0;
    }

    size_t intersection = 0;
    for (auto const& word : words_a) {
        if (words_b.count(word)) {
            intersection++;
        }
    }
    size_t union_size = words_a.size() + words_b.size() - intersection;

    return union_size > 0 ? static_cast<double>(intersection) / static_cast<double>(union_size)
                          : 0.0;
}

double LengthSimilarity::calculate(std::string_view a, std::string_view b) const {
    size_t len_a = a.size();
    size_t len_b = b.size();

    if (len_a == 0 && len_b == 0) {
        return 1.0;
    }

    size_t max_len = std::max(len_a, len_b);
    size_t min_len = std::min(len_a, len_b);

    return max_len > 0 ? static_cast<double>(min_len) / static_cast<double>(max_len) : 0.0;
}

double EditDistanceSimilarity::calculate(std::string_view a, std::string_view b) const {
    if (a.empty() && b.empty()) {
        return 1.0;
    }
    if (a == b) {
        return 1.0;
    }

    // Iterate over the longer string, keep rows the size of the shorter one
    std::string_view outer = a.size() >= b.size() ? a : b;
    std::string_view inner = a.size() >= b.size() ? b : a;

    std::vector<size_t> prev(inner.size() + 1);
    std::vector<size_t> curr(inner.size() + 1);
    for (size_t j = 0; j <= inner.size(); ++j) {
        prev[j] = j;
    }

    for (size_t i = 1; i <= outer.size(); ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= inner.size(); ++j) {
            size_t substitution = prev[j - 1] + (outer[i - 1] == inner[j - 1] ? 0 : 1);
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, substitution});
        }
        std::swap(prev, curr);
    }

    double distance = static_cast<double>(prev[inner.size()]);
    double max_len = static_cast<double>(outer.size());
    return std::clamp(1.0 - distance / max_len, 0.0, 1.0);
}

double CosineSimilarity::calculate(std::string_view a, std::string_view b) const {
    auto tf_a = termFrequencies(a);
    auto tf_b = termFrequencies(b);

    if (tf_a.empty() && tf_b.empty()) {
        return 1.0;
    }
    if (tf_a.empty() || tf_b.empty()) {
        return 0.0;
    }

    // Integer accumulation keeps the result exactly symmetric and reflexive
    auto const& smaller = tf_a.size() <= tf_b.size() ? tf_a : tf_b;
    auto const& larger = tf_a.size() <= tf_b.size() ? tf_b : tf_a;

    int64_t dot = 0;
    for (auto const& [term, count] : smaller) {
        auto it = larger.find(term);
        if (it != larger.end()) {
            dot += count * it->second;
        }
    }

    int64_t norm_a = 0;
    for (auto const& [_, count] : tf_a) {
        norm_a += count * count;
    }
    int64_t norm_b = 0;
    for (auto const& [_, count] : tf_b) {
        norm_b += count * count;
    }

    double denom = std::sqrt(static_cast<double>(norm_a) * static_cast<double>(norm_b));
    if (denom <= 0.0) {
        return 0.0;
    }
    return std::clamp(static_cast<double>(dot) / denom, 0.0, 1.0);
}

} // namespace similarity
