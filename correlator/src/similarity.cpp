#include "similarity.hpp"
#include "util.hpp"
#include <algorithm>
#include <vector>

namespace similarity {

std::set<std::string> word_set(const std::string& text) {
    auto tokens = util::split_whitespace(util::to_lower(text));
    return std::set<std::string>(tokens.begin(), tokens.end());
}

double jaccard(const std::string& a, const std::string& b) {
    auto words_a = word_set(a);
    auto words_b = word_set(b);

    if (words_a.empty() && words_b.empty()) {
        return 0.0;
    }

    size_t intersection = 0;
    for (const auto& word : words_a) {
        if (words_b.count(word) > 0) {
            ++intersection;
        }
    }
    size_t union_size = words_a.size() + words_b.size() - intersection;

    return static_cast<double>(intersection) / static_cast<double>(union_size);
}

size_t levenshtein_distance(const std::string& a, const std::string& b) {
    const size_t len_a = a.size();
    const size_t len_b = b.size();

    // Two rolling rows instead of the full matrix
    std::vector<size_t> previous(len_b + 1);
    std::vector<size_t> current(len_b + 1);
    for (size_t j = 0; j <= len_b; ++j) {
        previous[j] = j;
    }

    for (size_t i = 1; i <= len_a; ++i) {
        current[0] = i;
        for (size_t j = 1; j <= len_b; ++j) {
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            current[j] = std::min({previous[j] + 1, current[j - 1] + 1, previous[j - 1] + cost});
        }
        std::swap(previous, current);
    }

    return previous[len_b];
}

double levenshtein_ratio(const std::string& a, const std::string& b) {
    if (a.empty() && b.empty()) {
        return 1.0;
    }
    size_t max_len = std::max(a.size(), b.size());
    return 1.0 - static_cast<double>(levenshtein_distance(a, b)) / static_cast<double>(max_len);
}

} // namespace similarity
