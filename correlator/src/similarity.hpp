#pragma once

#include <string>
#include <set>
#include <cstddef>

namespace similarity {

// Lower-cased whitespace-separated word set
std::set<std::string> word_set(const std::string& text);

// |A ∩ B| / |A ∪ B| over word sets. Two empty texts carry no evidence and score 0.
double jaccard(const std::string& a, const std::string& b);

size_t levenshtein_distance(const std::string& a, const std::string& b);

// 1 - distance / max(len); 1.0 for two empty strings
double levenshtein_ratio(const std::string& a, const std::string& b);

} // namespace similarity
