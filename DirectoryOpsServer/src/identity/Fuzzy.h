#pragma once

#include <string>

namespace identity {

// Case-folded, punctuation replaced by single spaces, trimmed.
std::u32string normalize(const std::string& s);

// Similarity scores in [0, 100] over normalized strings.
double ratio(const std::u32string& a, const std::u32string& b);
double partial_ratio(const std::u32string& a, const std::u32string& b);
double token_sort_ratio(const std::u32string& a, const std::u32string& b);
double token_set_ratio(const std::u32string& a, const std::u32string& b);

// Blend of the above, weighted by how different the two lengths are.
double weighted_ratio(const std::string& a, const std::string& b);

bool starts_with_normalized(const std::string& value, const std::string& prefix);

}
