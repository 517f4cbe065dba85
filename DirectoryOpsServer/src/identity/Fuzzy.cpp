#include "Fuzzy.h"
#include "../text/Utf8.h"

#include <algorithm>
#include <iterator>
#include <vector>

namespace identity {

namespace {

size_t lcs_length(const std::u32string& a, const std::u32string& b) {
    if (a.empty() || b.empty()) return 0;
    std::vector<size_t> prev(b.size() + 1, 0), cur(b.size() + 1, 0);
    for (size_t i = 1; i <= a.size(); ++i) {
        for (size_t j = 1; j <= b.size(); ++j) {
            cur[j] = a[i - 1] == b[j - 1] ? prev[j - 1] + 1 : std::max(prev[j], cur[j - 1]);
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

std::vector<std::u32string> tokens(const std::u32string& s) {
    std::vector<std::u32string> out;
    std::u32string cur;
    for (char32_t c : s) {
        if (c == U' ') {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::u32string join(const std::vector<std::u32string>& parts) {
    std::u32string out;
    for (const auto& p : parts) {
        if (!out.empty()) out.push_back(U' ');
        out += p;
    }
    return out;
}

std::u32string sorted_tokens(const std::u32string& s) {
    auto t = tokens(s);
    std::sort(t.begin(), t.end());
    return join(t);
}

// Long names are capped so that ranking stays cheap on large raw result sets.
const size_t kMaxLen = 128;

std::u32string clip(std::u32string s) {
    if (s.size() > kMaxLen) s.resize(kMaxLen);
    return s;
}

}

std::u32string normalize(const std::string& s) {
    std::u32string out;
    bool pending_space = false;
    for (char32_t c : text::decode_utf8(s)) {
        c = text::fold_char(c);
        if (text::is_letter(c) || text::is_digit(c)) {
            if (pending_space && !out.empty()) out.push_back(U' ');
            pending_space = false;
            out.push_back(c);
        } else {
            pending_space = true;
        }
    }
    return clip(out);
}

double ratio(const std::u32string& a, const std::u32string& b) {
    if (a.empty() && b.empty()) return 100.0;
    if (a.empty() || b.empty()) return 0.0;
    return 200.0 * double(lcs_length(a, b)) / double(a.size() + b.size());
}

double partial_ratio(const std::u32string& a, const std::u32string& b) {
    const std::u32string& shorter = a.size() <= b.size() ? a : b;
    const std::u32string& longer = a.size() <= b.size() ? b : a;
    if (shorter.empty()) return 0.0;
    double best = 0.0;
    for (size_t start = 0; start + shorter.size() <= longer.size(); ++start) {
        best = std::max(best, ratio(shorter, longer.substr(start, shorter.size())));
        if (best >= 100.0) break;
    }
    return best;
}

double token_sort_ratio(const std::u32string& a, const std::u32string& b) {
    return ratio(sorted_tokens(a), sorted_tokens(b));
}

double token_set_ratio(const std::u32string& a, const std::u32string& b) {
    auto ta = tokens(a), tb = tokens(b);
    std::sort(ta.begin(), ta.end());
    ta.erase(std::unique(ta.begin(), ta.end()), ta.end());
    std::sort(tb.begin(), tb.end());
    tb.erase(std::unique(tb.begin(), tb.end()), tb.end());
    std::vector<std::u32string> common, only_a, only_b;
    std::set_intersection(ta.begin(), ta.end(), tb.begin(), tb.end(), std::back_inserter(common));
    std::set_difference(ta.begin(), ta.end(), tb.begin(), tb.end(), std::back_inserter(only_a));
    std::set_difference(tb.begin(), tb.end(), ta.begin(), ta.end(), std::back_inserter(only_b));
    if (common.empty()) return ratio(join(ta), join(tb));
    std::u32string base = join(common);
    std::u32string with_a = only_a.empty() ? base : base + U" " + join(only_a);
    std::u32string with_b = only_b.empty() ? base : base + U" " + join(only_b);
    if (only_a.empty() || only_b.empty()) return 100.0;
    return std::max({ratio(base, with_a), ratio(base, with_b), ratio(with_a, with_b)});
}

double weighted_ratio(const std::string& a, const std::string& b) {
    auto na = normalize(a), nb = normalize(b);
    if (na.empty() || nb.empty()) return 0.0;
    double base = ratio(na, nb);
    double len_ratio = double(std::max(na.size(), nb.size())) / double(std::min(na.size(), nb.size()));
    if (len_ratio < 1.5) {
        return std::max({base, token_sort_ratio(na, nb) * 0.95, token_set_ratio(na, nb) * 0.95});
    }
    double scale = len_ratio < 8.0 ? 0.9 : 0.6;
    double partial = partial_ratio(na, nb) * scale;
    double partial_sorted = partial_ratio(sorted_tokens(na), sorted_tokens(nb)) * scale * 0.95;
    return std::max({base, partial, partial_sorted});
}

bool starts_with_normalized(const std::string& value, const std::string& prefix) {
    auto v = normalize(value), p = normalize(prefix);
    if (p.empty() || p.size() > v.size()) return false;
    return v.compare(0, p.size(), p) == 0;
}

}
