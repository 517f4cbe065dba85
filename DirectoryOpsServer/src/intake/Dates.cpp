#include "Dates.h"
#include "../text/Utf8.h"

#include <cctype>
#include <map>

namespace intake {

namespace {

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

std::optional<int> small_number(const std::string& s, int max) {
    if (!all_digits(s) || s.size() > 4) return std::nullopt;
    int v = std::stoi(s);
    if (v > max) return std::nullopt;
    return v;
}

std::optional<int> month_of(const std::string& folded) {
    static const std::map<std::string, int> months = {
        {"января", 1}, {"февраля", 2}, {"марта", 3}, {"апреля", 4}, {"мая", 5}, {"июня", 6},
        {"июля", 7}, {"августа", 8}, {"сентября", 9}, {"октября", 10}, {"ноября", 11}, {"декабря", 12},
        {"январь", 1}, {"февраль", 2}, {"март", 3}, {"апрель", 4}, {"май", 5}, {"июнь", 6},
        {"июль", 7}, {"август", 8}, {"сентябрь", 9}, {"октябрь", 10}, {"ноябрь", 11}, {"декабрь", 12},
        {"january", 1}, {"february", 2}, {"march", 3}, {"april", 4}, {"may", 5}, {"june", 6},
        {"july", 7}, {"august", 8}, {"september", 9}, {"october", 10}, {"november", 11}, {"december", 12},
        {"jan", 1}, {"feb", 2}, {"mar", 3}, {"apr", 4}, {"jun", 6}, {"jul", 7}, {"aug", 8},
        {"sep", 9}, {"sept", 9}, {"oct", 10}, {"nov", 11}, {"dec", 12}};
    auto it = months.find(folded);
    if (it == months.end()) return std::nullopt;
    return it->second;
}

// Fills in a missing year so that the date is not in the past.
std::optional<timeutil::LocalDate> complete(int day, int month, std::optional<int> year, const timeutil::LocalDate& today) {
    timeutil::LocalDate d{year ? *year : today.year, month, day};
    if (year && *year < 100) d.year += 2000;
    if (!year && date_before(d, today)) d.year += 1;
    if (!timeutil::valid_date(d)) return std::nullopt;
    return d;
}

std::optional<timeutil::LocalDate> numeric_date(const std::string& s, const timeutil::LocalDate& today) {
    char sep = 0;
    for (char c : s) {
        if (c == '.' || c == '/' || c == '-') { sep = c; break; }
    }
    if (!sep) return std::nullopt;
    std::vector<std::string> parts;
    std::string cur;
    for (char c : s) {
        if (c == sep) { parts.push_back(cur); cur.clear(); }
        else cur.push_back(c);
    }
    parts.push_back(cur);
    if (parts.size() < 2 || parts.size() > 3) return std::nullopt;
    for (const auto& p : parts) if (!all_digits(p)) return std::nullopt;

    if (parts.size() == 3 && parts[0].size() == 4) {
        if (parts[1].size() > 2 || parts[2].size() > 2) return std::nullopt;
        return complete(std::stoi(parts[2]), std::stoi(parts[1]), std::stoi(parts[0]), today);
    }
    if (parts[0].size() > 2 || parts[1].size() > 2) return std::nullopt;
    std::optional<int> year;
    if (parts.size() == 3) {
        if (parts[2].size() != 2 && parts[2].size() != 4) return std::nullopt;
        year = std::stoi(parts[2]);
    }
    return complete(std::stoi(parts[0]), std::stoi(parts[1]), year, today);
}

bool is_days_word(const std::string& f) {
    return f == "дней" || f == "дня" || f == "день" || f == "days" || f == "day";
}

}

bool date_before(const timeutil::LocalDate& a, const timeutil::LocalDate& b) {
    if (a.year != b.year) return a.year < b.year;
    if (a.month != b.month) return a.month < b.month;
    return a.day < b.day;
}

std::vector<Token> tokenize(const std::string& s) {
    std::vector<Token> out;
    std::u32string u = text::decode_utf8(s);
    std::size_t i = 0;
    while (i < u.size()) {
        while (i < u.size() && text::is_space(u[i])) ++i;
        std::size_t start = i;
        while (i < u.size() && !text::is_space(u[i])) ++i;
        std::size_t b = start, e = i;
        while (b < e && !text::is_letter(u[b]) && !text::is_digit(u[b])) ++b;
        while (e > b && !text::is_letter(u[e - 1]) && !text::is_digit(u[e - 1])) --e;
        if (b == e) continue;
        std::u32string w = u.substr(b, e - b);
        out.push_back(Token{text::encode_utf8(w), text::encode_utf8(text::fold(w))});
    }
    return out;
}

std::optional<DateSpan> date_at(const std::vector<Token>& tokens, std::size_t at, const timeutil::LocalDate& today) {
    if (at >= tokens.size()) return std::nullopt;
    const std::string& f = tokens[at].folded;
    auto next = [&](std::size_t k) -> const std::string& {
        static const std::string empty;
        return at + k < tokens.size() ? tokens[at + k].folded : empty;
    };

    if (f == "сегодня" || f == "today") return DateSpan{today, at, at + 1};
    if (f == "послезавтра") return DateSpan{timeutil::add_days(today, 2), at, at + 1};
    if (f == "завтра" || f == "tomorrow") return DateSpan{timeutil::add_days(today, 1), at, at + 1};
    if (f == "day" && next(1) == "after" && next(2) == "tomorrow") return DateSpan{timeutil::add_days(today, 2), at, at + 3};

    if (f == "через" || f == "in") {
        if (auto n = small_number(next(1), 3650)) {
            if (is_days_word(next(2))) return DateSpan{timeutil::add_days(today, *n), at, at + 3};
        }
        if (f == "через" && (next(1) == "день")) return DateSpan{timeutil::add_days(today, 1), at, at + 2};
        return std::nullopt;
    }

    if (auto d = numeric_date(f, today)) return DateSpan{*d, at, at + 1};

    if (auto day = small_number(f, 31)) {
        auto month = month_of(next(1));
        if (!month) return std::nullopt;
        std::size_t end = at + 2;
        std::optional<int> year;
        if (all_digits(next(2)) && next(2).size() == 4) {
            year = std::stoi(next(2));
            ++end;
            if (next(3) == "г" || next(3) == "года" || next(3) == "год") ++end;
        }
        auto d = complete(*day, *month, year, today);
        if (!d) return std::nullopt;
        return DateSpan{*d, at, end};
    }
    return std::nullopt;
}

std::optional<DateSpan> find_date(const std::vector<Token>& tokens, const timeutil::LocalDate& today, std::size_t from) {
    for (std::size_t i = from; i < tokens.size(); ++i) {
        if (auto span = date_at(tokens, i, today)) return span;
    }
    return std::nullopt;
}

}
