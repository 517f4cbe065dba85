#include "MailExtractor.h"
#include "Dates.h"
#include "../text/Utf8.h"

#include <regex>
#include <set>
#include <vector>

namespace intake {

namespace {

bool has_trigger(const std::string& folded) {
    static const char* triggers[] = {"уволен", "увольнен", "уволить", "последний рабочий день",
                                     "dismissal", "terminated", "last working day"};
    for (const char* t : triggers) {
        if (folded.find(t) != std::string::npos) return true;
    }
    return false;
}

bool is_cyrillic(char32_t c) {
    return (c >= 0x0400 && c <= 0x04FF);
}

// Capitalized Cyrillic word, hyphenated surnames allowed.
bool is_name_word(const Token& t) {
    static const std::set<std::string> stop = {
        "сотрудник", "сотрудница", "сотрудника", "просьба", "прошу", "уважаемые", "коллеги",
        "добрый", "день", "здравствуйте", "приказ", "уведомление", "отдел", "последний", "дата"};
    std::u32string u = text::decode_utf8(t.text);
    if (u.size() < 2 || !is_cyrillic(u[0]) || !text::is_upper(u[0])) return false;
    for (char32_t c : u) {
        if (c != U'-' && !(is_cyrillic(c) && text::is_letter(c))) return false;
    }
    return stop.count(t.folded) == 0;
}

}

MailExtractor::MailExtractor(TodayFn today)
    : today_(today ? std::move(today) : TodayFn([] { return timeutil::local_date_of(timeutil::Clock::now()); })) {}

std::optional<MailEvent> MailExtractor::extract(const std::string& body) const {
    std::string folded = text::fold_utf8(body);
    if (!has_trigger(folded)) return std::nullopt;

    std::vector<Token> tokens = tokenize(body);
    auto span = find_date(tokens, today_());
    if (!span) return std::nullopt;

    MailEvent ev;
    ev.date = span->date;

    static const std::regex sam_re(R"(sam(?:accountname)?\s*[:=]\s*([a-z0-9_.\-]+))");
    std::smatch m;
    if (std::regex_search(folded, m, sam_re)) ev.handle = m[1].str();

    for (std::size_t i = 0; i < tokens.size() && ev.name.empty(); ++i) {
        std::size_t n = 0;
        while (i + n < tokens.size() && n < 3 && is_name_word(tokens[i + n])) ++n;
        if (n < 2) continue;
        for (std::size_t k = 0; k < n; ++k) {
            if (k) ev.name += ' ';
            ev.name += tokens[i + k].text;
        }
    }

    if (ev.name.empty() && ev.handle.empty()) return std::nullopt;
    return ev;
}

}
