#include "IntentClassifier.h"
#include "Dates.h"

#include <set>
#include <vector>

namespace intake {

namespace {

// One keyword word: exact match, or prefix match for Russian stems.
struct Word {
    std::string text;
    bool stem;
};

struct Rule {
    Intent intent;
    std::vector<Word> words;
};

const std::vector<Rule>& rules() {
    static const std::vector<Rule> r = {
        {Intent::Reset, {{"reset", false}, {"password", false}}},
        {Intent::Reset, {{"reset", false}, {"pass", false}}},
        {Intent::Reset, {{"сброс", true}, {"парол", true}}},
        {Intent::Reset, {{"сбрось", true}, {"парол", true}}},
        {Intent::Reset, {{"смен", true}, {"парол", true}}},
        {Intent::Reset, {{"поменя", true}, {"парол", true}}},
        {Intent::Reset, {{"reset", false}}},
        {Intent::Disable, {{"schedule", false}, {"block", false}}},
        {Intent::Disable, {{"disable", false}, {"account", false}}},
        {Intent::Disable, {{"disable", false}}},
        {Intent::Disable, {{"block", false}}},
        {Intent::Disable, {{"deactivate", false}}},
        {Intent::Disable, {{"заблок", true}}},
        {Intent::Disable, {{"блокир", true}}},
        {Intent::Disable, {{"отключ", true}}},
        {Intent::Disable, {{"деактив", true}}},
        {Intent::Disable, {{"увол", true}}},
    };
    return r;
}

bool word_matches(const Word& w, const std::string& folded) {
    if (!w.stem) return folded == w.text;
    return folded.compare(0, w.text.size(), w.text) == 0;
}

std::size_t match_rule(const Rule& rule, const std::vector<Token>& tokens, std::size_t at) {
    if (at + rule.words.size() > tokens.size()) return 0;
    for (std::size_t k = 0; k < rule.words.size(); ++k) {
        if (!word_matches(rule.words[k], tokens[at + k].folded)) return 0;
    }
    return rule.words.size();
}

bool is_filler(const std::string& f) {
    static const std::set<std::string> words = {
        "для", "у", "пользователя", "пользователю", "пользователь", "сотрудника", "сотруднику",
        "сотрудник", "учетку", "учетная", "учетную", "запись", "записи", "аккаунт", "пожалуйста",
        "user", "account", "for", "the", "of", "please", "password", "пароль"};
    return words.count(f) > 0;
}

bool is_connector(const std::string& f) {
    static const std::set<std::string> words = {"на", "с", "со", "в", "во", "к", "on", "at", "by", "from"};
    return words.count(f) > 0;
}

bool is_list_request(const std::vector<Token>& tokens) {
    std::string joined;
    for (const auto& t : tokens) {
        if (!joined.empty()) joined += ' ';
        joined += t.folded;
    }
    return joined == "jobs" || joined == "list jobs" || joined == "задачи" || joined == "список задач"
        || joined == "задания";
}

}

const char* to_string(Intent i) {
    switch (i) {
        case Intent::None: return "none";
        case Intent::Reset: return "reset";
        case Intent::Disable: return "disable";
        case Intent::ListJobs: return "list_jobs";
    }
    return "none";
}

RuleIntentClassifier::RuleIntentClassifier(TodayFn today)
    : today_(today ? std::move(today) : TodayFn([] { return timeutil::local_date_of(timeutil::Clock::now()); })) {}

Classification RuleIntentClassifier::classify(const std::string& text) const {
    Classification out;
    std::vector<Token> tokens = tokenize(text);
    if (tokens.empty()) return out;
    if (is_list_request(tokens)) {
        out.intent = Intent::ListJobs;
        return out;
    }

    std::size_t kw_begin = 0, kw_len = 0;
    for (std::size_t i = 0; i < tokens.size() && kw_len == 0; ++i) {
        for (const auto& rule : rules()) {
            std::size_t n = match_rule(rule, tokens, i);
            if (n == 0) continue;
            out.intent = rule.intent;
            kw_begin = i;
            kw_len = n;
            break;
        }
    }
    if (out.intent == Intent::None) return out;

    timeutil::LocalDate today = today_();
    std::vector<bool> drop(tokens.size(), false);
    for (std::size_t i = 0; i < kw_begin + kw_len; ++i) drop[i] = true;

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i >= kw_begin && i < kw_begin + kw_len) continue;
        auto span = date_at(tokens, i, today);
        if (!span) continue;
        if (!out.date) out.date = span->date;
        for (std::size_t k = span->begin; k < span->end; ++k) drop[k] = true;
        if (span->begin > 0 && is_connector(tokens[span->begin - 1].folded)) drop[span->begin - 1] = true;
        i = span->end - 1;
    }

    for (std::size_t i = kw_begin + kw_len; i < tokens.size(); ++i) {
        if (drop[i] || is_filler(tokens[i].folded)) continue;
        if (!out.query.empty()) out.query += ' ';
        out.query += tokens[i].text;
    }
    return out;
}

}
