
#include <iostream>
#include <string>
#include "intake/Dates.h"
#include "intake/IntentClassifier.h"

using namespace intake;
using timeutil::LocalDate;

static const LocalDate kToday{2024, 6, 10};

static int expect(const RuleIntentClassifier& c, const std::string& text, Intent intent, const std::string& query,
                  std::optional<LocalDate> date = std::nullopt) {
    auto r = c.classify(text);
    if (r.intent != intent) { std::cerr << "'" << text << "' intent " << to_string(r.intent) << " want " << to_string(intent) << "\n"; return 1; }
    if (r.query != query) { std::cerr << "'" << text << "' query '" << r.query << "' want '" << query << "'\n"; return 1; }
    if (r.date != date) { std::cerr << "'" << text << "' date mismatch\n"; return 1; }
    return 0;
}

static std::optional<LocalDate> date_of(const std::string& s) {
    auto span = find_date(tokenize(s), kToday);
    if (!span) return std::nullopt;
    return span->date;
}

int main() {
    {
        auto t = tokenize("  «Иванову», (alice)!  ");
        if (t.size() != 2 || t[0].text != "Иванову" || t[0].folded != "иванову" || t[1].text != "alice") { std::cerr << "tokenize\n"; return 1; }
        if (!tokenize(" ... ").empty()) { std::cerr << "punctuation-only tokens should vanish\n"; return 1; }
    }

    {
        if (date_of("сегодня") != kToday) { std::cerr << "today\n"; return 1; }
        if (date_of("tomorrow") != (LocalDate{2024, 6, 11})) { std::cerr << "tomorrow\n"; return 1; }
        if (date_of("послезавтра") != (LocalDate{2024, 6, 12})) { std::cerr << "day after tomorrow ru\n"; return 1; }
        if (date_of("the day after tomorrow") != (LocalDate{2024, 6, 12})) { std::cerr << "day after tomorrow en\n"; return 1; }
        if (date_of("через 3 дня") != (LocalDate{2024, 6, 13})) { std::cerr << "in 3 days ru\n"; return 1; }
        if (date_of("in 30 days") != (LocalDate{2024, 7, 10})) { std::cerr << "in 30 days\n"; return 1; }
        if (date_of("через день") != (LocalDate{2024, 6, 11})) { std::cerr << "через день\n"; return 1; }
        if (date_of("2024-07-01") != (LocalDate{2024, 7, 1})) { std::cerr << "iso date\n"; return 1; }
        if (date_of("01.07.2024") != (LocalDate{2024, 7, 1})) { std::cerr << "dotted date\n"; return 1; }
        if (date_of("1/7/24") != (LocalDate{2024, 7, 1})) { std::cerr << "short slashed date\n"; return 1; }
        if (date_of("15.07") != (LocalDate{2024, 7, 15})) { std::cerr << "date without year\n"; return 1; }
        if (date_of("01.03") != (LocalDate{2025, 3, 1})) { std::cerr << "past date without year should roll over\n"; return 1; }
        if (date_of("1 июля 2024 г.") != (LocalDate{2024, 7, 1})) { std::cerr << "russian month name\n"; return 1; }
        if (date_of("5 march") != (LocalDate{2025, 3, 5})) { std::cerr << "english month rolls over\n"; return 1; }
        if (date_of("31.02.2024") || date_of("32 июля") || date_of("через неделю")) { std::cerr << "invalid dates accepted\n"; return 1; }

        auto span = find_date(tokenize("уволен с 1 июля 2024 года"), kToday);
        if (!span || span->begin != 2 || span->end != 6) { std::cerr << "date span bounds\n"; return 1; }
        if (!date_before(LocalDate{2024, 6, 9}, kToday) || date_before(kToday, kToday)) { std::cerr << "date_before\n"; return 1; }
    }

    RuleIntentClassifier c([] { return kToday; });

    int bad = 0;
    bad += expect(c, "reset password alice", Intent::Reset, "alice");
    bad += expect(c, "Reset alice", Intent::Reset, "alice");
    bad += expect(c, "сбросить пароль Петрову", Intent::Reset, "Петрову");
    bad += expect(c, "смени пароль пользователю Иванова Наталья", Intent::Reset, "Иванова Наталья");
    bad += expect(c, "disable account bob", Intent::Disable, "bob");
    bad += expect(c, "заблокировать Иванову завтра", Intent::Disable, "Иванову", LocalDate{2024, 6, 11});
    bad += expect(c, "заблокируй учетку Петрова на 15.07", Intent::Disable, "Петрова", LocalDate{2024, 7, 15});
    bad += expect(c, "уволить Иванова с 1 июля 2024", Intent::Disable, "Иванова", LocalDate{2024, 7, 1});
    bad += expect(c, "отключить alice", Intent::Disable, "alice");
    bad += expect(c, "schedule block carol in 3 days", Intent::Disable, "carol", LocalDate{2024, 6, 13});
    bad += expect(c, "block", Intent::Disable, "");
    bad += expect(c, "Список задач", Intent::ListJobs, "");
    bad += expect(c, "jobs", Intent::ListJobs, "");
    bad += expect(c, "привет, как дела?", Intent::None, "");
    bad += expect(c, "", Intent::None, "");
    if (bad) return 1;

    std::cout << "intent_unit ok\n";
    return 0;
}
