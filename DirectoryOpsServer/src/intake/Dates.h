#pragma once

#include "../timeutil/Time.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace intake {

// A word of free text with surrounding punctuation removed.
struct Token {
    std::string text;
    std::string folded;
};

std::vector<Token> tokenize(const std::string& s);

// Tokens [begin, end) that spell a date.
struct DateSpan {
    timeutil::LocalDate date;
    std::size_t begin = 0;
    std::size_t end = 0;
};

// Recognizes, starting at token `at`: today/tomorrow/day after tomorrow and their Russian
// forms, "in N days" / "через N дней", numeric dates (dd.mm.yyyy, dd.mm.yy, dd.mm,
// yyyy-mm-dd, dd/mm/yyyy) and "1 июля 2024" / "1 july". A date without a year that already
// passed this year rolls over to the next one.
std::optional<DateSpan> date_at(const std::vector<Token>& tokens, std::size_t at, const timeutil::LocalDate& today);

std::optional<DateSpan> find_date(const std::vector<Token>& tokens, const timeutil::LocalDate& today,
                                  std::size_t from = 0);

bool date_before(const timeutil::LocalDate& a, const timeutil::LocalDate& b);

}
