#pragma once

#include "../timeutil/Time.h"

#include <functional>
#include <optional>
#include <string>

namespace intake {

enum class Intent { None, Reset, Disable, ListJobs };

const char* to_string(Intent i);

struct Classification {
    Intent intent = Intent::None;
    std::string query;
    std::optional<timeutil::LocalDate> date;
};

class IntentClassifier {
public:
    virtual ~IntentClassifier() = default;
    virtual Classification classify(const std::string& text) const = 0;
};

using TodayFn = std::function<timeutil::LocalDate()>;

// Keyword rules in Russian and English. The target is what follows the keyword once
// date words and filler are removed.
class RuleIntentClassifier : public IntentClassifier {
public:
    explicit RuleIntentClassifier(TodayFn today = {});
    Classification classify(const std::string& text) const override;

private:
    TodayFn today_;
};

}
