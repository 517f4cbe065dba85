#pragma once

#include "IntentClassifier.h"

#include <optional>
#include <string>

namespace intake {

// Offboarding notice reduced to who and when. Either name or handle is set.
struct MailEvent {
    std::string name;
    std::string handle;
    timeutil::LocalDate date;
};

class MailExtractor {
public:
    explicit MailExtractor(TodayFn today = {});

    // nullopt unless the text is an offboarding notice naming a person and a date.
    std::optional<MailEvent> extract(const std::string& body) const;

private:
    TodayFn today_;
};

}
