#pragma once

#include "../directory/Directory.h"
#include "../intake/MailExtractor.h"
#include "../jobs/Job.h"
#include "../session/Sessions.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace identity { class IdentityResolver; }
namespace jobs { class Scheduler; }
namespace audit { class AuditLog; }
namespace acl { class Operators; }

namespace service {

struct Choice {
    std::string label;
    std::string data;   // callback payload to send back
};

struct Outcome {
    enum class Kind {
        Denied, Unrecognized, NeedTarget, NotFound, Choose, SelectionExpired,
        Cancelled, PasswordReset, Scheduled, Failed, Jobs
    };

    Kind kind = Kind::Unrecognized;
    std::string message;
    std::optional<directory::Identity> identity;
    std::vector<Choice> choices;
    std::string cancel_data;
    std::string password;
    int64_t job_id = 0;
    bool job_created = false;
    std::optional<timeutil::TimePoint> run_at;
    std::vector<jobs::Job> jobs;
};

const char* to_string(Outcome::Kind k);

struct Dependencies {
    std::shared_ptr<identity::IdentityResolver> resolver;
    std::shared_ptr<session::SessionManager> sessions;
    std::shared_ptr<jobs::Scheduler> scheduler;
    std::shared_ptr<jobs::JobStore> store;
    std::shared_ptr<directory::ActionExecutor> executor;
    std::shared_ptr<audit::AuditLog> audit;
    std::shared_ptr<acl::Operators> operators;
    std::shared_ptr<intake::IntentClassifier> classifier;
};

struct Settings {
    int disable_hour = 16;
    std::size_t resolver_limit = 10;
    std::size_t password_length = 12;
};

struct WhoAmI {
    std::string principal;
    bool is_operator = false;
    bool is_superadmin = false;
};

// Request flow: authorize, classify, resolve, then either act on the single candidate or
// park the action behind a disambiguation token. jobs::PersistenceError propagates.
class OpsService {
public:
    OpsService(Dependencies deps, Settings settings);

    Outcome handle_text(const std::string& principal, const std::string& text);
    Outcome handle_mail(const intake::MailEvent& event);
    Outcome handle_callback(const std::string& principal, const std::string& data);
    Outcome list_jobs(const std::string& principal);
    WhoAmI whoami(const std::string& principal) const;

    acl::Operators& operators() { return *deps_.operators; }

    // DISABLE_HOUR local time on the given day, today when none is given.
    timeutil::TimePoint disable_time(const std::optional<timeutil::LocalDate>& date) const;

private:
    Outcome dispatch(const session::PendingAction& pending, const directory::Identity& target, const std::string& actor);
    Outcome reset_password(const std::string& actor, const directory::Identity& target);
    Outcome schedule_disable(const std::string& created_by, const directory::Identity& target,
                             timeutil::TimePoint when, const std::string& source, const std::string& confirmed_by);
    Outcome offer_choices(session::PendingAction pending, std::vector<directory::Identity> candidates);

    Dependencies deps_;
    Settings settings_;
};

}
