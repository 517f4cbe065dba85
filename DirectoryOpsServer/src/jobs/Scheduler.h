#pragma once

#include "Job.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <boost/asio.hpp>

namespace directory { class ActionExecutor; }
namespace audit { class AuditLog; }

namespace jobs {

// Timer queue plus executor for durable jobs. Timers live on the application io_context,
// external calls run on an owned thread pool. Call stop() before releasing the last reference.
class Scheduler : public std::enable_shared_from_this<Scheduler> {
public:
    struct Options {
        std::size_t threads = 2;
        std::chrono::milliseconds store_retry_delay{30000};
    };

    // Called after a job reached a terminal state, from a pool thread.
    using FinishedHook = std::function<void(const Job&, JobStatus)>;

    Scheduler(boost::asio::io_context& ioc, std::shared_ptr<JobStore> store,
              std::shared_ptr<directory::ActionExecutor> executor,
              std::shared_ptr<audit::AuditLog> audit);
    Scheduler(boost::asio::io_context& ioc, std::shared_ptr<JobStore> store,
              std::shared_ptr<directory::ActionExecutor> executor,
              std::shared_ptr<audit::AuditLog> audit, Options opts);
    ~Scheduler();

    // Persists, then arms. Throws PersistenceError and arms nothing if the write fails.
    CreateResult submit(const NewJob& job);

    // Replaces any timer already armed for id.
    void arm(int64_t id, timeutil::TimePoint when);

    bool is_armed(int64_t id) const;
    std::size_t armed_count() const;
    std::size_t in_flight_count() const;
    bool is_in_flight(int64_t id) const;

    void set_finished_hook(FinishedHook hook);
    void stop();

    JobStore& store() { return *store_; }

private:
    void on_timer(int64_t id, uint64_t generation);
    void execute(int64_t id);
    void finish(const Job& job, JobStatus status, const std::string& reason);

    boost::asio::io_context& ioc_;
    std::shared_ptr<JobStore> store_;
    std::shared_ptr<directory::ActionExecutor> executor_;
    std::shared_ptr<audit::AuditLog> audit_;
    Options opts_;
    boost::asio::thread_pool pool_;

    mutable std::mutex mu_;
    struct Armed {
        uint64_t generation = 0;
        std::unique_ptr<boost::asio::system_timer> timer;
    };
    std::map<int64_t, Armed> armed_;
    std::set<int64_t> in_flight_;
    uint64_t next_generation_ = 1;
    FinishedHook finished_hook_;
    std::atomic_bool stopped_ = false;
};

}
