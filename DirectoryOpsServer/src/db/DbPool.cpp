#include "DbPool.h"
#include <stdexcept>
#include <thread>
#include <queue>
#include <mutex>
#include <future>
#include <condition_variable>
#include <cstdlib>
#include "../observability/Logging.h"
#include <vector>

namespace db {

namespace {

using PgResultPtr = std::unique_ptr<PGresult, decltype(&PQclear)>;

DbResult to_db_result(PGresult* pr) {
    DbResult r;
    if (!pr) return r;
    ExecStatusType st = PQresultStatus(pr);
    r.ok = (st == PGRES_TUPLES_OK || st == PGRES_COMMAND_OK);
    const char* ss = PQresultErrorField(pr, PG_DIAG_SQLSTATE);
    r.sqlstate = ss ? ss : std::string();
    const char* msg = PQresultErrorMessage(pr);
    r.message = msg ? msg : std::string();
    int nfields = PQnfields(pr);
    for (int i = 0; i < nfields; ++i) r.columns.emplace_back(PQfname(pr, i) ? PQfname(pr, i) : "");
    int ntuples = PQntuples(pr);
    r.rows.reserve(ntuples);
    for (int i = 0; i < ntuples; ++i) {
        std::vector<std::optional<std::string>> row; row.reserve(nfields);
        for (int j = 0; j < nfields; ++j) {
            if (PQgetisnull(pr, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                char* v = PQgetvalue(pr, i, j);
                row.emplace_back(v ? std::optional<std::string>(std::string(v)) : std::nullopt);
            }
        }
        r.rows.emplace_back(std::move(row));
    }
    if (st == PGRES_COMMAND_OK) {
        char* ct = PQcmdTuples(pr);
        r.affected_rows = ct ? std::atoi(ct) : 0;
    } else {
        r.affected_rows = ntuples;
    }
    if (!r.ok) {
        observability::log_warn("dbpool.result_non_ok", {{"status", std::string(PQresStatus(st))}, {"sqlstate", r.sqlstate}, {"msg", r.message}});
    }
    return r;
}

}

struct DbPool::Impl {
    std::string conninfo;
    int workers = 2;

    struct Task { std::function<void(PGconn*&)> fn; };
    std::queue<Task> tasks;
    std::mutex mu_tasks;
    std::condition_variable cv_tasks;
    bool stopping = false;

    std::vector<std::thread> threads;

    Impl(const std::string& ci, int workers_)
        : conninfo(ci), workers(workers_) {
        for (int i = 0; i < workers; ++i) threads.emplace_back([this]{ this->worker_loop(); });
    }

    ~Impl() {
        { std::lock_guard<std::mutex> lk(mu_tasks); stopping = true; }
        cv_tasks.notify_all();
        for (auto &t : threads) if (t.joinable()) t.join();
    }

    PGconn* connect_one() {
        PGconn* c = PQconnectdb(conninfo.c_str());
        if (c == nullptr) return nullptr;
        if (PQstatus(c) != CONNECTION_OK) {
            observability::log_warn("dbpool.connect_failed", {{"err", std::string(PQerrorMessage(c))}});
            PQfinish(c);
            return nullptr;
        }
        return c;
    }

    void worker_loop() {
        PGconn* local_conn = connect_one();
        observability::log_info("dbpool.worker_started", {{"local_conn", local_conn ? std::string("ok") : std::string("null")}});
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lk(mu_tasks);
                cv_tasks.wait(lk, [this]{ return stopping || !tasks.empty(); });
                if (stopping && tasks.empty()) {
                    if (local_conn) { PQfinish(local_conn); local_conn = nullptr; }
                    return;
                }
                task = std::move(tasks.front()); tasks.pop();
            }
            try {
                task.fn(local_conn);
            } catch (const std::exception& e) {
                observability::log_error("dbpool.task_exception", {{"err", std::string(e.what())}});
            }
        }
    }

    void post_task(std::function<void(PGconn*&)> f) {
        {
            std::lock_guard<std::mutex> lk(mu_tasks);
            tasks.push(Task{std::move(f)});
        }
        cv_tasks.notify_one();
    }

    // Runs on a worker. Retries once on a broken connection.
    DbResult run(PGconn*& local_conn, const std::string& sql, const std::vector<std::string>& params,
                 boost::system::error_code& ec) {
        PGresult* r = nullptr;
        for (int attempt = 0; attempt < 2; ++attempt) {
            if (!local_conn) {
                local_conn = connect_one();
                if (!local_conn) { ec = boost::system::errc::make_error_code(boost::system::errc::host_unreachable); break; }
            }
            std::vector<const char*> cparams; cparams.reserve(params.size());
            for (const auto& p : params) cparams.push_back(p.c_str());
            r = PQexecParams(local_conn, sql.c_str(), int(cparams.size()), nullptr, cparams.data(), nullptr, nullptr, 0);
            if (!r) { PQfinish(local_conn); local_conn = nullptr; ec = boost::system::errc::make_error_code(boost::system::errc::io_error); continue; }
            ec = {};
            if (PQstatus(local_conn) != CONNECTION_OK) { PQfinish(local_conn); local_conn = nullptr; }
            break;
        }
        if (!r) {
            observability::log_warn("dbpool.exec_null", {{"err", ec.message()}});
            return DbResult{};
        }
        PgResultPtr guard(r, &PQclear);
        return to_db_result(r);
    }
};

DbPool::DbPool(const std::string& conninfo, int workers) {
    impl_ = std::make_unique<Impl>(conninfo, workers < 1 ? 1 : workers);
}

DbPool::~DbPool() = default;

DbResult DbPool::exec_params(const std::string& sql, std::vector<std::string> params, boost::system::error_code& ec) {
    auto impl = impl_.get();
    auto done = std::make_shared<std::promise<std::pair<boost::system::error_code, DbResult>>>();
    auto fut = done->get_future();
    impl->post_task([impl, sql, params = std::move(params), done](PGconn*& local_conn) {
        boost::system::error_code e;
        DbResult r = impl->run(local_conn, sql, params, e);
        done->set_value(std::make_pair(e, std::move(r)));
    });
    auto res = fut.get();
    ec = res.first;
    return std::move(res.second);
}

}
