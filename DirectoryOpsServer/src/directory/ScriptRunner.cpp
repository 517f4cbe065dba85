#include "ScriptRunner.h"
#include "Directory.h"
#include "../observability/Logging.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace directory {

namespace {

struct Pipe {
    int fds[2] = {-1, -1};
    ~Pipe() { close_read(); close_write(); }
    void open() {
        if (pipe(fds) < 0) throw DirectoryError(std::string("pipe failed: ") + std::strerror(errno));
        fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        fcntl(fds[0], F_SETFL, O_NONBLOCK);
    }
    void close_read() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void close_write() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
};

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

bool wait_for_exit(pid_t pid, std::chrono::milliseconds timeout, int& exit_code) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        int status = 0;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) { exit_code = decode_status(status); return true; }
        if (r < 0 && errno != EINTR) { exit_code = -1; return true; }
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void terminate_child(pid_t pid, int& exit_code) {
    kill(pid, SIGTERM);
    if (wait_for_exit(pid, std::chrono::seconds(2), exit_code)) return;
    observability::log_warn("script.kill", {{"pid", int64_t(pid)}});
    kill(pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    exit_code = decode_status(status);
}

}

std::vector<std::string> split_command(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    bool in_word = false;
    char quote = 0;
    for (char c : cmd) {
        if (quote) {
            if (c == quote) quote = 0;
            else cur.push_back(c);
            continue;
        }
        if (c == '\'' || c == '"') { quote = c; in_word = true; continue; }
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) { out.push_back(cur); cur.clear(); in_word = false; }
            continue;
        }
        cur.push_back(c);
        in_word = true;
    }
    if (in_word) out.push_back(cur);
    return out;
}

RunResult run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout, std::size_t max_output) {
    if (argv.empty()) throw DirectoryError("empty command");

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    Pipe out_pipe, err_pipe;
    out_pipe.open();
    err_pipe.open();

    pid_t pid = fork();
    if (pid < 0) throw DirectoryError(std::string("fork failed: ") + std::strerror(errno));
    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out_pipe.fds[1], STDOUT_FILENO);
        dup2(err_pipe.fds[1], STDERR_FILENO);
        execvp(cargv[0], cargv.data());
        _exit(127);
    }
    out_pipe.close_write();
    err_pipe.close_write();

    RunResult res;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[4096];
    bool out_open = true, err_open = true;
    while (out_open || err_open) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) { res.timed_out = true; break; }
        pollfd pfds[2];
        nfds_t n = 0;
        if (out_open) pfds[n++] = pollfd{out_pipe.fds[0], POLLIN, 0};
        if (err_open) pfds[n++] = pollfd{err_pipe.fds[0], POLLIN, 0};
        int pr = poll(pfds, n, static_cast<int>(std::min<int64_t>(left.count(), 1000)));
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (nfds_t i = 0; i < n; ++i) {
            if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            bool is_out = pfds[i].fd == out_pipe.fds[0];
            std::string& sink = is_out ? res.out : res.err;
            ssize_t got = read(pfds[i].fd, buf, sizeof(buf));
            if (got > 0) {
                std::size_t room = sink.size() < max_output ? max_output - sink.size() : 0;
                sink.append(buf, std::min<std::size_t>(room, static_cast<std::size_t>(got)));
            } else if (got == 0 || (errno != EAGAIN && errno != EINTR)) {
                if (is_out) { out_open = false; out_pipe.close_read(); }
                else { err_open = false; err_pipe.close_read(); }
            }
        }
    }

    if (res.timed_out) {
        terminate_child(pid, res.exit_code);
        return res;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (!wait_for_exit(pid, std::max(left, std::chrono::milliseconds(0)), res.exit_code)) {
        res.timed_out = true;
        terminate_child(pid, res.exit_code);
    }
    return res;
}

}
