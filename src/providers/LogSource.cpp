#include "LogSource.h"
#include "../core/Utils.h"
#include "../core/Logging.h"
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <regex>
#include <sys/wait.h>
#include <unistd.h>

namespace ioc_sweep {

std::vector<std::string> JournalLogSource::build_argv(const LogQuery& q) const {
    return { binary_, "--no-pager", "--quiet", "--output=short-iso", "--since=-" + std::to_string(q.window_seconds) + "s" };
}

namespace {

class LineMatcher {
public:
    explicit LineMatcher(const LogQuery& q) : q_(q) {
        if(q.regex) for(const auto& p : q.patterns) res_.emplace_back(p);
    }
    bool matches(const std::string& line) const {
        if(q_.regex){
            for(const auto& re : res_) if(std::regex_search(line, re)) return true;
            return false;
        }
        for(const auto& p : q_.patterns) if(line.find(p) != std::string::npos) return true;
        return false;
    }
private:
    const LogQuery& q_;
    std::vector<std::regex> res_;
};

void consume_line(const std::string& line, const LineMatcher& m, const LogQuery& q, LogQueryResult& r){
    if(line.empty() || !m.matches(line)) return;
    ++r.count;
    if(r.samples.size() < q.sample_limit) r.samples.push_back(line);
}

}

LogQueryResult JournalLogSource::query(const LogQuery& q){
    LogQueryResult result;
    LineMatcher matcher(q);
    int fds[2];
    if(pipe2(fds, O_CLOEXEC) != 0){
        result.ok = false;
        result.error = "pipe failed: " + utils::errno_text(errno);
        return result;
    }
    auto args = build_argv(q);
    std::vector<char*> argv;
    for(auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    pid_t pid = fork();
    if(pid < 0){
        result.ok = false;
        result.error = "fork failed: " + utils::errno_text(errno);
        close(fds[0]); close(fds[1]);
        return result;
    }
    if(pid == 0){
        // Child: stdout -> pipe, everything else -> /dev/null
        int devnull = open("/dev/null", O_RDWR | O_CLOEXEC);
        if(devnull >= 0){ dup2(devnull, STDIN_FILENO); dup2(devnull, STDERR_FILENO); }
        dup2(fds[1], STDOUT_FILENO);
        execvp(argv[0], argv.data());
        _exit(127);
    }
    close(fds[1]);

    auto deadline = std::chrono::steady_clock::now() + q.timeout;
    std::string pending;
    char buf[8192];
    bool timed_out = false;
    bool read_error = false;
    for(;;){
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if(remaining <= 0){ timed_out = true; break; }
        struct pollfd pfd{fds[0], POLLIN, 0};
        int rc = poll(&pfd, 1, static_cast<int>(remaining));
        if(rc < 0){
            if(errno == EINTR) continue;
            read_error = true;
            break;
        }
        if(rc == 0){ timed_out = true; break; }
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if(n < 0){
            if(errno == EINTR) continue;
            read_error = true;
            break;
        }
        if(n == 0) break;
        pending.append(buf, static_cast<size_t>(n));
        size_t pos;
        while((pos = pending.find('\n')) != std::string::npos){
            consume_line(pending.substr(0, pos), matcher, q, result);
            pending.erase(0, pos + 1);
        }
    }
    close(fds[0]);
    if(timed_out || read_error) kill(pid, SIGKILL);
    int status = 0;
    while(waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if(timed_out){
        result.ok = false;
        result.error = "log query timed out after " + std::to_string(q.timeout.count()) + " ms";
        return result;
    }
    if(read_error){
        result.ok = false;
        result.error = "reading log output failed";
        return result;
    }
    consume_line(pending, matcher, q, result);
    if(!WIFEXITED(status) || WEXITSTATUS(status) != 0){
        result.ok = false;
        result.error = WIFEXITED(status) && WEXITSTATUS(status) == 127
            ? "log subsystem unavailable (" + binary_ + " could not be executed)"
            : "log query exited abnormally (status " + std::to_string(status) + ")";
        Logger::instance().debug("Journal query failed: " + result.error);
    }
    return result;
}

}
