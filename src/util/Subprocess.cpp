#include "util/Subprocess.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>

extern char** environ;

using namespace std::chrono;

namespace gitsync::util {

namespace {

std::vector<std::string> buildEnv(const std::vector<std::pair<std::string, std::string>>& extra) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        const std::string kv(*e);
        const auto key = kv.substr(0, kv.find('='));
        bool overridden = false;
        for (const auto& [k, v] : extra) if (k == key) { overridden = true; break; }
        if (!overridden) env.push_back(kv);
    }
    for (const auto& [k, v] : extra) env.push_back(k + "=" + v);
    return env;
}

int waitChild(const pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

bool reapWithin(const pid_t pid, const milliseconds grace, int& code) {
    const auto deadline = steady_clock::now() + grace;
    for (;;) {
        int status = 0;
        const pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            if (WIFEXITED(status)) code = WEXITSTATUS(status);
            else if (WIFSIGNALED(status)) code = 128 + WTERMSIG(status);
            return true;
        }
        if (r < 0 && errno != EINTR) return true;
        if (steady_clock::now() >= deadline) return false;
        usleep(10 * 1000);
    }
}

}

ProcessResult runProcess(const std::vector<std::string>& argv, const ProcessOptions& opts) {
    if (argv.empty()) throw std::runtime_error("runProcess: empty argv");

    // Everything the child touches is prepared before fork()
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    const auto envStrings = buildEnv(opts.env);
    std::vector<char*> envp;
    envp.reserve(envStrings.size() + 1);
    for (const auto& e : envStrings) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);

    const std::string cwd = opts.cwd.string();

    int outPipe[2], errPipe[2];
    if (pipe2(outPipe, O_CLOEXEC) == -1) throw std::runtime_error("Failed to create stdout pipe");
    if (pipe2(errPipe, O_CLOEXEC) == -1) {
        close(outPipe[0]); close(outPipe[1]);
        throw std::runtime_error("Failed to create stderr pipe");
    }

    const pid_t pid = fork();
    if (pid < 0) {
        close(outPipe[0]); close(outPipe[1]);
        close(errPipe[0]); close(errPipe[1]);
        throw std::runtime_error(fmt::format("Failed to fork {}: {}", argv[0], std::strerror(errno)));
    }

    if (pid == 0) {
        setpgid(0, 0);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);

        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(126);

        execvpe(args[0], args.data(), envp.data());
        _exit(127); // exec failed
    }

    setpgid(pid, pid);
    close(outPipe[1]);
    close(errPipe[1]);

    ProcessResult result;
    pollfd fds[2] = {{outPipe[0], POLLIN, 0}, {errPipe[0], POLLIN, 0}};
    int openFds = 2;
    const auto deadline = steady_clock::now() + opts.timeout;
    char buf[4096];

    while (openFds > 0) {
        const auto left = duration_cast<milliseconds>(deadline - steady_clock::now());
        if (left.count() <= 0) { result.timed_out = true; break; }

        const int n = poll(fds, 2, static_cast<int>(left.count()));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) continue;

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            const ssize_t r = read(fds[i].fd, buf, sizeof(buf));
            if (r > 0) (i == 0 ? result.out : result.err).append(buf, static_cast<size_t>(r));
            else if (r == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --openFds;
            }
        }
    }

    for (auto& f : fds) if (f.fd >= 0) close(f.fd);

    // Pipes can close before the process exits; the deadline still applies
    if (!result.timed_out) {
        const auto left = duration_cast<milliseconds>(deadline - steady_clock::now());
        if (reapWithin(pid, std::max(left, milliseconds(0)), result.exit_code)) return result;
        result.timed_out = true;
    }

    kill(-pid, SIGTERM);
    if (!reapWithin(pid, opts.kill_grace, result.exit_code)) {
        kill(-pid, SIGKILL);
        result.exit_code = waitChild(pid);
    }
    return result;
}

}
