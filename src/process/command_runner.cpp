#include "process/command_runner.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <string_view>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/prctl.h>
#endif

extern char** environ;

namespace bwproxy {

namespace {

/**
 * @brief Inherited environment with overrides applied (override wins, no duplicates)
 */
std::vector<std::string> build_environment(
    const std::vector<std::pair<std::string, std::string>>& overrides) {

    std::vector<std::string> result;
    for (char** entry = environ; entry && *entry; ++entry) {
        const std::string_view kv(*entry);
        const auto eq = kv.find('=');
        const std::string_view key = kv.substr(0, eq);
        bool overridden = false;
        for (const auto& [name, value] : overrides) {
            if (name == key) {
                overridden = true;
                break;
            }
        }
        if (!overridden) result.emplace_back(kv);
    }
    for (const auto& [name, value] : overrides) {
        result.push_back(std::format("{}={}", name, value));
    }
    return result;
}

CommandResult spawn_failure(std::string_view what) {
    CommandResult result;
    result.spawned = false;
    result.output = std::format("{} failed: {}", what, std::strerror(errno));
    return result;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // anonymous namespace

std::string CommandResult::describe() const {
    if (!spawned) return output;
    if (term_signal != 0) return std::format("signal {}", term_signal);
    return std::format("exit status {}", exit_code);
}

CommandResult run_command(const CommandSpec& spec) {
    if (spec.argv.empty()) {
        CommandResult result;
        result.output = "empty command line";
        return result;
    }

    // Everything the child touches is prepared before fork(): only
    // async-signal-safe calls are allowed between fork and exec.
    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const auto env_storage = build_environment(spec.env);
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (const auto& kv : env_storage) {
        envp.push_back(const_cast<char*>(kv.c_str()));
    }
    envp.push_back(nullptr);

    const std::string exec_error = std::format("{}: command not found or not executable\n", spec.argv[0]);
    const bool capture = spec.output == OutputMode::CAPTURE;
    const pid_t parent_pid = ::getpid();

    int pipe_fds[2] = {-1, -1};
    if (capture && ::pipe2(pipe_fds, O_CLOEXEC) != 0) {
        return spawn_failure("pipe");
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        auto failure = spawn_failure("fork");
        close_fd(pipe_fds[0]);
        close_fd(pipe_fds[1]);
        return failure;
    }

    if (pid == 0) {
        if (capture) {
            ::dup2(pipe_fds[1], STDOUT_FILENO);
            ::dup2(pipe_fds[1], STDERR_FILENO);
        }
#ifdef __linux__
        if (spec.die_with_parent) {
            ::prctl(PR_SET_PDEATHSIG, SIGTERM);
            if (::getppid() != parent_pid) ::_exit(1);
        }
#endif
        ::execvpe(argv[0], argv.data(), envp.data());
        const ssize_t written = ::write(STDERR_FILENO, exec_error.data(), exec_error.size());
        (void)written;
        ::_exit(127);
    }

    CommandResult result;
    result.spawned = true;

    if (capture) {
        close_fd(pipe_fds[1]);
        char buf[4096];
        for (;;) {
            const ssize_t n = ::read(pipe_fds[0], buf, sizeof(buf));
            if (n > 0) {
                result.output.append(buf, static_cast<size_t>(n));
            } else if (n == 0) {
                break;
            } else if (errno != EINTR) {
                break;
            }
        }
        close_fd(pipe_fds[0]);
    }

    int status = 0;
    pid_t waited = -1;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        result.exit_code = -1;
        result.output += std::format("waitpid failed: {}", std::strerror(errno));
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }
    return result;
}

CommandExecutor system_executor() {
    return [](const CommandSpec& spec) { return run_command(spec); };
}

std::string format_command(const std::vector<std::string>& argv) {
    std::string out;
    bool redact_next = false;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        if (redact_next) {
            out += "<redacted>";
            redact_next = false;
            continue;
        }
        out += arg;
        redact_next = (arg == "--session");
    }
    return out;
}

} // namespace bwproxy
