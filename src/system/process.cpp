#include <sitecache/system/process.h>

#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sitecache::system {

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

std::string describeCommand(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty())
            out.push_back(' ');
        out += a;
    }
    return out;
}

Result<ProcessResult> runProcess(const ProcessSpec& spec) {
    if (spec.argv.empty()) {
        return Error{ErrorCode::InvalidArgument, "runProcess: empty argv"};
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) < 0 || ::pipe2(errPipe, O_CLOEXEC) < 0) {
        int saved = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return Error{ErrorCode::InternalError,
                     "Failed to create pipes: " + std::string(std::strerror(saved))};
    }

    const std::string logName =
        spec.redactArgs ? spec.argv.front() + " <redacted>" : describeCommand(spec.argv);
    spdlog::debug("exec: {}", logName);

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return Error{ErrorCode::InternalError,
                     "fork() failed: " + std::string(std::strerror(saved))};
    }

    if (pid == 0) {
        // Child process
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);

        if (spec.workdir) {
            if (::chdir(spec.workdir->c_str()) < 0) {
                ::_exit(kExecFailedExitCode);
            }
        }

        std::vector<char*> argv;
        argv.reserve(spec.argv.size() + 1);
        for (const auto& arg : spec.argv) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        ::execvp(argv[0], argv.data());
        ::_exit(kExecFailedExitCode);
    }

    // Parent process
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now() + spec.timeout;
    bool timedOut = false;

    pollfd fds[2] = {{outPipe[0], POLLIN, 0}, {errPipe[0], POLLIN, 0}};
    std::string* sinks[2] = {&result.out, &result.err};
    int openCount = 2;
    char buf[4096];

    while (openCount > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timedOut = true;
            break;
        }
        int rc = ::poll(fds, 2, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            break;
        }
        if (rc == 0) {
            timedOut = true;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0)
                continue;
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                closeFd(fds[i].fd);
                --openCount;
            }
        }
    }

    // Read ends are owned by fds[] from here on
    closeFd(fds[0].fd);
    closeFd(fds[1].fd);

    if (timedOut) {
        spdlog::warn("Command timed out after {} ms, killing pid {}: {}", spec.timeout.count(), pid,
                     logName);
        ::kill(pid, SIGKILL);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Error{ErrorCode::InternalError,
                         "waitpid() failed: " + std::string(std::strerror(errno))};
        }
    }

    if (timedOut) {
        return Error{ErrorCode::Timeout, "Command timed out: " + logName};
    }

    result.exitCode = decodeStatus(status);
    spdlog::debug("exec finished (exit {}): {}", result.exitCode, spec.argv.front());
    return result;
}

} // namespace sitecache::system
