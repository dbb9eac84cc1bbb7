#include "util/Process.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/Constants.hpp"

namespace folio {

namespace {

constexpr int POLL_INTERVAL_MS = 50;

void appendCapped(std::string& out, const char* data, size_t len) {
    size_t room = Constants::MAX_CAPTURED_STDERR > out.size()
        ? Constants::MAX_CAPTURED_STDERR - out.size() : 0;
    out.append(data, std::min(len, room));
}

/// Read whatever is available; returns false once the pipe reaches EOF or fails
bool drainPipe(int fd, std::string& out) {
    char buf[1024];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            appendCapped(out, buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

}

Expected<ProcessResult> runProcess(const std::vector<std::string>& argv, std::chrono::seconds timeout) {
    if (argv.empty()) {
        return Error{ErrorCode::InvalidArgs, "runProcess: empty argument list"};
    }

    // Built before fork: the child of a multithreaded parent must not allocate
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int errPipe[2];
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        return Error{ErrorCode::IoError, std::string("pipe failed: ") + std::strerror(errno)};
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        int err = errno;
        ::close(errPipe[0]);
        ::close(errPipe[1]);
        return Error{ErrorCode::IoError, std::string("fork failed: ") + std::strerror(err)};
    }

    if (pid == 0) {
        // Child process
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            ::close(devNull);
        }
        ::dup2(errPipe[1], STDERR_FILENO);
        ::close(errPipe[0]);
        ::close(errPipe[1]);

        ::execvp(cargv[0], cargv.data());
        _exit(127);
    }

    // Parent process
    ::close(errPipe[1]);
    int fd = errPipe[0];
    ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);

    ProcessResult result;
    const bool bounded = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool pipeOpen = true;
    int status = 0;

    while (true) {
        if (pipeOpen) {
            pollfd pfd{fd, POLLIN, 0};
            int pr = ::poll(&pfd, 1, POLL_INTERVAL_MS);
            if (pr > 0) pipeOpen = drainPipe(fd, result.stderrText);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
        }

        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r == -1 && errno != EINTR) {
            int err = errno;
            ::close(fd);
            return Error{ErrorCode::IoError, std::string("waitpid failed: ") + std::strerror(err)};
        }

        if (bounded && std::chrono::steady_clock::now() >= deadline) {
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
            }
            ::close(fd);
            return Error{ErrorCode::Timeout,
                         argv.front() + " timed out after " + std::to_string(timeout.count()) + "s"};
        }
    }

    // Child exited; pick up anything still buffered without waiting on grandchildren
    if (pipeOpen) drainPipe(fd, result.stderrText);
    ::close(fd);

    result.exitStatus = decodeStatus(status);
    if (result.exitStatus == 127 && result.stderrText.empty()) {
        return Error{ErrorCode::IoError, "could not execute " + argv.front()};
    }
    return result;
}

}
