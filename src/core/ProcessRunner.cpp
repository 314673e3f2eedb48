/**
 * @file ProcessRunner.cpp
 * @brief fork/exec wrapper with a deadline and captured stdout.
 */

#include "lanmonitor/ProcessRunner.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace LanMonitor {

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

}  // namespace

ProcessResult ProcessRunner::run(const std::vector<std::string>& argv,
                                 std::chrono::milliseconds timeout,
                                 size_t maxOutputBytes) {
    ProcessResult result;
    if (argv.empty()) {
        result.errorMsg = "empty command line";
        return result;
    }

    // argv must be built before fork(); the child may only call
    // async-signal-safe functions.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        cargv.push_back(const_cast<char*>(a.c_str()));
    }
    cargv.push_back(nullptr);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};   // reports exec failure, closed on exec success
    if (pipe2(outPipe, O_CLOEXEC) != 0) {
        result.errorMsg = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (pipe2(errPipe, O_CLOEXEC) != 0) {
        result.errorMsg = std::string("pipe failed: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return result;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        result.errorMsg = std::string("fork failed: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child
        dup2(outPipe[1], STDOUT_FILENO);
        const int devNull = ::open("/dev/null", O_RDWR);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            dup2(devNull, STDERR_FILENO);
        }
        execvp(cargv[0], cargv.data());
        const int err = errno;
        ssize_t ignored = ::write(errPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(errPipe[0], &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(errPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        closeFd(outPipe[0]);
        result.errorMsg = std::string("exec ") + argv[0] + " failed: " + std::strerror(execErrno);
        return result;
    }
    result.launched = true;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[4096];

    while (outPipe[0] >= 0) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            break;
        }

        pollfd pfd{};
        pfd.fd = outPipe[0];
        pfd.events = POLLIN;
        const int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (rc == 0) {
            continue;
        }

        const ssize_t got = ::read(outPipe[0], buffer, sizeof(buffer));
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (got == 0) {
            break;  // EOF
        }
        if (result.output.size() < maxOutputBytes) {
            const size_t room = maxOutputBytes - result.output.size();
            result.output.append(buffer, std::min(room, static_cast<size_t>(got)));
        }
    }
    closeFd(outPipe[0]);

    int status = 0;
    if (result.timedOut) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        result.exitCode = -1;
        return result;
    }

    // stdout closed; give the child the rest of the deadline to exit.
    while (true) {
        const pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            result.exitCode = decodeWaitStatus(status);
            break;
        }
        if (w < 0 && errno != EINTR) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            result.timedOut = true;
            result.exitCode = -1;
            break;
        }
        usleep(10 * 1000);
    }

    return result;
}

}  // namespace LanMonitor
