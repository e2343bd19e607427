// filename: process.cpp
// part of Gray-Scott Ensemble Orchestrator
// MIT License

#include "ensemble/process.hpp"

#include "ensemble/errors.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ensemble {

namespace {

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }
    ~UniqueFd() { reset(); }

    [[nodiscard]] int get() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

    int release() {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

UniqueFd openOutput(const std::filesystem::path& path) {
    UniqueFd fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.valid()) {
        throw ResourceUnavailable("Failed to open " + path.string() + ": " + std::strerror(errno));
    }
    return fd;
}

// Only async-signal-safe calls are allowed between fork and exec.
[[noreturn]] void execChild(char* const* argv, const char* workingDirectory, int outFd, int errFd,
                            int reportFd) {
    int failure = 0;
    if (::chdir(workingDirectory) != 0) {
        failure = errno;
    } else if (::dup2(outFd, STDOUT_FILENO) < 0 || ::dup2(errFd, STDERR_FILENO) < 0) {
        failure = errno;
    } else {
        ::execv(argv[0], argv);
        failure = errno;
    }
    ssize_t written = ::write(reportFd, &failure, sizeof(failure));
    (void)written;
    ::_exit(127);
}

ProcessResult decodeStatus(int status) {
    ProcessResult result{};
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signalled = true;
        result.signal = WTERMSIG(status);
        result.exitCode = 128 + result.signal;
    }
    return result;
}

}  // namespace

ProcessResult runProcess(const std::vector<std::string>& argv,
                         const std::filesystem::path& workingDirectory,
                         const std::filesystem::path& stdoutPath,
                         const std::filesystem::path& stderrPath) {
    if (argv.empty()) {
        throw std::invalid_argument("runProcess: empty command");
    }

    UniqueFd outFd = openOutput(stdoutPath);
    UniqueFd errFd = openOutput(stderrPath);

    int reportPipe[2];
    if (::pipe2(reportPipe, O_CLOEXEC) != 0) {
        throw ResourceUnavailable(std::string("Failed to create pipe: ") + std::strerror(errno));
    }
    UniqueFd reportRead(reportPipe[0]);
    UniqueFd reportWrite(reportPipe[1]);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);
    const std::string cwd = workingDirectory.string();

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw ResourceUnavailable(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        execChild(args.data(), cwd.c_str(), outFd.get(), errFd.get(), reportWrite.get());
    }

    reportWrite.reset();
    outFd.reset();
    errFd.reset();

    // The pipe closes on a successful exec, so a zero-length read means the
    // program is running.
    int childErrno = 0;
    ssize_t got = 0;
    do {
        got = ::read(reportRead.get(), &childErrno, sizeof(childErrno));
    } while (got < 0 && errno == EINTR);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw ResourceUnavailable(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (got == static_cast<ssize_t>(sizeof(childErrno))) {
        throw ResourceUnavailable("Failed to start " + argv.front() + ": " + std::strerror(childErrno));
    }
    return decodeStatus(status);
}

}  // namespace ensemble
