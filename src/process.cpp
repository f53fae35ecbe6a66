#include "process.hpp"
#include "logging.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mediaframes {

namespace {

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

class PosixChildProcess : public ChildProcess {
public:
    PosixChildProcess(pid_t pid, int stdout_fd, int stderr_fd)
        : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

    ~PosixChildProcess() override {
        terminate();
        close_fd(stderr_fd_);
    }

    size_t read(uint8_t* buffer, size_t size) override {
        if (stdout_fd_ < 0) {
            return 0;
        }
        while (true) {
            ssize_t n = ::read(stdout_fd_, buffer, size);
            if (n >= 0) {
                return static_cast<size_t>(n);
            }
            if (errno != EINTR) {
                throw std::system_error(errno, std::generic_category(),
                                        "Cannot read output of process " + std::to_string(pid_));
            }
        }
    }

    std::optional<int> wait_for(std::chrono::milliseconds timeout) override {
        if (exit_status_) {
            return exit_status_;
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            int status = 0;
            pid_t result = ::waitpid(pid_, &status, WNOHANG);
            if (result == pid_) {
                exit_status_ = decode_wait_status(status);
                close_fd(stdout_fd_);
                return exit_status_;
            }
            if (result < 0 && errno != EINTR) {
                throw std::system_error(errno, std::generic_category(),
                                        "Cannot wait for process " + std::to_string(pid_));
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return std::nullopt;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    std::string error_output() override {
        std::string output;
        if (stderr_fd_ < 0 || ::lseek(stderr_fd_, 0, SEEK_SET) < 0) {
            return output;
        }

        char chunk[4096];
        while (true) {
            ssize_t n = ::read(stderr_fd_, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                break;
            }
            output.append(chunk, static_cast<size_t>(n));
        }
        return output;
    }

    void terminate() override {
        close_fd(stdout_fd_);
        if (exit_status_) {
            return;
        }

        if (::kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
            log_error("Failed to kill process " + std::to_string(pid_) + ": " + std::strerror(errno));
        }

        int status = 0;
        pid_t result;
        do {
            result = ::waitpid(pid_, &status, 0);
        } while (result < 0 && errno == EINTR);

        if (result == pid_) {
            exit_status_ = decode_wait_status(status);
            log_debug("Process " + std::to_string(pid_) + " terminated");
        } else {
            exit_status_ = -1;
            log_error("Failed to reap process " + std::to_string(pid_) + ": " + std::strerror(errno));
        }
    }

private:
    pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    std::optional<int> exit_status_;
};

} // namespace

std::unique_ptr<ChildProcess> PosixProcessLauncher::launch(const std::vector<std::string>& args,
                                                           int stdin_fd) {
    if (args.empty()) {
        throw std::invalid_argument("Cannot launch a process without arguments");
    }

    int out_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "Cannot create pipe");
    }

    // stderr goes to an unlinked file so the child can never block on it
    std::FILE* err_file = std::tmpfile();
    if (err_file == nullptr) {
        int err = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        throw std::system_error(err, std::generic_category(), "Cannot create stderr capture file");
    }
    int err_fd = ::fcntl(::fileno(err_file), F_DUPFD_CLOEXEC, 0);
    int dup_errno = errno;
    std::fclose(err_file);
    if (err_fd < 0) {
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        throw std::system_error(dup_errno, std::generic_category(), "Cannot create stderr capture file");
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_fd);
        throw std::system_error(err, std::generic_category(), "Cannot fork");
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        if (::dup2(stdin_fd, STDIN_FILENO) < 0 ||
            ::dup2(out_pipe[1], STDOUT_FILENO) < 0 ||
            ::dup2(err_fd, STDERR_FILENO) < 0) {
            ::_exit(127);
        }
        ::execvp(argv[0], argv.data());

        const char msg[] = "failed to execute transcoder\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    log_debug("Started " + args[0] + " as process " + std::to_string(pid));
    return std::make_unique<PosixChildProcess>(pid, out_pipe[0], err_fd);
}

} // namespace mediaframes
