/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "systrack/shell_pipe.hpp"
#include "systrack/config.hpp"
#include "systrack/interrupts.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <format>
#include <system_error>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace systrack {

namespace {

int pidfd_open(pid_t pid, unsigned int flags) {
#ifdef __NR_pidfd_open
    return static_cast<int>(syscall(__NR_pidfd_open, pid, flags));
#else
    errno = ENOSYS;
    return -1;
#endif
}

int decode_status(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

constexpr std::chrono::milliseconds kPollSlice{100};

}  // namespace

ShellPipe::ShellPipe(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("ShellPipe: Empty argument list");
    }

    std::vector<std::string> args_copy = args;
    std::vector<char*> c_args;
    c_args.reserve(args_copy.size() + 1);

    for (auto& arg : args_copy) {
        c_args.push_back(arg.data());
    }
    c_args.push_back(nullptr);

    int out_fds[2];
    if (::pipe2(out_fds, O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::generic_category(), "Failed to create pipe");
    }
    FileDescriptor out_read(out_fds[0]);
    FileDescriptor out_write(out_fds[1]);

    // Carries errno back from the child when execvp fails. Closed by exec on success.
    int status_fds[2];
    if (::pipe2(status_fds, O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::generic_category(), "Failed to create pipe");
    }
    FileDescriptor status_read(status_fds[0]);
    FileDescriptor status_write(status_fds[1]);

    pid_t pid = ::fork();
    if (pid == -1) {
        throw std::system_error(errno, std::generic_category(), "Failed to fork process");
    }

    if (pid == 0) {
        if (::dup2(out_fds[1], STDOUT_FILENO) == -1) ::_exit(127);
        if (::dup2(out_fds[1], STDERR_FILENO) == -1) ::_exit(127);

        ::execvp(c_args[0], c_args.data());

        int err = errno;
        [[maybe_unused]] auto val = ::write(status_fds[1], &err, sizeof(err));
        ::_exit(127);
    }

    pid_ = pid;
    out_write.reset();
    status_write.reset();

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_read.get(), &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        ::waitpid(pid_, nullptr, 0);
        pid_ = -1;
        throw std::system_error(
            child_errno, std::generic_category(), std::format("Failed to execute '{}'", args[0]));
    }

    read_fd_ = std::move(out_read);
}

ShellPipe::~ShellPipe() {
    read_fd_.reset();
    terminate();
}

void ShellPipe::terminate() noexcept {
    if (pid_ == -1) {
        return;
    }

    int status = 0;
    if (::waitpid(pid_, &status, WNOHANG) == pid_) {
        exit_code_ = decode_status(status);
        pid_ = -1;
        return;
    }

    ::kill(pid_, SIGTERM);

    bool reaped = false;
    int pfd = pidfd_open(pid_, 0);

    if (pfd >= 0) {
        struct pollfd pfd_struct;
        pfd_struct.fd = pfd;
        pfd_struct.events = POLLIN;

        int ret = ::poll(&pfd_struct, 1, 1000);
        ::close(pfd);

        if (ret > 0 && ::waitpid(pid_, &status, 0) == pid_) {
            reaped = true;
        }
    }

    if (!reaped) {
        for (int i = 0; i < 5; ++i) {
            if (::waitpid(pid_, &status, WNOHANG) == pid_) {
                reaped = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (!reaped) {
            ::kill(pid_, SIGKILL);
            ::waitpid(pid_, &status, 0);
        }
    }

    exit_code_ = decode_status(status);
    pid_ = -1;
}

std::string ShellPipe::read_all(std::chrono::milliseconds timeout, std::stop_token stop) {
    std::string output;
    if (!read_fd_) {
        return output;
    }

    std::array<char, 4096> buffer;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (g_interrupted || stop.stop_requested()) {
            terminate();
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            terminate();
            throw CommandTimeout(std::format("Command timed out after {} ms", timeout.count()));
        }

        auto slice = std::min(
            kPollSlice, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));

        struct pollfd pfd;
        pfd.fd = read_fd_.get();
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ret = ::poll(&pfd, 1, static_cast<int>(std::max<long>(1, slice.count())));
        if (ret == 0) {
            continue;
        }
        if (ret < 0) {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(), "Failed to poll pipe");
        }

        ssize_t bytes_read = ::read(read_fd_.get(), buffer.data(), buffer.size());

        if (bytes_read > 0) {
            if (output.size() + static_cast<std::size_t>(bytes_read) > Config::MAX_PIPE_OUTPUT) {
                output += "\n[Output truncated (too large)]";
                terminate();
                break;
            }
            output.append(buffer.data(), static_cast<std::size_t>(bytes_read));
        } else if (bytes_read == 0) {
            break;
        } else {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            throw std::system_error(errno, std::generic_category(), "Failed to read from pipe");
        }
    }

    return output;
}

int ShellPipe::wait() {
    if (pid_ == -1) {
        return exit_code_;
    }

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result == -1 && errno == EINTR);

    if (result == -1) {
        throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }

    exit_code_ = decode_status(status);
    pid_ = -1;
    return exit_code_;
}

}  // namespace systrack
