/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

#include "systrack/file_descriptor.hpp"

namespace systrack {

class CommandTimeout : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// Runs a program with stdout and stderr captured through a pipe.
//
// The constructor throws std::system_error when the program cannot be
// started; a missing binary is reported with errc::no_such_file_or_directory.
// The destructor terminates and reaps a child that is still running.
class ShellPipe {
    FileDescriptor read_fd_;
    pid_t pid_ = -1;
    int exit_code_ = -1;

    void terminate() noexcept;

   public:
    explicit ShellPipe(const std::vector<std::string>& args);

    ~ShellPipe();

    ShellPipe(const ShellPipe&) = delete;
    ShellPipe& operator=(const ShellPipe&) = delete;

    // Reads until EOF. Throws CommandTimeout (after killing the child) when
    // the deadline passes, and stops early when `stop` is requested or the
    // process is interrupted.
    std::string read_all(std::chrono::milliseconds timeout = std::chrono::milliseconds(60000),
                         std::stop_token stop = {});

    // Reaps the child and returns its exit status (128 + signal when killed).
    int wait();
};

}  // namespace systrack
