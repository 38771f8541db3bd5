// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace ksymtab {

using CommandLine = std::vector<std::string>;

std::string to_string(const CommandLine& command);

/// Raised when a program cannot be started at all.
class CommandLaunchError : public std::runtime_error {
  public:
    explicit CommandLaunchError(const std::string& what) : std::runtime_error(what) {}
};

struct CapturedOutput {
    int status{};
    std::string output;
};

/// Runs external programs. Tests substitute a recording implementation.
class CommandRunner {
  public:
    virtual ~CommandRunner() = default;

    /// Run the command and return its exit status.
    virtual int run(const CommandLine& command) = 0;

    /// Run the command and capture its standard output.
    virtual CapturedOutput capture(const CommandLine& command) = 0;
};

/// CommandRunner backed by cpp-subprocess.
class SubprocessRunner final : public CommandRunner {
    std::ostream* echo_;

  public:
    /// When echo is set, each command line is printed there before it runs.
    explicit SubprocessRunner(std::ostream* echo = nullptr) : echo_{echo} {}

    int run(const CommandLine& command) override;
    CapturedOutput capture(const CommandLine& command) override;
};

} // namespace ksymtab
