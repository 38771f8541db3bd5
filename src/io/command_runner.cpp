// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#include <string>
#include <vector>

#include <subprocess.hpp>

#include "io/command_runner.hpp"
#include "utils/debug.hpp"

namespace sp = subprocess;

namespace ksymtab {

std::string to_string(const CommandLine& command) {
    std::string result;
    for (const auto& arg : command) {
        if (!result.empty()) {
            result += ' ';
        }
        result += arg;
    }
    return result;
}

int SubprocessRunner::run(const CommandLine& command) {
    if (command.empty()) {
        KSYM_ERROR("empty command line");
    }
    if (echo_) {
        *echo_ << to_string(command) << std::endl;
    }
    try {
        return sp::call(command);
    } catch (const sp::OSError& e) {
        throw CommandLaunchError("Unable to run '" + command.front() + "': " + e.what());
    } catch (const sp::CalledProcessError& e) {
        // exec failed in the child
        throw CommandLaunchError("Unable to run '" + command.front() + "': " + e.what());
    }
}

CapturedOutput SubprocessRunner::capture(const CommandLine& command) {
    if (command.empty()) {
        KSYM_ERROR("empty command line");
    }
    if (echo_) {
        *echo_ << to_string(command) << std::endl;
    }
    try {
        sp::Popen process(command, sp::output{sp::PIPE});
        auto [out, err] = process.communicate();
        CapturedOutput result;
        result.status = process.retcode();
        result.output.assign(out.buf.data(), out.length);
        return result;
    } catch (const sp::OSError& e) {
        throw CommandLaunchError("Unable to run '" + command.front() + "': " + e.what());
    } catch (const sp::CalledProcessError& e) {
        // exec failed in the child
        throw CommandLaunchError("Unable to run '" + command.front() + "': " + e.what());
    }
}

} // namespace ksymtab
