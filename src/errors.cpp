// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#include <string>

#include "errors.hpp"
#include "utils/debug.hpp"

namespace ksymtab {

CapacityExceeded::CapacityExceeded(const uint64_t blob_size, const uint64_t section_size)
    : KsymtabError("Symbol table is too big (" + std::to_string(blob_size) + "B > " + std::to_string(section_size) +
                   "B)"),
      blob_size_{blob_size}, section_size_{section_size} {}

std::string to_string(const PatchStep step) {
    switch (step) {
    case PatchStep::extract_debug: return "extract debug info";
    case PatchStep::strip_debug: return "strip debug info";
    case PatchStep::update_section: return "update symbol section";
    case PatchStep::add_debug_link: return "add debug link";
    }
    KSYM_ERROR("unknown patch step ", static_cast<int>(step));
}

static std::string describe_failure(const PatchStep step, const std::string& command, const int status,
                                    const std::string& detail) {
    std::string message = "Patch step '" + to_string(step) + "' failed";
    if (status >= 0) {
        message += " with exit status " + std::to_string(status);
    }
    message += ": " + command;
    if (!detail.empty()) {
        message += " (" + detail + ")";
    }
    return message;
}

PatchStepFailure::PatchStepFailure(const PatchStep step, std::string command, const int status,
                                   const std::string& detail)
    : KsymtabError(describe_failure(step, command, status, detail)), step_{step}, command_{std::move(command)},
      status_{status} {}

} // namespace ksymtab
