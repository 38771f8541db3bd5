// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ksymtab {

class KsymtabError : public std::runtime_error {
  public:
    explicit KsymtabError(const std::string& what) : std::runtime_error(what) {}
};

class MissingInput final : public KsymtabError {
  public:
    explicit MissingInput(const std::string& what) : KsymtabError(what) {}
};

class ExtractionError final : public KsymtabError {
  public:
    explicit ExtractionError(const std::string& what) : KsymtabError(what) {}
};

class EncodingError final : public KsymtabError {
  public:
    explicit EncodingError(const std::string& what) : KsymtabError(what) {}
};

class MalformedTable final : public KsymtabError {
  public:
    explicit MalformedTable(const std::string& what) : KsymtabError(what) {}
};

class CapacityExceeded final : public KsymtabError {
    uint64_t blob_size_;
    uint64_t section_size_;

  public:
    CapacityExceeded(uint64_t blob_size, uint64_t section_size);

    [[nodiscard]]
    uint64_t blob_size() const noexcept {
        return blob_size_;
    }
    [[nodiscard]]
    uint64_t section_size() const noexcept {
        return section_size_;
    }
};

/// A step of the patch sequence, in execution order.
enum class PatchStep { extract_debug, strip_debug, update_section, add_debug_link };

std::string to_string(PatchStep step);

class PatchStepFailure final : public KsymtabError {
    PatchStep step_;
    std::string command_;
    int status_;

  public:
    PatchStepFailure(PatchStep step, std::string command, int status, const std::string& detail = {});

    [[nodiscard]]
    PatchStep step() const noexcept {
        return step_;
    }
    [[nodiscard]]
    const std::string& command() const noexcept {
        return command_;
    }
    /// Exit status of the editor, or -1 when it could not be launched.
    [[nodiscard]]
    int status() const noexcept {
        return status_;
    }
};

} // namespace ksymtab
