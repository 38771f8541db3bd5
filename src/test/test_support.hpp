// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "ksymtab.hpp"
#include "utils/debug.hpp"

using namespace ksymtab;

inline std::vector<uint8_t> read_file_bytes(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open test file: " + path.string());
    }
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

inline void write_file_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Failed to open test output: " + path.string());
    }
    file << text;
    if (!file) {
        throw std::runtime_error("Failed to write test output: " + path.string());
    }
}

inline std::string read_file_text(const std::filesystem::path& path) {
    const auto bytes = read_file_bytes(path);
    return {bytes.begin(), bytes.end()};
}

inline uint32_t read_u32_le(const std::vector<uint8_t>& bytes, const size_t offset) {
    if (offset + sizeof(uint32_t) > bytes.size()) {
        throw std::runtime_error("u32 read out of bounds");
    }
    return static_cast<uint32_t>(bytes[offset] | (static_cast<uint32_t>(bytes[offset + 1]) << 8U) |
                                 (static_cast<uint32_t>(bytes[offset + 2]) << 16U) |
                                 (static_cast<uint32_t>(bytes[offset + 3]) << 24U));
}

/// Turns warnings off for the lifetime of the object.
class SilencedWarnings {
    bool previous_{KsymWarningFlag};

  public:
    SilencedWarnings() { KsymEnableWarningMsg(false); }
    ~SilencedWarnings() { KsymEnableWarningMsg(previous_); }
    SilencedWarnings(const SilencedWarnings&) = delete;
    SilencedWarnings& operator=(const SilencedWarnings&) = delete;
};

/// Fresh directory under the system temp directory, removed with its content.
class TempDirectory {
  public:
    explicit TempDirectory(const std::string_view tag) {
        const auto temp_dir = std::filesystem::temp_directory_path();
        const auto seed = std::random_device{}();
        for (size_t attempt = 0; attempt < 4096; ++attempt) {
            path_ = temp_dir / ("ksymtab-" + std::string(tag) + "-" + std::to_string(seed) + "-" +
                                std::to_string(attempt));
            if (std::filesystem::create_directory(path_)) {
                return;
            }
        }
        throw std::runtime_error("Failed to create temporary directory");
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

  private:
    std::filesystem::path path_;
};

/// Records every command and answers with canned results.
class RecordingRunner final : public CommandRunner {
  public:
    std::vector<CommandLine> commands;

    /// Returned by capture().
    std::string output;
    int capture_status = 0;

    /// Zero-based index of the run() call that exits with `failure_status`.
    std::optional<size_t> fail_run;
    int failure_status = 1;

    int run(const CommandLine& command) override {
        commands.push_back(command);
        return fail_run == runs_++ ? failure_status : 0;
    }

    CapturedOutput capture(const CommandLine& command) override {
        commands.push_back(command);
        return {capture_status, output};
    }

  private:
    size_t runs_ = 0;
};

/// Returns a fixed listing.
class CannedLister final : public SymbolLister {
  public:
    explicit CannedLister(SymbolListing listing) : listing_{std::move(listing)} {}

    SymbolListing list(const std::filesystem::path&) override { return listing_; }

  private:
    SymbolListing listing_;
};

/// A kernel symbol listing as `nm -n` prints it for the i686 kernel.
inline SymbolListing sample_kernel_listing() {
    return {
        "         U __stack_chk_guard",
        "00000001 a KERNEL_STACK_ORDER",
        "c0100000 T _kernel_start",
        "c0100000 t multiboot_header",
        "c0101000 T _kernel_code_start",
        "c0101000 T arch_setup",
        "c0101040 t gdt_load",
        "c0101080 T kernel_main",
        "c0101100 T panic",
        "c0103000 R _kernel_code_end",
        "c0104000 r logger_levels",
        "c0105000 D kernel_page_directory",
        "c0106000 B kernel_stack",
    };
}
