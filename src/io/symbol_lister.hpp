// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "io/command_runner.hpp"

namespace ksymtab {

/// Address-sorted `nm -n` style listing: one "address type name" line per symbol.
using SymbolListing = std::vector<std::string>;

class SymbolLister {
  public:
    virtual ~SymbolLister() = default;

    /// @throws ExtractionError when no listing can be obtained.
    virtual SymbolListing list(const std::filesystem::path& binary) = 0;
};

/// Dumps symbols with the host (or cross) `nm`.
class NmSymbolLister final : public SymbolLister {
    CommandRunner& runner_;
    std::string program_;

  public:
    NmSymbolLister(CommandRunner& runner, std::string program) : runner_{runner}, program_{std::move(program)} {}

    SymbolListing list(const std::filesystem::path& binary) override;
};

/// Reads `.symtab` in process and renders it the way `nm -n` does.
class ElfSymbolLister final : public SymbolLister {
  public:
    SymbolListing list(const std::filesystem::path& binary) override;
};

std::unique_ptr<SymbolLister> make_symbol_lister(const ksymtab_options_t& options, CommandRunner& runner);

SymbolListing split_lines(const std::string& text);

} // namespace ksymtab
