// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

#include "config.hpp"
#include "io/symbol_lister.hpp"
#include "patcher.hpp"
#include "symbol.hpp"

namespace ksymtab {

struct RunReport {
    std::filesystem::path map_file;
    std::filesystem::path debug_file;
    SymbolTable table;
    uint64_t table_size{};
    uint64_t section_size{};
    /// Set when the start sentinel did not end up as the first entry.
    std::optional<std::string> sentinel_divergence;
};

/// The external collaborators used by a run.
struct Toolchain {
    SymbolLister& lister;
    BinaryEditor& editor;
};

/**
 * @brief Build the kernel symbol table and embed it into the kernel image.
 *
 * Writes `<stem>.map` and `<stem>.sym` beside the kernel. Progress messages go
 * to `out`.
 *
 * @throws MissingInput if the kernel does not exist.
 * @throws ExtractionError, EncodingError, CapacityExceeded, PatchStepFailure
 * The kernel is not modified unless the patch sequence was reached.
 */
RunReport run_pipeline(const std::filesystem::path& kernel, uint64_t section_size, const ksymtab_options_t& options,
                       Toolchain toolchain, std::ostream& out);

} // namespace ksymtab
