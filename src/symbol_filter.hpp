// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "io/symbol_lister.hpp"
#include "symbol.hpp"

namespace ksymtab {

/// Names of the linker symbols marking the first and last byte of the kernel code.
struct CodeSentinels {
    std::string start;
    std::string end;

    static CodeSentinels from(const ksymtab_options_t& options) {
        return {options.code_start_symbol, options.code_end_symbol};
    }
};

/// @brief Keep text symbols (type `t` or `T`) and the code sentinels, in listing order.
///
/// Each kept line contributes its address and name; the type letter and any
/// extra columns are dropped. Lines without an address are skipped.
///
/// @throws ExtractionError if a kept line has a malformed address.
SymbolTable select_symbols(const SymbolListing& listing, const CodeSentinels& sentinels);

/// @brief Compatibility reordering of the selected symbols.
///
/// Drops the first entry (the image start marker), then moves the new first
/// entry to position 1: `[A, B, C, D]` becomes `[C, B, D]`. The rule is
/// positional: the start sentinel ends up first only when it was the third
/// selected symbol. See check_sentinel_order().
///
/// @throws ExtractionError if fewer than two symbols are given.
void reorder_symbols(SymbolTable& symbols);

/// Describe how the table departs from "start sentinel first, end sentinel present".
[[nodiscard]]
std::optional<std::string> check_sentinel_order(const SymbolTable& table, const CodeSentinels& sentinels);

/// select_symbols() followed by reorder_symbols().
SymbolTable build_symbol_table(const SymbolListing& listing, const CodeSentinels& sentinels);

} // namespace ksymtab
