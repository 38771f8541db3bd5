// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace ksymtab {

/// A named address of the kernel image: a function or a code boundary marker.
struct Symbol {
    /// Address as listed. The encoded table stores it on 32 bits.
    uint64_t address{};
    std::string name;

    bool operator==(const Symbol&) const = default;
};

/// Ordered symbols as consumed by the kernel's symbolizer.
/// Entries 0 and 1 are reserved for the code region sentinels.
using SymbolTable = std::vector<Symbol>;

std::ostream& operator<<(std::ostream& os, const Symbol& symbol);

/// One "index address name" line per entry.
void print_symbol_table(std::ostream& os, const SymbolTable& table);

/// Print `address` as `name+0xoffset`, or as unknown when `symbol` is null.
void print_resolution(std::ostream& os, uint64_t address, const Symbol* symbol);

} // namespace ksymtab
