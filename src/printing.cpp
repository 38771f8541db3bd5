// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#include <iomanip>
#include <ostream>

#include "symbol.hpp"

namespace ksymtab {

static std::ostream& print_address(std::ostream& os, const uint64_t address) {
    const auto flags = os.flags();
    const auto fill = os.fill();
    os << "0x" << std::hex << std::setw(8) << std::setfill('0') << address;
    os.flags(flags);
    os.fill(fill);
    return os;
}

std::ostream& operator<<(std::ostream& os, const Symbol& symbol) {
    return print_address(os, symbol.address) << " " << symbol.name;
}

void print_symbol_table(std::ostream& os, const SymbolTable& table) {
    os << table.size() << " symbols\n";
    for (size_t i = 0; i < table.size(); ++i) {
        os << std::setw(6) << i << " " << table[i] << "\n";
    }
}

void print_resolution(std::ostream& os, const uint64_t address, const Symbol* symbol) {
    print_address(os, address) << " ";
    if (!symbol) {
        os << "<unknown>\n";
        return;
    }
    os << symbol->name;
    if (address > symbol->address) {
        os << "+0x" << std::hex << (address - symbol->address) << std::dec;
    } else if (address < symbol->address) {
        os << "-0x" << std::hex << (symbol->address - address) << std::dec;
    }
    os << "\n";
}

} // namespace ksymtab
