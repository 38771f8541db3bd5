// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#include <algorithm>
#include <charconv>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "errors.hpp"
#include "symbol_filter.hpp"
#include "utils/debug.hpp"

namespace ksymtab {

static std::vector<std::string> tokenize(const std::string& line) {
    std::istringstream is{line};
    std::vector<std::string> tokens;
    std::string token;
    while (is >> token) {
        tokens.push_back(std::move(token));
    }
    return tokens;
}

static bool is_text_type(const std::string& type) { return type == "t" || type == "T"; }

static uint64_t parse_address(const std::string& text, const std::string& line) {
    uint64_t address = 0;
    const char* first = text.data();
    const char* last = first + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, address, 16);
    if (ec != std::errc{} || ptr != last) {
        throw ExtractionError("Malformed address '" + text + "' in symbol listing line: " + line);
    }
    return address;
}

SymbolTable select_symbols(const SymbolListing& listing, const CodeSentinels& sentinels) {
    SymbolTable selected;
    for (const auto& line : listing) {
        const auto tokens = tokenize(line);
        if (tokens.size() < 3) {
            continue;
        }
        const std::string& type = tokens[1];
        const std::string& name = tokens[2];
        if (!is_text_type(type) && name != sentinels.start && name != sentinels.end) {
            continue;
        }
        selected.push_back(Symbol{parse_address(tokens[0], line), name});
    }
    KSYM_LOG("filter", std::cout << "selected " << selected.size() << " of " << listing.size() << " symbols\n");
    return selected;
}

void reorder_symbols(SymbolTable& symbols) {
    if (symbols.size() < 2) {
        throw ExtractionError("Symbol listing holds " + std::to_string(symbols.size()) +
                              " function symbols, at least 2 are required");
    }

    symbols.erase(symbols.begin());

    Symbol first = std::move(symbols.front());
    symbols.erase(symbols.begin());
    const auto position = std::min<SymbolTable::difference_type>(1, std::ssize(symbols));
    symbols.insert(symbols.begin() + position, std::move(first));
}

std::optional<std::string> check_sentinel_order(const SymbolTable& table, const CodeSentinels& sentinels) {
    const auto find = [&](const std::string& name) {
        return std::ranges::find(table, name, &Symbol::name);
    };

    const auto start = find(sentinels.start);
    if (start == table.end()) {
        return "code start sentinel '" + sentinels.start + "' is missing from the symbol table";
    }
    if (start != table.begin()) {
        return "code start sentinel '" + sentinels.start + "' is at position " +
               std::to_string(start - table.begin()) + " instead of 0 (first entry is '" + table.front().name + "')";
    }
    if (find(sentinels.end) == table.end()) {
        return "code end sentinel '" + sentinels.end + "' is missing from the symbol table";
    }
    return std::nullopt;
}

SymbolTable build_symbol_table(const SymbolListing& listing, const CodeSentinels& sentinels) {
    SymbolTable table = select_symbols(listing, sentinels);
    reorder_symbols(table);
    KSYM_LOG("filter", std::cout << "first entry after reordering: " << table.front() << "\n");
    return table;
}

} // namespace ksymtab
