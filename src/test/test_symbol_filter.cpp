// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#include <catch2/catch_all.hpp>

#include <string>
#include <vector>

#include "test_support.hpp"

static const CodeSentinels sentinels{"_kernel_code_start", "_kernel_code_end"};

static std::vector<std::string> names(const SymbolTable& table) {
    std::vector<std::string> result;
    for (const auto& symbol : table) {
        result.push_back(symbol.name);
    }
    return result;
}

static SymbolTable symbols(const std::vector<std::string>& names) {
    SymbolTable table;
    uint64_t address = 0x1000;
    for (const auto& name : names) {
        table.push_back(Symbol{address, name});
        address += 0x10;
    }
    return table;
}

TEST_CASE("only text symbols and code sentinels are selected", "[filter]") {
    const SymbolListing listing{
        "00001000 T global_function",
        "00001010 t local_function",
        "00001020 D some_data",
        "00001030 d local_data",
        "00001040 B bss_object",
        "00001050 R _kernel_code_end",
        "00001060 r read_only",
        "00001070 W weak_function",
        "00001080 A _kernel_code_start",
        "00001090 a absolute",
        "000010a0 U bogus_with_address",
    };

    const SymbolTable selected = select_symbols(listing, sentinels);
    REQUIRE(names(selected) ==
            std::vector<std::string>{"global_function", "local_function", "_kernel_code_end", "_kernel_code_start"});
    REQUIRE(selected[0].address == 0x1000);
    REQUIRE(selected[3].address == 0x1080);
}

TEST_CASE("selection keeps the address and name columns", "[filter]") {
    SECTION("extra columns are dropped") {
        const SymbolTable selected = select_symbols({"c0101000 T kernel_main extra columns"}, sentinels);
        REQUIRE(selected == SymbolTable{{0xc0101000, "kernel_main"}});
    }

    SECTION("whitespace is not significant") {
        const SymbolTable selected = select_symbols({"  c0101000\tt   gdt_load  "}, sentinels);
        REQUIRE(selected == SymbolTable{{0xc0101000, "gdt_load"}});
    }

    SECTION("64-bit addresses are parsed in full") {
        const SymbolTable selected = select_symbols({"ffffffff80001000 T start_kernel"}, sentinels);
        REQUIRE(selected[0].address == 0xffffffff80001000ULL);
    }
}

TEST_CASE("lines without an address are skipped", "[filter]") {
    const SymbolListing listing{
        "         U external_function",
        "         w weak_undefined",
        "00001000 T kept",
    };
    REQUIRE(names(select_symbols(listing, sentinels)) == std::vector<std::string>{"kept"});
}

TEST_CASE("a selected line with a malformed address is rejected", "[filter]") {
    REQUIRE_THROWS_AS(select_symbols({"c01g1000 T kernel_main"}, sentinels), ExtractionError);
    REQUIRE_THROWS_AS(select_symbols({"0xc0101000 T kernel_main"}, sentinels), ExtractionError);
}

TEST_CASE("a dropped line is not parsed", "[filter]") {
    REQUIRE(select_symbols({"zzzz D not_an_address"}, sentinels).empty());
}

TEST_CASE("reordering drops the first entry then moves the next one to position 1", "[filter]") {
    SymbolTable table = symbols({"A", "B", "C", "D"});
    reorder_symbols(table);
    REQUIRE(names(table) == std::vector<std::string>{"C", "B", "D"});
    REQUIRE(table[0].address == 0x1020);
    REQUIRE(table[1].address == 0x1010);
}

TEST_CASE("reordering of short tables", "[filter]") {
    SECTION("two entries keep only the second") {
        SymbolTable table = symbols({"A", "B"});
        reorder_symbols(table);
        REQUIRE(names(table) == std::vector<std::string>{"B"});
    }

    SECTION("three entries swap the remaining pair") {
        SymbolTable table = symbols({"A", "B", "C"});
        reorder_symbols(table);
        REQUIRE(names(table) == std::vector<std::string>{"C", "B"});
    }

    SECTION("fewer than two entries is an error") {
        SymbolTable one = symbols({"A"});
        REQUIRE_THROWS_AS(reorder_symbols(one), ExtractionError);
        SymbolTable none;
        REQUIRE_THROWS_AS(reorder_symbols(none), ExtractionError);
    }
}

TEST_CASE("kernel listing puts the code start sentinel first", "[filter]") {
    const SymbolTable table = build_symbol_table(sample_kernel_listing(), sentinels);

    REQUIRE(names(table) == std::vector<std::string>{"_kernel_code_start", "multiboot_header", "arch_setup",
                                                     "gdt_load", "kernel_main", "panic", "_kernel_code_end"});
    REQUIRE(table.front() == Symbol{0xc0101000, "_kernel_code_start"});
    REQUIRE_FALSE(check_sentinel_order(table, sentinels).has_value());
}

TEST_CASE("positional reordering misplaces a start sentinel that is not third", "[filter]") {
    // The start sentinel directly follows the image start, so the swap pushes it to position 1.
    const SymbolListing listing{
        "c0100000 T _kernel_start",
        "c0100000 T _kernel_code_start",
        "c0100010 T kernel_main",
        "c0100020 T panic",
        "c0100030 T _kernel_code_end",
    };
    const SymbolTable table = build_symbol_table(listing, sentinels);
    REQUIRE(names(table) == std::vector<std::string>{"kernel_main", "_kernel_code_start", "panic", "_kernel_code_end"});

    const auto divergence = check_sentinel_order(table, sentinels);
    REQUIRE(divergence.has_value());
    REQUIRE(divergence->find("position 1") != std::string::npos);
}

TEST_CASE("sentinel check reports missing sentinels", "[filter]") {
    REQUIRE(check_sentinel_order(symbols({"kernel_main", "panic"}), sentinels)->find("start") != std::string::npos);
    REQUIRE(check_sentinel_order(symbols({"_kernel_code_start", "panic"}), sentinels)->find("end") !=
            std::string::npos);
    REQUIRE_FALSE(check_sentinel_order(symbols({"_kernel_code_start", "_kernel_code_end"}), sentinels).has_value());
}

TEST_CASE("sentinel names come from the options", "[filter]") {
    ksymtab_options_t options;
    options.code_start_symbol = "__text_start";
    options.code_end_symbol = "__text_end";
    const SymbolTable selected =
        select_symbols({"00001000 A __text_start", "00002000 A __text_end", "00001000 A _kernel_code_start"},
                       CodeSentinels::from(options));
    REQUIRE(names(selected) == std::vector<std::string>{"__text_start", "__text_end"});
}
