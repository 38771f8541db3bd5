// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#include <charconv>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "ksymtab.hpp"
#include "main/ksymtab_cli.hpp"
#include "utils/debug.hpp"

// Avoid affecting other headers by macros.
#include <CLI/CLI.hpp>

using std::string;
using std::vector;

namespace ksymtab {

static const std::map<std::string, ListerKind> lister_kinds = {{"nm", ListerKind::nm}, {"elf", ListerKind::elf}};

static std::optional<uint64_t> parse_address(std::string_view text) {
    if (text.starts_with("0x") || text.starts_with("0X")) {
        text.remove_prefix(2);
    }
    uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, 16);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return {};
    }
    return value;
}

int run_cli(const int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    ksymtab_options_t options;

    CLI::App app{"Extract the kernel's function symbols, embed them in its reserved section and split its debug "
                 "information into a separate file."};
    app.option_defaults()->delimiter(',');

    string kernel;
    app.add_option("kernel", kernel, "Kernel binary location")->required()->type_name("KERNEL");

    uint64_t section_size = 0;
    app.add_option("section_size", section_size, "Size of the code section reserved for the kernel symbol table")
        ->required()
        ->type_name("BYTES")
        ->check(CLI::PositiveNumber);

    app.add_option("--section", options.section_name, "Section receiving the symbol table")
        ->type_name("NAME")
        ->capture_default_str()
        ->group("Layout");
    app.add_option("--code-start", options.code_start_symbol, "Symbol marking the start of the kernel code")
        ->type_name("NAME")
        ->capture_default_str()
        ->group("Layout");
    app.add_option("--code-end", options.code_end_symbol, "Symbol marking the end of the kernel code")
        ->type_name("NAME")
        ->capture_default_str()
        ->group("Layout");

    app.add_option("--nm", options.nm_program, "Symbol dump program")
        ->type_name("PROG")
        ->capture_default_str()
        ->group("Tools");
    app.add_option("--objcopy", options.objcopy_program, "Object editing program")
        ->type_name("PROG")
        ->capture_default_str()
        ->group("Tools");
    string lister = "nm";
    app.add_option("--lister", lister, "Where the symbol listing comes from")
        ->type_name("KIND")
        ->capture_default_str()
        ->check(CLI::IsMember({"nm", "elf"}))
        ->group("Tools");

    app.add_flag("--rollback,!--no-rollback", options.rollback,
                 "Restore the kernel when a patch step fails. Without it, a failure may leave the kernel stripped "
                 "but not patched. Default: enabled")
        ->group("Features");
    app.add_flag("--strict,-s", options.strict, "Fail when the code start symbol is not the first table entry")
        ->group("Features");

    vector<string> resolve;
    app.add_option("--resolve", resolve, "Resolve addresses against the generated table")
        ->type_name("ADDR")
        ->group("Verbosity");
    app.add_flag("--print-table", options.verbosity_opts.print_table, "Print the generated symbol table")
        ->group("Verbosity");
    app.add_flag("-v", options.verbosity_opts.print_commands, "Print external commands")->group("Verbosity");

    std::set<string> log_tags;
    app.add_option("--log", log_tags, "Enable debug logs")
        ->type_name("TAGS")
        ->check(CLI::IsMember({"lister", "filter", "codec", "patch"}))
        ->group("Verbosity");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e, out, err);
    }

    options.lister = lister_kinds.at(lister);
    for (const auto& tag : log_tags) {
        KsymEnableLog(tag);
    }

    vector<uint64_t> addresses;
    for (const auto& text : resolve) {
        const auto address = parse_address(text);
        if (!address) {
            err << "error: invalid address '" << text << "'" << std::endl;
            return 1;
        }
        addresses.push_back(*address);
    }

    SubprocessRunner runner{options.verbosity_opts.print_commands ? &out : nullptr};
    const auto symbol_lister = make_symbol_lister(options, runner);
    ObjcopyEditor editor{runner, options.objcopy_program};

    try {
        const RunReport report = run_pipeline(kernel, section_size, options, {*symbol_lister, editor}, out);

        if (options.verbosity_opts.print_table) {
            print_symbol_table(out, read_symbol_table(report.map_file));
        }
        for (const uint64_t address : addresses) {
            print_resolution(out, address, lookup_symbol(report.table, address));
        }
    } catch (const std::exception& e) {
        err << "error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

} // namespace ksymtab
