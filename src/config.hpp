// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <string>

namespace ksymtab {

enum class ListerKind { nm, elf };

struct verbosity_options_t {
    /// Echo every external command before running it.
    bool print_commands = false;

    /// Print the decoded symbol table after the map file is written.
    bool print_table = false;
};

struct ksymtab_options_t {
    /// Section of the kernel image reserved for the encoded symbol table.
    std::string section_name = ".kernel_symbols";

    /// Linker-script symbols delimiting the kernel's executable code.
    std::string code_start_symbol = "_kernel_code_start";
    std::string code_end_symbol = "_kernel_code_end";

    std::string nm_program = "nm";
    std::string objcopy_program = "objcopy";
    ListerKind lister = ListerKind::nm;

    /// Restore the kernel image when a patch step fails.
    bool rollback = true;

    /// Fail instead of warning when the code start sentinel is not the first entry.
    bool strict = false;

    verbosity_options_t verbosity_opts;
};

} // namespace ksymtab
