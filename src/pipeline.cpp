// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#include <filesystem>
#include <string>
#include <system_error>

#include "errors.hpp"
#include "pipeline.hpp"
#include "symbol_filter.hpp"
#include "symbol_table_codec.hpp"
#include "utils/debug.hpp"

namespace fs = std::filesystem;

namespace ksymtab {

static void require_kernel(const fs::path& kernel) {
    std::error_code ec;
    if (!fs::exists(kernel, ec)) {
        throw MissingInput("No such file or directory '" + kernel.string() + "'");
    }
}

// The derived outputs are written before and during patching, so neither may name the kernel.
static void require_distinct_output(const fs::path& kernel, const fs::path& output) {
    std::error_code ec;
    const fs::path kernel_path = fs::weakly_canonical(kernel, ec);
    if (ec) {
        throw KsymtabError("Failed to resolve " + kernel.string() + ": " + ec.message());
    }
    const fs::path output_path = fs::weakly_canonical(output, ec);
    if (ec) {
        throw KsymtabError("Failed to resolve " + output.string() + ": " + ec.message());
    }
    // equivalent() fails with `ec` set while the output does not exist yet.
    if (kernel_path == output_path || fs::equivalent(kernel, output, ec)) {
        throw KsymtabError("Output file " + output.string() + " would overwrite the kernel " + kernel.string());
    }
}

RunReport run_pipeline(const fs::path& kernel, const uint64_t section_size, const ksymtab_options_t& options,
                       const Toolchain toolchain, std::ostream& out) {
    require_kernel(kernel);
    require_distinct_output(kernel, map_file_path(kernel));
    require_distinct_output(kernel, debug_file_path(kernel));
    const CodeSentinels sentinels = CodeSentinels::from(options);

    RunReport report;
    report.section_size = section_size;

    out << "Extracting symbol table from " << kernel.string() << std::endl;
    const SymbolListing listing = toolchain.lister.list(kernel);
    report.table = build_symbol_table(listing, sentinels);

    report.sentinel_divergence = check_sentinel_order(report.table, sentinels);
    if (report.sentinel_divergence) {
        if (options.strict) {
            throw ExtractionError("Unexpected symbol order: " + *report.sentinel_divergence);
        }
        KSYM_WARN(*report.sentinel_divergence);
    }

    report.map_file = map_file_path(kernel);
    write_symbol_table(report.table, report.map_file);
    out << "Saved " << report.table.size() << " kernel function symbols inside " << report.map_file.string()
        << std::endl;

    std::error_code ec;
    report.table_size = fs::file_size(report.map_file, ec);
    if (ec) {
        throw KsymtabError("Failed to stat " + report.map_file.string() + ": " + ec.message());
    }
    check_capacity(report.table_size, section_size);

    report.debug_file = debug_file_path(kernel);
    out << "Generating debug and stripped binary files" << std::endl;
    patch_kernel(toolchain.editor,
                 PatchPlan{
                     .kernel = kernel,
                     .debug_file = report.debug_file,
                     .table_file = report.map_file,
                     .section_name = options.section_name,
                 },
                 options.rollback);

    return report;
}

} // namespace ksymtab
