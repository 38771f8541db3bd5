// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#include <memory>
#include <string>

#include "errors.hpp"
#include "io/symbol_lister.hpp"
#include "utils/debug.hpp"

namespace ksymtab {

SymbolListing split_lines(const std::string& text) {
    SymbolListing lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") != std::string::npos) {
            lines.push_back(std::move(line));
        }
        start = end + 1;
    }
    return lines;
}

SymbolListing NmSymbolLister::list(const std::filesystem::path& binary) {
    const CommandLine command{program_, "-n", binary.string()};
    CapturedOutput result;
    try {
        result = runner_.capture(command);
    } catch (const CommandLaunchError& e) {
        throw ExtractionError("Unable to dump symbols from " + binary.string() + ": " + e.what());
    }
    if (result.status != 0) {
        throw ExtractionError("Unable to dump symbols from " + binary.string() + ": '" + to_string(command) +
                              "' exited with status " + std::to_string(result.status));
    }

    SymbolListing lines = split_lines(result.output);
    if (lines.empty()) {
        throw ExtractionError("Unable to dump symbols from " + binary.string());
    }
    KSYM_LOG("lister", std::cout << program_ << " listed " << lines.size() << " symbols\n");
    return lines;
}

std::unique_ptr<SymbolLister> make_symbol_lister(const ksymtab_options_t& options, CommandRunner& runner) {
    switch (options.lister) {
    case ListerKind::nm: return std::make_unique<NmSymbolLister>(runner, options.nm_program);
    case ListerKind::elf: return std::make_unique<ElfSymbolLister>();
    }
    KSYM_ERROR("unknown symbol lister kind ", static_cast<int>(options.lister));
}

} // namespace ksymtab
