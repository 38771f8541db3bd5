// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <vector>

#include <elfio/elfio.hpp>

#include "errors.hpp"
#include "io/symbol_lister.hpp"
#include "utils/debug.hpp"

namespace ksymtab {

namespace {

struct symbol_details_t {
    std::string name;
    ELFIO::Elf64_Addr value{};
    ELFIO::Elf_Xword size{};
    unsigned char bind{};
    unsigned char type{};
    ELFIO::Elf_Half section_index{};
    unsigned char other{};
};

struct ListedElfSymbol {
    bool defined{};
    ELFIO::Elf64_Addr address{};
    char type_code{};
    std::string name;
};

symbol_details_t get_symbol_details(const ELFIO::const_symbol_section_accessor& symbols, const ELFIO::Elf_Xword index,
                                    const std::string& path) {
    symbol_details_t details;
    if (!symbols.get_symbol(index, details.name, details.value, details.size, details.bind, details.type,
                            details.section_index, details.other)) {
        throw ExtractionError("Invalid symbol index " + std::to_string(index) + " in " + path);
    }
    return details;
}

ELFIO::elfio load_elf(const std::string& path) {
    std::ifstream stream{path, std::ios::in | std::ios::binary};
    if (!stream) {
        struct stat st; // NOLINT(*-pro-type-member-init)
        if (stat(path.c_str(), &st)) {
            throw ExtractionError(std::string(strerror(errno)) + " opening " + path);
        }
        throw ExtractionError("Can't open ELF file " + path);
    }

    ELFIO::elfio reader;
    if (!reader.load(stream)) {
        throw ExtractionError("Can't process ELF file " + path);
    }
    return reader;
}

// Single letter classification used by nm.
char classify(const ELFIO::elfio& reader, const symbol_details_t& symbol) {
    const bool local = symbol.bind == ELFIO::STB_LOCAL;
    char code = '?';

    if (symbol.section_index == ELFIO::SHN_UNDEF) {
        return symbol.bind == ELFIO::STB_WEAK ? 'w' : 'U';
    }
    if (symbol.bind == ELFIO::STB_WEAK) {
        return symbol.type == ELFIO::STT_OBJECT ? 'V' : 'W';
    }
    if (symbol.section_index == ELFIO::SHN_ABS) {
        code = 'A';
    } else if (symbol.section_index == ELFIO::SHN_COMMON) {
        code = 'C';
    } else if (symbol.section_index < reader.sections.size()) {
        const ELFIO::section* section = reader.sections[symbol.section_index];
        const auto flags = section->get_flags();
        if (flags & ELFIO::SHF_EXECINSTR) {
            code = 'T';
        } else if (section->get_type() == ELFIO::SHT_NOBITS && (flags & ELFIO::SHF_WRITE)) {
            code = 'B';
        } else if (flags & ELFIO::SHF_WRITE) {
            code = 'D';
        } else if (flags & ELFIO::SHF_ALLOC) {
            code = 'R';
        } else {
            code = 'N';
        }
    }

    return local ? static_cast<char>(std::tolower(static_cast<unsigned char>(code))) : code;
}

std::string render(const ListedElfSymbol& symbol, const int width) {
    std::ostringstream os;
    if (symbol.defined) {
        os << std::hex << std::setfill('0') << std::setw(width) << symbol.address;
    } else {
        os << std::string(width, ' ');
    }
    os << ' ' << symbol.type_code << ' ' << symbol.name;
    return os.str();
}

} // namespace

SymbolListing ElfSymbolLister::list(const std::filesystem::path& binary) {
    const std::string path = binary.string();
    const ELFIO::elfio reader = load_elf(path);

    const ELFIO::section* symbol_section = reader.sections[".symtab"];
    if (!symbol_section) {
        throw ExtractionError("Unable to dump symbols from " + path + ": no symbol section");
    }
    const ELFIO::const_symbol_section_accessor symbols{reader, symbol_section};

    std::vector<ListedElfSymbol> listed;
    // Entry 0 is the reserved null symbol.
    for (ELFIO::Elf_Xword index = 1; index < symbols.get_symbols_num(); index++) {
        const auto details = get_symbol_details(symbols, index, path);
        if (details.name.empty() || details.type == ELFIO::STT_SECTION || details.type == ELFIO::STT_FILE) {
            continue;
        }
        listed.push_back(ListedElfSymbol{
            .defined = details.section_index != ELFIO::SHN_UNDEF,
            .address = details.value,
            .type_code = classify(reader, details),
            .name = details.name,
        });
    }

    // nm -n: undefined symbols first, then by address, ties by name.
    std::ranges::stable_sort(listed, [](const ListedElfSymbol& a, const ListedElfSymbol& b) {
        if (a.defined != b.defined) {
            return !a.defined;
        }
        if (a.address != b.address) {
            return a.address < b.address;
        }
        return a.name < b.name;
    });

    const int width = reader.get_class() == ELFIO::ELFCLASS64 ? 16 : 8;
    SymbolListing lines;
    lines.reserve(listed.size());
    for (const auto& symbol : listed) {
        lines.push_back(render(symbol, width));
    }

    if (lines.empty()) {
        throw ExtractionError("Unable to dump symbols from " + path);
    }
    KSYM_LOG("lister", std::cout << path << ": " << lines.size() << " symbols in .symtab\n");
    return lines;
}

} // namespace ksymtab
