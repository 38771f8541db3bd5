// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>
#include <string>
#include <vector>

#include <gsl/narrow>

#include "errors.hpp"
#include "symbol_table_codec.hpp"
#include "utils/debug.hpp"

namespace ksymtab {

namespace {

constexpr uint64_t U32_MAX = std::numeric_limits<uint32_t>::max();

void put_u32(std::vector<std::byte>& out, const uint32_t value) {
    for (unsigned shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<std::byte>((value >> shift) & 0xffU));
    }
}

uint32_t get_u32(const std::span<const std::byte> blob, const size_t offset) {
    uint32_t value = 0;
    for (size_t i = 0; i < sizeof(uint32_t); ++i) {
        value |= std::to_integer<uint32_t>(blob[offset + i]) << (8U * i);
    }
    return value;
}

void validate(const Symbol& symbol, const size_t index) {
    if (symbol.name.empty()) {
        throw EncodingError("Symbol #" + std::to_string(index) + " has an empty name");
    }
    if (symbol.name.find('\0') != std::string::npos) {
        throw EncodingError("Symbol name '" + symbol.name.substr(0, symbol.name.find('\0')) +
                            "' contains a null byte");
    }
    if (symbol.address > U32_MAX) {
        throw EncodingError("Address of symbol '" + symbol.name + "' does not fit in 32 bits");
    }
    if (encoded_entry_size(symbol) > U32_MAX) {
        throw EncodingError("Symbol name '" + symbol.name.substr(0, 32) + "...' is too long");
    }
}

} // namespace

size_t encoded_entry_size(const Symbol& symbol) { return ENTRY_HEADER_SIZE + symbol.name.size() + 1; }

std::vector<std::byte> encode_symbol_table(const SymbolTable& table) {
    if (table.size() > U32_MAX) {
        throw EncodingError("Too many symbols: " + std::to_string(table.size()));
    }

    size_t total = TABLE_HEADER_SIZE;
    for (size_t i = 0; i < table.size(); ++i) {
        validate(table[i], i);
        total += encoded_entry_size(table[i]);
    }

    std::vector<std::byte> blob;
    blob.reserve(total);
    put_u32(blob, gsl::narrow<uint32_t>(table.size()));
    for (const auto& symbol : table) {
        put_u32(blob, gsl::narrow<uint32_t>(encoded_entry_size(symbol)));
        put_u32(blob, gsl::narrow<uint32_t>(symbol.address));
        const auto* name = reinterpret_cast<const std::byte*>(symbol.name.data());
        blob.insert(blob.end(), name, name + symbol.name.size());
        blob.push_back(std::byte{0});
    }
    KSYM_LOG("codec", std::cout << "encoded " << table.size() << " symbols in " << blob.size() << " bytes\n");
    return blob;
}

SymbolTable decode_symbol_table(const std::span<const std::byte> blob) {
    if (blob.size() < TABLE_HEADER_SIZE) {
        throw MalformedTable("Symbol table is " + std::to_string(blob.size()) + " bytes, too short for its header");
    }
    const uint32_t count = get_u32(blob, 0);

    SymbolTable table;
    size_t offset = TABLE_HEADER_SIZE;
    for (uint32_t i = 0; i < count; ++i) {
        if (blob.size() - offset < ENTRY_HEADER_SIZE) {
            throw MalformedTable("Symbol table truncated in entry #" + std::to_string(i));
        }
        const uint32_t size = get_u32(blob, offset);
        const uint32_t address = get_u32(blob, offset + sizeof(uint32_t));
        if (size < ENTRY_HEADER_SIZE + 1 || size > blob.size() - offset) {
            throw MalformedTable("Entry #" + std::to_string(i) + " has invalid size " + std::to_string(size));
        }
        const auto name_bytes = blob.subspan(offset + ENTRY_HEADER_SIZE, size - ENTRY_HEADER_SIZE);
        if (name_bytes.back() != std::byte{0}) {
            throw MalformedTable("Name of entry #" + std::to_string(i) + " is not null terminated");
        }
        std::string name(reinterpret_cast<const char*>(name_bytes.data()), name_bytes.size() - 1);
        if (name.empty() || name.find('\0') != std::string::npos) {
            throw MalformedTable("Entry #" + std::to_string(i) + " has an invalid name");
        }
        table.push_back(Symbol{address, std::move(name)});
        offset += size;
    }
    if (offset != blob.size()) {
        throw MalformedTable(std::to_string(blob.size() - offset) + " trailing bytes after " + std::to_string(count) +
                             " entries");
    }
    return table;
}

std::filesystem::path map_file_path(const std::filesystem::path& kernel) {
    return kernel.parent_path() / (kernel.stem().string() + ".map");
}

uint64_t write_symbol_table(const SymbolTable& table, const std::filesystem::path& path) {
    const std::vector<std::byte> blob = encode_symbol_table(table);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw KsymtabError("Failed to open " + path.string() + " for writing");
    }
    file.write(reinterpret_cast<const char*>(blob.data()), gsl::narrow<std::streamsize>(blob.size()));
    if (!file) {
        throw KsymtabError("Failed to write symbol table to " + path.string());
    }
    return blob.size();
}

SymbolTable read_symbol_table(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw KsymtabError("Failed to open symbol table " + path.string());
    }
    const std::vector<char> bytes{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    return decode_symbol_table(std::as_bytes(std::span{bytes}));
}

const Symbol* lookup_symbol(const SymbolTable& table, const uint64_t address) {
    if (table.empty()) {
        return nullptr;
    }
    const Symbol* symbol = &table.front();
    for (size_t i = 1; i < table.size(); ++i) {
        if (table[i].address > address) {
            break;
        }
        symbol = &table[i];
    }
    return symbol;
}

} // namespace ksymtab
