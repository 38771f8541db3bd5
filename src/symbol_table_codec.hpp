// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

#include "symbol.hpp"

namespace ksymtab {

/*
 * Layout of the encoded table, all integers 32-bit little endian:
 *
 *   u32 count
 *   count times:
 *     u32  size      sizeof(size) + sizeof(address) + strlen(name) + 1
 *     u32  address
 *     char name[]    null terminated
 */
constexpr size_t TABLE_HEADER_SIZE = sizeof(uint32_t);
constexpr size_t ENTRY_HEADER_SIZE = 2 * sizeof(uint32_t);

/// Encoded size of a single entry, header included.
[[nodiscard]]
size_t encoded_entry_size(const Symbol& symbol);

/// @throws EncodingError if the table cannot be represented.
std::vector<std::byte> encode_symbol_table(const SymbolTable& table);

/// @throws MalformedTable on truncated or inconsistent input.
SymbolTable decode_symbol_table(std::span<const std::byte> blob);

/// `<dir>/<stem>.map` for a kernel at `<dir>/<stem>.<ext>`.
std::filesystem::path map_file_path(const std::filesystem::path& kernel);

/// Encode the table and write it to `path`, replacing any previous file.
/// @return Number of bytes written.
uint64_t write_symbol_table(const SymbolTable& table, const std::filesystem::path& path);

SymbolTable read_symbol_table(const std::filesystem::path& path);

/// @brief Find the symbol an address belongs to, the way the kernel's panic handler does.
///
/// Walks the table from the first entry and stops before the first successor
/// lying above `address`.
///
/// @return The selected entry, or nullptr for an empty table.
const Symbol* lookup_symbol(const SymbolTable& table, uint64_t address);

} // namespace ksymtab
