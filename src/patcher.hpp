// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "errors.hpp"
#include "io/command_runner.hpp"

namespace ksymtab {

/// Edits the kernel image. Each operation throws PatchStepFailure when it fails.
class BinaryEditor {
  public:
    virtual ~BinaryEditor() = default;

    /// Copy the debug sections of `binary` into a new file.
    virtual void extract_debug_info(const std::filesystem::path& binary, const std::filesystem::path& debug_file) = 0;

    /// Remove the debug sections from `binary`, in place.
    virtual void strip_debug_info(const std::filesystem::path& binary) = 0;

    /// Replace the raw bytes of an existing section with the content of `contents`.
    virtual void update_section(const std::filesystem::path& binary, const std::string& section,
                                const std::filesystem::path& contents) = 0;

    /// Record a link to the split debug file inside `binary`.
    virtual void add_debug_link(const std::filesystem::path& binary, const std::filesystem::path& debug_file) = 0;
};

/// BinaryEditor driving GNU objcopy.
class ObjcopyEditor final : public BinaryEditor {
    CommandRunner& runner_;
    std::string program_;

    void execute(PatchStep step, const CommandLine& command);

  public:
    ObjcopyEditor(CommandRunner& runner, std::string program) : runner_{runner}, program_{std::move(program)} {}

    void extract_debug_info(const std::filesystem::path& binary, const std::filesystem::path& debug_file) override;
    void strip_debug_info(const std::filesystem::path& binary) override;
    void update_section(const std::filesystem::path& binary, const std::string& section,
                        const std::filesystem::path& contents) override;
    void add_debug_link(const std::filesystem::path& binary, const std::filesystem::path& debug_file) override;
};

/// @throws CapacityExceeded if `blob_size` > `section_size`.
void check_capacity(uint64_t blob_size, uint64_t section_size);

/// `<dir>/<stem>.sym` for a kernel at `<dir>/<stem>.<ext>`.
std::filesystem::path debug_file_path(const std::filesystem::path& kernel);

/// @brief Restores the kernel image if the patch sequence does not complete.
///
/// Construction copies the kernel next to itself. Unless commit() is called,
/// destruction moves the copy back over the kernel and deletes the split
/// debug file.
class RollbackGuard {
    std::filesystem::path kernel_;
    std::filesystem::path backup_;
    std::filesystem::path debug_file_;
    bool committed_{};

  public:
    RollbackGuard(std::filesystem::path kernel, std::filesystem::path debug_file);
    ~RollbackGuard();

    RollbackGuard(const RollbackGuard&) = delete;
    RollbackGuard& operator=(const RollbackGuard&) = delete;

    void commit();
};

struct PatchPlan {
    std::filesystem::path kernel;
    std::filesystem::path debug_file;
    std::filesystem::path table_file;
    std::string section_name;
};

/**
 * @brief Split the debug information out of the kernel and embed the symbol table.
 *
 * Steps, each aborting the sequence on failure:
 *  1. copy the debug sections to plan.debug_file
 *  2. strip the debug sections from the kernel
 *  3. overwrite plan.section_name with the content of plan.table_file
 *  4. add a debug link to plan.debug_file
 *
 * Without rollback, a failure in steps 2 to 4 leaves the kernel in an
 * intermediate state (stripped but not patched).
 */
void patch_kernel(BinaryEditor& editor, const PatchPlan& plan, bool rollback);

} // namespace ksymtab
