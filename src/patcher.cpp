// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

#include "patcher.hpp"
#include "utils/debug.hpp"

namespace fs = std::filesystem;

namespace ksymtab {

void ObjcopyEditor::execute(const PatchStep step, const CommandLine& command) {
    KSYM_LOG("patch", std::cout << to_string(step) << ": " << to_string(command) << "\n");
    int status = 0;
    try {
        status = runner_.run(command);
    } catch (const CommandLaunchError& e) {
        throw PatchStepFailure(step, to_string(command), -1, e.what());
    }
    if (status != 0) {
        throw PatchStepFailure(step, to_string(command), status);
    }
}

void ObjcopyEditor::extract_debug_info(const fs::path& binary, const fs::path& debug_file) {
    execute(PatchStep::extract_debug, {program_, "--only-keep-debug", binary.string(), debug_file.string()});
}

void ObjcopyEditor::strip_debug_info(const fs::path& binary) {
    execute(PatchStep::strip_debug, {program_, "--strip-debug", binary.string()});
}

void ObjcopyEditor::update_section(const fs::path& binary, const std::string& section, const fs::path& contents) {
    execute(PatchStep::update_section,
            {program_, "--update-section", section + "=" + contents.string(), binary.string()});
}

void ObjcopyEditor::add_debug_link(const fs::path& binary, const fs::path& debug_file) {
    execute(PatchStep::add_debug_link, {program_, "--add-gnu-debuglink=" + debug_file.string(), binary.string()});
}

void check_capacity(const uint64_t blob_size, const uint64_t section_size) {
    if (blob_size > section_size) {
        throw CapacityExceeded(blob_size, section_size);
    }
}

fs::path debug_file_path(const fs::path& kernel) { return kernel.parent_path() / (kernel.stem().string() + ".sym"); }

RollbackGuard::RollbackGuard(fs::path kernel, fs::path debug_file)
    : kernel_{std::move(kernel)}, debug_file_{std::move(debug_file)} {
    backup_ = kernel_;
    backup_ += ".ksymtab-backup";
    std::error_code ec;
    fs::copy_file(kernel_, backup_, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw KsymtabError("Failed to back up " + kernel_.string() + " to " + backup_.string() + ": " + ec.message());
    }
    KSYM_LOG("patch", std::cout << "backed up " << kernel_ << " to " << backup_ << "\n");
}

RollbackGuard::~RollbackGuard() {
    std::error_code ec;
    if (committed_) {
        fs::remove(backup_, ec);
        if (ec) {
            KSYM_WARN("could not remove backup ", backup_.string(), ": ", ec.message());
        }
        return;
    }

    fs::rename(backup_, kernel_, ec);
    if (ec) {
        KSYM_WARN("could not restore ", kernel_.string(), " from ", backup_.string(), ": ", ec.message());
        return;
    }
    fs::remove(debug_file_, ec);
    if (ec) {
        KSYM_WARN("could not remove ", debug_file_.string(), ": ", ec.message());
    }
    KSYM_LOG("patch", std::cout << "restored " << kernel_ << "\n");
}

void RollbackGuard::commit() { committed_ = true; }

void patch_kernel(BinaryEditor& editor, const PatchPlan& plan, const bool rollback) {
    editor.extract_debug_info(plan.kernel, plan.debug_file);

    std::optional<RollbackGuard> guard;
    if (rollback) {
        guard.emplace(plan.kernel, plan.debug_file);
    }

    editor.strip_debug_info(plan.kernel);
    editor.update_section(plan.kernel, plan.section_name, plan.table_file);
    editor.add_debug_link(plan.kernel, plan.debug_file);

    if (guard) {
        guard->commit();
    }
}

} // namespace ksymtab
