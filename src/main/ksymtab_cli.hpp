// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <ostream>

namespace ksymtab {

/// Parse the command line and run the whole tool.
/// @return 0 on success, 1 on any fatal error, CLI11's code on a usage error.
int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace ksymtab
