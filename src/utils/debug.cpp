// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#include "utils/debug.hpp"

namespace ksymtab {
bool KsymLogFlag = false;
std::set<std::string> KsymLog;

void KsymEnableLog(const std::string& tag) {
    KsymLogFlag = true;
    KsymLog.insert(tag);
}

bool KsymWarningFlag = true;
void KsymEnableWarningMsg(const bool b) { KsymWarningFlag = b; }

} // namespace ksymtab
