// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ksymtab {

// Tagged debug output. Tags in use: "lister", "filter", "codec", "patch".
extern bool KsymLogFlag;
extern std::set<std::string> KsymLog;

#define KSYM_LOG(TAG, CODE)                                                                                            \
    do {                                                                                                               \
        if (::ksymtab::KsymLogFlag && ::ksymtab::KsymLog.contains(TAG)) {                                              \
            CODE;                                                                                                      \
        }                                                                                                              \
    } while (0)

void KsymEnableLog(const std::string& tag);

extern bool KsymWarningFlag;
void KsymEnableWarningMsg(bool b);

template <typename... ArgTypes>
void ksym_warn(const ArgTypes&... args) {
    std::ostringstream os;
    os << "WARNING: ";
    (os << ... << args);
    std::cerr << os.str() << std::endl;
}

template <typename... ArgTypes>
[[noreturn]]
void ksym_error(const char* file, const int line, const ArgTypes&... args) {
    std::ostringstream os;
    os << "ksymtab internal error (" << file << ":" << line << "): ";
    (os << ... << args);
    throw std::logic_error(os.str());
}

#define KSYM_WARN(...)                                                                                                 \
    do {                                                                                                               \
        if (::ksymtab::KsymWarningFlag) {                                                                              \
            ::ksymtab::ksym_warn(__VA_ARGS__);                                                                         \
        }                                                                                                              \
    } while (0)

#define KSYM_ERROR(...) ::ksymtab::ksym_error(__FILE__, __LINE__, __VA_ARGS__)

} // namespace ksymtab
