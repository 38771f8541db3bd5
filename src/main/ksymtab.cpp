// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#include <iostream>

#include "main/ksymtab_cli.hpp"

int main(const int argc, char** argv) { return ksymtab::run_cli(argc, argv, std::cout, std::cerr); }
