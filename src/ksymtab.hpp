// Copyright (c) Ksymtab contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "io/command_runner.hpp"
#include "io/symbol_lister.hpp"
#include "patcher.hpp"
#include "pipeline.hpp"
#include "symbol.hpp"
#include "symbol_filter.hpp"
#include "symbol_table_codec.hpp"
