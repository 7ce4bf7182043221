//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BuiltinCatalog.h
// Purpose: Default genome-browser tool set registered by mcpgw_server
//==========================================================================================================

#pragma once

#include "mcpgw/ToolCatalog.h"

namespace mcpgw {

//==========================================================================================================
// RegisterBuiltinTools
// Purpose: Registers the genome-browser descriptors (navigation, search, sequence, track, annotation,
//          analysis, export). All of them are ClientSide except the pure sequence utilities
//          (reverse_complement, compute_gc_content), which run in-process.
// Throws:
//   std::invalid_argument when a name is already registered in catalog.
//==========================================================================================================
void RegisterBuiltinTools(ToolCatalog& catalog);

// Fresh catalog holding only the builtin tools.
ToolCatalog MakeBuiltinCatalog();

} // namespace mcpgw
