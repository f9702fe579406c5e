//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BuiltinTools.h
// Purpose: The fetch, echo and hello tools exposed by the server
//==========================================================================================================

#pragma once

#include <memory>

#include "ssehost/HTTPFetcher.hpp"
#include "ssehost/ToolRegistry.h"

namespace ssehost {
namespace tools {

// Descriptors, exposed for listing checks.
Tool FetchToolDescriptor();
Tool EchoToolDescriptor();
Tool HelloToolDescriptor();

//==========================================================================================================
// Registers fetch(url), echo(message) and hello(name = "World") in that order.
// The fetch handler keeps the fetcher alive for the registry's lifetime.
// Throws errors::DuplicateToolError if any of the names is already taken.
//==========================================================================================================
void RegisterBuiltinTools(ToolRegistry& registry, std::shared_ptr<HTTPFetcher> fetcher);

} // namespace tools
} // namespace ssehost
