//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StandardActions.h
// Purpose: Binds the full action catalog to the tool implementations and the collaborator
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "toolgate/ActionRegistry.h"
#include "toolgate/Collaborator.h"
#include "toolgate/tools/CommandRunner.h"
#include "toolgate/tools/FileMutator.h"

namespace toolgate {

// Shared services the handlers run against. All members must be non-null.
struct ToolContext {
    std::shared_ptr<tools::FileMutator> files;
    std::shared_ptr<tools::CommandRunner> commands;
    std::shared_ptr<ICollaborator> collaborator;
};

//==========================================================================================================
// RegisterStandardActions
// Purpose: Registers every Action with its schema, handler and failure message. Does not seal.
// Throws:
//   std::invalid_argument when a ToolContext member is null; std::logic_error from the registry.
//==========================================================================================================
void RegisterStandardActions(ActionRegistry& registry, const ToolContext& context);

// Test framework used by generate_tests when none is given (python -> pytest, java -> junit, ...).
std::string DefaultTestFramework(const std::string& language);

} // namespace toolgate
