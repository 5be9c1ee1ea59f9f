//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Options.hpp
/// @brief Frontend options for the Fountain pipeline.
///
//===----------------------------------------------------------------------===//

#pragma once

namespace fountain::frontends::fountain
{

/// @brief Options controlling how source is turned into a checked program.
struct FrontendOptions
{
    /// @brief Print the AST instead of executing it.
    bool dumpAst{false};

    /// @brief Run the control-flow resolver after parsing.
    /// @details Disabling it leaves misplaced break/continue to the runtime
    ///          guards, which raise the same error kind. A top-level return
    ///          then ends the program.
    bool resolve{true};
};

} // namespace fountain::frontends::fountain
