//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/fountain/cli.hpp
// Purpose: Command-line parsing and dispatch for the `fountain` tool.
// Key invariants: parseArgs never exits the process; runCli maps every
//                 outcome onto one of the documented exit codes.
// Ownership/Lifetime: Streams passed to runCli are borrowed for the call.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>

namespace fountain::tools
{

/// @name Process exit codes
/// @{
inline constexpr int kExitOk = 0;
inline constexpr int kExitUsage = 1;
inline constexpr int kExitCompileError = 65;
inline constexpr int kExitRuntimeError = 70;
/// @}

/// @brief Where the program text comes from.
enum class InputMode
{
    Repl,    ///< No input named: interactive prompt.
    Command, ///< `-c CMD`
    File,    ///< A path argument.
    Stdin,   ///< `-`
};

struct CliConfig
{
    InputMode mode = InputMode::Repl;
    std::string command;    ///< Source text for InputMode::Command.
    std::string sourcePath; ///< Path for InputMode::File.
    bool dumpAst = false;
    bool trace = false;
    size_t maxDepth = 0; ///< 0 keeps the interpreter default.
    bool showHelp = false;
};

/// @brief Parse argv (excluding argv[0]) into a configuration.
/// @return The configuration, or a diagnostic describing the usage error.
fountain::support::Expected<CliConfig> parseArgs(int argc, char **argv);

/// @brief Execute @p config.
/// @param in Source for `-` and for REPL lines.
/// @param out Receives program output, REPL prompts and echoed values.
/// @param err Receives diagnostics and runtime errors.
/// @return One of the kExit* codes.
int runCli(const CliConfig &config, std::istream &in, std::ostream &out, std::ostream &err);

/// @brief Print usage text to @p os.
void printUsage(std::ostream &os);

} // namespace fountain::tools
