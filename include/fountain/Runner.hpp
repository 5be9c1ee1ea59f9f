//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/fountain/Runner.hpp
// Purpose: Declare the embedding facade that compiles and runs Fountain
//          source without exposing parser or interpreter internals.
// Invariants: One Runner owns one interpreter; globals defined by earlier
//             runs stay visible to later ones.
// Ownership: Runner owns its interpreter and source manager. Streams named in
//            RunConfig are borrowed and must outlive the runner.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/fountain/Options.hpp"
#include "interp/Function.hpp"
#include "interp/InterpOptions.hpp"
#include "interp/RuntimeError.hpp"
#include "interp/Value.hpp"
#include "support/diagnostics.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fountain
{

/// @brief Configuration for a Runner.
struct RunConfig
{
    frontends::fountain::FrontendOptions frontend; ///< Parsing and AST dump options.
    interp::InterpreterOptions interpreter;        ///< Evaluator limits and tracing.
    std::ostream *output = nullptr;      ///< `print` and AST dump sink; std::cout when null.
    std::ostream *traceOutput = nullptr; ///< Trace sink; std::cerr when null.
    bool standardBuiltins = true;        ///< Install clock, len, str and type.
};

/// @brief Outcome of one Runner::run call.
/// @details `lastValue` and `error->payload` may reference heap tables and
///          functions. The runner keeps those objects alive until its next
///          run() call; after that they may be collected, so hosts that need
///          a value longer must bind it to a global first.
struct RunResult
{
    enum class Status
    {
        Ok,           ///< Program ran to completion (or was dumped).
        CompileError, ///< Lexing, parsing or resolving failed; nothing ran.
        RuntimeError, ///< Execution started and failed.
    };

    Status status = Status::Ok;
    std::vector<support::Diagnostic> diagnostics; ///< Compile-time diagnostics.
    std::optional<interp::FountainError> error;   ///< First failure, if any.
    interp::Value lastValue; ///< Last top-level expression statement value.

    [[nodiscard]] bool ok() const
    {
        return status == Status::Ok;
    }
};

/// @brief Compiles and executes Fountain source against persistent state.
class Runner
{
  public:
    explicit Runner(RunConfig config = {});
    ~Runner();

    Runner(const Runner &) = delete;
    Runner &operator=(const Runner &) = delete;
    Runner(Runner &&) noexcept;
    Runner &operator=(Runner &&) noexcept;

    /// @brief Lex, parse, resolve and execute @p source.
    /// @param path Name used in diagnostics; pseudo-paths such as "<stdin>"
    ///        are kept verbatim.
    RunResult run(std::string source, std::string path = "<input>");

    /// @brief Expose a host function to Fountain code as a global.
    /// @param arity Required positional argument count, or interp::kVariadic.
    void registerBuiltin(const std::string &name,
                         interp::BuiltinFn fn,
                         int arity = interp::kVariadic);

    /// @brief Print the diagnostics of the most recent run as
    ///        `path:line:col: error[CODE]: message`.
    void printDiagnostics(std::ostream &os) const;

    /// @brief Render a runtime error as `path:line:col: error: Kind: message`.
    [[nodiscard]] std::string describe(const interp::FountainError &error) const;

    /// @brief Force a garbage collection; returns the number of freed objects.
    size_t collectGarbage();

    /// @brief Number of live heap objects.
    [[nodiscard]] size_t liveObjectCount() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fountain
