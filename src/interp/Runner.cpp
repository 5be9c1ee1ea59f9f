//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Runner.cpp
// Purpose: Implement the public Runner facade over the frontend and the
//          tree-walking interpreter.
// Key invariants: Nothing executes unless lexing, parsing and resolving all
//                 succeeded. Runtime failures are returned, never rethrown.
// Ownership/Lifetime: Runner::Impl owns the interpreter, the source manager
//                     and the diagnostics of the latest run.
//
//===----------------------------------------------------------------------===//

#include "fountain/Runner.hpp"

#include "frontends/fountain/AstPrinter.hpp"
#include "frontends/fountain/Lexer.hpp"
#include "frontends/fountain/Parser.hpp"
#include "frontends/fountain/Resolver.hpp"
#include "interp/Builtins.hpp"
#include "interp/Interpreter.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <iostream>
#include <sstream>
#include <utility>

namespace fountain
{

using namespace fountain::frontends::fountain;
using fountain::interp::ErrorKind;
using fountain::interp::FountainError;

namespace
{

/// @brief Map a compile-time diagnostic code onto the language error kind.
ErrorKind errorKindForCode(const std::string &code)
{
    if (code == "F1000")
        return ErrorKind::LexError;
    if (code == "F2100")
        return ErrorKind::ControlFlowError;
    return ErrorKind::ParseError;
}

} // namespace

/// @brief Private state behind Runner.
class Runner::Impl
{
  public:
    explicit Impl(RunConfig cfg) : config(std::move(cfg)), interpreter(config.interpreter)
    {
        if (config.output)
            interpreter.setOutput(*config.output);
        if (config.traceOutput)
            interpreter.setTraceOutput(*config.traceOutput);
        if (config.standardBuiltins)
            interp::installStandardBuiltins(interpreter);
    }

    RunResult run(std::string source, std::string path)
    {
        diag.clear();
        RunResult result;

        const uint32_t fileId = sm.addFile(std::move(path));
        if (fileId == 0)
        {
            diag.report(support::makeError({}, std::string{support::kSourceManagerFileIdOverflowMessage}));
            return compileFailure(std::move(result));
        }

        Lexer lexer(std::move(source), fileId, diag);
        Parser parser(lexer, diag);
        ProgramPtr program = parser.parseProgram();
        if (!program)
            return compileFailure(std::move(result));

        if (config.frontend.resolve)
        {
            Resolver resolver(diag);
            if (!resolver.resolve(*program))
                return compileFailure(std::move(result));
        }

        if (config.frontend.dumpAst)
        {
            AstPrinter printer;
            output() << printer.dump(*program);
            result.diagnostics = diag.diagnostics();
            return result;
        }

        try
        {
            interpreter.execute(std::move(program));
            result.lastValue = interpreter.lastValue();
        }
        catch (const interp::RuntimeError &err)
        {
            result.status = RunResult::Status::RuntimeError;
            result.error = err.toError();
        }
        result.diagnostics = diag.diagnostics();
        return result;
    }

    std::string describe(const FountainError &error) const
    {
        support::Diagnostic d{support::Severity::Error,
                              std::string(interp::toString(error.kind)) + ": " + error.message,
                              error.loc,
                              {}};
        std::ostringstream os;
        support::printDiag(d, os, &sm);
        std::string text = os.str();
        if (!text.empty() && text.back() == '\n')
            text.pop_back();
        return text;
    }

    std::ostream &output()
    {
        return config.output ? *config.output : std::cout;
    }

    RunConfig config;
    support::SourceManager sm;
    support::DiagnosticEngine diag;
    interp::Interpreter interpreter;

  private:
    RunResult compileFailure(RunResult result)
    {
        result.status = RunResult::Status::CompileError;
        result.diagnostics = diag.diagnostics();
        for (const auto &d : result.diagnostics)
        {
            if (d.severity != support::Severity::Error)
                continue;
            result.error = FountainError{errorKindForCode(d.code), d.message, d.loc, {}};
            break;
        }
        return result;
    }
};

Runner::Runner(RunConfig config) : impl_(std::make_unique<Impl>(std::move(config))) {}

Runner::~Runner() = default;

Runner::Runner(Runner &&) noexcept = default;

Runner &Runner::operator=(Runner &&) noexcept = default;

RunResult Runner::run(std::string source, std::string path)
{
    return impl_->run(std::move(source), std::move(path));
}

void Runner::registerBuiltin(const std::string &name, interp::BuiltinFn fn, int arity)
{
    impl_->interpreter.defineBuiltin(name, arity, std::move(fn));
}

void Runner::printDiagnostics(std::ostream &os) const
{
    impl_->diag.printAll(os, &impl_->sm);
}

std::string Runner::describe(const FountainError &error) const
{
    return impl_->describe(error);
}

size_t Runner::collectGarbage()
{
    return impl_->interpreter.collectGarbage();
}

size_t Runner::liveObjectCount() const
{
    return impl_->interpreter.liveObjectCount();
}

} // namespace fountain
