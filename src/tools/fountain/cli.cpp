//===----------------------------------------------------------------------===//
//
// Part of the Fountain project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements argument parsing, script execution and the REPL for the
///        `fountain` tool.

#include "tools/fountain/cli.hpp"

#include "fountain/Runner.hpp"
#include "tools/common/source_loader.hpp"

#include <charconv>
#include <istream>
#include <ostream>
#include <string_view>
#include <system_error>
#include <utility>

namespace fountain::tools
{

using fountain::support::Diagnostic;
using fountain::support::Expected;
using fountain::support::Severity;

namespace
{

constexpr std::string_view kPrompt = "> ";

Diagnostic usageError(std::string message)
{
    return Diagnostic{Severity::Error, std::move(message), {}, {}};
}

/// @brief Claim the single input slot, rejecting a second input.
bool setInput(CliConfig &config, InputMode mode)
{
    if (config.mode != InputMode::Repl)
        return false;
    config.mode = mode;
    return true;
}

RunConfig makeRunConfig(const CliConfig &config, std::ostream &out, std::ostream &err)
{
    RunConfig run;
    run.frontend.dumpAst = config.dumpAst;
    run.interpreter.trace = config.trace;
    if (config.maxDepth != 0)
        run.interpreter.maxCallDepth = config.maxDepth;
    run.output = &out;
    run.traceOutput = &err;
    return run;
}

int exitCodeFor(const RunResult &result)
{
    switch (result.status)
    {
        case RunResult::Status::Ok:
            return kExitOk;
        case RunResult::Status::CompileError:
            return kExitCompileError;
        case RunResult::Status::RuntimeError:
            return kExitRuntimeError;
    }
    return kExitRuntimeError;
}

/// @brief Report the failure carried by @p result, if any.
void reportFailure(const Runner &runner, const RunResult &result, std::ostream &err)
{
    if (result.status == RunResult::Status::CompileError)
        runner.printDiagnostics(err);
    else if (result.status == RunResult::Status::RuntimeError && result.error)
        err << runner.describe(*result.error) << '\n';
}

int runSource(const CliConfig &config,
              std::string source,
              std::string path,
              std::ostream &out,
              std::ostream &err)
{
    Runner runner(makeRunConfig(config, out, err));
    RunResult result = runner.run(std::move(source), std::move(path));
    reportFailure(runner, result, err);
    out.flush();
    return exitCodeFor(result);
}

int runRepl(const CliConfig &config, std::istream &in, std::ostream &out, std::ostream &err)
{
    Runner runner(makeRunConfig(config, out, err));
    std::string line;
    for (;;)
    {
        out << kPrompt << std::flush;
        if (!std::getline(in, line))
            break;
        if (line.empty())
            continue;

        RunResult result = runner.run(line, "<stdin>");
        reportFailure(runner, result, err);
        if (result.ok() && !result.lastValue.isNil())
            out << interp::toReprString(result.lastValue) << '\n';
    }
    out << '\n';
    return kExitOk;
}

} // namespace

Expected<CliConfig> parseArgs(int argc, char **argv)
{
    CliConfig config;
    for (int i = 0; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help")
        {
            config.showHelp = true;
        }
        else if (arg == "--dump-ast")
        {
            config.dumpAst = true;
        }
        else if (arg == "--trace")
        {
            config.trace = true;
        }
        else if (arg == "--max-depth")
        {
            if (i + 1 >= argc)
                return usageError("--max-depth requires a value");
            std::string_view text = argv[++i];
            size_t depth = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), depth);
            if (ec != std::errc() || ptr != text.data() + text.size() || depth == 0)
                return usageError("invalid --max-depth value '" + std::string(text) + "'");
            config.maxDepth = depth;
        }
        else if (arg == "-c")
        {
            if (i + 1 >= argc)
                return usageError("-c requires a command");
            if (!setInput(config, InputMode::Command))
                return usageError("only one program input may be given");
            config.command = argv[++i];
        }
        else if (arg == "-")
        {
            if (!setInput(config, InputMode::Stdin))
                return usageError("only one program input may be given");
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            return usageError("unknown option '" + std::string(arg) + "'");
        }
        else
        {
            if (!setInput(config, InputMode::File))
                return usageError("only one program input may be given");
            config.sourcePath = std::string(arg);
        }
    }
    return config;
}

int runCli(const CliConfig &config, std::istream &in, std::ostream &out, std::ostream &err)
{
    if (config.showHelp)
    {
        printUsage(out);
        return kExitOk;
    }

    switch (config.mode)
    {
        case InputMode::Repl:
            return runRepl(config, in, out, err);
        case InputMode::Command:
            return runSource(config, config.command, "<string>", out, err);
        case InputMode::Stdin:
        {
            auto source = common::loadSourceStream(in, "<stdin>");
            if (!source)
            {
                support::printDiag(source.error(), err);
                return kExitUsage;
            }
            return runSource(config, std::move(source.value()), "<stdin>", out, err);
        }
        case InputMode::File:
        {
            auto source = common::loadSourceFile(config.sourcePath);
            if (!source)
            {
                support::printDiag(source.error(), err);
                return kExitUsage;
            }
            return runSource(config, std::move(source.value()), config.sourcePath, out, err);
        }
    }
    return kExitUsage;
}

void printUsage(std::ostream &os)
{
    os << "Usage: fountain [options] [-c CMD | FILE | -]\n"
       << "\n"
       << "With no program input, starts an interactive prompt.\n"
       << "\n"
       << "Options:\n"
       << "  -c CMD          Run CMD as the program\n"
       << "  -               Read the program from standard input\n"
       << "  --dump-ast      Print the syntax tree instead of running\n"
       << "  --max-depth N   Limit function call nesting to N (default 1000)\n"
       << "  --trace         Log each executed statement to stderr\n"
       << "  -h, --help      Show this message\n"
       << "\n"
       << "Exit status: 0 success, 1 usage or I/O error, 65 compile error,\n"
       << "70 runtime error.\n";
}

} // namespace fountain::tools
