//===----------------------------------------------------------------------===//
//
// Part of the codeintel project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `codeintel-probe` executable.
///
/// The probe runs one code-intelligence tool call through a fresh server
/// manager and prints the rendered output. It is the manual counterpart of
/// the unit tests: point it at a workspace with real language servers
/// installed.
///
//===----------------------------------------------------------------------===//

#include "codeintel/LSP/ServerConfig.h"
#include "codeintel/LSP/ServerManager.h"
#include "codeintel/LSP/ToolHandlers.h"
#include "codeintel/Version.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace
{

constexpr int ExitSuccess     = 0;
constexpr int ExitToolFailure = 1;
constexpr int ExitUsage       = 2;

void printUsage()
{
    llvm::errs() << "Usage: codeintel-probe [--workspace <dir>] [--config <catalog.json>] [--timeout-ms N] "
                    "[--verbose] <tool-name> '<json-args>'\n"
                 << "       codeintel-probe --list | --version | --help\n";
}

void printHelp()
{
    printUsage();
    llvm::errs() << "\nTOOLS\n";
    for (const llvm::StringRef name : codeintel::lsp::toolNames())
    {
        llvm::errs() << "  " << name << "\n";
    }
    llvm::errs() << "\nOPTIONS\n"
                 << "  --workspace <dir>      Workspace root (default: current directory).\n"
                 << "  --config <file>        Server catalog {\"servers\": [...]} merged over the defaults.\n"
                 << "  --timeout-ms <N>       Per-request timeout in milliseconds.\n"
                 << "  --verbose              Log protocol traffic to stderr.\n"
                 << "  --list                 Print the effective server catalog and exit.\n";
}

void printCatalog(const std::vector<codeintel::lsp::ServerConfig>& configs)
{
    for (const auto& config : configs)
    {
        llvm::outs() << config.language << ": " << config.command;
        for (const std::string& arg : config.args)
        {
            llvm::outs() << " " << arg;
        }
        llvm::outs() << "  [";
        bool first = true;
        for (const std::string& extension : config.fileExtensions)
        {
            llvm::outs() << (first ? "" : " ") << "." << extension;
            first = false;
        }
        llvm::outs() << "]\n";
    }
}

}  // namespace

int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    std::string                    workspace = ".";
    std::string                    configPath;
    codeintel::lsp::ManagerOptions options;
    bool                           listOnly = false;
    std::vector<llvm::StringRef>   positional;

    for (int i = 1; i < argc; ++i)
    {
        const llvm::StringRef arg(argv[i]);
        if (arg == "--version" || arg == "-V")
        {
            llvm::outs() << "codeintel-probe " << codeintel::kVersionString << "\n";
            return ExitSuccess;
        }
        if (arg == "--help" || arg == "-h")
        {
            printHelp();
            return ExitSuccess;
        }
        if (arg == "--list")
        {
            listOnly = true;
            continue;
        }
        if (arg == "--verbose" || arg == "-v")
        {
            options.traceLevel = codeintel::lsp::TraceLevel::Verbose;
            continue;
        }
        if (arg == "--workspace" || arg == "--config" || arg == "--timeout-ms")
        {
            if (i + 1 >= argc)
            {
                llvm::errs() << "codeintel-probe: " << arg << " requires a value\n";
                printUsage();
                return ExitUsage;
            }
            const llvm::StringRef value(argv[++i]);
            if (arg == "--workspace")
            {
                workspace = value.str();
            }
            else if (arg == "--config")
            {
                configPath = value.str();
            }
            else
            {
                std::uint64_t millis = 0;
                if (value.getAsInteger(10, millis) || millis == 0)
                {
                    llvm::errs() << "codeintel-probe: invalid --timeout-ms value '" << value << "'\n";
                    return ExitUsage;
                }
                options.requestTimeout = std::chrono::milliseconds(millis);
            }
            continue;
        }
        if (arg.size() > 1 && arg.front() == '-')
        {
            llvm::errs() << "codeintel-probe: unknown option '" << arg << "'\n";
            printUsage();
            return ExitUsage;
        }
        positional.push_back(arg);
    }

    std::vector<codeintel::lsp::ServerConfig> configs = codeintel::lsp::defaultServerConfigs();
    if (!configPath.empty())
    {
        auto overrides = codeintel::lsp::loadServerCatalogFile(configPath);
        if (!overrides)
        {
            llvm::errs() << "codeintel-probe: " << llvm::toString(overrides.takeError()) << "\n";
            return ExitUsage;
        }
        configs = codeintel::lsp::mergeServerCatalogs(std::move(configs), *overrides);
    }

    if (listOnly)
    {
        printCatalog(configs);
        return ExitSuccess;
    }

    if (positional.size() != 2U)
    {
        printUsage();
        return ExitUsage;
    }

    auto args = llvm::json::parse(positional[1]);
    if (!args)
    {
        llvm::errs() << "codeintel-probe: tool arguments are not valid JSON: " << llvm::toString(args.takeError())
                     << "\n";
        return ExitUsage;
    }

    codeintel::lsp::ServerManager    manager(workspace, std::move(configs), options);
    const codeintel::lsp::ToolOutput output = codeintel::lsp::dispatchToolCall(positional[0], *args, manager);
    manager.shutdownAll();

    if (output.success)
    {
        llvm::outs() << output.content << "\n";
        return ExitSuccess;
    }
    llvm::errs() << output.content << "\n";
    return ExitToolFailure;
}
