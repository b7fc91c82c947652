//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `gofreeze` command-line tool.
///
/// `gofreeze generate` walks a directory tree, encodes every value document
/// it finds into a Go source file and writes an aggregate import file.
/// `gofreeze encode` prints the Go expression of a single document.
///
//===----------------------------------------------------------------------===//

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include "gofreeze/Driver/Generate.h"
#include "gofreeze/Driver/GenerateConfig.h"
#include "gofreeze/Frontend/ValueDocument.h"
#include "gofreeze/Support/Diagnostics.h"
#include "gofreeze/Version.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

namespace
{

bool isKnownCommand(llvm::StringRef command)
{
    return command == "generate" || command == "encode";
}

/// @brief Checks whether a token is a help switch.
bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: gofreeze <generate|encode> [options]\n"
                 << "Try: gofreeze --help\n";
}

/// @brief Prints the full help text.
void printHelp()
{
    llvm::errs()
        << "NAME\n"
        << "  gofreeze - freeze typed value documents into Go source\n\n"
        << "SYNOPSIS\n"
        << "  gofreeze generate [--pkg <import path>] [--root-dir <dir>] [options]\n"
        << "  gofreeze encode [--sort-map-keys] [--sized-arrays] [--no-cycle-check] <document>\n"
        << "  gofreeze --version\n\n"
        << "COMMANDS\n"
        << "  generate   Walk --root-dir depth-first. In every directory holding one value\n"
        << "             document, write a Go file declaring the frozen value and registering\n"
        << "             it from init(). Then write an import file that blank-imports every\n"
        << "             generated package.\n"
        << "  encode     Print the Go expression of one value document to stdout.\n\n"
        << "GENERATE OPTIONS\n"
        << "  --pkg <path>             Import path of the root package (required).\n"
        << "  --root-dir <dir>         Root of the walk (default: .).\n"
        << "  --import-file <file>     Import file relative to --root-dir (default: builtin_gen.go).\n"
        << "  --output-file <name>     File written into each unit directory (default: freeze_gen.go).\n"
        << "  --register-func <f>      Registration function as <import path>.<Name>\n"
        << "                           (default: github.com/influxdata/flux.RegisterPackage).\n"
        << "  --variable <name>        Frozen variable name (default: pkgAST).\n"
        << "  --config <file>          JSON config file (default: <root-dir>/gofreeze.json when present).\n"
        << "  --dry-run                Do not write files.\n"
        << "  --no-overwrite           Fail instead of replacing existing files.\n"
        << "  --verbose                Print one progress line per generated file.\n\n"
        << "ENCODING OPTIONS\n"
        << "  --sort-map-keys          Emit map entries sorted by key.\n"
        << "  --sized-arrays           Spell array types as [N]T.\n"
        << "  --no-cycle-check         Do not reject self-referencing values.\n\n"
        << "EXIT STATUS\n"
        << "  0 on success, 1 on any failure. A run summary is printed to stderr after generate.\n";
}

/// @brief Emits collected diagnostics to stderr.
void printDiagnostics(const gofreeze::DiagnosticEngine& diag)
{
    for (const auto& d : diag.diagnostics())
    {
        llvm::StringRef level = "note";
        if (d.level == gofreeze::DiagnosticLevel::Warning)
        {
            level = "warning";
        }
        else if (d.level == gofreeze::DiagnosticLevel::Error)
        {
            level = "error";
        }
        llvm::errs() << d.location.str() << ": " << level << ": " << d.message << "\n";
    }
}

std::string resolveOutputRoot(const std::string& root)
{
    std::error_code ec;
    const auto      abs = std::filesystem::absolute(root, ec);
    if (!ec)
    {
        return abs.lexically_normal().string();
    }
    return root;
}

/// @brief Prints the post-run command summary.
void printRunSummary(llvm::StringRef                           command,
                     llvm::StringRef                           outputRoot,
                     const gofreeze::GenerateResult&           result,
                     const bool                                dryRun,
                     const std::chrono::steady_clock::duration elapsed)
{
    const auto elapsedMs         = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    const auto elapsedWholeSec   = elapsedMs / 1000;
    const auto elapsedFractionMs = elapsedMs % 1000;
    llvm::errs() << "Run summary:\n"
                 << "  command: " << command << (dryRun ? " (dry run)" : "") << "\n"
                 << "  output root: " << outputRoot << "\n"
                 << "  directories visited: " << result.directoriesVisited << "\n"
                 << "  units generated: " << result.unitsGenerated << "\n"
                 << "  files generated: " << result.outputFiles.size() << "\n"
                 << "  elapsed: " << elapsedWholeSec << ".";
    if (elapsedFractionMs < 100)
    {
        llvm::errs() << "0";
    }
    if (elapsedFractionMs < 10)
    {
        llvm::errs() << "0";
    }
    llvm::errs() << elapsedFractionMs << "s\n";
}

}  // namespace

/// @brief Program entry point for `gofreeze`.
///
/// @param[in] argc Argument count.
/// @param[in] argv Argument vector.
/// @return Zero on success, non-zero on CLI, load, encoding or write failure.
int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    if (argc < 2)
    {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];
    if (isHelpToken(command) || command == "help")
    {
        printHelp();
        return 0;
    }
    if (command == "--version")
    {
        llvm::outs() << "gofreeze " << gofreeze::kVersionString << "\n";
        return 0;
    }
    if (!isKnownCommand(command))
    {
        llvm::errs() << "Unknown command: " << command << "\n";
        printUsage();
        return 1;
    }

    gofreeze::GenerateOverrides overrides;
    std::string                 documentPath;
    bool                        helpRequested = false;

    for (int i = 2; i < argc; ++i)
    {
        const std::string arg          = argv[i];
        auto              requireValue = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc)
            {
                llvm::errs() << "Missing value for " << name << "\n";
                printUsage();
                std::exit(1);
            }
            return argv[++i];
        };

        if (isHelpToken(arg))
        {
            helpRequested = true;
        }
        else if (arg == "--pkg")
        {
            overrides.pkg = requireValue(arg);
        }
        else if (arg == "--root-dir")
        {
            overrides.rootDir = requireValue(arg);
        }
        else if (arg == "--import-file")
        {
            overrides.importFile = requireValue(arg);
        }
        else if (arg == "--output-file")
        {
            overrides.outputFile = requireValue(arg);
        }
        else if (arg == "--register-func")
        {
            overrides.registerFunc = requireValue(arg);
        }
        else if (arg == "--variable")
        {
            overrides.variable = requireValue(arg);
        }
        else if (arg == "--config")
        {
            overrides.configFile = requireValue(arg);
        }
        else if (arg == "--sort-map-keys")
        {
            overrides.sortMapKeys = true;
        }
        else if (arg == "--sized-arrays")
        {
            overrides.sizedArrays = true;
        }
        else if (arg == "--no-cycle-check")
        {
            overrides.detectCycles = false;
        }
        else if (arg == "--dry-run")
        {
            overrides.dryRun = true;
        }
        else if (arg == "--no-overwrite")
        {
            overrides.noOverwrite = true;
        }
        else if (arg == "--verbose")
        {
            overrides.verbose = true;
        }
        else if (command == "encode" && documentPath.empty() && !llvm::StringRef(arg).consume_front("-"))
        {
            documentPath = arg;
        }
        else
        {
            llvm::errs() << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (helpRequested)
    {
        printHelp();
        return 0;
    }

    if (command == "encode")
    {
        if (documentPath.empty())
        {
            llvm::errs() << "encode requires a document path\n";
            printUsage();
            return 1;
        }
        auto document = gofreeze::loadValueDocument(documentPath);
        if (!document)
        {
            llvm::errs() << llvm::toString(document.takeError()) << "\n";
            return 1;
        }
        gofreeze::GenerateConfig config;
        config.sortMapKeys  = overrides.sortMapKeys.value_or(config.sortMapKeys);
        config.sizedArrays  = overrides.sizedArrays.value_or(config.sizedArrays);
        config.detectCycles = overrides.detectCycles.value_or(config.detectCycles);
        auto expression     = gofreeze::renderDocumentExpression(*document, gofreeze::encodeOptionsFor(config));
        if (!expression)
        {
            llvm::errs() << documentPath << ": " << llvm::toString(expression.takeError()) << "\n";
            return 1;
        }
        llvm::outs() << *expression << "\n";
        return 0;
    }

    auto config = gofreeze::resolveGenerateConfig(overrides);
    if (!config)
    {
        llvm::errs() << llvm::toString(config.takeError()) << "\n";
        return 1;
    }

    const auto                 startTime = std::chrono::steady_clock::now();
    gofreeze::DiagnosticEngine diagnostics;
    auto                       result = gofreeze::runGenerate(*config, diagnostics, &llvm::errs());
    if (!result)
    {
        llvm::errs() << llvm::toString(result.takeError()) << "\n";
        printDiagnostics(diagnostics);
        return 1;
    }

    printDiagnostics(diagnostics);
    printRunSummary(command,
                    resolveOutputRoot(config->rootDir),
                    *result,
                    config->dryRun,
                    std::chrono::steady_clock::now() - startTime);
    return diagnostics.hasErrors() ? 1 : 0;
}
