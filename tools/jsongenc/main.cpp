//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `jsongenc` JSON binding generator.
///
/// This tool loads unit models, resolves configuration, emits companion
/// `<unit>.json.hpp` headers, and optionally inserts `fromJson`/`toJson`
/// member declarations into the declaring sources.
///
//===----------------------------------------------------------------------===//

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "llvmjsongen/Pipeline/Driver.h"
#include "llvmjsongen/Semantics/Config.h"
#include "llvmjsongen/Support/Diagnostics.h"
#include "llvmjsongen/Support/GenerationError.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

namespace
{

/// @brief Checks whether a token is a help switch.
///
/// @param[in] arg Argument token from argv.
/// @return `true` when the argument is `--help` or `-h`.
bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: jsongenc --model <unit.json> [--model <unit.json> ...] [options]\n"
                 << "Try: jsongenc --help\n";
}

/// @brief Prints the full help text.
void printHelp()
{
    llvm::errs() << "NAME\n"
                 << "  jsongenc - JSON encode/decode binding generator for C++ classes\n\n"
                 << "SYNOPSIS\n"
                 << "  jsongenc --model <unit.json> [--model <unit.json> ...] [options]\n"
                 << "  jsongenc --help\n\n"
                 << "DESCRIPTION\n"
                 << "  jsongenc reads resolved unit models, merges global, class, and field configuration,\n"
                 << "  and writes one <unit>.json.hpp companion header per unit with llvm::json based\n"
                 << "  <Class>FromJson/<Class>ToJson functions. With addMembers enabled it also inserts\n"
                 << "  fromJson/toJson member declarations into the declaring source file.\n\n"
                 << "OPTIONS\n"
                 << "  --model <file>\n"
                 << "      Unit model JSON. Repeat to process several units concurrently.\n"
                 << "  --config <file>\n"
                 << "      Global configuration JSON: {\"options\": {...}, \"typeCodecs\": {...}}.\n"
                 << "  --out-dir <dir>\n"
                 << "      Directory for companion headers (default: next to each source file).\n"
                 << "  --add-members\n"
                 << "      Enable addMembers globally (in-place member insertion).\n"
                 << "  --no-patch\n"
                 << "      Never modify source files; companions are still written.\n"
                 << "  --dry-run\n"
                 << "      Validate everything and report what would be written, without writing.\n"
                 << "  --jobs <n>\n"
                 << "      Worker threads (default: hardware concurrency).\n"
                 << "  --verbose\n"
                 << "      Print exclusion notes and a per-unit trace.\n"
                 << "  --help, -h\n"
                 << "      Print this help text.\n\n"
                 << "RUN SUMMARY\n"
                 << "  jsongenc prints a summary to stderr with:\n"
                 << "    - units processed and failed\n"
                 << "    - files generated\n"
                 << "    - files patched\n"
                 << "    - elapsed wall time\n\n"
                 << "EXAMPLES\n"
                 << "  jsongenc --model build/shapes.model.json --out-dir build/generated\n"
                 << "  jsongenc --model a.model.json --model b.model.json --config jsongen.json --add-members\n\n"
                 << "EXIT STATUS\n"
                 << "  0 on success, non-zero on any error diagnostic or invalid CLI usage.\n";
}

/// @brief Emits collected diagnostics to stderr.
///
/// @param[in] diag Diagnostic engine containing accumulated diagnostics.
/// @param[in] verbose Also print notes.
void printDiagnostics(const llvmjsongen::DiagnosticEngine& diag, const bool verbose)
{
    for (const auto& d : diag.diagnostics())
    {
        if (d.level == llvmjsongen::DiagnosticLevel::Note && !verbose)
        {
            continue;
        }
        llvm::errs() << d.location.str() << ": " << llvmjsongen::diagnosticLevelName(d.level) << ": ";
        if (!d.element.empty())
        {
            llvm::errs() << "[" << d.element << "] ";
        }
        llvm::errs() << d.message << "\n";
    }
}

/// @brief Prints the per-unit trace of a verbose run.
///
/// @param[in] unit Unit outcome.
void printUnitTrace(const llvmjsongen::UnitReport& unit)
{
    llvm::errs() << "unit " << (unit.unitName.empty() ? unit.modelPath : unit.unitName) << ": "
                 << (unit.failed ? "failed" : "ok") << ", " << unit.fragmentCount << " fragment(s) from "
                 << unit.rawFragmentCount << " emitted";
    if (!unit.companionPath.empty())
    {
        llvm::errs() << ", companion " << unit.companionPath;
    }
    llvm::errs() << "\n";
    for (const auto& patch : unit.patches)
    {
        llvm::errs() << "  patch " << patch.filePath << " @" << patch.startOffset << " (" << patch.element << ", "
                     << patch.replacementText.size() << " bytes)\n";
    }
}

/// @brief Prints the post-run summary.
///
/// @param[in] report Run report.
/// @param[in] dryRun Whether the run wrote nothing.
void printRunSummary(const llvmjsongen::RunReport& report, const bool dryRun)
{
    std::uint64_t failed = 0;
    for (const auto& unit : report.units)
    {
        if (unit.failed)
        {
            ++failed;
        }
    }
    const auto elapsedMs         = report.elapsed.count();
    const auto elapsedWholeSec   = elapsedMs / 1000;
    const auto elapsedFractionMs = elapsedMs % 1000;
    llvm::errs() << "Run summary" << (dryRun ? " (dry run)" : "") << ":\n"
                 << "  units: " << report.units.size() << " (" << failed << " failed)\n"
                 << "  files generated: " << report.generatedFiles.size() << "\n"
                 << "  files patched: " << report.patchedFiles.size() << "\n"
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

/// @brief Program entry point for `jsongenc`.
///
/// @param[in] argc Argument count.
/// @param[in] argv Argument vector.
/// @return Zero on success, non-zero on configuration, generation, or patch failure.
int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    if (argc < 2)
    {
        printUsage();
        return 1;
    }

    llvmjsongen::DriverOptions options;
    std::string                configPath;
    bool                       addMembers = false;
    bool                       verbose    = false;

    for (int i = 1; i < argc; ++i)
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
            printHelp();
            return 0;
        }
        if (arg == "--model")
        {
            options.modelPaths.push_back(requireValue(arg));
        }
        else if (arg == "--config")
        {
            configPath = requireValue(arg);
        }
        else if (arg == "--out-dir")
        {
            options.outDir = requireValue(arg);
        }
        else if (arg == "--add-members")
        {
            addMembers = true;
        }
        else if (arg == "--no-patch")
        {
            options.applyPatches = false;
        }
        else if (arg == "--dry-run")
        {
            options.dryRun = true;
        }
        else if (arg == "--verbose")
        {
            verbose = true;
        }
        else if (arg == "--jobs")
        {
            const std::string value = requireValue(arg);
            unsigned          jobs  = 0;
            if (llvm::StringRef(value).getAsInteger(10, jobs) || jobs == 0U)
            {
                llvm::errs() << "Invalid --jobs value: " << value << "\n";
                printUsage();
                return 1;
            }
            options.jobs = jobs;
        }
        else
        {
            llvm::errs() << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (options.modelPaths.empty())
    {
        llvm::errs() << "At least one --model is required\n";
        printUsage();
        return 1;
    }

    if (!configPath.empty())
    {
        auto global = llvmjsongen::loadGlobalConfig(configPath);
        if (!global)
        {
            llvm::errs() << "error: " << llvm::toString(global.takeError()) << "\n";
            return 1;
        }
        options.global = std::move(*global);
    }
    if (addMembers)
    {
        // The command-line switch overlays the config file.
        options.global.options.addMembers = true;
    }

    const llvmjsongen::RunReport report = llvmjsongen::runGeneration(options);
    for (const auto& unit : report.units)
    {
        if (verbose)
        {
            printUnitTrace(unit);
        }
        printDiagnostics(unit.diagnostics, verbose);
    }
    printDiagnostics(report.patchDiagnostics, verbose);
    printRunSummary(report, options.dryRun);

    return report.hasErrors() ? 1 : 0;
}
