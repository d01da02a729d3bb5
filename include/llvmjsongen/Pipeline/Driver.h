//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Multi-unit generation driver.
///
/// Units are loaded and composed concurrently by a fixed set of worker
/// threads. Companion headers are written by the worker that composed them.
/// Patch instructions of all units are merged into one batch per file and
/// applied after every unit finished.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_PIPELINE_DRIVER_H
#define LLVMJSONGEN_PIPELINE_DRIVER_H

#include "llvmjsongen/Pipeline/GeneratorPass.h"
#include "llvmjsongen/Semantics/Config.h"
#include "llvmjsongen/Support/Diagnostics.h"
#include "llvmjsongen/Support/PatchInstruction.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace llvmjsongen
{

/// @brief Options of one generation run.
struct DriverOptions final
{
    /// @brief Unit model files, in report order.
    std::vector<std::string> modelPaths;

    /// @brief Global configuration.
    GlobalConfig global;

    /// @brief Companion output directory; empty writes next to each source file.
    std::string outDir;

    /// @brief Apply in-place patches.
    bool applyPatches{true};

    /// @brief Validate and report without writing any file.
    bool dryRun{false};

    /// @brief Worker count; 0 selects the hardware concurrency.
    unsigned jobs{0};

    /// @brief Passes run over every unit.
    std::vector<GeneratorPass> passes = defaultPasses();
};

/// @brief Outcome of one unit.
struct UnitReport final
{
    /// @brief Unit model path.
    std::string modelPath;

    /// @brief Unit name; empty when the model could not be loaded.
    std::string unitName;

    /// @brief Companion path; empty when no companion was produced.
    std::string companionPath;

    /// @brief Kept fragment count.
    std::size_t fragmentCount{0};

    /// @brief Raw fragment count before deduplication.
    std::size_t rawFragmentCount{0};

    /// @brief Patch instructions contributed to the run.
    std::vector<PatchInstruction> patches;

    /// @brief Diagnostics of the unit.
    DiagnosticEngine diagnostics;

    /// @brief True when the unit was aborted.
    bool failed{false};
};

/// @brief Outcome of one run.
struct RunReport final
{
    /// @brief Per-unit outcomes in `modelPaths` order.
    std::vector<UnitReport> units;

    /// @brief Companion files written (or that would be, in dry-run mode).
    std::vector<std::string> generatedFiles;

    /// @brief Source files patched (or that would be, in dry-run mode).
    std::vector<std::string> patchedFiles;

    /// @brief Diagnostics of patch application.
    DiagnosticEngine patchDiagnostics;

    /// @brief Wall time of the run.
    std::chrono::milliseconds elapsed{0};

    /// @brief Indicates whether any unit or batch reported an error.
    /// @return True on any error diagnostic.
    [[nodiscard]] bool hasErrors() const;
};

/// @brief Loads, composes, and writes the companion of one unit.
/// @param[in] modelPath Unit model path.
/// @param[in] options Run options.
/// @param[in,out] generatedFiles Receives the companion path when one is produced.
/// @return Unit outcome; failures are recorded as diagnostics.
UnitReport processUnit(const std::string& modelPath, const DriverOptions& options, std::vector<std::string>& generatedFiles);

/// @brief Runs generation over every unit, then applies merged patch batches.
/// @param[in] options Run options.
/// @return Run report.
RunReport runGeneration(const DriverOptions& options);

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_PIPELINE_DRIVER_H
