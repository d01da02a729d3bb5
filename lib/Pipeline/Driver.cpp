//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the multi-unit generation driver.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/Pipeline/Driver.h"

#include "llvmjsongen/CodeGen/EmitCommon.h"
#include "llvmjsongen/Frontend/ModelReader.h"
#include "llvmjsongen/Pipeline/Composer.h"
#include "llvmjsongen/Pipeline/SourcePatcher.h"
#include "llvmjsongen/Support/GenerationError.h"

#include "llvm/Support/MemoryBuffer.h"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <memory>
#include <thread>
#include <utility>

namespace llvmjsongen
{
namespace
{

// Resolves `Class` or `Class.field` to its declaration line.
SourceLocation elementLocation(const UnitModel& unit, llvm::StringRef element)
{
    const auto [className, fieldName] = element.split('.');
    if (const ClassModel* model = findClass(unit, className))
    {
        for (const FieldDescriptor& field : model->fields)
        {
            if (!fieldName.empty() && field.name == fieldName)
            {
                return SourceLocation{unit.sourcePath, field.line, 1};
            }
        }
        return SourceLocation{unit.sourcePath, model->line, 1};
    }
    if (const EnumModel* model = findEnum(unit, className))
    {
        return SourceLocation{unit.sourcePath, model->line, 1};
    }
    return SourceLocation{unit.sourcePath, 1, 1};
}

std::filesystem::path companionPath(const UnitModel& unit, const DriverOptions& options)
{
    const std::filesystem::path directory = options.outDir.empty()
                                                ? std::filesystem::path(unit.sourcePath).parent_path()
                                                : std::filesystem::path(options.outDir);
    return directory / companionFileName(unit);
}

}  // namespace

bool RunReport::hasErrors() const
{
    if (patchDiagnostics.hasErrors())
    {
        return true;
    }
    return std::any_of(units.begin(), units.end(), [](const UnitReport& unit) {
        return unit.diagnostics.hasErrors();
    });
}

UnitReport processUnit(const std::string& modelPath, const DriverOptions& options, std::vector<std::string>& generatedFiles)
{
    UnitReport report;
    report.modelPath = modelPath;

    auto unit = loadUnitModel(modelPath);
    if (!unit)
    {
        report.failed = true;
        reportGenerationError(report.diagnostics, SourceLocation{modelPath, 1, 1}, unit.takeError());
        return report;
    }
    report.unitName = unit->name;

    UnitSnapshot snapshot{*unit, options.global, std::nullopt, std::string(), options.applyPatches};
    auto         source = llvm::MemoryBuffer::getFile(unit->sourcePath);
    if (source)
    {
        snapshot.sourceText = (*source)->getBuffer().str();
    }
    else
    {
        snapshot.sourceError = source.getError().message();
    }

    auto composition = composeUnit(snapshot, options.passes, report.diagnostics);
    if (!composition)
    {
        report.failed = true;
        std::string element;
        llvm::Error tagged =
            llvm::handleErrors(composition.takeError(), [&element](std::unique_ptr<GenerationError> payload) {
                element = payload->element();
                return llvm::Error(std::move(payload));
            });
        reportGenerationError(report.diagnostics, elementLocation(*unit, element), std::move(tagged));
        return report;
    }

    report.fragmentCount = composition->output.fragments().size();
    for (const std::size_t count : composition->rawFragmentCounts)
    {
        report.rawFragmentCount += count;
    }
    if (composition->output.empty())
    {
        report.patches = std::move(composition->patches);
        return report;
    }

    const std::filesystem::path path = companionPath(*unit, options);
    EmitWritePolicy             policy;
    policy.dryRun          = options.dryRun;
    policy.recordedOutputs = &generatedFiles;
    if (llvm::Error err = writeGeneratedFile(path, renderCompanionHeader(*unit, composition->output.text()), policy))
    {
        // Without definitions in the companion the inserted member declarations would not link.
        report.failed = true;
        reportGenerationError(report.diagnostics, SourceLocation{unit->sourcePath, 1, 1}, std::move(err));
        return report;
    }
    report.companionPath = path.string();
    report.patches       = std::move(composition->patches);
    return report;
}

RunReport runGeneration(const DriverOptions& options)
{
    const auto started = std::chrono::steady_clock::now();

    RunReport                             run;
    const std::size_t                     unitCount = options.modelPaths.size();
    std::vector<std::vector<std::string>> generated(unitCount);
    run.units.resize(unitCount);

    unsigned workers = options.jobs;
    if (workers == 0U)
    {
        workers = std::max(1U, std::thread::hardware_concurrency());
    }
    workers = static_cast<unsigned>(std::min<std::size_t>(workers, std::max<std::size_t>(unitCount, 1U)));

    // Each unit owns its report slot, so workers never share mutable state.
    std::atomic<std::size_t> next{0};
    const auto               work = [&]() {
        for (std::size_t index = next.fetch_add(1); index < unitCount; index = next.fetch_add(1))
        {
            run.units[index] = processUnit(options.modelPaths[index], options, generated[index]);
        }
    };
    std::vector<std::thread> threads;
    threads.reserve(workers - 1U);
    for (unsigned i = 1; i < workers; ++i)
    {
        threads.emplace_back(work);
    }
    work();
    for (std::thread& thread : threads)
    {
        thread.join();
    }

    std::vector<PatchInstruction> patches;
    for (std::size_t i = 0; i < unitCount; ++i)
    {
        run.generatedFiles.insert(run.generatedFiles.end(), generated[i].begin(), generated[i].end());
        patches.insert(patches.end(), run.units[i].patches.begin(), run.units[i].patches.end());
    }

    if (options.applyPatches && !patches.empty())
    {
        EmitWritePolicy policy;
        policy.dryRun            = options.dryRun;
        PatchReport patchReport  = applyPatches(std::move(patches), policy);
        run.patchedFiles         = std::move(patchReport.patchedFiles);
        run.patchDiagnostics     = std::move(patchReport.diagnostics);
    }

    run.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    return run;
}

}  // namespace llvmjsongen
