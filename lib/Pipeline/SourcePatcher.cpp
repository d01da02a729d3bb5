//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements safe application of patch batches.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/Pipeline/SourcePatcher.h"

#include "llvmjsongen/Support/GenerationError.h"

#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <filesystem>
#include <numeric>
#include <system_error>
#include <utility>

namespace llvmjsongen
{
namespace
{

llvm::Error rangeError(const PatchInstruction& patch, const std::string& message)
{
    return makeGenerationError(GenerationErrorKind::PatchRange, patch.filePath, message);
}

std::string describe(const PatchInstruction& patch)
{
    return "patch [" + std::to_string(patch.startOffset) + ", " + std::to_string(patch.endOffset) + ")" +
           (patch.element.empty() ? std::string() : " for `" + patch.element + "`");
}

}  // namespace

std::map<std::string, std::vector<PatchInstruction>> groupPatchesByFile(std::vector<PatchInstruction> patches)
{
    std::map<std::string, std::vector<PatchInstruction>> batches;
    for (PatchInstruction& patch : patches)
    {
        batches[patch.filePath].push_back(std::move(patch));
    }
    return batches;
}

llvm::Expected<std::string> applyPatchesToText(llvm::StringRef text, std::vector<PatchInstruction> batch)
{
    const std::uint64_t fingerprint = snapshotFingerprint(text);
    for (const PatchInstruction& patch : batch)
    {
        if (patch.snapshotHash != fingerprint)
        {
            return rangeError(patch, describe(patch) + " was computed against different file contents");
        }
        if (patch.startOffset > patch.endOffset)
        {
            return rangeError(patch, describe(patch) + " ends before it starts");
        }
        if (patch.endOffset > text.size())
        {
            return rangeError(patch,
                              describe(patch) + " lies beyond the end of the file (" + std::to_string(text.size()) +
                                  " bytes)");
        }
    }

    // Highest start first; for equal starts wider ranges first, then later batch entries first,
    // so equal insertions end up in batch order.
    std::vector<std::size_t> order(batch.size());
    std::iota(order.begin(), order.end(), std::size_t{0});

    // An identical edit requested twice is applied once.
    std::vector<std::size_t> unique;
    for (const std::size_t index : order)
    {
        const PatchInstruction& patch     = batch[index];
        const bool              duplicate = std::any_of(unique.begin(), unique.end(), [&](const std::size_t kept) {
            const PatchInstruction& other = batch[kept];
            return other.startOffset == patch.startOffset && other.endOffset == patch.endOffset &&
                   other.replacementText == patch.replacementText;
        });
        if (!duplicate)
        {
            unique.push_back(index);
        }
    }
    order = std::move(unique);

    std::sort(order.begin(), order.end(), [&batch](const std::size_t lhs, const std::size_t rhs) {
        const PatchInstruction& a = batch[lhs];
        const PatchInstruction& b = batch[rhs];
        if (a.startOffset != b.startOffset)
        {
            return a.startOffset > b.startOffset;
        }
        if (a.endOffset != b.endOffset)
        {
            return a.endOffset > b.endOffset;
        }
        return lhs > rhs;
    });

    for (std::size_t i = 1; i < order.size(); ++i)
    {
        const PatchInstruction& higher = batch[order[i - 1]];
        const PatchInstruction& lower  = batch[order[i]];
        if (lower.endOffset > higher.startOffset)
        {
            return rangeError(lower, describe(lower) + " overlaps " + describe(higher));
        }
    }

    std::string out = text.str();
    for (const std::size_t index : order)
    {
        const PatchInstruction& patch = batch[index];
        out.replace(patch.startOffset, patch.endOffset - patch.startOffset, patch.replacementText);
    }
    return out;
}

llvm::Expected<PatchOutcome> applyPatchBatch(llvm::StringRef                filePath,
                                             std::vector<PatchInstruction> batch,
                                             const EmitWritePolicy&        policy)
{
    auto buffer = llvm::MemoryBuffer::getFile(filePath);
    if (!buffer)
    {
        return makeGenerationError(GenerationErrorKind::Io,
                                   filePath.str(),
                                   "cannot read patch target: " + buffer.getError().message());
    }
    const llvm::StringRef original = (*buffer)->getBuffer();

    auto patched = applyPatchesToText(original, std::move(batch));
    if (!patched)
    {
        return patched.takeError();
    }
    if (*patched == original)
    {
        return PatchOutcome::Unchanged;
    }
    if (policy.recordedOutputs != nullptr)
    {
        policy.recordedOutputs->push_back(filePath.str());
    }
    if (policy.dryRun)
    {
        return PatchOutcome::Written;
    }

    std::error_code                    ec;
    const std::filesystem::file_status status = std::filesystem::status(filePath.str(), ec);
    if (ec)
    {
        return makeGenerationError(GenerationErrorKind::Io, filePath.str(), "cannot stat patch target: " + ec.message());
    }

    if (llvm::Error err = llvm::writeToOutput(filePath, [&patched](llvm::raw_ostream& os) {
            os << *patched;
            return llvm::Error::success();
        }))
    {
        return makeGenerationError(GenerationErrorKind::Io,
                                   filePath.str(),
                                   "failed to write: " + llvm::toString(std::move(err)));
    }

    std::filesystem::permissions(filePath.str(), status.permissions(), std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        return makeGenerationError(GenerationErrorKind::Io, filePath.str(), "failed to restore mode: " + ec.message());
    }
    return PatchOutcome::Written;
}

PatchReport applyPatches(std::vector<PatchInstruction> patches, const EmitWritePolicy& policy)
{
    PatchReport report;
    for (auto& [filePath, batch] : groupPatchesByFile(std::move(patches)))
    {
        auto outcome = applyPatchBatch(filePath, std::move(batch), policy);
        if (!outcome)
        {
            reportGenerationError(report.diagnostics, SourceLocation{filePath, 1, 1}, outcome.takeError());
            continue;
        }
        if (*outcome == PatchOutcome::Written)
        {
            report.patchedFiles.push_back(filePath);
        }
        else
        {
            report.unchangedFiles.push_back(filePath);
        }
    }
    return report;
}

}  // namespace llvmjsongen
