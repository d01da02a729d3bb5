//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Application of patch batches to source files.
///
/// Instructions of one file are applied from the highest start offset to the
/// lowest, so every offset stays valid against the snapshot it was computed
/// on. A batch is validated completely before anything is written, and a
/// file is written at most once.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_PIPELINE_SOURCE_PATCHER_H
#define LLVMJSONGEN_PIPELINE_SOURCE_PATCHER_H

#include "llvmjsongen/CodeGen/EmitCommon.h"
#include "llvmjsongen/Support/Diagnostics.h"
#include "llvmjsongen/Support/PatchInstruction.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <map>
#include <string>
#include <vector>

namespace llvmjsongen
{

/// @brief Groups instructions by target file, keeping input order inside each group.
/// @param[in] patches Instructions of one run.
/// @return Batches keyed by file path.
std::map<std::string, std::vector<PatchInstruction>> groupPatchesByFile(std::vector<PatchInstruction> patches);

/// @brief Applies one batch to in-memory text.
///
/// @details
/// Every instruction must carry the fingerprint of `text`, lie within it, have
/// `startOffset <= endOffset`, and not overlap another instruction. Insertions
/// at the same offset keep their batch order in the result.
///
/// @param[in] text Current file contents.
/// @param[in] batch Instructions targeting the file.
/// @return Patched text or a `PatchRangeError`.
llvm::Expected<std::string> applyPatchesToText(llvm::StringRef text, std::vector<PatchInstruction> batch);

/// @brief Outcome of applying the batch of one file.
enum class PatchOutcome
{
    /// @brief The file was rewritten.
    Written,

    /// @brief The patched text equals the current contents; nothing was written.
    Unchanged,
};

/// @brief Reads, patches, and writes one file.
/// @param[in] filePath Target file.
/// @param[in] batch Instructions targeting the file.
/// @param[in] policy Write policy; `dryRun` validates without writing.
/// @return Outcome, an `IoError`, or a `PatchRangeError`.
llvm::Expected<PatchOutcome> applyPatchBatch(llvm::StringRef                filePath,
                                             std::vector<PatchInstruction> batch,
                                             const EmitWritePolicy&        policy);

/// @brief Summary of applying every batch of a run.
struct PatchReport final
{
    /// @brief Files rewritten (or that would be, in dry-run mode).
    std::vector<std::string> patchedFiles;

    /// @brief Files whose batch produced no change.
    std::vector<std::string> unchangedFiles;

    /// @brief One error per failed batch.
    DiagnosticEngine diagnostics;
};

/// @brief Applies all batches of a run, one file at a time.
///
/// @details
/// A failing batch is reported and does not affect other files.
///
/// @param[in] patches Instructions of the run.
/// @param[in] policy Write policy.
/// @return Report.
PatchReport applyPatches(std::vector<PatchInstruction> patches, const EmitWritePolicy& policy);

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_PIPELINE_SOURCE_PATCHER_H
