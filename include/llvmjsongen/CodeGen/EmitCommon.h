//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Shared emission helpers for file-write policy and companion header layout.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_CODEGEN_EMIT_COMMON_H
#define LLVMJSONGEN_CODEGEN_EMIT_COMMON_H

#include "llvmjsongen/Semantics/Model.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace llvmjsongen
{

/// @brief Output-file write policy shared by companion and patch writers.
struct EmitWritePolicy final
{
    /// @brief Do not create or modify any files.
    bool dryRun{false};

    /// @brief File mode applied after writing (POSIX-like bitmask).
    std::uint32_t fileMode{0644U};

    /// @brief Optional sink of absolute generated output paths.
    std::vector<std::string>* recordedOutputs{nullptr};
};

/// @brief Writes one generated file under a policy.
///
/// @details
/// When @ref EmitWritePolicy::dryRun is true, no filesystem mutation occurs.
/// In all modes, if @ref EmitWritePolicy::recordedOutputs is set, the resolved
/// absolute path is appended.
///
/// @param[in] path Destination file path.
/// @param[in] content File contents.
/// @param[in] policy Write policy.
/// @return Success or an `IoError` naming the path.
llvm::Error writeGeneratedFile(const std::filesystem::path& path, llvm::StringRef content, const EmitWritePolicy& policy);

/// @brief Returns the companion file name of a unit (`<unit>.json.hpp`).
/// @param[in] unit Unit model.
/// @return File name without directory.
std::string companionFileName(const UnitModel& unit);

/// @brief Wraps an aggregate fragment body into a self-contained companion header.
///
/// @details
/// The header carries a generated-file banner, an include guard derived from
/// the unit name, the declaring source header, the codec runtime, and the
/// unit namespace when one is set.
///
/// @param[in] unit Unit model.
/// @param[in] body Aggregate fragment text.
/// @return Header text ending with a newline.
std::string renderCompanionHeader(const UnitModel& unit, llvm::StringRef body);

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_CODEGEN_EMIT_COMMON_H
