//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Byte-range text replacement produced by in-place generation.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_SUPPORT_PATCH_INSTRUCTION_H
#define LLVMJSONGEN_SUPPORT_PATCH_INSTRUCTION_H

#include "llvm/ADT/StringRef.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace llvmjsongen
{

/// @brief Replaces `[startOffset, endOffset)` of one file with new text.
struct PatchInstruction final
{
    /// @brief Target file.
    std::string filePath;

    /// @brief First replaced byte.
    std::size_t startOffset{0};

    /// @brief One past the last replaced byte; equal to `startOffset` for an insertion.
    std::size_t endOffset{0};

    /// @brief Replacement text.
    std::string replacementText;

    /// @brief Element the patch belongs to (class name).
    std::string element;

    /// @brief Fingerprint of the snapshot the offsets were computed against.
    std::uint64_t snapshotHash{0};
};

/// @brief Computes the snapshot fingerprint stored in patch instructions.
/// @param[in] contents File contents.
/// @return xxHash64 of the contents.
std::uint64_t snapshotFingerprint(llvm::StringRef contents);

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_SUPPORT_PATCH_INSTRUCTION_H
