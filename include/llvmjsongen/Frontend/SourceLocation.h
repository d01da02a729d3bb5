//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Source location primitives shared by model loading, diagnostics, and source patching.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_FRONTEND_SOURCE_LOCATION_H
#define LLVMJSONGEN_FRONTEND_SOURCE_LOCATION_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "llvm/ADT/StringRef.h"

namespace llvmjsongen
{

/// @file
/// @brief Source location primitives shared across frontend and diagnostics.

/// @brief Identifies a concrete position in an input source file.
struct SourceLocation
{
    /// @brief Path to the source file.
    std::string file;

    /// @brief 1-based source line.
    std::uint32_t line{1};

    /// @brief 1-based source column.
    std::uint32_t column{1};

    /// @brief Formats this location as a human-readable string.
    /// @return Formatted location text.
    [[nodiscard]] std::string str() const;
};

/// @brief Computes the line/column location of a byte offset inside a text snapshot.
/// @param[in] file Path recorded into the location.
/// @param[in] text Snapshot text.
/// @param[in] offset Byte offset; clamped to the text size.
/// @return Location of the offset.
SourceLocation locationForOffset(const std::string& file, llvm::StringRef text, std::size_t offset);

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_FRONTEND_SOURCE_LOCATION_H
