//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements source-location rendering helpers.
///
/// This file contains utility formatting logic for presenting file, line, and column coordinates.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/Frontend/SourceLocation.h"

#include <algorithm>
#include <sstream>

namespace llvmjsongen
{

std::string SourceLocation::str() const
{
    std::ostringstream out;
    out << file << ':' << line << ':' << column;
    return out.str();
}

SourceLocation locationForOffset(const std::string& file, llvm::StringRef text, const std::size_t offset)
{
    SourceLocation    location{file, 1, 1};
    const std::size_t end = std::min(offset, text.size());
    for (std::size_t i = 0; i < end; ++i)
    {
        if (text[i] == '\n')
        {
            ++location.line;
            location.column = 1;
        }
        else
        {
            ++location.column;
        }
    }
    return location;
}

}  // namespace llvmjsongen
