//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Reader for canonical, already-resolved C++ type spellings.
///
/// Type spellings arrive from the semantic model provider fully resolved
/// (`std::vector<Point>`, `unsigned int`, `std::map<std::string, double>`).
/// Only named types with template arguments are accepted; pointers, references,
/// and function types are rejected.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_FRONTEND_TYPE_SPELLING_H
#define LLVMJSONGEN_FRONTEND_TYPE_SPELLING_H

#include "llvmjsongen/Semantics/Model.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace llvmjsongen
{

/// @brief Parses one type spelling into a `TypeRef` tree.
/// @param[in] spelling Canonical type spelling.
/// @return Parsed type or an `InvalidModelError`.
llvm::Expected<TypeRef> parseTypeSpelling(llvm::StringRef spelling);

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_FRONTEND_TYPE_SPELLING_H
