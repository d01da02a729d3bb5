//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Locates class and struct definitions by name in C++ source text.
///
/// The locator is not a C++ parser. It blanks comments, string and character
/// literals, and preprocessor lines, then looks for `class Name` or
/// `struct Name` followed by a body in the expected namespace scope. Forward
/// declarations, elaborated type specifiers, and `enum class` are skipped.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_FRONTEND_DECLARATION_LOCATOR_H
#define LLVMJSONGEN_FRONTEND_DECLARATION_LOCATOR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <string>

namespace llvmjsongen
{

/// @brief Byte region of one class definition.
struct DeclarationRegion final
{
    /// @brief Offset of the `class`/`struct` keyword.
    std::size_t keywordOffset{0};

    /// @brief Offset of the opening brace of the body.
    std::size_t openBrace{0};

    /// @brief Offset of the matching closing brace.
    std::size_t closeBrace{0};

    /// @brief True for `class` (members default to private).
    bool isClass{false};
};

/// @brief Replaces comments, literals, and preprocessor lines with spaces.
///
/// @details
/// Newlines are kept and the result has the same length as the input, so
/// offsets into the result are offsets into the original text.
///
/// @param[in] text Source text.
/// @return Code-only text.
std::string blankNonCode(llvm::StringRef text);

/// @brief Finds the first definition of a class or struct by name.
///
/// @details
/// Only definitions directly inside @p cppNamespace count; classes nested in
/// other classes, functions, or other namespaces are skipped. Inline and
/// anonymous namespaces and `extern "C"` blocks are transparent.
///
/// @param[in] text Source text.
/// @param[in] name Unqualified class name.
/// @param[in] sourcePath Path named in errors.
/// @param[in] cppNamespace Enclosing namespace (`geo` or `a::b`); empty for the global namespace.
/// @return Region or a `ClassNotFoundError`.
llvm::Expected<DeclarationRegion> locateDeclaration(llvm::StringRef text,
                                                    llvm::StringRef name,
                                                    llvm::StringRef sourcePath,
                                                    llvm::StringRef cppNamespace = "");

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_FRONTEND_DECLARATION_LOCATOR_H
