//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Shared naming-policy helpers for JSON key projection and generated C++ identifiers.
///
/// This interface centralizes the field-rename projections (kebab/snake/pascal/
/// screaming-snake) applied to output keys and the identifier sanitation used
/// for generated symbol names.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_CODEGEN_NAMING_POLICY_H
#define LLVMJSONGEN_CODEGEN_NAMING_POLICY_H

#include <optional>
#include <string>

#include "llvm/ADT/StringRef.h"

namespace llvmjsongen
{

/// @brief Projection applied to a field (or enumerator) name to derive its JSON key.
enum class FieldRename
{
    /// @brief Use the name unchanged.
    None,

    /// @brief `fooBar` -> `foo-bar`.
    Kebab,

    /// @brief `fooBar` -> `foo_bar`.
    Snake,

    /// @brief `fooBar` -> `FooBar`.
    Pascal,

    /// @brief `fooBar` -> `FOO_BAR`.
    ScreamingSnake,
};

/// @brief Parses a config spelling (`none`, `kebab`, `snake`, `pascal`, `screamingSnake`).
/// @param[in] spelling Config value.
/// @return Rename policy, or empty for unknown spellings.
std::optional<FieldRename> parseFieldRename(llvm::StringRef spelling);

/// @brief Returns the config spelling of a rename policy.
/// @param[in] rename Rename policy.
/// @return Config spelling.
llvm::StringRef fieldRenameName(FieldRename rename);

/// @brief Applies a rename policy to a field name.
/// @param[in] rename Rename policy.
/// @param[in] name Field name.
/// @return JSON key.
std::string renameKey(FieldRename rename, llvm::StringRef name);

/// @brief Returns true when an identifier is a C++ keyword.
/// @param[in] name Candidate identifier.
/// @return True when the identifier is reserved.
bool codegenIsCppKeyword(llvm::StringRef name);

/// @brief Sanitizes one identifier for generated C++.
/// @param[in] name Candidate identifier.
/// @return C++-safe identifier.
std::string codegenSanitizeIdentifier(llvm::StringRef name);

/// @brief Projects text into UPPER_SNAKE_CASE and sanitizes it (include guards).
/// @param[in] name Source text.
/// @return Upper snake-case identifier.
std::string codegenToUpperSnakeCaseIdentifier(llvm::StringRef name);

/// @brief Escapes text for use inside a C++ string literal.
/// @param[in] text Raw text.
/// @return Escaped text without surrounding quotes.
std::string escapeCppString(llvm::StringRef text);

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_CODEGEN_NAMING_POLICY_H
