//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// In-place insertion of `fromJson`/`toJson` member declarations.
///
/// Only declarations are inserted into the class body; their definitions are
/// the member forwarders emitted into the companion header.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_CODEGEN_MEMBER_INSERTION_H
#define LLVMJSONGEN_CODEGEN_MEMBER_INSERTION_H

#include "llvmjsongen/CodeGen/CodeEmitter.h"
#include "llvmjsongen/Semantics/Config.h"
#include "llvmjsongen/Semantics/Model.h"
#include "llvmjsongen/Support/PatchInstruction.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <optional>
#include <string>
#include <vector>

namespace llvmjsongen
{

/// @brief Returns the member declarations the in-place path adds to a class.
/// @param[in] model Class model.
/// @param[in] config Resolved class configuration.
/// @return Declarations without indentation, in insertion order.
std::vector<std::string> memberDeclarations(const ClassModel& model, const ResolvedConfig& config);

/// @brief How a class body already provides one generated member.
enum class MemberPresence
{
    /// @brief No member of that name; the declaration is inserted.
    Missing,

    /// @brief Declared with the generated signature; the companion defines it.
    Declared,

    /// @brief Defined in the class body with the generated signature.
    Defined,

    /// @brief A member of that name exists with a different signature.
    Conflicting,
};

/// @brief Result of planning the in-place insertion for one class.
struct MemberInsertionPlan final
{
    /// @brief Insertion patch; empty when nothing is missing.
    std::optional<PatchInstruction> patch;

    /// @brief State of `fromJson` in the class body.
    MemberPresence fromJson{MemberPresence::Missing};

    /// @brief State of `toJson` in the class body.
    MemberPresence toJson{MemberPresence::Missing};

    /// @brief Forwarders the companion must not define.
    [[nodiscard]] ForwarderSuppression suppressedForwarders() const;
};

/// @brief Classifies how a class body provides one member declaration.
///
/// @details
/// Only members at the top level of the body count. Whitespace and parameter
/// names are ignored when the signature is compared with @p declaration.
///
/// @param[in] body Class body text produced by @ref blankNonCode.
/// @param[in] declaration Expected declaration as returned by @ref memberDeclarations.
/// @return Presence of the member.
MemberPresence classifyMember(llvm::StringRef body, llvm::StringRef declaration);

/// @brief Computes the one insertion patch for a class declaration.
///
/// @details
/// A member already declared with the generated signature is not inserted
/// again, so planning against already patched source yields no patch. A member
/// of the same name with another signature is left alone and reported through
/// @ref MemberInsertionPlan.
///
/// @param[in] model Class model.
/// @param[in] config Resolved class configuration.
/// @param[in] sourcePath Declaring source path.
/// @param[in] snapshot Source contents the offsets are computed against.
/// @param[in] cppNamespace Namespace the class is declared in; empty for the global namespace.
/// @return Plan or a `ClassNotFoundError`.
llvm::Expected<MemberInsertionPlan> planMemberInsertion(const ClassModel&     model,
                                                        const ResolvedConfig& config,
                                                        llvm::StringRef       sourcePath,
                                                        llvm::StringRef       snapshot,
                                                        llvm::StringRef       cppNamespace = "");

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_CODEGEN_MEMBER_INSERTION_H
