//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Eligible field selection and constructor binding for one class.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_SEMANTICS_FIELD_SELECTOR_H
#define LLVMJSONGEN_SEMANTICS_FIELD_SELECTOR_H

#include "llvmjsongen/Semantics/Config.h"
#include "llvmjsongen/Semantics/Model.h"
#include "llvmjsongen/Support/Diagnostics.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace llvmjsongen
{

/// @brief Direction a field was excluded from.
enum class FieldDirection
{
    /// @brief Decode (`fromJson`) side.
    Decode,

    /// @brief Encode (`toJson`) side.
    Encode,
};

/// @brief One excluded field with the reason it was excluded.
struct FieldExclusion final
{
    /// @brief Excluded field name.
    std::string fieldName;

    /// @brief Side it is excluded from.
    FieldDirection direction{FieldDirection::Decode};

    /// @brief Non-empty human-readable reason.
    std::string reason;
};

/// @brief How the decode factory constructs an instance.
struct FactoryPlan final
{
    /// @brief Fields passed to the constructor, in parameter order.
    std::vector<std::string> constructorFields;

    /// @brief Fields assigned after construction, in declaration order.
    std::vector<std::string> assignedFields;
};

/// @brief Result of field selection.
struct FieldSelection final
{
    /// @brief Fields read from JSON, in declaration order.
    std::vector<FieldDescriptor> decodeFields;

    /// @brief Fields written to JSON, in declaration order.
    std::vector<FieldDescriptor> encodeFields;

    /// @brief Excluded fields with reasons, in declaration order.
    std::vector<FieldExclusion> excluded;

    /// @brief Constructor binding; empty when factory generation is disabled.
    FactoryPlan factory;
};

/// @brief Returns `decode` or `encode`.
/// @param[in] direction Exclusion direction.
/// @return Display name.
llvm::StringRef fieldDirectionName(FieldDirection direction);

/// @brief Computes the decode and encode field sets of one class.
///
/// @details
/// Private, setter-only, and `includeFromJson: false` fields are unavailable
/// for decode. With factory generation enabled, constructor parameters bind
/// available fields by name, remaining non-final available fields are assigned
/// after construction, and unbound final fields are dropped. Fields forced with
/// `includeToJson: true` are re-added to the encode set, then
/// `includeToJson: false` fields are removed and output keys are checked for
/// collisions.
///
/// @param[in] model Class model.
/// @param[in] fields Collected fields of the class (inherited first).
/// @param[in] config Resolved configuration of the class.
/// @param[in] sourcePath Source path used for diagnostic locations.
/// @param[in,out] diagnostics Receives warnings.
/// @return Selection, an `UnavailableFieldError`, or a `DuplicateKeyError`.
llvm::Expected<FieldSelection> selectFields(const ClassModel&                   model,
                                            const std::vector<FieldDescriptor>& fields,
                                            const ResolvedConfig&               config,
                                            llvm::StringRef                     sourcePath,
                                            DiagnosticEngine&                   diagnostics);

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_SEMANTICS_FIELD_SELECTOR_H
