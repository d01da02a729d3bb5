//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Deterministic C++ fragment emission for JSON encode/decode bindings.
///
/// Each fragment is a pure function of the class model, its resolved
/// configuration, its field selection, and the conversion registry. Identical
/// inputs always produce byte-identical text.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_CODEGEN_CODE_EMITTER_H
#define LLVMJSONGEN_CODEGEN_CODE_EMITTER_H

#include "llvmjsongen/CodeGen/ConversionRegistry.h"
#include "llvmjsongen/Semantics/Config.h"
#include "llvmjsongen/Semantics/FieldSelector.h"
#include "llvmjsongen/Semantics/Model.h"

#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace llvmjsongen
{

/// @brief Member forwarders left out of the companion because the class body provides them differently.
struct ForwarderSuppression final
{
    /// @brief Leave out `C::fromJson`.
    bool fromJson{false};

    /// @brief Leave out `C::toJson`.
    bool toJson{false};
};

/// @brief Inputs shared by every fragment of one class.
struct ClassEmitInput final
{
    /// @brief Class model.
    const ClassModel& model;

    /// @brief Resolved class configuration.
    const ResolvedConfig& config;

    /// @brief Field selection.
    const FieldSelection& selection;

    /// @brief Codec registry for the class.
    const ConversionRegistry& registry;

    /// @brief Member forwarders not to emit.
    ForwarderSuppression suppressedForwarders{};
};

/// @brief Emits `<C>FromJson`.
/// @param[in] input Class inputs.
/// @return Fragment text or an `UnsupportedTypeError`.
llvm::Expected<std::string> emitDecodeFactory(const ClassEmitInput& input);

/// @brief Emits `<C>ToJson`.
/// @param[in] input Class inputs.
/// @return Fragment text or an `UnsupportedTypeError`.
llvm::Expected<std::string> emitEncodeFunction(const ClassEmitInput& input);

/// @brief Emits the constant field-name to output-key map `<C>FieldMap`.
/// @param[in] input Class inputs.
/// @return Fragment text.
std::string emitFieldMap(const ClassEmitInput& input);

/// @brief Emits the output-key constants struct `<C>JsonKeys`.
/// @param[in] input Class inputs.
/// @return Fragment text.
std::string emitJsonKeys(const ClassEmitInput& input);

/// @brief Emits the per-field encode-function struct `<C>PerFieldToJson`.
/// @param[in] input Class inputs.
/// @return Fragment text or an `UnsupportedTypeError`.
llvm::Expected<std::string> emitPerFieldToJson(const ClassEmitInput& input);

/// @brief Emits forward declarations of the class's generated functions.
/// @param[in] model Class model.
/// @param[in] config Resolved class configuration.
/// @return Declaration lines; empty when no function is generated.
std::string emitPrototypes(const ClassModel& model, const ResolvedConfig& config);

/// @brief Emits the out-of-class definitions of the `fromJson`/`toJson` members.
/// @param[in] model Class model.
/// @param[in] config Resolved class configuration.
/// @param[in] suppressed Forwarders to leave out.
/// @return Fragment text; empty when members are not requested.
std::string emitMemberForwarders(const ClassModel&          model,
                                 const ResolvedConfig&      config,
                                 const ForwarderSuppression& suppressed = {});

/// @brief Indicates whether the in-place path applies to a class.
/// @param[in] model Class model.
/// @param[in] config Resolved class configuration.
/// @return True when `addMembers` is set and the class has no type parameters.
bool wantsMemberInsertion(const ClassModel& model, const ResolvedConfig& config);

/// @brief Emits the enum value table `<E>EnumMap`.
/// @param[in] model Enum model.
/// @return Fragment text, a `ConfigurationError`, or a `DuplicateKeyError`.
llvm::Expected<std::string> emitEnumMap(const EnumModel& model);

/// @brief Collects unit enums referenced by a type, in first-seen order.
/// @param[in] type Declared type.
/// @param[in] unit Unit model.
/// @param[in,out] out Enum names; existing entries are not repeated.
void collectReferencedEnums(const TypeRef& type, const UnitModel& unit, std::vector<std::string>& out);

/// @brief Emits every fragment of one class in output order.
///
/// @details
/// Order: enum tables used by selected fields, field map, key constants,
/// per-field encoders, decode factory, encode function, member forwarders.
///
/// @param[in] input Class inputs.
/// @param[in] unit Owning unit.
/// @return Fragments or the first generation error.
llvm::Expected<std::vector<std::string>> emitClassFragments(const ClassEmitInput& input, const UnitModel& unit);

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_CODEGEN_CODE_EMITTER_H
