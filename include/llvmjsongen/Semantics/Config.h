//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Layered generation configuration and its merge into one resolved view per class.
///
/// Three scopes contribute options: the global layer (config file plus command
/// line), the class annotation, and per-field overrides. Unset values inherit
/// from the next broader scope; built-in defaults sit below the global layer.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_SEMANTICS_CONFIG_H
#define LLVMJSONGEN_SEMANTICS_CONFIG_H

#include "llvmjsongen/CodeGen/NamingPolicy.h"
#include "llvmjsongen/Semantics/Model.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace llvmjsongen
{

/// @brief One configuration scope. Every switch is optional so that it can inherit.
struct ConfigLayer final
{
    /// @brief Emit the decode factory.
    std::optional<bool> createFactory;

    /// @brief Emit the encode function.
    std::optional<bool> createToJson;

    /// @brief Emit the field-name to output-key map.
    std::optional<bool> createFieldMap;

    /// @brief Emit the output-key constants struct.
    std::optional<bool> createJsonKeys;

    /// @brief Emit the per-field encode-function struct.
    std::optional<bool> createPerFieldToJson;

    /// @brief Emit codec-parameterized templates for classes with type parameters.
    std::optional<bool> genericArgumentFactories;

    /// @brief Encode empty `std::optional` fields as `null` instead of omitting them.
    std::optional<bool> includeIfNull;

    /// @brief Reject input objects carrying keys that no decode field consumes.
    std::optional<bool> disallowUnrecognizedKeys;

    /// @brief Skip fields that carry no per-field override.
    std::optional<bool> ignoreUnannotated;

    /// @brief Insert `fromJson`/`toJson` member declarations into the class body.
    std::optional<bool> addMembers;

    /// @brief Output-key projection.
    std::optional<FieldRename> fieldRename;
};

/// @brief Per-field override payload.
struct FieldOverride final
{
    /// @brief Explicit output key.
    std::optional<std::string> name;

    /// @brief Explicit decode participation.
    std::optional<bool> includeFromJson;

    /// @brief Explicit encode participation.
    std::optional<bool> includeToJson;

    /// @brief Field-level `includeIfNull`.
    std::optional<bool> includeIfNull;

    /// @brief Missing key is a decode error.
    std::optional<bool> required;

    /// @brief C++ expression used when the key is missing.
    std::optional<std::string> defaultValue;

    /// @brief Skip the key on encode when the value equals its default.
    std::optional<bool> omitIfDefault;

    /// @brief Custom decode function `bool (const llvm::json::Value&, std::optional<T>&, llvm::json::Path)`.
    std::optional<std::string> fromJson;

    /// @brief Custom encode function `llvm::json::Value (const T&)`.
    std::optional<std::string> toJson;
};

/// @brief Merged per-field configuration.
struct ResolvedFieldConfig final
{
    /// @brief Field name.
    std::string fieldName;

    /// @brief Resolved output key.
    std::string jsonKey;

    /// @brief True when the field carried any override.
    bool annotated{false};

    /// @brief Explicit decode participation; empty when the selector decides by visibility.
    std::optional<bool> includeFromJson;

    /// @brief Explicit encode participation; empty for the default behavior.
    std::optional<bool> includeToJson;

    /// @brief Effective `includeIfNull`.
    bool includeIfNull{true};

    /// @brief Effective `required`.
    bool required{false};

    /// @brief Default value expression.
    std::optional<std::string> defaultValue;

    /// @brief Effective `omitIfDefault`.
    bool omitIfDefault{false};

    /// @brief Custom decode function; empty when none.
    std::string fromJson;

    /// @brief Custom encode function; empty when none.
    std::string toJson;
};

/// @brief Config-registered codec for one type name.
struct TypeCodecBinding final
{
    /// @brief Type name as spelled in the model (`Money`, `shop::Money`).
    std::string typeName;

    /// @brief Codec expression emitted verbatim (`::shop::MoneyCodec{}`).
    std::string codecExpression;
};

/// @brief Global scope: options plus registered codecs.
struct GlobalConfig final
{
    /// @brief Global option layer.
    ConfigLayer options;

    /// @brief Extra type codecs sorted by type name.
    std::vector<TypeCodecBinding> typeCodecs;
};

/// @brief Final read-only configuration for one class.
struct ResolvedConfig final
{
    bool        createFactory{true};
    bool        createToJson{true};
    bool        createFieldMap{false};
    bool        createJsonKeys{false};
    bool        createPerFieldToJson{false};
    bool        genericArgumentFactories{false};
    bool        includeIfNull{true};
    bool        disallowUnrecognizedKeys{false};
    bool        ignoreUnannotated{false};
    bool        addMembers{false};
    FieldRename fieldRename{FieldRename::None};

    /// @brief Per-field configuration in field declaration order.
    std::vector<ResolvedFieldConfig> fields;

    /// @brief Looks up the configuration of one field.
    /// @param[in] name Field name.
    /// @return Field configuration or `nullptr`.
    [[nodiscard]] const ResolvedFieldConfig* field(llvm::StringRef name) const;
};

/// @brief Parses one option layer from a JSON object.
/// @param[in] object Option object.
/// @param[in] element Element named in errors.
/// @param[in] ignoredKeys Keys owned by an enclosing payload and skipped here.
/// @return Parsed layer or a `ConfigurationError`.
llvm::Expected<ConfigLayer> parseConfigLayer(const llvm::json::Object&       object,
                                             llvm::StringRef                 element,
                                             llvm::ArrayRef<llvm::StringRef> ignoredKeys = {});

/// @brief Parses one per-field override.
/// @param[in] object Override object.
/// @param[in] element Element named in errors (`Class.field`).
/// @return Parsed override or a `ConfigurationError`.
llvm::Expected<FieldOverride> parseFieldOverride(const llvm::json::Object& object, llvm::StringRef element);

/// @brief Parses the global config document `{"options": {...}, "typeCodecs": {...}}`.
/// @param[in] document Parsed JSON document.
/// @return Global config or a `ConfigurationError` for element `<global>`.
llvm::Expected<GlobalConfig> parseGlobalConfig(const llvm::json::Value& document);

/// @brief Reads and parses a global config file.
/// @param[in] path Config file path.
/// @return Global config, an `IoError`, or a `ConfigurationError`.
llvm::Expected<GlobalConfig> loadGlobalConfig(llvm::StringRef path);

/// @brief Applies every set value of `top` onto `base`.
/// @param[in,out] base Broader layer.
/// @param[in] top Narrower layer.
void overlayConfigLayer(ConfigLayer& base, const ConfigLayer& top);

/// @brief Merges the three scopes into one resolved configuration.
///
/// @details
/// Precedence is field > class > global > built-in default. Overrides naming
/// undeclared fields, required fields that cannot be decoded or that carry a
/// default, and `omitIfDefault` on encode-excluded fields are `ConfigurationError`s.
///
/// @param[in] className Class name used in error elements.
/// @param[in] global Global layer.
/// @param[in] classLayer Class layer.
/// @param[in] fields Declared fields (inherited first).
/// @param[in] overrides Field overrides keyed by field name.
/// @return Resolved configuration or a `ConfigurationError`.
llvm::Expected<ResolvedConfig> mergeConfig(llvm::StringRef                                           className,
                                           const ConfigLayer&                                        global,
                                           const ConfigLayer&                                        classLayer,
                                           const std::vector<FieldDescriptor>&                       fields,
                                           const std::vector<std::pair<std::string, FieldOverride>>& overrides);

/// @brief Resolves the configuration of one class from its raw annotations.
///
/// @details
/// Field overrides come from each field's `key` payload and from the `fields`
/// object of the class annotation; both naming the same field is a conflict.
///
/// @param[in] global Global layer.
/// @param[in] model Class model.
/// @param[in] fields Collected fields of the class.
/// @return Resolved configuration or a `ConfigurationError`.
llvm::Expected<ResolvedConfig> resolveClassConfig(const ConfigLayer&                  global,
                                                  const ClassModel&                   model,
                                                  const std::vector<FieldDescriptor>& fields);

/// @brief Resolves the value rename policy of an enum from its annotation.
///
/// @details
/// The enum annotation accepts only `fieldRename`; the policy applies to
/// enumerators without an explicit JSON value.
///
/// @param[in] model Enum model.
/// @return Rename policy or a `ConfigurationError`.
llvm::Expected<FieldRename> resolveEnumRename(const EnumModel& model);

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_SEMANTICS_CONFIG_H
