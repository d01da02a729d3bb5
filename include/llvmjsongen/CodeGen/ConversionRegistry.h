//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Pluggable per-type codec registry consulted by the code emitter.
///
/// A codec expression is a C++ expression naming a runtime object with
/// `decode(value, slot, path)` and `encode(value)` members. Built-in converters
/// cover scalars, `llvm::json::Value`, optionals, sequences, string-keyed maps,
/// enums and serializable classes of the unit, and type parameters of generic
/// classes; config-registered codecs and user converters take precedence.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_CODEGEN_CONVERSION_REGISTRY_H
#define LLVMJSONGEN_CODEGEN_CONVERSION_REGISTRY_H

#include "llvmjsongen/Semantics/Config.h"
#include "llvmjsongen/Semantics/Model.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace llvmjsongen
{

/// @brief Qualified namespace prefix of the codec runtime used in generated code.
inline constexpr llvm::StringLiteral kRuntimeNamespace("::llvmjsongen::rt::");

class ConversionRegistry;

/// @brief Interface implemented by one per-type converter.
class TypeConverter
{
public:
    virtual ~TypeConverter() = default;

    /// @brief Returns stable converter identifier.
    /// @return Converter ID.
    [[nodiscard]] virtual std::string id() const = 0;

    /// @brief Indicates whether this converter handles a type.
    /// @param[in] type Declared type.
    /// @return True when `codecFor` should be used.
    [[nodiscard]] virtual bool matches(const TypeRef& type) const = 0;

    /// @brief Builds the codec expression for a matched type.
    /// @param[in] type Declared type.
    /// @param[in] registry Registry used for nested argument types.
    /// @param[in] element Element named in errors.
    /// @return Codec expression or an `UnsupportedTypeError`.
    [[nodiscard]] virtual llvm::Expected<std::string> codecFor(const TypeRef&            type,
                                                               const ConversionRegistry& registry,
                                                               llvm::StringRef           element) const = 0;
};

/// @brief What the emitter generates for one serializable class of the unit.
struct ClassCodecFacts final
{
    /// @brief Number of type parameters.
    std::size_t arity{0};

    /// @brief Resolved `genericArgumentFactories`.
    bool genericArgumentFactories{false};

    /// @brief Resolved `createFactory`.
    bool hasFromJson{true};

    /// @brief Resolved `createToJson`.
    bool hasToJson{true};
};

/// @brief Facts of the unit the built-in converters need.
struct ConversionContext final
{
    /// @brief Enum names of the unit.
    std::vector<std::string> enums;

    /// @brief Serializable classes of the unit keyed by name.
    std::map<std::string, ClassCodecFacts> classes;

    /// @brief Config-registered codecs.
    std::vector<TypeCodecBinding> typeCodecs;

    /// @brief Type parameters of the class being emitted.
    std::vector<std::string> typeParameters;

    /// @brief Resolved `genericArgumentFactories` of the class being emitted.
    bool genericArgumentFactories{false};
};

/// @brief Builds a context for one class of a unit.
/// @param[in] unit Unit model.
/// @param[in] classes Facts of every serializable class of the unit.
/// @param[in] typeCodecs Config-registered codecs.
/// @param[in] owner Class being emitted; `nullptr` for unit-level fragments.
/// @param[in] ownerGenericFactories Resolved `genericArgumentFactories` of the owner.
/// @return Context.
ConversionContext makeConversionContext(const UnitModel&                              unit,
                                        const std::map<std::string, ClassCodecFacts>& classes,
                                        const std::vector<TypeCodecBinding>&          typeCodecs,
                                        const ClassModel*                             owner,
                                        bool                                          ownerGenericFactories);

/// @brief Ordered converter registry; the most recently registered match wins.
class ConversionRegistry final
{
public:
    /// @brief Constructs registry with built-in and config converters installed.
    /// @param[in] context Unit facts.
    explicit ConversionRegistry(ConversionContext context);

    /// @brief Registers one converter ahead of every converter registered before it.
    /// @param[in] converter Converter instance.
    void registerConverter(std::unique_ptr<TypeConverter> converter);

    /// @brief Resolves the codec expression for a type.
    /// @param[in] type Declared type.
    /// @param[in] element Element named in errors.
    /// @return Codec expression or an `UnsupportedTypeError`.
    [[nodiscard]] llvm::Expected<std::string> codecFor(const TypeRef& type, llvm::StringRef element) const;

    /// @brief Returns the unit facts.
    /// @return Context.
    [[nodiscard]] const ConversionContext& context() const
    {
        return context_;
    }

private:
    ConversionContext                           context_;
    std::vector<std::unique_ptr<TypeConverter>> converters_;
};

/// @brief Returns the name of the codec parameter generated for a type parameter (`T` -> `codecT`).
/// @param[in] typeParameter Type parameter name.
/// @return Parameter identifier.
std::string codecParameterName(llvm::StringRef typeParameter);

/// @brief Returns the name of the codec template parameter for a type parameter (`T` -> `TCodec`).
/// @param[in] typeParameter Type parameter name.
/// @return Template parameter identifier.
std::string codecTemplateParameterName(llvm::StringRef typeParameter);

/// @brief Returns true for the scalar types the runtime `ScalarCodec` handles.
/// @param[in] type Declared type.
/// @return True for scalars.
bool isScalarType(const TypeRef& type);

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_CODEGEN_CONVERSION_REGISTRY_H
