//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the built-in type converters and the converter registry.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/CodeGen/ConversionRegistry.h"

#include "llvmjsongen/CodeGen/NamingPolicy.h"
#include "llvmjsongen/Support/GenerationError.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringSet.h"

#include <utility>

namespace llvmjsongen
{
namespace
{

const llvm::StringSet<>& scalarTypeNames()
{
    static const llvm::StringSet<> names = {"bool",
                                            "short",
                                            "short int",
                                            "unsigned short",
                                            "unsigned short int",
                                            "int",
                                            "signed",
                                            "signed int",
                                            "unsigned",
                                            "unsigned int",
                                            "long",
                                            "long int",
                                            "unsigned long",
                                            "unsigned long int",
                                            "long long",
                                            "long long int",
                                            "unsigned long long",
                                            "unsigned long long int",
                                            "std::int8_t",
                                            "std::int16_t",
                                            "std::int32_t",
                                            "std::int64_t",
                                            "std::uint8_t",
                                            "std::uint16_t",
                                            "std::uint32_t",
                                            "std::uint64_t",
                                            "std::size_t",
                                            "std::ptrdiff_t",
                                            "int8_t",
                                            "int16_t",
                                            "int32_t",
                                            "int64_t",
                                            "uint8_t",
                                            "uint16_t",
                                            "uint32_t",
                                            "uint64_t",
                                            "size_t",
                                            "float",
                                            "double",
                                            "long double",
                                            "std::string"};
    return names;
}

llvm::Error unsupported(llvm::StringRef element, std::string message)
{
    return makeGenerationError(GenerationErrorKind::UnsupportedType, element.str(), std::move(message));
}

std::string runtimeName(llvm::StringRef name)
{
    return kRuntimeNamespace.str() + name.str();
}

class ScalarConverter final : public TypeConverter
{
public:
    [[nodiscard]] std::string id() const override
    {
        return "scalar";
    }

    [[nodiscard]] bool matches(const TypeRef& type) const override
    {
        return isScalarType(type);
    }

    [[nodiscard]] llvm::Expected<std::string> codecFor(const TypeRef&,
                                                       const ConversionRegistry&,
                                                       llvm::StringRef) const override
    {
        return runtimeName("ScalarCodec{}");
    }
};

class PassthroughConverter final : public TypeConverter
{
public:
    [[nodiscard]] std::string id() const override
    {
        return "json-value";
    }

    [[nodiscard]] bool matches(const TypeRef& type) const override
    {
        return type.arguments.empty() && (type.name == "llvm::json::Value" || type.name == "::llvm::json::Value");
    }

    [[nodiscard]] llvm::Expected<std::string> codecFor(const TypeRef&,
                                                       const ConversionRegistry&,
                                                       llvm::StringRef) const override
    {
        return runtimeName("PassthroughCodec{}");
    }
};

/// Wraps the codec of the single template argument: `std::optional<T>`, `std::vector<T>`, ...
class WrapperConverter final : public TypeConverter
{
public:
    WrapperConverter(std::string id, std::vector<std::string> typeNames, std::string factory)
        : id_(std::move(id))
        , typeNames_(std::move(typeNames))
        , factory_(std::move(factory))
    {
    }

    [[nodiscard]] std::string id() const override
    {
        return id_;
    }

    [[nodiscard]] bool matches(const TypeRef& type) const override
    {
        return llvm::is_contained(typeNames_, type.name);
    }

    [[nodiscard]] llvm::Expected<std::string> codecFor(const TypeRef&            type,
                                                       const ConversionRegistry& registry,
                                                       llvm::StringRef           element) const override
    {
        if (type.arguments.size() != 1U)
        {
            return unsupported(element, "`" + type.str() + "` must have exactly one template argument");
        }
        auto inner = registry.codecFor(type.arguments.front(), element);
        if (!inner)
        {
            return inner.takeError();
        }
        return runtimeName(factory_) + "(" + *inner + ")";
    }

private:
    std::string              id_;
    std::vector<std::string> typeNames_;
    std::string              factory_;
};

class MappingConverter final : public TypeConverter
{
public:
    [[nodiscard]] std::string id() const override
    {
        return "mapping";
    }

    [[nodiscard]] bool matches(const TypeRef& type) const override
    {
        return type.name == "std::map" || type.name == "std::unordered_map";
    }

    [[nodiscard]] llvm::Expected<std::string> codecFor(const TypeRef&            type,
                                                       const ConversionRegistry& registry,
                                                       llvm::StringRef           element) const override
    {
        if (type.arguments.size() != 2U)
        {
            return unsupported(element, "`" + type.str() + "` must have a key and a value type");
        }
        if (type.arguments.front().str() != "std::string")
        {
            return unsupported(element,
                               "`" + type.str() + "` is not supported: JSON object keys require `std::string` map keys");
        }
        auto inner = registry.codecFor(type.arguments[1], element);
        if (!inner)
        {
            return inner.takeError();
        }
        return runtimeName("makeMappingCodec") + "(" + *inner + ")";
    }
};

class EnumConverter final : public TypeConverter
{
public:
    explicit EnumConverter(std::vector<std::string> enums)
        : enums_(std::move(enums))
    {
    }

    [[nodiscard]] std::string id() const override
    {
        return "enum";
    }

    [[nodiscard]] bool matches(const TypeRef& type) const override
    {
        return type.arguments.empty() && llvm::is_contained(enums_, type.name);
    }

    [[nodiscard]] llvm::Expected<std::string> codecFor(const TypeRef& type,
                                                       const ConversionRegistry&,
                                                       llvm::StringRef) const override
    {
        return runtimeName("makeEnumCodec") + "(" + type.name + "EnumMap)";
    }

private:
    std::vector<std::string> enums_;
};

class ClassConverter final : public TypeConverter
{
public:
    explicit ClassConverter(std::map<std::string, ClassCodecFacts> classes)
        : classes_(std::move(classes))
    {
    }

    [[nodiscard]] std::string id() const override
    {
        return "class";
    }

    [[nodiscard]] bool matches(const TypeRef& type) const override
    {
        return classes_.count(type.name) != 0U;
    }

    [[nodiscard]] llvm::Expected<std::string> codecFor(const TypeRef&            type,
                                                       const ConversionRegistry& registry,
                                                       llvm::StringRef           element) const override
    {
        const ClassCodecFacts& facts = classes_.at(type.name);
        if (type.arguments.size() != facts.arity)
        {
            return unsupported(element,
                               "`" + type.str() + "` passes " + std::to_string(type.arguments.size()) +
                                   " template arguments but `" + type.name + "` declares " +
                                   std::to_string(facts.arity));
        }

        const std::string spelling = type.str();
        if (facts.arity == 0U)
        {
            return runtimeName("makeFunctionCodec") + "<" + spelling + ">(" + functionName(type, "FromJson", facts) +
                   ", " + functionName(type, "ToJson", facts) + ")";
        }

        std::string explicitArguments = "<";
        for (std::size_t i = 0; i < type.arguments.size(); ++i)
        {
            explicitArguments += (i > 0 ? ", " : "") + type.arguments[i].str();
        }
        explicitArguments += ">";

        if (!facts.genericArgumentFactories)
        {
            return runtimeName("makeFunctionCodec") + "<" + spelling + ">(" +
                   functionName(type, "FromJson" + explicitArguments, facts) + ", " +
                   functionName(type, "ToJson" + explicitArguments, facts) + ")";
        }

        std::string codecArguments;
        for (const TypeRef& argument : type.arguments)
        {
            auto codec = registry.codecFor(argument, element);
            if (!codec)
            {
                return codec.takeError();
            }
            codecArguments += ", " + *codec;
        }

        std::string decoder = "nullptr";
        if (facts.hasFromJson)
        {
            decoder = "[&](const llvm::json::Value& json, std::optional<" + spelling +
                      ">& out, llvm::json::Path path) { return " + type.name + "FromJson" + explicitArguments +
                      "(json, out, path" + codecArguments + "); }";
        }
        std::string encoder = "nullptr";
        if (facts.hasToJson)
        {
            encoder = "[&](const " + spelling + "& value) { return " + type.name + "ToJson" + explicitArguments +
                      "(value" + codecArguments + "); }";
        }
        return runtimeName("makeFunctionCodec") + "<" + spelling + ">(" + decoder + ", " + encoder + ")";
    }

private:
    static std::string functionName(const TypeRef& type, const std::string& suffix, const ClassCodecFacts& facts)
    {
        const bool available = llvm::StringRef(suffix).startswith("FromJson") ? facts.hasFromJson : facts.hasToJson;
        return available ? type.name + suffix : "nullptr";
    }

    std::map<std::string, ClassCodecFacts> classes_;
};

class TypeParameterConverter final : public TypeConverter
{
public:
    TypeParameterConverter(std::vector<std::string> typeParameters, bool genericArgumentFactories)
        : typeParameters_(std::move(typeParameters))
        , genericArgumentFactories_(genericArgumentFactories)
    {
    }

    [[nodiscard]] std::string id() const override
    {
        return "type-parameter";
    }

    [[nodiscard]] bool matches(const TypeRef& type) const override
    {
        return type.arguments.empty() && llvm::is_contained(typeParameters_, type.name);
    }

    [[nodiscard]] llvm::Expected<std::string> codecFor(const TypeRef&            type,
                                                       const ConversionRegistry&,
                                                       llvm::StringRef element) const override
    {
        if (!genericArgumentFactories_)
        {
            return unsupported(element,
                               "type parameter `" + type.name + "` requires `genericArgumentFactories: true`");
        }
        return codecParameterName(type.name);
    }

private:
    std::vector<std::string> typeParameters_;
    bool                     genericArgumentFactories_;
};

class ConfiguredCodecConverter final : public TypeConverter
{
public:
    explicit ConfiguredCodecConverter(TypeCodecBinding binding)
        : binding_(std::move(binding))
    {
    }

    [[nodiscard]] std::string id() const override
    {
        return "config:" + binding_.typeName;
    }

    [[nodiscard]] bool matches(const TypeRef& type) const override
    {
        return type.str() == binding_.typeName;
    }

    [[nodiscard]] llvm::Expected<std::string> codecFor(const TypeRef&,
                                                       const ConversionRegistry&,
                                                       llvm::StringRef) const override
    {
        return binding_.codecExpression;
    }

private:
    TypeCodecBinding binding_;
};

}  // namespace

ConversionContext makeConversionContext(const UnitModel&                              unit,
                                        const std::map<std::string, ClassCodecFacts>& classes,
                                        const std::vector<TypeCodecBinding>&          typeCodecs,
                                        const ClassModel*                             owner,
                                        const bool                                    ownerGenericFactories)
{
    ConversionContext context;
    for (const EnumModel& model : unit.enums)
    {
        context.enums.push_back(model.name);
    }
    context.classes    = classes;
    context.typeCodecs = typeCodecs;
    if (owner != nullptr)
    {
        context.typeParameters           = owner->typeParameters;
        context.genericArgumentFactories = ownerGenericFactories;
    }
    return context;
}

ConversionRegistry::ConversionRegistry(ConversionContext context)
    : context_(std::move(context))
{
    registerConverter(std::make_unique<ScalarConverter>());
    registerConverter(std::make_unique<PassthroughConverter>());
    registerConverter(std::make_unique<WrapperConverter>("nullable",
                                                         std::vector<std::string>{"std::optional"},
                                                         "makeNullableCodec"));
    registerConverter(
        std::make_unique<WrapperConverter>("sequence",
                                           std::vector<std::string>{"std::vector", "std::deque", "std::list"},
                                           "makeSequenceCodec"));
    registerConverter(std::make_unique<MappingConverter>());
    registerConverter(std::make_unique<EnumConverter>(context_.enums));
    registerConverter(std::make_unique<ClassConverter>(context_.classes));
    registerConverter(
        std::make_unique<TypeParameterConverter>(context_.typeParameters, context_.genericArgumentFactories));
    for (const TypeCodecBinding& binding : context_.typeCodecs)
    {
        registerConverter(std::make_unique<ConfiguredCodecConverter>(binding));
    }
}

void ConversionRegistry::registerConverter(std::unique_ptr<TypeConverter> converter)
{
    converters_.insert(converters_.begin(), std::move(converter));
}

llvm::Expected<std::string> ConversionRegistry::codecFor(const TypeRef& type, llvm::StringRef element) const
{
    for (const auto& converter : converters_)
    {
        if (converter->matches(type))
        {
            return converter->codecFor(type, *this, element);
        }
    }
    return unsupported(element, "no codec is registered for type `" + type.str() + "`");
}

std::string codecParameterName(llvm::StringRef typeParameter)
{
    return codegenSanitizeIdentifier("codec" + typeParameter.str());
}

std::string codecTemplateParameterName(llvm::StringRef typeParameter)
{
    return codegenSanitizeIdentifier(typeParameter.str() + "Codec");
}

bool isScalarType(const TypeRef& type)
{
    return type.arguments.empty() && scalarTypeNames().contains(type.name);
}

}  // namespace llvmjsongen
