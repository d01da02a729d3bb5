//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements deterministic emission of JSON binding fragments.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/CodeGen/CodeEmitter.h"

#include "llvmjsongen/CodeGen/NamingPolicy.h"
#include "llvmjsongen/Support/GenerationError.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringMap.h"

#include <cstddef>
#include <sstream>

namespace llvmjsongen
{
namespace
{

void emitLine(std::ostringstream& out, const int indent, const std::string& line)
{
    out << std::string(static_cast<std::size_t>(indent) * 4U, ' ') << line << '\n';
}

std::string rt(llvm::StringRef name)
{
    return kRuntimeNamespace.str() + name.str();
}

std::string quoted(llvm::StringRef text)
{
    return "\"" + escapeCppString(text) + "\"";
}

bool takesCodecs(const ClassModel& model, const ResolvedConfig& config)
{
    return !model.typeParameters.empty() && config.genericArgumentFactories;
}

// `template <typename T, typename TCodec>` for generic classes, empty otherwise.
std::string templateHeader(const ClassModel& model, const ResolvedConfig& config)
{
    if (model.typeParameters.empty())
    {
        return "";
    }
    std::string header = "template <";
    for (std::size_t i = 0; i < model.typeParameters.size(); ++i)
    {
        header += (i > 0 ? ", typename " : "typename ") + model.typeParameters[i];
    }
    if (takesCodecs(model, config))
    {
        for (const std::string& parameter : model.typeParameters)
        {
            header += ", typename " + codecTemplateParameterName(parameter);
        }
    }
    return header + ">";
}

std::string codecParameters(const ClassModel& model, const ResolvedConfig& config)
{
    std::string out;
    if (takesCodecs(model, config))
    {
        for (const std::string& parameter : model.typeParameters)
        {
            out += ", const " + codecTemplateParameterName(parameter) + "& " + codecParameterName(parameter);
        }
    }
    return out;
}

std::string decodeSignature(const ClassModel& model, const ResolvedConfig& config)
{
    return "bool " + model.name + "FromJson(const llvm::json::Value& json, std::optional<" + classTypeSpelling(model) +
           ">& out, llvm::json::Path path" + codecParameters(model, config) + ")";
}

std::string encodeSignature(const ClassModel& model, const ResolvedConfig& config)
{
    return "llvm::json::Value " + model.name + "ToJson(const " + classTypeSpelling(model) + "& instance" +
           codecParameters(model, config) + ")";
}

// Emits either a template header line or returns the `inline ` prefix for the signature line.
std::string openFunction(std::ostringstream& out, const ClassModel& model, const ResolvedConfig& config)
{
    const std::string header = templateHeader(model, config);
    if (header.empty())
    {
        return "inline ";
    }
    emitLine(out, 0, header);
    return "";
}

std::string slotName(const FieldDescriptor& field)
{
    return codegenSanitizeIdentifier(field.name + "Slot");
}

std::string accessExpression(const FieldDescriptor& field)
{
    return "instance." + (field.getter.empty() ? field.name : field.getter);
}

std::string fieldElement(const ClassModel& model, const FieldDescriptor& field)
{
    return model.name + "." + field.name;
}

const std::string& jsonKeyOf(const ResolvedConfig& config, const FieldDescriptor& field)
{
    const ResolvedFieldConfig* fieldConfig = config.field(field.name);
    return fieldConfig != nullptr ? fieldConfig->jsonKey : field.name;
}

llvm::Expected<std::string> fieldCodec(const ClassEmitInput& input, const FieldDescriptor& field)
{
    const ResolvedFieldConfig* fieldConfig = input.config.field(field.name);
    const std::string          type        = field.type.str();
    const bool customDecode = fieldConfig != nullptr && !fieldConfig->fromJson.empty();
    const bool customEncode = fieldConfig != nullptr && !fieldConfig->toJson.empty();
    if (customDecode && customEncode)
    {
        return rt("makeFunctionCodec") + "<" + type + ">(" + fieldConfig->fromJson + ", " + fieldConfig->toJson + ")";
    }

    auto codec = input.registry.codecFor(field.type, fieldElement(input.model, field));
    if (!codec)
    {
        return codec.takeError();
    }
    if (customDecode || customEncode)
    {
        return rt("makeOverrideCodec") + "<" + type + ">(" + (customDecode ? fieldConfig->fromJson : "nullptr") +
               ", " + (customEncode ? fieldConfig->toJson : "nullptr") + ", " + *codec + ")";
    }
    return *codec;
}

bool isConstructorBound(const FieldSelection& selection, const FieldDescriptor& field)
{
    return llvm::is_contained(selection.factory.constructorFields, field.name);
}

const FieldDescriptor* findSelected(const std::vector<FieldDescriptor>& fields, llvm::StringRef name)
{
    for (const FieldDescriptor& field : fields)
    {
        if (field.name == name)
        {
            return &field;
        }
    }
    return nullptr;
}

}  // namespace

llvm::Expected<std::string> emitDecodeFactory(const ClassEmitInput& input)
{
    const ClassModel&     model     = input.model;
    const ResolvedConfig& config    = input.config;
    const FieldSelection& selection = input.selection;

    std::ostringstream out;
    const std::string  prefix = openFunction(out, model, config);
    emitLine(out, 0, prefix + decodeSignature(model, config));
    emitLine(out, 0, "{");
    emitLine(out, 1, "const llvm::json::Object* object = json.getAsObject();");
    emitLine(out, 1, "if (object == nullptr) {");
    emitLine(out, 2, "path.report(\"expected object\");");
    emitLine(out, 2, "return false;");
    emitLine(out, 1, "}");

    if (config.disallowUnrecognizedKeys)
    {
        // Encode-only keys stay acceptable so that encoded output always decodes.
        std::vector<std::string> known;
        for (const auto* fields : {&selection.decodeFields, &selection.encodeFields})
        {
            for (const FieldDescriptor& field : *fields)
            {
                const std::string key = quoted(jsonKeyOf(config, field));
                if (!llvm::is_contained(known, key))
                {
                    known.push_back(key);
                }
            }
        }
        emitLine(out, 1, "if (!" + rt("rejectUnknownKeys") + "(*object, {" + llvm::join(known, ", ") + "}, path)) {");
        emitLine(out, 2, "return false;");
        emitLine(out, 1, "}");
    }

    for (const FieldDescriptor& field : selection.decodeFields)
    {
        const ResolvedFieldConfig* fieldConfig = config.field(field.name);
        const std::string          slot        = slotName(field);
        const std::string          key         = quoted(jsonKeyOf(config, field));
        auto                       codec       = fieldCodec(input, field);
        if (!codec)
        {
            return codec.takeError();
        }

        emitLine(out, 1, "std::optional<" + field.type.str() + "> " + slot + ";");
        emitLine(out, 1, "if (!" + rt("readKey") + "(*object, " + key + ", " + slot + ", path, " + *codec + ")) {");
        emitLine(out, 2, "return false;");
        emitLine(out, 1, "}");

        const bool required = fieldConfig != nullptr && fieldConfig->required;
        if (required)
        {
            emitLine(out, 1, "if (!" + slot + ".has_value()) {");
            emitLine(out, 2, "return " + rt("reportMissingKey") + "(path, " + key + ");");
            emitLine(out, 1, "}");
        }
        else if (fieldConfig != nullptr && fieldConfig->defaultValue.has_value())
        {
            emitLine(out, 1, "if (!" + slot + ".has_value()) {");
            emitLine(out, 2, slot + ".emplace(" + *fieldConfig->defaultValue + ");");
            emitLine(out, 1, "}");
        }
        else if (field.type.isNullable())
        {
            emitLine(out, 1, "if (!" + slot + ".has_value()) {");
            emitLine(out, 2, slot + ".emplace(std::nullopt);");
            emitLine(out, 1, "}");
        }
        else if (isConstructorBound(selection, field))
        {
            emitLine(out, 1, "if (!" + slot + ".has_value()) {");
            emitLine(out, 2, "return " + rt("reportMissingKey") + "(path, " + key + ");");
            emitLine(out, 1, "}");
        }
    }

    std::vector<std::string> arguments;
    for (const std::string& name : selection.factory.constructorFields)
    {
        const FieldDescriptor* field = findSelected(selection.decodeFields, name);
        if (field != nullptr)
        {
            arguments.push_back("std::move(*" + slotName(*field) + ")");
        }
    }
    emitLine(out, 1, "out.emplace(" + llvm::join(arguments, ", ") + ");");

    for (const std::string& name : selection.factory.assignedFields)
    {
        const FieldDescriptor* field = findSelected(selection.decodeFields, name);
        if (field == nullptr)
        {
            continue;
        }
        const std::string slot = slotName(*field);
        emitLine(out, 1, "if (" + slot + ".has_value()) {");
        if (field->setter.empty())
        {
            emitLine(out, 2, "out->" + field->name + " = std::move(*" + slot + ");");
        }
        else
        {
            emitLine(out, 2, "out->" + field->setter + "(std::move(*" + slot + "));");
        }
        emitLine(out, 1, "}");
    }
    emitLine(out, 1, "return true;");
    emitLine(out, 0, "}");
    return out.str();
}

llvm::Expected<std::string> emitEncodeFunction(const ClassEmitInput& input)
{
    const ClassModel&     model  = input.model;
    const ResolvedConfig& config = input.config;

    std::ostringstream out;
    const std::string  prefix = openFunction(out, model, config);
    emitLine(out, 0, prefix + encodeSignature(model, config));
    emitLine(out, 0, "{");
    emitLine(out, 1, "llvm::json::Object json;");
    for (const FieldDescriptor& field : input.selection.encodeFields)
    {
        const ResolvedFieldConfig* fieldConfig = config.field(field.name);
        auto                       codec       = fieldCodec(input, field);
        if (!codec)
        {
            return codec.takeError();
        }

        const std::string        access = accessExpression(field);
        std::vector<std::string> conditions;
        const bool includeIfNull = fieldConfig != nullptr ? fieldConfig->includeIfNull : config.includeIfNull;
        if (field.type.isNullable() && !includeIfNull)
        {
            conditions.push_back(access + ".has_value()");
        }
        if (fieldConfig != nullptr && fieldConfig->omitIfDefault)
        {
            const std::string defaultValue = fieldConfig->defaultValue.value_or(field.type.str() + "{}");
            conditions.push_back("!(" + access + " == " + defaultValue + ")");
        }

        const std::string assignment = "json[" + quoted(jsonKeyOf(config, field)) + "] = " + *codec + ".encode(" +
                                       access + ");";
        if (conditions.empty())
        {
            emitLine(out, 1, assignment);
            continue;
        }
        emitLine(out, 1, "if (" + llvm::join(conditions, " && ") + ") {");
        emitLine(out, 2, assignment);
        emitLine(out, 1, "}");
    }
    emitLine(out, 1, "return llvm::json::Value(std::move(json));");
    emitLine(out, 0, "}");
    return out.str();
}

std::string emitFieldMap(const ClassEmitInput& input)
{
    const auto&        fields = input.selection.encodeFields;
    const std::string  type   = "std::array<std::pair<std::string_view, std::string_view>, " +
                             std::to_string(fields.size()) + ">";
    std::ostringstream out;
    if (fields.empty())
    {
        emitLine(out, 0, "inline constexpr " + type + " " + input.model.name + "FieldMap{};");
        return out.str();
    }
    emitLine(out, 0, "inline constexpr " + type + " " + input.model.name + "FieldMap{{");
    for (const FieldDescriptor& field : fields)
    {
        emitLine(out, 1, "{" + quoted(field.name) + ", " + quoted(jsonKeyOf(input.config, field)) + "},");
    }
    emitLine(out, 0, "}};");
    return out.str();
}

std::string emitJsonKeys(const ClassEmitInput& input)
{
    std::ostringstream out;
    const std::string  header = templateHeader(input.model, ResolvedConfig{});
    if (!header.empty())
    {
        emitLine(out, 0, header);
    }
    emitLine(out, 0, "struct " + input.model.name + "JsonKeys final");
    emitLine(out, 0, "{");
    for (const FieldDescriptor& field : input.selection.encodeFields)
    {
        emitLine(out,
                 1,
                 "static constexpr std::string_view " + codegenSanitizeIdentifier(field.name) + " = " +
                     quoted(jsonKeyOf(input.config, field)) + ";");
    }
    emitLine(out, 0, "};");
    return out.str();
}

llvm::Expected<std::string> emitPerFieldToJson(const ClassEmitInput& input)
{
    const ClassModel&     model  = input.model;
    const ResolvedConfig& config = input.config;

    std::ostringstream out;
    const std::string  header = templateHeader(model, ResolvedConfig{});
    if (!header.empty())
    {
        emitLine(out, 0, header);
    }
    emitLine(out, 0, "struct " + model.name + "PerFieldToJson final");
    emitLine(out, 0, "{");

    std::string codecTemplate;
    if (takesCodecs(model, config))
    {
        std::vector<std::string> parameters;
        for (const std::string& parameter : model.typeParameters)
        {
            parameters.push_back("typename " + codecTemplateParameterName(parameter));
        }
        codecTemplate = "template <" + llvm::join(parameters, ", ") + ">";
    }

    bool first = true;
    for (const FieldDescriptor& field : input.selection.encodeFields)
    {
        auto codec = fieldCodec(input, field);
        if (!codec)
        {
            return codec.takeError();
        }
        if (!first)
        {
            out << '\n';
        }
        first = false;
        if (!codecTemplate.empty())
        {
            emitLine(out, 1, codecTemplate);
        }
        emitLine(out,
                 1,
                 "static llvm::json::Value " + codegenSanitizeIdentifier(field.name) + "(const " + field.type.str() +
                     "& input" + codecParameters(model, config) + ")");
        emitLine(out, 1, "{");
        emitLine(out, 2, "return " + *codec + ".encode(input);");
        emitLine(out, 1, "}");
    }
    emitLine(out, 0, "};");
    return out.str();
}

std::string emitPrototypes(const ClassModel& model, const ResolvedConfig& config)
{
    std::ostringstream out;
    const std::string  header = templateHeader(model, config);
    const std::string  prefix = header.empty() ? "inline " : "";
    if (config.createFactory)
    {
        if (!header.empty())
        {
            emitLine(out, 0, header);
        }
        emitLine(out, 0, prefix + decodeSignature(model, config) + ";");
    }
    if (config.createToJson)
    {
        if (!header.empty())
        {
            emitLine(out, 0, header);
        }
        emitLine(out, 0, prefix + encodeSignature(model, config) + ";");
    }
    return out.str();
}

bool wantsMemberInsertion(const ClassModel& model, const ResolvedConfig& config)
{
    return config.addMembers && model.typeParameters.empty() && (config.createFactory || config.createToJson);
}

std::string emitMemberForwarders(const ClassModel&          model,
                                 const ResolvedConfig&      config,
                                 const ForwarderSuppression& suppressed)
{
    if (!wantsMemberInsertion(model, config))
    {
        return "";
    }
    const bool         withFromJson = config.createFactory && !suppressed.fromJson;
    const bool         withToJson   = config.createToJson && !suppressed.toJson;
    std::ostringstream out;
    if (withFromJson)
    {
        emitLine(out,
                 0,
                 "inline bool " + model.name + "::fromJson(const llvm::json::Value& json, std::optional<" + model.name +
                     ">& out, llvm::json::Path path)");
        emitLine(out, 0, "{");
        emitLine(out, 1, "return " + model.name + "FromJson(json, out, path);");
        emitLine(out, 0, "}");
    }
    if (withToJson)
    {
        if (withFromJson)
        {
            out << '\n';
        }
        emitLine(out, 0, "inline llvm::json::Value " + model.name + "::toJson() const");
        emitLine(out, 0, "{");
        emitLine(out, 1, "return " + model.name + "ToJson(*this);");
        emitLine(out, 0, "}");
    }
    return out.str();
}

llvm::Expected<std::string> emitEnumMap(const EnumModel& model)
{
    auto rename = resolveEnumRename(model);
    if (!rename)
    {
        return rename.takeError();
    }

    const std::string type = rt("EnumTable") + "<" + model.name + ", " + std::to_string(model.values.size()) + ">";
    std::ostringstream out;
    if (model.values.empty())
    {
        emitLine(out, 0, "inline constexpr " + type + " " + model.name + "EnumMap{};");
        return out.str();
    }

    llvm::StringMap<std::string> ownerByValue;
    emitLine(out, 0, "inline constexpr " + type + " " + model.name + "EnumMap{{");
    for (const EnumValueModel& value : model.values)
    {
        const std::string spelling = value.jsonValue.empty() ? renameKey(*rename, value.name) : value.jsonValue;
        const auto [existing, inserted] = ownerByValue.try_emplace(spelling, value.name);
        if (!inserted)
        {
            return makeGenerationError(GenerationErrorKind::DuplicateKey,
                                       model.name + "." + value.name,
                                       "More than one enumerator has the JSON value `" + spelling + "`: `" +
                                           existing->second + "` and `" + value.name + "`.");
        }
        emitLine(out, 1, "{" + model.name + "::" + value.name + ", " + quoted(spelling) + "},");
    }
    emitLine(out, 0, "}};");
    return out.str();
}

void collectReferencedEnums(const TypeRef& type, const UnitModel& unit, std::vector<std::string>& out)
{
    if (type.arguments.empty() && findEnum(unit, type.name) != nullptr && !llvm::is_contained(out, type.name))
    {
        out.push_back(type.name);
    }
    for (const TypeRef& argument : type.arguments)
    {
        collectReferencedEnums(argument, unit, out);
    }
}

llvm::Expected<std::vector<std::string>> emitClassFragments(const ClassEmitInput& input, const UnitModel& unit)
{
    std::vector<std::string> fragments;

    std::vector<std::string> enums;
    for (const auto* fields : {&input.selection.decodeFields, &input.selection.encodeFields})
    {
        for (const FieldDescriptor& field : *fields)
        {
            collectReferencedEnums(field.type, unit, enums);
        }
    }
    for (const std::string& name : enums)
    {
        auto table = emitEnumMap(*findEnum(unit, name));
        if (!table)
        {
            return table.takeError();
        }
        fragments.push_back(std::move(*table));
    }

    if (input.config.createFieldMap)
    {
        fragments.push_back(emitFieldMap(input));
    }
    if (input.config.createJsonKeys)
    {
        fragments.push_back(emitJsonKeys(input));
    }
    if (input.config.createPerFieldToJson)
    {
        auto perField = emitPerFieldToJson(input);
        if (!perField)
        {
            return perField.takeError();
        }
        fragments.push_back(std::move(*perField));
    }
    if (input.config.createFactory)
    {
        auto decode = emitDecodeFactory(input);
        if (!decode)
        {
            return decode.takeError();
        }
        fragments.push_back(std::move(*decode));
    }
    if (input.config.createToJson)
    {
        auto encode = emitEncodeFunction(input);
        if (!encode)
        {
            return encode.takeError();
        }
        fragments.push_back(std::move(*encode));
    }
    std::string forwarders = emitMemberForwarders(input.model, input.config, input.suppressedForwarders);
    if (!forwarders.empty())
    {
        fragments.push_back(std::move(forwarders));
    }
    return fragments;
}

}  // namespace llvmjsongen
