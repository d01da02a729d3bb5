//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements unit model loading from JSON.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/Frontend/ModelReader.h"

#include "llvmjsongen/Frontend/TypeSpelling.h"
#include "llvmjsongen/Support/GenerationError.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace llvmjsongen
{
namespace
{

llvm::Error invalid(std::string element, std::string message)
{
    return makeGenerationError(GenerationErrorKind::InvalidModel, std::move(element), std::move(message));
}

const llvm::json::Object* asObject(const llvm::json::Value& value)
{
    return value.getAsObject();
}

llvm::Expected<std::string> readString(const llvm::json::Object& object,
                                       llvm::StringRef           key,
                                       const std::string&        element,
                                       bool                      required)
{
    const llvm::json::Value* value = object.get(key);
    if (value == nullptr || value->kind() == llvm::json::Value::Null)
    {
        if (required)
        {
            return invalid(element, "missing required key `" + key.str() + "`");
        }
        return std::string();
    }
    const auto text = value->getAsString();
    if (!text)
    {
        return invalid(element, "`" + key.str() + "` must be a string");
    }
    return text->str();
}

llvm::Expected<bool> readBool(const llvm::json::Object& object, llvm::StringRef key, const std::string& element)
{
    const llvm::json::Value* value = object.get(key);
    if (value == nullptr)
    {
        return false;
    }
    const auto flag = value->getAsBoolean();
    if (!flag)
    {
        return invalid(element, "`" + key.str() + "` must be a boolean");
    }
    return *flag;
}

llvm::Expected<std::uint32_t> readLine(const llvm::json::Object& object, const std::string& element)
{
    const llvm::json::Value* value = object.get("line");
    if (value == nullptr)
    {
        return 1U;
    }
    const auto line = value->getAsInteger();
    if (!line || *line < 1 || *line > std::numeric_limits<std::uint32_t>::max())
    {
        return invalid(element, "`line` must be a positive integer");
    }
    return static_cast<std::uint32_t>(*line);
}

// Reads an optional annotation: absent or null means none, `true` means an empty payload.
llvm::Expected<std::optional<llvm::json::Object>> readAnnotation(const llvm::json::Object& object,
                                                                 llvm::StringRef           key,
                                                                 const std::string&        element)
{
    const llvm::json::Value* value = object.get(key);
    if (value == nullptr || value->kind() == llvm::json::Value::Null)
    {
        return std::optional<llvm::json::Object>();
    }
    if (const auto flag = value->getAsBoolean())
    {
        if (!*flag)
        {
            return std::optional<llvm::json::Object>();
        }
        return std::optional<llvm::json::Object>(llvm::json::Object{});
    }
    const llvm::json::Object* payload = value->getAsObject();
    if (payload == nullptr)
    {
        return invalid(element, "`" + key.str() + "` must be an object or a boolean");
    }
    return std::optional<llvm::json::Object>(*payload);
}

llvm::Expected<std::vector<std::string>> readStringArray(const llvm::json::Object& object,
                                                         llvm::StringRef           key,
                                                         const std::string&        element)
{
    std::vector<std::string>  out;
    const llvm::json::Value* value = object.get(key);
    if (value == nullptr)
    {
        return out;
    }
    const llvm::json::Array* array = value->getAsArray();
    if (array == nullptr)
    {
        return invalid(element, "`" + key.str() + "` must be an array of strings");
    }
    out.reserve(array->size());
    for (const llvm::json::Value& item : *array)
    {
        const auto text = item.getAsString();
        if (!text)
        {
            return invalid(element, "`" + key.str() + "` must be an array of strings");
        }
        out.emplace_back(text->str());
    }
    return out;
}

const llvm::json::Array* readArray(const llvm::json::Object& object, llvm::StringRef key)
{
    const llvm::json::Value* value = object.get(key);
    return value == nullptr ? nullptr : value->getAsArray();
}

llvm::Expected<FieldVisibility> parseVisibility(llvm::StringRef text, const std::string& element)
{
    if (text.empty() || text == "public")
    {
        return FieldVisibility::Public;
    }
    if (text == "protected")
    {
        return FieldVisibility::Protected;
    }
    if (text == "private")
    {
        return FieldVisibility::Private;
    }
    return invalid(element, "unknown visibility `" + text.str() + "`");
}

llvm::Expected<FieldDescriptor> readField(const llvm::json::Value& value, const std::string& className)
{
    const llvm::json::Object* object = asObject(value);
    if (object == nullptr)
    {
        return invalid(className, "each field must be an object");
    }
    auto name = readString(*object, "name", className, true);
    if (!name)
    {
        return name.takeError();
    }
    if (name->empty())
    {
        return invalid(className, "field name must not be empty");
    }

    FieldDescriptor   field;
    const std::string element = className + "." + *name;
    field.name                = *name;
    field.declaringClass      = className;

    auto typeSpelling = readString(*object, "type", element, true);
    if (!typeSpelling)
    {
        return typeSpelling.takeError();
    }
    auto type = parseTypeSpelling(*typeSpelling);
    if (!type)
    {
        const GenerationErrorInfo info = takeGenerationErrorInfo(type.takeError());
        return invalid(element, "invalid type `" + *typeSpelling + "`: " + info.message);
    }
    field.type = std::move(*type);

    auto visibility = readString(*object, "visibility", element, false);
    if (!visibility)
    {
        return visibility.takeError();
    }
    auto parsedVisibility = parseVisibility(*visibility, element);
    if (!parsedVisibility)
    {
        return parsedVisibility.takeError();
    }
    field.visibility = *parsedVisibility;

    auto isFinal = readBool(*object, "final", element);
    if (!isFinal)
    {
        return isFinal.takeError();
    }
    field.isFinal = *isFinal;

    auto isWriteOnly = readBool(*object, "writeOnly", element);
    if (!isWriteOnly)
    {
        return isWriteOnly.takeError();
    }
    field.isWriteOnly = *isWriteOnly;

    auto getter = readString(*object, "getter", element, false);
    if (!getter)
    {
        return getter.takeError();
    }
    field.getter = std::move(*getter);

    auto setter = readString(*object, "setter", element, false);
    if (!setter)
    {
        return setter.takeError();
    }
    field.setter = std::move(*setter);

    auto key = readAnnotation(*object, "key", element);
    if (!key)
    {
        return key.takeError();
    }
    field.keyAnnotation = std::move(*key);

    auto line = readLine(*object, element);
    if (!line)
    {
        return line.takeError();
    }
    field.line = *line;
    return field;
}

llvm::Expected<ConstructorParam> readConstructorParam(const llvm::json::Value& value, const std::string& className)
{
    const llvm::json::Object* object = asObject(value);
    if (object == nullptr)
    {
        return invalid(className, "each constructor parameter must be an object");
    }
    ConstructorParam param;
    auto             name = readString(*object, "name", className, true);
    if (!name)
    {
        return name.takeError();
    }
    param.name = std::move(*name);

    const std::string element = className + "(" + param.name + ")";
    auto              type    = readString(*object, "type", element, false);
    if (!type)
    {
        return type.takeError();
    }
    param.type = std::move(*type);

    auto hasDefault = readBool(*object, "hasDefault", element);
    if (!hasDefault)
    {
        return hasDefault.takeError();
    }
    param.hasDefault = *hasDefault;
    return param;
}

llvm::Expected<ClassModel> readClass(const llvm::json::Value& value, const std::string& unitName)
{
    const llvm::json::Object* object = asObject(value);
    if (object == nullptr)
    {
        return invalid(unitName, "each class must be an object");
    }
    auto name = readString(*object, "name", unitName, true);
    if (!name)
    {
        return name.takeError();
    }

    ClassModel model;
    model.name = *name;

    auto line = readLine(*object, model.name);
    if (!line)
    {
        return line.takeError();
    }
    model.line = *line;

    auto supertype = readString(*object, "supertype", model.name, false);
    if (!supertype)
    {
        return supertype.takeError();
    }
    model.supertype = std::move(*supertype);

    auto typeParameters = readStringArray(*object, "typeParameters", model.name);
    if (!typeParameters)
    {
        return typeParameters.takeError();
    }
    model.typeParameters = std::move(*typeParameters);

    auto annotation = readAnnotation(*object, "annotation", model.name);
    if (!annotation)
    {
        return annotation.takeError();
    }
    model.serializableAnnotation = std::move(*annotation);

    if (const llvm::json::Array* params = readArray(*object, "constructor"))
    {
        for (const llvm::json::Value& item : *params)
        {
            auto param = readConstructorParam(item, model.name);
            if (!param)
            {
                return param.takeError();
            }
            model.constructorParams.push_back(std::move(*param));
        }
    }

    llvm::StringSet<> seen;
    if (const llvm::json::Array* fields = readArray(*object, "fields"))
    {
        for (const llvm::json::Value& item : *fields)
        {
            auto field = readField(item, model.name);
            if (!field)
            {
                return field.takeError();
            }
            if (!seen.insert(field->name).second)
            {
                return invalid(model.name + "." + field->name, "field is declared more than once");
            }
            model.fields.push_back(std::move(*field));
        }
    }
    return model;
}

llvm::Expected<EnumValueModel> readEnumValue(const llvm::json::Value& value, const std::string& enumName)
{
    EnumValueModel out;
    if (const auto text = value.getAsString())
    {
        out.name = text->str();
    }
    else if (const llvm::json::Object* object = value.getAsObject())
    {
        auto name = readString(*object, "name", enumName, true);
        if (!name)
        {
            return name.takeError();
        }
        out.name = std::move(*name);
        auto json = readString(*object, "json", enumName + "." + out.name, false);
        if (!json)
        {
            return json.takeError();
        }
        out.jsonValue = std::move(*json);
    }
    else
    {
        return invalid(enumName, "each enumerator must be a string or an object");
    }
    if (out.name.empty())
    {
        return invalid(enumName, "enumerator name must not be empty");
    }
    return out;
}

llvm::Expected<EnumModel> readEnum(const llvm::json::Value& value, const std::string& unitName)
{
    const llvm::json::Object* object = asObject(value);
    if (object == nullptr)
    {
        return invalid(unitName, "each enum must be an object");
    }
    auto name = readString(*object, "name", unitName, true);
    if (!name)
    {
        return name.takeError();
    }

    EnumModel model;
    model.name = *name;

    auto line = readLine(*object, model.name);
    if (!line)
    {
        return line.takeError();
    }
    model.line = *line;

    auto annotation = readAnnotation(*object, "annotation", model.name);
    if (!annotation)
    {
        return annotation.takeError();
    }
    model.enumAnnotation = std::move(*annotation);

    llvm::StringSet<> seen;
    if (const llvm::json::Array* values = readArray(*object, "values"))
    {
        for (const llvm::json::Value& item : *values)
        {
            auto enumerator = readEnumValue(item, model.name);
            if (!enumerator)
            {
                return enumerator.takeError();
            }
            if (!seen.insert(enumerator->name).second)
            {
                return invalid(model.name + "." + enumerator->name, "enumerator is declared more than once");
            }
            model.values.push_back(std::move(*enumerator));
        }
    }
    return model;
}

std::string resolveSourcePath(llvm::StringRef source, llvm::StringRef modelPath)
{
    if (source.empty() || llvm::sys::path::is_absolute(source) || modelPath.empty())
    {
        return source.str();
    }
    llvm::SmallString<256> resolved(llvm::sys::path::parent_path(modelPath));
    llvm::sys::path::append(resolved, source);
    return std::string(resolved.str());
}

}  // namespace

llvm::Expected<UnitModel> readUnitModel(const llvm::json::Value& document, llvm::StringRef modelPath)
{
    const std::string         root   = modelPath.empty() ? std::string("<model>") : modelPath.str();
    const llvm::json::Object* object = document.getAsObject();
    if (object == nullptr)
    {
        return invalid(root, "unit model must be a JSON object");
    }

    UnitModel unit;
    unit.modelPath = modelPath.str();

    auto name = readString(*object, "unit", root, true);
    if (!name)
    {
        return name.takeError();
    }
    if (name->empty())
    {
        return invalid(root, "unit name must not be empty");
    }
    unit.name = std::move(*name);

    auto source = readString(*object, "source", unit.name, true);
    if (!source)
    {
        return source.takeError();
    }
    unit.sourcePath = resolveSourcePath(*source, modelPath);

    auto include = readString(*object, "include", unit.name, false);
    if (!include)
    {
        return include.takeError();
    }
    unit.includePath = include->empty() ? llvm::sys::path::filename(*source).str() : std::move(*include);

    auto cppNamespace = readString(*object, "namespace", unit.name, false);
    if (!cppNamespace)
    {
        return cppNamespace.takeError();
    }
    unit.cppNamespace = std::move(*cppNamespace);

    llvm::StringSet<> declared;
    if (const llvm::json::Array* classes = readArray(*object, "classes"))
    {
        for (const llvm::json::Value& item : *classes)
        {
            auto model = readClass(item, unit.name);
            if (!model)
            {
                return model.takeError();
            }
            if (!declared.insert(model->name).second)
            {
                return invalid(model->name, "declaration name is used more than once in the unit");
            }
            unit.classes.push_back(std::move(*model));
        }
    }
    if (const llvm::json::Array* enums = readArray(*object, "enums"))
    {
        for (const llvm::json::Value& item : *enums)
        {
            auto model = readEnum(item, unit.name);
            if (!model)
            {
                return model.takeError();
            }
            if (!declared.insert(model->name).second)
            {
                return invalid(model->name, "declaration name is used more than once in the unit");
            }
            unit.enums.push_back(std::move(*model));
        }
    }

    // Inherited fields must not collide with the subclass's own fields.
    for (const ClassModel& model : unit.classes)
    {
        auto fields = collectSortedFields(unit, model);
        if (!fields)
        {
            return fields.takeError();
        }
    }
    return unit;
}

llvm::Expected<UnitModel> loadUnitModel(llvm::StringRef modelPath)
{
    auto buffer = llvm::MemoryBuffer::getFile(modelPath);
    if (!buffer)
    {
        return makeGenerationError(GenerationErrorKind::Io,
                                   modelPath.str(),
                                   "cannot read unit model: " + buffer.getError().message());
    }
    auto document = llvm::json::parse((*buffer)->getBuffer());
    if (!document)
    {
        return invalid(modelPath.str(), "malformed JSON: " + llvm::toString(document.takeError()));
    }
    return readUnitModel(*document, modelPath);
}

}  // namespace llvmjsongen
