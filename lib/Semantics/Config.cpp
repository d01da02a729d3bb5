//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements configuration parsing and the three-scope merge.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/Semantics/Config.h"

#include "llvmjsongen/Support/GenerationError.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/MemoryBuffer.h"

#include <algorithm>
#include <memory>

namespace llvmjsongen
{
namespace
{

struct BooleanOption final
{
    llvm::StringRef                  key;
    std::optional<bool> ConfigLayer::*member;
};

const BooleanOption kLayerBooleans[] = {
    {"createFactory", &ConfigLayer::createFactory},
    {"createToJson", &ConfigLayer::createToJson},
    {"createFieldMap", &ConfigLayer::createFieldMap},
    {"createJsonKeys", &ConfigLayer::createJsonKeys},
    {"createPerFieldToJson", &ConfigLayer::createPerFieldToJson},
    {"genericArgumentFactories", &ConfigLayer::genericArgumentFactories},
    {"includeIfNull", &ConfigLayer::includeIfNull},
    {"disallowUnrecognizedKeys", &ConfigLayer::disallowUnrecognizedKeys},
    {"ignoreUnannotated", &ConfigLayer::ignoreUnannotated},
    {"addMembers", &ConfigLayer::addMembers},
};

llvm::Error configError(llvm::StringRef element, std::string message)
{
    return makeGenerationError(GenerationErrorKind::Configuration, element.str(), std::move(message));
}

// llvm::json::Object iterates in hash order; errors must not depend on it.
std::vector<llvm::StringRef> sortedKeys(const llvm::json::Object& object)
{
    std::vector<llvm::StringRef> keys;
    keys.reserve(object.size());
    for (const auto& entry : object)
    {
        keys.push_back(entry.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

llvm::Error readBoolean(const llvm::json::Value& value,
                        llvm::StringRef          key,
                        llvm::StringRef          element,
                        std::optional<bool>&     out)
{
    const auto parsed = value.getAsBoolean();
    if (!parsed)
    {
        return configError(element, "option `" + key.str() + "` expects a boolean");
    }
    out = *parsed;
    return llvm::Error::success();
}

llvm::Error readNonEmptyString(const llvm::json::Value&    value,
                               llvm::StringRef             key,
                               llvm::StringRef             element,
                               std::optional<std::string>& out)
{
    const auto text = value.getAsString();
    if (!text)
    {
        return configError(element, "option `" + key.str() + "` expects a string");
    }
    if (text->trim().empty())
    {
        return configError(element, "option `" + key.str() + "` must not be empty");
    }
    out = text->str();
    return llvm::Error::success();
}

// Strings are taken as C++ expressions; other scalars are rendered as literals.
llvm::Error readDefaultValue(const llvm::json::Value& value, llvm::StringRef element, std::optional<std::string>& out)
{
    if (value.kind() == llvm::json::Value::String)
    {
        return readNonEmptyString(value, "defaultValue", element, out);
    }
    if (value.kind() == llvm::json::Value::Null)
    {
        out = std::string("std::nullopt");
        return llvm::Error::success();
    }
    if (value.kind() == llvm::json::Value::Boolean || value.kind() == llvm::json::Value::Number)
    {
        out = llvm::formatv("{0}", value).str();
        return llvm::Error::success();
    }
    return configError(element, "option `defaultValue` expects a C++ expression string or a scalar");
}

llvm::Error applyFieldOption(llvm::StringRef          key,
                             const llvm::json::Value& value,
                             llvm::StringRef          element,
                             FieldOverride&           out)
{
    if (key == "name")
    {
        return readNonEmptyString(value, key, element, out.name);
    }
    if (key == "includeFromJson")
    {
        return readBoolean(value, key, element, out.includeFromJson);
    }
    if (key == "includeToJson")
    {
        return readBoolean(value, key, element, out.includeToJson);
    }
    if (key == "includeIfNull")
    {
        return readBoolean(value, key, element, out.includeIfNull);
    }
    if (key == "required")
    {
        return readBoolean(value, key, element, out.required);
    }
    if (key == "omitIfDefault")
    {
        return readBoolean(value, key, element, out.omitIfDefault);
    }
    if (key == "defaultValue")
    {
        return readDefaultValue(value, element, out.defaultValue);
    }
    if (key == "fromJson")
    {
        return readNonEmptyString(value, key, element, out.fromJson);
    }
    if (key == "toJson")
    {
        return readNonEmptyString(value, key, element, out.toJson);
    }
    return configError(element, "unknown field option `" + key.str() + "`");
}

}  // namespace

const ResolvedFieldConfig* ResolvedConfig::field(llvm::StringRef name) const
{
    for (const ResolvedFieldConfig& entry : fields)
    {
        if (entry.fieldName == name)
        {
            return &entry;
        }
    }
    return nullptr;
}

llvm::Expected<ConfigLayer> parseConfigLayer(const llvm::json::Object&       object,
                                             llvm::StringRef                 element,
                                             llvm::ArrayRef<llvm::StringRef> ignoredKeys)
{
    ConfigLayer layer;
    for (const llvm::StringRef key : sortedKeys(object))
    {
        if (llvm::is_contained(ignoredKeys, key))
        {
            continue;
        }
        const llvm::json::Value& value = *object.get(key);
        if (key == "fieldRename")
        {
            const auto spelling = value.getAsString();
            if (!spelling)
            {
                return configError(element, "option `fieldRename` expects a string");
            }
            const auto rename = parseFieldRename(*spelling);
            if (!rename.has_value())
            {
                return configError(element,
                                   "unknown `fieldRename` value `" + spelling->str() +
                                       "` (expected none, kebab, snake, pascal, or screamingSnake)");
            }
            layer.fieldRename = *rename;
            continue;
        }

        const auto* option = std::find_if(std::begin(kLayerBooleans),
                                          std::end(kLayerBooleans),
                                          [key](const BooleanOption& candidate) { return candidate.key == key; });
        if (option == std::end(kLayerBooleans))
        {
            return configError(element, "unknown option `" + key.str() + "`");
        }
        if (llvm::Error err = readBoolean(value, key, element, layer.*(option->member)))
        {
            return std::move(err);
        }
    }
    return layer;
}

llvm::Expected<FieldOverride> parseFieldOverride(const llvm::json::Object& object, llvm::StringRef element)
{
    FieldOverride out;
    for (const llvm::StringRef key : sortedKeys(object))
    {
        if (llvm::Error err = applyFieldOption(key, *object.get(key), element, out))
        {
            return std::move(err);
        }
    }
    return out;
}

llvm::Expected<GlobalConfig> parseGlobalConfig(const llvm::json::Value& document)
{
    constexpr llvm::StringLiteral kGlobal("<global>");

    const auto* root = document.getAsObject();
    if (root == nullptr)
    {
        return configError(kGlobal, "config document must be a JSON object");
    }

    GlobalConfig config;
    for (const llvm::StringRef key : sortedKeys(*root))
    {
        const llvm::json::Value& value = *root->get(key);
        if (key == "options")
        {
            const auto* options = value.getAsObject();
            if (options == nullptr)
            {
                return configError(kGlobal, "`options` must be an object");
            }
            auto layer = parseConfigLayer(*options, kGlobal);
            if (!layer)
            {
                return layer.takeError();
            }
            config.options = *layer;
        }
        else if (key == "typeCodecs")
        {
            const auto* codecs = value.getAsObject();
            if (codecs == nullptr)
            {
                return configError(kGlobal, "`typeCodecs` must be an object");
            }
            for (const llvm::StringRef typeName : sortedKeys(*codecs))
            {
                const auto expression = codecs->getString(typeName);
                if (!expression || expression->trim().empty())
                {
                    return configError(kGlobal,
                                       "codec for type `" + typeName.str() + "` must be a non-empty expression string");
                }
                config.typeCodecs.push_back(TypeCodecBinding{typeName.str(), expression->str()});
            }
        }
        else
        {
            return configError(kGlobal, "unknown config section `" + key.str() + "`");
        }
    }
    return config;
}

llvm::Expected<GlobalConfig> loadGlobalConfig(llvm::StringRef path)
{
    auto buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
    {
        return makeGenerationError(GenerationErrorKind::Io,
                                   path.str(),
                                   "failed to read config file: " + buffer.getError().message());
    }
    auto document = llvm::json::parse((*buffer)->getBuffer());
    if (!document)
    {
        return configError("<global>", path.str() + ": " + llvm::toString(document.takeError()));
    }
    return parseGlobalConfig(*document);
}

void overlayConfigLayer(ConfigLayer& base, const ConfigLayer& top)
{
    for (const BooleanOption& option : kLayerBooleans)
    {
        if ((top.*(option.member)).has_value())
        {
            base.*(option.member) = top.*(option.member);
        }
    }
    if (top.fieldRename.has_value())
    {
        base.fieldRename = top.fieldRename;
    }
}

llvm::Expected<ResolvedConfig> mergeConfig(llvm::StringRef                                           className,
                                           const ConfigLayer&                                        global,
                                           const ConfigLayer&                                        classLayer,
                                           const std::vector<FieldDescriptor>&                       fields,
                                           const std::vector<std::pair<std::string, FieldOverride>>& overrides)
{
    ConfigLayer effective = global;
    overlayConfigLayer(effective, classLayer);

    ResolvedConfig resolved;
    resolved.createFactory            = effective.createFactory.value_or(resolved.createFactory);
    resolved.createToJson             = effective.createToJson.value_or(resolved.createToJson);
    resolved.createFieldMap           = effective.createFieldMap.value_or(resolved.createFieldMap);
    resolved.createJsonKeys           = effective.createJsonKeys.value_or(resolved.createJsonKeys);
    resolved.createPerFieldToJson     = effective.createPerFieldToJson.value_or(resolved.createPerFieldToJson);
    resolved.genericArgumentFactories = effective.genericArgumentFactories.value_or(resolved.genericArgumentFactories);
    resolved.includeIfNull            = effective.includeIfNull.value_or(resolved.includeIfNull);
    resolved.disallowUnrecognizedKeys = effective.disallowUnrecognizedKeys.value_or(resolved.disallowUnrecognizedKeys);
    resolved.ignoreUnannotated        = effective.ignoreUnannotated.value_or(resolved.ignoreUnannotated);
    resolved.addMembers               = effective.addMembers.value_or(resolved.addMembers);
    resolved.fieldRename              = effective.fieldRename.value_or(resolved.fieldRename);

    llvm::StringMap<const FieldOverride*> overrideByField;
    for (const auto& entry : overrides)
    {
        const bool declared = std::any_of(fields.begin(), fields.end(), [&entry](const FieldDescriptor& field) {
            return field.name == entry.first;
        });
        const std::string element = className.str() + "." + entry.first;
        if (!declared)
        {
            return configError(element, "override names a field the class does not declare");
        }
        if (!overrideByField.try_emplace(entry.first, &entry.second).second)
        {
            return configError(element, "conflicting overrides for the same field");
        }
    }

    resolved.fields.reserve(fields.size());
    for (const FieldDescriptor& field : fields)
    {
        const std::string    element = className.str() + "." + field.name;
        const auto           found   = overrideByField.find(field.name);
        const FieldOverride* fo      = found == overrideByField.end() ? nullptr : found->second;

        ResolvedFieldConfig entry;
        entry.fieldName     = field.name;
        entry.annotated     = fo != nullptr;
        entry.jsonKey       = renameKey(resolved.fieldRename, field.name);
        entry.includeIfNull = resolved.includeIfNull;
        if (fo != nullptr)
        {
            if (fo->name.has_value())
            {
                entry.jsonKey = *fo->name;
            }
            entry.includeFromJson = fo->includeFromJson;
            entry.includeToJson   = fo->includeToJson;
            entry.includeIfNull   = fo->includeIfNull.value_or(entry.includeIfNull);
            entry.required        = fo->required.value_or(false);
            entry.defaultValue    = fo->defaultValue;
            entry.omitIfDefault   = fo->omitIfDefault.value_or(false);
            entry.fromJson        = fo->fromJson.value_or("");
            entry.toJson          = fo->toJson.value_or("");
        }

        if (entry.required && entry.includeFromJson == false)
        {
            return configError(element, "`required` cannot be combined with `includeFromJson: false`");
        }
        if (entry.required && entry.defaultValue.has_value())
        {
            return configError(element, "`required` cannot be combined with `defaultValue`");
        }
        if (entry.omitIfDefault && entry.includeToJson == false)
        {
            return configError(element, "`omitIfDefault` has no effect on a field excluded from encode");
        }
        resolved.fields.push_back(std::move(entry));
    }
    return resolved;
}

llvm::Expected<ResolvedConfig> resolveClassConfig(const ConfigLayer&                  global,
                                                  const ClassModel&                   model,
                                                  const std::vector<FieldDescriptor>& fields)
{
    ConfigLayer                                        classLayer;
    std::vector<std::pair<std::string, FieldOverride>> overrides;

    for (const FieldDescriptor& field : fields)
    {
        if (!field.keyAnnotation.has_value())
        {
            continue;
        }
        auto parsed = parseFieldOverride(*field.keyAnnotation, model.name + "." + field.name);
        if (!parsed)
        {
            return parsed.takeError();
        }
        overrides.emplace_back(field.name, std::move(*parsed));
    }

    if (model.serializableAnnotation.has_value())
    {
        const llvm::json::Object& annotation = *model.serializableAnnotation;
        const llvm::StringRef     nested[]   = {"fields"};
        auto                      layer      = parseConfigLayer(annotation, model.name, nested);
        if (!layer)
        {
            return layer.takeError();
        }
        classLayer = *layer;

        if (const llvm::json::Value* fieldsValue = annotation.get("fields"))
        {
            const auto* fieldsObject = fieldsValue->getAsObject();
            if (fieldsObject == nullptr)
            {
                return configError(model.name, "option `fields` expects an object keyed by field name");
            }
            for (const llvm::StringRef fieldName : sortedKeys(*fieldsObject))
            {
                const std::string element = model.name + "." + fieldName.str();
                const auto*       payload = fieldsObject->getObject(fieldName);
                if (payload == nullptr)
                {
                    return configError(element, "field override must be an object");
                }
                auto parsed = parseFieldOverride(*payload, element);
                if (!parsed)
                {
                    return parsed.takeError();
                }
                overrides.emplace_back(fieldName.str(), std::move(*parsed));
            }
        }
    }

    return mergeConfig(model.name, global, classLayer, fields, overrides);
}

llvm::Expected<FieldRename> resolveEnumRename(const EnumModel& model)
{
    if (!model.enumAnnotation.has_value())
    {
        return FieldRename::None;
    }
    for (const llvm::StringRef key : sortedKeys(*model.enumAnnotation))
    {
        if (key != "fieldRename")
        {
            return configError(model.name, "unknown enum option `" + key.str() + "`");
        }
    }
    auto layer = parseConfigLayer(*model.enumAnnotation, model.name);
    if (!layer)
    {
        return layer.takeError();
    }
    return layer->fieldRename ? *layer->fieldRename : FieldRename::None;
}

}  // namespace llvmjsongen
