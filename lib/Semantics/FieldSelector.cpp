//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements eligible field selection and constructor binding.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/Semantics/FieldSelector.h"

#include "llvmjsongen/Support/GenerationError.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringSet.h"

namespace llvmjsongen
{
namespace
{

constexpr llvm::StringLiteral kPrivateReason("It is assigned to a private field.");
constexpr llvm::StringLiteral kSetterOnlyReason("Setter-only properties are not supported.");
constexpr llvm::StringLiteral kNoFromJsonReason("It is assigned to a field not meant to be used in fromJson.");
constexpr llvm::StringLiteral kNoToJsonReason("It is assigned to a field not meant to be used in toJson.");
constexpr llvm::StringLiteral kUnannotatedReason("It is not annotated and `ignoreUnannotated` is enabled.");
constexpr llvm::StringLiteral kUnboundFinalReason("It is final and not bound to a constructor parameter.");
constexpr llvm::StringLiteral kPrivateNoSetterReason("It is assigned to a private field without a setter.");
constexpr llvm::StringLiteral kPrivateNoGetterReason("It is read from a private field without a getter.");

SourceLocation fieldLocation(llvm::StringRef sourcePath, const FieldDescriptor& field)
{
    return SourceLocation{sourcePath.str(), field.line, 1};
}

std::string defaultReason(const llvm::StringMap<std::string>& reasons, llvm::StringRef fieldName)
{
    const auto it = reasons.find(fieldName);
    if (it != reasons.end())
    {
        return it->second;
    }
    return kUnboundFinalReason.str();
}

}  // namespace

llvm::StringRef fieldDirectionName(const FieldDirection direction)
{
    return direction == FieldDirection::Decode ? "decode" : "encode";
}

llvm::Expected<FieldSelection> selectFields(const ClassModel&                   model,
                                            const std::vector<FieldDescriptor>& fields,
                                            const ResolvedConfig&               config,
                                            llvm::StringRef                     sourcePath,
                                            DiagnosticEngine&                   diagnostics)
{
    if (config.genericArgumentFactories && model.typeParameters.empty())
    {
        diagnostics.warning(SourceLocation{sourcePath.str(), model.line, 1},
                            model.name,
                            "`genericArgumentFactories` only affects classes with type parameters; the option is "
                            "ignored for `" +
                                model.name + "`");
    }

    // Fields unavailable for decode, keyed by name, with the reason quoted by later errors.
    llvm::StringMap<std::string> unavailableReasons;
    llvm::StringSet<>            accessible;
    llvm::StringSet<>            ignored;
    for (const FieldDescriptor& field : fields)
    {
        const ResolvedFieldConfig* fieldConfig = config.field(field.name);
        const bool                 annotated   = fieldConfig != nullptr && fieldConfig->annotated;
        const bool explicitYesFromJson = fieldConfig != nullptr && fieldConfig->includeFromJson == true;
        const bool explicitNoFromJson  = fieldConfig != nullptr && fieldConfig->includeFromJson == false;

        if (config.ignoreUnannotated && !annotated)
        {
            unavailableReasons[field.name] = kUnannotatedReason.str();
            ignored.insert(field.name);
        }
        else if (!field.isPublic() && !explicitYesFromJson)
        {
            unavailableReasons[field.name] = kPrivateReason.str();
        }
        else if (field.isWriteOnly)
        {
            unavailableReasons[field.name] = kSetterOnlyReason.str();
            diagnostics.warning(fieldLocation(sourcePath, field),
                                model.name + "." + field.name,
                                "Setters are ignored: " + model.name + "." + field.name);
        }
        else if (explicitNoFromJson)
        {
            unavailableReasons[field.name] = kNoFromJsonReason.str();
        }
        else
        {
            accessible.insert(field.name);
        }
    }

    FieldSelection    selection;
    llvm::StringSet<> decodeSet;
    llvm::StringSet<> encodeSet;

    if (config.createFactory)
    {
        bool skipping = false;
        for (const ConstructorParam& param : model.constructorParams)
        {
            const bool available = accessible.contains(param.name);
            if (!skipping && available)
            {
                selection.factory.constructorFields.push_back(param.name);
                decodeSet.insert(param.name);
                continue;
            }
            if (param.hasDefault)
            {
                // Positional arguments: once one defaulted parameter is skipped, every later one is too.
                skipping = true;
                continue;
            }
            const auto  reason  = unavailableReasons.find(param.name);
            std::string message = "Cannot populate the required constructor argument: " + param.name + ".";
            if (reason != unavailableReasons.end())
            {
                message += " " + reason->second;
            }
            else if (available)
            {
                message += " An earlier defaulted parameter could not be bound.";
            }
            else
            {
                message += " No field with that name is declared.";
            }
            return makeGenerationError(GenerationErrorKind::UnavailableField,
                                       model.name + "." + param.name,
                                       std::move(message));
        }

        for (const FieldDescriptor& field : fields)
        {
            if (accessible.contains(field.name) && !decodeSet.contains(field.name) && !field.isFinal)
            {
                // Only constructor binding or a setter can reach a non-public field.
                if (!field.isPublic() && field.setter.empty())
                {
                    unavailableReasons[field.name] = kPrivateNoSetterReason.str();
                    continue;
                }
                selection.factory.assignedFields.push_back(field.name);
                decodeSet.insert(field.name);
            }
        }
        encodeSet = decodeSet;
    }
    else
    {
        for (const FieldDescriptor& field : fields)
        {
            if (accessible.contains(field.name))
            {
                decodeSet.insert(field.name);
                encodeSet.insert(field.name);
            }
        }
    }

    // Forced encode fields come back regardless of decode eligibility; a getter-less field cannot be read.
    for (const FieldDescriptor& field : fields)
    {
        const ResolvedFieldConfig* fieldConfig = config.field(field.name);
        if (fieldConfig != nullptr && fieldConfig->includeToJson == true && !field.isWriteOnly &&
            !ignored.contains(field.name))
        {
            encodeSet.insert(field.name);
        }
    }

    llvm::StringMap<std::string> ownerByKey;
    for (const FieldDescriptor& field : fields)
    {
        const ResolvedFieldConfig* fieldConfig = config.field(field.name);
        const bool explicitNoToJson = fieldConfig != nullptr && fieldConfig->includeToJson == false;

        if (decodeSet.contains(field.name))
        {
            selection.decodeFields.push_back(field);
        }
        else
        {
            selection.excluded.push_back(
                FieldExclusion{field.name, FieldDirection::Decode, defaultReason(unavailableReasons, field.name)});
        }

        const bool readable = field.isPublic() || !field.getter.empty();
        if (encodeSet.contains(field.name) && !explicitNoToJson && readable)
        {
            const std::string key = fieldConfig != nullptr ? fieldConfig->jsonKey : field.name;
            const auto [existing, inserted] = ownerByKey.try_emplace(key, field.name);
            if (!inserted)
            {
                return makeGenerationError(GenerationErrorKind::DuplicateKey,
                                           model.name + "." + field.name,
                                           "More than one field has the JSON key `" + key + "`: `" +
                                               existing->second + "` and `" + field.name + "`.");
            }
            selection.encodeFields.push_back(field);
        }
        else
        {
            std::string reason;
            if (explicitNoToJson)
            {
                reason = kNoToJsonReason.str();
            }
            else if (encodeSet.contains(field.name))
            {
                reason = kPrivateNoGetterReason.str();
            }
            else
            {
                reason = defaultReason(unavailableReasons, field.name);
            }
            selection.excluded.push_back(FieldExclusion{field.name, FieldDirection::Encode, reason});
        }
    }
    return selection;
}

}  // namespace llvmjsongen
