//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "llvmjsongen/Semantics/Config.h"
#include "llvmjsongen/Semantics/FieldSelector.h"
#include "llvmjsongen/Semantics/Model.h"
#include "llvmjsongen/Support/Diagnostics.h"
#include "llvmjsongen/Support/GenerationError.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace
{

using llvmjsongen::FieldDescriptor;
using llvmjsongen::FieldVisibility;

FieldDescriptor makeField(const std::string& name, const FieldVisibility visibility = FieldVisibility::Public)
{
    FieldDescriptor field;
    field.name       = name;
    field.type.name  = "int";
    field.visibility = visibility;
    return field;
}

llvmjsongen::ResolvedFieldConfig& configure(llvmjsongen::ResolvedConfig& config, const std::string& name)
{
    llvmjsongen::ResolvedFieldConfig entry;
    entry.fieldName = name;
    entry.jsonKey   = name;
    entry.annotated = true;
    config.fields.push_back(entry);
    return config.fields.back();
}

std::vector<std::string> names(const std::vector<FieldDescriptor>& fields)
{
    std::vector<std::string> out;
    for (const FieldDescriptor& field : fields)
    {
        out.push_back(field.name);
    }
    return out;
}

const llvmjsongen::FieldExclusion* findExclusion(const llvmjsongen::FieldSelection& selection,
                                                 const std::string&                 name,
                                                 const llvmjsongen::FieldDirection  direction)
{
    for (const auto& exclusion : selection.excluded)
    {
        if (exclusion.fieldName == name && exclusion.direction == direction)
        {
            return &exclusion;
        }
    }
    return nullptr;
}

}  // namespace

bool runFieldSelectorTests()
{
    using llvmjsongen::FieldDirection;

    {
        llvmjsongen::ClassModel model;
        model.name              = "Point";
        model.constructorParams = {{"x", "int", false}, {"y", "int", false}};
        model.fields            = {makeField("x"), makeField("y")};
        llvmjsongen::DiagnosticEngine diag;
        auto selection = llvmjsongen::selectFields(model, model.fields, {}, "point.h", diag);
        if (!selection)
        {
            std::cerr << "selection failed: " << llvm::toString(selection.takeError()) << "\n";
            return false;
        }
        if (selection->factory.constructorFields != std::vector<std::string>{"x", "y"} ||
            !selection->factory.assignedFields.empty() || names(selection->encodeFields) != names(model.fields) ||
            !selection->excluded.empty())
        {
            std::cerr << "constructor binding mismatch\n";
            return false;
        }
    }

    {
        llvmjsongen::ClassModel model;
        model.name              = "Vault";
        model.constructorParams = {{"owner", "int", false}, {"secret", "int", false}};
        model.fields            = {makeField("owner"), makeField("secret", FieldVisibility::Private)};
        llvmjsongen::DiagnosticEngine diag;
        auto selection = llvmjsongen::selectFields(model, model.fields, {}, "vault.h", diag);
        if (selection)
        {
            std::cerr << "an unbindable required constructor argument must fail\n";
            return false;
        }
        const auto info = llvmjsongen::takeGenerationErrorInfo(selection.takeError());
        if (info.kind != llvmjsongen::GenerationErrorKind::UnavailableField || info.element != "Vault.secret" ||
            !llvm::StringRef(info.message)
                 .endswith("Cannot populate the required constructor argument: secret. It is assigned to a private "
                           "field."))
        {
            std::cerr << "unavailable field error mismatch: " << info.message << "\n";
            return false;
        }
    }

    // A skipped defaulted parameter shifts every later one out of the constructor call.
    {
        llvmjsongen::ClassModel model;
        model.name              = "Widget";
        model.constructorParams = {{"a", "int", false}, {"b", "int", true}, {"c", "int", true}};
        model.fields            = {makeField("a"), makeField("b", FieldVisibility::Protected), makeField("c")};
        llvmjsongen::DiagnosticEngine diag;
        auto selection = llvmjsongen::selectFields(model, model.fields, {}, "widget.h", diag);
        if (!selection)
        {
            std::cerr << "defaulted parameter selection failed: " << llvm::toString(selection.takeError()) << "\n";
            return false;
        }
        if (selection->factory.constructorFields != std::vector<std::string>{"a"} ||
            selection->factory.assignedFields != std::vector<std::string>{"c"})
        {
            std::cerr << "defaulted parameter binding mismatch\n";
            return false;
        }
        const auto* excluded = findExclusion(*selection, "b", FieldDirection::Decode);
        if (excluded == nullptr || excluded->reason != "It is assigned to a private field.")
        {
            std::cerr << "protected field exclusion reason mismatch\n";
            return false;
        }
    }

    {
        llvmjsongen::ClassModel model;
        model.name = "Sensor";
        model.fields = {makeField("reading"), makeField("calibration"), makeField("serial"), makeField("cache")};
        model.fields[1].isWriteOnly = true;
        model.fields[2].isFinal     = true;
        model.fields[3].visibility  = FieldVisibility::Private;
        model.fields[3].getter      = "cache()";

        llvmjsongen::ResolvedConfig config;
        configure(config, "cache").includeToJson = true;

        llvmjsongen::DiagnosticEngine diag;
        auto selection = llvmjsongen::selectFields(model, model.fields, config, "sensor.h", diag);
        if (!selection)
        {
            std::cerr << "sensor selection failed: " << llvm::toString(selection.takeError()) << "\n";
            return false;
        }
        if (names(selection->decodeFields) != std::vector<std::string>{"reading"} ||
            names(selection->encodeFields) != std::vector<std::string>{"reading", "cache"})
        {
            std::cerr << "write-only/final/forced selection mismatch\n";
            return false;
        }
        const auto* setterOnly = findExclusion(*selection, "calibration", FieldDirection::Encode);
        const auto* unbound    = findExclusion(*selection, "serial", FieldDirection::Decode);
        if (setterOnly == nullptr || setterOnly->reason != "Setter-only properties are not supported." ||
            unbound == nullptr || unbound->reason != "It is final and not bound to a constructor parameter.")
        {
            std::cerr << "exclusion reasons mismatch\n";
            return false;
        }
        if (diag.count(llvmjsongen::DiagnosticLevel::Warning) != 1U ||
            diag.diagnostics().front().message != "Setters are ignored: Sensor.calibration")
        {
            std::cerr << "setter warning mismatch\n";
            return false;
        }
    }

    {
        // Forced private fields are only used where an accessor or the constructor reaches them.
        llvmjsongen::ClassModel model;
        model.name   = "Vault";
        model.fields = {makeField("label"),
                        makeField("secret", FieldVisibility::Private),
                        makeField("pin", FieldVisibility::Private),
                        makeField("code", FieldVisibility::Private)};
        model.fields[1].getter = "secret()";
        model.fields[2].setter = "setPin";
        model.constructorParams.push_back(llvmjsongen::ConstructorParam{"code", "std::string", false});

        llvmjsongen::ResolvedConfig config;
        configure(config, "secret").includeFromJson = true;
        configure(config, "pin").includeFromJson    = true;
        configure(config, "code").includeFromJson   = true;

        llvmjsongen::DiagnosticEngine diag;
        auto selection = llvmjsongen::selectFields(model, model.fields, config, "vault.h", diag);
        if (!selection)
        {
            std::cerr << "vault selection failed: " << llvm::toString(selection.takeError()) << "\n";
            return false;
        }
        if (selection->factory.constructorFields != std::vector<std::string>{"code"} ||
            selection->factory.assignedFields != std::vector<std::string>{"label", "pin"} ||
            names(selection->decodeFields) != std::vector<std::string>{"label", "pin", "code"})
        {
            std::cerr << "a private field without a setter must not be assigned\n";
            return false;
        }
        if (names(selection->encodeFields) != std::vector<std::string>{"label", "secret"})
        {
            std::cerr << "a private field without a getter must not be encoded\n";
            return false;
        }
        const auto* unassignable = findExclusion(*selection, "secret", FieldDirection::Decode);
        const auto* unreadable   = findExclusion(*selection, "pin", FieldDirection::Encode);
        if (unassignable == nullptr ||
            unassignable->reason != "It is assigned to a private field without a setter." || unreadable == nullptr ||
            unreadable->reason != "It is read from a private field without a getter." ||
            findExclusion(*selection, "code", FieldDirection::Encode) == nullptr)
        {
            std::cerr << "private accessor exclusion reasons mismatch\n";
            return false;
        }
    }

    {
        llvmjsongen::ClassModel model;
        model.name   = "Clash";
        model.fields = {makeField("identifier"), makeField("id")};
        llvmjsongen::ResolvedConfig config;
        configure(config, "identifier").jsonKey = "id";
        configure(config, "id");
        llvmjsongen::DiagnosticEngine diag;
        auto selection = llvmjsongen::selectFields(model, model.fields, config, "clash.h", diag);
        if (selection)
        {
            std::cerr << "duplicate JSON keys must fail\n";
            return false;
        }
        const auto info = llvmjsongen::takeGenerationErrorInfo(selection.takeError());
        if (info.kind != llvmjsongen::GenerationErrorKind::DuplicateKey ||
            !llvm::StringRef(info.message).endswith("More than one field has the JSON key `id`: `identifier` and `id`."))
        {
            std::cerr << "duplicate key message mismatch: " << info.message << "\n";
            return false;
        }

        // Excluding one of the pair from encode resolves the clash.
        config.fields.back().includeToJson = false;
        auto resolved = llvmjsongen::selectFields(model, model.fields, config, "clash.h", diag);
        if (!resolved || names(resolved->encodeFields) != std::vector<std::string>{"identifier"})
        {
            if (!resolved)
            {
                llvm::consumeError(resolved.takeError());
            }
            std::cerr << "encode exclusion must resolve a key clash\n";
            return false;
        }
    }

    {
        llvmjsongen::ClassModel model;
        model.name   = "Sparse";
        model.fields = {makeField("kept"), makeField("dropped")};
        model.fields[0].isFinal = true;
        llvmjsongen::ResolvedConfig config;
        config.ignoreUnannotated = true;
        config.createFactory     = false;
        configure(config, "kept");
        llvmjsongen::DiagnosticEngine diag;
        auto selection = llvmjsongen::selectFields(model, model.fields, config, "sparse.h", diag);
        if (!selection)
        {
            std::cerr << "ignoreUnannotated selection failed: " << llvm::toString(selection.takeError()) << "\n";
            return false;
        }
        // Without a factory the final field is still encoded.
        if (names(selection->encodeFields) != std::vector<std::string>{"kept"} ||
            findExclusion(*selection, "dropped", FieldDirection::Encode) == nullptr)
        {
            std::cerr << "ignoreUnannotated selection mismatch\n";
            return false;
        }
    }

    if (llvmjsongen::fieldDirectionName(FieldDirection::Decode) != "decode")
    {
        std::cerr << "direction name mismatch\n";
        return false;
    }

    return true;
}
