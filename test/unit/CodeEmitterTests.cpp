//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "llvmjsongen/CodeGen/CodeEmitter.h"
#include "llvmjsongen/CodeGen/ConversionRegistry.h"
#include "llvmjsongen/Frontend/TypeSpelling.h"
#include "llvmjsongen/Semantics/Config.h"
#include "llvmjsongen/Semantics/FieldSelector.h"
#include "llvmjsongen/Support/Diagnostics.h"
#include "llvmjsongen/Support/GenerationError.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace
{

llvmjsongen::FieldDescriptor makeField(const std::string& name, const char* type)
{
    llvmjsongen::FieldDescriptor field;
    field.name = name;
    auto parsed = llvmjsongen::parseTypeSpelling(type);
    if (parsed)
    {
        field.type = std::move(*parsed);
    }
    else
    {
        std::cerr << "fixture type rejected: " << llvm::toString(parsed.takeError()) << "\n";
    }
    return field;
}

llvmjsongen::ResolvedFieldConfig& configure(llvmjsongen::ResolvedConfig& config,
                                            const std::string&           name,
                                            const std::string&           key)
{
    llvmjsongen::ResolvedFieldConfig entry;
    entry.fieldName = name;
    entry.jsonKey   = key;
    config.fields.push_back(entry);
    return config.fields.back();
}

bool expectContains(const char* label, const std::string& text, llvm::StringRef needle)
{
    if (llvm::StringRef(text).contains(needle))
    {
        return true;
    }
    std::cerr << label << ": missing `" << needle.str() << "` in:\n" << text << "\n";
    return false;
}

// Unit with `enum class Color` and the classes Point, Shape and Box<T>.
llvmjsongen::UnitModel makeUnit()
{
    llvmjsongen::UnitModel unit;
    unit.name = "shapes";
    llvmjsongen::EnumModel color;
    color.name           = "Color";
    color.values         = {{"red", ""}, {"darkBlue", ""}};
    color.enumAnnotation = llvm::json::Object{{"fieldRename", "kebab"}};
    unit.enums.push_back(color);
    return unit;
}

llvmjsongen::ConversionRegistry makeRegistry(const llvmjsongen::UnitModel&  unit,
                                             const llvmjsongen::ClassModel* owner,
                                             const bool                     genericFactories)
{
    llvmjsongen::ClassCodecFacts box;
    box.arity                    = 1;
    box.genericArgumentFactories = true;
    const std::map<std::string, llvmjsongen::ClassCodecFacts> classes = {{"Point", {}}, {"Box", box}};
    return llvmjsongen::ConversionRegistry(
        llvmjsongen::makeConversionContext(unit, classes, {}, owner, genericFactories));
}

}  // namespace

bool runCodeEmitterTests()
{
    const llvmjsongen::UnitModel unit = makeUnit();
    const std::string            rt   = "::llvmjsongen::rt::";

    {
        llvmjsongen::ClassModel point;
        point.name              = "Point";
        point.constructorParams = {{"x", "int", false}, {"y", "int", false}};
        point.fields            = {makeField("x", "int"), makeField("y", "int")};
        const llvmjsongen::ResolvedConfig config;
        llvmjsongen::DiagnosticEngine     diag;
        auto selection = llvmjsongen::selectFields(point, point.fields, config, "shapes.h", diag);
        if (!selection)
        {
            std::cerr << "point selection failed: " << llvm::toString(selection.takeError()) << "\n";
            return false;
        }
        const llvmjsongen::ConversionRegistry registry = makeRegistry(unit, &point, false);
        const llvmjsongen::ClassEmitInput     input{point, config, *selection, registry};

        auto decode = llvmjsongen::emitDecodeFactory(input);
        if (!decode)
        {
            std::cerr << "point decode emission failed: " << llvm::toString(decode.takeError()) << "\n";
            return false;
        }
        if (!expectContains("decode signature",
                            *decode,
                            "inline bool PointFromJson(const llvm::json::Value& json, std::optional<Point>& out, "
                            "llvm::json::Path path)\n{\n") ||
            !expectContains("decode object check", *decode, "    path.report(\"expected object\");\n") ||
            !expectContains("decode read",
                            *decode,
                            "    if (!" + rt + "readKey(*object, \"y\", ySlot, path, " + rt + "ScalarCodec{})) {\n") ||
            !expectContains("decode missing constructor key",
                            *decode,
                            "        return " + rt + "reportMissingKey(path, \"x\");\n") ||
            !expectContains("decode construction", *decode, "    out.emplace(std::move(*xSlot), std::move(*ySlot));\n"))
        {
            return false;
        }

        auto again = llvmjsongen::emitDecodeFactory(input);
        if (!again || *again != *decode)
        {
            if (!again)
            {
                llvm::consumeError(again.takeError());
            }
            std::cerr << "decode emission must be deterministic\n";
            return false;
        }
    }

    {
        llvmjsongen::ClassModel shape;
        shape.name   = "Shape";
        shape.fields = {makeField("strokeWidth", "double"),
                        makeField("label", "std::optional<std::string>"),
                        makeField("color", "Color"),
                        makeField("revision", "int")};
        shape.fields[3].getter = "getRevision()";

        llvmjsongen::ResolvedConfig config;
        config.includeIfNull            = false;
        config.disallowUnrecognizedKeys = true;
        config.createFieldMap           = true;
        config.createJsonKeys           = true;
        configure(config, "strokeWidth", "stroke-width").defaultValue = "2.5";
        configure(config, "label", "label").includeIfNull             = false;
        configure(config, "color", "color");
        auto& revision         = configure(config, "revision", "revision");
        revision.omitIfDefault = true;
        revision.includeToJson = true;

        llvmjsongen::DiagnosticEngine diag;
        auto selection = llvmjsongen::selectFields(shape, shape.fields, config, "shapes.h", diag);
        if (!selection)
        {
            std::cerr << "shape selection failed: " << llvm::toString(selection.takeError()) << "\n";
            return false;
        }
        const llvmjsongen::ConversionRegistry registry = makeRegistry(unit, &shape, false);
        const llvmjsongen::ClassEmitInput     input{shape, config, *selection, registry};

        auto decode = llvmjsongen::emitDecodeFactory(input);
        auto encode = llvmjsongen::emitEncodeFunction(input);
        if (!decode || !encode)
        {
            if (!decode)
            {
                std::cerr << "shape decode failed: " << llvm::toString(decode.takeError()) << "\n";
            }
            if (!encode)
            {
                std::cerr << "shape encode failed: " << llvm::toString(encode.takeError()) << "\n";
            }
            return false;
        }
        if (!expectContains("unknown key guard",
                            *decode,
                            "rejectUnknownKeys(*object, {\"stroke-width\", \"label\", \"color\", \"revision\"}, "
                            "path)") ||
            !expectContains("default value", *decode, "        strokeWidthSlot.emplace(2.5);\n") ||
            !expectContains("nullable default", *decode, "        labelSlot.emplace(std::nullopt);\n") ||
            !expectContains("assignment", *decode, "        out->strokeWidth = std::move(*strokeWidthSlot);\n") ||
            !expectContains("enum codec", *decode, rt + "makeEnumCodec(ColorEnumMap)"))
        {
            return false;
        }
        if (!expectContains("omit null",
                            *encode,
                            "    if (instance.label.has_value()) {\n        json[\"label\"] = ") ||
            !expectContains("omit default", *encode, "    if (!(instance.getRevision() == int{})) {\n") ||
            !expectContains("renamed key",
                            *encode,
                            "    json[\"stroke-width\"] = " + rt + "ScalarCodec{}.encode(instance.strokeWidth);\n") ||
            !expectContains("encode tail", *encode, "    return llvm::json::Value(std::move(json));\n}\n"))
        {
            return false;
        }

        const std::string fieldMap = llvmjsongen::emitFieldMap(input);
        if (!expectContains("field map type",
                            fieldMap,
                            "inline constexpr std::array<std::pair<std::string_view, std::string_view>, 4> "
                            "ShapeFieldMap{{\n") ||
            !expectContains("field map entry", fieldMap, "    {\"strokeWidth\", \"stroke-width\"},\n"))
        {
            return false;
        }
        const std::string keys = llvmjsongen::emitJsonKeys(input);
        if (!expectContains("json keys",
                            keys,
                            "struct ShapeJsonKeys final\n{\n    static constexpr std::string_view strokeWidth = "
                            "\"stroke-width\";\n"))
        {
            return false;
        }

        // Referenced enum tables come first, then helpers, then the codec pair.
        auto fragments = llvmjsongen::emitClassFragments(input, unit);
        if (!fragments)
        {
            std::cerr << "shape fragments failed: " << llvm::toString(fragments.takeError()) << "\n";
            return false;
        }
        if (fragments->size() != 5U || !llvm::StringRef(fragments->front()).contains("ColorEnumMap{{") ||
            (*fragments)[3] != *decode || (*fragments)[4] != *encode)
        {
            std::cerr << "class fragment order mismatch\n";
            return false;
        }
    }

    {
        auto table = llvmjsongen::emitEnumMap(unit.enums.front());
        if (!table)
        {
            std::cerr << "enum table failed: " << llvm::toString(table.takeError()) << "\n";
            return false;
        }
        if (*table != "inline constexpr " + rt +
                          "EnumTable<Color, 2> ColorEnumMap{{\n"
                          "    {Color::red, \"red\"},\n"
                          "    {Color::darkBlue, \"dark-blue\"},\n"
                          "}};\n")
        {
            std::cerr << "enum table text mismatch:\n" << *table << "\n";
            return false;
        }

        llvmjsongen::EnumModel clash;
        clash.name   = "Mode";
        clash.values = {{"fast", "f"}, {"slow", ""}, {"fine", "f"}};
        auto duplicate = llvmjsongen::emitEnumMap(clash);
        if (duplicate)
        {
            std::cerr << "duplicate enum JSON values must fail\n";
            return false;
        }
        const auto info = llvmjsongen::takeGenerationErrorInfo(duplicate.takeError());
        if (info.kind != llvmjsongen::GenerationErrorKind::DuplicateKey || info.element != "Mode.fine" ||
            !llvm::StringRef(info.message).endswith("More than one enumerator has the JSON value `f`: `fast` and "
                                                    "`fine`."))
        {
            std::cerr << "duplicate enum value error mismatch: " << info.message << "\n";
            return false;
        }
    }

    {
        llvmjsongen::ClassModel box;
        box.name           = "Box";
        box.typeParameters = {"T"};
        box.fields         = {makeField("value", "T"), makeField("items", "std::vector<T>")};
        llvmjsongen::ResolvedConfig config;
        config.genericArgumentFactories = true;
        config.createPerFieldToJson     = true;
        llvmjsongen::DiagnosticEngine diag;
        auto selection = llvmjsongen::selectFields(box, box.fields, config, "shapes.h", diag);
        if (!selection)
        {
            std::cerr << "box selection failed: " << llvm::toString(selection.takeError()) << "\n";
            return false;
        }
        const llvmjsongen::ConversionRegistry registry = makeRegistry(unit, &box, true);
        const llvmjsongen::ClassEmitInput     input{box, config, *selection, registry};

        auto encode = llvmjsongen::emitEncodeFunction(input);
        if (!encode)
        {
            std::cerr << "box encode failed: " << llvm::toString(encode.takeError()) << "\n";
            return false;
        }
        if (!expectContains("generic header",
                            *encode,
                            "template <typename T, typename TCodec>\nllvm::json::Value BoxToJson(const Box<T>& "
                            "instance, const TCodec& codecT)\n") ||
            !expectContains("generic sequence", *encode, rt + "makeSequenceCodec(codecT).encode(instance.items)"))
        {
            return false;
        }

        auto perField = llvmjsongen::emitPerFieldToJson(input);
        if (!perField)
        {
            std::cerr << "box per-field failed: " << llvm::toString(perField.takeError()) << "\n";
            return false;
        }
        if (!expectContains("per-field template",
                            *perField,
                            "template <typename T>\nstruct BoxPerFieldToJson final\n{\n    template <typename TCodec>\n"
                            "    static llvm::json::Value value(const T& input, const TCodec& codecT)\n"))
        {
            return false;
        }

        config.addMembers = true;
        if (llvmjsongen::wantsMemberInsertion(box, config) || !llvmjsongen::emitMemberForwarders(box, config).empty())
        {
            std::cerr << "generic classes never receive member declarations\n";
            return false;
        }
    }

    {
        llvmjsongen::ClassModel account;
        account.name = "Account";
        llvmjsongen::ResolvedConfig config;
        config.addMembers = true;
        const std::string forwarders = llvmjsongen::emitMemberForwarders(account, config);
        if (!expectContains("fromJson forwarder",
                            forwarders,
                            "inline bool Account::fromJson(const llvm::json::Value& json, std::optional<Account>& out, "
                            "llvm::json::Path path)\n{\n    return AccountFromJson(json, out, path);\n}\n") ||
            !expectContains("toJson forwarder",
                            forwarders,
                            "inline llvm::json::Value Account::toJson() const\n{\n    return AccountToJson(*this);\n}\n"))
        {
            return false;
        }

        config.createFactory         = false;
        const std::string prototypes = llvmjsongen::emitPrototypes(account, config);
        if (prototypes != "inline llvm::json::Value AccountToJson(const Account& instance);\n")
        {
            std::cerr << "prototype mismatch:\n" << prototypes << "\n";
            return false;
        }
    }

    {
        std::vector<std::string> found;
        auto nested = llvmjsongen::parseTypeSpelling("std::map<std::string, std::vector<Color>>");
        if (!nested)
        {
            std::cerr << "fixture type rejected: " << llvm::toString(nested.takeError()) << "\n";
            return false;
        }
        llvmjsongen::collectReferencedEnums(*nested, unit, found);
        llvmjsongen::collectReferencedEnums(*nested, unit, found);
        if (found != std::vector<std::string>{"Color"})
        {
            std::cerr << "referenced enum collection mismatch\n";
            return false;
        }
    }

    return true;
}
