//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "llvmjsongen/Frontend/TypeSpelling.h"
#include "llvmjsongen/Pipeline/Composer.h"
#include "llvmjsongen/Support/GenerationError.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

namespace
{

llvmjsongen::FieldDescriptor makeField(const std::string& name, const char* type, const std::uint32_t line)
{
    llvmjsongen::FieldDescriptor field;
    field.name           = name;
    field.declaringClass = "Shape";
    field.line           = line;
    auto parsed          = llvmjsongen::parseTypeSpelling(type);
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

// `struct Shape { Color color; std::string secret_; }` with an annotated `enum class Color`.
llvmjsongen::UnitModel makeUnit(llvm::json::Object annotation)
{
    llvmjsongen::UnitModel unit;
    unit.name        = "shapes";
    unit.sourcePath  = "shapes.h";
    unit.includePath = "shapes.h";

    llvmjsongen::EnumModel color;
    color.name           = "Color";
    color.values         = {{"red", ""}, {"blue", ""}};
    color.enumAnnotation = llvm::json::Object{};
    unit.enums.push_back(color);

    llvmjsongen::ClassModel shape;
    shape.name                   = "Shape";
    shape.line                   = 3;
    shape.serializableAnnotation = std::move(annotation);
    shape.fields                 = {makeField("color", "Color", 5), makeField("secret", "std::string", 6)};
    shape.fields[1].visibility   = llvmjsongen::FieldVisibility::Private;
    unit.classes.push_back(shape);

    llvmjsongen::ClassModel plain;
    plain.name = "Plain";
    unit.classes.push_back(plain);
    return unit;
}

const std::string kSource = "enum class Color { red, blue };\n"
                            "\n"
                            "struct Shape\n"
                            "{\n"
                            "    Color       color{Color::red};\n"
                            "    std::string secret;\n"
                            "};\n";

}  // namespace

bool runComposerTests()
{
    {
        llvmjsongen::GeneratedUnit unit;
        const bool                 first     = unit.add("\n  inline int a = 1;  \n");
        const bool                 duplicate = unit.add("inline int a = 1;");
        const bool                 blank     = unit.add(" \n\t ");
        const bool                 second    = unit.add("inline int b = 2;\n");
        if (!first || duplicate || blank || !second || unit.fragments().size() != 2U ||
            unit.text() != "inline int a = 1;\n\ninline int b = 2;")
        {
            std::cerr << "fragment deduplication mismatch\n";
            return false;
        }
        if (!llvmjsongen::GeneratedUnit{}.empty() || !llvmjsongen::GeneratedUnit{}.text().empty())
        {
            std::cerr << "empty unit must render empty text\n";
            return false;
        }
    }

    // The serializable pass emits the Color table for the field and the enum pass emits it again.
    {
        const llvmjsongen::UnitModel    unit = makeUnit(llvm::json::Object{{"addMembers", true}});
        const llvmjsongen::GlobalConfig global;
        const llvmjsongen::UnitSnapshot snapshot{unit, global, kSource, "", true};
        llvmjsongen::DiagnosticEngine   diag;

        auto composition = llvmjsongen::composeUnit(snapshot, llvmjsongen::defaultPasses(), diag);
        if (!composition)
        {
            std::cerr << "composition failed: " << llvm::toString(composition.takeError()) << "\n";
            return false;
        }
        if (composition->rawFragmentCounts != std::vector<std::size_t>{5U, 1U} ||
            composition->output.fragments().size() != 5U)
        {
            std::cerr << "raw/unique fragment counts mismatch\n";
            return false;
        }
        const std::vector<std::string>& fragments = composition->output.fragments();
        if (!llvm::StringRef(fragments[0]).startswith("inline bool ShapeFromJson(") ||
            !llvm::StringRef(fragments[1]).contains("ColorEnumMap{{") ||
            !llvm::StringRef(fragments[4]).startswith("inline bool Shape::fromJson("))
        {
            std::cerr << "composed fragment order mismatch\n";
            return false;
        }
        if (composition->patches.size() != 1U || composition->patches.front().element != "Shape" ||
            composition->patches.front().startOffset != kSource.rfind("};"))
        {
            std::cerr << "member insertion patch mismatch\n";
            return false;
        }

        bool sawExclusion = false;
        for (const llvmjsongen::Diagnostic& diagnostic : diag.diagnostics())
        {
            if (diagnostic.level == llvmjsongen::DiagnosticLevel::Note && diagnostic.element == "Shape.secret" &&
                diagnostic.message == "excluded from decode: It is assigned to a private field.")
            {
                sawExclusion = true;
            }
        }
        if (!sawExclusion || diag.hasErrors())
        {
            std::cerr << "exclusion note missing\n";
            return false;
        }
    }

    {
        const llvmjsongen::UnitModel    unit = makeUnit(llvm::json::Object{{"addMembers", true}});
        const llvmjsongen::GlobalConfig global;

        const llvmjsongen::UnitSnapshot companionOnly{unit, global, kSource, "", false};
        llvmjsongen::DiagnosticEngine   quiet;
        auto noPatches = llvmjsongen::composeUnit(companionOnly, {llvmjsongen::SerializablePass{}}, quiet);
        if (!noPatches || !noPatches->patches.empty() || noPatches->rawFragmentCounts.size() != 1U)
        {
            if (!noPatches)
            {
                llvm::consumeError(noPatches.takeError());
            }
            std::cerr << "disabled patching must still compose the companion\n";
            return false;
        }

        // In-place failures are diagnostics; the companion output survives.
        const llvmjsongen::UnitSnapshot unreadable{unit, global, std::nullopt, "permission denied", true};
        llvmjsongen::DiagnosticEngine   diag;
        auto composed = llvmjsongen::composeUnit(unreadable, llvmjsongen::defaultPasses(), diag);
        if (!composed || !composed->patches.empty() || composed->output.empty() ||
            diag.count(llvmjsongen::DiagnosticLevel::Error) != 1U ||
            diag.diagnostics().back().message != "IoError: cannot read shapes.h: permission denied")
        {
            if (!composed)
            {
                llvm::consumeError(composed.takeError());
            }
            std::cerr << "unreadable source handling mismatch\n";
            return false;
        }

        const llvmjsongen::UnitSnapshot elsewhere{unit, global, std::string("struct Other {};\n"), "", true};
        llvmjsongen::DiagnosticEngine   missing;
        auto located = llvmjsongen::composeUnit(elsewhere, llvmjsongen::defaultPasses(), missing);
        if (!located || !located->patches.empty() || missing.count(llvmjsongen::DiagnosticLevel::Error) != 1U ||
            !llvm::StringRef(missing.diagnostics().back().message).startswith("ClassNotFoundError: "))
        {
            if (!located)
            {
                llvm::consumeError(located.takeError());
            }
            std::cerr << "missing class must be reported without aborting the unit\n";
            return false;
        }
    }

    // A hand-written factory with another signature keeps its name; only the encoder is wired in.
    {
        const llvmjsongen::UnitModel    unit = makeUnit(llvm::json::Object{{"addMembers", true}});
        const llvmjsongen::GlobalConfig global;
        const std::string               source = "struct Shape\n"
                                                 "{\n"
                                                 "    std::string secret;\n"
                                                 "    static Shape fromJson(const std::string& text);\n"
                                                 "};\n";
        const llvmjsongen::UnitSnapshot snapshot{unit, global, source, "", true};
        llvmjsongen::DiagnosticEngine   diag;

        auto composition = llvmjsongen::composeUnit(snapshot, {llvmjsongen::SerializablePass{}}, diag);
        if (!composition)
        {
            std::cerr << "composition next to a foreign factory failed: " << llvm::toString(composition.takeError())
                      << "\n";
            return false;
        }
        const std::string text = composition->output.text();
        if (llvm::StringRef(text).contains("Shape::fromJson(") || !llvm::StringRef(text).contains("Shape::toJson() const"))
        {
            std::cerr << "the conflicting forwarder must not be generated\n";
            return false;
        }
        if (composition->patches.size() != 1U ||
            composition->patches.front().replacementText != "    llvm::json::Value toJson() const;\n")
        {
            std::cerr << "only the encoder declaration may be inserted\n";
            return false;
        }
        bool warned = false;
        for (const llvmjsongen::Diagnostic& diagnostic : diag.diagnostics())
        {
            warned = warned || (diagnostic.level == llvmjsongen::DiagnosticLevel::Warning &&
                                diagnostic.element == "Shape" &&
                                llvm::StringRef(diagnostic.message).startswith("`fromJson` is already declared"));
        }
        if (!warned || diag.hasErrors())
        {
            std::cerr << "a conflicting member must be reported as a warning\n";
            return false;
        }
    }

    {
        llvmjsongen::UnitModel unit = makeUnit(llvm::json::Object{});
        unit.classes.front().fields.push_back(makeField("socket", "Socket", 7));
        const llvmjsongen::GlobalConfig global;
        const llvmjsongen::UnitSnapshot snapshot{unit, global, kSource, "", true};
        llvmjsongen::DiagnosticEngine   diag;
        auto composition = llvmjsongen::composeUnit(snapshot, llvmjsongen::defaultPasses(), diag);
        if (composition)
        {
            std::cerr << "an unsupported field type must abort the unit\n";
            return false;
        }
        const auto info = llvmjsongen::takeGenerationErrorInfo(composition.takeError());
        if (info.kind != llvmjsongen::GenerationErrorKind::UnsupportedType || info.element != "Shape.socket")
        {
            std::cerr << "unsupported type error mismatch: " << info.message << "\n";
            return false;
        }
    }

    if (llvmjsongen::passName(llvmjsongen::SerializablePass{}) != "serializable" ||
        llvmjsongen::passName(llvmjsongen::EnumPass{}) != "enum")
    {
        std::cerr << "pass names mismatch\n";
        return false;
    }

    return true;
}
