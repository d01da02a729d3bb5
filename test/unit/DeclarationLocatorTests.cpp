//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "llvmjsongen/Frontend/DeclarationLocator.h"
#include "llvmjsongen/Support/GenerationError.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

bool runDeclarationLocatorTests()
{
    {
        const std::string text = "// struct Point { int x; };\n"
                                 "#define POINT struct Point {}\n"
                                 "const char* kDoc = \"class Point { };\";\n"
                                 "int digits = 1'000'000;\n";
        const std::string code = llvmjsongen::blankNonCode(text);
        if (code.size() != text.size() || llvm::StringRef(code).contains("Point") ||
            llvm::StringRef(code).count('\n') != 4U)
        {
            std::cerr << "comments, literals and directives must be blanked in place\n";
            return false;
        }
        if (!llvm::StringRef(code).contains("int digits = 1'000'000;"))
        {
            std::cerr << "digit separators must not open a character literal\n";
            return false;
        }
        if (llvm::StringRef(llvmjsongen::blankNonCode("auto s = R\"x(struct A {)x\"; struct B {};")).contains("A"))
        {
            std::cerr << "raw string literals must be blanked\n";
            return false;
        }
    }

    {
        const std::string text = "struct Point;\n"
                                 "enum class Point2 { a };\n"
                                 "void take(struct Point* p);\n"
                                 "namespace geo {\n"
                                 "template <typename T>\n"
                                 "struct [[nodiscard]] Point final : Base<T, 2>\n"
                                 "{\n"
                                 "    struct Inner { int z; };\n"
                                 "    int x{0};\n"
                                 "};\n"
                                 "}\n";
        auto region = llvmjsongen::locateDeclaration(text, "Point", "geo.h", "geo");
        if (!region)
        {
            std::cerr << "definition lookup failed: " << llvm::toString(region.takeError()) << "\n";
            return false;
        }
        const std::size_t keyword = text.find("struct [[nodiscard]]");
        const std::size_t open    = text.find("{\n    struct Inner");
        const std::size_t close   = text.find("};\n}\n");
        if (region->keywordOffset != keyword || region->openBrace != open || region->closeBrace != close ||
            region->isClass)
        {
            std::cerr << "definition region mismatch\n";
            return false;
        }
    }

    {
        const std::string text = "class Account {\n    std::string owner_;\n};\n";
        auto              region = llvmjsongen::locateDeclaration(text, "Account", "account.h");
        if (!region || !region->isClass || region->closeBrace != text.rfind('}'))
        {
            if (!region)
            {
                llvm::consumeError(region.takeError());
            }
            std::cerr << "class keyword must be reported\n";
            return false;
        }
    }

    {
        auto missing = llvmjsongen::locateDeclaration("struct Other {};\nenum class Ghost { a };\n", "Ghost", "x.h");
        if (missing)
        {
            std::cerr << "enum definitions must not satisfy a class lookup\n";
            return false;
        }
        const auto info = llvmjsongen::takeGenerationErrorInfo(missing.takeError());
        if (info.kind != llvmjsongen::GenerationErrorKind::ClassNotFound || info.element != "Ghost" ||
            !llvm::StringRef(info.message).endswith("Could not find a definition of `Ghost` in x.h."))
        {
            std::cerr << "class-not-found error mismatch: " << info.message << "\n";
            return false;
        }
    }

    {
        const std::string text = "struct Outer{ struct Point{int q;}; }; struct Point{int x;};";
        auto              region = llvmjsongen::locateDeclaration(text, "Point", "nested.h");
        if (!region || region->keywordOffset != text.rfind("struct Point"))
        {
            if (!region)
            {
                llvm::consumeError(region.takeError());
            }
            std::cerr << "a nested class of the same name must not be located\n";
            return false;
        }
    }

    {
        const std::string text = "void build() { struct Point { int x; }; }\n"
                                 "namespace gfx { struct Point { float x; }; }\n"
                                 "namespace a::b { inline namespace v1 { struct Point { int y; }; } }\n"
                                 "extern \"C\" { struct Sample { int v; }; }\n";
        auto global = llvmjsongen::locateDeclaration(text, "Point", "scopes.h");
        if (global)
        {
            std::cerr << "classes in functions and other namespaces must not satisfy a global lookup\n";
            return false;
        }
        const auto info = llvmjsongen::takeGenerationErrorInfo(global.takeError());
        if (info.kind != llvmjsongen::GenerationErrorKind::ClassNotFound)
        {
            std::cerr << "out-of-scope lookup must report a missing class: " << info.message << "\n";
            return false;
        }

        auto nested = llvmjsongen::locateDeclaration(text, "Point", "scopes.h", "a::b");
        if (!nested || nested->keywordOffset != text.find("struct Point { int y;"))
        {
            if (!nested)
            {
                llvm::consumeError(nested.takeError());
            }
            std::cerr << "nested and inline namespaces must be matched\n";
            return false;
        }

        auto linkage = llvmjsongen::locateDeclaration(text, "Sample", "scopes.h");
        if (!linkage)
        {
            std::cerr << "linkage blocks must not hide a class: " << llvm::toString(linkage.takeError()) << "\n";
            return false;
        }

        auto other = llvmjsongen::locateDeclaration(text, "Point", "scopes.h", "geo");
        if (other)
        {
            std::cerr << "a class in another namespace must not be located\n";
            return false;
        }
        const auto otherInfo = llvmjsongen::takeGenerationErrorInfo(other.takeError());
        if (!llvm::StringRef(otherInfo.message).endswith("Could not find a definition of `geo::Point` in scopes.h."))
        {
            std::cerr << "namespaced class-not-found message mismatch: " << otherInfo.message << "\n";
            return false;
        }
    }

    return true;
}
