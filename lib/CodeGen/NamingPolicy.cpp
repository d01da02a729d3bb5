//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements shared naming-policy helpers for key projection and generated identifiers.
///
/// The implementation provides the C++ keyword table, identifier sanitation,
/// and the case projections behind field-rename policies.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/CodeGen/NamingPolicy.h"

#include <cctype>
#include <cstddef>
#include <cstdio>
#include <string>

#include "llvm/ADT/StringSet.h"

namespace llvmjsongen
{
namespace
{

const llvm::StringSet<>& cppKeywordSet()
{
    static const llvm::StringSet<> cppKeywords = {"alignas",
                                                  "alignof",
                                                  "and",
                                                  "and_eq",
                                                  "asm",
                                                  "auto",
                                                  "bitand",
                                                  "bitor",
                                                  "bool",
                                                  "break",
                                                  "case",
                                                  "catch",
                                                  "char",
                                                  "char8_t",
                                                  "char16_t",
                                                  "char32_t",
                                                  "class",
                                                  "compl",
                                                  "concept",
                                                  "const",
                                                  "consteval",
                                                  "constexpr",
                                                  "constinit",
                                                  "const_cast",
                                                  "continue",
                                                  "co_await",
                                                  "co_return",
                                                  "co_yield",
                                                  "decltype",
                                                  "default",
                                                  "delete",
                                                  "do",
                                                  "double",
                                                  "dynamic_cast",
                                                  "else",
                                                  "enum",
                                                  "explicit",
                                                  "export",
                                                  "extern",
                                                  "false",
                                                  "float",
                                                  "for",
                                                  "friend",
                                                  "goto",
                                                  "if",
                                                  "inline",
                                                  "int",
                                                  "long",
                                                  "mutable",
                                                  "namespace",
                                                  "new",
                                                  "noexcept",
                                                  "not",
                                                  "not_eq",
                                                  "nullptr",
                                                  "operator",
                                                  "or",
                                                  "or_eq",
                                                  "private",
                                                  "protected",
                                                  "public",
                                                  "register",
                                                  "reinterpret_cast",
                                                  "requires",
                                                  "return",
                                                  "short",
                                                  "signed",
                                                  "sizeof",
                                                  "static",
                                                  "static_assert",
                                                  "static_cast",
                                                  "struct",
                                                  "switch",
                                                  "template",
                                                  "this",
                                                  "thread_local",
                                                  "throw",
                                                  "true",
                                                  "try",
                                                  "typedef",
                                                  "typeid",
                                                  "typename",
                                                  "union",
                                                  "unsigned",
                                                  "using",
                                                  "virtual",
                                                  "void",
                                                  "volatile",
                                                  "wchar_t",
                                                  "while",
                                                  "xor",
                                                  "xor_eq"};
    return cppKeywords;
}

std::string normalizeSnakeCase(llvm::StringRef name, const char separator)
{
    std::string out;
    out.reserve(name.size() + 8);

    bool prevSeparator = false;
    for (std::size_t i = 0; i < name.size(); ++i)
    {
        const char c    = name[i];
        const char prev = (i > 0) ? name[i - 1] : '\0';
        const char next = (i + 1 < name.size()) ? name[i + 1] : '\0';
        if (!std::isalnum(static_cast<unsigned char>(c)))
        {
            if (!out.empty() && !prevSeparator)
            {
                out.push_back(separator);
                prevSeparator = true;
            }
            continue;
        }

        if (std::isupper(static_cast<unsigned char>(c)))
        {
            const bool boundary =
                std::islower(static_cast<unsigned char>(prev)) || std::isdigit(static_cast<unsigned char>(prev)) ||
                (std::isupper(static_cast<unsigned char>(prev)) && std::islower(static_cast<unsigned char>(next)));
            if (!out.empty() && !prevSeparator && boundary)
            {
                out.push_back(separator);
            }
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        else
        {
            out.push_back(c);
        }
        prevSeparator = false;
    }
    while (!out.empty() && out.back() == separator)
    {
        out.pop_back();
    }
    return out;
}

std::string normalizePascalCase(llvm::StringRef name)
{
    std::string out;
    out.reserve(name.size() + 8);

    bool upperNext = true;
    for (const char c : name)
    {
        if (!std::isalnum(static_cast<unsigned char>(c)))
        {
            upperNext = true;
            continue;
        }
        if (upperNext)
        {
            out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
            upperNext = false;
        }
        else
        {
            out.push_back(c);
        }
    }
    return out;
}

}  // namespace

std::optional<FieldRename> parseFieldRename(llvm::StringRef spelling)
{
    if (spelling == "none")
    {
        return FieldRename::None;
    }
    if (spelling == "kebab")
    {
        return FieldRename::Kebab;
    }
    if (spelling == "snake")
    {
        return FieldRename::Snake;
    }
    if (spelling == "pascal")
    {
        return FieldRename::Pascal;
    }
    if (spelling == "screamingSnake")
    {
        return FieldRename::ScreamingSnake;
    }
    return std::nullopt;
}

llvm::StringRef fieldRenameName(const FieldRename rename)
{
    switch (rename)
    {
    case FieldRename::None:
        return "none";
    case FieldRename::Kebab:
        return "kebab";
    case FieldRename::Snake:
        return "snake";
    case FieldRename::Pascal:
        return "pascal";
    case FieldRename::ScreamingSnake:
        return "screamingSnake";
    }
    return "none";
}

std::string renameKey(const FieldRename rename, llvm::StringRef name)
{
    switch (rename)
    {
    case FieldRename::None:
        return name.str();
    case FieldRename::Kebab:
        return normalizeSnakeCase(name, '-');
    case FieldRename::Snake:
        return normalizeSnakeCase(name, '_');
    case FieldRename::Pascal:
        return normalizePascalCase(name);
    case FieldRename::ScreamingSnake: {
        std::string out = normalizeSnakeCase(name, '_');
        for (char& c : out)
        {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return out;
    }
    }
    return name.str();
}

bool codegenIsCppKeyword(const llvm::StringRef name)
{
    return cppKeywordSet().contains(name);
}

std::string codegenSanitizeIdentifier(llvm::StringRef name)
{
    std::string out = name.str();
    if (out.empty())
    {
        return "_";
    }
    for (char& c : out)
    {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_'))
        {
            c = '_';
        }
    }
    if (std::isdigit(static_cast<unsigned char>(out.front())))
    {
        out.insert(out.begin(), '_');
    }
    if (codegenIsCppKeyword(out))
    {
        out += "_";
    }
    return out;
}

std::string codegenToUpperSnakeCaseIdentifier(const llvm::StringRef name)
{
    auto out = normalizeSnakeCase(name, '_');
    if (out.empty())
    {
        out = "_";
    }
    for (char& c : out)
    {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return codegenSanitizeIdentifier(out);
}

std::string escapeCppString(llvm::StringRef text)
{
    std::string out;
    out.reserve(text.size());
    for (const char c : text)
    {
        switch (c)
        {
        case '\\':
            out.append("\\\\");
            break;
        case '"':
            out.append("\\\"");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\t':
            out.append("\\t");
            break;
        case '\r':
            out.append("\\r");
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20U)
            {
                char buffer[8];
                std::snprintf(buffer, sizeof(buffer), "\\%03o", static_cast<unsigned>(static_cast<unsigned char>(c)));
                out.append(buffer);
            }
            else
            {
                out.push_back(c);
            }
            break;
        }
    }
    return out;
}

}  // namespace llvmjsongen
