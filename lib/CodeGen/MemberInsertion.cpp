//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements in-place member declaration insertion.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/CodeGen/MemberInsertion.h"

#include "llvmjsongen/CodeGen/CodeEmitter.h"
#include "llvmjsongen/Frontend/DeclarationLocator.h"

#include <cctype>
#include <utility>

namespace llvmjsongen
{
namespace
{

std::string leadingWhitespace(llvm::StringRef line)
{
    return line.take_while([](const char c) { return c == ' ' || c == '\t'; }).str();
}

std::size_t lineStartOf(llvm::StringRef text, std::size_t offset)
{
    const std::size_t newline = text.rfind('\n', offset);
    return newline == llvm::StringRef::npos ? 0 : newline + 1;
}

// Indentation of the first non-blank body line, or one level deeper than the class.
std::string memberIndentation(llvm::StringRef snapshot, const DeclarationRegion& region, llvm::StringRef outer)
{
    llvm::StringRef body = snapshot.slice(region.openBrace + 1, region.closeBrace);
    while (!body.empty())
    {
        const auto [line, rest] = body.split('\n');
        body                    = rest;
        if (line.trim().empty() || line.data() == snapshot.data() + region.openBrace + 1)
        {
            continue;
        }
        const std::string indent = leadingWhitespace(line);
        if (indent.size() > outer.size())
        {
            return indent;
        }
        break;
    }
    return outer.str() + "    ";
}

bool isWordChar(const char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Drops whitespace, keeping one space where two words would otherwise merge.
std::string compactSpelling(llvm::StringRef text)
{
    std::string out;
    bool        pendingSpace = false;
    for (const char c : text)
    {
        if (std::isspace(static_cast<unsigned char>(c)) != 0)
        {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace && isWordChar(out.back()) && isWordChar(c))
        {
            out += ' ';
        }
        pendingSpace = false;
        out += c;
    }
    return out;
}

// Removes `[[...]]` attributes and `inline` from a declaration prefix.
std::string declarationPrefix(llvm::StringRef text)
{
    std::string stripped;
    while (!text.empty())
    {
        const std::size_t open = text.find("[[");
        stripped += text.take_front(open).str();
        if (open == llvm::StringRef::npos)
        {
            break;
        }
        const std::size_t close = text.find("]]", open);
        text                    = close == llvm::StringRef::npos ? llvm::StringRef() : text.drop_front(close + 2);
    }

    std::string       out;
    const std::string compact = compactSpelling(stripped);
    llvm::StringRef   rest(compact);
    while (!rest.empty())
    {
        const auto [word, tail] = rest.split(' ');
        if (word != "inline")
        {
            out += out.empty() ? word.str() : " " + word.str();
        }
        rest = tail;
    }
    return out;
}

// Parameter type with any default argument and parameter name removed.
std::string parameterType(llvm::StringRef parameter)
{
    std::string     compact = compactSpelling(parameter.split('=').first);
    llvm::StringRef type(compact);
    std::size_t     nameStart = type.size();
    while (nameStart > 0 && isWordChar(type[nameStart - 1]))
    {
        --nameStart;
    }
    if (nameStart > 0 && nameStart < type.size())
    {
        const char before = type[nameStart - 1];
        if (before == ' ' || before == '&' || before == '*' || before == '>')
        {
            type = type.take_front(before == ' ' ? nameStart - 1 : nameStart);
        }
    }
    return type.str();
}

// Splits a parameter list on top-level commas.
std::vector<std::string> parameterTypes(llvm::StringRef list)
{
    std::vector<std::string> out;
    if (list.trim().empty() || list.trim() == "void")
    {
        return out;
    }
    int         depth = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i <= list.size(); ++i)
    {
        const char c = i < list.size() ? list[i] : ',';
        if (c == '<' || c == '(' || c == '[' || c == '{')
        {
            ++depth;
        }
        else if (c == '>' || c == ')' || c == ']' || c == '}')
        {
            --depth;
        }
        else if (c == ',' && depth <= 0)
        {
            out.push_back(parameterType(list.slice(start, i)));
            start = i + 1;
        }
    }
    return out;
}

struct Signature final
{
    std::string              prefix;
    std::string              name;
    std::vector<std::string> parameters;
    std::string              qualifiers;

    bool operator==(const Signature& other) const
    {
        return prefix == other.prefix && name == other.name && parameters == other.parameters &&
               qualifiers == other.qualifiers;
    }
};

std::size_t matchParenthesis(llvm::StringRef text, std::size_t open)
{
    int depth = 0;
    for (std::size_t i = open; i < text.size(); ++i)
    {
        if (text[i] == '(')
        {
            ++depth;
        }
        else if (text[i] == ')' && --depth == 0)
        {
            return i;
        }
    }
    return llvm::StringRef::npos;
}

Signature parseExpected(llvm::StringRef declaration)
{
    Signature         out;
    const std::size_t open = declaration.find('(');
    std::size_t       nameStart = open;
    while (nameStart > 0 && isWordChar(declaration[nameStart - 1]))
    {
        --nameStart;
    }
    const std::size_t close = matchParenthesis(declaration, open);
    out.prefix              = declarationPrefix(declaration.take_front(nameStart));
    out.name                = declaration.slice(nameStart, open).str();
    out.parameters          = parameterTypes(declaration.slice(open + 1, close));
    out.qualifiers          = compactSpelling(declaration.slice(close + 1, declaration.find(';')));
    return out;
}

}  // namespace

std::vector<std::string> memberDeclarations(const ClassModel& model, const ResolvedConfig& config)
{
    std::vector<std::string> out;
    if (config.createFactory)
    {
        out.push_back("static bool fromJson(const llvm::json::Value& json, std::optional<" + model.name +
                      ">& out, llvm::json::Path path);");
    }
    if (config.createToJson)
    {
        out.push_back("llvm::json::Value toJson() const;");
    }
    return out;
}

ForwarderSuppression MemberInsertionPlan::suppressedForwarders() const
{
    const auto suppressed = [](const MemberPresence presence) {
        return presence == MemberPresence::Defined || presence == MemberPresence::Conflicting;
    };
    return ForwarderSuppression{suppressed(fromJson), suppressed(toJson)};
}

MemberPresence classifyMember(llvm::StringRef body, llvm::StringRef declaration)
{
    const Signature expected = parseExpected(declaration);

    bool        declared    = false;
    bool        defined     = false;
    bool        conflicting = false;
    int         braces      = 0;
    int         parens      = 0;
    std::size_t boundary    = 0;
    std::size_t i           = 0;
    while (i < body.size())
    {
        const char c = body[i];
        if (!isWordChar(c))
        {
            if (c == '{')
            {
                ++braces;
            }
            else if (c == '}')
            {
                --braces;
            }
            else if (c == '(')
            {
                ++parens;
            }
            else if (c == ')')
            {
                --parens;
            }
            if (braces == 0 && parens == 0)
            {
                const bool scopeColon = c == ':' && ((i + 1 < body.size() && body[i + 1] == ':') ||
                                                     (i > 0 && body[i - 1] == ':'));
                if (c == ';' || c == '{' || c == '}' || (c == ':' && !scopeColon))
                {
                    boundary = i + 1;
                }
            }
            ++i;
            continue;
        }

        const std::size_t start = i;
        while (i < body.size() && isWordChar(body[i]))
        {
            ++i;
        }
        if (braces != 0 || parens != 0 || body.slice(start, i) != expected.name ||
            (start > 0 && (body[start - 1] == '.' || body[start - 1] == '>')))
        {
            continue;
        }
        const llvm::StringRef before = body.slice(boundary, start);
        if (before.contains('='))
        {
            continue;
        }

        std::size_t open = i;
        while (open < body.size() && std::isspace(static_cast<unsigned char>(body[open])) != 0)
        {
            ++open;
        }
        const std::size_t close = open < body.size() && body[open] == '(' ? matchParenthesis(body, open)
                                                                          : llvm::StringRef::npos;
        if (close == llvm::StringRef::npos)
        {
            conflicting = true;
            continue;
        }
        const std::size_t terminator = body.find_first_of(";{=", close + 1);
        const std::size_t tailEnd    = terminator == llvm::StringRef::npos ? body.size() : terminator;

        Signature found;
        found.prefix     = declarationPrefix(before);
        found.name       = expected.name;
        found.parameters = parameterTypes(body.slice(open + 1, close));
        found.qualifiers = compactSpelling(body.slice(close + 1, tailEnd));

        if (!(found == expected) || terminator == llvm::StringRef::npos || body[terminator] == '=')
        {
            conflicting = true;
        }
        else if (body[terminator] == '{')
        {
            defined = true;
        }
        else
        {
            declared = true;
        }
        i = close + 1;
    }

    if (defined)
    {
        return MemberPresence::Defined;
    }
    if (declared)
    {
        return MemberPresence::Declared;
    }
    return conflicting ? MemberPresence::Conflicting : MemberPresence::Missing;
}

llvm::Expected<MemberInsertionPlan> planMemberInsertion(const ClassModel&     model,
                                                        const ResolvedConfig& config,
                                                        llvm::StringRef       sourcePath,
                                                        llvm::StringRef       snapshot,
                                                        llvm::StringRef       cppNamespace)
{
    MemberInsertionPlan plan;
    if (!wantsMemberInsertion(model, config))
    {
        return plan;
    }

    auto region = locateDeclaration(snapshot, model.name, sourcePath, cppNamespace);
    if (!region)
    {
        return region.takeError();
    }

    const std::string     code = blankNonCode(snapshot);
    const llvm::StringRef body = llvm::StringRef(code).slice(region->openBrace + 1, region->closeBrace);

    const std::vector<std::string> declarations = memberDeclarations(model, ResolvedConfig{});
    std::vector<std::string>       missing;
    if (config.createFactory)
    {
        plan.fromJson = classifyMember(body, declarations.front());
        if (plan.fromJson == MemberPresence::Missing)
        {
            missing.push_back(declarations.front());
        }
    }
    if (config.createToJson)
    {
        plan.toJson = classifyMember(body, declarations.back());
        if (plan.toJson == MemberPresence::Missing)
        {
            missing.push_back(declarations.back());
        }
    }
    if (missing.empty())
    {
        return plan;
    }

    const std::string outer  = leadingWhitespace(snapshot.substr(lineStartOf(snapshot, region->keywordOffset)));
    const std::string indent = memberIndentation(snapshot, *region, outer);

    std::string lines;
    if (region->isClass)
    {
        lines += outer + "public:\n";
    }
    for (const std::string& declaration : missing)
    {
        lines += indent + declaration + "\n";
    }

    PatchInstruction patch;
    patch.filePath     = sourcePath.str();
    patch.element      = model.name;
    patch.snapshotHash = snapshotFingerprint(snapshot);

    // Insert on a line of its own before the closing brace when that brace starts its line.
    const std::size_t closeLine = lineStartOf(snapshot, region->closeBrace);
    if (closeLine > region->openBrace && snapshot.slice(closeLine, region->closeBrace).trim().empty())
    {
        patch.startOffset     = closeLine;
        patch.replacementText = lines;
    }
    else
    {
        patch.startOffset     = region->closeBrace;
        patch.replacementText = "\n" + lines + outer;
    }
    patch.endOffset = patch.startOffset;
    plan.patch      = std::move(patch);
    return plan;
}

}  // namespace llvmjsongen
