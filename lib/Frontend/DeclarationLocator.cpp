//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements name-based lookup of class definitions in source text.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/Frontend/DeclarationLocator.h"

#include "llvmjsongen/Support/GenerationError.h"

#include "llvm/ADT/SmallVector.h"

#include <cctype>
#include <vector>

namespace llvmjsongen
{
namespace
{

bool isIdentifierStart(const char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool isIdentifierChar(const char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool isHorizontalSpace(const char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

std::size_t tokenStart(llvm::StringRef text, std::size_t offset)
{
    std::size_t start = offset;
    while (start > 0 && isIdentifierChar(text[start - 1]))
    {
        --start;
    }
    return start;
}

// Returns the end of the quoted literal opened at `offset`; stops at an unescaped newline.
std::size_t quotedLiteralEnd(llvm::StringRef text, std::size_t offset, const char quote)
{
    std::size_t i = offset + 1;
    while (i < text.size())
    {
        const char c = text[i];
        if (c == '\\')
        {
            i += 2;
            continue;
        }
        if (c == quote)
        {
            return i + 1;
        }
        if (c == '\n')
        {
            return i;
        }
        ++i;
    }
    return text.size();
}

// Returns the end of a raw string whose `R"` starts at `offset`, or npos when the delimiter is malformed.
std::size_t rawStringEnd(llvm::StringRef text, std::size_t offset)
{
    const std::size_t open = text.find('(', offset + 2);
    if (open == llvm::StringRef::npos || open - (offset + 2) > 16)
    {
        return llvm::StringRef::npos;
    }
    const std::string closing = ")" + text.slice(offset + 2, open).str() + "\"";
    const std::size_t end     = text.find(closing, open + 1);
    return end == llvm::StringRef::npos ? text.size() : end + closing.size();
}

std::size_t skipSpaceAndAttributes(llvm::StringRef code, std::size_t offset)
{
    std::size_t i = offset;
    while (i < code.size())
    {
        if (std::isspace(static_cast<unsigned char>(code[i])) != 0)
        {
            ++i;
            continue;
        }
        const llvm::StringRef rest = code.substr(i);
        if (rest.startswith("[["))
        {
            const std::size_t end = code.find("]]", i + 2);
            if (end == llvm::StringRef::npos)
            {
                return code.size();
            }
            i = end + 2;
            continue;
        }
        if (rest.startswith("alignas") && !isIdentifierChar(rest.size() > 7 ? rest[7] : ' '))
        {
            const std::size_t end = code.find(')', i);
            if (end == llvm::StringRef::npos)
            {
                return code.size();
            }
            i = end + 1;
            continue;
        }
        break;
    }
    return i;
}

// Returns the offset of the brace that opens the body, or npos for a declaration without one.
std::size_t findBodyBrace(llvm::StringRef code, std::size_t offset)
{
    int angleDepth = 0;
    for (std::size_t i = offset; i < code.size(); ++i)
    {
        const char c = code[i];
        if (c == '<')
        {
            ++angleDepth;
        }
        else if (c == '>')
        {
            --angleDepth;
        }
        else if (c == '{')
        {
            return i;
        }
        else if (c == ';')
        {
            return llvm::StringRef::npos;
        }
        else if ((c == '(' || c == ')' || c == '=') && angleDepth <= 0)
        {
            return llvm::StringRef::npos;
        }
    }
    return llvm::StringRef::npos;
}

std::size_t matchBrace(llvm::StringRef code, std::size_t open)
{
    std::size_t depth = 0;
    for (std::size_t i = open; i < code.size(); ++i)
    {
        if (code[i] == '{')
        {
            ++depth;
        }
        else if (code[i] == '}')
        {
            --depth;
            if (depth == 0)
            {
                return i;
            }
        }
    }
    return llvm::StringRef::npos;
}

enum class ScopeKind
{
    Namespace,
    Linkage,
    Block,
};

// One open brace: a namespace body, an `extern "C"` block, or anything else.
struct Scope final
{
    ScopeKind                    kind;
    std::vector<llvm::StringRef> components;
    bool                         isInline;
};

// True when the enclosing scopes are exactly the wanted namespace. Inline and
// anonymous namespaces and linkage blocks do not add a component.
bool isInScope(const std::vector<Scope>& scopes, const std::vector<llvm::StringRef>& wanted)
{
    std::vector<llvm::StringRef> path;
    for (const Scope& scope : scopes)
    {
        if (scope.kind == ScopeKind::Block)
        {
            return false;
        }
        if (scope.kind == ScopeKind::Namespace && !scope.isInline)
        {
            path.insert(path.end(), scope.components.begin(), scope.components.end());
        }
    }
    return path == wanted;
}

}  // namespace

std::string blankNonCode(llvm::StringRef text)
{
    std::string out(text.str());
    const auto  blank = [&out](std::size_t from, std::size_t to) {
        for (std::size_t k = from; k < to && k < out.size(); ++k)
        {
            if (out[k] != '\n')
            {
                out[k] = ' ';
            }
        }
    };

    bool        lineStart = true;
    std::size_t i         = 0;
    while (i < text.size())
    {
        const char c = text[i];
        if (c == '\n')
        {
            lineStart = true;
            ++i;
            continue;
        }
        if (isHorizontalSpace(c))
        {
            ++i;
            continue;
        }
        if (lineStart && c == '#')
        {
            std::size_t end = i;
            while (end < text.size() && !(text[end] == '\n' && text[end - 1] != '\\'))
            {
                ++end;
            }
            blank(i, end);
            i = end;
            continue;
        }
        lineStart = false;

        const llvm::StringRef rest = text.substr(i);
        if (rest.startswith("//"))
        {
            const std::size_t end = text.find('\n', i);
            const std::size_t stop = end == llvm::StringRef::npos ? text.size() : end;
            blank(i, stop);
            i = stop;
            continue;
        }
        if (rest.startswith("/*"))
        {
            const std::size_t end  = text.find("*/", i + 2);
            const std::size_t stop = end == llvm::StringRef::npos ? text.size() : end + 2;
            blank(i, stop);
            i = stop;
            continue;
        }
        if (c == 'R' && rest.startswith("R\""))
        {
            const std::size_t     start  = tokenStart(text, i);
            const llvm::StringRef prefix = text.slice(start, i);
            if (prefix.empty() || prefix == "u8" || prefix == "u" || prefix == "U" || prefix == "L")
            {
                const std::size_t end = rawStringEnd(text, i);
                if (end != llvm::StringRef::npos)
                {
                    blank(start, end);
                    i = end;
                    continue;
                }
            }
        }
        if (c == '"')
        {
            const std::size_t end = quotedLiteralEnd(text, i, '"');
            blank(i, end);
            i = end;
            continue;
        }
        if (c == '\'')
        {
            // A quote inside a numeric token is a digit separator.
            const std::size_t start = tokenStart(text, i);
            if (start == i || std::isdigit(static_cast<unsigned char>(text[start])) == 0)
            {
                const std::size_t end = quotedLiteralEnd(text, i, '\'');
                blank(i, end);
                i = end;
                continue;
            }
        }
        ++i;
    }
    return out;
}

llvm::Expected<DeclarationRegion> locateDeclaration(llvm::StringRef text,
                                                    llvm::StringRef name,
                                                    llvm::StringRef sourcePath,
                                                    llvm::StringRef cppNamespace)
{
    const std::string     blanked = blankNonCode(text);
    const llvm::StringRef code(blanked);

    llvm::SmallVector<llvm::StringRef, 4> wantedParts;
    cppNamespace.trim().split(wantedParts, "::", -1, false);
    std::vector<llvm::StringRef> wanted(wantedParts.begin(), wantedParts.end());
    if (!wanted.empty() && wanted.front().empty())
    {
        wanted.erase(wanted.begin());
    }
    for (llvm::StringRef& component : wanted)
    {
        component = component.trim();
    }

    std::vector<Scope>           scopes;
    std::vector<llvm::StringRef> pendingNamespace;
    bool                         inNamespaceHead = false;
    bool                         inlineNamespace = false;
    bool                         afterExtern     = false;
    const auto                   resetHead       = [&]() {
        pendingNamespace.clear();
        inNamespaceHead = false;
        inlineNamespace = false;
        afterExtern     = false;
    };

    llvm::StringRef previous;
    std::size_t     i = 0;
    while (i < code.size())
    {
        const char c = code[i];
        if (!isIdentifierStart(c))
        {
            if (c == '{')
            {
                if (inNamespaceHead)
                {
                    scopes.push_back(Scope{ScopeKind::Namespace, pendingNamespace, inlineNamespace});
                }
                else
                {
                    scopes.push_back(Scope{afterExtern ? ScopeKind::Linkage : ScopeKind::Block, {}, false});
                }
                resetHead();
            }
            else if (c == '}')
            {
                if (!scopes.empty())
                {
                    scopes.pop_back();
                }
                resetHead();
            }
            else if (c == ';')
            {
                resetHead();
            }
            if (std::isspace(static_cast<unsigned char>(c)) == 0)
            {
                previous = llvm::StringRef();
            }
            ++i;
            continue;
        }

        const std::size_t start = i;
        while (i < code.size() && isIdentifierChar(code[i]))
        {
            ++i;
        }
        const llvm::StringRef word = code.slice(start, i);
        if (inNamespaceHead)
        {
            pendingNamespace.push_back(word);
            previous = word;
            continue;
        }
        if (word == "namespace")
        {
            inNamespaceHead = true;
            inlineNamespace = previous == "inline";
            previous        = word;
            continue;
        }
        afterExtern = word == "extern";

        if ((word == "class" || word == "struct") && previous != "enum" && isInScope(scopes, wanted))
        {
            std::size_t j = skipSpaceAndAttributes(code, i);
            if (j < code.size() && isIdentifierStart(code[j]))
            {
                const std::size_t nameStart = j;
                while (j < code.size() && isIdentifierChar(code[j]))
                {
                    ++j;
                }
                if (code.slice(nameStart, j) == name)
                {
                    const std::size_t open = findBodyBrace(code, j);
                    if (open != llvm::StringRef::npos)
                    {
                        const std::size_t close = matchBrace(code, open);
                        if (close == llvm::StringRef::npos)
                        {
                            return makeGenerationError(GenerationErrorKind::ClassNotFound,
                                                       name.str(),
                                                       "The body of `" + name.str() + "` in " + sourcePath.str() +
                                                           " has no closing brace.");
                        }
                        return DeclarationRegion{start, open, close, word == "class"};
                    }
                }
            }
        }
        previous = word;
    }

    std::string qualified;
    for (const llvm::StringRef component : wanted)
    {
        qualified += component.str() + "::";
    }
    qualified += name.str();
    return makeGenerationError(GenerationErrorKind::ClassNotFound,
                               name.str(),
                               "Could not find a definition of `" + qualified + "` in " + sourcePath.str() + ".");
}

}  // namespace llvmjsongen
