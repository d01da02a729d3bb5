//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the canonical type-spelling reader.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/Frontend/TypeSpelling.h"

#include "llvmjsongen/Support/GenerationError.h"

#include <cctype>
#include <string>

namespace llvmjsongen
{
namespace
{

bool isIdentifierStart(const char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentifierChar(const char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isBuiltinWord(llvm::StringRef word)
{
    return word == "unsigned" || word == "signed" || word == "short" || word == "long" || word == "int" ||
           word == "char" || word == "double";
}

class SpellingReader final
{
public:
    explicit SpellingReader(llvm::StringRef text)
        : text_(text)
    {
    }

    llvm::Expected<TypeRef> readType()
    {
        skipSpace();
        TypeRef type;
        if (llvm::Error err = readName(type.name))
        {
            return std::move(err);
        }
        skipSpace();
        if (peek() == '<')
        {
            ++pos_;
            while (true)
            {
                auto argument = readType();
                if (!argument)
                {
                    return argument.takeError();
                }
                type.arguments.push_back(std::move(*argument));
                skipSpace();
                if (peek() == ',')
                {
                    ++pos_;
                    continue;
                }
                if (peek() == '>')
                {
                    ++pos_;
                    break;
                }
                return fail("expected `,` or `>`");
            }
        }
        return type;
    }

    [[nodiscard]] bool atEnd()
    {
        skipSpace();
        return pos_ >= text_.size();
    }

    llvm::Error fail(const std::string& what) const
    {
        return makeGenerationError(GenerationErrorKind::InvalidModel,
                                   text_.str(),
                                   "malformed type spelling at offset " + std::to_string(pos_) + ": " + what);
    }

private:
    llvm::Error readName(std::string& out)
    {
        if (text_.substr(pos_).startswith("::"))
        {
            out += "::";
            pos_ += 2;
        }
        while (true)
        {
            if (!isIdentifierStart(peek()))
            {
                return fail("expected identifier");
            }
            const std::size_t start = pos_;
            while (isIdentifierChar(peek()))
            {
                ++pos_;
            }
            const llvm::StringRef word = text_.slice(start, pos_);
            out += word.str();

            if (text_.substr(pos_).startswith("::"))
            {
                out += "::";
                pos_ += 2;
                continue;
            }

            // Multi-word builtins (`unsigned long long`) are joined with single spaces.
            if (isBuiltinWord(word))
            {
                const std::size_t save = pos_;
                skipSpace();
                const std::size_t nextStart = pos_;
                while (isIdentifierChar(peek()))
                {
                    ++pos_;
                }
                const llvm::StringRef next = text_.slice(nextStart, pos_);
                if (!next.empty() && isBuiltinWord(next))
                {
                    pos_ = nextStart;
                    out += " ";
                    continue;
                }
                pos_ = save;
            }
            return llvm::Error::success();
        }
    }

    void skipSpace()
    {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])))
        {
            ++pos_;
        }
    }

    [[nodiscard]] char peek() const
    {
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    llvm::StringRef text_;
    std::size_t     pos_{0};
};

}  // namespace

llvm::Expected<TypeRef> parseTypeSpelling(llvm::StringRef spelling)
{
    SpellingReader reader(spelling);
    auto           type = reader.readType();
    if (!type)
    {
        return type.takeError();
    }
    if (!reader.atEnd())
    {
        return reader.fail("unexpected trailing text (pointers, references and qualifiers are not supported)");
    }
    return type;
}

}  // namespace llvmjsongen
