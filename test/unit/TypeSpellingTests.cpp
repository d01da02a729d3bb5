//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "llvmjsongen/Frontend/TypeSpelling.h"
#include "llvmjsongen/Support/GenerationError.h"

#include "llvm/Support/Error.h"

bool runTypeSpellingTests()
{
    {
        auto type = llvmjsongen::parseTypeSpelling("std::map< std::string , std::vector<std::optional<int>> >");
        if (!type)
        {
            std::cerr << "nested type spelling failed: " << llvm::toString(type.takeError()) << "\n";
            return false;
        }
        if (type->name != "std::map" || type->arguments.size() != 2U ||
            type->arguments[1].name != "std::vector" || !type->arguments[1].arguments[0].isNullable())
        {
            std::cerr << "nested type structure mismatch\n";
            return false;
        }
        if (type->str() != "std::map<std::string, std::vector<std::optional<int>>>")
        {
            std::cerr << "canonical spelling mismatch: " << type->str() << "\n";
            return false;
        }
    }

    {
        auto type = llvmjsongen::parseTypeSpelling("unsigned   long long");
        if (!type || type->str() != "unsigned long long" || !type->arguments.empty())
        {
            if (!type)
            {
                llvm::consumeError(type.takeError());
            }
            std::cerr << "multi-word builtin spelling mismatch\n";
            return false;
        }
    }

    {
        auto type = llvmjsongen::parseTypeSpelling("::llvm::json::Value");
        if (!type || type->name != "::llvm::json::Value")
        {
            if (!type)
            {
                llvm::consumeError(type.takeError());
            }
            std::cerr << "globally qualified spelling mismatch\n";
            return false;
        }
    }

    for (const char* bad : {"int*", "const Point&", "std::vector<int", "std::vector<>", ""})
    {
        auto type = llvmjsongen::parseTypeSpelling(bad);
        if (type)
        {
            std::cerr << "malformed spelling accepted: `" << bad << "`\n";
            return false;
        }
        const auto info = llvmjsongen::takeGenerationErrorInfo(type.takeError());
        if (info.kind != llvmjsongen::GenerationErrorKind::InvalidModel)
        {
            std::cerr << "malformed spelling reported with the wrong kind: `" << bad << "`\n";
            return false;
        }
    }

    return true;
}
