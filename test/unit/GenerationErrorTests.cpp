//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "llvmjsongen/Support/Diagnostics.h"
#include "llvmjsongen/Support/GenerationError.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

bool runGenerationErrorTests()
{
    using llvmjsongen::GenerationError;
    using llvmjsongen::GenerationErrorKind;

    {
        std::string detail;
        std::string rendered;
        llvm::Error rest = llvm::handleErrors(llvmjsongen::makeGenerationError(GenerationErrorKind::DuplicateKey,
                                                                               "Shape.id",
                                                                               "key `id` is used twice"),
                                              [&](const GenerationError& payload) {
                                                  detail   = payload.detail();
                                                  rendered = payload.message();
                                              });
        if (rest)
        {
            std::cerr << "generation error payload was not handled: " << llvm::toString(std::move(rest)) << "\n";
            return false;
        }
        if (detail != "key `id` is used twice" || rendered != "DuplicateKeyError: [Shape.id] key `id` is used twice")
        {
            std::cerr << "error detail/rendering mismatch: " << rendered << "\n";
            return false;
        }
    }

    {
        const auto info = llvmjsongen::takeGenerationErrorInfo(
            llvmjsongen::makeGenerationError(GenerationErrorKind::Io, "", "disk full"));
        if (info.kind != GenerationErrorKind::Io || info.message != "IoError: disk full")
        {
            std::cerr << "element-less rendering mismatch: " << info.message << "\n";
            return false;
        }
    }

    {
        llvmjsongen::DiagnosticEngine diag;
        llvmjsongen::reportGenerationError(diag,
                                           llvmjsongen::SourceLocation{"shapes.h", 4, 1},
                                           llvmjsongen::makeGenerationError(GenerationErrorKind::ClassNotFound,
                                                                            "Shape",
                                                                            "no definition"));
        llvmjsongen::reportGenerationError(diag,
                                           llvmjsongen::SourceLocation{"shapes.h", 4, 1},
                                           llvm::createStringError(llvm::inconvertibleErrorCode(), "foreign"));
        if (diag.count(llvmjsongen::DiagnosticLevel::Error) != 2U || diag.diagnostics().front().element != "Shape" ||
            diag.diagnostics().front().message != "ClassNotFoundError: no definition" ||
            diag.diagnostics().back().message != "foreign")
        {
            std::cerr << "generation error diagnostics mismatch\n";
            return false;
        }
    }

    return true;
}
