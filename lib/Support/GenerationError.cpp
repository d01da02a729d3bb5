//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the typed generation error payload.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/Support/GenerationError.h"

#include <utility>

namespace llvmjsongen
{

char GenerationError::ID = 0;

llvm::StringRef generationErrorKindName(const GenerationErrorKind kind)
{
    switch (kind)
    {
    case GenerationErrorKind::Configuration:
        return "ConfigurationError";
    case GenerationErrorKind::DuplicateKey:
        return "DuplicateKeyError";
    case GenerationErrorKind::ClassNotFound:
        return "ClassNotFoundError";
    case GenerationErrorKind::PatchRange:
        return "PatchRangeError";
    case GenerationErrorKind::UnavailableField:
        return "UnavailableFieldError";
    case GenerationErrorKind::UnsupportedType:
        return "UnsupportedTypeError";
    case GenerationErrorKind::InvalidModel:
        return "InvalidModelError";
    case GenerationErrorKind::Io:
        return "IoError";
    }
    return "GenerationError";
}

GenerationError::GenerationError(const GenerationErrorKind kind, std::string element, std::string message)
    : kind_(kind)
    , element_(std::move(element))
    , message_(std::move(message))
{
}

void GenerationError::log(llvm::raw_ostream& os) const
{
    os << generationErrorKindName(kind_) << ": ";
    if (!element_.empty())
    {
        os << '[' << element_ << "] ";
    }
    os << message_;
}

std::error_code GenerationError::convertToErrorCode() const
{
    return llvm::inconvertibleErrorCode();
}

llvm::Error makeGenerationError(const GenerationErrorKind kind, std::string element, std::string message)
{
    return llvm::make_error<GenerationError>(kind, std::move(element), std::move(message));
}

GenerationErrorInfo takeGenerationErrorInfo(llvm::Error error)
{
    GenerationErrorInfo info;
    llvm::Error         rest = llvm::handleErrors(std::move(error), [&info](const GenerationError& payload) {
        info.kind    = payload.kind();
        info.element = payload.element();
        std::string              text;
        llvm::raw_string_ostream os(text);
        payload.log(os);
        info.message = os.str();
    });
    if (rest)
    {
        info.message = llvm::toString(std::move(rest));
    }
    return info;
}

}  // namespace llvmjsongen
