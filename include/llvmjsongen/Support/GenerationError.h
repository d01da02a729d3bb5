//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Typed error payloads propagated through `llvm::Error` by the generation pipeline.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_SUPPORT_GENERATION_ERROR_H
#define LLVMJSONGEN_SUPPORT_GENERATION_ERROR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <optional>
#include <string>
#include <system_error>

namespace llvmjsongen
{

/// @brief Category of a terminal generation failure.
enum class GenerationErrorKind
{
    /// @brief Malformed or conflicting configuration payload.
    Configuration,

    /// @brief Two encoded fields resolve to the same output key.
    DuplicateKey,

    /// @brief Target declaration cannot be located by name in the source snapshot.
    ClassNotFound,

    /// @brief Patch byte range is invalid against the current file contents.
    PatchRange,

    /// @brief Constructor binding requires a field that selection excluded.
    UnavailableField,

    /// @brief No codec is registered for a declared type.
    UnsupportedType,

    /// @brief Unit model payload is malformed.
    InvalidModel,

    /// @brief File could not be read or written.
    Io,
};

/// @brief Returns the stable display name of an error kind (for example `DuplicateKeyError`).
/// @param[in] kind Error kind.
/// @return Display name.
llvm::StringRef generationErrorKindName(GenerationErrorKind kind);

/// @brief `llvm::Error` payload naming the failure kind and the offending element.
class GenerationError final : public llvm::ErrorInfo<GenerationError>
{
public:
    /// @brief LLVM RTTI anchor.
    static char ID;

    /// @brief Constructs an error payload.
    /// @param[in] kind Failure kind.
    /// @param[in] element Offending element (`Class`, `Class.field`, file path).
    /// @param[in] message Human-readable message.
    GenerationError(GenerationErrorKind kind, std::string element, std::string message);

    /// @brief Renders `<Kind>: [<element>] <message>`.
    /// @param[in,out] os Output stream.
    void log(llvm::raw_ostream& os) const override;

    /// @brief Maps every kind onto an inconvertible error code.
    /// @return Error code.
    [[nodiscard]] std::error_code convertToErrorCode() const override;

    /// @brief Failure kind.
    [[nodiscard]] GenerationErrorKind kind() const
    {
        return kind_;
    }

    /// @brief Offending element.
    [[nodiscard]] const std::string& element() const
    {
        return element_;
    }

    /// @brief Message text without kind or element decoration.
    [[nodiscard]] const std::string& detail() const
    {
        return message_;
    }

private:
    GenerationErrorKind kind_;
    std::string         element_;
    std::string         message_;
};

/// @brief Creates a `GenerationError` wrapped in `llvm::Error`.
/// @param[in] kind Failure kind.
/// @param[in] element Offending element.
/// @param[in] message Human-readable message.
/// @return Error value.
llvm::Error makeGenerationError(GenerationErrorKind kind, std::string element, std::string message);

/// @brief Flattened view of a consumed error.
struct GenerationErrorInfo final
{
    /// @brief Kind when the error was a `GenerationError`.
    std::optional<GenerationErrorKind> kind;

    /// @brief Offending element, empty for foreign errors.
    std::string element;

    /// @brief Full rendered message.
    std::string message;
};

/// @brief Consumes an error and returns its flattened view.
/// @param[in] error Error to consume; must be a failure.
/// @return Flattened view.
GenerationErrorInfo takeGenerationErrorInfo(llvm::Error error);

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_SUPPORT_GENERATION_ERROR_H
