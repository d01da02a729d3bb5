//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations for diagnostic reporting interfaces used across config merging, field selection,
/// emission, composition, and source patching.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_SUPPORT_DIAGNOSTICS_H
#define LLVMJSONGEN_SUPPORT_DIAGNOSTICS_H

#include "llvmjsongen/Frontend/SourceLocation.h"

#include "llvm/ADT/StringRef.h"

#include "llvm/Support/Error.h"

#include <cstddef>
#include <string>
#include <vector>

namespace llvmjsongen
{

/// @file
/// @brief Diagnostic collection and reporting interfaces.

/// @brief Severity level for a diagnostic message.
enum class DiagnosticLevel
{

    /// @brief Informational note.
    Note,

    /// @brief Non-fatal warning.
    Warning,

    /// @brief Fatal error.
    Error,
};

/// @brief Single diagnostic record produced by the pipeline.
struct Diagnostic
{
    /// @brief Severity level.
    DiagnosticLevel level;

    /// @brief Source location associated with the message.
    SourceLocation location;

    /// @brief Originating element (`Class`, `Class.field`, `Enum`), empty for unit-wide messages.
    std::string element;

    /// @brief Human-readable message text.
    std::string message;
};

/// @brief Returns the lowercase spelling of a diagnostic level.
/// @param[in] level Severity level.
/// @return `note`, `warning`, or `error`.
llvm::StringRef diagnosticLevelName(DiagnosticLevel level);

/// @brief Accumulates diagnostics emitted while processing one unit.
///
/// @details
/// One engine is created per unit and threaded explicitly through the pipeline,
/// so concurrently processed units never share an engine.
class DiagnosticEngine final
{
public:
    /// @brief Appends a diagnostic entry.
    /// @param[in] level Severity level.
    /// @param[in] location Source location associated with the message.
    /// @param[in] element Originating element reference.
    /// @param[in] message Human-readable message text.
    void report(DiagnosticLevel level, const SourceLocation& location, std::string element, std::string message);

    /// @brief Emits a note-level diagnostic.
    /// @param[in] location Source location associated with the message.
    /// @param[in] element Originating element reference.
    /// @param[in] message Human-readable message text.
    void note(const SourceLocation& location, std::string element, std::string message);

    /// @brief Emits a warning-level diagnostic.
    /// @param[in] location Source location associated with the message.
    /// @param[in] element Originating element reference.
    /// @param[in] message Human-readable message text.
    void warning(const SourceLocation& location, std::string element, std::string message);

    /// @brief Emits an error-level diagnostic.
    /// @param[in] location Source location associated with the message.
    /// @param[in] element Originating element reference.
    /// @param[in] message Human-readable message text.
    void error(const SourceLocation& location, std::string element, std::string message);

    /// @brief Appends every diagnostic of another engine, preserving order.
    /// @param[in] other Source engine.
    void append(const DiagnosticEngine& other);

    /// @brief Indicates whether any error diagnostics were recorded.
    /// @return True when at least one error exists.
    [[nodiscard]] bool hasErrors() const;

    /// @brief Counts diagnostics of one severity.
    /// @param[in] level Severity level.
    /// @return Number of matching diagnostics.
    [[nodiscard]] std::size_t count(DiagnosticLevel level) const;

    /// @brief Returns all recorded diagnostics in insertion order.
    /// @return Immutable diagnostic list.
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const
    {
        return diagnostics_;
    }

private:
    /// @brief Backing storage for collected diagnostics.
    std::vector<Diagnostic> diagnostics_;
};

/// @brief Consumes an error and records it as one error diagnostic.
///
/// @details
/// A `GenerationError` contributes its element and is rendered as
/// `<Kind>: <message>`; any other error is rendered with `llvm::toString`.
///
/// @param[in,out] engine Receiving engine.
/// @param[in] location Location the error is tied to.
/// @param[in] error Failure to consume.
void reportGenerationError(DiagnosticEngine& engine, const SourceLocation& location, llvm::Error error);

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_SUPPORT_DIAGNOSTICS_H
