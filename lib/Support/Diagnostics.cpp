//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic collection and formatting helpers.
///
/// The diagnostic engine records element-aware notes, warnings, and errors for one unit.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/Support/Diagnostics.h"

#include "llvmjsongen/Support/GenerationError.h"

#include <algorithm>
#include <utility>

namespace llvmjsongen
{

llvm::StringRef diagnosticLevelName(const DiagnosticLevel level)
{
    switch (level)
    {
    case DiagnosticLevel::Note:
        return "note";
    case DiagnosticLevel::Warning:
        return "warning";
    case DiagnosticLevel::Error:
        return "error";
    }
    return "error";
}

void DiagnosticEngine::report(const DiagnosticLevel level,
                              const SourceLocation& location,
                              std::string           element,
                              std::string           message)
{
    diagnostics_.push_back(Diagnostic{level, location, std::move(element), std::move(message)});
}

void DiagnosticEngine::note(const SourceLocation& location, std::string element, std::string message)
{
    report(DiagnosticLevel::Note, location, std::move(element), std::move(message));
}

void DiagnosticEngine::warning(const SourceLocation& location, std::string element, std::string message)
{
    report(DiagnosticLevel::Warning, location, std::move(element), std::move(message));
}

void DiagnosticEngine::error(const SourceLocation& location, std::string element, std::string message)
{
    report(DiagnosticLevel::Error, location, std::move(element), std::move(message));
}

void DiagnosticEngine::append(const DiagnosticEngine& other)
{
    diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

bool DiagnosticEngine::hasErrors() const
{
    for (const Diagnostic& d : diagnostics_)
    {
        if (d.level == DiagnosticLevel::Error)
        {
            return true;
        }
    }
    return false;
}

std::size_t DiagnosticEngine::count(const DiagnosticLevel level) const
{
    return static_cast<std::size_t>(std::count_if(diagnostics_.begin(), diagnostics_.end(), [level](const Diagnostic& d) {
        return d.level == level;
    }));
}

void reportGenerationError(DiagnosticEngine& engine, const SourceLocation& location, llvm::Error error)
{
    llvm::Error rest = llvm::handleErrors(std::move(error), [&](const GenerationError& payload) {
        engine.error(location,
                     payload.element(),
                     generationErrorKindName(payload.kind()).str() + ": " + payload.detail());
    });
    if (rest)
    {
        engine.error(location, "", llvm::toString(std::move(rest)));
    }
}

}  // namespace llvmjsongen
