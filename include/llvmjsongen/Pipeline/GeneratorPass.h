//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Generation passes run by the composer over one unit snapshot.
///
/// Passes form a closed set. Each pass turns an immutable snapshot into
/// fragments and, for in-place generation, patch instructions.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_PIPELINE_GENERATOR_PASS_H
#define LLVMJSONGEN_PIPELINE_GENERATOR_PASS_H

#include "llvmjsongen/Semantics/Config.h"
#include "llvmjsongen/Semantics/Model.h"
#include "llvmjsongen/Support/Diagnostics.h"
#include "llvmjsongen/Support/PatchInstruction.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace llvmjsongen
{

/// @brief Immutable inputs of one unit generation.
struct UnitSnapshot final
{
    /// @brief Unit model.
    const UnitModel& unit;

    /// @brief Global configuration.
    const GlobalConfig& global;

    /// @brief Source contents; `std::nullopt` when the source could not be read.
    std::optional<std::string> sourceText;

    /// @brief Read failure description when `sourceText` is empty.
    std::string sourceError;

    /// @brief Allow passes to produce patch instructions.
    bool allowPatches{true};
};

/// @brief Raw output of one pass.
struct PassOutput final
{
    /// @brief Fragments in emission order; may contain duplicates and blanks.
    std::vector<std::string> fragments;

    /// @brief In-place patches.
    std::vector<PatchInstruction> patches;
};

/// @brief Generates bindings for annotated classes.
class SerializablePass final
{
public:
    /// @brief Returns the pass name used in traces.
    /// @return Pass name.
    [[nodiscard]] llvm::StringRef name() const
    {
        return "serializable";
    }

    /// @brief Runs the pass.
    /// @param[in] snapshot Unit snapshot.
    /// @param[in,out] diagnostics Receives warnings, exclusion notes, and in-place errors.
    /// @return Output or the first terminal generation error.
    [[nodiscard]] llvm::Expected<PassOutput> run(const UnitSnapshot& snapshot, DiagnosticEngine& diagnostics) const;
};

/// @brief Generates value tables for annotated enums.
class EnumPass final
{
public:
    /// @brief Returns the pass name used in traces.
    /// @return Pass name.
    [[nodiscard]] llvm::StringRef name() const
    {
        return "enum";
    }

    /// @brief Runs the pass.
    /// @param[in] snapshot Unit snapshot.
    /// @param[in,out] diagnostics Unused; kept for a uniform pass contract.
    /// @return Output or the first terminal generation error.
    [[nodiscard]] llvm::Expected<PassOutput> run(const UnitSnapshot& snapshot, DiagnosticEngine& diagnostics) const;
};

/// @brief Closed set of generation passes.
using GeneratorPass = std::variant<SerializablePass, EnumPass>;

/// @brief Returns the standard pass list: serializable classes, then enums.
/// @return Pass list.
std::vector<GeneratorPass> defaultPasses();

/// @brief Runs one pass of the closed set.
/// @param[in] pass Pass to run.
/// @param[in] snapshot Unit snapshot.
/// @param[in,out] diagnostics Diagnostics sink.
/// @return Output or the first terminal generation error.
llvm::Expected<PassOutput> runPass(const GeneratorPass& pass, const UnitSnapshot& snapshot, DiagnosticEngine& diagnostics);

/// @brief Returns the name of one pass of the closed set.
/// @param[in] pass Pass.
/// @return Pass name.
llvm::StringRef passName(const GeneratorPass& pass);

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_PIPELINE_GENERATOR_PASS_H
