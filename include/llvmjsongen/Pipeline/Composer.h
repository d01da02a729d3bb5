//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Composition of pass outputs into one deduplicated unit artifact.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_PIPELINE_COMPOSER_H
#define LLVMJSONGEN_PIPELINE_COMPOSER_H

#include "llvmjsongen/Pipeline/GeneratorPass.h"
#include "llvmjsongen/Support/Diagnostics.h"
#include "llvmjsongen/Support/PatchInstruction.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <string>
#include <vector>

namespace llvmjsongen
{

/// @brief Deduplicated, insertion-ordered fragments of one unit.
class GeneratedUnit final
{
public:
    /// @brief Adds one fragment after trimming surrounding whitespace.
    /// @param[in] fragment Raw fragment text.
    /// @return True when the fragment was new and non-empty.
    bool add(llvm::StringRef fragment);

    /// @brief Returns the kept fragments in first-seen order.
    /// @return Fragment list.
    [[nodiscard]] const std::vector<std::string>& fragments() const
    {
        return fragments_;
    }

    /// @brief Returns the fragments joined by one blank line.
    /// @return Aggregate text; empty when there are no fragments.
    [[nodiscard]] std::string text() const;

    /// @brief Indicates whether no fragment was kept.
    /// @return True when empty.
    [[nodiscard]] bool empty() const
    {
        return fragments_.empty();
    }

private:
    std::vector<std::string> fragments_;
    llvm::StringSet<>        seen_;
};

/// @brief Result of composing one unit.
struct Composition final
{
    /// @brief Aggregate output.
    GeneratedUnit output;

    /// @brief Patch instructions from every pass, in pass order.
    std::vector<PatchInstruction> patches;

    /// @brief Raw fragment count per pass, in pass order.
    std::vector<std::size_t> rawFragmentCounts;
};

/// @brief Runs passes over one snapshot and composes their outputs.
///
/// @details
/// The first pass error aborts the composition and is returned unchanged.
///
/// @param[in] snapshot Unit snapshot.
/// @param[in] passes Ordered pass list.
/// @param[in,out] diagnostics Diagnostics sink shared by the passes.
/// @return Composition or the first terminal generation error.
llvm::Expected<Composition> composeUnit(const UnitSnapshot&               snapshot,
                                        const std::vector<GeneratorPass>& passes,
                                        DiagnosticEngine&                 diagnostics);

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_PIPELINE_COMPOSER_H
