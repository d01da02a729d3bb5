//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements unit composition.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/Pipeline/Composer.h"

#include <iterator>
#include <utility>

namespace llvmjsongen
{

bool GeneratedUnit::add(llvm::StringRef fragment)
{
    const llvm::StringRef trimmed = fragment.trim();
    if (trimmed.empty() || !seen_.insert(trimmed).second)
    {
        return false;
    }
    fragments_.push_back(trimmed.str());
    return true;
}

std::string GeneratedUnit::text() const
{
    std::string out;
    for (const std::string& fragment : fragments_)
    {
        if (!out.empty())
        {
            out += "\n\n";
        }
        out += fragment;
    }
    return out;
}

llvm::Expected<Composition> composeUnit(const UnitSnapshot&               snapshot,
                                        const std::vector<GeneratorPass>& passes,
                                        DiagnosticEngine&                 diagnostics)
{
    Composition composition;
    for (const GeneratorPass& pass : passes)
    {
        auto output = runPass(pass, snapshot, diagnostics);
        if (!output)
        {
            return output.takeError();
        }
        composition.rawFragmentCounts.push_back(output->fragments.size());
        for (const std::string& fragment : output->fragments)
        {
            composition.output.add(fragment);
        }
        composition.patches.insert(composition.patches.end(),
                                   std::make_move_iterator(output->patches.begin()),
                                   std::make_move_iterator(output->patches.end()));
    }
    return composition;
}

}  // namespace llvmjsongen
