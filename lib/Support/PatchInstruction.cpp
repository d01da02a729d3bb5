//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements snapshot fingerprints for patch instructions.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/Support/PatchInstruction.h"

#include "llvm/Support/xxhash.h"

namespace llvmjsongen
{

std::uint64_t snapshotFingerprint(llvm::StringRef contents)
{
    return llvm::xxHash64(contents);
}

}  // namespace llvmjsongen
