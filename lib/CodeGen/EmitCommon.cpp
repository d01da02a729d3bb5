//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements shared file-write policy and companion header rendering.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/CodeGen/EmitCommon.h"

#include "llvmjsongen/CodeGen/NamingPolicy.h"
#include "llvmjsongen/Support/GenerationError.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <sstream>
#include <system_error>

namespace llvmjsongen
{

namespace
{

std::filesystem::perms permsFromMode(const std::uint32_t mode)
{
    using Perm = std::filesystem::perms;
    Perm out   = Perm::none;

    if ((mode & 0400U) != 0U)
    {
        out |= Perm::owner_read;
    }
    if ((mode & 0200U) != 0U)
    {
        out |= Perm::owner_write;
    }
    if ((mode & 0040U) != 0U)
    {
        out |= Perm::group_read;
    }
    if ((mode & 0020U) != 0U)
    {
        out |= Perm::group_write;
    }
    if ((mode & 0004U) != 0U)
    {
        out |= Perm::others_read;
    }
    if ((mode & 0002U) != 0U)
    {
        out |= Perm::others_write;
    }

    return out;
}

std::string absoluteNormalizedPath(const std::filesystem::path& path)
{
    std::error_code ec;
    const auto      absolute = std::filesystem::absolute(path, ec);
    if (ec)
    {
        return path.lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

llvm::Error ioError(const std::filesystem::path& path, const std::string& what, const std::error_code& ec)
{
    return makeGenerationError(GenerationErrorKind::Io, path.string(), what + ": " + ec.message());
}

}  // namespace

llvm::Error writeGeneratedFile(const std::filesystem::path& path, llvm::StringRef content, const EmitWritePolicy& policy)
{
    if (policy.recordedOutputs != nullptr)
    {
        policy.recordedOutputs->push_back(absoluteNormalizedPath(path));
    }

    if (policy.dryRun)
    {
        return llvm::Error::success();
    }

    std::error_code ec;

    const auto parent = path.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            return ioError(parent, "failed to create output directory", ec);
        }
    }

    // Written through a temporary file and renamed, so readers never observe a partial header.
    if (llvm::Error err = llvm::writeToOutput(path.string(), [&](llvm::raw_ostream& os) {
            os << content;
            return llvm::Error::success();
        }))
    {
        return makeGenerationError(GenerationErrorKind::Io,
                                   path.string(),
                                   "failed to write: " + llvm::toString(std::move(err)));
    }

    std::filesystem::permissions(path, permsFromMode(policy.fileMode), std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        return ioError(path, "failed to set mode", ec);
    }

    return llvm::Error::success();
}

std::string companionFileName(const UnitModel& unit)
{
    return unit.name + ".json.hpp";
}

std::string renderCompanionHeader(const UnitModel& unit, llvm::StringRef body)
{
    const std::string  guard = codegenToUpperSnakeCaseIdentifier(unit.name) + "_JSON_HPP";
    const std::string  from  = unit.modelPath.empty() ? unit.name : llvm::sys::path::filename(unit.modelPath).str();
    std::ostringstream out;
    out << "// Generated by jsongenc from " << from << ". Do not edit.\n";
    out << "#ifndef " << guard << "\n";
    out << "#define " << guard << "\n\n";
    out << "#include \"" << unit.includePath << "\"\n\n";
    out << "#include \"llvmjsongen_runtime.hpp\"\n\n";
    out << "#include \"llvm/Support/JSON.h\"\n\n";
    out << "#include <array>\n";
    out << "#include <optional>\n";
    out << "#include <string_view>\n";
    out << "#include <utility>\n\n";
    if (!unit.cppNamespace.empty())
    {
        out << "namespace " << unit.cppNamespace << "\n{\n\n";
    }
    if (!body.empty())
    {
        out << body.str() << "\n";
        if (!body.endswith("\n"))
        {
            out << "\n";
        }
    }
    if (!unit.cppNamespace.empty())
    {
        out << "}  // namespace " << unit.cppNamespace << "\n\n";
    }
    out << "#endif  // " << guard << "\n";
    return out.str();
}

}  // namespace llvmjsongen
