//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements policy-driven writes of generated files.
///
//===----------------------------------------------------------------------===//

#include "pklgen/CodeGen/EmitCommon.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/raw_ostream.h"

#include <array>
#include <system_error>
#include <utility>

namespace pklgen
{
namespace
{

std::filesystem::perms permsFromMode(const std::uint32_t mode)
{
    using Perm = std::filesystem::perms;

    static constexpr std::array<std::pair<std::uint32_t, Perm>, 9> kBits = {{
        {0400U, Perm::owner_read},
        {0200U, Perm::owner_write},
        {0100U, Perm::owner_exec},
        {0040U, Perm::group_read},
        {0020U, Perm::group_write},
        {0010U, Perm::group_exec},
        {0004U, Perm::others_read},
        {0002U, Perm::others_write},
        {0001U, Perm::others_exec},
    }};

    Perm out = Perm::none;
    for (const auto& [bit, perm] : kBits)
    {
        if ((mode & bit) != 0U)
        {
            out |= perm;
        }
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

llvm::Error removeExisting(const std::filesystem::path& path, const EmitWritePolicy& policy)
{
    std::error_code ec;
    const bool      exists = std::filesystem::exists(path, ec);
    if (ec)
    {
        return llvm::createStringError(ec, "failed to stat output path %s", path.string().c_str());
    }
    if (!exists)
    {
        return llvm::Error::success();
    }
    if (policy.noOverwrite)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "refusing to overwrite existing output file: %s",
                                       path.string().c_str());
    }

    // Generated files are left read-only, so replace rather than truncate.
    const bool removed = std::filesystem::remove(path, ec);
    if (ec || !removed)
    {
        return llvm::createStringError(ec ? ec : llvm::inconvertibleErrorCode(),
                                       "failed to remove existing output file %s",
                                       path.string().c_str());
    }
    return llvm::Error::success();
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
    const auto      parent = path.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            return llvm::createStringError(ec, "failed to create output directory %s", parent.string().c_str());
        }
    }

    if (auto err = removeExisting(path, policy))
    {
        return err;
    }

    {
        llvm::raw_fd_ostream os(path.string(), ec, llvm::sys::fs::OF_Text);
        if (ec)
        {
            return llvm::createStringError(ec, "failed to open %s", path.string().c_str());
        }
        os << content;
        os.close();
        if (os.has_error())
        {
            const std::error_code writeError = os.error();
            os.clear_error();
            return llvm::createStringError(writeError, "failed to write %s", path.string().c_str());
        }
    }

    std::filesystem::permissions(path, permsFromMode(policy.fileMode), std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        return llvm::createStringError(ec, "failed to set mode on %s", path.string().c_str());
    }
    return llvm::Error::success();
}

}  // namespace pklgen
