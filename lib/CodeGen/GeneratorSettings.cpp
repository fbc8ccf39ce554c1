//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements generator settings decoding.
///
//===----------------------------------------------------------------------===//

#include "pklgen/CodeGen/GeneratorSettings.h"

#include "pklgen/Support/Diagnostics.h"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

#include "llvm/ADT/StringSet.h"

namespace pklgen
{
namespace
{

bool readTextFile(const std::filesystem::path& path, std::string& out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.good())
    {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

llvm::Error invalidSetting(llvm::StringRef sourceName, llvm::StringRef key, llvm::StringRef expected)
{
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "%s: setting '%s' must be %s",
                                   sourceName.str().c_str(),
                                   key.str().c_str(),
                                   expected.str().c_str());
}

llvm::Error applyString(const llvm::json::Object& settings,
                        llvm::StringRef           key,
                        llvm::StringRef           sourceName,
                        std::string&              outValue)
{
    const auto* value = settings.get(key);
    if (value == nullptr)
    {
        return llvm::Error::success();
    }
    const auto text = value->getAsString();
    if (!text)
    {
        return invalidSetting(sourceName, key, "a string");
    }
    outValue = text->str();
    return llvm::Error::success();
}

llvm::Error applyBoolean(const llvm::json::Object& settings,
                         llvm::StringRef           key,
                         llvm::StringRef           sourceName,
                         bool&                     outValue)
{
    const auto* value = settings.get(key);
    if (value == nullptr)
    {
        return llvm::Error::success();
    }
    const auto flag = value->getAsBoolean();
    if (!flag)
    {
        return invalidSetting(sourceName, key, "a boolean");
    }
    outValue = *flag;
    return llvm::Error::success();
}

llvm::Error applyIndent(const llvm::json::Object& settings, llvm::StringRef sourceName, std::string& outValue)
{
    const auto* value = settings.get("indent");
    if (value == nullptr)
    {
        return llvm::Error::success();
    }

    if (const auto width = value->getAsInteger())
    {
        auto unit = indentUnitFromWidth(*width);
        if (!unit)
        {
            llvm::consumeError(unit.takeError());
            return invalidSetting(sourceName, "indent", "between 1 and 16 spaces");
        }
        outValue = std::move(*unit);
        return llvm::Error::success();
    }

    const auto text = value->getAsString();
    if (!text || text->empty() || text->find_first_not_of(" \t") != llvm::StringRef::npos)
    {
        return invalidSetting(sourceName, "indent", "a width or a non-empty string of spaces and tabs");
    }
    outValue = text->str();
    return llvm::Error::success();
}

llvm::Error applyHeaderLines(const llvm::json::Object& settings,
                             llvm::StringRef           sourceName,
                             std::vector<std::string>& outValue)
{
    const auto* value = settings.get("headerLines");
    if (value == nullptr)
    {
        return llvm::Error::success();
    }
    const auto* array = value->getAsArray();
    if (array == nullptr)
    {
        return invalidSetting(sourceName, "headerLines", "an array of strings");
    }

    std::vector<std::string> lines;
    lines.reserve(array->size());
    for (const llvm::json::Value& item : *array)
    {
        const auto text = item.getAsString();
        if (!text)
        {
            return invalidSetting(sourceName, "headerLines", "an array of strings");
        }
        lines.emplace_back(text->str());
    }
    outValue = std::move(lines);
    return llvm::Error::success();
}

}  // namespace

llvm::Expected<std::string> indentUnitFromWidth(const std::int64_t width)
{
    if (width < 1 || width > kMaxIndentWidth)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "indent width must be between 1 and %lld, got %lld",
                                       static_cast<long long>(kMaxIndentWidth),
                                       static_cast<long long>(width));
    }
    return std::string(static_cast<std::size_t>(width), ' ');
}

llvm::Error applyGeneratorSettings(const llvm::json::Value& settings,
                                   llvm::StringRef          sourceName,
                                   PythonEmitOptions&       options,
                                   DiagnosticEngine&        diagnostics)
{
    const auto* object = settings.getAsObject();
    if (object == nullptr)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "%s: settings must be a JSON object",
                                       sourceName.str().c_str());
    }

    static const llvm::StringSet<> kKnownKeys = {"indent",
                                                 "fileSuffix",
                                                 "outputDirectory",
                                                 "dryRun",
                                                 "noOverwrite",
                                                 "headerLines"};
    std::vector<std::string> unknownKeys;
    for (const auto& entry : *object)
    {
        if (!kKnownKeys.contains(entry.first))
        {
            unknownKeys.push_back(entry.first.str());
        }
    }
    std::sort(unknownKeys.begin(), unknownKeys.end());
    for (const std::string& key : unknownKeys)
    {
        SourceLocation location;
        location.file = sourceName.str();
        diagnostics.warning(location, "ignoring unknown setting '" + key + "'");
    }

    if (auto err = applyIndent(*object, sourceName, options.indentUnit))
    {
        return err;
    }
    if (auto err = applyString(*object, "fileSuffix", sourceName, options.fileSuffix))
    {
        return err;
    }
    if (options.fileSuffix.empty())
    {
        return invalidSetting(sourceName, "fileSuffix", "a non-empty string");
    }
    if (auto err = applyString(*object, "outputDirectory", sourceName, options.outDir))
    {
        return err;
    }
    if (auto err = applyBoolean(*object, "dryRun", sourceName, options.writePolicy.dryRun))
    {
        return err;
    }
    if (auto err = applyBoolean(*object, "noOverwrite", sourceName, options.writePolicy.noOverwrite))
    {
        return err;
    }
    return applyHeaderLines(*object, sourceName, options.headerLines);
}

llvm::Error loadGeneratorSettingsFile(const std::string& path, PythonEmitOptions& options, DiagnosticEngine& diagnostics)
{
    std::string text;
    if (!readTextFile(path, text))
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "failed to read settings file %s", path.c_str());
    }

    auto settings = llvm::json::parse(text);
    if (!settings)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "%s: invalid JSON: %s",
                                       path.c_str(),
                                       llvm::toString(settings.takeError()).c_str());
    }
    return applyGeneratorSettings(*settings, path, options, diagnostics);
}

}  // namespace pklgen
