//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `pkl-gen-python` command-line generator.
///
/// This tool decodes a reflected Pkl schema, generates one Python module per
/// namespace, and writes the modules under the output directory.
///
//===----------------------------------------------------------------------===//

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "pklgen/CodeGen/GeneratorSettings.h"
#include "pklgen/CodeGen/PythonEmitter.h"
#include "pklgen/Frontend/SchemaReader.h"
#include "pklgen/Support/Diagnostics.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

namespace
{

/// @brief Checks whether a token is a help switch.
///
/// @param[in] arg Argument token from argv.
/// @return `true` when the argument is `--help` or `-h`.
bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: pkl-gen-python <schema.json> [--out-dir <dir>] [options]\n"
                 << "Try: pkl-gen-python --help\n";
}

void printHelp()
{
    llvm::errs()
        << "NAME\n"
        << "  pkl-gen-python - Python dataclass generator for reflected Pkl schemas\n\n"
        << "SYNOPSIS\n"
        << "  pkl-gen-python <schema.json> [--out-dir <dir>] [--settings <file>] [options]\n"
        << "  pkl-gen-python --help\n\n"
        << "DESCRIPTION\n"
        << "  pkl-gen-python reads the JSON reflection of a Pkl module tree and writes one Python\n"
        << "  module per target namespace, named <namespace>_<suffix>.py. Each module holds the\n"
        << "  namespace's type aliases, enums and @dataclass classes in dependency order, with a\n"
        << "  load_pkl class method on the module class.\n\n"
        << "OPTIONS\n"
        << "  --out-dir <dir>\n"
        << "      Output directory for generated files. Required unless set by --settings.\n"
        << "  --settings <file>\n"
        << "      JSON generator settings (indent, fileSuffix, outputDirectory, dryRun,\n"
        << "      noOverwrite, headerLines). Command-line options take precedence.\n"
        << "  --indent <n>\n"
        << "      Indent generated code with <n> spaces (1-16, default 4).\n"
        << "  --suffix <text>\n"
        << "      Output file suffix (default: pkl).\n"
        << "  --dry-run\n"
        << "      Generate and validate, print output paths, write nothing.\n"
        << "  --no-overwrite\n"
        << "      Fail instead of replacing an existing output file.\n"
        << "  --help, -h\n"
        << "      Print this help text.\n\n"
        << "EXAMPLES\n"
        << "  pkl-gen-python build/Classes.reflect.json --out-dir gen\n"
        << "  pkl-gen-python build/Classes.reflect.json --settings pkl-gen.json --dry-run\n\n"
        << "EXIT STATUS\n"
        << "  0 on success, non-zero on input, name-collision, generation or write failure, or invalid\n"
        << "  CLI usage.\n";
}

/// @brief Resolves a path to an absolute output-root string when possible.
///
/// @param[in] root Requested output directory.
/// @return Absolute path string when resolution succeeds; otherwise the input.
std::string resolveOutputRoot(const std::string& root)
{
    std::error_code ec;
    const auto      abs = std::filesystem::absolute(root, ec);
    if (!ec)
    {
        return abs.string();
    }
    return root;
}

/// @brief Prints the post-run summary.
void printRunSummary(llvm::StringRef                           schemaPath,
                     llvm::StringRef                           outputRoot,
                     const std::uint64_t                       generatedFiles,
                     const bool                                dryRun,
                     const std::chrono::steady_clock::duration elapsed)
{
    const auto elapsedMs         = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    const auto elapsedWholeSec   = elapsedMs / 1000;
    const auto elapsedFractionMs = elapsedMs % 1000;
    llvm::errs() << "Run summary:\n"
                 << "  schema: " << schemaPath << "\n"
                 << "  output root: " << outputRoot << "\n"
                 << "  files " << (dryRun ? "planned" : "generated") << ": " << generatedFiles << "\n"
                 << "  elapsed: " << elapsedWholeSec << ".";
    if (elapsedFractionMs < 100)
    {
        llvm::errs() << "0";
    }
    if (elapsedFractionMs < 10)
    {
        llvm::errs() << "0";
    }
    llvm::errs() << elapsedFractionMs << "s\n";
}

}  // namespace

/// @brief Program entry point for `pkl-gen-python`.
///
/// @param[in] argc Argument count.
/// @param[in] argv Argument vector.
/// @return Zero on success, non-zero on CLI, input, or generation failure.
int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    if (argc < 2)
    {
        printUsage();
        return 1;
    }

    std::string                schemaPath;
    std::string                settingsPath;
    std::optional<std::string> outDir;
    std::optional<std::string> indentUnit;
    std::optional<std::string> fileSuffix;
    bool                       dryRun      = false;
    bool                       noOverwrite = false;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg          = argv[i];
        auto              requireValue = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc)
            {
                llvm::errs() << "Missing value for " << name << "\n";
                printUsage();
                std::exit(1);
            }
            return argv[++i];
        };

        if (isHelpToken(arg))
        {
            printHelp();
            return 0;
        }
        else if (arg == "--out-dir")
        {
            outDir = requireValue(arg);
        }
        else if (arg == "--settings")
        {
            settingsPath = requireValue(arg);
        }
        else if (arg == "--indent")
        {
            const auto value = requireValue(arg);
            long long  width = 0;
            if (llvm::StringRef(value).getAsInteger(10, width))
            {
                llvm::errs() << "Invalid --indent value: " << value << "\n";
                printUsage();
                return 1;
            }
            auto unit = pklgen::indentUnitFromWidth(width);
            if (!unit)
            {
                llvm::errs() << "Invalid --indent value: " << llvm::toString(unit.takeError()) << "\n";
                printUsage();
                return 1;
            }
            indentUnit = std::move(*unit);
        }
        else if (arg == "--suffix")
        {
            fileSuffix = requireValue(arg);
            if (fileSuffix->empty())
            {
                llvm::errs() << "Invalid --suffix value: suffix must not be empty\n";
                printUsage();
                return 1;
            }
        }
        else if (arg == "--dry-run")
        {
            dryRun = true;
        }
        else if (arg == "--no-overwrite")
        {
            noOverwrite = true;
        }
        else if (!arg.empty() && arg.front() == '-')
        {
            llvm::errs() << "Unknown option: " << arg << "\n";
            printUsage();
            return 1;
        }
        else if (schemaPath.empty())
        {
            schemaPath = arg;
        }
        else
        {
            llvm::errs() << "Unexpected argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (schemaPath.empty())
    {
        llvm::errs() << "A reflected schema file is required\n";
        printUsage();
        return 1;
    }

    const auto                startedAt = std::chrono::steady_clock::now();
    pklgen::DiagnosticEngine  diagnostics;
    pklgen::PythonEmitOptions options;
    std::vector<std::string>  recordedOutputs;

    if (!settingsPath.empty())
    {
        if (llvm::Error err = pklgen::loadGeneratorSettingsFile(settingsPath, options, diagnostics))
        {
            llvm::errs() << llvm::toString(std::move(err)) << "\n";
            diagnostics.print(llvm::errs());
            return 1;
        }
    }
    if (outDir)
    {
        options.outDir = *outDir;
    }
    if (indentUnit)
    {
        options.indentUnit = *indentUnit;
    }
    if (fileSuffix)
    {
        options.fileSuffix = *fileSuffix;
    }
    options.writePolicy.dryRun          = options.writePolicy.dryRun || dryRun;
    options.writePolicy.noOverwrite     = options.writePolicy.noOverwrite || noOverwrite;
    options.writePolicy.recordedOutputs = &recordedOutputs;

    if (options.outDir.empty())
    {
        llvm::errs() << "--out-dir is required\n";
        printUsage();
        return 1;
    }

    auto schema = pklgen::readSchemaFile(schemaPath);
    if (!schema)
    {
        llvm::errs() << llvm::toString(schema.takeError()) << "\n";
        diagnostics.print(llvm::errs());
        return 1;
    }

    if (llvm::Error err = pklgen::emitPython(*schema, options, diagnostics))
    {
        llvm::errs() << llvm::toString(std::move(err)) << "\n";
        diagnostics.print(llvm::errs());
        return 1;
    }

    diagnostics.print(llvm::errs());
    if (options.writePolicy.dryRun)
    {
        for (const std::string& path : recordedOutputs)
        {
            llvm::outs() << path << "\n";
        }
    }
    printRunSummary(schemaPath,
                    resolveOutputRoot(options.outDir),
                    recordedOutputs.size(),
                    options.writePolicy.dryRun,
                    std::chrono::steady_clock::now() - startedAt);
    return 0;
}
