//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <llvm/Support/JSON.h>
#include <iostream>
#include <string>
#include <vector>

#include "pklgen/CodeGen/GeneratorSettings.h"
#include "pklgen/Support/Diagnostics.h"

namespace
{

llvm::Error applyText(const char* text, pklgen::PythonEmitOptions& options, pklgen::DiagnosticEngine& diagnostics)
{
    auto settings = llvm::json::parse(text);
    if (!settings)
    {
        return settings.takeError();
    }
    return pklgen::applyGeneratorSettings(*settings, "settings.json", options, diagnostics);
}

}  // namespace

bool runGeneratorSettingsTests()
{
    {
        pklgen::PythonEmitOptions options;
        pklgen::DiagnosticEngine  diagnostics;
        if (llvm::Error err = applyText(R"json({
              "indent": 2,
              "fileSuffix": "gen",
              "outputDirectory": "out/py",
              "dryRun": true,
              "noOverwrite": true,
              "headerLines": ["# one", "# two"]
            })json",
                                        options,
                                        diagnostics))
        {
            std::cerr << "valid settings rejected: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (options.indentUnit != "  " || options.fileSuffix != "gen" || options.outDir != "out/py" ||
            !options.writePolicy.dryRun || !options.writePolicy.noOverwrite ||
            options.headerLines != std::vector<std::string>{"# one", "# two"})
        {
            std::cerr << "settings were not applied\n";
            return false;
        }
        if (!diagnostics.diagnostics().empty())
        {
            std::cerr << "valid settings should not produce diagnostics\n";
            return false;
        }
    }

    {
        pklgen::PythonEmitOptions options;
        pklgen::DiagnosticEngine  diagnostics;
        if (llvm::Error err = applyText(R"json({"indent": "\t", "zeta": 1, "alpha": true})json", options, diagnostics))
        {
            std::cerr << "string indent rejected: " << llvm::toString(std::move(err)) << "\n";
            return false;
        }
        if (options.indentUnit != "\t" || options.fileSuffix != "pkl")
        {
            std::cerr << "string indent or defaults mismatch\n";
            return false;
        }
        const auto& diags = diagnostics.diagnostics();
        if (diags.size() != 2U || diags[0].level != pklgen::DiagnosticLevel::Warning ||
            diags[0].message.find("'alpha'") == std::string::npos || diags[1].message.find("'zeta'") == std::string::npos)
        {
            std::cerr << "unknown keys should warn in sorted order\n";
            return false;
        }
    }

    {
        const char* const invalid[] = {
            R"json({"indent": 0})json",
            R"json({"indent": 17})json",
            R"json({"indent": "xx"})json",
            R"json({"dryRun": "yes"})json",
            R"json({"fileSuffix": ""})json",
            R"json({"headerLines": [1]})json",
            R"json([])json",
        };
        for (const char* text : invalid)
        {
            pklgen::PythonEmitOptions options;
            pklgen::DiagnosticEngine  diagnostics;
            llvm::Error               err = applyText(text, options, diagnostics);
            if (!err)
            {
                std::cerr << "invalid settings accepted: " << text << "\n";
                return false;
            }
            llvm::consumeError(std::move(err));
        }
    }

    {
        auto unit = pklgen::indentUnitFromWidth(3);
        if (!unit || *unit != "   ")
        {
            if (!unit)
            {
                llvm::consumeError(unit.takeError());
            }
            std::cerr << "indent width projection mismatch\n";
            return false;
        }
        auto tooWide = pklgen::indentUnitFromWidth(pklgen::kMaxIndentWidth + 1);
        if (tooWide)
        {
            std::cerr << "over-wide indent should be rejected\n";
            return false;
        }
        llvm::consumeError(tooWide.takeError());
    }

    {
        pklgen::PythonEmitOptions options;
        pklgen::DiagnosticEngine  diagnostics;
        llvm::Error err = pklgen::loadGeneratorSettingsFile("/nonexistent/pklgen-settings.json", options, diagnostics);
        if (!err)
        {
            std::cerr << "missing settings file should fail\n";
            return false;
        }
        llvm::consumeError(std::move(err));
    }

    return true;
}
