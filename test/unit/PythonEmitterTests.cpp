//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "pklgen/CodeGen/PythonEmitter.h"
#include "pklgen/Frontend/SchemaReader.h"
#include "pklgen/Support/Diagnostics.h"

namespace
{

/// `app` imports `lib`; each module generates into a namespace named after it.
const char* const kTwoModuleJson = R"json({
  "modules": [
    {
      "name": "app",
      "uri": "file:///app.pkl",
      "declarations": [
        {
          "kind": "module",
          "name": "Module",
          "location": {"line": 1, "column": 1},
          "properties": [
            {"name": "owner", "type": {"kind": "declared", "ref": "lib#Person"}},
            {"name": "token", "hidden": true, "location": {"line": 4, "column": 3},
             "type": {"kind": "primitive", "name": "String"}}
          ]
        }
      ]
    },
    {
      "name": "lib",
      "uri": "file:///lib.pkl",
      "declarations": [
        {"kind": "class", "name": "Person", "properties": [{"name": "name", "type": {"kind": "primitive", "name": "String"}}]},
        {"kind": "module", "name": "Module"}
      ]
    }
  ]
})json";

std::filesystem::path makeUniqueTempDir()
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / ("pklgen-python-emitter-tests-" + std::to_string(now));
}

std::string readTextFile(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return {};
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

}  // namespace

bool runPythonEmitterTests()
{
    auto schema = pklgen::readSchemaJson(kTwoModuleJson, "two-module.json");
    if (!schema)
    {
        std::cerr << "fixture decode failed: " << llvm::toString(schema.takeError()) << "\n";
        return false;
    }

    {
        pklgen::PythonEmitOptions options;
        pklgen::DiagnosticEngine  diagnostics;
        auto                      documents = pklgen::generatePython(*schema, options, diagnostics);
        if (!documents)
        {
            std::cerr << "generation failed: " << llvm::toString(documents.takeError()) << "\n";
            return false;
        }
        if (documents->size() != 2U || (*documents)[0].fileName != "app_pkl.py" ||
            (*documents)[1].fileName != "lib_pkl.py")
        {
            std::cerr << "one document per module in module order expected\n";
            return false;
        }

        const std::string& app = (*documents)[0].text;
        if (app.rfind("# Code generated from Pkl module `app`. DO NOT EDIT.\n", 0) != 0)
        {
            std::cerr << "default header mismatch\n";
            return false;
        }
        if (app.find("\nimport lib_pkl\n\n\n@dataclass\nclass ModuleClass:\n    owner: lib_pkl.Person\n") ==
            std::string::npos)
        {
            std::cerr << "foreign reference should be imported and qualified:\n" << app << "\n";
            return false;
        }
        if (app.find("token") != std::string::npos)
        {
            std::cerr << "hidden property should not be emitted\n";
            return false;
        }
        if (app.find("evaluate it into `app.Module`.") == std::string::npos)
        {
            std::cerr << "loader should reference the module type\n";
            return false;
        }

        if (diagnostics.count(pklgen::DiagnosticLevel::Note) != 2U ||
            diagnostics.count(pklgen::DiagnosticLevel::Warning) != 1U || diagnostics.hasErrors())
        {
            std::cerr << "expected one note per document and one hidden-property warning\n";
            return false;
        }
        const auto& warning = diagnostics.diagnostics().front();
        if (warning.location.str() != "file:///app.pkl:4:3" || warning.message.find("'token'") == std::string::npos)
        {
            std::cerr << "hidden-property warning mismatch\n";
            return false;
        }
    }

    {
        pklgen::PythonEmitOptions options;
        options.headerLines = {"# custom header"};
        options.fileSuffix  = "gen";
        options.indentUnit  = "  ";
        pklgen::DiagnosticEngine diagnostics;
        auto                     documents = pklgen::generatePython(*schema, options, diagnostics);
        if (!documents)
        {
            std::cerr << "customized generation failed: " << llvm::toString(documents.takeError()) << "\n";
            return false;
        }
        const std::string& app = documents->front().text;
        if (documents->front().fileName != "app_gen.py" || app.rfind("# custom header\n", 0) != 0 ||
            app.find("\nimport lib_gen\n") == std::string::npos || app.find("\n  owner: lib_gen.Person\n") ==
                std::string::npos)
        {
            std::cerr << "header, suffix, or indent options were not honored:\n" << app << "\n";
            return false;
        }
    }

    {
        auto clash = pklgen::readSchemaJson(R"json({"modules": [
              {"name": "a", "namespace": "shared", "declarations": [{"kind": "module", "name": "Module"}]},
              {"name": "b", "namespace": "shared", "declarations": [{"kind": "module", "name": "Module"}]}
            ]})json",
                                            "clash.json");
        if (!clash)
        {
            std::cerr << "clash fixture decode failed: " << llvm::toString(clash.takeError()) << "\n";
            return false;
        }
        pklgen::PythonEmitOptions options;
        pklgen::DiagnosticEngine  diagnostics;
        auto                      documents = pklgen::generatePython(*clash, options, diagnostics);
        if (documents)
        {
            std::cerr << "two modules generating one namespace should fail\n";
            return false;
        }
        llvm::consumeError(documents.takeError());
    }

    {
        auto stemClash = pklgen::readSchemaJson(R"json({"modules": [
              {"name": "first", "namespace": "a.b", "declarations": [{"kind": "module", "name": "Module"}]},
              {"name": "second", "namespace": "a_b", "declarations": [{"kind": "module", "name": "Module"}]}
            ]})json",
                                                "stem-clash.json");
        if (!stemClash)
        {
            std::cerr << "stem clash fixture decode failed: " << llvm::toString(stemClash.takeError()) << "\n";
            return false;
        }
        pklgen::PythonEmitOptions options;
        pklgen::DiagnosticEngine  diagnostics;
        auto                      documents = pklgen::generatePython(*stemClash, options, diagnostics);
        if (documents)
        {
            std::cerr << "namespaces sharing an output file name should fail\n";
            return false;
        }
        const std::string message = llvm::toString(documents.takeError());
        if (message != "modules 'first' and 'second' both generate output file 'a_b_pkl.py'")
        {
            std::cerr << "output file clash message mismatch: " << message << "\n";
            return false;
        }
    }

    {
        pklgen::PythonEmitOptions options;
        pklgen::DiagnosticEngine  diagnostics;
        llvm::Error               err = pklgen::emitPython(*schema, options, diagnostics);
        if (!err)
        {
            std::cerr << "emission without an output directory should fail\n";
            return false;
        }
        llvm::consumeError(std::move(err));
    }

    {
        const auto                root = makeUniqueTempDir();
        std::vector<std::string>  recorded;
        pklgen::PythonEmitOptions options;
        options.outDir                      = root.string();
        options.writePolicy.recordedOutputs = &recorded;
        options.writePolicy.fileMode        = 0644U;
        pklgen::DiagnosticEngine diagnostics;
        if (llvm::Error err = pklgen::emitPython(*schema, options, diagnostics))
        {
            std::cerr << "emission failed: " << llvm::toString(std::move(err)) << "\n";
            std::error_code ec;
            std::filesystem::remove_all(root, ec);
            return false;
        }

        pklgen::DiagnosticEngine generationDiagnostics;
        auto                     documents = pklgen::generatePython(*schema, options, generationDiagnostics);
        const bool               matches   = documents && recorded.size() == 2U &&
                                 readTextFile(root / "app_pkl.py") == (*documents)[0].text &&
                                 readTextFile(root / "lib_pkl.py") == (*documents)[1].text;
        if (!documents)
        {
            llvm::consumeError(documents.takeError());
        }
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
        if (!matches)
        {
            std::cerr << "written files should match the generated documents\n";
            return false;
        }
    }

    return true;
}
