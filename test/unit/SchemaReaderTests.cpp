//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <iostream>
#include <string>

#include "pklgen/Frontend/SchemaReader.h"

namespace
{

const char* const kBirdsJson = R"json({
  "modules": [
    {
      "name": "Birds",
      "uri": "file:///birds/Birds.pkl",
      "declarations": [
        {
          "kind": "typealias",
          "name": "Wingspan",
          "location": {"line": 3, "column": 1},
          "aliasedType": {"kind": "primitive", "name": "Float"}
        },
        {
          "kind": "class",
          "name": "Bird",
          "pythonName": "BirdSpec",
          "doc": "A bird.",
          "properties": [
            {"name": "name", "type": {"kind": "primitive", "name": "String"}},
            {
              "name": "tags",
              "type": {
                "kind": "nullable",
                "inner": {
                  "kind": "generic",
                  "base": {"kind": "primitive", "name": "Listing"},
                  "arguments": [{"kind": "stringLiteral", "value": "rare"}]
                }
              }
            },
            {"name": "secret", "hidden": true, "type": {"kind": "primitive", "name": "Int32"}}
          ]
        },
        {"kind": "enum", "name": "Size", "values": ["small", "large"]},
        {
          "kind": "module",
          "name": "Module",
          "location": {"line": 1},
          "properties": [
            {"name": "birds", "type": {"kind": "union", "members": [
              {"kind": "declared", "ref": "Birds#Bird"},
              {"kind": "function", "parameters": [{"kind": "primitive", "name": "Int"}],
               "result": {"kind": "primitive", "name": "Boolean"}}
            ]}}
          ]
        }
      ]
    }
  ]
})json";

bool expectFailure(const char* json, const std::string& fragment, const char* what)
{
    auto schema = pklgen::readSchemaJson(json, "input.json");
    if (schema)
    {
        std::cerr << what << ": expected a decode failure\n";
        return false;
    }
    const std::string message = llvm::toString(schema.takeError());
    if (message.find(fragment) == std::string::npos)
    {
        std::cerr << what << ": error '" << message << "' does not mention '" << fragment << "'\n";
        return false;
    }
    return true;
}

}  // namespace

bool runSchemaReaderTests()
{
    {
        auto schema = pklgen::readSchemaJson(kBirdsJson, "birds.json");
        if (!schema)
        {
            std::cerr << "sample schema failed: " << llvm::toString(schema.takeError()) << "\n";
            return false;
        }
        if (schema->modules.size() != 1U || schema->modules.front().declarations.size() != 4U)
        {
            std::cerr << "sample schema shape mismatch\n";
            return false;
        }

        const auto& decls = schema->modules.front().declarations;
        if (decls[0].kind != pklgen::DeclarationKind::TypeAlias || !decls[0].aliasedType ||
            decls[0].aliasedType->str() != "Float" || decls[0].location.str() != "file:///birds/Birds.pkl:3:1")
        {
            std::cerr << "type alias decode mismatch\n";
            return false;
        }
        if (decls[1].qualifiedName() != "Birds#Bird" || !decls[1].docComment || *decls[1].docComment != "A bird." ||
            decls[1].properties.size() != 3U || !decls[1].properties[2].isHidden)
        {
            std::cerr << "class decode mismatch\n";
            return false;
        }
        if (decls[1].properties[1].type->str() != "List<\"rare\">?")
        {
            std::cerr << "nested type decode mismatch: " << decls[1].properties[1].type->str() << "\n";
            return false;
        }
        if (decls[2].enumValues.size() != 2U || decls[2].enumValues[1] != "large")
        {
            std::cerr << "enum decode mismatch\n";
            return false;
        }
        if (decls[3].kind != pklgen::DeclarationKind::Module || decls[3].qualifiedName() != "Birds" ||
            decls[3].properties.front().type->str() != "Birds#Bird|(Int) -> Boolean")
        {
            std::cerr << "module class decode mismatch: " << decls[3].properties.front().type->str() << "\n";
            return false;
        }

        const pklgen::Mapping* bird = schema->mappings.find("Birds#Bird");
        const pklgen::Mapping* root = schema->mappings.find("Birds");
        if (bird == nullptr || bird->targetName != "BirdSpec" || bird->targetNamespace != "Birds")
        {
            std::cerr << "pythonName should rename the derived mapping\n";
            return false;
        }
        if (root == nullptr || root->targetName != "ModuleClass" || root->sourceKind != pklgen::DeclarationKind::Module)
        {
            std::cerr << "module class should map to ModuleClass by default\n";
            return false;
        }
    }

    {
        auto schema = pklgen::readSchemaJson(R"json({
          "modules": [{"name": "M", "namespace": "ignored", "declarations": [{"kind": "module", "name": "Module"}]}],
          "mappings": [{"kind": "module", "source": "M", "namespace": "app", "name": "Config",
                        "location": {"line": 2, "column": 5}}]
        })json",
                                             "explicit.json");
        if (!schema)
        {
            std::cerr << "explicit mappings failed: " << llvm::toString(schema.takeError()) << "\n";
            return false;
        }
        const pklgen::Mapping* root = schema->mappings.find("M");
        if (schema->mappings.all().size() != 1U || root == nullptr || root->targetNamespace != "app" ||
            root->targetName != "Config" || root->sourceLocation.line != 2U)
        {
            std::cerr << "explicit mapping table should be used verbatim\n";
            return false;
        }
    }

    if (!expectFailure("{\"modules\": [", "invalid JSON", "truncated document") ||
        !expectFailure("{}", "modules: missing required array", "missing modules") ||
        !expectFailure("{\"modules\": []}", "at least one module", "empty modules") ||
        !expectFailure(R"json({"modules": [{"name": "M", "declarations": [{"kind": "struct", "name": "S"}]}]})json",
                       "modules[0].declarations[0].kind: unknown declaration kind 'struct'",
                       "unknown declaration kind") ||
        !expectFailure(R"json({"modules": [{"name": "M", "declarations": [{"kind": "typealias", "name": "T"}]}]})json",
                       "type alias requires an aliased type",
                       "alias without type") ||
        !expectFailure(R"json({"modules": [{"name": "M", "declarations": [{"kind": "class", "name": "C",
                       "properties": [{"name": "p", "type": {"kind": "primitive", "name": "Widget"}}]}]}]})json",
                       "properties[0].type.name: unknown primitive type 'Widget'",
                       "unknown primitive") ||
        !expectFailure(R"json({"modules": [{"name": "M", "declarations": [{"kind": "class", "name": "C",
                       "location": {"line": 0}}]}]})json",
                       "location.line: expected a positive integer",
                       "invalid location") ||
        !expectFailure(R"json({"modules": [{"declarations": []}]})json", "modules[0].name", "module without name") ||
        !expectFailure(R"json({"modules": [{"name": "M", "declarations": [{"kind": "module", "name": "Module"}]}],
                       "mappings": [{"kind": "module", "source": "M", "namespace": "app", "name": "Config"},
                                    {"kind": "module", "source": "M", "namespace": "app", "name": "Other"}]})json",
                       "mappings[1].source: duplicate mapping for 'M' (first declared at mappings[0])",
                       "duplicate mapping source"))
    {
        return false;
    }

    {
        std::string deep;
        for (int i = 0; i < 300; ++i)
        {
            deep += R"({"kind": "nullable", "inner": )";
        }
        deep += R"({"kind": "primitive", "name": "String"})";
        deep += std::string(300, '}');
        const std::string json =
            R"({"modules": [{"name": "M", "declarations": [{"kind": "typealias", "name": "T", "aliasedType": )" + deep +
            "}]}]}";
        if (!expectFailure(json.c_str(), "nesting is too deep", "deeply nested type"))
        {
            return false;
        }
    }

    return true;
}
