//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pklgen/CodeGen/CodegenContext.h"
#include "pklgen/CodeGen/CodegenErrors.h"
#include "pklgen/CodeGen/GeneratedMember.h"
#include "pklgen/CodeGen/NamespaceAssembler.h"
#include "pklgen/Model/Schema.h"
#include "pklgen/Model/TypeExpr.h"

namespace
{

pklgen::Declaration makeDecl(pklgen::DeclarationKind kind, const std::string& name)
{
    pklgen::Declaration decl;
    decl.kind          = kind;
    decl.name          = name;
    decl.moduleName    = "N";
    decl.location.file = "N.pkl";
    return decl;
}

pklgen::PropertyDecl makeProperty(const std::string& name, pklgen::TypeExprPtr type)
{
    pklgen::PropertyDecl property;
    property.name = name;
    property.type = std::move(type);
    return property;
}

/// Txt alias, E enum, A class, and module class B extending A, declared in that order.
pklgen::ReflectedModule makeSampleModule()
{
    using pklgen::DeclarationKind;
    using pklgen::PrimitiveKind;

    pklgen::ReflectedModule module;
    module.name = "N";
    module.uri  = "file:///N.pkl";

    auto txt        = makeDecl(DeclarationKind::TypeAlias, "Txt");
    txt.aliasedType = pklgen::makePrimitiveType(PrimitiveKind::String);

    auto e       = makeDecl(DeclarationKind::Enum, "E");
    e.enumValues = {"a", "b"};

    auto a = makeDecl(DeclarationKind::Class, "A");
    a.properties.push_back(makeProperty("name", pklgen::makePrimitiveType(PrimitiveKind::String)));

    auto b       = makeDecl(DeclarationKind::Module, "B");
    b.superclass = "N#A";
    b.properties.push_back(makeProperty("e", pklgen::makeDeclaredType("N#E")));

    module.declarations = {txt, e, a, b};
    return module;
}

pklgen::MappingTable makeSampleMappings(const pklgen::ReflectedModule& module)
{
    std::vector<pklgen::Mapping> mappings;
    for (const pklgen::Declaration& decl : module.declarations)
    {
        pklgen::Mapping mapping = pklgen::makeDefaultMapping(decl, "N");
        mapping.targetName      = decl.name;
        mappings.push_back(std::move(mapping));
    }
    return pklgen::MappingTable(std::move(mappings));
}

std::size_t countOccurrences(std::string_view text, std::string_view needle)
{
    std::size_t count = 0;
    std::size_t pos   = 0;
    while ((pos = text.find(needle, pos)) != std::string_view::npos)
    {
        ++count;
        pos += needle.size();
    }
    return count;
}

const char* const kExpectedSampleDocument =
    "# Code generated from Pkl module `N`. DO NOT EDIT.\n"
    "from __future__ import annotations\n"
    "from typing import Any, Callable, Dict, List, Literal, Optional, Set, Tuple, Union\n"
    "from dataclasses import dataclass\n"
    "import re\n"
    "import pkl\n"
    "from enum import Enum\n"
    "\n"
    "\n"
    "Txt = str\n"
    "\n"
    "class E(str, Enum):\n"
    "    A = \"a\"\n"
    "    B = \"b\"\n"
    "\n"
    "@dataclass\n"
    "class A:\n"
    "    name: str\n"
    "\n"
    "    _registered_identifier = \"N#A\"\n"
    "\n"
    "@dataclass\n"
    "class B(A):\n"
    "    e: E\n"
    "\n"
    "    _registered_identifier = \"N\"\n"
    "\n"
    "    @classmethod\n"
    "    def load_pkl(cls, source):\n"
    "        # Load the Pkl module at the given source and evaluate it into `N.B`.\n"
    "        # - Parameter source: The source of the Pkl module.\n"
    "        config = pkl.load(source, parser=pkl.Parser(namespace = globals()))\n"
    "        return config\n";

}  // namespace

bool runNamespaceAssemblerTests()
{
    using pklgen::DeclarationKind;

    const std::vector<std::string> header = {"# Code generated from Pkl module `N`. DO NOT EDIT."};

    {
        const auto                   module   = makeSampleModule();
        const auto                   mappings = makeSampleMappings(module);
        const pklgen::CodegenContext ctx("N", mappings);

        auto first = pklgen::generateNamespace(module, ctx, header);
        if (!first)
        {
            std::cerr << "sample namespace failed: " << llvm::toString(first.takeError()) << "\n";
            return false;
        }
        if (first->text != kExpectedSampleDocument)
        {
            std::cerr << "sample document mismatch:\n" << first->text << "\n";
            return false;
        }
        if (first->fileName != "N_pkl.py" || first->namespaceName != "N")
        {
            std::cerr << "document naming mismatch\n";
            return false;
        }
        if (first->text.back() != '\n' || first->text.find("\n\n\n", first->text.find("Txt = str")) != std::string::npos)
        {
            std::cerr << "bodies should be separated by exactly one blank line\n";
            return false;
        }
        if (first->text.size() >= 2 && first->text[first->text.size() - 2] == '\n')
        {
            std::cerr << "document should end with exactly one newline\n";
            return false;
        }

        auto second = pklgen::generateNamespace(module, ctx, header);
        if (!second || second->text != first->text)
        {
            if (!second)
            {
                llvm::consumeError(second.takeError());
            }
            std::cerr << "generation should be deterministic\n";
            return false;
        }
    }

    {
        auto module   = makeSampleModule();
        auto e2       = makeDecl(DeclarationKind::Enum, "E2");
        e2.enumValues = {"c"};
        module.declarations.insert(module.declarations.begin() + 1, e2);
        const auto                   mappings = makeSampleMappings(module);
        const pklgen::CodegenContext ctx("N", mappings, "\t");

        auto document = pklgen::generateNamespace(module, ctx, header);
        if (!document)
        {
            std::cerr << "two-enum namespace failed: " << llvm::toString(document.takeError()) << "\n";
            return false;
        }
        if (countOccurrences(document->text, "from enum import Enum\n") != 1U)
        {
            std::cerr << "auxiliary text should be de-duplicated\n";
            return false;
        }
        if (document->text.find("\n\t@classmethod\n\tdef load_pkl(cls, source):\n\t\t# Load") == std::string::npos)
        {
            std::cerr << "configured indent unit should apply to the loader\n";
            return false;
        }
    }

    {
        auto module = makeSampleModule();
        std::vector<pklgen::Mapping> mappings;
        for (const pklgen::Declaration& decl : module.declarations)
        {
            pklgen::Mapping mapping = pklgen::makeDefaultMapping(decl, "N");
            mapping.targetName      = decl.name == "Txt" ? "A" : decl.name;
            mappings.push_back(std::move(mapping));
        }
        const pklgen::MappingTable   table(std::move(mappings));
        const pklgen::CodegenContext ctx("N", table);

        auto document = pklgen::generateNamespace(module, ctx, header);
        if (document)
        {
            std::cerr << "name collision should abort the namespace\n";
            return false;
        }
        std::vector<std::string> conflicting;
        llvm::handleAllErrors(document.takeError(), [&](const pklgen::NameCollisionError& collision) {
            for (const auto& conflict : collision.conflicts())
            {
                conflicting.push_back(conflict.qualifiedName);
            }
        });
        if (conflicting != std::vector<std::string>{"N#Txt", "N#A"})
        {
            std::cerr << "collision should list exactly the colliding declarations\n";
            return false;
        }
    }

    {
        auto module = makeSampleModule();
        module.declarations.pop_back();
        const auto                   mappings = makeSampleMappings(module);
        const pklgen::CodegenContext ctx("N", mappings);
        auto                         document = pklgen::generateNamespace(module, ctx, header);
        if (document)
        {
            std::cerr << "module without a module class should fail\n";
            return false;
        }
        llvm::consumeError(document.takeError());
    }

    {
        const auto                   module = makeSampleModule();
        std::vector<pklgen::Mapping> mappings;
        for (const pklgen::Declaration& decl : module.declarations)
        {
            mappings.push_back(pklgen::makeDefaultMapping(decl, decl.name == "A" ? "Elsewhere" : "N"));
        }
        const pklgen::MappingTable   table(std::move(mappings));
        const pklgen::CodegenContext ctx("N", table);
        auto                         document = pklgen::generateNamespace(module, ctx, header);
        if (document)
        {
            std::cerr << "declaration mapped to a foreign namespace should fail\n";
            return false;
        }
        const std::string message = llvm::toString(document.takeError());
        if (message.find("Elsewhere") == std::string::npos)
        {
            std::cerr << "namespace mismatch error should name the namespace: " << message << "\n";
            return false;
        }
    }

    {
        auto module = makeSampleModule();
        module.declarations[2].properties.push_back(
            makeProperty("check", pklgen::makeUnsupportedType("Int(isPositive)")));
        const auto                   mappings = makeSampleMappings(module);
        const pklgen::CodegenContext ctx("N", mappings);
        auto                         document = pklgen::generateNamespace(module, ctx, header);
        if (document)
        {
            std::cerr << "unsupported type should abort the namespace\n";
            return false;
        }
        bool sawUnsupported = false;
        llvm::handleAllErrors(document.takeError(), [&](const pklgen::UnsupportedTypeError&) {
            sawUnsupported = true;
        });
        if (!sawUnsupported)
        {
            std::cerr << "unsupported type should surface as UnsupportedTypeError\n";
            return false;
        }
    }

    {
        pklgen::GeneratedMember root;
        root.kind      = DeclarationKind::Module;
        root.sourceKey = "N";
        root.body.line("class B:");
        pklgen::GeneratedMember trailing;
        trailing.kind      = DeclarationKind::Class;
        trailing.sourceKey = "N#A";
        trailing.body.line("class A:");

        const pklgen::MappingTable   table{};
        const pklgen::CodegenContext ctx("N", table);
        pklgen::NamespaceModuleInfo  info;
        info.moduleName   = "N";
        info.rootTypeName = "B";

        const std::vector<const pklgen::GeneratedMember*> misordered = {&root, &trailing};
        auto document = pklgen::assembleDocument(info, ctx, misordered);
        if (document)
        {
            std::cerr << "assembly should reject a module class that is not last\n";
            return false;
        }
        llvm::consumeError(document.takeError());
    }

    {
        pklgen::GeneratedMember alias;
        alias.kind      = DeclarationKind::TypeAlias;
        alias.sourceKey = "N#Ref";
        alias.body.line("Ref = x_pkl.Thing");
        alias.topLevelAux = {"import x_pkl"};
        pklgen::GeneratedMember choice;
        choice.kind      = DeclarationKind::Enum;
        choice.sourceKey = "N#Choice";
        choice.body.line("class Choice(str, Enum):").indent().line("A = \"a\"");
        choice.topLevelAux = {"from enum import Enum"};
        pklgen::GeneratedMember root;
        root.kind      = DeclarationKind::Module;
        root.sourceKey = "N";
        root.body.line("class Root:").indent().line("other: x_pkl.Thing");
        root.topLevelAux = {"import x_pkl"};

        const pklgen::MappingTable   table{};
        const pklgen::CodegenContext ctx("N", table);
        pklgen::NamespaceModuleInfo  info;
        info.moduleName   = "N";
        info.rootTypeName = "Root";

        const std::vector<const pklgen::GeneratedMember*> ordered = {&alias, &choice, &root};
        auto document = pklgen::assembleDocument(info, ctx, ordered);
        if (!document)
        {
            std::cerr << "auxiliary ordering assembly failed: " << llvm::toString(document.takeError()) << "\n";
            return false;
        }
        const std::string expectedHead = "from __future__ import annotations\n"
                                         "from typing import Any, Callable, Dict, List, Literal, Optional, Set, "
                                         "Tuple, Union\n"
                                         "from dataclasses import dataclass\n"
                                         "import re\n"
                                         "import pkl\n"
                                         "import x_pkl\n"
                                         "from enum import Enum\n"
                                         "\n"
                                         "\n"
                                         "Ref = x_pkl.Thing\n"
                                         "\n"
                                         "class Choice(str, Enum):\n"
                                         "    A = \"a\"\n"
                                         "\n"
                                         "class Root:\n"
                                         "    other: x_pkl.Thing\n"
                                         "\n"
                                         "    @classmethod\n";
        if (document->text.compare(0, expectedHead.size(), expectedHead) != 0)
        {
            std::cerr << "auxiliary units should keep first-occurrence order:\n" << document->text << "\n";
            return false;
        }
    }

    {
        const std::string loader = pklgen::buildLoaderStub("Birds.Module").str("  ");
        if (loader != "  @classmethod\n"
                      "  def load_pkl(cls, source):\n"
                      "    # Load the Pkl module at the given source and evaluate it into `Birds.Module`.\n"
                      "    # - Parameter source: The source of the Pkl module.\n"
                      "    config = pkl.load(source, parser=pkl.Parser(namespace = globals()))\n"
                      "    return config\n")
        {
            std::cerr << "loader stub mismatch:\n" << loader << "\n";
            return false;
        }
    }

    return true;
}
