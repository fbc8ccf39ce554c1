//===----------------------------------------------------------------------===//
//
// Part of the pklgen project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements decoding of the reflected-schema JSON hand-off.
///
//===----------------------------------------------------------------------===//

#include "pklgen/Frontend/SchemaReader.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <map>
#include <sstream>
#include <utility>

#include "llvm/ADT/StringSwitch.h"

namespace pklgen
{
namespace
{

/// Nesting limit for type expressions.
constexpr std::size_t kMaxTypeDepth = 256;

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

std::optional<DeclarationKind> parseDeclarationKind(llvm::StringRef text)
{
    return llvm::StringSwitch<std::optional<DeclarationKind>>(text)
        .Case("module", DeclarationKind::Module)
        .Case("class", DeclarationKind::Class)
        .Case("enum", DeclarationKind::Enum)
        .Case("typealias", DeclarationKind::TypeAlias)
        .Default(std::nullopt);
}

std::string indexPath(llvm::StringRef path, llvm::StringRef key, std::size_t index)
{
    return (path.empty() ? key.str() : path.str() + "." + key.str()) + "[" + std::to_string(index) + "]";
}

std::string memberPath(llvm::StringRef path, llvm::StringRef key)
{
    return path.empty() ? key.str() : path.str() + "." + key.str();
}

}  // namespace

SchemaReader::SchemaReader(std::string sourceName)
    : sourceName_(std::move(sourceName))
{
}

llvm::Error SchemaReader::fail(llvm::StringRef path, const llvm::Twine& message) const
{
    if (path.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "%s: %s",
                                       sourceName_.c_str(),
                                       message.str().c_str());
    }
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "%s: %s: %s",
                                   sourceName_.c_str(),
                                   path.str().c_str(),
                                   message.str().c_str());
}

llvm::Expected<const llvm::json::Object*> SchemaReader::requireObject(const llvm::json::Value& value,
                                                                      llvm::StringRef          path) const
{
    const auto* object = value.getAsObject();
    if (object == nullptr)
    {
        return fail(path, "expected an object");
    }
    return object;
}

llvm::Expected<std::string> SchemaReader::requireString(const llvm::json::Object& object,
                                                        llvm::StringRef           key,
                                                        llvm::StringRef           path) const
{
    const auto* value = object.get(key);
    if (value == nullptr)
    {
        return fail(memberPath(path, key), "missing required string");
    }
    const auto text = value->getAsString();
    if (!text)
    {
        return fail(memberPath(path, key), "expected a string");
    }
    return text->str();
}

llvm::Expected<std::optional<std::string>> SchemaReader::optionalString(const llvm::json::Object& object,
                                                                        llvm::StringRef           key,
                                                                        llvm::StringRef           path) const
{
    const auto* value = object.get(key);
    if (value == nullptr || value->kind() == llvm::json::Value::Null)
    {
        return std::optional<std::string>{};
    }
    const auto text = value->getAsString();
    if (!text)
    {
        return fail(memberPath(path, key), "expected a string");
    }
    return std::optional<std::string>{text->str()};
}

llvm::Expected<const llvm::json::Array*> SchemaReader::optionalArray(const llvm::json::Object& object,
                                                                     llvm::StringRef           key,
                                                                     llvm::StringRef           path) const
{
    static const llvm::json::Array kEmpty;

    const auto* value = object.get(key);
    if (value == nullptr)
    {
        return &kEmpty;
    }
    const auto* array = value->getAsArray();
    if (array == nullptr)
    {
        return fail(memberPath(path, key), "expected an array");
    }
    return array;
}

llvm::Expected<SourceLocation> SchemaReader::readLocation(const llvm::json::Object& object,
                                                          llvm::StringRef           file,
                                                          llvm::StringRef           path) const
{
    SourceLocation location;
    location.file = file.str();

    const auto* value = object.get("location");
    if (value == nullptr)
    {
        return location;
    }

    const std::string locationPath = memberPath(path, "location");
    auto              fields       = requireObject(*value, locationPath);
    if (!fields)
    {
        return fields.takeError();
    }

    const auto readPosition = [&](llvm::StringRef key, std::uint32_t& out) -> llvm::Error {
        const auto* raw = (*fields)->get(key);
        if (raw == nullptr)
        {
            return llvm::Error::success();
        }
        const auto number = raw->getAsInteger();
        if (!number || *number < 1 || *number > std::numeric_limits<std::uint32_t>::max())
        {
            return fail(memberPath(locationPath, key), "expected a positive integer");
        }
        out = static_cast<std::uint32_t>(*number);
        return llvm::Error::success();
    };

    if (auto err = readPosition("line", location.line))
    {
        return std::move(err);
    }
    if (auto err = readPosition("column", location.column))
    {
        return std::move(err);
    }
    return location;
}

llvm::Expected<ReflectedSchema> SchemaReader::read(const llvm::json::Value& root)
{
    derivedMappings_.clear();

    auto object = requireObject(root, "");
    if (!object)
    {
        return object.takeError();
    }

    const auto* modulesValue = (*object)->get("modules");
    if (modulesValue == nullptr)
    {
        return fail("modules", "missing required array");
    }
    const auto* modules = modulesValue->getAsArray();
    if (modules == nullptr)
    {
        return fail("modules", "expected an array");
    }
    if (modules->empty())
    {
        return fail("modules", "at least one module is required");
    }

    ReflectedSchema schema;
    schema.modules.reserve(modules->size());
    for (std::size_t i = 0; i < modules->size(); ++i)
    {
        auto module = readModule((*modules)[i], indexPath("", "modules", i));
        if (!module)
        {
            return module.takeError();
        }
        schema.modules.push_back(std::move(*module));
    }

    if ((*object)->get("mappings") == nullptr)
    {
        schema.mappings = MappingTable(std::move(derivedMappings_));
        derivedMappings_.clear();
        return schema;
    }

    auto mappings = optionalArray(**object, "mappings", "");
    if (!mappings)
    {
        return mappings.takeError();
    }
    std::vector<Mapping>                            explicitMappings;
    std::map<std::string, std::size_t, std::less<>> firstBySource;
    explicitMappings.reserve((*mappings)->size());
    for (std::size_t i = 0; i < (*mappings)->size(); ++i)
    {
        const std::string entryPath = indexPath("", "mappings", i);
        auto              mapping   = readMapping((**mappings)[i], entryPath);
        if (!mapping)
        {
            return mapping.takeError();
        }
        const auto [first, inserted] = firstBySource.emplace(mapping->sourceQualifiedName, i);
        if (!inserted)
        {
            return fail(memberPath(entryPath, "source"),
                        "duplicate mapping for '" + mapping->sourceQualifiedName + "' (first declared at " +
                            indexPath("", "mappings", first->second) + ")");
        }
        explicitMappings.push_back(std::move(*mapping));
    }
    schema.mappings = MappingTable(std::move(explicitMappings));
    derivedMappings_.clear();
    return schema;
}

llvm::Expected<ReflectedModule> SchemaReader::readModule(const llvm::json::Value& value, const std::string& path)
{
    auto object = requireObject(value, path);
    if (!object)
    {
        return object.takeError();
    }

    ReflectedModule module;
    auto            name = requireString(**object, "name", path);
    if (!name)
    {
        return name.takeError();
    }
    module.name = std::move(*name);

    auto uri = optionalString(**object, "uri", path);
    if (!uri)
    {
        return uri.takeError();
    }
    module.uri = uri->value_or("");

    auto targetNamespace = optionalString(**object, "namespace", path);
    if (!targetNamespace)
    {
        return targetNamespace.takeError();
    }
    const std::string ns = targetNamespace->value_or(module.name);

    auto declarations = optionalArray(**object, "declarations", path);
    if (!declarations)
    {
        return declarations.takeError();
    }
    module.declarations.reserve((*declarations)->size());
    for (std::size_t i = 0; i < (*declarations)->size(); ++i)
    {
        const std::string declPath = indexPath(path, "declarations", i);
        auto              decl     = readDeclaration((**declarations)[i], module, declPath);
        if (!decl)
        {
            return decl.takeError();
        }

        Mapping mapping = makeDefaultMapping(*decl, ns);
        auto    rename  = optionalString(*(**declarations)[i].getAsObject(), "pythonName", declPath);
        if (!rename)
        {
            return rename.takeError();
        }
        if (*rename)
        {
            mapping.targetName = **rename;
        }
        derivedMappings_.push_back(std::move(mapping));
        module.declarations.push_back(std::move(*decl));
    }
    return module;
}

llvm::Expected<Declaration> SchemaReader::readDeclaration(const llvm::json::Value& value,
                                                          const ReflectedModule&   module,
                                                          const std::string&       path)
{
    auto object = requireObject(value, path);
    if (!object)
    {
        return object.takeError();
    }

    auto kindText = requireString(**object, "kind", path);
    if (!kindText)
    {
        return kindText.takeError();
    }
    const auto kind = parseDeclarationKind(*kindText);
    if (!kind)
    {
        return fail(memberPath(path, "kind"), "unknown declaration kind '" + *kindText + "'");
    }

    Declaration decl;
    decl.kind       = *kind;
    decl.moduleName = module.name;

    auto name = requireString(**object, "name", path);
    if (!name)
    {
        return name.takeError();
    }
    decl.name = std::move(*name);

    const std::string file = module.uri.empty() ? sourceName_ : module.uri;
    auto              location = readLocation(**object, file, path);
    if (!location)
    {
        return location.takeError();
    }
    decl.location = std::move(*location);

    auto doc = optionalString(**object, "doc", path);
    if (!doc)
    {
        return doc.takeError();
    }
    decl.docComment = std::move(*doc);

    auto superclass = optionalString(**object, "superclass", path);
    if (!superclass)
    {
        return superclass.takeError();
    }
    decl.superclass = std::move(*superclass);
    if (decl.superclass && decl.kind != DeclarationKind::Class && decl.kind != DeclarationKind::Module)
    {
        return fail(memberPath(path, "superclass"), "only classes may declare a superclass");
    }

    auto properties = optionalArray(**object, "properties", path);
    if (!properties)
    {
        return properties.takeError();
    }
    for (std::size_t i = 0; i < (*properties)->size(); ++i)
    {
        auto property = readProperty((**properties)[i], file, indexPath(path, "properties", i));
        if (!property)
        {
            return property.takeError();
        }
        decl.properties.push_back(std::move(*property));
    }

    auto values = optionalArray(**object, "values", path);
    if (!values)
    {
        return values.takeError();
    }
    for (std::size_t i = 0; i < (*values)->size(); ++i)
    {
        const auto text = (**values)[i].getAsString();
        if (!text)
        {
            return fail(indexPath(path, "values", i), "expected a string");
        }
        decl.enumValues.push_back(text->str());
    }

    const auto* aliased = (*object)->get("aliasedType");
    if (decl.kind == DeclarationKind::TypeAlias)
    {
        if (aliased == nullptr)
        {
            return fail(memberPath(path, "aliasedType"), "type alias requires an aliased type");
        }
        auto type = readType(*aliased, file, memberPath(path, "aliasedType"), 0);
        if (!type)
        {
            return type.takeError();
        }
        decl.aliasedType = std::move(*type);
    }
    else if (aliased != nullptr)
    {
        return fail(memberPath(path, "aliasedType"), "only type aliases may declare an aliased type");
    }
    return decl;
}

llvm::Expected<PropertyDecl> SchemaReader::readProperty(const llvm::json::Value& value,
                                                        llvm::StringRef          file,
                                                        const std::string&       path)
{
    auto object = requireObject(value, path);
    if (!object)
    {
        return object.takeError();
    }

    PropertyDecl property;
    auto         name = requireString(**object, "name", path);
    if (!name)
    {
        return name.takeError();
    }
    property.name = std::move(*name);

    const auto* typeValue = (*object)->get("type");
    if (typeValue == nullptr)
    {
        return fail(memberPath(path, "type"), "missing property type");
    }
    auto type = readType(*typeValue, file, memberPath(path, "type"), 0);
    if (!type)
    {
        return type.takeError();
    }
    property.type = std::move(*type);

    auto doc = optionalString(**object, "doc", path);
    if (!doc)
    {
        return doc.takeError();
    }
    property.docComment = std::move(*doc);

    if (const auto* hidden = (*object)->get("hidden"))
    {
        const auto flag = hidden->getAsBoolean();
        if (!flag)
        {
            return fail(memberPath(path, "hidden"), "expected a boolean");
        }
        property.isHidden = *flag;
    }

    auto location = readLocation(**object, file, path);
    if (!location)
    {
        return location.takeError();
    }
    property.location = std::move(*location);
    return property;
}

llvm::Expected<std::vector<TypeExprPtr>> SchemaReader::readTypeList(const llvm::json::Object& object,
                                                                    llvm::StringRef           key,
                                                                    llvm::StringRef           file,
                                                                    const std::string&        path,
                                                                    std::size_t               depth)
{
    auto array = optionalArray(object, key, path);
    if (!array)
    {
        return array.takeError();
    }

    std::vector<TypeExprPtr> out;
    out.reserve((*array)->size());
    for (std::size_t i = 0; i < (*array)->size(); ++i)
    {
        auto type = readType((**array)[i], file, indexPath(path, key, i), depth + 1);
        if (!type)
        {
            return type.takeError();
        }
        out.push_back(std::move(*type));
    }
    return out;
}

llvm::Expected<TypeExprPtr> SchemaReader::readType(const llvm::json::Value& value,
                                                   llvm::StringRef          file,
                                                   const std::string&       path,
                                                   std::size_t              depth)
{
    if (depth > kMaxTypeDepth)
    {
        return fail(path, "type expression nesting is too deep");
    }

    auto object = requireObject(value, path);
    if (!object)
    {
        return object.takeError();
    }
    auto kind = requireString(**object, "kind", path);
    if (!kind)
    {
        return kind.takeError();
    }
    auto location = readLocation(**object, file, path);
    if (!location)
    {
        return location.takeError();
    }

    const auto readChild = [&](llvm::StringRef key) -> llvm::Expected<TypeExprPtr> {
        const auto* child = (*object)->get(key);
        if (child == nullptr)
        {
            return fail(memberPath(path, key), "missing nested type");
        }
        return readType(*child, file, memberPath(path, key), depth + 1);
    };

    if (*kind == "primitive")
    {
        auto name = requireString(**object, "name", path);
        if (!name)
        {
            return name.takeError();
        }
        const auto primitive = parsePrimitiveKind(*name);
        if (!primitive)
        {
            return fail(memberPath(path, "name"), "unknown primitive type '" + *name + "'");
        }
        return makePrimitiveType(*primitive, std::move(*location));
    }
    if (*kind == "nullable")
    {
        auto inner = readChild("inner");
        if (!inner)
        {
            return inner.takeError();
        }
        return makeNullableType(std::move(*inner), std::move(*location));
    }
    if (*kind == "union")
    {
        auto members = readTypeList(**object, "members", file, path, depth);
        if (!members)
        {
            return members.takeError();
        }
        return makeUnionType(std::move(*members), std::move(*location));
    }
    if (*kind == "declared")
    {
        auto ref = requireString(**object, "ref", path);
        if (!ref)
        {
            return ref.takeError();
        }
        return makeDeclaredType(std::move(*ref), std::move(*location));
    }
    if (*kind == "stringLiteral")
    {
        auto literal = requireString(**object, "value", path);
        if (!literal)
        {
            return literal.takeError();
        }
        return makeStringLiteralType(std::move(*literal), std::move(*location));
    }
    if (*kind == "generic")
    {
        auto base = readChild("base");
        if (!base)
        {
            return base.takeError();
        }
        auto arguments = readTypeList(**object, "arguments", file, path, depth);
        if (!arguments)
        {
            return arguments.takeError();
        }
        return makeGenericType(std::move(*base), std::move(*arguments), std::move(*location));
    }
    if (*kind == "function")
    {
        auto parameters = readTypeList(**object, "parameters", file, path, depth);
        if (!parameters)
        {
            return parameters.takeError();
        }
        auto result = readChild("result");
        if (!result)
        {
            return result.takeError();
        }
        return makeFunctionType(std::move(*parameters), std::move(*result), std::move(*location));
    }
    if (*kind == "unsupported")
    {
        auto display = requireString(**object, "display", path);
        if (!display)
        {
            return display.takeError();
        }
        return makeUnsupportedType(std::move(*display), std::move(*location));
    }
    return fail(memberPath(path, "kind"), "unknown type kind '" + *kind + "'");
}

llvm::Expected<Mapping> SchemaReader::readMapping(const llvm::json::Value& value, const std::string& path)
{
    auto object = requireObject(value, path);
    if (!object)
    {
        return object.takeError();
    }

    auto kindText = requireString(**object, "kind", path);
    if (!kindText)
    {
        return kindText.takeError();
    }
    const auto kind = parseDeclarationKind(*kindText);
    if (!kind)
    {
        return fail(memberPath(path, "kind"), "unknown declaration kind '" + *kindText + "'");
    }

    auto source = requireString(**object, "source", path);
    if (!source)
    {
        return source.takeError();
    }
    auto ns = requireString(**object, "namespace", path);
    if (!ns)
    {
        return ns.takeError();
    }
    auto name = requireString(**object, "name", path);
    if (!name)
    {
        return name.takeError();
    }
    auto location = readLocation(**object, sourceName_, path);
    if (!location)
    {
        return location.takeError();
    }

    Mapping mapping;
    mapping.sourceKind          = *kind;
    mapping.sourceQualifiedName = std::move(*source);
    mapping.sourceLocation      = std::move(*location);
    mapping.targetNamespace     = std::move(*ns);
    mapping.targetName          = std::move(*name);
    return mapping;
}

llvm::Expected<ReflectedSchema> readSchemaJson(llvm::StringRef text, llvm::StringRef sourceName)
{
    auto root = llvm::json::parse(text);
    if (!root)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "%s: invalid JSON: %s",
                                       sourceName.str().c_str(),
                                       llvm::toString(root.takeError()).c_str());
    }
    SchemaReader reader(sourceName.str());
    return reader.read(*root);
}

llvm::Expected<ReflectedSchema> readSchemaFile(const std::string& path)
{
    std::string text;
    if (!readTextFile(path, text))
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "failed to read %s", path.c_str());
    }
    return readSchemaJson(text, path);
}

}  // namespace pklgen
