//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements semantic model lookups and inherited field collection.
///
//===----------------------------------------------------------------------===//

#include "llvmjsongen/Semantics/Model.h"

#include "llvmjsongen/Support/GenerationError.h"

#include "llvm/ADT/StringSet.h"

#include <algorithm>

namespace llvmjsongen
{

std::string TypeRef::str() const
{
    if (arguments.empty())
    {
        return name;
    }
    std::string out = name + "<";
    for (std::size_t i = 0; i < arguments.size(); ++i)
    {
        if (i > 0)
        {
            out += ", ";
        }
        out += arguments[i].str();
    }
    out += ">";
    return out;
}

bool TypeRef::isNullable() const
{
    return name == "std::optional" && arguments.size() == 1U;
}

bool operator==(const TypeRef& lhs, const TypeRef& rhs)
{
    return lhs.name == rhs.name && lhs.arguments == rhs.arguments;
}

const ClassModel* findClass(const UnitModel& unit, llvm::StringRef name)
{
    for (const ClassModel& model : unit.classes)
    {
        if (model.name == name)
        {
            return &model;
        }
    }
    return nullptr;
}

const EnumModel* findEnum(const UnitModel& unit, llvm::StringRef name)
{
    for (const EnumModel& model : unit.enums)
    {
        if (model.name == name)
        {
            return &model;
        }
    }
    return nullptr;
}

llvm::Expected<std::vector<FieldDescriptor>> collectSortedFields(const UnitModel& unit, const ClassModel& model)
{
    std::vector<const ClassModel*> chain;
    llvm::StringSet<>              visited;
    const ClassModel*              current = &model;
    while (current != nullptr)
    {
        if (!visited.insert(current->name).second)
        {
            return makeGenerationError(GenerationErrorKind::InvalidModel,
                                       model.name,
                                       "inheritance cycle through `" + current->name + "`");
        }
        chain.push_back(current);
        if (current->supertype.empty())
        {
            break;
        }
        const ClassModel* parent = findClass(unit, current->supertype);
        if (parent == nullptr)
        {
            return makeGenerationError(GenerationErrorKind::InvalidModel,
                                       current->name,
                                       "supertype `" + current->supertype + "` is not declared in unit `" + unit.name +
                                           "`");
        }
        current = parent;
    }

    std::vector<FieldDescriptor> sorted;
    llvm::StringSet<>            names;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it)
    {
        for (FieldDescriptor field : (*it)->fields)
        {
            if (!names.insert(field.name).second)
            {
                return makeGenerationError(GenerationErrorKind::InvalidModel,
                                           model.name + "." + field.name,
                                           "field name is declared more than once");
            }
            if (field.declaringClass.empty())
            {
                field.declaringClass = (*it)->name;
            }
            sorted.push_back(std::move(field));
        }
    }
    return sorted;
}

std::string classTypeSpelling(const ClassModel& model)
{
    if (model.typeParameters.empty())
    {
        return model.name;
    }
    std::string out = model.name + "<";
    for (std::size_t i = 0; i < model.typeParameters.size(); ++i)
    {
        if (i > 0)
        {
            out += ", ";
        }
        out += model.typeParameters[i];
    }
    out += ">";
    return out;
}

}  // namespace llvmjsongen
