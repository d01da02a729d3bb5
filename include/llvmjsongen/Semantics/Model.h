//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Resolved semantic model of the declarations a unit asks to generate JSON code for.
///
/// The model is supplied by an external, fully type-checked provider and is treated
/// as an immutable snapshot for the duration of one generation invocation.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_SEMANTICS_MODEL_H
#define LLVMJSONGEN_SEMANTICS_MODEL_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace llvmjsongen
{

/// @file
/// @brief Semantic model consumed by selection and emission.

/// @brief Resolved type as a name with template arguments.
struct TypeRef final
{
    /// @brief Qualified type name without arguments (`std::vector`, `int`, `Point`).
    std::string name;

    /// @brief Template arguments in declaration order.
    std::vector<TypeRef> arguments;

    /// @brief Renders the canonical spelling (`std::map<std::string, Point>`).
    /// @return Canonical spelling.
    [[nodiscard]] std::string str() const;

    /// @brief Indicates whether the type is `std::optional<T>`.
    /// @return True for nullable types.
    [[nodiscard]] bool isNullable() const;
};

/// @brief Equality over name and arguments.
bool operator==(const TypeRef& lhs, const TypeRef& rhs);

/// @brief Member visibility.
enum class FieldVisibility
{
    /// @brief Public member.
    Public,

    /// @brief Protected member.
    Protected,

    /// @brief Private member.
    Private,
};

/// @brief One declared field (or property) of a class.
struct FieldDescriptor final
{
    /// @brief Field name, unique within the class including inherited fields.
    std::string name;

    /// @brief Declared type.
    TypeRef type;

    /// @brief Declared visibility.
    FieldVisibility visibility{FieldVisibility::Public};

    /// @brief True for const members; final fields can only be set through a constructor.
    bool isFinal{false};

    /// @brief True for getter-less properties.
    bool isWriteOnly{false};

    /// @brief Read accessor call (`getName()`); empty for direct member access.
    std::string getter;

    /// @brief Setter method name; empty for direct assignment.
    std::string setter;

    /// @brief Raw per-field override payload, supplied by the metadata reader.
    std::optional<llvm::json::Object> keyAnnotation;

    /// @brief Class that declares the field (differs from the owner for inherited fields).
    std::string declaringClass;

    /// @brief 1-based declaration line.
    std::uint32_t line{1};

    /// @brief Indicates public visibility.
    /// @return True for public members.
    [[nodiscard]] bool isPublic() const
    {
        return visibility == FieldVisibility::Public;
    }
};

/// @brief One constructor parameter in declaration order.
struct ConstructorParam final
{
    /// @brief Parameter name; binds to the field with the same name.
    std::string name;

    /// @brief Declared parameter type spelling.
    std::string type;

    /// @brief True when the parameter declares a default argument.
    bool hasDefault{false};
};

/// @brief Structural snapshot of one class declaration.
struct ClassModel final
{
    /// @brief Class name as it appears in source.
    std::string name;

    /// @brief Fields declared by this class, in declaration order.
    std::vector<FieldDescriptor> fields;

    /// @brief Parameters of the constructor used by the decode factory. Empty means default-constructible.
    std::vector<ConstructorParam> constructorParams;

    /// @brief Template type parameters.
    std::vector<std::string> typeParameters;

    /// @brief Supertype name within the same unit; empty when none.
    std::string supertype;

    /// @brief Raw class-level annotation; its presence triggers the serializable pass.
    std::optional<llvm::json::Object> serializableAnnotation;

    /// @brief 1-based declaration line.
    std::uint32_t line{1};
};

/// @brief One enumerator of an enum declaration.
struct EnumValueModel final
{
    /// @brief Enumerator name.
    std::string name;

    /// @brief Explicit JSON spelling; empty to derive from the name.
    std::string jsonValue;
};

/// @brief Structural snapshot of one enum declaration.
struct EnumModel final
{
    /// @brief Enum name.
    std::string name;

    /// @brief Enumerators in declaration order.
    std::vector<EnumValueModel> values;

    /// @brief Raw enum annotation; its presence triggers the enum pass.
    std::optional<llvm::json::Object> enumAnnotation;

    /// @brief 1-based declaration line.
    std::uint32_t line{1};
};

/// @brief One compiled unit: a source file and its declarations.
struct UnitModel final
{
    /// @brief Unit name, used for the companion file name and include guard.
    std::string name;

    /// @brief Path of the unit model file the unit was loaded from; empty for in-memory units.
    std::string modelPath;

    /// @brief Path of the declaring source file.
    std::string sourcePath;

    /// @brief Include spelling of the source header used by the companion.
    std::string includePath;

    /// @brief C++ namespace the declarations live in; empty for the global namespace.
    std::string cppNamespace;

    /// @brief Classes in declaration order.
    std::vector<ClassModel> classes;

    /// @brief Enums in declaration order.
    std::vector<EnumModel> enums;
};

/// @brief Looks up a class by name.
/// @param[in] unit Unit model.
/// @param[in] name Class name.
/// @return Class or `nullptr`.
const ClassModel* findClass(const UnitModel& unit, llvm::StringRef name);

/// @brief Looks up an enum by name.
/// @param[in] unit Unit model.
/// @param[in] name Enum name.
/// @return Enum or `nullptr`.
const EnumModel* findEnum(const UnitModel& unit, llvm::StringRef name);

/// @brief Collects the fields of a class with inherited fields first.
///
/// @details
/// The supertype chain is followed within the unit. A missing supertype, an
/// inheritance cycle, or a field name declared twice along the chain is an
/// `InvalidModelError`.
///
/// @param[in] unit Unit model.
/// @param[in] model Class model.
/// @return Ordered field list.
llvm::Expected<std::vector<FieldDescriptor>> collectSortedFields(const UnitModel& unit, const ClassModel& model);

/// @brief Renders the class type spelling with its type parameters (`Box<T>`).
/// @param[in] model Class model.
/// @return Type spelling.
std::string classTypeSpelling(const ClassModel& model);

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_SEMANTICS_MODEL_H
