//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Header-only codec runtime used by generated JSON bindings.
///
/// Every codec exposes `decode(value, slot, path)` filling a `std::optional`
/// slot and reporting failures through `llvm::json::Path`, plus
/// `encode(value)` returning an `llvm::json::Value`. Generated factories
/// compose these codecs; user code usually only calls `decodeRoot`.
///
//===----------------------------------------------------------------------===//

#ifndef LLVMJSONGEN_CPP_RUNTIME_HPP
#define LLVMJSONGEN_CPP_RUNTIME_HPP

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace llvmjsongen
{
namespace rt
{

/// @brief Codec for `bool`, arithmetic types, and `std::string`.
struct ScalarCodec final
{
    template <typename T>
    bool decode(const llvm::json::Value& json, std::optional<T>& slot, llvm::json::Path path) const
    {
        if constexpr (std::is_same_v<T, bool>)
        {
            if (const auto value = json.getAsBoolean())
            {
                slot.emplace(*value);
                return true;
            }
            path.report("expected boolean");
            return false;
        }
        else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>)
        {
            if (const auto value = json.getAsInteger())
            {
                if (*value < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
                    *value > static_cast<std::int64_t>(std::numeric_limits<T>::max()))
                {
                    path.report("integer out of range");
                    return false;
                }
                slot.emplace(static_cast<T>(*value));
                return true;
            }
            path.report("expected integer");
            return false;
        }
        else if constexpr (std::is_integral_v<T>)
        {
            if (const auto value = json.getAsUINT64())
            {
                if (*value > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
                {
                    path.report("integer out of range");
                    return false;
                }
                slot.emplace(static_cast<T>(*value));
                return true;
            }
            path.report("expected non-negative integer");
            return false;
        }
        else if constexpr (std::is_floating_point_v<T>)
        {
            if (const auto value = json.getAsNumber())
            {
                slot.emplace(static_cast<T>(*value));
                return true;
            }
            path.report("expected number");
            return false;
        }
        else
        {
            static_assert(std::is_same_v<T, std::string>, "ScalarCodec handles bool, arithmetic types and std::string");
            if (const auto value = json.getAsString())
            {
                slot.emplace(value->str());
                return true;
            }
            path.report("expected string");
            return false;
        }
    }

    template <typename T>
    llvm::json::Value encode(const T& value) const
    {
        if constexpr (std::is_same_v<T, bool>)
        {
            return value;
        }
        else if constexpr (std::is_floating_point_v<T>)
        {
            return static_cast<double>(value);
        }
        else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>)
        {
            return static_cast<std::uint64_t>(value);
        }
        else if constexpr (std::is_integral_v<T>)
        {
            return static_cast<std::int64_t>(value);
        }
        else
        {
            return std::string(value);
        }
    }
};

/// @brief Codec storing `llvm::json::Value` fields as-is.
struct PassthroughCodec final
{
    bool decode(const llvm::json::Value& json, std::optional<llvm::json::Value>& slot, llvm::json::Path) const
    {
        slot.emplace(json);
        return true;
    }

    llvm::json::Value encode(const llvm::json::Value& value) const
    {
        return value;
    }
};

/// @brief Codec for `std::optional<T>`: JSON `null` maps to an empty value.
template <typename Inner>
struct NullableCodec final
{
    Inner inner;

    template <typename T>
    bool decode(const llvm::json::Value& json, std::optional<std::optional<T>>& slot, llvm::json::Path path) const
    {
        if (json.kind() == llvm::json::Value::Null)
        {
            slot.emplace(std::nullopt);
            return true;
        }
        std::optional<T> value;
        if (!inner.decode(json, value, path))
        {
            return false;
        }
        slot.emplace(std::move(value));
        return true;
    }

    template <typename T>
    llvm::json::Value encode(const std::optional<T>& value) const
    {
        if (!value.has_value())
        {
            return nullptr;
        }
        return inner.encode(*value);
    }
};

template <typename Inner>
NullableCodec<Inner> makeNullableCodec(Inner inner)
{
    return NullableCodec<Inner>{std::move(inner)};
}

/// @brief Codec for sequence containers (`std::vector`, `std::deque`, `std::list`).
template <typename Inner>
struct SequenceCodec final
{
    Inner inner;

    template <typename Container>
    bool decode(const llvm::json::Value& json, std::optional<Container>& slot, llvm::json::Path path) const
    {
        const llvm::json::Array* array = json.getAsArray();
        if (array == nullptr)
        {
            path.report("expected array");
            return false;
        }
        Container out;
        for (std::size_t i = 0; i < array->size(); ++i)
        {
            std::optional<typename Container::value_type> element;
            if (!inner.decode((*array)[i], element, path.index(static_cast<unsigned>(i))))
            {
                return false;
            }
            out.push_back(std::move(*element));
        }
        slot.emplace(std::move(out));
        return true;
    }

    template <typename Container>
    llvm::json::Value encode(const Container& values) const
    {
        llvm::json::Array out;
        for (const auto& value : values)
        {
            out.push_back(inner.encode(value));
        }
        return llvm::json::Value(std::move(out));
    }
};

template <typename Inner>
SequenceCodec<Inner> makeSequenceCodec(Inner inner)
{
    return SequenceCodec<Inner>{std::move(inner)};
}

/// @brief Codec for string-keyed maps (`std::map`, `std::unordered_map`).
template <typename Inner>
struct MappingCodec final
{
    Inner inner;

    template <typename Map>
    bool decode(const llvm::json::Value& json, std::optional<Map>& slot, llvm::json::Path path) const
    {
        const llvm::json::Object* object = json.getAsObject();
        if (object == nullptr)
        {
            path.report("expected object");
            return false;
        }
        Map out;
        for (const auto& entry : *object)
        {
            const llvm::StringRef                    key = entry.first;
            std::optional<typename Map::mapped_type> value;
            if (!inner.decode(entry.second, value, path.field(key)))
            {
                return false;
            }
            out.try_emplace(key.str(), std::move(*value));
        }
        slot.emplace(std::move(out));
        return true;
    }

    template <typename Map>
    llvm::json::Value encode(const Map& values) const
    {
        llvm::json::Object out;
        for (const auto& entry : values)
        {
            out[entry.first] = inner.encode(entry.second);
        }
        return llvm::json::Value(std::move(out));
    }
};

template <typename Inner>
MappingCodec<Inner> makeMappingCodec(Inner inner)
{
    return MappingCodec<Inner>{std::move(inner)};
}

/// @brief Enum value table: enumerator and its JSON spelling.
template <typename E, std::size_t N>
using EnumTable = std::array<std::pair<E, std::string_view>, N>;

/// @brief Codec mapping enumerators to JSON strings through a generated table.
template <typename E, std::size_t N>
struct EnumCodec final
{
    const EnumTable<E, N>* table;

    bool decode(const llvm::json::Value& json, std::optional<E>& slot, llvm::json::Path path) const
    {
        const auto spelling = json.getAsString();
        if (!spelling)
        {
            path.report("expected string");
            return false;
        }
        for (const auto& entry : *table)
        {
            if (*spelling == llvm::StringRef(entry.second.data(), entry.second.size()))
            {
                slot.emplace(entry.first);
                return true;
            }
        }
        path.report("unknown enum value");
        return false;
    }

    llvm::json::Value encode(const E& value) const
    {
        for (const auto& entry : *table)
        {
            if (entry.first == value)
            {
                return std::string(entry.second);
            }
        }
        return nullptr;
    }
};

template <typename E, std::size_t N>
EnumCodec<E, N> makeEnumCodec(const EnumTable<E, N>& table)
{
    return EnumCodec<E, N>{&table};
}

/// @brief Signature of a generated or user decode function.
template <typename T>
using DecodeFunction = std::function<bool(const llvm::json::Value&, std::optional<T>&, llvm::json::Path)>;

/// @brief Signature of a generated or user encode function.
template <typename T>
using EncodeFunction = std::function<llvm::json::Value(const T&)>;

/// @brief Codec delegating to a pair of functions; used for serializable classes.
template <typename T>
struct FunctionCodec final
{
    DecodeFunction<T> decodeFn;
    EncodeFunction<T> encodeFn;

    bool decode(const llvm::json::Value& json, std::optional<T>& slot, llvm::json::Path path) const
    {
        if (!decodeFn)
        {
            path.report("decoding is not generated for this type");
            return false;
        }
        return decodeFn(json, slot, path);
    }

    llvm::json::Value encode(const T& value) const
    {
        if (!encodeFn)
        {
            return nullptr;
        }
        return encodeFn(value);
    }
};

template <typename T>
FunctionCodec<T> makeFunctionCodec(DecodeFunction<T> decodeFn, EncodeFunction<T> encodeFn)
{
    return FunctionCodec<T>{std::move(decodeFn), std::move(encodeFn)};
}

/// @brief Codec replacing one direction of a fallback codec with a user function.
template <typename T, typename Fallback>
struct OverrideCodec final
{
    bool (*decodeFn)(const llvm::json::Value&, std::optional<T>&, llvm::json::Path);
    llvm::json::Value (*encodeFn)(const T&);
    Fallback fallback;

    bool decode(const llvm::json::Value& json, std::optional<T>& slot, llvm::json::Path path) const
    {
        if (decodeFn != nullptr)
        {
            return decodeFn(json, slot, path);
        }
        return fallback.decode(json, slot, path);
    }

    llvm::json::Value encode(const T& value) const
    {
        if (encodeFn != nullptr)
        {
            return encodeFn(value);
        }
        return fallback.encode(value);
    }
};

template <typename T, typename Fallback>
OverrideCodec<T, Fallback> makeOverrideCodec(bool (*decodeFn)(const llvm::json::Value&,
                                                              std::optional<T>&,
                                                              llvm::json::Path),
                                             llvm::json::Value (*encodeFn)(const T&),
                                             Fallback fallback)
{
    return OverrideCodec<T, Fallback>{decodeFn, encodeFn, std::move(fallback)};
}

/// @brief Decodes one key of an object; a missing key leaves the slot empty.
template <typename T, typename Codec>
bool readKey(const llvm::json::Object& object,
             llvm::StringRef           key,
             std::optional<T>&         slot,
             llvm::json::Path          path,
             const Codec&              codec)
{
    const llvm::json::Value* value = object.get(key);
    if (value == nullptr)
    {
        return true;
    }
    return codec.decode(*value, slot, path.field(key));
}

/// @brief Reports a missing required key.
inline bool reportMissingKey(llvm::json::Path path, llvm::StringRef key)
{
    path.field(key).report("missing required key");
    return false;
}

/// @brief Fails when the object carries a key outside `known`; the smallest unknown key is reported.
inline bool rejectUnknownKeys(const llvm::json::Object&              object,
                              std::initializer_list<llvm::StringRef> known,
                              llvm::json::Path                       path)
{
    std::vector<llvm::StringRef> unknown;
    for (const auto& entry : object)
    {
        const llvm::StringRef key = entry.first;
        if (std::find(known.begin(), known.end(), key) == known.end())
        {
            unknown.push_back(key);
        }
    }
    if (unknown.empty())
    {
        return true;
    }
    path.field(*std::min_element(unknown.begin(), unknown.end())).report("unrecognized key");
    return false;
}

/// @brief Runs a generated decode function against a fresh path root.
/// @param[in] json Input value.
/// @param[in] decodeFn Decode function.
/// @param[in] rootName Name printed in error messages.
/// @return Decoded value or an error naming the failing path.
template <typename T, typename DecodeFn>
llvm::Expected<T> decodeRoot(const llvm::json::Value& json, DecodeFn&& decodeFn, llvm::StringRef rootName = "")
{
    llvm::json::Path::Root root(rootName);
    std::optional<T>       out;
    if (!decodeFn(json, out, root))
    {
        return root.getError();
    }
    return std::move(*out);
}

}  // namespace rt
}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_CPP_RUNTIME_HPP
