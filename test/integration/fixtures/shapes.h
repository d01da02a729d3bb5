//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations bound by the round-trip tests; `shapes.model.json` describes them.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_TEST_FIXTURES_SHAPES_H
#define LLVMJSONGEN_TEST_FIXTURES_SHAPES_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shapes
{

enum class Color
{
    red,
    darkBlue,
    lightGreen,
};

struct Meters final
{
    double value{0.0};

    bool operator==(const Meters& other) const
    {
        return value == other.value;
    }
};

/// Encodes `Meters` as a `"<n>m"` string.
struct MetersCodec final
{
    bool decode(const llvm::json::Value& json, std::optional<Meters>& slot, llvm::json::Path path) const
    {
        const auto text = json.getAsString();
        if (!text || !text->endswith("m"))
        {
            path.report("expected a length such as \"2.5m\"");
            return false;
        }
        double value = 0.0;
        if (text->drop_back().getAsDouble(value))
        {
            path.report("malformed length");
            return false;
        }
        slot.emplace(Meters{value});
        return true;
    }

    llvm::json::Value encode(const Meters& meters) const
    {
        return llvm::formatv("{0}m", meters.value).str();
    }
};

inline llvm::json::Value shoutCode(const std::string& code)
{
    return llvm::StringRef(code).upper();
}

struct Point
{
    Point(int x, int y)
        : x(x)
        , y(y)
    {
    }

    int x;
    int y;
};

struct Reading
{
    explicit Reading(int x)
        : x(x)
    {
    }

    int x;
    int y{7};
};

struct Shape
{
    std::string                   name;
    std::string                   code;
    Color                         color{Color::red};
    std::vector<Point>            vertices;
    std::optional<std::string>    label;
    std::map<std::string, double> metrics;
    double                        strokeWidth{1.0};
    Meters                        perimeter;
    std::int32_t                  revision{0};
};

template <typename T>
struct Box
{
    T              value{};
    std::vector<T> items;
};

struct Crate
{
    Box<int>                        ints;
    std::optional<Box<std::string>> labels;
};

class Account
{
public:
    Account(std::string owner, long long balance)
        : balance(balance)
        , owner_(std::move(owner))
    {
    }

    const std::string& getOwner() const
    {
        return owner_;
    }

    long long balance;

    static bool fromJson(const llvm::json::Value& json, std::optional<Account>& out, llvm::json::Path path);
    llvm::json::Value toJson() const;

private:
    std::string owner_;
};

}  // namespace shapes

#endif  // LLVMJSONGEN_TEST_FIXTURES_SHAPES_H
