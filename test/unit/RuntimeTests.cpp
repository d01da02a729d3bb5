//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "llvmjsongen_runtime.hpp"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

namespace
{

enum class Mode
{
    fast,
    slow
};

const llvmjsongen::rt::EnumTable<Mode, 2> kModeTable{{
    {Mode::fast, "fast"},
    {Mode::slow, "slow-motion"},
}};

template <typename T, typename Codec>
llvm::Expected<T> decodeWith(const Codec& codec, const llvm::json::Value& json)
{
    return llvmjsongen::rt::decodeRoot<T>(json,
                                          [&codec](const llvm::json::Value& value,
                                                   std::optional<T>&        out,
                                                   llvm::json::Path         path) {
                                              return codec.decode(value, out, path);
                                          });
}

// Expects a decode failure whose rendered message starts with `message` and mentions `where`.
template <typename T>
bool expectFailure(const char* label, llvm::Expected<T> result, llvm::StringRef message, llvm::StringRef where = "")
{
    if (result)
    {
        std::cerr << label << ": invalid input was accepted\n";
        return false;
    }
    const std::string text = llvm::toString(result.takeError());
    if (!llvm::StringRef(text).startswith(message) || !llvm::StringRef(text).contains(where))
    {
        std::cerr << label << ": unexpected error " << text << "\n";
        return false;
    }
    return true;
}

llvm::json::Value shout(const std::string& value)
{
    return llvm::StringRef(value).upper();
}

}  // namespace

bool runRuntimeTests()
{
    namespace rt = llvmjsongen::rt;

    {
        auto small = decodeWith<std::int8_t>(rt::ScalarCodec{}, llvm::json::Value(-128));
        if (!small || *small != -128)
        {
            if (!small)
            {
                llvm::consumeError(small.takeError());
            }
            std::cerr << "int8 lower bound must decode\n";
            return false;
        }
        auto real = decodeWith<double>(rt::ScalarCodec{}, llvm::json::Value(3));
        if (!real || *real != 3.0)
        {
            if (!real)
            {
                llvm::consumeError(real.takeError());
            }
            std::cerr << "integers must decode into floating-point fields\n";
            return false;
        }
    }

    if (!expectFailure("int8 overflow",
                       decodeWith<std::int8_t>(rt::ScalarCodec{}, llvm::json::Value(300)),
                       "integer out of range") ||
        !expectFailure("negative unsigned",
                       decodeWith<std::uint16_t>(rt::ScalarCodec{}, llvm::json::Value(-1)),
                       "expected non-negative integer") ||
        !expectFailure("string kind",
                       decodeWith<std::string>(rt::ScalarCodec{}, llvm::json::Value(true)),
                       "expected string") ||
        !expectFailure("boolean kind",
                       decodeWith<bool>(rt::ScalarCodec{}, llvm::json::Value("yes")),
                       "expected boolean"))
    {
        return false;
    }

    {
        const rt::ScalarCodec codec;
        if (codec.encode(std::uint8_t{200}) != llvm::json::Value(std::uint64_t{200}) ||
            codec.encode(std::int16_t{-7}) != llvm::json::Value(-7) ||
            codec.encode(std::string("x")) != llvm::json::Value("x") || codec.encode(false) != llvm::json::Value(false))
        {
            std::cerr << "scalar encoding mismatch\n";
            return false;
        }
    }

    {
        const auto codec    = rt::makeNullableCodec(rt::ScalarCodec{});
        auto       absent   = decodeWith<std::optional<int>>(codec, llvm::json::Value(nullptr));
        auto       present  = decodeWith<std::optional<int>>(codec, llvm::json::Value(4));
        const bool absentOk = static_cast<bool>(absent) && !absent->has_value();
        if (!absent)
        {
            llvm::consumeError(absent.takeError());
        }
        const bool presentOk = static_cast<bool>(present) && *present == std::optional<int>(4);
        if (!present)
        {
            llvm::consumeError(present.takeError());
        }
        if (!absentOk || !presentOk || codec.encode(std::optional<int>{}) != llvm::json::Value(nullptr))
        {
            std::cerr << "nullable codec mismatch\n";
            return false;
        }
    }

    {
        const auto codec = rt::makeSequenceCodec(rt::ScalarCodec{});
        auto       items = decodeWith<std::vector<int>>(codec, llvm::json::Value(llvm::json::Array{1, 2, 3}));
        if (!items || *items != std::vector<int>{1, 2, 3})
        {
            if (!items)
            {
                llvm::consumeError(items.takeError());
            }
            std::cerr << "sequence decoding mismatch\n";
            return false;
        }
        if (!expectFailure("sequence element",
                           decodeWith<std::vector<int>>(codec, llvm::json::Value(llvm::json::Array{1, "two"})),
                           "expected integer",
                           "[1]") ||
            !expectFailure("sequence kind",
                           decodeWith<std::vector<int>>(codec, llvm::json::Value(llvm::json::Object{})),
                           "expected array"))
        {
            return false;
        }
        if (codec.encode(std::vector<int>{5, 6}) != llvm::json::Value(llvm::json::Array{5, 6}))
        {
            std::cerr << "sequence encoding mismatch\n";
            return false;
        }
    }

    {
        const auto codec = rt::makeMappingCodec(rt::makeSequenceCodec(rt::ScalarCodec{}));
        using Table      = std::map<std::string, std::vector<double>>;
        auto table       = decodeWith<Table>(codec, llvm::json::Value(llvm::json::Object{{"a", llvm::json::Array{1.5}}}));
        if (!table || table->size() != 1U || table->at("a") != std::vector<double>{1.5})
        {
            if (!table)
            {
                llvm::consumeError(table.takeError());
            }
            std::cerr << "mapping decoding mismatch\n";
            return false;
        }
        if (!expectFailure("mapping value",
                           decodeWith<Table>(codec,
                                             llvm::json::Value(llvm::json::Object{{"a", llvm::json::Array{}},
                                                                                  {"b", llvm::json::Array{true}}})),
                           "expected number",
                           ".b[0]"))
        {
            return false;
        }
    }

    {
        const auto codec = rt::makeEnumCodec(kModeTable);
        auto       mode  = decodeWith<Mode>(codec, llvm::json::Value("slow-motion"));
        if (!mode || *mode != Mode::slow || codec.encode(Mode::fast) != llvm::json::Value("fast"))
        {
            if (!mode)
            {
                llvm::consumeError(mode.takeError());
            }
            std::cerr << "enum codec mismatch\n";
            return false;
        }
        if (!expectFailure("enum spelling", decodeWith<Mode>(codec, llvm::json::Value("slow")), "unknown enum value") ||
            !expectFailure("enum kind", decodeWith<Mode>(codec, llvm::json::Value(1)), "expected string"))
        {
            return false;
        }
    }

    // A serializable type that only generates encoding.
    {
        const auto codec = rt::makeFunctionCodec<int>(nullptr, [](const int& value) {
            return llvm::json::Value(value * 2);
        });
        if (codec.encode(21) != llvm::json::Value(42))
        {
            std::cerr << "function codec encoding mismatch\n";
            return false;
        }
        if (!expectFailure("missing decoder",
                           decodeWith<int>(codec, llvm::json::Value(1)),
                           "decoding is not generated for this type"))
        {
            return false;
        }
        const auto silent = rt::makeFunctionCodec<int>(nullptr, nullptr);
        if (silent.encode(1) != llvm::json::Value(nullptr))
        {
            std::cerr << "a missing encoder must encode null\n";
            return false;
        }
    }

    {
        const auto codec = rt::makeOverrideCodec<std::string>(nullptr, &shout, rt::ScalarCodec{});
        auto       text  = decodeWith<std::string>(codec, llvm::json::Value("quiet"));
        if (!text || *text != "quiet" || codec.encode(std::string("quiet")) != llvm::json::Value("QUIET"))
        {
            if (!text)
            {
                llvm::consumeError(text.takeError());
            }
            std::cerr << "override codec must replace only the given direction\n";
            return false;
        }
    }

    {
        const llvm::json::Object object{{"z", 1}, {"m", 2}, {"a", 3}};
        auto checked = rt::decodeRoot<bool>(llvm::json::Value(llvm::json::Object(object)),
                                            [&object](const llvm::json::Value&, std::optional<bool>& out, llvm::json::Path path) {
                                                if (!rt::rejectUnknownKeys(object, {"a"}, path))
                                                {
                                                    return false;
                                                }
                                                out.emplace(true);
                                                return true;
                                            });
        if (!expectFailure("unknown keys", std::move(checked), "unrecognized key", "(root).m"))
        {
            return false;
        }
    }

    {
        const llvm::json::Object object{{"x", 1}};
        auto point = rt::decodeRoot<int>(llvm::json::Value(llvm::json::Object(object)),
                                         [&object](const llvm::json::Value&, std::optional<int>& out, llvm::json::Path path) {
                                             std::optional<int> x;
                                             std::optional<int> y;
                                             if (!rt::readKey(object, "x", x, path, rt::ScalarCodec{}) ||
                                                 !rt::readKey(object, "y", y, path, rt::ScalarCodec{}))
                                             {
                                                 return false;
                                             }
                                             if (!y)
                                             {
                                                 return rt::reportMissingKey(path, "y");
                                             }
                                             out.emplace(*x + *y);
                                             return true;
                                         });
        if (!expectFailure("missing key", std::move(point), "missing required key", "(root).y"))
        {
            return false;
        }
    }

    return true;
}
