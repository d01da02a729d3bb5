//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>

#include "llvmjsongen/CodeGen/NamingPolicy.h"

bool runNamingPolicyTests()
{
    using llvmjsongen::FieldRename;
    using llvmjsongen::codegenSanitizeIdentifier;
    using llvmjsongen::codegenToUpperSnakeCaseIdentifier;
    using llvmjsongen::escapeCppString;
    using llvmjsongen::parseFieldRename;
    using llvmjsongen::renameKey;

    if (renameKey(FieldRename::None, "strokeWidth") != "strokeWidth")
    {
        std::cerr << "none rename must keep the field name\n";
        return false;
    }
    if (renameKey(FieldRename::Kebab, "strokeWidth") != "stroke-width")
    {
        std::cerr << "kebab rename mismatch\n";
        return false;
    }
    if (renameKey(FieldRename::Snake, "HTTPStatusCode") != "http_status_code")
    {
        std::cerr << "snake rename acronym boundary mismatch\n";
        return false;
    }
    if (renameKey(FieldRename::Snake, "point2D") != "point2_d")
    {
        std::cerr << "snake rename digit boundary mismatch\n";
        return false;
    }
    if (renameKey(FieldRename::Pascal, "strokeWidth") != "StrokeWidth" ||
        renameKey(FieldRename::Pascal, "stroke_width") != "StrokeWidth")
    {
        std::cerr << "pascal rename mismatch\n";
        return false;
    }
    if (renameKey(FieldRename::ScreamingSnake, "strokeWidth") != "STROKE_WIDTH")
    {
        std::cerr << "screamingSnake rename mismatch\n";
        return false;
    }
    if (renameKey(FieldRename::Kebab, "already-kebab") != "already-kebab")
    {
        std::cerr << "kebab rename must be idempotent\n";
        return false;
    }

    if (parseFieldRename("screamingSnake") != FieldRename::ScreamingSnake || parseFieldRename("camel").has_value())
    {
        std::cerr << "fieldRename parsing mismatch\n";
        return false;
    }
    if (llvmjsongen::fieldRenameName(FieldRename::Kebab) != "kebab" ||
        parseFieldRename(llvmjsongen::fieldRenameName(FieldRename::Pascal)) != FieldRename::Pascal)
    {
        std::cerr << "fieldRename spelling mismatch\n";
        return false;
    }

    if (codegenSanitizeIdentifier("namespace") != "namespace_")
    {
        std::cerr << "C++ keyword sanitization mismatch\n";
        return false;
    }
    if (codegenSanitizeIdentifier("9lives") != "_9lives" || codegenSanitizeIdentifier("a-b") != "a_b")
    {
        std::cerr << "identifier sanitization mismatch\n";
        return false;
    }
    if (codegenToUpperSnakeCaseIdentifier("flightControl") != "FLIGHT_CONTROL")
    {
        std::cerr << "UPPER_SNAKE_CASE projection mismatch\n";
        return false;
    }

    if (escapeCppString("a\"b\\c\nd") != "a\\\"b\\\\c\\nd")
    {
        std::cerr << "C++ string escaping mismatch\n";
        return false;
    }
    if (escapeCppString(std::string("\x01") + "1") != "\\0011")
    {
        std::cerr << "control character escaping must not absorb following digits\n";
        return false;
    }

    return true;
}
