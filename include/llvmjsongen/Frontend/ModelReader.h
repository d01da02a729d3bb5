//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Unit model loading from JSON.
///
/// A unit model is the resolved structural snapshot of one source file:
///
/// @code{.json}
/// {
///   "unit": "shapes",
///   "source": "shapes.h",
///   "include": "shapes.h",
///   "namespace": "shapes",
///   "classes": [{
///     "name": "Point", "line": 12, "supertype": "", "typeParameters": [],
///     "annotation": {"fieldRename": "snake"},
///     "constructor": [{"name": "x", "type": "int", "hasDefault": false}],
///     "fields": [{"name": "x", "type": "int", "visibility": "public", "final": false,
///                 "writeOnly": false, "getter": "", "setter": "", "key": {"name": "X"},
///                 "line": 14}]
///   }],
///   "enums": [{"name": "Color", "line": 3, "annotation": {},
///              "values": ["red", {"name": "darkBlue", "json": "dark-blue"}]}]
/// }
/// @endcode
///
/// `source` is resolved against the directory of the model file. A class or
/// enum without `annotation` is known to the unit but does not trigger a pass.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMJSONGEN_FRONTEND_MODEL_READER_H
#define LLVMJSONGEN_FRONTEND_MODEL_READER_H

#include "llvmjsongen/Semantics/Model.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

namespace llvmjsongen
{

/// @brief Builds a unit model from a parsed JSON document.
/// @param[in] document Unit model document.
/// @param[in] modelPath Path recorded into the unit; relative `source` paths resolve against its directory.
/// @return Unit model or an `InvalidModelError`.
llvm::Expected<UnitModel> readUnitModel(const llvm::json::Value& document, llvm::StringRef modelPath);

/// @brief Reads and parses one unit model file.
/// @param[in] modelPath Model file path.
/// @return Unit model, an `IoError`, or an `InvalidModelError`.
llvm::Expected<UnitModel> loadUnitModel(llvm::StringRef modelPath);

}  // namespace llvmjsongen

#endif  // LLVMJSONGEN_FRONTEND_MODEL_READER_H
