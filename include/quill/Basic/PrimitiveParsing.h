//===--- PrimitiveParsing.h - Primitive parsing routines --------*- C++ -*-===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2025 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See https://swift.org/LICENSE.txt for license information
// See https://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//
///
/// \file
/// Primitive parsing routines useful in various places in the compiler.
///
//===----------------------------------------------------------------------===//

#ifndef QUILL_BASIC_PRIMITIVEPARSING_H
#define QUILL_BASIC_PRIMITIVEPARSING_H

#include "quill/Basic/LLVM.h"
#include "llvm/ADT/StringRef.h"
#include <cstdint>
#include <optional>

namespace quill {

/// Why a string could not be parsed as an integer.
enum class IntErrorKind : uint8_t {
  /// The string was empty.
  Empty,
  /// The string contained a character that is not a decimal digit.
  InvalidDigit,
  /// The value does not fit in the requested width.
  PosOverflow,
};

/// The failure of parsing an integer out of configuration text.
class ParseIntError {
  IntErrorKind Kind;

public:
  explicit ParseIntError(IntErrorKind kind) : Kind(kind) {}

  IntErrorKind getKind() const { return Kind; }

  /// A short English description of the failure, e.g.
  /// "invalid digit found in string".
  StringRef getDescription() const;

  bool operator==(const ParseIntError &other) const {
    return Kind == other.Kind;
  }
  bool operator!=(const ParseIntError &other) const {
    return !operator==(other);
  }

  friend raw_ostream &operator<<(raw_ostream &OS, const ParseIntError &E);
};

raw_ostream &operator<<(raw_ostream &OS, const ParseIntError &E);

/// Parse \p text as an unsigned decimal integer that fits in \p bitWidth
/// bits. A single leading '+' is accepted.
///
/// \returns the error on failure, leaving \p result untouched.
std::optional<ParseIntError> parseUnsignedInteger(StringRef text,
                                                  unsigned bitWidth,
                                                  uint64_t &result);

} // end namespace quill

#endif // QUILL_BASIC_PRIMITIVEPARSING_H
