//===--- QuotedString.h - Print a string in double-quotes -------*- C++ -*-===//
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
//
/// \file Declares QuotedString, a convenient type for printing a
/// string as a string literal, and QuotedCharacter, which does the same
/// for a single character literal.
//
//===----------------------------------------------------------------------===//

#ifndef QUILL_BASIC_QUOTEDSTRING_H
#define QUILL_BASIC_QUOTEDSTRING_H

#include "quill/Basic/LLVM.h"
#include "llvm/ADT/StringRef.h"
#include <cstdint>

namespace quill {
  /// Print the given string as if it were a quoted string.
  void printAsQuotedString(raw_ostream &out, StringRef text);

  /// Print the given Unicode scalar as a single-quoted character literal.
  ///
  /// Quotes, backslashes and the usual control characters use their short
  /// escapes ('\n', '\t', '\r', '\0', '\\', '\''). Any other character that
  /// is not printable, is whitespace other than ' ', or has no width (such as
  /// a combining mark) is written as '\u{hex}'.
  void printAsQuotedCharacter(raw_ostream &out, uint32_t codePoint);

  /// A class designed to make it easy to write a string to a stream
  /// as a quoted string.
  class QuotedString {
    StringRef Text;
  public:
    explicit QuotedString(StringRef text) : Text(text) {}

    friend raw_ostream &operator<<(raw_ostream &out, QuotedString string) {
      printAsQuotedString(out, string.Text);
      return out;
    }
  };

  /// A class designed to make it easy to write a character to a stream as a
  /// character literal.
  class QuotedCharacter {
    uint32_t CodePoint;
  public:
    explicit QuotedCharacter(uint32_t codePoint) : CodePoint(codePoint) {}

    friend raw_ostream &operator<<(raw_ostream &out, QuotedCharacter C) {
      printAsQuotedCharacter(out, C.CodePoint);
      return out;
    }
  };
} // end namespace quill

#endif // QUILL_BASIC_QUOTEDSTRING_H
