//===--- QuotedString.cpp - Printing a string as a quoted string ----------===//
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

#include "quill/Basic/QuotedString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/ConvertUTF.h"
#include "llvm/Support/Unicode.h"
#include "llvm/Support/raw_ostream.h"

using namespace quill;

void quill::printAsQuotedString(llvm::raw_ostream &out, llvm::StringRef text) {
  out << '"';
  for (auto C : text) {
    switch (C) {
    case '\\': out << "\\\\"; break;
    case '\t': out << "\\t"; break;
    case '\n': out << "\\n"; break;
    case '\r': out << "\\r"; break;
    case '"': out << "\\\""; break;
    case '\'': out << '\''; break; // no need to escape these
    case '\0': out << "\\0"; break;
    default:
      auto c = (unsigned char)C;
      // Other ASCII control characters should get escaped.
      if (c < 0x20 || c == 0x7F) {
        out << "\\u{" << llvm::hexdigit(c >> 4, /*LowerCase=*/true)
            << llvm::hexdigit(c & 0xF, /*LowerCase=*/true) << '}';
      } else {
        out << (char)c;
      }
      break;
    }
  }
  out << '"';
}

/// Unicode White_Space characters outside ASCII.
static bool isNonASCIIWhitespace(uint32_t codePoint) {
  switch (codePoint) {
  case 0x0085: case 0x00A0: case 0x1680: case 0x2028: case 0x2029:
  case 0x202F: case 0x205F: case 0x3000:
    return true;
  default:
    return codePoint >= 0x2000 && codePoint <= 0x200A;
  }
}

void quill::printAsQuotedCharacter(llvm::raw_ostream &out,
                                   uint32_t codePoint) {
  out << '\'';
  switch (codePoint) {
  case '\\': out << "\\\\"; break;
  case '\t': out << "\\t"; break;
  case '\n': out << "\\n"; break;
  case '\r': out << "\\r"; break;
  case '\'': out << "\\'"; break;
  case '"': out << '"'; break; // no need to escape these
  case '\0': out << "\\0"; break;
  default: {
    if (codePoint < 0x80) {
      if (codePoint < 0x20 || codePoint == 0x7F)
        out << "\\u{" << llvm::utohexstr(codePoint, /*LowerCase=*/true) << '}';
      else
        out << (char)codePoint;
      break;
    }

    // Surrogates and values past the last scalar are not characters at all.
    // Whitespace, zero-width and combining characters are invisible or merge
    // into the quote, so they are escaped too.
    char buffer[UNI_MAX_UTF8_BYTES_PER_CODE_POINT];
    char *end = buffer;
    if (isNonASCIIWhitespace(codePoint) ||
        !llvm::sys::unicode::isPrintable(codePoint) ||
        !llvm::ConvertCodePointToUTF8(codePoint, end) ||
        llvm::sys::unicode::columnWidthUTF8(StringRef(buffer, end - buffer)) <=
            0) {
      out << "\\u{" << llvm::utohexstr(codePoint, /*LowerCase=*/true) << '}';
      break;
    }
    out.write(buffer, end - buffer);
    break;
  }
  }
  out << '\'';
}
