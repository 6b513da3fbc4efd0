//===--- QuotedStringTest.cpp ---------------------------------------------===//
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
#include "gtest/gtest.h"

using namespace quill;

namespace {
std::string quote(uint32_t codePoint) {
  std::string result;
  llvm::raw_string_ostream OS(result);
  OS << QuotedCharacter(codePoint);
  return OS.str();
}

/// Reads a character literal back, returning false if \p text is not one.
/// Unescaped characters must occupy at least one column.
bool unquote(StringRef text, uint32_t &codePoint) {
  if (text.size() < 3 || !text.startswith("'") || !text.endswith("'"))
    return false;
  StringRef body = text.drop_front().drop_back();

  if (body.consume_front("\\u{")) {
    return body.consume_back("}") && !body.empty() &&
           !body.getAsInteger(16, codePoint);
  }
  if (body.consume_front("\\")) {
    if (body.size() != 1)
      return false;
    switch (body[0]) {
    case 'n': codePoint = '\n'; return true;
    case 't': codePoint = '\t'; return true;
    case 'r': codePoint = '\r'; return true;
    case '0': codePoint = '\0'; return true;
    case '\\': codePoint = '\\'; return true;
    case '\'': codePoint = '\''; return true;
    default: return false;
    }
  }

  if (llvm::sys::unicode::columnWidthUTF8(body) < 1)
    return false;
  auto *cur = reinterpret_cast<const llvm::UTF8 *>(body.begin());
  auto *end = reinterpret_cast<const llvm::UTF8 *>(body.end());
  llvm::UTF32 decoded;
  if (llvm::convertUTF8Sequence(&cur, end, &decoded, llvm::strictConversion) !=
          llvm::conversionOK ||
      cur != end)
    return false;
  codePoint = decoded;
  return true;
}
} // end anonymous namespace

TEST(QuotedCharacter, SeparatorsAndSpacesAreEscaped) {
  EXPECT_EQ(quote(0x2028), "'\\u{2028}'");
  EXPECT_EQ(quote(0x2029), "'\\u{2029}'");
  EXPECT_EQ(quote(0x00A0), "'\\u{a0}'");
  EXPECT_EQ(quote(0x3000), "'\\u{3000}'");
  EXPECT_EQ(quote(0x2003), "'\\u{2003}'");
  EXPECT_EQ(quote(0x0085), "'\\u{85}'");
  EXPECT_EQ(quote(' '), "' '");
}

TEST(QuotedCharacter, ZeroWidthCharactersAreEscaped) {
  EXPECT_EQ(quote(0x0301), "'\\u{301}'");
  EXPECT_EQ(quote(0x200B), "'\\u{200b}'");
  EXPECT_EQ(quote(0xFEFF), "'\\u{feff}'");
}

TEST(QuotedCharacter, VisibleCharactersAreKept) {
  EXPECT_EQ(quote(0x00E9), "'\xC3\xA9'");
  EXPECT_EQ(quote(0x4E2D), "'\xE4\xB8\xAD'");
  EXPECT_EQ(quote(0x1F600), "'\xF0\x9F\x98\x80'");
}

TEST(QuotedCharacter, NonScalarsAreEscaped) {
  EXPECT_EQ(quote(0xD800), "'\\u{d800}'");
  EXPECT_EQ(quote(0x110000), "'\\u{110000}'");
}

TEST(QuotedCharacter, EveryScalarReadsBack) {
  for (uint32_t codePoint = 0; codePoint <= 0x10FFFF; ++codePoint) {
    if (codePoint >= 0xD800 && codePoint <= 0xDFFF)
      continue;
    std::string text = quote(codePoint);
    uint32_t decoded = UINT32_MAX;
    ASSERT_TRUE(unquote(text, decoded))
        << "U+" << llvm::utohexstr(codePoint) << " printed as " << text;
    ASSERT_EQ(decoded, codePoint) << text;
  }
}
