//===--- PrimitiveParsingTest.cpp -----------------------------------------===//
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

#include "quill/Basic/PrimitiveParsing.h"
#include "gtest/gtest.h"

using namespace quill;

static std::optional<IntErrorKind> parseKind(StringRef text, unsigned width,
                                             uint64_t &result) {
  if (auto err = parseUnsignedInteger(text, width, result))
    return err->getKind();
  return std::nullopt;
}

TEST(PrimitiveParsing, ParseUnsignedInteger) {
  uint64_t value = 0;
  EXPECT_EQ(parseKind("42", 32, value), std::nullopt);
  EXPECT_EQ(value, 42u);
  EXPECT_EQ(parseKind("+7", 32, value), std::nullopt);
  EXPECT_EQ(value, 7u);
  EXPECT_EQ(parseKind("255", 8, value), std::nullopt);
  EXPECT_EQ(value, 255u);
  EXPECT_EQ(parseKind("18446744073709551615", 64, value), std::nullopt);
  EXPECT_EQ(value, UINT64_MAX);
}

TEST(PrimitiveParsing, ParseUnsignedIntegerErrors) {
  uint64_t value = 3;
  EXPECT_EQ(parseKind("", 32, value), IntErrorKind::Empty);
  EXPECT_EQ(parseKind("+", 32, value), IntErrorKind::InvalidDigit);
  EXPECT_EQ(parseKind("-1", 32, value), IntErrorKind::InvalidDigit);
  EXPECT_EQ(parseKind("12a", 32, value), IntErrorKind::InvalidDigit);
  EXPECT_EQ(parseKind("++1", 32, value), IntErrorKind::InvalidDigit);
  EXPECT_EQ(parseKind(" 1", 32, value), IntErrorKind::InvalidDigit);
  EXPECT_EQ(parseKind("0x10", 32, value), IntErrorKind::InvalidDigit);
  EXPECT_EQ(parseKind("4294967296", 32, value), IntErrorKind::PosOverflow);
  EXPECT_EQ(parseKind("256", 8, value), IntErrorKind::PosOverflow);
  EXPECT_EQ(parseKind("18446744073709551616", 64, value),
            IntErrorKind::PosOverflow);
  EXPECT_EQ(value, 3u);
}

TEST(PrimitiveParsing, ErrorDescriptions) {
  EXPECT_EQ(ParseIntError(IntErrorKind::Empty).getDescription(),
            "cannot parse integer from empty string");
  EXPECT_EQ(ParseIntError(IntErrorKind::InvalidDigit).getDescription(),
            "invalid digit found in string");
  EXPECT_EQ(ParseIntError(IntErrorKind::PosOverflow).getDescription(),
            "number too large to fit in target type");
}
