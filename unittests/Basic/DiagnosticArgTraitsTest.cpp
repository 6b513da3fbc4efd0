//===--- DiagnosticArgTraitsTest.cpp --------------------------------------===//
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

#include "quill/Basic/DiagnosticArgTraits.h"
#include "quill/Basic/Backtrace.h"
#include "quill/Basic/DiagnosticLocation.h"
#include "quill/Basic/DiagnosticSymbolList.h"
#include "quill/Basic/Edition.h"
#include "quill/Basic/PrimitiveParsing.h"
#include "quill/Basic/Program.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/VersionTuple.h"
#include "gtest/gtest.h"
#include <cstdint>
#include <limits>
#include <string>
#include <system_error>
#include <vector>

using namespace quill;

namespace {
template <typename T>
std::string numberText(T &&value) {
  DiagnosticArgValue arg = intoDiagnosticArg(std::forward<T>(value));
  EXPECT_TRUE(arg.isNumber());
  if (!arg.isNumber())
    return "";
  return llvm::toString(arg.getAsNumber(), 10);
}

template <typename T>
std::string stringText(T &&value) {
  DiagnosticArgValue arg = intoDiagnosticArg(std::forward<T>(value));
  EXPECT_TRUE(arg.isString());
  if (!arg.isString())
    return "";
  return arg.getAsString().str();
}

template <typename IntT>
void checkFullRange() {
  for (int64_t i = std::numeric_limits<IntT>::min(),
               e = std::numeric_limits<IntT>::max();
       i <= e; ++i) {
    ASSERT_EQ(numberText(static_cast<IntT>(i)), std::to_string(i));
  }
}
} // end anonymous namespace

TEST(DiagnosticArgTraits, NarrowIntegersCoverTheirRange) {
  checkFullRange<int8_t>();
  checkFullRange<uint8_t>();
  checkFullRange<int16_t>();
  checkFullRange<uint16_t>();
}

TEST(DiagnosticArgTraits, WideIntegerExtremes) {
  EXPECT_EQ(numberText(std::numeric_limits<int32_t>::min()), "-2147483648");
  EXPECT_EQ(numberText(std::numeric_limits<uint32_t>::max()), "4294967295");
  EXPECT_EQ(numberText(std::numeric_limits<int64_t>::min()),
            "-9223372036854775808");
  EXPECT_EQ(numberText(std::numeric_limits<int64_t>::max()),
            "9223372036854775807");
  EXPECT_EQ(numberText(std::numeric_limits<uint64_t>::max()),
            "18446744073709551615");
  EXPECT_EQ(numberText(size_t(0)), "0");
  EXPECT_EQ(numberText(static_cast<signed char>(-5)), "-5");
}

TEST(DiagnosticArgTraits, ArbitraryPrecisionIntegers) {
  EXPECT_EQ(numberText(APSInt::get(-5)), "-5");

  // 2^128 - 1 does not fit in a signed 128-bit number.
  APSInt huge(APInt::getMaxValue(128), /*isUnsigned=*/true);
  EXPECT_EQ(stringText(huge), "340282366920938463463374607431768211455");

  APSInt largest(APInt::getSignedMaxValue(128), /*isUnsigned=*/true);
  EXPECT_EQ(numberText(largest), "170141183460469231731687303715884105727");
}

TEST(DiagnosticArgTraits, BooleansAreWords) {
  EXPECT_EQ(stringText(true), "true");
  EXPECT_EQ(stringText(false), "false");
}

TEST(DiagnosticArgTraits, CharactersAreQuoted) {
  EXPECT_EQ(stringText('x'), "'x'");
  EXPECT_EQ(stringText('\n'), "'\\n'");
  EXPECT_EQ(stringText('\''), "'\\''");
  EXPECT_EQ(stringText('"'), "'\"'");
  EXPECT_EQ(stringText('\x1b'), "'\\u{1b}'");
  EXPECT_EQ(stringText(U'é'), "'\xC3\xA9'");
  EXPECT_EQ(stringText(U'\u2028'), "'\\u{2028}'");
  EXPECT_EQ(stringText(U'\u0301'), "'\\u{301}'");
}

TEST(DiagnosticArgTraits, StringsAreRepairedToUTF8) {
  EXPECT_EQ(stringText(std::string("plain")), "plain");
  EXPECT_EQ(stringText(StringRef("a\xFF" "b")), "a\xEF\xBF\xBD" "b");
  EXPECT_EQ(stringText("literal"), "literal");

  const char *null = nullptr;
  EXPECT_EQ(stringText(null), "");

  llvm::SmallString<16> small("small");
  EXPECT_EQ(stringText(small), "small");
}

TEST(DiagnosticArgTraits, LvaluesAreCopied) {
  std::string name = "value";
  DiagnosticArgValue first = intoDiagnosticArg(name);
  DiagnosticArgValue second = intoDiagnosticArg(name);
  EXPECT_EQ(name, "value");
  EXPECT_EQ(first, second);

  EXPECT_EQ(stringText(std::cref(name)), "value");
}

TEST(DiagnosticArgTraits, PathsAreNotEscaped) {
  EXPECT_EQ(stringText(std::filesystem::path("/tmp/some dir/\"x\".rs")),
            "/tmp/some dir/\"x\".rs");
}

TEST(DiagnosticArgTraits, ErrorsUseTheirMessage) {
  auto code = std::make_error_code(std::errc::no_such_file_or_directory);
  EXPECT_EQ(stringText(code), code.message());

  llvm::Error err = llvm::createStringError(llvm::inconvertibleErrorCode(),
                                            "could not open archive");
  EXPECT_EQ(stringText(std::move(err)), "could not open archive");
}

TEST(DiagnosticArgTraits, DisplayableTypesUseTheirPrintedForm) {
  EXPECT_EQ(stringText(llvm::VersionTuple(1, 70, 2)), "1.70.2");
  EXPECT_EQ(stringText(Edition::Edition2021), "2021");
  EXPECT_EQ(stringText(ParseIntError(IntErrorKind::InvalidDigit)),
            "invalid digit found in string");
  EXPECT_EQ(stringText(ExitStatus::exited(1)), "exit status: 1");
  EXPECT_EQ(stringText(ExitStatus::signaled(9)), "signal: 9");
  EXPECT_EQ(stringText(DiagnosticLocation("lib/Sema.cpp", 12, 5)),
            "lib/Sema.cpp:12:5");
  EXPECT_EQ(stringText(Backtrace::disabled()), "disabled backtrace");
}

TEST(DiagnosticArgTraits, FromDisplayForwardsToTheReferent) {
  llvm::VersionTuple version(2, 1);
  EXPECT_EQ(stringText(DiagnosticArgFromDisplay(
                [&](raw_ostream &OS) { OS << version; })),
            "2.1");

  unsigned calls = 0;
  DiagnosticArgValue value =
      intoDiagnosticArg(DiagnosticArgFromDisplay([&](raw_ostream &OS) {
        ++calls;
        OS << "v" << version.getMajor();
      }));
  EXPECT_EQ(calls, 1u);
  EXPECT_EQ(value, DiagnosticArgValue::getString("v2"));
}

TEST(DiagnosticArgTraits, SymbolListsKeepOrder) {
  DiagnosticSymbolList symbols(std::vector<std::string>{"foo", "bar"});
  DiagnosticArgValue arg = intoDiagnosticArg(std::move(symbols));
  ASSERT_TRUE(arg.isStringList());
  ASSERT_EQ(arg.getAsStringList().size(), 2u);
  EXPECT_EQ(arg.getAsStringList()[0], "`foo`");
  EXPECT_EQ(arg.getAsStringList()[1], "`bar`");

  DiagnosticSymbolList editions;
  editions.push_back(Edition::Edition2018);
  editions.push_back(Edition::Edition2015);
  editions.push_back(Edition::Edition2024);
  DiagnosticArgValue editionArg = intoDiagnosticArg(editions);
  std::string text;
  llvm::raw_string_ostream OS(text);
  OS << editionArg;
  EXPECT_EQ(OS.str(), "`2018`, `2015` and `2024`");
}

TEST(DiagnosticArgTraits, EmptySymbolList) {
  DiagnosticArgValue arg = intoDiagnosticArg(DiagnosticSymbolList());
  ASSERT_TRUE(arg.isStringList());
  EXPECT_TRUE(arg.getAsStringList().empty());
}
