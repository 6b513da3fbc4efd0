//===--- PrimitiveParsing.cpp - Primitive parsing routines ----------------===//
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

#include "quill/Basic/PrimitiveParsing.h"
#include "quill/Basic/Assertions.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

using namespace quill;

StringRef ParseIntError::getDescription() const {
  switch (Kind) {
  case IntErrorKind::Empty:
    return "cannot parse integer from empty string";
  case IntErrorKind::InvalidDigit:
    return "invalid digit found in string";
  case IntErrorKind::PosOverflow:
    return "number too large to fit in target type";
  }
  llvm_unreachable("Unhandled IntErrorKind in switch.");
}

raw_ostream &quill::operator<<(raw_ostream &OS, const ParseIntError &E) {
  return OS << E.getDescription();
}

std::optional<ParseIntError>
quill::parseUnsignedInteger(StringRef text, unsigned bitWidth,
                            uint64_t &result) {
  ASSERT(bitWidth > 0 && bitWidth <= 64);

  if (text.empty())
    return ParseIntError(IntErrorKind::Empty);

  StringRef digits = text;
  if (digits.startswith("+"))
    digits = digits.drop_front();

  uint64_t value;
  if (digits.getAsInteger(10, value)) {
    // A run of plain digits can only fail by overflowing 64 bits.
    bool allDigits = !digits.empty() && llvm::all_of(digits, llvm::isDigit);
    return ParseIntError(allDigits ? IntErrorKind::PosOverflow
                                   : IntErrorKind::InvalidDigit);
  }

  if (bitWidth < 64 && value >> bitWidth)
    return ParseIntError(IntErrorKind::PosOverflow);

  result = value;
  return std::nullopt;
}
