//===--- StringExtras.cpp - String Utilities ------------------------------===//
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
// This file implements lossy conversion of byte strings to UTF-8 text.
//
//===----------------------------------------------------------------------===//

#include "quill/Basic/StringExtras.h"
#include "llvm/Support/ConvertUTF.h"

using namespace quill;

static bool isContinuationByte(unsigned char byte) {
  return (byte & 0xC0) == 0x80;
}

bool quill::isValidUTF8(StringRef bytes) {
  auto *start = reinterpret_cast<const llvm::UTF8 *>(bytes.begin());
  auto *end = reinterpret_cast<const llvm::UTF8 *>(bytes.end());
  return llvm::isLegalUTF8String(&start, end);
}

std::string quill::toStringLossy(StringRef bytes) {
  std::string result;
  result.reserve(bytes.size());

  auto *cur = reinterpret_cast<const llvm::UTF8 *>(bytes.begin());
  auto *end = reinterpret_cast<const llvm::UTF8 *>(bytes.end());
  while (cur != end) {
    unsigned length = llvm::getNumBytesForUTF8(*cur);
    if (length <= unsigned(end - cur) &&
        llvm::isLegalUTF8Sequence(cur, cur + length)) {
      result.append(reinterpret_cast<const char *>(cur), length);
      cur += length;
      continue;
    }

    // Replace the lead byte and whatever continuation bytes it claimed.
    result += UTF8_REPLACEMENT_CHARACTER;
    ++cur;
    for (unsigned i = 1; i < length && cur != end && isContinuationByte(*cur);
         ++i)
      ++cur;
  }
  return result;
}

std::string quill::toStringLossy(std::string &&bytes) {
  if (isValidUTF8(bytes))
    return std::move(bytes);
  return toStringLossy(StringRef(bytes));
}
