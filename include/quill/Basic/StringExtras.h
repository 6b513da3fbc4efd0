//===--- StringExtras.h - String Utilities ----------------------*- C++ -*-===//
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
// This file provides utilities for turning arbitrary byte strings into text
// that is safe to show to users.
//
//===----------------------------------------------------------------------===//

#ifndef QUILL_BASIC_STRINGEXTRAS_H
#define QUILL_BASIC_STRINGEXTRAS_H

#include "quill/Basic/LLVM.h"
#include "llvm/ADT/StringRef.h"
#include <string>

namespace quill {

/// The UTF-8 encoding of U+FFFD REPLACEMENT CHARACTER.
constexpr static const StringLiteral UTF8_REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

/// Returns true if \p bytes is a well-formed UTF-8 sequence.
bool isValidUTF8(StringRef bytes);

/// Copies \p bytes into a string, replacing every ill-formed UTF-8 sequence
/// with U+FFFD.
std::string toStringLossy(StringRef bytes);

/// Same as the StringRef overload, but reuses the storage of \p bytes when
/// it is already well-formed.
std::string toStringLossy(std::string &&bytes);

} // end namespace quill

#endif // QUILL_BASIC_STRINGEXTRAS_H
