//===--- Edition.h - Language editions --------------------------*- C++ -*-===//
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

#ifndef QUILL_BASIC_EDITION_H
#define QUILL_BASIC_EDITION_H

#include "quill/Basic/LLVM.h"
#include "llvm/ADT/StringRef.h"
#include <cstdint>

namespace quill {

/// The edition of the source language a crate is compiled against.
enum class Edition : uint8_t {
  Edition2015,
  Edition2018,
  Edition2021,
  Edition2024,
};

/// The year of \p edition, e.g. "2021".
StringRef getEditionName(Edition edition);

raw_ostream &operator<<(raw_ostream &OS, Edition edition);

} // end namespace quill

#endif // QUILL_BASIC_EDITION_H
