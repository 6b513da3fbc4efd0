//===--- DiagnosticLocation.h - Where a diagnostic was built ----*- C++ -*-===//
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
// This file defines DiagnosticLocation, the position in the compiler's own
// sources at which a diagnostic was created.
//
//===----------------------------------------------------------------------===//

#ifndef QUILL_BASIC_DIAGNOSTICLOCATION_H
#define QUILL_BASIC_DIAGNOSTICLOCATION_H

#include "quill/Basic/LLVM.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Compiler.h"

// GCC has no __builtin_COLUMN; its call sites carry no column.
#if defined(__has_builtin)
#if __has_builtin(__builtin_COLUMN)
#define QUILL_CALLER_COLUMN __builtin_COLUMN()
#endif
#endif
#ifndef QUILL_CALLER_COLUMN
#define QUILL_CALLER_COLUMN 0
#endif

namespace quill {

class DiagnosticLocation {
  StringRef File;
  unsigned Line = 0;
  unsigned Column = 0;

public:
  DiagnosticLocation() = default;
  /// A \p column of 0 means the column is unknown.
  DiagnosticLocation(StringRef file, unsigned line, unsigned column)
      : File(file), Line(line), Column(column) {}

  /// The location of the code calling the function this is a default
  /// argument of.
  static DiagnosticLocation caller(const char *file = __builtin_FILE(),
                                   unsigned line = __builtin_LINE(),
                                   unsigned column = QUILL_CALLER_COLUMN) {
    return DiagnosticLocation(file, line, column);
  }

  StringRef getFile() const { return File; }
  unsigned getLine() const { return Line; }
  unsigned getColumn() const { return Column; }
  bool hasColumn() const { return Column != 0; }

  bool operator==(const DiagnosticLocation &other) const {
    return File == other.File && Line == other.Line && Column == other.Column;
  }

  /// Prints "file:line:column", or "file:line" when the column is unknown.
  void print(raw_ostream &OS) const;

  friend raw_ostream &operator<<(raw_ostream &OS,
                                 const DiagnosticLocation &loc) {
    loc.print(OS);
    return OS;
  }
};

} // end namespace quill

#endif // QUILL_BASIC_DIAGNOSTICLOCATION_H
