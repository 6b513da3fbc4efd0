//===--- Program.h - Child process results ----------------------*- C++ -*-===//
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

#ifndef QUILL_BASIC_PROGRAM_H
#define QUILL_BASIC_PROGRAM_H

#include "quill/Basic/LLVM.h"
#include <cstdint>

namespace llvm {
namespace sys {
struct ProcessInfo;
} // end namespace sys
} // end namespace llvm

namespace quill {

/// How a child process (a linker, an assembler, ...) terminated.
class ExitStatus {
public:
  enum class Kind : uint8_t {
    /// The process returned from main; the value is its exit code.
    Exited,
    /// The process was killed by a known signal.
    Signaled,
    /// The process crashed or could not be waited on, with no usable code.
    Abnormal,
  };

private:
  Kind TheKind;
  int Value;

  ExitStatus(Kind kind, int value) : TheKind(kind), Value(value) {}

public:
  /// The process returned \p code from main.
  static ExitStatus exited(int code) { return ExitStatus(Kind::Exited, code); }

  /// The process was terminated by signal \p signal.
  static ExitStatus signaled(int signal) {
    return ExitStatus(Kind::Signaled, signal);
  }

  static ExitStatus abnormal() { return ExitStatus(Kind::Abnormal, 0); }

  /// Interpret the result of llvm::sys::Wait.
  ///
  /// LLVM reports a crashed child with a return code of -2 and a failed wait
  /// with -1. The signal number only appears in the error message, so both
  /// become abnormal().
  static ExitStatus fromProcessInfo(const llvm::sys::ProcessInfo &info);

  Kind getKind() const { return TheKind; }
  bool success() const { return TheKind == Kind::Exited && Value == 0; }

  /// The exit code or signal number. Not meaningful for Kind::Abnormal.
  int getValue() const { return Value; }

  bool operator==(const ExitStatus &other) const {
    return TheKind == other.TheKind && Value == other.Value;
  }

  /// Prints "exit status: N", "signal: N" or "terminated abnormally".
  friend raw_ostream &operator<<(raw_ostream &OS, const ExitStatus &status);
};

raw_ostream &operator<<(raw_ostream &OS, const ExitStatus &status);

} // end namespace quill

#endif // QUILL_BASIC_PROGRAM_H
