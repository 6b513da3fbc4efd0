//===--- DelayedDiagnostic.h - Diagnostics reported later -------*- C++ -*-===//
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

#ifndef QUILL_AST_DELAYEDDIAGNOSTIC_H
#define QUILL_AST_DELAYEDDIAGNOSTIC_H

#include "quill/AST/Diagnostic.h"
#include "quill/Basic/Backtrace.h"

namespace quill {

/// A diagnostic whose report is deferred, usually a bug that is only real if
/// compilation otherwise succeeds. It keeps the backtrace of the point where
/// it was delayed.
class DelayedDiagnostic {
  Diagnostic Inner;
  Backtrace Note;

public:
  DelayedDiagnostic(Diagnostic inner, Backtrace note)
      : Inner(std::move(inner)), Note(std::move(note)) {}

  /// Delay \p inner, capturing the current backtrace if enabled.
  static DelayedDiagnostic withCapturedBacktrace(Diagnostic inner) {
    return DelayedDiagnostic(std::move(inner), Backtrace::capture());
  }

  const Diagnostic &getDiagnostic() const { return Inner; }
  const Backtrace &getBacktrace() const { return Note; }

  /// Release the diagnostic with a note saying where it was delayed.
  Diagnostic decorate() &&;

  /// Release the diagnostic at the final flush of delayed bugs. The result is
  /// always an internal compiler error.
  Diagnostic flush() &&;
};

} // end namespace quill

#endif // QUILL_AST_DELAYEDDIAGNOSTIC_H
