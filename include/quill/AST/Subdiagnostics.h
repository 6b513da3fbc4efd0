//===--- Subdiagnostics.h - Reusable diagnostic parts -----------*- C++ -*-===//
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
//  Subdiagnostics are small bundles of spans and values that know how to
//  merge themselves into a Diagnostic as labels, notes or suggestions. Each
//  is built right before it is added and consumed by adding it:
//
//  \code
//    diag.subdiagnostic(ExpectedLifetimeParameter{span, 2});
//  \endcode
//
//===----------------------------------------------------------------------===//

#ifndef QUILL_AST_SUBDIAGNOSTICS_H
#define QUILL_AST_SUBDIAGNOSTICS_H

#include "quill/AST/Diagnostic.h"
#include "quill/AST/DiagnosticLevel.h"
#include "quill/Basic/Backtrace.h"
#include "quill/Basic/DiagnosticLocation.h"
#include "quill/Basic/LLVM.h"
#include "quill/Basic/SourceLoc.h"
#include "llvm/ADT/SmallVector.h"
#include <string>

namespace quill {

/// The same literal label on every one of a set of spans.
struct SingleLabelManySpans {
  SmallVector<SourceRange, 2> Spans;
  std::string Label;

  void addToDiagnostic(Diagnostic &diag) &&;
};

/// "expected lifetime parameter(s)" on the span missing them.
struct ExpectedLifetimeParameter {
  SourceRange Span;
  unsigned Count;

  void addToDiagnostic(Diagnostic &diag) &&;
};

/// The note on a delayed bug when a backtrace was captured. The backtrace
/// goes on its own lines.
struct DelayedAtWithNewline {
  SourceRange Span;
  DiagnosticLocation EmittedAt;
  Backtrace Note;

  void addToDiagnostic(Diagnostic &diag) &&;
};

/// The note on a delayed bug when no backtrace is available; the status goes
/// on the same line.
struct DelayedAtWithoutNewline {
  SourceRange Span;
  DiagnosticLocation EmittedAt;
  Backtrace Note;

  void addToDiagnostic(Diagnostic &diag) &&;
};

/// A diagnostic other than a delayed bug reached the delayed-bug flush.
struct InvalidFlushedDelayedDiagnosticLevel {
  SourceRange Span;
  DiagnosticLevel Level;

  void addToDiagnostic(Diagnostic &diag) &&;
};

/// Suggest spelling out an elided lifetime, e.g. \c '_.
struct IndicateAnonymousLifetime {
  SourceRange Span;
  unsigned Count;
  std::string Suggestion;

  void addToDiagnostic(Diagnostic &diag) &&;
};

} // end namespace quill

#endif // QUILL_AST_SUBDIAGNOSTICS_H
