//===--- DelayedDiagnostic.cpp - Diagnostics reported later ---------------===//
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

#define DEBUG_TYPE "quill-diagnostics"
#include "quill/AST/DelayedDiagnostic.h"
#include "quill/AST/Subdiagnostics.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

using namespace quill;

Diagnostic DelayedDiagnostic::decorate() && {
  SourceRange span = Inner.getPrimarySpan().value_or(SourceRange());
  DiagnosticLocation emittedAt = Inner.getEmittedAt();

  // A captured backtrace spans many lines and reads better on its own.
  if (Note.getStatus() == Backtrace::Status::Captured)
    Inner.subdiagnostic(DelayedAtWithNewline{span, emittedAt, std::move(Note)});
  else
    Inner.subdiagnostic(
        DelayedAtWithoutNewline{span, emittedAt, std::move(Note)});
  return std::move(Inner);
}

Diagnostic DelayedDiagnostic::flush() && {
  DiagnosticLevel level = Inner.getLevel();
  Diagnostic result = std::move(*this).decorate();

  if (level != DiagnosticLevel::DelayedBug) {
    LLVM_DEBUG(llvm::dbgs() << "flushing delayed diagnostic with level '"
                            << level << "'\n");
    SourceRange span = result.getPrimarySpan().value_or(SourceRange());
    result.subdiagnostic(InvalidFlushedDelayedDiagnosticLevel{span, level});
  }
  result.setLevel(DiagnosticLevel::Bug);
  return result;
}
