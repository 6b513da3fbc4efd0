//===--- DiagnosticLevel.h - Diagnostic and lint levels ---------*- C++ -*-===//
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

#ifndef QUILL_AST_DIAGNOSTICLEVEL_H
#define QUILL_AST_DIAGNOSTICLEVEL_H

#include "quill/Basic/DiagnosticArgTraits.h"
#include "quill/Basic/LLVM.h"
#include "llvm/ADT/StringRef.h"
#include <cstdint>

namespace quill {

/// The severity of a diagnostic.
enum class DiagnosticLevel : uint8_t {
  /// An internal compiler error, reported immediately.
  Bug,
  /// An internal compiler error reported only if no other error is emitted.
  DelayedBug,
  /// An error that stops compilation immediately.
  Fatal,
  Error,
  /// A warning that cannot be silenced by lint attributes.
  ForceWarning,
  Warning,
  Note,
  /// A note emitted at most once per span and message.
  OnceNote,
  Help,
  OnceHelp,
  /// Context printed after compilation has already failed.
  FailureNote,
  /// A lint that was allowed; nothing is printed.
  Allow,
  /// A lint that was expected to fire.
  Expect,
};

/// The label printed before the message, e.g. "warning".
StringRef getDiagnosticLevelLabel(DiagnosticLevel level);

/// Whether a diagnostic of \p level fails the compilation.
bool isErrorLevel(DiagnosticLevel level);

raw_ostream &operator<<(raw_ostream &OS, DiagnosticLevel level);

/// The level a lint is set to.
enum class LintLevel : uint8_t {
  Allow,
  Expect,
  Warn,
  ForceWarn,
  Deny,
  Forbid,
};

/// The name of the level as used in attributes, e.g. "deny".
StringRef getLintLevelName(LintLevel level);

/// The command-line flag that sets a lint to \p level, e.g. "-D".
StringRef getLintLevelCommandLineFlag(LintLevel level);

raw_ostream &operator<<(raw_ostream &OS, LintLevel level);

/// Lint levels are named by their command-line flag.
template <>
struct DiagnosticArgTraits<LintLevel> {
  static DiagnosticArgValue intoDiagnosticArg(LintLevel level) {
    return DiagnosticArgValue::getString(
        getLintLevelCommandLineFlag(level).str());
  }
};

} // end namespace quill

#endif // QUILL_AST_DIAGNOSTICLEVEL_H
