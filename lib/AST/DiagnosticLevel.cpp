//===--- DiagnosticLevel.cpp - Diagnostic and lint levels -----------------===//
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

#include "quill/AST/DiagnosticLevel.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

using namespace quill;

StringRef quill::getDiagnosticLevelLabel(DiagnosticLevel level) {
  switch (level) {
  case DiagnosticLevel::Bug:
  case DiagnosticLevel::DelayedBug:
    return "error: internal compiler error";
  case DiagnosticLevel::Fatal:
  case DiagnosticLevel::Error:
    return "error";
  case DiagnosticLevel::ForceWarning:
  case DiagnosticLevel::Warning:
    return "warning";
  case DiagnosticLevel::Note:
  case DiagnosticLevel::OnceNote:
    return "note";
  case DiagnosticLevel::Help:
  case DiagnosticLevel::OnceHelp:
    return "help";
  case DiagnosticLevel::FailureNote:
    return "failure-note";
  case DiagnosticLevel::Allow:
    return "allow";
  case DiagnosticLevel::Expect:
    return "expect";
  }
  llvm_unreachable("Unhandled DiagnosticLevel in switch.");
}

bool quill::isErrorLevel(DiagnosticLevel level) {
  switch (level) {
  case DiagnosticLevel::Bug:
  case DiagnosticLevel::DelayedBug:
  case DiagnosticLevel::Fatal:
  case DiagnosticLevel::Error:
    return true;
  case DiagnosticLevel::ForceWarning:
  case DiagnosticLevel::Warning:
  case DiagnosticLevel::Note:
  case DiagnosticLevel::OnceNote:
  case DiagnosticLevel::Help:
  case DiagnosticLevel::OnceHelp:
  case DiagnosticLevel::FailureNote:
  case DiagnosticLevel::Allow:
  case DiagnosticLevel::Expect:
    return false;
  }
  llvm_unreachable("Unhandled DiagnosticLevel in switch.");
}

raw_ostream &quill::operator<<(raw_ostream &OS, DiagnosticLevel level) {
  return OS << getDiagnosticLevelLabel(level);
}

StringRef quill::getLintLevelName(LintLevel level) {
  switch (level) {
  case LintLevel::Allow:
    return "allow";
  case LintLevel::Expect:
    return "expect";
  case LintLevel::Warn:
    return "warn";
  case LintLevel::ForceWarn:
    return "force-warn";
  case LintLevel::Deny:
    return "deny";
  case LintLevel::Forbid:
    return "forbid";
  }
  llvm_unreachable("Unhandled LintLevel in switch.");
}

StringRef quill::getLintLevelCommandLineFlag(LintLevel level) {
  switch (level) {
  case LintLevel::Allow:
    return "-A";
  case LintLevel::Warn:
    return "-W";
  case LintLevel::ForceWarn:
    return "--force-warn";
  case LintLevel::Deny:
    return "-D";
  case LintLevel::Forbid:
    return "-F";
  case LintLevel::Expect:
    // Expectations are only written as attributes.
    return "expect";
  }
  llvm_unreachable("Unhandled LintLevel in switch.");
}

raw_ostream &quill::operator<<(raw_ostream &OS, LintLevel level) {
  return OS << getLintLevelName(level);
}
