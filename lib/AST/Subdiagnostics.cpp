//===--- Subdiagnostics.cpp - Reusable diagnostic parts -------------------===//
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

#include "quill/AST/Subdiagnostics.h"
#include "quill/AST/DiagnosticIDs.h"

using namespace quill;

void SingleLabelManySpans::addToDiagnostic(Diagnostic &diag) && {
  diag.spanLabels(Spans, Label);
}

void ExpectedLifetimeParameter::addToDiagnostic(Diagnostic &diag) && {
  DiagnosticArgs args;
  args.set("count", Count);
  diag.spanLabel(Span, DiagID::errors_expected_lifetime_parameter,
                 std::move(args));
}

void DelayedAtWithNewline::addToDiagnostic(Diagnostic &diag) && {
  DiagnosticArgs args;
  args.set("emitted_at", EmittedAt);
  args.set("note", std::move(Note));
  diag.spanNote(Span, DiagID::errors_delayed_at_with_newline,
                std::move(args));
}

void DelayedAtWithoutNewline::addToDiagnostic(Diagnostic &diag) && {
  DiagnosticArgs args;
  args.set("emitted_at", EmittedAt);
  args.set("note", std::move(Note));
  diag.spanNote(Span, DiagID::errors_delayed_at_without_newline,
                std::move(args));
}

void InvalidFlushedDelayedDiagnosticLevel::addToDiagnostic(
    Diagnostic &diag) && {
  DiagnosticArgs args;
  args.set("level", Level);
  diag.spanNote(Span, DiagID::errors_invalid_flushed_delayed_diagnostic_level,
                std::move(args));
}

void IndicateAnonymousLifetime::addToDiagnostic(Diagnostic &diag) && {
  DiagnosticArgs args;
  args.set("count", Count);
  args.set("suggestion", Suggestion);
  diag.spanSuggestion(Span, DiagID::errors_indicate_anonymous_lifetime,
                      std::move(Suggestion), Applicability::Unspecified,
                      SuggestionStyle::ShowAlways, std::move(args));
}
