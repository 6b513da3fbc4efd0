//===--- SubdiagnosticTest.cpp --------------------------------------------===//
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
#include "gtest/gtest.h"

using namespace quill;

namespace {
const char Source[] = "fn f(x: &Foo, y: &Bar) -> Ref<Baz> {}";

SourceRange rangeAt(unsigned offset, unsigned length) {
  SourceLoc start = SourceLoc::getFromPointer(Source + offset);
  return SourceRange(start, start.getAdvancedLoc(length - 1));
}

std::string stringArg(const DiagnosticArgs &args, StringRef name) {
  const DiagnosticArgValue *value = args.lookup(name);
  if (!value || !value->isString()) {
    ADD_FAILURE() << "no string argument '" << name.str() << "'";
    return "";
  }
  return value->getAsString().str();
}

int64_t numberArg(const DiagnosticArgs &args, StringRef name) {
  const DiagnosticArgValue *value = args.lookup(name);
  if (!value || !value->isNumber()) {
    ADD_FAILURE() << "no number argument '" << name.str() << "'";
    return -1;
  }
  return value->getAsNumber().getSExtValue();
}
} // end anonymous namespace

TEST(Subdiagnostic, SingleLabelManySpans) {
  Diagnostic diag(DiagnosticLevel::Error, "missing lifetime specifiers");
  diag.subdiagnostic(
      SingleLabelManySpans{{rangeAt(8, 4), rangeAt(17, 4)}, "borrowed here"});

  ASSERT_EQ(diag.getSpanLabels().size(), 2u);
  for (const SpanLabel &label : diag.getSpanLabels()) {
    EXPECT_EQ(label.Label.getText(), "borrowed here");
    EXPECT_TRUE(label.Args.empty());
  }
  EXPECT_EQ(diag.getSpanLabels()[0].Range, rangeAt(8, 4));
  EXPECT_EQ(diag.getSpanLabels()[1].Range, rangeAt(17, 4));
  EXPECT_TRUE(diag.getChildren().empty());
}

TEST(Subdiagnostic, ExpectedLifetimeParameter) {
  Diagnostic diag(DiagnosticLevel::Error, "missing lifetime specifier");
  diag.subdiagnostic(ExpectedLifetimeParameter{rangeAt(26, 8), 1});

  ASSERT_EQ(diag.getSpanLabels().size(), 1u);
  const SpanLabel &label = diag.getSpanLabels()[0];
  EXPECT_EQ(label.Label.getID(), DiagID::errors_expected_lifetime_parameter);
  EXPECT_EQ(label.Args.size(), 1u);
  EXPECT_EQ(numberArg(label.Args, "count"), 1);
  EXPECT_TRUE(diag.getArgs().empty());
}

TEST(Subdiagnostic, SameNameDoesNotCollide) {
  Diagnostic diag(DiagnosticLevel::Error, "missing lifetime specifiers");
  diag.subdiagnostic(ExpectedLifetimeParameter{rangeAt(8, 4), 1})
      .subdiagnostic(ExpectedLifetimeParameter{rangeAt(26, 8), 2});

  ASSERT_EQ(diag.getSpanLabels().size(), 2u);
  EXPECT_EQ(numberArg(diag.getSpanLabels()[0].Args, "count"), 1);
  EXPECT_EQ(numberArg(diag.getSpanLabels()[1].Args, "count"), 2);
}

TEST(Subdiagnostic, IndicateAnonymousLifetime) {
  Diagnostic diag(DiagnosticLevel::Error, "hidden lifetime parameters");
  diag.subdiagnostic(IndicateAnonymousLifetime{rangeAt(26, 3), 1, "Ref<'_, "});

  EXPECT_TRUE(diag.getSpanLabels().empty());
  ASSERT_EQ(diag.getSuggestions().size(), 1u);
  const CodeSuggestion &suggestion = diag.getSuggestions()[0];
  EXPECT_EQ(suggestion.Message.getID(),
            DiagID::errors_indicate_anonymous_lifetime);
  EXPECT_EQ(suggestion.Code, "Ref<'_, ");
  EXPECT_EQ(suggestion.Style, SuggestionStyle::ShowAlways);
  EXPECT_EQ(suggestion.Applic, Applicability::Unspecified);
  EXPECT_EQ(suggestion.Range, rangeAt(26, 3));
  EXPECT_EQ(suggestion.Args.size(), 2u);
  EXPECT_EQ(numberArg(suggestion.Args, "count"), 1);
  EXPECT_EQ(stringArg(suggestion.Args, "suggestion"), "Ref<'_, ");
}

TEST(Subdiagnostic, DelayedAtNotes) {
  Diagnostic diag(DiagnosticLevel::DelayedBug, "unexpected region");
  DiagnosticLocation site("lib/Sema/Regions.cpp", 88, 7);
  diag.subdiagnostic(
      DelayedAtWithNewline{rangeAt(0, 2), site, Backtrace::fromFrames("#0 f")});
  diag.subdiagnostic(
      DelayedAtWithoutNewline{rangeAt(0, 2), site, Backtrace::disabled()});

  ASSERT_EQ(diag.getChildren().size(), 2u);
  const SubDiagnostic &first = diag.getChildren()[0];
  EXPECT_EQ(first.Level, DiagnosticLevel::Note);
  EXPECT_EQ(first.Message.getID(), DiagID::errors_delayed_at_with_newline);
  ASSERT_EQ(first.Spans.size(), 1u);
  EXPECT_EQ(stringArg(first.Args, "emitted_at"), "lib/Sema/Regions.cpp:88:7");
  EXPECT_EQ(stringArg(first.Args, "note"), "#0 f");

  const SubDiagnostic &second = diag.getChildren()[1];
  EXPECT_EQ(second.Message.getID(), DiagID::errors_delayed_at_without_newline);
  EXPECT_EQ(stringArg(second.Args, "note"), "disabled backtrace");
}

TEST(Subdiagnostic, InvalidFlushedDelayedDiagnosticLevel) {
  Diagnostic diag(DiagnosticLevel::Bug, "flushed");
  diag.subdiagnostic(
      InvalidFlushedDelayedDiagnosticLevel{rangeAt(3, 1), DiagnosticLevel::Warning});

  ASSERT_EQ(diag.getChildren().size(), 1u);
  const SubDiagnostic &note = diag.getChildren()[0];
  EXPECT_EQ(note.Message.getID(),
            DiagID::errors_invalid_flushed_delayed_diagnostic_level);
  EXPECT_EQ(stringArg(note.Args, "level"), "warning");
}

TEST(Subdiagnostic, MergeOrderIsPreserved) {
  Diagnostic diag(DiagnosticLevel::Error, "ordering");
  diag.subdiagnostic(InvalidFlushedDelayedDiagnosticLevel{
                         rangeAt(0, 1), DiagnosticLevel::Error})
      .subdiagnostic(DelayedAtWithoutNewline{
          rangeAt(0, 1), DiagnosticLocation("a.cpp", 1, 1),
          Backtrace::disabled()})
      .subdiagnostic(InvalidFlushedDelayedDiagnosticLevel{
          rangeAt(0, 1), DiagnosticLevel::Note});

  ASSERT_EQ(diag.getChildren().size(), 3u);
  EXPECT_EQ(stringArg(diag.getChildren()[0].Args, "level"), "error");
  EXPECT_EQ(diag.getChildren()[1].Message.getID(),
            DiagID::errors_delayed_at_without_newline);
  EXPECT_EQ(stringArg(diag.getChildren()[2].Args, "level"), "note");
}
