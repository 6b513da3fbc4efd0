//===--- DelayedDiagnosticTest.cpp ----------------------------------------===//
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

#include "quill/AST/DelayedDiagnostic.h"
#include "quill/AST/DiagnosticIDs.h"
#include "gtest/gtest.h"

using namespace quill;

namespace {
const char Source[] = "let r: &'a u8;";

SourceRange primaryRange() {
  SourceLoc start = SourceLoc::getFromPointer(Source + 7);
  return SourceRange(start, start.getAdvancedLoc(2));
}

Diagnostic makeDiagnostic(DiagnosticLevel level) {
  Diagnostic diag(level, "region resolution failed",
                  DiagnosticLocation("lib/Sema/Regions.cpp", 120, 9));
  diag.span(primaryRange());
  return diag;
}

std::string stringArg(const SubDiagnostic &child, StringRef name) {
  const DiagnosticArgValue *value = child.Args.lookup(name);
  if (!value || !value->isString()) {
    ADD_FAILURE() << "no string argument '" << name.str() << "'";
    return "";
  }
  return value->getAsString().str();
}
} // end anonymous namespace

TEST(DelayedDiagnostic, DecorateWithCapturedBacktrace) {
  DelayedDiagnostic delayed(makeDiagnostic(DiagnosticLevel::DelayedBug),
                            Backtrace::fromFrames("#0 resolve\n#1 check\n"));
  Diagnostic diag = std::move(delayed).decorate();

  EXPECT_EQ(diag.getLevel(), DiagnosticLevel::DelayedBug);
  ASSERT_EQ(diag.getChildren().size(), 1u);
  const SubDiagnostic &note = diag.getChildren()[0];
  EXPECT_EQ(note.Message.getID(), DiagID::errors_delayed_at_with_newline);
  ASSERT_EQ(note.Spans.size(), 1u);
  EXPECT_EQ(note.Spans[0], primaryRange());
  EXPECT_EQ(stringArg(note, "emitted_at"), "lib/Sema/Regions.cpp:120:9");
  EXPECT_EQ(stringArg(note, "note"), "#0 resolve\n#1 check\n");
}

TEST(DelayedDiagnostic, DecorateWithoutBacktrace) {
  DelayedDiagnostic disabled(makeDiagnostic(DiagnosticLevel::DelayedBug),
                             Backtrace::disabled());
  Diagnostic diag = std::move(disabled).decorate();
  ASSERT_EQ(diag.getChildren().size(), 1u);
  EXPECT_EQ(diag.getChildren()[0].Message.getID(),
            DiagID::errors_delayed_at_without_newline);
  EXPECT_EQ(stringArg(diag.getChildren()[0], "note"), "disabled backtrace");

  DelayedDiagnostic unsupported(makeDiagnostic(DiagnosticLevel::DelayedBug),
                                Backtrace::fromFrames(""));
  diag = std::move(unsupported).decorate();
  ASSERT_EQ(diag.getChildren().size(), 1u);
  EXPECT_EQ(stringArg(diag.getChildren()[0], "note"),
            "unsupported backtrace");
}

TEST(DelayedDiagnostic, FlushDelayedBug) {
  DelayedDiagnostic delayed(makeDiagnostic(DiagnosticLevel::DelayedBug),
                            Backtrace::disabled());
  Diagnostic diag = std::move(delayed).flush();

  EXPECT_EQ(diag.getLevel(), DiagnosticLevel::Bug);
  ASSERT_EQ(diag.getChildren().size(), 1u);
  EXPECT_EQ(diag.getChildren()[0].Message.getID(),
            DiagID::errors_delayed_at_without_newline);
}

TEST(DelayedDiagnostic, FlushOtherLevel) {
  DelayedDiagnostic delayed(makeDiagnostic(DiagnosticLevel::Error),
                            Backtrace::disabled());
  Diagnostic diag = std::move(delayed).flush();

  EXPECT_EQ(diag.getLevel(), DiagnosticLevel::Bug);
  ASSERT_EQ(diag.getChildren().size(), 2u);
  const SubDiagnostic &invalid = diag.getChildren()[1];
  EXPECT_EQ(invalid.Message.getID(),
            DiagID::errors_invalid_flushed_delayed_diagnostic_level);
  EXPECT_EQ(stringArg(invalid, "level"), "error");
  ASSERT_EQ(invalid.Spans.size(), 1u);
  EXPECT_EQ(invalid.Spans[0], primaryRange());
}

TEST(DelayedDiagnostic, CapturesWhenEnabled) {
  DelayedDiagnostic delayed = DelayedDiagnostic::withCapturedBacktrace(
      makeDiagnostic(DiagnosticLevel::DelayedBug));
  EXPECT_NE(delayed.getBacktrace().getStatus(), Backtrace::Status::Disabled);
  EXPECT_EQ(delayed.getDiagnostic().getLevel(), DiagnosticLevel::DelayedBug);
}
