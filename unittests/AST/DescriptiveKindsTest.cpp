//===--- DescriptiveKindsTest.cpp -----------------------------------------===//
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

#include "quill/AST/DescriptiveKinds.h"
#include "quill/AST/DiagnosticLevel.h"
#include "llvm/Support/raw_ostream.h"
#include "gtest/gtest.h"

using namespace quill;

template <typename T>
static std::string display(const T &value) {
  std::string text;
  llvm::raw_string_ostream OS(text);
  OS << value;
  return OS.str();
}

static std::string argText(DiagnosticArgValue value) {
  EXPECT_TRUE(value.isString());
  return value.isString() ? value.getAsString().str() : "";
}

TEST(DescriptiveKinds, DedicatedRuleWinsOverDisplay) {
  ConstContext constFn = ConstContext::getConstFn();
  EXPECT_EQ(display(constFn), "constant function");
  EXPECT_EQ(argText(intoDiagnosticArg(constFn)), "const_fn");

  EXPECT_EQ(display(ConstContext::getStatic(true)), "static");
  EXPECT_EQ(argText(intoDiagnosticArg(ConstContext::getStatic(true))),
            "static");
  EXPECT_EQ(display(ConstContext::getConst(false)), "constant");
  EXPECT_EQ(argText(intoDiagnosticArg(ConstContext::getConst(false))),
            "const");

  EXPECT_EQ(display(LintLevel::Deny), "deny");
  EXPECT_EQ(argText(intoDiagnosticArg(LintLevel::Deny)), "-D");
}

TEST(DescriptiveKinds, LintLevelFlags) {
  EXPECT_EQ(argText(intoDiagnosticArg(LintLevel::Allow)), "-A");
  EXPECT_EQ(argText(intoDiagnosticArg(LintLevel::Warn)), "-W");
  EXPECT_EQ(argText(intoDiagnosticArg(LintLevel::ForceWarn)), "--force-warn");
  EXPECT_EQ(argText(intoDiagnosticArg(LintLevel::Forbid)), "-F");
  EXPECT_EQ(argText(intoDiagnosticArg(LintLevel::Expect)), "expect");
  EXPECT_EQ(display(LintLevel::ForceWarn), "force-warn");
}

TEST(DescriptiveKinds, DiagnosticLevelLabels) {
  EXPECT_EQ(argText(intoDiagnosticArg(DiagnosticLevel::Bug)),
            "error: internal compiler error");
  EXPECT_EQ(argText(intoDiagnosticArg(DiagnosticLevel::DelayedBug)),
            "error: internal compiler error");
  EXPECT_EQ(argText(intoDiagnosticArg(DiagnosticLevel::Fatal)), "error");
  EXPECT_EQ(argText(intoDiagnosticArg(DiagnosticLevel::ForceWarning)),
            "warning");
  EXPECT_EQ(argText(intoDiagnosticArg(DiagnosticLevel::OnceNote)), "note");
  EXPECT_EQ(argText(intoDiagnosticArg(DiagnosticLevel::OnceHelp)), "help");
  EXPECT_EQ(argText(intoDiagnosticArg(DiagnosticLevel::FailureNote)),
            "failure-note");
  EXPECT_EQ(argText(intoDiagnosticArg(DiagnosticLevel::Allow)), "allow");
  EXPECT_EQ(argText(intoDiagnosticArg(DiagnosticLevel::Expect)), "expect");

  EXPECT_TRUE(isErrorLevel(DiagnosticLevel::DelayedBug));
  EXPECT_FALSE(isErrorLevel(DiagnosticLevel::ForceWarning));
}

TEST(DescriptiveKinds, NamedStates) {
  EXPECT_EQ(argText(intoDiagnosticArg(ParamKindOrd::Lifetime)), "lifetime");
  EXPECT_EQ(argText(intoDiagnosticArg(ParamKindOrd::TypeOrConst)),
            "type and const");
  EXPECT_EQ(argText(intoDiagnosticArg(ClosureKind::FnMut)), "FnMut");
  EXPECT_EQ(argText(intoDiagnosticArg(ClosureKind::FnOnce)), "FnOnce");
  EXPECT_EQ(argText(intoDiagnosticArg(FloatTy::F16)), "f16");
  EXPECT_EQ(argText(intoDiagnosticArg(FloatTy::F128)), "f128");
  EXPECT_EQ(argText(intoDiagnosticArg(AttrTarget::Fn)), "function");
  EXPECT_EQ(argText(intoDiagnosticArg(AttrTarget::ForeignMod)),
            "foreign module");
}

TEST(DescriptiveKinds, Resolutions) {
  EXPECT_EQ(argText(intoDiagnosticArg(Res::getDef(DefKind::Mod))), "module");
  EXPECT_EQ(argText(intoDiagnosticArg(Res::getDef(DefKind::StructCtorFn))),
            "tuple struct");
  EXPECT_EQ(argText(intoDiagnosticArg(Res::get(Res::Kind::PrimTy))),
            "builtin type");
  EXPECT_EQ(argText(intoDiagnosticArg(Res::get(Res::Kind::SelfTyAlias))),
            "self type");
  EXPECT_EQ(argText(intoDiagnosticArg(Res::get(Res::Kind::Local))),
            "local variable");
  EXPECT_EQ(argText(intoDiagnosticArg(Res::get(Res::Kind::Err))),
            "unresolved item");
}
