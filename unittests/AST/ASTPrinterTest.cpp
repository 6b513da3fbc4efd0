//===--- ASTPrinterTest.cpp -----------------------------------------------===//
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

#include "quill/AST/ASTPrinter.h"
#include "quill/AST/ASTContext.h"
#include "quill/AST/Expr.h"
#include "quill/AST/Path.h"
#include "quill/AST/Token.h"
#include "quill/AST/Visibility.h"
#include "gtest/gtest.h"

using namespace quill;

namespace {
class ASTPrinterTest : public ::testing::Test {
protected:
  ASTContext Ctx;

  Expr *name(StringRef text) {
    Identifier segment = Ctx.getIdentifier(text);
    return new (Ctx) PathExpr(Path::create(Ctx, segment));
  }

  Expr *binary(BinaryOperator op, Expr *lhs, Expr *rhs) {
    return new (Ctx) BinaryExpr(op, lhs, rhs);
  }
};
} // end anonymous namespace

TEST_F(ASTPrinterTest, Literals) {
  EXPECT_EQ(exprToString(new (Ctx) IntegerLiteralExpr("0xFF_u8")), "0xFF_u8");
  EXPECT_EQ(exprToString(new (Ctx) StringLiteralExpr("a \"b\"\n")),
            "\"a \\\"b\\\"\\n\"");
  EXPECT_EQ(exprToString(new (Ctx) BooleanLiteralExpr(false)), "false");
  EXPECT_EQ(exprToString(nullptr), "<null>");
}

TEST_F(ASTPrinterTest, BinaryPrecedence) {
  Expr *a = name("a"), *b = name("b"), *c = name("c");

  EXPECT_EQ(exprToString(binary(BinaryOperator::Mul,
                                binary(BinaryOperator::Add, a, b), c)),
            "(a + b) * c");
  EXPECT_EQ(exprToString(binary(BinaryOperator::Add, a,
                                binary(BinaryOperator::Mul, b, c))),
            "a + b * c");
  EXPECT_EQ(exprToString(binary(BinaryOperator::Sub,
                                binary(BinaryOperator::Sub, a, b), c)),
            "a - b - c");
  EXPECT_EQ(exprToString(binary(BinaryOperator::Sub, a,
                                binary(BinaryOperator::Sub, b, c))),
            "a - (b - c)");
  EXPECT_EQ(exprToString(binary(BinaryOperator::Eq,
                                binary(BinaryOperator::Lt, a, b), c)),
            "(a < b) == c");
  EXPECT_EQ(exprToString(binary(BinaryOperator::Or,
                                binary(BinaryOperator::And, a, b), c)),
            "a && b || c");
}

TEST_F(ASTPrinterTest, UnaryCallAndField) {
  Expr *a = name("a"), *b = name("b");

  EXPECT_EQ(exprToString(new (Ctx) UnaryExpr(
                UnaryOperator::Neg, binary(BinaryOperator::Add, a, b))),
            "-(a + b)");
  EXPECT_EQ(exprToString(new (Ctx) UnaryExpr(UnaryOperator::Not, a)), "!a");

  Expr *args[] = {new (Ctx) IntegerLiteralExpr("1"),
                  new (Ctx) StringLiteralExpr("s")};
  EXPECT_EQ(exprToString(CallExpr::create(Ctx, name("f"), args)),
            "f(1, \"s\")");
  EXPECT_EQ(exprToString(CallExpr::create(Ctx, name("g"), {})), "g()");

  Expr *sum = binary(BinaryOperator::Add, a, b);
  EXPECT_EQ(exprToString(new (Ctx) FieldExpr(sum, Ctx.getIdentifier("len"))),
            "(a + b).len");
  EXPECT_EQ(exprToString(new (Ctx) ParenExpr(a)), "(a)");
}

TEST_F(ASTPrinterTest, Paths) {
  Identifier segments[] = {Ctx.getIdentifier("std"), Ctx.getIdentifier("mem"),
                           Ctx.getIdentifier("swap")};
  EXPECT_EQ(pathToString(Path::create(Ctx, segments)), "std::mem::swap");
  EXPECT_EQ(pathToString(Path::create(Ctx, segments, /*global=*/true)),
            "::std::mem::swap");

  Identifier raw[] = {Ctx.getIdentifier("self"), Ctx.getIdentifier("match")};
  EXPECT_EQ(pathToString(Path::create(Ctx, raw)), "self::r#match");
}

TEST_F(ASTPrinterTest, Tokens) {
  EXPECT_EQ(tokenToString(Token(tok::kw_fn, "fn")), "fn");
  EXPECT_EQ(tokenToString(Token(tok::pathsep, "::")), "::");
  EXPECT_EQ(tokenToString(Token(tok::identifier, "foo")), "foo");
  EXPECT_EQ(tokenToString(Token::getRawIdentifier("fn")), "r#fn");
  EXPECT_EQ(tokenToString(Token(tok::integer_literal, "42u8")), "42u8");
  EXPECT_EQ(tokenKindToString(tok::fat_arrow), "=>");
  EXPECT_EQ(tokenKindToString(tok::eof), "<eof>");

  EXPECT_TRUE(isKeyword(tok::kw_Self));
  EXPECT_FALSE(isKeyword(tok::semi));
  EXPECT_TRUE(isPunctuator(tok::semi));
  EXPECT_EQ(getKeywordKind("while"), tok::kw_while);
  EXPECT_EQ(getKeywordKind("whilst"), tok::identifier);
}

TEST_F(ASTPrinterTest, Visibility) {
  EXPECT_EQ(visibilityToString(Visibility::getPublic()), "pub ");
  EXPECT_EQ(visibilityToString(Visibility::getInherited()), "");

  Path crate = Path::create(Ctx, Ctx.getIdentifier("crate"));
  EXPECT_EQ(visibilityToString(Visibility::getRestricted(crate, true)),
            "pub(crate) ");
  EXPECT_EQ(visibilityToString(Visibility::getRestricted(crate, false)),
            "pub(in crate) ");

  Identifier segments[] = {Ctx.getIdentifier("a"), Ctx.getIdentifier("b")};
  EXPECT_EQ(visibilityToString(
                Visibility::getRestricted(Path::create(Ctx, segments), false)),
            "pub(in a::b) ");
}

TEST_F(ASTPrinterTest, DiagnosticArguments) {
  Expr *sum = binary(BinaryOperator::Add, name("x"), name("y"));
  EXPECT_EQ(intoDiagnosticArg(sum), DiagnosticArgValue::getString("x + y"));
  const Expr *base = sum;
  EXPECT_EQ(intoDiagnosticArg(base), DiagnosticArgValue::getString("x + y"));

  EXPECT_EQ(intoDiagnosticArg(Visibility::getPublic()),
            DiagnosticArgValue::getString("pub"));
  EXPECT_EQ(intoDiagnosticArg(Visibility::getInherited()),
            DiagnosticArgValue::getString(""));
  EXPECT_EQ(intoDiagnosticArg(Path::create(Ctx, Ctx.getIdentifier("Vec"))),
            DiagnosticArgValue::getString("Vec"));
  EXPECT_EQ(intoDiagnosticArg(Token::getRawIdentifier("match")),
            DiagnosticArgValue::getString("r#match"));
  EXPECT_EQ(intoDiagnosticArg(tok::rarrow), DiagnosticArgValue::getString("->"));
}

TEST_F(ASTPrinterTest, Identifiers) {
  Identifier foo = Ctx.getIdentifier("foo");
  EXPECT_EQ(foo, Ctx.getIdentifier("foo"));
  EXPECT_NE(foo, Ctx.getIdentifier("bar"));
  EXPECT_EQ(intoDiagnosticArg(foo), DiagnosticArgValue::getString("foo"));
  EXPECT_EQ(intoDiagnosticArg(Ctx.getIdentifier("match")),
            DiagnosticArgValue::getString("r#match"));
  EXPECT_EQ(intoDiagnosticArg(Ident(Ctx.getIdentifier("self"))),
            DiagnosticArgValue::getString("self"));
  EXPECT_EQ(intoDiagnosticArg(Ident(Ctx.getIdentifier("async"))),
            DiagnosticArgValue::getString("r#async"));
}
