//===--- Expr.cpp - Quill Language Expression ASTs ------------------------===//
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
//  This file implements the Expr class and subclasses.
//
//===----------------------------------------------------------------------===//

#include "quill/AST/Expr.h"
#include "quill/AST/ASTContext.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

using namespace quill;

#define EXPR(Id, _) \
  static_assert(std::is_trivially_destructible<Id##Expr>::value, \
                "Exprs are BumpPtrAllocated; the destructor is never called");
#include "quill/AST/ExprNodes.def"

/// Prefix operators bind tighter than any binary operator.
static const unsigned PrefixPrecedence = 14;
/// Calls and field accesses.
static const unsigned PostfixPrecedence = 15;
/// Literals, paths and parenthesized expressions.
static const unsigned PrimaryPrecedence = 16;

StringRef quill::getUnaryOperatorSpelling(UnaryOperator op) {
  switch (op) {
  case UnaryOperator::Deref:
    return "*";
  case UnaryOperator::Not:
    return "!";
  case UnaryOperator::Neg:
    return "-";
  }
  llvm_unreachable("Unhandled UnaryOperator in switch.");
}

StringRef quill::getBinaryOperatorSpelling(BinaryOperator op) {
  switch (op) {
  case BinaryOperator::Add:    return "+";
  case BinaryOperator::Sub:    return "-";
  case BinaryOperator::Mul:    return "*";
  case BinaryOperator::Div:    return "/";
  case BinaryOperator::Rem:    return "%";
  case BinaryOperator::And:    return "&&";
  case BinaryOperator::Or:     return "||";
  case BinaryOperator::BitXor: return "^";
  case BinaryOperator::BitAnd: return "&";
  case BinaryOperator::BitOr:  return "|";
  case BinaryOperator::Shl:    return "<<";
  case BinaryOperator::Shr:    return ">>";
  case BinaryOperator::Eq:     return "==";
  case BinaryOperator::Lt:     return "<";
  case BinaryOperator::Le:     return "<=";
  case BinaryOperator::Ne:     return "!=";
  case BinaryOperator::Ge:     return ">=";
  case BinaryOperator::Gt:     return ">";
  }
  llvm_unreachable("Unhandled BinaryOperator in switch.");
}

unsigned quill::getBinaryOperatorPrecedence(BinaryOperator op) {
  switch (op) {
  case BinaryOperator::Mul:
  case BinaryOperator::Div:
  case BinaryOperator::Rem:
    return 13;
  case BinaryOperator::Add:
  case BinaryOperator::Sub:
    return 12;
  case BinaryOperator::Shl:
  case BinaryOperator::Shr:
    return 11;
  case BinaryOperator::BitAnd:
    return 10;
  case BinaryOperator::BitXor:
    return 9;
  case BinaryOperator::BitOr:
    return 8;
  case BinaryOperator::Eq:
  case BinaryOperator::Lt:
  case BinaryOperator::Le:
  case BinaryOperator::Ne:
  case BinaryOperator::Ge:
  case BinaryOperator::Gt:
    return 7;
  case BinaryOperator::And:
    return 6;
  case BinaryOperator::Or:
    return 5;
  }
  llvm_unreachable("Unhandled BinaryOperator in switch.");
}

bool quill::isComparisonOperator(BinaryOperator op) {
  return getBinaryOperatorPrecedence(op) == 7;
}

//===----------------------------------------------------------------------===//
// Expr methods.
//===----------------------------------------------------------------------===//

StringRef Expr::getKindName(ExprKind K) {
  switch (K) {
#define EXPR(Id, Parent) case ExprKind::Id: return #Id;
#include "quill/AST/ExprNodes.def"
  }
  llvm_unreachable("bad ExprKind");
}

unsigned Expr::getPrecedence() const {
  switch (getKind()) {
  case ExprKind::IntegerLiteral:
  case ExprKind::StringLiteral:
  case ExprKind::BooleanLiteral:
  case ExprKind::Path:
  case ExprKind::Paren:
    return PrimaryPrecedence;
  case ExprKind::Call:
  case ExprKind::Field:
    return PostfixPrecedence;
  case ExprKind::Unary:
    return PrefixPrecedence;
  case ExprKind::Binary:
    return getBinaryOperatorPrecedence(cast<BinaryExpr>(this)->getOperator());
  }
  llvm_unreachable("bad ExprKind");
}

void Expr::dump() const {
  llvm::dbgs() << getKindName(getKind()) << ": ";
  print(llvm::dbgs());
  llvm::dbgs() << '\n';
}

void *Expr::operator new(size_t Bytes, const ASTContext &C,
                         unsigned Alignment) {
  return C.Allocate(Bytes, Alignment);
}

CallExpr *CallExpr::create(const ASTContext &ctx, Expr *fn,
                           ArrayRef<Expr *> args, SourceRange range) {
  return new (ctx) CallExpr(fn, ctx.AllocateCopy(args), range);
}

//===----------------------------------------------------------------------===//
// Path methods.
//===----------------------------------------------------------------------===//

Path Path::create(const ASTContext &ctx, ArrayRef<Identifier> segments,
                  bool global, SourceRange range) {
  return Path(ctx.AllocateCopy(segments), global, range);
}
