//===--- Expr.h - Quill Language Expression ASTs ----------------*- C++ -*-===//
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
// This file defines the Expr class and subclasses.
//
//===----------------------------------------------------------------------===//

#ifndef QUILL_AST_EXPR_H
#define QUILL_AST_EXPR_H

#include "quill/AST/Identifier.h"
#include "quill/AST/Path.h"
#include "quill/Basic/Assertions.h"
#include "quill/Basic/DiagnosticArgTraits.h"
#include "quill/Basic/LLVM.h"
#include "quill/Basic/SourceLoc.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Compiler.h"
#include <cstdint>
#include <type_traits>

namespace quill {

class ASTContext;

enum class ExprKind : uint8_t {
#define EXPR(Id, Parent) Id,
#define LAST_EXPR(Id) Last_Expr = Id,
#include "quill/AST/ExprNodes.def"
};

enum class UnaryOperator : uint8_t {
  /// \c *e
  Deref,
  /// \c !e
  Not,
  /// \c -e
  Neg,
};

StringRef getUnaryOperatorSpelling(UnaryOperator op);

enum class BinaryOperator : uint8_t {
  Add,
  Sub,
  Mul,
  Div,
  Rem,
  And,
  Or,
  BitXor,
  BitAnd,
  BitOr,
  Shl,
  Shr,
  Eq,
  Lt,
  Le,
  Ne,
  Ge,
  Gt,
};

StringRef getBinaryOperatorSpelling(BinaryOperator op);

/// Higher binds tighter. \c || is the loosest at 5.
unsigned getBinaryOperatorPrecedence(BinaryOperator op);

/// Comparisons do not chain: \c a == b == c is not an expression.
bool isComparisonOperator(BinaryOperator op);

/// Expr - Base class for all expressions.
class alignas(8) Expr {
  Expr(const Expr &) = delete;
  void operator=(const Expr &) = delete;

  ExprKind Kind;
  SourceRange Range;

protected:
  Expr(ExprKind kind, SourceRange range) : Kind(kind), Range(range) {}

public:
  ExprKind getKind() const { return Kind; }

  /// Retrieve the name of the given expression kind.
  static StringRef getKindName(ExprKind K);

  SourceRange getSourceRange() const { return Range; }
  SourceLoc getStartLoc() const { return Range.Start; }
  SourceLoc getEndLoc() const { return Range.End; }

  /// How tightly this expression binds, on the scale of
  /// getBinaryOperatorPrecedence.
  unsigned getPrecedence() const;

  /// Prints the expression as source code.
  void print(raw_ostream &OS) const;
  LLVM_DUMP_METHOD void dump() const;

  // Only allow allocation of Exprs using the allocator in ASTContext
  // or by doing a placement new.
  void *operator new(size_t Bytes, const ASTContext &C,
                     unsigned Alignment = alignof(Expr));

  void *operator new(size_t Bytes) throw() = delete;
  void operator delete(void *Data) throw() = delete;

  void *operator new(size_t Bytes, void *Mem) {
    ASSERT(Mem);
    return Mem;
  }
};

/// An integer literal, kept as written, e.g. "0xFF_u8".
class IntegerLiteralExpr : public Expr {
  StringRef Digits;

public:
  IntegerLiteralExpr(StringRef digits, SourceRange range = SourceRange())
      : Expr(ExprKind::IntegerLiteral, range), Digits(digits) {}

  StringRef getDigits() const { return Digits; }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::IntegerLiteral;
  }
};

/// A string literal. The value is unescaped; the printer quotes it again.
class StringLiteralExpr : public Expr {
  StringRef Value;

public:
  StringLiteralExpr(StringRef value, SourceRange range = SourceRange())
      : Expr(ExprKind::StringLiteral, range), Value(value) {}

  StringRef getValue() const { return Value; }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::StringLiteral;
  }
};

class BooleanLiteralExpr : public Expr {
  bool Value;

public:
  BooleanLiteralExpr(bool value, SourceRange range = SourceRange())
      : Expr(ExprKind::BooleanLiteral, range), Value(value) {}

  bool getValue() const { return Value; }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::BooleanLiteral;
  }
};

/// A reference to an item by path, e.g. \c std::mem::swap.
class PathExpr : public Expr {
  Path ThePath;

public:
  explicit PathExpr(Path path)
      : Expr(ExprKind::Path, path.getSourceRange()), ThePath(path) {}

  const Path &getPath() const { return ThePath; }

  static bool classof(const Expr *E) { return E->getKind() == ExprKind::Path; }
};

class UnaryExpr : public Expr {
  UnaryOperator Op;
  Expr *Operand;

public:
  UnaryExpr(UnaryOperator op, Expr *operand,
            SourceRange range = SourceRange())
      : Expr(ExprKind::Unary, range), Op(op), Operand(operand) {}

  UnaryOperator getOperator() const { return Op; }
  Expr *getOperand() const { return Operand; }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::Unary;
  }
};

class BinaryExpr : public Expr {
  BinaryOperator Op;
  Expr *LHS;
  Expr *RHS;

public:
  BinaryExpr(BinaryOperator op, Expr *lhs, Expr *rhs,
             SourceRange range = SourceRange())
      : Expr(ExprKind::Binary, range), Op(op), LHS(lhs), RHS(rhs) {}

  BinaryOperator getOperator() const { return Op; }
  Expr *getLHS() const { return LHS; }
  Expr *getRHS() const { return RHS; }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::Binary;
  }
};

/// A function call, e.g. \c f(a, b).
class CallExpr : public Expr {
  Expr *Fn;
  ArrayRef<Expr *> Args;

  CallExpr(Expr *fn, ArrayRef<Expr *> args, SourceRange range)
      : Expr(ExprKind::Call, range), Fn(fn), Args(args) {}

public:
  /// Copies \p args into \p ctx.
  static CallExpr *create(const ASTContext &ctx, Expr *fn,
                          ArrayRef<Expr *> args,
                          SourceRange range = SourceRange());

  Expr *getFn() const { return Fn; }
  ArrayRef<Expr *> getArgs() const { return Args; }

  static bool classof(const Expr *E) { return E->getKind() == ExprKind::Call; }
};

class ParenExpr : public Expr {
  Expr *SubExpr;

public:
  ParenExpr(Expr *subExpr, SourceRange range = SourceRange())
      : Expr(ExprKind::Paren, range), SubExpr(subExpr) {}

  Expr *getSubExpr() const { return SubExpr; }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::Paren;
  }
};

/// A field access, e.g. \c self.len.
class FieldExpr : public Expr {
  Expr *Base;
  Identifier Name;

public:
  FieldExpr(Expr *base, Identifier name, SourceRange range = SourceRange())
      : Expr(ExprKind::Field, range), Base(base), Name(name) {}

  Expr *getBase() const { return Base; }
  Identifier getName() const { return Name; }

  static bool classof(const Expr *E) {
    return E->getKind() == ExprKind::Field;
  }
};

/// The source text of \p E, or "<null>".
DiagnosticArgValue getExprDiagnosticArg(const Expr *E);

/// Binds the source text of any expression node.
template <typename T>
struct DiagnosticArgTraits<
    T *, std::enable_if_t<std::is_base_of<Expr, T>::value>> {
  static DiagnosticArgValue intoDiagnosticArg(T *E) {
    return getExprDiagnosticArg(E);
  }
};

} // end namespace quill

#endif // QUILL_AST_EXPR_H
