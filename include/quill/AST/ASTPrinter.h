//===--- ASTPrinter.h - Printing syntax fragments as source -----*- C++ -*-===//
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

#ifndef QUILL_AST_ASTPRINTER_H
#define QUILL_AST_ASTPRINTER_H

#include "quill/AST/Token.h"
#include "quill/Basic/LLVM.h"
#include <string>

namespace quill {

class Expr;
class Path;
class Visibility;

/// Prints syntax fragments the way they would be written in source, for use
/// in diagnostic messages.
class ASTPrinter {
  raw_ostream &OS;

  void printExprWithPrecedence(const Expr *E, unsigned MinPrecedence);

public:
  explicit ASTPrinter(raw_ostream &OS) : OS(OS) {}

  /// Parenthesizes subexpressions only where precedence requires it.
  void printExpr(const Expr *E);
  void printPath(const Path &P);
  void printToken(const Token &T);
  void printTokenKind(tok K);
  void printVisibility(const Visibility &V);
};

std::string exprToString(const Expr *E);
std::string pathToString(const Path &P);
std::string tokenToString(const Token &T);
std::string tokenKindToString(tok K);

/// Ends in a space unless the visibility is inherited.
std::string visibilityToString(const Visibility &V);

} // end namespace quill

#endif // QUILL_AST_ASTPRINTER_H
