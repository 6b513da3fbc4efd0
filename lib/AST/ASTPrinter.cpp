//===--- ASTPrinter.cpp - Printing syntax fragments as source -------------===//
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
//  This file implements printing of expressions, paths, tokens and
//  visibilities back to source form.
//
//===----------------------------------------------------------------------===//

#include "quill/AST/ASTPrinter.h"
#include "quill/AST/Expr.h"
#include "quill/AST/Path.h"
#include "quill/AST/Visibility.h"
#include "quill/Basic/QuotedString.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

using namespace quill;

void ASTPrinter::printExprWithPrecedence(const Expr *E,
                                         unsigned MinPrecedence) {
  bool NeedsParens = E && E->getPrecedence() < MinPrecedence;
  if (NeedsParens)
    OS << '(';
  printExpr(E);
  if (NeedsParens)
    OS << ')';
}

void ASTPrinter::printExpr(const Expr *E) {
  if (!E) {
    OS << "<null>";
    return;
  }

  switch (E->getKind()) {
  case ExprKind::IntegerLiteral:
    OS << cast<IntegerLiteralExpr>(E)->getDigits();
    return;
  case ExprKind::StringLiteral:
    printAsQuotedString(OS, cast<StringLiteralExpr>(E)->getValue());
    return;
  case ExprKind::BooleanLiteral:
    OS << llvm::toStringRef(cast<BooleanLiteralExpr>(E)->getValue());
    return;
  case ExprKind::Path:
    printPath(cast<PathExpr>(E)->getPath());
    return;
  case ExprKind::Unary: {
    auto *UE = cast<UnaryExpr>(E);
    OS << getUnaryOperatorSpelling(UE->getOperator());
    printExprWithPrecedence(UE->getOperand(), E->getPrecedence());
    return;
  }
  case ExprKind::Binary: {
    auto *BE = cast<BinaryExpr>(E);
    unsigned Prec = E->getPrecedence();
    // Binary operators associate to the left, except comparisons which do
    // not associate at all.
    unsigned LeftPrec =
        isComparisonOperator(BE->getOperator()) ? Prec + 1 : Prec;
    printExprWithPrecedence(BE->getLHS(), LeftPrec);
    OS << ' ' << getBinaryOperatorSpelling(BE->getOperator()) << ' ';
    printExprWithPrecedence(BE->getRHS(), Prec + 1);
    return;
  }
  case ExprKind::Call: {
    auto *CE = cast<CallExpr>(E);
    printExprWithPrecedence(CE->getFn(), E->getPrecedence());
    OS << '(';
    llvm::interleave(
        CE->getArgs(), [&](const Expr *Arg) { printExpr(Arg); },
        [&] { OS << ", "; });
    OS << ')';
    return;
  }
  case ExprKind::Paren:
    OS << '(';
    printExpr(cast<ParenExpr>(E)->getSubExpr());
    OS << ')';
    return;
  case ExprKind::Field: {
    auto *FE = cast<FieldExpr>(E);
    printExprWithPrecedence(FE->getBase(), E->getPrecedence());
    OS << '.';
    printIdentifier(OS, FE->getName(), FE->getName().isRawGuess());
    return;
  }
  }
  llvm_unreachable("bad ExprKind");
}

void ASTPrinter::printPath(const Path &P) {
  if (P.isGlobal())
    OS << "::";
  llvm::interleave(
      P.getSegments(),
      [&](Identifier Segment) {
        printIdentifier(OS, Segment, Segment.isRawGuess());
      },
      [&] { OS << "::"; });
}

void ASTPrinter::printToken(const Token &T) {
  switch (T.getKind()) {
  case tok::identifier:
    OS << (T.isRawIdentifier() ? "r#" : "") << T.getText();
    return;
  case tok::lifetime:
  case tok::integer_literal:
  case tok::float_literal:
  case tok::string_literal:
  case tok::char_literal:
    OS << T.getText();
    return;
  default:
    printTokenKind(T.getKind());
    return;
  }
}

void ASTPrinter::printTokenKind(tok K) {
  OS << getTokenKindText(K);
}

void ASTPrinter::printVisibility(const Visibility &V) {
  switch (V.getKind()) {
  case Visibility::Kind::Public:
    OS << "pub ";
    return;
  case Visibility::Kind::Restricted: {
    const Path &P = V.getRestrictedPath();
    if (V.isShorthand() && (P.is("crate") || P.is("self") || P.is("super"))) {
      OS << "pub(";
      printPath(P);
      OS << ") ";
      return;
    }
    OS << "pub(in ";
    printPath(P);
    OS << ") ";
    return;
  }
  case Visibility::Kind::Inherited:
    return;
  }
  llvm_unreachable("Unhandled Visibility::Kind in switch.");
}

template <typename Fn>
static std::string printToString(Fn Print) {
  std::string Result;
  llvm::raw_string_ostream OS(Result);
  ASTPrinter Printer(OS);
  Print(Printer);
  OS.flush();
  return Result;
}

std::string quill::exprToString(const Expr *E) {
  return printToString([&](ASTPrinter &P) { P.printExpr(E); });
}

std::string quill::pathToString(const Path &Pa) {
  return printToString([&](ASTPrinter &P) { P.printPath(Pa); });
}

std::string quill::tokenToString(const Token &T) {
  return printToString([&](ASTPrinter &P) { P.printToken(T); });
}

std::string quill::tokenKindToString(tok K) {
  return printToString([&](ASTPrinter &P) { P.printTokenKind(K); });
}

std::string quill::visibilityToString(const Visibility &V) {
  return printToString([&](ASTPrinter &P) { P.printVisibility(V); });
}

void Expr::print(raw_ostream &OS) const { ASTPrinter(OS).printExpr(this); }

void Path::print(raw_ostream &OS) const { ASTPrinter(OS).printPath(*this); }

void Visibility::print(raw_ostream &OS) const {
  ASTPrinter(OS).printVisibility(*this);
}

DiagnosticArgValue quill::getExprDiagnosticArg(const Expr *E) {
  return DiagnosticArgValue::getString(toStringLossy(exprToString(E)));
}

DiagnosticArgValue DiagnosticArgTraits<Path>::intoDiagnosticArg(Path path) {
  return DiagnosticArgValue::getString(toStringLossy(pathToString(path)));
}

DiagnosticArgValue
DiagnosticArgTraits<Visibility>::intoDiagnosticArg(Visibility vis) {
  return DiagnosticArgValue::getString(
      StringRef(visibilityToString(vis)).rtrim().str());
}
