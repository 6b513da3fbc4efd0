//===--- Token.cpp - Token implementation ---------------------------------===//
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

#include "quill/AST/Token.h"
#include "quill/AST/ASTPrinter.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

using namespace quill;

StringRef quill::getTokenKindText(tok kind) {
  switch (kind) {
#define KEYWORD(KW) case tok::kw_##KW: return #KW;
#define PUNCTUATOR(PUN, TEXT) case tok::PUN: return TEXT;
#define MISC(NAME, DESC) case tok::NAME: return DESC;
#include "quill/AST/TokenKinds.def"
  case tok::NUM_TOKENS:
    break;
  }
  llvm_unreachable("Unhandled tok in switch.");
}

bool quill::isKeyword(tok kind) {
  switch (kind) {
#define KEYWORD(KW) case tok::kw_##KW: return true;
#define TOKEN(NAME) case tok::NAME: return false;
#include "quill/AST/TokenKinds.def"
  case tok::NUM_TOKENS:
    break;
  }
  llvm_unreachable("Unhandled tok in switch.");
}

bool quill::isPunctuator(tok kind) {
  switch (kind) {
#define PUNCTUATOR(PUN, TEXT) case tok::PUN: return true;
#define TOKEN(NAME) case tok::NAME: return false;
#include "quill/AST/TokenKinds.def"
  case tok::NUM_TOKENS:
    break;
  }
  llvm_unreachable("Unhandled tok in switch.");
}

tok quill::getKeywordKind(StringRef text) {
  return llvm::StringSwitch<tok>(text)
#define KEYWORD(KW) .Case(#KW, tok::kw_##KW)
#include "quill/AST/TokenKinds.def"
      .Default(tok::identifier);
}

void Token::print(raw_ostream &OS) const {
  ASTPrinter(OS).printToken(*this);
}

DiagnosticArgValue DiagnosticArgTraits<Token>::intoDiagnosticArg(Token token) {
  return DiagnosticArgValue::getString(tokenToString(token));
}

DiagnosticArgValue DiagnosticArgTraits<tok>::intoDiagnosticArg(tok kind) {
  return DiagnosticArgValue::getString(tokenKindToString(kind));
}
