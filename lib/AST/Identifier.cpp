//===--- Identifier.cpp - Uniqued Identifier ------------------------------===//
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
// This file implements the Identifier interface.
//
//===----------------------------------------------------------------------===//

#include "quill/AST/Identifier.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/raw_ostream.h"

using namespace quill;

raw_ostream &quill::operator<<(raw_ostream &OS, Identifier I) {
  if (I.get() == nullptr)
    return OS << "_";
  return OS << I.get();
}

bool Identifier::isReservedKeyword() const {
  return llvm::StringSwitch<bool>(str())
#define KEYWORD(KW) .Case(#KW, true)
#include "quill/AST/TokenKinds.def"
      .Default(false);
}

bool Identifier::isRawGuess() const {
  if (empty() || is("_"))
    return false;
  // Path segment keywords have no raw form.
  if (is("self") || is("Self") || is("super") || is("crate"))
    return false;
  return isReservedKeyword();
}

std::string Identifier::toIdentString() const {
  std::string result;
  llvm::raw_string_ostream OS(result);
  printIdentifier(OS, *this, isRawGuess());
  return std::move(OS.str());
}

void quill::printIdentifier(raw_ostream &OS, Identifier name, bool isRaw) {
  if (isRaw)
    OS << "r#";
  OS << name.str();
}
