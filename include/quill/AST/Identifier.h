//===--- Identifier.h - Uniqued Identifier ----------------------*- C++ -*-===//
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

#ifndef QUILL_AST_IDENTIFIER_H
#define QUILL_AST_IDENTIFIER_H

#include "quill/Basic/DiagnosticArgTraits.h"
#include "quill/Basic/LLVM.h"
#include "quill/Basic/SourceLoc.h"
#include "llvm/ADT/StringRef.h"
#include <string>

namespace quill {

class ASTContext;

/// A name uniqued in the ASTContext. Two identifiers with the same spelling
/// compare equal by pointer.
class Identifier {
  friend class ASTContext;

  const char *Pointer = nullptr;

  explicit Identifier(const char *Ptr) : Pointer(Ptr) {}

public:
  Identifier() = default;

  const char *get() const { return Pointer; }

  StringRef str() const { return Pointer ? StringRef(Pointer) : StringRef(); }

  bool empty() const { return Pointer == nullptr || *Pointer == 0; }

  bool is(StringRef string) const { return str() == string; }

  /// Whether this name is spelled like a keyword.
  bool isReservedKeyword() const;

  /// Whether this name, used as an identifier, must be written with the raw
  /// prefix "r#". Path segment keywords such as \c self cannot be raw.
  bool isRawGuess() const;

  /// The spelling of this name as an identifier, e.g. "r#match".
  std::string toIdentString() const;

  bool operator==(Identifier RHS) const { return Pointer == RHS.Pointer; }
  bool operator!=(Identifier RHS) const { return !(*this == RHS); }

  bool operator<(Identifier RHS) const { return Pointer < RHS.Pointer; }

  friend raw_ostream &operator<<(raw_ostream &OS, Identifier I);
};

raw_ostream &operator<<(raw_ostream &OS, Identifier I);

template <>
struct DiagnosticArgTraits<Identifier> {
  static DiagnosticArgValue intoDiagnosticArg(Identifier name) {
    return DiagnosticArgValue::getString(name.toIdentString());
  }
};

/// Print \p name as an identifier, with the raw prefix if \p isRaw.
void printIdentifier(raw_ostream &OS, Identifier name, bool isRaw);

/// An identifier together with where it was written.
class Ident {
  Identifier Name;
  SourceRange Range;

public:
  Ident() = default;
  explicit Ident(Identifier name, SourceRange range = SourceRange())
      : Name(name), Range(range) {}

  Identifier getName() const { return Name; }
  SourceRange getSourceRange() const { return Range; }

  bool operator==(const Ident &other) const { return Name == other.Name; }

  /// Prints "r#" before a name that is spelled like a keyword.
  friend raw_ostream &operator<<(raw_ostream &OS, const Ident &I) {
    printIdentifier(OS, I.Name, I.Name.isRawGuess());
    return OS;
  }
};

} // end namespace quill

#endif // QUILL_AST_IDENTIFIER_H
