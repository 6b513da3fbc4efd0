//===--- Token.h - Token interface ------------------------------*- C++ -*-===//
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
//  This file defines the Token interface.
//
//===----------------------------------------------------------------------===//

#ifndef QUILL_AST_TOKEN_H
#define QUILL_AST_TOKEN_H

#include "quill/Basic/DiagnosticArgTraits.h"
#include "quill/Basic/LLVM.h"
#include "quill/Basic/SourceLoc.h"
#include "llvm/ADT/StringRef.h"
#include <cstdint>

namespace quill {

enum class tok : uint8_t {
#define TOKEN(X) X,
#include "quill/AST/TokenKinds.def"

  NUM_TOKENS
};

/// The fixed spelling of a keyword or punctuator, or the description of any
/// other kind, e.g. "identifier".
StringRef getTokenKindText(tok kind);

bool isKeyword(tok kind);
bool isPunctuator(tok kind);

/// The keyword spelled \p text, or tok::identifier.
tok getKeywordKind(StringRef text);

/// A lexed token. The text is owned by the source buffer.
class Token {
  tok Kind;

  /// Whether an identifier was written with the "r#" prefix.
  bool RawIdentifier = false;

  /// The spelling, without the raw prefix.
  StringRef Text;

  SourceRange Range;

public:
  Token() : Kind(tok::eof) {}
  Token(tok kind, StringRef text, SourceRange range = SourceRange())
      : Kind(kind), Text(text), Range(range) {}

  /// An identifier written "r#text".
  static Token getRawIdentifier(StringRef text,
                                SourceRange range = SourceRange()) {
    Token result(tok::identifier, text, range);
    result.RawIdentifier = true;
    return result;
  }

  tok getKind() const { return Kind; }
  bool is(tok K) const { return Kind == K; }
  bool isNot(tok K) const { return Kind != K; }
  bool isKeyword() const { return quill::isKeyword(Kind); }

  bool isRawIdentifier() const { return RawIdentifier; }

  StringRef getText() const { return Text; }
  SourceRange getSourceRange() const { return Range; }

  /// Prints the token as it would be written in source.
  void print(raw_ostream &OS) const;
};

template <>
struct DiagnosticArgTraits<Token> {
  static DiagnosticArgValue intoDiagnosticArg(Token token);
};

template <>
struct DiagnosticArgTraits<tok> {
  static DiagnosticArgValue intoDiagnosticArg(tok kind);
};

} // end namespace quill

#endif // QUILL_AST_TOKEN_H
