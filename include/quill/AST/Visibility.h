//===--- Visibility.h - pub, pub(crate) and friends -------------*- C++ -*-===//
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

#ifndef QUILL_AST_VISIBILITY_H
#define QUILL_AST_VISIBILITY_H

#include "quill/AST/Path.h"
#include "quill/Basic/DiagnosticArgTraits.h"
#include "quill/Basic/SourceLoc.h"
#include <cstdint>

namespace quill {

/// The visibility written before an item.
class Visibility {
public:
  enum class Kind : uint8_t {
    /// \c pub
    Public,
    /// \c pub(in path), or \c pub(crate) and friends when Shorthand.
    Restricted,
    /// No visibility was written.
    Inherited,
  };

private:
  Kind TheKind;
  Path RestrictedTo;
  bool Shorthand = false;
  SourceRange Range;

  Visibility(Kind kind, Path path, bool shorthand, SourceRange range)
      : TheKind(kind), RestrictedTo(path), Shorthand(shorthand),
        Range(range) {}

public:
  static Visibility getPublic(SourceRange range = SourceRange()) {
    return Visibility(Kind::Public, Path(), false, range);
  }

  static Visibility getInherited() {
    return Visibility(Kind::Inherited, Path(), false, SourceRange());
  }

  /// \param shorthand Whether it was written without "in", as in
  /// \c pub(crate).
  static Visibility getRestricted(Path path, bool shorthand,
                                  SourceRange range = SourceRange()) {
    return Visibility(Kind::Restricted, path, shorthand, range);
  }

  Kind getKind() const { return TheKind; }
  const Path &getRestrictedPath() const { return RestrictedTo; }
  bool isShorthand() const { return Shorthand; }
  SourceRange getSourceRange() const { return Range; }

  /// Prints the visibility followed by a space, or nothing if inherited.
  void print(raw_ostream &OS) const;
};

/// Binds the printed visibility without its trailing space.
template <>
struct DiagnosticArgTraits<Visibility> {
  static DiagnosticArgValue intoDiagnosticArg(Visibility vis);
};

} // end namespace quill

#endif // QUILL_AST_VISIBILITY_H
