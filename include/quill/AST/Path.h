//===--- Path.h - Paths such as std::vec::Vec -------------------*- C++ -*-===//
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

#ifndef QUILL_AST_PATH_H
#define QUILL_AST_PATH_H

#include "quill/AST/Identifier.h"
#include "quill/Basic/DiagnosticArgTraits.h"
#include "quill/Basic/SourceLoc.h"
#include "llvm/ADT/ArrayRef.h"

namespace quill {

class ASTContext;

/// A path made of "::"-separated segments.
///
/// The segments are not owned. Use create() to copy them into an ASTContext.
class Path {
  ArrayRef<Identifier> Segments;

  /// Whether the path starts with "::".
  bool Global = false;

  SourceRange Range;

public:
  Path() = default;
  explicit Path(ArrayRef<Identifier> segments, bool global = false,
                SourceRange range = SourceRange())
      : Segments(segments), Global(global), Range(range) {}

  static Path create(const ASTContext &ctx, ArrayRef<Identifier> segments,
                     bool global = false, SourceRange range = SourceRange());

  ArrayRef<Identifier> getSegments() const { return Segments; }
  bool isGlobal() const { return Global; }
  SourceRange getSourceRange() const { return Range; }

  /// Whether this is the single segment \p name.
  bool is(StringRef name) const {
    return !Global && Segments.size() == 1 && Segments[0].is(name);
  }

  void print(raw_ostream &OS) const;
};

template <>
struct DiagnosticArgTraits<Path> {
  static DiagnosticArgValue intoDiagnosticArg(Path path);
};

} // end namespace quill

#endif // QUILL_AST_PATH_H
