//===--- SourceLoc.h - Source Locations and Ranges --------------*- C++ -*-===//
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
//  This file defines types used to reason about source locations and ranges.
//
//===----------------------------------------------------------------------===//

#ifndef QUILL_BASIC_SOURCELOC_H
#define QUILL_BASIC_SOURCELOC_H

#include "quill/Basic/LLVM.h"
#include "llvm/Support/SMLoc.h"
#include <cassert>

namespace quill {

/// SourceLoc in Quill is just an SMLoc.  We define it as a different type
/// (instead of as a typedef) so that locations coming from the compiler are
/// never confused with LLVM's own buffer locations.
class SourceLoc {
  friend class SourceRange;

  llvm::SMLoc Value;

public:
  SourceLoc() {}
  explicit SourceLoc(llvm::SMLoc Value) : Value(Value) {}

  static SourceLoc getFromPointer(const char *Pointer) {
    return SourceLoc(llvm::SMLoc::getFromPointer(Pointer));
  }

  bool isValid() const { return Value.isValid(); }
  bool isInvalid() const { return !isValid(); }

  /// An explicit bool operator so one can check if a SourceLoc is valid in an
  /// if statement:
  ///
  /// if (auto x = getSourceLoc()) { ... }
  explicit operator bool() const { return isValid(); }

  bool operator==(const SourceLoc &RHS) const { return RHS.Value == Value; }
  bool operator!=(const SourceLoc &RHS) const { return !operator==(RHS); }

  const char *getPointer() const { return Value.getPointer(); }

  /// Return a source location advanced a specified number of bytes.
  SourceLoc getAdvancedLoc(int ByteOffset) const {
    assert(isValid() && "Can't advance an invalid location");
    return SourceLoc(
        llvm::SMLoc::getFromPointer(Value.getPointer() + ByteOffset));
  }

  SourceLoc getAdvancedLocOrInvalid(int ByteOffset) const {
    if (isValid())
      return getAdvancedLoc(ByteOffset);
    return SourceLoc();
  }
};

/// SourceRange in Quill is a pair of locations.  However, note that the end
/// location is the start of the last token in the range, not the last
/// character in the range.
class SourceRange {
public:
  SourceLoc Start, End;

  SourceRange() {}
  SourceRange(SourceLoc Loc) : Start(Loc), End(Loc) {}
  SourceRange(SourceLoc Start, SourceLoc End) : Start(Start), End(End) {
    assert(Start.isValid() == End.isValid() &&
           "Start and end should either both be valid or both be invalid!");
  }

  bool isValid() const { return Start.isValid(); }
  bool isInvalid() const { return !isValid(); }

  /// An explicit bool operator so one can check if a SourceRange is valid in
  /// an if statement.
  explicit operator bool() const { return isValid(); }

  /// Returns true if the given location is within the range, inclusive of
  /// both end points.
  bool contains(SourceLoc Loc) const {
    return Start.getPointer() <= Loc.getPointer() &&
           Loc.getPointer() <= End.getPointer();
  }

  bool operator==(const SourceRange &other) const {
    return Start == other.Start && End == other.End;
  }
  bool operator!=(const SourceRange &other) const { return !operator==(other); }
};

} // end namespace quill

#endif // QUILL_BASIC_SOURCELOC_H
