//===--- TargetOptions.h - Code generation toggles --------------*- C++ -*-===//
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
//  This file defines the small enumerations that describe how code for a
//  target is generated, and the TargetTriple naming that target.
//
//===----------------------------------------------------------------------===//

#ifndef QUILL_TARGET_TARGETOPTIONS_H
#define QUILL_TARGET_TARGETOPTIONS_H

#include "quill/Basic/DiagnosticArgTraits.h"
#include "quill/Basic/LLVM.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Triple.h"
#include <cstdint>
#include <optional>

namespace quill {

enum class Endian : uint8_t {
  Little,
  Big,
};

/// "little" or "big".
StringRef getEndianName(Endian endian);

raw_ostream &operator<<(raw_ostream &OS, Endian endian);

/// What happens when a program panics.
enum class PanicStrategy : uint8_t {
  Unwind,
  Abort,
};

/// The spelling accepted by -C panic=..., e.g. "unwind".
StringRef getPanicStrategyDesc(PanicStrategy strategy);

std::optional<PanicStrategy> parsePanicStrategy(StringRef text);

template <>
struct DiagnosticArgTraits<PanicStrategy> {
  static DiagnosticArgValue intoDiagnosticArg(PanicStrategy strategy) {
    return DiagnosticArgValue::getString(
        getPanicStrategyDesc(strategy).str());
  }
};

/// Where debug information ends up relative to the object files.
enum class SplitDebuginfo : uint8_t {
  /// Debug information stays in the object files and is linked normally.
  Off,
  /// Debug information is collected into one separate package.
  Packed,
  /// Debug information stays in separate per-object files.
  Unpacked,
};

std::optional<SplitDebuginfo> parseSplitDebuginfo(StringRef text);

raw_ostream &operator<<(raw_ostream &OS, SplitDebuginfo kind);

enum class StackProtector : uint8_t {
  None,
  /// Protect functions with character arrays or alloca calls.
  Basic,
  /// Protect functions with any array or address-taken local.
  Strong,
  All,
};

std::optional<StackProtector> parseStackProtector(StringRef text);

raw_ostream &operator<<(raw_ostream &OS, StackProtector kind);

/// The target a crate is compiled for, e.g. "x86_64-unknown-linux-gnu".
class TargetTriple {
  llvm::Triple Triple;

public:
  explicit TargetTriple(const Twine &text) : Triple(text) {}
  explicit TargetTriple(llvm::Triple triple) : Triple(std::move(triple)) {}

  const llvm::Triple &getTriple() const { return Triple; }
  StringRef str() const { return Triple.str(); }

  /// The byte order of the target architecture.
  Endian getEndian() const {
    return Triple.isLittleEndian() ? Endian::Little : Endian::Big;
  }

  /// The width of a pointer in bits, or 0 for an unknown architecture.
  uint32_t getPointerWidth() const;

  friend raw_ostream &operator<<(raw_ostream &OS, const TargetTriple &T) {
    return OS << T.str();
  }
};

} // end namespace quill

#endif // QUILL_TARGET_TARGETOPTIONS_H
