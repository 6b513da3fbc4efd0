//===--- Align.h - Sizes and alignments of target types ---------*- C++ -*-===//
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

#ifndef QUILL_TARGET_ALIGN_H
#define QUILL_TARGET_ALIGN_H

#include "quill/Basic/Assertions.h"
#include "quill/Basic/LLVM.h"
#include "llvm/ADT/StringRef.h"
#include <cstdint>
#include <optional>

namespace quill {

/// A size in bytes.
class Size {
  uint64_t Bytes = 0;

  explicit Size(uint64_t bytes) : Bytes(bytes) {}

public:
  Size() = default;

  /// The largest byte count whose bit count still fits in 64 bits.
  static constexpr uint64_t MaxBytes = UINT64_MAX / 8;

  static Size fromBytes(uint64_t bytes) {
    ASSERT(bytes <= MaxBytes && "size in bits overflows");
    return Size(bytes);
  }

  /// The byte count \p bits rounds up to.
  static uint64_t bitsToBytes(uint64_t bits) {
    return bits / 8 + ((bits % 8) + 7) / 8;
  }

  /// Whether fromBits(\p bits) is representable.
  static bool isRepresentableBits(uint64_t bits) {
    return bitsToBytes(bits) <= MaxBytes;
  }

  /// Rounds up to a whole number of bytes.
  static Size fromBits(uint64_t bits) { return fromBytes(bitsToBytes(bits)); }

  uint64_t getBytes() const { return Bytes; }
  uint64_t getBits() const { return Bytes * 8; }

  bool operator==(Size other) const { return Bytes == other.Bytes; }
  bool operator!=(Size other) const { return Bytes != other.Bytes; }
};

/// Why a byte count is not a valid alignment.
class AlignFromBytesError {
public:
  enum class Kind : uint8_t {
    NotPowerOfTwo,
    TooLarge,
  };

private:
  Kind TheKind;
  uint64_t Bytes;

public:
  AlignFromBytesError(Kind kind, uint64_t bytes)
      : TheKind(kind), Bytes(bytes) {}

  Kind getKind() const { return TheKind; }

  /// The rejected alignment in bytes.
  uint64_t getAlign() const { return Bytes; }

  /// "not_power_of_two" or "too_large", selecting the message variant.
  StringRef getDiagIdent() const;

  bool operator==(const AlignFromBytesError &other) const {
    return TheKind == other.TheKind && Bytes == other.Bytes;
  }

  friend raw_ostream &operator<<(raw_ostream &OS,
                                 const AlignFromBytesError &E);
};

raw_ostream &operator<<(raw_ostream &OS, const AlignFromBytesError &E);

/// A power-of-two alignment in bytes.
class Align {
  uint8_t Pow2 = 0;

  explicit Align(uint8_t pow2) : Pow2(pow2) {}

public:
  /// The largest supported alignment is 2^29 bytes.
  static constexpr unsigned MaxPow2 = 29;

  Align() = default;

  static Align one() { return Align(0); }

  /// Zero bytes is treated as an alignment of one.
  ///
  /// \returns the error on failure, leaving \p result untouched.
  static std::optional<AlignFromBytesError> fromBytes(uint64_t bytes,
                                                      Align &result);

  static std::optional<AlignFromBytesError> fromBits(uint64_t bits,
                                                     Align &result) {
    return fromBytes(Size::bitsToBytes(bits), result);
  }

  uint64_t getBytes() const { return uint64_t(1) << Pow2; }
  uint64_t getBits() const { return getBytes() * 8; }

  bool operator==(Align other) const { return Pow2 == other.Pow2; }
  bool operator!=(Align other) const { return Pow2 != other.Pow2; }
};

/// The ABI-mandated and preferred alignment of a type.
struct AbiAndPrefAlign {
  Align Abi;
  Align Pref;

  static AbiAndPrefAlign get(Align align) { return {align, align}; }

  bool operator==(const AbiAndPrefAlign &other) const {
    return Abi == other.Abi && Pref == other.Pref;
  }
};

} // end namespace quill

#endif // QUILL_TARGET_ALIGN_H
