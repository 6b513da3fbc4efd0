//===--- Align.cpp - Sizes and alignments of target types -----------------===//
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

#include "quill/Target/Align.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/MathExtras.h"
#include "llvm/Support/raw_ostream.h"

using namespace quill;

StringRef AlignFromBytesError::getDiagIdent() const {
  switch (TheKind) {
  case Kind::NotPowerOfTwo:
    return "not_power_of_two";
  case Kind::TooLarge:
    return "too_large";
  }
  llvm_unreachable("Unhandled AlignFromBytesError::Kind in switch.");
}

raw_ostream &quill::operator<<(raw_ostream &OS, const AlignFromBytesError &E) {
  switch (E.TheKind) {
  case AlignFromBytesError::Kind::NotPowerOfTwo:
    return OS << '`' << E.Bytes << "` is not a power of 2";
  case AlignFromBytesError::Kind::TooLarge:
    return OS << '`' << E.Bytes << "` is too large";
  }
  llvm_unreachable("Unhandled AlignFromBytesError::Kind in switch.");
}

std::optional<AlignFromBytesError> Align::fromBytes(uint64_t bytes,
                                                    Align &result) {
  if (bytes == 0) {
    result = one();
    return std::nullopt;
  }

  if (!llvm::isPowerOf2_64(bytes))
    return AlignFromBytesError(AlignFromBytesError::Kind::NotPowerOfTwo, bytes);

  unsigned pow2 = llvm::Log2_64(bytes);
  if (pow2 > MaxPow2)
    return AlignFromBytesError(AlignFromBytesError::Kind::TooLarge, bytes);

  result = Align(pow2);
  return std::nullopt;
}
