//===--- DataLayout.h - Target data layout strings --------------*- C++ -*-===//
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
//  This file defines TargetDataLayout, the sizes and alignments parsed out of
//  an LLVM data layout string, and the errors reported for malformed ones.
//
//===----------------------------------------------------------------------===//

#ifndef QUILL_TARGET_DATALAYOUT_H
#define QUILL_TARGET_DATALAYOUT_H

#include "quill/Basic/LLVM.h"
#include "quill/Basic/PrimitiveParsing.h"
#include "quill/Target/Align.h"
#include "quill/Target/TargetOptions.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace quill {

/// An integer type the target supports natively.
enum class IntegerSize : uint8_t {
  I8,
  I16,
  I32,
  I64,
  I128,
};

Size getIntegerSize(IntegerSize integer);

/// Find the integer type of exactly \p size.
llvm::Expected<IntegerSize> getIntegerOfSize(Size size);

/// An address space number in a data layout string, e.g. the 1 in "P1".
struct AddressSpace {
  uint32_t Value = 0;

  bool operator==(AddressSpace other) const { return Value == other.Value; }
};

struct TargetDataLayout {
  Endian TheEndian = Endian::Big;
  AbiAndPrefAlign I1Align;
  AbiAndPrefAlign I8Align;
  AbiAndPrefAlign I16Align;
  AbiAndPrefAlign I32Align;
  AbiAndPrefAlign I64Align;
  AbiAndPrefAlign I128Align;
  AbiAndPrefAlign F32Align;
  AbiAndPrefAlign F64Align;
  Size PointerSize;
  AbiAndPrefAlign PointerAlign;
  AbiAndPrefAlign AggregateAlign;

  /// Alignments for vector types, keyed by vector size.
  std::vector<std::pair<Size, AbiAndPrefAlign>> VectorAlign;

  AddressSpace InstructionAddressSpace;

  /// The minimum size of a C enum.
  IntegerSize CEnumMinSize = IntegerSize::I32;

  /// The layout assumed before any specification is applied.
  TargetDataLayout();

  /// Parse an LLVM data layout string such as
  /// "e-m:e-p270:32:32-i64:64-n8:16:32:64-S128".
  ///
  /// Specifications this layer has no use for are skipped.
  static llvm::Expected<TargetDataLayout> parse(StringRef layout);
};

struct InvalidAddressSpaceError {
  std::string AddrSpace;
  std::string Cause;
  ParseIntError Err;
};

struct InvalidBitsError {
  /// "size" or "alignment".
  std::string Kind;
  std::string Bit;
  std::string Cause;
  ParseIntError Err;
};

struct MissingAlignmentError {
  std::string Cause;
};

struct InvalidAlignmentError {
  std::string Cause;
  AlignFromBytesError Err;
};

/// The layout and the target disagree about byte order.
struct InconsistentTargetArchitectureError {
  std::string DL;
  std::string Target;
};

struct InconsistentTargetPointerWidthError {
  uint64_t PointerSize;
  uint32_t Target;
};

struct InvalidBitsSizeError {
  std::string Err;
};

/// Everything that can be wrong with a target's data layout.
using TargetDataLayoutErrors =
    std::variant<InvalidAddressSpaceError, InvalidBitsError,
                 MissingAlignmentError, InvalidAlignmentError,
                 InconsistentTargetArchitectureError,
                 InconsistentTargetPointerWidthError, InvalidBitsSizeError>;

/// Print an English description of \p err.
void printDataLayoutError(raw_ostream &OS, const TargetDataLayoutErrors &err);

/// The llvm::Error carrying a TargetDataLayoutErrors.
class DataLayoutError : public llvm::ErrorInfo<DataLayoutError> {
  TargetDataLayoutErrors Err;

public:
  static char ID;

  explicit DataLayoutError(TargetDataLayoutErrors err) : Err(std::move(err)) {}

  const TargetDataLayoutErrors &getError() const { return Err; }
  TargetDataLayoutErrors takeError() { return std::move(Err); }

  void log(raw_ostream &OS) const override;
  std::error_code convertToErrorCode() const override;
};

} // end namespace quill

#endif // QUILL_TARGET_DATALAYOUT_H
