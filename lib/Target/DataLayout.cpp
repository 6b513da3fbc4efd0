//===--- DataLayout.cpp - Target data layout strings ----------------------===//
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

#define DEBUG_TYPE "quill-target"
#include "quill/Target/DataLayout.h"
#include "quill/Basic/Assertions.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"
#include <cinttypes>

using namespace quill;

char DataLayoutError::ID = 0;

Size quill::getIntegerSize(IntegerSize integer) {
  switch (integer) {
  case IntegerSize::I8:
    return Size::fromBits(8);
  case IntegerSize::I16:
    return Size::fromBits(16);
  case IntegerSize::I32:
    return Size::fromBits(32);
  case IntegerSize::I64:
    return Size::fromBits(64);
  case IntegerSize::I128:
    return Size::fromBits(128);
  }
  llvm_unreachable("Unhandled IntegerSize in switch.");
}

llvm::Expected<IntegerSize> quill::getIntegerOfSize(Size size) {
  switch (size.getBits()) {
  case 8:
    return IntegerSize::I8;
  case 16:
    return IntegerSize::I16;
  case 32:
    return IntegerSize::I32;
  case 64:
    return IntegerSize::I64;
  case 128:
    return IntegerSize::I128;
  default:
    return llvm::createStringError(
        llvm::inconvertibleErrorCode(),
        "quill does not support integers with %" PRIu64 " bits",
        size.getBits());
  }
}

/// Both alignments of \p bits, which must be valid.
static AbiAndPrefAlign alignOfBits(uint64_t abiBits, uint64_t prefBits) {
  Align abi, pref;
  if (Align::fromBits(abiBits, abi) || Align::fromBits(prefBits, pref))
    ABORT("default alignment must be valid");
  return {abi, pref};
}

static AbiAndPrefAlign alignOfBits(uint64_t bits) {
  return alignOfBits(bits, bits);
}

TargetDataLayout::TargetDataLayout()
    : I1Align(alignOfBits(8)), I8Align(alignOfBits(8)),
      I16Align(alignOfBits(16)), I32Align(alignOfBits(32)),
      I64Align(alignOfBits(32, 64)), I128Align(alignOfBits(32, 64)),
      F32Align(alignOfBits(32)), F64Align(alignOfBits(64)),
      PointerSize(Size::fromBits(64)), PointerAlign(alignOfBits(64)),
      AggregateAlign(alignOfBits(0, 64)),
      VectorAlign{{Size::fromBits(64), alignOfBits(64)},
                  {Size::fromBits(128), alignOfBits(128)}} {}

using LayoutErrorOr = std::optional<TargetDataLayoutErrors>;

static LayoutErrorOr parseAddressSpace(StringRef text, StringRef cause,
                                       AddressSpace &result) {
  uint64_t value;
  if (auto err = parseUnsignedInteger(text, 32, value))
    return InvalidAddressSpaceError{text.str(), cause.str(), *err};
  result.Value = static_cast<uint32_t>(value);
  return std::nullopt;
}

static LayoutErrorOr parseBits(StringRef text, StringRef kind, StringRef cause,
                               uint64_t &result) {
  if (auto err = parseUnsignedInteger(text, 64, result))
    return InvalidBitsError{kind.str(), text.str(), cause.str(), *err};
  return std::nullopt;
}

static LayoutErrorOr parseSize(StringRef text, StringRef cause,
                               Size &result) {
  uint64_t bits;
  if (auto err = parseBits(text, "size", cause, bits))
    return err;
  if (!Size::isRepresentableBits(bits))
    return InvalidBitsError{"size", text.str(), cause.str(),
                            ParseIntError(IntErrorKind::PosOverflow)};
  result = Size::fromBits(bits);
  return std::nullopt;
}

/// Parse the "abi[:pref]" alignments following a specification.
static LayoutErrorOr parseAlign(ArrayRef<StringRef> fields, StringRef cause,
                                AbiAndPrefAlign &result) {
  if (fields.empty())
    return MissingAlignmentError{cause.str()};

  uint64_t abiBits;
  if (auto err = parseBits(fields[0], "alignment", cause, abiBits))
    return err;
  uint64_t prefBits = abiBits;
  if (fields.size() > 1)
    if (auto err = parseBits(fields[1], "alignment", cause, prefBits))
      return err;

  Align abi, pref;
  if (auto err = Align::fromBits(abiBits, abi))
    return InvalidAlignmentError{cause.str(), *err};
  if (auto err = Align::fromBits(prefBits, pref))
    return InvalidAlignmentError{cause.str(), *err};

  result = {abi, pref};
  return std::nullopt;
}

llvm::Expected<TargetDataLayout> TargetDataLayout::parse(StringRef layout) {
  TargetDataLayout DL;
  // The largest integer alignment seen so far stands in for i128.
  uint64_t i128AlignSource = 64;

  SmallVector<StringRef, 16> specs;
  layout.split(specs, '-');
  for (StringRef spec : specs) {
    SmallVector<StringRef, 4> parts;
    spec.split(parts, ':');
    StringRef head = parts.front();
    ArrayRef<StringRef> fields = ArrayRef<StringRef>(parts).drop_front();

    LayoutErrorOr err;
    if (parts.size() == 1 && head == "e") {
      DL.TheEndian = Endian::Little;
    } else if (parts.size() == 1 && head == "E") {
      DL.TheEndian = Endian::Big;
    } else if (parts.size() == 1 && head.startswith("P")) {
      err = parseAddressSpace(head.drop_front(), "P",
                              DL.InstructionAddressSpace);
    } else if (head == "a") {
      err = parseAlign(fields, head, DL.AggregateAlign);
    } else if (head == "f32") {
      err = parseAlign(fields, head, DL.F32Align);
    } else if (head == "f64") {
      err = parseAlign(fields, head, DL.F64Align);
    } else if ((head == "p" || head == "p0") && parts.size() >= 2) {
      err = parseSize(fields[0], head, DL.PointerSize);
      if (!err)
        err = parseAlign(fields.drop_front(), head, DL.PointerAlign);
    } else if (head.startswith("i")) {
      uint64_t bits;
      if (parseUnsignedInteger(head.drop_front(), 64, bits).has_value()) {
        // Report the bad width as a size.
        Size ignored;
        err = parseSize(head.drop_front(), "i", ignored);
      } else {
        AbiAndPrefAlign align;
        err = parseAlign(fields, head, align);
        if (!err) {
          switch (bits) {
          case 1:
            DL.I1Align = align;
            break;
          case 8:
            DL.I8Align = align;
            break;
          case 16:
            DL.I16Align = align;
            break;
          case 32:
            DL.I32Align = align;
            break;
          case 64:
            DL.I64Align = align;
            break;
          default:
            break;
          }
          if (bits >= i128AlignSource && bits <= 128) {
            i128AlignSource = bits;
            DL.I128Align = align;
          }
        }
      }
    } else if (head.startswith("v")) {
      Size vectorSize;
      AbiAndPrefAlign align;
      err = parseSize(head.drop_front(), "v", vectorSize);
      if (!err)
        err = parseAlign(fields, head, align);
      if (!err) {
        auto existing = llvm::find_if(DL.VectorAlign, [&](const auto &entry) {
          return entry.first == vectorSize;
        });
        if (existing != DL.VectorAlign.end())
          existing->second = align;
        else
          DL.VectorAlign.emplace_back(vectorSize, align);
      }
    } else {
      LLVM_DEBUG(llvm::dbgs() << "ignoring data layout specification '"
                              << spec << "'\n");
    }

    if (err)
      return llvm::make_error<DataLayoutError>(std::move(*err));
  }
  return DL;
}

void quill::printDataLayoutError(raw_ostream &OS,
                                 const TargetDataLayoutErrors &err) {
  std::visit(
      llvm::makeVisitor(
          [&](const InvalidAddressSpaceError &E) {
            OS << "invalid address space `" << E.AddrSpace << "` for `"
               << E.Cause << "` in \"data-layout\": " << E.Err;
          },
          [&](const InvalidBitsError &E) {
            OS << "invalid " << E.Kind << " `" << E.Bit << "` for `"
               << E.Cause << "` in \"data-layout\": " << E.Err;
          },
          [&](const MissingAlignmentError &E) {
            OS << "missing alignment for `" << E.Cause
               << "` in \"data-layout\"";
          },
          [&](const InvalidAlignmentError &E) {
            OS << "invalid alignment for `" << E.Cause
               << "` in \"data-layout\": " << E.Err;
          },
          [&](const InconsistentTargetArchitectureError &E) {
            OS << "inconsistent target specification: \"data-layout\" claims "
                  "architecture is "
               << E.DL << "-endian, while \"target-endian\" is `" << E.Target
               << '`';
          },
          [&](const InconsistentTargetPointerWidthError &E) {
            OS << "inconsistent target specification: \"data-layout\" claims "
                  "pointers are "
               << E.PointerSize
               << "-bit, while \"target-pointer-width\" is `" << E.Target
               << '`';
          },
          [&](const InvalidBitsSizeError &E) { OS << E.Err; }),
      err);
}

void DataLayoutError::log(raw_ostream &OS) const {
  printDataLayoutError(OS, Err);
}

std::error_code DataLayoutError::convertToErrorCode() const {
  return llvm::inconvertibleErrorCode();
}
