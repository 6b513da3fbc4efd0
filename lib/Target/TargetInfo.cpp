//===--- TargetInfo.cpp - Description of the compilation target -----------===//
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
#include "quill/Target/TargetInfo.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

#include <string>

using namespace quill;

llvm::Expected<TargetDataLayout> TargetInfo::parseDataLayout() const {
  auto DL = TargetDataLayout::parse(DataLayout);
  if (!DL)
    return DL.takeError();

  if (DL->TheEndian != TargetEndian) {
    return llvm::make_error<DataLayoutError>(
        InconsistentTargetArchitectureError{
            getEndianName(DL->TheEndian).str(),
            getEndianName(TargetEndian).str()});
  }

  if (DL->PointerSize.getBits() != PointerWidth) {
    return llvm::make_error<DataLayoutError>(
        InconsistentTargetPointerWidthError{DL->PointerSize.getBits(),
                                            PointerWidth});
  }

  if (CEnumMinBits) {
    if (!Size::isRepresentableBits(*CEnumMinBits)) {
      return llvm::make_error<DataLayoutError>(InvalidBitsSizeError{
          "quill does not support integers with " +
          std::to_string(*CEnumMinBits) + " bits"});
    }
    auto minSize = getIntegerOfSize(Size::fromBits(*CEnumMinBits));
    if (!minSize) {
      return llvm::make_error<DataLayoutError>(
          InvalidBitsSizeError{llvm::toString(minSize.takeError())});
    }
    DL->CEnumMinSize = *minSize;
  }

  LLVM_DEBUG(llvm::dbgs() << "parsed data layout of " << Triple << "\n");
  return DL;
}
