//===--- TargetInfo.h - Description of the compilation target ---*- C++ -*-===//
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

#ifndef QUILL_TARGET_TARGETINFO_H
#define QUILL_TARGET_TARGETINFO_H

#include "quill/Target/DataLayout.h"
#include "quill/Target/TargetOptions.h"
#include "llvm/Support/Error.h"
#include <optional>
#include <string>

namespace quill {

/// The built-in description of a target: its triple, its LLVM data layout and
/// the properties the layout must agree with.
struct TargetInfo {
  TargetTriple Triple;
  std::string DataLayout;
  Endian TargetEndian;
  uint32_t PointerWidth;

  /// The minimum size of a C enum in bits, if it differs from 32.
  std::optional<uint64_t> CEnumMinBits;

  PanicStrategy Panic = PanicStrategy::Unwind;
  SplitDebuginfo SplitDebugInfo = SplitDebuginfo::Off;
  StackProtector Protector = StackProtector::None;

  /// Derives the byte order and pointer width from \p triple.
  TargetInfo(TargetTriple triple, std::string dataLayout)
      : Triple(std::move(triple)), DataLayout(std::move(dataLayout)),
        TargetEndian(Triple.getEndian()),
        PointerWidth(Triple.getPointerWidth()) {}

  /// Parse DataLayout and check it against the rest of the target.
  ///
  /// Fails with a DataLayoutError.
  llvm::Expected<TargetDataLayout> parseDataLayout() const;
};

} // end namespace quill

#endif // QUILL_TARGET_TARGETINFO_H
