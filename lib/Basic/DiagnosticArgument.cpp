//===--- DiagnosticArgument.cpp - Rendered diagnostic arguments -----------===//
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

#include "quill/Basic/DiagnosticArgument.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

using namespace quill;

std::optional<DiagnosticArgValue>
DiagnosticArgValue::getNumberIfRepresentable(const APSInt &value) {
  // An unsigned value needs a spare bit for the sign.
  if (value.isSigned() ? value.getMinSignedBits() > NumberWidth
                       : value.getActiveBits() > NumberWidth - 1)
    return std::nullopt;

  APInt widened = value.isSigned() ? value.sextOrTrunc(NumberWidth)
                                   : value.zextOrTrunc(NumberWidth);
  return DiagnosticArgValue(APSInt(std::move(widened), /*isUnsigned=*/false));
}

bool DiagnosticArgValue::operator==(const DiagnosticArgValue &other) const {
  if (getKind() != other.getKind())
    return false;

  switch (getKind()) {
  case DiagnosticArgValueKind::Number:
    return APSInt::isSameValue(getAsNumber(), other.getAsNumber());
  case DiagnosticArgValueKind::Str:
    return getAsString() == other.getAsString();
  case DiagnosticArgValueKind::StrListSepByAnd:
    return getAsStringList() == other.getAsStringList();
  }
  llvm_unreachable("Unhandled DiagnosticArgValueKind in switch.");
}

void DiagnosticArgValue::print(raw_ostream &OS) const {
  switch (getKind()) {
  case DiagnosticArgValueKind::Number:
    OS << getAsNumber();
    return;
  case DiagnosticArgValueKind::Str:
    OS << getAsString();
    return;
  case DiagnosticArgValueKind::StrListSepByAnd: {
    auto items = getAsStringList();
    for (size_t i = 0, e = items.size(); i != e; ++i) {
      if (i != 0)
        OS << (i + 1 == e ? " and " : ", ");
      OS << items[i];
    }
    return;
  }
  }
  llvm_unreachable("Unhandled DiagnosticArgValueKind in switch.");
}

void DiagnosticArgValue::dump() const {
  print(llvm::dbgs());
  llvm::dbgs() << '\n';
}
