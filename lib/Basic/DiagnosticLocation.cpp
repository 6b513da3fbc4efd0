//===--- DiagnosticLocation.cpp - Where a diagnostic was built ------------===//
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

#include "quill/Basic/DiagnosticLocation.h"
#include "llvm/Support/raw_ostream.h"

using namespace quill;

void DiagnosticLocation::print(raw_ostream &OS) const {
  OS << File << ':' << Line;
  if (hasColumn())
    OS << ':' << Column;
}
