//===--- Edition.cpp - Language editions ----------------------------------===//
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

#include "quill/Basic/Edition.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

using namespace quill;

StringRef quill::getEditionName(Edition edition) {
  switch (edition) {
  case Edition::Edition2015:
    return "2015";
  case Edition::Edition2018:
    return "2018";
  case Edition::Edition2021:
    return "2021";
  case Edition::Edition2024:
    return "2024";
  }
  llvm_unreachable("Unhandled Edition in switch.");
}

raw_ostream &quill::operator<<(raw_ostream &OS, Edition edition) {
  return OS << getEditionName(edition);
}
