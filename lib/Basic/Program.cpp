//===--- Program.cpp - Child process results ------------------------------===//
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

#include "quill/Basic/Program.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/Program.h"
#include "llvm/Support/raw_ostream.h"

using namespace quill;

ExitStatus ExitStatus::fromProcessInfo(const llvm::sys::ProcessInfo &info) {
  if (info.ReturnCode < 0)
    return abnormal();
  return exited(info.ReturnCode);
}

raw_ostream &quill::operator<<(raw_ostream &OS, const ExitStatus &status) {
  switch (status.TheKind) {
  case ExitStatus::Kind::Exited:
    return OS << "exit status: " << status.Value;
  case ExitStatus::Kind::Signaled:
    return OS << "signal: " << status.Value;
  case ExitStatus::Kind::Abnormal:
    return OS << "terminated abnormally";
  }
  llvm_unreachable("Unhandled ExitStatus::Kind in switch.");
}
