//===--- Backtrace.cpp - Captured compiler stack traces -------------------===//
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

#define DEBUG_TYPE "quill-diagnostics"
#include "quill/Basic/Backtrace.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/Signals.h"
#include "llvm/Support/raw_ostream.h"

using namespace quill;

static llvm::cl::opt<bool> DiagnosticBacktraces(
    "quill-diagnostic-backtraces", llvm::cl::init(true),
    llvm::cl::desc("Capture a compiler backtrace when a diagnostic is "
                   "delayed"));

bool Backtrace::isCaptureEnabled() { return DiagnosticBacktraces; }

Backtrace Backtrace::capture() {
  if (!isCaptureEnabled())
    return disabled();
  return forceCapture();
}

Backtrace Backtrace::forceCapture() {
  std::string frames;
  llvm::raw_string_ostream OS(frames);
  llvm::sys::PrintStackTrace(OS);
  OS.flush();
  LLVM_DEBUG(llvm::dbgs() << "captured backtrace of " << frames.size()
                          << " bytes\n");
  return fromFrames(std::move(frames));
}

void Backtrace::print(raw_ostream &OS) const {
  switch (State) {
  case Status::Unsupported:
    OS << "unsupported backtrace";
    return;
  case Status::Disabled:
    OS << "disabled backtrace";
    return;
  case Status::Captured:
    OS << Frames;
    return;
  }
  llvm_unreachable("Unhandled Backtrace::Status in switch.");
}

