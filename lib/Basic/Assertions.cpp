//===--- Assertions.cpp - Assertion macros --------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2024 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See https://swift.org/LICENSE.txt for license information
// See https://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//
//
// Failure reporting for the ASSERT and ABORT macros.
//
//===----------------------------------------------------------------------===//

#include "quill/Basic/Assertions.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/PrettyStackTrace.h"
#include "llvm/Support/raw_ostream.h"
#include <cstdlib>

using namespace llvm;

static cl::opt<bool> AssertContinue(
    "assert-continue", cl::init(false),
    cl::desc("Report a failed assertion and keep going"));

static cl::opt<bool> AssertHelp(
    "assert-help", cl::init(false),
    cl::desc("Describe the options controlling assertions"));

namespace {
/// Carries a possibly multi-line failure report into the crash stack trace.
class PrettyStackTraceReport : public PrettyStackTraceEntry {
  StringRef Report;

public:
  explicit PrettyStackTraceReport(StringRef report) : Report(report) {}

  void print(raw_ostream &OS) const override {
    SmallVector<StringRef, 4> lines;
    Report.rtrim('\n').split(lines, '\n');
    for (unsigned i = 0, e = lines.size(); i != e; ++i)
      OS << (i == 0 ? "" : "| \t") << lines[i] << '\n';
  }
};
} // end anonymous namespace

[[noreturn]] static void reportAndAbort(StringRef report) {
  PrettyStackTraceReport entry(report);
  errs() << report << '\n';
  std::abort();
}

static void printAssertHelp(raw_ostream &OS) {
  static bool shown = false;
  if (shown)
    return;
  shown = true;

  if (!AssertHelp) {
    OS << "(pass -assert-help to list the assertion options)\n";
    return;
  }
  OS << "\nAssertion options:\n"
     << "  -assert-continue  report failures and keep going\n";
}

void ASSERT_failure(const char *expr, const char *file, int line,
                    const char *func) {
  SmallString<128> report;
  raw_svector_ostream OS(report);
  OS << "quill: internal invariant `" << expr << "` violated in " << func
     << " (" << sys::path::filename(file) << ':' << line << ")\n";
  printAssertHelp(OS);

  if (!AssertContinue)
    reportAndAbort(report);

  errs() << report << "continuing (-assert-continue)\n";
}

void _ABORT(const char *file, int line, const char *func,
            function_ref<void(raw_ostream &)> message) {
  SmallString<128> report;
  raw_svector_ostream OS(report);
  OS << "quill: fatal internal error in " << func << " ("
     << sys::path::filename(file) << ':' << line << ")\n";
  message(OS);
  reportAndAbort(report);
}

void _ABORT(const char *file, int line, const char *func, StringRef message) {
  _ABORT(file, line, func, [&](raw_ostream &OS) { OS << message; });
}
