//===--- Backtrace.h - Captured compiler stack traces -----------*- C++ -*-===//
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

#ifndef QUILL_BASIC_BACKTRACE_H
#define QUILL_BASIC_BACKTRACE_H

#include "quill/Basic/LLVM.h"
#include "llvm/ADT/StringRef.h"
#include <cstdint>
#include <string>

namespace quill {

/// A stack trace of the compiler itself, captured when a diagnostic is
/// delayed so that the eventual report can say where it came from.
class Backtrace {
public:
  enum class Status : uint8_t {
    /// Stack walking is not available on this host.
    Unsupported,
    /// Capturing was turned off with -quill-diagnostic-backtraces=false.
    Disabled,
    Captured,
  };

private:
  Status State;
  std::string Frames;

  Backtrace(Status state, std::string frames)
      : State(state), Frames(std::move(frames)) {}

public:
  /// Capture the current stack, unless backtraces are disabled.
  static Backtrace capture();

  /// Capture the current stack regardless of configuration.
  static Backtrace forceCapture();

  static Backtrace disabled() { return Backtrace(Status::Disabled, ""); }

  /// Wrap frames captured elsewhere.
  static Backtrace fromFrames(std::string frames) {
    if (frames.empty())
      return Backtrace(Status::Unsupported, "");
    return Backtrace(Status::Captured, std::move(frames));
  }

  /// Whether backtraces are collected by capture().
  static bool isCaptureEnabled();

  Status getStatus() const { return State; }

  /// The symbolized frames, empty unless getStatus() is Captured.
  StringRef getFrames() const { return Frames; }

  void print(raw_ostream &OS) const;

  friend raw_ostream &operator<<(raw_ostream &OS, const Backtrace &BT) {
    BT.print(OS);
    return OS;
  }
};

} // end namespace quill

#endif // QUILL_BASIC_BACKTRACE_H
