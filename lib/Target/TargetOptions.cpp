//===--- TargetOptions.cpp - Code generation toggles ----------------------===//
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

#include "quill/Target/TargetOptions.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

using namespace quill;

StringRef quill::getEndianName(Endian endian) {
  switch (endian) {
  case Endian::Little:
    return "little";
  case Endian::Big:
    return "big";
  }
  llvm_unreachable("Unhandled Endian in switch.");
}

raw_ostream &quill::operator<<(raw_ostream &OS, Endian endian) {
  return OS << getEndianName(endian);
}

StringRef quill::getPanicStrategyDesc(PanicStrategy strategy) {
  switch (strategy) {
  case PanicStrategy::Unwind:
    return "unwind";
  case PanicStrategy::Abort:
    return "abort";
  }
  llvm_unreachable("Unhandled PanicStrategy in switch.");
}

std::optional<PanicStrategy> quill::parsePanicStrategy(StringRef text) {
  return llvm::StringSwitch<std::optional<PanicStrategy>>(text)
      .Case("unwind", PanicStrategy::Unwind)
      .Case("abort", PanicStrategy::Abort)
      .Default(std::nullopt);
}

std::optional<SplitDebuginfo> quill::parseSplitDebuginfo(StringRef text) {
  return llvm::StringSwitch<std::optional<SplitDebuginfo>>(text)
      .Case("off", SplitDebuginfo::Off)
      .Case("packed", SplitDebuginfo::Packed)
      .Case("unpacked", SplitDebuginfo::Unpacked)
      .Default(std::nullopt);
}

raw_ostream &quill::operator<<(raw_ostream &OS, SplitDebuginfo kind) {
  switch (kind) {
  case SplitDebuginfo::Off:
    return OS << "off";
  case SplitDebuginfo::Packed:
    return OS << "packed";
  case SplitDebuginfo::Unpacked:
    return OS << "unpacked";
  }
  llvm_unreachable("Unhandled SplitDebuginfo in switch.");
}

std::optional<StackProtector> quill::parseStackProtector(StringRef text) {
  return llvm::StringSwitch<std::optional<StackProtector>>(text)
      .Case("none", StackProtector::None)
      .Case("basic", StackProtector::Basic)
      .Case("strong", StackProtector::Strong)
      .Case("all", StackProtector::All)
      .Default(std::nullopt);
}

raw_ostream &quill::operator<<(raw_ostream &OS, StackProtector kind) {
  switch (kind) {
  case StackProtector::None:
    return OS << "none";
  case StackProtector::Basic:
    return OS << "basic";
  case StackProtector::Strong:
    return OS << "strong";
  case StackProtector::All:
    return OS << "all";
  }
  llvm_unreachable("Unhandled StackProtector in switch.");
}

uint32_t TargetTriple::getPointerWidth() const {
  if (Triple.isArch64Bit())
    return 64;
  if (Triple.isArch32Bit())
    return 32;
  if (Triple.isArch16Bit())
    return 16;
  return 0;
}
