//===--- DiagnosticArgument.h - Rendered diagnostic arguments ---*- C++ -*-===//
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
//
//  This file defines the value bound to a named placeholder of a diagnostic
//  message template.
//
//===----------------------------------------------------------------------===//

#ifndef QUILL_BASIC_DIAGNOSTICARGUMENT_H
#define QUILL_BASIC_DIAGNOSTICARGUMENT_H

#include "quill/Basic/Assertions.h"
#include "quill/Basic/LLVM.h"
#include "llvm/ADT/APSInt.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Compiler.h"
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace quill {

/// Describes the kind of value stored in a DiagnosticArgValue.
enum class DiagnosticArgValueKind : uint8_t {
  /// A signed 128-bit integer.
  Number,
  /// A UTF-8 string.
  Str,
  /// An ordered list of strings, rendered as "a, b and c".
  StrListSepByAnd,
};

/// The rendered value of one diagnostic argument.
///
/// Every argument a diagnostic carries ends up as one of three shapes, so the
/// formatter never needs to know about the compiler's data structures.
class DiagnosticArgValue {
public:
  /// The width of Number values. Every built-in integer widens into it.
  static constexpr unsigned NumberWidth = 128;

private:
  std::variant<APSInt, std::string, std::vector<std::string>> Storage;

  explicit DiagnosticArgValue(APSInt N) : Storage(std::move(N)) {}
  explicit DiagnosticArgValue(std::string S) : Storage(std::move(S)) {}
  explicit DiagnosticArgValue(std::vector<std::string> L)
      : Storage(std::move(L)) {}

public:
  template <typename IntT>
  static DiagnosticArgValue getNumber(IntT value) {
    static_assert(std::is_integral<IntT>::value && sizeof(IntT) <= 8,
                  "only built-in integers widen to a Number");
    APInt bits(NumberWidth, static_cast<uint64_t>(value),
               /*isSigned=*/std::is_signed<IntT>::value);
    return DiagnosticArgValue(APSInt(std::move(bits), /*isUnsigned=*/false));
  }

  /// Returns the value as a Number if it fits in a signed 128-bit integer.
  static std::optional<DiagnosticArgValue>
  getNumberIfRepresentable(const APSInt &value);

  static DiagnosticArgValue getString(std::string S) {
    return DiagnosticArgValue(std::move(S));
  }

  static DiagnosticArgValue getStringList(std::vector<std::string> items) {
    return DiagnosticArgValue(std::move(items));
  }

  DiagnosticArgValueKind getKind() const {
    return static_cast<DiagnosticArgValueKind>(Storage.index());
  }

  bool isNumber() const { return getKind() == DiagnosticArgValueKind::Number; }
  bool isString() const { return getKind() == DiagnosticArgValueKind::Str; }
  bool isStringList() const {
    return getKind() == DiagnosticArgValueKind::StrListSepByAnd;
  }

  const APSInt &getAsNumber() const {
    ASSERT(isNumber());
    return std::get<APSInt>(Storage);
  }

  StringRef getAsString() const {
    ASSERT(isString());
    return std::get<std::string>(Storage);
  }

  ArrayRef<std::string> getAsStringList() const {
    ASSERT(isStringList());
    return std::get<std::vector<std::string>>(Storage);
  }

  bool operator==(const DiagnosticArgValue &other) const;
  bool operator!=(const DiagnosticArgValue &other) const {
    return !(*this == other);
  }

  void print(raw_ostream &OS) const;
  LLVM_DUMP_METHOD void dump() const;
};

inline raw_ostream &operator<<(raw_ostream &OS, const DiagnosticArgValue &V) {
  V.print(OS);
  return OS;
}

/// A value bound to the placeholder \c Name.
struct DiagnosticArgument {
  std::string Name;
  DiagnosticArgValue Value;
};

} // end namespace quill

#endif // QUILL_BASIC_DIAGNOSTICARGUMENT_H
