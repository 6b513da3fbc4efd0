//===--- DiagnosticArgTraits.h - Converting values to arguments -*- C++ -*-===//
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
//  This file defines DiagnosticArgTraits, which turns a compiler value into the
//  DiagnosticArgValue bound to a placeholder.
//
//  Types with a dedicated rendering specialize DiagnosticArgTraits next to
//  their own definition. Any other type that can be written to a raw_ostream
//  uses the primary template, which binds the printed text. A specialization
//  always wins over the printed form, and a type with neither is rejected at
//  compile time.
//
//===----------------------------------------------------------------------===//

#ifndef QUILL_BASIC_DIAGNOSTICARGTRAITS_H
#define QUILL_BASIC_DIAGNOSTICARGTRAITS_H

#include "quill/Basic/DiagnosticArgument.h"
#include "quill/Basic/QuotedString.h"
#include "quill/Basic/StringExtras.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace quill {

namespace detail {
template <typename T>
using display_t =
    decltype(std::declval<raw_ostream &>() << std::declval<const T &>());

/// Whether \c T can be written to a raw_ostream.
template <typename T>
using is_displayable = llvm::is_detected<display_t, T>;

/// The built-in integer types that render as a Number. Booleans and the
/// character types have dedicated renderings of their own.
template <typename T>
using is_number_like = std::integral_constant<
    bool, std::is_integral<T>::value && sizeof(T) <= 8 &&
              !std::is_same<T, bool>::value && !std::is_same<T, char>::value &&
              !std::is_same<T, wchar_t>::value &&
              !std::is_same<T, char16_t>::value &&
              !std::is_same<T, char32_t>::value>;

/// Print \p value and bind the text, repairing any invalid UTF-8.
template <typename T>
DiagnosticArgValue renderDisplay(const T &value) {
  std::string text;
  llvm::raw_string_ostream OS(text);
  OS << value;
  OS.flush();
  return DiagnosticArgValue::getString(toStringLossy(std::move(text)));
}
} // end namespace detail

/// Converts a \c T into the value bound to a diagnostic placeholder.
///
/// The primary template renders anything with an \c operator<<. Pointers are
/// rejected so that an object's address is never bound by accident.
template <typename T, typename Enable = void>
struct DiagnosticArgTraits {
  static_assert(!std::is_pointer<T>::value,
                "pointer has no diagnostic argument rendering");
  static_assert(detail::is_displayable<T>::value,
                "type has no diagnostic argument rendering and cannot be "
                "printed to a raw_ostream");

  static DiagnosticArgValue intoDiagnosticArg(T value) {
    return detail::renderDisplay(value);
  }
};

/// Convert \p value into a diagnostic argument.
///
/// An rvalue is consumed. An lvalue is copied first, so the referent is
/// rendered and never its address.
template <typename T>
DiagnosticArgValue intoDiagnosticArg(T &&value) {
  using ValueT = std::decay_t<T>;
  return DiagnosticArgTraits<ValueT>::intoDiagnosticArg(
      ValueT(std::forward<T>(value)));
}

template <>
struct DiagnosticArgTraits<DiagnosticArgValue> {
  static DiagnosticArgValue intoDiagnosticArg(DiagnosticArgValue value) {
    return value;
  }
};

template <typename T>
struct DiagnosticArgTraits<T,
                           std::enable_if_t<detail::is_number_like<T>::value>> {
  static DiagnosticArgValue intoDiagnosticArg(T value) {
    return DiagnosticArgValue::getNumber(value);
  }
};

/// Wider integers fall back to their decimal text.
template <>
struct DiagnosticArgTraits<APSInt> {
  static DiagnosticArgValue intoDiagnosticArg(APSInt value) {
    if (auto number = DiagnosticArgValue::getNumberIfRepresentable(value))
      return std::move(*number);
    return DiagnosticArgValue::getString(llvm::toString(value, 10));
  }
};

template <>
struct DiagnosticArgTraits<bool> {
  static DiagnosticArgValue intoDiagnosticArg(bool value) {
    return DiagnosticArgValue::getString(llvm::toStringRef(value).str());
  }
};

/// Characters render as quoted literals, e.g. '\n'.
template <>
struct DiagnosticArgTraits<char> {
  static DiagnosticArgValue intoDiagnosticArg(char value) {
    return detail::renderDisplay(
        QuotedCharacter(static_cast<unsigned char>(value)));
  }
};

template <>
struct DiagnosticArgTraits<char32_t> {
  static DiagnosticArgValue intoDiagnosticArg(char32_t value) {
    return detail::renderDisplay(QuotedCharacter(value));
  }
};

template <>
struct DiagnosticArgTraits<std::string> {
  static DiagnosticArgValue intoDiagnosticArg(std::string value) {
    return DiagnosticArgValue::getString(toStringLossy(std::move(value)));
  }
};

template <>
struct DiagnosticArgTraits<StringRef> {
  static DiagnosticArgValue intoDiagnosticArg(StringRef value) {
    return DiagnosticArgValue::getString(toStringLossy(value));
  }
};

template <>
struct DiagnosticArgTraits<const char *> {
  static DiagnosticArgValue intoDiagnosticArg(const char *value) {
    return DiagnosticArgValue::getString(
        toStringLossy(value ? StringRef(value) : StringRef()));
  }
};

template <>
struct DiagnosticArgTraits<char *> : DiagnosticArgTraits<const char *> {};

template <unsigned N>
struct DiagnosticArgTraits<llvm::SmallString<N>> {
  static DiagnosticArgValue intoDiagnosticArg(llvm::SmallString<N> value) {
    return DiagnosticArgValue::getString(toStringLossy(value.str()));
  }
};

/// Paths render as their native spelling, without quotes or escapes.
template <>
struct DiagnosticArgTraits<std::filesystem::path> {
  static DiagnosticArgValue intoDiagnosticArg(std::filesystem::path value) {
    return DiagnosticArgValue::getString(toStringLossy(value.string()));
  }
};

template <>
struct DiagnosticArgTraits<std::error_code> {
  static DiagnosticArgValue intoDiagnosticArg(std::error_code value) {
    return DiagnosticArgValue::getString(toStringLossy(value.message()));
  }
};

/// Consumes the error.
template <>
struct DiagnosticArgTraits<llvm::Error> {
  static DiagnosticArgValue intoDiagnosticArg(llvm::Error value) {
    return DiagnosticArgValue::getString(
        toStringLossy(llvm::toString(std::move(value))));
  }
};

template <typename T>
struct DiagnosticArgTraits<std::reference_wrapper<T>> {
  static DiagnosticArgValue intoDiagnosticArg(std::reference_wrapper<T> ref) {
    using ValueT = std::remove_const_t<T>;
    return DiagnosticArgTraits<ValueT>::intoDiagnosticArg(ValueT(ref.get()));
  }
};

/// Binds whatever \p print writes, for values that are displayable only in
/// context. Like any function_ref, it must be converted within the
/// full-expression that creates it.
///
/// \code
///   Diag.arg("version", DiagnosticArgFromDisplay(
///                           [&](raw_ostream &OS) { OS << Version; }));
/// \endcode
class DiagnosticArgFromDisplay {
  llvm::function_ref<void(raw_ostream &)> Print;

public:
  explicit DiagnosticArgFromDisplay(
      llvm::function_ref<void(raw_ostream &)> print)
      : Print(print) {}

  friend raw_ostream &operator<<(raw_ostream &OS,
                                 const DiagnosticArgFromDisplay &D) {
    D.Print(OS);
    return OS;
  }
};

template <>
struct DiagnosticArgTraits<DiagnosticArgFromDisplay> {
  static DiagnosticArgValue intoDiagnosticArg(DiagnosticArgFromDisplay value) {
    return detail::renderDisplay(value);
  }
};

} // end namespace quill

#endif // QUILL_BASIC_DIAGNOSTICARGTRAITS_H
