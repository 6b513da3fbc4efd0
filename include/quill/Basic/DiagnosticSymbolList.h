//===--- DiagnosticSymbolList.h - "`a`, `b` and `c`" arguments --*- C++ -*-===//
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

#ifndef QUILL_BASIC_DIAGNOSTICSYMBOLLIST_H
#define QUILL_BASIC_DIAGNOSTICSYMBOLLIST_H

#include "quill/Basic/DiagnosticArgTraits.h"
#include "llvm/Support/raw_ostream.h"
#include <string>
#include <vector>

namespace quill {

/// An ordered list of names, bound as a StrListSepByAnd with each name in
/// backticks.
class DiagnosticSymbolList {
  std::vector<std::string> Symbols;

public:
  DiagnosticSymbolList() = default;

  /// Collect the printed form of every element of \p range, in order.
  template <typename RangeT>
  explicit DiagnosticSymbolList(const RangeT &range) {
    for (const auto &item : range)
      push_back(item);
  }

  template <typename T>
  void push_back(const T &item) {
    static_assert(detail::is_displayable<T>::value,
                  "symbol must be printable to a raw_ostream");
    std::string text;
    llvm::raw_string_ostream OS(text);
    OS << item;
    OS.flush();
    Symbols.push_back(toStringLossy(std::move(text)));
  }

  ArrayRef<std::string> getSymbols() const { return Symbols; }
  size_t size() const { return Symbols.size(); }
  bool empty() const { return Symbols.empty(); }
};

template <>
struct DiagnosticArgTraits<DiagnosticSymbolList> {
  static DiagnosticArgValue intoDiagnosticArg(DiagnosticSymbolList list) {
    std::vector<std::string> items;
    items.reserve(list.size());
    for (StringRef symbol : list.getSymbols())
      items.push_back(("`" + symbol + "`").str());
    return DiagnosticArgValue::getStringList(std::move(items));
  }
};

} // end namespace quill

#endif // QUILL_BASIC_DIAGNOSTICSYMBOLLIST_H
