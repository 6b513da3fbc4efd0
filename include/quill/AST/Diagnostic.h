//===--- Diagnostic.h - Diagnostic construction -----------------*- C++ -*-===//
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
//  This file declares the Diagnostic class, a diagnostic under construction.
//  A Diagnostic selects a message template, binds named arguments for it, and
//  collects the spans, labels, child notes and code suggestions that are
//  rendered together with it.
//
//===----------------------------------------------------------------------===//

#ifndef QUILL_AST_DIAGNOSTIC_H
#define QUILL_AST_DIAGNOSTIC_H

#include "quill/AST/DiagnosticIDs.h"
#include "quill/AST/DiagnosticLevel.h"
#include "quill/Basic/Assertions.h"
#include "quill/Basic/DiagnosticArgTraits.h"
#include "quill/Basic/DiagnosticArgument.h"
#include "quill/Basic/DiagnosticLocation.h"
#include "quill/Basic/LLVM.h"
#include "quill/Basic/SourceLoc.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/Support/Compiler.h"
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace quill {

/// The message of a diagnostic or of one of its parts: either a template key
/// resolved later by the renderer, or literal text.
class DiagnosticMessage {
  std::variant<std::string, DiagID> Storage;

public:
  DiagnosticMessage(DiagID ID) : Storage(ID) {}
  DiagnosticMessage(std::string text) : Storage(std::move(text)) {}
  DiagnosticMessage(StringRef text) : Storage(text.str()) {}
  DiagnosticMessage(const char *text) : Storage(std::string(text)) {}

  bool isTemplate() const { return std::holds_alternative<DiagID>(Storage); }

  DiagID getID() const {
    ASSERT(isTemplate() && "literal messages have no template key");
    return std::get<DiagID>(Storage);
  }

  StringRef getText() const {
    ASSERT(!isTemplate() && "template keys have no literal text");
    return std::get<std::string>(Storage);
  }

  bool operator==(const DiagnosticMessage &other) const {
    return Storage == other.Storage;
  }
  bool operator!=(const DiagnosticMessage &other) const {
    return !operator==(other);
  }

  /// Prints the template slug or the literal text.
  void print(raw_ostream &OS) const;
};

/// The named arguments bound to placeholders of a message template.
///
/// Names are unique; binding a name that is already present replaces its
/// value.
class DiagnosticArgs {
  llvm::StringMap<DiagnosticArgValue> Args;

public:
  /// Convert \p value with its DiagnosticArgTraits and bind it to \p name.
  template <typename T>
  void set(StringRef name, T &&value) {
    setValue(name, intoDiagnosticArg(std::forward<T>(value)));
  }

  void setValue(StringRef name, DiagnosticArgValue value);

  void insert(DiagnosticArgument arg) {
    setValue(arg.Name, std::move(arg.Value));
  }

  /// \returns the value bound to \p name, or null.
  const DiagnosticArgValue *lookup(StringRef name) const;

  bool contains(StringRef name) const { return Args.count(name) != 0; }
  size_t size() const { return Args.size(); }
  bool empty() const { return Args.empty(); }

  /// The bound names in lexicographic order.
  std::vector<StringRef> getNames() const;
};

/// A label attached to one primary span.
struct SpanLabel {
  SourceRange Range;
  DiagnosticMessage Label;
  DiagnosticArgs Args;
};

/// A note, help or similar message attached below a diagnostic.
struct SubDiagnostic {
  DiagnosticLevel Level;
  DiagnosticMessage Message;
  SmallVector<SourceRange, 1> Spans;
  DiagnosticArgs Args;
};

/// How a code suggestion is shown to the user.
enum class SuggestionStyle : uint8_t {
  /// Show the message only; the code is inlined into the label.
  HideCodeInline,
  /// Show the message only, never the code.
  HideCodeAlways,
  /// Do not show the suggestion at all; it is only for tools.
  CompletelyHidden,
  /// Show the code in a separate snippet when it does not fit inline.
  ShowCode,
  /// Always show the code in a separate snippet.
  ShowAlways,
};

/// How confident the compiler is that a suggestion is what the user wants.
enum class Applicability : uint8_t {
  /// The suggestion is definitely what the user intended.
  MachineApplicable,
  /// The suggestion may be what the user intended, but it is uncertain.
  MaybeIncorrect,
  /// The suggestion contains placeholders like \c (...) or \c { /* fields */ }.
  HasPlaceholders,
  Unspecified,
};

/// A replacement of the code covered by \c Range.
struct CodeSuggestion {
  SourceRange Range;
  std::string Code;
  DiagnosticMessage Message;
  DiagnosticArgs Args;
  SuggestionStyle Style;
  Applicability Applic;
};

/// A diagnostic under construction.
class Diagnostic {
  DiagnosticLevel Level;
  DiagnosticMessage Message;
  DiagnosticArgs Args;
  SmallVector<SourceRange, 1> PrimarySpans;
  std::vector<SpanLabel> Labels;
  std::vector<SubDiagnostic> Children;
  std::vector<CodeSuggestion> Suggestions;

  /// Where in the compiler this diagnostic was created.
  DiagnosticLocation EmittedAt;

public:
  Diagnostic(DiagnosticLevel level, DiagnosticMessage message,
             DiagnosticLocation emittedAt = DiagnosticLocation::caller())
      : Level(level), Message(std::move(message)), EmittedAt(emittedAt) {}

  /// Bind \p value to the placeholder \p name of the primary message.
  template <typename T>
  Diagnostic &arg(StringRef name, T &&value) {
    Args.set(name, std::forward<T>(value));
    return *this;
  }

  /// Replace the primary spans with \p range.
  Diagnostic &span(SourceRange range);

  /// Replace the primary spans with \p ranges.
  Diagnostic &spans(ArrayRef<SourceRange> ranges);

  /// The first primary span, if any.
  std::optional<SourceRange> getPrimarySpan() const;

  /// Attach \p label to \p range.
  Diagnostic &spanLabel(SourceRange range, DiagnosticMessage label,
                        DiagnosticArgs args = DiagnosticArgs());

  /// Attach the same literal \p label to each of \p ranges.
  Diagnostic &spanLabels(ArrayRef<SourceRange> ranges, StringRef label);

  Diagnostic &note(DiagnosticMessage message,
                   DiagnosticArgs args = DiagnosticArgs());
  Diagnostic &spanNote(SourceRange range, DiagnosticMessage message,
                       DiagnosticArgs args = DiagnosticArgs());
  Diagnostic &help(DiagnosticMessage message,
                   DiagnosticArgs args = DiagnosticArgs());
  Diagnostic &spanHelp(SourceRange range, DiagnosticMessage message,
                       DiagnosticArgs args = DiagnosticArgs());
  Diagnostic &addChild(SubDiagnostic child);

  /// Suggest replacing the code at \p range with \p code.
  Diagnostic &spanSuggestion(SourceRange range, DiagnosticMessage message,
                             std::string code, Applicability applicability,
                             SuggestionStyle style = SuggestionStyle::ShowCode,
                             DiagnosticArgs args = DiagnosticArgs());

  /// Merge \p sub into this diagnostic. Subdiagnostics are consumed by
  /// merging, so \p sub must be an rvalue.
  template <typename T>
  Diagnostic &subdiagnostic(T &&sub) {
    static_assert(!std::is_lvalue_reference<T>::value,
                  "subdiagnostics are consumed when added to a diagnostic");
    std::move(sub).addToDiagnostic(*this);
    return *this;
  }

  DiagnosticLevel getLevel() const { return Level; }
  void setLevel(DiagnosticLevel level) { Level = level; }

  const DiagnosticMessage &getMessage() const { return Message; }
  const DiagnosticArgs &getArgs() const { return Args; }
  ArrayRef<SourceRange> getPrimarySpans() const { return PrimarySpans; }
  ArrayRef<SpanLabel> getSpanLabels() const { return Labels; }
  ArrayRef<SubDiagnostic> getChildren() const { return Children; }
  ArrayRef<CodeSuggestion> getSuggestions() const { return Suggestions; }
  const DiagnosticLocation &getEmittedAt() const { return EmittedAt; }

  bool isError() const { return isErrorLevel(Level); }

  /// Print a structural rendering for debugging. Templates are not
  /// resolved; arguments are printed next to them.
  void print(raw_ostream &OS) const;
  LLVM_DUMP_METHOD void dump() const;
};

} // end namespace quill

#endif // QUILL_AST_DIAGNOSTIC_H
