//===--- Diagnostic.cpp - Diagnostic construction -------------------------===//
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
#include "quill/AST/Diagnostic.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

using namespace quill;

//===----------------------------------------------------------------------===//
// DiagnosticMessage and DiagnosticArgs
//===----------------------------------------------------------------------===//

void DiagnosticMessage::print(raw_ostream &OS) const {
  if (isTemplate())
    OS << getDiagnosticSlug(getID());
  else
    OS << '"' << getText() << '"';
}

void DiagnosticArgs::setValue(StringRef name, DiagnosticArgValue value) {
  auto found = Args.find(name);
  if (found != Args.end()) {
    LLVM_DEBUG(llvm::dbgs() << "replacing diagnostic argument '" << name
                            << "' (" << found->second << " -> " << value
                            << ")\n");
    found->second = std::move(value);
    return;
  }
  Args.try_emplace(name, std::move(value));
}

const DiagnosticArgValue *DiagnosticArgs::lookup(StringRef name) const {
  auto found = Args.find(name);
  if (found == Args.end())
    return nullptr;
  return &found->second;
}

std::vector<StringRef> DiagnosticArgs::getNames() const {
  std::vector<StringRef> names;
  names.reserve(Args.size());
  for (const auto &entry : Args)
    names.push_back(entry.getKey());
  llvm::sort(names);
  return names;
}

static void printArgs(raw_ostream &OS, const DiagnosticArgs &args,
                      unsigned indent) {
  for (StringRef name : args.getNames()) {
    OS.indent(indent) << name << " = ";
    const DiagnosticArgValue *value = args.lookup(name);
    if (value->isNumber())
      OS << *value;
    else
      OS << '"' << *value << '"';
    OS << '\n';
  }
}

//===----------------------------------------------------------------------===//
// Diagnostic
//===----------------------------------------------------------------------===//

Diagnostic &Diagnostic::span(SourceRange range) {
  PrimarySpans.clear();
  PrimarySpans.push_back(range);
  return *this;
}

Diagnostic &Diagnostic::spans(ArrayRef<SourceRange> ranges) {
  PrimarySpans.assign(ranges.begin(), ranges.end());
  return *this;
}

std::optional<SourceRange> Diagnostic::getPrimarySpan() const {
  if (PrimarySpans.empty())
    return std::nullopt;
  return PrimarySpans.front();
}

Diagnostic &Diagnostic::spanLabel(SourceRange range, DiagnosticMessage label,
                                  DiagnosticArgs args) {
  Labels.push_back({range, std::move(label), std::move(args)});
  return *this;
}

Diagnostic &Diagnostic::spanLabels(ArrayRef<SourceRange> ranges,
                                   StringRef label) {
  for (SourceRange range : ranges)
    spanLabel(range, label);
  return *this;
}

Diagnostic &Diagnostic::note(DiagnosticMessage message, DiagnosticArgs args) {
  return addChild(
      {DiagnosticLevel::Note, std::move(message), {}, std::move(args)});
}

Diagnostic &Diagnostic::spanNote(SourceRange range, DiagnosticMessage message,
                                 DiagnosticArgs args) {
  return addChild(
      {DiagnosticLevel::Note, std::move(message), {range}, std::move(args)});
}

Diagnostic &Diagnostic::help(DiagnosticMessage message, DiagnosticArgs args) {
  return addChild(
      {DiagnosticLevel::Help, std::move(message), {}, std::move(args)});
}

Diagnostic &Diagnostic::spanHelp(SourceRange range, DiagnosticMessage message,
                                 DiagnosticArgs args) {
  return addChild(
      {DiagnosticLevel::Help, std::move(message), {range}, std::move(args)});
}

Diagnostic &Diagnostic::addChild(SubDiagnostic child) {
  Children.push_back(std::move(child));
  return *this;
}

Diagnostic &Diagnostic::spanSuggestion(SourceRange range,
                                       DiagnosticMessage message,
                                       std::string code,
                                       Applicability applicability,
                                       SuggestionStyle style,
                                       DiagnosticArgs args) {
  Suggestions.push_back({range, std::move(code), std::move(message),
                         std::move(args), style, applicability});
  return *this;
}

void Diagnostic::print(raw_ostream &OS) const {
  OS << Level << ": ";
  Message.print(OS);
  OS << " (emitted at " << EmittedAt << ")\n";
  printArgs(OS, Args, 2);
  OS << "  " << PrimarySpans.size() << " primary span(s)\n";

  for (const auto &label : Labels) {
    OS << "  label: ";
    label.Label.print(OS);
    OS << '\n';
    printArgs(OS, label.Args, 4);
  }
  for (const auto &child : Children) {
    OS << "  " << child.Level << ": ";
    child.Message.print(OS);
    OS << '\n';
    printArgs(OS, child.Args, 4);
  }
  for (const auto &suggestion : Suggestions) {
    OS << "  suggestion: ";
    suggestion.Message.print(OS);
    OS << " -> `" << suggestion.Code << "`\n";
    printArgs(OS, suggestion.Args, 4);
  }
}

void Diagnostic::dump() const { print(llvm::errs()); }
