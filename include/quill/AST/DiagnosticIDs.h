//===--- DiagnosticIDs.h - Diagnostic template keys -------------*- C++ -*-===//
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
//  This file declares the enumeration of diagnostic template keys.
//
//===----------------------------------------------------------------------===//

#ifndef QUILL_AST_DIAGNOSTICIDS_H
#define QUILL_AST_DIAGNOSTICIDS_H

#include "quill/Basic/LLVM.h"
#include "llvm/ADT/StringRef.h"
#include <cstdint>

namespace quill {

/// Enumeration describing all of the diagnostic template keys.
enum class DiagID : uint32_t {
#define DIAG(ROLE, ID, Text) ID,
#include "quill/AST/DiagnosticIDs.def"
};

constexpr unsigned NumDiagIDs = 0
#define DIAG(ROLE, ID, Text) +1
#include "quill/AST/DiagnosticIDs.def"
    ;

/// Where a template is meant to be attached within a diagnostic.
enum class DiagnosticRole : uint8_t {
  /// The primary message of a top-level diagnostic.
  Error,
  /// A child note.
  Note,
  /// A label on a primary span.
  Label,
  /// The message of a code suggestion.
  Suggestion,
};

/// The name of the template key, e.g. "errors_target_invalid_bits".
StringRef getDiagnosticSlug(DiagID ID);

/// The role the template is written for.
DiagnosticRole getDiagnosticRole(DiagID ID);

/// The unformatted template text, placeholders included.
StringRef getDiagnosticTemplate(DiagID ID);

} // end namespace quill

#endif // QUILL_AST_DIAGNOSTICIDS_H
