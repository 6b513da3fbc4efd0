//===--- TargetDiagnostics.h - Diagnosing target specs ----------*- C++ -*-===//
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

#ifndef QUILL_AST_TARGETDIAGNOSTICS_H
#define QUILL_AST_TARGETDIAGNOSTICS_H

#include "quill/AST/Diagnostic.h"
#include "quill/AST/DiagnosticLevel.h"
#include "quill/Basic/DiagnosticLocation.h"
#include "quill/Target/DataLayout.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Error.h"

namespace quill {

/// Build the diagnostic reporting a malformed "data-layout" of a target
/// specification, binding the fields of \p err to its template.
Diagnostic
intoDiagnostic(TargetDataLayoutErrors err, DiagnosticLevel level,
               DiagnosticLocation emittedAt = DiagnosticLocation::caller());

/// Turn every DataLayoutError in \p err into a diagnostic appended to
/// \p diags.
///
/// \returns the errors that are not data layout errors.
llvm::Error diagnoseDataLayoutErrors(llvm::Error err, DiagnosticLevel level,
                                     SmallVectorImpl<Diagnostic> &diags);

} // end namespace quill

#endif // QUILL_AST_TARGETDIAGNOSTICS_H
