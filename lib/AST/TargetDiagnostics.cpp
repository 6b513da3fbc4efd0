//===--- TargetDiagnostics.cpp - Diagnosing target specs ------------------===//
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

#include "quill/AST/TargetDiagnostics.h"
#include "quill/AST/DiagnosticIDs.h"
#include "llvm/ADT/STLExtras.h"

using namespace quill;

Diagnostic quill::intoDiagnostic(TargetDataLayoutErrors err,
                                 DiagnosticLevel level,
                                 DiagnosticLocation emittedAt) {
  return std::visit(
      llvm::makeVisitor(
          [&](InvalidAddressSpaceError &E) {
            Diagnostic diag(level, DiagID::errors_target_invalid_address_space,
                            emittedAt);
            diag.arg("addr_space", std::move(E.AddrSpace))
                .arg("cause", std::move(E.Cause))
                .arg("err", E.Err);
            return diag;
          },
          [&](InvalidBitsError &E) {
            Diagnostic diag(level, DiagID::errors_target_invalid_bits,
                            emittedAt);
            diag.arg("kind", std::move(E.Kind))
                .arg("bit", std::move(E.Bit))
                .arg("cause", std::move(E.Cause))
                .arg("err", E.Err);
            return diag;
          },
          [&](MissingAlignmentError &E) {
            Diagnostic diag(level, DiagID::errors_target_missing_alignment,
                            emittedAt);
            diag.arg("cause", std::move(E.Cause));
            return diag;
          },
          [&](InvalidAlignmentError &E) {
            Diagnostic diag(level, DiagID::errors_target_invalid_alignment,
                            emittedAt);
            diag.arg("cause", std::move(E.Cause))
                .arg("err_kind", E.Err.getDiagIdent())
                .arg("align", E.Err.getAlign());
            return diag;
          },
          [&](InconsistentTargetArchitectureError &E) {
            Diagnostic diag(level,
                            DiagID::errors_target_inconsistent_architecture,
                            emittedAt);
            diag.arg("dl", std::move(E.DL)).arg("target", std::move(E.Target));
            return diag;
          },
          [&](InconsistentTargetPointerWidthError &E) {
            Diagnostic diag(level,
                            DiagID::errors_target_inconsistent_pointer_width,
                            emittedAt);
            diag.arg("pointer_size", E.PointerSize).arg("target", E.Target);
            return diag;
          },
          [&](InvalidBitsSizeError &E) {
            Diagnostic diag(level, DiagID::errors_target_invalid_bits_size,
                            emittedAt);
            diag.arg("err", std::move(E.Err));
            return diag;
          }),
      err);
}

llvm::Error quill::diagnoseDataLayoutErrors(llvm::Error err,
                                            DiagnosticLevel level,
                                            SmallVectorImpl<Diagnostic> &diags) {
  return llvm::handleErrors(std::move(err), [&](DataLayoutError &E) {
    diags.push_back(intoDiagnostic(E.takeError(), level));
  });
}
