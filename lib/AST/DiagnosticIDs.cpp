//===--- DiagnosticIDs.cpp - Diagnostic template keys ---------------------===//
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

#include "quill/AST/DiagnosticIDs.h"
#include "quill/Basic/Assertions.h"

using namespace quill;

static constexpr const char *const diagnosticSlugs[] = {
#define DIAG(ROLE, ID, Text) #ID,
#include "quill/AST/DiagnosticIDs.def"
};

static constexpr const char *const diagnosticTemplates[] = {
#define DIAG(ROLE, ID, Text) Text,
#include "quill/AST/DiagnosticIDs.def"
};

static constexpr DiagnosticRole diagnosticRoles[] = {
#define DIAG(ROLE, ID, Text) DiagnosticRole::ROLE,
#include "quill/AST/DiagnosticIDs.def"
};

static_assert(sizeof(diagnosticSlugs) / sizeof(diagnosticSlugs[0]) ==
                  NumDiagIDs,
              "array size mismatch");
static_assert(sizeof(diagnosticRoles) / sizeof(diagnosticRoles[0]) ==
                  NumDiagIDs,
              "array size mismatch");

StringRef quill::getDiagnosticSlug(DiagID ID) {
  ASSERT(unsigned(ID) < NumDiagIDs && "invalid DiagID");
  return diagnosticSlugs[unsigned(ID)];
}

DiagnosticRole quill::getDiagnosticRole(DiagID ID) {
  ASSERT(unsigned(ID) < NumDiagIDs && "invalid DiagID");
  return diagnosticRoles[unsigned(ID)];
}

StringRef quill::getDiagnosticTemplate(DiagID ID) {
  ASSERT(unsigned(ID) < NumDiagIDs && "invalid DiagID");
  return diagnosticTemplates[unsigned(ID)];
}
