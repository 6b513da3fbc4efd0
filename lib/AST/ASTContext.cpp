//===--- ASTContext.cpp - ASTContext Implementation -----------------------===//
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

#include "quill/AST/ASTContext.h"

using namespace quill;

ASTContext::ASTContext() : IdentifierTable(Allocator) {}

ASTContext::~ASTContext() = default;

Identifier ASTContext::getIdentifier(StringRef Str) const {
  // Make sure null pointers stay null.
  if (Str.data() == nullptr)
    return Identifier(nullptr);

  auto I = IdentifierTable.insert(std::make_pair(Str, char())).first;
  return Identifier(I->getKeyData());
}
