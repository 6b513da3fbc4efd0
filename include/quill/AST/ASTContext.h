//===--- ASTContext.h - AST Context Object ----------------------*- C++ -*-===//
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
//  This file defines the ASTContext, which owns the memory of the syntax
//  fragments and the identifier table.
//
//===----------------------------------------------------------------------===//

#ifndef QUILL_AST_ASTCONTEXT_H
#define QUILL_AST_ASTCONTEXT_H

#include "quill/AST/Identifier.h"
#include "quill/Basic/LLVM.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Allocator.h"
#include <algorithm>
#include <cstring>
#include <type_traits>

namespace quill {

class ASTContext {
  ASTContext(const ASTContext &) = delete;
  void operator=(const ASTContext &) = delete;

  mutable llvm::BumpPtrAllocator Allocator;

  /// The uniqued spellings handed out by getIdentifier.
  mutable llvm::StringMap<char, llvm::BumpPtrAllocator &> IdentifierTable;

public:
  ASTContext();
  ~ASTContext();

  /// Return the uniqued identifier for \p Str.
  Identifier getIdentifier(StringRef Str) const;

  void *Allocate(size_t Bytes, unsigned Alignment) const {
    if (Bytes == 0)
      return nullptr;
    return Allocator.Allocate(Bytes, Alignment);
  }

  template <typename T>
  T *Allocate(size_t NumElts = 1) const {
    return static_cast<T *>(Allocate(sizeof(T) * NumElts, alignof(T)));
  }

  template <typename T>
  MutableArrayRef<T> AllocateCopy(ArrayRef<T> Array) const {
    static_assert(std::is_trivially_destructible<T>::value,
                  "arena memory is never destroyed");
    T *Result = Allocate<T>(Array.size());
    std::uninitialized_copy(Array.begin(), Array.end(), Result);
    return MutableArrayRef<T>(Result, Array.size());
  }

  StringRef AllocateCopy(StringRef Str) const {
    if (Str.empty())
      return StringRef();
    char *Result = Allocate<char>(Str.size());
    std::memcpy(Result, Str.data(), Str.size());
    return StringRef(Result, Str.size());
  }

  size_t getTotalMemory() const { return Allocator.getTotalMemory(); }
};

} // end namespace quill

#endif // QUILL_AST_ASTCONTEXT_H
