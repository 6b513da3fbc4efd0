//===--- LLVM.h - Import various common LLVM datatypes ----------*- C++ -*-===//
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
// This file forward declares and imports various common LLVM datatypes that
// Quill wants to use unqualified.
//
//===----------------------------------------------------------------------===//

#ifndef QUILL_BASIC_LLVM_H
#define QUILL_BASIC_LLVM_H

// Do not proliferate #includes here, require clients to #include their
// dependencies.
// Casting.h has complex templates that cannot be easily forward declared.
#include "llvm/Support/Casting.h"
// SmallVector has default template arguments that cannot be redeclared.
#include "llvm/ADT/SmallVector.h"

// Forward declarations.
namespace llvm {
  // Containers.
  class StringRef;
  class StringLiteral;
  class Twine;
  template <unsigned N> class SmallString;
  template<typename T> class ArrayRef;
  template<typename T> class MutableArrayRef;

  // Other common classes.
  class raw_ostream;
  class APInt;
  class APSInt;
  template <typename Fn> class function_ref;
} // end namespace llvm

namespace quill {
  // Casting operators.
  using llvm::isa;
  using llvm::cast;
  using llvm::dyn_cast;
  using llvm::dyn_cast_or_null;
  using llvm::cast_or_null;

  // Containers.
  using llvm::ArrayRef;
  using llvm::MutableArrayRef;
  using llvm::SmallString;
  using llvm::SmallVector;
  using llvm::SmallVectorImpl;
  using llvm::StringLiteral;
  using llvm::StringRef;
  using llvm::Twine;

  // Other common classes.
  using llvm::APInt;
  using llvm::APSInt;
  using llvm::function_ref;
  using llvm::raw_ostream;
} // end namespace quill

#endif // QUILL_BASIC_LLVM_H
