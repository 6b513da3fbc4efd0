//===--- Assertions.h - Assertion macros ------------------------*- C++ -*-===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2024 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See https://swift.org/LICENSE.txt for license information
// See https://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//
//
// This file provides two alternatives to the C/C++ standard `assert()`
// macro:
//
//  ASSERT(expr) is always compiled in and always checked, in debug and
//  release builds alike. Use it for invariants whose violation would leave
//  a diagnostic in a corrupt state.
//
//  ABORT(message) reports a fatal internal error and terminates.
//
//===----------------------------------------------------------------------===//

#ifndef QUILL_BASIC_ASSERTIONS_H
#define QUILL_BASIC_ASSERTIONS_H

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

#if defined(__clang__) || defined(__GNUC__)
#define ASSERT_UNLIKELY(expression) (__builtin_expect(!!(expression), 0))
#else
#define ASSERT_UNLIKELY(expression) ((expression))
#endif

#define ASSERT(expr)                                                           \
  do {                                                                         \
    if (ASSERT_UNLIKELY(!(expr))) {                                            \
      ASSERT_failure(#expr, __FILE__, __LINE__, __func__);                     \
    }                                                                          \
  } while (0)

#define ABORT(arg) _ABORT(__FILE__, __LINE__, __func__, (arg))

void ASSERT_failure(const char *expr, const char *file, int line,
                    const char *func);

[[noreturn]]
void _ABORT(const char *file, int line, const char *func,
            llvm::function_ref<void(llvm::raw_ostream &)> message);

[[noreturn]]
void _ABORT(const char *file, int line, const char *func,
            llvm::StringRef message);

#endif // QUILL_BASIC_ASSERTIONS_H
