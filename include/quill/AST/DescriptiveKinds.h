//===--- DescriptiveKinds.h - Kinds named in diagnostics --------*- C++ -*-===//
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
//  This file defines the small enumerations whose only job in a diagnostic is
//  to be named: the kind of a const context, of a definition, of an attribute
//  target, and so on.
//
//===----------------------------------------------------------------------===//

#ifndef QUILL_AST_DESCRIPTIVEKINDS_H
#define QUILL_AST_DESCRIPTIVEKINDS_H

#include "quill/Basic/Assertions.h"
#include "quill/Basic/DiagnosticArgTraits.h"
#include "quill/Basic/LLVM.h"
#include "llvm/ADT/StringRef.h"
#include <cstdint>

namespace quill {

/// The kind of body that is evaluated at compile time.
class ConstContext {
public:
  enum class Kind : uint8_t {
    ConstFn,
    Static,
    Const,
  };

private:
  Kind TheKind;
  bool Mutable = false;
  bool Inline = false;

  explicit ConstContext(Kind kind) : TheKind(kind) {}

public:
  static ConstContext getConstFn() { return ConstContext(Kind::ConstFn); }

  static ConstContext getStatic(bool isMutable) {
    ConstContext result(Kind::Static);
    result.Mutable = isMutable;
    return result;
  }

  /// \param isInline Whether this is an inline \c const { ... } block.
  static ConstContext getConst(bool isInline) {
    ConstContext result(Kind::Const);
    result.Inline = isInline;
    return result;
  }

  Kind getKind() const { return TheKind; }
  bool isMutable() const { return Mutable; }
  bool isInline() const { return Inline; }

  /// "const_fn", "static" or "const", used to select a message variant.
  StringRef getDiagIdent() const;

  /// Prints prose such as "constant function".
  void print(raw_ostream &OS) const;

  friend raw_ostream &operator<<(raw_ostream &OS, ConstContext ctx) {
    ctx.print(OS);
    return OS;
  }
};

template <>
struct DiagnosticArgTraits<ConstContext> {
  static DiagnosticArgValue intoDiagnosticArg(ConstContext ctx) {
    return DiagnosticArgValue::getString(ctx.getDiagIdent().str());
  }
};

/// The order generic parameter kinds must be declared in.
enum class ParamKindOrd : uint8_t {
  Lifetime,
  TypeOrConst,
};

raw_ostream &operator<<(raw_ostream &OS, ParamKindOrd kind);

/// Which of the closure traits a closure implements.
enum class ClosureKind : uint8_t {
  Fn,
  FnMut,
  FnOnce,
};

StringRef getClosureKindName(ClosureKind kind);

template <>
struct DiagnosticArgTraits<ClosureKind> {
  static DiagnosticArgValue intoDiagnosticArg(ClosureKind kind) {
    return DiagnosticArgValue::getString(getClosureKindName(kind).str());
  }
};

enum class FloatTy : uint8_t {
  F16,
  F32,
  F64,
  F128,
};

/// The type's name in source, e.g. "f32".
StringRef getFloatTyName(FloatTy ty);

template <>
struct DiagnosticArgTraits<FloatTy> {
  static DiagnosticArgValue intoDiagnosticArg(FloatTy ty) {
    return DiagnosticArgValue::getString(getFloatTyName(ty).str());
  }
};

/// The syntactic position an attribute is attached to.
enum class AttrTarget : uint8_t {
#define ATTR_TARGET(Id, Description) Id,
#include "quill/AST/AttrTargets.def"
};

StringRef getAttrTargetDescription(AttrTarget target);

raw_ostream &operator<<(raw_ostream &OS, AttrTarget target);

enum class DefKind : uint8_t {
#define DEF_KIND(Id, Description) Id,
#include "quill/AST/DefKinds.def"
};

StringRef getDefKindDescription(DefKind kind);

/// What a path resolved to.
class Res {
public:
  enum class Kind : uint8_t {
    /// A definition of some DefKind.
    Def,
    /// A primitive type such as \c u8.
    PrimTy,
    /// \c Self in a trait.
    SelfTyParam,
    /// \c Self in an impl.
    SelfTyAlias,
    /// \c Self used as a constructor.
    SelfCtor,
    Local,
    ToolMod,
    BuiltinAttr,
    ToolAttr,
    DeriveHelperAttr,
    /// Resolution failed.
    Err,
  };

private:
  Kind TheKind;
  DefKind Def = DefKind::Mod;

  explicit Res(Kind kind) : TheKind(kind) {}

public:
  static Res get(Kind kind) {
    ASSERT(kind != Kind::Def && "use getDef");
    return Res(kind);
  }

  static Res getDef(DefKind def) {
    Res result(Kind::Def);
    result.Def = def;
    return result;
  }

  Kind getKind() const { return TheKind; }

  DefKind getDefKind() const {
    ASSERT(TheKind == Kind::Def);
    return Def;
  }

  /// A phrase such as "tuple struct" or "local variable".
  StringRef getDescription() const;
};

template <>
struct DiagnosticArgTraits<Res> {
  static DiagnosticArgValue intoDiagnosticArg(Res res) {
    return DiagnosticArgValue::getString(res.getDescription().str());
  }
};

} // end namespace quill

#endif // QUILL_AST_DESCRIPTIVEKINDS_H
