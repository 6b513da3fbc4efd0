//===--- DescriptiveKinds.cpp - Kinds named in diagnostics ----------------===//
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

#include "quill/AST/DescriptiveKinds.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

using namespace quill;

StringRef ConstContext::getDiagIdent() const {
  switch (TheKind) {
  case Kind::ConstFn:
    return "const_fn";
  case Kind::Static:
    return "static";
  case Kind::Const:
    return "const";
  }
  llvm_unreachable("Unhandled ConstContext::Kind in switch.");
}

void ConstContext::print(raw_ostream &OS) const {
  switch (TheKind) {
  case Kind::ConstFn:
    OS << "constant function";
    return;
  case Kind::Static:
    OS << "static";
    return;
  case Kind::Const:
    OS << "constant";
    return;
  }
  llvm_unreachable("Unhandled ConstContext::Kind in switch.");
}

raw_ostream &quill::operator<<(raw_ostream &OS, ParamKindOrd kind) {
  switch (kind) {
  case ParamKindOrd::Lifetime:
    return OS << "lifetime";
  case ParamKindOrd::TypeOrConst:
    return OS << "type and const";
  }
  llvm_unreachable("Unhandled ParamKindOrd in switch.");
}

StringRef quill::getClosureKindName(ClosureKind kind) {
  switch (kind) {
  case ClosureKind::Fn:
    return "Fn";
  case ClosureKind::FnMut:
    return "FnMut";
  case ClosureKind::FnOnce:
    return "FnOnce";
  }
  llvm_unreachable("Unhandled ClosureKind in switch.");
}

StringRef quill::getFloatTyName(FloatTy ty) {
  switch (ty) {
  case FloatTy::F16:
    return "f16";
  case FloatTy::F32:
    return "f32";
  case FloatTy::F64:
    return "f64";
  case FloatTy::F128:
    return "f128";
  }
  llvm_unreachable("Unhandled FloatTy in switch.");
}

StringRef quill::getAttrTargetDescription(AttrTarget target) {
  switch (target) {
#define ATTR_TARGET(Id, Description)                                           \
  case AttrTarget::Id:                                                         \
    return Description;
#include "quill/AST/AttrTargets.def"
  }
  llvm_unreachable("Unhandled AttrTarget in switch.");
}

raw_ostream &quill::operator<<(raw_ostream &OS, AttrTarget target) {
  return OS << getAttrTargetDescription(target);
}

StringRef quill::getDefKindDescription(DefKind kind) {
  switch (kind) {
#define DEF_KIND(Id, Description)                                              \
  case DefKind::Id:                                                            \
    return Description;
#include "quill/AST/DefKinds.def"
  }
  llvm_unreachable("Unhandled DefKind in switch.");
}

StringRef Res::getDescription() const {
  switch (TheKind) {
  case Kind::Def:
    return getDefKindDescription(Def);
  case Kind::PrimTy:
    return "builtin type";
  case Kind::SelfTyParam:
  case Kind::SelfTyAlias:
    return "self type";
  case Kind::SelfCtor:
    return "self constructor";
  case Kind::Local:
    return "local variable";
  case Kind::ToolMod:
    return "tool module";
  case Kind::BuiltinAttr:
    return "built-in attribute";
  case Kind::ToolAttr:
    return "tool attribute";
  case Kind::DeriveHelperAttr:
    return "derive helper attribute";
  case Kind::Err:
    return "unresolved item";
  }
  llvm_unreachable("Unhandled Res::Kind in switch.");
}
