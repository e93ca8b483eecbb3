// Copyright (c) 2025 YiZhonghua<zhyi@dpai.com>. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSet.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tempo {

/// Static types of the analysed Java program. Every Type is owned by a
/// TypeContext and interned there, so two types are the same type exactly
/// when their pointers are equal. The error type is the one exception: it is
/// identical to nothing, itself included.
class Type {
public:
  enum Kind { Primitive, Void, Null, Class, Array, Error };

  Kind typeKind;

  Type(Kind k) : typeKind(k) {}
  virtual ~Type() = default;

  virtual std::string toString() const = 0;

  bool isPrimitive() const { return typeKind == Primitive; }
  bool isVoid() const { return typeKind == Void; }
  bool isNull() const { return typeKind == Null; }
  bool isClass() const { return typeKind == Class; }
  bool isArray() const { return typeKind == Array; }
  bool isError() const { return typeKind == Error; }
  bool isReference() const {
    return typeKind == Class || typeKind == Array || typeKind == Null;
  }

  /// Exact identity; never true when either side is the error type.
  bool isIdenticalTo(const Type *Other) const {
    return Other == this && !isError();
  }
};

class PrimitiveType : public Type {
public:
  std::string Name; // int, long, boolean, ...
  PrimitiveType(const std::string &name) : Type(Primitive), Name(name) {}
  std::string toString() const override { return Name; }

  bool isBoolean() const { return Name == "boolean"; }
  bool isNumeric() const { return !isBoolean(); }
  /// Rank for binary numeric promotion: int < long < float < double.
  int getPromotionRank() const;
};

class VoidType : public Type {
public:
  VoidType() : Type(Void) {}
  std::string toString() const override { return "void"; }
};

class NullType : public Type {
public:
  NullType() : Type(Null) {}
  std::string toString() const override { return "<null>"; }
};

class ErrorType : public Type {
public:
  ErrorType() : Type(Error) {}
  std::string toString() const override { return "<error>"; }
};

class ArrayType : public Type {
public:
  const Type *ElementType;
  ArrayType(const Type *elem) : Type(Array), ElementType(elem) {}
  std::string toString() const override {
    return ElementType->toString() + "[]";
  }
};

class ClassType;

struct FieldInfo {
  std::string Name;
  const Type *FieldType = nullptr;
  bool IsStatic = false;
};

struct MethodInfo {
  std::string Name;
  std::vector<const Type *> ParamTypes;
  const Type *ReturnType = nullptr;
  bool IsStatic = false;
  bool IsVarArgs = false;
  const ClassType *Owner = nullptr;

  bool acceptsArity(size_t N) const {
    if (IsVarArgs)
      return N + 1 >= ParamTypes.size();
    return N == ParamTypes.size();
  }
};

/// A class, interface or enum, either declared in the analysed source or
/// described by the library model. Types that are merely named (an import of
/// a class we know nothing about) are classes without members.
class ClassType : public Type {
public:
  std::string QualifiedName; // java.time.LocalDate, pkg.Outer.Inner
  std::string SimpleName;
  bool IsInterface = false;
  bool IsFromSource = false;
  const ClassType *Outer = nullptr;
  std::vector<const ClassType *> Supertypes;
  std::vector<FieldInfo> Fields;
  std::vector<MethodInfo> Methods;

  ClassType(const std::string &qualified);
  std::string toString() const override { return QualifiedName; }

  /// Package part of the qualified name, enclosing classes excluded.
  std::string getPackageName() const;

  /// Field lookup through this class and its supertypes.
  const FieldInfo *findField(llvm::StringRef Name) const;

  /// All methods named \p Name that accept \p Arity arguments, most derived
  /// first.
  void findMethods(llvm::StringRef Name, size_t Arity,
                   llvm::SmallVectorImpl<const MethodInfo *> &Out) const;

  bool isSubtypeOf(const ClassType *Other) const;

  FieldInfo &addField(const std::string &Name, const Type *FieldType,
                      bool IsStatic);
  MethodInfo &addMethod(const std::string &Name, const Type *ReturnType,
                        std::vector<const Type *> Params, bool IsStatic);
};

/// The static-type queries a check asks of its host. TypeContext answers
/// them for the built-in frontend; tests may answer them however they like.
class TypeResolver {
public:
  virtual ~TypeResolver() = default;

  /// Exact static type identity. Unresolved types are identical to nothing.
  virtual bool isSameType(const Type *A, const Type *B) const = 0;

  /// True when \p T is the class named \p QualifiedName.
  virtual bool isNamedType(const Type *T,
                           llvm::StringRef QualifiedName) const = 0;

  /// True when the host could not determine \p T (absent or erroneous).
  virtual bool isUnresolved(const Type *T) const = 0;

  /// Fully qualified name of a class type, empty for anything else.
  virtual std::string getQualifiedName(const Type *T) const = 0;
};

/// Owns and interns all types of one analysis run.
class TypeContext : public TypeResolver {
public:
  TypeContext();

  const PrimitiveType *getPrimitive(llvm::StringRef Name) const;
  const Type *getVoid() const { return &m_Void; }
  const Type *getNull() const { return &m_Null; }
  const Type *getError() const { return &m_Error; }
  const Type *getArrayOf(const Type *Element, unsigned Dims = 1);

  /// Returns the class, creating an empty one on first use.
  ClassType *getOrCreateClass(llvm::StringRef QualifiedName);
  ClassType *lookupClass(llvm::StringRef QualifiedName) const;

  /// Parses `int`, `long[]`, `java.time.Month` style names. Unknown class
  /// names are created.
  const Type *getTypeByName(llvm::StringRef Name);

  bool isKnownPackage(llvm::StringRef Package) const {
    return m_Packages.count(Package) != 0;
  }

  /// Common java.lang types.
  ClassType *getObjectType() { return getOrCreateClass("java.lang.Object"); }
  ClassType *getStringType() { return getOrCreateClass("java.lang.String"); }

  // TypeResolver
  bool isSameType(const Type *A, const Type *B) const override;
  bool isNamedType(const Type *T,
                   llvm::StringRef QualifiedName) const override;
  bool isUnresolved(const Type *T) const override;
  std::string getQualifiedName(const Type *T) const override;

private:
  VoidType m_Void;
  NullType m_Null;
  ErrorType m_Error;
  llvm::StringMap<std::unique_ptr<PrimitiveType>> m_Primitives;
  llvm::StringMap<std::unique_ptr<ClassType>> m_Classes;
  llvm::StringSet<> m_Packages;
  std::map<const Type *, std::unique_ptr<ArrayType>> m_Arrays;
};

} // namespace tempo
