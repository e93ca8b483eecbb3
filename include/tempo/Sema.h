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

#include "tempo/AST.h"
#include "tempo/Type.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringMap.h"
#include <memory>
#include <string>
#include <vector>

namespace tempo {

class Scope {
public:
  Scope *Parent = nullptr;
  llvm::StringMap<const Type *> Vars;
  llvm::StringMap<ClassType *> LocalTypes; // local classes

  Scope(Scope *P = nullptr) : Parent(P) {}

  void define(llvm::StringRef Name, const Type *T) { Vars[Name] = T; }

  const Type *lookupVar(llvm::StringRef Name) const {
    auto it = Vars.find(Name);
    if (it != Vars.end())
      return it->second;
    return Parent ? Parent->lookupVar(Name) : nullptr;
  }

  ClassType *lookupLocalType(llvm::StringRef Name) const {
    auto it = LocalTypes.find(Name);
    if (it != LocalTypes.end())
      return it->second;
    return Parent ? Parent->lookupLocalType(Name) : nullptr;
  }
};

/// Attributes compilation units with static types.
///
/// This is not a Java type checker: it never reports errors. Names it cannot
/// resolve, generic type variables and expressions whose type depends on
/// inference all get the error type, which the checks treat as "unknown".
/// Method calls are resolved by name and arity, then by argument
/// applicability, against the library model and the declarations of the
/// analysed units.
class Sema {
public:
  explicit Sema(TypeContext &Ctx) : m_Ctx(Ctx) {}
  ~Sema();

  /// Attribute a single unit (all three passes).
  void checkCompilationUnit(CompilationUnit &Unit);

  /// Attribute several units that may refer to each other's classes.
  void checkCompilationUnits(llvm::ArrayRef<CompilationUnit *> Units);

  /// Attribute a free-standing expression in the context of \p Unit
  /// (imports and package) with no enclosing class. For tools and tests.
  const Type *checkStandaloneExpr(CompilationUnit &Unit, Expr *E);

private:
  TypeContext &m_Ctx;
  Scope *CurrentScope = nullptr;
  CompilationUnit *m_Unit = nullptr;
  ClassType *m_CurrentClass = nullptr;
  unsigned m_LocalClassCounter = 0;

  // Per-unit import tables, rebuilt by setUnit.
  llvm::StringMap<std::string> m_SingleImports;       // Simple -> qualified
  std::vector<std::string> m_OnDemandImports;         // package or class
  llvm::StringMap<std::string> m_StaticSingleImports; // member -> class
  std::vector<std::string> m_StaticOnDemandImports;   // class

  void setUnit(CompilationUnit &Unit);

  // Scope management
  void enterScope();
  void exitScope();

  // Passes (Sema.cpp)
  void declareTypes(CompilationUnit &Unit);
  void declareClass(ClassDecl &Class, const std::string &QualifiedName,
                    ClassType *Outer);
  void declareMembers(ClassDecl &Class);
  void checkClassBody(ClassDecl &Class);
  void checkMethod(MethodDecl &Method);
  ClassType *declareLocalClass(ClassDecl &Class, const std::string &Suffix);

  // Types (Sema.cpp)
  const Type *resolveType(TypeNode *Node);
  const Type *resolveTypeName(llvm::StringRef Name);
  ClassType *resolveSimpleTypeName(llvm::StringRef Name);
  ClassType *lookupMemberType(const ClassType *Owner, llvm::StringRef Name);
  ClassType *lookupImportedClass(llvm::StringRef ClassName);

  // Statements (Sema_Stmt.cpp)
  void checkStmt(Stmt *S);
  void checkBlock(BlockStmt *Block);
  void checkLocalVarDecl(LocalVarDeclStmt *Decl);
  void checkVarInit(Expr *Init, const Type *Declared);

  // Expressions (Sema_Expr.cpp)
  const Type *checkExpr(Expr *E);
  const Type *checkName(NameExpr *Name);
  const Type *checkFieldAccess(FieldAccessExpr *Access);
  const Type *checkMethodCall(MethodCallExpr *Call);
  const Type *checkNew(NewExpr *New);
  const Type *checkBinary(BinaryExpr *Binary);
  const Type *checkConditional(ConditionalExpr *Cond);
  const Type *checkLambda(LambdaExpr *Lambda);

  const MethodInfo *
  selectMethod(llvm::ArrayRef<const MethodInfo *> Candidates,
               llvm::ArrayRef<const Type *> ArgTypes) const;
  void findUnqualifiedMethods(llvm::StringRef Name, size_t Arity,
                              llvm::SmallVectorImpl<const MethodInfo *> &Out);
  const FieldInfo *findUnqualifiedField(llvm::StringRef Name);

  // Type relations
  bool isAssignable(const Type *From, const Type *To) const;
  const Type *promoteNumeric(const Type *A, const Type *B) const;
  const Type *unaryPromote(const Type *T) const;
  bool isStringType(const Type *T) const;
};

} // namespace tempo
