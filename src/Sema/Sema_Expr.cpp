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
#include "tempo/Sema.h"
#include <algorithm>

namespace tempo {

static bool isTypeOrPackageRef(const Expr *E, NameRefKind Kind) {
  if (auto *Name = dynamic_cast<const NameExpr *>(E))
    return Name->RefKind == Kind;
  if (auto *Access = dynamic_cast<const FieldAccessExpr *>(E))
    return Access->RefKind == Kind;
  return false;
}

/// Dotted text of a name or package reference (`java.time`).
static std::string getRefText(const Expr *E) {
  if (auto *Name = dynamic_cast<const NameExpr *>(E))
    return Name->Name;
  if (auto *Access = dynamic_cast<const FieldAccessExpr *>(E))
    return getRefText(Access->Object.get()) + "." + Access->Name;
  return "";
}

const Type *Sema::checkExpr(Expr *E) {
  if (!E)
    return m_Ctx.getError();

  const Type *T = m_Ctx.getError();

  if (auto *Lit = dynamic_cast<LiteralExpr *>(E)) {
    switch (Lit->Kind) {
    case LiteralExpr::Int:
      T = m_Ctx.getPrimitive("int");
      break;
    case LiteralExpr::Long:
      T = m_Ctx.getPrimitive("long");
      break;
    case LiteralExpr::Float:
      T = m_Ctx.getPrimitive("float");
      break;
    case LiteralExpr::Double:
      T = m_Ctx.getPrimitive("double");
      break;
    case LiteralExpr::Char:
      T = m_Ctx.getPrimitive("char");
      break;
    case LiteralExpr::String:
      T = m_Ctx.getStringType();
      break;
    case LiteralExpr::Bool:
      T = m_Ctx.getPrimitive("boolean");
      break;
    case LiteralExpr::Null:
      T = m_Ctx.getNull();
      break;
    }
  } else if (auto *Name = dynamic_cast<NameExpr *>(E)) {
    T = checkName(Name);
  } else if (auto *Access = dynamic_cast<FieldAccessExpr *>(E)) {
    T = checkFieldAccess(Access);
  } else if (auto *Call = dynamic_cast<MethodCallExpr *>(E)) {
    T = checkMethodCall(Call);
  } else if (auto *New = dynamic_cast<NewExpr *>(E)) {
    T = checkNew(New);
  } else if (auto *NewArray = dynamic_cast<NewArrayExpr *>(E)) {
    for (auto &Dim : NewArray->Dims)
      checkExpr(Dim.get());
    T = resolveType(NewArray->ElementType.get());
    if (NewArray->Init)
      checkVarInit(NewArray->Init.get(), T);
  } else if (auto *ArrayInit = dynamic_cast<ArrayInitExpr *>(E)) {
    // Only valid where a declaration supplies the type; see checkVarInit.
    for (auto &Elem : ArrayInit->Elements)
      checkExpr(Elem.get());
  } else if (auto *Index = dynamic_cast<ArrayAccessExpr *>(E)) {
    const Type *ArrT = checkExpr(Index->Array.get());
    checkExpr(Index->Index.get());
    if (ArrT->isArray())
      T = static_cast<const ArrayType *>(ArrT)->ElementType;
  } else if (auto *Cast = dynamic_cast<CastExpr *>(E)) {
    checkExpr(Cast->Expression.get());
    T = resolveType(Cast->TargetType.get());
  } else if (auto *Paren = dynamic_cast<ParenExpr *>(E)) {
    T = checkExpr(Paren->Inner.get());
  } else if (auto *Unary = dynamic_cast<UnaryExpr *>(E)) {
    const Type *Operand = checkExpr(Unary->RHS.get());
    if (Unary->Op == TokenType::Bang)
      T = m_Ctx.getPrimitive("boolean");
    else if (Unary->Op == TokenType::PlusPlus ||
             Unary->Op == TokenType::MinusMinus)
      T = Operand;
    else
      T = unaryPromote(Operand);
  } else if (auto *Postfix = dynamic_cast<PostfixExpr *>(E)) {
    T = checkExpr(Postfix->LHS.get());
  } else if (auto *Binary = dynamic_cast<BinaryExpr *>(E)) {
    T = checkBinary(Binary);
  } else if (auto *Assign = dynamic_cast<AssignExpr *>(E)) {
    T = checkExpr(Assign->Target.get());
    checkVarInit(Assign->Value.get(), T);
  } else if (auto *Cond = dynamic_cast<ConditionalExpr *>(E)) {
    T = checkConditional(Cond);
  } else if (auto *InstOf = dynamic_cast<InstanceOfExpr *>(E)) {
    checkExpr(InstOf->Expression.get());
    const Type *Tested = resolveType(InstOf->TestType.get());
    if (!InstOf->BindingName.empty())
      CurrentScope->define(InstOf->BindingName, Tested);
    T = m_Ctx.getPrimitive("boolean");
  } else if (auto *Lambda = dynamic_cast<LambdaExpr *>(E)) {
    T = checkLambda(Lambda);
  } else if (auto *Ref = dynamic_cast<MethodRefExpr *>(E)) {
    // The qualifier is attributed; the reference itself needs a target type.
    checkExpr(Ref->Object.get());
  } else if (auto *This = dynamic_cast<ThisExpr *>(E)) {
    if (m_CurrentClass) {
      T = m_CurrentClass;
      if (This->IsSuper && !m_CurrentClass->Supertypes.empty())
        T = m_CurrentClass->Supertypes.front();
    }
  } else if (auto *ClassLit = dynamic_cast<ClassLiteralExpr *>(E)) {
    resolveType(ClassLit->OfType.get());
    T = m_Ctx.getOrCreateClass("java.lang.Class");
  }

  E->StaticType = T;
  return T;
}

// --- Names ---

const Type *Sema::checkName(NameExpr *Name) {
  if (CurrentScope) {
    if (const Type *Var = CurrentScope->lookupVar(Name->Name)) {
      Name->RefKind = NameRefKind::Variable;
      return Var;
    }
  }

  if (const FieldInfo *Field = findUnqualifiedField(Name->Name)) {
    Name->RefKind = NameRefKind::Field;
    return Field->FieldType;
  }

  if (ClassType *T = resolveSimpleTypeName(Name->Name)) {
    Name->RefKind = NameRefKind::Type;
    return T;
  }

  if (m_Ctx.isKnownPackage(Name->Name)) {
    Name->RefKind = NameRefKind::Package;
    return m_Ctx.getError();
  }

  // Probably a package we have no classes for (`com` in com.acme.Foo).
  Name->RefKind = NameRefKind::Unresolved;
  return m_Ctx.getError();
}

const FieldInfo *Sema::findUnqualifiedField(llvm::StringRef Name) {
  for (const ClassType *C = m_CurrentClass; C; C = C->Outer) {
    if (const FieldInfo *F = C->findField(Name))
      return F;
  }

  auto single = m_StaticSingleImports.find(Name);
  if (single != m_StaticSingleImports.end()) {
    if (ClassType *Owner = m_Ctx.lookupClass(single->second)) {
      if (const FieldInfo *F = Owner->findField(Name))
        return F;
    }
  }
  for (const std::string &ClassName : m_StaticOnDemandImports) {
    if (ClassType *Owner = m_Ctx.lookupClass(ClassName)) {
      if (const FieldInfo *F = Owner->findField(Name))
        return F;
    }
  }
  return nullptr;
}

const Type *Sema::checkFieldAccess(FieldAccessExpr *Access) {
  Expr *Object = Access->Object.get();
  const Type *ObjT = checkExpr(Object);

  // java.time.LocalDate: the qualifier is a package, this may be a class.
  if (isTypeOrPackageRef(Object, NameRefKind::Package)) {
    std::string qualified = getRefText(Object) + "." + Access->Name;
    if (ClassType *C = m_Ctx.lookupClass(qualified)) {
      Access->RefKind = NameRefKind::Type;
      return C;
    }
    if (m_Ctx.isKnownPackage(qualified)) {
      Access->RefKind = NameRefKind::Package;
      return m_Ctx.getError();
    }
    return m_Ctx.getError();
  }

  if (isTypeOrPackageRef(Object, NameRefKind::Type) && ObjT->isClass()) {
    const auto *Owner = static_cast<const ClassType *>(ObjT);
    if (ClassType *Nested = lookupMemberType(Owner, Access->Name)) {
      Access->RefKind = NameRefKind::Type;
      return Nested;
    }
    if (const FieldInfo *F = Owner->findField(Access->Name)) {
      Access->RefKind = NameRefKind::Field;
      return F->FieldType;
    }
    return m_Ctx.getError();
  }

  if (ObjT->isArray() && Access->Name == "length") {
    Access->RefKind = NameRefKind::Field;
    return m_Ctx.getPrimitive("int");
  }

  if (ObjT->isClass()) {
    const auto *Owner = static_cast<const ClassType *>(ObjT);
    if (const FieldInfo *F = Owner->findField(Access->Name)) {
      Access->RefKind = NameRefKind::Field;
      return F->FieldType;
    }
  }
  return m_Ctx.getError();
}

// --- Calls ---

void Sema::findUnqualifiedMethods(
    llvm::StringRef Name, size_t Arity,
    llvm::SmallVectorImpl<const MethodInfo *> &Out) {
  // The innermost class declaring a method of that name wins.
  for (const ClassType *C = m_CurrentClass; C; C = C->Outer) {
    C->findMethods(Name, Arity, Out);
    if (!Out.empty())
      return;
  }

  auto single = m_StaticSingleImports.find(Name);
  if (single != m_StaticSingleImports.end()) {
    if (ClassType *Owner = m_Ctx.lookupClass(single->second))
      Owner->findMethods(Name, Arity, Out);
    if (!Out.empty())
      return;
  }
  for (const std::string &ClassName : m_StaticOnDemandImports) {
    if (ClassType *Owner = m_Ctx.lookupClass(ClassName))
      Owner->findMethods(Name, Arity, Out);
  }
}

const Type *Sema::checkMethodCall(MethodCallExpr *Call) {
  llvm::SmallVector<const Type *, 4> argTypes;
  for (auto &Arg : Call->Args)
    argTypes.push_back(checkExpr(Arg.get()));

  // this(...) / super(...)
  if (!Call->Object && (Call->Method == "this" || Call->Method == "super"))
    return m_Ctx.getVoid();

  llvm::SmallVector<const MethodInfo *, 8> candidates;
  bool staticOnly = false;

  if (!Call->Object) {
    findUnqualifiedMethods(Call->Method, argTypes.size(), candidates);
  } else {
    const Type *ObjT = checkExpr(Call->Object.get());
    if (isTypeOrPackageRef(Call->Object.get(), NameRefKind::Package))
      return m_Ctx.getError();
    staticOnly = isTypeOrPackageRef(Call->Object.get(), NameRefKind::Type);

    if (ObjT->isClass()) {
      static_cast<const ClassType *>(ObjT)->findMethods(
          Call->Method, argTypes.size(), candidates);
    } else if (ObjT->isArray() && Call->Method == "clone" &&
               argTypes.empty()) {
      return ObjT;
    } else if (!ObjT->isReference()) {
      return m_Ctx.getError();
    }
    // Interfaces and arrays still have Object's methods.
    if (candidates.empty() && !staticOnly)
      m_Ctx.getObjectType()->findMethods(Call->Method, argTypes.size(),
                                         candidates);
  }

  if (staticOnly) {
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [](const MethodInfo *M) {
                                      return !M->IsStatic;
                                    }),
                     candidates.end());
  }

  const MethodInfo *M = selectMethod(candidates, argTypes);
  if (!M)
    return m_Ctx.getError();

  Call->Owner = M->Owner;
  Call->IsStatic = M->IsStatic;
  Call->ParamTypes = M->ParamTypes;
  return M->ReturnType ? M->ReturnType : m_Ctx.getError();
}

const MethodInfo *
Sema::selectMethod(llvm::ArrayRef<const MethodInfo *> Candidates,
                   llvm::ArrayRef<const Type *> ArgTypes) const {
  if (Candidates.empty())
    return nullptr;
  if (Candidates.size() == 1)
    return Candidates.front();

  auto paramAt = [](const MethodInfo *M, size_t i) -> const Type * {
    if (M->IsVarArgs && i + 1 >= M->ParamTypes.size()) {
      const Type *Last = M->ParamTypes.back();
      if (Last->isArray())
        return static_cast<const ArrayType *>(Last)->ElementType;
      return Last;
    }
    return M->ParamTypes[i];
  };

  // Arguments of unknown type fit any parameter, so a call with such an
  // argument still resolves when the overloads agree on its shape.
  const MethodInfo *best = nullptr;
  for (const MethodInfo *M : Candidates) {
    bool applicable = true;
    for (size_t i = 0; i < ArgTypes.size() && applicable; ++i)
      applicable = isAssignable(ArgTypes[i], paramAt(M, i));
    if (!applicable)
      continue;
    if (!best) {
      best = M;
      continue;
    }
    // Prefer the candidate whose parameters are assignable to the others'.
    bool moreSpecific = true;
    for (size_t i = 0; i < ArgTypes.size() && moreSpecific; ++i)
      moreSpecific = isAssignable(paramAt(M, i), paramAt(best, i));
    if (moreSpecific)
      best = M;
  }
  return best;
}

const Type *Sema::checkNew(NewExpr *New) {
  for (auto &Arg : New->Args)
    checkExpr(Arg.get());
  const Type *T = resolveType(New->InstanceType.get());

  if (New->AnonymousBody) {
    ClassType *Anon = declareLocalClass(*New->AnonymousBody, "");
    if (T->isClass())
      Anon->Supertypes.push_back(static_cast<const ClassType *>(T));
    declareMembers(*New->AnonymousBody);
    checkClassBody(*New->AnonymousBody);
    return Anon;
  }
  return T;
}

const Type *Sema::checkLambda(LambdaExpr *Lambda) {
  enterScope();
  for (LambdaExpr::Param &P : Lambda->Params) {
    const Type *PT = P.ParamType ? resolveType(P.ParamType.get())
                                 : m_Ctx.getError();
    CurrentScope->define(P.Name, PT);
  }
  if (Lambda->BodyExpr)
    checkExpr(Lambda->BodyExpr.get());
  else
    checkBlock(Lambda->BodyBlock.get());
  exitScope();
  // A lambda's type is its target type, which is never inferred here.
  return m_Ctx.getError();
}

// --- Operators ---

const Type *Sema::checkBinary(BinaryExpr *Binary) {
  const Type *L = checkExpr(Binary->LHS.get());
  const Type *R = checkExpr(Binary->RHS.get());
  llvm::StringRef op = Binary->Op;

  if (op == "&&" || op == "||" || op == "==" || op == "!=" || op == "<" ||
      op == ">" || op == "<=" || op == ">=")
    return m_Ctx.getPrimitive("boolean");

  if (op == "+" && (isStringType(L) || isStringType(R)))
    return m_Ctx.getStringType();

  if (op == "&" || op == "|" || op == "^") {
    auto isBool = [](const Type *T) {
      return T->isPrimitive() &&
             static_cast<const PrimitiveType *>(T)->isBoolean();
    };
    if (isBool(L) && isBool(R))
      return m_Ctx.getPrimitive("boolean");
  }

  if (op == "<<" || op == ">>" || op == ">>>")
    return unaryPromote(L);

  return promoteNumeric(L, R);
}

const Type *Sema::checkConditional(ConditionalExpr *Cond) {
  checkExpr(Cond->Cond.get());
  const Type *A = checkExpr(Cond->Then.get());
  const Type *B = checkExpr(Cond->Else.get());

  if (A->isIdenticalTo(B))
    return A;
  if (A->isNull() && B->isReference())
    return B;
  if (B->isNull() && A->isReference())
    return A;
  if (A->isPrimitive() && B->isPrimitive())
    return promoteNumeric(A, B);
  // Mixed class types need a least upper bound; leave them unknown.
  return m_Ctx.getError();
}

// --- Type relations ---

bool Sema::isStringType(const Type *T) const {
  return m_Ctx.isNamedType(T, "java.lang.String");
}

const Type *Sema::unaryPromote(const Type *T) const {
  if (!T->isPrimitive())
    return m_Ctx.getError();
  const auto *P = static_cast<const PrimitiveType *>(T);
  if (P->isBoolean())
    return m_Ctx.getError();
  if (P->getPromotionRank() == 0)
    return m_Ctx.getPrimitive("int");
  return P;
}

const Type *Sema::promoteNumeric(const Type *A, const Type *B) const {
  const Type *PA = unaryPromote(A);
  const Type *PB = unaryPromote(B);
  if (PA->isError() || PB->isError())
    return m_Ctx.getError();
  int rankA = static_cast<const PrimitiveType *>(PA)->getPromotionRank();
  int rankB = static_cast<const PrimitiveType *>(PB)->getPromotionRank();
  return rankA >= rankB ? PA : PB;
}

bool Sema::isAssignable(const Type *From, const Type *To) const {
  if (!From || !To || From->isError() || To->isError())
    return true; // unknown: do not rule the candidate out
  if (From == To)
    return true;

  if (From->isPrimitive() && To->isPrimitive()) {
    const auto *F = static_cast<const PrimitiveType *>(From);
    const auto *T = static_cast<const PrimitiveType *>(To);
    if (F->isBoolean() || T->isBoolean())
      return false;
    if (T->Name == "char" || T->Name == "byte" || T->Name == "short")
      return false;
    int rankT = T->getPromotionRank();
    int rankF = F->getPromotionRank();
    return rankF <= rankT;
  }

  if (From->isNull())
    return To->isReference();

  if (To->isClass()) {
    const auto *Target = static_cast<const ClassType *>(To);
    if (Target->QualifiedName == "java.lang.Object")
      return From->isReference() || From->isPrimitive(); // boxing
    if (From->isClass())
      return static_cast<const ClassType *>(From)->isSubtypeOf(Target);
    return false;
  }

  if (From->isArray() && To->isArray())
    return isAssignable(static_cast<const ArrayType *>(From)->ElementType,
                        static_cast<const ArrayType *>(To)->ElementType);
  return false;
}

} // namespace tempo
