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

namespace tempo {

Sema::~Sema() {
  while (CurrentScope)
    exitScope();
}

void Sema::enterScope() { CurrentScope = new Scope(CurrentScope); }

void Sema::exitScope() {
  Scope *Old = CurrentScope;
  CurrentScope = CurrentScope->Parent;
  delete Old;
}

void Sema::checkCompilationUnit(CompilationUnit &Unit) {
  CompilationUnit *units[] = {&Unit};
  checkCompilationUnits(units);
}

void Sema::checkCompilationUnits(llvm::ArrayRef<CompilationUnit *> Units) {
  // Every class must exist before any signature mentions it, and every
  // signature must exist before any body calls it.
  for (CompilationUnit *Unit : Units)
    declareTypes(*Unit);

  for (CompilationUnit *Unit : Units) {
    setUnit(*Unit);
    for (auto &Class : Unit->Types)
      declareMembers(*Class);
  }

  for (CompilationUnit *Unit : Units) {
    setUnit(*Unit);
    enterScope();
    for (auto &Class : Unit->Types)
      checkClassBody(*Class);
    exitScope();
  }
  m_Unit = nullptr;
}

const Type *Sema::checkStandaloneExpr(CompilationUnit &Unit, Expr *E) {
  setUnit(Unit);
  enterScope();
  const Type *T = checkExpr(E);
  exitScope();
  m_Unit = nullptr;
  return T;
}

void Sema::setUnit(CompilationUnit &Unit) {
  m_Unit = &Unit;
  m_CurrentClass = nullptr;
  m_SingleImports.clear();
  m_OnDemandImports.clear();
  m_StaticSingleImports.clear();
  m_StaticOnDemandImports.clear();

  for (const ImportDecl &Import : Unit.Imports) {
    llvm::StringRef name = Import.Name;
    if (Import.IsStatic) {
      if (Import.IsOnDemand) {
        m_StaticOnDemandImports.push_back(Import.Name);
      } else {
        auto parts = name.rsplit('.');
        m_StaticSingleImports[parts.second] = parts.first.str();
      }
      continue;
    }
    if (Import.IsOnDemand) {
      m_OnDemandImports.push_back(Import.Name);
    } else {
      m_SingleImports[name.rsplit('.').second] = Import.Name;
    }
  }
}

// --- Pass 1: classes ---

void Sema::declareTypes(CompilationUnit &Unit) {
  for (auto &Class : Unit.Types) {
    std::string qualified = Unit.PackageName.empty()
                                ? Class->Name
                                : Unit.PackageName + "." + Class->Name;
    declareClass(*Class, qualified, nullptr);
  }
}

void Sema::declareClass(ClassDecl &Class, const std::string &QualifiedName,
                        ClassType *Outer) {
  ClassType *T = m_Ctx.getOrCreateClass(QualifiedName);
  T->IsFromSource = true;
  T->IsInterface = Class.Kind == ClassDecl::Interface ||
                   Class.Kind == ClassDecl::Annotation;
  T->Outer = Outer;
  Class.Symbol = T;

  for (auto &Member : Class.Members) {
    if (auto *Nested = dynamic_cast<ClassDecl *>(Member.get()))
      declareClass(*Nested, QualifiedName + "." + Nested->Name, T);
  }
}

ClassType *Sema::declareLocalClass(ClassDecl &Class,
                                   const std::string &Suffix) {
  std::string base =
      m_CurrentClass ? m_CurrentClass->QualifiedName : std::string("$");
  std::string name = base + "$" + std::to_string(++m_LocalClassCounter) +
                     Suffix;
  declareClass(Class, name, m_CurrentClass);
  Class.Symbol->SimpleName = Suffix;
  return Class.Symbol;
}

// --- Pass 2: supertypes and member signatures ---

void Sema::declareMembers(ClassDecl &Class) {
  ClassType *T = Class.Symbol;
  if (!T)
    return;

  ClassType *savedClass = m_CurrentClass;
  m_CurrentClass = T;

  auto addSuper = [&](TypeNode *Node) {
    const Type *S = resolveType(Node);
    if (!S || !S->isClass())
      return;
    // Cyclic hierarchies are broken at the edge that would close the cycle.
    const auto *Super = static_cast<const ClassType *>(S);
    if (!Super->isSubtypeOf(T))
      T->Supertypes.push_back(Super);
  };
  if (Class.Extends)
    addSuper(Class.Extends.get());
  for (auto &Iface : Class.Implements)
    addSuper(Iface.get());
  if (T->Supertypes.empty() && T != m_Ctx.getObjectType())
    T->Supertypes.push_back(m_Ctx.getObjectType());

  if (Class.Kind == ClassDecl::Enum) {
    for (auto &Constant : Class.EnumConstants)
      T->addField(Constant->Name, T, /*IsStatic=*/true);
    T->addMethod("values", m_Ctx.getArrayOf(T), {}, /*IsStatic=*/true);
    T->addMethod("valueOf", T, {m_Ctx.getStringType()}, /*IsStatic=*/true);
    T->addMethod("name", m_Ctx.getStringType(), {}, /*IsStatic=*/false);
    T->addMethod("ordinal", m_Ctx.getPrimitive("int"), {},
                 /*IsStatic=*/false);
  }

  for (auto &Member : Class.Members) {
    if (auto *Field = dynamic_cast<FieldDecl *>(Member.get())) {
      const Type *FT = resolveType(Field->FieldType.get());
      for (const VarDeclarator &Var : Field->Vars)
        T->addField(Var.Name, m_Ctx.getArrayOf(FT, Var.ExtraDims),
                    Field->isStatic());
    } else if (auto *Method = dynamic_cast<MethodDecl *>(Member.get())) {
      if (Method->isConstructor())
        continue;
      std::vector<const Type *> params;
      bool isVarArgs = false;
      for (auto &Param : Method->Params) {
        if (Param->Name == "this")
          continue;
        params.push_back(resolveType(Param->ParamType.get()));
        isVarArgs = Param->IsVarArgs;
      }
      MethodInfo &M =
          T->addMethod(Method->Name, resolveType(Method->ReturnType.get()),
                       std::move(params), Method->isStatic());
      M.IsVarArgs = isVarArgs;
    } else if (auto *Nested = dynamic_cast<ClassDecl *>(Member.get())) {
      declareMembers(*Nested);
    }
  }

  m_CurrentClass = savedClass;
}

// --- Pass 3: bodies ---

void Sema::checkClassBody(ClassDecl &Class) {
  ClassType *savedClass = m_CurrentClass;
  m_CurrentClass = Class.Symbol;
  enterScope();

  for (auto &Constant : Class.EnumConstants) {
    for (auto &Arg : Constant->Args)
      checkExpr(Arg.get());
    if (Constant->Body) {
      ClassType *Anon = declareLocalClass(*Constant->Body, "");
      Anon->Supertypes.push_back(Class.Symbol);
      declareMembers(*Constant->Body);
      checkClassBody(*Constant->Body);
    }
  }

  for (auto &Member : Class.Members) {
    if (auto *Field = dynamic_cast<FieldDecl *>(Member.get())) {
      const Type *FT = resolveType(Field->FieldType.get());
      for (VarDeclarator &Var : Field->Vars) {
        if (Var.Init)
          checkVarInit(Var.Init.get(), m_Ctx.getArrayOf(FT, Var.ExtraDims));
      }
    } else if (auto *Method = dynamic_cast<MethodDecl *>(Member.get())) {
      checkMethod(*Method);
    } else if (auto *Init = dynamic_cast<InitializerDecl *>(Member.get())) {
      checkBlock(Init->Body.get());
    } else if (auto *Nested = dynamic_cast<ClassDecl *>(Member.get())) {
      checkClassBody(*Nested);
    }
  }

  exitScope();
  m_CurrentClass = savedClass;
}

void Sema::checkMethod(MethodDecl &Method) {
  enterScope(); // Parameters
  for (auto &Param : Method.Params) {
    if (Param->Name != "this")
      CurrentScope->define(Param->Name, resolveType(Param->ParamType.get()));
  }
  if (Method.Body)
    checkBlock(Method.Body.get());
  exitScope();
}

// --- Type names ---

const Type *Sema::resolveType(TypeNode *Node) {
  if (!Node)
    return m_Ctx.getVoid();
  if (Node->IsVar)
    return m_Ctx.getError(); // the caller infers it from the initializer

  for (auto &Arg : Node->TypeArgs)
    resolveType(Arg.get());

  const Type *base = nullptr;
  if (Node->IsWildcard) {
    // `? extends T` reads as T, a bare `?` as Object.
    base = Node->TypeArgs.empty() ? m_Ctx.getObjectType()
                                  : Node->TypeArgs.front()->Resolved;
  } else {
    base = resolveTypeName(Node->Name);
  }
  Node->Resolved = m_Ctx.getArrayOf(base, Node->ArrayDims);
  return Node->Resolved;
}

const Type *Sema::resolveTypeName(llvm::StringRef Name) {
  if (Name == "void")
    return m_Ctx.getVoid();
  if (const PrimitiveType *Prim = m_Ctx.getPrimitive(Name))
    return Prim;

  auto parts = Name.split('.');
  if (ClassType *Head = resolveSimpleTypeName(parts.first)) {
    // Outer.Inner
    ClassType *current = Head;
    llvm::StringRef rest = parts.second;
    while (current && !rest.empty()) {
      auto next = rest.split('.');
      current = lookupMemberType(current, next.first);
      rest = next.second;
    }
    if (current)
      return current;
    return m_Ctx.getError();
  }

  if (parts.second.empty())
    return m_Ctx.getError();

  // Fully qualified.
  if (ClassType *C = lookupImportedClass(Name))
    return C;
  return m_Ctx.getError();
}

ClassType *Sema::lookupMemberType(const ClassType *Owner,
                                  llvm::StringRef Name) {
  if (ClassType *Nested =
          m_Ctx.lookupClass(Owner->QualifiedName + "." + Name.str()))
    return Nested;
  for (const ClassType *Super : Owner->Supertypes) {
    if (ClassType *Inherited = lookupMemberType(Super, Name))
      return Inherited;
  }
  return nullptr;
}

ClassType *Sema::lookupImportedClass(llvm::StringRef ClassName) {
  if (ClassType *Known = m_Ctx.lookupClass(ClassName))
    return Known;
  llvm::StringRef package = ClassName.rsplit('.').first;
  if (m_Ctx.isKnownPackage(package))
    return nullptr;
  // An import of a class nobody described: a named type with no members.
  return m_Ctx.getOrCreateClass(ClassName);
}

ClassType *Sema::resolveSimpleTypeName(llvm::StringRef Name) {
  if (CurrentScope) {
    if (ClassType *Local = CurrentScope->lookupLocalType(Name))
      return Local;
  }

  for (const ClassType *C = m_CurrentClass; C; C = C->Outer) {
    if (C->SimpleName == Name && !C->SimpleName.empty())
      return const_cast<ClassType *>(C);
    if (ClassType *Member = lookupMemberType(C, Name))
      return Member;
  }

  if (!m_Unit)
    return nullptr;

  auto single = m_SingleImports.find(Name);
  if (single != m_SingleImports.end())
    return lookupImportedClass(single->second);

  std::string samePackage = m_Unit->PackageName.empty()
                                ? Name.str()
                                : m_Unit->PackageName + "." + Name.str();
  if (ClassType *Sibling = m_Ctx.lookupClass(samePackage))
    return Sibling;

  for (const std::string &Prefix : m_OnDemandImports) {
    if (ClassType *C = m_Ctx.lookupClass(Prefix + "." + Name.str()))
      return C;
  }
  for (const std::string &Prefix : m_StaticOnDemandImports) {
    if (ClassType *C = m_Ctx.lookupClass(Prefix + "." + Name.str()))
      return C;
  }

  return m_Ctx.lookupClass("java.lang." + Name.str());
}

} // namespace tempo
