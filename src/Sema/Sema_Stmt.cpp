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

void Sema::checkBlock(BlockStmt *Block) {
  if (!Block)
    return;
  enterScope();
  for (auto &S : Block->Statements)
    checkStmt(S.get());
  exitScope();
}

void Sema::checkVarInit(Expr *Init, const Type *Declared) {
  if (auto *ArrayInit = dynamic_cast<ArrayInitExpr *>(Init)) {
    // `T[] a = {...}` takes its type from the declaration.
    const Type *Element = m_Ctx.getError();
    if (Declared && Declared->isArray())
      Element = static_cast<const ArrayType *>(Declared)->ElementType;
    for (auto &E : ArrayInit->Elements)
      checkVarInit(E.get(), Element);
    ArrayInit->StaticType = Declared ? Declared : m_Ctx.getError();
    return;
  }
  checkExpr(Init);
}

void Sema::checkLocalVarDecl(LocalVarDeclStmt *Decl) {
  const Type *Declared =
      Decl->VarType->IsVar ? nullptr : resolveType(Decl->VarType.get());

  for (VarDeclarator &Var : Decl->Vars) {
    const Type *T = Declared ? m_Ctx.getArrayOf(Declared, Var.ExtraDims)
                             : nullptr;
    if (Var.Init)
      checkVarInit(Var.Init.get(), T);
    if (!T) {
      // `var x = init;`
      T = Var.Init && Var.Init->StaticType && !Var.Init->StaticType->isNull()
              ? Var.Init->StaticType
              : m_Ctx.getError();
      if (!Decl->VarType->Resolved)
        Decl->VarType->Resolved = T;
    }
    CurrentScope->define(Var.Name, T);
  }
}

void Sema::checkStmt(Stmt *S) {
  if (!S)
    return;

  if (auto *Block = dynamic_cast<BlockStmt *>(S)) {
    checkBlock(Block);
  } else if (auto *Decl = dynamic_cast<LocalVarDeclStmt *>(S)) {
    checkLocalVarDecl(Decl);
  } else if (auto *ES = dynamic_cast<ExprStmt *>(S)) {
    checkExpr(ES->Expression.get());
  } else if (auto *If = dynamic_cast<IfStmt *>(S)) {
    // Pattern bindings of the condition stay visible in both branches.
    enterScope();
    checkExpr(If->Condition.get());
    checkStmt(If->Then.get());
    checkStmt(If->Else.get());
    exitScope();
  } else if (auto *While = dynamic_cast<WhileStmt *>(S)) {
    enterScope();
    checkExpr(While->Condition.get());
    checkStmt(While->Body.get());
    exitScope();
  } else if (auto *For = dynamic_cast<ForStmt *>(S)) {
    enterScope();
    for (auto &Init : For->Init)
      checkStmt(Init.get());
    if (For->Condition)
      checkExpr(For->Condition.get());
    for (auto &Update : For->Updates)
      checkExpr(Update.get());
    checkStmt(For->Body.get());
    exitScope();
  } else if (auto *ForEach = dynamic_cast<ForEachStmt *>(S)) {
    const Type *IterType = checkExpr(ForEach->Iterable.get());
    enterScope();
    const Type *VarType = nullptr;
    if (ForEach->VarType->IsVar) {
      VarType = IterType->isArray()
                    ? static_cast<const ArrayType *>(IterType)->ElementType
                    : m_Ctx.getError();
      ForEach->VarType->Resolved = VarType;
    } else {
      VarType = resolveType(ForEach->VarType.get());
    }
    CurrentScope->define(ForEach->VarName, VarType);
    checkStmt(ForEach->Body.get());
    exitScope();
  } else if (auto *Ret = dynamic_cast<ReturnStmt *>(S)) {
    if (Ret->ReturnValue)
      checkExpr(Ret->ReturnValue.get());
  } else if (auto *Throw = dynamic_cast<ThrowStmt *>(S)) {
    checkExpr(Throw->Exception.get());
  } else if (auto *Labeled = dynamic_cast<LabeledStmt *>(S)) {
    checkStmt(Labeled->Body.get());
  } else if (auto *Assert = dynamic_cast<AssertStmt *>(S)) {
    checkExpr(Assert->Condition.get());
    if (Assert->Message)
      checkExpr(Assert->Message.get());
  } else if (auto *Sync = dynamic_cast<SynchronizedStmt *>(S)) {
    checkExpr(Sync->Lock.get());
    checkBlock(Sync->Body.get());
  } else if (auto *Try = dynamic_cast<TryStmt *>(S)) {
    enterScope(); // Resources
    for (auto &Resource : Try->Resources)
      checkStmt(Resource.get());
    checkBlock(Try->Body.get());
    exitScope();
    for (CatchClause &Catch : Try->Catches) {
      enterScope();
      const Type *CaughtType = m_Ctx.getError();
      for (auto &Alt : Catch.Types)
        CaughtType = resolveType(Alt.get());
      // A multi-catch parameter has the union type, which we do not model.
      if (Catch.Types.size() != 1)
        CaughtType = m_Ctx.getError();
      CurrentScope->define(Catch.Name, CaughtType);
      checkBlock(Catch.Body.get());
      exitScope();
    }
    checkBlock(Try->Finally.get());
  } else if (auto *Switch = dynamic_cast<SwitchStmt *>(S)) {
    checkExpr(Switch->Selector.get());
    enterScope(); // One scope for the whole switch block
    for (SwitchCase &Case : Switch->Cases) {
      for (auto &Label : Case.Labels) {
        // Enum labels are bare constant names of the selector's type.
        auto *Name = dynamic_cast<NameExpr *>(Label.get());
        const Type *Sel = Switch->Selector->StaticType;
        if (Name && Sel && Sel->isClass()) {
          const auto *EnumType = static_cast<const ClassType *>(Sel);
          if (const FieldInfo *F = EnumType->findField(Name->Name)) {
            Name->RefKind = NameRefKind::Field;
            Name->StaticType = F->FieldType;
            continue;
          }
        }
        checkExpr(Label.get());
      }
      for (auto &Body : Case.Body)
        checkStmt(Body.get());
    }
    exitScope();
  } else if (auto *Local = dynamic_cast<LocalClassStmt *>(S)) {
    ClassType *T = declareLocalClass(*Local->Class, Local->Class->Name);
    CurrentScope->LocalTypes[Local->Class->Name] = T;
    declareMembers(*Local->Class);
    checkClassBody(*Local->Class);
  }
  // EmptyStmt, JumpStmt: nothing to attribute.
}

} // namespace tempo
