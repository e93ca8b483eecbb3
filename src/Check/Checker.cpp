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
#include "tempo/Checker.h"
#include "tempo/Type.h"

namespace tempo {

// --- ASTCallSite ---

static bool isValueExpr(const Expr *E) {
  if (auto *Name = dynamic_cast<const NameExpr *>(E))
    return Name->RefKind != NameRefKind::Type &&
           Name->RefKind != NameRefKind::Package;
  if (auto *Access = dynamic_cast<const FieldAccessExpr *>(E))
    return Access->RefKind != NameRefKind::Type &&
           Access->RefKind != NameRefKind::Package;
  return true;
}

bool ASTCallSite::isStaticCallTo(const char *Name,
                                 const char *ParamType) const {
  if (!m_Call.IsStatic || m_Call.Method != Name)
    return false;
  if (m_Call.ParamTypes.size() != 1 || m_Call.Args.size() != 1)
    return false;
  const Type *Param = m_Call.ParamTypes.front();
  return Param && Param->isClass() &&
         static_cast<const ClassType *>(Param)->QualifiedName == ParamType;
}

const Type *ASTCallSite::getReceiverType() const {
  if (m_Call.Object)
    return m_Call.Object->StaticType;
  return m_Call.Owner;
}

const Type *ASTCallSite::getArgumentType() const {
  const Expr *Arg = getArgument();
  if (!Arg || !isValueExpr(Arg))
    return nullptr;
  return Arg->StaticType;
}

std::string ASTCallSite::getArgumentSource() const {
  const Expr *Arg = getArgument();
  if (!Arg)
    return "";
  return std::string(m_SM.getText(Arg->Range));
}

bool ASTCallSite::isArgumentPrimary() const {
  const Expr *Arg = getArgument();
  return !Arg || dynamic_cast<const LiteralExpr *>(Arg) ||
         dynamic_cast<const NameExpr *>(Arg) ||
         dynamic_cast<const FieldAccessExpr *>(Arg) ||
         dynamic_cast<const MethodCallExpr *>(Arg) ||
         dynamic_cast<const NewExpr *>(Arg) ||
         dynamic_cast<const ArrayAccessExpr *>(Arg) ||
         dynamic_cast<const ParenExpr *>(Arg) ||
         dynamic_cast<const ThisExpr *>(Arg);
}

SourceRange ASTCallSite::getArgumentRange() const {
  const Expr *Arg = getArgument();
  return Arg ? Arg->Range : SourceRange();
}

// --- Checker ---

std::vector<Finding> Checker::checkCompilationUnit(const CompilationUnit &Unit) {
  m_Unit = &Unit;
  m_Findings.clear();
  for (auto &Class : Unit.Types)
    visitClass(Class.get());
  m_Unit = nullptr;
  return std::move(m_Findings);
}

void Checker::visitClass(const ClassDecl *Class) {
  if (!Class)
    return;

  for (auto &Constant : Class->EnumConstants) {
    for (auto &Arg : Constant->Args)
      visitExpr(Arg.get());
    visitClass(Constant->Body.get());
  }

  for (auto &Member : Class->Members) {
    if (auto *Field = dynamic_cast<const FieldDecl *>(Member.get())) {
      for (const VarDeclarator &Var : Field->Vars)
        visitExpr(Var.Init.get());
    } else if (auto *Method = dynamic_cast<const MethodDecl *>(Member.get())) {
      visitStmt(Method->Body.get());
    } else if (auto *Init =
                   dynamic_cast<const InitializerDecl *>(Member.get())) {
      visitStmt(Init->Body.get());
    } else if (auto *Nested = dynamic_cast<const ClassDecl *>(Member.get())) {
      visitClass(Nested);
    }
  }
}

void Checker::visitStmt(const Stmt *S) {
  if (!S)
    return;

  if (auto *Block = dynamic_cast<const BlockStmt *>(S)) {
    for (auto &Sub : Block->Statements)
      visitStmt(Sub.get());
  } else if (auto *Decl = dynamic_cast<const LocalVarDeclStmt *>(S)) {
    for (const VarDeclarator &Var : Decl->Vars)
      visitExpr(Var.Init.get());
  } else if (auto *ES = dynamic_cast<const ExprStmt *>(S)) {
    visitExpr(ES->Expression.get());
  } else if (auto *If = dynamic_cast<const IfStmt *>(S)) {
    visitExpr(If->Condition.get());
    visitStmt(If->Then.get());
    visitStmt(If->Else.get());
  } else if (auto *While = dynamic_cast<const WhileStmt *>(S)) {
    if (While->IsDoWhile) {
      visitStmt(While->Body.get());
      visitExpr(While->Condition.get());
    } else {
      visitExpr(While->Condition.get());
      visitStmt(While->Body.get());
    }
  } else if (auto *For = dynamic_cast<const ForStmt *>(S)) {
    for (auto &Init : For->Init)
      visitStmt(Init.get());
    visitExpr(For->Condition.get());
    for (auto &Update : For->Updates)
      visitExpr(Update.get());
    visitStmt(For->Body.get());
  } else if (auto *ForEach = dynamic_cast<const ForEachStmt *>(S)) {
    visitExpr(ForEach->Iterable.get());
    visitStmt(ForEach->Body.get());
  } else if (auto *Ret = dynamic_cast<const ReturnStmt *>(S)) {
    visitExpr(Ret->ReturnValue.get());
  } else if (auto *Throw = dynamic_cast<const ThrowStmt *>(S)) {
    visitExpr(Throw->Exception.get());
  } else if (auto *Labeled = dynamic_cast<const LabeledStmt *>(S)) {
    visitStmt(Labeled->Body.get());
  } else if (auto *Assert = dynamic_cast<const AssertStmt *>(S)) {
    visitExpr(Assert->Condition.get());
    visitExpr(Assert->Message.get());
  } else if (auto *Sync = dynamic_cast<const SynchronizedStmt *>(S)) {
    visitExpr(Sync->Lock.get());
    visitStmt(Sync->Body.get());
  } else if (auto *Try = dynamic_cast<const TryStmt *>(S)) {
    for (auto &Resource : Try->Resources)
      visitStmt(Resource.get());
    visitStmt(Try->Body.get());
    for (const CatchClause &Catch : Try->Catches)
      visitStmt(Catch.Body.get());
    visitStmt(Try->Finally.get());
  } else if (auto *Switch = dynamic_cast<const SwitchStmt *>(S)) {
    visitExpr(Switch->Selector.get());
    for (const SwitchCase &Case : Switch->Cases) {
      for (auto &Label : Case.Labels)
        visitExpr(Label.get());
      for (auto &Body : Case.Body)
        visitStmt(Body.get());
    }
  } else if (auto *Local = dynamic_cast<const LocalClassStmt *>(S)) {
    visitClass(Local->Class.get());
  }
}

void Checker::visitExpr(const Expr *E) {
  if (!E)
    return;

  if (auto *Call = dynamic_cast<const MethodCallExpr *>(E)) {
    // Qualifier and arguments are evaluated first, so their findings come
    // first too.
    visitExpr(Call->Object.get());
    for (auto &Arg : Call->Args)
      visitExpr(Arg.get());
    visitCall(Call);
  } else if (auto *Access = dynamic_cast<const FieldAccessExpr *>(E)) {
    visitExpr(Access->Object.get());
  } else if (auto *New = dynamic_cast<const NewExpr *>(E)) {
    for (auto &Arg : New->Args)
      visitExpr(Arg.get());
    visitClass(New->AnonymousBody.get());
  } else if (auto *NewArray = dynamic_cast<const NewArrayExpr *>(E)) {
    for (auto &Dim : NewArray->Dims)
      visitExpr(Dim.get());
    visitExpr(NewArray->Init.get());
  } else if (auto *ArrayInit = dynamic_cast<const ArrayInitExpr *>(E)) {
    for (auto &Elem : ArrayInit->Elements)
      visitExpr(Elem.get());
  } else if (auto *Index = dynamic_cast<const ArrayAccessExpr *>(E)) {
    visitExpr(Index->Array.get());
    visitExpr(Index->Index.get());
  } else if (auto *Cast = dynamic_cast<const CastExpr *>(E)) {
    visitExpr(Cast->Expression.get());
  } else if (auto *Paren = dynamic_cast<const ParenExpr *>(E)) {
    visitExpr(Paren->Inner.get());
  } else if (auto *Unary = dynamic_cast<const UnaryExpr *>(E)) {
    visitExpr(Unary->RHS.get());
  } else if (auto *Postfix = dynamic_cast<const PostfixExpr *>(E)) {
    visitExpr(Postfix->LHS.get());
  } else if (auto *Binary = dynamic_cast<const BinaryExpr *>(E)) {
    visitExpr(Binary->LHS.get());
    visitExpr(Binary->RHS.get());
  } else if (auto *Assign = dynamic_cast<const AssignExpr *>(E)) {
    visitExpr(Assign->Target.get());
    visitExpr(Assign->Value.get());
  } else if (auto *Cond = dynamic_cast<const ConditionalExpr *>(E)) {
    visitExpr(Cond->Cond.get());
    visitExpr(Cond->Then.get());
    visitExpr(Cond->Else.get());
  } else if (auto *InstOf = dynamic_cast<const InstanceOfExpr *>(E)) {
    visitExpr(InstOf->Expression.get());
  } else if (auto *Lambda = dynamic_cast<const LambdaExpr *>(E)) {
    visitExpr(Lambda->BodyExpr.get());
    visitStmt(Lambda->BodyBlock.get());
  } else if (auto *Ref = dynamic_cast<const MethodRefExpr *>(E)) {
    visitExpr(Ref->Object.get());
  }
}

void Checker::visitCall(const MethodCallExpr *Call) {
  ASTCallSite Site(*Call, *m_Unit, m_SM);
  for (const BugChecker *Check : m_Checks) {
    if (llvm::Optional<Finding> F = Check->matchCall(Site))
      m_Findings.push_back(std::move(*F));
  }
}

// --- Reporting ---

void reportFinding(const Finding &F) {
  DiagnosticEngine::reportFormatted(F.Range.Begin, F.ID, F.Message);
  if (DiagnosticEngine::getLevel(F.ID) == DiagLevel::Ignored)
    return;
  for (const Replacement &R : F.Fix.Replacements)
    DiagnosticEngine::report(F.Range.Begin, DiagID::NOTE_REPLACE_WITH, R.Text);
}

} // namespace tempo
