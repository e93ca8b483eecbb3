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
#include "tempo/BugChecker.h"
#include "tempo/SourceManager.h"
#include "llvm/ADT/ArrayRef.h"
#include <vector>

namespace tempo {

/// CallSite over an attributed MethodCallExpr.
class ASTCallSite : public CallSite {
public:
  ASTCallSite(const MethodCallExpr &Call, const CompilationUnit &Unit,
              const SourceManager &SM)
      : m_Call(Call), m_Unit(Unit), m_SM(SM) {}

  bool isStaticCallTo(const char *Name, const char *ParamType) const override;
  std::string getEnclosingPackage() const override {
    return m_Unit.PackageName;
  }
  const Type *getReceiverType() const override;
  const Type *getArgumentType() const override;
  const Type *getResultType() const override { return m_Call.StaticType; }
  std::string getArgumentSource() const override;
  bool isArgumentPrimary() const override;
  SourceRange getCallRange() const override { return m_Call.Range; }
  SourceRange getArgumentRange() const override;

private:
  const MethodCallExpr &m_Call;
  const CompilationUnit &m_Unit;
  const SourceManager &m_SM;

  const Expr *getArgument() const {
    return m_Call.Args.size() == 1 ? m_Call.Args.front().get() : nullptr;
  }
};

/// Walks an attributed compilation unit in source order and runs every
/// registered check on each method call.
class Checker {
public:
  Checker(const SourceManager &SM, llvm::ArrayRef<const BugChecker *> Checks)
      : m_SM(SM), m_Checks(Checks.begin(), Checks.end()) {}

  std::vector<Finding> checkCompilationUnit(const CompilationUnit &Unit);

private:
  const SourceManager &m_SM;
  std::vector<const BugChecker *> m_Checks;
  const CompilationUnit *m_Unit = nullptr;
  std::vector<Finding> m_Findings;

  void visitClass(const ClassDecl *Class);
  void visitStmt(const Stmt *S);
  void visitExpr(const Expr *E);
  void visitCall(const MethodCallExpr *Call);
};

/// Prints \p F through the DiagnosticEngine, with a note for its fix.
void reportFinding(const Finding &F);

} // namespace tempo
