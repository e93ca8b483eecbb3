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

#include "tempo/SourceLocation.h"
#include "tempo/Token.h"
#include <memory>
#include <string>
#include <vector>

namespace tempo {

class Type;
class ClassType;

class ASTNode {
public:
  SourceRange Range;

  virtual ~ASTNode() = default;
  virtual std::string toString() const = 0;

  SourceLocation getLoc() const { return Range.Begin; }
  void setRange(SourceLocation B, SourceLocation E) { Range = {B, E}; }
};

template <typename T>
inline std::string joinNodes(const std::vector<std::unique_ptr<T>> &Nodes,
                             const char *Sep = ", ") {
  std::string s;
  for (size_t i = 0; i < Nodes.size(); ++i) {
    if (i > 0)
      s += Sep;
    s += Nodes[i] ? Nodes[i]->toString() : "<null>";
  }
  return s;
}

// --- Type syntax ---

/// A type as written: `int`, `LocalDate`, `java.time.Month[]`,
/// `Map<String, List<Instant>>`, `var`, `? extends Temporal`.
class TypeNode : public ASTNode {
public:
  std::string Name; // dotted, as written; empty for wildcards
  std::vector<std::unique_ptr<TypeNode>> TypeArgs;
  unsigned ArrayDims = 0;
  bool IsPrimitive = false;
  bool IsWildcard = false;
  bool IsVar = false; // local variable type inference

  const Type *Resolved = nullptr; // filled in by Sema

  TypeNode(const std::string &name) : Name(name) {}
  std::string toString() const override {
    std::string s = IsWildcard ? "?" : Name;
    if (!TypeArgs.empty())
      s += "<" + joinNodes(TypeArgs) + ">";
    for (unsigned i = 0; i < ArrayDims; ++i)
      s += "[]";
    return s;
  }
};

// --- Expressions ---

class Expr : public ASTNode {
public:
  const Type *StaticType = nullptr; // filled in by Sema
};

class Stmt : public ASTNode {};

class LiteralExpr : public Expr {
public:
  enum LiteralKind { Int, Long, Float, Double, Char, String, Bool, Null };
  LiteralKind Kind;
  std::string Text;
  LiteralExpr(LiteralKind kind, const std::string &text)
      : Kind(kind), Text(text) {}
  std::string toString() const override { return "Lit(" + Text + ")"; }
};

/// What a name (or dotted name) refers to once Sema has looked at it.
enum class NameRefKind { Unresolved, Variable, Field, Type, Package };

class NameExpr : public Expr {
public:
  std::string Name;
  NameRefKind RefKind = NameRefKind::Unresolved;
  NameExpr(const std::string &name) : Name(name) {}
  std::string toString() const override { return "Name(" + Name + ")"; }
};

class FieldAccessExpr : public Expr {
public:
  std::unique_ptr<Expr> Object;
  std::string Name;
  NameRefKind RefKind = NameRefKind::Unresolved;
  FieldAccessExpr(std::unique_ptr<Expr> obj, const std::string &name)
      : Object(std::move(obj)), Name(name) {}
  std::string toString() const override {
    return Object->toString() + "." + Name;
  }
};

class MethodCallExpr : public Expr {
public:
  std::unique_ptr<Expr> Object; // null for unqualified calls
  std::string Method;
  std::vector<std::unique_ptr<Expr>> Args;
  SourceLocation NameLoc;

  // Filled in by Sema.
  const ClassType *Owner = nullptr; // class declaring the invoked method
  bool IsStatic = false;
  std::vector<const Type *> ParamTypes; // declared parameter types

  MethodCallExpr(std::unique_ptr<Expr> obj, const std::string &method,
                 std::vector<std::unique_ptr<Expr>> args)
      : Object(std::move(obj)), Method(method), Args(std::move(args)) {}
  std::string toString() const override {
    return "Call(" + (Object ? Object->toString() + "." : std::string()) +
           Method + "(" + joinNodes(Args) + "))";
  }
};

class ClassDecl;

class NewExpr : public Expr {
public:
  std::unique_ptr<TypeNode> InstanceType;
  std::vector<std::unique_ptr<Expr>> Args;
  std::unique_ptr<ClassDecl> AnonymousBody;
  NewExpr(std::unique_ptr<TypeNode> type,
          std::vector<std::unique_ptr<Expr>> args)
      : InstanceType(std::move(type)), Args(std::move(args)) {}
  std::string toString() const override {
    return "New(" + InstanceType->toString() + "(" + joinNodes(Args) + "))";
  }
};

class ArrayInitExpr : public Expr {
public:
  std::vector<std::unique_ptr<Expr>> Elements;
  ArrayInitExpr(std::vector<std::unique_ptr<Expr>> elems)
      : Elements(std::move(elems)) {}
  std::string toString() const override {
    return "{" + joinNodes(Elements) + "}";
  }
};

class NewArrayExpr : public Expr {
public:
  std::unique_ptr<TypeNode> ElementType; // ArrayDims counts every dimension
  std::vector<std::unique_ptr<Expr>> Dims;
  std::unique_ptr<ArrayInitExpr> Init;
  NewArrayExpr(std::unique_ptr<TypeNode> type,
               std::vector<std::unique_ptr<Expr>> dims,
               std::unique_ptr<ArrayInitExpr> init)
      : ElementType(std::move(type)), Dims(std::move(dims)),
        Init(std::move(init)) {}
  std::string toString() const override {
    return "NewArray(" + ElementType->toString() + ")";
  }
};

class ArrayAccessExpr : public Expr {
public:
  std::unique_ptr<Expr> Array;
  std::unique_ptr<Expr> Index;
  ArrayAccessExpr(std::unique_ptr<Expr> arr, std::unique_ptr<Expr> idx)
      : Array(std::move(arr)), Index(std::move(idx)) {}
  std::string toString() const override {
    return Array->toString() + "[" + Index->toString() + "]";
  }
};

class CastExpr : public Expr {
public:
  std::unique_ptr<TypeNode> TargetType;
  std::unique_ptr<Expr> Expression;
  CastExpr(std::unique_ptr<TypeNode> type, std::unique_ptr<Expr> expr)
      : TargetType(std::move(type)), Expression(std::move(expr)) {}
  std::string toString() const override {
    return "Cast(" + TargetType->toString() + ", " + Expression->toString() +
           ")";
  }
};

class ParenExpr : public Expr {
public:
  std::unique_ptr<Expr> Inner;
  ParenExpr(std::unique_ptr<Expr> inner) : Inner(std::move(inner)) {}
  std::string toString() const override {
    return "(" + Inner->toString() + ")";
  }
};

class UnaryExpr : public Expr {
public:
  TokenType Op;
  std::unique_ptr<Expr> RHS;
  UnaryExpr(TokenType op, std::unique_ptr<Expr> rhs)
      : Op(op), RHS(std::move(rhs)) {}
  std::string toString() const override {
    return "Unary(" + RHS->toString() + ")";
  }
};

class PostfixExpr : public Expr {
public:
  TokenType Op;
  std::unique_ptr<Expr> LHS;
  PostfixExpr(TokenType op, std::unique_ptr<Expr> lhs)
      : Op(op), LHS(std::move(lhs)) {}
  std::string toString() const override {
    return "Postfix(" + LHS->toString() + ")";
  }
};

class BinaryExpr : public Expr {
public:
  std::string Op;
  std::unique_ptr<Expr> LHS, RHS;
  BinaryExpr(const std::string &op, std::unique_ptr<Expr> lhs,
             std::unique_ptr<Expr> rhs)
      : Op(op), LHS(std::move(lhs)), RHS(std::move(rhs)) {}
  std::string toString() const override {
    return "Binary(" + Op + ", " + LHS->toString() + ", " + RHS->toString() +
           ")";
  }
};

class AssignExpr : public Expr {
public:
  std::string Op; // "=", "+=", ...
  std::unique_ptr<Expr> Target;
  std::unique_ptr<Expr> Value;
  AssignExpr(const std::string &op, std::unique_ptr<Expr> target,
             std::unique_ptr<Expr> value)
      : Op(op), Target(std::move(target)), Value(std::move(value)) {}
  std::string toString() const override {
    return "Assign(" + Target->toString() + " " + Op + " " +
           Value->toString() + ")";
  }
};

class ConditionalExpr : public Expr {
public:
  std::unique_ptr<Expr> Cond, Then, Else;
  ConditionalExpr(std::unique_ptr<Expr> c, std::unique_ptr<Expr> t,
                  std::unique_ptr<Expr> e)
      : Cond(std::move(c)), Then(std::move(t)), Else(std::move(e)) {}
  std::string toString() const override {
    return "Cond(" + Cond->toString() + " ? " + Then->toString() + " : " +
           Else->toString() + ")";
  }
};

class InstanceOfExpr : public Expr {
public:
  std::unique_ptr<Expr> Expression;
  std::unique_ptr<TypeNode> TestType;
  std::string BindingName; // pattern matching, may be empty
  InstanceOfExpr(std::unique_ptr<Expr> expr, std::unique_ptr<TypeNode> type)
      : Expression(std::move(expr)), TestType(std::move(type)) {}
  std::string toString() const override {
    return "InstanceOf(" + Expression->toString() + ", " +
           TestType->toString() + ")";
  }
};

class BlockStmt;

class LambdaExpr : public Expr {
public:
  struct Param {
    std::unique_ptr<TypeNode> ParamType; // null when implicitly typed
    std::string Name;
  };
  std::vector<Param> Params;
  std::unique_ptr<Expr> BodyExpr;
  std::unique_ptr<BlockStmt> BodyBlock;
  std::string toString() const override;
};

class MethodRefExpr : public Expr {
public:
  std::unique_ptr<Expr> Object;
  std::string Name; // "new" for constructor references
  MethodRefExpr(std::unique_ptr<Expr> obj, const std::string &name)
      : Object(std::move(obj)), Name(name) {}
  std::string toString() const override {
    return "MethodRef(" + Object->toString() + "::" + Name + ")";
  }
};

class ThisExpr : public Expr {
public:
  bool IsSuper = false;
  ThisExpr(bool isSuper) : IsSuper(isSuper) {}
  std::string toString() const override { return IsSuper ? "super" : "this"; }
};

class ClassLiteralExpr : public Expr {
public:
  std::unique_ptr<TypeNode> OfType;
  ClassLiteralExpr(std::unique_ptr<TypeNode> type) : OfType(std::move(type)) {}
  std::string toString() const override {
    return OfType->toString() + ".class";
  }
};

// --- Statements ---

class BlockStmt : public Stmt {
public:
  std::vector<std::unique_ptr<Stmt>> Statements;
  std::string toString() const override {
    return "Block{" + joinNodes(Statements, "; ") + "}";
  }
};

struct VarDeclarator {
  std::string Name;
  SourceRange NameRange;
  unsigned ExtraDims = 0; // `int a[]`
  std::unique_ptr<Expr> Init;
};

class LocalVarDeclStmt : public Stmt {
public:
  unsigned Modifiers = 0;
  std::unique_ptr<TypeNode> VarType;
  std::vector<VarDeclarator> Vars;
  std::string toString() const override {
    std::string s = "Var(" + VarType->toString();
    for (const auto &V : Vars) {
      s += " " + V.Name;
      if (V.Init)
        s += " = " + V.Init->toString();
    }
    return s + ")";
  }
};

class ExprStmt : public Stmt {
public:
  std::unique_ptr<Expr> Expression;
  ExprStmt(std::unique_ptr<Expr> expr) : Expression(std::move(expr)) {}
  std::string toString() const override { return Expression->toString(); }
};

class EmptyStmt : public Stmt {
public:
  std::string toString() const override { return "Empty"; }
};

class IfStmt : public Stmt {
public:
  std::unique_ptr<Expr> Condition;
  std::unique_ptr<Stmt> Then;
  std::unique_ptr<Stmt> Else;
  std::string toString() const override {
    return "If(" + Condition->toString() + ", " + Then->toString() +
           (Else ? ", " + Else->toString() : std::string()) + ")";
  }
};

class WhileStmt : public Stmt {
public:
  std::unique_ptr<Expr> Condition;
  std::unique_ptr<Stmt> Body;
  bool IsDoWhile = false;
  std::string toString() const override {
    return std::string(IsDoWhile ? "DoWhile(" : "While(") +
           Condition->toString() + ", " + Body->toString() + ")";
  }
};

class ForStmt : public Stmt {
public:
  std::vector<std::unique_ptr<Stmt>> Init;
  std::unique_ptr<Expr> Condition; // may be null
  std::vector<std::unique_ptr<Expr>> Updates;
  std::unique_ptr<Stmt> Body;
  std::string toString() const override {
    return "For(" + joinNodes(Init) + "; " +
           (Condition ? Condition->toString() : std::string()) + "; " +
           joinNodes(Updates) + ", " + Body->toString() + ")";
  }
};

class ForEachStmt : public Stmt {
public:
  std::unique_ptr<TypeNode> VarType;
  std::string VarName;
  std::unique_ptr<Expr> Iterable;
  std::unique_ptr<Stmt> Body;
  std::string toString() const override {
    return "ForEach(" + VarType->toString() + " " + VarName + " : " +
           Iterable->toString() + ", " + Body->toString() + ")";
  }
};

class ReturnStmt : public Stmt {
public:
  std::unique_ptr<Expr> ReturnValue;
  std::string toString() const override {
    return "Return(" + (ReturnValue ? ReturnValue->toString() : "") + ")";
  }
};

class ThrowStmt : public Stmt {
public:
  std::unique_ptr<Expr> Exception;
  std::string toString() const override {
    return "Throw(" + Exception->toString() + ")";
  }
};

class JumpStmt : public Stmt {
public:
  bool IsBreak;
  std::string Label;
  JumpStmt(bool isBreak) : IsBreak(isBreak) {}
  std::string toString() const override {
    return IsBreak ? "Break" : "Continue";
  }
};

class LabeledStmt : public Stmt {
public:
  std::string Label;
  std::unique_ptr<Stmt> Body;
  std::string toString() const override {
    return Label + ": " + Body->toString();
  }
};

class AssertStmt : public Stmt {
public:
  std::unique_ptr<Expr> Condition;
  std::unique_ptr<Expr> Message;
  std::string toString() const override {
    return "Assert(" + Condition->toString() + ")";
  }
};

class SynchronizedStmt : public Stmt {
public:
  std::unique_ptr<Expr> Lock;
  std::unique_ptr<BlockStmt> Body;
  std::string toString() const override {
    return "Synchronized(" + Lock->toString() + ", " + Body->toString() + ")";
  }
};

struct CatchClause {
  std::vector<std::unique_ptr<TypeNode>> Types; // multi-catch alternatives
  std::string Name;
  std::unique_ptr<BlockStmt> Body;
};

class TryStmt : public Stmt {
public:
  std::vector<std::unique_ptr<Stmt>> Resources; // declarations or expressions
  std::unique_ptr<BlockStmt> Body;
  std::vector<CatchClause> Catches;
  std::unique_ptr<BlockStmt> Finally;
  std::string toString() const override {
    return "Try(" + Body->toString() + ")";
  }
};

struct SwitchCase {
  std::vector<std::unique_ptr<Expr>> Labels; // empty for `default`
  std::vector<std::unique_ptr<Stmt>> Body;
};

class SwitchStmt : public Stmt {
public:
  std::unique_ptr<Expr> Selector;
  std::vector<SwitchCase> Cases;
  std::string toString() const override {
    return "Switch(" + Selector->toString() + ")";
  }
};

class LocalClassStmt : public Stmt {
public:
  std::unique_ptr<ClassDecl> Class;
  std::string toString() const override;
};

// --- Declarations ---

enum Modifier : unsigned {
  ModPublic = 1 << 0,
  ModPrivate = 1 << 1,
  ModProtected = 1 << 2,
  ModStatic = 1 << 3,
  ModFinal = 1 << 4,
  ModAbstract = 1 << 5,
  ModDefault = 1 << 6,
  ModOther = 1 << 7,
};

class Decl : public ASTNode {
public:
  unsigned Modifiers = 0;
  bool isStatic() const { return (Modifiers & ModStatic) != 0; }
};

class FieldDecl : public Decl {
public:
  std::unique_ptr<TypeNode> FieldType;
  std::vector<VarDeclarator> Vars;
  std::string toString() const override {
    std::string s = "Field(" + FieldType->toString();
    for (const auto &V : Vars) {
      s += " " + V.Name;
      if (V.Init)
        s += " = " + V.Init->toString();
    }
    return s + ")";
  }
};

class ParamDecl : public ASTNode {
public:
  std::unique_ptr<TypeNode> ParamType;
  std::string Name;
  bool IsVarArgs = false;
  std::string toString() const override {
    return ParamType->toString() + (IsVarArgs ? "... " : " ") + Name;
  }
};

class MethodDecl : public Decl {
public:
  std::unique_ptr<TypeNode> ReturnType; // null for constructors
  std::string Name;
  std::vector<std::unique_ptr<ParamDecl>> Params;
  std::unique_ptr<BlockStmt> Body; // null for abstract/native
  bool isConstructor() const { return !ReturnType; }
  std::string toString() const override {
    return "Method(" + (ReturnType ? ReturnType->toString() + " " : "") +
           Name + "(" + joinNodes(Params) + ")" +
           (Body ? " " + Body->toString() : std::string()) + ")";
  }
};

class InitializerDecl : public Decl {
public:
  std::unique_ptr<BlockStmt> Body;
  std::string toString() const override {
    return std::string(isStatic() ? "StaticInit " : "Init ") +
           Body->toString();
  }
};

class EnumConstantDecl : public Decl {
public:
  std::string Name;
  std::vector<std::unique_ptr<Expr>> Args;
  std::unique_ptr<ClassDecl> Body;
  std::string toString() const override {
    return "EnumConstant(" + Name + ")";
  }
};

class ClassDecl : public Decl {
public:
  enum ClassKind { Class, Interface, Enum, Annotation };
  ClassKind Kind = Class;
  std::string Name; // empty for anonymous classes
  std::unique_ptr<TypeNode> Extends;
  std::vector<std::unique_ptr<TypeNode>> Implements;
  std::vector<std::unique_ptr<EnumConstantDecl>> EnumConstants;
  std::vector<std::unique_ptr<Decl>> Members;

  ClassType *Symbol = nullptr; // filled in by Sema

  std::string toString() const override {
    std::string s = "Class(" + (Name.empty() ? "<anonymous>" : Name);
    if (!EnumConstants.empty())
      s += " " + joinNodes(EnumConstants);
    if (!Members.empty())
      s += " " + joinNodes(Members, " ");
    return s + ")";
  }
};

struct ImportDecl {
  std::string Name; // dotted, without the trailing `.*`
  bool IsStatic = false;
  bool IsOnDemand = false;
  SourceRange Range;
};

class CompilationUnit : public ASTNode {
public:
  std::string PackageName; // empty for the default package
  std::vector<ImportDecl> Imports;
  std::vector<std::unique_ptr<ClassDecl>> Types;
  std::string toString() const override {
    std::string s = "CompilationUnit(" + PackageName;
    for (const auto &I : Imports)
      s += std::string(" import ") + (I.IsStatic ? "static " : "") + I.Name +
           (I.IsOnDemand ? ".*" : "");
    for (const auto &T : Types)
      s += "\n  " + T->toString();
    return s + ")";
  }
};

inline std::string LambdaExpr::toString() const {
  std::string s = "Lambda(";
  for (const auto &P : Params)
    s += P.Name + " ";
  s += "-> ";
  if (BodyExpr)
    s += BodyExpr->toString();
  else if (BodyBlock)
    s += BodyBlock->toString();
  return s + ")";
}

inline std::string LocalClassStmt::toString() const {
  return "LocalClass(" + Class->toString() + ")";
}

} // namespace tempo
