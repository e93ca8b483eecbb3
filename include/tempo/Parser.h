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
#include "tempo/DiagnosticEngine.h"
#include "tempo/Lexer.h"
#include <memory>
#include <vector>

namespace tempo {

/// Recursive descent parser for the Java subset the checker understands.
/// Errors go to the DiagnosticEngine; the parser resynchronizes at statement
/// and member boundaries so one typo does not hide the rest of the file.
class Parser {
public:
  Parser(const std::vector<Token> &tokens) : m_Tokens(tokens), m_Pos(0) {}

  // Top level
  std::unique_ptr<CompilationUnit> parseCompilationUnit();

  /// Parse a single expression (used by tests and tools).
  std::unique_ptr<Expr> parseStandaloneExpr();

  unsigned getNumErrors() const { return m_NumErrors; }

  /// Combined depth of nested expressions, statements, types and class
  /// bodies the parser accepts.
  static constexpr unsigned MaxNestingDepth = 1024;

private:
  const std::vector<Token> &m_Tokens;
  size_t m_Pos;
  unsigned m_NumErrors = 0;
  size_t m_LastErrorPos = static_cast<size_t>(-1);
  unsigned m_Depth = 0;

  /// Counts one level of recursion for as long as it is alive.
  class NestingScope {
  public:
    explicit NestingScope(Parser &P) : m_P(P) { ++m_P.m_Depth; }
    ~NestingScope() { --m_P.m_Depth; }
    NestingScope(const NestingScope &) = delete;
    NestingScope &operator=(const NestingScope &) = delete;

  private:
    Parser &m_P;
  };

  /// False once MaxNestingDepth is exceeded. The first time, reports it and
  /// moves to end of input so every caller unwinds without further errors.
  bool checkNesting();

  // Helpers
  const Token &peek() const;
  const Token &peekAt(size_t offset) const;
  const Token &previous() const;
  Token advance();
  bool isAtEnd() const { return peek().Kind == TokenType::EndOfFile; }
  bool check(TokenType type) const;
  bool checkAt(size_t offset, TokenType type) const;
  bool checkIdent(const char *text) const;
  bool match(TokenType type);
  Token consume(TokenType type, const char *what);
  void error(const Token &tok, DiagID id);
  void errorExpected(const char *what);
  void synchronizeStmt();
  void synchronizeMember();
  void skipBalanced(TokenType open, TokenType close);
  bool adjacent(size_t offset) const;

  template <typename T> void finish(T &node, const Token &start) {
    node.setRange(start.Loc, previous().EndLoc);
  }

  // Declarations (Parser_Decl.cpp)
  void parseImport(CompilationUnit &Unit);
  std::string parseQualifiedName();
  unsigned parseModifiers();
  void skipAnnotation();
  void skipAnnotations();
  void skipTypeParams();
  bool isTypeDeclStart() const;
  std::unique_ptr<ClassDecl> parseClassDecl(unsigned modifiers,
                                            const Token &start);
  void parseClassBody(ClassDecl &Class);
  void parseEnumConstants(ClassDecl &Class);
  void parseMember(ClassDecl &Class);
  std::vector<std::unique_ptr<ParamDecl>> parseParams();
  void parseDeclarators(std::vector<VarDeclarator> &Vars);

  // Types (Parser.cpp)
  std::unique_ptr<TypeNode> parseType();
  void parseTypeArgs(TypeNode &Type);
  bool skipTypeQuiet();
  bool skipTypeArgsQuiet();

  // Statements (Parser_Stmt.cpp)
  std::unique_ptr<BlockStmt> parseBlock();
  std::unique_ptr<Stmt> parseStmt();
  bool isLocalVarDeclStart();
  std::unique_ptr<LocalVarDeclStmt> parseLocalVarDecl(bool requireSemi);
  std::unique_ptr<Stmt> parseIf();
  std::unique_ptr<Stmt> parseWhile();
  std::unique_ptr<Stmt> parseDoWhile();
  std::unique_ptr<Stmt> parseFor();
  std::unique_ptr<Stmt> parseTry();
  std::unique_ptr<Stmt> parseSwitch();
  std::unique_ptr<Stmt> parseReturn();

  // Expressions (Parser_Expr.cpp)
  std::unique_ptr<Expr> parseExpr();
  std::unique_ptr<Expr> parseTernary();
  std::unique_ptr<Expr> parseBinary(int minPrec);
  int getPrecedence(std::string &op, size_t &width) const;
  std::unique_ptr<Expr> parseUnary();
  std::unique_ptr<Expr> parsePostfix(std::unique_ptr<Expr> base,
                                     const Token &start);
  std::unique_ptr<Expr> parsePrimary();
  std::unique_ptr<Expr> parseNew(const Token &start);
  std::unique_ptr<ArrayInitExpr> parseArrayInit();
  std::unique_ptr<Expr> parseVarInit();
  std::vector<std::unique_ptr<Expr>> parseArgs();
  bool isLambdaStart() const;
  std::unique_ptr<Expr> parseLambda();
  bool isCastStart();
};

} // namespace tempo
