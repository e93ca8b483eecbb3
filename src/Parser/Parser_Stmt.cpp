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
#include "tempo/Parser.h"
#include <memory>
#include <string>
#include <vector>

namespace tempo {

std::unique_ptr<BlockStmt> Parser::parseBlock() {
  Token start = peek();
  auto block = std::make_unique<BlockStmt>();
  consume(TokenType::LBrace, "'{'");

  while (!check(TokenType::RBrace) && !isAtEnd()) {
    size_t before = m_Pos;
    auto stmt = parseStmt();
    if (stmt)
      block->Statements.push_back(std::move(stmt));
    if (m_Pos == before)
      advance();
  }

  consume(TokenType::RBrace, "'}'");
  finish(*block, start);
  return block;
}

std::unique_ptr<Stmt> Parser::parseStmt() {
  NestingScope scope(*this);
  Token start = peek();
  if (!checkNesting()) {
    auto empty = std::make_unique<EmptyStmt>();
    finish(*empty, start);
    return empty;
  }

  if (check(TokenType::LBrace))
    return parseBlock();

  if (match(TokenType::Semicolon)) {
    auto empty = std::make_unique<EmptyStmt>();
    finish(*empty, start);
    return empty;
  }

  if (check(TokenType::KwIf))
    return parseIf();
  if (check(TokenType::KwWhile))
    return parseWhile();
  if (check(TokenType::KwDo))
    return parseDoWhile();
  if (check(TokenType::KwFor))
    return parseFor();
  if (check(TokenType::KwTry))
    return parseTry();
  if (check(TokenType::KwSwitch))
    return parseSwitch();
  if (check(TokenType::KwReturn))
    return parseReturn();

  if (match(TokenType::KwThrow)) {
    auto stmt = std::make_unique<ThrowStmt>();
    stmt->Exception = parseExpr();
    if (!stmt->Exception) {
      synchronizeStmt();
      return nullptr;
    }
    consume(TokenType::Semicolon, "';'");
    finish(*stmt, start);
    return stmt;
  }

  if (check(TokenType::KwBreak) || check(TokenType::KwContinue)) {
    auto stmt = std::make_unique<JumpStmt>(advance().is(TokenType::KwBreak));
    if (check(TokenType::Identifier))
      stmt->Label = advance().Text;
    consume(TokenType::Semicolon, "';'");
    finish(*stmt, start);
    return stmt;
  }

  if (match(TokenType::KwAssert)) {
    auto stmt = std::make_unique<AssertStmt>();
    stmt->Condition = parseExpr();
    if (!stmt->Condition) {
      synchronizeStmt();
      return nullptr;
    }
    if (match(TokenType::Colon))
      stmt->Message = parseExpr();
    consume(TokenType::Semicolon, "';'");
    finish(*stmt, start);
    return stmt;
  }

  if (check(TokenType::KwSynchronized) && checkAt(1, TokenType::LParen)) {
    advance();
    auto stmt = std::make_unique<SynchronizedStmt>();
    consume(TokenType::LParen, "'('");
    stmt->Lock = parseExpr();
    consume(TokenType::RParen, "')'");
    stmt->Body = parseBlock();
    if (!stmt->Lock)
      return nullptr;
    finish(*stmt, start);
    return stmt;
  }

  // label: statement
  if (check(TokenType::Identifier) && checkAt(1, TokenType::Colon)) {
    auto stmt = std::make_unique<LabeledStmt>();
    stmt->Label = advance().Text;
    advance();
    stmt->Body = parseStmt();
    if (!stmt->Body)
      return nullptr;
    finish(*stmt, start);
    return stmt;
  }

  // Modifiers in a block introduce either a local class or a local variable.
  if (peek().isModifier() || check(TokenType::At)) {
    size_t save = m_Pos;
    unsigned modifiers = parseModifiers();
    if (isTypeDeclStart()) {
      auto stmt = std::make_unique<LocalClassStmt>();
      stmt->Class = parseClassDecl(modifiers, start);
      finish(*stmt, start);
      return stmt;
    }
    m_Pos = save;
    return parseLocalVarDecl(/*requireSemi=*/true);
  }

  if (isTypeDeclStart()) {
    auto stmt = std::make_unique<LocalClassStmt>();
    stmt->Class = parseClassDecl(0, start);
    finish(*stmt, start);
    return stmt;
  }

  if (isLocalVarDeclStart())
    return parseLocalVarDecl(/*requireSemi=*/true);

  auto expr = parseExpr();
  if (!expr) {
    synchronizeStmt();
    return nullptr;
  }
  auto stmt = std::make_unique<ExprStmt>(std::move(expr));
  consume(TokenType::Semicolon, "';'");
  finish(*stmt, start);
  return stmt;
}

bool Parser::isLocalVarDeclStart() {
  if (checkIdent("var") && checkAt(1, TokenType::Identifier))
    return true;
  if (peek().isPrimitiveType())
    return true;
  if (!check(TokenType::Identifier))
    return false;

  // `Type name` is never a valid expression prefix, so a type followed by an
  // identifier settles it.
  size_t save = m_Pos;
  bool isDecl = skipTypeQuiet() && check(TokenType::Identifier);
  m_Pos = save;
  return isDecl;
}

std::unique_ptr<LocalVarDeclStmt> Parser::parseLocalVarDecl(bool requireSemi) {
  Token start = peek();
  auto decl = std::make_unique<LocalVarDeclStmt>();
  decl->Modifiers = parseModifiers();

  if (checkIdent("var") && checkAt(1, TokenType::Identifier)) {
    Token varTok = advance();
    decl->VarType = std::make_unique<TypeNode>("var");
    decl->VarType->IsVar = true;
    decl->VarType->setRange(varTok.Loc, varTok.EndLoc);
  } else {
    decl->VarType = parseType();
    if (!decl->VarType) {
      synchronizeStmt();
      return nullptr;
    }
  }

  parseDeclarators(decl->Vars);
  if (requireSemi)
    consume(TokenType::Semicolon, "';'");
  finish(*decl, start);
  return decl;
}

std::unique_ptr<Stmt> Parser::parseIf() {
  Token start = consume(TokenType::KwIf, "'if'");
  auto stmt = std::make_unique<IfStmt>();
  consume(TokenType::LParen, "'('");
  stmt->Condition = parseExpr();
  consume(TokenType::RParen, "')'");
  stmt->Then = parseStmt();
  if (match(TokenType::KwElse))
    stmt->Else = parseStmt();
  if (!stmt->Condition || !stmt->Then)
    return nullptr;
  finish(*stmt, start);
  return stmt;
}

std::unique_ptr<Stmt> Parser::parseWhile() {
  Token start = consume(TokenType::KwWhile, "'while'");
  auto stmt = std::make_unique<WhileStmt>();
  consume(TokenType::LParen, "'('");
  stmt->Condition = parseExpr();
  consume(TokenType::RParen, "')'");
  stmt->Body = parseStmt();
  if (!stmt->Condition || !stmt->Body)
    return nullptr;
  finish(*stmt, start);
  return stmt;
}

std::unique_ptr<Stmt> Parser::parseDoWhile() {
  Token start = consume(TokenType::KwDo, "'do'");
  auto stmt = std::make_unique<WhileStmt>();
  stmt->IsDoWhile = true;
  stmt->Body = parseStmt();
  consume(TokenType::KwWhile, "'while'");
  consume(TokenType::LParen, "'('");
  stmt->Condition = parseExpr();
  consume(TokenType::RParen, "')'");
  consume(TokenType::Semicolon, "';'");
  if (!stmt->Condition || !stmt->Body)
    return nullptr;
  finish(*stmt, start);
  return stmt;
}

std::unique_ptr<Stmt> Parser::parseFor() {
  Token start = consume(TokenType::KwFor, "'for'");
  consume(TokenType::LParen, "'('");

  std::vector<std::unique_ptr<Stmt>> init;
  if (!check(TokenType::Semicolon)) {
    size_t save = m_Pos;
    parseModifiers();
    if (isLocalVarDeclStart()) {
      // for (Type name : iterable)
      std::unique_ptr<TypeNode> type;
      if (checkIdent("var")) {
        Token varTok = advance();
        type = std::make_unique<TypeNode>("var");
        type->IsVar = true;
        type->setRange(varTok.Loc, varTok.EndLoc);
      } else {
        type = parseType();
      }
      if (type && check(TokenType::Identifier) &&
          checkAt(1, TokenType::Colon)) {
        auto stmt = std::make_unique<ForEachStmt>();
        stmt->VarType = std::move(type);
        stmt->VarName = advance().Text;
        advance();
        stmt->Iterable = parseExpr();
        consume(TokenType::RParen, "')'");
        stmt->Body = parseStmt();
        if (!stmt->Iterable || !stmt->Body)
          return nullptr;
        finish(*stmt, start);
        return stmt;
      }
      m_Pos = save;
      if (auto decl = parseLocalVarDecl(/*requireSemi=*/false))
        init.push_back(std::move(decl));
    } else {
      m_Pos = save;
      do {
        Token exprStart = peek();
        auto expr = parseExpr();
        if (!expr)
          break;
        auto stmt = std::make_unique<ExprStmt>(std::move(expr));
        finish(*stmt, exprStart);
        init.push_back(std::move(stmt));
      } while (match(TokenType::Comma));
    }
  }
  consume(TokenType::Semicolon, "';'");

  auto stmt = std::make_unique<ForStmt>();
  stmt->Init = std::move(init);
  if (!check(TokenType::Semicolon))
    stmt->Condition = parseExpr();
  consume(TokenType::Semicolon, "';'");
  if (!check(TokenType::RParen)) {
    do {
      if (auto expr = parseExpr())
        stmt->Updates.push_back(std::move(expr));
    } while (match(TokenType::Comma));
  }
  consume(TokenType::RParen, "')'");
  stmt->Body = parseStmt();
  if (!stmt->Body)
    return nullptr;
  finish(*stmt, start);
  return stmt;
}

std::unique_ptr<Stmt> Parser::parseTry() {
  Token start = consume(TokenType::KwTry, "'try'");
  auto stmt = std::make_unique<TryStmt>();

  if (match(TokenType::LParen)) {
    while (!check(TokenType::RParen) && !isAtEnd()) {
      Token resStart = peek();
      if (peek().isModifier() || check(TokenType::At) ||
          isLocalVarDeclStart()) {
        if (auto decl = parseLocalVarDecl(/*requireSemi=*/false))
          stmt->Resources.push_back(std::move(decl));
      } else if (auto expr = parseExpr()) {
        auto res = std::make_unique<ExprStmt>(std::move(expr));
        finish(*res, resStart);
        stmt->Resources.push_back(std::move(res));
      }
      if (!match(TokenType::Semicolon))
        break;
    }
    consume(TokenType::RParen, "')'");
  }

  stmt->Body = parseBlock();

  while (match(TokenType::KwCatch)) {
    CatchClause clause;
    consume(TokenType::LParen, "'('");
    parseModifiers();
    do {
      if (auto type = parseType())
        clause.Types.push_back(std::move(type));
    } while (match(TokenType::Pipe));
    clause.Name = consume(TokenType::Identifier, "exception name").Text;
    consume(TokenType::RParen, "')'");
    clause.Body = parseBlock();
    stmt->Catches.push_back(std::move(clause));
  }

  if (match(TokenType::KwFinally))
    stmt->Finally = parseBlock();

  finish(*stmt, start);
  return stmt;
}

std::unique_ptr<Stmt> Parser::parseSwitch() {
  Token start = consume(TokenType::KwSwitch, "'switch'");
  auto stmt = std::make_unique<SwitchStmt>();
  consume(TokenType::LParen, "'('");
  stmt->Selector = parseExpr();
  consume(TokenType::RParen, "')'");
  consume(TokenType::LBrace, "'{'");

  while (!check(TokenType::RBrace) && !isAtEnd()) {
    SwitchCase c;
    if (match(TokenType::KwCase)) {
      // Labels use parseTernary so `case X ->` is not taken for a lambda.
      do {
        if (match(TokenType::KwDefault))
          continue;
        if (auto label = parseTernary())
          c.Labels.push_back(std::move(label));
      } while (match(TokenType::Comma));
    } else if (!match(TokenType::KwDefault)) {
      errorExpected("'case' or 'default'");
      synchronizeStmt();
      continue;
    }

    if (match(TokenType::Arrow)) {
      if (auto body = parseStmt())
        c.Body.push_back(std::move(body));
    } else {
      consume(TokenType::Colon, "':' or '->'");
      while (!check(TokenType::KwCase) && !check(TokenType::KwDefault) &&
             !check(TokenType::RBrace) && !isAtEnd()) {
        size_t before = m_Pos;
        if (auto body = parseStmt())
          c.Body.push_back(std::move(body));
        if (m_Pos == before)
          advance();
      }
    }
    stmt->Cases.push_back(std::move(c));
  }
  consume(TokenType::RBrace, "'}'");

  if (!stmt->Selector)
    return nullptr;
  finish(*stmt, start);
  return stmt;
}

std::unique_ptr<Stmt> Parser::parseReturn() {
  Token start = consume(TokenType::KwReturn, "'return'");
  auto stmt = std::make_unique<ReturnStmt>();
  if (!check(TokenType::Semicolon)) {
    stmt->ReturnValue = parseExpr();
    if (!stmt->ReturnValue) {
      synchronizeStmt();
      return nullptr;
    }
  }
  consume(TokenType::Semicolon, "';'");
  finish(*stmt, start);
  return stmt;
}

} // namespace tempo
