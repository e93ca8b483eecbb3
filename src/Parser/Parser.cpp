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

namespace tempo {

const Token &Parser::peek() const {
  if (m_Pos >= m_Tokens.size())
    return m_Tokens.back(); // EOF
  return m_Tokens[m_Pos];
}

const Token &Parser::peekAt(size_t offset) const {
  if (m_Pos + offset >= m_Tokens.size())
    return m_Tokens.back();
  return m_Tokens[m_Pos + offset];
}

const Token &Parser::previous() const {
  return m_Tokens[m_Pos == 0 ? 0 : m_Pos - 1];
}

Token Parser::advance() {
  if (m_Pos < m_Tokens.size() && !isAtEnd())
    m_Pos++;
  return previous();
}

bool Parser::check(TokenType type) const {
  if (peek().Kind == TokenType::EndOfFile)
    return false;
  return peek().Kind == type;
}

bool Parser::checkAt(size_t offset, TokenType type) const {
  if (peekAt(offset).Kind == TokenType::EndOfFile)
    return false;
  return peekAt(offset).Kind == type;
}

bool Parser::checkIdent(const char *text) const {
  return check(TokenType::Identifier) && peek().Text == text;
}

bool Parser::match(TokenType type) {
  if (check(type)) {
    advance();
    return true;
  }
  return false;
}

Token Parser::consume(TokenType type, const char *what) {
  if (check(type))
    return advance();
  errorExpected(what);
  return peek();
}

void Parser::error(const Token &tok, DiagID id) {
  // One diagnostic per position; recovery often trips over the same token.
  if (m_Pos == m_LastErrorPos)
    return;
  m_LastErrorPos = m_Pos;
  m_NumErrors++;
  std::string found = tok.Kind == TokenType::EndOfFile ? "<eof>" : tok.Text;
  DiagnosticEngine::report(tok.Loc, id, found);
}

void Parser::errorExpected(const char *what) {
  if (m_Pos == m_LastErrorPos)
    return;
  m_LastErrorPos = m_Pos;
  m_NumErrors++;
  const Token &tok = peek();
  std::string found = tok.Kind == TokenType::EndOfFile ? "<eof>" : tok.Text;
  DiagnosticEngine::report(tok.Loc, DiagID::ERR_EXPECTED, what, found);
}

bool Parser::checkNesting() {
  if (m_Depth <= MaxNestingDepth)
    return true;
  if (!isAtEnd()) {
    m_NumErrors++;
    DiagnosticEngine::report(peek().Loc, DiagID::ERR_NESTING_TOO_DEEP,
                             MaxNestingDepth);
    m_Pos = m_Tokens.size() - 1;
  }
  m_LastErrorPos = m_Pos;
  return false;
}

bool Parser::adjacent(size_t offset) const {
  return peekAt(offset).Loc == peekAt(offset - 1).EndLoc;
}

void Parser::skipBalanced(TokenType open, TokenType close) {
  if (!match(open))
    return;
  int depth = 1;
  while (!isAtEnd() && depth > 0) {
    if (check(open))
      depth++;
    else if (check(close))
      depth--;
    advance();
  }
}

void Parser::synchronizeStmt() {
  int depth = 0;
  while (!isAtEnd()) {
    if (check(TokenType::LBrace)) {
      depth++;
    } else if (check(TokenType::RBrace)) {
      if (depth == 0)
        return;
      depth--;
      if (depth == 0) {
        advance();
        return;
      }
    } else if (check(TokenType::Semicolon) && depth == 0) {
      advance();
      return;
    }
    advance();
  }
}

void Parser::synchronizeMember() { synchronizeStmt(); }

std::unique_ptr<CompilationUnit> Parser::parseCompilationUnit() {
  auto unit = std::make_unique<CompilationUnit>();
  Token start = peek();

  // Package annotations are legal (package-info.java).
  if (check(TokenType::At) && !checkAt(1, TokenType::KwInterface))
    skipAnnotations();

  if (match(TokenType::KwPackage)) {
    unit->PackageName = parseQualifiedName();
    consume(TokenType::Semicolon, "';'");
  }

  while (check(TokenType::KwImport))
    parseImport(*unit);

  while (!isAtEnd()) {
    if (match(TokenType::Semicolon))
      continue;

    size_t before = m_Pos;
    Token declStart = peek();
    unsigned modifiers = parseModifiers();
    if (isTypeDeclStart()) {
      unit->Types.push_back(parseClassDecl(modifiers, declStart));
    } else {
      error(peek(), DiagID::ERR_EXPECTED_TYPE_DECL);
      synchronizeMember();
    }
    if (m_Pos == before)
      advance();
  }

  finish(*unit, start);
  return unit;
}

std::unique_ptr<Expr> Parser::parseStandaloneExpr() {
  auto expr = parseExpr();
  if (!isAtEnd())
    errorExpected("end of expression");
  return expr;
}

std::unique_ptr<TypeNode> Parser::parseType() {
  NestingScope scope(*this);
  if (!checkNesting())
    return nullptr;
  skipAnnotations();
  Token start = peek();
  std::unique_ptr<TypeNode> type;

  if (peek().isPrimitiveType() || check(TokenType::KwVoid)) {
    type = std::make_unique<TypeNode>(advance().Text);
    type->IsPrimitive = true;
  } else if (check(TokenType::Question)) {
    advance();
    type = std::make_unique<TypeNode>("");
    type->IsWildcard = true;
    if (match(TokenType::KwExtends) || match(TokenType::KwSuper)) {
      // Keep the bound; for our purposes `? extends T` behaves like T.
      auto bound = parseType();
      if (bound)
        type->TypeArgs.push_back(std::move(bound));
    }
    finish(*type, start);
    return type;
  } else if (check(TokenType::Identifier)) {
    type = std::make_unique<TypeNode>(advance().Text);
    if (check(TokenType::Less))
      parseTypeArgs(*type);
    while (check(TokenType::Dot) && checkAt(1, TokenType::Identifier)) {
      advance();
      type->Name += "." + advance().Text;
      if (check(TokenType::Less)) {
        // Outer<A>.Inner<B>: only the innermost arguments are kept.
        type->TypeArgs.clear();
        parseTypeArgs(*type);
      }
    }
  } else {
    error(peek(), DiagID::ERR_EXPECTED_TYPE);
    return nullptr;
  }

  skipAnnotations();
  while (check(TokenType::LBracket) && checkAt(1, TokenType::RBracket)) {
    advance();
    advance();
    type->ArrayDims++;
  }

  finish(*type, start);
  return type;
}

void Parser::parseTypeArgs(TypeNode &Type) {
  consume(TokenType::Less, "'<'");
  if (match(TokenType::Greater))
    return; // diamond

  while (!isAtEnd()) {
    auto arg = parseType();
    if (!arg)
      break;
    Type.TypeArgs.push_back(std::move(arg));
    // Intersection bounds inside arguments are rare; skip them.
    while (match(TokenType::Ampersand))
      parseType();
    if (!match(TokenType::Comma))
      break;
  }
  consume(TokenType::Greater, "'>'");
}

bool Parser::skipTypeArgsQuiet() {
  if (!match(TokenType::Less))
    return false;
  if (match(TokenType::Greater))
    return true;
  while (!isAtEnd()) {
    if (match(TokenType::Question)) {
      if (match(TokenType::KwExtends) || match(TokenType::KwSuper)) {
        if (!skipTypeQuiet())
          return false;
      }
    } else if (!skipTypeQuiet()) {
      return false;
    }
    while (match(TokenType::Ampersand)) {
      if (!skipTypeQuiet())
        return false;
    }
    if (!match(TokenType::Comma))
      break;
  }
  return match(TokenType::Greater);
}

bool Parser::skipTypeQuiet() {
  // Lookahead only: too deep is "not a type" and parseType reports it.
  NestingScope scope(*this);
  if (m_Depth > MaxNestingDepth)
    return false;
  while (check(TokenType::At) && checkAt(1, TokenType::Identifier)) {
    advance();
    advance();
    while (check(TokenType::Dot) && checkAt(1, TokenType::Identifier)) {
      advance();
      advance();
    }
    if (check(TokenType::LParen))
      skipBalanced(TokenType::LParen, TokenType::RParen);
  }

  if (peek().isPrimitiveType()) {
    advance();
  } else if (check(TokenType::Identifier)) {
    advance();
    if (check(TokenType::Less) && !skipTypeArgsQuiet())
      return false;
    while (check(TokenType::Dot) && checkAt(1, TokenType::Identifier)) {
      advance();
      advance();
      if (check(TokenType::Less) && !skipTypeArgsQuiet())
        return false;
    }
  } else {
    return false;
  }

  while (check(TokenType::LBracket) && checkAt(1, TokenType::RBracket)) {
    advance();
    advance();
  }
  return true;
}

} // namespace tempo
