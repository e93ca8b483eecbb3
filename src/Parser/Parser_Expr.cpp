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

/// Rebuild the dotted name of `a.b.C` so it can be reused as a type when a
/// `[]`, `.class` or `::` suffix shows the expression was a type all along.
static bool getDottedName(const Expr *E, std::string &Out) {
  if (auto *name = dynamic_cast<const NameExpr *>(E)) {
    Out = name->Name;
    return true;
  }
  if (auto *field = dynamic_cast<const FieldAccessExpr *>(E)) {
    if (!getDottedName(field->Object.get(), Out))
      return false;
    Out += "." + field->Name;
    return true;
  }
  return false;
}

std::unique_ptr<Expr> Parser::parseExpr() {
  NestingScope scope(*this);
  if (!checkNesting())
    return nullptr;
  if (isLambdaStart())
    return parseLambda();

  Token start = peek();
  auto lhs = parseTernary();
  if (!lhs)
    return nullptr;

  std::string op;
  size_t width = 1;
  switch (peek().Kind) {
  case TokenType::Equal:
    op = "=";
    break;
  case TokenType::PlusEqual:
  case TokenType::MinusEqual:
  case TokenType::StarEqual:
  case TokenType::SlashEqual:
  case TokenType::PercentEqual:
  case TokenType::AmpersandEqual:
  case TokenType::PipeEqual:
  case TokenType::CaretEqual:
  case TokenType::LessLessEqual:
    op = peek().Text;
    break;
  case TokenType::Greater:
    // `>>=` and `>>>=` arrive as separate, adjacent tokens.
    if (checkAt(1, TokenType::GreaterEqual) && adjacent(1)) {
      op = ">>=";
      width = 2;
    } else if (checkAt(1, TokenType::Greater) && adjacent(1) &&
               checkAt(2, TokenType::GreaterEqual) && adjacent(2)) {
      op = ">>>=";
      width = 3;
    }
    break;
  default:
    break;
  }
  if (op.empty())
    return lhs;

  for (size_t i = 0; i < width; ++i)
    advance();
  auto rhs = parseExpr();
  if (!rhs)
    return nullptr;
  auto assign = std::make_unique<AssignExpr>(op, std::move(lhs), std::move(rhs));
  finish(*assign, start);
  return assign;
}

std::unique_ptr<Expr> Parser::parseTernary() {
  Token start = peek();
  auto cond = parseBinary(0);
  if (!cond)
    return nullptr;
  if (!match(TokenType::Question))
    return cond;

  auto then = isLambdaStart() ? parseLambda() : parseTernary();
  consume(TokenType::Colon, "':'");
  auto otherwise = isLambdaStart() ? parseLambda() : parseTernary();
  if (!then || !otherwise)
    return nullptr;
  auto expr = std::make_unique<ConditionalExpr>(
      std::move(cond), std::move(then), std::move(otherwise));
  finish(*expr, start);
  return expr;
}

int Parser::getPrecedence(std::string &op, size_t &width) const {
  width = 1;
  switch (peek().Kind) {
  case TokenType::OrOr:
    op = "||";
    return 1;
  case TokenType::AndAnd:
    op = "&&";
    return 2;
  case TokenType::Pipe:
    op = "|";
    return 3;
  case TokenType::Caret:
    op = "^";
    return 4;
  case TokenType::Ampersand:
    op = "&";
    return 5;
  case TokenType::DoubleEqual:
    op = "==";
    return 6;
  case TokenType::Neq:
    op = "!=";
    return 6;
  case TokenType::Less:
    op = "<";
    return 7;
  case TokenType::LessEqual:
    op = "<=";
    return 7;
  case TokenType::GreaterEqual:
    op = ">=";
    return 7;
  case TokenType::Greater:
    if (checkAt(1, TokenType::Greater) && adjacent(1)) {
      if (checkAt(2, TokenType::Greater) && adjacent(2)) {
        if (checkAt(3, TokenType::GreaterEqual) && adjacent(3))
          return -1; // >>>=
        op = ">>>";
        width = 3;
        return 8;
      }
      if (checkAt(2, TokenType::GreaterEqual) && adjacent(2))
        return -1; // >>>=
      op = ">>";
      width = 2;
      return 8;
    }
    if (checkAt(1, TokenType::GreaterEqual) && adjacent(1))
      return -1; // >>=
    op = ">";
    return 7;
  case TokenType::LessLess:
    op = "<<";
    return 8;
  case TokenType::Plus:
    op = "+";
    return 9;
  case TokenType::Minus:
    op = "-";
    return 9;
  case TokenType::Star:
    op = "*";
    return 10;
  case TokenType::Slash:
    op = "/";
    return 10;
  case TokenType::Percent:
    op = "%";
    return 10;
  default:
    return -1;
  }
}

std::unique_ptr<Expr> Parser::parseBinary(int minPrec) {
  Token start = peek();
  auto lhs = parseUnary();
  if (!lhs)
    return nullptr;

  while (true) {
    if (check(TokenType::KwInstanceof)) {
      if (7 < minPrec)
        break;
      advance();
      match(TokenType::KwFinal);
      auto type = parseType();
      if (!type)
        return nullptr;
      auto expr =
          std::make_unique<InstanceOfExpr>(std::move(lhs), std::move(type));
      if (check(TokenType::Identifier))
        expr->BindingName = advance().Text;
      finish(*expr, start);
      lhs = std::move(expr);
      continue;
    }

    std::string op;
    size_t width = 1;
    int prec = getPrecedence(op, width);
    if (prec < 0 || prec < minPrec)
      break;
    for (size_t i = 0; i < width; ++i)
      advance();

    auto rhs = parseBinary(prec + 1);
    if (!rhs)
      return nullptr;
    lhs = std::make_unique<BinaryExpr>(op, std::move(lhs), std::move(rhs));
    finish(*lhs, start);
  }
  return lhs;
}

std::unique_ptr<Expr> Parser::parseUnary() {
  NestingScope scope(*this);
  if (!checkNesting())
    return nullptr;
  Token start = peek();

  if (check(TokenType::Plus) || check(TokenType::Minus) ||
      check(TokenType::Bang) || check(TokenType::Tilde) ||
      check(TokenType::PlusPlus) || check(TokenType::MinusMinus)) {
    TokenType op = advance().Kind;
    auto rhs = parseUnary();
    if (!rhs)
      return nullptr;
    auto expr = std::make_unique<UnaryExpr>(op, std::move(rhs));
    finish(*expr, start);
    return expr;
  }

  if (check(TokenType::LParen) && isCastStart()) {
    advance();
    auto type = parseType();
    while (match(TokenType::Ampersand))
      parseType(); // intersection cast, first bound wins
    consume(TokenType::RParen, "')'");
    auto operand = isLambdaStart() ? parseLambda() : parseUnary();
    if (!type || !operand)
      return nullptr;
    auto cast = std::make_unique<CastExpr>(std::move(type), std::move(operand));
    finish(*cast, start);
    return cast;
  }

  auto primary = parsePrimary();
  if (!primary)
    return nullptr;
  return parsePostfix(std::move(primary), start);
}

bool Parser::isCastStart() {
  size_t save = m_Pos;
  advance(); // (

  bool isCast = false;
  if (peek().isPrimitiveType()) {
    isCast = skipTypeQuiet() && check(TokenType::RParen);
  } else if (check(TokenType::Identifier) && skipTypeQuiet()) {
    bool ok = true;
    while (ok && match(TokenType::Ampersand))
      ok = skipTypeQuiet();
    if (ok && match(TokenType::RParen)) {
      switch (peek().Kind) {
      case TokenType::Identifier:
      case TokenType::Integer:
      case TokenType::Float:
      case TokenType::String:
      case TokenType::Char:
      case TokenType::KwTrue:
      case TokenType::KwFalse:
      case TokenType::KwNull:
      case TokenType::KwThis:
      case TokenType::KwSuper:
      case TokenType::KwNew:
      case TokenType::LParen:
      case TokenType::Bang:
      case TokenType::Tilde:
        isCast = true;
        break;
      default:
        break;
      }
    }
  }

  m_Pos = save;
  return isCast;
}

std::unique_ptr<Expr> Parser::parsePrimary() {
  Token start = peek();
  std::unique_ptr<Expr> expr;

  switch (peek().Kind) {
  case TokenType::Integer: {
    Token tok = advance();
    char last = tok.Text.back();
    expr = std::make_unique<LiteralExpr>(last == 'l' || last == 'L'
                                             ? LiteralExpr::Long
                                             : LiteralExpr::Int,
                                         tok.Text);
    break;
  }
  case TokenType::Float: {
    Token tok = advance();
    char last = tok.Text.back();
    expr = std::make_unique<LiteralExpr>(last == 'f' || last == 'F'
                                             ? LiteralExpr::Float
                                             : LiteralExpr::Double,
                                         tok.Text);
    break;
  }
  case TokenType::String:
    expr = std::make_unique<LiteralExpr>(LiteralExpr::String, advance().Text);
    break;
  case TokenType::Char:
    expr = std::make_unique<LiteralExpr>(LiteralExpr::Char, advance().Text);
    break;
  case TokenType::KwTrue:
  case TokenType::KwFalse:
    expr = std::make_unique<LiteralExpr>(LiteralExpr::Bool, advance().Text);
    break;
  case TokenType::KwNull:
    expr = std::make_unique<LiteralExpr>(LiteralExpr::Null, advance().Text);
    break;

  case TokenType::KwThis:
  case TokenType::KwSuper: {
    Token tok = advance();
    if (check(TokenType::LParen)) {
      // Explicit constructor invocation: this(...) / super(...)
      auto call =
          std::make_unique<MethodCallExpr>(nullptr, tok.Text, parseArgs());
      call->NameLoc = tok.Loc;
      expr = std::move(call);
    } else {
      expr = std::make_unique<ThisExpr>(tok.is(TokenType::KwSuper));
    }
    break;
  }

  case TokenType::KwNew:
    return parseNew(start);

  case TokenType::LParen: {
    advance();
    auto inner = parseExpr();
    consume(TokenType::RParen, "')'");
    if (!inner)
      return nullptr;
    expr = std::make_unique<ParenExpr>(std::move(inner));
    break;
  }

  case TokenType::Identifier: {
    Token tok = advance();
    if (check(TokenType::LParen)) {
      auto call =
          std::make_unique<MethodCallExpr>(nullptr, tok.Text, parseArgs());
      call->NameLoc = tok.Loc;
      expr = std::move(call);
    } else {
      expr = std::make_unique<NameExpr>(tok.Text);
    }
    break;
  }

  default:
    if (peek().isPrimitiveType() || check(TokenType::KwVoid)) {
      // int.class, int[].class, int[]::new
      auto type = parseType();
      if (match(TokenType::ColonColon)) {
        std::string name = match(TokenType::KwNew)
                               ? "new"
                               : consume(TokenType::Identifier, "method name")
                                     .Text;
        auto lit = std::make_unique<ClassLiteralExpr>(std::move(type));
        finish(*lit, start);
        expr = std::make_unique<MethodRefExpr>(std::move(lit), name);
        break;
      }
      consume(TokenType::Dot, "'.'");
      consume(TokenType::KwClass, "'class'");
      expr = std::make_unique<ClassLiteralExpr>(std::move(type));
      break;
    }
    error(peek(), DiagID::ERR_EXPECTED_EXPRESSION);
    return nullptr;
  }

  finish(*expr, start);
  return expr;
}

std::unique_ptr<Expr> Parser::parsePostfix(std::unique_ptr<Expr> base,
                                           const Token &start) {
  while (base) {
    if (match(TokenType::Dot)) {
      if (check(TokenType::Less))
        skipTypeArgsQuiet(); // explicit type witness: obj.<T>method()

      if (check(TokenType::Identifier)) {
        Token nameTok = advance();
        if (check(TokenType::LParen)) {
          auto call = std::make_unique<MethodCallExpr>(
              std::move(base), nameTok.Text, parseArgs());
          call->NameLoc = nameTok.Loc;
          base = std::move(call);
        } else {
          base =
              std::make_unique<FieldAccessExpr>(std::move(base), nameTok.Text);
        }
      } else if (match(TokenType::KwClass)) {
        std::string name;
        if (!getDottedName(base.get(), name)) {
          errorExpected("type before '.class'");
          return nullptr;
        }
        auto type = std::make_unique<TypeNode>(name);
        type->Range = base->Range;
        base = std::make_unique<ClassLiteralExpr>(std::move(type));
      } else if (match(TokenType::KwThis)) {
        base = std::make_unique<ThisExpr>(false); // Outer.this
      } else if (check(TokenType::KwNew)) {
        // outer.new Inner(): the qualifier does not change the type.
        Token newTok = peek();
        base = parseNew(newTok);
        continue;
      } else if (match(TokenType::KwSuper)) {
        base = std::make_unique<ThisExpr>(true);
      } else {
        errorExpected("member name");
        return nullptr;
      }
    } else if (check(TokenType::LBracket)) {
      if (checkAt(1, TokenType::RBracket)) {
        // Array type used as a class literal or method reference target.
        std::string name;
        if (!getDottedName(base.get(), name)) {
          errorExpected("expression");
          return nullptr;
        }
        auto type = std::make_unique<TypeNode>(name);
        while (check(TokenType::LBracket) && checkAt(1, TokenType::RBracket)) {
          advance();
          advance();
          type->ArrayDims++;
        }
        finish(*type, start);
        if (match(TokenType::ColonColon)) {
          auto lit = std::make_unique<ClassLiteralExpr>(std::move(type));
          finish(*lit, start);
          std::string ref =
              match(TokenType::KwNew)
                  ? "new"
                  : consume(TokenType::Identifier, "method name").Text;
          base = std::make_unique<MethodRefExpr>(std::move(lit), ref);
        } else {
          consume(TokenType::Dot, "'.'");
          consume(TokenType::KwClass, "'class'");
          base = std::make_unique<ClassLiteralExpr>(std::move(type));
        }
      } else {
        advance();
        auto index = parseExpr();
        consume(TokenType::RBracket, "']'");
        if (!index)
          return nullptr;
        base =
            std::make_unique<ArrayAccessExpr>(std::move(base), std::move(index));
      }
    } else if (match(TokenType::ColonColon)) {
      std::string name =
          match(TokenType::KwNew)
              ? "new"
              : consume(TokenType::Identifier, "method name").Text;
      base = std::make_unique<MethodRefExpr>(std::move(base), name);
    } else if (check(TokenType::PlusPlus) || check(TokenType::MinusMinus)) {
      base = std::make_unique<PostfixExpr>(advance().Kind, std::move(base));
    } else {
      break;
    }
    finish(*base, start);
  }
  return base;
}

std::unique_ptr<Expr> Parser::parseNew(const Token &start) {
  consume(TokenType::KwNew, "'new'");
  if (check(TokenType::Less))
    skipTypeArgsQuiet();

  auto type = parseType();
  if (!type)
    return nullptr;

  if (type->ArrayDims > 0 || check(TokenType::LBracket)) {
    std::vector<std::unique_ptr<Expr>> dims;
    unsigned elementDims = type->ArrayDims;
    type->ArrayDims = 0;
    while (check(TokenType::LBracket)) {
      advance();
      if (!match(TokenType::RBracket)) {
        if (auto dim = parseExpr())
          dims.push_back(std::move(dim));
        consume(TokenType::RBracket, "']'");
      }
      elementDims++;
    }
    type->ArrayDims = elementDims;
    std::unique_ptr<ArrayInitExpr> init;
    if (check(TokenType::LBrace))
      init = parseArrayInit();
    auto expr = std::make_unique<NewArrayExpr>(std::move(type), std::move(dims),
                                               std::move(init));
    finish(*expr, start);
    return parsePostfix(std::move(expr), start);
  }

  auto expr = std::make_unique<NewExpr>(std::move(type), parseArgs());
  if (check(TokenType::LBrace)) {
    expr->AnonymousBody = std::make_unique<ClassDecl>();
    Token bodyStart = peek();
    parseClassBody(*expr->AnonymousBody);
    finish(*expr->AnonymousBody, bodyStart);
  }
  finish(*expr, start);
  return parsePostfix(std::move(expr), start);
}

std::unique_ptr<ArrayInitExpr> Parser::parseArrayInit() {
  Token start = consume(TokenType::LBrace, "'{'");
  std::vector<std::unique_ptr<Expr>> elems;
  while (!check(TokenType::RBrace) && !isAtEnd()) {
    auto elem = parseVarInit();
    if (!elem)
      break;
    elems.push_back(std::move(elem));
    if (!match(TokenType::Comma))
      break;
  }
  consume(TokenType::RBrace, "'}'");
  auto init = std::make_unique<ArrayInitExpr>(std::move(elems));
  finish(*init, start);
  return init;
}

std::unique_ptr<Expr> Parser::parseVarInit() {
  NestingScope scope(*this);
  if (!checkNesting())
    return nullptr;
  if (check(TokenType::LBrace))
    return parseArrayInit();
  return parseExpr();
}

std::vector<std::unique_ptr<Expr>> Parser::parseArgs() {
  std::vector<std::unique_ptr<Expr>> args;
  consume(TokenType::LParen, "'('");
  if (match(TokenType::RParen))
    return args;
  while (!isAtEnd()) {
    auto arg = parseExpr();
    if (!arg)
      break;
    args.push_back(std::move(arg));
    if (!match(TokenType::Comma))
      break;
  }
  consume(TokenType::RParen, "')'");
  return args;
}

bool Parser::isLambdaStart() const {
  if (check(TokenType::Identifier))
    return checkAt(1, TokenType::Arrow);
  if (!check(TokenType::LParen))
    return false;

  // Find the matching ')' and look for '->' behind it.
  int depth = 0;
  for (size_t i = 0;; ++i) {
    const Token &tok = peekAt(i);
    if (tok.is(TokenType::EndOfFile))
      return false;
    if (tok.is(TokenType::LParen)) {
      depth++;
    } else if (tok.is(TokenType::RParen)) {
      if (--depth == 0)
        return checkAt(i + 1, TokenType::Arrow);
    } else if (tok.is(TokenType::Semicolon) || tok.is(TokenType::LBrace)) {
      return false;
    }
  }
}

std::unique_ptr<Expr> Parser::parseLambda() {
  Token start = peek();
  auto lambda = std::make_unique<LambdaExpr>();

  if (check(TokenType::Identifier)) {
    LambdaExpr::Param param;
    param.Name = advance().Text;
    lambda->Params.push_back(std::move(param));
  } else {
    consume(TokenType::LParen, "'('");
    while (!check(TokenType::RParen) && !isAtEnd()) {
      LambdaExpr::Param param;
      if (check(TokenType::Identifier) &&
          (checkAt(1, TokenType::Comma) || checkAt(1, TokenType::RParen))) {
        param.Name = advance().Text;
      } else {
        parseModifiers();
        if (checkIdent("var") && checkAt(1, TokenType::Identifier)) {
          advance(); // implicitly typed after all
        } else {
          param.ParamType = parseType();
          if (!param.ParamType)
            break;
          if (match(TokenType::DotDotDot))
            param.ParamType->ArrayDims++;
        }
        param.Name = consume(TokenType::Identifier, "parameter name").Text;
      }
      lambda->Params.push_back(std::move(param));
      if (!match(TokenType::Comma))
        break;
    }
    consume(TokenType::RParen, "')'");
  }

  consume(TokenType::Arrow, "'->'");
  if (check(TokenType::LBrace)) {
    lambda->BodyBlock = parseBlock();
  } else {
    lambda->BodyExpr = parseExpr();
    if (!lambda->BodyExpr)
      return nullptr;
  }
  finish(*lambda, start);
  return lambda;
}

} // namespace tempo
