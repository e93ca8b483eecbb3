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

void Parser::parseImport(CompilationUnit &Unit) {
  Token start = consume(TokenType::KwImport, "'import'");
  ImportDecl imp;
  imp.IsStatic = match(TokenType::KwStatic);
  imp.Name = consume(TokenType::Identifier, "identifier").Text;
  while (match(TokenType::Dot)) {
    if (match(TokenType::Star)) {
      imp.IsOnDemand = true;
      break;
    }
    imp.Name += "." + consume(TokenType::Identifier, "identifier").Text;
  }
  consume(TokenType::Semicolon, "';'");
  imp.Range = SourceRange(start.Loc, previous().EndLoc);
  Unit.Imports.push_back(std::move(imp));
}

std::string Parser::parseQualifiedName() {
  std::string name = consume(TokenType::Identifier, "identifier").Text;
  while (check(TokenType::Dot) && checkAt(1, TokenType::Identifier)) {
    advance();
    name += "." + advance().Text;
  }
  return name;
}

void Parser::skipAnnotation() {
  consume(TokenType::At, "'@'");
  parseQualifiedName();
  if (check(TokenType::LParen))
    skipBalanced(TokenType::LParen, TokenType::RParen);
}

void Parser::skipAnnotations() {
  while (check(TokenType::At) && !checkAt(1, TokenType::KwInterface))
    skipAnnotation();
}

unsigned Parser::parseModifiers() {
  unsigned mods = 0;
  while (true) {
    if (check(TokenType::At) && !checkAt(1, TokenType::KwInterface)) {
      skipAnnotation();
      continue;
    }
    if (!peek().isModifier())
      break;
    // `default:` and `default ->` belong to a switch, not to a declaration.
    if (check(TokenType::KwDefault) &&
        (checkAt(1, TokenType::Colon) || checkAt(1, TokenType::Arrow)))
      break;
    switch (advance().Kind) {
    case TokenType::KwPublic:
      mods |= ModPublic;
      break;
    case TokenType::KwPrivate:
      mods |= ModPrivate;
      break;
    case TokenType::KwProtected:
      mods |= ModProtected;
      break;
    case TokenType::KwStatic:
      mods |= ModStatic;
      break;
    case TokenType::KwFinal:
      mods |= ModFinal;
      break;
    case TokenType::KwAbstract:
      mods |= ModAbstract;
      break;
    case TokenType::KwDefault:
      mods |= ModDefault;
      break;
    default:
      mods |= ModOther;
      break;
    }
  }
  return mods;
}

void Parser::skipTypeParams() {
  if (!check(TokenType::Less))
    return;
  int depth = 0;
  while (!isAtEnd()) {
    if (check(TokenType::Less))
      depth++;
    else if (check(TokenType::Greater))
      depth--;
    advance();
    if (depth == 0)
      return;
  }
}

bool Parser::isTypeDeclStart() const {
  return check(TokenType::KwClass) || check(TokenType::KwInterface) ||
         check(TokenType::KwEnum) ||
         (check(TokenType::At) && checkAt(1, TokenType::KwInterface));
}

std::unique_ptr<ClassDecl> Parser::parseClassDecl(unsigned modifiers,
                                                  const Token &start) {
  auto decl = std::make_unique<ClassDecl>();
  decl->Modifiers = modifiers;

  if (match(TokenType::KwClass)) {
    decl->Kind = ClassDecl::Class;
  } else if (match(TokenType::KwInterface)) {
    decl->Kind = ClassDecl::Interface;
  } else if (match(TokenType::KwEnum)) {
    decl->Kind = ClassDecl::Enum;
  } else {
    consume(TokenType::At, "'@'");
    consume(TokenType::KwInterface, "'interface'");
    decl->Kind = ClassDecl::Annotation;
  }

  decl->Name = consume(TokenType::Identifier, "class name").Text;
  skipTypeParams();

  if (match(TokenType::KwExtends)) {
    // Interfaces extend a list; it behaves like `implements` for lookup.
    if (decl->Kind == ClassDecl::Interface) {
      do {
        if (auto type = parseType())
          decl->Implements.push_back(std::move(type));
      } while (match(TokenType::Comma));
    } else {
      decl->Extends = parseType();
    }
  }
  if (match(TokenType::KwImplements)) {
    do {
      if (auto type = parseType())
        decl->Implements.push_back(std::move(type));
    } while (match(TokenType::Comma));
  }
  if (checkIdent("permits")) {
    advance();
    do {
      parseType();
    } while (match(TokenType::Comma));
  }

  parseClassBody(*decl);
  finish(*decl, start);
  return decl;
}

void Parser::parseClassBody(ClassDecl &Class) {
  NestingScope scope(*this);
  if (!checkNesting())
    return;
  if (!check(TokenType::LBrace)) {
    errorExpected("'{'");
    synchronizeMember();
    return;
  }
  advance();

  if (Class.Kind == ClassDecl::Enum)
    parseEnumConstants(Class);

  while (!check(TokenType::RBrace) && !isAtEnd()) {
    size_t before = m_Pos;
    parseMember(Class);
    if (m_Pos == before)
      advance();
  }
  consume(TokenType::RBrace, "'}'");
}

void Parser::parseEnumConstants(ClassDecl &Class) {
  while (true) {
    skipAnnotations();
    if (!check(TokenType::Identifier))
      break;
    Token start = advance();
    auto constant = std::make_unique<EnumConstantDecl>();
    constant->Name = start.Text;
    constant->Modifiers = ModPublic | ModStatic | ModFinal;
    if (check(TokenType::LParen))
      constant->Args = parseArgs();
    if (check(TokenType::LBrace)) {
      constant->Body = std::make_unique<ClassDecl>();
      Token bodyStart = peek();
      parseClassBody(*constant->Body);
      finish(*constant->Body, bodyStart);
    }
    finish(*constant, start);
    Class.EnumConstants.push_back(std::move(constant));
    if (!match(TokenType::Comma))
      break;
  }
  if (!match(TokenType::Semicolon) && !check(TokenType::RBrace))
    errorExpected("',', ';' or '}'");
}

void Parser::parseMember(ClassDecl &Class) {
  if (match(TokenType::Semicolon))
    return;

  Token start = peek();

  // Initializer blocks.
  if (check(TokenType::LBrace) ||
      (check(TokenType::KwStatic) && checkAt(1, TokenType::LBrace))) {
    auto init = std::make_unique<InitializerDecl>();
    if (match(TokenType::KwStatic))
      init->Modifiers = ModStatic;
    init->Body = parseBlock();
    finish(*init, start);
    Class.Members.push_back(std::move(init));
    return;
  }

  unsigned modifiers = parseModifiers();
  if (Class.Kind == ClassDecl::Interface ||
      Class.Kind == ClassDecl::Annotation) {
    modifiers |= ModPublic; // implicitly
  }

  if (isTypeDeclStart()) {
    auto nested = parseClassDecl(modifiers, start);
    Class.Members.push_back(std::move(nested));
    return;
  }

  skipTypeParams();

  // Constructor: the class name directly followed by '('.
  if (check(TokenType::Identifier) && peek().Text == Class.Name &&
      checkAt(1, TokenType::LParen)) {
    auto ctor = std::make_unique<MethodDecl>();
    ctor->Modifiers = modifiers;
    ctor->Name = advance().Text;
    ctor->Params = parseParams();
    if (match(TokenType::KwThrows)) {
      do {
        parseType();
      } while (match(TokenType::Comma));
    }
    ctor->Body = parseBlock();
    finish(*ctor, start);
    Class.Members.push_back(std::move(ctor));
    return;
  }

  auto type = parseType();
  if (!type) {
    synchronizeMember();
    return;
  }

  if (!check(TokenType::Identifier)) {
    errorExpected("member name");
    synchronizeMember();
    return;
  }
  Token nameTok = peek();

  if (checkAt(1, TokenType::LParen)) {
    advance();
    auto method = std::make_unique<MethodDecl>();
    method->Modifiers = modifiers;
    method->ReturnType = std::move(type);
    method->Name = nameTok.Text;
    method->Params = parseParams();
    while (check(TokenType::LBracket) && checkAt(1, TokenType::RBracket)) {
      advance();
      advance();
      method->ReturnType->ArrayDims++;
    }
    if (match(TokenType::KwThrows)) {
      do {
        parseType();
      } while (match(TokenType::Comma));
    }
    if (match(TokenType::KwDefault)) {
      // Annotation element default value.
      while (!check(TokenType::Semicolon) && !check(TokenType::RBrace) &&
             !isAtEnd()) {
        if (check(TokenType::LBrace))
          skipBalanced(TokenType::LBrace, TokenType::RBrace);
        else if (check(TokenType::LParen))
          skipBalanced(TokenType::LParen, TokenType::RParen);
        else
          advance();
      }
    }
    if (check(TokenType::LBrace))
      method->Body = parseBlock();
    else
      consume(TokenType::Semicolon, "';' or method body");
    finish(*method, start);
    Class.Members.push_back(std::move(method));
    return;
  }

  auto field = std::make_unique<FieldDecl>();
  field->Modifiers = modifiers;
  if (Class.Kind == ClassDecl::Interface)
    field->Modifiers |= ModStatic | ModFinal;
  field->FieldType = std::move(type);
  parseDeclarators(field->Vars);
  consume(TokenType::Semicolon, "';'");
  finish(*field, start);
  Class.Members.push_back(std::move(field));
}

std::vector<std::unique_ptr<ParamDecl>> Parser::parseParams() {
  std::vector<std::unique_ptr<ParamDecl>> params;
  consume(TokenType::LParen, "'('");
  if (match(TokenType::RParen))
    return params;

  while (!isAtEnd()) {
    Token start = peek();
    parseModifiers();
    auto param = std::make_unique<ParamDecl>();
    param->ParamType = parseType();
    if (!param->ParamType)
      break;
    if (match(TokenType::DotDotDot)) {
      param->IsVarArgs = true;
      param->ParamType->ArrayDims++;
    }
    if (match(TokenType::KwThis)) {
      param->Name = "this"; // explicit receiver parameter
    } else {
      param->Name = consume(TokenType::Identifier, "parameter name").Text;
    }
    while (check(TokenType::LBracket) && checkAt(1, TokenType::RBracket)) {
      advance();
      advance();
      param->ParamType->ArrayDims++;
    }
    finish(*param, start);
    params.push_back(std::move(param));
    if (!match(TokenType::Comma))
      break;
  }
  consume(TokenType::RParen, "')'");
  return params;
}

void Parser::parseDeclarators(std::vector<VarDeclarator> &Vars) {
  do {
    VarDeclarator var;
    Token nameTok = consume(TokenType::Identifier, "variable name");
    var.Name = nameTok.Text;
    var.NameRange = nameTok.getRange();
    while (check(TokenType::LBracket) && checkAt(1, TokenType::RBracket)) {
      advance();
      advance();
      var.ExtraDims++;
    }
    if (match(TokenType::Equal))
      var.Init = parseVarInit();
    Vars.push_back(std::move(var));
  } while (match(TokenType::Comma));
}

} // namespace tempo
