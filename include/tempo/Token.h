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
#include <string>

namespace tempo {

enum class TokenType {
  // End of file
  EndOfFile,
  Unknown,

  // Identifiers & Literals
  Identifier,
  Integer,
  Float,
  String,
  Char,

  // Keywords
  KwPackage,
  KwImport,
  KwStatic,
  KwClass,
  KwInterface,
  KwEnum,
  KwExtends,
  KwImplements,
  KwPublic,
  KwPrivate,
  KwProtected,
  KwFinal,
  KwAbstract,
  KwNative,
  KwSynchronized,
  KwTransient,
  KwVolatile,
  KwStrictfp,
  KwDefault,
  KwThrows,

  KwVoid,
  KwBoolean,
  KwByte,
  KwChar,
  KwShort,
  KwInt,
  KwLong,
  KwFloat,
  KwDouble,

  KwIf,
  KwElse,
  KwWhile,
  KwDo,
  KwFor,
  KwSwitch,
  KwCase,
  KwBreak,
  KwContinue,
  KwReturn,
  KwThrow,
  KwTry,
  KwCatch,
  KwFinally,
  KwAssert,

  KwNew,
  KwThis,
  KwSuper,
  KwNull,
  KwTrue,
  KwFalse,
  KwInstanceof,

  // Punctuation
  LParen,
  RParen, // ( )
  LBracket,
  RBracket, // [ ]
  LBrace,
  RBrace,      // { }
  Comma,       // ,
  Dot,         // .
  Semicolon,   // ;
  Colon,       // :
  ColonColon,  // ::
  Question,    // ?
  At,          // @
  Arrow,       // ->
  DotDotDot,   // ...

  // Operators
  Equal,
  DoubleEqual,
  Neq,
  Less,
  Greater,
  LessEqual,
  GreaterEqual,
  Plus,
  Minus,
  Star,
  Slash,
  Percent,
  PlusPlus,
  MinusMinus,
  Bang,
  Tilde,
  AndAnd,
  OrOr,
  Ampersand,
  Pipe,
  Caret,
  LessLess,
  PlusEqual,
  MinusEqual,
  StarEqual,
  SlashEqual,
  PercentEqual,
  AmpersandEqual,
  PipeEqual,
  CaretEqual,
  LessLessEqual
};

const char *getTokenName(TokenType Kind);

struct Token {
  TokenType Kind;
  std::string Text; // Raw lexeme, quotes and escapes included
  int Line;
  int Column;
  SourceLocation Loc;    // first character
  SourceLocation EndLoc; // one past the last character

  SourceRange getRange() const { return SourceRange(Loc, EndLoc); }

  bool is(TokenType K) const { return Kind == K; }
  bool isPrimitiveType() const {
    return Kind == TokenType::KwBoolean || Kind == TokenType::KwByte ||
           Kind == TokenType::KwChar || Kind == TokenType::KwShort ||
           Kind == TokenType::KwInt || Kind == TokenType::KwLong ||
           Kind == TokenType::KwFloat || Kind == TokenType::KwDouble;
  }
  bool isModifier() const {
    return Kind == TokenType::KwPublic || Kind == TokenType::KwPrivate ||
           Kind == TokenType::KwProtected || Kind == TokenType::KwStatic ||
           Kind == TokenType::KwFinal || Kind == TokenType::KwAbstract ||
           Kind == TokenType::KwNative ||
           Kind == TokenType::KwSynchronized ||
           Kind == TokenType::KwTransient || Kind == TokenType::KwVolatile ||
           Kind == TokenType::KwStrictfp || Kind == TokenType::KwDefault;
  }

  std::string toString() const {
    // Debug helper
    return std::string(getTokenName(Kind)) + " '" + Text + "'";
  }
};

} // namespace tempo
