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
#include "tempo/Lexer.h"
#include "tempo/DiagnosticEngine.h"
#include <llvm/ADT/StringMap.h>

namespace tempo {

static const llvm::StringMap<TokenType> &getKeywords() {
  static const llvm::StringMap<TokenType> Keywords = {
      {"package", TokenType::KwPackage},
      {"import", TokenType::KwImport},
      {"static", TokenType::KwStatic},
      {"class", TokenType::KwClass},
      {"interface", TokenType::KwInterface},
      {"enum", TokenType::KwEnum},
      {"extends", TokenType::KwExtends},
      {"implements", TokenType::KwImplements},
      {"public", TokenType::KwPublic},
      {"private", TokenType::KwPrivate},
      {"protected", TokenType::KwProtected},
      {"final", TokenType::KwFinal},
      {"abstract", TokenType::KwAbstract},
      {"native", TokenType::KwNative},
      {"synchronized", TokenType::KwSynchronized},
      {"transient", TokenType::KwTransient},
      {"volatile", TokenType::KwVolatile},
      {"strictfp", TokenType::KwStrictfp},
      {"default", TokenType::KwDefault},
      {"throws", TokenType::KwThrows},
      {"void", TokenType::KwVoid},
      {"boolean", TokenType::KwBoolean},
      {"byte", TokenType::KwByte},
      {"char", TokenType::KwChar},
      {"short", TokenType::KwShort},
      {"int", TokenType::KwInt},
      {"long", TokenType::KwLong},
      {"float", TokenType::KwFloat},
      {"double", TokenType::KwDouble},
      {"if", TokenType::KwIf},
      {"else", TokenType::KwElse},
      {"while", TokenType::KwWhile},
      {"do", TokenType::KwDo},
      {"for", TokenType::KwFor},
      {"switch", TokenType::KwSwitch},
      {"case", TokenType::KwCase},
      {"break", TokenType::KwBreak},
      {"continue", TokenType::KwContinue},
      {"return", TokenType::KwReturn},
      {"throw", TokenType::KwThrow},
      {"try", TokenType::KwTry},
      {"catch", TokenType::KwCatch},
      {"finally", TokenType::KwFinally},
      {"assert", TokenType::KwAssert},
      {"new", TokenType::KwNew},
      {"this", TokenType::KwThis},
      {"super", TokenType::KwSuper},
      {"null", TokenType::KwNull},
      {"true", TokenType::KwTrue},
      {"false", TokenType::KwFalse},
      {"instanceof", TokenType::KwInstanceof}};
  return Keywords;
}

const char *getTokenName(TokenType Kind) {
  switch (Kind) {
  case TokenType::EndOfFile:
    return "EOF";
  case TokenType::Unknown:
    return "Unknown";
  case TokenType::Identifier:
    return "Identifier";
  case TokenType::Integer:
    return "Integer";
  case TokenType::Float:
    return "Float";
  case TokenType::String:
    return "String";
  case TokenType::Char:
    return "Char";
  case TokenType::LParen:
  case TokenType::RParen:
  case TokenType::LBracket:
  case TokenType::RBracket:
  case TokenType::LBrace:
  case TokenType::RBrace:
  case TokenType::Comma:
  case TokenType::Dot:
  case TokenType::Semicolon:
  case TokenType::Colon:
  case TokenType::ColonColon:
  case TokenType::Question:
  case TokenType::At:
  case TokenType::Arrow:
  case TokenType::DotDotDot:
    return "Punct";
  default:
    break;
  }
  if (Kind >= TokenType::KwPackage && Kind <= TokenType::KwInstanceof)
    return "Keyword";
  return "Operator";
}

Lexer::Lexer(std::string_view Source, SourceLocation FileStart)
    : m_Source(Source), m_FileStart(FileStart) {}

std::vector<Token> Lexer::tokenize() {
  std::vector<Token> tokens;
  while (true) {
    Token t = nextToken();
    if (t.Kind == TokenType::Unknown)
      continue; // already diagnosed
    tokens.push_back(t);
    if (t.Kind == TokenType::EndOfFile)
      break;
  }
  return tokens;
}

Token Lexer::makeToken(TokenType Kind, size_t Start, int Line,
                       int Col) const {
  Token T;
  T.Kind = Kind;
  T.Text = std::string(m_Source.substr(Start, m_Pos - Start));
  T.Line = Line;
  T.Column = Col;
  T.Loc = getLoc(Start);
  T.EndLoc = getLoc(m_Pos);
  return T;
}

void Lexer::skipWhitespace() {
  while (!isAtEnd()) {
    char c = peek();
    if (c == ' ' || c == '\r' || c == '\t' || c == '\n' || c == '\f') {
      advance();
    } else if (c == '/' && peekNext() == '/') {
      while (!isAtEnd() && peek() != '\n')
        advance();
    } else if (c == '/' && peekNext() == '*') {
      SourceLocation Start = getLoc(m_Pos);
      advance();
      advance();
      bool Closed = false;
      while (!isAtEnd()) {
        if (peek() == '*' && peekNext() == '/') {
          advance();
          advance();
          Closed = true;
          break;
        }
        advance();
      }
      if (!Closed)
        DiagnosticEngine::report(Start, DiagID::ERR_UNTERMINATED_COMMENT);
    } else {
      break;
    }
  }
}

Token Lexer::nextToken() {
  skipWhitespace();

  if (isAtEnd())
    return makeToken(TokenType::EndOfFile, m_Pos, m_Line, m_Column);

  // Numbers (".5" is a number too)
  if (isDigit(peek()) || (peek() == '.' && isDigit(peekNext())))
    return number();

  // Identifiers & Keywords
  if (isAlpha(peek()))
    return identifier();

  if (peek() == '"') {
    if (peekAt(1) == '"' && peekAt(2) == '"')
      return textBlock();
    return string();
  }
  if (peek() == '\'')
    return character();

  return punctuation();
}

Token Lexer::identifier() {
  size_t Start = m_Pos;
  int StartLine = m_Line;
  int StartCol = m_Column;

  while (!isAtEnd() && (isAlpha(peek()) || isDigit(peek())))
    advance();

  Token T = makeToken(TokenType::Identifier, Start, StartLine, StartCol);
  auto It = getKeywords().find(T.Text);
  if (It != getKeywords().end())
    T.Kind = It->second;
  return T;
}

Token Lexer::number() {
  size_t Start = m_Pos;
  int Line = m_Line;
  int Col = m_Column;
  bool IsFloat = false;

  if (peek() == '0' && (peekNext() == 'x' || peekNext() == 'X')) {
    advance();
    advance();
    while (!isAtEnd() && (isHexDigit(peek()) || peek() == '_'))
      advance();
  } else if (peek() == '0' && (peekNext() == 'b' || peekNext() == 'B')) {
    advance();
    advance();
    while (!isAtEnd() && (peek() == '0' || peek() == '1' || peek() == '_'))
      advance();
  } else {
    while (!isAtEnd() && (isDigit(peek()) || peek() == '_'))
      advance();
    if (peek() == '.' && isDigit(peekNext())) {
      IsFloat = true;
      advance();
      while (!isAtEnd() && (isDigit(peek()) || peek() == '_'))
        advance();
    } else if (peek() == '.' && !isAlpha(peekNext()) && peekNext() != '.') {
      // "1." is a double literal; "1.foo" is not a thing in Java anyway.
      IsFloat = true;
      advance();
    }
    if (peek() == 'e' || peek() == 'E') {
      char Sign = peekNext();
      if (isDigit(Sign) ||
          ((Sign == '+' || Sign == '-') && isDigit(peekAt(2)))) {
        IsFloat = true;
        advance();
        if (peek() == '+' || peek() == '-')
          advance();
        while (!isAtEnd() && isDigit(peek()))
          advance();
      }
    }
  }

  char Suffix = peek();
  if (Suffix == 'f' || Suffix == 'F' || Suffix == 'd' || Suffix == 'D') {
    IsFloat = true;
    advance();
  } else if (Suffix == 'l' || Suffix == 'L') {
    advance();
  }

  return makeToken(IsFloat ? TokenType::Float : TokenType::Integer, Start,
                   Line, Col);
}

Token Lexer::string() {
  size_t Start = m_Pos;
  int Line = m_Line;
  int Col = m_Column;
  advance(); // opening quote

  while (!isAtEnd() && peek() != '"' && peek() != '\n') {
    if (advance() == '\\' && !isAtEnd())
      advance();
  }

  if (peek() == '"') {
    advance(); // closing quote
  } else {
    DiagnosticEngine::report(getLoc(Start), DiagID::ERR_UNTERMINATED_STRING);
  }

  return makeToken(TokenType::String, Start, Line, Col);
}

Token Lexer::textBlock() {
  size_t Start = m_Pos;
  int Line = m_Line;
  int Col = m_Column;
  advance();
  advance();
  advance();

  while (!isAtEnd()) {
    if (peek() == '\\') {
      advance();
      if (!isAtEnd())
        advance();
      continue;
    }
    if (peek() == '"' && peekAt(1) == '"' && peekAt(2) == '"') {
      advance();
      advance();
      advance();
      return makeToken(TokenType::String, Start, Line, Col);
    }
    advance();
  }

  DiagnosticEngine::report(getLoc(Start), DiagID::ERR_UNTERMINATED_STRING);
  return makeToken(TokenType::String, Start, Line, Col);
}

Token Lexer::character() {
  size_t Start = m_Pos;
  int Line = m_Line;
  int Col = m_Column;
  advance(); // opening quote

  while (!isAtEnd() && peek() != '\'' && peek() != '\n') {
    if (advance() == '\\' && !isAtEnd())
      advance();
  }

  if (peek() == '\'') {
    advance();
  } else {
    DiagnosticEngine::report(getLoc(Start), DiagID::ERR_UNTERMINATED_CHAR);
  }

  return makeToken(TokenType::Char, Start, Line, Col);
}

Token Lexer::punctuation() {
  size_t Start = m_Pos;
  int line = m_Line;
  int col = m_Column;
  char c = advance();

  auto tok = [&](TokenType Kind) { return makeToken(Kind, Start, line, col); };

  switch (c) {
  case '(':
    return tok(TokenType::LParen);
  case ')':
    return tok(TokenType::RParen);
  case '[':
    return tok(TokenType::LBracket);
  case ']':
    return tok(TokenType::RBracket);
  case '{':
    return tok(TokenType::LBrace);
  case '}':
    return tok(TokenType::RBrace);
  case ',':
    return tok(TokenType::Comma);
  case ';':
    return tok(TokenType::Semicolon);
  case '?':
    return tok(TokenType::Question);
  case '@':
    return tok(TokenType::At);
  case '~':
    return tok(TokenType::Tilde);
  case ':':
    if (match(':'))
      return tok(TokenType::ColonColon);
    return tok(TokenType::Colon);
  case '.':
    if (peek() == '.' && peekNext() == '.') {
      advance();
      advance();
      return tok(TokenType::DotDotDot);
    }
    return tok(TokenType::Dot);
  case '+':
    if (match('='))
      return tok(TokenType::PlusEqual);
    if (match('+'))
      return tok(TokenType::PlusPlus);
    return tok(TokenType::Plus);
  case '-':
    if (match('='))
      return tok(TokenType::MinusEqual);
    if (match('-'))
      return tok(TokenType::MinusMinus);
    if (match('>'))
      return tok(TokenType::Arrow);
    return tok(TokenType::Minus);
  case '*':
    if (match('='))
      return tok(TokenType::StarEqual);
    return tok(TokenType::Star);
  case '/':
    if (match('='))
      return tok(TokenType::SlashEqual);
    return tok(TokenType::Slash);
  case '%':
    if (match('='))
      return tok(TokenType::PercentEqual);
    return tok(TokenType::Percent);
  case '=':
    if (match('='))
      return tok(TokenType::DoubleEqual);
    return tok(TokenType::Equal);
  case '!':
    if (match('='))
      return tok(TokenType::Neq);
    return tok(TokenType::Bang);
  case '&':
    if (match('&'))
      return tok(TokenType::AndAnd);
    if (match('='))
      return tok(TokenType::AmpersandEqual);
    return tok(TokenType::Ampersand);
  case '|':
    if (match('|'))
      return tok(TokenType::OrOr);
    if (match('='))
      return tok(TokenType::PipeEqual);
    return tok(TokenType::Pipe);
  case '^':
    if (match('='))
      return tok(TokenType::CaretEqual);
    return tok(TokenType::Caret);
  case '<':
    if (peek() == '<' && peekNext() == '=') {
      advance();
      advance();
      return tok(TokenType::LessLessEqual);
    }
    if (match('<'))
      return tok(TokenType::LessLess);
    if (match('='))
      return tok(TokenType::LessEqual);
    return tok(TokenType::Less);
  case '>':
    // '>>' is left to the parser so that nested type arguments close cleanly.
    if (match('='))
      return tok(TokenType::GreaterEqual);
    return tok(TokenType::Greater);
  default:
    DiagnosticEngine::report(getLoc(Start), DiagID::ERR_UNEXPECTED_CHAR,
                             std::string(1, c));
    return tok(TokenType::Unknown);
  }
}

} // namespace tempo
