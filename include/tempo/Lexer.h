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

#include "tempo/Token.h"
#include <string_view>
#include <vector>

namespace tempo {

class Lexer {
public:
  /// \p FileStart is the location of Source[0] in the SourceManager.
  Lexer(std::string_view Source, SourceLocation FileStart);

  // Returns a vector of all tokens, always terminated by EndOfFile.
  std::vector<Token> tokenize();

private:
  std::string_view m_Source;
  size_t m_Pos = 0;
  SourceLocation m_FileStart;
  int m_Line = 1;
  int m_Column = 1;

  void skipWhitespace();
  Token nextToken();
  Token identifier();
  Token number();
  Token string();
  Token textBlock();
  Token character();
  Token punctuation();

  Token makeToken(TokenType Kind, size_t Start, int Line, int Col) const;
  SourceLocation getLoc(size_t Offset) const {
    return m_FileStart.getLocWithOffset(static_cast<int32_t>(Offset));
  }

  char peek() const { return m_Pos < m_Source.size() ? m_Source[m_Pos] : '\0'; }
  char peekNext() const {
    return m_Pos + 1 < m_Source.size() ? m_Source[m_Pos + 1] : '\0';
  }
  char peekAt(size_t Offset) const {
    return m_Pos + Offset < m_Source.size() ? m_Source[m_Pos + Offset] : '\0';
  }
  bool isAtEnd() const { return m_Pos >= m_Source.size(); }
  char advance() {
    char c = m_Source[m_Pos];
    if (c == '\n') {
      m_Line++;
      m_Column = 1;
    } else {
      m_Column++;
    }
    m_Pos++;
    return c;
  }
  bool match(char expected) {
    if (!isAtEnd() && peek() == expected) {
      advance();
      return true;
    }
    return false;
  }

  static bool isAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
           c == '$' || static_cast<unsigned char>(c) >= 0x80;
  }
  static bool isDigit(char c) { return c >= '0' && c <= '9'; }
  static bool isHexDigit(char c) {
    return isDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
  }
};

} // namespace tempo
