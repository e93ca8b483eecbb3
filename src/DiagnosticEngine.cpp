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
#include "tempo/DiagnosticEngine.h"
#include "tempo/SourceManager.h"
#include <llvm/Support/raw_ostream.h>

namespace tempo {

SourceManager *DiagnosticEngine::SrcMgr = nullptr;
int DiagnosticEngine::ErrorCount = 0;
int DiagnosticEngine::WarningCount = 0;
unsigned DiagnosticEngine::ErrorLimit = 20;
bool DiagnosticEngine::UseColor = false;
bool DiagnosticEngine::LimitReported = false;
llvm::raw_ostream *DiagnosticEngine::Out = nullptr;
std::map<DiagID, DiagLevel> DiagnosticEngine::LevelOverrides;

void DiagnosticEngine::reset() {
  SrcMgr = nullptr;
  ErrorCount = 0;
  WarningCount = 0;
  LimitReported = false;
  LevelOverrides.clear();
}

const char *DiagnosticEngine::getFormatString(DiagID id) {
  switch (id) {
#define DIAG(ID, Level, Code, Msg)                                             \
  case DiagID::ID:                                                             \
    return Msg;
#include "tempo/DiagnosticDefs.def"
#undef DIAG
  case DiagID::NUM_DIAGNOSTICS:
    return "Unknown Error";
  }
  return "Unknown Error";
}

DiagLevel DiagnosticEngine::getDefaultLevel(DiagID id) {
  switch (id) {
#define DIAG(ID, Level, Code, Msg)                                             \
  case DiagID::ID:                                                             \
    return DiagLevel::Level;
#include "tempo/DiagnosticDefs.def"
#undef DIAG
  case DiagID::NUM_DIAGNOSTICS:
    return DiagLevel::Error;
  }
  return DiagLevel::Error;
}

DiagLevel DiagnosticEngine::getLevel(DiagID id) {
  auto It = LevelOverrides.find(id);
  if (It != LevelOverrides.end())
    return It->second;
  return getDefaultLevel(id);
}

const char *DiagnosticEngine::getCode(DiagID id) {
  switch (id) {
#define DIAG(ID, Level, Code, Msg)                                             \
  case DiagID::ID:                                                             \
    return Code;
#include "tempo/DiagnosticDefs.def"
#undef DIAG
  case DiagID::NUM_DIAGNOSTICS:
    return "";
  }
  return "";
}

void DiagnosticEngine::reportImpl(DiagLoc loc, DiagID id,
                                  const std::string &message) {
  DiagLevel level = getLevel(id);
  if (level == DiagLevel::Ignored)
    return;

  // Update stats
  if (level == DiagLevel::Error) {
    ErrorCount++;
  } else if (level == DiagLevel::Warning) {
    WarningCount++;
  }

  llvm::raw_ostream &OS = Out ? *Out : llvm::errs();

  // Past the limit we keep counting but stop printing.
  if (ErrorLimit != 0 && static_cast<unsigned>(ErrorCount) > ErrorLimit) {
    if (!LimitReported) {
      LimitReported = true;
      if (UseColor)
        OS.changeColor(llvm::raw_ostream::RED, /*Bold=*/true);
      OS << "fatal: ";
      if (UseColor)
        OS.resetColor();
      OS << "too many errors emitted, stopping now.\n";
    }
    return;
  }
  if (LimitReported)
    return;

  llvm::raw_ostream::Colors color = llvm::raw_ostream::CYAN;
  const char *levelStr = "note";
  if (level == DiagLevel::Error) {
    color = llvm::raw_ostream::RED;
    levelStr = "error";
  } else if (level == DiagLevel::Warning) {
    color = llvm::raw_ostream::YELLOW;
    levelStr = "warning";
  }

  OS << loc.File << ":" << loc.Line << ":" << loc.Col << ": ";
  if (UseColor)
    OS.changeColor(color, /*Bold=*/true);
  OS << levelStr << ": ";
  if (UseColor)
    OS.resetColor();
  OS << message;
  if (level != DiagLevel::Note)
    OS << " [" << getCode(id) << "]";
  OS << "\n";
}

void DiagnosticEngine::reportImpl(SourceLocation loc, DiagID id,
                                  const std::string &message) {
  if (SrcMgr) {
    FullSourceLoc Full = SrcMgr->getFullSourceLoc(loc);
    if (Full.isValid()) {
      DiagLoc DL{Full.FileName, (int)Full.Line, (int)Full.Column};
      reportImpl(DL, id, message);
      return;
    }
  }
  DiagLoc DL{"<unknown>", 0, 0};
  reportImpl(DL, id,
             message + " [RawLoc: " + std::to_string(loc.getRawEncoding()) +
                 "]");
}

} // namespace tempo
