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
#include "tempo/Checker.h"
#include "tempo/DiagnosticEngine.h"
#include "tempo/FromTemporalAccessor.h"
#include "tempo/Lexer.h"
#include "tempo/LibraryModel.h"
#include "tempo/Options.h"
#include "tempo/Parser.h"
#include "tempo/Rewriter.h"
#include "tempo/Sema.h"
#include "tempo/SourceManager.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/raw_ostream.h"
#include <memory>
#include <vector>

using namespace tempo;

namespace {

struct InputFile {
  std::string Path;
  SourceLocation Start;
  std::unique_ptr<CompilationUnit> Unit;
};

const char *getLevelName(DiagLevel Level) {
  switch (Level) {
  case DiagLevel::Error:
    return "error";
  case DiagLevel::Warning:
    return "warning";
  case DiagLevel::Note:
    return "note";
  case DiagLevel::Ignored:
    return "off";
  }
  return "error";
}

void dumpTokens(const std::vector<Token> &Tokens) {
  for (const Token &Tok : Tokens) {
    llvm::outs() << Tok.Line << ":" << Tok.Column << " "
                 << getTokenName(Tok.Kind);
    if (!Tok.Text.empty())
      llvm::outs() << " '" << Tok.Text << "'";
    llvm::outs() << "\n";
  }
}

bool writeFile(const InputFile &File, const std::string &Text) {
  if (File.Path == "-") {
    llvm::outs() << Text;
    return true;
  }
  std::error_code EC;
  llvm::raw_fd_ostream OS(File.Path, EC, llvm::sys::fs::OF_Text);
  if (EC) {
    DiagnosticEngine::report(DiagLoc{File.Path, 0, 0},
                             DiagID::ERR_CANNOT_WRITE_FILE, File.Path,
                             EC.message());
    return false;
  }
  OS << Text;
  OS.close();
  if (OS.has_error()) {
    DiagnosticEngine::report(DiagLoc{File.Path, 0, 0},
                             DiagID::ERR_CANNOT_WRITE_FILE, File.Path,
                             OS.error().message());
    OS.clear_error();
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char **argv) {
  Options Opts;
  std::string Error;
  if (!parseOptions(argc, argv, Opts, Error)) {
    llvm::errs() << argv[0] << ": error: " << Error << "\n";
    printUsage(llvm::errs(), argv[0]);
    return 2;
  }

  const BugPatternInfo &Info = FromTemporalAccessor::Info;
  if (Opts.Help) {
    printUsage(llvm::outs(), argv[0]);
    return 0;
  }
  if (Opts.ListChecks) {
    llvm::outs() << Info.Name << " [" << getLevelName(Opts.Severity)
                 << "]: " << Info.Summary << "\n";
    return 0;
  }
  if (Opts.Explain) {
    llvm::outs() << Info.Name << "\n\n"
                 << Info.Summary << "\n\n"
                 << Info.Explanation << "\n";
    return 0;
  }

  SourceManager SM;
  DiagnosticEngine::init(SM);
  DiagnosticEngine::ErrorLimit = Opts.ErrorLimit;
  DiagnosticEngine::UseColor = Opts.Color;
  DiagnosticEngine::setLevel(DiagID::ERR_FROM_TEMPORAL_ACCESSOR_INVALID,
                             Opts.Severity);
  DiagnosticEngine::setLevel(DiagID::ERR_FROM_TEMPORAL_ACCESSOR_REDUNDANT,
                             Opts.Severity);

  // Load everything first: buffers must stay put while tokens and fixes
  // point into them.
  std::vector<InputFile> Files;
  for (const std::string &Path : Opts.InputFiles) {
    std::string Reason;
    SourceLocation Start = SM.loadFile(Path, Reason);
    if (Start.isInvalid()) {
      DiagnosticEngine::report(DiagLoc{Path, 0, 0},
                               DiagID::ERR_CANNOT_OPEN_FILE, Path, Reason);
      continue;
    }
    Files.push_back({Path, Start, nullptr});
  }

  for (InputFile &File : Files) {
    if (Opts.Verbose)
      llvm::errs() << "Parsing " << File.Path << "...\n";

    Lexer lexer(SM.getBufferData(File.Start), File.Start);
    std::vector<Token> tokens = lexer.tokenize();
    if (Opts.DumpTokens) {
      dumpTokens(tokens);
      continue;
    }

    Parser parser(tokens);
    File.Unit = parser.parseCompilationUnit();
    if (Opts.DumpAST)
      llvm::outs() << File.Unit->toString() << "\n";
  }
  if (Opts.DumpTokens || Opts.DumpAST)
    return DiagnosticEngine::hasErrors() ? 1 : 0;

  if (Opts.Verbose)
    llvm::errs() << "Attributing " << Files.size() << " file(s)...\n";

  TypeContext Ctx;
  loadLibraryModel(Ctx);
  Sema sema(Ctx);
  std::vector<CompilationUnit *> Units;
  for (InputFile &File : Files)
    Units.push_back(File.Unit.get());
  sema.checkCompilationUnits(Units);

  if (Opts.Severity == DiagLevel::Ignored)
    return DiagnosticEngine::hasErrors() ? 1 : 0;

  FromTemporalAccessor Check(Ctx);
  const BugChecker *Checks[] = {&Check};
  Checker checker(SM, Checks);
  Rewriter Rewrite(SM);

  for (InputFile &File : Files) {
    if (Opts.Verbose)
      llvm::errs() << "Checking " << File.Path << "...\n";
    for (const Finding &F : checker.checkCompilationUnit(*File.Unit)) {
      reportFinding(F);
      Rewrite.addFix(F.Fix);
    }
  }

  if (Opts.Fix || Opts.FixToStdout) {
    for (const InputFile &File : Files) {
      unsigned numFixes = Rewrite.getNumReplacements(File.Start);
      if (Opts.FixToStdout) {
        llvm::outs() << Rewrite.getRewrittenText(File.Start);
        continue;
      }
      if (numFixes == 0)
        continue;
      if (writeFile(File, Rewrite.getRewrittenText(File.Start)))
        DiagnosticEngine::report(File.Start, DiagID::NOTE_FIXES_APPLIED,
                                 numFixes);
    }
  }

  return DiagnosticEngine::hasErrors() ? 1 : 0;
}
