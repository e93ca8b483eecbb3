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
#include "tempo/Parser.h"
#include "tempo/Rewriter.h"
#include "tempo/Sema.h"
#include "tempo/SourceManager.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#ifndef TEMPO_TEST_CASE_DIR
#define TEMPO_TEST_CASE_DIR "tests/cases"
#endif

using namespace tempo;

namespace {

static const char *const BugMarker = "// BUG: Diagnostic contains: ";

/// Result of running the whole pipeline over one case file.
struct CaseRun {
  SourceManager SM;
  SourceLocation Start;
  std::vector<Finding> Findings;
  std::string Rewritten;
  std::string Diagnostics;
  unsigned ParseErrors = 0;
  bool Loaded = false;

  explicit CaseRun(const std::string &Path) {
    llvm::raw_string_ostream OS(Diagnostics);
    DiagnosticEngine::reset();
    DiagnosticEngine::init(SM);
    DiagnosticEngine::setOutput(OS);

    std::string Reason;
    Start = SM.loadFile(Path, Reason);
    Loaded = Start.isValid();
    if (Loaded)
      run();

    OS.flush();
    DiagnosticEngine::setOutput(llvm::errs());
  }

private:
  void run() {
    Lexer lexer(SM.getBufferData(Start), Start);
    std::vector<Token> tokens = lexer.tokenize();
    Parser parser(tokens);
    std::unique_ptr<CompilationUnit> Unit = parser.parseCompilationUnit();
    ParseErrors = parser.getNumErrors();

    TypeContext Ctx;
    loadLibraryModel(Ctx);
    Sema sema(Ctx);
    std::vector<CompilationUnit *> Units = {Unit.get()};
    sema.checkCompilationUnits(Units);

    FromTemporalAccessor Check(Ctx);
    const BugChecker *Checks[] = {&Check};
    Checker checker(SM, Checks);
    Rewriter Rewrite(SM);
    Findings = checker.checkCompilationUnit(*Unit);
    for (const Finding &F : Findings)
      Rewrite.addFix(F.Fix);
    Rewritten = Rewrite.getRewrittenText(Start);
  }
};

static bool require_(bool cond, const std::string &msg) {
  if (cond)
    return true;
  std::cerr << "  - " << msg << "\n";
  return false;
}

/// Maps each line following a BUG marker to the text the marker expects.
static std::map<unsigned, std::string> collectExpectations(llvm::StringRef Text) {
  std::map<unsigned, std::string> expected;
  llvm::SmallVector<llvm::StringRef, 64> lines;
  Text.split(lines, '\n');
  for (unsigned i = 0; i < lines.size(); ++i) {
    size_t pos = lines[i].find(BugMarker);
    if (pos == llvm::StringRef::npos)
      continue;
    llvm::StringRef want = lines[i].substr(pos + llvm::StringRef(BugMarker).size());
    // Lines are 1-based; the marker applies to the next one.
    expected[i + 2] = want.rtrim().str();
  }
  return expected;
}

static bool checkFindings(const std::string &Path) {
  CaseRun run(Path);
  if (!require_(run.Loaded, "cannot load " + Path))
    return false;

  bool ok = true;
  ok &= require_(run.ParseErrors == 0,
                 "parse errors in " + Path + ":\n" + run.Diagnostics);

  std::string_view text = run.SM.getBufferData(run.Start);
  std::map<unsigned, std::string> expected =
      collectExpectations(llvm::StringRef(text.data(), text.size()));
  std::map<unsigned, bool> seen;
  for (const Finding &F : run.Findings) {
    unsigned line = run.SM.getFullSourceLoc(F.Range.Begin).Line;
    auto it = expected.find(line);
    if (it == expected.end()) {
      ok &= require_(false, Path + ":" + std::to_string(line) +
                                ": unexpected finding: " + F.Message);
      continue;
    }
    ok &= require_(F.Message.find(it->second) != std::string::npos,
                   Path + ":" + std::to_string(line) + ": message '" +
                       F.Message + "' lacks '" + it->second + "'");
    seen[line] = true;
  }
  for (const auto &entry : expected)
    ok &= require_(seen.count(entry.first) != 0,
                   Path + ":" + std::to_string(entry.first) +
                       ": expected a finding containing '" + entry.second +
                       "'");
  return ok;
}

static bool checkRefactoring(const std::string &InputPath,
                             const std::string &OutputPath) {
  CaseRun run(InputPath);
  if (!require_(run.Loaded, "cannot load " + InputPath))
    return false;

  SourceManager ExpectedSM;
  std::string Reason;
  SourceLocation ExpectedStart = ExpectedSM.loadFile(OutputPath, Reason);
  if (!require_(ExpectedStart.isValid(),
                "cannot load " + OutputPath + ": " + Reason))
    return false;

  bool ok = true;
  ok &= require_(run.ParseErrors == 0, "parse errors in " + InputPath);
  ok &= require_(!run.Findings.empty(), "no findings in " + InputPath);
  std::string expected(ExpectedSM.getBufferData(ExpectedStart));
  ok &= require_(run.Rewritten == expected,
                 "rewritten " + InputPath + " differs from " + OutputPath +
                     ":\n" + run.Rewritten);
  return ok;
}

} // namespace

int main() {
  std::vector<std::string> paths;
  std::error_code EC;
  for (llvm::sys::fs::directory_iterator It(TEMPO_TEST_CASE_DIR, EC), End;
       It != End && !EC; It.increment(EC)) {
    if (llvm::sys::path::extension(It->path()) == ".java")
      paths.push_back(It->path());
  }
  if (EC || paths.empty()) {
    std::cout << "cannot read case directory " << TEMPO_TEST_CASE_DIR << "\n";
    return 1;
  }
  std::sort(paths.begin(), paths.end());

  int failed = 0;
  auto runCase = [&failed](const std::string &name, bool passed) {
    std::cout << "[TEST] " << name << "\n";
    if (!passed) {
      ++failed;
      std::cout << "  -> FAIL\n";
    } else {
      std::cout << "  -> PASS\n";
    }
  };

  for (const std::string &path : paths) {
    llvm::StringRef stem = llvm::sys::path::stem(path);
    if (stem.endswith("_output"))
      continue;
    if (stem.endswith("_input")) {
      llvm::SmallString<128> output(llvm::sys::path::parent_path(path));
      llvm::sys::path::append(
          output, stem.drop_back(llvm::StringRef("_input").size()).str() +
                      "_output.java");
      runCase(stem.str(), checkRefactoring(path, output.str().str()));
      continue;
    }
    runCase(stem.str(), checkFindings(path));
  }

  if (failed != 0) {
    std::cout << "\nFAILED " << failed << " test(s)\n";
    return 1;
  }
  std::cout << "\nALL TESTS PASSED\n";
  return 0;
}
