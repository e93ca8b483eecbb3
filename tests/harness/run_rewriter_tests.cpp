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
#include "tempo/Rewriter.h"
#include "tempo/SourceManager.h"
#include "llvm/Support/raw_ostream.h"

#include <iostream>
#include <string>

using namespace tempo;

namespace {

static bool require_(bool cond, const std::string &msg) {
  if (cond)
    return true;
  std::cerr << "  - " << msg << "\n";
  return false;
}

static SourceRange range_(SourceLocation FileStart, int Begin, int End) {
  return SourceRange(FileStart.getLocWithOffset(Begin),
                     FileStart.getLocWithOffset(End));
}

/// Routes diagnostics into a string for the lifetime of the object.
struct CapturedDiagnostics {
  std::string Text;
  llvm::raw_string_ostream OS;

  explicit CapturedDiagnostics(SourceManager &SM) : OS(Text) {
    DiagnosticEngine::reset();
    DiagnosticEngine::init(SM);
    DiagnosticEngine::setOutput(OS);
  }
  ~CapturedDiagnostics() { DiagnosticEngine::setOutput(llvm::errs()); }

  const std::string &str() { return OS.str(); }
};

static bool test_apply_in_order_() {
  SourceManager SM;
  CapturedDiagnostics diags(SM);
  //                                       0         1         2         3
  //                                       0123456789012345678901234567890123
  SourceLocation file = SM.addFile("A.java", "x = Instant.from(i); y = Year.from(yr);");
  Rewriter rewrite(SM);

  bool ok = true;
  // Queued back to front on purpose.
  ok &= require_(rewrite.addReplacement({range_(file, 25, 38), "yr"}),
                 "second call accepted");
  ok &= require_(rewrite.addReplacement({range_(file, 4, 19), "i"}),
                 "first call accepted");
  ok &= require_(rewrite.getNumReplacements(file) == 2, "two replacements");
  ok &= require_(rewrite.getRewrittenText(file) == "x = i; y = yr;",
                 "rewritten: " + rewrite.getRewrittenText(file));
  ok &= require_(!DiagnosticEngine::hasErrors(), "no errors");
  return ok;
}

static bool test_overlap_is_rejected_() {
  SourceManager SM;
  CapturedDiagnostics diags(SM);
  SourceLocation file =
      SM.addFile("B.java", "Instant.from(Instant.from(i));");
  Rewriter rewrite(SM);

  bool ok = true;
  ok &= require_(rewrite.addReplacement({range_(file, 13, 28), "i"}),
                 "inner call accepted");
  ok &= require_(!rewrite.addReplacement({range_(file, 0, 29), "Instant.from(i)"}),
                 "enclosing call rejected");
  ok &= require_(rewrite.getNumReplacements(file) == 1, "one replacement kept");
  ok &= require_(rewrite.getRewrittenText(file) == "Instant.from(i);",
                 "only the inner fix applies: " + rewrite.getRewrittenText(file));
  ok &= require_(diags.str().find("B.java:1:1: error: suggested fix overlaps "
                                  "an earlier fix and was not applied "
                                  "[E0301]") != std::string::npos,
                 "overlap is reported: " + diags.str());
  return ok;
}

static bool test_adjacent_and_insertions_() {
  SourceManager SM;
  CapturedDiagnostics diags(SM);
  SourceLocation file = SM.addFile("C.java", "abcdef");
  Rewriter rewrite(SM);

  bool ok = true;
  ok &= require_(rewrite.addReplacement({range_(file, 0, 3), "X"}),
                 "first half");
  ok &= require_(rewrite.addReplacement({range_(file, 3, 6), "Y"}),
                 "touching second half");
  ok &= require_(rewrite.getRewrittenText(file) == "XY", "adjacent ranges");

  SourceManager SM2;
  CapturedDiagnostics diags2(SM2);
  SourceLocation other = SM2.addFile("D.java", "abc");
  Rewriter inserts(SM2);
  ok &= require_(inserts.addReplacement({range_(other, 1, 1), "1"}),
                 "insertion");
  ok &= require_(!inserts.addReplacement({range_(other, 1, 1), "2"}),
                 "second insertion at the same point");
  ok &= require_(inserts.getRewrittenText(other) == "a1bc", "one insertion");
  return ok;
}

static bool test_files_are_separate_() {
  SourceManager SM;
  CapturedDiagnostics diags(SM);
  SourceLocation first = SM.addFile("E.java", "Month.from(m)");
  SourceLocation second = SM.addFile("F.java", "Year.from(y)");
  Rewriter rewrite(SM);

  SuggestedFix fix;
  fix.replace(range_(second, 0, 12), "y");
  rewrite.addFix(fix);

  bool ok = true;
  ok &= require_(rewrite.getNumReplacements(first) == 0, "nothing in E.java");
  ok &= require_(rewrite.getNumReplacements(second) == 1, "one in F.java");
  ok &= require_(rewrite.getRewrittenText(first) == "Month.from(m)",
                 "E.java untouched");
  ok &= require_(rewrite.getRewrittenText(second) == "y", "F.java rewritten");
  return ok;
}

} // namespace

int main() {
  struct Case {
    const char *name;
    bool (*fn)();
  };

  const Case cases[] = {
      {"apply_in_order", test_apply_in_order_},
      {"overlap_is_rejected", test_overlap_is_rejected_},
      {"adjacent_and_insertions", test_adjacent_and_insertions_},
      {"files_are_separate", test_files_are_separate_},
  };

  int failed = 0;
  for (const auto &c : cases) {
    std::cout << "[TEST] " << c.name << "\n";
    if (!c.fn()) {
      ++failed;
      std::cout << "  -> FAIL\n";
    } else {
      std::cout << "  -> PASS\n";
    }
  }

  if (failed != 0) {
    std::cout << "\nFAILED " << failed << " test(s)\n";
    return 1;
  }
  std::cout << "\nALL TESTS PASSED\n";
  return 0;
}
