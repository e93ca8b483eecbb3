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
#include "tempo/Options.h"
#include "llvm/Support/raw_ostream.h"

#include <iostream>
#include <string>
#include <vector>

using namespace tempo;

namespace {

static bool require_(bool cond, const std::string &msg) {
  if (cond)
    return true;
  std::cerr << "  - " << msg << "\n";
  return false;
}

static bool parse_(std::vector<const char *> args, Options &opts,
                   std::string &err) {
  args.insert(args.begin(), "tempo-check");
  return parseOptions(static_cast<int>(args.size()), args.data(), opts, err);
}

static bool test_defaults_() {
  Options opts;
  std::string err;
  bool ok = true;
  ok &= require_(parse_({"A.java", "B.java"}, opts, err), "plain files parse");
  ok &= require_(opts.InputFiles.size() == 2 && opts.InputFiles[1] == "B.java",
                 "input files kept in order");
  ok &= require_(!opts.Fix && !opts.FixToStdout, "no fixing by default");
  ok &= require_(opts.Severity == DiagLevel::Error, "error severity");
  ok &= require_(opts.ErrorLimit == 20, "default error limit");
  return ok;
}

static bool test_flags_() {
  Options opts;
  std::string err;
  bool ok = true;
  ok &= require_(parse_({"--fix", "--severity=warning", "--error-limit=0",
                         "--no-color", "-v", "A.java"},
                        opts, err),
                 "flags parse: " + err);
  ok &= require_(opts.Fix, "--fix");
  ok &= require_(opts.Severity == DiagLevel::Warning, "--severity=warning");
  ok &= require_(opts.ErrorLimit == 0, "--error-limit=0");
  ok &= require_(!opts.Color, "--no-color");
  ok &= require_(opts.Verbose, "-v");

  Options off;
  ok &= require_(parse_({"--severity=off", "--color", "A.java"}, off, err),
                 "severity off parses");
  ok &= require_(off.Severity == DiagLevel::Ignored, "off maps to Ignored");
  ok &= require_(off.Color, "--color");
  return ok;
}

static bool test_files_after_dashes_() {
  Options opts;
  std::string err;
  bool ok = true;
  ok &= require_(parse_({"-", "--", "--fix", "-x.java"}, opts, err),
                 "dash arguments parse");
  ok &= require_(opts.InputFiles.size() == 3 && opts.InputFiles[0] == "-" &&
                     opts.InputFiles[1] == "--fix" &&
                     opts.InputFiles[2] == "-x.java",
                 "`-` is stdin and `--` ends options");
  ok &= require_(!opts.Fix, "--fix after -- is a file name");
  return ok;
}

static bool test_errors_() {
  bool ok = true;
  {
    Options opts;
    std::string err;
    ok &= require_(!parse_({"--bogus", "A.java"}, opts, err), "unknown flag");
    ok &= require_(err == "unknown option '--bogus'", "message: " + err);
  }
  {
    Options opts;
    std::string err;
    ok &= require_(!parse_({"--severity=fatal", "A.java"}, opts, err),
                   "bad severity");
    ok &= require_(err.find("'fatal'") != std::string::npos, "names the value");
  }
  {
    Options opts;
    std::string err;
    ok &= require_(!parse_({"--error-limit=many", "A.java"}, opts, err),
                   "bad error limit");
  }
  {
    Options opts;
    std::string err;
    ok &= require_(!parse_({"--fix", "--fix-to-stdout", "A.java"}, opts, err),
                   "conflicting fix modes");
  }
  {
    Options opts;
    std::string err;
    ok &= require_(!parse_({"--fix"}, opts, err), "no input files");
    ok &= require_(err == "no input files", "message: " + err);
  }
  return ok;
}

static bool test_informational_modes_() {
  bool ok = true;
  const char *const modes[] = {"--help", "-h", "--explain", "--list-checks"};
  for (const char *mode : modes) {
    Options opts;
    std::string err;
    ok &= require_(parse_({mode}, opts, err),
                   std::string(mode) + " needs no input files");
  }

  std::string usage;
  llvm::raw_string_ostream OS(usage);
  printUsage(OS, "tempo-check");
  OS.flush();
  ok &= require_(usage.rfind("Usage: tempo-check", 0) == 0, "usage header");
  ok &= require_(usage.find("--fix-to-stdout") != std::string::npos,
                 "usage lists the options");
  return ok;
}

} // namespace

int main() {
  struct Case {
    const char *name;
    bool (*fn)();
  };

  const Case cases[] = {
      {"defaults", test_defaults_},
      {"flags", test_flags_},
      {"files_after_dashes", test_files_after_dashes_},
      {"errors", test_errors_},
      {"informational_modes", test_informational_modes_},
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
