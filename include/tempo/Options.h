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

#include "tempo/DiagnosticEngine.h"
#include <string>
#include <vector>

namespace llvm {
class raw_ostream;
} // namespace llvm

namespace tempo {

struct Options {
  std::vector<std::string> InputFiles;
  bool Fix = false;
  bool FixToStdout = false;
  DiagLevel Severity = DiagLevel::Error; // Ignored means "off"
  unsigned ErrorLimit = 20;
  bool Color = false;
  bool DumpTokens = false;
  bool DumpAST = false;
  bool Explain = false;
  bool ListChecks = false;
  bool Verbose = false;
  bool Help = false;
};

/// Parses the tempo-check command line. On failure returns false with
/// \p Error describing the offending argument.
bool parseOptions(int argc, const char *const *argv, Options &Opts,
                  std::string &Error);

void printUsage(llvm::raw_ostream &OS, const char *ProgramName);

} // namespace tempo
