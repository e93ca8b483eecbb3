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
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/Process.h"
#include "llvm/Support/raw_ostream.h"

namespace tempo {

bool parseOptions(int argc, const char *const *argv, Options &Opts,
                  std::string &Error) {
  Opts.Color = llvm::sys::Process::StandardErrHasColors();

  bool onlyFiles = false;
  for (int i = 1; i < argc; ++i) {
    llvm::StringRef arg = argv[i];

    if (onlyFiles || arg == "-" || !arg.startswith("-")) {
      Opts.InputFiles.push_back(arg.str());
      continue;
    }
    if (arg == "--") {
      onlyFiles = true;
      continue;
    }

    if (arg == "--fix") {
      Opts.Fix = true;
    } else if (arg == "--fix-to-stdout") {
      Opts.FixToStdout = true;
    } else if (arg.consume_front("--severity=")) {
      llvm::Optional<DiagLevel> level =
          llvm::StringSwitch<llvm::Optional<DiagLevel>>(arg)
              .Case("error", DiagLevel::Error)
              .Case("warning", DiagLevel::Warning)
              .Case("off", DiagLevel::Ignored)
              .Default(llvm::None);
      if (!level) {
        Error = "invalid severity '" + arg.str() +
                "' (expected error, warning or off)";
        return false;
      }
      Opts.Severity = *level;
    } else if (arg.consume_front("--error-limit=")) {
      unsigned limit = 0;
      if (arg.getAsInteger(10, limit)) {
        Error = "invalid error limit '" + arg.str() + "'";
        return false;
      }
      Opts.ErrorLimit = limit;
    } else if (arg == "--color") {
      Opts.Color = true;
    } else if (arg == "--no-color") {
      Opts.Color = false;
    } else if (arg == "--dump-tokens") {
      Opts.DumpTokens = true;
    } else if (arg == "--dump-ast") {
      Opts.DumpAST = true;
    } else if (arg == "--explain") {
      Opts.Explain = true;
    } else if (arg == "--list-checks") {
      Opts.ListChecks = true;
    } else if (arg == "-v" || arg == "--verbose") {
      Opts.Verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      Opts.Help = true;
    } else {
      Error = "unknown option '" + arg.str() + "'";
      return false;
    }
  }

  if (Opts.Fix && Opts.FixToStdout) {
    Error = "--fix and --fix-to-stdout cannot be used together";
    return false;
  }
  bool needsInput = !(Opts.Help || Opts.Explain || Opts.ListChecks);
  if (needsInput && Opts.InputFiles.empty()) {
    Error = "no input files";
    return false;
  }
  return true;
}

void printUsage(llvm::raw_ostream &OS, const char *ProgramName) {
  OS << "Usage: " << ProgramName << " [options] <file.java>...\n"
     << "\n"
     << "Reports java.time from(TemporalAccessor) conversions that always\n"
     << "throw or return their argument. '-' reads standard input.\n"
     << "\n"
     << "Options:\n"
     << "  --fix                 apply suggested fixes to the input files\n"
     << "  --fix-to-stdout       print every file with fixes applied\n"
     << "  --severity=<level>    error (default), warning or off\n"
     << "  --error-limit=<n>     stop printing after n errors (0 = no limit)\n"
     << "  --color, --no-color   force diagnostic colours on or off\n"
     << "  --dump-tokens         print the token stream and exit\n"
     << "  --dump-ast            print the parsed tree and exit\n"
     << "  --explain             describe the check and exit\n"
     << "  --list-checks         list the available checks and exit\n"
     << "  -v, --verbose         log progress to stderr\n"
     << "  -h, --help            show this message\n";
}

} // namespace tempo
