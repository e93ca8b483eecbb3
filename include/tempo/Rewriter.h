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

#include "tempo/BugChecker.h"
#include "tempo/SourceManager.h"
#include <string>
#include <vector>

namespace tempo {

/// Collects textual replacements against buffers owned by a SourceManager
/// and produces the rewritten buffers.
class Rewriter {
public:
  explicit Rewriter(const SourceManager &SM) : m_SM(SM) {}

  /// Queues \p R. A replacement overlapping one queued earlier is reported
  /// as ERR_OVERLAPPING_FIX and dropped; the return value says whether it
  /// was kept.
  bool addReplacement(const Replacement &R);

  /// Queues every replacement of \p Fix.
  void addFix(const SuggestedFix &Fix);

  /// Number of queued replacements inside the file starting at \p FileStart.
  unsigned getNumReplacements(SourceLocation FileStart) const;

  /// The file starting at \p FileStart with its replacements applied.
  std::string getRewrittenText(SourceLocation FileStart) const;

private:
  const SourceManager &m_SM;
  std::vector<Replacement> m_Replacements; // sorted by start location

  bool isInFile(const Replacement &R, SourceLocation FileStart) const;
};

} // namespace tempo
