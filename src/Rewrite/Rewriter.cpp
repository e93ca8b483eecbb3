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
#include "tempo/Rewriter.h"
#include "tempo/DiagnosticEngine.h"
#include <algorithm>
#include <iterator>

namespace tempo {

bool Rewriter::addReplacement(const Replacement &R) {
  auto It = std::upper_bound(m_Replacements.begin(), m_Replacements.end(), R,
                             [](const Replacement &A, const Replacement &B) {
                               return A.Range.Begin < B.Range.Begin;
                             });

  // Only the neighbours can overlap, since the queued ranges are disjoint.
  bool overlaps = false;
  if (It != m_Replacements.end() && It->Range.overlaps(R.Range))
    overlaps = true;
  if (It != m_Replacements.begin() && std::prev(It)->Range.overlaps(R.Range))
    overlaps = true;
  // Two insertions at the same point have no defined order either.
  if (It != m_Replacements.begin() &&
      std::prev(It)->Range.Begin == R.Range.Begin)
    overlaps = true;

  if (overlaps) {
    DiagnosticEngine::report(R.Range.Begin, DiagID::ERR_OVERLAPPING_FIX);
    return false;
  }
  m_Replacements.insert(It, R);
  return true;
}

void Rewriter::addFix(const SuggestedFix &Fix) {
  for (const Replacement &R : Fix.Replacements)
    addReplacement(R);
}

bool Rewriter::isInFile(const Replacement &R, SourceLocation FileStart) const {
  uint32_t begin = FileStart.getRawEncoding();
  uint32_t end =
      begin + static_cast<uint32_t>(m_SM.getBufferData(FileStart).size());
  return begin <= R.Range.Begin.getRawEncoding() &&
         R.Range.End.getRawEncoding() <= end;
}

unsigned Rewriter::getNumReplacements(SourceLocation FileStart) const {
  unsigned count = 0;
  for (const Replacement &R : m_Replacements) {
    if (isInFile(R, FileStart))
      count++;
  }
  return count;
}

std::string Rewriter::getRewrittenText(SourceLocation FileStart) const {
  std::string text(m_SM.getBufferData(FileStart));

  // Back to front, so earlier offsets stay valid.
  for (auto It = m_Replacements.rbegin(); It != m_Replacements.rend(); ++It) {
    if (!isInFile(*It, FileStart))
      continue;
    uint32_t offset = m_SM.getFileOffset(It->Range.Begin);
    text.replace(offset, It->Range.size(), It->Text);
  }
  return text;
}

} // namespace tempo
