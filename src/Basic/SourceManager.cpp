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
#include "tempo/SourceManager.h"
#include <llvm/Support/ErrorOr.h>
#include <llvm/Support/MemoryBuffer.h>
#include <algorithm>

namespace tempo {

SourceManager::FileInfo::FileInfo(std::string Name, std::string Data,
                                  uint32_t Start)
    : FileName(std::move(Name)), Content(std::move(Data)),
      GlobalStartOffset(Start),
      GlobalEndOffset(Start + static_cast<uint32_t>(Content.size())) {
  calculateLineOffsets();
}

void SourceManager::FileInfo::calculateLineOffsets() {
  LineStartOffsets.clear();
  LineStartOffsets.push_back(0); // Line 1 starts at 0

  for (size_t i = 0; i < Content.size(); ++i) {
    if (Content[i] == '\n') {
      LineStartOffsets.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

SourceLocation SourceManager::loadFile(const std::string &Path,
                                       std::string &ErrorMessage) {
  for (const auto &File : Files) {
    if (File.FileName == Path) {
      return SourceLocation(File.GlobalStartOffset);
    }
  }

  llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> Buffer =
      llvm::MemoryBuffer::getFileOrSTDIN(Path, /*IsText=*/true);
  if (std::error_code EC = Buffer.getError()) {
    ErrorMessage = EC.message();
    return SourceLocation();
  }

  return addFile(Path, (*Buffer)->getBuffer().str());
}

SourceLocation SourceManager::addFile(const std::string &Path,
                                      std::string Content) {
  for (const auto &File : Files) {
    if (File.FileName == Path) {
      return SourceLocation(File.GlobalStartOffset);
    }
  }

  uint32_t Start = NextOffset;
  Files.emplace_back(Path, std::move(Content), Start);
  // One-past-the-end is addressable (EOF tokens point there), so leave a gap.
  NextOffset = Files.back().GlobalEndOffset + 1;

  return SourceLocation(Start);
}

const SourceManager::FileInfo *
SourceManager::getFileInfo(SourceLocation Loc) const {
  if (Loc.isInvalid())
    return nullptr;

  uint32_t Offset = Loc.getRawEncoding();

  // Find the first file whose end is not before Offset.
  auto It = std::lower_bound(Files.begin(), Files.end(), Offset,
                             [](const FileInfo &FI, uint32_t Off) {
                               return FI.GlobalEndOffset < Off;
                             });

  if (It == Files.end() || Offset < It->GlobalStartOffset)
    return nullptr;
  return &*It;
}

FullSourceLoc SourceManager::getFullSourceLoc(SourceLocation Loc) const {
  const FileInfo *File = getFileInfo(Loc);
  if (!File)
    return FullSourceLoc();

  uint32_t FileRelativeOffset = Loc.getRawEncoding() - File->GlobalStartOffset;

  // LineIt points to the first line start > our offset, and lines are
  // 1-based, so the distance is the line number.
  auto LineIt =
      std::upper_bound(File->LineStartOffsets.begin(),
                       File->LineStartOffsets.end(), FileRelativeOffset);
  unsigned Line =
      static_cast<unsigned>(std::distance(File->LineStartOffsets.begin(), LineIt));

  uint32_t LineStart = File->LineStartOffsets[Line - 1];

  // Column is 1-based
  unsigned Col = FileRelativeOffset - LineStart + 1;

  return FullSourceLoc{File->FileName.c_str(), Line, Col};
}

std::string_view SourceManager::getBufferData(SourceLocation Loc) const {
  const FileInfo *File = getFileInfo(Loc);
  if (!File)
    return "";
  return File->Content;
}

llvm::StringRef SourceManager::getFileName(SourceLocation Loc) const {
  const FileInfo *File = getFileInfo(Loc);
  if (!File)
    return "";
  return File->FileName;
}

uint32_t SourceManager::getFileOffset(SourceLocation Loc) const {
  const FileInfo *File = getFileInfo(Loc);
  if (!File)
    return 0;
  return Loc.getRawEncoding() - File->GlobalStartOffset;
}

std::string_view SourceManager::getText(SourceRange Range) const {
  const FileInfo *File = getFileInfo(Range.Begin);
  if (!File || !Range.isValid() || Range.End < Range.Begin ||
      Range.End.getRawEncoding() > File->GlobalEndOffset)
    return "";

  std::string_view Content = File->Content;
  return Content.substr(Range.Begin.getRawEncoding() - File->GlobalStartOffset,
                        Range.size());
}

} // namespace tempo
