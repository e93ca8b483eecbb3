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

#include "tempo/SourceLocation.h"
#include <llvm/ADT/StringRef.h>
#include <string>
#include <string_view>
#include <vector>

namespace tempo {

class SourceManager {
  struct FileInfo {
    std::string FileName;
    std::string Content;
    uint32_t GlobalStartOffset;
    uint32_t GlobalEndOffset;

    // Offsets within Content where each line starts.
    // Line 1 is always at index 0.
    std::vector<uint32_t> LineStartOffsets;

    FileInfo(std::string Name, std::string Data, uint32_t Start);

    void calculateLineOffsets();
  };

  std::vector<FileInfo> Files;
  uint32_t NextOffset = 1; // 0 is invalid

  const FileInfo *getFileInfo(SourceLocation Loc) const;

public:
  SourceManager() = default;
  SourceManager(const SourceManager &) = delete;
  SourceManager &operator=(const SourceManager &) = delete;

  /// Load a file from disk ("-" reads standard input). Returns the
  /// SourceLocation of the first character, or an invalid location with
  /// \p ErrorMessage filled in when the file cannot be read.
  SourceLocation loadFile(const std::string &Path, std::string &ErrorMessage);

  /// Add a file from memory content. Useful for testing.
  SourceLocation addFile(const std::string &Path, std::string Content);

  /// Resolve a SourceLocation to its full file/line/column info.
  FullSourceLoc getFullSourceLoc(SourceLocation Loc) const;

  /// Get the raw buffer content for the file containing Loc.
  std::string_view getBufferData(SourceLocation Loc) const;

  /// Name of the file containing Loc, empty if Loc is not mapped.
  llvm::StringRef getFileName(SourceLocation Loc) const;

  /// Offset of Loc relative to the start of its file.
  uint32_t getFileOffset(SourceLocation Loc) const;

  /// The characters covered by Range. Both ends must be in the same file.
  std::string_view getText(SourceRange Range) const;

  unsigned getNumFiles() const { return static_cast<unsigned>(Files.size()); }
};

} // namespace tempo
