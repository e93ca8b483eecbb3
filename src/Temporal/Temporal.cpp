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
#include "tempo/Temporal.h"
#include "llvm/ADT/StringMap.h"

namespace tempo {

static const TemporalTag AllTags[] = {
#define TEMPORAL_TYPE(Tag, QualifiedName) TemporalTag::Tag,
#include "tempo/TemporalTypes.def"
};

static const char *const QualifiedNames[] = {
#define TEMPORAL_TYPE(Tag, QualifiedName) QualifiedName,
#include "tempo/TemporalTypes.def"
};

static const char *const SimpleNames[] = {
#define TEMPORAL_TYPE(Tag, QualifiedName) #Tag,
#include "tempo/TemporalTypes.def"
};

static const char *const TrustedPackages[] = {"java.time",
                                              "org.threeten.extra",
                                              "tck.java.time"};

llvm::ArrayRef<TemporalTag> getAllTemporalTags() { return AllTags; }

llvm::StringRef getTemporalTypeName(TemporalTag Tag) {
  return QualifiedNames[getTagIndex(Tag)];
}

llvm::StringRef getTemporalSimpleName(TemporalTag Tag) {
  return SimpleNames[getTagIndex(Tag)];
}

llvm::Optional<TemporalTag> lookupTemporalTag(llvm::StringRef QualifiedName) {
  static const llvm::StringMap<TemporalTag> Index = [] {
    llvm::StringMap<TemporalTag> index;
    for (TemporalTag Tag : AllTags)
      index[getTemporalTypeName(Tag)] = Tag;
    return index;
  }();

  auto it = Index.find(QualifiedName);
  if (it == Index.end())
    return llvm::None;
  return it->second;
}

static bool isInPackage(llvm::StringRef Package, llvm::StringRef Root) {
  if (!Package.startswith(Root))
    return false;
  // `java.timex` is not inside `java.time`.
  llvm::StringRef rest = Package.drop_front(Root.size());
  return rest.empty() || rest.front() == '.';
}

bool isTrustedTemporalPackage(llvm::StringRef Package) {
  for (llvm::StringRef Trusted : TrustedPackages) {
    if (isInPackage(Package, Trusted))
      return true;
  }
  return false;
}

bool isTemporalLibraryClass(llvm::StringRef QualifiedName) {
  llvm::StringRef package = QualifiedName.rsplit('.').first;
  if (package == QualifiedName)
    return false;
  return isInPackage(package, "java.time") ||
         isInPackage(package, "org.threeten.extra");
}

} // namespace tempo
