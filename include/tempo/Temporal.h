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

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

namespace tempo {

enum class TemporalTag : unsigned {
#define TEMPORAL_TYPE(Tag, QualifiedName) Tag,
#include "tempo/TemporalTypes.def"
};

constexpr unsigned NumTemporalTags = 0
#define TEMPORAL_TYPE(Tag, QualifiedName) +1
#include "tempo/TemporalTypes.def"
    ;

/// The capability interface every temporal value type implements.
constexpr const char TemporalAccessorName[] =
    "java.time.temporal.TemporalAccessor";

/// All tags in enumerator order.
llvm::ArrayRef<TemporalTag> getAllTemporalTags();

/// `java.time.LocalDate` for TemporalTag::LocalDate.
llvm::StringRef getTemporalTypeName(TemporalTag Tag);

/// `LocalDate` for TemporalTag::LocalDate.
llvm::StringRef getTemporalSimpleName(TemporalTag Tag);

/// Maps a fully qualified class name back to its tag.
llvm::Optional<TemporalTag> lookupTemporalTag(llvm::StringRef QualifiedName);

/// True for `java.time`, `org.threeten.extra`, `tck.java.time` and their
/// subpackages. Code in these packages implements the types and may rely on
/// conversions that look impossible from the outside.
bool isTrustedTemporalPackage(llvm::StringRef Package);

/// True for classes declared in `java.time`, `org.threeten.extra` or their
/// subpackages, whether or not they have a tag (ZoneId, HijrahDate).
bool isTemporalLibraryClass(llvm::StringRef QualifiedName);

inline unsigned getTagIndex(TemporalTag Tag) {
  return static_cast<unsigned>(Tag);
}

} // namespace tempo
