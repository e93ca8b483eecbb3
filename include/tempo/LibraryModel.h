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

#include "tempo/Type.h"
#include "llvm/ADT/StringRef.h"
#include <initializer_list>

namespace tempo {

/// Declares the java.lang, java.time and org.threeten.extra classes that
/// analysed code calls into: their supertypes, constants and the members
/// whose result types matter for typing `from` arguments.
void loadLibraryModel(TypeContext &Ctx);

/// Fluent helper for describing a library class. Members are written as
/// Java-like signatures, e.g. "static Self of(int, Month, int)" or
/// "LocalDate toLocalDate()". `Self` names the class being built; simple
/// names are resolved against java.lang, java.time, java.time.temporal,
/// java.time.format and org.threeten.extra.
class ClassBuilder {
public:
  ClassBuilder(TypeContext &Ctx, llvm::StringRef QualifiedName,
               bool IsInterface = false);

  ClassBuilder &extends(llvm::StringRef Super);
  /// `public static final Self NAME` for each name.
  ClassBuilder &constants(std::initializer_list<const char *> Names);
  ClassBuilder &field(llvm::StringRef Signature);
  ClassBuilder &members(std::initializer_list<const char *> Signatures);

  ClassType *getClass() const { return m_Class; }

private:
  TypeContext &m_Ctx;
  ClassType *m_Class;

  const Type *resolve(llvm::StringRef Name);
  void addMember(llvm::StringRef Signature);
};

} // namespace tempo
