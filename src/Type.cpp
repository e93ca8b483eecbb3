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
#include "tempo/Type.h"
#include "llvm/ADT/SmallPtrSet.h"
#include <memory>
#include <string>

namespace tempo {

int PrimitiveType::getPromotionRank() const {
  if (Name == "double")
    return 3;
  if (Name == "float")
    return 2;
  if (Name == "long")
    return 1;
  return 0; // int, short, byte, char
}

// --- ClassType ---

ClassType::ClassType(const std::string &qualified)
    : Type(Class), QualifiedName(qualified) {
  size_t dot = qualified.rfind('.');
  SimpleName = dot == std::string::npos ? qualified : qualified.substr(dot + 1);
}

std::string ClassType::getPackageName() const {
  if (Outer)
    return Outer->getPackageName();
  size_t dot = QualifiedName.rfind('.');
  if (dot == std::string::npos)
    return "";
  return QualifiedName.substr(0, dot);
}

const FieldInfo *ClassType::findField(llvm::StringRef Name) const {
  for (const auto &F : Fields) {
    if (F.Name == Name)
      return &F;
  }
  for (const ClassType *Super : Supertypes) {
    if (const FieldInfo *F = Super->findField(Name))
      return F;
  }
  return nullptr;
}

void ClassType::findMethods(
    llvm::StringRef Name, size_t Arity,
    llvm::SmallVectorImpl<const MethodInfo *> &Out) const {
  llvm::SmallVector<const ClassType *, 8> worklist;
  llvm::SmallPtrSet<const ClassType *, 8> visited;
  worklist.push_back(this);

  // Breadth first so overriding declarations come before the overridden ones.
  for (size_t i = 0; i < worklist.size(); ++i) {
    const ClassType *current = worklist[i];
    if (!visited.insert(current).second)
      continue;
    for (const auto &M : current->Methods) {
      if (M.Name == Name && M.acceptsArity(Arity))
        Out.push_back(&M);
    }
    for (const ClassType *Super : current->Supertypes)
      worklist.push_back(Super);
  }
}

bool ClassType::isSubtypeOf(const ClassType *Other) const {
  if (this == Other)
    return true;
  for (const ClassType *Super : Supertypes) {
    if (Super->isSubtypeOf(Other))
      return true;
  }
  return false;
}

FieldInfo &ClassType::addField(const std::string &Name, const Type *FieldType,
                               bool IsStatic) {
  FieldInfo info;
  info.Name = Name;
  info.FieldType = FieldType;
  info.IsStatic = IsStatic;
  Fields.push_back(info);
  return Fields.back();
}

MethodInfo &ClassType::addMethod(const std::string &Name,
                                 const Type *ReturnType,
                                 std::vector<const Type *> Params,
                                 bool IsStatic) {
  MethodInfo info;
  info.Name = Name;
  info.ReturnType = ReturnType;
  info.ParamTypes = std::move(Params);
  info.IsStatic = IsStatic;
  info.Owner = this;
  Methods.push_back(std::move(info));
  return Methods.back();
}

// --- TypeContext ---

TypeContext::TypeContext() {
  static const char *const PrimitiveNames[] = {
      "boolean", "byte", "char", "short", "int", "long", "float", "double"};
  for (const char *name : PrimitiveNames)
    m_Primitives[name] = std::make_unique<PrimitiveType>(name);
}

const PrimitiveType *TypeContext::getPrimitive(llvm::StringRef Name) const {
  auto it = m_Primitives.find(Name);
  if (it == m_Primitives.end())
    return nullptr;
  return it->second.get();
}

const Type *TypeContext::getArrayOf(const Type *Element, unsigned Dims) {
  const Type *current = Element;
  for (unsigned i = 0; i < Dims; ++i) {
    if (current->isError())
      return current;
    auto &slot = m_Arrays[current];
    if (!slot)
      slot = std::make_unique<ArrayType>(current);
    current = slot.get();
  }
  return current;
}

ClassType *TypeContext::getOrCreateClass(llvm::StringRef QualifiedName) {
  auto &slot = m_Classes[QualifiedName];
  if (!slot) {
    slot = std::make_unique<ClassType>(QualifiedName.str());
    // Register every enclosing prefix as a possible package.
    llvm::StringRef prefix = QualifiedName;
    while (true) {
      size_t dot = prefix.rfind('.');
      if (dot == llvm::StringRef::npos)
        break;
      prefix = prefix.take_front(dot);
      m_Packages.insert(prefix);
    }
  }
  return slot.get();
}

ClassType *TypeContext::lookupClass(llvm::StringRef QualifiedName) const {
  auto it = m_Classes.find(QualifiedName);
  if (it == m_Classes.end())
    return nullptr;
  return it->second.get();
}

const Type *TypeContext::getTypeByName(llvm::StringRef Name) {
  unsigned dims = 0;
  while (Name.consume_back("[]"))
    dims++;
  const Type *base = nullptr;
  if (Name == "void")
    base = getVoid();
  else if (const PrimitiveType *prim = getPrimitive(Name))
    base = prim;
  else
    base = getOrCreateClass(Name);
  return getArrayOf(base, dims);
}

bool TypeContext::isSameType(const Type *A, const Type *B) const {
  if (!A || !B)
    return false;
  return A->isIdenticalTo(B);
}

bool TypeContext::isNamedType(const Type *T,
                              llvm::StringRef QualifiedName) const {
  if (!T || !T->isClass())
    return false;
  return static_cast<const ClassType *>(T)->QualifiedName == QualifiedName;
}

bool TypeContext::isUnresolved(const Type *T) const {
  return !T || T->isError();
}

std::string TypeContext::getQualifiedName(const Type *T) const {
  if (!T || !T->isClass())
    return "";
  return static_cast<const ClassType *>(T)->QualifiedName;
}

} // namespace tempo
