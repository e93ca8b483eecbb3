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
#include "tempo/DiagnosticEngine.h"
#include "tempo/Lexer.h"
#include "tempo/LibraryModel.h"
#include "tempo/Parser.h"
#include "tempo/Sema.h"
#include "tempo/SourceManager.h"
#include "tempo/Temporal.h"
#include "tempo/Type.h"
#include "llvm/ADT/SmallVector.h"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace tempo;

namespace {

static bool require_(bool cond, const std::string &msg) {
  if (cond)
    return true;
  std::cerr << "  - " << msg << "\n";
  return false;
}

/// Parses and attributes a set of in-memory files together.
struct Program {
  SourceManager SM;
  TypeContext Ctx;
  std::vector<std::unique_ptr<CompilationUnit>> Units;
  unsigned ParseErrors = 0;

  explicit Program(std::initializer_list<const char *> Sources) {
    DiagnosticEngine::reset();
    DiagnosticEngine::init(SM);
    loadLibraryModel(Ctx);

    unsigned index = 0;
    for (const char *Source : Sources) {
      SourceLocation Start =
          SM.addFile("Unit" + std::to_string(index++) + ".java", Source);
      Lexer lexer(SM.getBufferData(Start), Start);
      std::vector<Token> tokens = lexer.tokenize();
      Parser parser(tokens);
      Units.push_back(parser.parseCompilationUnit());
      ParseErrors += parser.getNumErrors();
    }

    std::vector<CompilationUnit *> raw;
    for (auto &U : Units)
      raw.push_back(U.get());
    Sema sema(Ctx);
    sema.checkCompilationUnits(raw);
  }

  /// Initializer of local `Var` declared directly in the body of
  /// `Class.Method` in the unit at \p UnitIndex.
  Expr *init(const std::string &Class, const std::string &Method,
             const std::string &Var, size_t UnitIndex = 0) const {
    if (UnitIndex >= Units.size())
      return nullptr;
    for (const auto &Type : Units[UnitIndex]->Types) {
      if (Type->Name != Class)
        continue;
      for (const auto &Member : Type->Members) {
        auto *M = dynamic_cast<MethodDecl *>(Member.get());
        if (!M || M->Name != Method || !M->Body)
          continue;
        for (const auto &S : M->Body->Statements) {
          auto *Decl = dynamic_cast<LocalVarDeclStmt *>(S.get());
          if (!Decl)
            continue;
          for (const VarDeclarator &V : Decl->Vars)
            if (V.Name == Var)
              return V.Init.get();
        }
      }
    }
    return nullptr;
  }

  const Type *typeOf(const std::string &Class, const std::string &Method,
                     const std::string &Var, size_t UnitIndex = 0) const {
    Expr *E = init(Class, Method, Var, UnitIndex);
    return E ? E->StaticType : nullptr;
  }
};

static bool is_class_(const Type *T, const std::string &Name) {
  return T && T->isClass() &&
         static_cast<const ClassType *>(T)->QualifiedName == Name;
}

static std::string show_(const Type *T) {
  return T ? T->toString() : std::string("<none>");
}

static bool test_imports_and_var_() {
  Program p({"package com.example;\n"
             "import java.time.LocalDate;\n"
             "import java.time.*;\n"
             "class A {\n"
             "  void m() {\n"
             "    var d = LocalDate.now();\n"
             "    Month mo = d.getMonth();\n"
             "    var q = org.threeten.extra.Quarter.from(mo);\n"
             "    var z = ZonedDateTime.now();\n"
             "    var u = Unknown.now();\n"
             "    var s = \"a\" + 1;\n"
             "    var n = d.lengthOfMonth() * 2L;\n"
             "  }\n"
             "}\n"});
  bool ok = true;
  ok &= require_(p.ParseErrors == 0, "parses");
  ok &= require_(is_class_(p.typeOf("A", "m", "d"), "java.time.LocalDate"),
                 "single-type import: " + show_(p.typeOf("A", "m", "d")));
  ok &= require_(is_class_(p.typeOf("A", "m", "mo"), "java.time.Month"),
                 "instance call on a var-typed local");
  ok &= require_(is_class_(p.typeOf("A", "m", "q"), "org.threeten.extra.Quarter"),
                 "fully qualified receiver: " + show_(p.typeOf("A", "m", "q")));
  ok &= require_(is_class_(p.typeOf("A", "m", "z"), "java.time.ZonedDateTime"),
                 "on-demand import");
  const Type *u = p.typeOf("A", "m", "u");
  ok &= require_(u && u->isError(), "unknown receiver gives the error type");
  ok &= require_(is_class_(p.typeOf("A", "m", "s"), "java.lang.String"),
                 "string concatenation");
  ok &= require_(show_(p.typeOf("A", "m", "n")) == "long",
                 "numeric promotion: " + show_(p.typeOf("A", "m", "n")));

  auto *call = dynamic_cast<MethodCallExpr *>(p.init("A", "m", "q"));
  ok &= require_(call && call->IsStatic &&
                     call->Owner->QualifiedName == "org.threeten.extra.Quarter",
                 "from resolves to Quarter.from");
  ok &= require_(call && call->ParamTypes.size() == 1 &&
                     is_class_(call->ParamTypes[0],
                               "java.time.temporal.TemporalAccessor"),
                 "from takes a TemporalAccessor");
  return ok;
}

static bool test_static_imports_() {
  Program p({"import static java.time.Month.JANUARY;\n"
             "import static java.time.LocalDate.from;\n"
             "import static org.threeten.extra.Quarter.*;\n"
             "import java.time.ZoneOffset;\n"
             "class A {\n"
             "  void m() {\n"
             "    var a = JANUARY;\n"
             "    var b = from(JANUARY);\n"
             "    var c = Q2;\n"
             "    var d = ofMonth(3);\n"
             "    var e = ZoneOffset.UTC;\n"
             "  }\n"
             "}\n"});
  bool ok = true;
  ok &= require_(is_class_(p.typeOf("A", "m", "a"), "java.time.Month"),
                 "statically imported constant");
  auto *b = dynamic_cast<MethodCallExpr *>(p.init("A", "m", "b"));
  ok &= require_(b && is_class_(b->StaticType, "java.time.LocalDate") &&
                     b->IsStatic &&
                     b->Owner->QualifiedName == "java.time.LocalDate",
                 "statically imported from");
  ok &= require_(is_class_(p.typeOf("A", "m", "c"), "org.threeten.extra.Quarter"),
                 "on-demand static constant");
  ok &= require_(is_class_(p.typeOf("A", "m", "d"), "org.threeten.extra.Quarter"),
                 "on-demand static method");
  ok &= require_(is_class_(p.typeOf("A", "m", "e"), "java.time.ZoneOffset"),
                 "static field through a type");
  return ok;
}

static bool test_cross_unit_classes_() {
  Program p({"package p;\n"
             "import java.time.Instant;\n"
             "public class Holder {\n"
             "  public static final Instant START = Instant.EPOCH;\n"
             "  public Instant get() { return START; }\n"
             "  public static class Inner { public java.time.YearMonth ym; }\n"
             "}\n",
             "package q;\n"
             "import p.Holder;\n"
             "class B {\n"
             "  void m(Holder h) {\n"
             "    var s = Holder.START;\n"
             "    var i = h.get();\n"
             "    var ym = new Holder.Inner().ym;\n"
             "    var other = p.Holder.START;\n"
             "  }\n"
             "}\n"});
  bool ok = true;
  ok &= require_(p.ParseErrors == 0, "parses");
  ok &= require_(is_class_(p.typeOf("B", "m", "s", 1), "java.time.Instant"),
                 "static field of a class from another unit");
  ok &= require_(is_class_(p.typeOf("B", "m", "i", 1), "java.time.Instant"),
                 "instance method of a class from another unit");
  ok &= require_(is_class_(p.typeOf("B", "m", "ym", 1), "java.time.YearMonth"),
                 "field of a nested class: " +
                     show_(p.typeOf("B", "m", "ym", 1)));
  ok &= require_(is_class_(p.typeOf("B", "m", "other", 1), "java.time.Instant"),
                 "fully qualified source class");
  return ok;
}

static bool test_scopes_and_shadowing_() {
  Program p({"import java.time.*;\n"
             "class A {\n"
             "  Month value;\n"
             "  Month field() { var f = value; return f; }\n"
             "  void m(LocalDate value) {\n"
             "    var v = value;\n"
             "    for (var day : new DayOfWeek[0]) { }\n"
             "    if (value instanceof Temporal t) { }\n"
             "  }\n"
             "  void n() {\n"
             "    var f = value;\n"
             "  }\n"
             "}\n"});
  bool ok = true;
  ok &= require_(is_class_(p.typeOf("A", "m", "v"), "java.time.LocalDate"),
                 "parameter shadows field");
  ok &= require_(is_class_(p.typeOf("A", "n", "f"), "java.time.Month"),
                 "field visible in another method");
  ok &= require_(is_class_(p.typeOf("A", "field", "f"), "java.time.Month"),
                 "field read in its own class");
  return ok;
}

static bool test_overloads_() {
  Program p({"import java.time.*;\n"
             "class A {\n"
             "  void m(LocalDate d, OffsetTime ot) {\n"
             "    var a = d.atTime(LocalTime.NOON);\n"
             "    var b = d.atTime(ot);\n"
             "    var c = d.atTime(10, 30);\n"
             "    var e = LocalDate.of(2020, Month.MARCH, 1);\n"
             "    var f = String.format(\"%s %s\", d, ot);\n"
             "  }\n"
             "}\n"});
  bool ok = true;
  ok &= require_(is_class_(p.typeOf("A", "m", "a"), "java.time.LocalDateTime"),
                 "atTime(LocalTime)");
  ok &= require_(is_class_(p.typeOf("A", "m", "b"), "java.time.OffsetDateTime"),
                 "atTime(OffsetTime)");
  ok &= require_(is_class_(p.typeOf("A", "m", "c"), "java.time.LocalDateTime"),
                 "atTime(int, int)");
  ok &= require_(is_class_(p.typeOf("A", "m", "e"), "java.time.LocalDate"),
                 "of(int, Month, int)");
  ok &= require_(is_class_(p.typeOf("A", "m", "f"), "java.lang.String"),
                 "varargs call");
  return ok;
}

static bool test_unknown_stays_unknown_() {
  Program p({"import java.time.*;\n"
             "import java.util.function.Function;\n"
             "class A<T extends Temporal> {\n"
             "  void m(T generic, boolean flag, LocalDate d, LocalTime t) {\n"
             "    var g = generic;\n"
             "    var mixed = flag ? d : t;\n"
             "    var nullable = flag ? d : null;\n"
             "    Function<LocalDate, Month> f = x -> Month.from(x);\n"
             "    var missing = java.time.NoSuchType.now();\n"
             "  }\n"
             "}\n"});
  bool ok = true;
  const Type *g = p.typeOf("A", "m", "g");
  ok &= require_(g && g->isError(), "type variables are unknown");
  const Type *mixed = p.typeOf("A", "m", "mixed");
  ok &= require_(mixed && mixed->isError(),
                 "conditional with unrelated branches is unknown");
  ok &= require_(is_class_(p.typeOf("A", "m", "nullable"),
                           "java.time.LocalDate"),
                 "conditional with a null branch");

  auto *lambda = dynamic_cast<LambdaExpr *>(p.init("A", "m", "f"));
  auto *body = lambda ? dynamic_cast<MethodCallExpr *>(lambda->BodyExpr.get())
                      : nullptr;
  ok &= require_(body && is_class_(body->StaticType, "java.time.Month"),
                 "call inside a lambda is attributed");
  ok &= require_(body && body->Args[0]->StaticType &&
                     body->Args[0]->StaticType->isError(),
                 "implicitly typed lambda parameters are unknown");

  const Type *missing = p.typeOf("A", "m", "missing");
  ok &= require_(missing && missing->isError(),
                 "unknown class in a known package");
  ok &= require_(!g || !g->isIdenticalTo(g),
                 "the error type is not identical to itself");
  return ok;
}

static bool test_local_and_anonymous_classes_() {
  Program p({"import java.time.*;\n"
             "class A {\n"
             "  void m() {\n"
             "    class Local { YearMonth ym() { return null; } }\n"
             "    var l = new Local().ym();\n"
             "    var anon = new Object() { Instant at() { return null; } };\n"
             "    var at = anon.at();\n"
             "  }\n"
             "}\n"});
  bool ok = true;
  ok &= require_(is_class_(p.typeOf("A", "m", "l"), "java.time.YearMonth"),
                 "local class method: " + show_(p.typeOf("A", "m", "l")));
  ok &= require_(is_class_(p.typeOf("A", "m", "at"), "java.time.Instant"),
                 "anonymous class method through var");
  return ok;
}

static const MethodInfo *onlyMethod_(const ClassType *C, llvm::StringRef Name,
                                     size_t Arity) {
  llvm::SmallVector<const MethodInfo *, 2> found;
  C->findMethods(Name, Arity, found);
  return found.size() == 1 ? found.front() : nullptr;
}

static bool test_library_signatures_resolve_names_() {
  TypeContext Ctx;
  loadLibraryModel(Ctx);
  ClassBuilder B(Ctx, "com.example.Sample");
  B.members({"static Thread spawn(Runnable)", "ZoneId zone(Locale)",
             "LocalDate today(Clock)", "Month[] months(java.util.List)",
             "Self copy()"});
  const ClassType *C = B.getClass();
  bool ok = true;

  const MethodInfo *spawn = onlyMethod_(C, "spawn", 1);
  ok &= require_(spawn && spawn->IsStatic, "spawn is a static method");
  ok &= require_(spawn && Ctx.getQualifiedName(spawn->ReturnType) ==
                              "java.lang.Thread",
                 "unknown simple names default to java.lang");
  ok &= require_(spawn && Ctx.getQualifiedName(spawn->ParamTypes[0]) ==
                              "java.lang.Runnable",
                 "parameters default to java.lang too");

  const MethodInfo *zone = onlyMethod_(C, "zone", 1);
  ok &= require_(zone && Ctx.getQualifiedName(zone->ReturnType) ==
                             "java.time.ZoneId",
                 "ZoneId lives in java.time");
  ok &= require_(zone && Ctx.getQualifiedName(zone->ParamTypes[0]) ==
                             "java.util.Locale",
                 "Locale lives in java.util");

  const MethodInfo *today = onlyMethod_(C, "today", 1);
  ok &= require_(today && today->ReturnType ==
                              Ctx.getTypeByName(getTemporalTypeName(
                                  TemporalTag::LocalDate)),
                 "temporal names map to their tagged class");
  ok &= require_(today && Ctx.getQualifiedName(today->ParamTypes[0]) ==
                              "java.time.Clock",
                 "Clock lives in java.time");

  const MethodInfo *months = onlyMethod_(C, "months", 1);
  ok &= require_(months && months->ReturnType ==
                               Ctx.getArrayOf(
                                   Ctx.getTypeByName("java.time.Month"), 1),
                 "array suffixes wrap the element type");
  ok &= require_(months && Ctx.getQualifiedName(months->ParamTypes[0]) ==
                               "java.util.List",
                 "qualified names are taken as written");

  const MethodInfo *copy = onlyMethod_(C, "copy", 0);
  ok &= require_(copy && copy->ReturnType == C, "Self is the class itself");
  return ok;
}

} // namespace

int main() {
  struct Case {
    const char *name;
    bool (*fn)();
  };

  const Case cases[] = {
      {"imports_and_var", test_imports_and_var_},
      {"static_imports", test_static_imports_},
      {"cross_unit_classes", test_cross_unit_classes_},
      {"scopes_and_shadowing", test_scopes_and_shadowing_},
      {"overloads", test_overloads_},
      {"unknown_stays_unknown", test_unknown_stays_unknown_},
      {"local_and_anonymous_classes", test_local_and_anonymous_classes_},
      {"library_signatures_resolve_names",
       test_library_signatures_resolve_names_},
  };

  int failed = 0;
  for (const auto &c : cases) {
    std::cout << "[TEST] " << c.name << "\n";
    if (!c.fn()) {
      ++failed;
      std::cout << "  -> FAIL\n";
    } else {
      std::cout << "  -> PASS\n";
    }
  }

  if (failed != 0) {
    std::cout << "\nFAILED " << failed << " test(s)\n";
    return 1;
  }
  std::cout << "\nALL TESTS PASSED\n";
  return 0;
}
