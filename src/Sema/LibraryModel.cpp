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
#include "tempo/LibraryModel.h"
#include "tempo/Temporal.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/ADT/Twine.h"

namespace tempo {

static llvm::StringRef getPackageForSimpleName(llvm::StringRef Name) {
  static const llvm::StringMap<const char *> Packages = [] {
    llvm::StringMap<const char *> map;
    for (const char *N : {"Object", "String", "CharSequence", "Class",
                          "Integer", "Long", "Boolean", "Character", "Number",
                          "Math", "System", "Comparable", "Throwable",
                          "Iterable"})
      map[N] = "java.lang";
    for (const char *N : {"ZoneId", "Duration", "Period", "Clock",
                          "DateTimeException"})
      map[N] = "java.time";
    for (const char *N :
         {"TemporalAccessor", "Temporal", "TemporalAdjuster", "TemporalField",
          "TemporalUnit", "TemporalAmount", "ChronoUnit", "ChronoField",
          "TemporalAdjusters", "ValueRange"})
      map[N] = "java.time.temporal";
    for (const char *N : {"DateTimeFormatter", "TextStyle"})
      map[N] = "java.time.format";
    map["Locale"] = "java.util";
    map["PrintStream"] = "java.io";
    for (TemporalTag Tag : getAllTemporalTags()) {
      llvm::StringRef qualified = getTemporalTypeName(Tag);
      // Entries point at the tag tables, which live for the whole process.
      map[getTemporalSimpleName(Tag)] = qualified.data();
    }
    return map;
  }();

  auto it = Packages.find(Name);
  if (it == Packages.end())
    return "";
  return it->second;
}

// --- ClassBuilder ---

ClassBuilder::ClassBuilder(TypeContext &Ctx, llvm::StringRef QualifiedName,
                           bool IsInterface)
    : m_Ctx(Ctx), m_Class(Ctx.getOrCreateClass(QualifiedName)) {
  m_Class->IsInterface = IsInterface;
}

const Type *ClassBuilder::resolve(llvm::StringRef Name) {
  Name = Name.trim();
  unsigned dims = 0;
  while (Name.consume_back("[]"))
    dims++;

  const Type *base = nullptr;
  if (Name == "Self") {
    base = m_Class;
  } else if (Name.contains('.') || m_Ctx.getPrimitive(Name) ||
             Name == "void") {
    base = m_Ctx.getTypeByName(Name);
  } else {
    llvm::StringRef where = getPackageForSimpleName(Name);
    if (where.empty())
      base = m_Ctx.getTypeByName((llvm::Twine("java.lang.") + Name).str());
    else if (where.endswith(Name)) // tag tables hold the full name
      base = m_Ctx.getTypeByName(where);
    else
      base = m_Ctx.getTypeByName((llvm::Twine(where) + "." + Name).str());
  }
  return m_Ctx.getArrayOf(base, dims);
}

ClassBuilder &ClassBuilder::extends(llvm::StringRef Super) {
  const Type *T = resolve(Super);
  if (T->isClass())
    m_Class->Supertypes.push_back(static_cast<const ClassType *>(T));
  return *this;
}

ClassBuilder &
ClassBuilder::constants(std::initializer_list<const char *> Names) {
  for (const char *Name : Names)
    m_Class->addField(Name, m_Class, /*IsStatic=*/true);
  return *this;
}

ClassBuilder &ClassBuilder::field(llvm::StringRef Signature) {
  // "static int MAX_VALUE"
  Signature = Signature.trim();
  bool isStatic = Signature.consume_front("static ");
  auto parts = Signature.rsplit(' ');
  m_Class->addField(parts.second.str(), resolve(parts.first), isStatic);
  return *this;
}

ClassBuilder &
ClassBuilder::members(std::initializer_list<const char *> Signatures) {
  for (const char *Sig : Signatures)
    addMember(Sig);
  return *this;
}

void ClassBuilder::addMember(llvm::StringRef Signature) {
  // "[static] Ret name(T1, T2...)"
  Signature = Signature.trim();
  bool isStatic = Signature.consume_front("static ");

  size_t open = Signature.find('(');
  llvm::StringRef head = Signature.take_front(open).trim();
  llvm::StringRef paramList =
      Signature.drop_front(open + 1).take_until([](char c) { return c == ')'; });

  auto retAndName = head.rsplit(' ');
  const Type *ret = resolve(retAndName.first);

  std::vector<const Type *> params;
  bool isVarArgs = false;
  llvm::SmallVector<llvm::StringRef, 4> pieces;
  paramList.split(pieces, ',', /*MaxSplit=*/-1, /*KeepEmpty=*/false);
  for (llvm::StringRef piece : pieces) {
    piece = piece.trim();
    if (piece.consume_back("...")) {
      isVarArgs = true;
      params.push_back(m_Ctx.getArrayOf(resolve(piece)));
      continue;
    }
    params.push_back(resolve(piece));
  }

  MethodInfo &M =
      m_Class->addMethod(retAndName.second.str(), ret, std::move(params),
                         isStatic);
  M.IsVarArgs = isVarArgs;
}

// --- The model ---

static void loadJavaLang(TypeContext &Ctx) {
  ClassBuilder(Ctx, "java.lang.Object")
      .members({"String toString()", "boolean equals(Object)",
                "int hashCode()", "Class getClass()"});

  ClassBuilder(Ctx, "java.lang.CharSequence", /*IsInterface=*/true)
      .members({"int length()", "char charAt(int)", "String toString()"});

  ClassBuilder(Ctx, "java.lang.Comparable", /*IsInterface=*/true)
      .members({"int compareTo(Object)"});

  ClassBuilder(Ctx, "java.lang.String")
      .extends("Object")
      .extends("CharSequence")
      .extends("Comparable")
      .members({"int length()",
                "boolean isEmpty()",
                "char charAt(int)",
                "String substring(int)",
                "String substring(int, int)",
                "String trim()",
                "String strip()",
                "String toUpperCase()",
                "String toLowerCase()",
                "boolean startsWith(String)",
                "boolean endsWith(String)",
                "boolean contains(CharSequence)",
                "int indexOf(String)",
                "String concat(String)",
                "String replace(CharSequence, CharSequence)",
                "String[] split(String)",
                "boolean equalsIgnoreCase(String)",
                "static String valueOf(Object)",
                "static String format(String, Object...)",
                "static String join(CharSequence, CharSequence...)"});

  ClassBuilder(Ctx, "java.lang.Integer")
      .extends("Number")
      .field("static int MAX_VALUE")
      .field("static int MIN_VALUE")
      .members({"static int parseInt(String)", "static Self valueOf(int)",
                "static String toString(int)", "int intValue()"});

  ClassBuilder(Ctx, "java.lang.Long")
      .extends("Number")
      .field("static long MAX_VALUE")
      .field("static long MIN_VALUE")
      .members({"static long parseLong(String)", "static Self valueOf(long)",
                "long longValue()"});

  ClassBuilder(Ctx, "java.lang.Math")
      .members({"static int abs(int)", "static long abs(long)",
                "static int max(int, int)", "static int min(int, int)",
                "static long floorDiv(long, long)",
                "static long floorMod(long, long)"});

  ClassBuilder(Ctx, "java.io.PrintStream")
      .members({"void println()", "void println(Object)",
                "void print(Object)",
                "PrintStream printf(String, Object...)"});

  ClassBuilder(Ctx, "java.lang.System")
      .field("static PrintStream out")
      .field("static PrintStream err")
      .members({"static long currentTimeMillis()", "static long nanoTime()"});
}

static void loadTemporalInterfaces(TypeContext &Ctx) {
  ClassBuilder(Ctx, TemporalAccessorName, /*IsInterface=*/true)
      .members({"boolean isSupported(TemporalField)",
                "int get(TemporalField)", "long getLong(TemporalField)",
                "ValueRange range(TemporalField)"});

  ClassBuilder(Ctx, "java.time.temporal.Temporal", /*IsInterface=*/true)
      .extends("TemporalAccessor")
      .members({"boolean isSupported(TemporalUnit)",
                "Temporal plus(long, TemporalUnit)",
                "Temporal minus(long, TemporalUnit)",
                "Temporal with(TemporalField, long)",
                "long until(Temporal, TemporalUnit)"});

  ClassBuilder(Ctx, "java.time.temporal.TemporalAdjuster",
               /*IsInterface=*/true)
      .members({"Temporal adjustInto(Temporal)"});

  ClassBuilder(Ctx, "java.time.temporal.TemporalUnit", /*IsInterface=*/true)
      .members({"Duration getDuration()", "boolean isDateBased()",
                "boolean isTimeBased()",
                "long between(Temporal, Temporal)"});

  ClassBuilder(Ctx, "java.time.temporal.TemporalField", /*IsInterface=*/true)
      .members({"ValueRange range()", "boolean isDateBased()",
                "boolean isTimeBased()"});

  ClassBuilder(Ctx, "java.time.temporal.ChronoUnit")
      .extends("TemporalUnit")
      .constants({"NANOS", "MICROS", "MILLIS", "SECONDS", "MINUTES", "HOURS",
                  "HALF_DAYS", "DAYS", "WEEKS", "MONTHS", "YEARS", "DECADES",
                  "CENTURIES", "MILLENNIA", "ERAS", "FOREVER"})
      .members({"static Self valueOf(String)", "static Self[] values()"});

  ClassBuilder(Ctx, "java.time.temporal.ChronoField")
      .extends("TemporalField")
      .constants({"NANO_OF_SECOND", "MILLI_OF_SECOND", "SECOND_OF_MINUTE",
                  "MINUTE_OF_HOUR", "HOUR_OF_DAY", "AMPM_OF_DAY",
                  "DAY_OF_WEEK", "DAY_OF_MONTH", "DAY_OF_YEAR",
                  "ALIGNED_WEEK_OF_YEAR", "MONTH_OF_YEAR", "YEAR", "ERA",
                  "INSTANT_SECONDS", "OFFSET_SECONDS", "EPOCH_DAY"})
      .members({"static Self valueOf(String)", "static Self[] values()"});

  ClassBuilder(Ctx, "java.time.temporal.TemporalAdjusters")
      .members({"static TemporalAdjuster firstDayOfMonth()",
                "static TemporalAdjuster lastDayOfMonth()",
                "static TemporalAdjuster firstDayOfNextMonth()",
                "static TemporalAdjuster firstDayOfYear()",
                "static TemporalAdjuster lastDayOfYear()",
                "static TemporalAdjuster next(DayOfWeek)",
                "static TemporalAdjuster nextOrSame(DayOfWeek)",
                "static TemporalAdjuster previous(DayOfWeek)",
                "static TemporalAdjuster previousOrSame(DayOfWeek)"});

  ClassBuilder(Ctx, "java.time.temporal.TemporalAmount",
               /*IsInterface=*/true)
      .members({"long get(TemporalUnit)"});

  ClassBuilder(Ctx, "java.time.format.DateTimeFormatter")
      .constants({"BASIC_ISO_DATE", "ISO_DATE", "ISO_DATE_TIME",
                  "ISO_INSTANT", "ISO_LOCAL_DATE", "ISO_LOCAL_DATE_TIME",
                  "ISO_LOCAL_TIME", "ISO_OFFSET_DATE_TIME", "ISO_TIME",
                  "ISO_ZONED_DATE_TIME", "RFC_1123_DATE_TIME"})
      .members({"static Self ofPattern(String)",
                "static Self ofPattern(String, Locale)",
                "String format(TemporalAccessor)",
                "TemporalAccessor parse(CharSequence)",
                "Self withZone(ZoneId)", "Self withLocale(Locale)"});
}

static void loadSupportTypes(TypeContext &Ctx) {
  ClassBuilder(Ctx, "java.time.ZoneId")
      .members({"static Self of(String)", "static Self systemDefault()",
                "static Self from(TemporalAccessor)", "String getId()",
                "Self normalized()"});

  ClassBuilder(Ctx, "java.time.Duration")
      .extends("TemporalAmount")
      .constants({"ZERO"})
      .members({"static Self ofDays(long)", "static Self ofHours(long)",
                "static Self ofMinutes(long)", "static Self ofSeconds(long)",
                "static Self ofSeconds(long, long)",
                "static Self ofMillis(long)", "static Self ofNanos(long)",
                "static Self of(long, TemporalUnit)",
                "static Self between(Temporal, Temporal)",
                "static Self parse(CharSequence)",
                "static Self from(TemporalAmount)", "Self plus(Duration)",
                "Self minus(Duration)", "Self plusDays(long)",
                "Self plusHours(long)", "Self plusMinutes(long)",
                "Self plusSeconds(long)", "Self plusMillis(long)",
                "Self multipliedBy(long)", "Self dividedBy(long)",
                "Self negated()", "Self abs()", "long toDays()",
                "long toHours()", "long toMinutes()", "long toMillis()",
                "long toNanos()", "long getSeconds()", "int getNano()",
                "boolean isZero()", "boolean isNegative()"});

  ClassBuilder(Ctx, "java.time.Period")
      .extends("TemporalAmount")
      .constants({"ZERO"})
      .members({"static Self ofDays(int)", "static Self ofWeeks(int)",
                "static Self ofMonths(int)", "static Self ofYears(int)",
                "static Self of(int, int, int)",
                "static Self between(LocalDate, LocalDate)",
                "static Self parse(CharSequence)",
                "static Self from(TemporalAmount)", "int getDays()",
                "int getMonths()", "int getYears()", "long toTotalMonths()",
                "Self plusDays(long)", "Self plusMonths(long)",
                "Self plusYears(long)", "Self normalized()"});

  ClassBuilder(Ctx, "java.time.Clock")
      .members({"static Self systemUTC()", "static Self systemDefaultZone()",
                "static Self system(ZoneId)",
                "static Self fixed(Instant, ZoneId)",
                "static Self offset(Clock, Duration)", "Instant instant()",
                "long millis()", "ZoneId getZone()",
                "Self withZone(ZoneId)"});

  ClassBuilder(Ctx, "java.util.Locale")
      .constants({"ROOT", "US", "UK", "ENGLISH", "GERMANY", "FRANCE"})
      .members({"static Self getDefault()",
                "static Self forLanguageTag(String)"});
}

/// Members every temporal value type shares.
static void addTemporalCommon(ClassBuilder &B, bool IsTemporal) {
  B.extends("Object").extends("TemporalAccessor").extends("Comparable");
  if (IsTemporal)
    B.extends("Temporal").extends("TemporalAdjuster");
  B.members({"static Self from(TemporalAccessor)", "Temporal adjustInto(Temporal)"});
}

static void loadJavaTime(TypeContext &Ctx) {
  {
    ClassBuilder B(Ctx, "java.time.Instant");
    addTemporalCommon(B, /*IsTemporal=*/true);
    B.constants({"EPOCH", "MIN", "MAX"})
        .members({"static Self now()",
                  "static Self now(Clock)",
                  "static Self ofEpochMilli(long)",
                  "static Self ofEpochSecond(long)",
                  "static Self ofEpochSecond(long, long)",
                  "static Self parse(CharSequence)",
                  "Self plus(TemporalAmount)",
                  "Self plus(long, TemporalUnit)",
                  "Self minus(TemporalAmount)",
                  "Self minus(long, TemporalUnit)",
                  "Self plusSeconds(long)",
                  "Self plusMillis(long)",
                  "Self plusNanos(long)",
                  "Self minusSeconds(long)",
                  "Self minusMillis(long)",
                  "Self minusNanos(long)",
                  "Self with(TemporalAdjuster)",
                  "Self with(TemporalField, long)",
                  "Self truncatedTo(TemporalUnit)",
                  "ZonedDateTime atZone(ZoneId)",
                  "OffsetDateTime atOffset(ZoneOffset)",
                  "long toEpochMilli()",
                  "long getEpochSecond()",
                  "int getNano()",
                  "boolean isAfter(Instant)",
                  "boolean isBefore(Instant)",
                  "long until(Temporal, TemporalUnit)"});
  }

  {
    ClassBuilder B(Ctx, "java.time.LocalDate");
    addTemporalCommon(B, /*IsTemporal=*/true);
    B.constants({"MIN", "MAX", "EPOCH"})
        .members({"static Self now()",
                  "static Self now(ZoneId)",
                  "static Self now(Clock)",
                  "static Self of(int, int, int)",
                  "static Self of(int, Month, int)",
                  "static Self ofYearDay(int, int)",
                  "static Self ofEpochDay(long)",
                  "static Self ofInstant(Instant, ZoneId)",
                  "static Self parse(CharSequence)",
                  "static Self parse(CharSequence, DateTimeFormatter)",
                  "Self plus(TemporalAmount)",
                  "Self plus(long, TemporalUnit)",
                  "Self minus(TemporalAmount)",
                  "Self minus(long, TemporalUnit)",
                  "Self plusDays(long)",
                  "Self plusWeeks(long)",
                  "Self plusMonths(long)",
                  "Self plusYears(long)",
                  "Self minusDays(long)",
                  "Self minusWeeks(long)",
                  "Self minusMonths(long)",
                  "Self minusYears(long)",
                  "Self with(TemporalAdjuster)",
                  "Self with(TemporalField, long)",
                  "Self withDayOfMonth(int)",
                  "Self withDayOfYear(int)",
                  "Self withMonth(int)",
                  "Self withYear(int)",
                  "LocalDateTime atStartOfDay()",
                  "ZonedDateTime atStartOfDay(ZoneId)",
                  "LocalDateTime atTime(LocalTime)",
                  "OffsetDateTime atTime(OffsetTime)",
                  "LocalDateTime atTime(int, int)",
                  "LocalDateTime atTime(int, int, int)",
                  "LocalDateTime atTime(int, int, int, int)",
                  "int getYear()",
                  "int getMonthValue()",
                  "Month getMonth()",
                  "int getDayOfMonth()",
                  "int getDayOfYear()",
                  "DayOfWeek getDayOfWeek()",
                  "int lengthOfMonth()",
                  "int lengthOfYear()",
                  "boolean isLeapYear()",
                  "long toEpochDay()",
                  "boolean isAfter(LocalDate)",
                  "boolean isBefore(LocalDate)",
                  "boolean isEqual(LocalDate)",
                  "Period until(LocalDate)",
                  "long until(Temporal, TemporalUnit)",
                  "String format(DateTimeFormatter)"});
  }

  {
    ClassBuilder B(Ctx, "java.time.LocalDateTime");
    addTemporalCommon(B, /*IsTemporal=*/true);
    B.constants({"MIN", "MAX"})
        .members({"static Self now()",
                  "static Self now(ZoneId)",
                  "static Self now(Clock)",
                  "static Self of(LocalDate, LocalTime)",
                  "static Self of(int, int, int, int, int)",
                  "static Self of(int, Month, int, int, int)",
                  "static Self of(int, int, int, int, int, int)",
                  "static Self of(int, int, int, int, int, int, int)",
                  "static Self ofInstant(Instant, ZoneId)",
                  "static Self ofEpochSecond(long, int, ZoneOffset)",
                  "static Self parse(CharSequence)",
                  "static Self parse(CharSequence, DateTimeFormatter)",
                  "Self plus(TemporalAmount)",
                  "Self plus(long, TemporalUnit)",
                  "Self minus(TemporalAmount)",
                  "Self minus(long, TemporalUnit)",
                  "Self plusYears(long)",
                  "Self plusMonths(long)",
                  "Self plusWeeks(long)",
                  "Self plusDays(long)",
                  "Self plusHours(long)",
                  "Self plusMinutes(long)",
                  "Self plusSeconds(long)",
                  "Self plusNanos(long)",
                  "Self minusYears(long)",
                  "Self minusMonths(long)",
                  "Self minusWeeks(long)",
                  "Self minusDays(long)",
                  "Self minusHours(long)",
                  "Self minusMinutes(long)",
                  "Self minusSeconds(long)",
                  "Self minusNanos(long)",
                  "Self with(TemporalAdjuster)",
                  "Self with(TemporalField, long)",
                  "Self withYear(int)",
                  "Self withMonth(int)",
                  "Self withDayOfMonth(int)",
                  "Self withDayOfYear(int)",
                  "Self withHour(int)",
                  "Self withMinute(int)",
                  "Self withSecond(int)",
                  "Self withNano(int)",
                  "Self truncatedTo(TemporalUnit)",
                  "LocalDate toLocalDate()",
                  "LocalTime toLocalTime()",
                  "ZonedDateTime atZone(ZoneId)",
                  "OffsetDateTime atOffset(ZoneOffset)",
                  "Instant toInstant(ZoneOffset)",
                  "long toEpochSecond(ZoneOffset)",
                  "int getYear()",
                  "int getMonthValue()",
                  "Month getMonth()",
                  "int getDayOfMonth()",
                  "int getDayOfYear()",
                  "DayOfWeek getDayOfWeek()",
                  "int getHour()",
                  "int getMinute()",
                  "int getSecond()",
                  "int getNano()",
                  "boolean isAfter(LocalDateTime)",
                  "boolean isBefore(LocalDateTime)",
                  "long until(Temporal, TemporalUnit)",
                  "String format(DateTimeFormatter)"});
  }

  {
    ClassBuilder B(Ctx, "java.time.LocalTime");
    addTemporalCommon(B, /*IsTemporal=*/true);
    B.constants({"MIN", "MAX", "MIDNIGHT", "NOON"})
        .members({"static Self now()",
                  "static Self now(ZoneId)",
                  "static Self now(Clock)",
                  "static Self of(int, int)",
                  "static Self of(int, int, int)",
                  "static Self of(int, int, int, int)",
                  "static Self ofSecondOfDay(long)",
                  "static Self ofNanoOfDay(long)",
                  "static Self ofInstant(Instant, ZoneId)",
                  "static Self parse(CharSequence)",
                  "static Self parse(CharSequence, DateTimeFormatter)",
                  "Self plus(TemporalAmount)",
                  "Self plus(long, TemporalUnit)",
                  "Self minus(TemporalAmount)",
                  "Self minus(long, TemporalUnit)",
                  "Self plusHours(long)",
                  "Self plusMinutes(long)",
                  "Self plusSeconds(long)",
                  "Self plusNanos(long)",
                  "Self minusHours(long)",
                  "Self minusMinutes(long)",
                  "Self minusSeconds(long)",
                  "Self minusNanos(long)",
                  "Self with(TemporalAdjuster)",
                  "Self with(TemporalField, long)",
                  "Self withHour(int)",
                  "Self withMinute(int)",
                  "Self withSecond(int)",
                  "Self withNano(int)",
                  "Self truncatedTo(TemporalUnit)",
                  "LocalDateTime atDate(LocalDate)",
                  "OffsetTime atOffset(ZoneOffset)",
                  "int getHour()",
                  "int getMinute()",
                  "int getSecond()",
                  "int getNano()",
                  "int toSecondOfDay()",
                  "long toNanoOfDay()",
                  "boolean isAfter(LocalTime)",
                  "boolean isBefore(LocalTime)",
                  "long until(Temporal, TemporalUnit)",
                  "String format(DateTimeFormatter)"});
  }

  {
    ClassBuilder B(Ctx, "java.time.Month");
    addTemporalCommon(B, /*IsTemporal=*/false);
    B.extends("TemporalAdjuster")
        .constants({"JANUARY", "FEBRUARY", "MARCH", "APRIL", "MAY", "JUNE",
                    "JULY", "AUGUST", "SEPTEMBER", "OCTOBER", "NOVEMBER",
                    "DECEMBER"})
        .members({"static Self of(int)", "static Self valueOf(String)",
                  "static Self[] values()", "String name()", "int ordinal()",
                  "int getValue()", "Self plus(long)", "Self minus(long)",
                  "int length(boolean)", "int minLength()", "int maxLength()",
                  "int firstDayOfYear(boolean)", "Self firstMonthOfQuarter()",
                  "String getDisplayName(TextStyle, Locale)"});
  }

  {
    ClassBuilder B(Ctx, "java.time.DayOfWeek");
    addTemporalCommon(B, /*IsTemporal=*/false);
    B.extends("TemporalAdjuster")
        .constants({"MONDAY", "TUESDAY", "WEDNESDAY", "THURSDAY", "FRIDAY",
                    "SATURDAY", "SUNDAY"})
        .members({"static Self of(int)", "static Self valueOf(String)",
                  "static Self[] values()", "String name()", "int ordinal()",
                  "int getValue()", "Self plus(long)", "Self minus(long)",
                  "String getDisplayName(TextStyle, Locale)"});
  }

  {
    ClassBuilder B(Ctx, "java.time.MonthDay");
    addTemporalCommon(B, /*IsTemporal=*/false);
    B.extends("TemporalAdjuster")
        .members({"static Self now()",
                  "static Self now(ZoneId)",
                  "static Self now(Clock)",
                  "static Self of(int, int)",
                  "static Self of(Month, int)",
                  "static Self parse(CharSequence)",
                  "static Self parse(CharSequence, DateTimeFormatter)",
                  "Month getMonth()",
                  "int getMonthValue()",
                  "int getDayOfMonth()",
                  "LocalDate atYear(int)",
                  "Self withMonth(int)",
                  "Self with(Month)",
                  "Self withDayOfMonth(int)",
                  "boolean isValidYear(int)",
                  "boolean isAfter(MonthDay)",
                  "boolean isBefore(MonthDay)",
                  "String format(DateTimeFormatter)"});
  }

  {
    ClassBuilder B(Ctx, "java.time.OffsetDateTime");
    addTemporalCommon(B, /*IsTemporal=*/true);
    B.constants({"MIN", "MAX"})
        .members({"static Self now()",
                  "static Self now(ZoneId)",
                  "static Self now(Clock)",
                  "static Self of(LocalDateTime, ZoneOffset)",
                  "static Self of(LocalDate, LocalTime, ZoneOffset)",
                  "static Self of(int, int, int, int, int, int, int, "
                  "ZoneOffset)",
                  "static Self ofInstant(Instant, ZoneId)",
                  "static Self parse(CharSequence)",
                  "static Self parse(CharSequence, DateTimeFormatter)",
                  "Self plus(TemporalAmount)",
                  "Self plus(long, TemporalUnit)",
                  "Self minus(TemporalAmount)",
                  "Self minus(long, TemporalUnit)",
                  "Self plusYears(long)",
                  "Self plusMonths(long)",
                  "Self plusWeeks(long)",
                  "Self plusDays(long)",
                  "Self plusHours(long)",
                  "Self plusMinutes(long)",
                  "Self plusSeconds(long)",
                  "Self minusYears(long)",
                  "Self minusMonths(long)",
                  "Self minusDays(long)",
                  "Self minusHours(long)",
                  "Self with(TemporalAdjuster)",
                  "Self with(TemporalField, long)",
                  "Self withOffsetSameInstant(ZoneOffset)",
                  "Self withOffsetSameLocal(ZoneOffset)",
                  "Self truncatedTo(TemporalUnit)",
                  "LocalDateTime toLocalDateTime()",
                  "LocalDate toLocalDate()",
                  "LocalTime toLocalTime()",
                  "OffsetTime toOffsetTime()",
                  "Instant toInstant()",
                  "ZonedDateTime toZonedDateTime()",
                  "ZonedDateTime atZoneSameInstant(ZoneId)",
                  "ZonedDateTime atZoneSimilarLocal(ZoneId)",
                  "ZoneOffset getOffset()",
                  "long toEpochSecond()",
                  "int getYear()",
                  "Month getMonth()",
                  "int getMonthValue()",
                  "int getDayOfMonth()",
                  "DayOfWeek getDayOfWeek()",
                  "int getHour()",
                  "int getMinute()",
                  "int getSecond()",
                  "boolean isAfter(OffsetDateTime)",
                  "boolean isBefore(OffsetDateTime)",
                  "String format(DateTimeFormatter)"});
  }

  {
    ClassBuilder B(Ctx, "java.time.OffsetTime");
    addTemporalCommon(B, /*IsTemporal=*/true);
    B.constants({"MIN", "MAX"})
        .members({"static Self now()",
                  "static Self now(ZoneId)",
                  "static Self now(Clock)",
                  "static Self of(LocalTime, ZoneOffset)",
                  "static Self of(int, int, int, int, ZoneOffset)",
                  "static Self ofInstant(Instant, ZoneId)",
                  "static Self parse(CharSequence)",
                  "static Self parse(CharSequence, DateTimeFormatter)",
                  "Self plus(TemporalAmount)",
                  "Self plus(long, TemporalUnit)",
                  "Self minus(TemporalAmount)",
                  "Self minus(long, TemporalUnit)",
                  "Self plusHours(long)",
                  "Self plusMinutes(long)",
                  "Self plusSeconds(long)",
                  "Self minusHours(long)",
                  "Self minusMinutes(long)",
                  "Self minusSeconds(long)",
                  "Self with(TemporalAdjuster)",
                  "Self with(TemporalField, long)",
                  "Self withOffsetSameInstant(ZoneOffset)",
                  "Self withOffsetSameLocal(ZoneOffset)",
                  "Self truncatedTo(TemporalUnit)",
                  "LocalTime toLocalTime()",
                  "OffsetDateTime atDate(LocalDate)",
                  "ZoneOffset getOffset()",
                  "int getHour()",
                  "int getMinute()",
                  "int getSecond()",
                  "boolean isAfter(OffsetTime)",
                  "boolean isBefore(OffsetTime)",
                  "String format(DateTimeFormatter)"});
  }

  {
    ClassBuilder B(Ctx, "java.time.Year");
    addTemporalCommon(B, /*IsTemporal=*/true);
    B.field("static int MIN_VALUE")
        .field("static int MAX_VALUE")
        .members({"static Self now()",
                  "static Self now(ZoneId)",
                  "static Self now(Clock)",
                  "static Self of(int)",
                  "static Self parse(CharSequence)",
                  "static Self parse(CharSequence, DateTimeFormatter)",
                  "static boolean isLeap(long)",
                  "int getValue()",
                  "boolean isLeap()",
                  "int length()",
                  "boolean isValidMonthDay(MonthDay)",
                  "LocalDate atDay(int)",
                  "YearMonth atMonth(int)",
                  "YearMonth atMonth(Month)",
                  "LocalDate atMonthDay(MonthDay)",
                  "Self plus(TemporalAmount)",
                  "Self plus(long, TemporalUnit)",
                  "Self minus(TemporalAmount)",
                  "Self minus(long, TemporalUnit)",
                  "Self plusYears(long)",
                  "Self minusYears(long)",
                  "Self with(TemporalAdjuster)",
                  "Self with(TemporalField, long)",
                  "boolean isAfter(Year)",
                  "boolean isBefore(Year)",
                  "String format(DateTimeFormatter)"});
  }

  {
    ClassBuilder B(Ctx, "java.time.YearMonth");
    addTemporalCommon(B, /*IsTemporal=*/true);
    B.members({"static Self now()",
               "static Self now(ZoneId)",
               "static Self now(Clock)",
               "static Self of(int, int)",
               "static Self of(int, Month)",
               "static Self parse(CharSequence)",
               "static Self parse(CharSequence, DateTimeFormatter)",
               "int getYear()",
               "int getMonthValue()",
               "Month getMonth()",
               "LocalDate atDay(int)",
               "LocalDate atEndOfMonth()",
               "int lengthOfMonth()",
               "int lengthOfYear()",
               "boolean isLeapYear()",
               "boolean isValidDay(int)",
               "Self plus(TemporalAmount)",
               "Self plus(long, TemporalUnit)",
               "Self minus(TemporalAmount)",
               "Self minus(long, TemporalUnit)",
               "Self plusMonths(long)",
               "Self plusYears(long)",
               "Self minusMonths(long)",
               "Self minusYears(long)",
               "Self withMonth(int)",
               "Self withYear(int)",
               "Self with(TemporalAdjuster)",
               "Self with(TemporalField, long)",
               "boolean isAfter(YearMonth)",
               "boolean isBefore(YearMonth)",
               "String format(DateTimeFormatter)"});
  }

  {
    ClassBuilder B(Ctx, "java.time.ZonedDateTime");
    addTemporalCommon(B, /*IsTemporal=*/true);
    B.members({"static Self now()",
               "static Self now(ZoneId)",
               "static Self now(Clock)",
               "static Self of(LocalDateTime, ZoneId)",
               "static Self of(LocalDate, LocalTime, ZoneId)",
               "static Self of(int, int, int, int, int, int, int, ZoneId)",
               "static Self ofInstant(Instant, ZoneId)",
               "static Self ofInstant(LocalDateTime, ZoneOffset, ZoneId)",
               "static Self ofLocal(LocalDateTime, ZoneId, ZoneOffset)",
               "static Self ofStrict(LocalDateTime, ZoneOffset, ZoneId)",
               "static Self parse(CharSequence)",
               "static Self parse(CharSequence, DateTimeFormatter)",
               "Self plus(TemporalAmount)",
               "Self plus(long, TemporalUnit)",
               "Self minus(TemporalAmount)",
               "Self minus(long, TemporalUnit)",
               "Self plusYears(long)",
               "Self plusMonths(long)",
               "Self plusWeeks(long)",
               "Self plusDays(long)",
               "Self plusHours(long)",
               "Self plusMinutes(long)",
               "Self plusSeconds(long)",
               "Self minusYears(long)",
               "Self minusMonths(long)",
               "Self minusWeeks(long)",
               "Self minusDays(long)",
               "Self minusHours(long)",
               "Self minusMinutes(long)",
               "Self minusSeconds(long)",
               "Self with(TemporalAdjuster)",
               "Self with(TemporalField, long)",
               "Self withZoneSameInstant(ZoneId)",
               "Self withZoneSameLocal(ZoneId)",
               "Self withEarlierOffsetAtOverlap()",
               "Self withLaterOffsetAtOverlap()",
               "Self truncatedTo(TemporalUnit)",
               "LocalDateTime toLocalDateTime()",
               "LocalDate toLocalDate()",
               "LocalTime toLocalTime()",
               "Instant toInstant()",
               "OffsetDateTime toOffsetDateTime()",
               "ZoneId getZone()",
               "ZoneOffset getOffset()",
               "long toEpochSecond()",
               "int getYear()",
               "Month getMonth()",
               "int getMonthValue()",
               "int getDayOfMonth()",
               "int getDayOfYear()",
               "DayOfWeek getDayOfWeek()",
               "int getHour()",
               "int getMinute()",
               "int getSecond()",
               "boolean isAfter(ZonedDateTime)",
               "boolean isBefore(ZonedDateTime)",
               "String format(DateTimeFormatter)"});
  }

  {
    ClassBuilder B(Ctx, "java.time.ZoneOffset");
    addTemporalCommon(B, /*IsTemporal=*/false);
    B.extends("ZoneId")
        .extends("TemporalAdjuster")
        .constants({"UTC", "MIN", "MAX"})
        .members({"static Self of(String)", "static Self ofHours(int)",
                  "static Self ofHoursMinutes(int, int)",
                  "static Self ofHoursMinutesSeconds(int, int, int)",
                  "static Self ofTotalSeconds(int)", "int getTotalSeconds()",
                  "String getId()"});
  }
}

static void loadThreeTenExtra(TypeContext &Ctx) {
  {
    ClassBuilder B(Ctx, "org.threeten.extra.AmPm");
    addTemporalCommon(B, /*IsTemporal=*/false);
    B.extends("TemporalAdjuster")
        .constants({"AM", "PM"})
        .members({"static Self of(int)", "static Self ofHour(int)",
                  "static Self valueOf(String)", "static Self[] values()",
                  "String name()", "int ordinal()", "int getValue()",
                  "String getDisplayName(TextStyle, Locale)"});
  }

  {
    ClassBuilder B(Ctx, "org.threeten.extra.DayOfMonth");
    addTemporalCommon(B, /*IsTemporal=*/false);
    B.extends("TemporalAdjuster")
        .members({"static Self now()", "static Self now(ZoneId)",
                  "static Self now(Clock)", "static Self of(int)",
                  "int getValue()", "boolean isValidYearMonth(YearMonth)",
                  "MonthDay atMonth(Month)", "MonthDay atMonth(int)",
                  "LocalDate atYearMonth(YearMonth)"});
  }

  {
    ClassBuilder B(Ctx, "org.threeten.extra.DayOfYear");
    addTemporalCommon(B, /*IsTemporal=*/false);
    B.extends("TemporalAdjuster")
        .members({"static Self now()", "static Self now(ZoneId)",
                  "static Self now(Clock)", "static Self of(int)",
                  "int getValue()", "boolean isValidYear(int)",
                  "LocalDate atYear(Year)", "LocalDate atYear(int)"});
  }

  {
    ClassBuilder B(Ctx, "org.threeten.extra.Quarter");
    addTemporalCommon(B, /*IsTemporal=*/false);
    B.extends("TemporalAdjuster")
        .constants({"Q1", "Q2", "Q3", "Q4"})
        .members({"static Self of(int)", "static Self ofMonth(int)",
                  "static Self valueOf(String)", "static Self[] values()",
                  "String name()", "int ordinal()", "int getValue()",
                  "Self plus(long)", "Self minus(long)",
                  "int length(boolean)", "Month firstMonth()",
                  "String getDisplayName(TextStyle, Locale)"});
  }

  {
    ClassBuilder B(Ctx, "org.threeten.extra.YearQuarter");
    addTemporalCommon(B, /*IsTemporal=*/true);
    B.members({"static Self now()",
               "static Self now(ZoneId)",
               "static Self now(Clock)",
               "static Self of(int, int)",
               "static Self of(int, Quarter)",
               "static Self of(Year, int)",
               "static Self of(Year, Quarter)",
               "static Self parse(CharSequence)",
               "static Self parse(CharSequence, DateTimeFormatter)",
               "int getYear()",
               "Quarter getQuarter()",
               "int getQuarterValue()",
               "boolean isLeapYear()",
               "boolean isValidDay(int)",
               "int lengthOfQuarter()",
               "int lengthOfYear()",
               "LocalDate atDay(int)",
               "LocalDate atEndOfQuarter()",
               "Self plus(TemporalAmount)",
               "Self plus(long, TemporalUnit)",
               "Self minus(TemporalAmount)",
               "Self minus(long, TemporalUnit)",
               "Self plusQuarters(long)",
               "Self plusYears(long)",
               "Self minusQuarters(long)",
               "Self minusYears(long)",
               "Self withQuarter(int)",
               "Self withYear(int)",
               "Self with(TemporalAdjuster)",
               "Self with(TemporalField, long)",
               "boolean isAfter(YearQuarter)",
               "boolean isBefore(YearQuarter)",
               "String format(DateTimeFormatter)"});
  }

  {
    ClassBuilder B(Ctx, "org.threeten.extra.YearWeek");
    addTemporalCommon(B, /*IsTemporal=*/true);
    B.members({"static Self now()",
               "static Self now(ZoneId)",
               "static Self now(Clock)",
               "static Self of(int, int)",
               "static Self of(Year, int)",
               "static Self parse(CharSequence)",
               "static Self parse(CharSequence, DateTimeFormatter)",
               "int getYear()",
               "int getWeek()",
               "boolean is53WeekYear()",
               "int lengthOfYear()",
               "LocalDate atDay(DayOfWeek)",
               "Self plus(TemporalAmount)",
               "Self plus(long, TemporalUnit)",
               "Self minus(TemporalAmount)",
               "Self minus(long, TemporalUnit)",
               "Self plusWeeks(long)",
               "Self plusYears(long)",
               "Self minusWeeks(long)",
               "Self minusYears(long)",
               "Self withYear(int)",
               "Self withWeek(int)",
               "Self with(TemporalAdjuster)",
               "Self with(TemporalField, long)",
               "boolean isAfter(YearWeek)",
               "boolean isBefore(YearWeek)",
               "String format(DateTimeFormatter)"});
  }
}

void loadLibraryModel(TypeContext &Ctx) {
  loadJavaLang(Ctx);
  loadTemporalInterfaces(Ctx);
  loadSupportTypes(Ctx);
  loadJavaTime(Ctx);
  loadThreeTenExtra(Ctx);
}

} // namespace tempo
