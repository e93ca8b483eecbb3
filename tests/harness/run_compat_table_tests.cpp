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
#include "tempo/CompatibilityTable.h"
#include "tempo/Temporal.h"

#include <iostream>
#include <string>

using namespace tempo;

namespace {

static bool require_(bool cond, const std::string &msg) {
  if (cond)
    return true;
  std::cerr << "  - " << msg << "\n";
  return false;
}

static std::string name_(TemporalTag Tag) {
  return getTemporalSimpleName(Tag).str();
}

static bool test_pair_count_() {
  const CompatibilityTable &table = CompatibilityTable::get();
  return require_(table.getNumIncompatiblePairs() == 269,
                  "table must hold 269 incompatible pairs, has " +
                      std::to_string(table.getNumIncompatiblePairs()));
}

static bool test_no_self_pairs_() {
  const CompatibilityTable &table = CompatibilityTable::get();
  bool ok = true;
  for (TemporalTag Tag : getAllTemporalTags())
    ok &= require_(!table.isKnownIncompatible(Tag, Tag),
                   name_(Tag) + " must not be incompatible with itself");
  return ok;
}

static bool test_full_information_sources_are_empty_() {
  const CompatibilityTable &table = CompatibilityTable::get();
  bool ok = true;
  ok &= require_(
      table.getUnconstructibleTargets(TemporalTag::OffsetDateTime).empty(),
      "nothing built from an OffsetDateTime is flagged");
  ok &= require_(
      table.getUnconstructibleTargets(TemporalTag::ZonedDateTime).empty(),
      "nothing built from a ZonedDateTime is flagged");
  return ok;
}

static bool test_per_source_counts_() {
  struct Expected {
    TemporalTag Source;
    unsigned Count;
  };
  const Expected expected[] = {
      {TemporalTag::DayOfWeek, 18},   {TemporalTag::Instant, 18},
      {TemporalTag::LocalDate, 8},    {TemporalTag::LocalDateTime, 5},
      {TemporalTag::LocalTime, 17},   {TemporalTag::Month, 17},
      {TemporalTag::MonthDay, 15},    {TemporalTag::OffsetDateTime, 0},
      {TemporalTag::OffsetTime, 15},  {TemporalTag::Year, 18},
      {TemporalTag::YearMonth, 14},   {TemporalTag::ZonedDateTime, 0},
      {TemporalTag::ZoneOffset, 18},  {TemporalTag::AmPm, 18},
      {TemporalTag::DayOfMonth, 18},  {TemporalTag::DayOfYear, 18},
      {TemporalTag::Quarter, 18},     {TemporalTag::YearQuarter, 16},
      {TemporalTag::YearWeek, 18},
  };

  const CompatibilityTable &table = CompatibilityTable::get();
  bool ok = true;
  for (const Expected &E : expected) {
    unsigned actual =
        static_cast<unsigned>(table.getUnconstructibleTargets(E.Source).size());
    ok &= require_(actual == E.Count,
                   name_(E.Source) + " must reject " + std::to_string(E.Count) +
                       " targets, rejects " + std::to_string(actual));
  }
  return ok;
}

static bool test_direction_() {
  const CompatibilityTable &table = CompatibilityTable::get();
  bool ok = true;
  ok &= require_(
      table.isKnownIncompatible(TemporalTag::LocalDate, TemporalTag::Month),
      "LocalDate.from(month) must be incompatible");
  ok &= require_(
      !table.isKnownIncompatible(TemporalTag::Month, TemporalTag::LocalDate),
      "Month.from(localDate) must be compatible");
  ok &= require_(
      table.isKnownIncompatible(TemporalTag::LocalDate, TemporalTag::LocalTime),
      "LocalDate.from(localTime) must be incompatible");
  ok &= require_(!table.isKnownIncompatible(TemporalTag::LocalTime,
                                            TemporalTag::LocalDateTime),
                 "LocalTime.from(localDateTime) must be compatible");
  ok &= require_(
      table.isKnownIncompatible(TemporalTag::Instant, TemporalTag::LocalDateTime),
      "Instant.from(localDateTime) must be incompatible");
  ok &= require_(
      !table.isKnownIncompatible(TemporalTag::Instant, TemporalTag::ZonedDateTime),
      "Instant.from(zonedDateTime) must be compatible");
  ok &= require_(
      !table.isKnownIncompatible(TemporalTag::Quarter, TemporalTag::Month),
      "Quarter.from(month) must be compatible");
  ok &= require_(
      !table.isKnownIncompatible(TemporalTag::AmPm, TemporalTag::LocalTime),
      "AmPm.from(localTime) must be compatible");
  return ok;
}

static bool test_inverse_views_agree_() {
  const CompatibilityTable &table = CompatibilityTable::get();
  bool ok = true;
  unsigned viaSources = 0;
  for (TemporalTag Target : getAllTemporalTags()) {
    for (TemporalTag Source : table.getIncompatibleSources(Target)) {
      viaSources++;
      bool found = false;
      for (TemporalTag T : table.getUnconstructibleTargets(Source))
        found |= T == Target;
      ok &= require_(found, name_(Target) + "/" + name_(Source) +
                                " missing from the inverse index");
    }
  }
  ok &= require_(viaSources == table.getNumIncompatiblePairs(),
                 "both views must list every pair once");
  return ok;
}

static bool test_tag_names_() {
  bool ok = true;
  for (TemporalTag Tag : getAllTemporalTags()) {
    llvm::Optional<TemporalTag> back =
        lookupTemporalTag(getTemporalTypeName(Tag));
    ok &= require_(back && *back == Tag,
                   name_(Tag) + " must map to its name and back");
    ok &= require_(getTemporalTypeName(Tag).endswith("." + name_(Tag)),
                   name_(Tag) + " qualified name must end in its simple name");
  }
  ok &= require_(getAllTemporalTags().size() == 19, "there are 19 tags");
  ok &= require_(!lookupTemporalTag("java.time.ZoneId"),
                 "ZoneId is not a temporal value type");
  ok &= require_(!lookupTemporalTag("LocalDate"),
                 "lookup needs the qualified name");
  return ok;
}

static bool test_trusted_packages_() {
  bool ok = true;
  ok &= require_(isTrustedTemporalPackage("java.time"), "java.time");
  ok &= require_(isTrustedTemporalPackage("java.time.chrono"),
                 "java.time.chrono");
  ok &= require_(isTrustedTemporalPackage("org.threeten.extra"),
                 "org.threeten.extra");
  ok &= require_(isTrustedTemporalPackage("tck.java.time.temporal"),
                 "tck.java.time.temporal");
  ok &= require_(!isTrustedTemporalPackage("java.timex"),
                 "java.timex is a different package");
  ok &= require_(!isTrustedTemporalPackage("com.example"), "com.example");
  ok &= require_(!isTrustedTemporalPackage(""), "the default package");
  return ok;
}

static bool test_library_classes_() {
  bool ok = true;
  ok &= require_(isTemporalLibraryClass("java.time.ZoneId"), "ZoneId");
  ok &= require_(isTemporalLibraryClass("java.time.chrono.HijrahDate"),
                 "chrono dates are in a subpackage");
  ok &= require_(isTemporalLibraryClass("org.threeten.extra.Interval"),
                 "Interval");
  ok &= require_(!isTemporalLibraryClass("java.timex.ZoneId"),
                 "java.timex is a different package");
  ok &= require_(!isTemporalLibraryClass("ZoneId"),
                 "a simple name has no package");
  ok &= require_(!isTemporalLibraryClass("com.example.Period"),
                 "com.example.Period");
  return ok;
}

} // namespace

int main() {
  struct Case {
    const char *name;
    bool (*fn)();
  };

  const Case cases[] = {
      {"pair_count", test_pair_count_},
      {"no_self_pairs", test_no_self_pairs_},
      {"full_information_sources_are_empty",
       test_full_information_sources_are_empty_},
      {"per_source_counts", test_per_source_counts_},
      {"direction", test_direction_},
      {"inverse_views_agree", test_inverse_views_agree_},
      {"tag_names", test_tag_names_},
      {"trusted_packages", test_trusted_packages_},
      {"library_classes", test_library_classes_},
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
