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
#include "llvm/Support/ErrorHandling.h"

namespace tempo {

const CompatibilityTable &CompatibilityTable::get() {
  static const CompatibilityTable Table;
  return Table;
}

void CompatibilityTable::put(TemporalTag Source,
                             std::initializer_list<TemporalTag> Targets) {
  for (TemporalTag Target : Targets) {
    if (Target == Source)
      llvm_unreachable("a type is never incompatible with itself");
    m_Incompatible[getTagIndex(Target)].set(getTagIndex(Source));
  }
}

// Each entry names a source type followed by every receiver whose `from`
// rejects it. A LocalDate carries year, month and day, so Month, Year and
// friends can be built from it; the zone-free and time-free receivers
// cannot. OffsetDateTime and ZonedDateTime carry everything.
CompatibilityTable::CompatibilityTable() {
  using T = TemporalTag;

  put(T::DayOfWeek,
      {T::Instant, T::LocalDate, T::LocalDateTime, T::LocalTime, T::Month,
       T::MonthDay, T::OffsetDateTime, T::OffsetTime, T::Year, T::YearMonth,
       T::ZonedDateTime, T::ZoneOffset, T::AmPm, T::DayOfMonth, T::DayOfYear,
       T::Quarter, T::YearQuarter, T::YearWeek});

  put(T::Instant,
      {T::DayOfWeek, T::LocalDate, T::LocalDateTime, T::LocalTime, T::Month,
       T::MonthDay, T::OffsetDateTime, T::OffsetTime, T::Year, T::YearMonth,
       T::ZonedDateTime, T::ZoneOffset, T::AmPm, T::DayOfMonth, T::DayOfYear,
       T::Quarter, T::YearQuarter, T::YearWeek});

  put(T::LocalDate,
      {T::Instant, T::LocalDateTime, T::LocalTime, T::OffsetDateTime,
       T::OffsetTime, T::ZonedDateTime, T::ZoneOffset, T::AmPm});

  put(T::LocalDateTime, {T::Instant, T::OffsetDateTime, T::OffsetTime,
                         T::ZonedDateTime, T::ZoneOffset});

  put(T::LocalTime,
      {T::DayOfWeek, T::Instant, T::LocalDate, T::LocalDateTime, T::Month,
       T::MonthDay, T::OffsetDateTime, T::OffsetTime, T::Year, T::YearMonth,
       T::ZonedDateTime, T::ZoneOffset, T::DayOfMonth, T::DayOfYear,
       T::Quarter, T::YearQuarter, T::YearWeek});

  put(T::Month,
      {T::DayOfWeek, T::Instant, T::LocalDate, T::LocalDateTime, T::LocalTime,
       T::MonthDay, T::OffsetDateTime, T::OffsetTime, T::Year, T::YearMonth,
       T::ZonedDateTime, T::ZoneOffset, T::AmPm, T::DayOfMonth, T::DayOfYear,
       T::YearQuarter, T::YearWeek});

  put(T::MonthDay,
      {T::DayOfWeek, T::Instant, T::LocalDate, T::LocalDateTime, T::LocalTime,
       T::OffsetDateTime, T::OffsetTime, T::Year, T::YearMonth,
       T::ZonedDateTime, T::ZoneOffset, T::AmPm, T::DayOfYear, T::YearQuarter,
       T::YearWeek});

  put(T::OffsetDateTime, {});

  put(T::OffsetTime,
      {T::DayOfWeek, T::Instant, T::LocalDate, T::LocalDateTime, T::Month,
       T::MonthDay, T::OffsetDateTime, T::Year, T::YearMonth, T::ZonedDateTime,
       T::DayOfMonth, T::DayOfYear, T::Quarter, T::YearQuarter, T::YearWeek});

  put(T::Year,
      {T::DayOfWeek, T::Instant, T::LocalDate, T::LocalDateTime, T::LocalTime,
       T::Month, T::MonthDay, T::OffsetDateTime, T::OffsetTime, T::YearMonth,
       T::ZonedDateTime, T::ZoneOffset, T::AmPm, T::DayOfMonth, T::DayOfYear,
       T::Quarter, T::YearQuarter, T::YearWeek});

  put(T::YearMonth,
      {T::DayOfWeek, T::Instant, T::LocalDate, T::LocalDateTime, T::LocalTime,
       T::MonthDay, T::OffsetDateTime, T::OffsetTime, T::ZonedDateTime,
       T::ZoneOffset, T::AmPm, T::DayOfMonth, T::DayOfYear, T::YearWeek});

  put(T::ZonedDateTime, {});

  put(T::ZoneOffset,
      {T::DayOfWeek, T::Instant, T::LocalDate, T::LocalDateTime, T::LocalTime,
       T::Month, T::MonthDay, T::OffsetDateTime, T::OffsetTime, T::Year,
       T::YearMonth, T::ZonedDateTime, T::AmPm, T::DayOfMonth, T::DayOfYear,
       T::Quarter, T::YearQuarter, T::YearWeek});

  put(T::AmPm,
      {T::DayOfWeek, T::Instant, T::LocalDate, T::LocalDateTime, T::LocalTime,
       T::Month, T::MonthDay, T::OffsetDateTime, T::OffsetTime, T::Year,
       T::YearMonth, T::ZonedDateTime, T::ZoneOffset, T::DayOfMonth,
       T::DayOfYear, T::Quarter, T::YearQuarter, T::YearWeek});

  put(T::DayOfMonth,
      {T::DayOfWeek, T::Instant, T::LocalDate, T::LocalDateTime, T::LocalTime,
       T::Month, T::MonthDay, T::OffsetDateTime, T::OffsetTime, T::Year,
       T::YearMonth, T::ZonedDateTime, T::ZoneOffset, T::AmPm, T::DayOfYear,
       T::Quarter, T::YearQuarter, T::YearWeek});

  put(T::DayOfYear,
      {T::DayOfWeek, T::Instant, T::LocalDate, T::LocalDateTime, T::LocalTime,
       T::Month, T::MonthDay, T::OffsetDateTime, T::OffsetTime, T::Year,
       T::YearMonth, T::ZonedDateTime, T::ZoneOffset, T::AmPm, T::DayOfMonth,
       T::Quarter, T::YearQuarter, T::YearWeek});

  put(T::Quarter,
      {T::DayOfWeek, T::Instant, T::LocalDate, T::LocalDateTime, T::LocalTime,
       T::Month, T::MonthDay, T::OffsetDateTime, T::OffsetTime, T::Year,
       T::YearMonth, T::ZonedDateTime, T::ZoneOffset, T::AmPm, T::DayOfMonth,
       T::DayOfYear, T::YearQuarter, T::YearWeek});

  put(T::YearQuarter,
      {T::DayOfWeek, T::Instant, T::LocalDate, T::LocalDateTime, T::LocalTime,
       T::Month, T::MonthDay, T::OffsetDateTime, T::OffsetTime, T::YearMonth,
       T::ZonedDateTime, T::ZoneOffset, T::AmPm, T::DayOfMonth, T::DayOfYear,
       T::YearWeek});

  put(T::YearWeek,
      {T::DayOfWeek, T::Instant, T::LocalDate, T::LocalDateTime, T::LocalTime,
       T::Month, T::MonthDay, T::OffsetDateTime, T::OffsetTime, T::Year,
       T::YearMonth, T::ZonedDateTime, T::ZoneOffset, T::AmPm, T::DayOfMonth,
       T::DayOfYear, T::Quarter, T::YearQuarter});
}

llvm::SmallVector<TemporalTag, 8>
CompatibilityTable::getIncompatibleSources(TemporalTag Target) const {
  llvm::SmallVector<TemporalTag, 8> sources;
  for (TemporalTag Source : getAllTemporalTags()) {
    if (isKnownIncompatible(Target, Source))
      sources.push_back(Source);
  }
  return sources;
}

llvm::SmallVector<TemporalTag, 8>
CompatibilityTable::getUnconstructibleTargets(TemporalTag Source) const {
  llvm::SmallVector<TemporalTag, 8> targets;
  for (TemporalTag Target : getAllTemporalTags()) {
    if (isKnownIncompatible(Target, Source))
      targets.push_back(Target);
  }
  return targets;
}

unsigned CompatibilityTable::getNumIncompatiblePairs() const {
  unsigned count = 0;
  for (const auto &row : m_Incompatible)
    count += row.count();
  return count;
}

} // namespace tempo
