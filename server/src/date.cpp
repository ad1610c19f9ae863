/*
 * 설명: boost::gregorian 기반 날짜 변환과 시계 구현.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/date_test.cpp
 */
#include "screenrank/date.hpp"

#include <cctype>
#include <exception>
#include <utility>

#include <boost/date_time/posix_time/posix_time.hpp>

namespace screenrank {
namespace {
const boost::gregorian::date kEpoch(1970, 1, 1);

// from_simple_string은 한 자리 월이나 월 이름도 받으므로 모양을 먼저 확인한다.
bool IsIsoShape(const std::string& text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return false;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i == 4 || i == 7) {
      continue;
    }
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
  }
  return true;
}
}  // namespace

Date::Date() : date_(kEpoch) {}

Date Date::FromCivil(int year, unsigned month, unsigned day) {
  return Date(boost::gregorian::date(static_cast<unsigned short>(year), static_cast<unsigned short>(month),
                                     static_cast<unsigned short>(day)));
}

Date Date::FromTimePoint(std::chrono::system_clock::time_point tp) {
  return Date(boost::posix_time::from_time_t(std::chrono::system_clock::to_time_t(tp)).date());
}

std::optional<Date> Date::Parse(const std::string& text) {
  if (!IsIsoShape(text)) {
    return std::nullopt;
  }
  try {
    return Date(boost::gregorian::from_simple_string(text));
  } catch (const std::exception&) {
    // 2023-02-29처럼 달력에 없는 날짜.
    return std::nullopt;
  }
}

unsigned Date::IsoWeekday() const {
  unsigned weekday = date_.day_of_week().as_number();
  return weekday == 0 ? 7 : weekday;
}

int Date::IsoWeekKey() const {
  int week = date_.week_number();
  int year = date_.year();
  if (week >= 52 && date_.month() == 1) {
    --year;
  } else if (week == 1 && date_.month() == 12) {
    ++year;
  }
  return year * 100 + week;
}

Date Date::FirstOfMonth() const { return Date(date_ - boost::gregorian::days(date_.day() - 1)); }

std::string Date::ToString() const { return boost::gregorian::to_iso_extended_string(date_); }

Clock::Clock() : now_([]() { return std::chrono::system_clock::now(); }) {}

Clock::Clock(NowFn now) : now_(std::move(now)) {}

Clock Clock::Fixed(Date today) {
  boost::posix_time::ptime noon(today.ToGregorian(), boost::posix_time::hours(12));
  auto tp = std::chrono::system_clock::from_time_t(boost::posix_time::to_time_t(noon));
  return Clock([tp]() { return tp; });
}

}  // namespace screenrank
