/*
 * 설명: UTC 기준 달력 날짜와 주입 가능한 시계를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/date_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include <boost/date_time/gregorian/gregorian.hpp>

namespace screenrank {

// boost::gregorian::date를 감싼 UTC 달력 날짜. 기본값은 1970-01-01.
class Date {
 public:
  Date();

  static Date FromCivil(int year, unsigned month, unsigned day);
  static Date FromGregorian(const boost::gregorian::date& value) { return Date(value); }
  static Date FromTimePoint(std::chrono::system_clock::time_point tp);
  // YYYY-MM-DD 형식만 허용한다.
  static std::optional<Date> Parse(const std::string& text);

  const boost::gregorian::date& ToGregorian() const { return date_; }
  int Year() const { return date_.year(); }
  unsigned Month() const { return date_.month(); }
  unsigned Day() const { return date_.day(); }
  // 월요일 1 ... 일요일 7.
  unsigned IsoWeekday() const;
  // ISO 연도 * 100 + ISO 주차.
  int IsoWeekKey() const;

  Date AddDays(int delta) const { return Date(date_ + boost::gregorian::days(delta)); }
  Date FirstOfMonth() const;
  Date LastOfMonth() const { return Date(date_.end_of_month()); }
  std::string ToString() const;

  bool operator==(const Date& other) const { return date_ == other.date_; }
  bool operator!=(const Date& other) const { return date_ != other.date_; }
  bool operator<(const Date& other) const { return date_ < other.date_; }
  bool operator<=(const Date& other) const { return date_ <= other.date_; }
  bool operator>(const Date& other) const { return date_ > other.date_; }
  bool operator>=(const Date& other) const { return date_ >= other.date_; }

 private:
  explicit Date(const boost::gregorian::date& value) : date_(value) {}

  boost::gregorian::date date_;
};

class Clock {
 public:
  using NowFn = std::function<std::chrono::system_clock::time_point()>;

  Clock();
  explicit Clock(NowFn now);

  // 해당 날짜 정오(UTC)에 고정된 시계. 테스트에서 사용한다.
  static Clock Fixed(Date today);

  std::chrono::system_clock::time_point Now() const { return now_(); }
  Date Today() const { return Date::FromTimePoint(now_()); }

 private:
  NowFn now_;
};

}  // namespace screenrank
