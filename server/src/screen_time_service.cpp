/*
 * 설명: 스크린타임 로그 기록과 재계산 분배 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/screen_time_service_test.cpp, server/tests/e2e/challenge_flow_test.cpp
 */
#include "screenrank/screen_time_service.hpp"

#include <algorithm>

#include "screenrank/app_catalog.hpp"
#include "screenrank/errors.hpp"

namespace screenrank {

ScreenTimeService::ScreenTimeService(std::shared_ptr<ChallengeStore> store, std::shared_ptr<ChallengeService> challenges,
                                     std::shared_ptr<GamificationService> gamification,
                                     std::shared_ptr<Observability> observability, Clock clock)
    : store_(std::move(store)), challenges_(std::move(challenges)), gamification_(std::move(gamification)),
      observability_(std::move(observability)), clock_(std::move(clock)) {}

LogResult ScreenTimeService::LogScreenTime(int user_id, const std::string& app_name, std::optional<Date> date,
                                           int minutes) {
  auto canonical = CanonicalizeAppName(app_name);
  if (!canonical) {
    throw ValidationError("unknown_app", "허용되지 않은 앱 이름입니다: " + app_name);
  }
  if (minutes < 0 || minutes > kMaxMinutesPerDay) {
    throw ValidationError("bad_request", "minutes는 0 이상 1440 이하여야 합니다");
  }
  Date today = clock_.Today();
  Date log_date = date.value_or(today);
  if (log_date > today) {
    throw ValidationError("bad_request", "미래 날짜는 기록할 수 없습니다");
  }
  if (log_date < today.AddDays(-kMaxLogAgeDays)) {
    throw ValidationError("bad_request", "365일보다 오래된 날짜는 기록할 수 없습니다");
  }

  ScreenTimeLog log = store_->UpsertLog(user_id, *canonical, log_date, minutes);
  observability_->IncrementLogWritten();

  int updated = 0;
  try {
    updated = challenges_->RecomputeForLog(log);
  } catch (const std::exception& ex) {
    observability_->IncrementAggregationFailure();
    observability_->LogEvent("aggregation_failure", LogLevel::kError, user_id,
                             nlohmann::json{{"logId", log.log_id}, {"error", ex.what()}});
  }
  try {
    gamification_->Refresh(user_id);
  } catch (const std::exception& ex) {
    observability_->LogEvent("gamification_refresh_failure", LogLevel::kWarn, user_id,
                             nlohmann::json{{"error", ex.what()}});
  }
  return LogResult{log, updated};
}

std::vector<ScreenTimeLog> ScreenTimeService::ListEntries(int user_id, const EntryFilter& filter) {
  if (filter.start_date && filter.end_date && *filter.start_date > *filter.end_date) {
    throw ValidationError("bad_request", "start_date는 end_date보다 늦을 수 없습니다");
  }
  LogQuery query;
  query.date = filter.date;
  query.start_date = filter.start_date;
  query.end_date = filter.end_date;
  query.app_contains = filter.app_name;
  int limit = filter.limit.value_or(static_cast<int>(kDefaultEntryLimit));
  query.limit = static_cast<std::size_t>(std::clamp(limit, 1, static_cast<int>(kMaxEntryLimit)));
  return store_->QueryLogs(user_id, query);
}

const std::vector<std::string>& ScreenTimeService::AllowedApps() const { return screenrank::AllowedApps(); }

}  // namespace screenrank
