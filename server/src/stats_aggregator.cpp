/*
 * 설명: 참가자 통계 재계산 구현. 저장소의 참가 행 잠금 아래에서 계산 함수를 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/stats_aggregator_test.cpp
 */
#include "screenrank/stats_aggregator.hpp"

#include <map>

#include "screenrank/streak_calculator.hpp"

namespace screenrank {

ParticipantStats ComputeParticipantStats(const Challenge& challenge, const std::vector<ScreenTimeLog>& logs,
                                         Date today) {
  std::vector<ScreenTimeLog> in_window;
  for (const auto& log : logs) {
    if (log.date < challenge.start_date || log.date > challenge.end_date) {
      continue;
    }
    if (!TargetMatches(challenge.target_app, log.app_name)) {
      continue;
    }
    in_window.push_back(log);
  }

  // ALL 대상은 Total 행과 앱별 행이 겹치지 않도록 하루 단위 사용량으로 합친다.
  std::map<Date, int> day_totals;
  if (IsAllApps(challenge.target_app)) {
    day_totals = DailyUsage(in_window);
  } else {
    for (const auto& log : in_window) {
      day_totals[log.date] += log.minutes;
    }
  }

  ParticipantStats stats;
  for (const auto& [day, minutes] : day_totals) {
    ++stats.days_logged;
    stats.total_screen_time_minutes += minutes;
    if (minutes <= challenge.target_minutes) {
      ++stats.days_passed;
    }
  }
  stats.days_failed = stats.days_logged - stats.days_passed;

  auto today_it = day_totals.find(today);
  if (today_it != day_totals.end()) {
    stats.today_minutes = today_it->second;
    stats.today_passed = today_it->second <= challenge.target_minutes;
  }
  return stats;
}

StatsAggregator::StatsAggregator(std::shared_ptr<ChallengeStore> store, Clock clock)
    : store_(std::move(store)), clock_(std::move(clock)) {}

std::optional<ParticipantStats> StatsAggregator::Recompute(int challenge_id, int user_id) {
  Date today = clock_.Today();
  return store_->UpdateParticipantStats(
      challenge_id, user_id, [today](const Challenge& challenge, const std::vector<ScreenTimeLog>& logs) {
        return ComputeParticipantStats(challenge, logs, today);
      });
}

}  // namespace screenrank
