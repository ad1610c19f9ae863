/*
 * 설명: 스크린타임 로그 기록/조회. 기록이 커밋된 뒤 챌린지 통계 재계산과 캐시 갱신을 이어서 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/screen_time_service_test.cpp, server/tests/e2e/challenge_flow_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "screenrank/challenge_service.hpp"
#include "screenrank/challenge_store.hpp"
#include "screenrank/date.hpp"
#include "screenrank/gamification_service.hpp"
#include "screenrank/observability.hpp"

namespace screenrank {

inline constexpr int kMaxMinutesPerDay = 1440;
inline constexpr int kMaxLogAgeDays = 365;
inline constexpr std::size_t kDefaultEntryLimit = 20;
inline constexpr std::size_t kMaxEntryLimit = 100;

struct LogResult {
  ScreenTimeLog log;
  int challenges_updated;
};

struct EntryFilter {
  std::optional<Date> date;
  std::optional<Date> start_date;
  std::optional<Date> end_date;
  std::optional<std::string> app_name;
  std::optional<int> limit;
};

class ScreenTimeService {
 public:
  ScreenTimeService(std::shared_ptr<ChallengeStore> store, std::shared_ptr<ChallengeService> challenges,
                    std::shared_ptr<GamificationService> gamification, std::shared_ptr<Observability> observability,
                    Clock clock);

  // date가 없으면 오늘(UTC). 재계산/캐시 갱신 실패는 기록 결과에 영향을 주지 않는다.
  LogResult LogScreenTime(int user_id, const std::string& app_name, std::optional<Date> date, int minutes);
  // 최신 날짜 우선. limit은 [1, 100]으로 맞춘다.
  std::vector<ScreenTimeLog> ListEntries(int user_id, const EntryFilter& filter);
  const std::vector<std::string>& AllowedApps() const;

 private:
  std::shared_ptr<ChallengeStore> store_;
  std::shared_ptr<ChallengeService> challenges_;
  std::shared_ptr<GamificationService> gamification_;
  std::shared_ptr<Observability> observability_;
  Clock clock_;
};

}  // namespace screenrank
