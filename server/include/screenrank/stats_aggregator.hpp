/*
 * 설명: 챌린지 기간/대상 앱 기준으로 참가자 통계를 다시 계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/stats_aggregator_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "screenrank/challenge_store.hpp"
#include "screenrank/date.hpp"
#include "screenrank/models.hpp"

namespace screenrank {

// 순수 함수. 기간 밖 로그와 대상이 아닌 앱 로그는 무시한다.
ParticipantStats ComputeParticipantStats(const Challenge& challenge, const std::vector<ScreenTimeLog>& logs,
                                         Date today);

class StatsAggregator {
 public:
  StatsAggregator(std::shared_ptr<ChallengeStore> store, Clock clock);

  // 챌린지가 없거나 수락된 참가자가 아니면 아무것도 하지 않고 nullopt.
  std::optional<ParticipantStats> Recompute(int challenge_id, int user_id);

 private:
  std::shared_ptr<ChallengeStore> store_;
  Clock clock_;
};

}  // namespace screenrank
