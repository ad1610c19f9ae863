/*
 * 설명: 챌린지 상태 기계. 생성/초대/응답/탈퇴/삭제/종료와 로그 기록 시 통계 재계산 분배를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/challenge_service_test.cpp, server/tests/e2e/challenge_flow_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "screenrank/achievement_sink.hpp"
#include "screenrank/challenge_store.hpp"
#include "screenrank/date.hpp"
#include "screenrank/models.hpp"
#include "screenrank/observability.hpp"
#include "screenrank/ranking_engine.hpp"
#include "screenrank/stats_aggregator.hpp"

namespace screenrank {

struct CreateChallengeInput {
  std::string name;
  std::optional<std::string> description;
  int owner_id;
  TargetApp target_app;
  int target_minutes;
  Date start_date;
  Date end_date;
  std::vector<int> invited_user_ids;
};

struct ChallengeView {
  Challenge challenge;
  // 요청자의 참가 행.
  std::optional<ChallengeParticipant> membership;
  std::vector<ChallengeParticipant> participants;
};

struct ChallengeStanding {
  int participant_id;
  int user_id;
  std::string username;
  ParticipantStats stats;
  double average;
  std::optional<int> rank;
  bool is_winner;
};

class ChallengeService {
 public:
  ChallengeService(std::shared_ptr<ChallengeStore> store, std::shared_ptr<StatsAggregator> aggregator,
                   std::shared_ptr<AchievementSink> achievements, std::shared_ptr<Observability> observability,
                   Clock clock, ZeroLogPolicy zero_log_policy);

  ChallengeView CreateChallenge(const CreateChallengeInput& input);
  // 삭제된 챌린지는 제외한다. 챌린지별 종료 처리 실패는 로그만 남기고 계속한다.
  std::vector<ChallengeView> ListChallenges(int user_id);
  ChallengeView GetChallenge(int challenge_id, int user_id);
  std::vector<ChallengeStanding> GetLeaderboard(int challenge_id, int user_id);

  // 새로 초대된 인원 수. 이미 참가 행이 있는 사용자는 건너뛴다.
  int InviteUsers(int challenge_id, int owner_id, const std::vector<int>& user_ids);
  ChallengeParticipant RespondToInvitation(int participant_id, int user_id, bool accept);
  void LeaveChallenge(int challenge_id, int user_id);
  void DeleteChallenge(int challenge_id, int owner_id);
  ChallengeView RenameChallenge(int challenge_id, int owner_id, const std::string& name);
  // 소유자가 종료일 전에 직접 끝낸다.
  ChallengeView CompleteChallenge(int challenge_id, int owner_id);

  // 종료일이 지난 챌린지를 종료하고, 유효 상태를 반영한 챌린지를 돌려준다.
  Challenge RefreshLifecycle(const Challenge& challenge);
  // 로그 한 건이 영향을 주는 모든 챌린지의 참가자 통계를 다시 계산한다. 재계산한 챌린지 수.
  int RecomputeForLog(const ScreenTimeLog& log);

 private:
  Challenge LoadChallenge(int challenge_id);
  Challenge LoadOwnedMutable(int challenge_id, int owner_id);
  bool Finalize(int challenge_id);
  ChallengeView BuildView(const Challenge& challenge, int user_id);
  void AwardBestEffort(int user_id, const std::string& badge);
  void RecomputeBestEffort(int challenge_id, int user_id);

  std::shared_ptr<ChallengeStore> store_;
  std::shared_ptr<StatsAggregator> aggregator_;
  std::shared_ptr<AchievementSink> achievements_;
  std::shared_ptr<Observability> observability_;
  Clock clock_;
  ZeroLogPolicy zero_log_policy_;
};

}  // namespace screenrank
