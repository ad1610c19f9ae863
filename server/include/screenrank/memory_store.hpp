/*
 * 설명: 단일 뮤텍스로 보호되는 인메모리 저장소. STORE_BACKEND=memory와 테스트에서 사용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/challenge_service_test.cpp, server/tests/e2e/challenge_flow_test.cpp
 */
#pragma once

#include <map>
#include <mutex>
#include <tuple>

#include "screenrank/challenge_store.hpp"

namespace screenrank {

class MemoryChallengeStore : public ChallengeStore {
 public:
  void EnsureUser(int user_id, const std::string& username) override;
  std::optional<UserRecord> FindUser(int user_id) override;
  void UpdateUserCache(int user_id, int streak_count, int total_points) override;

  void UpsertGoal(const Goal& goal) override;
  std::optional<Goal> FindGoal(int user_id, GoalType type) override;

  ScreenTimeLog UpsertLog(int user_id, const std::string& app_name, Date date, int minutes) override;
  std::vector<ScreenTimeLog> ListLogs(int user_id, Date from, Date to) override;
  std::vector<ScreenTimeLog> ListLogsInRange(Date from, Date to) override;
  std::vector<ScreenTimeLog> QueryLogs(int user_id, const LogQuery& query) override;

  Challenge CreateChallenge(const NewChallenge& challenge, const std::vector<int>& invited_user_ids) override;
  std::optional<Challenge> FindChallenge(int challenge_id) override;
  void RenameChallenge(int challenge_id, const std::string& name) override;
  bool MarkDeleted(int challenge_id) override;
  bool FinalizeChallenge(int challenge_id, std::chrono::system_clock::time_point completed_at,
                         const Finalizer& finalizer) override;

  std::optional<ChallengeParticipant> FindParticipant(int challenge_id, int user_id) override;
  std::optional<ChallengeParticipant> FindParticipantById(int participant_id) override;
  std::vector<ChallengeParticipant> ListParticipants(int challenge_id) override;
  std::vector<ChallengeParticipant> ListParticipationsForUser(int user_id) override;
  bool AddParticipant(int challenge_id, int user_id, InvitationStatus status,
                      std::chrono::system_clock::time_point joined_at) override;
  bool RemoveParticipant(int participant_id) override;
  bool UpdateInvitation(int participant_id, InvitationStatus from, InvitationStatus to) override;
  std::optional<ParticipantStats> UpdateParticipantStats(int challenge_id, int user_id,
                                                         const StatsComputer& compute) override;

 private:
  using LogKey = std::tuple<int, Date, std::string>;

  bool AddParticipantLocked(int challenge_id, int user_id, InvitationStatus status,
                            std::chrono::system_clock::time_point joined_at);
  ChallengeParticipant* FindParticipantLocked(int challenge_id, int user_id);

  std::mutex mutex_;
  int next_log_id_{1};
  int next_challenge_id_{1};
  int next_participant_id_{1};
  std::map<int, UserRecord> users_;
  std::map<std::pair<int, GoalType>, Goal> goals_;
  std::map<LogKey, ScreenTimeLog> logs_;
  std::map<int, Challenge> challenges_;
  std::map<int, ChallengeParticipant> participants_;
};

}  // namespace screenrank
