/*
 * 설명: MariaDB 기반 저장소. 참가자 통계 갱신과 챌린지 종료는 행 잠금 트랜잭션으로 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <memory>

#include <mariadb/mysql.h>

#include "screenrank/challenge_store.hpp"
#include "screenrank/db_client.hpp"

namespace screenrank {

class MariaDbChallengeStore : public ChallengeStore {
 public:
  explicit MariaDbChallengeStore(std::shared_ptr<MariaDbClient> db_client);

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

  // 통합 테스트용. 모든 테이블을 비운다.
  void ClearAll() const;

 private:
  bool InsertParticipantInTx(MYSQL* conn, int challenge_id, int user_id, InvitationStatus status,
                             std::chrono::system_clock::time_point joined_at);
  std::optional<Challenge> FindChallengeInTx(MYSQL* conn, int challenge_id, bool for_update);
  std::vector<ChallengeParticipant> QueryParticipants(MYSQL* conn, const std::string& where_clause);
  std::vector<ScreenTimeLog> QueryLogRows(MYSQL* conn, const std::string& tail);

  Challenge BuildChallenge(MYSQL_ROW row) const;
  ChallengeParticipant BuildParticipant(MYSQL_ROW row) const;
  ScreenTimeLog BuildLog(MYSQL_ROW row) const;
  std::string ToTimestamp(const std::chrono::system_clock::time_point& tp) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace screenrank
