/*
 * 설명: 로그/챌린지/참가자/목표/사용자 저장소 인터페이스. MariaDB와 인메모리 구현이 있다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/it/mariadb_store_it_test.cpp, server/tests/unit/challenge_service_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "screenrank/date.hpp"
#include "screenrank/models.hpp"

namespace screenrank {

struct NewChallenge {
  std::string name;
  std::optional<std::string> description;
  int owner_id;
  TargetApp target_app;
  int target_minutes;
  Date start_date;
  Date end_date;
  ChallengeStatus status;
  std::chrono::system_clock::time_point created_at;
};

struct LogQuery {
  std::optional<Date> date;
  std::optional<Date> start_date;
  std::optional<Date> end_date;
  std::optional<std::string> app_contains;
  std::size_t limit{20};
};

class ChallengeStore {
 public:
  // 챌린지와 (user_id의) 기간 내 로그를 받아 새 통계를 계산한다.
  using StatsComputer = std::function<ParticipantStats(const Challenge&, const std::vector<ScreenTimeLog>&)>;
  // 수락된 참가자를 받아 최종 순위를 돌려준다.
  using Finalizer = std::function<std::vector<FinalStanding>(const std::vector<ChallengeParticipant>&)>;

  virtual ~ChallengeStore() = default;

  virtual void EnsureUser(int user_id, const std::string& username) = 0;
  virtual std::optional<UserRecord> FindUser(int user_id) = 0;
  virtual void UpdateUserCache(int user_id, int streak_count, int total_points) = 0;

  virtual void UpsertGoal(const Goal& goal) = 0;
  virtual std::optional<Goal> FindGoal(int user_id, GoalType type) = 0;

  // (user_id, app_name, date)당 한 행. 이미 있으면 minutes를 덮어쓴다.
  virtual ScreenTimeLog UpsertLog(int user_id, const std::string& app_name, Date date, int minutes) = 0;
  // 날짜, 앱 이름 오름차순.
  virtual std::vector<ScreenTimeLog> ListLogs(int user_id, Date from, Date to) = 0;
  virtual std::vector<ScreenTimeLog> ListLogsInRange(Date from, Date to) = 0;
  // 최신 날짜 우선.
  virtual std::vector<ScreenTimeLog> QueryLogs(int user_id, const LogQuery& query) = 0;

  // 소유자는 accepted, 초대 대상은 pending 참가자로 함께 생성한다.
  virtual Challenge CreateChallenge(const NewChallenge& challenge, const std::vector<int>& invited_user_ids) = 0;
  virtual std::optional<Challenge> FindChallenge(int challenge_id) = 0;
  virtual void RenameChallenge(int challenge_id, const std::string& name) = 0;
  // upcoming/active일 때만 deleted로 바꾼다.
  virtual bool MarkDeleted(int challenge_id) = 0;
  // 챌린지 단위 원자 연산. 상태가 upcoming/active가 아니면 아무것도 하지 않고 false.
  virtual bool FinalizeChallenge(int challenge_id, std::chrono::system_clock::time_point completed_at,
                                 const Finalizer& finalizer) = 0;

  virtual std::optional<ChallengeParticipant> FindParticipant(int challenge_id, int user_id) = 0;
  virtual std::optional<ChallengeParticipant> FindParticipantById(int participant_id) = 0;
  virtual std::vector<ChallengeParticipant> ListParticipants(int challenge_id) = 0;
  virtual std::vector<ChallengeParticipant> ListParticipationsForUser(int user_id) = 0;
  // 이미 참가 행이 있으면 false.
  virtual bool AddParticipant(int challenge_id, int user_id, InvitationStatus status,
                              std::chrono::system_clock::time_point joined_at) = 0;
  virtual bool RemoveParticipant(int participant_id) = 0;
  // from 상태일 때만 to로 바꾼다.
  virtual bool UpdateInvitation(int participant_id, InvitationStatus from, InvitationStatus to) = 0;
  // 참가 행 잠금 아래에서 로그 조회, 계산, 저장을 수행한다.
  // 챌린지가 없거나 수락된 참가자가 아니면 nullopt.
  virtual std::optional<ParticipantStats> UpdateParticipantStats(int challenge_id, int user_id,
                                                                 const StatsComputer& compute) = 0;
};

}  // namespace screenrank
