/*
 * 설명: 스크린타임 로그, 챌린지, 참가자, 목표, 사용자 레코드를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/unit/stats_aggregator_test.cpp, server/tests/unit/challenge_service_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <variant>

#include "screenrank/date.hpp"

namespace screenrank {

enum class ChallengeStatus { kUpcoming, kActive, kCompleted, kDeleted };
enum class InvitationStatus { kPending, kAccepted, kDeclined };
enum class GoalType { kDaily, kWeekly };

std::string ToString(ChallengeStatus status);
std::string ToString(InvitationStatus status);
std::string ToString(GoalType type);
std::optional<ChallengeStatus> ParseChallengeStatus(const std::string& text);
std::optional<InvitationStatus> ParseInvitationStatus(const std::string& text);
std::optional<GoalType> ParseGoalType(const std::string& text);

struct AllApps {};
struct SpecificApp {
  std::string name;
};
using TargetApp = std::variant<SpecificApp, AllApps>;

bool TargetMatches(const TargetApp& target, const std::string& app_name);
bool IsAllApps(const TargetApp& target);
// 전체 앱 대상은 "ALL"로 표기한다.
std::string TargetLabel(const TargetApp& target);

struct ScreenTimeLog {
  int log_id;
  int user_id;
  std::string app_name;
  Date date;
  int minutes;
};

struct Challenge {
  int challenge_id;
  std::string name;
  std::optional<std::string> description;
  int owner_id;
  TargetApp target_app;
  int target_minutes;
  Date start_date;
  Date end_date;
  ChallengeStatus status;
  std::chrono::system_clock::time_point created_at;
  std::optional<std::chrono::system_clock::time_point> completed_at;

  bool IsTerminal() const { return status == ChallengeStatus::kCompleted || status == ChallengeStatus::kDeleted; }
};

// upcoming은 저장된 상태일 뿐이며 시작일이 지나면 active로 읽힌다.
ChallengeStatus EffectiveStatus(const Challenge& challenge, Date today);

struct ParticipantStats {
  int days_logged{0};
  int total_screen_time_minutes{0};
  int days_passed{0};
  int days_failed{0};
  int today_minutes{0};
  std::optional<bool> today_passed;

  bool operator==(const ParticipantStats& other) const {
    return days_logged == other.days_logged && total_screen_time_minutes == other.total_screen_time_minutes &&
           days_passed == other.days_passed && days_failed == other.days_failed &&
           today_minutes == other.today_minutes && today_passed == other.today_passed;
  }
  bool operator!=(const ParticipantStats& other) const { return !(*this == other); }
};

struct ChallengeParticipant {
  int participant_id;
  int challenge_id;
  int user_id;
  InvitationStatus invitation_status;
  std::chrono::system_clock::time_point joined_at;
  ParticipantStats stats;
  std::optional<int> final_rank;
  bool is_winner{false};
  bool challenge_completed{false};
};

struct FinalStanding {
  int participant_id;
  std::optional<int> final_rank;
  bool is_winner;
};

struct Goal {
  int user_id;
  GoalType goal_type;
  int target_minutes;
};

struct UserRecord {
  int user_id;
  std::string username;
  int streak_count{0};
  int total_points{0};
};

}  // namespace screenrank
