/*
 * 설명: 상태 열거형 문자열 변환과 대상 앱 판정을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/stats_aggregator_test.cpp
 */
#include "screenrank/models.hpp"

namespace screenrank {

std::string ToString(ChallengeStatus status) {
  switch (status) {
    case ChallengeStatus::kUpcoming:
      return "upcoming";
    case ChallengeStatus::kActive:
      return "active";
    case ChallengeStatus::kCompleted:
      return "completed";
    case ChallengeStatus::kDeleted:
      return "deleted";
  }
  return "unknown";
}

std::string ToString(InvitationStatus status) {
  switch (status) {
    case InvitationStatus::kPending:
      return "pending";
    case InvitationStatus::kAccepted:
      return "accepted";
    case InvitationStatus::kDeclined:
      return "declined";
  }
  return "unknown";
}

std::string ToString(GoalType type) { return type == GoalType::kDaily ? "daily" : "weekly"; }

std::optional<ChallengeStatus> ParseChallengeStatus(const std::string& text) {
  if (text == "upcoming") {
    return ChallengeStatus::kUpcoming;
  }
  if (text == "active") {
    return ChallengeStatus::kActive;
  }
  if (text == "completed") {
    return ChallengeStatus::kCompleted;
  }
  if (text == "deleted") {
    return ChallengeStatus::kDeleted;
  }
  return std::nullopt;
}

std::optional<InvitationStatus> ParseInvitationStatus(const std::string& text) {
  if (text == "pending") {
    return InvitationStatus::kPending;
  }
  if (text == "accepted") {
    return InvitationStatus::kAccepted;
  }
  if (text == "declined") {
    return InvitationStatus::kDeclined;
  }
  return std::nullopt;
}

std::optional<GoalType> ParseGoalType(const std::string& text) {
  if (text == "daily") {
    return GoalType::kDaily;
  }
  if (text == "weekly") {
    return GoalType::kWeekly;
  }
  return std::nullopt;
}

bool TargetMatches(const TargetApp& target, const std::string& app_name) {
  if (const auto* specific = std::get_if<SpecificApp>(&target)) {
    return specific->name == app_name;
  }
  return true;
}

bool IsAllApps(const TargetApp& target) { return std::holds_alternative<AllApps>(target); }

std::string TargetLabel(const TargetApp& target) {
  if (const auto* specific = std::get_if<SpecificApp>(&target)) {
    return specific->name;
  }
  return "ALL";
}

ChallengeStatus EffectiveStatus(const Challenge& challenge, Date today) {
  if (challenge.status == ChallengeStatus::kUpcoming && challenge.start_date <= today) {
    return ChallengeStatus::kActive;
  }
  return challenge.status;
}

}  // namespace screenrank
