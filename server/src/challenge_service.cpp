/*
 * 설명: 챌린지 상태 기계 구현. 종료는 읽기 경로에서 지연 수행되며 저장소의 CAS로 한 번만 반영된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/challenge_service_test.cpp, server/tests/e2e/challenge_flow_test.cpp
 */
#include "screenrank/challenge_service.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>

#include "screenrank/errors.hpp"

namespace screenrank {
namespace {
constexpr std::size_t kMaxNameLength = 200;

std::string TrimName(const std::string& value) {
  auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
  auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::string ValidateName(const std::string& raw_name) {
  std::string name = TrimName(raw_name);
  if (name.empty() || name.size() > kMaxNameLength) {
    throw ValidationError("bad_request", "챌린지 이름은 1자 이상 200자 이하여야 합니다");
  }
  return name;
}
}  // namespace

ChallengeService::ChallengeService(std::shared_ptr<ChallengeStore> store, std::shared_ptr<StatsAggregator> aggregator,
                                   std::shared_ptr<AchievementSink> achievements,
                                   std::shared_ptr<Observability> observability, Clock clock,
                                   ZeroLogPolicy zero_log_policy)
    : store_(std::move(store)), aggregator_(std::move(aggregator)), achievements_(std::move(achievements)),
      observability_(std::move(observability)), clock_(std::move(clock)), zero_log_policy_(zero_log_policy) {}

ChallengeView ChallengeService::CreateChallenge(const CreateChallengeInput& input) {
  std::string name = ValidateName(input.name);
  if (input.target_minutes < 0) {
    throw ValidationError("bad_request", "target_minutes는 0 이상이어야 합니다");
  }
  Date today = clock_.Today();
  if (input.start_date < today) {
    throw ValidationError("bad_request", "시작일은 오늘 이후여야 합니다");
  }
  if (input.end_date < input.start_date) {
    throw ValidationError("bad_request", "종료일은 시작일 이후여야 합니다");
  }
  std::vector<int> invited;
  std::set<int> seen;
  for (int user_id : input.invited_user_ids) {
    if (user_id <= 0) {
      throw ValidationError("bad_request", "초대 대상 user_id가 올바르지 않습니다");
    }
    if (user_id == input.owner_id || !seen.insert(user_id).second) {
      continue;
    }
    invited.push_back(user_id);
  }

  NewChallenge record{name,
                      input.description,
                      input.owner_id,
                      input.target_app,
                      input.target_minutes,
                      input.start_date,
                      input.end_date,
                      input.start_date == today ? ChallengeStatus::kActive : ChallengeStatus::kUpcoming,
                      clock_.Now()};
  Challenge created = store_->CreateChallenge(record, invited);
  // 오늘 시작하는 챌린지는 소유자가 이미 남긴 오늘 기록을 반영한다.
  if (EffectiveStatus(created, today) == ChallengeStatus::kActive) {
    RecomputeBestEffort(created.challenge_id, input.owner_id);
  }
  observability_->LogEvent("challenge_created", LogLevel::kDebug, input.owner_id,
                           nlohmann::json{{"challengeId", created.challenge_id},
                                          {"targetApp", TargetLabel(created.target_app)},
                                          {"invited", invited.size()}});
  return BuildView(created, input.owner_id);
}

std::vector<ChallengeView> ChallengeService::ListChallenges(int user_id) {
  std::vector<ChallengeView> views;
  for (const auto& participation : store_->ListParticipationsForUser(user_id)) {
    if (participation.invitation_status == InvitationStatus::kDeclined) {
      continue;
    }
    std::optional<Challenge> challenge;
    try {
      challenge = store_->FindChallenge(participation.challenge_id);
      if (!challenge || challenge->status == ChallengeStatus::kDeleted) {
        continue;
      }
      challenge = RefreshLifecycle(*challenge);
      views.push_back(BuildView(*challenge, user_id));
    } catch (const std::exception& ex) {
      observability_->IncrementFinalizationFailure();
      observability_->LogEvent("finalization_failure", LogLevel::kError, user_id,
                               nlohmann::json{{"challengeId", participation.challenge_id}, {"error", ex.what()}});
      if (!challenge) {
        continue;
      }
      Challenge fallback = *challenge;
      fallback.status = EffectiveStatus(fallback, clock_.Today());
      views.push_back(ChallengeView{fallback, participation, {}});
    }
  }
  std::sort(views.begin(), views.end(), [](const ChallengeView& a, const ChallengeView& b) {
    return a.challenge.challenge_id > b.challenge.challenge_id;
  });
  return views;
}

ChallengeView ChallengeService::GetChallenge(int challenge_id, int user_id) {
  Challenge challenge = LoadChallenge(challenge_id);
  if (challenge.status == ChallengeStatus::kDeleted) {
    throw NotFoundError("챌린지를 찾을 수 없습니다");
  }
  if (!store_->FindParticipant(challenge_id, user_id)) {
    throw ValidationError("not_participant", "챌린지 참가자만 조회할 수 있습니다");
  }
  return BuildView(RefreshLifecycle(challenge), user_id);
}

std::vector<ChallengeStanding> ChallengeService::GetLeaderboard(int challenge_id, int user_id) {
  Challenge challenge = LoadChallenge(challenge_id);
  if (challenge.status == ChallengeStatus::kDeleted) {
    throw NotFoundError("챌린지를 찾을 수 없습니다");
  }
  if (!store_->FindParticipant(challenge_id, user_id)) {
    throw ValidationError("not_participant", "챌린지 참가자만 순위를 조회할 수 있습니다");
  }
  challenge = RefreshLifecycle(challenge);

  std::map<int, ChallengeParticipant> accepted;
  std::vector<RankingEntry> entries;
  for (const auto& participant : store_->ListParticipants(challenge_id)) {
    if (participant.invitation_status != InvitationStatus::kAccepted) {
      continue;
    }
    accepted.emplace(participant.participant_id, participant);
    entries.push_back(RankingEntry{participant.participant_id, participant.stats.total_screen_time_minutes,
                                   participant.stats.days_logged});
  }

  std::vector<ChallengeStanding> standings;
  standings.reserve(entries.size());
  for (const auto& ranked : RankChallenge(entries, zero_log_policy_)) {
    const auto& participant = accepted.at(ranked.id);
    auto user = store_->FindUser(participant.user_id);
    ChallengeStanding standing{participant.participant_id,
                               participant.user_id,
                               user ? user->username : std::string(),
                               participant.stats,
                               ranked.average,
                               ranked.rank,
                               ranked.is_winner};
    // 종료된 챌린지는 종료 시점에 기록된 순위를 그대로 보여준다.
    if (challenge.status == ChallengeStatus::kCompleted) {
      standing.rank = participant.final_rank;
      standing.is_winner = participant.is_winner;
    }
    standings.push_back(std::move(standing));
  }
  if (challenge.status == ChallengeStatus::kCompleted) {
    std::stable_sort(standings.begin(), standings.end(), [](const ChallengeStanding& a, const ChallengeStanding& b) {
      if (a.rank.has_value() != b.rank.has_value()) {
        return a.rank.has_value();
      }
      return a.rank.value_or(0) < b.rank.value_or(0);
    });
  }
  return standings;
}

int ChallengeService::InviteUsers(int challenge_id, int owner_id, const std::vector<int>& user_ids) {
  for (int user_id : user_ids) {
    if (user_id <= 0) {
      throw ValidationError("bad_request", "초대 대상 user_id가 올바르지 않습니다");
    }
  }
  Challenge challenge = LoadOwnedMutable(challenge_id, owner_id);
  int invited = 0;
  std::set<int> seen;
  auto now = clock_.Now();
  for (int user_id : user_ids) {
    if (user_id == challenge.owner_id || !seen.insert(user_id).second) {
      continue;
    }
    if (store_->AddParticipant(challenge_id, user_id, InvitationStatus::kPending, now)) {
      ++invited;
    }
  }
  return invited;
}

ChallengeParticipant ChallengeService::RespondToInvitation(int participant_id, int user_id, bool accept) {
  auto participant = store_->FindParticipantById(participant_id);
  if (!participant) {
    throw NotFoundError("초대를 찾을 수 없습니다");
  }
  if (participant->user_id != user_id) {
    throw ValidationError("not_invitee", "본인에게 온 초대만 응답할 수 있습니다");
  }
  Challenge challenge = RefreshLifecycle(LoadChallenge(participant->challenge_id));
  if (challenge.IsTerminal()) {
    throw ValidationError("challenge_closed", "종료되었거나 삭제된 챌린지입니다");
  }
  InvitationStatus next = accept ? InvitationStatus::kAccepted : InvitationStatus::kDeclined;
  if (participant->invitation_status != InvitationStatus::kPending ||
      !store_->UpdateInvitation(participant_id, InvitationStatus::kPending, next)) {
    throw ValidationError("invitation_closed", "이미 응답한 초대입니다");
  }

  if (accept) {
    RecomputeBestEffort(challenge.challenge_id, user_id);
    AwardBestEffort(user_id, kBadgeChallengeAccepted);
  }

  auto updated = store_->FindParticipantById(participant_id);
  if (!updated) {
    throw NotFoundError("초대를 찾을 수 없습니다");
  }
  return *updated;
}

void ChallengeService::LeaveChallenge(int challenge_id, int user_id) {
  Challenge challenge = LoadChallenge(challenge_id);
  auto participant = store_->FindParticipant(challenge_id, user_id);
  if (!participant) {
    throw ValidationError("not_participant", "챌린지 참가자가 아닙니다");
  }
  if (challenge.owner_id == user_id) {
    throw ValidationError("owner_cannot_leave", "소유자는 탈퇴할 수 없으며 삭제해야 합니다");
  }
  challenge = RefreshLifecycle(challenge);
  if (challenge.IsTerminal()) {
    throw ValidationError("challenge_closed", "종료되었거나 삭제된 챌린지입니다");
  }
  store_->RemoveParticipant(participant->participant_id);
}

void ChallengeService::DeleteChallenge(int challenge_id, int owner_id) {
  LoadOwnedMutable(challenge_id, owner_id);
  if (!store_->MarkDeleted(challenge_id)) {
    throw ValidationError("challenge_closed", "종료되었거나 삭제된 챌린지입니다");
  }
  observability_->LogEvent("challenge_deleted", LogLevel::kDebug, owner_id,
                           nlohmann::json{{"challengeId", challenge_id}});
}

ChallengeView ChallengeService::RenameChallenge(int challenge_id, int owner_id, const std::string& name) {
  std::string validated = ValidateName(name);
  Challenge challenge = LoadOwnedMutable(challenge_id, owner_id);
  store_->RenameChallenge(challenge_id, validated);
  challenge.name = validated;
  return BuildView(challenge, owner_id);
}

ChallengeView ChallengeService::CompleteChallenge(int challenge_id, int owner_id) {
  LoadOwnedMutable(challenge_id, owner_id);
  if (!Finalize(challenge_id)) {
    throw ValidationError("challenge_closed", "종료되었거나 삭제된 챌린지입니다");
  }
  return BuildView(LoadChallenge(challenge_id), owner_id);
}

Challenge ChallengeService::RefreshLifecycle(const Challenge& challenge) {
  if (challenge.IsTerminal()) {
    return challenge;
  }
  Date today = clock_.Today();
  if (today <= challenge.end_date) {
    Challenge current = challenge;
    current.status = EffectiveStatus(challenge, today);
    return current;
  }
  Finalize(challenge.challenge_id);
  return LoadChallenge(challenge.challenge_id);
}

int ChallengeService::RecomputeForLog(const ScreenTimeLog& log) {
  Date today = clock_.Today();
  int recomputed = 0;
  for (const auto& participation : store_->ListParticipationsForUser(log.user_id)) {
    if (participation.invitation_status != InvitationStatus::kAccepted) {
      continue;
    }
    try {
      auto challenge = store_->FindChallenge(participation.challenge_id);
      if (!challenge || EffectiveStatus(*challenge, today) != ChallengeStatus::kActive ||
          today > challenge->end_date) {
        continue;
      }
      if (log.date < challenge->start_date || log.date > challenge->end_date ||
          !TargetMatches(challenge->target_app, log.app_name)) {
        continue;
      }
      if (aggregator_->Recompute(challenge->challenge_id, log.user_id)) {
        ++recomputed;
      }
    } catch (const std::exception& ex) {
      observability_->IncrementAggregationFailure();
      observability_->LogEvent("aggregation_failure", LogLevel::kError, log.user_id,
                               nlohmann::json{{"challengeId", participation.challenge_id},
                                              {"logId", log.log_id},
                                              {"error", ex.what()}});
    }
  }
  return recomputed;
}

void ChallengeService::RecomputeBestEffort(int challenge_id, int user_id) {
  try {
    aggregator_->Recompute(challenge_id, user_id);
  } catch (const std::exception& ex) {
    observability_->IncrementAggregationFailure();
    observability_->LogEvent("aggregation_failure", LogLevel::kError, user_id,
                             nlohmann::json{{"challengeId", challenge_id}, {"error", ex.what()}});
  }
}

Challenge ChallengeService::LoadChallenge(int challenge_id) {
  auto challenge = store_->FindChallenge(challenge_id);
  if (!challenge) {
    throw NotFoundError("챌린지를 찾을 수 없습니다");
  }
  return *challenge;
}

Challenge ChallengeService::LoadOwnedMutable(int challenge_id, int owner_id) {
  Challenge challenge = LoadChallenge(challenge_id);
  if (challenge.owner_id != owner_id) {
    throw ValidationError("not_owner", "챌린지 소유자만 수행할 수 있습니다");
  }
  challenge = RefreshLifecycle(challenge);
  if (challenge.IsTerminal()) {
    throw ValidationError("challenge_closed", "종료되었거나 삭제된 챌린지입니다");
  }
  return challenge;
}

bool ChallengeService::Finalize(int challenge_id) {
  std::vector<int> winners;
  bool finalized = store_->FinalizeChallenge(
      challenge_id, clock_.Now(), [&](const std::vector<ChallengeParticipant>& accepted) {
        winners.clear();
        std::map<int, int> user_by_participant;
        std::vector<RankingEntry> entries;
        entries.reserve(accepted.size());
        for (const auto& participant : accepted) {
          user_by_participant[participant.participant_id] = participant.user_id;
          entries.push_back(RankingEntry{participant.participant_id, participant.stats.total_screen_time_minutes,
                                         participant.stats.days_logged});
        }
        std::vector<FinalStanding> standings;
        for (const auto& ranked : RankChallenge(entries, zero_log_policy_)) {
          standings.push_back(FinalStanding{ranked.id, ranked.rank, ranked.is_winner});
          if (ranked.is_winner) {
            winners.push_back(user_by_participant[ranked.id]);
          }
        }
        return standings;
      });
  if (!finalized) {
    return false;
  }
  observability_->IncrementChallengeFinalized();
  observability_->LogEvent("challenge_finalized", LogLevel::kInfo, std::nullopt,
                           nlohmann::json{{"challengeId", challenge_id}, {"winners", winners}});
  for (int winner : winners) {
    AwardBestEffort(winner, kBadgeCommunityChampion);
  }
  return true;
}

ChallengeView ChallengeService::BuildView(const Challenge& challenge, int user_id) {
  ChallengeView view{challenge, std::nullopt, store_->ListParticipants(challenge.challenge_id)};
  for (const auto& participant : view.participants) {
    if (participant.user_id == user_id) {
      view.membership = participant;
      break;
    }
  }
  return view;
}

void ChallengeService::AwardBestEffort(int user_id, const std::string& badge) {
  if (!achievements_) {
    return;
  }
  try {
    achievements_->Award(user_id, badge);
  } catch (const std::exception& ex) {
    observability_->IncrementAchievementFailure();
    observability_->LogEvent("achievement_failure", LogLevel::kWarn, user_id,
                             nlohmann::json{{"badge", badge}, {"error", ex.what()}});
  }
}

}  // namespace screenrank
