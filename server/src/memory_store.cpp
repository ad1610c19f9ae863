/*
 * 설명: 인메모리 저장소 구현. 모든 연산은 하나의 뮤텍스 아래에서 원자적으로 수행된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/challenge_service_test.cpp, server/tests/e2e/challenge_flow_test.cpp
 */
#include "screenrank/memory_store.hpp"

#include <algorithm>
#include <cctype>

#include "screenrank/errors.hpp"

namespace screenrank {

void MemoryChallengeStore::EnsureUser(int user_id, const std::string& username) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = users_.find(user_id);
  if (it == users_.end()) {
    users_.emplace(user_id, UserRecord{user_id, username, 0, 0});
    return;
  }
  if (!username.empty()) {
    it->second.username = username;
  }
}

std::optional<UserRecord> MemoryChallengeStore::FindUser(int user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = users_.find(user_id);
  if (it == users_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryChallengeStore::UpdateUserCache(int user_id, int streak_count, int total_points) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = users_.find(user_id);
  if (it == users_.end()) {
    throw NotFoundError("사용자를 찾을 수 없습니다");
  }
  it->second.streak_count = streak_count;
  it->second.total_points = total_points;
}

void MemoryChallengeStore::UpsertGoal(const Goal& goal) {
  std::lock_guard<std::mutex> lock(mutex_);
  goals_[{goal.user_id, goal.goal_type}] = goal;
}

std::optional<Goal> MemoryChallengeStore::FindGoal(int user_id, GoalType type) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = goals_.find({user_id, type});
  if (it == goals_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ScreenTimeLog MemoryChallengeStore::UpsertLog(int user_id, const std::string& app_name, Date date, int minutes) {
  std::lock_guard<std::mutex> lock(mutex_);
  LogKey key{user_id, date, app_name};
  auto it = logs_.find(key);
  if (it != logs_.end()) {
    it->second.minutes = minutes;
    return it->second;
  }
  ScreenTimeLog log{next_log_id_++, user_id, app_name, date, minutes};
  logs_.emplace(key, log);
  return log;
}

std::vector<ScreenTimeLog> MemoryChallengeStore::ListLogs(int user_id, Date from, Date to) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ScreenTimeLog> result;
  auto it = logs_.lower_bound(LogKey{user_id, from, std::string()});
  for (; it != logs_.end(); ++it) {
    const auto& log = it->second;
    if (log.user_id != user_id || log.date > to) {
      break;
    }
    result.push_back(log);
  }
  return result;
}

std::vector<ScreenTimeLog> MemoryChallengeStore::ListLogsInRange(Date from, Date to) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ScreenTimeLog> result;
  for (const auto& [key, log] : logs_) {
    if (log.date >= from && log.date <= to) {
      result.push_back(log);
    }
  }
  return result;
}

std::vector<ScreenTimeLog> MemoryChallengeStore::QueryLogs(int user_id, const LogQuery& query) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ScreenTimeLog> result;
  for (const auto& [key, log] : logs_) {
    if (log.user_id != user_id) {
      continue;
    }
    if (query.date) {
      if (log.date != *query.date) {
        continue;
      }
    } else {
      if (query.start_date && log.date < *query.start_date) {
        continue;
      }
      if (query.end_date && log.date > *query.end_date) {
        continue;
      }
    }
    if (query.app_contains && !query.app_contains->empty()) {
      std::string haystack = log.app_name;
      std::string needle = *query.app_contains;
      auto lower = [](std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
      };
      if (lower(haystack).find(lower(needle)) == std::string::npos) {
        continue;
      }
    }
    result.push_back(log);
  }
  std::stable_sort(result.begin(), result.end(), [](const ScreenTimeLog& a, const ScreenTimeLog& b) {
    if (a.date != b.date) {
      return a.date > b.date;
    }
    return a.log_id > b.log_id;
  });
  if (result.size() > query.limit) {
    result.resize(query.limit);
  }
  return result;
}

Challenge MemoryChallengeStore::CreateChallenge(const NewChallenge& challenge, const std::vector<int>& invited_user_ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  Challenge created{next_challenge_id_++,
                    challenge.name,
                    challenge.description,
                    challenge.owner_id,
                    challenge.target_app,
                    challenge.target_minutes,
                    challenge.start_date,
                    challenge.end_date,
                    challenge.status,
                    challenge.created_at,
                    std::nullopt};
  challenges_.emplace(created.challenge_id, created);
  AddParticipantLocked(created.challenge_id, challenge.owner_id, InvitationStatus::kAccepted, challenge.created_at);
  for (int user_id : invited_user_ids) {
    AddParticipantLocked(created.challenge_id, user_id, InvitationStatus::kPending, challenge.created_at);
  }
  return created;
}

std::optional<Challenge> MemoryChallengeStore::FindChallenge(int challenge_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = challenges_.find(challenge_id);
  if (it == challenges_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryChallengeStore::RenameChallenge(int challenge_id, const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = challenges_.find(challenge_id);
  if (it == challenges_.end()) {
    throw NotFoundError("챌린지를 찾을 수 없습니다");
  }
  it->second.name = name;
}

bool MemoryChallengeStore::MarkDeleted(int challenge_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = challenges_.find(challenge_id);
  if (it == challenges_.end() || it->second.IsTerminal()) {
    return false;
  }
  it->second.status = ChallengeStatus::kDeleted;
  return true;
}

bool MemoryChallengeStore::FinalizeChallenge(int challenge_id, std::chrono::system_clock::time_point completed_at,
                                             const Finalizer& finalizer) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = challenges_.find(challenge_id);
  if (it == challenges_.end() || it->second.IsTerminal()) {
    return false;
  }
  std::vector<ChallengeParticipant> accepted;
  for (const auto& [id, participant] : participants_) {
    if (participant.challenge_id == challenge_id && participant.invitation_status == InvitationStatus::kAccepted) {
      accepted.push_back(participant);
    }
  }
  // 순위 계산이 실패하면 아무것도 바꾸지 않는다.
  std::vector<FinalStanding> standings = finalizer(accepted);

  for (const auto& standing : standings) {
    auto participant_it = participants_.find(standing.participant_id);
    if (participant_it == participants_.end() || participant_it->second.challenge_id != challenge_id) {
      continue;
    }
    participant_it->second.final_rank = standing.final_rank;
    participant_it->second.is_winner = standing.is_winner;
  }
  for (auto& [id, participant] : participants_) {
    if (participant.challenge_id == challenge_id) {
      participant.challenge_completed = true;
    }
  }
  it->second.status = ChallengeStatus::kCompleted;
  it->second.completed_at = completed_at;
  return true;
}

std::optional<ChallengeParticipant> MemoryChallengeStore::FindParticipant(int challenge_id, int user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* participant = FindParticipantLocked(challenge_id, user_id);
  if (!participant) {
    return std::nullopt;
  }
  return *participant;
}

std::optional<ChallengeParticipant> MemoryChallengeStore::FindParticipantById(int participant_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = participants_.find(participant_id);
  if (it == participants_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<ChallengeParticipant> MemoryChallengeStore::ListParticipants(int challenge_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ChallengeParticipant> result;
  for (const auto& [id, participant] : participants_) {
    if (participant.challenge_id == challenge_id) {
      result.push_back(participant);
    }
  }
  return result;
}

std::vector<ChallengeParticipant> MemoryChallengeStore::ListParticipationsForUser(int user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ChallengeParticipant> result;
  for (const auto& [id, participant] : participants_) {
    if (participant.user_id == user_id) {
      result.push_back(participant);
    }
  }
  return result;
}

bool MemoryChallengeStore::AddParticipant(int challenge_id, int user_id, InvitationStatus status,
                                          std::chrono::system_clock::time_point joined_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (challenges_.count(challenge_id) == 0) {
    throw NotFoundError("챌린지를 찾을 수 없습니다");
  }
  return AddParticipantLocked(challenge_id, user_id, status, joined_at);
}

bool MemoryChallengeStore::RemoveParticipant(int participant_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return participants_.erase(participant_id) > 0;
}

bool MemoryChallengeStore::UpdateInvitation(int participant_id, InvitationStatus from, InvitationStatus to) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = participants_.find(participant_id);
  if (it == participants_.end() || it->second.invitation_status != from) {
    return false;
  }
  it->second.invitation_status = to;
  return true;
}

std::optional<ParticipantStats> MemoryChallengeStore::UpdateParticipantStats(int challenge_id, int user_id,
                                                                             const StatsComputer& compute) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto challenge_it = challenges_.find(challenge_id);
  if (challenge_it == challenges_.end()) {
    return std::nullopt;
  }
  auto* participant = FindParticipantLocked(challenge_id, user_id);
  if (!participant || participant->invitation_status != InvitationStatus::kAccepted) {
    return std::nullopt;
  }
  const Challenge& challenge = challenge_it->second;
  std::vector<ScreenTimeLog> logs;
  auto it = logs_.lower_bound(LogKey{user_id, challenge.start_date, std::string()});
  for (; it != logs_.end(); ++it) {
    if (it->second.user_id != user_id || it->second.date > challenge.end_date) {
      break;
    }
    logs.push_back(it->second);
  }
  ParticipantStats stats = compute(challenge, logs);
  participant->stats = stats;
  return stats;
}

bool MemoryChallengeStore::AddParticipantLocked(int challenge_id, int user_id, InvitationStatus status,
                                                std::chrono::system_clock::time_point joined_at) {
  if (FindParticipantLocked(challenge_id, user_id)) {
    return false;
  }
  ChallengeParticipant participant{};
  participant.participant_id = next_participant_id_++;
  participant.challenge_id = challenge_id;
  participant.user_id = user_id;
  participant.invitation_status = status;
  participant.joined_at = joined_at;
  participants_.emplace(participant.participant_id, participant);
  return true;
}

ChallengeParticipant* MemoryChallengeStore::FindParticipantLocked(int challenge_id, int user_id) {
  for (auto& [id, participant] : participants_) {
    if (participant.challenge_id == challenge_id && participant.user_id == user_id) {
      return &participant;
    }
  }
  return nullptr;
}

}  // namespace screenrank
