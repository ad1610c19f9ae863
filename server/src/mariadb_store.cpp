/*
 * 설명: MariaDB 저장소 구현. 통계 갱신은 참가 행을 FOR UPDATE로 잠근 뒤 로그를 읽어 계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/it/mariadb_store_it_test.cpp
 */
#include "screenrank/mariadb_store.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "screenrank/errors.hpp"

namespace screenrank {
namespace {
constexpr unsigned int kDuplicateEntry = 1062;

constexpr const char* kChallengeColumns =
    "challenge_id, name, description, owner_id, target_app, target_minutes, start_date, end_date, status, "
    "created_at, completed_at";
constexpr const char* kParticipantColumns =
    "participant_id, challenge_id, user_id, invitation_status, joined_at, days_logged, total_screen_time_minutes, "
    "days_passed, days_failed, today_minutes, today_passed, final_rank, is_winner, challenge_completed";
constexpr const char* kLogColumns = "log_id, user_id, app_name, log_date, minutes";

int ToInt(const char* value) { return value ? std::stoi(value) : 0; }

Date ToDate(const char* value) {
  auto parsed = Date::Parse(value ? value : "");
  if (!parsed) {
    throw DbException(std::string("날짜 컬럼 해석 실패: ") + (value ? value : "NULL"), 0, false);
  }
  return *parsed;
}

std::chrono::system_clock::time_point ParseTimestamp(const std::string& text) {
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::string Quote(const std::string& escaped) { return "'" + escaped + "'"; }

std::string BoolSql(bool value) { return value ? "1" : "0"; }

std::string OptionalIntSql(const std::optional<int>& value) { return value ? std::to_string(*value) : "NULL"; }

std::string OptionalBoolSql(const std::optional<bool>& value) { return value ? BoolSql(*value) : "NULL"; }

// LIKE 패턴의 와일드카드를 문자 그대로 취급하도록 바꾼다. 이미 이스케이프된 문자열을 받는다.
std::string EscapeLikeWildcards(const std::string& escaped) {
  std::string result;
  result.reserve(escaped.size());
  for (char c : escaped) {
    if (c == '%' || c == '_') {
      result.push_back('\\');
    }
    result.push_back(c);
  }
  return result;
}
}  // namespace

MariaDbChallengeStore::MariaDbChallengeStore(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

void MariaDbChallengeStore::EnsureUser(int user_id, const std::string& username) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO users(user_id, username, streak_count, total_points, updated_at) VALUES(" << user_id << ", "
        << Quote(db_client_->Escape(conn, username))
        << ", 0, 0, NOW(6)) ON DUPLICATE KEY UPDATE username=IF(VALUES(username)='', username, VALUES(username)), "
           "updated_at=NOW(6);";
    db_client_->Execute(conn, oss.str(), "사용자 등록 실패");
  });
}

std::optional<UserRecord> MariaDbChallengeStore::FindUser(int user_id) {
  std::optional<UserRecord> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT user_id, username, streak_count, total_points FROM users WHERE user_id=" << user_id << ";";
    db_client_->ForEachRow(conn, oss.str(), "사용자", [&](MYSQL_ROW row) {
      result = UserRecord{ToInt(row[0]), row[1] ? row[1] : "", ToInt(row[2]), ToInt(row[3])};
    });
  });
  return result;
}

void MariaDbChallengeStore::UpdateUserCache(int user_id, int streak_count, int total_points) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    bool exists = false;
    std::ostringstream find;
    find << "SELECT 1 FROM users WHERE user_id=" << user_id << ";";
    db_client_->ForEachRow(conn, find.str(), "사용자", [&](MYSQL_ROW) { exists = true; });
    if (!exists) {
      throw NotFoundError("사용자를 찾을 수 없습니다");
    }
    std::ostringstream oss;
    oss << "UPDATE users SET streak_count=" << streak_count << ", total_points=" << total_points
        << ", updated_at=NOW(6) WHERE user_id=" << user_id << ";";
    db_client_->Execute(conn, oss.str(), "사용자 캐시 갱신 실패");
  });
}

void MariaDbChallengeStore::UpsertGoal(const Goal& goal) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO goals(user_id, goal_type, target_minutes) VALUES(" << goal.user_id << ", '"
        << ToString(goal.goal_type) << "', " << goal.target_minutes
        << ") ON DUPLICATE KEY UPDATE target_minutes=VALUES(target_minutes);";
    db_client_->Execute(conn, oss.str(), "목표 저장 실패");
  });
}

std::optional<Goal> MariaDbChallengeStore::FindGoal(int user_id, GoalType type) {
  std::optional<Goal> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT target_minutes FROM goals WHERE user_id=" << user_id << " AND goal_type='" << ToString(type)
        << "';";
    db_client_->ForEachRow(conn, oss.str(), "목표",
                           [&](MYSQL_ROW row) { result = Goal{user_id, type, ToInt(row[0])}; });
  });
  return result;
}

ScreenTimeLog MariaDbChallengeStore::UpsertLog(int user_id, const std::string& app_name, Date date, int minutes) {
  std::optional<ScreenTimeLog> stored;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::string escaped_app = db_client_->Escape(conn, app_name);
    std::ostringstream oss;
    oss << "INSERT INTO screen_time_logs(user_id, app_name, log_date, minutes, created_at, updated_at) VALUES("
        << user_id << ", " << Quote(escaped_app) << ", '" << date.ToString() << "', " << minutes
        << ", NOW(6), NOW(6)) ON DUPLICATE KEY UPDATE minutes=VALUES(minutes), updated_at=NOW(6);";
    db_client_->Execute(conn, oss.str(), "로그 저장 실패");

    std::ostringstream select;
    select << "WHERE user_id=" << user_id << " AND app_name=" << Quote(escaped_app) << " AND log_date='"
           << date.ToString() << "'";
    auto rows = QueryLogRows(conn, select.str());
    if (rows.empty()) {
      throw DbException("저장한 로그를 다시 읽지 못했습니다", 0, false);
    }
    stored = rows.front();
    return true;
  });
  return *stored;
}

std::vector<ScreenTimeLog> MariaDbChallengeStore::ListLogs(int user_id, Date from, Date to) {
  std::vector<ScreenTimeLog> logs;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "WHERE user_id=" << user_id << " AND log_date BETWEEN '" << from.ToString() << "' AND '" << to.ToString()
        << "' ORDER BY log_date, app_name";
    logs = QueryLogRows(conn, oss.str());
  });
  return logs;
}

std::vector<ScreenTimeLog> MariaDbChallengeStore::ListLogsInRange(Date from, Date to) {
  std::vector<ScreenTimeLog> logs;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "WHERE log_date BETWEEN '" << from.ToString() << "' AND '" << to.ToString()
        << "' ORDER BY user_id, log_date, app_name";
    logs = QueryLogRows(conn, oss.str());
  });
  return logs;
}

std::vector<ScreenTimeLog> MariaDbChallengeStore::QueryLogs(int user_id, const LogQuery& query) {
  std::vector<ScreenTimeLog> logs;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "WHERE user_id=" << user_id;
    if (query.date) {
      oss << " AND log_date='" << query.date->ToString() << "'";
    } else {
      if (query.start_date) {
        oss << " AND log_date>='" << query.start_date->ToString() << "'";
      }
      if (query.end_date) {
        oss << " AND log_date<='" << query.end_date->ToString() << "'";
      }
    }
    if (query.app_contains && !query.app_contains->empty()) {
      oss << " AND app_name LIKE '%" << EscapeLikeWildcards(db_client_->Escape(conn, *query.app_contains)) << "%'";
    }
    oss << " ORDER BY log_date DESC, log_id DESC LIMIT " << query.limit;
    logs = QueryLogRows(conn, oss.str());
  });
  return logs;
}

Challenge MariaDbChallengeStore::CreateChallenge(const NewChallenge& challenge,
                                                 const std::vector<int>& invited_user_ids) {
  int challenge_id = 0;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::string target_sql = "NULL";
    if (const auto* app = std::get_if<SpecificApp>(&challenge.target_app)) {
      target_sql = Quote(db_client_->Escape(conn, app->name));
    }
    std::string description_sql =
        challenge.description ? Quote(db_client_->Escape(conn, *challenge.description)) : "NULL";
    std::ostringstream oss;
    oss << "INSERT INTO challenges(name, description, owner_id, target_app, target_minutes, start_date, end_date, "
           "status, created_at) VALUES("
        << Quote(db_client_->Escape(conn, challenge.name)) << ", " << description_sql << ", " << challenge.owner_id
        << ", " << target_sql << ", " << challenge.target_minutes << ", '" << challenge.start_date.ToString() << "', '"
        << challenge.end_date.ToString() << "', '" << ToString(challenge.status) << "', '"
        << ToTimestamp(challenge.created_at) << "');";
    db_client_->Execute(conn, oss.str(), "챌린지 저장 실패");
    challenge_id = static_cast<int>(mysql_insert_id(conn));

    InsertParticipantInTx(conn, challenge_id, challenge.owner_id, InvitationStatus::kAccepted, challenge.created_at);
    for (int user_id : invited_user_ids) {
      InsertParticipantInTx(conn, challenge_id, user_id, InvitationStatus::kPending, challenge.created_at);
    }
    return true;
  });
  return Challenge{challenge_id,
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
}

std::optional<Challenge> MariaDbChallengeStore::FindChallenge(int challenge_id) {
  std::optional<Challenge> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) { result = FindChallengeInTx(conn, challenge_id, false); });
  return result;
}

void MariaDbChallengeStore::RenameChallenge(int challenge_id, const std::string& name) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    if (!FindChallengeInTx(conn, challenge_id, false)) {
      throw NotFoundError("챌린지를 찾을 수 없습니다");
    }
    std::ostringstream oss;
    oss << "UPDATE challenges SET name=" << Quote(db_client_->Escape(conn, name))
        << " WHERE challenge_id=" << challenge_id << ";";
    db_client_->Execute(conn, oss.str(), "챌린지 이름 변경 실패");
  });
}

bool MariaDbChallengeStore::MarkDeleted(int challenge_id) {
  bool changed = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE challenges SET status='deleted' WHERE challenge_id=" << challenge_id
        << " AND status IN ('upcoming', 'active');";
    changed = db_client_->Execute(conn, oss.str(), "챌린지 삭제 실패") > 0;
  });
  return changed;
}

bool MariaDbChallengeStore::FinalizeChallenge(int challenge_id, std::chrono::system_clock::time_point completed_at,
                                              const Finalizer& finalizer) {
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    auto challenge = FindChallengeInTx(conn, challenge_id, true);
    if (!challenge || challenge->IsTerminal()) {
      return false;
    }
    std::ostringstream where;
    where << "WHERE challenge_id=" << challenge_id << " ORDER BY participant_id FOR UPDATE";
    auto participants = QueryParticipants(conn, where.str());
    std::vector<ChallengeParticipant> accepted;
    for (const auto& participant : participants) {
      if (participant.invitation_status == InvitationStatus::kAccepted) {
        accepted.push_back(participant);
      }
    }
    std::vector<FinalStanding> standings = finalizer(accepted);

    for (const auto& standing : standings) {
      std::ostringstream oss;
      oss << "UPDATE challenge_participants SET final_rank=" << OptionalIntSql(standing.final_rank)
          << ", is_winner=" << BoolSql(standing.is_winner) << " WHERE participant_id=" << standing.participant_id
          << " AND challenge_id=" << challenge_id << ";";
      db_client_->Execute(conn, oss.str(), "최종 순위 저장 실패");
    }
    std::ostringstream completed;
    completed << "UPDATE challenge_participants SET challenge_completed=1 WHERE challenge_id=" << challenge_id << ";";
    db_client_->Execute(conn, completed.str(), "참가자 종료 표시 실패");

    std::ostringstream status;
    status << "UPDATE challenges SET status='completed', completed_at='" << ToTimestamp(completed_at)
           << "' WHERE challenge_id=" << challenge_id << ";";
    db_client_->Execute(conn, status.str(), "챌린지 종료 실패");
    return true;
  });
}

std::optional<ChallengeParticipant> MariaDbChallengeStore::FindParticipant(int challenge_id, int user_id) {
  std::optional<ChallengeParticipant> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream where;
    where << "WHERE challenge_id=" << challenge_id << " AND user_id=" << user_id;
    auto rows = QueryParticipants(conn, where.str());
    result = rows.empty() ? std::nullopt : std::optional<ChallengeParticipant>(rows.front());
  });
  return result;
}

std::optional<ChallengeParticipant> MariaDbChallengeStore::FindParticipantById(int participant_id) {
  std::optional<ChallengeParticipant> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream where;
    where << "WHERE participant_id=" << participant_id;
    auto rows = QueryParticipants(conn, where.str());
    result = rows.empty() ? std::nullopt : std::optional<ChallengeParticipant>(rows.front());
  });
  return result;
}

std::vector<ChallengeParticipant> MariaDbChallengeStore::ListParticipants(int challenge_id) {
  std::vector<ChallengeParticipant> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream where;
    where << "WHERE challenge_id=" << challenge_id << " ORDER BY participant_id";
    result = QueryParticipants(conn, where.str());
  });
  return result;
}

std::vector<ChallengeParticipant> MariaDbChallengeStore::ListParticipationsForUser(int user_id) {
  std::vector<ChallengeParticipant> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream where;
    where << "WHERE user_id=" << user_id << " ORDER BY participant_id";
    result = QueryParticipants(conn, where.str());
  });
  return result;
}

bool MariaDbChallengeStore::AddParticipant(int challenge_id, int user_id, InvitationStatus status,
                                           std::chrono::system_clock::time_point joined_at) {
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    if (!FindChallengeInTx(conn, challenge_id, false)) {
      throw NotFoundError("챌린지를 찾을 수 없습니다");
    }
    return InsertParticipantInTx(conn, challenge_id, user_id, status, joined_at);
  });
}

bool MariaDbChallengeStore::RemoveParticipant(int participant_id) {
  bool removed = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "DELETE FROM challenge_participants WHERE participant_id=" << participant_id << ";";
    removed = db_client_->Execute(conn, oss.str(), "참가자 삭제 실패") > 0;
  });
  return removed;
}

bool MariaDbChallengeStore::UpdateInvitation(int participant_id, InvitationStatus from, InvitationStatus to) {
  bool changed = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE challenge_participants SET invitation_status='" << ToString(to)
        << "' WHERE participant_id=" << participant_id << " AND invitation_status='" << ToString(from) << "';";
    changed = db_client_->Execute(conn, oss.str(), "초대 상태 변경 실패") > 0;
  });
  return changed;
}

std::optional<ParticipantStats> MariaDbChallengeStore::UpdateParticipantStats(int challenge_id, int user_id,
                                                                              const StatsComputer& compute) {
  std::optional<ParticipantStats> result;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    result.reset();
    auto challenge = FindChallengeInTx(conn, challenge_id, false);
    if (!challenge) {
      return false;
    }
    std::ostringstream where;
    where << "WHERE challenge_id=" << challenge_id << " AND user_id=" << user_id << " FOR UPDATE";
    auto participants = QueryParticipants(conn, where.str());
    if (participants.empty() || participants.front().invitation_status != InvitationStatus::kAccepted) {
      return false;
    }
    std::ostringstream log_where;
    log_where << "WHERE user_id=" << user_id << " AND log_date BETWEEN '" << challenge->start_date.ToString()
              << "' AND '" << challenge->end_date.ToString() << "' ORDER BY log_date, app_name LOCK IN SHARE MODE";
    auto logs = QueryLogRows(conn, log_where.str());
    ParticipantStats stats = compute(*challenge, logs);

    std::ostringstream oss;
    oss << "UPDATE challenge_participants SET days_logged=" << stats.days_logged
        << ", total_screen_time_minutes=" << stats.total_screen_time_minutes << ", days_passed=" << stats.days_passed
        << ", days_failed=" << stats.days_failed << ", today_minutes=" << stats.today_minutes
        << ", today_passed=" << OptionalBoolSql(stats.today_passed)
        << " WHERE participant_id=" << participants.front().participant_id << ";";
    db_client_->Execute(conn, oss.str(), "참가자 통계 저장 실패");
    result = stats;
    return true;
  });
  return result;
}

void MariaDbChallengeStore::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "DELETE FROM challenge_participants;", "참가자 정리 실패");
    db_client_->Execute(conn, "DELETE FROM challenges;", "챌린지 정리 실패");
    db_client_->Execute(conn, "DELETE FROM screen_time_logs;", "로그 정리 실패");
    db_client_->Execute(conn, "DELETE FROM goals;", "목표 정리 실패");
    db_client_->Execute(conn, "DELETE FROM users;", "사용자 정리 실패");
  });
}

bool MariaDbChallengeStore::InsertParticipantInTx(MYSQL* conn, int challenge_id, int user_id,
                                                  InvitationStatus status,
                                                  std::chrono::system_clock::time_point joined_at) {
  std::ostringstream oss;
  oss << "INSERT INTO challenge_participants(challenge_id, user_id, invitation_status, joined_at) VALUES("
      << challenge_id << ", " << user_id << ", '" << ToString(status) << "', '" << ToTimestamp(joined_at) << "');";
  if (mysql_query(conn, oss.str().c_str()) != 0) {
    if (mysql_errno(conn) == kDuplicateEntry) {
      return false;
    }
    db_client_->RaiseError(conn, "참가자 저장 실패");
  }
  return true;
}

std::optional<Challenge> MariaDbChallengeStore::FindChallengeInTx(MYSQL* conn, int challenge_id, bool for_update) {
  std::optional<Challenge> result;
  std::ostringstream oss;
  oss << "SELECT " << kChallengeColumns << " FROM challenges WHERE challenge_id=" << challenge_id
      << (for_update ? " FOR UPDATE;" : ";");
  db_client_->ForEachRow(conn, oss.str(), "챌린지", [&](MYSQL_ROW row) { result = BuildChallenge(row); });
  return result;
}

std::vector<ChallengeParticipant> MariaDbChallengeStore::QueryParticipants(MYSQL* conn,
                                                                           const std::string& where_clause) {
  std::vector<ChallengeParticipant> result;
  std::ostringstream oss;
  oss << "SELECT " << kParticipantColumns << " FROM challenge_participants " << where_clause << ";";
  db_client_->ForEachRow(conn, oss.str(), "참가자", [&](MYSQL_ROW row) { result.push_back(BuildParticipant(row)); });
  return result;
}

std::vector<ScreenTimeLog> MariaDbChallengeStore::QueryLogRows(MYSQL* conn, const std::string& tail) {
  std::vector<ScreenTimeLog> result;
  std::ostringstream oss;
  oss << "SELECT " << kLogColumns << " FROM screen_time_logs " << tail << ";";
  db_client_->ForEachRow(conn, oss.str(), "로그", [&](MYSQL_ROW row) { result.push_back(BuildLog(row)); });
  return result;
}

Challenge MariaDbChallengeStore::BuildChallenge(MYSQL_ROW row) const {
  auto status = ParseChallengeStatus(row[8] ? row[8] : "");
  if (!status) {
    throw DbException(std::string("알 수 없는 챌린지 상태: ") + (row[8] ? row[8] : "NULL"), 0, false);
  }
  TargetApp target = AllApps{};
  if (row[4]) {
    target = SpecificApp{row[4]};
  }
  std::optional<std::string> description;
  if (row[2]) {
    description = std::string(row[2]);
  }
  std::optional<std::chrono::system_clock::time_point> completed_at;
  if (row[10]) {
    completed_at = ParseTimestamp(row[10]);
  }
  return Challenge{ToInt(row[0]),
                   row[1] ? row[1] : "",
                   description,
                   ToInt(row[3]),
                   target,
                   ToInt(row[5]),
                   ToDate(row[6]),
                   ToDate(row[7]),
                   *status,
                   ParseTimestamp(row[9] ? row[9] : "1970-01-01 00:00:00"),
                   completed_at};
}

ChallengeParticipant MariaDbChallengeStore::BuildParticipant(MYSQL_ROW row) const {
  auto invitation = ParseInvitationStatus(row[3] ? row[3] : "");
  if (!invitation) {
    throw DbException(std::string("알 수 없는 초대 상태: ") + (row[3] ? row[3] : "NULL"), 0, false);
  }
  ChallengeParticipant participant{};
  participant.participant_id = ToInt(row[0]);
  participant.challenge_id = ToInt(row[1]);
  participant.user_id = ToInt(row[2]);
  participant.invitation_status = *invitation;
  participant.joined_at = ParseTimestamp(row[4] ? row[4] : "1970-01-01 00:00:00");
  participant.stats.days_logged = ToInt(row[5]);
  participant.stats.total_screen_time_minutes = ToInt(row[6]);
  participant.stats.days_passed = ToInt(row[7]);
  participant.stats.days_failed = ToInt(row[8]);
  participant.stats.today_minutes = ToInt(row[9]);
  if (row[10]) {
    participant.stats.today_passed = ToInt(row[10]) != 0;
  }
  if (row[11]) {
    participant.final_rank = ToInt(row[11]);
  }
  participant.is_winner = ToInt(row[12]) != 0;
  participant.challenge_completed = ToInt(row[13]) != 0;
  return participant;
}

ScreenTimeLog MariaDbChallengeStore::BuildLog(MYSQL_ROW row) const {
  return ScreenTimeLog{ToInt(row[0]), ToInt(row[1]), row[2] ? row[2] : "", ToDate(row[3]), ToInt(row[4])};
}

std::string MariaDbChallengeStore::ToTimestamp(const std::chrono::system_clock::time_point& tp) const {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

}  // namespace screenrank
