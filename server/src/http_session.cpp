/*
 * 설명: HTTP 요청을 처리하고 스크린타임/챌린지/초대/리더보드 경로로 분기한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/challenge_flow_test.cpp
 */
#include "screenrank/http_session.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include <boost/beast/version.hpp>

#include "screenrank/api_response.hpp"
#include "screenrank/app_catalog.hpp"
#include "screenrank/db_client.hpp"
#include "screenrank/errors.hpp"
#include "screenrank/screen_time_service.hpp"

namespace screenrank {

namespace {
class UnauthorizedError : public std::runtime_error {
 public:
  UnauthorizedError() : std::runtime_error("X-User-Id 헤더가 필요합니다") {}
};

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string PercentDecode(const std::string& value) {
  std::string decoded;
  decoded.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '+') {
      decoded.push_back(' ');
    } else if (value[i] == '%' && i + 2 < value.size() && HexValue(value[i + 1]) >= 0 &&
               HexValue(value[i + 2]) >= 0) {
      decoded.push_back(static_cast<char>(HexValue(value[i + 1]) * 16 + HexValue(value[i + 2])));
      i += 2;
    } else {
      decoded.push_back(value[i]);
    }
  }
  return decoded;
}

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(PercentDecode(pair.substr(0, eq)), PercentDecode(pair.substr(eq + 1)));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> segments;
  std::size_t pos = 0;
  while (pos <= path.size()) {
    auto slash = path.find('/', pos);
    std::string segment = path.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
    if (!segment.empty()) {
      segments.push_back(segment);
    }
    if (slash == std::string::npos) {
      break;
    }
    pos = slash + 1;
  }
  return segments;
}

std::optional<int> ParseInt(const std::string& value) {
  try {
    std::size_t idx = 0;
    int parsed = std::stoi(value, &idx);
    if (idx != value.size()) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

int ParseId(const std::string& value) {
  auto parsed = ParseInt(value);
  if (!parsed || *parsed <= 0) {
    throw ValidationError("bad_request", "ID 형식이 올바르지 않습니다: " + value);
  }
  return *parsed;
}

Date ParseDateValue(const std::string& value, const std::string& field) {
  auto parsed = Date::Parse(value);
  if (!parsed) {
    throw ValidationError("bad_request", field + "는 YYYY-MM-DD 형식이어야 합니다");
  }
  return *parsed;
}

std::optional<Date> OptionalDateParam(const std::unordered_map<std::string, std::string>& params,
                                      const std::string& key) {
  auto it = params.find(key);
  if (it == params.end() || it->second.empty()) {
    return std::nullopt;
  }
  return ParseDateValue(it->second, key);
}

const nlohmann::json& RequireField(const nlohmann::json& body, const std::string& key) {
  if (!body.contains(key) || body[key].is_null()) {
    throw ValidationError("bad_request", key + " 필드가 필요합니다");
  }
  return body[key];
}

std::string RequireString(const nlohmann::json& body, const std::string& key) {
  const auto& value = RequireField(body, key);
  if (!value.is_string()) {
    throw ValidationError("bad_request", key + " 필드는 문자열이어야 합니다");
  }
  return value.get<std::string>();
}

// JSON 정수를 int64로 읽고 int 범위를 확인한 뒤 좁힌다.
int NarrowInt(const nlohmann::json& value, const std::string& key) {
  if (value.is_number_unsigned()) {
    if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      throw ValidationError("bad_request", key + " 필드가 허용 범위를 벗어났습니다");
    }
    return static_cast<int>(value.get<std::uint64_t>());
  }
  auto wide = value.get<std::int64_t>();
  if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
    throw ValidationError("bad_request", key + " 필드가 허용 범위를 벗어났습니다");
  }
  return static_cast<int>(wide);
}

int RequireInt(const nlohmann::json& body, const std::string& key) {
  const auto& value = RequireField(body, key);
  if (!value.is_number_integer()) {
    throw ValidationError("bad_request", key + " 필드는 정수여야 합니다");
  }
  return NarrowInt(value, key);
}

// hours와 minutes를 합친 분. int로 좁히기 전에 하루 범위를 확인한다.
int CombineDuration(const nlohmann::json& body, bool has_hours, bool has_minutes) {
  double total = 0.0;
  if (has_hours) {
    if (!body["hours"].is_number()) {
      throw ValidationError("bad_request", "hours 필드는 숫자여야 합니다");
    }
    double hours = body["hours"].get<double>();
    if (!std::isfinite(hours) || hours < 0.0 || hours * 60.0 > static_cast<double>(kMaxMinutesPerDay)) {
      throw ValidationError("bad_request", "hours는 0 이상 24 이하여야 합니다");
    }
    total += std::round(hours * 60.0);
  }
  if (has_minutes) {
    total += static_cast<double>(RequireInt(body, "minutes"));
  }
  if (total < 0.0 || total > static_cast<double>(kMaxMinutesPerDay)) {
    throw ValidationError("bad_request", "minutes는 0 이상 1440 이하여야 합니다");
  }
  return static_cast<int>(total);
}

std::vector<int> OptionalIdList(const nlohmann::json& body, const std::string& key) {
  std::vector<int> ids;
  if (!body.contains(key) || body[key].is_null()) {
    return ids;
  }
  if (!body[key].is_array()) {
    throw ValidationError("bad_request", key + " 필드는 정수 배열이어야 합니다");
  }
  for (const auto& item : body[key]) {
    if (!item.is_number_integer()) {
      throw ValidationError("bad_request", key + " 필드는 정수 배열이어야 합니다");
    }
    ids.push_back(NarrowInt(item, key));
  }
  return ids;
}

void Reply(HttpSession::Response& res, boost::beast::http::status status, const nlohmann::json& envelope) {
  res.result(status);
  res.body() = envelope.dump();
  res.content_length(res.body().size());
}

nlohmann::json ViewsToJson(const std::vector<ChallengeView>& views) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto& view : views) {
    items.push_back(ToJson(view));
  }
  return items;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<Services> services)
    : stream_(std::move(socket)), services_(std::move(services)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) { self->OnRead(ec, bytes_transferred); });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = services_->observability->NextTraceId();
  services_->observability->IncrementRequest();
  user_id_.reset();

  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "screenrank");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  try {
    Dispatch(path, query, *res);
  } catch (const UnauthorizedError& ex) {
    Reply(*res, http::status::unauthorized, MakeErrorEnvelope("unauthorized", ex.what()));
  } catch (const ValidationError& ex) {
    Reply(*res, http::status::bad_request, MakeErrorEnvelope(ex.code, ex.what()));
  } catch (const NotFoundError& ex) {
    Reply(*res, http::status::not_found, MakeErrorEnvelope("not_found", ex.what()));
  } catch (const nlohmann::json::exception&) {
    Reply(*res, http::status::bad_request, MakeErrorEnvelope("bad_request", "JSON 본문이 올바르지 않습니다"));
  } catch (const DbException& ex) {
    services_->observability->LogEvent("db_failure", LogLevel::kError, user_id_,
                                       nlohmann::json{{"code", ex.code}, {"retryable", ex.retryable},
                                                      {"error", ex.what()}});
    Reply(*res, http::status::internal_server_error,
          MakeErrorEnvelope("internal_error", "저장소 오류가 발생했습니다"));
  } catch (const std::exception& ex) {
    services_->observability->LogEvent("request_failure", LogLevel::kError, user_id_,
                                       nlohmann::json{{"error", ex.what()}});
    Reply(*res, http::status::internal_server_error, MakeErrorEnvelope("internal_error", "서버 오류가 발생했습니다"));
  }
  SendResponse(res);
}

void HttpSession::Dispatch(const std::string& path, const std::string& query, Response& res) {
  using namespace boost::beast;
  const auto method = req_.method();

  if (method == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (method == http::verb::get && path == "/metrics") {
    auto snapshot = services_->observability->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"logs", {{"written", snapshot.logs_written}}},
                        {"aggregation", {{"failures", snapshot.aggregation_failures}}},
                        {"finalization",
                         {{"completed", snapshot.challenges_finalized}, {"failures", snapshot.finalization_failures}}},
                        {"achievements", {{"failures", snapshot.achievement_failures}}}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (method == http::verb::get && path == "/api/screen-time/apps") {
    return Reply(res, http::status::ok, MakeSuccessEnvelope(services_->screen_time->AllowedApps()));
  }

  if (path == "/api/screen-time") {
    int user_id = RequireUser();
    if (method == http::verb::post) {
      auto body = ParseBody();
      std::string app_name;
      if (body.contains("app_name") && !body["app_name"].is_null()) {
        app_name = RequireString(body, "app_name");
      }
      bool has_hours = body.contains("hours") && !body["hours"].is_null();
      bool has_minutes = body.contains("minutes") && !body["minutes"].is_null();
      if (!has_hours && !has_minutes) {
        throw ValidationError("bad_request", "hours 또는 minutes가 필요합니다");
      }
      int minutes = CombineDuration(body, has_hours, has_minutes);
      std::optional<Date> date;
      if (body.contains("date") && !body["date"].is_null()) {
        date = ParseDateValue(RequireString(body, "date"), "date");
      }
      auto result = services_->screen_time->LogScreenTime(user_id, app_name, date, minutes);
      nlohmann::json data{{"entry", ToJson(result.log)}, {"challengesUpdated", result.challenges_updated}};
      return Reply(res, http::status::created, MakeSuccessEnvelope(data));
    }
    if (method == http::verb::get) {
      auto params = ParseQueryParams(query);
      EntryFilter filter;
      filter.date = OptionalDateParam(params, "date");
      filter.start_date = OptionalDateParam(params, "start_date");
      filter.end_date = OptionalDateParam(params, "end_date");
      if (auto it = params.find("app_name"); it != params.end() && !it->second.empty()) {
        filter.app_name = it->second;
      }
      if (auto it = params.find("limit"); it != params.end()) {
        auto limit = ParseInt(it->second);
        if (!limit) {
          throw ValidationError("bad_request", "limit은 정수여야 합니다");
        }
        filter.limit = *limit;
      }
      nlohmann::json entries = nlohmann::json::array();
      for (const auto& log : services_->screen_time->ListEntries(user_id, filter)) {
        entries.push_back(ToJson(log));
      }
      return Reply(res, http::status::ok, MakeSuccessEnvelope(nlohmann::json{{"entries", entries}}));
    }
  }

  if (method == http::verb::get && path == "/api/leaderboard") {
    auto params = ParseQueryParams(query);
    int limit = services_->config.leaderboard_default_limit;
    if (auto it = params.find("limit"); it != params.end()) {
      auto parsed = ParseInt(it->second);
      if (!parsed) {
        throw ValidationError("leaderboard_range", "limit은 정수여야 합니다");
      }
      limit = *parsed;
    }
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : services_->leaderboard->GlobalLeaderboard(limit)) {
      entries.push_back(ToJson(entry));
    }
    return Reply(res, http::status::ok, MakeSuccessEnvelope(nlohmann::json{{"limit", limit}, {"entries", entries}}));
  }

  if (method == http::verb::get && path == "/api/users/me/stats") {
    int user_id = RequireUser();
    auto month = services_->leaderboard->CurrentMonth();
    auto stats = services_->leaderboard->MonthlyStats(user_id);
    nlohmann::json data{{"monthStart", month.first.ToString()},
                        {"monthEnd", month.second.ToString()},
                        {"stats", stats ? ToJson(*stats) : nlohmann::json(nullptr)}};
    return Reply(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (method == http::verb::post && path == "/api/users/me/refresh") {
    int user_id = RequireUser();
    auto stats = services_->gamification->Refresh(user_id);
    if (!stats) {
      throw NotFoundError("사용자를 찾을 수 없습니다");
    }
    return Reply(res, http::status::ok, MakeSuccessEnvelope(ToJson(*stats)));
  }

  auto segments = SplitPath(path);
  if (segments.size() >= 2 && segments[0] == "api" && segments[1] == "challenges") {
    return HandleChallengeRoute(segments, res);
  }

  if (method == http::verb::post && segments.size() == 4 && segments[0] == "api" && segments[1] == "invitations" &&
      segments[3] == "respond") {
    int user_id = RequireUser();
    int participant_id = ParseId(segments[2]);
    auto body = ParseBody();
    const auto& accept = RequireField(body, "accept");
    if (!accept.is_boolean()) {
      throw ValidationError("bad_request", "accept 필드는 불리언이어야 합니다");
    }
    auto participant = services_->challenges->RespondToInvitation(participant_id, user_id, accept.get<bool>());
    return Reply(res, http::status::ok, MakeSuccessEnvelope(ToJson(participant)));
  }

  Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::HandleChallengeRoute(const std::vector<std::string>& segments, Response& res) {
  using namespace boost::beast;
  const auto method = req_.method();
  int user_id = RequireUser();
  auto& challenges = *services_->challenges;

  if (segments.size() == 2) {
    if (method == http::verb::post) {
      auto body = ParseBody();
      auto target = ParseTargetApp(RequireString(body, "target_app"));
      if (!target) {
        throw ValidationError("unknown_app", "target_app이 올바르지 않습니다");
      }
      CreateChallengeInput input{RequireString(body, "name"),
                                 std::nullopt,
                                 user_id,
                                 *target,
                                 RequireInt(body, "target_minutes"),
                                 ParseDateValue(RequireString(body, "start_date"), "start_date"),
                                 ParseDateValue(RequireString(body, "end_date"), "end_date"),
                                 OptionalIdList(body, "invited_user_ids")};
      if (body.contains("description") && !body["description"].is_null()) {
        input.description = RequireString(body, "description");
      }
      return Reply(res, http::status::created, MakeSuccessEnvelope(ToJson(challenges.CreateChallenge(input))));
    }
    if (method == http::verb::get) {
      return Reply(res, http::status::ok,
                   MakeSuccessEnvelope(nlohmann::json{{"challenges", ViewsToJson(challenges.ListChallenges(user_id))}}));
    }
  }

  if (segments.size() == 3) {
    int challenge_id = ParseId(segments[2]);
    if (method == http::verb::get) {
      return Reply(res, http::status::ok, MakeSuccessEnvelope(ToJson(challenges.GetChallenge(challenge_id, user_id))));
    }
    if (method == http::verb::patch) {
      auto body = ParseBody();
      auto view = challenges.RenameChallenge(challenge_id, user_id, RequireString(body, "name"));
      return Reply(res, http::status::ok, MakeSuccessEnvelope(ToJson(view)));
    }
    if (method == http::verb::delete_) {
      challenges.DeleteChallenge(challenge_id, user_id);
      return Reply(res, http::status::ok, MakeSuccessEnvelope(nlohmann::json{{"deleted", true}}));
    }
  }

  if (segments.size() == 4) {
    int challenge_id = ParseId(segments[2]);
    const std::string& action = segments[3];
    if (method == http::verb::get && action == "leaderboard") {
      nlohmann::json standings = nlohmann::json::array();
      for (const auto& standing : challenges.GetLeaderboard(challenge_id, user_id)) {
        standings.push_back(ToJson(standing));
      }
      return Reply(res, http::status::ok,
                   MakeSuccessEnvelope(nlohmann::json{{"challengeId", challenge_id}, {"standings", standings}}));
    }
    if (method == http::verb::post && action == "invite") {
      auto body = ParseBody();
      RequireField(body, "user_ids");
      int invited = challenges.InviteUsers(challenge_id, user_id, OptionalIdList(body, "user_ids"));
      return Reply(res, http::status::ok, MakeSuccessEnvelope(nlohmann::json{{"invited", invited}}));
    }
    if (method == http::verb::post && action == "leave") {
      challenges.LeaveChallenge(challenge_id, user_id);
      return Reply(res, http::status::ok, MakeSuccessEnvelope(nlohmann::json{{"left", true}}));
    }
    if (method == http::verb::post && action == "complete") {
      return Reply(res, http::status::ok,
                   MakeSuccessEnvelope(ToJson(challenges.CompleteChallenge(challenge_id, user_id))));
    }
  }

  Reply(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    services_->observability->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  services_->observability->Log(LogContext{trace_id_, user_id_, std::string(req_.target()), latency,
                                           static_cast<unsigned>(res->result_int())});
  boost::beast::http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

std::optional<int> HttpSession::ExtractUserId() {
  auto it = req_.find("X-User-Id");
  if (it == req_.end()) {
    return std::nullopt;
  }
  auto parsed = ParseInt(std::string(it->value()));
  if (!parsed || *parsed <= 0) {
    return std::nullopt;
  }
  return parsed;
}

int HttpSession::RequireUser() {
  auto user_id = ExtractUserId();
  if (!user_id) {
    throw UnauthorizedError();
  }
  user_id_ = user_id;
  auto name_it = req_.find("X-Username");
  std::string username = name_it == req_.end() ? std::string() : std::string(name_it->value());
  services_->store->EnsureUser(*user_id, username);
  return *user_id;
}

nlohmann::json HttpSession::ParseBody() const {
  auto body = nlohmann::json::parse(req_.body());
  if (!body.is_object()) {
    throw ValidationError("bad_request", "JSON 객체 본문이 필요합니다");
  }
  return body;
}

}  // namespace screenrank
