/*
 * 설명: HTTP 연결을 처리하고 스크린타임/챌린지/리더보드 엔드포인트를 제공한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/challenge_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <nlohmann/json.hpp>

#include "screenrank/app.hpp"

namespace screenrank {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<Services> services);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  // 라우팅 결과를 res에 채운다. 도메인 예외는 HandleRequest에서 상태 코드로 바꾼다.
  void Dispatch(const std::string& path, const std::string& query, Response& res);
  void HandleChallengeRoute(const std::vector<std::string>& segments, Response& res);
  void SendResponse(std::shared_ptr<Response> res);

  // X-User-Id가 없거나 양의 정수가 아니면 nullopt.
  std::optional<int> ExtractUserId();
  int RequireUser();
  nlohmann::json ParseBody() const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<Services> services_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::optional<int> user_id_;
};

}  // namespace screenrank
