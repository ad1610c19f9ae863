/*
 * 설명: 서비스 계층이 호출자에게 전달하는 검증/미존재 예외를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/challenge_service_test.cpp, server/tests/e2e/challenge_flow_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>

namespace screenrank {

// HTTP 400으로 매핑된다. 재시도하지 않는다.
class ValidationError : public std::runtime_error {
 public:
  ValidationError(const std::string& code, const std::string& message) : std::runtime_error(message), code(code) {}
  std::string code;
};

// HTTP 404로 매핑된다.
class NotFoundError : public std::runtime_error {
 public:
  explicit NotFoundError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace screenrank
