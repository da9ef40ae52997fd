/*
 * 설명: {success, data, error, meta} 형태의 JSON 응답 엔벨로프를 만든다.
 * 버전: v1.0.0
 * 관련 문서: SPEC_FULL.md (A4, S2, S7)
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "relay/api_response.hpp"

#include <chrono>

#include "relay/util.hpp"

namespace relay {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", detail}};
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

}  // namespace relay
