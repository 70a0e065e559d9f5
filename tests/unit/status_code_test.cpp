#include <catch2/catch.hpp>
#include <replica/status_code.hpp>

#include <sstream>

using namespace replica;

TEST_CASE("status codes keep their numeric values", "[status]") {
  REQUIRE(http_code(StatusCode::Ok) == 200);
  REQUIRE(http_code(StatusCode::NotFound) == 404);
  REQUIRE(http_code(StatusCode::ServerError) == 500);
  REQUIRE(http_code(StatusCode::FetchFailed) == 901);
  REQUIRE(http_code(StatusCode::Cancelled) == 904);
}

TEST_CASE("success and failure partition the codes", "[status]") {
  for (auto c : {StatusCode::Ok, StatusCode::Created, StatusCode::NoContent, StatusCode::NotModified}) {
    REQUIRE(is_success(c));
    REQUIRE_FALSE(is_failure(c));
  }
  for (auto c : {StatusCode::ValidationFailed, StatusCode::NotFound, StatusCode::Conflict,
                 StatusCode::ServerError, StatusCode::FetchTimeout, StatusCode::Cancelled}) {
    REQUIRE(is_failure(c));
    REQUIRE_FALSE(is_success(c));
  }
  STATIC_REQUIRE(is_local(StatusCode::DecodeFailed));
  STATIC_REQUIRE_FALSE(is_local(StatusCode::ServerError));
}

TEST_CASE("from_http maps known codes only", "[status]") {
  REQUIRE(from_http(204) == StatusCode::NoContent);
  REQUIRE(from_http(429) == StatusCode::RateLimited);
  REQUIRE(from_http(902) == StatusCode::FetchTimeout);
  REQUIRE_FALSE(from_http(418).has_value());
  REQUIRE_FALSE(from_http(0).has_value());
}

TEST_CASE("from_bool and names", "[status]") {
  REQUIRE(from_bool(true) == StatusCode::Ok);
  REQUIRE(from_bool(false) == StatusCode::ValidationFailed);
  REQUIRE(to_string(StatusCode::NotFound) == "not_found");
  REQUIRE(to_string(StatusCode::PayloadTooBig) == "payload_too_big");

  std::ostringstream os;
  os << StatusCode::Cancelled;
  REQUIRE(os.str() == "cancelled");
}
