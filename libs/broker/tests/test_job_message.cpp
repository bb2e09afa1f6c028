#include "gentrade/broker/job_message.h"
#include "kj/test.h"

using namespace gentrade::broker;

namespace {

KJ_TEST("JobMessage: encodes every field") {
  JobMessage message;
  message.job_id = 42;
  message.strategy_id = 7;
  message.principal_id = kj::str("auth0|alice");
  message.date_range = kj::str("20240101-20240131");

  auto decoded = decode_job_message(encode_job_message(message));
  KJ_EXPECT(decoded.job_id == 42);
  KJ_EXPECT(decoded.strategy_id == 7);
  KJ_EXPECT(decoded.principal_id == "auth0|alice"_kj);
  KJ_EXPECT(decoded.date_range == "20240101-20240131"_kj);
}

KJ_TEST("JobMessage: extra fields are ignored") {
  auto decoded = decode_job_message(
      R"({"job_id": 1, "strategy_id": 2, "principal_id": "p", "date_range": "r", "retry": true})"_kj);
  KJ_EXPECT(decoded.job_id == 1);
}

KJ_TEST("JobMessage: malformed payloads are rejected") {
  KJ_EXPECT_THROW_MESSAGE("JSON parse error", (void)decode_job_message("{not json"_kj));
  KJ_EXPECT_THROW_MESSAGE("must be a JSON object", (void)decode_job_message("[1]"_kj));
  KJ_EXPECT_THROW_MESSAGE("job_id",
                          (void)decode_job_message(
                              R"({"strategy_id": 2, "principal_id": "p", "date_range": "r"})"_kj));
  KJ_EXPECT_THROW_MESSAGE("job_id",
                          (void)decode_job_message(
                              R"({"job_id": "1", "strategy_id": 2, "principal_id": "p", "date_range": "r"})"_kj));
  KJ_EXPECT_THROW_MESSAGE("principal_id",
                          (void)decode_job_message(
                              R"({"job_id": 1, "strategy_id": 2, "date_range": "r"})"_kj));
  KJ_EXPECT_THROW_MESSAGE("date_range",
                          (void)decode_job_message(
                              R"({"job_id": 1, "strategy_id": 2, "principal_id": "p"})"_kj));
}

} // namespace
