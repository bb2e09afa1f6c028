#include "gentrade/broker/job_message.h"

#include "gentrade/core/json.h"

#include <kj/debug.h>

namespace gentrade::broker {

kj::String encode_job_message(const JobMessage& message) {
  auto builder = core::JsonBuilder::object();
  builder.put("job_id"_kj, static_cast<int64_t>(message.job_id))
      .put("strategy_id"_kj, static_cast<int64_t>(message.strategy_id))
      .put("principal_id"_kj, message.principal_id.asPtr())
      .put("date_range"_kj, message.date_range.asPtr());
  return builder.build();
}

JobMessage decode_job_message(kj::StringPtr payload) {
  auto doc = core::JsonDocument::parse(payload);
  auto root = doc.root();
  KJ_REQUIRE(root.is_object(), "job message must be a JSON object");

  auto job_id = root["job_id"_kj];
  auto strategy_id = root["strategy_id"_kj];
  KJ_REQUIRE(job_id.is_int() && job_id.get_int() > 0, "job message without a valid job_id");
  KJ_REQUIRE(strategy_id.is_int() && strategy_id.get_int() > 0,
             "job message without a valid strategy_id");

  JobMessage message;
  message.job_id = job_id.get_int();
  message.strategy_id = strategy_id.get_int();
  KJ_IF_SOME(principal, root["principal_id"_kj].get_string_ptr()) {
    message.principal_id = kj::str(principal);
  } else {
    KJ_FAIL_REQUIRE("job message without a principal_id");
  }
  KJ_IF_SOME(range, root["date_range"_kj].get_string_ptr()) {
    message.date_range = kj::str(range);
  } else {
    KJ_FAIL_REQUIRE("job message without a date_range");
  }
  return message;
}

} // namespace gentrade::broker
