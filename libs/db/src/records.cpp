#include "gentrade/db/records.h"

#include "gentrade/core/error.h"
#include "gentrade/core/json.h"

#include <kj/debug.h>

namespace gentrade::db {

kj::StringPtr to_string(JobStatus status) {
  switch (status) {
  case JobStatus::Created:
    return "created"_kj;
  case JobStatus::DownloadingData:
    return "downloading_data"_kj;
  case JobStatus::Running:
    return "running"_kj;
  case JobStatus::Finished:
    return "finished"_kj;
  case JobStatus::Failed:
    return "failed"_kj;
  }
  KJ_UNREACHABLE;
}

kj::Maybe<JobStatus> parse_job_status(kj::StringPtr str) {
  if (str == "created"_kj) {
    return JobStatus::Created;
  } else if (str == "downloading_data"_kj) {
    return JobStatus::DownloadingData;
  } else if (str == "running"_kj) {
    return JobStatus::Running;
  } else if (str == "finished"_kj) {
    return JobStatus::Finished;
  } else if (str == "failed"_kj) {
    return JobStatus::Failed;
  }
  return kj::none;
}

bool is_terminal(JobStatus status) {
  return status == JobStatus::Finished || status == JobStatus::Failed;
}

int rank(JobStatus status) {
  switch (status) {
  case JobStatus::Created:
    return 0;
  case JobStatus::DownloadingData:
    return 1;
  case JobStatus::Running:
    return 2;
  case JobStatus::Finished:
  case JobStatus::Failed:
    return 3;
  }
  KJ_UNREACHABLE;
}

bool can_transition(JobStatus from, JobStatus to) {
  if (is_terminal(from)) {
    return false;
  }
  if (to == JobStatus::Failed) {
    return true;
  }
  // success path advances exactly one step
  return rank(to) == rank(from) + 1;
}

void require_transition(JobStatus from, JobStatus to) {
  if (!can_transition(from, to)) {
    throw core::InvalidTransitionException(
        kj::str("illegal job transition ", to_string(from), " -> ", to_string(to)));
  }
}

void require_advance(JobStatus from, JobStatus to) {
  require_transition(from, to);
  if (is_terminal(to)) {
    throw core::InvalidTransitionException(
        kj::str("terminal status ", to_string(to), " cannot be set by a plain transition"));
  }
}

JobRecord JobRecord::clone() const {
  JobRecord copy;
  copy.id = id;
  copy.strategy_id = strategy_id;
  copy.date_range = kj::str(date_range);
  copy.status = status;
  KJ_IF_SOME(path, artifact_path) {
    copy.artifact_path = kj::str(path);
  }
  KJ_IF_SOME(e, error) {
    copy.error = kj::str(e);
  }
  copy.created_at = created_at;
  copy.updated_at = updated_at;
  copy.queued_at = queued_at;
  return copy;
}

StrategyRecord StrategyRecord::clone() const {
  StrategyRecord copy;
  copy.id = id;
  copy.user_id = user_id;
  copy.name = kj::str(name);
  copy.file = kj::str(file);
  KJ_IF_SOME(tf, timeframe) {
    copy.timeframe = kj::str(tf);
  }
  copy.pairs = KJ_MAP(p, pairs) { return kj::str(p); };
  return copy;
}

UserRecord UserRecord::clone() const {
  UserRecord copy;
  copy.id = id;
  copy.principal = kj::str(principal);
  KJ_IF_SOME(n, name) {
    copy.name = kj::str(n);
  }
  return copy;
}

StrategyDraft parse_strategy_draft(kj::StringPtr json) {
  StrategyDraft draft;
  if (json.size() == 0) {
    return draft;
  }
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
               auto doc = core::JsonDocument::parse(json);
               auto root = doc.root();
               if (!root.is_object()) {
                 return;
               }
               KJ_IF_SOME(tf, root["timeframe"_kj].get_string_ptr()) {
                 if (tf.size() > 0) {
                   draft.timeframe = kj::str(tf);
                 }
               }
               auto pairs = root["pairs"_kj];
               if (!pairs.is_array()) {
                 pairs = root["pair_whitelist"_kj];
               }
               draft.pairs = pairs.get_string_array().releaseAsArray();
             })) {
    KJ_LOG(WARNING, "ignoring malformed strategy draft", exception.getDescription());
    draft = StrategyDraft();
  }
  return draft;
}

} // namespace gentrade::db
