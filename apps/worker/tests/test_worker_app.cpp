#include "gentrade/worker/worker_app.h"

#include <cstdlib>
#include <kj/debug.h>
#include <kj/filesystem.h>
#include <kj/test.h>
#include <kj/thread.h>

using namespace gentrade;

namespace {

struct TempDir {
  kj::Own<kj::Filesystem> fs = kj::newDiskFilesystem();
  kj::Path path{nullptr};

  TempDir() {
    char tmpl[] = "/tmp/gentrade-worker-XXXXXX";
    KJ_REQUIRE(::mkdtemp(tmpl) != nullptr, "mkdtemp failed");
    path = kj::Path::parse(tmpl + 1);
  }
  ~TempDir() noexcept(false) {
    fs->getRoot().tryRemove(path);
  }
  kj::String native() const {
    return path.toNativeString(true);
  }
};

jobs::WorkerConfig config_for(kj::StringPtr userdata) {
  jobs::WorkerConfig config;
  config.userdata_dir = kj::str(userdata);
  config.concurrency = 1;
  config.receive_timeout = 20 * kj::MILLISECONDS;
  return config;
}

KJ_TEST("WorkerApp: in-memory worker runs until asked to stop") {
  TempDir userdata;
  worker::WorkerApp app(config_for(userdata.native()), true);

  int rc = -1;
  {
    kj::Thread runner([&]() { rc = app.run(); });
    app.request_stop();
  }
  KJ_EXPECT(rc == 0);
  KJ_EXPECT(app.processed() == 0);
  // the shared market data directory is prepared at startup
  KJ_EXPECT(userdata.fs->getRoot().exists(userdata.path.append("_common_data")));
}

KJ_TEST("WorkerApp: a missing userdata directory fails startup") {
  TempDir parent;
  auto missing = kj::str(parent.native(), "/nowhere");
  worker::WorkerApp app(config_for(missing), true);
  KJ_EXPECT(app.run() == 1);
}

} // namespace
