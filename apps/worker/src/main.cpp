#include "gentrade/core/error.h"
#include "gentrade/core/logger.h"
#include "gentrade/jobs/worker_config.h"
#include "gentrade/worker/worker_app.h"

#include <cstdio>
#include <kj/exception.h>
#include <kj/memory.h>
#include <kj/string.h>

extern char** environ;

namespace {

constexpr auto kUsage = "usage: gentrade-worker [--config <file>] [--concurrency N] [--memory]\n"_kj;

struct Flags {
  kj::Maybe<kj::StringPtr> config_path;
  kj::Maybe<size_t> concurrency;
  bool memory{false};
};

kj::Maybe<Flags> parse_flags(int argc, char** argv) {
  Flags flags;
  for (int i = 1; i < argc; ++i) {
    kj::StringPtr arg = argv[i];
    if (arg == "--config"_kj && i + 1 < argc) {
      flags.config_path = kj::StringPtr(argv[++i]);
    } else if (arg == "--concurrency"_kj && i + 1 < argc) {
      KJ_IF_SOME(n, kj::StringPtr(argv[++i]).tryParseAs<size_t>()) {
        if (n == 0) {
          return kj::none;
        }
        flags.concurrency = n;
      } else {
        return kj::none;
      }
    } else if (arg == "--memory"_kj) {
      flags.memory = true;
    } else {
      return kj::none;
    }
  }
  return kj::mv(flags);
}

} // namespace

int main(int argc, char** argv) {
  using namespace gentrade;

  Flags flags;
  KJ_IF_SOME(parsed, parse_flags(argc, argv)) {
    flags = kj::mv(parsed);
  } else {
    std::fputs(kUsage.cStr(), stderr);
    return 2;
  }

  kj::Maybe<kj::Own<worker::WorkerApp>> app;
  try {
    auto settings = jobs::load_config(flags.config_path, environ);
    auto config = jobs::WorkerConfig::from(settings, environ);
    KJ_IF_SOME(n, flags.concurrency) {
      config.concurrency = n;
    }
    jobs::configure_logging(core::global_logger(), config);
    app = kj::heap<worker::WorkerApp>(kj::mv(config), flags.memory);
  } catch (const core::ConfigException& e) {
    std::fprintf(stderr, "gentrade-worker: %s\n", e.message().cStr());
    return 1;
  } catch (const kj::Exception& e) {
    std::fprintf(stderr, "gentrade-worker: %s\n", e.getDescription().cStr());
    return 1;
  }

  KJ_IF_SOME(worker, app) {
    core::global_logger().info("gentrade worker starting");
    return worker->run();
  }
  return 1;
}
