#include "gentrade/ctl/ctl_app.h"

#include <kj/io.h>
#include <kj/vector.h>
#include <unistd.h>

extern char** environ;

int main(int argc, char** argv) {
  kj::FdOutputStream out(STDOUT_FILENO);
  kj::FdOutputStream err(STDERR_FILENO);

  kj::Vector<kj::StringPtr> args(argc);
  for (int i = 1; i < argc; ++i) {
    args.add(argv[i]);
  }

  gentrade::ctl::CtlApp app(out, err);
  return app.run(args.asPtr(), environ);
}
