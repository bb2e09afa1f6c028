#include "gentrade/exec/user_sandbox.h"

#include <kj/debug.h>

namespace gentrade::exec {

namespace {

kj::Maybe<kj::Path> relative_under(kj::StringPtr path, kj::StringPtr mount) {
  if (!path.startsWith(mount)) {
    return kj::none;
  }
  auto rest = path.slice(mount.size());
  if (rest.size() == 0 || rest[0] != '/') {
    return kj::none;
  }
  rest = rest.slice(1);
  if (rest.size() == 0) {
    return kj::none;
  }
  // ".." that climbs out of the mount is rejected by the parser
  kj::Maybe<kj::Path> parsed;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { parsed = kj::Path::parse(rest); })) {
    KJ_LOG(WARNING, "rejected container path", path, exception.getDescription());
    return kj::none;
  }
  return kj::mv(parsed);
}

} // namespace

UserSandbox::UserSandbox(const kj::Filesystem& fs, kj::Path userdata_dir,
                         kj::StringPtr common_dir_name)
    : fs_(fs), userdata_(kj::mv(userdata_dir)),
      common_data_(userdata_.append(kj::Path::parse(common_dir_name))) {}

UserSandbox UserSandbox::open(const kj::Filesystem& fs, kj::StringPtr userdata_dir,
                              kj::StringPtr common_dir_name) {
  return UserSandbox(fs, fs.getCurrentPath().evalNative(userdata_dir), common_dir_name);
}

kj::String UserSandbox::directory_name(kj::StringPtr principal) {
  if (principal.startsWith("user_"_kj)) {
    return kj::str(principal);
  }
  return kj::str("user_", principal);
}

kj::Path UserSandbox::user_dir(kj::StringPtr principal) const {
  KJ_REQUIRE(principal.size() > 0 && principal.findFirst('/') == kj::none &&
                 principal != "."_kj && principal != ".."_kj,
             "invalid principal for sandbox", principal);
  return userdata_.append(directory_name(principal));
}

kj::Path UserSandbox::strategies_dir(kj::StringPtr principal) const {
  return user_dir(principal).append(kj::Path({"user_data", "strategies"}));
}

kj::Path UserSandbox::results_dir(kj::StringPtr principal) const {
  return user_dir(principal).append(kj::Path({"user_data", "backtest_results"}));
}

kj::Path UserSandbox::compose_file(kj::StringPtr principal) const {
  return user_dir(principal).append("docker-compose.yml");
}

bool UserSandbox::exists(const kj::Path& path) const {
  return fs_.getRoot().exists(path);
}

void UserSandbox::ensure_directory(const kj::Path& path) const {
  fs_.getRoot().openSubdir(path, kj::WriteMode::CREATE | kj::WriteMode::MODIFY |
                                     kj::WriteMode::CREATE_PARENT);
}

kj::Maybe<kj::Path> UserSandbox::map_container_path(kj::StringPtr principal,
                                                    kj::StringPtr container_path) const {
  KJ_IF_SOME(rest, relative_under(container_path, kContainerUserData)) {
    return user_dir(principal).append("user_data").append(rest);
  }
  KJ_IF_SOME(rest, relative_under(container_path, kContainerCommonData)) {
    return common_data_.append(rest);
  }
  return kj::none;
}

} // namespace gentrade::exec
