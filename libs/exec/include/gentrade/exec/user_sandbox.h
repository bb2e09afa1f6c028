#pragma once

#include <kj/common.h>
#include <kj/filesystem.h>
#include <kj/string.h>

namespace gentrade::exec {

// Mount points inside the engine container
constexpr kj::StringPtr kContainerUserData = "/freqtrade/user_data"_kj;
constexpr kj::StringPtr kContainerCommonData = "/freqtrade/common_data"_kj;

/**
 * @brief Host-side layout of the per-user execution environments
 *
 *   <userdata>/user_<principal>/docker-compose.yml
 *   <userdata>/user_<principal>/user_data/strategies/
 *   <userdata>/user_<principal>/user_data/backtest_results/
 *   <userdata>/<common>/              shared market data
 *
 * Provisioning the compose file is done elsewhere; this class only resolves
 * paths and creates missing result directories.
 */
class UserSandbox {
public:
  UserSandbox(const kj::Filesystem& fs, kj::Path userdata_dir, kj::StringPtr common_dir_name);

  /**
   * @brief Resolve `userdata_dir` against the current directory when relative
   */
  static UserSandbox open(const kj::Filesystem& fs, kj::StringPtr userdata_dir,
                          kj::StringPtr common_dir_name);

  // "user_<principal>", without doubling a prefix the principal already has
  [[nodiscard]] static kj::String directory_name(kj::StringPtr principal);

  [[nodiscard]] kj::Path user_dir(kj::StringPtr principal) const;
  [[nodiscard]] kj::Path strategies_dir(kj::StringPtr principal) const;
  [[nodiscard]] kj::Path results_dir(kj::StringPtr principal) const;
  [[nodiscard]] kj::Path compose_file(kj::StringPtr principal) const;
  [[nodiscard]] const kj::Path& common_data_dir() const {
    return common_data_;
  }
  [[nodiscard]] const kj::Path& userdata_dir() const {
    return userdata_;
  }

  [[nodiscard]] bool exists(const kj::Path& path) const;
  void ensure_directory(const kj::Path& path) const;

  /**
   * @brief Host path of a file the engine reported under a container mount
   *
   * Returns none for paths outside both mounts or escaping them with "..".
   */
  [[nodiscard]] kj::Maybe<kj::Path> map_container_path(kj::StringPtr principal,
                                                       kj::StringPtr container_path) const;

  [[nodiscard]] static kj::String native(const kj::Path& path) {
    return path.toNativeString(true);
  }

private:
  const kj::Filesystem& fs_;
  kj::Path userdata_;
  kj::Path common_data_;
};

} // namespace gentrade::exec
