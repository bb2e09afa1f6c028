#pragma once

#include <kj/string.h>

namespace gentrade::core {

// Random RFC 4122 version 4 UUID in canonical lowercase form
[[nodiscard]] kj::String generate_uuid();

} // namespace gentrade::core
