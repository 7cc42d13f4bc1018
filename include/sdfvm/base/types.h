#pragma once

#include <cstdint>
#include <limits>

namespace sdfvm {
namespace base {

using ObjectId = uint64_t;

static constexpr ObjectId NoObjectId = std::numeric_limits<ObjectId>::max();

} // namespace base
} // namespace sdfvm
