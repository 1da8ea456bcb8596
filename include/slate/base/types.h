#pragma once

#include <cstdint>

namespace slate {
namespace base {

using ObjectId = uint64_t;

} // namespace base
} // namespace slate
