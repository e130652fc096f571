#ifndef SANDBOX_ID_MAP_HPP
#define SANDBOX_ID_MAP_HPP

#include <cstdint>
#include <string>

#include "absl/types/optional.h"

namespace sandbox {

// Range of host ids, as listed in /etc/subuid and /etc/subgid.
struct IdRange {
  int64_t first = 0;
  int64_t count = 0;
};

// Finds the first range that content, with lines of the form
// "owner:first:count", grants to the user with the given name or numeric id.
absl::optional<IdRange> FindSubordinateRange(const std::string& content,
                                             const std::string& name,
                                             int64_t id);

}  // namespace sandbox

#endif
