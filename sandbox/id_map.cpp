#include "sandbox/id_map.hpp"

#include <vector>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"

namespace sandbox {

absl::optional<IdRange> FindSubordinateRange(const std::string& content,
                                             const std::string& name,
                                             int64_t id) {
  const std::string numeric = absl::StrCat(id);
  for (absl::string_view line :
       absl::StrSplit(content, '\n', absl::SkipEmpty())) {
    line = absl::StripAsciiWhitespace(line);
    if (line.empty() || line[0] == '#') continue;
    std::vector<absl::string_view> fields = absl::StrSplit(line, ':');
    if (fields.size() != 3) continue;
    if (fields[0] != name && fields[0] != numeric) continue;
    IdRange range;
    if (!absl::SimpleAtoi(fields[1], &range.first) ||
        !absl::SimpleAtoi(fields[2], &range.count) || range.first < 0 ||
        range.count <= 0) {
      continue;
    }
    return range;
  }
  return absl::nullopt;
}

}  // namespace sandbox
