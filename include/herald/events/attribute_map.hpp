#pragma once

#include <functional>
#include <map>
#include <string>

namespace herald::events {

/// Event payload. Ordered by key so that wire output is deterministic; the
/// transparent comparator allows lookups by std::string_view.
using attributes_t = std::map<std::string, std::string, std::less<>>;

}  // namespace herald::events
