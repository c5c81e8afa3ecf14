#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace commute::model {

enum class Direction {
  kHomeToWork,
  kWorkToHome,
  kSkip,
};

inline std::string_view ToString(Direction direction) {
  switch (direction) {
    case Direction::kHomeToWork:
      return "H2W";
    case Direction::kWorkToHome:
      return "W2H";
    case Direction::kSkip:
    default:
      return "SKIP";
  }
}

// Accepts the override spellings "H2W" / "W2H" (any case, surrounding blanks).
inline std::optional<Direction> ParseDirection(std::string_view value) {
  std::string normalized;
  for (char c : value) {
    if (c == ' ' || c == '\t') continue;
    normalized.push_back(static_cast<char>(c >= 'a' && c <= 'z' ? c - 'a' + 'A' : c));
  }
  if (normalized == "H2W") return Direction::kHomeToWork;
  if (normalized == "W2H") return Direction::kWorkToHome;
  return std::nullopt;
}

} // namespace commute::model
