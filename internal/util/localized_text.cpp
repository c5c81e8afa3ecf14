#include "localized_text.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <string>
#include <vector>

#include "errors.hpp"

namespace commute::util {

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::vector<std::string_view> SplitWords(std::string_view s) {
  std::vector<std::string_view> words;
  size_t                        i = 0;
  while (i < s.size()) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    const size_t start = i;
    while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    if (i > start) words.push_back(s.substr(start, i - start));
  }
  return words;
}

[[noreturn]] void Reject(std::string_view what, std::string_view text) {
  throw ParseError(std::string(what) + ": unexpected text '" + std::string(text) + "'");
}

// Digits with optional thousands separators: "1532", "1,532", "12,345,678".
// A leading group has 1-3 digits, every later group exactly 3.
// Returns the digits with separators removed, or empty when malformed.
std::string StripGrouping(std::string_view token) {
  std::string digits;
  size_t      group   = 0;
  bool        grouped = false;
  for (char c : token) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digits.push_back(c);
      ++group;
    } else if (c == ',') {
      if (group == 0 || (grouped ? group != 3 : group > 3)) return {};
      grouped = true;
      group   = 0;
    } else {
      return {};
    }
  }
  if (group == 0 || (grouped && group != 3)) return {};
  return digits;
}

int64_t ToInt64(const std::string& digits, std::string_view what, std::string_view text) {
  if (digits.empty() || digits.size() > 18) Reject(what, text);
  return std::stoll(digits);
}

int ToMinutesInt(int64_t value, std::string_view text) {
  if (value > std::numeric_limits<int>::max()) Reject("minutes", text);
  return static_cast<int>(value);
}

bool IsMinuteUnit(std::string_view unit) {
  return unit == "min" || unit == "mins";
}

bool IsHourUnit(std::string_view unit) {
  return unit == "hr" || unit == "hrs" || unit == "hour" || unit == "hours";
}

} // namespace

int64_t ParseDurationSeconds(std::string_view text) {
  const auto trimmed = Trim(text);
  if (trimmed.size() < 2 || trimmed.back() != 's') Reject("duration seconds", text);

  const auto number = trimmed.substr(0, trimmed.size() - 1);
  for (char c : number) {
    if (!std::isdigit(static_cast<unsigned char>(c))) Reject("duration seconds", text);
  }
  return ToInt64(std::string(number), "duration seconds", text);
}

int ParseMinutes(std::string_view text) {
  const auto words = SplitWords(Trim(text));

  if (words.size() == 2 && IsMinuteUnit(words[1])) {
    return ToMinutesInt(ToInt64(StripGrouping(words[0]), "minutes", text), text);
  }

  if ((words.size() == 2 || words.size() == 4) && IsHourUnit(words[1])) {
    const int64_t hours = ToInt64(StripGrouping(words[0]), "minutes", text);
    if (hours > std::numeric_limits<int>::max() / 60) Reject("minutes", text);

    // bounded above, so adding an 18-digit minute count cannot overflow
    int64_t total = hours * 60;
    if (words.size() == 4) {
      if (!IsMinuteUnit(words[3])) Reject("minutes", text);
      total += ToInt64(StripGrouping(words[2]), "minutes", text);
    }
    return ToMinutesInt(total, text);
  }

  Reject("minutes", text);
}

double ParseMiles(std::string_view text) {
  const auto words = SplitWords(Trim(text));
  if (words.size() != 2 || words[1] != "mi") Reject("miles", text);

  const auto token    = words[0];
  const auto dot      = token.find('.');
  const auto integral = StripGrouping(token.substr(0, dot));
  if (integral.empty()) Reject("miles", text);

  std::string number = integral;
  if (dot != std::string_view::npos) {
    const auto fraction = token.substr(dot + 1);
    if (fraction.empty()) Reject("miles", text);
    for (char c : fraction) {
      if (!std::isdigit(static_cast<unsigned char>(c))) Reject("miles", text);
    }
    number += "." + std::string(fraction);
  }
  return std::strtod(number.c_str(), nullptr);
}

} // namespace commute::util
