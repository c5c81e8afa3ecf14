#pragma once

#include <cstdint>
#include <string_view>

namespace commute::util {

/*
  Parsers for the provider's textual numeric fields.

  Accepted shapes:

    ParseDurationSeconds  "1532s"                  machine field, plain digits only
    ParseMinutes          "25 min", "25 mins",     localized text, "," grouping allowed
                          "1 hour 5 mins", "2 hours"
    ParseMiles            "12.3 mi", "1,204.5 mi"  localized text, "," grouping allowed

  Leading/trailing whitespace is ignored. Anything else throws ParseError.
*/

int64_t ParseDurationSeconds(std::string_view text);

int ParseMinutes(std::string_view text);

double ParseMiles(std::string_view text);

} // namespace commute::util
