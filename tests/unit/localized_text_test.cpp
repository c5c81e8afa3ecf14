#include "internal/util/localized_text.hpp"

#include <cassert>
#include <cmath>
#include <functional>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using commute::util::ParseDurationSeconds;
using commute::util::ParseMiles;
using commute::util::ParseMinutes;

bool Rejects(const std::function<void()>& parse) {
  try {
    parse();
  } catch (const commute::util::ParseError&) {
    return true;
  }
  return false;
}

void TestDurationSecondsStripsUnitSuffix() {
  assert(ParseDurationSeconds("1532s") == 1532);
  assert(ParseDurationSeconds("0s") == 0);
  assert(ParseDurationSeconds(" 86400s ") == 86400);
}

void TestDurationSecondsRejectsGroupingAndOtherShapes() {
  // machine field: separators are never valid
  assert(Rejects([] { ParseDurationSeconds("1,532s"); }));
  assert(Rejects([] { ParseDurationSeconds("1532"); }));
  assert(Rejects([] { ParseDurationSeconds("s"); }));
  assert(Rejects([] { ParseDurationSeconds("15.5s"); }));
  assert(Rejects([] { ParseDurationSeconds("-3s"); }));
  assert(Rejects([] { ParseDurationSeconds("1532 s"); }));
  assert(Rejects([] { ParseDurationSeconds(""); }));
}

void TestMinutesSingularAndPluralParseIdentically() {
  assert(ParseMinutes("25 min") == 25);
  assert(ParseMinutes("25 mins") == 25);
  assert(ParseMinutes("1 min") == 1);
  assert(ParseMinutes("  7 mins\n") == 7);
}

void TestMinutesAcceptThousandsSeparators() {
  assert(ParseMinutes("1,532 min") == 1532);
  assert(ParseMinutes("1,532 mins") == 1532);
  assert(Rejects([] { ParseMinutes(",532 min"); }));
  assert(Rejects([] { ParseMinutes("1,,532 min"); }));
  assert(Rejects([] { ParseMinutes("1532, min"); }));
  assert(ParseMinutes("1,000,000 min") == 1000000);
  assert(Rejects([] { ParseMinutes("1,2 min"); }));
  assert(Rejects([] { ParseMinutes("1,2345 min"); }));
  assert(Rejects([] { ParseMinutes("1234,567 min"); }));
  assert(Rejects([] { ParseMinutes("1,000,00 min"); }));
}

void TestMinutesAcceptHourForms() {
  assert(ParseMinutes("1 hour 5 mins") == 65);
  assert(ParseMinutes("2 hours") == 120);
  assert(ParseMinutes("1 hr 1 min") == 61);
  assert(Rejects([] { ParseMinutes("1 hour 5"); }));
  assert(Rejects([] { ParseMinutes("1 hour 5 hours"); }));
}

void TestMinutesRejectOutOfRangeHours() {
  assert(Rejects([] { ParseMinutes("999999999999999999 hours"); }));
  assert(Rejects([] { ParseMinutes("999999999999999999 hours 59 mins"); }));
  assert(Rejects([] { ParseMinutes("1 hour 999999999999999999 mins"); }));
  assert(ParseMinutes("35791394 hours") == 35791394 * 60);
}

void TestMinutesRejectOtherShapes() {
  assert(Rejects([] { ParseMinutes("25"); }));
  assert(Rejects([] { ParseMinutes("25min"); }));
  assert(Rejects([] { ParseMinutes("25 sec"); }));
  assert(Rejects([] { ParseMinutes("twenty min"); }));
  assert(Rejects([] { ParseMinutes("2.5 min"); }));
  assert(Rejects([] { ParseMinutes(""); }));
}

void TestMilesTakeLeadingNumber() {
  assert(std::fabs(ParseMiles("12.3 mi") - 12.3) < 1e-9);
  assert(std::fabs(ParseMiles("9.9 mi") - 9.9) < 1e-9);
  assert(std::fabs(ParseMiles("12 mi") - 12.0) < 1e-9);
  assert(std::fabs(ParseMiles("1,204.5 mi") - 1204.5) < 1e-9);
}

void TestMilesRejectOtherShapes() {
  assert(Rejects([] { ParseMiles("12.3"); }));
  assert(Rejects([] { ParseMiles("500 ft"); }));
  assert(Rejects([] { ParseMiles("12.3 km"); }));
  assert(Rejects([] { ParseMiles("12. mi"); }));
  assert(Rejects([] { ParseMiles(".5 mi"); }));
  assert(Rejects([] { ParseMiles("1.2.3 mi"); }));
  assert(Rejects([] { ParseMiles("12,34 mi"); }));
  assert(Rejects([] { ParseMiles("1,2.5 mi"); }));
}

} // namespace

int main() {
  TestDurationSecondsStripsUnitSuffix();
  TestDurationSecondsRejectsGroupingAndOtherShapes();
  TestMinutesSingularAndPluralParseIdentically();
  TestMinutesAcceptThousandsSeparators();
  TestMinutesAcceptHourForms();
  TestMinutesRejectOutOfRangeHours();
  TestMinutesRejectOtherShapes();
  TestMilesTakeLeadingNumber();
  TestMilesRejectOtherShapes();

  std::cout << "commute_unit_localized_text: pass\n";
  return 0;
}
