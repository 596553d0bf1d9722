#pragma once
#include <optional>
#include <string>
#include "Types.h"

namespace standkit {

// Age labels the age net can answer, index = class id
extern const char* const kAgeRanges[9];
// Gender labels, index = class id; "Unknown" when the net is unsure
extern const char* const kGenders[3];

// Map a raw age label ("25-32") to a bucket.
// lo = lower bound (60 when the label has no dash):
//   lo < 18 -> child, 18 <= lo < 30 -> young, 40 <= lo <= 60 -> adult, else senior
AgeBucket mapAgeBucket(const std::string& age_range);

// "25-32" -> 28.5 ; "42" -> 42 ; malformed -> nullopt
std::optional<double> ageMidpoint(const std::string& age_range);

// Assemble a DemographicsResult, nullopt if the age label cannot be parsed
std::optional<DemographicsResult> makeDemographics(const std::string& age_range,
                                                   const std::string& gender);

} // namespace standkit
