#include "standkit/core/Demographics.h"
#include <stdexcept>

namespace standkit {

const char* const kAgeRanges[9] = {
    "0-2", "4-6", "8-12", "15-20", "21-24", "25-32", "33-43", "44-53", "60-100"
};

const char* const kGenders[3] = { "Male", "Female", "Unknown" };

static int parseBound(const std::string& s) {
    size_t pos = 0;
    int v = std::stoi(s, &pos);
    if (pos != s.size()) throw std::invalid_argument("trailing characters in age bound: " + s);
    return v;
}

AgeBucket mapAgeBucket(const std::string& age_range) {
    int lo = 60;
    auto dash = age_range.find('-');
    if (dash != std::string::npos) {
        try {
            lo = parseBound(age_range.substr(0, dash));
        } catch (const std::exception&) {
            lo = 60;
        }
    }

    if (lo < 18)              return AgeBucket::CHILD;
    if (lo >= 18 && lo < 30)  return AgeBucket::YOUNG;
    if (lo >= 40 && lo <= 60) return AgeBucket::ADULT;
    return AgeBucket::SENIOR;   // includes the 30..39 gap
}

std::optional<double> ageMidpoint(const std::string& age_range) {
    try {
        auto dash = age_range.find('-');
        if (dash == std::string::npos) {
            return static_cast<double>(parseBound(age_range));
        }
        int lo = parseBound(age_range.substr(0, dash));
        int hi = parseBound(age_range.substr(dash + 1));
        return (lo + hi) / 2.0;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<DemographicsResult> makeDemographics(const std::string& age_range,
                                                   const std::string& gender) {
    auto mid = ageMidpoint(age_range);
    if (!mid) return std::nullopt;

    DemographicsResult r;
    r.gender     = gender;
    r.age_range  = age_range;
    r.age_bucket = mapAgeBucket(age_range);
    r.age        = *mid;
    return r;
}

} // namespace standkit
