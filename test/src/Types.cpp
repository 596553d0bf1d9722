#include <doctest/doctest.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include "standkit/core/Demographics.h"
#include "standkit/core/TimeUtils.h"
#include "standkit/core/Types.h"

using namespace standkit;
using nlohmann::json;

SCENARIO("sessionRecordToJson - visit payload")
{
    GIVEN("A finished 1.5 minute session")
    {
        SessionRecord r;
        r.stand_name     = "stand-01";
        r.activated_at   = TimeUtils::fromEpochMs(1760000000000);
        r.deactivated_at = r.activated_at + std::chrono::seconds(90);
        r.dwell_minutes  = 1.5;
        r.demographics   = *makeDemographics("25-32", "Female");

        json j = json::parse(sessionRecordToJson(r));

        THEN("It carries exactly the backend's fields")
        {
            CHECK(j.size() == 7);
            CHECK(j["gender"] == "Female");
            CHECK(j["group"] == "young");
            CHECK(j["age_group"] == "25-32");
            CHECK(j["age"].get<double>() == doctest::Approx(28.5));
            CHECK(j["name"] == "stand-01");
            CHECK(j["datetime"] == TimeUtils::toIso8601(r.activated_at));
            CHECK(j["time_elapsed"].get<double>() == doctest::Approx(1.5));
        }
    }
}

TEST_CASE("TimeUtils - iso8601 and minutes")
{
    const TimePoint t = TimeUtils::fromEpochMs(1760000000000);
    const std::string whole = TimeUtils::toIso8601(t);
    CHECK(whole.size() == 19);                  // YYYY-MM-DDTHH:MM:SS
    CHECK(whole[10] == 'T');

    const std::string frac = TimeUtils::toIso8601(t + std::chrono::milliseconds(250));
    CHECK(frac.size() == 26);
    CHECK(frac.substr(19) == ".250000");

    CHECK(TimeUtils::minutesBetween(t, t + std::chrono::seconds(30)) == doctest::Approx(0.5));
    CHECK(TimeUtils::toEpochMs(t) == 1760000000000);
}

SCENARIO("parseReplayFrameFromJson")
{
    GIVEN("A frame with a confident person, two faces and a demographics answer")
    {
        const std::string line = R"({"ts_ms": 1000, "frame_index": 7,
            "person": {"center": [300, 240], "distance": 1.4, "nose": [301, 115]},
            "faces": [{"x1": 280, "y1": 80, "x2": 330, "y2": 150, "conf": 0.93},
                      {"x1": 40, "y1": 90, "x2": 90, "y2": 150, "conf": 0.81}],
            "demographics": {"age_range": "25-32", "gender": "Female"}})";
        ReplayFrame f;
        REQUIRE(parseReplayFrameFromJson(line, f));

        CHECK(f.ts_ms == 1000);
        CHECK(f.frame_index == 7);
        CHECK(f.pose.person_detected);
        CHECK(f.pose.body_center.x == doctest::Approx(300.f));
        REQUIRE(f.pose.sample.distance_m.has_value());
        CHECK(*f.pose.sample.distance_m == doctest::Approx(1.4f));
        REQUIRE(f.pose.sample.reference_point.has_value());
        CHECK(f.pose.sample.reference_point->y == doctest::Approx(115.f));
        REQUIRE(f.faces.size() == 2);
        CHECK(f.faces[0].rect == cv::Rect(280, 80, 50, 70));
        CHECK(f.faces[1].conf == doctest::Approx(0.81f));
        CHECK(f.age_range.value_or("") == "25-32");
        CHECK(f.gender.value_or("") == "Female");
    }

    GIVEN("A tracked person without a confident pose")
    {
        ReplayFrame f;
        REQUIRE(parseReplayFrameFromJson(R"({"ts_ms": 5, "person": {"center": [10, 20]}})", f));
        CHECK(f.pose.person_detected);
        CHECK(f.pose.sample.empty());
        CHECK(f.faces.empty());
    }

    GIVEN("An empty frame")
    {
        ReplayFrame f;
        REQUIRE(parseReplayFrameFromJson(R"({"ts_ms": 5})", f));
        CHECK_FALSE(f.pose.person_detected);
        CHECK_FALSE(f.age_range.has_value());
    }

    GIVEN("Garbage")
    {
        ReplayFrame f;
        CHECK_FALSE(parseReplayFrameFromJson("{not json", f));
        CHECK_FALSE(parseReplayFrameFromJson("[1, 2]", f));
        CHECK_FALSE(parseReplayFrameFromJson(R"({"person": {"distance": "far"}, "faces": [{"x1": "a"}]})", f));
    }
}
