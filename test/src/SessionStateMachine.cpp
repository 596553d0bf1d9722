#include <doctest/doctest.h>
#include <chrono>
#include <optional>
#include "standkit/core/Demographics.h"
#include "standkit/core/SessionStateMachine.h"
#include "standkit/core/TimeUtils.h"

using namespace standkit;
using namespace std::chrono_literals;

static PresenceSample at(float distance)
{
    PresenceSample s;
    s.distance_m = distance;
    s.reference_point = cv::Point2f(100.f, 100.f);
    return s;
}

static DemographicsResolver face(const std::string& age_range, const std::string& gender, int* calls = nullptr)
{
    return [=]() -> std::optional<DemographicsResult> {
        if (calls) ++*calls;
        return makeDemographics(age_range, gender);
    };
}

static DemographicsResolver noFace(int* calls = nullptr)
{
    return [=]() -> std::optional<DemographicsResult> {
        if (calls) ++*calls;
        return std::nullopt;
    };
}

// -------------------------------------------------------------------------------------------------
// SessionStateMachine - one full visit
// Purpose:
//  • testing 2.0 m -> 1.4 m (+face) -> 1.6 m gives one activation and one record.
// -------------------------------------------------------------------------------------------------
SCENARIO("SessionStateMachine - one visit")
{
    GIVEN("An idle machine with the default 1.5 m threshold")
    {
        SessionStateMachine machine("stand-01");
        const TimePoint t0 = TimeUtils::fromEpochMs(1760000000000);
        int calls = 0;

        WHEN("The visitor is still far away")
        {
            StepResult r = machine.step(at(2.0f), t0, face("25-32", "Female", &calls));
            THEN("Nothing happens and no face match is attempted")
            {
                CHECK(r.transition == Transition::NONE);
                CHECK(machine.phase() == SessionPhase::IDLE);
                CHECK(calls == 0);
            }
        }

        WHEN("The visitor comes within range with a matched face")
        {
            StepResult r = machine.step(at(1.4f), t0, face("25-32", "Female", &calls));

            THEN("The session activates with frozen demographics")
            {
                CHECK(r.transition == Transition::ACTIVATED);
                CHECK_FALSE(r.record.has_value());
                CHECK(machine.phase() == SessionPhase::ACTIVE);
                CHECK(calls == 1);

                PipelineState s = machine.snapshot();
                REQUIRE(s.demographics.has_value());
                CHECK(s.demographics->gender == "Female");
                CHECK(s.demographics->age_bucket == AgeBucket::YOUNG);
                REQUIRE(s.last_activation.has_value());
                CHECK(*s.last_activation == t0);
            }

            AND_WHEN("The visitor stays close")
            {
                StepResult again = machine.step(at(1.0f), t0 + 10s, face("60-100", "Male", &calls));
                THEN("There is no second activation and demographics do not change")
                {
                    CHECK(again.transition == Transition::NONE);
                    CHECK(calls == 1);
                    CHECK(machine.snapshot().demographics->age_range == "25-32");
                }
            }

            AND_WHEN("The visitor steps back beyond the threshold after 90 s")
            {
                StepResult out = machine.step(at(1.6f), t0 + 90s, noFace());

                THEN("Exactly one record is produced")
                {
                    CHECK(out.transition == Transition::DEACTIVATED);
                    REQUIRE(out.record.has_value());
                    CHECK(out.record->stand_name == "stand-01");
                    CHECK(out.record->activated_at == t0);
                    CHECK(out.record->deactivated_at == t0 + 90s);
                    CHECK(out.record->dwell_minutes == doctest::Approx(1.5));
                    CHECK(out.record->demographics.gender == "Female");
                    CHECK(out.record->demographics.age == doctest::Approx(28.5));
                    CHECK(machine.phase() == SessionPhase::IDLE);
                    CHECK_FALSE(machine.snapshot().demographics.has_value());
                }

                AND_WHEN("The visitor keeps walking away")
                {
                    StepResult later = machine.step(at(3.0f), t0 + 95s, noFace());
                    CHECK(later.transition == Transition::NONE);
                    CHECK_FALSE(later.record.has_value());
                }
            }
        }
    }
}

SCENARIO("SessionStateMachine - no face, no session")
{
    SessionStateMachine machine("stand-01");
    const TimePoint t0 = TimeUtils::fromEpochMs(0);
    int calls = 0;

    for (int i = 0; i < 5; ++i) {
        StepResult r = machine.step(at(1.0f), t0 + std::chrono::seconds(i), noFace(&calls));
        CHECK(r.transition == Transition::NONE);
    }
    CHECK(machine.phase() == SessionPhase::IDLE);
    CHECK(calls == 5);

    // activation on the first frame that has a face
    StepResult r = machine.step(at(1.0f), t0 + 6s, face("8-12", "Male"));
    CHECK(r.transition == Transition::ACTIVATED);
    CHECK(*machine.snapshot().last_activation == t0 + 6s);
}

SCENARIO("SessionStateMachine - missing distance holds the state")
{
    GIVEN("An active session")
    {
        SessionStateMachine machine("stand-01");
        const TimePoint t0 = TimeUtils::fromEpochMs(0);
        REQUIRE(machine.step(at(1.0f), t0, face("44-53", "Male")).transition == Transition::ACTIVATED);

        WHEN("Frames without a distance arrive")
        {
            PresenceSample empty;
            StepResult r = machine.step(empty, t0 + 5s, noFace());
            THEN("The session stays active")
            {
                CHECK(r.transition == Transition::NONE);
                CHECK(machine.phase() == SessionPhase::ACTIVE);
            }
        }
    }
}

SCENARIO("SessionStateMachine - threshold is inclusive for activation")
{
    SessionStateMachine machine("stand-01", 2.0f);
    const TimePoint t0 = TimeUtils::fromEpochMs(0);

    CHECK(machine.wantsCandidate(at(2.0f)));
    CHECK_FALSE(machine.wantsCandidate(at(2.01f)));
    CHECK(machine.step(at(2.0f), t0, face("21-24", "Female")).transition == Transition::ACTIVATED);
    CHECK_FALSE(machine.wantsCandidate(at(1.0f)));

    // exactly at the threshold is still "in range"
    CHECK(machine.step(at(2.0f), t0 + 1s, noFace()).transition == Transition::NONE);
    CHECK(machine.step(at(2.5f), t0 + 2s, noFace()).transition == Transition::DEACTIVATED);
}

SCENARIO("SessionStateMachine - dwell is never negative")
{
    SessionStateMachine machine("stand-01");
    const TimePoint t0 = TimeUtils::fromEpochMs(1000000);
    REQUIRE(machine.step(at(1.0f), t0, face("4-6", "Male")).transition == Transition::ACTIVATED);

    // wall clock stepped back
    StepResult r = machine.step(at(2.0f), t0 - 30s, noFace());
    REQUIRE(r.record.has_value());
    CHECK(r.record->dwell_minutes == doctest::Approx(0.0));
}

SCENARIO("SessionStateMachine - reset")
{
    SessionStateMachine machine("stand-01");
    REQUIRE(machine.step(at(1.0f), TimeUtils::fromEpochMs(0), face("4-6", "Male")).transition == Transition::ACTIVATED);
    machine.reset();

    PipelineState s = machine.snapshot();
    CHECK(s.phase == SessionPhase::IDLE);
    CHECK_FALSE(s.last_activation.has_value());
    CHECK_FALSE(s.demographics.has_value());
}
