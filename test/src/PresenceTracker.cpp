#include <doctest/doctest.h>
#include <opencv2/core.hpp>
#include "standkit/core/PresenceTracker.h"

using namespace standkit;

// -------------------------------------------------------------------------------------------------
// PresenceTracker - window fill
// Purpose:
//  • testing that no verdict is given before 10 updates and that the 10th reflects the mean.
// -------------------------------------------------------------------------------------------------
SCENARIO("PresenceTracker - slowing down needs a full window")
{
    GIVEN("A fresh tracker and a standing visitor")
    {
        PresenceTracker tracker;
        const cv::Point2f still(320.f, 240.f);

        WHEN("Nine updates arrive")
        {
            bool any = false;
            for (int i = 0; i < 9; ++i) any = any || tracker.update(still);

            THEN("All of them report false")
            {
                CHECK_FALSE(any);
                CHECK(tracker.windowSize() == 9);
                CHECK_FALSE(tracker.slowingDown());
            }

            AND_WHEN("The tenth update arrives")
            {
                bool slowing = tracker.update(still);

                THEN("It reflects the mean of the last five displacements")
                {
                    CHECK(slowing);
                    CHECK(tracker.slowingDown());
                    CHECK(tracker.windowSize() == PresenceTracker::kWindowSize);
                }
            }
        }
    }
}

SCENARIO("PresenceTracker - walking visitor is not slowing down")
{
    GIVEN("A visitor moving 5 px per frame")
    {
        PresenceTracker tracker;
        bool slowing = true;
        for (int i = 0; i < 12; ++i) slowing = tracker.update(cv::Point2f(100.f + 5.f * i, 200.f));

        THEN("The verdict is false and the window stays bounded")
        {
            CHECK_FALSE(slowing);
            CHECK(tracker.windowSize() == PresenceTracker::kWindowSize);
        }

        WHEN("The visitor stops for five frames")
        {
            for (int i = 0; i < 5; ++i) slowing = tracker.update(cv::Point2f(155.f, 200.f));
            THEN("Only the last five displacements count")
            {
                CHECK(slowing);
            }
        }

        WHEN("The visitor stops for four frames")
        {
            for (int i = 0; i < 4; ++i) slowing = tracker.update(cv::Point2f(155.f, 200.f));
            THEN("One 5 px step is still in the mean (1.0 px/frame)")
            {
                CHECK_FALSE(slowing);
            }
        }
    }
}

SCENARIO("PresenceTracker - vertical motion is ignored")
{
    PresenceTracker tracker;
    bool slowing = false;
    for (int i = 0; i < 10; ++i) slowing = tracker.update(cv::Point2f(50.f, 10.f * i));
    CHECK(slowing);
}

SCENARIO("PresenceTracker - losing the person")
{
    GIVEN("A tracker with a full window")
    {
        PresenceTracker tracker;
        for (int i = 0; i < 10; ++i) tracker.update(cv::Point2f(10.f, 10.f));
        REQUIRE(tracker.hasReference());

        WHEN("The person is lost")
        {
            tracker.lostPerson();

            THEN("The reference is forgotten but the window is kept")
            {
                CHECK_FALSE(tracker.hasReference());
                CHECK(tracker.windowSize() == PresenceTracker::kWindowSize);
            }

            AND_WHEN("Someone reappears far away")
            {
                bool slowing = tracker.update(cv::Point2f(600.f, 10.f));
                THEN("No jump is recorded and the verdict comes from the kept window")
                {
                    CHECK(slowing);
                    CHECK(tracker.hasReference());
                    CHECK(tracker.windowSize() == PresenceTracker::kWindowSize);
                }
            }
        }

        WHEN("The tracker is reset")
        {
            tracker.reset();
            THEN("It behaves like a new one")
            {
                CHECK(tracker.windowSize() == 0);
                CHECK_FALSE(tracker.hasReference());
                CHECK_FALSE(tracker.slowingDown());
            }
        }
    }
}

// -------------------------------------------------------------------------------------------------
// PresenceTracker - re-entry
// Purpose:
//  • testing that a re-entry after lostPerson() adds no displacement sample of its own.
// -------------------------------------------------------------------------------------------------
SCENARIO("PresenceTracker - re-entry does not add a zero displacement")
{
    GIVEN("A walking visitor (5 px per frame) who leaves the frame")
    {
        PresenceTracker tracker;
        for (int i = 0; i < 12; ++i) tracker.update(cv::Point2f(100.f + 5.f * i, 200.f));
        REQUIRE_FALSE(tracker.slowingDown());
        tracker.lostPerson();

        WHEN("The visitor reappears")
        {
            bool slowing = tracker.update(cv::Point2f(400.f, 200.f));

            THEN("The window is untouched and still says walking")
            {
                CHECK_FALSE(slowing);
                CHECK(tracker.windowSize() == PresenceTracker::kWindowSize);
            }

            AND_WHEN("The visitor stands still for four frames")
            {
                for (int i = 0; i < 4; ++i) slowing = tracker.update(cv::Point2f(400.f, 200.f));

                THEN("One 5 px step is still in the mean of the last five")
                {
                    CHECK_FALSE(slowing);
                }
            }

            AND_WHEN("The visitor stands still for five frames")
            {
                for (int i = 0; i < 5; ++i) slowing = tracker.update(cv::Point2f(400.f, 200.f));

                THEN("The visitor is slowing down")
                {
                    CHECK(slowing);
                }
            }
        }
    }

    GIVEN("A fresh tracker that sees a person, loses them and sees them again")
    {
        PresenceTracker tracker;
        tracker.update(cv::Point2f(10.f, 10.f));
        tracker.lostPerson();
        tracker.update(cv::Point2f(90.f, 10.f));

        THEN("Only the very first sighting was recorded")
        {
            CHECK(tracker.windowSize() == 1);
            CHECK_FALSE(tracker.slowingDown());
        }
    }
}
