#include <doctest/doctest.h>
#include <vector>
#include "standkit/core/CandidateSelector.h"

using namespace standkit;

// face centered dist px to the right of (0,0)
static FaceCandidate faceAt(int dist, float conf)
{
    FaceCandidate f;
    f.rect = cv::Rect(dist - 10, -10, 20, 20);
    f.conf = conf;
    return f;
}

SCENARIO("CandidateSelector - picking the visitor's face")
{
    const cv::Point2f nose(0.f, 0.f);

    GIVEN("No faces")
    {
        CHECK_FALSE(CandidateSelector::select({}, nose).has_value());
    }

    GIVEN("A far confident face followed by a nearer, more confident one")
    {
        std::vector<FaceCandidate> faces = {faceAt(50, 0.9f), faceAt(10, 0.95f)};
        auto best = CandidateSelector::select(faces, nose);
        THEN("The nearer one wins")
        {
            REQUIRE(best.has_value());
            CHECK(best->conf == doctest::Approx(0.95f));
            CHECK(CandidateSelector::centerDistance(*best, nose) == doctest::Approx(10.0));
        }
    }

    GIVEN("A far face followed by a nearer but less confident one")
    {
        std::vector<FaceCandidate> faces = {faceAt(50, 0.95f), faceAt(10, 0.9f)};
        THEN("Nothing is selected")
        {
            CHECK_FALSE(CandidateSelector::select(faces, nose).has_value());
        }
    }

    GIVEN("A pick, a nearer weaker face, then a face between them that beats the pick")
    {
        std::vector<FaceCandidate> faces = {faceAt(50, 0.95f), faceAt(10, 0.90f), faceAt(30, 0.99f)};
        auto best = CandidateSelector::select(faces, nose);
        THEN("The weaker face only voids the pick, the last face is compared against the pick")
        {
            REQUIRE(best.has_value());
            CHECK(best->conf == doctest::Approx(0.99f));
            CHECK(CandidateSelector::centerDistance(*best, nose) == doctest::Approx(30.0));
        }
    }

    GIVEN("A near face followed by a farther one")
    {
        std::vector<FaceCandidate> faces = {faceAt(10, 0.8f), faceAt(50, 0.99f)};
        auto best = CandidateSelector::select(faces, nose);
        THEN("The farther face is never considered")
        {
            REQUIRE(best.has_value());
            CHECK(best->conf == doctest::Approx(0.8f));
        }
    }

    GIVEN("A single face with zero confidence")
    {
        std::vector<FaceCandidate> faces = {faceAt(5, 0.f)};
        THEN("It does not beat the zero confidence floor")
        {
            CHECK_FALSE(CandidateSelector::select(faces, nose).has_value());
        }
    }
}

TEST_CASE("CandidateSelector - centerDistance uses the box center")
{
    FaceCandidate f;
    f.rect = cv::Rect(cv::Point(0, 0), cv::Point(6, 8));   // center (3,4)
    CHECK(CandidateSelector::centerDistance(f, cv::Point2f(0.f, 0.f)) == doctest::Approx(5.0));
}
