#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <random>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "engage/locator.hpp"

using namespace engage;

namespace {

cv::Mat noiseImage(int rows, int cols, std::uint64_t seed)
{
    cv::Mat image(rows, cols, CV_8UC3);
    cv::RNG rng(seed);
    rng.fill(image, cv::RNG::UNIFORM, cv::Scalar::all(0), cv::Scalar::all(256));
    return image;
}

ReferenceTemplate makeGlyph(double threshold = kDefaultThreshold)
{
    ReferenceTemplate tmpl;
    tmpl.name = "like_button";
    tmpl.image = noiseImage(40, 40, 7);
    tmpl.threshold = threshold;
    return tmpl;
}

void stamp(cv::Mat& frame, const cv::Mat& glyph, int x, int y)
{
    glyph.copyTo(frame(cv::Rect(x, y, glyph.cols, glyph.rows)));
}

cv::Mat degraded(const cv::Mat& glyph)
{
    cv::Mat noise(glyph.size(), CV_16SC3);
    cv::RNG rng(99);
    rng.fill(noise, cv::RNG::UNIFORM, cv::Scalar::all(-30), cv::Scalar::all(31));
    cv::Mat widened;
    glyph.convertTo(widened, CV_16SC3);
    widened += noise;
    cv::Mat result;
    widened.convertTo(result, CV_8UC3);
    return result;
}

}  // namespace

TEST(LocatorTest, TopmostPicksUppermostDistinctMatch)
{
    ReferenceTemplate tmpl = makeGlyph();
    cv::Mat frame = noiseImage(1200, 400, 11);
    stamp(frame, tmpl.image, 100, 200);
    stamp(frame, tmpl.image, 200, 210);
    stamp(frame, tmpl.image, 100, 1000);

    LocateResult result = locate(frame, tmpl, SelectionPolicy::Topmost);

    ASSERT_TRUE(result.found);
    EXPECT_EQ(result.x, 120);
    EXPECT_EQ(result.y, 220);
    EXPECT_GT(result.confidence, 0.99);
    EXPECT_LE(result.confidence, 1.0);
    EXPECT_EQ(result.candidate_count, 2u);
}

TEST(LocatorTest, HighestConfidencePrefersCleanMatchOverHigherDegradedOne)
{
    ReferenceTemplate tmpl = makeGlyph();
    cv::Mat frame = noiseImage(1200, 400, 11);
    stamp(frame, degraded(tmpl.image), 50, 100);
    stamp(frame, tmpl.image, 250, 800);

    LocateResult topmost = locate(frame, tmpl, SelectionPolicy::Topmost);
    LocateResult best = locate(frame, tmpl, SelectionPolicy::HighestConfidence);

    ASSERT_TRUE(topmost.found);
    EXPECT_EQ(topmost.x, 70);
    EXPECT_EQ(topmost.y, 120);
    EXPECT_LT(topmost.confidence, 0.999);

    ASSERT_TRUE(best.found);
    EXPECT_EQ(best.x, 270);
    EXPECT_EQ(best.y, 820);
    EXPECT_GT(best.confidence, topmost.confidence);
}

TEST(LocatorTest, NotFoundReportsBestObservedConfidence)
{
    ReferenceTemplate tmpl = makeGlyph();
    cv::Mat frame = noiseImage(600, 300, 23);

    LocateResult result = locate(frame, tmpl, SelectionPolicy::Topmost);

    EXPECT_FALSE(result.found);
    EXPECT_GT(result.confidence, 0.0);
    EXPECT_LT(result.confidence, tmpl.threshold);
    EXPECT_EQ(result.candidate_count, 0u);
}

TEST(LocatorTest, MatchJustBelowThresholdIsNotFound)
{
    ReferenceTemplate tmpl = makeGlyph(0.995);
    cv::Mat frame = noiseImage(600, 300, 23);
    stamp(frame, degraded(tmpl.image), 40, 40);

    LocateResult result = locate(frame, tmpl, SelectionPolicy::Topmost);

    EXPECT_FALSE(result.found);
    EXPECT_GT(result.confidence, 0.9);
    EXPECT_LT(result.confidence, 0.995);
}

TEST(LocatorTest, RepeatedCallsGiveIdenticalResults)
{
    ReferenceTemplate tmpl = makeGlyph();
    cv::Mat frame = noiseImage(800, 300, 5);
    stamp(frame, tmpl.image, 30, 400);

    EXPECT_EQ(locate(frame, tmpl, SelectionPolicy::Topmost), locate(frame, tmpl, SelectionPolicy::Topmost));
}

TEST(LocatorTest, GrayTemplateMatchesColorFrame)
{
    ReferenceTemplate tmpl = makeGlyph();
    cv::Mat frame = noiseImage(500, 300, 5);
    stamp(frame, tmpl.image, 60, 300);
    cv::cvtColor(tmpl.image, tmpl.image, cv::COLOR_BGR2GRAY);

    LocateResult result = locate(frame, tmpl, SelectionPolicy::Topmost);

    ASSERT_TRUE(result.found);
    EXPECT_EQ(result.x, 80);
    EXPECT_EQ(result.y, 320);
}

TEST(LocatorTest, GrayscaleOptionStillFindsGlyph)
{
    ReferenceTemplate tmpl = makeGlyph();
    cv::Mat frame = noiseImage(500, 300, 5);
    stamp(frame, tmpl.image, 10, 10);

    LocatorOptions options;
    options.grayscale = true;
    LocateResult result = locate(frame, tmpl, SelectionPolicy::Topmost, options);

    ASSERT_TRUE(result.found);
    EXPECT_EQ(result.x, 30);
    EXPECT_EQ(result.y, 30);
}

TEST(LocatorTest, UnusableInputsRaiseImageLoadError)
{
    ReferenceTemplate tmpl = makeGlyph();

    EXPECT_THROW(locate(cv::Mat(), tmpl, SelectionPolicy::Topmost), ImageLoadError);

    cv::Mat tiny = noiseImage(20, 20, 1);
    EXPECT_THROW(locate(tiny, tmpl, SelectionPolicy::Topmost), ImageLoadError);

    cv::Mat wide(200, 200, CV_16UC3, cv::Scalar::all(1000));
    EXPECT_THROW(locate(wide, tmpl, SelectionPolicy::Topmost), ImageLoadError);

    ReferenceTemplate empty = tmpl;
    empty.image = cv::Mat();
    EXPECT_THROW(locate(noiseImage(200, 200, 1), empty, SelectionPolicy::Topmost), ImageLoadError);
}

TEST(LocatorTest, TwoChannelFrameRaisesImageLoadError)
{
    ReferenceTemplate tmpl = makeGlyph();
    cv::Mat frame(200, 200, CV_8UC2, cv::Scalar::all(90));

    EXPECT_THROW(locate(frame, tmpl, SelectionPolicy::Topmost), ImageLoadError);

    LocatorOptions gray;
    gray.grayscale = true;
    EXPECT_THROW(locate(frame, tmpl, SelectionPolicy::Topmost, gray), ImageLoadError);
}

TEST(LocatorTest, ThresholdIsComparedAtFullPrecision)
{
    ReferenceTemplate tmpl = makeGlyph(0.3);
    cv::Mat frame = noiseImage(300, 300, 21);
    stamp(frame, degraded(tmpl.image), 120, 80);

    LocateResult best = locate(frame, tmpl, SelectionPolicy::HighestConfidence);
    ASSERT_TRUE(best.found);
    ASSERT_LT(best.confidence, 1.0);

    // Just above the best score, but equal to it once narrowed to float.
    tmpl.threshold = std::nextafter(best.confidence, 2.0);
    LocateResult result = locate(frame, tmpl, SelectionPolicy::HighestConfidence);
    EXPECT_FALSE(result.found);

    tmpl.threshold = best.confidence;
    result = locate(frame, tmpl, SelectionPolicy::HighestConfidence);
    ASSERT_TRUE(result.found);
    EXPECT_GE(result.confidence, tmpl.threshold);
}

TEST(LocatorTest, TemplateLocatorRejectsUnknownControl)
{
    TemplateLibrary library;
    library.add(makeGlyph());
    TemplateLocator locator(library, LocatorOptions{});

    EXPECT_THROW(locator.locate(noiseImage(200, 200, 3), "follow_button", SelectionPolicy::Topmost),
                 ImageLoadError);
}

TEST(LocatorTest, TemplateLocatorUsesNamedTemplate)
{
    TemplateLibrary library;
    library.add(makeGlyph());
    TemplateLocator locator(library, LocatorOptions{});
    cv::Mat frame = noiseImage(400, 300, 8);
    stamp(frame, library.at("like_button").image, 100, 150);

    LocateResult result = locator.locate(frame, "like_button", SelectionPolicy::Topmost);

    ASSERT_TRUE(result.found);
    EXPECT_EQ(result.x, 120);
    EXPECT_EQ(result.y, 170);
}

TEST(DeduplicateTest, KeepsFirstCandidateOfEachVerticalCluster)
{
    std::vector<Candidate> input{
        {10, 300, 0.7}, {12, 310, 0.9}, {15, 340, 0.8}, {20, 400, 0.75}, {18, 351, 0.66},
    };

    std::vector<Candidate> distinct = deduplicateCandidates(input, 50);

    ASSERT_EQ(distinct.size(), 2u);
    EXPECT_EQ(distinct[0].y, 300);
    EXPECT_EQ(distinct[1].y, 351);
}

TEST(DeduplicateTest, ZeroRadiusKeepsEverything)
{
    std::vector<Candidate> input{{0, 5, 0.7}, {0, 5, 0.8}, {0, 6, 0.9}};
    EXPECT_EQ(deduplicateCandidates(input, 0).size(), 3u);
}

TEST(DeduplicateTest, RandomCandidatesSatisfySeparationAndCoverage)
{
    std::mt19937 gen(1234);
    std::uniform_int_distribution<int> coord(0, 1919);
    std::uniform_real_distribution<double> conf(0.65, 1.0);

    for (int round = 0; round < 20; ++round) {
        std::vector<Candidate> input;
        for (int i = 0; i < 200; ++i) {
            input.push_back(Candidate{coord(gen) % 1080, coord(gen), conf(gen)});
        }
        std::vector<Candidate> distinct = deduplicateCandidates(input, 50);

        for (std::size_t i = 0; i < distinct.size(); ++i) {
            for (std::size_t j = i + 1; j < distinct.size(); ++j) {
                EXPECT_GE(std::abs(distinct[i].y - distinct[j].y), 50);
            }
        }
        for (const auto& candidate : input) {
            bool covered = false;
            for (const auto& kept : distinct) {
                if (std::abs(candidate.y - kept.y) < 50) {
                    covered = true;
                    break;
                }
            }
            EXPECT_TRUE(covered);
        }
    }
}

TEST(SelectCandidateTest, PoliciesPickExpectedCandidate)
{
    std::vector<Candidate> distinct{{1, 900, 0.95}, {2, 100, 0.7}, {3, 500, 0.8}};

    EXPECT_EQ(selectCandidate(distinct, SelectionPolicy::Topmost).x, 2);
    EXPECT_EQ(selectCandidate(distinct, SelectionPolicy::HighestConfidence).x, 1);
    EXPECT_THROW(selectCandidate({}, SelectionPolicy::Topmost), std::invalid_argument);
}

TEST(LocateResultTest, JsonShapeForFoundAndNotFound)
{
    Json found = toJson(LocateResult::Found(12, 34, 0.875, 3));
    EXPECT_TRUE(found["success"].as_bool());
    EXPECT_EQ(found["x"].as_int(), 12);
    EXPECT_EQ(found["y"].as_int(), 34);
    EXPECT_EQ(found["count"].as_int(), 3);

    Json missing = toJson(LocateResult::NotFound(0.4));
    EXPECT_FALSE(missing["success"].as_bool());
    EXPECT_TRUE(missing["x"].is_null());
    EXPECT_EQ(missing["error"].as_string(), "NOT_FOUND");
    EXPECT_DOUBLE_EQ(missing["confidence"].as_number(), 0.4);
}
