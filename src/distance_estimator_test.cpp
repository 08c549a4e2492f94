#include "distance_estimator.hpp"
#include "geo_errors.hpp"

#include <map>
#include <optional>

#define BOOST_TEST_MODULE DistanceEstimator

#include <boost/test/unit_test.hpp>
#include <boost/test/tools/floating_point_comparison.hpp>

using namespace cubegeo;

namespace {
    BoundingBox box(const double x1, const double y1, const double x2, const double y2, const int index = 0) {
        BoundingBox b;
        b.x1 = x1;
        b.y1 = y1;
        b.x2 = x2;
        b.y2 = y2;
        b.bbox_index = index;
        b.class_id = 1;
        b.score = 0.75;
        return b;
    }

    // depth(x, y) = y * cols + x
    cv::Mat rampDepth(const int rows, const int cols) {
        cv::Mat depth(rows, cols, CV_32F);
        for (int y = 0; y < rows; ++y) {
            for (int x = 0; x < cols; ++x) {
                depth.at<float>(y, x) = static_cast<float>(y * cols + x);
            }
        }
        return depth;
    }

    class FixedEstimator : public DistanceEstimator {
    public:
        std::optional<double> estimate(const CubeFace face, const BoundingBox &b) override {
            if (face == CubeFace::Down) {
                return std::nullopt;
            }
            return 10.0 + b.bbox_index;
        }
    };
}

BOOST_AUTO_TEST_CASE(Median_OddCount)
{
    const cv::Mat depth = rampDepth(4, 4);
    // columns 0..2 of row 0: 0, 1, 2
    const auto median = medianDepthInRegion(depth, box(0, 0, 3, 1));
    BOOST_REQUIRE(median.has_value());
    BOOST_CHECK_CLOSE(*median, 1.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(Median_EvenCountAveragesMiddle)
{
    const cv::Mat depth = rampDepth(4, 4);
    // rows 0..1, cols 0..1: 0, 1, 4, 5
    const auto median = medianDepthInRegion(depth, box(0, 0, 2, 2));
    BOOST_REQUIRE(median.has_value());
    BOOST_CHECK_CLOSE(*median, 2.5, 1e-9);
}

BOOST_AUTO_TEST_CASE(Median_BoundsTruncatedAndClipped)
{
    const cv::Mat depth = rampDepth(4, 4);
    // 2.9 -> 2 and 100 -> 4: row 3, cols 2..3 are 14, 15
    const auto median = medianDepthInRegion(depth, box(2.9, 3.2, 100.0, 100.0));
    BOOST_REQUIRE(median.has_value());
    BOOST_CHECK_CLOSE(*median, 14.5, 1e-9);
}

BOOST_AUTO_TEST_CASE(Median_HugeCoordinatesClipped)
{
    const cv::Mat depth = rampDepth(4, 4);
    // rows 2..3, all columns: 8..15
    const auto median = medianDepthInRegion(depth, box(-1e12, 2.0, 1e12, 1e15));
    BOOST_REQUIRE(median.has_value());
    BOOST_CHECK_CLOSE(*median, 11.5, 1e-9);
}

BOOST_AUTO_TEST_CASE(Median_EmptyRegion)
{
    const cv::Mat depth = rampDepth(4, 4);
    BOOST_CHECK(!medianDepthInRegion(depth, box(2, 2, 2, 3)).has_value());
    BOOST_CHECK(!medianDepthInRegion(depth, box(10, 10, 20, 20)).has_value());
    BOOST_CHECK(!medianDepthInRegion(cv::Mat(), box(0, 0, 2, 2)).has_value());
}

BOOST_AUTO_TEST_CASE(Median_RejectsMultiChannel)
{
    const cv::Mat depth(4, 4, CV_32FC3, cv::Scalar::all(1.0));
    BOOST_CHECK_THROW(medianDepthInRegion(depth, box(0, 0, 2, 2)), InvalidInputError);
}

BOOST_AUTO_TEST_CASE(DepthMap_MissingFaceHasNoDistance)
{
    std::map<CubeFace, cv::Mat> maps;
    maps[CubeFace::Front] = cv::Mat(8, 8, CV_16U, cv::Scalar::all(7));
    DepthMapDistanceEstimator estimator(maps);

    BOOST_CHECK_EQUAL(estimator.faceCount(), 1u);
    const auto front = estimator.estimate(CubeFace::Front, box(1, 1, 5, 5));
    BOOST_REQUIRE(front.has_value());
    BOOST_CHECK_CLOSE(*front, 7.0, 1e-9);
    BOOST_CHECK(!estimator.estimate(CubeFace::Back, box(1, 1, 5, 5)).has_value());
}

BOOST_AUTO_TEST_CASE(EstimateDistances_AlignedWithDetections)
{
    FaceDetections detections;
    detections[CubeFace::Front] = {box(0, 0, 1, 1, 0), box(0, 0, 1, 1, 1)};
    detections[CubeFace::Down] = {box(0, 0, 1, 1, 0)};
    detections[CubeFace::Down][0].score.reset();
    detections[CubeFace::Left] = {};

    FixedEstimator estimator;
    const FaceDistances distances = estimateDistances(detections, estimator);

    BOOST_REQUIRE_EQUAL(distances.size(), 3u);
    const auto &front = distances.at(CubeFace::Front);
    BOOST_REQUIRE_EQUAL(front.size(), 2u);
    BOOST_CHECK_EQUAL(front[1].bbox_index, 1);
    BOOST_CHECK_EQUAL(front[1].class_id, 1);
    BOOST_REQUIRE(front[1].score.has_value());
    BOOST_CHECK_CLOSE(*front[1].score, 0.75, 1e-9);
    BOOST_REQUIRE(front[1].distance_m.has_value());
    BOOST_CHECK_CLOSE(*front[1].distance_m, 11.0, 1e-9);

    BOOST_REQUIRE_EQUAL(distances.at(CubeFace::Down).size(), 1u);
    BOOST_CHECK(!distances.at(CubeFace::Down)[0].distance_m.has_value());
    BOOST_CHECK(!distances.at(CubeFace::Down)[0].score.has_value());
    BOOST_CHECK(distances.at(CubeFace::Left).empty());
}
