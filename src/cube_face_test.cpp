#include "cube_face.hpp"
#include "geo_errors.hpp"

#define BOOST_TEST_MODULE CubeFace

#include <boost/test/unit_test.hpp>
#include <boost/test/tools/floating_point_comparison.hpp>

using namespace cubegeo;

namespace {
    void checkVec(const cv::Vec3d &got, const cv::Vec3d &expected) {
        for (int k = 0; k < 3; ++k) {
            BOOST_CHECK_SMALL(got[k] - expected[k], 1e-12);
        }
    }
}

BOOST_AUTO_TEST_CASE(FaceCenter_IsOutwardNormal)
{
    checkVec(faceDirection(CubeFace::Front, 0.0, 0.0), {0, 0, 1});
    checkVec(faceDirection(CubeFace::Right, 0.0, 0.0), {1, 0, 0});
    checkVec(faceDirection(CubeFace::Back, 0.0, 0.0), {0, 0, -1});
    checkVec(faceDirection(CubeFace::Left, 0.0, 0.0), {-1, 0, 0});
    checkVec(faceDirection(CubeFace::Up, 0.0, 0.0), {0, 1, 0});
    checkVec(faceDirection(CubeFace::Down, 0.0, 0.0), {0, -1, 0});
}

BOOST_AUTO_TEST_CASE(FaceBasis_AxisAssignment)
{
    const double a = 0.5;
    const double b = -0.25;
    checkVec(faceDirection(0, a, b), {a, b, 1});
    checkVec(faceDirection(1, a, b), {1, b, -a});
    checkVec(faceDirection(2, a, b), {-a, b, -1});
    checkVec(faceDirection(3, a, b), {-1, b, a});
    checkVec(faceDirection(4, a, b), {a, 1, -b});
    checkVec(faceDirection(5, a, b), {a, -1, b});
}

BOOST_AUTO_TEST_CASE(FaceIndex_OutOfRangeThrows)
{
    BOOST_CHECK_THROW(faceDirection(6, 0.0, 0.0), InvalidFaceError);
    BOOST_CHECK_THROW(faceDirection(-1, 0.0, 0.0), InvalidFaceError);
    BOOST_CHECK_THROW(faceFromIndex(7), InvalidFaceError);
    BOOST_CHECK(faceFromIndex(4) == CubeFace::Up);
}

BOOST_AUTO_TEST_CASE(NormalizeFaceCoord_FlipsVerticalAxis)
{
    const auto top_left = normalizeFaceCoord(0, 0, 512);
    BOOST_CHECK_SMALL(top_left.a + 1.0, 1e-12);
    BOOST_CHECK_SMALL(top_left.b - 1.0, 1e-12);

    const auto coord = normalizeFaceCoord(150, 150, 512);
    BOOST_CHECK_SMALL(coord.a + 0.4140625, 1e-12);
    BOOST_CHECK_SMALL(coord.b - 0.4140625, 1e-12);

    // moving down a row lowers b
    BOOST_CHECK_LT(normalizeFaceCoord(10, 11, 64).b, normalizeFaceCoord(10, 10, 64).b);
}

BOOST_AUTO_TEST_CASE(FaceKey_IndexOrName)
{
    BOOST_CHECK(faceFromKey("0") == CubeFace::Front);
    BOOST_CHECK(faceFromKey("5") == CubeFace::Down);
    BOOST_CHECK(faceFromKey("left") == CubeFace::Left);
    BOOST_CHECK_THROW(faceFromKey("6"), InvalidFaceError);
    BOOST_CHECK_THROW(faceFromKey("sideways"), InvalidFaceError);
    BOOST_CHECK_THROW(faceFromKey(""), InvalidFaceError);

    FaceNames names = {"f", "r", "b", "l", "u", "d"};
    BOOST_CHECK(faceFromKey("u", names) == CubeFace::Up);
    BOOST_CHECK_THROW(faceFromKey("up", names), InvalidFaceError);
}
