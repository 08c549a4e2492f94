#pragma once

#include <opencv2/core.hpp>

namespace cubegeo {
    /// theta: elevation in (-pi/2, pi/2). phi: azimuth in (-pi, pi], 0 on +Z, growing towards +X.
    struct SphericalAngles {
        double theta = 0.0;
        double phi = 0.0;
    };

    SphericalAngles toSpherical(const cv::Vec3d &direction);

    /// Angles to an equirect pixel of a width x height panorama.
    /// Both axes are clamped to [0, dim - 1] before truncation.
    cv::Point toEquirectPixel(const SphericalAngles &angles, int width, int height);

    /// Inverse of toEquirectPixel for continuous pixel coordinates (no clamping).
    SphericalAngles fromEquirectPixel(double x, double y, int width, int height);

    /// Compass degrees in [0, 360) from an azimuth angle.
    double azimuthDegrees(double phi);

    double degreeToRadian(double degree);

    double radianToDegree(double radian);
} // namespace cubegeo
