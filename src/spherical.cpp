#include "spherical.hpp"

#include <algorithm>
#include <cmath>

namespace cubegeo {
    SphericalAngles toSpherical(const cv::Vec3d &direction) {
        const double x = direction[0];
        const double y = direction[1];
        const double z = direction[2];
        SphericalAngles angles;
        angles.theta = std::atan2(y, std::sqrt(x * x + z * z));
        angles.phi = std::atan2(x, z);
        return angles;
    }

    cv::Point toEquirectPixel(const SphericalAngles &angles, const int width, const int height) {
        double x = (angles.phi / CV_PI + 1.0) * 0.5 * width;
        double y = (0.5 - angles.theta / CV_PI) * height;
        x = std::clamp(x, 0.0, static_cast<double>(width - 1));
        y = std::clamp(y, 0.0, static_cast<double>(height - 1));
        return {static_cast<int>(x), static_cast<int>(y)};
    }

    SphericalAngles fromEquirectPixel(const double x, const double y, const int width, const int height) {
        SphericalAngles angles;
        angles.phi = (x / (0.5 * width) - 1.0) * CV_PI;
        angles.theta = (0.5 - y / height) * CV_PI;
        return angles;
    }

    double azimuthDegrees(const double phi) {
        double deg = radianToDegree(phi);
        if (deg < 0.0) {
            deg += 360.0;
        }
        // tiny negative angles land on exactly 360 after the shift
        if (deg >= 360.0) {
            deg -= 360.0;
        }
        return deg;
    }

    double degreeToRadian(const double degree) {
        return degree * CV_PI / 180.0;
    }

    double radianToDegree(const double radian) {
        return radian * 180.0 / CV_PI;
    }
} // namespace cubegeo
