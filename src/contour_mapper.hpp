#pragma once

#include <opencv2/core.hpp>

#include <vector>

#include "cube_face.hpp"
#include "detection_record.hpp"

namespace cubegeo {
    constexpr int kDefaultContourSamples = 20;

    /// Face pixel (x, y) of a cube_size face to its panorama pixel.
    cv::Point mapFacePointToEquirect(CubeFace face, double x, double y, int cube_size, const cv::Size &pano_size);

    /// Walks the box perimeter clockwise (top, right, bottom, left) sampling about
    /// samples_per_edge points per edge and maps every sample into the panorama.
    /// Zero-length edges add nothing. Boxes straddling the +-180 deg seam or a
    /// pole come back with a jump in the polyline.
    std::vector<cv::Point> mapBoxToEquirect(
        CubeFace face,
        const BoundingBox &box,
        int cube_size,
        const cv::Size &pano_size,
        int samples_per_edge = kDefaultContourSamples);

    /// Polylines of two points or fewer cannot be drawn as an outline.
    [[nodiscard]] bool isRenderableContour(const std::vector<cv::Point> &contour);
} // namespace cubegeo
