#pragma once

#include <opencv2/core.hpp>

#include <cstddef>
#include <vector>

#include "detection_record.hpp"

namespace cubegeo {
    /// BGR colours picked by class_id modulo the palette size.
    using ClassPalette = std::vector<cv::Scalar>;

    /// red, green, blue, yellow, magenta, cyan
    ClassPalette defaultClassPalette();

    const cv::Scalar &classColor(const ClassPalette &palette, int class_id);

    /// Copy of a face with each box outlined and labelled "<class>: <score>" (class alone without a score).
    cv::Mat annotateFace(const cv::Mat &face, const std::vector<BoundingBox> &boxes, const ClassPalette &palette);

    struct ContourOverlay {
        cv::Mat image;
        size_t drawn = 0;
        size_t rejected = 0;    // polylines too short to draw
    };

    /// Copy of the panorama with every box's projected outline.
    ContourOverlay drawPanoramaContours(
        const cv::Mat &panorama,
        const FaceDetections &detections,
        int cube_size,
        const ClassPalette &palette,
        int samples_per_edge);
} // namespace cubegeo
