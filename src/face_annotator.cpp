#include "face_annotator.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <string>

#include "contour_mapper.hpp"
#include "geo_errors.hpp"

namespace cubegeo {
    ClassPalette defaultClassPalette() {
        return {
            cv::Scalar(0, 0, 255),
            cv::Scalar(0, 255, 0),
            cv::Scalar(255, 0, 0),
            cv::Scalar(0, 255, 255),
            cv::Scalar(255, 0, 255),
            cv::Scalar(255, 255, 0)
        };
    }

    const cv::Scalar &classColor(const ClassPalette &palette, const int class_id) {
        if (palette.empty()) {
            throw InvalidInputError("class palette is empty");
        }
        const int n = static_cast<int>(palette.size());
        return palette[((class_id % n) + n) % n];
    }

    cv::Mat annotateFace(const cv::Mat &face, const std::vector<BoundingBox> &boxes, const ClassPalette &palette) {
        cv::Mat canvas = face.clone();
        for (const auto &box: boxes) {
            const cv::Scalar &color = classColor(palette, box.class_id);
            const cv::Point top_left(static_cast<int>(box.x1), static_cast<int>(box.y1));
            const cv::Point bottom_right(static_cast<int>(box.x2), static_cast<int>(box.y2));
            cv::rectangle(canvas, top_left, bottom_right, color, 3);

            char label[48];
            if (box.score) {
                std::snprintf(label, sizeof(label), "%d: %.2f", box.class_id, *box.score);
            } else {
                std::snprintf(label, sizeof(label), "%d", box.class_id);
            }
            const cv::Point text_pos(top_left.x, std::max(0, top_left.y - 10));
            int baseline = 0;
            const cv::Size text_size = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, 0.4, 1, &baseline);
            cv::rectangle(canvas, cv::Rect(text_pos.x, text_pos.y, text_size.width, text_size.height + baseline),
                          cv::Scalar(0, 0, 0), cv::FILLED);
            cv::putText(canvas, label, cv::Point(text_pos.x, text_pos.y + text_size.height),
                        cv::FONT_HERSHEY_SIMPLEX, 0.4, color, 1, cv::LINE_AA);
        }
        return canvas;
    }

    ContourOverlay drawPanoramaContours(
        const cv::Mat &panorama,
        const FaceDetections &detections,
        const int cube_size,
        const ClassPalette &palette,
        const int samples_per_edge) {
        ContourOverlay overlay;
        overlay.image = panorama.clone();
        for (const auto &[face, boxes]: detections) {
            for (const auto &box: boxes) {
                const auto contour = mapBoxToEquirect(face, box, cube_size, panorama.size(), samples_per_edge);
                if (!isRenderableContour(contour)) {
                    ++overlay.rejected;
                    continue;
                }
                cv::polylines(overlay.image, contour, true, classColor(palette, box.class_id), 2, cv::LINE_AA);
                ++overlay.drawn;
            }
        }
        std::cout << "[Contour] drawn=" << overlay.drawn << ", rejected=" << overlay.rejected << std::endl;
        return overlay;
    }
} // namespace cubegeo
