#include "contour_mapper.hpp"

#include <algorithm>
#include <string>

#include "geo_errors.hpp"
#include "spherical.hpp"

namespace cubegeo {
    namespace {
        /// Visits from..to inclusive in either direction. length is the
        /// untruncated edge length and sets the step.
        template<typename Visit>
        void walkEdge(const int from, const int to, const double length, const int samples, Visit &&visit) {
            if (from == to) {
                return;
            }
            const int step = std::max(1, static_cast<int>(length / samples));
            if (from < to) {
                for (int v = from; v <= to; v += step) {
                    visit(v);
                }
            } else {
                for (int v = from; v >= to; v -= step) {
                    visit(v);
                }
            }
        }
    }

    cv::Point mapFacePointToEquirect(
        const CubeFace face,
        const double x,
        const double y,
        const int cube_size,
        const cv::Size &pano_size) {
        const cv::Vec3d dir = facePixelDirection(face, x, y, cube_size);
        return toEquirectPixel(toSpherical(dir), pano_size.width, pano_size.height);
    }

    std::vector<cv::Point> mapBoxToEquirect(
        const CubeFace face,
        const BoundingBox &box,
        const int cube_size,
        const cv::Size &pano_size,
        const int samples_per_edge) {
        if (!box.isValid()) {
            throw InvalidInputError("bounding box " + std::to_string(box.bbox_index) + " is not a valid rectangle");
        }
        if (cube_size <= 0 || samples_per_edge <= 0) {
            throw InvalidInputError("cube size and samples per edge must be positive");
        }

        const int ix1 = static_cast<int>(box.x1);
        const int iy1 = static_cast<int>(box.y1);
        const int ix2 = static_cast<int>(box.x2);
        const int iy2 = static_cast<int>(box.y2);
        const double width = box.x2 - box.x1;
        const double height = box.y2 - box.y1;

        std::vector<cv::Point> contour;
        contour.reserve(4 * (samples_per_edge + 1));
        const auto emit = [&](const double x, const double y) {
            contour.push_back(mapFacePointToEquirect(face, x, y, cube_size, pano_size));
        };

        walkEdge(ix1, ix2, width, samples_per_edge, [&](const int x) { emit(x, box.y1); });   // top
        walkEdge(iy1, iy2, height, samples_per_edge, [&](const int y) { emit(box.x2, y); });  // right
        walkEdge(ix2, ix1, width, samples_per_edge, [&](const int x) { emit(x, box.y2); });   // bottom
        walkEdge(iy2, iy1, height, samples_per_edge, [&](const int y) { emit(box.x1, y); });  // left
        return contour;
    }

    bool isRenderableContour(const std::vector<cv::Point> &contour) {
        return contour.size() > 2;
    }
} // namespace cubegeo
