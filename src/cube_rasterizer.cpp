#include "cube_rasterizer.hpp"

#include <opencv2/imgproc.hpp>

#include <string>
#include <utility>

#include "geo_errors.hpp"
#include "spherical.hpp"

namespace cubegeo {
    namespace {
        void checkSource(const cv::Mat &source) {
            if (source.empty()) {
                throw ImageLoadError("source panorama is empty");
            }
        }

        // Tile position (column, row) of each face in the cross layout.
        constexpr std::array<std::pair<int, int>, kFaceCount> kCrossTiles = {{
            {1, 1}, // front
            {2, 1}, // right
            {3, 1}, // back
            {0, 1}, // left
            {1, 0}, // up
            {1, 2}  // down
        }};
    }

    FaceLookup buildFaceLookup(const CubeFace face, const int cube_size, const cv::Size &source_size) {
        if (cube_size <= 0) {
            throw InvalidInputError("cube size must be positive, got " + std::to_string(cube_size));
        }
        if (source_size.width <= 0 || source_size.height <= 0) {
            throw InvalidInputError("source size must be positive");
        }

        FaceLookup lookup;
        lookup.face = face;
        lookup.cube_size = cube_size;
        lookup.source_size = source_size;
        lookup.map_x.create(cube_size, cube_size, CV_32FC1);
        lookup.map_y.create(cube_size, cube_size, CV_32FC1);

        for (int j = 0; j < cube_size; ++j) {
            auto *row_x = lookup.map_x.ptr<float>(j);
            auto *row_y = lookup.map_y.ptr<float>(j);
            for (int i = 0; i < cube_size; ++i) {
                const cv::Vec3d dir = facePixelDirection(face, i, j, cube_size);
                const cv::Point src = toEquirectPixel(toSpherical(dir), source_size.width, source_size.height);
                row_x[i] = static_cast<float>(src.x);
                row_y[i] = static_cast<float>(src.y);
            }
        }
        return lookup;
    }

    cv::Mat rasterizeFace(const cv::Mat &source, const FaceLookup &lookup) {
        checkSource(source);
        if (lookup.source_size != source.size()) {
            throw InvalidInputError("face lookup was built for a different source size");
        }
        cv::Mat face_image;
        cv::remap(source, face_image, lookup.map_x, lookup.map_y, cv::INTER_NEAREST, cv::BORDER_REPLICATE);
        return face_image;
    }

    cv::Mat rasterizeFace(const cv::Mat &source, const CubeFace face, const int cube_size) {
        checkSource(source);
        return rasterizeFace(source, buildFaceLookup(face, cube_size, source.size()));
    }

    CubeFaceRasterizer::CubeFaceRasterizer(const int cube_size, const bool parallel)
        : cube_size_(cube_size), parallel_(parallel) {
    }

    int CubeFaceRasterizer::cubeSizeFor(const cv::Size &source_size) const {
        return cube_size_ > 0 ? cube_size_ : source_size.width / 4;
    }

    void CubeFaceRasterizer::prepareLookups(const cv::Size &source_size) {
        const int size = cubeSizeFor(source_size);
        for (const CubeFace face: kAllFaces) {
            FaceLookup &lookup = lookups_[faceIndex(face)];
            if (!lookup.matches(face, size, source_size)) {
                lookup = buildFaceLookup(face, size, source_size);
            }
        }
    }

    cv::Mat CubeFaceRasterizer::rasterize(const cv::Mat &source, const CubeFace face) {
        checkSource(source);
        const int size = cubeSizeFor(source.size());
        FaceLookup &lookup = lookups_[faceIndex(face)];
        if (!lookup.matches(face, size, source.size())) {
            lookup = buildFaceLookup(face, size, source.size());
        }
        return rasterizeFace(source, lookup);
    }

    CubeFaces CubeFaceRasterizer::rasterizeAll(const cv::Mat &source) {
        checkSource(source);
        prepareLookups(source.size());

        CubeFaces faces;
        const auto body = [&](const cv::Range &range) {
            for (int f = range.start; f < range.end; ++f) {
                faces[f] = rasterizeFace(source, lookups_[f]);
            }
        };
        if (parallel_) {
            cv::parallel_for_(cv::Range(0, kFaceCount), body);
        } else {
            body(cv::Range(0, kFaceCount));
        }
        return faces;
    }

    cv::Mat composeCrossLayout(const CubeFaces &faces) {
        const cv::Mat &front = faces[faceIndex(CubeFace::Front)];
        if (front.empty()) {
            throw InvalidInputError("cross layout needs all six faces");
        }
        const int size = front.cols;
        cv::Mat cross(size * 3, size * 4, front.type(), cv::Scalar::all(0));
        for (const CubeFace face: kAllFaces) {
            const cv::Mat &tile = faces[faceIndex(face)];
            if (tile.empty() || tile.size() != front.size() || tile.type() != front.type()) {
                throw InvalidInputError("cross layout needs six faces of equal size and type");
            }
            const auto [col, row] = kCrossTiles[faceIndex(face)];
            tile.copyTo(cross(cv::Rect(col * size, row * size, size, size)));
        }
        return cross;
    }
} // namespace cubegeo
