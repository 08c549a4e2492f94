#pragma once

#include <opencv2/core.hpp>

#include <array>

#include "cube_face.hpp"

namespace cubegeo {
    /// Precomputed source pixel for every pixel of one face. Depends only on
    /// (face, cube_size, source size), never on pixel content.
    struct FaceLookup {
        CubeFace face = CubeFace::Front;
        int cube_size = 0;
        cv::Size source_size;
        cv::Mat map_x;  // CV_32FC1, integral source column
        cv::Mat map_y;  // CV_32FC1, integral source row

        [[nodiscard]] bool matches(const CubeFace f, const int size, const cv::Size &src) const {
            return !map_x.empty() && face == f && cube_size == size && source_size == src;
        }
    };

    using CubeFaces = std::array<cv::Mat, kFaceCount>;

    FaceLookup buildFaceLookup(CubeFace face, int cube_size, const cv::Size &source_size);

    /// Nearest-pixel pull of one face through a prepared lookup.
    cv::Mat rasterizeFace(const cv::Mat &source, const FaceLookup &lookup);

    /// One-shot variant, builds the lookup on the fly.
    cv::Mat rasterizeFace(const cv::Mat &source, CubeFace face, int cube_size);

    /// Rasterizes all six faces of equirect panoramas, caching the lookups
    /// between calls with the same source size.
    class CubeFaceRasterizer {
    public:
        /// cube_size <= 0 selects width / 4 of each source.
        explicit CubeFaceRasterizer(int cube_size = 0, bool parallel = true);

        [[nodiscard]] int cubeSizeFor(const cv::Size &source_size) const;

        cv::Mat rasterize(const cv::Mat &source, CubeFace face);

        /// Faces in index order. The source is shared read-only between face tasks.
        CubeFaces rasterizeAll(const cv::Mat &source);

    private:
        void prepareLookups(const cv::Size &source_size);

        int cube_size_;
        bool parallel_;
        std::array<FaceLookup, kFaceCount> lookups_;
    };

    /// 4x3 cross: up above front, left/front/right/back in the middle row, down below.
    cv::Mat composeCrossLayout(const CubeFaces &faces);
} // namespace cubegeo
