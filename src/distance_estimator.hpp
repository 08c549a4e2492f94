#pragma once

#include <opencv2/core.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "cube_face.hpp"
#include "detection_record.hpp"

namespace cubegeo {
    /// Distance source for boxes on cube faces (depth network, lidar, files...).
    class DistanceEstimator {
    public:
        virtual ~DistanceEstimator() = default;

        /// Metres to the object inside box, empty when nothing can be measured.
        virtual std::optional<double> estimate(CubeFace face, const BoundingBox &box) = 0;
    };

    /// Median of depth[y1:y2, x1:x2] with bounds truncated to int and clipped
    /// to the map. Empty region gives no value. depth must be single channel.
    std::optional<double> medianDepthInRegion(const cv::Mat &depth, const BoundingBox &box);

    /// Reads distances off per-face metric depth maps.
    class DepthMapDistanceEstimator : public DistanceEstimator {
    public:
        explicit DepthMapDistanceEstimator(std::map<CubeFace, cv::Mat> depth_maps);

        /// Loads <face>_depth.exr / .tiff / .tif / .png from dir. Returns nullptr
        /// when no face has a depth map.
        static std::unique_ptr<DepthMapDistanceEstimator> fromDirectory(
            const std::string &dir, const FaceNames &names = defaultFaceNames());

        std::optional<double> estimate(CubeFace face, const BoundingBox &box) override;

        [[nodiscard]] size_t faceCount() const { return depth_maps_.size(); }

    private:
        std::map<CubeFace, cv::Mat> depth_maps_;
    };

    /// One record per box, aligned with the detection lists.
    FaceDistances estimateDistances(const FaceDetections &detections, DistanceEstimator &estimator);
} // namespace cubegeo
