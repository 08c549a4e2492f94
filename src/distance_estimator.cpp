#include "distance_estimator.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <utility>
#include <vector>

#include "geo_errors.hpp"

namespace fs = std::filesystem;

namespace cubegeo {
    namespace {
        // Truncated toward zero, clamped to [0, limit] before the cast.
        int clippedIndex(const double v, const int limit) {
            if (std::isnan(v)) {
                return 0;
            }
            return static_cast<int>(std::clamp(std::trunc(v), 0.0, static_cast<double>(limit)));
        }
    }

    std::optional<double> medianDepthInRegion(const cv::Mat &depth, const BoundingBox &box) {
        if (depth.empty()) {
            return std::nullopt;
        }
        if (depth.channels() != 1) {
            throw InvalidInputError("depth map must have a single channel");
        }
        const int x1 = clippedIndex(box.x1, depth.cols);
        const int y1 = clippedIndex(box.y1, depth.rows);
        const int x2 = clippedIndex(box.x2, depth.cols);
        const int y2 = clippedIndex(box.y2, depth.rows);
        if (x2 <= x1 || y2 <= y1) {
            return std::nullopt;
        }

        cv::Mat region;
        depth(cv::Rect(x1, y1, x2 - x1, y2 - y1)).convertTo(region, CV_64F);
        std::vector<double> values;
        values.reserve(region.total());
        for (int r = 0; r < region.rows; ++r) {
            const auto *row = region.ptr<double>(r);
            values.insert(values.end(), row, row + region.cols);
        }

        const size_t mid = values.size() / 2;
        std::ranges::nth_element(values, values.begin() + static_cast<std::ptrdiff_t>(mid));
        const double upper = values[mid];
        if (values.size() % 2 == 1) {
            return upper;
        }
        const double lower = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
        return (lower + upper) / 2.0;
    }

    DepthMapDistanceEstimator::DepthMapDistanceEstimator(std::map<CubeFace, cv::Mat> depth_maps)
        : depth_maps_(std::move(depth_maps)) {
    }

    std::unique_ptr<DepthMapDistanceEstimator> DepthMapDistanceEstimator::fromDirectory(
        const std::string &dir, const FaceNames &names) {
        const std::array<std::string, 4> exts = {".exr", ".tiff", ".tif", ".png"};
        std::map<CubeFace, cv::Mat> depth_maps;
        for (const CubeFace face: kAllFaces) {
            for (const auto &ext: exts) {
                const fs::path candidate = fs::path(dir) / (names[faceIndex(face)] + "_depth" + ext);
                if (!fs::is_regular_file(candidate)) {
                    continue;
                }
                cv::Mat depth = cv::imread(candidate.string(), cv::IMREAD_ANYDEPTH);
                if (depth.empty()) {
                    std::cout << "[Distance] read failed: " << candidate << std::endl;
                    continue;
                }
                std::cout << "[Distance] depth map: " << candidate << std::endl;
                depth_maps[face] = depth;
                break;
            }
        }
        if (depth_maps.empty()) {
            return nullptr;
        }
        return std::make_unique<DepthMapDistanceEstimator>(std::move(depth_maps));
    }

    std::optional<double> DepthMapDistanceEstimator::estimate(const CubeFace face, const BoundingBox &box) {
        const auto it = depth_maps_.find(face);
        if (it == depth_maps_.end()) {
            return std::nullopt;
        }
        return medianDepthInRegion(it->second, box);
    }

    FaceDistances estimateDistances(const FaceDetections &detections, DistanceEstimator &estimator) {
        FaceDistances distances;
        size_t measured = 0;
        size_t total = 0;
        for (const auto &[face, boxes]: detections) {
            auto &face_out = distances[face];
            face_out.reserve(boxes.size());
            for (const auto &box: boxes) {
                DistanceRecord record;
                record.face = face;
                record.bbox_index = box.bbox_index;
                record.class_id = box.class_id;
                record.score = box.score;
                record.distance_m = estimator.estimate(face, box);
                if (record.distance_m) {
                    ++measured;
                }
                face_out.push_back(record);
                ++total;
            }
        }
        std::cout << "[Distance] measured " << measured << "/" << total << " boxes" << std::endl;
        return distances;
    }
} // namespace cubegeo
