#pragma once

#include <map>
#include <optional>
#include <vector>

#include "cube_face.hpp"

namespace cubegeo {
    /// Axis-aligned box in a face's pixel space plus the detector's verdict.
    struct BoundingBox {
        double x1 = 0;
        double y1 = 0;
        double x2 = 0;
        double y2 = 0;
        int class_id = -1;          // -1 when the detector gave no class
        std::optional<double> score;        // confidence 0..1, empty when the detector gave none
        int bbox_index = 0;         // position in the face's detection list

        [[nodiscard]] double centerX() const { return (x1 + x2) / 2.0; }

        [[nodiscard]] double centerY() const { return (y1 + y2) / 2.0; }

        /// x1 <= x2, y1 <= y2 and all corners finite.
        [[nodiscard]] bool isValid() const;
    };

    struct AzimuthRecord {
        CubeFace face = CubeFace::Front;
        int bbox_index = 0;
        int class_id = -1;
        double azimuth_deg = 0;     // [0, 360), clockwise from the panorama centre
    };

    struct DistanceRecord {
        CubeFace face = CubeFace::Front;
        int bbox_index = 0;
        int class_id = -1;
        std::optional<double> score;
        std::optional<double> distance_m;   // absent when the estimator region was empty
    };

    struct GeoPosition {
        double latitude = 0;        // decimal degrees
        double longitude = 0;       // decimal degrees
        std::optional<double> altitude;     // metres, negative below sea level
    };

    struct GeocodedDetection {
        int bbox_index = 0;
        int class_id = -1;
        std::optional<double> score;
        double azimuth_deg = 0;
        double distance_m = 0;
        double latitude = 0;
        double longitude = 0;
    };

    // Per-face lists keyed by face; std::map keeps the face enumeration order.
    using FaceDetections = std::map<CubeFace, std::vector<BoundingBox> >;
    using FaceAzimuths = std::map<CubeFace, std::vector<AzimuthRecord> >;
    using FaceDistances = std::map<CubeFace, std::vector<DistanceRecord> >;
    using FaceGeocoded = std::map<CubeFace, std::vector<GeocodedDetection> >;
} // namespace cubegeo
