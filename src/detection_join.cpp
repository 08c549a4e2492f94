#include "detection_join.hpp"

#include <iostream>
#include <unordered_map>

namespace cubegeo {
    FaceGeocoded joinDetections(
        const GeoPosition &origin,
        const FaceAzimuths &azimuths,
        const FaceDistances &distances,
        const double earth_radius_m,
        JoinStats *stats) {
        JoinStats local_stats;
        FaceGeocoded geocoded;

        for (const auto &[face, face_azimuths]: azimuths) {
            // First record wins when a face lists the same bbox_index twice.
            std::unordered_map<int, const DistanceRecord *> by_index;
            if (const auto it = distances.find(face); it != distances.end()) {
                by_index.reserve(it->second.size());
                for (const auto &record: it->second) {
                    by_index.try_emplace(record.bbox_index, &record);
                }
            }

            auto &face_out = geocoded[face];
            for (const auto &azimuth: face_azimuths) {
                ++local_stats.azimuths;
                const auto match = by_index.find(azimuth.bbox_index);
                if (match == by_index.end()) {
                    ++local_stats.unmatched;
                    continue;
                }
                const DistanceRecord &distance = *match->second;
                if (!distance.distance_m.has_value()) {
                    ++local_stats.no_distance;
                    continue;
                }

                const GeoPosition target = destinationPoint(
                    origin, azimuth.azimuth_deg, *distance.distance_m, earth_radius_m);
                GeocodedDetection detection;
                detection.bbox_index = azimuth.bbox_index;
                detection.class_id = azimuth.class_id;
                detection.score = distance.score;
                detection.azimuth_deg = azimuth.azimuth_deg;
                detection.distance_m = *distance.distance_m;
                detection.latitude = target.latitude;
                detection.longitude = target.longitude;
                face_out.push_back(detection);
                ++local_stats.geocoded;
            }
        }

        std::cout << "[Join] azimuths=" << local_stats.azimuths
                << ", geocoded=" << local_stats.geocoded
                << ", unmatched=" << local_stats.unmatched
                << ", no_distance=" << local_stats.no_distance << std::endl;
        if (stats) {
            *stats = local_stats;
        }
        return geocoded;
    }
} // namespace cubegeo
