#pragma once

#include <cstddef>

#include "detection_record.hpp"
#include "geodesic.hpp"

namespace cubegeo {
    struct JoinStats {
        size_t azimuths = 0;
        size_t geocoded = 0;
        size_t unmatched = 0;       // no distance record with the same bbox_index
        size_t no_distance = 0;     // matched, but the distance is absent
    };

    /// Pairs every azimuth with the distance of the same (face, bbox_index) and
    /// projects it from the origin. Azimuths without a usable distance are
    /// dropped; this is a normal outcome and never raises. Output keeps face
    /// order and each face's azimuth order.
    FaceGeocoded joinDetections(
        const GeoPosition &origin,
        const FaceAzimuths &azimuths,
        const FaceDistances &distances,
        double earth_radius_m = kEarthRadiusM,
        JoinStats *stats = nullptr);
} // namespace cubegeo
