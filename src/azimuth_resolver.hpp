#pragma once

#include "cube_face.hpp"
#include "detection_record.hpp"

namespace cubegeo {
    /// Compass bearing of a face pixel, degrees in [0, 360).
    double azimuthOfPixel(CubeFace face, double x, double y, int cube_size);

    /// Bearing of the box centroid. The centroid stands in for the whole box.
    double azimuthOf(CubeFace face, const BoundingBox &box, int cube_size);

    /// One record per box, keeping each face's detection order.
    FaceAzimuths computeAzimuths(const FaceDetections &detections, int cube_size);
} // namespace cubegeo
