#include "azimuth_resolver.hpp"

#include <iostream>
#include <string>

#include "geo_errors.hpp"
#include "spherical.hpp"

namespace cubegeo {
    double azimuthOfPixel(const CubeFace face, const double x, const double y, const int cube_size) {
        if (cube_size <= 0) {
            throw InvalidInputError("cube size must be positive, got " + std::to_string(cube_size));
        }
        const cv::Vec3d dir = facePixelDirection(face, x, y, cube_size);
        return azimuthDegrees(toSpherical(dir).phi);
    }

    double azimuthOf(const CubeFace face, const BoundingBox &box, const int cube_size) {
        if (!box.isValid()) {
            throw InvalidInputError("bounding box " + std::to_string(box.bbox_index) + " is not a valid rectangle");
        }
        return azimuthOfPixel(face, box.centerX(), box.centerY(), cube_size);
    }

    FaceAzimuths computeAzimuths(const FaceDetections &detections, const int cube_size) {
        FaceAzimuths azimuths;
        size_t total = 0;
        for (const auto &[face, boxes]: detections) {
            auto &face_out = azimuths[face];
            face_out.reserve(boxes.size());
            for (const auto &box: boxes) {
                AzimuthRecord record;
                record.face = face;
                record.bbox_index = box.bbox_index;
                record.class_id = box.class_id;
                record.azimuth_deg = azimuthOf(face, box, cube_size);
                face_out.push_back(record);
            }
            total += face_out.size();
        }
        std::cout << "[Azimuth] computed " << total << " azimuths over "
                << azimuths.size() << " faces (cube_size=" << cube_size << ")" << std::endl;
        return azimuths;
    }
} // namespace cubegeo
