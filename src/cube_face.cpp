#include "cube_face.hpp"

#include <algorithm>
#include <cctype>

#include "geo_errors.hpp"

namespace cubegeo {
    namespace {
        // Each face maps (a, b) onto one axis-aligned cube side.
        using FaceBasisFn = cv::Vec3d (*)(double a, double b);

        constexpr std::array<FaceBasisFn, kFaceCount> kFaceBasis = {
            [](const double a, const double b) { return cv::Vec3d(a, b, 1.0); },   // front
            [](const double a, const double b) { return cv::Vec3d(1.0, b, -a); },  // right
            [](const double a, const double b) { return cv::Vec3d(-a, b, -1.0); }, // back
            [](const double a, const double b) { return cv::Vec3d(-1.0, b, a); },  // left
            [](const double a, const double b) { return cv::Vec3d(a, 1.0, -b); },  // up
            [](const double a, const double b) { return cv::Vec3d(a, -1.0, b); }   // down
        };
    }

    const FaceNames &defaultFaceNames() {
        static const FaceNames names = {"front", "right", "back", "left", "up", "down"};
        return names;
    }

    CubeFace faceFromIndex(const int index) {
        if (index < 0 || index >= kFaceCount) {
            throw InvalidFaceError("invalid face index: " + std::to_string(index));
        }
        return static_cast<CubeFace>(index);
    }

    CubeFace faceFromKey(const std::string &key, const FaceNames &names) {
        if (!key.empty() && key.size() <= 2 && std::ranges::all_of(key, [](const unsigned char c) { return std::isdigit(c) != 0; })) {
            return faceFromIndex(std::stoi(key));
        }
        for (int i = 0; i < kFaceCount; ++i) {
            if (names[i] == key) {
                return static_cast<CubeFace>(i);
            }
        }
        throw InvalidFaceError("unknown face: " + key);
    }

    NormalizedFaceCoord normalizeFaceCoord(const double i, const double j, const int cube_size) {
        NormalizedFaceCoord coord;
        coord.a = 2.0 * i / cube_size - 1.0;
        coord.b = 1.0 - 2.0 * j / cube_size;
        return coord;
    }

    cv::Vec3d faceDirection(const CubeFace face, const double a, const double b) {
        return faceDirection(faceIndex(face), a, b);
    }

    cv::Vec3d faceDirection(const int face_index, const double a, const double b) {
        if (face_index < 0 || face_index >= kFaceCount) {
            throw InvalidFaceError("invalid face index: " + std::to_string(face_index));
        }
        return kFaceBasis[face_index](a, b);
    }

    cv::Vec3d facePixelDirection(const CubeFace face, const double i, const double j, const int cube_size) {
        const auto [a, b] = normalizeFaceCoord(i, j, cube_size);
        return faceDirection(face, a, b);
    }
} // namespace cubegeo
