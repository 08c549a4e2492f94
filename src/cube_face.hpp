#pragma once

#include <opencv2/core.hpp>

#include <array>
#include <string>

namespace cubegeo {
    /// Cube faces in index order. The index is the face id used by detection files.
    enum class CubeFace : int {
        Front = 0, // +Z
        Right = 1, // +X
        Back = 2,  // -Z
        Left = 3,  // -X
        Up = 4,    // +Y
        Down = 5   // -Y
    };

    constexpr int kFaceCount = 6;

    constexpr std::array<CubeFace, kFaceCount> kAllFaces = {
        CubeFace::Front, CubeFace::Right, CubeFace::Back,
        CubeFace::Left, CubeFace::Up, CubeFace::Down
    };

    /// Display and file names of the faces, indexed like CubeFace.
    using FaceNames = std::array<std::string, kFaceCount>;

    const FaceNames &defaultFaceNames();

    /// Throws InvalidFaceError when index is outside 0..5.
    CubeFace faceFromIndex(int index);

    /// Accepts a face index ("0".."5") or one of the given names.
    /// Throws InvalidFaceError for anything else.
    CubeFace faceFromKey(const std::string &key, const FaceNames &names = defaultFaceNames());

    [[nodiscard]] constexpr int faceIndex(const CubeFace face) {
        return static_cast<int>(face);
    }

    /// (a, b) in [-1, 1]^2. b grows upwards, opposite to the pixel row.
    struct NormalizedFaceCoord {
        double a = 0.0;
        double b = 0.0;
    };

    NormalizedFaceCoord normalizeFaceCoord(double i, double j, int cube_size);

    /// Unnormalized direction through (a, b) on the given face.
    cv::Vec3d faceDirection(CubeFace face, double a, double b);

    /// Index-checked overload for ids coming from data files.
    cv::Vec3d faceDirection(int face_index, double a, double b);

    /// Pixel (i, j) of a cube_size face to its direction.
    cv::Vec3d facePixelDirection(CubeFace face, double i, double j, int cube_size);
} // namespace cubegeo
