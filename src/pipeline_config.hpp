#pragma once

#include <optional>
#include <string>

#include "contour_mapper.hpp"
#include "cube_face.hpp"
#include "detection_record.hpp"
#include "face_annotator.hpp"
#include "geodesic.hpp"

namespace cubegeo {
    struct PipelineConfig {
        /// 360 panoramas to process (.jpg/.jpeg/.png)
        std::string images_dir = "imagenes";
        /// each panorama writes into <output_root>/output_<stem>
        std::string output_root = ".";

        /// face side in pixels; <= 0 uses panorama width / 4
        int cube_size = 0;
        /// samples per box edge when projecting contours onto the panorama
        int contour_samples = kDefaultContourSamples;
        /// spherical Earth radius for the destination point
        double earth_radius_m = kEarthRadiusM;
        /// cv::IMWRITE_JPEG_QUALITY for faces and overlays
        int jpeg_quality = 95;

        /// also write the 4x3 cross layout
        bool write_cross_layout = true;
        /// draw detections on faces and contours on the panorama
        bool annotate = true;
        /// rasterize the six faces concurrently
        bool parallel_faces = true;

        /// used when a panorama carries no GPS EXIF
        std::optional<GeoPosition> fallback_origin;

        FaceNames face_names = defaultFaceNames();
        ClassPalette class_palette = defaultClassPalette();
    };

    /// Defaults overridden by CUBEGEO_* environment variables.
    PipelineConfig loadPipelineConfig();

    bool envEnabled(const char *name, bool default_value = false);

    int envIntOr(const char *name, int default_value, int min_value);

    double envDoubleOr(const char *name, double default_value, double min_value);

    std::optional<double> envDouble(const char *name);

    std::string envStringOr(const char *name, const std::string &default_value);
} // namespace cubegeo
