#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "cube_rasterizer.hpp"
#include "detection_record.hpp"
#include "pipeline_config.hpp"

namespace cubegeo {
    enum class ImageStatus {
        Complete,   // coords.json written
        Incomplete, // a later stage lacked its input (detections, distances, origin)
        Skipped     // the panorama could not be processed at all
    };

    struct ImageOutcome {
        std::string image_path;
        ImageStatus status = ImageStatus::Skipped;
        std::string note;
    };

    /// Distance files looked up in an image's output folder, first match wins.
    inline const std::array<std::string, 2> kDistanceFiles = {"distances.json", "distances_unidepth.json"};

    std::optional<std::string> findDistancesFile(const std::string &out_dir);

    /// EXIF origin, else the configured fallback. Unreadable or malformed
    /// GPS data counts as absent.
    std::optional<GeoPosition> resolveOrigin(const std::string &image_path, const PipelineConfig &config);

    /// Cubemap, azimuths, distances and geocoding for one panorama. Missing
    /// stage inputs end the run early as Incomplete; load failures throw.
    ImageOutcome processPanorama(
        const std::string &image_path,
        const PipelineConfig &config,
        CubeFaceRasterizer &rasterizer);

    /// Batch over argv[1] or every panorama in the configured folder.
    int runCubeGeoApplication(int argc, char **argv);
} // namespace cubegeo
