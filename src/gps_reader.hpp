#pragma once

#include <optional>
#include <string>

#include "detection_record.hpp"

namespace cubegeo {
    /// Raw EXIF GPS tags in their string form ("deg, min, sec").
    struct GpsTags {
        std::optional<std::string> latitude;
        std::optional<std::string> latitude_ref;
        std::optional<std::string> longitude;
        std::optional<std::string> longitude_ref;
        std::optional<double> altitude;
        int altitude_ref = 0;

        /// References are optional; a missing one reads as N or E.
        [[nodiscard]] bool hasPosition() const {
            return latitude && longitude;
        }
    };

    class GpsReader {
    public:
        /// Camera position from the panorama's EXIF. Empty when the GPS tags are
        /// absent; throws ImageLoadError when the file itself cannot be opened.
        static std::optional<GeoPosition> readOrigin(const std::string &image_path);

        static GpsTags readTags(const std::string &image_path);

        /// Empty unless latitude and longitude are present. References are
        /// trimmed and upper-cased; absent or blank ones default to N and E.
        /// Throws InvalidInputError for values that do not parse.
        static std::optional<GeoPosition> originFromTags(const GpsTags &tags);
    };
} // namespace cubegeo
