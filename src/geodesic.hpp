#pragma once

#include <string>

#include "detection_record.hpp"

namespace cubegeo {
    /// Mean Earth radius of the spherical model (m).
    constexpr double kEarthRadiusM = 6371000.0;

    /// Direct geodesic on a sphere: start point, bearing (deg clockwise from
    /// north) and distance (m) to the destination. Longitude is left unwrapped,
    /// see wrapLongitude. Throws InvalidInputError on non-finite input.
    GeoPosition destinationPoint(
        double lat_deg,
        double lon_deg,
        double bearing_deg,
        double distance_m,
        double earth_radius_m = kEarthRadiusM);

    GeoPosition destinationPoint(
        const GeoPosition &origin,
        double bearing_deg,
        double distance_m,
        double earth_radius_m = kEarthRadiusM);

    /// Longitude folded into [-180, 180).
    double wrapLongitude(double lon_deg);

    /// degrees + minutes / 60 + seconds / 3600, negated for "S" and "W".
    /// Throws InvalidInputError for any other reference than N, S, E, W.
    double dmsToDecimal(double degrees, double minutes, double seconds, const std::string &ref);

    /// Comma separated "deg, min, sec" (trailing parts optional) with its reference.
    double parseGpsFromString(const std::string &gps_degrees, const std::string &gps_ref);

    /// EXIF altitude with AltitudeRef: 1 means below sea level.
    double altitudeFromRef(double altitude, int altitude_ref);
} // namespace cubegeo
