#include "geodesic.hpp"

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <vector>

#include "geo_errors.hpp"
#include "spherical.hpp"

namespace cubegeo {
    GeoPosition destinationPoint(
        const double lat_deg,
        const double lon_deg,
        const double bearing_deg,
        const double distance_m,
        const double earth_radius_m) {
        if (!std::isfinite(lat_deg) || !std::isfinite(lon_deg) ||
            !std::isfinite(bearing_deg) || !std::isfinite(distance_m)) {
            throw InvalidInputError("destination point needs finite latitude, longitude, bearing and distance");
        }
        if (!std::isfinite(earth_radius_m) || earth_radius_m <= 0.0) {
            throw InvalidInputError("earth radius must be positive");
        }

        const double lat1 = degreeToRadian(lat_deg);
        const double lon1 = degreeToRadian(lon_deg);
        const double theta = degreeToRadian(bearing_deg);
        const double delta = distance_m / earth_radius_m;

        const double lat2 = std::asin(
            std::sin(lat1) * std::cos(delta) + std::cos(lat1) * std::sin(delta) * std::cos(theta));
        const double lon2 = lon1 + std::atan2(
                                std::sin(theta) * std::sin(delta) * std::cos(lat1),
                                std::cos(delta) - std::sin(lat1) * std::sin(lat2));

        GeoPosition destination;
        destination.latitude = radianToDegree(lat2);
        destination.longitude = radianToDegree(lon2);
        return destination;
    }

    GeoPosition destinationPoint(
        const GeoPosition &origin,
        const double bearing_deg,
        const double distance_m,
        const double earth_radius_m) {
        GeoPosition destination = destinationPoint(
            origin.latitude, origin.longitude, bearing_deg, distance_m, earth_radius_m);
        destination.altitude = origin.altitude;
        return destination;
    }

    double wrapLongitude(const double lon_deg) {
        double wrapped = std::fmod(lon_deg + 180.0, 360.0);
        if (wrapped < 0.0) {
            wrapped += 360.0;
        }
        return wrapped - 180.0;
    }

    double dmsToDecimal(const double degrees, const double minutes, const double seconds, const std::string &ref) {
        static const std::array<std::string, 4> allowed_refs = {"N", "S", "E", "W"};
        if (std::ranges::find(allowed_refs, ref) == allowed_refs.end()) {
            throw InvalidInputError("unexpected gps reference: " + ref);
        }
        const double decimal = degrees + minutes / 60.0 + seconds / 3600.0;
        return (ref == "S" || ref == "W") ? -decimal : decimal;
    }

    double parseGpsFromString(const std::string &gps_degrees, const std::string &gps_ref) {
        std::vector<std::string> parts;
        boost::split(parts, gps_degrees, boost::is_any_of(","));
        if (parts.empty() || parts.size() > 3) {
            throw InvalidInputError("unexpected gps value: " + gps_degrees);
        }

        std::array<double, 3> dms = {0.0, 0.0, 0.0};
        for (size_t i = 0; i < parts.size(); ++i) {
            boost::trim(parts[i]);
            try {
                dms[i] = std::stod(parts[i]);
            } catch (const std::exception &) {
                throw InvalidInputError("unexpected gps value: " + gps_degrees);
            }
        }
        return dmsToDecimal(dms[0], dms[1], dms[2], boost::trim_copy(gps_ref));
    }

    double altitudeFromRef(const double altitude, const int altitude_ref) {
        return altitude_ref == 1 ? -altitude : altitude;
    }
} // namespace cubegeo
