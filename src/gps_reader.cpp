#include "gps_reader.hpp"

#include <OpenImageIO/imageio.h>

#include <boost/algorithm/string.hpp>

#include <iostream>

#include "geo_errors.hpp"
#include "geodesic.hpp"

namespace cubegeo {
    namespace {
        std::optional<std::string> stringAttribute(const OIIO::ImageSpec &spec, const std::string &name) {
            const OIIO::ParamValue *param = spec.find_attribute(name);
            if (!param) {
                return std::nullopt;
            }
            // float[3] rationals come back as "d, m, s"
            return param->get_string();
        }

        std::string referenceOr(const std::optional<std::string> &ref, const char *fallback) {
            std::string text = ref ? boost::to_upper_copy(boost::trim_copy(*ref)) : std::string();
            return text.empty() ? std::string(fallback) : text;
        }
    }

    GpsTags GpsReader::readTags(const std::string &image_path) {
        auto input = OIIO::ImageInput::open(image_path);
        if (!input) {
            throw ImageLoadError("cannot open " + image_path + ": " + OIIO::geterror());
        }
        const OIIO::ImageSpec &spec = input->spec();

        GpsTags tags;
        tags.latitude = stringAttribute(spec, "GPS:Latitude");
        tags.latitude_ref = stringAttribute(spec, "GPS:LatitudeRef");
        tags.longitude = stringAttribute(spec, "GPS:Longitude");
        tags.longitude_ref = stringAttribute(spec, "GPS:LongitudeRef");
        if (spec.find_attribute("GPS:Altitude")) {
            tags.altitude = spec.get_float_attribute("GPS:Altitude");
            tags.altitude_ref = spec.get_int_attribute("GPS:AltitudeRef", 0);
        }
        input->close();
        return tags;
    }

    std::optional<GeoPosition> GpsReader::originFromTags(const GpsTags &tags) {
        if (!tags.hasPosition()) {
            return std::nullopt;
        }
        GeoPosition origin;
        origin.latitude = parseGpsFromString(*tags.latitude, referenceOr(tags.latitude_ref, "N"));
        origin.longitude = parseGpsFromString(*tags.longitude, referenceOr(tags.longitude_ref, "E"));
        if (tags.altitude) {
            origin.altitude = altitudeFromRef(*tags.altitude, tags.altitude_ref);
        }
        return origin;
    }

    std::optional<GeoPosition> GpsReader::readOrigin(const std::string &image_path) {
        const auto origin = originFromTags(readTags(image_path));
        if (!origin) {
            std::cout << "[Geo] no GPS EXIF in " << image_path << std::endl;
            return std::nullopt;
        }
        std::cout << "[Geo] origin: lat=" << origin->latitude << ", lon=" << origin->longitude;
        if (origin->altitude) {
            std::cout << ", alt=" << *origin->altitude << "m";
        }
        std::cout << std::endl;
        return origin;
    }
} // namespace cubegeo
