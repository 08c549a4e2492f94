#include "pipeline_config.hpp"

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <system_error>

namespace cubegeo {
    namespace {
        // Trimmed value of a set, non-blank variable.
        std::optional<std::string> envText(const char *name) {
            const char *raw = std::getenv(name);
            if (!raw) {
                return std::nullopt;
            }
            std::string text = boost::trim_copy(std::string(raw));
            if (text.empty()) {
                return std::nullopt;
            }
            return text;
        }

        bool matchesAny(const std::string &text, std::initializer_list<const char *> words) {
            return std::ranges::any_of(words, [&](const char *word) { return boost::iequals(text, word); });
        }

        template<typename T>
        std::optional<T> parseWhole(const std::string &text) {
            T parsed{};
            const char *first = text.data();
            const char *last = first + text.size();
            const auto [ptr, ec] = std::from_chars(first, last, parsed);
            if (ec != std::errc() || ptr != last) {
                return std::nullopt;
            }
            return parsed;
        }
    }

    bool envEnabled(const char *name, const bool default_value) {
        const auto text = envText(name);
        if (!text) {
            return default_value;
        }
        if (matchesAny(*text, {"1", "true", "on", "yes"})) {
            return true;
        }
        if (matchesAny(*text, {"0", "false", "off", "no"})) {
            return false;
        }
        std::cout << "[Config] " << name << "=" << *text << " is not a switch, keeping default" << std::endl;
        return default_value;
    }

    int envIntOr(const char *name, const int default_value, const int min_value) {
        const auto text = envText(name);
        if (!text) {
            return default_value;
        }
        const auto parsed = parseWhole<long long>(*text);
        if (!parsed) {
            std::cout << "[Config] " << name << "=" << *text << " is not an integer, keeping default" << std::endl;
            return default_value;
        }
        const long long upper = std::numeric_limits<int>::max();
        return static_cast<int>(std::clamp<long long>(*parsed, min_value, upper));
    }

    std::optional<double> envDouble(const char *name) {
        const auto text = envText(name);
        if (!text) {
            return std::nullopt;
        }
        const auto parsed = parseWhole<double>(*text);
        if (!parsed || !std::isfinite(*parsed)) {
            std::cout << "[Config] " << name << "=" << *text << " is not a finite number, ignored" << std::endl;
            return std::nullopt;
        }
        return parsed;
    }

    double envDoubleOr(const char *name, const double default_value, const double min_value) {
        return std::max(min_value, envDouble(name).value_or(default_value));
    }

    std::string envStringOr(const char *name, const std::string &default_value) {
        return envText(name).value_or(default_value);
    }

    PipelineConfig loadPipelineConfig() {
        PipelineConfig config;
        config.images_dir = envStringOr("CUBEGEO_IMAGES_DIR", config.images_dir);
        config.output_root = envStringOr("CUBEGEO_OUTPUT_ROOT", config.output_root);

        config.cube_size = envIntOr("CUBEGEO_CUBE_SIZE", config.cube_size, 0);
        config.contour_samples = envIntOr("CUBEGEO_CONTOUR_SAMPLES", config.contour_samples, 1);
        config.earth_radius_m = envDoubleOr("CUBEGEO_EARTH_RADIUS_M", config.earth_radius_m, 1.0);
        config.jpeg_quality = std::min(100, envIntOr("CUBEGEO_JPEG_QUALITY", config.jpeg_quality, 1));

        config.write_cross_layout = envEnabled("CUBEGEO_WRITE_CROSS", config.write_cross_layout);
        config.annotate = envEnabled("CUBEGEO_ANNOTATE", config.annotate);
        config.parallel_faces = envEnabled("CUBEGEO_PARALLEL_FACES", config.parallel_faces);

        const auto lat = envDouble("CUBEGEO_ORIGIN_LAT");
        const auto lon = envDouble("CUBEGEO_ORIGIN_LON");
        if (lat && lon) {
            GeoPosition origin;
            origin.latitude = *lat;
            origin.longitude = *lon;
            config.fallback_origin = origin;
        } else if (lat || lon) {
            std::cout << "[Config] CUBEGEO_ORIGIN_LAT and CUBEGEO_ORIGIN_LON must be set together, ignored" << std::endl;
        }
        return config;
    }
} // namespace cubegeo
