#include "cubegeo_app.hpp"
#include "geo_errors.hpp"

#include <opencv2/imgcodecs.hpp>

#include <boost/json.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#define BOOST_TEST_MODULE CubeGeoApplication

#include <boost/test/unit_test.hpp>
#include <boost/test/tools/floating_point_comparison.hpp>

using namespace cubegeo;
namespace fs = std::filesystem;

namespace {
    // front box centred at (6, 6) on a 16 px face
    const char *kDetections = R"({
        "0": {"boxes": [[2, 2, 10, 10]], "scores": [0.9], "classes": [1]},
        "up": {"boxes": [], "scores": [], "classes": []}
    })";

    const char *kDistances = R"({
        "front": [{"bbox_index": 0, "class_id": 1, "score": 0.9, "distance_m": 100.0}]
    })";

    void writeText(const fs::path &path, const std::string &content) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        out << content;
    }

    std::string readText(const fs::path &path) {
        std::ifstream in(path);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    void writePanorama(const fs::path &path) {
        cv::Mat pano(32, 64, CV_8UC3);
        cv::randu(pano, cv::Scalar::all(0), cv::Scalar::all(255));
        BOOST_REQUIRE(cv::imwrite(path.string(), pano));
    }

    // images/ and out/ under a fresh temporary root
    struct Workspace {
        fs::path root;
        fs::path images;
        fs::path output;

        Workspace() {
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            root = fs::temp_directory_path() / ("cubegeo_app_test_" + std::to_string(stamp));
            images = root / "images";
            output = root / "out";
            fs::create_directories(images);
            fs::create_directories(output);
        }

        ~Workspace() {
            std::error_code ec;
            fs::remove_all(root, ec);
        }

        fs::path outputFor(const std::string &stem) const {
            return output / ("output_" + stem);
        }

        PipelineConfig config(const bool with_origin = true) const {
            PipelineConfig cfg;
            cfg.images_dir = images.string();
            cfg.output_root = output.string();
            cfg.parallel_faces = false;
            if (with_origin) {
                GeoPosition origin;
                origin.latitude = 0.0;
                origin.longitude = 0.0;
                cfg.fallback_origin = origin;
            }
            return cfg;
        }
    };

    struct ScopedEnv {
        const char *name;

        ScopedEnv(const char *n, const std::string &value) : name(n) {
            ::setenv(name, value.c_str(), 1);
        }

        ~ScopedEnv() {
            ::unsetenv(name);
        }
    };
}

BOOST_AUTO_TEST_CASE(ProcessPanorama_Complete)
{
    Workspace ws;
    writePanorama(ws.images / "good.png");
    writeText(ws.outputFor("good") / "detections.json", kDetections);
    writeText(ws.outputFor("good") / "distances_unidepth.json", kDistances);

    const PipelineConfig config = ws.config();
    CubeFaceRasterizer rasterizer(config.cube_size, config.parallel_faces);
    const ImageOutcome outcome = processPanorama((ws.images / "good.png").string(), config, rasterizer);
    BOOST_CHECK(outcome.status == ImageStatus::Complete);

    const fs::path out = ws.outputFor("good");
    for (const char *name: {"front.jpg", "down.jpg", "cubemap_cross.jpg", "azimuths.json",
                            "front_with_detections.jpg", "panorama_with_detections.jpg", "coords.json"}) {
        BOOST_CHECK_MESSAGE(fs::is_regular_file(out / name), name);
    }

    const boost::json::value coords = boost::json::parse(readText(out / "coords.json"));
    const auto &front = coords.as_object().at("front").as_array();
    BOOST_REQUIRE_EQUAL(front.size(), 1u);
    const auto &record = front[0].as_object();
    BOOST_CHECK_EQUAL(record.at("bbox_index").as_int64(), 0);
    BOOST_CHECK_EQUAL(record.at("class_id").as_int64(), 1);
    BOOST_CHECK_CLOSE(record.at("distance_m").to_number<double>(), 100.0, 1e-9);
    // atan2(-0.25, 1) from the box centre
    BOOST_CHECK_CLOSE(record.at("azimuth_deg").to_number<double>(), 345.9637565, 1e-6);
    BOOST_CHECK_CLOSE(record.at("latitude").to_number<double>(), 8.7247e-4, 0.1);
    BOOST_CHECK_LT(record.at("longitude").to_number<double>(), 0.0);
}

BOOST_AUTO_TEST_CASE(ProcessPanorama_MissingInputsAreIncomplete)
{
    Workspace ws;
    const PipelineConfig config = ws.config();
    CubeFaceRasterizer rasterizer(config.cube_size, config.parallel_faces);

    writePanorama(ws.images / "bare.png");
    const ImageOutcome no_detections = processPanorama((ws.images / "bare.png").string(), config, rasterizer);
    BOOST_CHECK(no_detections.status == ImageStatus::Incomplete);
    BOOST_CHECK(fs::is_regular_file(ws.outputFor("bare") / "front.jpg"));
    BOOST_CHECK(!fs::exists(ws.outputFor("bare") / "azimuths.json"));

    writePanorama(ws.images / "nodist.png");
    writeText(ws.outputFor("nodist") / "detections.json", kDetections);
    const ImageOutcome no_distances = processPanorama((ws.images / "nodist.png").string(), config, rasterizer);
    BOOST_CHECK(no_distances.status == ImageStatus::Incomplete);
    BOOST_CHECK(fs::is_regular_file(ws.outputFor("nodist") / "azimuths.json"));
    BOOST_CHECK(!fs::exists(ws.outputFor("nodist") / "coords.json"));
}

BOOST_AUTO_TEST_CASE(ProcessPanorama_NoOriginIsIncomplete)
{
    Workspace ws;
    writePanorama(ws.images / "noexif.png");
    writeText(ws.outputFor("noexif") / "detections.json", kDetections);
    writeText(ws.outputFor("noexif") / "distances.json", kDistances);

    const PipelineConfig config = ws.config(false);
    CubeFaceRasterizer rasterizer(config.cube_size, config.parallel_faces);
    const ImageOutcome outcome = processPanorama((ws.images / "noexif.png").string(), config, rasterizer);
    BOOST_CHECK(outcome.status == ImageStatus::Incomplete);
    BOOST_CHECK(!fs::exists(ws.outputFor("noexif") / "coords.json"));
}

BOOST_AUTO_TEST_CASE(ProcessPanorama_CorruptImageThrows)
{
    Workspace ws;
    writeText(ws.images / "broken.jpg", "not a jpeg");
    const PipelineConfig config = ws.config();
    CubeFaceRasterizer rasterizer(config.cube_size, config.parallel_faces);
    BOOST_CHECK_THROW(processPanorama((ws.images / "broken.jpg").string(), config, rasterizer), ImageLoadError);
}

BOOST_AUTO_TEST_CASE(ResolveOrigin_UnreadableExifFallsBack)
{
    Workspace ws;
    const std::string missing = (ws.images / "missing.jpg").string();

    const auto fallback = resolveOrigin(missing, ws.config());
    BOOST_REQUIRE(fallback.has_value());
    BOOST_CHECK_SMALL(fallback->latitude, 1e-12);
    BOOST_CHECK_SMALL(fallback->longitude, 1e-12);

    BOOST_CHECK(!resolveOrigin(missing, ws.config(false)).has_value());
}

BOOST_AUTO_TEST_CASE(FindDistancesFile_PrefersDistancesJson)
{
    Workspace ws;
    const fs::path out = ws.outputFor("pano");
    fs::create_directories(out);
    BOOST_CHECK(!findDistancesFile(out.string()).has_value());

    writeText(out / "distances_unidepth.json", kDistances);
    auto found = findDistancesFile(out.string());
    BOOST_REQUIRE(found.has_value());
    BOOST_CHECK_EQUAL(fs::path(*found).filename().string(), "distances_unidepth.json");

    writeText(out / "distances.json", kDistances);
    found = findDistancesFile(out.string());
    BOOST_REQUIRE(found.has_value());
    BOOST_CHECK_EQUAL(fs::path(*found).filename().string(), "distances.json");
}

BOOST_AUTO_TEST_CASE(RunApplication_SkipsBrokenImagesAndContinues)
{
    Workspace ws;
    writePanorama(ws.images / "good.png");
    writeText(ws.images / "broken.jpg", "not a jpeg");
    writeText(ws.outputFor("good") / "detections.json", kDetections);
    writeText(ws.outputFor("good") / "distances_unidepth.json", kDistances);

    const ScopedEnv images("CUBEGEO_IMAGES_DIR", ws.images.string());
    const ScopedEnv output("CUBEGEO_OUTPUT_ROOT", ws.output.string());
    const ScopedEnv lat("CUBEGEO_ORIGIN_LAT", "0");
    const ScopedEnv lon("CUBEGEO_ORIGIN_LON", "0");
    const ScopedEnv parallel("CUBEGEO_PARALLEL_FACES", "off");

    char program[] = "cubegeo_app";
    char *argv[] = {program, nullptr};
    BOOST_CHECK_EQUAL(runCubeGeoApplication(1, argv), 0);
    BOOST_CHECK(fs::is_regular_file(ws.outputFor("good") / "coords.json"));

    fs::remove(ws.images / "good.png");
    BOOST_CHECK_EQUAL(runCubeGeoApplication(1, argv), 1);
}

BOOST_AUTO_TEST_CASE(RunApplication_SingleImageArgument)
{
    Workspace ws;
    writePanorama(ws.images / "solo.png");
    const ScopedEnv images("CUBEGEO_IMAGES_DIR", ws.images.string());
    const ScopedEnv output("CUBEGEO_OUTPUT_ROOT", ws.output.string());

    char program[] = "cubegeo_app";
    char image[] = "solo.png";
    char *argv[] = {program, image, nullptr};
    // no detections: incomplete, not a failure
    BOOST_CHECK_EQUAL(runCubeGeoApplication(2, argv), 0);
    BOOST_CHECK(fs::is_regular_file(ws.outputFor("solo") / "front.jpg"));

    char unknown[] = "absent.png";
    char *missing_argv[] = {program, unknown, nullptr};
    BOOST_CHECK_EQUAL(runCubeGeoApplication(2, missing_argv), 1);
}
