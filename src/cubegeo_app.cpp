#include "cubegeo_app.hpp"

#include <opencv2/core/utils/logger.hpp>
#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>

#include "azimuth_resolver.hpp"
#include "detection_io.hpp"
#include "detection_join.hpp"
#include "distance_estimator.hpp"
#include "face_annotator.hpp"
#include "geo_errors.hpp"
#include "gps_reader.hpp"
#include "image_loader.hpp"

namespace fs = std::filesystem;

namespace cubegeo {
    namespace {
        void logRuntimeOptions(const PipelineConfig &config) {
            std::cout << "[Main] images dir: " << config.images_dir
                    << ", output root: " << config.output_root << std::endl;
            std::cout << "[Main] params: cube_size=" << (config.cube_size > 0 ? std::to_string(config.cube_size) : "auto")
                    << ", contour_samples=" << config.contour_samples
                    << ", earth_radius_m=" << config.earth_radius_m
                    << ", jpeg_quality=" << config.jpeg_quality
                    << ", cross=" << (config.write_cross_layout ? "on" : "off")
                    << ", annotate=" << (config.annotate ? "on" : "off")
                    << ", parallel_faces=" << (config.parallel_faces ? "on" : "off") << std::endl;
            if (config.fallback_origin) {
                std::cout << "[Main] fallback origin: lat=" << config.fallback_origin->latitude
                        << ", lon=" << config.fallback_origin->longitude << std::endl;
            }
        }

        void writeImage(const fs::path &path, const cv::Mat &image, const int jpeg_quality) {
            if (!cv::imwrite(path.string(), image, {cv::IMWRITE_JPEG_QUALITY, jpeg_quality})) {
                throw std::runtime_error("write failed: " + path.string());
            }
        }

        ImageOutcome incomplete(const std::string &image_path, const std::string &note) {
            std::cout << "[Main] " << image_path << " incomplete: " << note << std::endl;
            return {image_path, ImageStatus::Incomplete, note};
        }

        std::optional<std::string> resolveSingleImage(const std::string &arg, const PipelineConfig &config) {
            if (fs::is_regular_file(arg)) {
                return arg;
            }
            const fs::path in_folder = fs::path(config.images_dir) / arg;
            if (fs::is_regular_file(in_folder)) {
                return in_folder.string();
            }
            return std::nullopt;
        }

        const char *statusName(const ImageStatus status) {
            switch (status) {
                case ImageStatus::Complete:
                    return "complete";
                case ImageStatus::Incomplete:
                    return "incomplete";
                case ImageStatus::Skipped:
                    return "skipped";
            }
            return "unknown";
        }
    } // namespace

    std::optional<std::string> findDistancesFile(const std::string &out_dir) {
        for (const auto &name: kDistanceFiles) {
            const fs::path candidate = fs::path(out_dir) / name;
            if (fs::is_regular_file(candidate)) {
                return candidate.string();
            }
        }
        return std::nullopt;
    }

    std::optional<GeoPosition> resolveOrigin(const std::string &image_path, const PipelineConfig &config) {
        std::optional<GeoPosition> origin;
        try {
            origin = GpsReader::readOrigin(image_path);
        } catch (const ImageLoadError &e) {
            std::cout << "[Geo] cannot read EXIF: " << e.what() << std::endl;
        } catch (const InvalidInputError &e) {
            std::cout << "[Geo] unusable GPS EXIF in " << image_path << ": " << e.what() << std::endl;
        }
        if (!origin && config.fallback_origin) {
            std::cout << "[Geo] using configured fallback origin" << std::endl;
            origin = config.fallback_origin;
        }
        return origin;
    }

    ImageOutcome processPanorama(
        const std::string &image_path,
        const PipelineConfig &config,
        CubeFaceRasterizer &rasterizer) {
        const fs::path out_dir = fs::path(config.output_root) / ("output_" + fs::path(image_path).stem().string());
        fs::create_directories(out_dir);
        std::cout << "[Main] processing " << image_path << " -> " << out_dir << std::endl;

        const cv::Mat panorama = ImageLoader::loadPanorama(image_path);
        const int cube_size = rasterizer.cubeSizeFor(panorama.size());
        if (cube_size <= 0) {
            throw ImageLoadError("panorama too small for a cubemap: " + image_path);
        }

        // 1. cubemap
        std::cout << "[Cubemap] cube_size=" << cube_size << std::endl;
        const CubeFaces faces = rasterizer.rasterizeAll(panorama);
        for (const CubeFace face: kAllFaces) {
            const fs::path face_path = out_dir / (config.face_names[faceIndex(face)] + ".jpg");
            writeImage(face_path, faces[faceIndex(face)], config.jpeg_quality);
            std::cout << "[Cubemap] saved " << face_path << std::endl;
        }
        if (config.write_cross_layout) {
            writeImage(out_dir / "cubemap_cross.jpg", composeCrossLayout(faces), config.jpeg_quality);
            std::cout << "[Cubemap] cross layout saved" << std::endl;
        }

        // 2. azimuths
        const fs::path detections_path = out_dir / "detections.json";
        if (!fs::is_regular_file(detections_path)) {
            return incomplete(image_path, "no detections.json in " + out_dir.string());
        }
        const FaceDetections detections = DetectionFileIO::readDetections(detections_path.string(), config.face_names);
        const FaceAzimuths azimuths = computeAzimuths(detections, cube_size);
        DetectionFileIO::writeAzimuths((out_dir / "azimuths.json").string(), azimuths, config.face_names);

        if (config.annotate) {
            for (const auto &[face, boxes]: detections) {
                if (boxes.empty()) {
                    continue;
                }
                const cv::Mat annotated = annotateFace(faces[faceIndex(face)], boxes, config.class_palette);
                writeImage(out_dir / (config.face_names[faceIndex(face)] + "_with_detections.jpg"),
                           annotated, config.jpeg_quality);
            }
            const ContourOverlay overlay = drawPanoramaContours(
                panorama, detections, cube_size, config.class_palette, config.contour_samples);
            writeImage(out_dir / "panorama_with_detections.jpg", overlay.image, config.jpeg_quality);
        }

        // 3. distances
        FaceDistances distances;
        if (const auto distances_path = findDistancesFile(out_dir.string())) {
            distances = DetectionFileIO::readDistances(*distances_path, config.face_names);
        } else if (const auto estimator = DepthMapDistanceEstimator::fromDirectory(out_dir.string(), config.face_names)) {
            std::cout << "[Distance] estimating from " << estimator->faceCount() << " depth maps" << std::endl;
            distances = estimateDistances(detections, *estimator);
            DetectionFileIO::writeDistances((out_dir / kDistanceFiles.front()).string(), distances, config.face_names);
        } else {
            return incomplete(image_path, "no distances file or depth maps in " + out_dir.string());
        }

        // 4. origin
        const std::optional<GeoPosition> origin = resolveOrigin(image_path, config);
        if (!origin) {
            return incomplete(image_path, "no GPS origin, coords skipped");
        }

        // 5. geocoding
        const FaceGeocoded geocoded = joinDetections(*origin, azimuths, distances, config.earth_radius_m);
        DetectionFileIO::writeGeocoded((out_dir / "coords.json").string(), geocoded, config.face_names);
        std::cout << "[Finish] done: " << image_path << std::endl;
        return {image_path, ImageStatus::Complete, ""};
    }

    int runCubeGeoApplication(const int argc, char **argv) {
        cv::utils::logging::setLogLevel(cv::utils::logging::LOG_LEVEL_SILENT);
        const PipelineConfig config = loadPipelineConfig();
        logRuntimeOptions(config);

        std::vector<std::string> images;
        try {
            if (argc > 1) {
                const auto single = resolveSingleImage(argv[1], config);
                if (!single) {
                    throw ImageLoadError(std::string("image not found: ") + argv[1]);
                }
                images.push_back(*single);
            } else {
                images = ImageLoader::listPanoramas(config.images_dir);
            }
        } catch (const std::exception &e) {
            std::cerr << "[Error] " << e.what() << std::endl;
            return 1;
        }
        if (images.empty()) {
            std::cout << "[Main] no panoramas to process" << std::endl;
            return 0;
        }

        CubeFaceRasterizer rasterizer(config.cube_size, config.parallel_faces);
        std::vector<ImageOutcome> outcomes;
        outcomes.reserve(images.size());
        for (const auto &image: images) {
            try {
                outcomes.push_back(processPanorama(image, config, rasterizer));
            } catch (const InvalidFaceError &e) {
                std::cerr << "[Error] " << image << ": " << e.what() << std::endl;
                return 1;
            } catch (const std::exception &e) {
                std::cerr << "[Error] " << image << ": " << e.what() << ", skipped" << std::endl;
                outcomes.push_back({image, ImageStatus::Skipped, e.what()});
            }
        }

        size_t complete = 0;
        size_t skipped = 0;
        for (const auto &outcome: outcomes) {
            if (outcome.status == ImageStatus::Complete) {
                ++complete;
            } else if (outcome.status == ImageStatus::Skipped) {
                ++skipped;
            }
        }
        std::cout << "[Summary] images=" << outcomes.size()
                << ", complete=" << complete
                << ", incomplete=" << outcomes.size() - complete - skipped
                << ", skipped=" << skipped << std::endl;
        for (const auto &outcome: outcomes) {
            if (outcome.status != ImageStatus::Complete) {
                std::cout << "[Summary]   " << statusName(outcome.status) << ": "
                        << outcome.image_path << " (" << outcome.note << ")" << std::endl;
            }
        }
        return skipped == outcomes.size() ? 1 : 0;
    }
} // namespace cubegeo
