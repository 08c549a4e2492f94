#include "image_loader.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <iostream>

#include "geo_errors.hpp"

namespace fs = std::filesystem;

namespace cubegeo {
    std::vector<std::string> ImageLoader::listPanoramas(const std::string &folder) {
        if (!fs::is_directory(folder)) {
            throw ImageLoadError("image folder not found: " + folder);
        }
        const std::vector<std::string> exts = {"jpg", "jpeg", "png"};
        std::vector<std::string> paths;

        for (auto &p: fs::directory_iterator(folder)) {
            if (!p.is_regular_file()) continue;
            std::string ext = p.path().extension().string();
            if (!ext.empty() && ext[0] == '.') ext = ext.substr(1);
            std::ranges::transform(ext, ext.begin(), [](const unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            if (std::ranges::find(exts, ext) != exts.end()) {
                paths.push_back(p.path().string());
            }
        }

        std::ranges::sort(paths);
        std::cout << "[Load] " << paths.size() << " panoramas in " << folder << std::endl;
        return paths;
    }

    cv::Mat ImageLoader::loadPanorama(const std::string &path) {
        if (!fs::is_regular_file(path)) {
            throw ImageLoadError("image not found: " + path);
        }
        cv::Mat img = cv::imread(path, cv::IMREAD_COLOR);
        if (img.empty()) {
            throw ImageLoadError("read failed: " + path);
        }
        std::cout << "[Load] " << path << ": " << img.cols << "x" << img.rows << std::endl;
        if (!looksEquirectangular(img.size())) {
            std::cout << "[Load] aspect ratio " << static_cast<double>(img.cols) / img.rows
                    << " is not 2:1, projection may be wrong" << std::endl;
        }
        return img;
    }

    bool ImageLoader::looksEquirectangular(const cv::Size &size) {
        if (size.height <= 0) {
            return false;
        }
        const double aspect = static_cast<double>(size.width) / size.height;
        return std::abs(aspect - 2.0) < 0.1;
    }
} // namespace cubegeo
