#pragma once

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace cubegeo {
    class ImageLoader {
    public:
        /// Sorted .jpg/.jpeg/.png paths directly inside folder.
        static std::vector<std::string> listPanoramas(const std::string &folder);

        /// Throws ImageLoadError when the file is missing or cannot be decoded.
        static cv::Mat loadPanorama(const std::string &path);

        /// Full spherical panoramas are 2:1.
        [[nodiscard]] static bool looksEquirectangular(const cv::Size &size);
    };
} // namespace cubegeo
