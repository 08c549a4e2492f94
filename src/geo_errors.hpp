#pragma once

#include <stdexcept>
#include <string>

namespace cubegeo {
    /// Face index outside 0..5. Programmer error, never corrected silently.
    class InvalidFaceError : public std::out_of_range {
    public:
        explicit InvalidFaceError(const std::string &what) : std::out_of_range(what) {
        }
    };

    /// Non-finite numbers, malformed GPS references and similar bad arguments.
    class InvalidInputError : public std::invalid_argument {
    public:
        explicit InvalidInputError(const std::string &what) : std::invalid_argument(what) {
        }
    };

    /// Source panorama or face image missing or undecodable.
    class ImageLoadError : public std::runtime_error {
    public:
        explicit ImageLoadError(const std::string &what) : std::runtime_error(what) {
        }
    };

    /// JSON data file unreadable or structurally wrong.
    class DataFileError : public std::runtime_error {
    public:
        explicit DataFileError(const std::string &what) : std::runtime_error(what) {
        }
    };
} // namespace cubegeo
