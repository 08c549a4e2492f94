#pragma once

#include <boost/json.hpp>

#include <iosfwd>
#include <string>

#include "cube_face.hpp"
#include "detection_record.hpp"

namespace cubegeo {
    /// JSON files exchanged with the detector, the distance estimator and
    /// downstream consumers. Faces are keyed by index or name on read and by
    /// name on write. Absent optionals are written as null.
    class DetectionFileIO {
    public:
        /// {face: {boxes: [[x1,y1,x2,y2],...], scores: [...], classes: [...]}}.
        /// Boxes given as {coordinates, score, class} objects are accepted too.
        static FaceDetections readDetections(const std::string &path, const FaceNames &names = defaultFaceNames());

        static void writeAzimuths(const std::string &path, const FaceAzimuths &azimuths,
                                  const FaceNames &names = defaultFaceNames());

        static FaceAzimuths readAzimuths(const std::string &path, const FaceNames &names = defaultFaceNames());

        static void writeDistances(const std::string &path, const FaceDistances &distances,
                                   const FaceNames &names = defaultFaceNames());

        /// distance_m may be missing or null. The older "distance" key is read as well.
        static FaceDistances readDistances(const std::string &path, const FaceNames &names = defaultFaceNames());

        static void writeGeocoded(const std::string &path, const FaceGeocoded &geocoded,
                                  const FaceNames &names = defaultFaceNames());
    };

    /// Indented output with numbers kept as numbers and empty lists as [].
    void writePrettyJson(std::ostream &os, const boost::json::value &jv, const std::string &indent = "");

    void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv, const AzimuthRecord &record);

    void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv, const DistanceRecord &record);

    void tag_invoke(const boost::json::value_from_tag &, boost::json::value &jv, const GeocodedDetection &detection);
} // namespace cubegeo
