#include "detection_io.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <vector>

#include "geo_errors.hpp"

namespace json = boost::json;

namespace cubegeo {
    namespace {
        json::object loadJson(const std::string &path) {
            std::ifstream in(path);
            if (!in) {
                throw DataFileError("cannot open " + path);
            }
            std::stringstream buffer;
            buffer << in.rdbuf();

            json::error_code ec;
            json::value jv = json::parse(buffer.str(), ec);
            if (ec) {
                throw DataFileError("cannot read " + path + ": " + ec.message());
            }
            if (!jv.is_object()) {
                throw DataFileError(path + ": expected an object keyed by face");
            }
            return std::move(jv.as_object());
        }

        void saveJson(const std::string &path, const json::value &jv) {
            std::ofstream out(path);
            if (!out) {
                throw DataFileError("cannot write " + path);
            }
            writePrettyJson(out, jv);
            out << "\n";
            if (!out) {
                throw DataFileError("write failed: " + path);
            }
        }

        // Numbers, and numeric text from older files. Anything else, null included, is empty.
        std::optional<double> numberOf(const json::value &jv) {
            if (jv.is_number()) {
                return jv.to_number<double>();
            }
            if (jv.is_string()) {
                const json::string &raw = jv.get_string();
                const std::string text(raw.data(), raw.size());
                char *end = nullptr;
                const double parsed = std::strtod(text.c_str(), &end);
                if (end != text.c_str() && *end == '\0') {
                    return parsed;
                }
            }
            return std::nullopt;
        }

        std::optional<double> numberAt(const json::object &obj, const char *key) {
            const json::value *jv = obj.if_contains(key);
            return jv ? numberOf(*jv) : std::nullopt;
        }

        double requiredNumber(const json::object &obj, const char *key, const std::string &path) {
            const auto value = numberAt(obj, key);
            if (!value) {
                throw DataFileError(path + ": record without numeric '" + key + "'");
            }
            return *value;
        }

        const json::object &objectOf(const json::value &jv, const std::string &path) {
            if (!jv.is_object()) {
                throw DataFileError(path + ": expected an object, got " + json::serialize(jv));
            }
            return jv.as_object();
        }

        const json::array &arrayOf(const json::value &jv, const std::string &path) {
            if (!jv.is_array()) {
                throw DataFileError(path + ": expected a list, got " + json::serialize(jv));
            }
            return jv.as_array();
        }

        std::vector<double> numberList(const json::value &jv, const std::string &path) {
            std::vector<double> values;
            for (const auto &item: arrayOf(jv, path)) {
                const auto value = numberOf(item);
                if (!value) {
                    throw DataFileError(path + ": non-numeric array entry " + json::serialize(item));
                }
                values.push_back(*value);
            }
            return values;
        }

        std::vector<double> optionalNumberList(const json::object &obj, const char *key, const std::string &path) {
            const json::value *jv = obj.if_contains(key);
            return (jv && !jv->is_null()) ? numberList(*jv, path) : std::vector<double>{};
        }

        void setCorners(BoundingBox &box, const std::vector<double> &coords, const std::string &path) {
            if (coords.size() != 4) {
                throw DataFileError(path + ": box " + std::to_string(box.bbox_index) + " needs 4 coordinates");
            }
            box.x1 = coords[0];
            box.y1 = coords[1];
            box.x2 = coords[2];
            box.y2 = coords[3];
        }

        std::vector<BoundingBox> parseFaceBoxes(const json::value &face_node, const std::string &path) {
            std::vector<BoundingBox> boxes;
            const json::object &face_obj = objectOf(face_node, path);
            const json::value *boxes_node = face_obj.if_contains("boxes");
            if (!boxes_node || boxes_node->is_null()) {
                return boxes;
            }
            const std::vector<double> scores = optionalNumberList(face_obj, "scores", path);
            const std::vector<double> classes = optionalNumberList(face_obj, "classes", path);

            int idx = 0;
            for (const auto &box_node: arrayOf(*boxes_node, path)) {
                BoundingBox box;
                box.bbox_index = idx;
                if (box_node.is_object()) {
                    const json::object &obj = box_node.as_object();
                    const json::value *coords = obj.if_contains("coordinates");
                    if (!coords) {
                        throw DataFileError(path + ": box " + std::to_string(idx) + " without coordinates");
                    }
                    setCorners(box, numberList(*coords, path), path);
                    box.score = numberAt(obj, "score");
                    box.class_id = static_cast<int>(numberAt(obj, "class").value_or(-1.0));
                } else {
                    setCorners(box, numberList(box_node, path), path);
                    if (static_cast<size_t>(idx) < scores.size()) {
                        box.score = scores[idx];
                    }
                    if (static_cast<size_t>(idx) < classes.size()) {
                        box.class_id = static_cast<int>(classes[idx]);
                    }
                }
                boxes.push_back(box);
                ++idx;
            }
            return boxes;
        }

        std::string keyOf(const json::key_value_pair &entry) {
            return {entry.key().data(), entry.key().size()};
        }

        json::value optionalNumber(const std::optional<double> &value) {
            return value ? json::value(*value) : json::value(nullptr);
        }

        json::value classValue(const int class_id) {
            return class_id >= 0 ? json::value(class_id) : json::value(nullptr);
        }

        int classAt(const json::object &obj) {
            return static_cast<int>(numberAt(obj, "class_id").value_or(-1.0));
        }

        void writeDouble(std::ostream &os, const double value) {
            if (!std::isfinite(value)) {
                os << "null";
                return;
            }
            std::array<char, 32> buf{};
            const auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
            os.write(buf.data(), end - buf.data());
        }

        template<typename Record>
        void writeFaceLists(
            const std::string &path,
            const std::map<CubeFace, std::vector<Record> > &by_face,
            const FaceNames &names) {
            json::object root;
            size_t total = 0;
            for (const auto &[face, records]: by_face) {
                json::array list;
                for (const auto &record: records) {
                    list.push_back(json::value_from(record));
                }
                total += records.size();
                root[names[faceIndex(face)]] = std::move(list);
            }
            saveJson(path, root);
            std::cout << "[IO] wrote " << total << " records to " << path << std::endl;
        }
    }

    void writePrettyJson(std::ostream &os, const json::value &jv, const std::string &indent) {
        switch (jv.kind()) {
            case json::kind::object: {
                const auto &obj = jv.get_object();
                if (obj.empty()) {
                    os << "{}";
                    return;
                }
                const std::string inner = indent + "    ";
                os << "{\n";
                for (auto it = obj.begin(); it != obj.end(); ++it) {
                    if (it != obj.begin()) {
                        os << ",\n";
                    }
                    os << inner << json::serialize(json::value(it->key())) << ": ";
                    writePrettyJson(os, it->value(), inner);
                }
                os << "\n" << indent << "}";
                break;
            }
            case json::kind::array: {
                const auto &arr = jv.get_array();
                if (arr.empty()) {
                    os << "[]";
                    return;
                }
                const std::string inner = indent + "    ";
                os << "[\n";
                for (auto it = arr.begin(); it != arr.end(); ++it) {
                    if (it != arr.begin()) {
                        os << ",\n";
                    }
                    os << inner;
                    writePrettyJson(os, *it, inner);
                }
                os << "\n" << indent << "]";
                break;
            }
            case json::kind::double_:
                writeDouble(os, jv.get_double());
                break;
            default:
                os << json::serialize(jv);
                break;
        }
    }

    void tag_invoke(const json::value_from_tag &, json::value &jv, const AzimuthRecord &record) {
        jv = {
            {"bbox_index", record.bbox_index},
            {"class_id", classValue(record.class_id)},
            {"azimuth_deg", record.azimuth_deg},
        };
    }

    void tag_invoke(const json::value_from_tag &, json::value &jv, const DistanceRecord &record) {
        jv = {
            {"bbox_index", record.bbox_index},
            {"class_id", classValue(record.class_id)},
            {"score", optionalNumber(record.score)},
            {"distance_m", optionalNumber(record.distance_m)},
        };
    }

    void tag_invoke(const json::value_from_tag &, json::value &jv, const GeocodedDetection &detection) {
        jv = {
            {"bbox_index", detection.bbox_index},
            {"class_id", classValue(detection.class_id)},
            {"score", optionalNumber(detection.score)},
            {"azimuth_deg", detection.azimuth_deg},
            {"distance_m", detection.distance_m},
            {"latitude", detection.latitude},
            {"longitude", detection.longitude},
        };
    }

    FaceDetections DetectionFileIO::readDetections(const std::string &path, const FaceNames &names) {
        std::cout << "[IO] reading detections: " << path << std::endl;
        const json::object root = loadJson(path);

        FaceDetections detections;
        size_t total = 0;
        for (const auto &entry: root) {
            const CubeFace face = faceFromKey(keyOf(entry), names);
            auto boxes = parseFaceBoxes(entry.value(), path);
            total += boxes.size();
            detections[face] = std::move(boxes);
        }
        std::cout << "[IO] detections: faces=" << detections.size() << ", boxes=" << total << std::endl;
        return detections;
    }

    void DetectionFileIO::writeAzimuths(const std::string &path, const FaceAzimuths &azimuths, const FaceNames &names) {
        writeFaceLists(path, azimuths, names);
    }

    FaceAzimuths DetectionFileIO::readAzimuths(const std::string &path, const FaceNames &names) {
        const json::object root = loadJson(path);
        FaceAzimuths azimuths;
        for (const auto &entry: root) {
            const CubeFace face = faceFromKey(keyOf(entry), names);
            auto &face_out = azimuths[face];
            for (const auto &item: arrayOf(entry.value(), path)) {
                const json::object &obj = objectOf(item, path);
                AzimuthRecord record;
                record.face = face;
                record.bbox_index = static_cast<int>(requiredNumber(obj, "bbox_index", path));
                record.class_id = classAt(obj);
                record.azimuth_deg = requiredNumber(obj, "azimuth_deg", path);
                face_out.push_back(record);
            }
        }
        return azimuths;
    }

    void DetectionFileIO::writeDistances(const std::string &path, const FaceDistances &distances, const FaceNames &names) {
        writeFaceLists(path, distances, names);
    }

    FaceDistances DetectionFileIO::readDistances(const std::string &path, const FaceNames &names) {
        std::cout << "[IO] reading distances: " << path << std::endl;
        const json::object root = loadJson(path);
        FaceDistances distances;
        for (const auto &entry: root) {
            const CubeFace face = faceFromKey(keyOf(entry), names);
            auto &face_out = distances[face];
            for (const auto &item: arrayOf(entry.value(), path)) {
                const json::object &obj = objectOf(item, path);
                DistanceRecord record;
                record.face = face;
                record.bbox_index = static_cast<int>(requiredNumber(obj, "bbox_index", path));
                record.class_id = classAt(obj);
                record.score = numberAt(obj, "score");
                record.distance_m = numberAt(obj, "distance_m");
                if (!record.distance_m) {
                    record.distance_m = numberAt(obj, "distance");
                }
                face_out.push_back(record);
            }
        }
        return distances;
    }

    void DetectionFileIO::writeGeocoded(const std::string &path, const FaceGeocoded &geocoded, const FaceNames &names) {
        writeFaceLists(path, geocoded, names);
    }
} // namespace cubegeo
