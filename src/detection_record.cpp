#include "detection_record.hpp"

#include <cmath>

namespace cubegeo {
    bool BoundingBox::isValid() const {
        if (!std::isfinite(x1) || !std::isfinite(y1) || !std::isfinite(x2) || !std::isfinite(y2)) {
            return false;
        }
        return x1 <= x2 && y1 <= y2;
    }
} // namespace cubegeo
