#include <QiLandscape/Core/Types.h>

namespace Qi::Landscape {

// =============================================================================
// Circle2d Implementation
// =============================================================================

double Circle2d::Area() const {
    return PI * radius * radius;
}

double Circle2d::Circumference() const {
    return 2.0 * PI * radius;
}

} // namespace Qi::Landscape
