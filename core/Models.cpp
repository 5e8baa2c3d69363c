#include "Models.hpp"

namespace iotpipe {

std::string featureToString(Feature feature) {
    switch (feature) {
        case Feature::Methods: return "methods";
        case Feature::C2D:     return "c2d";
        case Feature::Twin:    return "twin";
    }
    return "unknown";
}

} // namespace iotpipe
