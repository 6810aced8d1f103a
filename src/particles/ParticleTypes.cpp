#include "heartfield/particles/ParticleTypes.hpp"
#include <algorithm>
#include <cctype>

namespace heartfield {
namespace particles {

std::string mode_to_string(Mode mode) {
    switch (mode) {
        case Mode::HEART: return "heart";
        case Mode::STARFIELD: return "starfield";
        default: return "invalid";
    }
}

bool parse_mode(const std::string& name, Mode& mode) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "heart") {
        mode = Mode::HEART;
        return true;
    }
    if (lower == "starfield" || lower == "space") {
        mode = Mode::STARFIELD;
        return true;
    }
    return false;
}

} // namespace particles
} // namespace heartfield
