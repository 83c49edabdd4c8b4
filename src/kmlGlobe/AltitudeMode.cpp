/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobe/AltitudeMode>

using namespace kmlGlobe;

const std::string kmlGlobe::AltitudeMode::ALTMODE_CLAMP_TO_GROUND    = "clampToGround";
const std::string kmlGlobe::AltitudeMode::ALTMODE_RELATIVE_TO_GROUND = "relativeToGround";
const std::string kmlGlobe::AltitudeMode::ALTMODE_ABSOLUTE           = "absolute";

bool
kmlGlobe::AltitudeMode::isValid(const std::string& mode)
{
    return
        mode == ALTMODE_CLAMP_TO_GROUND ||
        mode == ALTMODE_RELATIVE_TO_GROUND ||
        mode == ALTMODE_ABSOLUTE;
}
