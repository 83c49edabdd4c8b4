/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobe/Status>

using namespace kmlGlobe;

const kmlGlobe::Status kmlGlobe::STATUS_OK;

std::string kmlGlobe::Status::_codeText[5] = {
    "No error",
    "Resource unavailable",
    "Configuration error",
    "Assertion failure",
    "Error"
};
