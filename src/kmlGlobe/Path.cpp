/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobe/Path>
#include <kmlGlobe/RenderContext>

using namespace kmlGlobe;

Path::Path(const PositionVector& positions, const ShapeAttributes* attributes) :
_extrude      ( false ),
_followTerrain( false ),
_altitudeMode ( AltitudeMode::ALTMODE_CLAMP_TO_GROUND ),
_positions    ( positions ),
_attributes   ( attributes )
{
    if ( !_attributes.valid() )
        _attributes = new ShapeAttributes();
}

void
Path::render(RenderContext& dc)
{
    if ( isValid() )
    {
        _lastFrame = dc.getFrameNumber();
    }
}
