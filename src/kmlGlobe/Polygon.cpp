/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobe/Polygon>
#include <kmlGlobe/RenderContext>
#include <kmlGlobe/Notify>

using namespace kmlGlobe;

#define LC "[Polygon] "

Polygon::Polygon(const Boundaries& boundaries, const ShapeAttributes* attributes) :
_extrude     ( false ),
_altitudeMode( AltitudeMode::ALTMODE_CLAMP_TO_GROUND ),
_boundaries  ( boundaries ),
_attributes  ( attributes ),
_warned      ( false )
{
    if ( !_attributes.valid() )
        _attributes = new ShapeAttributes();
}

bool
Polygon::isValid() const
{
    if ( _boundaries.empty() )
        return false;

    for(auto& boundary : _boundaries)
    {
        if ( boundary.size() < 3 )
            return false;
    }
    return true;
}

void
Polygon::render(RenderContext& dc)
{
    if ( !isValid() )
    {
        if ( !_warned )
        {
            KG_WARN << LC << "\"" << getDisplayName() << "\" has no closed boundary and will not be drawn" << std::endl;
            _warned = true;
        }
        return;
    }

    _lastFrame = dc.getFrameNumber();
}
