/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KML_Geometry>
#include <kmlGlobeKML/KML_NodeTransformers>
#include <kmlGlobeKML/KMLRenderContext>

using namespace kmlGlobe_kml;

KML_GeometrySupport::KML_GeometrySupport(const KML_Node& node) :
_node     ( node ),
_visible  ( true ),
_lastFrame( ~0u )
{
    //nop
}

bool
KML_GeometrySupport::render(KMLRenderContext& dc)
{
    if ( !_visible )
        return false;

    _lastFrame = dc.getFrameNumber();

    if ( dc.kmlOptions().lastStyle.isSet() )
    {
        _style = dc.kmlOptions().lastStyle.get();
    }

    return true;
}

optional<bool>
KML_GeometrySupport::getExtrude() const
{
    return _node.get( "extrude", KML_NodeTransformers::boolean );
}

optional<bool>
KML_GeometrySupport::getTessellate() const
{
    return _node.get( "tessellate", KML_NodeTransformers::boolean );
}

optional<std::string>
KML_GeometrySupport::getAltitudeMode() const
{
    return _node.get( "altitudeMode", KML_NodeTransformers::string );
}
