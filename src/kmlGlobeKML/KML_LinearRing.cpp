/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KML_LinearRing>
#include <kmlGlobeKML/KML_NodeTransformers>

using namespace kmlGlobe_kml;

KML_LinearRing::KML_LinearRing(const KML_Node& node) :
_node( node )
{
    //nop
}

PositionVector
KML_LinearRing::getPositions() const
{
    return _node.get( "coordinates", KML_NodeTransformers::positions ).get();
}

Position
KML_LinearRing::getCenter() const
{
    PositionVector positions = getPositions();
    if ( positions.empty() )
        return Position();

    double lat = 0.0, lon = 0.0, alt = 0.0;
    for(auto& p : positions)
    {
        lat += p.latitude();
        lon += p.longitude();
        alt += p.altitude();
    }

    double n = (double)positions.size();
    return Position( lat/n, lon/n, alt/n );
}
