/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KML_Placemark>
#include <kmlGlobeKML/KML_NodeTransformers>
#include <kmlGlobeKML/KMLRenderContext>

using namespace kmlGlobe_kml;

#define LC "[KML_Placemark] "

KML_Placemark::KML_Placemark(const KML_Node& node, KML_Geometry* geometry) :
_node    ( node ),
_geometry( geometry )
{
    _name = _node.get( "name", KML_NodeTransformers::string ).getOrUse( std::string() );

    // <visibility>0</visibility> hides the placemark's geometry
    if ( _geometry.valid() &&
         _node.get( "visibility", KML_NodeTransformers::boolean ).getOrUse( true ) == false )
    {
        _geometry->setVisible( false );
    }
}

void
KML_Placemark::render(KMLRenderContext& dc)
{
    if ( !_geometry.valid() )
        return;

    optional<KML_StyleSet> previous = dc.kmlOptions().lastStyle;

    if ( _style.isSet() )
        dc.kmlOptions().lastStyle = _style.get();
    else
        dc.kmlOptions().lastStyle.unset();

    _geometry->render( dc );

    dc.kmlOptions().lastStyle = previous;
}
