/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KML_Style>
#include <kmlGlobeKML/KML_PolyStyle>
#include <kmlGlobeKML/KML_LineStyle>

using namespace kmlGlobe_kml;

KML_Style::KML_Style(const std::string& id) :
_id( id )
{
    //nop
}

KML_Style*
KML_Style::read(const KML_Node& node)
{
    KML_Style* style = new KML_Style( node.attr("id") );

    KML_PolyStyle poly;
    poly.scan( node.child("polystyle"), *style );

    KML_LineStyle line;
    line.scan( node.child("linestyle"), *style );

    return style;
}

ShapeAttributes::Options
KML_Style::generate() const
{
    ShapeAttributes::Options options;

    if ( polyColor().isSet() )
        options.interiorColor() = polyColor().get();

    if ( polyFill().isSet() )
        options.drawInterior() = polyFill().get();

    if ( polyOutline().isSet() )
        options.drawOutline() = polyOutline().get();

    if ( lineColor().isSet() )
        options.outlineColor() = lineColor().get();

    if ( lineWidth().isSet() )
        options.outlineWidth() = lineWidth().get();

    return options;
}
