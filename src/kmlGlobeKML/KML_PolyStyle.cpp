/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KML_PolyStyle>

using namespace kmlGlobe_kml;

void
KML_PolyStyle::scan( const KML_Node& node, KML_Style& style )
{
    if ( !node.valid() )
        return;

    std::string colorVal = node.value("color");
    if ( !colorVal.empty() )
    {
        style.polyColor() = Color( colorVal, Color::ABGR );
    }

    std::string fillVal = node.value("fill");
    if ( !fillVal.empty() )
    {
        style.polyFill() = as<int>(fillVal, 1) == 1;
    }

    std::string outlineVal = node.value("outline");
    if ( !outlineVal.empty() )
    {
        style.polyOutline() = as<int>(outlineVal, 1) == 1;
    }
}
