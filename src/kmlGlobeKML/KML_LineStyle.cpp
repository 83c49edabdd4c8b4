/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KML_LineStyle>

using namespace kmlGlobe_kml;

void
KML_LineStyle::scan( const KML_Node& node, KML_Style& style )
{
    if ( !node.valid() )
        return;

    std::string color = node.value("color");
    if ( !color.empty() )
    {
        style.lineColor() = Color( color, Color::ABGR );
    }

    std::string widthStr = node.value("width");
    if ( !widthStr.empty() )
    {
        style.lineWidth() = as<float>(widthStr, 1.0f);
    }
}
