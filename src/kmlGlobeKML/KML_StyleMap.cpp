/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KML_StyleMap>

using namespace kmlGlobe_kml;

#define LC "[KML_StyleMap] "

void
KML_StyleMap::scan2( const KML_Node& node, KML_StyleSheet& sheet )
{
    KML_StyleSet styles;

    for(auto& pair : node.children("pair"))
    {
        std::string key = toLower(pair.value("key"));

        osg::ref_ptr<const KML_Style> style;

        // a pair refers to a shared style, or carries its own
        KML_Node inlineStyle = pair.child("style");
        if ( inlineStyle.valid() )
        {
            style = KML_Style::read( inlineStyle );
        }
        else
        {
            std::string url = pair.value("styleurl");
            if ( !url.empty() )
            {
                style = sheet.getStyle( url );
                if ( !style.valid() )
                {
                    KG_WARN << LC << "Style map \"" << node.attr("id")
                        << "\" refers to unknown style \"" << url << "\"" << std::endl;
                }
            }
        }

        if ( key == "normal" )
            styles.normal = style;
        else if ( key == "highlight" )
            styles.highlight = style;
    }

    sheet.addStyleMap( node.attr("id"), styles );
}
