/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KML_StyleSheet>

using namespace kmlGlobe_kml;

#define LC "[KML_StyleSheet] "

namespace
{
    // "#id" and "id" both refer to a style in the same document.
    std::string localId(const std::string& url)
    {
        std::string id = trim(url);
        if ( startsWith(id, "#") )
            id = id.substr(1);
        return id;
    }
}

KML_StyleSheet::KML_StyleSheet()
{
    //nop
}

void
KML_StyleSheet::addStyle(const KML_Style* style)
{
    if ( !style )
        return;

    if ( style->getId().empty() )
    {
        KG_DEBUG << LC << "Ignoring shared style without an id" << std::endl;
        return;
    }

    _styles[style->getId()] = style;
}

void
KML_StyleSheet::addStyleMap(const std::string& id, const KML_StyleSet& styles)
{
    if ( id.empty() )
    {
        KG_DEBUG << LC << "Ignoring style map without an id" << std::endl;
        return;
    }

    _styleMaps[id] = styles;
}

const KML_Style*
KML_StyleSheet::getStyle(const std::string& url) const
{
    StyleTable::const_iterator i = _styles.find( localId(url) );
    return i != _styles.end() ? i->second.get() : 0L;
}

bool
KML_StyleSheet::resolve(const std::string& url, KML_StyleSet& output) const
{
    std::string id = localId(url);

    StyleMapTable::const_iterator m = _styleMaps.find( id );
    if ( m != _styleMaps.end() )
    {
        output = m->second;
        return true;
    }

    StyleTable::const_iterator s = _styles.find( id );
    if ( s != _styles.end() )
    {
        output.normal = s->second.get();
        output.highlight = s->second.get();
        return true;
    }

    return false;
}
