/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KML_Elements>
#include <kmlGlobeKML/KML_Polygon>
#include <kmlGlobeKML/KML_LineString>

using namespace kmlGlobe_kml;

#define LC "[KML_Elements] "

KML_Elements::KML_Elements()
{
    //nop
}

void
KML_Elements::add(const std::string& tagName, const Factory& factory)
{
    // keyed case-insensitively; the registered spelling is kept for getTagNames()
    _factories[toLower(tagName)] = std::make_pair( tagName, factory );
}

void
KML_Elements::registerDefaults()
{
    add<KML_Polygon>();
    add<KML_LineString>();
}

bool
KML_Elements::contains(const std::string& tagName) const
{
    return _factories.find( toLower(tagName) ) != _factories.end();
}

KML_Geometry*
KML_Elements::create(const KML_Node& node) const
{
    if ( !node.valid() )
        return 0L;

    FactoryTable::const_iterator i = _factories.find( toLower(node.getName()) );
    if ( i == _factories.end() )
    {
        KG_DEBUG << LC << "No adapter for <" << node.getName() << ">" << std::endl;
        return 0L;
    }

    return i->second.second( node );
}

StringVector
KML_Elements::getTagNames() const
{
    StringVector names;
    for(auto& f : _factories)
        names.push_back( f.second.first );
    return names;
}
