/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KML_NodeTransformers>
#include <kmlGlobeKML/KML_LinearRing>
#include <cmath>

using namespace kmlGlobe_kml;

#define LC "[KML_NodeTransformers] "

optional<bool>
KML_NodeTransformers::boolean(const KML_Node& node)
{
    optional<bool> result;
    std::string t = toLower(node.text());
    if ( t == "1" || t == "true" )
        result = true;
    else if ( t == "0" || t == "false" )
        result = false;
    else if ( !t.empty() )
        KG_DEBUG << LC << "Ignoring <" << node.getName() << "> value \"" << t << "\"" << std::endl;
    return result;
}

optional<std::string>
KML_NodeTransformers::string(const KML_Node& node)
{
    optional<std::string> result;
    std::string t = node.text();
    if ( !t.empty() )
        result = t;
    return result;
}

optional<double>
KML_NodeTransformers::number(const KML_Node& node)
{
    optional<double> result;
    double value = parseDouble( node.text() );
    if ( !std::isnan(value) )
        result = value;
    return result;
}

optional<PositionVector>
KML_NodeTransformers::positions(const KML_Node& node)
{
    PositionVector output;

    StringVector tuples;
    StringTokenizer( node.text(), tuples, " \t\r\n", false, true );
    for( StringVector::const_iterator s = tuples.begin(); s != tuples.end(); ++s )
    {
        StringVector parts;
        StringTokenizer( *s, parts, ",", false, true );
        if ( parts.size() >= 2 )
        {
            Position p;
            p.longitude() = as<double>( parts[0], 0.0 );
            p.latitude()  = as<double>( parts[1], 0.0 );
            if ( parts.size() >= 3 )
                p.altitude() = as<double>( parts[2], 0.0 );
            output.push_back( p );
        }
        else
        {
            KG_DEBUG << LC << "Skipping malformed coordinate tuple \"" << *s << "\"" << std::endl;
        }
    }

    return optional<PositionVector>( PositionVector(), output );
}

optional< osg::ref_ptr<KML_LinearRing> >
KML_NodeTransformers::linearRing(const KML_Node& node)
{
    optional< osg::ref_ptr<KML_LinearRing> > result;
    KML_Node ring = node.child( "linearring" );
    if ( ring.valid() )
        result = osg::ref_ptr<KML_LinearRing>( new KML_LinearRing(ring) );
    return result;
}
