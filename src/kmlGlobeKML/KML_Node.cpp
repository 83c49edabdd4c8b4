/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KML_Node>
#include <kmlGlobeKML/KMLFile>

using namespace kmlGlobe_kml;

KML_Node::KML_Node() :
_node( 0L )
{
    //nop
}

KML_Node::KML_Node(const KMLFile* file, XmlNode* node) :
_file( file ),
_node( node )
{
    //nop
}

const KMLFile*
KML_Node::getFile() const
{
    return static_cast<const KMLFile*>( _file.get() );
}

std::string
KML_Node::getName() const
{
    return _node ? std::string(_node->name(), _node->name_size()) : std::string();
}

KML_Node
KML_Node::child(const std::string& name) const
{
    if ( _node )
    {
        XmlNode* c = _node->first_node( name.c_str(), name.size(), false );
        if ( c )
            return KML_Node( getFile(), c );
    }
    return KML_Node();
}

KML_NodeVector
KML_Node::children(const std::string& name) const
{
    KML_NodeVector output;
    if ( _node )
    {
        const char* n = name.empty() ? 0L : name.c_str();
        for(XmlNode* c = _node->first_node(n, name.size(), false); c; c = c->next_sibling(n, name.size(), false))
        {
            if ( c->type() == rapidxml::node_element )
                output.push_back( KML_Node(getFile(), c) );
        }
    }
    return output;
}

std::string
KML_Node::attr(const std::string& key) const
{
    if ( _node )
    {
        for(rapidxml::xml_attribute<>* a = _node->first_attribute(); a; a = a->next_attribute())
        {
            if ( ciEquals(a->name(), key) )
                return a->value();
        }
    }
    return EMPTY_STRING;
}

std::string
KML_Node::text() const
{
    std::string result;
    if ( _node )
    {
        if ( _node->value_size() > 0 )
        {
            result = _node->value();
        }
        else
        {
            // try to read a CDATA node
            XmlNode* c = _node->first_node();
            if ( c && (c->type() == rapidxml::node_cdata || c->type() == rapidxml::node_data) )
            {
                result = c->value();
            }
        }
    }
    if ( !result.empty() )
        trim2( result );
    return result;
}

std::string
KML_Node::value(const std::string& key) const
{
    std::string result = attr( key );
    if ( result.empty() )
        result = child( key ).text();
    return result;
}
