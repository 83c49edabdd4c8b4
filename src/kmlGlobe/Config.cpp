/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobe/Config>
#include <kmlGlobe/Notify>
#include <rapidxml.hpp>
#include <sstream>

using namespace kmlGlobe;
using namespace rapidxml;

#define LC "[Config] "

namespace
{
    bool keys_equal(const std::string& a, const std::string& b)
    {
        return ciEquals(a, b);
    }

    Config xmlToConfig(xml_node<>* node)
    {
        Config conf( node->name() );

        for (xml_attribute<>* attr = node->first_attribute(); attr; attr = attr->next_attribute())
        {
            conf.add( attr->name(), attr->value() );
        }

        bool hasElements = false;
        for (xml_node<>* child = node->first_node(); child; child = child->next_sibling())
        {
            if ( child->type() == node_element )
            {
                hasElements = true;
                conf.add( xmlToConfig(child) );
            }
            else if ( child->type() == node_data || child->type() == node_cdata )
            {
                conf.setValue( conf.value() + child->value() );
            }
        }

        if ( hasElements )
            conf.setValue( "" );
        else
            conf.setValue( trim(conf.value()) );

        return conf;
    }
}

bool
Config::fromXML( std::istream& in )
{
    std::stringstream buffer;
    buffer << in.rdbuf();
    std::string xmlStr = buffer.str();
    if ( xmlStr.empty() )
        return false;

    xml_document<> doc;
    try
    {
        doc.parse<0>( &xmlStr[0] );
    }
    catch(const parse_error& e)
    {
        KG_WARN << LC << "XML parse error: " << e.what() << std::endl;
        return false;
    }

    xml_node<>* root = doc.first_node();
    while ( root && root->type() != node_element )
        root = root->next_sibling();

    if ( !root )
        return false;

    *this = xmlToConfig( root );
    return true;
}

const Config&
Config::child( const std::string& childName ) const
{
    for (auto& c : _children) {
        if (keys_equal(c.key(), childName))
            return c;
    }

    static Config s_emptyConf;
    return s_emptyConf;
}

const Config*
Config::child_ptr( const std::string& childName ) const
{
    for (auto& c : _children) {
        if (keys_equal(c.key(), childName))
            return &c;
    }
    return nullptr;
}

void
Config::remove( const std::string& key )
{
    for (ConfigSet::iterator i = _children.begin(); i != _children.end(); )
    {
        if (keys_equal(i->key(), key))
            i = _children.erase(i);
        else
            ++i;
    }
}

void
Config::merge( const Config& rhs )
{
    // remove any matching keys first; this will allow the addition of multi-key values
    for (auto& c : rhs._children)
        remove(c.key());

    for (auto& c : rhs._children)
        add(c);
}

Config
ConfigOptions::getConfig() const
{
    return _conf;
}
