/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KMLFile>
#include <osgDB/FileUtils>
#include <osgDB/fstream>
#include <sstream>

using namespace kmlGlobe_kml;

#define LC "[KMLFile] "

KMLFile::KMLFile() :
_root( 0L )
{
    //nop
}

Status
KMLFile::load(const std::string& location)
{
    std::string path = osgDB::findDataFile( location );
    if ( path.empty() )
    {
        return Status(Status::ResourceUnavailable, Stringify() << "File not found: " << location);
    }

    osgDB::ifstream in( path.c_str() );
    if ( !in.is_open() )
    {
        return Status(Status::ResourceUnavailable, Stringify() << "Unable to open " << path);
    }

    return read( in, path );
}

Status
KMLFile::read(std::istream& in, const std::string& referrer)
{
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse( buffer.str(), referrer );
}

Status
KMLFile::parse(const std::string& xml, const std::string& referrer)
{
    _doc.clear();
    _root = 0L;
    _referrer = referrer;

    // rapidxml parses in place, so the buffer lives as long as the file.
    _buffer = xml;
    _buffer.push_back( '\0' );

    try
    {
        _doc.parse<0>( &_buffer[0] );
    }
    catch(const rapidxml::parse_error& e)
    {
        _doc.clear();
        return Status(Status::GeneralError, Stringify()
            << "XML parse error in " << (referrer.empty() ? "document" : referrer)
            << ": " << e.what());
    }

    _root = _doc.first_node( "kml", 0, false );
    if ( !_root )
    {
        return Status(Status::ConfigurationError, Stringify()
            << "No <kml> root element in " << (referrer.empty() ? "document" : referrer));
    }

    KG_DEBUG << LC << "Parsed " << (referrer.empty() ? "document" : referrer) << std::endl;
    return STATUS_OK;
}

KML_Node
KMLFile::getRoot() const
{
    return _root ? KML_Node( this, _root ) : KML_Node();
}
