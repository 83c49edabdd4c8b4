/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KMLReader>
#include <kmlGlobeKML/KML_StyleMap>
#include <kmlGlobeKML/KMLFile>
#include <osg/Timer>

using namespace kmlGlobe_kml;

#define LC "[KMLReader] "

namespace
{
    // Elements whose children are features
    bool isContainer(const std::string& name)
    {
        return ciEquals(name, "Document") || ciEquals(name, "Folder");
    }
}

KMLReader::KMLReader(const KML_Elements& elements) :
_elements( elements )
{
    //nop
}

Status
KMLReader::read(std::istream& in, osg::ref_ptr<KML_Scene>& output, const std::string& referrer)
{
    osg::ref_ptr<KMLFile> file = new KMLFile();
    Status status = file->read( in, referrer );
    if ( status.isError() )
        return status;

    return read( file.get(), output );
}

Status
KMLReader::read(const std::string& location, osg::ref_ptr<KML_Scene>& output)
{
    osg::ref_ptr<KMLFile> file = new KMLFile();
    Status status = file->load( location );
    if ( status.isError() )
        return status;

    return read( file.get(), output );
}

Status
KMLReader::read(const KMLFile* file, osg::ref_ptr<KML_Scene>& output)
{
    if ( !file )
        return Status(Status::AssertionFailure, "No KML file");

    KML_Node top = file->getRoot();
    if ( !top.valid() )
        return Status(Status::ConfigurationError, "KML file has no <kml> root element");

    osg::Timer_t start = osg::Timer::instance()->tick();

    osg::ref_ptr<KML_StyleSheet> sheet = new KML_StyleSheet();
    osg::ref_ptr<KML_Scene> scene = new KML_Scene( file, sheet.get() );

    scan ( top, *sheet );    // first pass
    scan2( top, *sheet );    // second pass
    build( top, *sheet, *scene );   // third pass

    osg::Timer_t end = osg::Timer::instance()->tick();

    KG_INFO << LC << "Loaded "
        << (file->getReferrer().empty() ? std::string("KML") : file->getReferrer())
        << ": " << scene->getNumPlacemarks() << " placemarks, "
        << sheet->getNumStyles() << " styles, "
        << sheet->getNumStyleMaps() << " style maps in "
        << osg::Timer::instance()->delta_s(start, end) << "s" << std::endl;

    output = scene.get();
    return STATUS_OK;
}

void
KMLReader::scan(const KML_Node& node, KML_StyleSheet& sheet) const
{
    for(auto& c : node.children())
    {
        if ( ciEquals(c.getName(), "Style") )
        {
            osg::ref_ptr<KML_Style> style = KML_Style::read( c );
            if ( style->getId().empty() )
            {
                KG_DEBUG << LC << "Skipping shared <Style> without an id" << std::endl;
            }
            else
            {
                sheet.addStyle( style.get() );
            }
        }
        else if ( isContainer(c.getName()) )
        {
            scan( c, sheet );
        }
    }
}

void
KMLReader::scan2(const KML_Node& node, KML_StyleSheet& sheet) const
{
    for(auto& c : node.children())
    {
        if ( ciEquals(c.getName(), "StyleMap") )
        {
            KML_StyleMap styleMap;
            styleMap.scan2( c, sheet );
        }
        else if ( isContainer(c.getName()) )
        {
            scan2( c, sheet );
        }
    }
}

void
KMLReader::build(const KML_Node& node, const KML_StyleSheet& sheet, KML_Scene& scene) const
{
    for(auto& c : node.children())
    {
        if ( ciEquals(c.getName(), "Placemark") )
        {
            osg::ref_ptr<KML_Placemark> placemark = buildPlacemark( c, sheet );
            if ( placemark.valid() )
                scene.addPlacemark( placemark.get() );
        }
        else if ( isContainer(c.getName()) )
        {
            build( c, sheet, scene );
        }
    }
}

KML_Placemark*
KMLReader::buildPlacemark(const KML_Node& node, const KML_StyleSheet& sheet) const
{
    // the placemark's geometry is its first child with a registered adapter
    osg::ref_ptr<KML_Geometry> geometry;
    for(auto& c : node.children())
    {
        if ( _elements.contains(c.getName()) )
        {
            geometry = _elements.create( c );
            break;
        }
    }

    if ( !geometry.valid() )
    {
        KG_DEBUG << LC << "Placemark \"" << node.value("name") << "\" has no supported geometry" << std::endl;
        return 0L;
    }

    osg::ref_ptr<KML_Placemark> placemark = new KML_Placemark( node, geometry.get() );

    KML_Node inlineStyle = node.child("style");
    std::string styleUrl = trim(node.value("styleurl"));

    if ( inlineStyle.valid() )
    {
        KML_StyleSet styles;
        styles.normal = KML_Style::read( inlineStyle );
        styles.highlight = styles.normal;
        placemark->setStyle( styles );
    }
    else if ( !styleUrl.empty() )
    {
        KML_StyleSet styles;
        if ( sheet.resolve(styleUrl, styles) )
        {
            placemark->setStyle( styles );
        }
        else
        {
            // left unset: the geometry waits for a style that never arrives
            KG_WARN << LC << "Placemark \"" << placemark->getName()
                << "\" refers to unresolved style \"" << styleUrl << "\"" << std::endl;
        }
    }
    else
    {
        // no style at all: geometry is built with default attributes
        placemark->setStyle( KML_StyleSet() );
    }

    return placemark.release();
}
