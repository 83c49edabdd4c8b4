/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#define LC "[kmlglobe_info] "

#include <kmlGlobe/Notify>
#include <kmlGlobe/Config>
#include <kmlGlobe/Polygon>
#include <kmlGlobe/Path>
#include <kmlGlobe/RenderableLayer>
#include <kmlGlobeKML/KMLReader>
#include <kmlGlobeKML/KMLRenderContext>

#include <osg/ArgumentParser>
#include <osgDB/FileUtils>
#include <osgDB/fstream>

#include <iostream>

using namespace kmlGlobe;
using namespace kmlGlobe_kml;

// documentation
int usage(char** argv)
{
    std::cout
        << "Loads a KML file, renders it into a layer and lists the resulting shapes.\n\n"
        << argv[0] << " file.kml"
        << "\n    --frames [int]             : number of frames to render (default = 2)"
        << "\n    --altitude-mode [mode]     : default altitude mode (clampToGround, relativeToGround, absolute)"
        << "\n    --options [file.xml]       : read KML options from an XML file"
        << "\n    --verbose                  : log at INFO level"
        << "\n    --help                     : show this message"
        << std::endl;

    return 0;
}

void
printRenderable(const Renderable* r, unsigned index)
{
    std::cout << "  [" << index << "] " << r->getDisplayName();

    if ( const Polygon* polygon = dynamic_cast<const Polygon*>(r) )
    {
        std::cout << " : Polygon, " << polygon->getNumBoundaries() << " boundaries (";
        for(unsigned i = 0; i < polygon->getNumBoundaries(); ++i)
            std::cout << (i > 0 ? ", " : "") << polygon->getBoundaries()[i].size();
        std::cout << " positions)"
            << ", extrude=" << (polygon->extrude() ? "true" : "false")
            << ", altitudeMode=" << polygon->altitudeMode()
            << ", interior=" << polygon->getAttributes()->getInteriorColor().toHTML(Color::RGBA);
    }
    else if ( const Path* path = dynamic_cast<const Path*>(r) )
    {
        std::cout << " : Path, " << path->getPositions().size() << " positions"
            << ", extrude=" << (path->extrude() ? "true" : "false")
            << ", followTerrain=" << (path->followTerrain() ? "true" : "false")
            << ", altitudeMode=" << path->altitudeMode();
    }

    std::cout << std::endl;
}

int
main(int argc, char** argv)
{
    osg::ArgumentParser arguments(&argc, argv);

    if ( arguments.read("--help") || argc < 2 )
        return usage(argv);

    if ( arguments.read("--verbose") )
        setNotifyLevel( osg::INFO );

    KMLOptions options;

    std::string optionsFile;
    if ( arguments.read("--options", optionsFile) )
    {
        std::string path = osgDB::findDataFile( optionsFile );
        osgDB::ifstream in( path.c_str() );
        Config conf;
        if ( path.empty() || !in.is_open() || !conf.fromXML(in) )
        {
            KG_WARN << LC << "Unable to read options from " << optionsFile << std::endl;
            return -1;
        }
        options.merge( ConfigOptions(conf) );
    }

    unsigned frames;
    if ( arguments.read("--frames", frames) )
        options.frames() = frames;

    std::string altitudeMode;
    if ( arguments.read("--altitude-mode", altitudeMode) )
    {
        if ( !AltitudeMode::isValid(altitudeMode) )
        {
            KG_WARN << LC << "Unknown altitude mode \"" << altitudeMode << "\"" << std::endl;
            return usage(argv);
        }
        options.defaultAltitudeMode() = altitudeMode;
    }

    arguments.reportRemainingOptionsAsUnrecognized();
    if ( arguments.errors() )
    {
        arguments.writeErrorMessages( std::cerr );
        return usage(argv);
    }

    std::string location;
    for(int pos = 1; pos < arguments.argc(); ++pos)
    {
        if ( !arguments.isOption(pos) )
        {
            location = arguments[pos];
            break;
        }
    }

    if ( location.empty() )
        return usage(argv);

    KML_Elements elements;
    elements.registerDefaults();

    KMLReader reader( elements );

    osg::ref_ptr<KML_Scene> scene;
    Status status = reader.read( location, scene );
    if ( status.isError() )
    {
        KG_WARN << LC << status.toString() << std::endl;
        return -1;
    }

    osg::ref_ptr<RenderableLayer> layer = new RenderableLayer( location );

    KMLRenderContext dc( options );
    dc.setCurrentLayer( layer.get() );

    for(unsigned i = 0; i < options.frames().get(); ++i)
    {
        scene->render( dc );
        layer->render( dc );
        dc.advanceFrame();
    }

    std::cout
        << location << "\n"
        << "  placemarks  : " << scene->getNumPlacemarks() << "\n"
        << "  styles      : " << scene->getStyleSheet()->getNumStyles() << "\n"
        << "  style maps  : " << scene->getStyleSheet()->getNumStyleMaps() << "\n"
        << "  frames      : " << options.frames().get() << "\n"
        << "  renderables : " << layer->getNumRenderables() << std::endl;

    for(unsigned i = 0; i < layer->getNumRenderables(); ++i)
    {
        printRenderable( layer->getRenderable(i), i );
    }

    return 0;
}
