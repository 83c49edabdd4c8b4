/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include "TestUtils"

#include <kmlGlobeKML/KML_Polygon>
#include <kmlGlobeKML/KMLRenderContext>
#include <kmlGlobe/RenderableLayer>

using namespace kmlGlobe_tests;

namespace
{
    const char* OUTER =
        "<outerBoundaryIs><LinearRing><coordinates>"
        "10,10 10,20 20,20 20,10"
        "</coordinates></LinearRing></outerBoundaryIs>";

    const char* INNER =
        "<innerBoundaryIs><LinearRing><coordinates>"
        "12,12 12,18 18,18"
        "</coordinates></LinearRing></innerBoundaryIs>";

    osg::ref_ptr<KML_Polygon> makePolygon(const std::string& body, osg::ref_ptr<KMLFile>& file)
    {
        file = parseKML( placemark("<Polygon id=\"p1\">" + body + "</Polygon>") );
        KML_Node node = file->getRoot().child("Placemark").child("Polygon");
        REQUIRE( node.valid() );
        return new KML_Polygon( node );
    }

    void renderWithStyle(KML_Polygon* polygon, KMLRenderContext& dc, const KML_StyleSet& styles =KML_StyleSet())
    {
        dc.kmlOptions().lastStyle = styles;
        polygon->render( dc );
        dc.advanceFrame();
    }
}

TEST_CASE("KML_Polygon reads its document node")
{
    osg::ref_ptr<KMLFile> file;

    SECTION("Outer boundary and center")
    {
        osg::ref_ptr<KML_Polygon> polygon = makePolygon( OUTER, file );
        REQUIRE( polygon->getOuterBoundary().valid() );
        REQUIRE_FALSE( polygon->getInnerBoundary().valid() );

        PositionVector outer = polygon->getOuterBoundary()->getPositions();
        REQUIRE( outer.size() == 4 );
        REQUIRE( outer[1] == Position(20.0, 10.0) );

        Position center = polygon->getCenter();
        REQUIRE( center.latitude() == Approx(15.0) );
        REQUIRE( center.longitude() == Approx(15.0) );
        REQUIRE( center.altitude() == Approx(0.0) );
    }

    SECTION("Flags are unset when absent")
    {
        osg::ref_ptr<KML_Polygon> polygon = makePolygon( OUTER, file );
        REQUIRE_FALSE( polygon->getExtrude().isSet() );
        REQUIRE_FALSE( polygon->getTessellate().isSet() );
        REQUIRE_FALSE( polygon->getAltitudeMode().isSet() );
    }

    SECTION("Flags are read when present")
    {
        osg::ref_ptr<KML_Polygon> polygon = makePolygon(
            std::string("<extrude>1</extrude><tessellate>0</tessellate>"
                        "<altitudeMode>relativeToGround</altitudeMode>") + OUTER, file );
        REQUIRE( polygon->getExtrude().isSetTo(true) );
        REQUIRE( polygon->getTessellate().isSetTo(false) );
        REQUIRE( polygon->getAltitudeMode().isSetTo(AltitudeMode::ALTMODE_RELATIVE_TO_GROUND) );
    }

    SECTION("Tag names")
    {
        osg::ref_ptr<KML_Polygon> polygon = makePolygon( OUTER, file );
        REQUIRE( polygon->getTagNames() == StringVector(1, "Polygon") );
    }
}

TEST_CASE("KML_Polygon prepares locations")
{
    osg::ref_ptr<KMLFile> file;

    SECTION("Outer only gives a single boundary")
    {
        osg::ref_ptr<KML_Polygon> polygon = makePolygon( OUTER, file );
        Boundaries locations = polygon->prepareLocations();
        REQUIRE( locations.size() == 1 );
        REQUIRE( locations[0].size() == 4 );
    }

    SECTION("Inner boundary comes first")
    {
        osg::ref_ptr<KML_Polygon> polygon = makePolygon( std::string(OUTER) + INNER, file );
        Boundaries locations = polygon->prepareLocations();
        REQUIRE( locations.size() == 2 );
        REQUIRE( locations[0].size() == 3 );
        REQUIRE( locations[0][0] == Position(12.0, 12.0) );
        REQUIRE( locations[1].size() == 4 );
    }

    SECTION("Missing outer boundary is logged and yields nothing")
    {
        osg::ref_ptr<KML_Polygon> polygon = makePolygon( INNER, file );

        ScopedNotifyCapture capture( osg::WARN );
        Boundaries locations = polygon->prepareLocations();
        REQUIRE( locations.empty() );
        REQUIRE( capture._handler->contains("[KML_Polygon]") );
    }
}

TEST_CASE("KML_Polygon prepares attributes")
{
    osg::ref_ptr<KMLFile> file;

    SECTION("Forced values hold regardless of style")
    {
        osg::ref_ptr<KML_Polygon> polygon = makePolygon( OUTER, file );

        osg::ref_ptr<KML_Style> style = new KML_Style("s");
        style->polyColor() = Color::Green;
        style->polyOutline() = false;

        osg::ref_ptr<ShapeAttributes> attrs = polygon->prepareAttributes( style.get() );
        REQUIRE( attrs->getInteriorColor() == Color::Green );
        REQUIRE( attrs->getDrawOutline() == false );
        REQUIRE( attrs->getApplyLighting() == true );
        REQUIRE( attrs->getEnableLighting() == true );
        REQUIRE( attrs->getDepthTest() == true );
        REQUIRE( attrs->getOutlineStippleFactor() == 0 );
        REQUIRE( attrs->getOutlineStipplePattern() == 61680u );
        REQUIRE( attrs->getDrawVerticals() == false );
    }

    SECTION("No style still yields forced values")
    {
        osg::ref_ptr<KML_Polygon> polygon = makePolygon( OUTER, file );
        osg::ref_ptr<ShapeAttributes> attrs = polygon->prepareAttributes( 0L );
        REQUIRE( attrs->getApplyLighting() == true );
        REQUIRE( attrs->getEnableLighting() == true );
        REQUIRE( attrs->getDepthTest() == true );
        REQUIRE( attrs->getOutlineStippleFactor() == 0 );
    }

    SECTION("Verticals follow extrude")
    {
        osg::ref_ptr<KML_Polygon> polygon = makePolygon( std::string("<extrude>1</extrude>") + OUTER, file );
        osg::ref_ptr<ShapeAttributes> attrs = polygon->prepareAttributes( 0L );
        REQUIRE( attrs->getDrawVerticals() == true );
    }

    SECTION("Stipple pattern comes from the options")
    {
        osg::ref_ptr<KML_Polygon> polygon = makePolygon( OUTER, file );
        KMLOptions options;
        options.outlineStipplePattern() = 0xAAAAu;
        osg::ref_ptr<ShapeAttributes> attrs = polygon->prepareAttributes( 0L, options );
        REQUIRE( attrs->getOutlineStipplePattern() == 0xAAAAu );
    }
}

TEST_CASE("KML_Polygon builds its renderable")
{
    osg::ref_ptr<KMLFile> file;
    osg::ref_ptr<RenderableLayer> layer = new RenderableLayer("test");
    KMLRenderContext dc;
    dc.setCurrentLayer( layer.get() );

    SECTION("Simple outer ring, no flags")
    {
        osg::ref_ptr<KML_Polygon> polygon = makePolygon( OUTER, file );
        renderWithStyle( polygon.get(), dc );

        REQUIRE( layer->getNumRenderables() == 1 );
        Polygon* shape = dynamic_cast<Polygon*>( layer->getRenderable(0) );
        REQUIRE( shape != nullptr );
        REQUIRE( shape == polygon->getRenderable() );
        REQUIRE( shape->getNumBoundaries() == 1 );
        REQUIRE( shape->getBoundaries()[0].size() == 4 );
        REQUIRE( shape->extrude() == true );
        REQUIRE( shape->altitudeMode() == AltitudeMode::ALTMODE_CLAMP_TO_GROUND );
        REQUIRE( shape->getDisplayName() == "p1" );
    }

    SECTION("Built at most once")
    {
        osg::ref_ptr<KML_Polygon> polygon = makePolygon( OUTER, file );
        renderWithStyle( polygon.get(), dc );
        Polygon* first = polygon->getRenderable();

        renderWithStyle( polygon.get(), dc );
        polygon->createPolygon( dc, KML_StyleSet() );

        REQUIRE( layer->getNumRenderables() == 1 );
        REQUIRE( polygon->getRenderable() == first );
    }

    SECTION("Explicit extrude false stays false")
    {
        osg::ref_ptr<KML_Polygon> polygon = makePolygon( std::string("<extrude>0</extrude>") + OUTER, file );
        renderWithStyle( polygon.get(), dc );
        REQUIRE( polygon->getRenderable()->extrude() == false );
    }

    SECTION("Declared altitude mode is applied")
    {
        osg::ref_ptr<KML_Polygon> polygon = makePolygon( std::string("<altitudeMode>absolute</altitudeMode>") + OUTER, file );
        renderWithStyle( polygon.get(), dc );
        REQUIRE( polygon->getRenderable()->altitudeMode() == AltitudeMode::ALTMODE_ABSOLUTE );
    }

    SECTION("Default altitude mode comes from the options")
    {
        KMLOptions options;
        options.defaultAltitudeMode() = AltitudeMode::ALTMODE_RELATIVE_TO_GROUND;
        KMLRenderContext dc2( options );
        dc2.setCurrentLayer( layer.get() );

        osg::ref_ptr<KML_Polygon> polygon = makePolygon( OUTER, file );
        renderWithStyle( polygon.get(), dc2 );
        REQUIRE( polygon->getRenderable()->altitudeMode() == AltitudeMode::ALTMODE_RELATIVE_TO_GROUND );
    }

    SECTION("Construction waits for a style")
    {
        osg::ref_ptr<KML_Polygon> polygon = makePolygon( OUTER, file );

        dc.kmlOptions().lastStyle.unset();
        polygon->render( dc );
        polygon->render( dc );
        REQUIRE( polygon->getRenderable() == nullptr );
        REQUIRE( layer->getNumRenderables() == 0 );
        REQUIRE_FALSE( polygon->getStyle().isSet() );

        renderWithStyle( polygon.get(), dc );
        REQUIRE( polygon->getRenderable() != nullptr );
        REQUIRE( layer->getNumRenderables() == 1 );
    }

    SECTION("Style is associated and used")
    {
        osg::ref_ptr<KML_Style> style = new KML_Style("s");
        style->polyColor() = Color::Blue;
        KML_StyleSet styles;
        styles.normal = style.get();

        osg::ref_ptr<KML_Polygon> polygon = makePolygon( OUTER, file );
        renderWithStyle( polygon.get(), dc, styles );

        REQUIRE( polygon->getStyle().isSet() );
        REQUIRE( polygon->getStyle().get() == styles );
        REQUIRE( polygon->getRenderable()->getAttributes()->getInteriorColor() == Color::Blue );
    }

    SECTION("Hidden polygons are not built")
    {
        osg::ref_ptr<KML_Polygon> polygon = makePolygon( OUTER, file );
        polygon->setVisible( false );
        renderWithStyle( polygon.get(), dc );
        REQUIRE( polygon->getRenderable() == nullptr );
        REQUIRE( layer->getNumRenderables() == 0 );
    }

    SECTION("Without a layer the polygon is built but not registered")
    {
        KMLRenderContext noLayer;
        osg::ref_ptr<KML_Polygon> polygon = makePolygon( OUTER, file );
        renderWithStyle( polygon.get(), noLayer );
        REQUIRE( polygon->getRenderable() != nullptr );
        REQUIRE( layer->getNumRenderables() == 0 );
    }
}
