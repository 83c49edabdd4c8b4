/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KML_LineString>
#include <kmlGlobeKML/KML_NodeTransformers>
#include <kmlGlobeKML/KMLRenderContext>

using namespace kmlGlobe_kml;

#define LC "[KML_LineString] "

KML_LineString::KML_LineString(const KML_Node& node) :
_support( node )
{
    //nop
}

StringVector
KML_LineString::tagNames()
{
    return StringVector( 1, "LineString" );
}

PositionVector
KML_LineString::getPositions() const
{
    return getNode().get( "coordinates", KML_NodeTransformers::positions ).get();
}

void
KML_LineString::render(KMLRenderContext& dc)
{
    if ( !_support.render(dc) )
        return;

    if ( dc.kmlOptions().lastStyle.isSet() )
    {
        createPath( dc, dc.kmlOptions().lastStyle.get() );
    }
}

void
KML_LineString::createPath(KMLRenderContext& dc, const KML_StyleSet& styles)
{
    if ( _renderable.valid() )
        return;

    osg::ref_ptr<ShapeAttributes> attributes = prepareAttributes( styles.normal.get() );
    _renderable = new Path( getPositions(), attributes.get() );

    std::string id = getNode().attr("id");
    _renderable->setDisplayName( id.empty() ? getNode().getName() : id );

    _renderable->extrude() = getExtrude().getOrUse( false );
    _renderable->followTerrain() = getTessellate().getOrUse( false );
    _renderable->altitudeMode() = getAltitudeMode().getOrUse( dc.getKMLOptions().defaultAltitudeMode().get() );

    if ( !_renderable->isValid() )
    {
        KG_WARN << LC << "Line string \"" << _renderable->getDisplayName()
            << "\" has fewer than two positions" << std::endl;
    }

    if ( dc.getCurrentLayer() )
    {
        dc.getCurrentLayer()->addRenderable( _renderable.get() );
    }
}

ShapeAttributes*
KML_LineString::prepareAttributes(const KML_Style* style) const
{
    ShapeAttributes::Options shapeOptions;
    if ( style )
        shapeOptions.merge( style->generate() );

    // a line has no interior
    shapeOptions.drawInterior() = false;
    shapeOptions.drawVerticals() = getExtrude().getOrUse( false );
    shapeOptions.depthTest() = true;

    return new ShapeAttributes( shapeOptions );
}
