/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KML_Polygon>
#include <kmlGlobeKML/KML_NodeTransformers>
#include <kmlGlobeKML/KMLRenderContext>

using namespace kmlGlobe_kml;

#define LC "[KML_Polygon] "

KML_Polygon::KML_Polygon(const KML_Node& node) :
_support ( node ),
_deferred( false )
{
    //nop
}

StringVector
KML_Polygon::tagNames()
{
    return StringVector( 1, "Polygon" );
}

osg::ref_ptr<KML_LinearRing>
KML_Polygon::getOuterBoundary() const
{
    return getNode().get( "outerBoundaryIs", KML_NodeTransformers::linearRing ).get();
}

osg::ref_ptr<KML_LinearRing>
KML_Polygon::getInnerBoundary() const
{
    return getNode().get( "innerBoundaryIs", KML_NodeTransformers::linearRing ).get();
}

Position
KML_Polygon::getCenter() const
{
    osg::ref_ptr<KML_LinearRing> outer = getOuterBoundary();
    return outer.valid() ? outer->getCenter() : Position();
}

void
KML_Polygon::render(KMLRenderContext& dc)
{
    if ( !_support.render(dc) )
        return;

    if ( dc.kmlOptions().lastStyle.isSet() )
    {
        createPolygon( dc, dc.kmlOptions().lastStyle.get() );
    }
    else if ( !_renderable.valid() && !_deferred )
    {
        KG_INFO << LC << "No style available yet; deferring polygon construction" << std::endl;
        _deferred = true;
    }
}

void
KML_Polygon::createPolygon(KMLRenderContext& dc, const KML_StyleSet& styles)
{
    if ( _renderable.valid() )
        return;

    const KMLOptions& options = dc.getKMLOptions();

    osg::ref_ptr<ShapeAttributes> attributes = prepareAttributes( styles.normal.get(), options );
    _renderable = new Polygon( prepareLocations(), attributes.get() );

    std::string id = getNode().attr("id");
    _renderable->setDisplayName( id.empty() ? getNode().getName() : id );

    applyMutableProperties( options );

    KG_DEBUG << LC << "Created polygon \"" << _renderable->getDisplayName() << "\" with "
        << _renderable->getNumBoundaries() << " boundaries" << std::endl;

    if ( dc.getCurrentLayer() )
    {
        dc.getCurrentLayer()->addRenderable( _renderable.get() );
    }
    else
    {
        KG_WARN << LC << "No current layer; polygon \"" << _renderable->getDisplayName()
            << "\" will not be drawn" << std::endl;
    }
}

void
KML_Polygon::applyMutableProperties(const KMLOptions& options)
{
    // An absent <extrude> means true; an explicit 0 stays false.
    _renderable->extrude() = getExtrude().getOrUse( true );
    _renderable->altitudeMode() = getAltitudeMode().getOrUse( options.defaultAltitudeMode().get() );
}

ShapeAttributes*
KML_Polygon::prepareAttributes(const KML_Style* style, const KMLOptions& options) const
{
    ShapeAttributes::Options shapeOptions;
    if ( style )
        shapeOptions.merge( style->generate() );

    shapeOptions.drawVerticals() = getExtrude().getOrUse( false );
    shapeOptions.applyLighting() = true;
    shapeOptions.depthTest() = true;
    shapeOptions.outlineStippleFactor() = 0;
    shapeOptions.outlineStipplePattern() = options.outlineStipplePattern().get();
    shapeOptions.enableLighting() = true;

    return new ShapeAttributes( shapeOptions );
}

Boundaries
KML_Polygon::prepareLocations() const
{
    Boundaries locations;

    osg::ref_ptr<KML_LinearRing> outer = getOuterBoundary();
    if ( !outer.valid() )
    {
        KG_WARN << LC << "Polygon \"" << getNode().attr("id") << "\" has no outer boundary" << std::endl;
        return locations;
    }

    // index 0 is the hole, index 1 the outer boundary
    osg::ref_ptr<KML_LinearRing> inner = getInnerBoundary();
    if ( inner.valid() )
    {
        locations.push_back( inner->getPositions() );
    }

    locations.push_back( outer->getPositions() );
    return locations;
}
