/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobe/ShapeAttributes>

using namespace kmlGlobe;

ShapeAttributes::Options::Options()
{
    _drawInterior.init( true );
    _drawOutline.init( true );
    _drawVerticals.init( false );
    _interiorColor.init( Color::White );
    _outlineColor.init( Color::Red );
    _outlineWidth.init( 1.0f );
    _outlineStippleFactor.init( 0 );
    _outlineStipplePattern.init( 0xF0F0 );
    _depthTest.init( true );
    _enableLighting.init( false );
    _applyLighting.init( false );
}

void
ShapeAttributes::Options::merge(const Options& rhs)
{
    if ( rhs.drawInterior().isSet() )          drawInterior() = rhs.drawInterior().get();
    if ( rhs.drawOutline().isSet() )           drawOutline() = rhs.drawOutline().get();
    if ( rhs.drawVerticals().isSet() )         drawVerticals() = rhs.drawVerticals().get();
    if ( rhs.interiorColor().isSet() )         interiorColor() = rhs.interiorColor().get();
    if ( rhs.outlineColor().isSet() )          outlineColor() = rhs.outlineColor().get();
    if ( rhs.outlineWidth().isSet() )          outlineWidth() = rhs.outlineWidth().get();
    if ( rhs.outlineStippleFactor().isSet() )  outlineStippleFactor() = rhs.outlineStippleFactor().get();
    if ( rhs.outlineStipplePattern().isSet() ) outlineStipplePattern() = rhs.outlineStipplePattern().get();
    if ( rhs.depthTest().isSet() )             depthTest() = rhs.depthTest().get();
    if ( rhs.enableLighting().isSet() )        enableLighting() = rhs.enableLighting().get();
    if ( rhs.applyLighting().isSet() )         applyLighting() = rhs.applyLighting().get();
}

ShapeAttributes::ShapeAttributes()
{
    //nop
}

ShapeAttributes::ShapeAttributes(const Options& options) :
_options( options )
{
    //nop
}
