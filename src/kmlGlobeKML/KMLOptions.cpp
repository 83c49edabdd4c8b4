/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KMLOptions>
#include <kmlGlobe/Notify>

using namespace kmlGlobe_kml;

#define LC "[KMLOptions] "

KMLOptions::KMLOptions( const ConfigOptions& options ) :
ConfigOptions( options )
{
    _defaultAltitudeMode.init( AltitudeMode::ALTMODE_CLAMP_TO_GROUND );
    _outlineStipplePattern.init( 0xF0F0 );
    _frames.init( 2u );
    fromConfig( _conf );
}

Config
KMLOptions::getConfig() const
{
    Config conf = ConfigOptions::getConfig();
    conf.key() = "kml";
    conf.set( "default_altitude_mode", _defaultAltitudeMode );
    conf.set( "outline_stipple_pattern", _outlineStipplePattern );
    conf.set( "frames", _frames );
    return conf;
}

void
KMLOptions::fromConfig( const Config& conf )
{
    conf.get( "default_altitude_mode", _defaultAltitudeMode );
    conf.get( "outline_stipple_pattern", _outlineStipplePattern );
    conf.get( "frames", _frames );

    if ( !AltitudeMode::isValid(*_defaultAltitudeMode) )
    {
        KG_WARN << LC << "Unknown altitude mode \"" << *_defaultAltitudeMode
            << "\"; using " << AltitudeMode::ALTMODE_CLAMP_TO_GROUND << std::endl;
        _defaultAltitudeMode = AltitudeMode::ALTMODE_CLAMP_TO_GROUND;
    }
}
