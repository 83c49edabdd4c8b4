/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobe/Position>
#include <kmlGlobe/StringUtils>
#include <osg/Math>
#include <ostream>

using namespace kmlGlobe;

Position::Position() :
_latitude ( 0.0 ),
_longitude( 0.0 ),
_altitude ( 0.0 )
{
    //nop
}

Position::Position(double latitude, double longitude, double altitude) :
_latitude ( latitude ),
_longitude( longitude ),
_altitude ( altitude )
{
    //nop
}

bool
Position::operator == (const Position& rhs) const
{
    return
        osg::equivalent(_latitude, rhs._latitude) &&
        osg::equivalent(_longitude, rhs._longitude) &&
        osg::equivalent(_altitude, rhs._altitude);
}

std::string
Position::toString() const
{
    return Stringify()
        << std::fixed << std::setprecision(6)
        << "(" << _latitude << ", " << _longitude << ", " << _altitude << ")";
}

std::ostream&
kmlGlobe::operator << (std::ostream& out, const Position& p)
{
    out << p.toString();
    return out;
}
