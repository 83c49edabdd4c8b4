/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobe/Color>
#include <kmlGlobe/StringUtils>
#include <osg/Math>
#include <sstream>
#include <iomanip>

using namespace kmlGlobe;

Color Color::White      ( 0xffffffff, Color::RGBA );
Color Color::Black      ( 0x000000ff, Color::RGBA );
Color Color::Red        ( 0xff0000ff, Color::RGBA );
Color Color::Green      ( 0x008000ff, Color::RGBA );
Color Color::Blue       ( 0x0000ffff, Color::RGBA );

Color::Color( unsigned v, Format format )
{
    if ( format == RGBA )
    {
        set(
            (float)(v>>24)/255.0f,
            (float)((v&0xFF0000)>>16)/255.0f,
            (float)((v&0xFF00)>>8)/255.0f,
            (float)(v&0xFF)/255.0f );
    }
    else // format == ABGR
    {
        set(
            (float)(v&0xFF)/255.0f,
            (float)((v&0xFF00)>>8)/255.0f,
            (float)((v&0xFF0000)>>16)/255.0f,
            (float)(v>>24)/255.0f );
    }
}

Color::Color( const Color& rhs, float a ) :
osg::Vec4f( rhs )
{
    (*this)[3] = a;
}

Color::Color( const std::string& input, Format format )
{
    std::string t = toLower(trim(input));
    if ( startsWith(t, "#") )
        t = t.substr(1);
    else if ( startsWith(t, "0x") )
        t = t.substr(2);

    unsigned v = 0u;
    if ( (t.length() == 6 || t.length() == 8) &&
         t.find_first_not_of("0123456789abcdef") == std::string::npos )
    {
        std::istringstream in(t);
        in >> std::hex >> v;

        // no alpha component: opaque
        if ( t.length() == 6 )
        {
            if ( format == RGBA )
                v = (v << 8) | 0xFF;
            else
                v = v | 0xFF000000;
        }
    }
    else
    {
        // unparseable: opaque black
        v = format == RGBA ? 0x000000FF : 0xFF000000;
    }

    *this = Color( v, format );
}

unsigned
Color::as( Format format ) const
{
    unsigned r = (unsigned)(osg::clampBetween(this->r(), 0.0f, 1.0f) * 255.0f + 0.5f);
    unsigned g = (unsigned)(osg::clampBetween(this->g(), 0.0f, 1.0f) * 255.0f + 0.5f);
    unsigned b = (unsigned)(osg::clampBetween(this->b(), 0.0f, 1.0f) * 255.0f + 0.5f);
    unsigned a = (unsigned)(osg::clampBetween(this->a(), 0.0f, 1.0f) * 255.0f + 0.5f);

    if ( format == RGBA )
        return (r << 24) | (g << 16) | (b << 8) | a;
    else
        return (a << 24) | (b << 16) | (g << 8) | r;
}

std::string
Color::toHTML( Format format ) const
{
    std::stringstream buf;
    buf << "#" << std::hex << std::setw(8) << std::setfill('0') << as(format);
    std::string ssStr;
    ssStr = buf.str();
    return ssStr;
}
