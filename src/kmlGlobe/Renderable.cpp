/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobe/Renderable>

using namespace kmlGlobe;

Renderable::Renderable() :
_enabled  ( true ),
_lastFrame( ~0u )
{
    //nop
}
