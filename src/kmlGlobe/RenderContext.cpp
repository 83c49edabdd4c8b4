/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobe/RenderContext>

using namespace kmlGlobe;

RenderContext::RenderContext() :
_frameNumber( 0u )
{
    //nop
}
