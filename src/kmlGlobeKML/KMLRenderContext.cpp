/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KMLRenderContext>

using namespace kmlGlobe_kml;

KMLRenderContext::KMLRenderContext(const KMLOptions& options) :
RenderContext(),
_options( options )
{
    //nop
}
