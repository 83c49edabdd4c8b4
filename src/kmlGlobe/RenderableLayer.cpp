/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobe/RenderableLayer>
#include <kmlGlobe/RenderContext>
#include <kmlGlobe/Notify>
#include <algorithm>

using namespace kmlGlobe;

#define LC "[RenderableLayer] " << getName() << ": "

RenderableLayer::RenderableLayer(const std::string& name) :
_name   ( name ),
_enabled( true )
{
    //nop
}

void
RenderableLayer::addRenderable(Renderable* renderable)
{
    if ( !renderable )
        return;

    for(auto& r : _renderables)
    {
        if ( r.get() == renderable )
            return;
    }

    _renderables.push_back( renderable );

    KG_DEBUG << LC << "Added renderable \"" << renderable->getDisplayName() << "\"" << std::endl;
}

bool
RenderableLayer::removeRenderable(Renderable* renderable)
{
    for(RenderableVector::iterator i = _renderables.begin(); i != _renderables.end(); ++i)
    {
        if ( i->get() == renderable )
        {
            _renderables.erase( i );
            return true;
        }
    }
    return false;
}

void
RenderableLayer::removeAllRenderables()
{
    _renderables.clear();
}

Renderable*
RenderableLayer::getRenderable(unsigned i) const
{
    return i < _renderables.size() ? _renderables[i].get() : 0L;
}

void
RenderableLayer::render(RenderContext& dc)
{
    if ( !_enabled )
        return;

    // a renderable may add more renderables while rendering, so
    // iterate over a snapshot.
    RenderableVector snapshot = _renderables;
    for(auto& r : snapshot)
    {
        if ( r->getEnabled() )
            r->render( dc );
    }
}
