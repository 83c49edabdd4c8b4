/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobeKML/KML_Scene>
#include <kmlGlobeKML/KMLRenderContext>

using namespace kmlGlobe_kml;

KML_Scene::KML_Scene(const KMLFile* file, KML_StyleSheet* sheet) :
_file ( file ),
_sheet( sheet )
{
    if ( !_sheet.valid() )
        _sheet = new KML_StyleSheet();
}

void
KML_Scene::addPlacemark(KML_Placemark* placemark)
{
    if ( placemark )
        _placemarks.push_back( placemark );
}

KML_Placemark*
KML_Scene::getPlacemark(unsigned i) const
{
    return i < _placemarks.size() ? _placemarks[i].get() : 0L;
}

void
KML_Scene::render(KMLRenderContext& dc)
{
    for(auto& placemark : _placemarks)
    {
        placemark->render( dc );
    }
}
