/* kmlGlobe
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <kmlGlobe/Notify>
#include <kmlGlobe/StringUtils>
#include <cstdlib>

using namespace kmlGlobe;

namespace
{
    struct LevelName
    {
        const char* name;
        osg::NotifySeverity severity;
    };

    const LevelName s_levels[] = {
        { "always",     osg::ALWAYS },
        { "fatal",      osg::FATAL },
        { "warn",       osg::WARN },
        { "notice",     osg::NOTICE },
        { "info",       osg::INFO },
        { "debug",      osg::DEBUG_INFO },
        { "debug_info", osg::DEBUG_INFO },
        { "debug_fp",   osg::DEBUG_FP }
    };

    // Applies KMLGLOBE_NOTIFY_LEVEL once, on first use.
    void applyEnvironmentLevel()
    {
        static bool s_applied = false;
        if ( s_applied )
            return;
        s_applied = true;

        const char* value = ::getenv("KMLGLOBE_NOTIFY_LEVEL");
        if ( !value )
            return;

        osg::NotifySeverity severity;
        if ( parseNotifyLevel(value, severity) )
        {
            osg::setNotifyLevel( severity );
        }
        else if ( osg::isNotifyEnabled(osg::WARN) )
        {
            osg::notify(osg::WARN) << "[kmlGlobe]*  Ignoring invalid KMLGLOBE_NOTIFY_LEVEL \""
                << value << "\"" << std::endl;
        }
    }
}

bool
kmlGlobe::parseNotifyLevel(const std::string& name, osg::NotifySeverity& output)
{
    std::string key = toLower(trim(name));
    for(const LevelName& level : s_levels)
    {
        if ( key == level.name )
        {
            output = level.severity;
            return true;
        }
    }
    return false;
}

void
kmlGlobe::setNotifyLevel(osg::NotifySeverity severity)
{
    applyEnvironmentLevel();
    osg::setNotifyLevel( severity );
}

osg::NotifySeverity
kmlGlobe::getNotifyLevel()
{
    applyEnvironmentLevel();
    return osg::getNotifyLevel();
}

bool
kmlGlobe::isNotifyEnabled(osg::NotifySeverity severity)
{
    applyEnvironmentLevel();
    return osg::isNotifyEnabled( severity );
}

void
kmlGlobe::setNotifyHandler(osg::NotifyHandler* handler)
{
    osg::setNotifyHandler( handler );
}

osg::NotifyHandler*
kmlGlobe::getNotifyHandler()
{
    return osg::getNotifyHandler();
}
