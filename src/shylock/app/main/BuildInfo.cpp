#include <shylock/app/main/BuildInfo.h>

namespace shylock {

namespace BuildInfo {

namespace {

//--------------------------------------------------------------------------
//  The build version number. You must edit this for each release
//  and follow the format described at http://semver.org/
//------------------------------------------------------------------------------
char const* const versionString = "1.0.0";

}  // namespace

std::string const&
getVersionString()
{
    static std::string const value = versionString;
    return value;
}

std::string const&
getFullVersionString()
{
    static std::string const value = "shylock-" + getVersionString();
    return value;
}

}  // namespace BuildInfo

}  // namespace shylock
