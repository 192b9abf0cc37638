#ifndef SHYLOCK_APP_MAIN_BUILDINFO_H_INCLUDED
#define SHYLOCK_APP_MAIN_BUILDINFO_H_INCLUDED

#include <string>

namespace shylock {

/** Versioning information for this build. */
namespace BuildInfo {

/** Server version.
    Follows the Semantic Versioning Specification:
    http://semver.org/
*/
std::string const&
getVersionString();

/** Full name, e.g. "shylock-1.0.0". */
std::string const&
getFullVersionString();

}  // namespace BuildInfo

}  // namespace shylock

#endif
