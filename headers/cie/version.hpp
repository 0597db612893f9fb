//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_VERSION_HPP
#define CIE_VERSION_HPP

/**
 * @file version.hpp
 * @brief Code Intelligence Engine version information.
 */

namespace cie {

    /**
     * Major version number.
     * Incremented for breaking changes to the JSON contract.
     */
    constexpr int VERSION_MAJOR = 1;

    constexpr int VERSION_MINOR = 0;

    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "1.0.0";

    constexpr auto PROJECT_NAME = "Code Intelligence Engine";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "cie";

}  // namespace cie

#endif //CIE_VERSION_HPP
