//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef CIE_CIE_HPP
#define CIE_CIE_HPP

/**
 * @file cie.hpp
 * @brief Main header for the Code Intelligence Engine library.
 *
 * Pulls in the core types and the query engine. Include specific headers
 * for more targeted dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "engine/analysis_engine.hpp"
#include "serialization/json_serializer.hpp"

#endif //CIE_CIE_HPP
