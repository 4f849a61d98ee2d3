/*
 * File: math-core.hpp
 * Imports linalg.h vector types (int2, float2, float4 ...) into the sonogram namespace.
 */

#pragma once

#ifndef sonogram_math_core_hpp
#define sonogram_math_core_hpp

#include "linalg.h"

namespace sonogram
{
    using namespace linalg::aliases;

    static const double SONOGRAM_TAU = 6.2831853071795862;

} // end namespace sonogram

#endif // end sonogram_math_core_hpp
