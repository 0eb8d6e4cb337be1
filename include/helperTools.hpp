#ifndef HELPER_TOOLS
#define HELPER_TOOLS

/*!
 *  @file helperTools.hpp
 *  @brief Some short utlity functions.
 *
 *  A constexpr function can be evaluated at compile time.
 *
 *  @author Copyright (C) 2018 Keith Pedersen (Keith.David.Pedersen@gmail.com)
 *  @date Jan 2018
*/

#include <assert.h>
#include <cmath>
#include <limits>
#include <algorithm> // std::max

////////////////////////////////////////////////////////////////////////

/*! @brief Wrap an azimuthal angle (or angular difference) into (-pi, pi].
 *
 *  std::remainder maps into [-pi, pi] (ties go to the even quotient),
 *  so the only fix-up needed is moving -pi to +pi.
*/
template<typename real_t>
real_t WrapPhi(real_t const phi)
{
	real_t wrapped = std::remainder(phi, real_t(2. * M_PI));

	if(wrapped <= real_t(-M_PI))
		wrapped += real_t(2. * M_PI);

	return wrapped;
}

////////////////////////////////////////////////////////////////////////

//! @brief Return the value of the smallest set bit (2**index, not index)
template<typename uint_t>
constexpr uint_t SmallestSetBit(uint_t const x)
{
	static_assert(not std::numeric_limits<uint_t>::is_signed, "SmallestBit: type must be UN-signed");

	// Developed from
	// http://www.exploringbinary.com/ten-ways-to-check-if-an-integer-is-a-power-of-two-in-c/
	return (x bitand (compl(x) + 1));
}

////////////////////////////////////////////////////////////////////////

/*! @brief floor(log2(x)) for x > 0, i.e. the index of the largest set bit.
 *
 *  Integer arithmetic keeps exact powers of 2 exact
 *  (std::log2 may land a hair below the integer).
*/
template<typename uint_t>
uint_t FloorLog2(uint_t x)
{
	static_assert(not std::numeric_limits<uint_t>::is_signed, "FloorLog2: type must be UN-signed");
	assert(x > 0);

	uint_t index = 0;

	// We can start with the smallest set bit and move on from there
	for(uint_t bit = SmallestSetBit(x); bit > 1; bit /= 2)
		++index;
	x /= (2 * SmallestSetBit(x));

	while(x)
	{
		x /= 2;
		++index;
	}
	return index;
}

////////////////////////////////////////////////////////////////////////

//! @brief Sturges' rule: floor(1 + log2(n)) bins for n samples
template<typename uint_t>
uint_t SturgesBins(uint_t const n)
{
	return uint_t(1) + FloorLog2(n);
}

////////////////////////////////////////////////////////////////////////

/*! @brief Are \p a and \p b equal within \p relTol?
 *
 *  The tolerance is relative to the larger magnitude,
 *  but never smaller than \p relTol itself (so two values near zero can still match).
*/
template<typename real_t>
bool CloseEnough(real_t const a, real_t const b, real_t const relTol)
{
	real_t const scale = std::max(real_t(1), std::max(std::fabs(a), std::fabs(b)));
	return (std::fabs(a - b) <= relTol * scale);
}

#endif
