// Copyright (C) 2018 by Keith Pedersen (Keith.David.Pedersen@gmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "Significance.hpp"
#include "kdp/kdpTools.hpp"
#include <cmath>

using real_t = PhenoTools::real_t;

real_t ApproxSignificance(std::vector<real_t> const& sig, std::vector<real_t> const& bkg,
	real_t const N)
{
	if(sig.size() not_eq bkg.size())
		throw PhenoTools::mismatched_length("ApproxSignificance: sig has "
			+ std::to_string(sig.size()) + " bins, bkg has " + std::to_string(bkg.size()));

	if(sig.empty())
		throw std::invalid_argument("ApproxSignificance: no bins");

	if(not(N >= real_t(0)))
		throw std::invalid_argument("ApproxSignificance: N (" + std::to_string(N) + ") must be non-negative");

	real_t sum_sw = 0; // sum(s w)
	real_t sum_bww = 0; // sum(b w**2)
	real_t sum_sww = 0; // sum(s w**2)

	for(size_t i = 0; i < sig.size(); ++i)
	{
		real_t const s = sig[i];
		real_t const b = bkg[i];

		// NaN fails the comparison
		if(not((s >= real_t(0)) and (b >= real_t(0))))
			throw std::invalid_argument("ApproxSignificance: bin " + std::to_string(i)
				+ " has a negative count");

		real_t const w = std::log1p(s / b);
		real_t const w2 = kdp::Squared(w);

		sum_sw += s * w;
		sum_bww += b * w2;
		sum_sww += s * w2;
	}

	return (sum_sw - N * std::sqrt(sum_bww)) / std::sqrt(sum_sww + sum_bww);
}

////////////////////////////////////////////////////////////////////////

real_t ApproxSignificance(Histogram const& sig, Histogram const& bkg,
	real_t const N, real_t const edgeTolerance)
{
	if(not sig.Bins().Compatible(bkg.Bins(), edgeTolerance))
		throw PhenoTools::incompatible_binning("ApproxSignificance: "
			+ sig.Name() + " and " + bkg.Name() + " are binned differently");

	return ApproxSignificance(sig.Contents(), bkg.Contents(), N);
}
