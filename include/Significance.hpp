#ifndef SIGNIFICANCE
#define SIGNIFICANCE

// Copyright (C) 2018 by Keith Pedersen (Keith.David.Pedersen@gmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "PhenoTools.hpp"
#include "Histogram.hpp"
#include <vector>

/*! @file Significance.hpp
 *  @brief The approximate significance of binned signal over background
 *  @author Copyright (C) 2018 Keith Pedersen (Keith.David.Pedersen@gmail.com, https://wwww.hepguy.com)
*/

/*! @brief The approximate global significance of binned signal over background.
 *
 *  Each bin is weighted by the log-likelihood ratio
 *  \f[ w_i = \ln(1 + s_i / b_i) \f]
 *  and the significance is
 *  \f[ Z = \frac{\sum_i s_i w_i - N\sqrt{\sum_i b_i w_i^2}}{\sqrt{\sum_i (s_i + b_i) w_i^2}} \f]
 *  For one bin with N = 0, this reduces to the familiar \f$ S/\sqrt{S + B} \f$
 *  in the limit \f$ S \ll B \f$. N > 0 asks for an N sigma fluctuation of the background.
 *
 *  Bins with zero background make w infinite; removing them is the caller's job.
 *
 *  \throws PhenoTools::mismatched_length if \p sig and \p bkg differ in length
 *  \throws std::invalid_argument if they are empty, a count is negative (or NaN), or N < 0
*/
PhenoTools::real_t ApproxSignificance(std::vector<PhenoTools::real_t> const& sig,
	std::vector<PhenoTools::real_t> const& bkg, PhenoTools::real_t const N = 0);

/*! @brief ApproxSignificance of the bin contents of two histograms.
 *
 *  \throws PhenoTools::incompatible_binning if the histograms are not binned the same way
 *  (within \p edgeTolerance)
*/
PhenoTools::real_t ApproxSignificance(Histogram const& sig, Histogram const& bkg,
	PhenoTools::real_t const N = 0, PhenoTools::real_t const edgeTolerance = 1e-9);

#endif
