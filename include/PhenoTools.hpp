#ifndef PHENO_TOOLS
#define PHENO_TOOLS

// Copyright (C) 2018 by Keith Pedersen (Keith.David.Pedersen@gmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "kdp/kdpVectors.hpp"
#include <stdexcept>
#include <string>

/*! @file PhenoTools.hpp
 *  @brief Defines the PhenoTools namespace, which holds the shared typedef's
 *  and the exceptions thrown across the library.
*/

/*! @mainpage PhenoTools
 *
 *  @brief A C++ library for turning collider events into
 *  per-event kinematic features, signal/background tags and
 *  normalized histograms.
 *
 *  The pipeline is short:
 *
 *   - An external reader supplies per-particle attributes
 *     (momentum, angles, tags), from which Particle's are built.
 *     EventParticles does this for an in-memory Pythia8 event record.
 *
 *   - The Classifier applies a KinematicCuts table to tag good particles,
 *     removes overlaps and merges categories into a single leading-pT list.
 *
 *   - FeatureRowBuilder flattens an ordered particle list into a FeatureRow
 *     (each particle's kinematics plus every pairwise delta),
 *     which accumulate into a FeatureTable.
 *
 *   - HistogramEngine turns table columns (or raw samples) into
 *     normalized, mergeable histograms, and ApproxSignificance
 *     condenses binned signal and background into a single number.
 *
 *  All tunables are read from an INI file via QSettings.
*/

namespace PhenoTools
{
	typedef double real_t;
	typedef kdp::Vector2<real_t> vec2_t;
	typedef kdp::Vector3<real_t> vec3_t;
	typedef kdp::Vector4<real_t> vec4_t;

	//! @brief Thrown when a particle's category has no entry in a KinematicCuts table.
	class missing_configuration : public std::runtime_error
	{
		public:
			missing_configuration(std::string const& what_in):runtime_error(what_in) {}
	};

	//! @brief Thrown when histograms with different binning are combined.
	class incompatible_binning : public std::runtime_error
	{
		public:
			incompatible_binning(std::string const& what_in):runtime_error(what_in) {}
	};

	//! @brief Thrown when paired arrays do not have the same length.
	class mismatched_length : public std::length_error
	{
		public:
			mismatched_length(std::string const& what_in):length_error(what_in) {}
	};
}

#endif
