#ifndef FEATURE_ROW
#define FEATURE_ROW

// Copyright (C) 2018 by Keith Pedersen (Keith.David.Pedersen@gmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "PhenoTools.hpp"
#include "Particle.hpp"
#include <map>
#include <string>
#include <utility> // pair
#include <vector>

/*! @file FeatureRow.hpp
 *  @brief Flattens an ordered set of particles into labeled kinematic features
 *  @author Copyright (C) 2018 Keith Pedersen (Keith.David.Pedersen@gmail.com, https://wwww.hepguy.com)
*/

/*! @brief An insertion-ordered mapping from label to value.
 *
 *  Labels use ROOT's TLatex markup (e.g. "#Delta{R}_{e_{1}j_{1}}"),
 *  so they can be used directly as axis titles.
*/
class FeatureRow
{
	public:
		using real_t = PhenoTools::real_t;
		using entry_t = std::pair<std::string, real_t>;

	private:
		std::vector<entry_t> entries;

	public:
		FeatureRow() {}

		//! @brief Append (label, value); labels are not checked for uniqueness.
		void Add(std::string const& label, real_t const value) {entries.emplace_back(label, value);}

		size_t size() const {return entries.size();}
		bool empty() const {return entries.empty();}

		std::vector<entry_t>::const_iterator begin() const {return entries.cbegin();}
		std::vector<entry_t>::const_iterator end() const {return entries.cend();}

		std::vector<std::string> Labels() const;

		bool Has(std::string const& label) const;

		//! @throws std::out_of_range if no entry has \p label
		real_t Get(std::string const& label) const;
};

////////////////////////////////////////////////////////////////////////

/*! @brief Build the FeatureRow of an ordered particle list.
 *
 *  For each particle i (name n), in order, we emit
 *
 *  	pT_{n}(GeV), #eta_{n}, #phi_{n}, Energy_{n}(GeV), Mass_{n}(GeV)
 *
 *  followed by every pair (i, j > i), with names a and b
 *
 *  	#Delta{R}_{ab}, #Delta{#eta}_{ab}, #Delta{#phi}_{ab},
 *  	#Delta{pT}_{ab}(GeV), #Delta{#vec{pT}}_{ab}(GeV), #Delta{#vec{p}}_{ab}(GeV)
 *
 *  So N particles yield 5N + 6 N(N-1)/2 features.
 *  Particle names must be unique (this is not checked).
*/
class FeatureRowBuilder
{
	public:
		using real_t = PhenoTools::real_t;

		static constexpr size_t featuresPerParticle = 5;
		static constexpr size_t featuresPerPair = 6;

		//! @throws std::invalid_argument if \p particles is empty
		static FeatureRow Build(ParticleVec const& particles);

		//! @brief The number of features for \p nParticles
		static size_t NumFeatures(size_t const nParticles);
};

////////////////////////////////////////////////////////////////////////

/*! @brief Rows of features, as accumulated over many events.
 *
 *  Different events can have different particle content,
 *  so the rows need not share labels. The columns are the union of the rows' labels
 *  (in the order they were first seen), and a row lacking a column reads as NaN.
*/
class FeatureTable
{
	public:
		using real_t = PhenoTools::real_t;

	private:
		std::vector<std::map<std::string, real_t>> rows;
		std::vector<std::string> columns; // union of labels, first-seen order
		std::map<std::string, size_t> columnIndex;

		void AddColumns(FeatureRow const& row);

	public:
		FeatureTable() {}

		void Append(FeatureRow const& row);

		//! @brief Append all rows from \p that (e.g. the table of another worker)
		void Concatenate(FeatureTable const& that);

		size_t NumRows() const {return rows.size();}
		std::vector<std::string> const& Columns() const {return columns;}

		bool HasColumn(std::string const& label) const {return (columnIndex.count(label) > 0);}

		/*! @brief Return one value per row (NaN where the row lacks \p label)
		 *
		 *  \throws std::out_of_range if no row has \p label
		*/
		std::vector<real_t> Column(std::string const& label) const;
};

#endif
