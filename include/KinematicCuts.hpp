#ifndef KINEMATIC_CUTS
#define KINEMATIC_CUTS

// Copyright (C) 2018 by Keith Pedersen (Keith.David.Pedersen@gmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "PhenoTools.hpp"
#include "Particle.hpp"
#include <map>
#include <limits>

#include <QtCore/QSettings>

/*! @file KinematicCuts.hpp
 *  @brief Defines the per-category kinematic acceptance windows
 *  @author Copyright (C) 2018 Keith Pedersen (Keith.David.Pedersen@gmail.com, https://wwww.hepguy.com)
*/

/*! @brief A closed interval [min, max] (max may be infinite).
 *
 *  A window is either "set" or not; an unset window accepts everything.
*/
struct Window
{
	using real_t = PhenoTools::real_t;

	real_t min;
	real_t max;
	bool set;

	//! @brief An unset window
	Window():min(-std::numeric_limits<real_t>::infinity()),
		max(std::numeric_limits<real_t>::infinity()), set(false) {}

	/*! @brief A set window
	 *
	 *  \throws std::invalid_argument if (max <= min) or either bound is NaN
	*/
	Window(real_t const min_in, real_t const max_in);

	bool Contains(real_t const x) const {return ((not set) or ((x >= min) and (x <= max)));}
};

////////////////////////////////////////////////////////////////////////

/*! @brief The acceptance of one category.
 *
 *  \f$ p_T \f$ always has a minimum (zero by default) and an optional maximum;
 *  \f$ \eta \f$ is bounded by (eta_min, eta_max); the isolation window is optional.
*/
struct KinematicCut
{
	using real_t = PhenoTools::real_t;

	real_t pt_min;
	real_t pt_max; //!< @brief +inf when there is no maximum
	real_t eta_min;
	real_t eta_max;
	Window isolation;

	KinematicCut():
		pt_min(0), pt_max(std::numeric_limits<real_t>::infinity()),
		eta_min(-std::numeric_limits<real_t>::infinity()),
		eta_max(std::numeric_limits<real_t>::infinity()),
		isolation() {}

	/*! @brief A cut on pT and |eta|
	 *
	 *  \throws std::invalid_argument if (pt_max <= pt_min) or (eta_max <= eta_min)
	*/
	KinematicCut(real_t const pt_min_in, real_t const pt_max_in,
		real_t const eta_min_in, real_t const eta_max_in);

	//! @brief pt_min <= |p_T| <= pt_max and eta_min <= eta <= eta_max
	bool Accepts(real_t const pt, real_t const eta) const
	{
		return (pt >= pt_min) and (pt <= pt_max) and (eta >= eta_min) and (eta <= eta_max);
	}

	//! @throws std::invalid_argument if (max <= min)
	void SetIsolation(real_t const iso_min, real_t const iso_max);

	bool HasPtMax() const {return (pt_max < std::numeric_limits<real_t>::infinity());}
};

////////////////////////////////////////////////////////////////////////

/*! @brief A KinematicCut for each category that will be classified.
 *
 *  Reading the cut of a category which was never configured is an error,
 *  not a silent pass.
*/
class KinematicCuts
{
	public:
		using real_t = PhenoTools::real_t;

	private:
		std::map<Category, KinematicCut> cuts;

	public:
		KinematicCuts() {}

		void Set(Category const category, KinematicCut const& cut) {cuts[category] = cut;}
		bool Has(Category const category) const {return (cuts.count(category) > 0);}
		size_t size() const {return cuts.size();}

		//! @throws PhenoTools::missing_configuration if the category has no cut
		KinematicCut const& Get(Category const category) const;

		/*! @brief The default analysis cuts.
		 *
		 *  Leptons and photons: pT > 10 GeV, |eta| < 2.5.
		 *  Jets: pT > 20 GeV, |eta| < 5.
		 *  MissingET and Generic are left unconfigured.
		*/
		static KinematicCuts Default();

		/*! @brief Read the cuts from a parsed INI file.
		 *
		 *  Every INI section whose name is a category key (see CategoryKey)
		 *  defines that category's cut, with the keys
		 *  pt_min (default 0), pt_max, eta_min, eta_max, isolation_min and isolation_max.
		 *  A missing bound is infinite. Other sections are skipped (with a warning).
		 *
		 *  \throws std::invalid_argument if a value is not a number, or a window is empty
		*/
		static KinematicCuts FromINI(QSettings const& parsedINI);
};

#endif
