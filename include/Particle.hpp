#ifndef PARTICLE
#define PARTICLE

// Copyright (C) 2018 by Keith Pedersen (Keith.David.Pedersen@gmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "PhenoTools.hpp"
#include "FourVector.hpp"
#include <map>
#include <string>
#include <utility> // pair
#include <vector>

/*! @file Particle.hpp
 *  @brief Defines a reconstructed (or generator-level) particle,
 *  its closed set of categories, and the containers which group them.
 *  @author Copyright (C) 2018 Keith Pedersen (Keith.David.Pedersen@gmail.com, https://wwww.hepguy.com)
*/

class KinematicCuts;

//! @brief The closed set of particle categories (one KinematicCut each)
enum class Category {Electron, Muon, Lepton, LightJet, BJet, TauJet, OtherJet,
	Photon, MissingET, Generic};

/*! @brief The category's key, used to name INI sections (e.g. "b_jet").
 *
 *  \throws std::invalid_argument for a value outside the enum
*/
std::string CategoryKey(Category const category);

/*! @brief Parse a category key (the inverse of CategoryKey).
 *
 *  \throws std::invalid_argument if \p key is not a known category
*/
Category ParseCategory(std::string const& key);

//! @brief The prefix of a category's display names (e.g. "#mu" for "#mu_{1}")
std::string NamePrefix(Category const category);

/*! @brief Detector- or category-specific attributes carried beside the four-momentum.
 *
 *  Not every reader supplies every attribute;
 *  they are stored in a side map so that every Particle has the same layout.
*/
enum class Attribute {BTag, CTag, Flavor, Isolation, PdgID};

////////////////////////////////////////////////////////////////////////

/*! @brief A particle: one four-momentum plus identity and classification.
 *
 *  A Particle exclusively owns its FourVector, which is fixed at construction.
 *  The one exception is Category::MissingET, which is built by vector-summing
 *  the (MET, phi) contributions of a detector (AddMissingEnergy).
 *
 *  The "valid tag" is the result of the last kinematic-cut decision
 *  (EvaluateValidTag); it is unset until a decision is made.
*/
class Particle
{
	public:
		using real_t = PhenoTools::real_t;

		static constexpr int tag_unset = -1;

	private:
		FourVector p4;
		real_t charge;
		std::string name;
		Category category;
		int validTag;
		std::map<Attribute, real_t> attributes;

	public:
		/*! @brief Construct a particle
		 *
		 *  \throws std::invalid_argument if \p charge_in is not finite
		*/
		Particle(FourVector const& p4_in, real_t const charge_in,
			std::string const& name_in, Category const category_in);

		/*! @brief Build the missing transverse momentum from detector contributions.
		 *
		 *  Each (MET, phi) pair is added as a massless transverse four-vector (eta = 0).
		 *  The result has zero charge and the name "MET".
		*/
		static Particle MissingET(std::vector<std::pair<real_t, real_t>> const& met_phi);

		/*! @brief Add one (MET, phi) contribution to a MissingET particle
		 *
		 *  \throws std::logic_error if this is not Category::MissingET
		*/
		void AddMissingEnergy(real_t const met, real_t const phi);

		FourVector const& p4_vec() const {return p4;}
		real_t Charge() const {return charge;}
		std::string const& Name() const {return name;}
		Category GetCategory() const {return category;}

		void SetName(std::string const& newName) {name = newName;}

		real_t Pt() const {return p4.Pt();}
		real_t P() const {return p4.P();}
		real_t Pl() const {return p4.Pl();}
		real_t Eta() const {return p4.Eta();}
		real_t Phi() const {return p4.Phi();}
		real_t M() const {return p4.M();}
		real_t E() const {return p4.E();}

		////////////////////////////////////////////////////////////////
		// Valid tag
		////////////////////////////////////////////////////////////////

		bool HasValidTag() const {return (validTag not_eq tag_unset);}

		//! @throws std::logic_error if no decision has been made yet
		int ValidTag() const;

		//! @throws std::invalid_argument unless \p value is 0 or 1
		void SetValidTag(int const value);

		/*! @brief Decide if the particle passes its category's kinematic cuts,
		 *  set the valid tag, and return it.
		 *
		 *  \f$ p_T \ge p_T^{\min} \f$, \f$ p_T \le p_T^{\max} \f$ (when set) and
		 *  \f$ \eta^{\min} \le \eta \le \eta^{\max} \f$. When the cut carries an isolation window,
		 *  Attribute::Isolation must also lie inside it (a particle without it fails).
		 *
		 *  \throws PhenoTools::missing_configuration if \p cuts has no entry for this category
		*/
		int EvaluateValidTag(KinematicCuts const& cuts);

		////////////////////////////////////////////////////////////////
		// Side attributes
		////////////////////////////////////////////////////////////////

		void SetAttribute(Attribute const key, real_t const value) {attributes[key] = value;}
		bool HasAttribute(Attribute const key) const {return (attributes.count(key) > 0);}

		//! @throws std::out_of_range if the attribute was never set
		real_t GetAttribute(Attribute const key) const;

		////////////////////////////////////////////////////////////////
		// Deltas (delegated to the four-vectors)
		////////////////////////////////////////////////////////////////

		real_t DeltaR(Particle const& that) const;
		real_t DeltaEta(Particle const& that) const;
		real_t DeltaPhi(Particle const& that) const;
		real_t DeltaPtScalar(Particle const& that) const;
		real_t DeltaPtVector(Particle const& that) const;
		real_t DeltaPVector(Particle const& that) const;
};

////////////////////////////////////////////////////////////////////////

//! @brief An ordered list of particles (leading pT first, by convention)
typedef std::vector<Particle> ParticleVec;

//! @brief Particles grouped by category
typedef std::map<Category, ParticleVec> ParticleMap;

//! @brief Sort descending in pT; particles with equal pT keep their relative order.
void SortByPt(ParticleVec& particles);

#endif
