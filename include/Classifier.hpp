#ifndef CLASSIFIER
#define CLASSIFIER

// Copyright (C) 2018 by Keith Pedersen (Keith.David.Pedersen@gmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "PhenoTools.hpp"
#include "Particle.hpp"
#include "KinematicCuts.hpp"
#include "kdp/kdpSettings.hpp"
#include <cstdlib> // abs

#include <QtCore/QSettings>

/*! @file Classifier.hpp
 *  @brief Tags good particles (kinematic cuts), removes overlaps and types jets
 *  @author Copyright (C) 2018 Keith Pedersen (Keith.David.Pedersen@gmail.com, https://wwww.hepguy.com)
*/

/*! @brief Turns the raw particles of an event into the "good" particles of an analysis.
 *
 *  The kinematic decisions (Classify) are pure functions of the cuts,
 *  so they are static. The tunables of overlap removal and c-tagging
 *  are read from the INI section [Classifier].
*/
class Classifier
{
	public:
		using real_t = PhenoTools::real_t;

		static constexpr char const* iniSection = "Classifier";

		/*! @brief The Classifier settings, read from a parsed INI file
		 *  from section "[Classifier]"
		 *
		 *  Each parameter is defined using <tt> Param<T>(key, default value) </tt>
		*/
		class Settings : public kdp::Settings_Base
		{
			public:
				//! @brief Use the default values
				Settings() {}

				//! @throws std::invalid_argument if a value is out of range
				Settings(QSettings const& parsedINI);

				~Settings() {}

				//! @brief The smallest DeltaR between two retained particles (after overlap removal)
				Param<double> overlapDeltaR = Param<double>("overlapDeltaR", 0.3);

				//! @brief The probability to c-tag a true charm jet
				Param<double> cTagEfficiency = Param<double>("cTagEfficiency", 0.7);

				//! @brief The probability to c-tag a jet which is not charm
				Param<double> cTagMisID = Param<double>("cTagMisID", 0.01);
		};

	private:
		Settings settings;

		static bool IsJet(Category const category);

		// Tag every particle, returning those which pass (in descending pT)
		static ParticleVec ClassifyCategory(ParticleVec& particles, KinematicCuts const& cuts);

	public:
		Classifier():settings() {}
		Classifier(QSettings const& parsedINI):settings(parsedINI) {}

		Settings const& GetSettings() const {return settings;}

		/*! @brief Evaluate every particle's valid tag, keeping those which pass.
		 *
		 *  The tags are written into \p event (which is otherwise unchanged).
		 *  Each category of the returned map is in descending pT order;
		 *  a category with no survivors is present but empty.
		 *
		 *  \throws PhenoTools::missing_configuration
		 *  if a particle's category has no cut in \p cuts
		*/
		static ParticleMap Classify(ParticleMap& event, KinematicCuts const& cuts);

		//! @brief Merge all categories into one list, sorted by descending pT (stable)
		static ParticleVec Unify(ParticleMap const& particles);

		/*! @brief Walk \p particles in descending pT, keeping a particle only when
		 *  it is at least \p deltaR_min from every particle already kept.
		 *
		 *  The returned list is in descending pT order.
		*/
		static ParticleVec RemoveOverlaps(ParticleVec const& particles, real_t const deltaR_min);

		/*! @brief Classify, then remove overlaps between all good particles (Settings::overlapDeltaR).
		 *
		 *  The harder particle of an overlapping pair survives;
		 *  survivors stay in their original category.
		*/
		ParticleMap GoodParticles(ParticleMap& event, KinematicCuts const& cuts) const;

		/*! @brief The good electrons and muons, merged and renamed lep_{1}, lep_{2}, ...
		 *
		 *  Each flavor uses its own cut, or the Category::Lepton cut when its own is absent.
		 *
		 *  \throws PhenoTools::missing_configuration
		 *  if a non-empty flavor has neither its own cut nor a lepton cut
		*/
		static ParticleVec GoodLeptons(ParticleMap& event, KinematicCuts const& cuts);

		/*! @brief The good jets, kept in their own category,
		 *  and renamed <prefix>_{1}, <prefix>_{2}, ... (e.g. b_{1}).
		 *
		 *  Non-jet categories are ignored.
		*/
		static ParticleMap GoodJets(ParticleMap& event, KinematicCuts const& cuts);

		//! @brief Rename in order as <prefix>_{1}, <prefix>_{2}, ...
		static void RenameLeading(ParticleVec& particles, std::string const& prefix);

		/*! @brief Map a jet's b-tag and tau-tag to its category.
		 *
		 *  (0,0) -> LightJet, (1,0) -> BJet, (0,1) -> TauJet, anything else -> OtherJet
		*/
		static Category JetCategory(int const bTag, int const tauTag);

		/*! @brief Probabilistically c-tag a jet, storing Attribute::CTag.
		 *
		 *  A jet whose Attribute::Flavor is (+/-)4 is tagged with probability Settings::cTagEfficiency;
		 *  every other jet (including one without a flavor) with probability Settings::cTagMisID.
		 *
		 *  \param gen
		 *  A source of uniform variates with a U_even() method (e.g. a pqRand::engine).
		 *  The caller owns (and seeds) it, so the decision is reproducible.
		 *
		 *  \returns the tag (0 or 1)
		*/
		template<class uniform_source>
		int CTag(Particle& jet, uniform_source& gen) const
		{
			bool const isCharm = jet.HasAttribute(Attribute::Flavor)
				and (std::abs(int(jet.GetAttribute(Attribute::Flavor))) == 4);

			real_t const prob = isCharm ? real_t(settings.cTagEfficiency) : real_t(settings.cTagMisID);
			int const tag = (real_t(gen.U_even()) < prob) ? 1 : 0;

			jet.SetAttribute(Attribute::CTag, real_t(tag));
			return tag;
		}
};

#endif
