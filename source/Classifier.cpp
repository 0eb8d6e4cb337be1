// Copyright (C) 2018 by Keith Pedersen (Keith.David.Pedersen@gmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "Classifier.hpp"

////////////////////////////////////////////////////////////////////////
// Classifier::Settings
////////////////////////////////////////////////////////////////////////

Classifier::Settings::Settings(QSettings const& parsedINI)
{
	overlapDeltaR.Read(parsedINI, iniSection);
	cTagEfficiency.Read(parsedINI, iniSection);
	cTagMisID.Read(parsedINI, iniSection);

	if(double(overlapDeltaR) < 0.)
		throw std::invalid_argument("Classifier::Settings: overlapDeltaR ("
			+ std::to_string(double(overlapDeltaR)) + ") must be non-negative");

	// Probabilities; NaN fails both comparisons
	for(double const prob : {double(cTagEfficiency), double(cTagMisID)})
	{
		if(not((prob >= 0.) and (prob <= 1.)))
			throw std::invalid_argument("Classifier::Settings: c-tag probabilities must lie in [0, 1] ("
				+ std::to_string(prob) + ")");
	}
}

////////////////////////////////////////////////////////////////////////
// Classifier
////////////////////////////////////////////////////////////////////////

constexpr char const* Classifier::iniSection;

bool Classifier::IsJet(Category const category)
{
	switch(category)
	{
		case Category::LightJet:
		case Category::BJet:
		case Category::TauJet:
		case Category::OtherJet:
			return true;

		default:
			return false;
	}
}

////////////////////////////////////////////////////////////////////////

ParticleVec Classifier::ClassifyCategory(ParticleVec& particles, KinematicCuts const& cuts)
{
	ParticleVec kept;

	for(Particle& particle : particles)
	{
		if(particle.EvaluateValidTag(cuts) == 1)
			kept.push_back(particle);
	}

	SortByPt(kept);
	return kept;
}

////////////////////////////////////////////////////////////////////////

ParticleMap Classifier::Classify(ParticleMap& event, KinematicCuts const& cuts)
{
	ParticleMap good;

	for(auto& category_particles : event)
		good[category_particles.first] = ClassifyCategory(category_particles.second, cuts);

	return good;
}

////////////////////////////////////////////////////////////////////////

ParticleVec Classifier::Unify(ParticleMap const& particles)
{
	ParticleVec unified;

	for(auto const& category_particles : particles)
		unified.insert(unified.end(), category_particles.second.cbegin(), category_particles.second.cend());

	SortByPt(unified);
	return unified;
}

////////////////////////////////////////////////////////////////////////

ParticleVec Classifier::RemoveOverlaps(ParticleVec const& particles, real_t const deltaR_min)
{
	ParticleVec sorted(particles);
	SortByPt(sorted);

	ParticleVec kept;

	for(Particle const& candidate : sorted)
	{
		bool isolated = true;

		for(Particle const& leader : kept)
		{
			if(candidate.DeltaR(leader) < deltaR_min)
			{
				isolated = false;
				break;
			}
		}

		if(isolated)
			kept.push_back(candidate);
	}

	return kept;
}

////////////////////////////////////////////////////////////////////////

ParticleMap Classifier::GoodParticles(ParticleMap& event, KinematicCuts const& cuts) const
{
	ParticleMap const classified = Classify(event, cuts);
	ParticleVec const survivors = RemoveOverlaps(Unify(classified), settings.overlapDeltaR);

	// Regroup by category. Every classified category stays present, and since
	// survivors are in descending pT, so is each category.
	ParticleMap good;
	for(auto const& category_particles : classified)
		good[category_particles.first];

	for(Particle const& particle : survivors)
		good[particle.GetCategory()].push_back(particle);

	return good;
}

////////////////////////////////////////////////////////////////////////

ParticleVec Classifier::GoodLeptons(ParticleMap& event, KinematicCuts const& cuts)
{
	// Resolve every flavor's cut before tagging anything
	KinematicCuts leptonCuts;

	for(Category const flavor : {Category::Electron, Category::Muon})
	{
		auto const it = event.find(flavor);

		if((it not_eq event.end()) and it->second.size())
		{
			// Get throws missing_configuration when the lepton fallback is also absent
			leptonCuts.Set(flavor, cuts.Has(flavor) ? cuts.Get(flavor) : cuts.Get(Category::Lepton));
		}
	}

	ParticleMap good;

	for(Category const flavor : {Category::Electron, Category::Muon})
	{
		if(leptonCuts.Has(flavor))
			good[flavor] = ClassifyCategory(event[flavor], leptonCuts);
	}

	ParticleVec unified = Unify(good);
	RenameLeading(unified, NamePrefix(Category::Lepton));

	return unified;
}

////////////////////////////////////////////////////////////////////////

ParticleMap Classifier::GoodJets(ParticleMap& event, KinematicCuts const& cuts)
{
	ParticleMap good;

	for(auto& category_particles : event)
	{
		if(IsJet(category_particles.first))
		{
			ParticleVec& kept = good[category_particles.first];

			kept = ClassifyCategory(category_particles.second, cuts);
			RenameLeading(kept, NamePrefix(category_particles.first));
		}
	}

	return good;
}

////////////////////////////////////////////////////////////////////////

void Classifier::RenameLeading(ParticleVec& particles, std::string const& prefix)
{
	for(size_t i = 0; i < particles.size(); ++i)
		particles[i].SetName(prefix + "_{" + std::to_string(i + 1) + "}");
}

////////////////////////////////////////////////////////////////////////

Category Classifier::JetCategory(int const bTag, int const tauTag)
{
	if(tauTag == 0)
	{
		if(bTag == 0)
			return Category::LightJet;
		else if(bTag == 1)
			return Category::BJet;
	}
	else if((tauTag == 1) and (bTag == 0))
		return Category::TauJet;

	return Category::OtherJet;
}
