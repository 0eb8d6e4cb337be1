// Copyright (C) 2018 by Keith Pedersen (Keith.David.Pedersen@gmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "EventParticles.hpp"
#include "Classifier.hpp"
#include <cstdlib> // abs

Category EventParticles::CategoryOf(int const pdgID)
{
	switch(std::abs(pdgID))
	{
		case 11: return Category::Electron;
		case 13: return Category::Muon;
		case 15: return Category::TauJet;
		case 22: return Category::Photon;
		case 5: return Category::BJet;

		case 1: case 2: case 3: case 4: // light quarks
		case 21: // gluon
			return Category::LightJet;

		case 12: case 14: case 16:
			return Category::MissingET;

		default:
			return Category::Generic;
	}
}

////////////////////////////////////////////////////////////////////////

EventParticles::real_t EventParticles::ChargeOf(int const pdgID)
{
	real_t const sign = (pdgID < 0) ? real_t(-1) : real_t(1);

	switch(std::abs(pdgID))
	{
		case 2: case 4: case 6: // up-type
			return sign * real_t(2) / real_t(3);

		case 1: case 3: case 5: // down-type
			return -sign / real_t(3);

		case 11: case 13: case 15: // e-, mu-, tau- are positive ID
			return -sign;

		default:
			return real_t(0);
	}
}

////////////////////////////////////////////////////////////////////////

bool EventParticles::IsNeutrino(int const pdgID)
{
	int const absID = std::abs(pdgID);
	return (absID == 12) or (absID == 14) or (absID == 16);
}

////////////////////////////////////////////////////////////////////////

bool EventParticles::Selected(Pythia8::Particle const& particle, Selection const selection)
{
	switch(selection)
	{
		case Selection::HardProcess:
			return (std::abs(particle.status()) == 23);

		default:
			return particle.isFinal();
	}
}

////////////////////////////////////////////////////////////////////////

Particle EventParticles::Convert(Pythia8::Particle const& particle)
{
	int const pdgID = particle.id();

	Particle converted(
		FourVector::PxPyPzE(particle.px(), particle.py(), particle.pz(), particle.e()),
		ChargeOf(pdgID), std::to_string(pdgID), CategoryOf(pdgID));

	converted.SetAttribute(Attribute::PdgID, real_t(pdgID));
	return converted;
}

////////////////////////////////////////////////////////////////////////

void EventParticles::SortAndName(ParticleMap& particles)
{
	for(auto& category_particles : particles)
	{
		SortByPt(category_particles.second);

		if(category_particles.first not_eq Category::MissingET)
			Classifier::RenameLeading(category_particles.second, NamePrefix(category_particles.first));
	}
}
