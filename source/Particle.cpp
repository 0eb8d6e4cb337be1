// Copyright (C) 2018 by Keith Pedersen (Keith.David.Pedersen@gmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "Particle.hpp"
#include "KinematicCuts.hpp"
#include <cmath>
#include <algorithm> // stable_sort

////////////////////////////////////////////////////////////////////////
// Category keys
////////////////////////////////////////////////////////////////////////

namespace
{
	struct CategoryInfo
	{
		Category category;
		char const* key;
		char const* prefix;
	};

	// Keys double as INI section names, so they never change
	CategoryInfo const categoryTable[] = {
		{Category::Electron, "electron", "e"},
		{Category::Muon, "muon", "#mu"},
		{Category::Lepton, "lep", "lep"},
		{Category::LightJet, "l_jet", "j"},
		{Category::BJet, "b_jet", "b"},
		{Category::TauJet, "tau_jet", "#tau"},
		{Category::OtherJet, "other_jet", "other_jet"},
		{Category::Photon, "photon", "#gamma"},
		{Category::MissingET, "MET", "MET"},
		{Category::Generic, "generic", "p"}};

	CategoryInfo const& Lookup(Category const category)
	{
		for(CategoryInfo const& info : categoryTable)
		{
			if(info.category == category)
				return info;
		}
		throw std::invalid_argument("Category: unknown enum value ("
			+ std::to_string(int(category)) + ")");
	}
}

std::string CategoryKey(Category const category)
{
	return Lookup(category).key;
}

////////////////////////////////////////////////////////////////////////

Category ParseCategory(std::string const& key)
{
	for(CategoryInfo const& info : categoryTable)
	{
		if(key == info.key)
			return info.category;
	}
	throw std::invalid_argument("ParseCategory: unknown category (" + key + ")");
}

////////////////////////////////////////////////////////////////////////

std::string NamePrefix(Category const category)
{
	return Lookup(category).prefix;
}

////////////////////////////////////////////////////////////////////////
// Particle
////////////////////////////////////////////////////////////////////////

constexpr int Particle::tag_unset;

Particle::Particle(FourVector const& p4_in, real_t const charge_in,
	std::string const& name_in, Category const category_in):
p4(p4_in), charge(charge_in), name(name_in), category(category_in),
validTag(tag_unset)
{
	if(not std::isfinite(charge))
		throw std::invalid_argument("Particle: charge must be finite (" + name + ")");
}

////////////////////////////////////////////////////////////////////////

Particle Particle::MissingET(std::vector<std::pair<real_t, real_t>> const& met_phi)
{
	Particle met(FourVector(), real_t(0), NamePrefix(Category::MissingET), Category::MissingET);

	for(auto const& contribution : met_phi)
		met.AddMissingEnergy(contribution.first, contribution.second);

	return met;
}

////////////////////////////////////////////////////////////////////////

void Particle::AddMissingEnergy(real_t const met, real_t const phi)
{
	if(category not_eq Category::MissingET)
		throw std::logic_error("Particle::AddMissingEnergy: only MissingET can accumulate missing energy ("
			+ name + ")");

	p4 += FourVector::PtEtaPhiM(met, real_t(0), phi, real_t(0));
}

////////////////////////////////////////////////////////////////////////

int Particle::ValidTag() const
{
	if(not HasValidTag())
		throw std::logic_error("Particle::ValidTag: no kinematic decision has been made (" + name + ")");
	return validTag;
}

////////////////////////////////////////////////////////////////////////

void Particle::SetValidTag(int const value)
{
	if((value not_eq 0) and (value not_eq 1))
		throw std::invalid_argument("Particle::SetValidTag: tag must be 0 or 1 ("
			+ std::to_string(value) + ")");
	validTag = value;
}

////////////////////////////////////////////////////////////////////////

int Particle::EvaluateValidTag(KinematicCuts const& cuts)
{
	KinematicCut const& cut = cuts.Get(category); // throws missing_configuration

	bool pass = cut.Accepts(Pt(), Eta());

	if(pass and cut.isolation.set)
	{
		pass = HasAttribute(Attribute::Isolation)
			and cut.isolation.Contains(GetAttribute(Attribute::Isolation));
	}

	SetValidTag(pass ? 1 : 0);
	return validTag;
}

////////////////////////////////////////////////////////////////////////

Particle::real_t Particle::GetAttribute(Attribute const key) const
{
	auto const it = attributes.find(key);

	if(it == attributes.end())
		throw std::out_of_range("Particle::GetAttribute: attribute ("
			+ std::to_string(int(key)) + ") not set for " + name);
	return it->second;
}

////////////////////////////////////////////////////////////////////////

Particle::real_t Particle::DeltaR(Particle const& that) const
{
	return ::DeltaR(p4, that.p4);
}

Particle::real_t Particle::DeltaEta(Particle const& that) const
{
	return ::DeltaEta(p4, that.p4);
}

Particle::real_t Particle::DeltaPhi(Particle const& that) const
{
	return ::DeltaPhi(p4, that.p4);
}

Particle::real_t Particle::DeltaPtScalar(Particle const& that) const
{
	return ::DeltaPtScalar(p4, that.p4);
}

Particle::real_t Particle::DeltaPtVector(Particle const& that) const
{
	return ::DeltaPtVector(p4, that.p4);
}

Particle::real_t Particle::DeltaPVector(Particle const& that) const
{
	return ::DeltaPVector(p4, that.p4);
}

////////////////////////////////////////////////////////////////////////

void SortByPt(ParticleVec& particles)
{
	std::stable_sort(particles.begin(), particles.end(),
		[](Particle const& a, Particle const& b) {return a.Pt() > b.Pt();});
}
