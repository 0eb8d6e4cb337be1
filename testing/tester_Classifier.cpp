#include "Classifier.hpp"
#include "pqRand/pqRand.hpp"
#include <cmath>
#include <cstdio>
#include <vector>
#include <QtCore/QSettings>

/*! @file tester_Classifier.cpp
 *  @brief Validate classification, overlap removal, lepton/jet selection and c-tagging
 *
 *  tester_Classifier.ini must be in the working directory.
*/

template<class exception_t, class Func>
bool Throws(Func&& f)
{
	try
	{
		f();
	}
	catch(exception_t const&)
	{
		return true;
	}
	return false;
}

// A "random" source which returns a fixed sequence, for exact c-tag decisions
struct FixedSource
{
	std::vector<double> values;
	size_t next;

	FixedSource(std::vector<double> const& values_in):values(values_in), next(0) {}

	double U_even() {return values.at(next++);}
};

Particle Make(double const pt, double const eta, double const phi,
	std::string const& name, Category const category)
{
	return Particle(FourVector::PtEtaPhiM(pt, eta, phi, 0.), 0., name, category);
}

bool DescendingPt(ParticleVec const& particles)
{
	for(size_t i = 1; i < particles.size(); ++i)
	{
		if(particles[i].Pt() > particles[i - 1].Pt())
			return false;
	}
	return true;
}

int main()
{
	size_t checks = 0;
	size_t failures = 0;

	auto Check = [&](bool const pass, char const* const what)
	{
		++checks;
		if(not pass)
		{
			++failures;
			printf("FAIL: %s\n", what);
		}
	};

	QSettings const parsedINI("tester_Classifier.ini", QSettings::IniFormat);
	KinematicCuts const cuts = KinematicCuts::FromINI(parsedINI);
	Classifier const classifier(parsedINI);

	// Settings
	{
		Check(double(classifier.GetSettings().overlapDeltaR) == 0.4, "overlapDeltaR from INI");
		Check(double(Classifier().GetSettings().overlapDeltaR) == 0.3, "default overlapDeltaR");

		QSettings const badINI("tester_Classifier_bad.ini", QSettings::IniFormat);
		Check(Throws<std::invalid_argument>([&](){Classifier bad(badINI);}), "c-tag efficiency > 1");
	}

	// Classify
	{
		ParticleMap event;
		event[Category::Muon] = {Make(5., 0., 0., "#mu_a", Category::Muon),
			Make(30., 1., 1., "#mu_b", Category::Muon),
			Make(50., 3., 2., "#mu_c", Category::Muon), // outside eta
			Make(12., -1., -1., "#mu_d", Category::Muon)};
		event[Category::LightJet] = {Make(15., 0., 0., "j_a", Category::LightJet),
			Make(25., 0., 0., "j_b", Category::LightJet)};
		event[Category::BJet] = {};

		ParticleMap const good = Classifier::Classify(event, cuts);

		ParticleVec const& muons = good.at(Category::Muon);
		Check(muons.size() == 2, "two good muons");
		Check(DescendingPt(muons) and (muons.front().Name() == "#mu_b"), "good muons are leading first");

		for(Particle const& muon : muons)
		{
			KinematicCut const& cut = cuts.Get(Category::Muon);
			Check((muon.Pt() >= cut.pt_min) and (muon.Eta() >= cut.eta_min)
				and (muon.Eta() <= cut.eta_max), "retained muon passes its cut");
		}

		Check(good.at(Category::LightJet).size() == 1, "one good light jet");
		Check(good.count(Category::BJet) and good.at(Category::BJet).empty(), "empty category kept");

		Check(event.at(Category::Muon)[0].ValidTag() == 0, "failing tag written back");
		Check(event.at(Category::Muon)[1].ValidTag() == 1, "passing tag written back");

		ParticleMap photons;
		photons[Category::Photon] = {Make(50., 0., 0., "#gamma", Category::Photon)};
		Check(Throws<PhenoTools::missing_configuration>([&](){Classifier::Classify(photons, cuts);}),
			"no photon cut");
	}

	// Unify
	{
		ParticleMap particles;
		particles[Category::Muon] = {Make(30., 0., 0., "m", Category::Muon)};
		particles[Category::LightJet] = {Make(40., 0., 1., "j1", Category::LightJet),
			Make(10., 0., 2., "j2", Category::LightJet)};
		particles[Category::BJet] = {};

		ParticleVec const unified = Classifier::Unify(particles);
		Check(unified.size() == 3, "Unify size");
		Check(DescendingPt(unified) and (unified[1].Name() == "m"), "Unify order");
		Check(Classifier::Unify(ParticleMap()).empty(), "Unify nothing");
	}

	// Overlap removal
	{
		ParticleVec const particles = {Make(40., 0.1, 0., "b", Category::Generic),
			Make(50., 0., 0., "a", Category::Generic),
			Make(30., 1., 0., "c", Category::Generic)};

		ParticleVec const kept = Classifier::RemoveOverlaps(particles, 0.4);
		Check((kept.size() == 2) and (kept[0].Name() == "a") and (kept[1].Name() == "c"),
			"softer overlapping particle removed");

		Check(Classifier::RemoveOverlaps(particles, 0.).size() == 3, "no overlap removal at deltaR = 0");

		ParticleMap event;
		event[Category::Muon] = {Make(30., 0., 0., "#mu", Category::Muon)};
		event[Category::LightJet] = {Make(25., 0.2, 0., "j", Category::LightJet),
			Make(60., -2., 2., "j", Category::LightJet)};

		ParticleMap const good = classifier.GoodParticles(event, cuts);
		Check(good.at(Category::Muon).size() == 1, "muon survives");
		Check((good.at(Category::LightJet).size() == 1)
			and (good.at(Category::LightJet)[0].Pt() > 59.), "overlapping jet removed");
	}

	// Good leptons (electrons use the "lep" fallback)
	{
		ParticleMap event;
		event[Category::Electron] = {Make(12., 0., 0., "e", Category::Electron),
			Make(20., 0., 1., "e", Category::Electron)};
		event[Category::Muon] = {Make(8., 0., 2., "#mu", Category::Muon),
			Make(40., 0., 3., "#mu", Category::Muon)};

		ParticleVec const leptons = Classifier::GoodLeptons(event, cuts);

		Check(leptons.size() == 2, "two good leptons");
		Check((leptons[0].Name() == "lep_{1}") and (leptons[1].Name() == "lep_{2}"), "lepton names");
		Check((leptons[0].GetCategory() == Category::Muon)
			and (leptons[1].GetCategory() == Category::Electron), "leptons keep their flavor");

		Check(event.at(Category::Electron).size() == 2, "event keeps its electrons");
		Check(event.at(Category::Electron)[0].ValidTag() == 0, "electron below the lep cut");

		KinematicCuts muonOnly;
		muonOnly.Set(Category::Muon, cuts.Get(Category::Muon));
		Check(Throws<PhenoTools::missing_configuration>([&](){Classifier::GoodLeptons(event, muonOnly);}),
			"electrons without electron or lep cut");
	}

	// Good jets
	{
		ParticleMap event;
		event[Category::LightJet] = {Make(10., 0., 0., "x", Category::LightJet),
			Make(30., 0., 1., "x", Category::LightJet),
			Make(50., 1., 2., "x", Category::LightJet)};
		event[Category::BJet] = {Make(45., 3., 0., "x", Category::BJet)};
		event[Category::Photon] = {Make(100., 0., 0., "x", Category::Photon)};

		ParticleMap const jets = Classifier::GoodJets(event, cuts);

		Check(not jets.count(Category::Photon), "GoodJets ignores photons");
		Check(jets.at(Category::LightJet).size() == 2, "two good light jets");
		Check((jets.at(Category::LightJet)[0].Name() == "j_{1}")
			and (jets.at(Category::LightJet)[1].Name() == "j_{2}"), "light jet names");
		Check(jets.at(Category::LightJet)[0].Pt() > 49., "leading jet first");
		Check(jets.at(Category::BJet).empty(), "forward b jet fails");
		Check(event.at(Category::LightJet).size() == 3, "event keeps its jets");
	}

	// Jet typing
	{
		Check(Classifier::JetCategory(0, 0) == Category::LightJet, "JetCategory(0, 0)");
		Check(Classifier::JetCategory(1, 0) == Category::BJet, "JetCategory(1, 0)");
		Check(Classifier::JetCategory(0, 1) == Category::TauJet, "JetCategory(0, 1)");
		Check(Classifier::JetCategory(1, 1) == Category::OtherJet, "JetCategory(1, 1)");
		Check(Classifier::JetCategory(2, 0) == Category::OtherJet, "JetCategory(2, 0)");
	}

	// c-tagging with a fixed source (efficiency 0.7, mis-ID 0.01)
	{
		Particle charm = Make(40., 0., 0., "j", Category::LightJet);
		charm.SetAttribute(Attribute::Flavor, 4.);

		Particle antiCharm = Make(40., 0., 0., "j", Category::LightJet);
		antiCharm.SetAttribute(Attribute::Flavor, -4.);

		Particle light = Make(40., 0., 0., "j", Category::LightJet);
		light.SetAttribute(Attribute::Flavor, 1.);

		Particle unknown = Make(40., 0., 0., "j", Category::LightJet);

		FixedSource gen({0.5, 0.8, 0.5, 0.005, 0.5, 0.005});

		Check(classifier.CTag(charm, gen) == 1, "charm tagged");
		Check(charm.GetAttribute(Attribute::CTag) == 1., "c-tag stored");
		Check(classifier.CTag(charm, gen) == 0, "charm missed");
		Check(classifier.CTag(antiCharm, gen) == 1, "anti-charm tagged");
		Check(classifier.CTag(light, gen) == 1, "light mis-tagged");
		Check(classifier.CTag(light, gen) == 0, "light not tagged");
		Check(light.GetAttribute(Attribute::CTag) == 0., "c-tag overwritten");
		Check(classifier.CTag(unknown, gen) == 1, "no flavor uses mis-ID");
	}

	// c-tagging rates
	{
		pqRand::engine gen;

		size_t const trials = 10000;
		size_t charmTags = 0;
		size_t lightTags = 0;

		Particle charm = Make(40., 0., 0., "j", Category::LightJet);
		charm.SetAttribute(Attribute::Flavor, 4.);

		Particle light = Make(40., 0., 0., "j", Category::LightJet);
		light.SetAttribute(Attribute::Flavor, 21.);

		for(size_t i = 0; i < trials; ++i)
		{
			charmTags += size_t(classifier.CTag(charm, gen));
			lightTags += size_t(classifier.CTag(light, gen));
		}

		// About 7 sigma for charm and 6 sigma for light
		double const charmRate = double(charmTags) / double(trials);
		Check(std::fabs(charmRate - 0.7) < 0.03, "c-tag efficiency");
		Check((lightTags > 40) and (lightTags < 160), "c-tag mis-ID rate");
	}

	printf("%lu checks, %lu failures\n", checks, failures);

	return (failures ? 1 : 0);
}
