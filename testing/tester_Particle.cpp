#include "Particle.hpp"
#include "KinematicCuts.hpp"
#include <cmath>
#include <cstdio>
#include <limits>

/*! @file tester_Particle.cpp
 *  @brief Validate Particle: categories, valid tags, side attributes and missing ET
*/

// Does f() throw exception_t?
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

	// Category keys and prefixes
	{
		for(Category const category : {Category::Electron, Category::Muon, Category::Lepton,
			Category::LightJet, Category::BJet, Category::TauJet, Category::OtherJet,
			Category::Photon, Category::MissingET, Category::Generic})
		{
			Check(ParseCategory(CategoryKey(category)) == category, "ParseCategory(CategoryKey)");
		}

		Check(CategoryKey(Category::BJet) == "b_jet", "b_jet key");
		Check(NamePrefix(Category::Muon) == "#mu", "muon prefix");
		Check(NamePrefix(Category::LightJet) == "j", "light jet prefix");
		Check(Throws<std::invalid_argument>([](){ParseCategory("gluino");}), "unknown category");
	}

	FourVector const p4 = FourVector::PtEtaPhiM(30., 1.2, 0.3, 0.105);

	// Construction and valid tags
	{
		Check(Throws<std::invalid_argument>([&]()
			{Particle(p4, std::numeric_limits<double>::quiet_NaN(), "#mu_{1}", Category::Muon);}),
			"NaN charge");

		Particle muon(p4, -1., "#mu_{1}", Category::Muon);

		Check(not muon.HasValidTag(), "tag starts unset");
		Check(Throws<std::logic_error>([&](){muon.ValidTag();}), "reading unset tag");
		Check(Throws<std::invalid_argument>([&](){muon.SetValidTag(2);}), "tag must be 0 or 1");

		muon.SetValidTag(0);
		Check(muon.ValidTag() == 0, "SetValidTag");

		muon.SetName("lep_{1}");
		Check(muon.Name() == "lep_{1}", "SetName");
		Check(muon.Charge() == -1., "charge");
	}

	// EvaluateValidTag
	{
		KinematicCuts cuts;
		cuts.Set(Category::Muon, KinematicCut(10., 100., -2.5, 2.5));

		Particle pass(p4, -1., "#mu_{1}", Category::Muon);
		Check(pass.EvaluateValidTag(cuts) == 1, "passes cut");
		Check(pass.ValidTag() == 1, "tag is stored");

		Particle soft(FourVector::PtEtaPhiM(5., 1.2, 0.3, 0.105), 1., "#mu_{2}", Category::Muon);
		Check(soft.EvaluateValidTag(cuts) == 0, "fails pt_min");

		Particle hard(FourVector::PtEtaPhiM(150., 1.2, 0.3, 0.105), 1., "#mu_{3}", Category::Muon);
		Check(hard.EvaluateValidTag(cuts) == 0, "fails pt_max");

		Particle forward(FourVector::PtEtaPhiM(30., -2.6, 0.3, 0.105), 1., "#mu_{4}", Category::Muon);
		Check(forward.EvaluateValidTag(cuts) == 0, "fails eta_min");

		Particle edge(FourVector::PtEtaPhiM(10., 0., 0., 0.), 1., "#mu_{5}", Category::Muon);
		Check(edge.EvaluateValidTag(cuts) == 1, "pt == pt_min passes");

		Particle electron(p4, -1., "e_{1}", Category::Electron);
		Check(Throws<PhenoTools::missing_configuration>([&](){electron.EvaluateValidTag(cuts);}),
			"missing category cut");
		Check(not electron.HasValidTag(), "tag unset after missing configuration");

		// Isolation window
		KinematicCut isolated(10., std::numeric_limits<double>::infinity(), -2.5, 2.5);
		isolated.SetIsolation(0., 0.1);
		cuts.Set(Category::Electron, isolated);

		Check(electron.EvaluateValidTag(cuts) == 0, "no isolation attribute fails");

		electron.SetAttribute(Attribute::Isolation, 0.05);
		Check(electron.EvaluateValidTag(cuts) == 1, "isolated passes");

		electron.SetAttribute(Attribute::Isolation, 0.5);
		Check(electron.EvaluateValidTag(cuts) == 0, "non-isolated fails");
	}

	// Side attributes
	{
		Particle jet(p4, 0., "b_{1}", Category::BJet);

		Check(not jet.HasAttribute(Attribute::BTag), "attribute absent");
		Check(Throws<std::out_of_range>([&](){jet.GetAttribute(Attribute::BTag);}), "missing attribute");

		jet.SetAttribute(Attribute::BTag, 1.);
		Check(jet.HasAttribute(Attribute::BTag), "attribute present");
		Check(jet.GetAttribute(Attribute::BTag) == 1., "attribute value");
	}

	// Missing ET
	{
		Particle met = Particle::MissingET({{30., 0.}, {40., 0.5 * M_PI}});

		Check(met.GetCategory() == Category::MissingET, "MET category");
		Check(met.Name() == "MET", "MET name");
		Check(met.Charge() == 0., "MET charge");
		Check(std::fabs(met.Pt() - 50.) < 1e-9, "MET is the vector sum");
		Check(std::fabs(met.Eta()) < 1e-12, "MET is transverse");
		Check(not std::isnan(met.Pl()) and (std::fabs(met.Pl()) < 1e-6), "MET Pl is zero");

		met.AddMissingEnergy(50., std::atan2(-4., -3.));
		Check(met.Pt() < 1e-9, "AddMissingEnergy cancels");

		Particle muon(p4, -1., "#mu_{1}", Category::Muon);
		Check(Throws<std::logic_error>([&](){muon.AddMissingEnergy(10., 0.);}),
			"AddMissingEnergy on a muon");
	}

	// Deltas delegate to the four-vectors
	{
		Particle a(p4, 0., "a", Category::Generic);
		Particle b(FourVector::PtEtaPhiM(20., -0.4, 2., 1.), 0., "b", Category::Generic);

		Check(a.DeltaR(b) == DeltaR(a.p4_vec(), b.p4_vec()), "Particle::DeltaR");
		Check(a.DeltaPhi(b) == DeltaPhi(a.p4_vec(), b.p4_vec()), "Particle::DeltaPhi");
		Check(a.DeltaPVector(b) == DeltaPVector(a.p4_vec(), b.p4_vec()), "Particle::DeltaPVector");
	}

	// SortByPt is stable and descending
	{
		ParticleVec particles;
		particles.emplace_back(FourVector::PtEtaPhiM(10., 0., 0., 0.), 0., "a", Category::Generic);
		particles.emplace_back(FourVector::PtEtaPhiM(30., 0., 0., 0.), 0., "b", Category::Generic);
		particles.emplace_back(FourVector::PtEtaPhiM(10., 1., 0., 0.), 0., "c", Category::Generic);
		particles.emplace_back(FourVector::PtEtaPhiM(20., 0., 0., 0.), 0., "d", Category::Generic);

		SortByPt(particles);

		Check((particles[0].Name() == "b") and (particles[1].Name() == "d")
			and (particles[2].Name() == "a") and (particles[3].Name() == "c"), "SortByPt");
	}

	printf("%lu checks, %lu failures\n", checks, failures);

	return (failures ? 1 : 0);
}
