#include "Histogram.hpp"
#include "helperTools.hpp"
#include <cmath>
#include <cstdio>
#include <limits>
#include <algorithm>
#include <QtCore/QSettings>

/*! @file tester_Histogram.cpp
 *  @brief Validate Histogram and HistogramEngine
 *
 *  tester_Histogram.ini must be in the working directory.
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

bool SameBins(BinSpecs const& bins, size_t const nbins, double const low, double const high)
{
	return (bins.nbins == nbins) and (bins.low == low) and (bins.high == high);
}

int main()
{
	using FillMode = HistogramEngine::FillMode;
	using BoundaryPolicy = HistogramEngine::BoundaryPolicy;

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

	QSettings const parsedINI("tester_Histogram.ini", QSettings::IniFormat);
	HistogramEngine const engine(parsedINI);

	Check(double(engine.GetSettings().holeFill) == 0.001, "holeFill from INI");

	// Sturges' rule
	{
		std::vector<double> range;
		for(int i = 0; i <= 20; ++i)
			range.push_back(double(i));

		Check(SameBins(HistogramEngine::BinningFromSamples(range), 5, 0., 20.), "Sturges [0..20]");
		Check(SameBins(HistogramEngine::BinningFromSamples(std::vector<double>(100, 0.)), 7, 0., 0.),
			"Sturges 100 zeros");
		Check(SameBins(HistogramEngine::BinningFromSamples({-10., -5., 0., 5., 10.}), 3, -10., 10.),
			"Sturges 5 samples");
		Check(SameBins(HistogramEngine::BinningFromSamples(
			{1., 2., 3., 3., 4., 5., 5., 5., 6., 7., 8., 9., 10.}), 4, 1., 10.), "Sturges 13 samples");

		// Exact powers of two must not round down
		Check(SturgesBins(size_t(64)) == 7, "SturgesBins(64)");
		Check(SturgesBins(size_t(1)) == 1, "SturgesBins(1)");

		Check(Throws<std::invalid_argument>([](){HistogramEngine::BinningFromSamples({});}), "no samples");
		Check(Throws<std::invalid_argument>([](){HistogramEngine::BinningFromSamples(
			{1., std::numeric_limits<double>::quiet_NaN()});}), "NaN sample");
	}

	// Histogram basics
	{
		Check(Throws<std::invalid_argument>([](){Histogram("h", BinSpecs(0, 0., 1.));}), "zero bins");
		Check(Throws<std::invalid_argument>([](){Histogram("h", BinSpecs(4, 1., 1.));}), "empty range");

		Histogram h("h", BinSpecs(4, 0., 4.));
		h.Fill(-1.);
		h.Fill(1.5);
		h.Fill(4.);
		h.Fill(10., 2.);

		Check(h.GetBinContent(1) == 1., "underflow clips to the first bin");
		Check(h.GetBinContent(2) == 1., "interior bin");
		Check(h.GetBinContent(4) == 3., "x == high and overflow clip to the last bin");
		Check(h.Integral() == 5., "Integral");

		Check(Throws<std::invalid_argument>([&](){h.Fill(std::numeric_limits<double>::quiet_NaN());}),
			"NaN fill");
		Check(Throws<std::out_of_range>([&](){h.GetBinContent(0);}), "bin 0");
		Check(Throws<std::out_of_range>([&](){h.GetBinContent(5);}), "bin nbins + 1");

		h.Scale(2.);
		h.Scale(0.25);
		Check(h.ScaleFactor() == 0.5, "cumulative scale factor");
		Check(h.GetBinContent(4) == 1.5, "Scale");
		Check(SameBins(h.Bins(), 4, 0., 4.), "Bins read back from the axis");

		// Same name twice, and copies that don't share contents
		Histogram copy(h);
		Histogram other("h", BinSpecs(4, 0., 4.));
		other.Fill(0.5, 4.);
		copy.SetBinContent(1, 7.);
		Check(h.GetBinContent(1) == 0.5, "copy is independent");
		Check((copy.Name() == "h") and (copy.ScaleFactor() == 0.5), "copy keeps name and scale");

		copy.Add(other, -1.);
		Check(copy.GetBinContent(1) == 3., "Add with coefficient -1");
		Check(copy.GetBinContent(4) == 1.5, "Add leaves other bins");

		other = h;
		Check((other.GetBinContent(1) == 0.5) and (other.ScaleFactor() == 0.5), "assignment");

		Histogram coarse("coarse", BinSpecs(2, 0., 4.));
		Check(Throws<PhenoTools::incompatible_binning>([&](){copy.Add(coarse);}), "Add across binnings");
	}

	// Build
	{
		Histogram const h = HistogramEngine::Build("h", {0.5, 1.5, 1.5, 3.5}, BinSpecs(4, 0., 4.));

		Check(std::fabs(h.Integral() - 1.) < 1e-12, "normalized");
		Check(h.GetBinContent(2) == 0.5, "normalized content");
		Check(h.ScaleFactor() == 0.25, "normalization factor");

		Histogram const ten = HistogramEngine::Build("ten", {0.5, 1.5}, BinSpecs(4, 0., 4.), 10.);
		Check(std::fabs(ten.Integral() - 10.) < 1e-12, "custom integral");

		Histogram const empty = HistogramEngine::Build("empty", {}, BinSpecs(4, 0., 4.));
		Check((empty.Integral() == 0.) and (empty.ScaleFactor() == 1.), "zero integral not normalized");
	}

	// Sum
	{
		Histogram a("a", BinSpecs(3, 0., 3.));
		a.Fill(0.5, 4.);
		a.Fill(2.5, 1.);

		Histogram b("b", BinSpecs(3, 0., 3. * (1. + 1e-12)));
		b.Fill(0.5, 1.);
		b.Fill(1.5, 2.);

		Histogram const sum = engine.Sum({a, b});
		Check(sum.Name() == "a", "sum takes the first name");
		Check((sum.GetBinContent(1) == 5.) and (sum.GetBinContent(2) == 2.)
			and (sum.GetBinContent(3) == 1.), "sum");

		Histogram const diff = engine.Sum({a, b}, true);
		Check((diff.GetBinContent(1) == 3.) and (diff.GetBinContent(2) == -2.), "subtract");

		Histogram const c("c", BinSpecs(4, 0., 3.));
		Check(Throws<PhenoTools::incompatible_binning>([&](){engine.Sum({a, c});}), "different nbins");

		Histogram const d("d", BinSpecs(3, 0., 3.1));
		Check(Throws<PhenoTools::incompatible_binning>([&](){engine.Sum({a, d});}), "different edges");

		Check(Throws<std::invalid_argument>([&](){engine.Sum({});}), "empty sum");
	}

	// Holes
	{
		Histogram h = HistogramEngine::Build("h", {0.5, 1.5, 1.5, 3.5}, BinSpecs(4, 0., 4.));

		std::vector<size_t> const holes = HistogramEngine::FindEmptyBins(h);
		Check((holes.size() == 1) and (holes.front() == 3), "FindEmptyBins is 1-based");

		engine.FillHoles(h, FillMode::Constant);
		Check(h.GetBinContent(3) == 0.001, "constant fill");
		Check(HistogramEngine::FindEmptyBins(h).empty(), "no holes after constant fill");

		// 0 2 0 0 8 0 -> interior holes are interpolated
		Histogram linear("linear", BinSpecs(6, 0., 6.));
		linear.SetBinContent(2, 2.);
		linear.SetBinContent(5, 8.);

		Histogram clamped(linear);

		engine.FillHoles(linear, FillMode::Linear);
		Check(std::fabs(linear.GetBinContent(3) - 4.) < 1e-12, "linear fill bin 3");
		Check(std::fabs(linear.GetBinContent(4) - 6.) < 1e-12, "linear fill bin 4");
		Check((linear.GetBinContent(1) == 0.) and (linear.GetBinContent(6) == 0.),
			"boundary holes stay empty by default");

		engine.FillHoles(clamped, FillMode::Linear, BoundaryPolicy::Clamp);
		Check((clamped.GetBinContent(1) == 2.) and (clamped.GetBinContent(6) == 8.),
			"clamped boundary holes");
		Check(std::fabs(clamped.GetBinContent(3) - 4.) < 1e-12, "clamped interior is still linear");

		Histogram nothing("nothing", BinSpecs(3, 0., 1.));
		engine.FillHoles(nothing, FillMode::Linear, BoundaryPolicy::Clamp);
		Check(nothing.Integral() == 0., "no anchors leaves the histogram unchanged");
	}

	// Default binning
	{
		BinSpecs const* deltaR = HistogramEngine::MatchBins("#Delta{R}_{e_{1}j_{1}}");
		Check(deltaR and SameBins(*deltaR, 96, 0., 7.), "DeltaR binning");

		BinSpecs const* deltaPhi = HistogramEngine::MatchBins("#Delta{#phi}_{e_{1}j_{1}}");
		Check(deltaPhi and SameBins(*deltaPhi, 52, -3.25, 3.25), "DeltaPhi binning (not phi)");

		BinSpecs const* phi = HistogramEngine::MatchBins("#phi_{j_{1}}");
		Check(phi and SameBins(*phi, 128, -3.2, 3.2), "phi binning");

		BinSpecs const* pT = HistogramEngine::MatchBins("pT_{j_{1}}(GeV)");
		Check(pT and SameBins(*pT, 160, 0., 2000.), "pT binning");

		BinSpecs const* vecPT = HistogramEngine::MatchBins("#Delta{#vec{pT}}_{e_{1}j_{1}}(GeV)");
		Check(vecPT and SameBins(*vecPT, 240, 0., 4800.), "vector pT binning");

		Check(HistogramEngine::MatchBins("Mass_{j_{1}}(GeV)") == nullptr, "no mass binning");
	}

	// Histograms from a table
	{
		FeatureTable table;
		{
			FeatureRow row;
			row.Add("pT_{j_{1}}(GeV)", 100.);
			row.Add("Mass_{j_{1}}(GeV)", 5.);
			table.Append(row);
		}
		{
			FeatureRow row;
			row.Add("pT_{j_{1}}(GeV)", 300.);
			row.Add("Mass_{j_{1}}(GeV)", 5.);
			row.Add("pT_{j_{2}}(GeV)", std::numeric_limits<double>::quiet_NaN());
			table.Append(row);
		}

		HistogramEngine::HistogramMap histograms = engine.MakeHistograms(table);

		Check(histograms.size() == 2, "all-NaN column skipped");

		Histogram const& pT = histograms.at("pT_{j_{1}}(GeV)");
		Check(pT.NumBins() == 160, "dictionary binning");
		Check(std::fabs(pT.Integral() - 1.) < 1e-12, "normalized to the INI integral");

		Histogram const& mass = histograms.at("Mass_{j_{1}}(GeV)");
		Check(SameBins(mass.Bins(), 2, 4.5, 5.5), "degenerate Sturges range widened");
		Check(std::fabs(mass.Integral() - 1.) < 1e-12, "degenerate histogram normalized");

		Histogram full("full", BinSpecs(1, 0., 1.));
		full.Fill(0.5);
		histograms.emplace("full", full);

		std::vector<std::string> const withHoles = HistogramEngine::HistogramsWithHoles(histograms);
		Check(std::find(withHoles.begin(), withHoles.end(), "pT_{j_{1}}(GeV)") not_eq withHoles.end(),
			"pT histogram has holes");
		Check(std::find(withHoles.begin(), withHoles.end(), "full") == withHoles.end(),
			"full histogram has no holes");
	}

	printf("%lu checks, %lu failures\n", checks, failures);

	return (failures ? 1 : 0);
}
