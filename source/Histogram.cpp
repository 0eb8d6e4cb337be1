// Copyright (C) 2018 by Keith Pedersen (Keith.David.Pedersen@gmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "Histogram.hpp"
#include "helperTools.hpp"
#include "kdp/kdpTools.hpp"
#include <cmath>
#include <limits>
#include <iostream>
#include <algorithm> // minmax_element

#include "TAxis.h"

////////////////////////////////////////////////////////////////////////
// BinSpecs
////////////////////////////////////////////////////////////////////////

bool BinSpecs::IsValid() const
{
	return (nbins > 0) and (nbins <= size_t(std::numeric_limits<int>::max()))
		and std::isfinite(low) and std::isfinite(high) and (high > low);
}

////////////////////////////////////////////////////////////////////////

bool BinSpecs::Compatible(BinSpecs const& that, real_t const relTol) const
{
	return (nbins == that.nbins)
		and CloseEnough(low, that.low, relTol)
		and CloseEnough(high, that.high, relTol);
}

////////////////////////////////////////////////////////////////////////
// Histogram
////////////////////////////////////////////////////////////////////////

namespace
{
	// TH1D silently repairs bad binning, so check before it is built
	BinSpecs const& ValidBins(std::string const& name, BinSpecs const& bins)
	{
		if(not bins.IsValid())
			throw std::invalid_argument("Histogram: invalid binning for " + name
				+ " (" + std::to_string(bins.nbins) + " bins over [" + std::to_string(bins.low)
				+ ", " + std::to_string(bins.high) + "])");
		return bins;
	}
}

Histogram::Histogram(std::string const& name_in, BinSpecs const& bins_in):
hist(name_in.c_str(), name_in.c_str(), int(ValidBins(name_in, bins_in).nbins), bins_in.low, bins_in.high),
scaleFactor(1)
{
	hist.SetDirectory(nullptr);
}

////////////////////////////////////////////////////////////////////////

Histogram::Histogram(Histogram const& that):
hist(that.hist), scaleFactor(that.scaleFactor)
{
	hist.SetDirectory(nullptr);
}

////////////////////////////////////////////////////////////////////////

Histogram& Histogram::operator=(Histogram const& that)
{
	if(this not_eq &that)
	{
		hist = that.hist;
		hist.SetDirectory(nullptr);
		scaleFactor = that.scaleFactor;
	}
	return *this;
}

////////////////////////////////////////////////////////////////////////

void Histogram::SetName(std::string const& newName)
{
	hist.SetName(newName.c_str());
	hist.SetTitle(newName.c_str());
}

////////////////////////////////////////////////////////////////////////

BinSpecs Histogram::Bins() const
{
	TAxis const* const axis = hist.GetXaxis();
	return BinSpecs(size_t(axis->GetNbins()), axis->GetXmin(), axis->GetXmax());
}

////////////////////////////////////////////////////////////////////////

int Histogram::CheckBin(size_t const bin) const
{
	if((bin == 0) or (bin > NumBins()))
		throw std::out_of_range("Histogram: bin (" + std::to_string(bin)
			+ ") outside [1, " + std::to_string(NumBins()) + "] in " + Name());
	return int(bin);
}

////////////////////////////////////////////////////////////////////////

size_t Histogram::FindBin(real_t const x) const
{
	// 0 is underflow and nbins + 1 overflow (including x == high)
	int const bin = hist.GetXaxis()->FindFixBin(x);

	if(bin < 1)
		return 1;
	else if(bin > hist.GetNbinsX())
		return NumBins();
	else
		return size_t(bin);
}

////////////////////////////////////////////////////////////////////////

void Histogram::Fill(real_t const x, real_t const weight)
{
	if(std::isnan(x))
		throw std::invalid_argument("Histogram::Fill: NaN value in " + Name());

	// Fill at the center of the clipped bin, so nothing reaches under/overflow
	hist.Fill(hist.GetXaxis()->GetBinCenter(int(FindBin(x))), weight);
}

////////////////////////////////////////////////////////////////////////

Histogram::real_t Histogram::GetBinContent(size_t const bin) const
{
	return hist.GetBinContent(CheckBin(bin));
}

////////////////////////////////////////////////////////////////////////

void Histogram::SetBinContent(size_t const bin, real_t const value)
{
	hist.SetBinContent(CheckBin(bin), value);
}

////////////////////////////////////////////////////////////////////////

std::vector<Histogram::real_t> Histogram::Contents() const
{
	std::vector<real_t> contents;
	contents.reserve(NumBins());

	for(int bin = 1; bin <= hist.GetNbinsX(); ++bin)
		contents.push_back(hist.GetBinContent(bin));

	return contents;
}

////////////////////////////////////////////////////////////////////////

void Histogram::Add(Histogram const& that, real_t const coefficient)
{
	// TH1::Add falls back to Merge for unequal bin counts (with coefficient 1),
	// and only warns about limits off by rounding; the caller checks those
	if((NumBins() not_eq that.NumBins()) or not hist.Add(&that.hist, coefficient))
		throw PhenoTools::incompatible_binning("Histogram::Add: cannot add "
			+ that.Name() + " to " + Name());
}

////////////////////////////////////////////////////////////////////////

void Histogram::Scale(real_t const factor)
{
	hist.Scale(factor);
	scaleFactor *= factor;
}

////////////////////////////////////////////////////////////////////////
// HistogramEngine::Settings
////////////////////////////////////////////////////////////////////////

HistogramEngine::Settings::Settings(QSettings const& parsedINI)
{
	integral.Read(parsedINI, iniSection);
	holeFill.Read(parsedINI, iniSection);
	edgeTolerance.Read(parsedINI, iniSection);

	if(not(double(integral) > 0.))
		throw std::invalid_argument("HistogramEngine::Settings: integral ("
			+ std::to_string(double(integral)) + ") must be positive");

	if(not(double(holeFill) > 0.))
		throw std::invalid_argument("HistogramEngine::Settings: holeFill ("
			+ std::to_string(double(holeFill)) + ") must be positive");

	if(not(double(edgeTolerance) >= 0.))
		throw std::invalid_argument("HistogramEngine::Settings: edgeTolerance ("
			+ std::to_string(double(edgeTolerance)) + ") must be non-negative");
}

////////////////////////////////////////////////////////////////////////
// HistogramEngine
////////////////////////////////////////////////////////////////////////

constexpr char const* HistogramEngine::iniSection;

BinSpecs HistogramEngine::BinningFromSamples(std::vector<real_t> const& samples)
{
	if(samples.empty())
		throw std::invalid_argument("HistogramEngine::BinningFromSamples: no samples");

	for(real_t const sample : samples)
	{
		if(not std::isfinite(sample))
			throw std::invalid_argument("HistogramEngine::BinningFromSamples: non-finite sample");
	}

	auto const minmax = std::minmax_element(samples.cbegin(), samples.cend());

	return BinSpecs(SturgesBins(samples.size()), *(minmax.first), *(minmax.second));
}

////////////////////////////////////////////////////////////////////////

Histogram HistogramEngine::Build(std::string const& name, std::vector<real_t> const& samples,
	BinSpecs const& bins, real_t const integral)
{
	Histogram histogram(name, bins);

	for(real_t const sample : samples)
		histogram.Fill(sample);

	real_t const raw = histogram.Integral();

				GCC_IGNORE_PUSH(-Wfloat-equal)
	if(raw == real_t(0))
		std::cerr << "HistogramEngine::Build: " << name
			<< " has zero integral; it cannot be normalized" << std::endl;
	else
		histogram.Scale(integral / raw);
				GCC_IGNORE_POP

	return histogram;
}

////////////////////////////////////////////////////////////////////////

Histogram HistogramEngine::Sum(std::vector<Histogram> const& histograms, bool const subtract) const
{
	if(histograms.empty())
		throw std::invalid_argument("HistogramEngine::Sum: no histograms");

	Histogram const& first = histograms.front();
	Histogram sum(first.Name(), first.Bins());

	for(size_t i = 0; i < histograms.size(); ++i)
	{
		Histogram const& addend = histograms[i];

		if(not first.Bins().Compatible(addend.Bins(), settings.edgeTolerance))
			throw PhenoTools::incompatible_binning("HistogramEngine::Sum: "
				+ addend.Name() + " does not share the binning of " + first.Name());

		sum.Add(addend, ((i > 0) and subtract) ? real_t(-1) : real_t(1));
	}

	return sum;
}

////////////////////////////////////////////////////////////////////////

std::vector<size_t> HistogramEngine::FindEmptyBins(Histogram const& histogram)
{
	std::vector<size_t> empty;

				GCC_IGNORE_PUSH(-Wfloat-equal)
	for(size_t bin = 1; bin <= histogram.NumBins(); ++bin)
	{
		if(histogram.GetBinContent(bin) == real_t(0))
			empty.push_back(bin);
	}
				GCC_IGNORE_POP

	return empty;
}

////////////////////////////////////////////////////////////////////////

void HistogramEngine::FillHoles(Histogram& histogram, FillMode const mode,
	BoundaryPolicy const boundary) const
{
	std::vector<size_t> const holes = FindEmptyBins(histogram);

	if(holes.empty())
		return;

	if(mode == FillMode::Constant)
	{
		for(size_t const bin : holes)
			histogram.SetBinContent(bin, settings.holeFill);
		return;
	}

	// Linear: the anchors are the non-empty bins
	std::vector<size_t> anchors;
	{
		auto hole = holes.cbegin();
		for(size_t bin = 1; bin <= histogram.NumBins(); ++bin)
		{
			if((hole not_eq holes.cend()) and (*hole == bin))
				++hole;
			else
				anchors.push_back(bin);
		}
	}

	if(anchors.empty())
		return;

	size_t const firstAnchor = anchors.front();
	size_t const lastAnchor = anchors.back();

	// Holes are ascending, so the right-hand anchor only moves forward
	auto right = anchors.cbegin();

	for(size_t const bin : holes)
	{
		if(bin < firstAnchor)
		{
			if(boundary == BoundaryPolicy::Clamp)
				histogram.SetBinContent(bin, histogram.GetBinContent(firstAnchor));
		}
		else if(bin > lastAnchor)
		{
			if(boundary == BoundaryPolicy::Clamp)
				histogram.SetBinContent(bin, histogram.GetBinContent(lastAnchor));
		}
		else
		{
			while(*right < bin)
				++right;

			size_t const b = *right;
			size_t const a = *(right - 1);

			real_t const y_a = histogram.GetBinContent(a);
			real_t const y_b = histogram.GetBinContent(b);
			real_t const frac = real_t(bin - a) / real_t(b - a);

			histogram.SetBinContent(bin, y_a + frac * (y_b - y_a));
		}
	}
}

////////////////////////////////////////////////////////////////////////

HistogramEngine::BinDictionary const& HistogramEngine::DefaultBins()
{
	// Delta keys come first, so "#Delta{#eta}_{...}" never matches "#eta_"
	static BinDictionary const dictionary = {
		{"#Delta{R}", BinSpecs(96, 0., 7.)},
		{"#Delta{#eta}", BinSpecs(80, -5., 5.)},
		{"#Delta{#phi}", BinSpecs(52, -3.25, 3.25)},
		{"#Delta{pT}", BinSpecs(120, 0., 1500.)},
		{"#Delta{#vec{pT}}", BinSpecs(240, 0., 4800.)},
		{"#Delta{#vec{p}}", BinSpecs(240, 0., 4800.)},
		{"MET(GeV)", BinSpecs(80, 0., 1000.)},
		{"pT_", BinSpecs(160, 0., 2000.)},
		{"sT(GeV)", BinSpecs(200, 0., 4000.)},
		{"mT(GeV)", BinSpecs(200, 0., 4000.)},
		{"#eta_", BinSpecs(80, -5., 5.)},
		{"#phi_", BinSpecs(128, -3.2, 3.2)},
		{"Energy_", BinSpecs(80, 0., 1000.)}};

	return dictionary;
}

////////////////////////////////////////////////////////////////////////

BinSpecs const* HistogramEngine::MatchBins(std::string const& label)
{
	for(auto const& key_bins : DefaultBins())
	{
		if(label.find(key_bins.first) not_eq std::string::npos)
			return &(key_bins.second);
	}
	return nullptr;
}

////////////////////////////////////////////////////////////////////////

HistogramEngine::HistogramMap HistogramEngine::MakeHistograms(FeatureTable const& table) const
{
	HistogramMap histograms;

	for(std::string const& label : table.Columns())
	{
		std::vector<real_t> values;

		for(real_t const value : table.Column(label))
		{
			if(std::isfinite(value))
				values.push_back(value);
		}

		if(values.empty())
		{
			std::cerr << "HistogramEngine::MakeHistograms: column " << label
				<< " has no values; skipping" << std::endl;
			continue;
		}

		BinSpecs const* const match = MatchBins(label);
		BinSpecs bins = (match ? *match : BinningFromSamples(values));

		if(not(bins.high > bins.low))
		{
			bins.low -= real_t(0.5);
			bins.high += real_t(0.5);
		}

		histograms.emplace(label, Build(label, values, bins, settings.integral));
	}

	return histograms;
}

////////////////////////////////////////////////////////////////////////

std::vector<std::string> HistogramEngine::HistogramsWithHoles(HistogramMap const& histograms)
{
	std::vector<std::string> withHoles;

	for(auto const& name_histogram : histograms)
	{
		if(not FindEmptyBins(name_histogram.second).empty())
			withHoles.push_back(name_histogram.first);
	}

	return withHoles;
}
