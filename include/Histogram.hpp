#ifndef HISTOGRAM
#define HISTOGRAM

// Copyright (C) 2018 by Keith Pedersen (Keith.David.Pedersen@gmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "PhenoTools.hpp"
#include "FeatureRow.hpp"
#include "kdp/kdpSettings.hpp"
#include <map>
#include <string>
#include <utility> // pair
#include <vector>

#include "TH1D.h"

#include <QtCore/QSettings>

/*! @file Histogram.hpp
 *  @brief Defines uniform-binned histograms and the tools which build, merge and patch them
 *  @author Copyright (C) 2018 Keith Pedersen (Keith.David.Pedersen@gmail.com, https://wwww.hepguy.com)
*/

//! @brief The uniform binning of a histogram: nbins over [low, high)
struct BinSpecs
{
	using real_t = PhenoTools::real_t;

	size_t nbins;
	real_t low;
	real_t high;

	BinSpecs(size_t const nbins_in, real_t const low_in, real_t const high_in):
		nbins(nbins_in), low(low_in), high(high_in) {}

	//! @brief At least one bin (no more than a TH1D holds) and a finite, non-empty range
	bool IsValid() const;

	real_t Width() const {return (high - low) / real_t(nbins);}

	//! @brief Same nbins, and low/high equal within \p relTol
	bool Compatible(BinSpecs const& that, real_t const relTol) const;
};

////////////////////////////////////////////////////////////////////////

/*! @brief A named, uniformly binned histogram, stored in a ROOT TH1D.
 *
 *  Bins are numbered 1 to nbins (as in ROOT). Values outside [low, high]
 *  are clipped into the first/last bin (so the TH1D's under/overflow bins stay empty),
 *  and x == high lands in the last bin.
 *
 *  The binning is fixed after construction. Contents are non-negative after filling,
 *  but may be anything after background subtraction.
 *
 *  The TH1D is detached from ROOT's current directory, so the Histogram owns it
 *  and equal names never collide.
*/
class Histogram
{
	public:
		using real_t = PhenoTools::real_t;

	private:
		TH1D hist;
		real_t scaleFactor; // product of all Scale() calls

		int CheckBin(size_t const bin) const; // return a ROOT bin, or throw

	public:
		/*! @brief Construct an empty histogram
		 *
		 *  \throws std::invalid_argument if \p bins_in is not valid (nbins == 0 or high <= low)
		*/
		Histogram(std::string const& name_in, BinSpecs const& bins_in);

		Histogram(Histogram const& that);
		Histogram& operator=(Histogram const& that);

		std::string Name() const {return hist.GetName();}
		void SetName(std::string const& newName);

		//! @brief The binning, read back from the TH1D's axis
		BinSpecs Bins() const;
		size_t NumBins() const {return size_t(hist.GetNbinsX());}
		real_t ScaleFactor() const {return scaleFactor;}

		//! @brief The 1-based bin which \p x fills (after clipping)
		size_t FindBin(real_t const x) const;

		//! @throws std::invalid_argument if \p x is NaN
		void Fill(real_t const x, real_t const weight = real_t(1));

		//! @throws std::out_of_range unless 1 <= bin <= nbins
		real_t GetBinContent(size_t const bin) const;

		//! @throws std::out_of_range unless 1 <= bin <= nbins
		void SetBinContent(size_t const bin, real_t const value);

		//! @brief The bin contents, in bin order (bin 1 first)
		std::vector<real_t> Contents() const;

		//! @brief The sum of the bin contents (not weighted by width)
		real_t Integral() const {return hist.Integral();}

		//! @brief Add coefficient * that, bin by bin (TH1::Add); throws incompatible_binning
		void Add(Histogram const& that, real_t const coefficient = real_t(1));
		void Scale(real_t const factor);
};

////////////////////////////////////////////////////////////////////////

/*! @brief Builds, merges and patches histograms.
 *
 *  The histogram "engine" is where the statistical summary of an analysis happens:
 *  columns of a FeatureTable (or raw samples) become normalized Histogram's,
 *  per-worker histograms are merged with Sum, and empty bins
 *  (which make log-likelihood ratios undefined) can be filled.
 *
 *  Tunables are read from the INI section [Histogram].
*/
class HistogramEngine
{
	public:
		using real_t = PhenoTools::real_t;
		using HistogramMap = std::map<std::string, Histogram>;

		static constexpr char const* iniSection = "Histogram";

		//! @brief How FillHoles patches empty bins
		enum class FillMode {Constant, Linear};

		/*! @brief How Linear FillHoles treats empty bins outside the first/last non-empty bin.
		 *
		 *  Zero leaves them empty, Clamp copies the nearest non-empty bin.
		*/
		enum class BoundaryPolicy {Zero, Clamp};

		/*! @brief The HistogramEngine settings, read from a parsed INI file
		 *  from section "[Histogram]"
		 *
		 *  Each parameter is defined using <tt> Param<T>(key, default value) </tt>
		*/
		class Settings : public kdp::Settings_Base
		{
			public:
				Settings() {}

				//! @throws std::invalid_argument if a value is out of range
				Settings(QSettings const& parsedINI);

				~Settings() {}

				//! @brief The integral of histograms built from a FeatureTable
				Param<double> integral = Param<double>("integral", 1.);

				//! @brief The value FillMode::Constant writes into empty bins
				Param<double> holeFill = Param<double>("holeFill", 1e-3);

				//! @brief The relative tolerance when comparing bin edges
				Param<double> edgeTolerance = Param<double>("edgeTolerance", 1e-9);
		};

	private:
		Settings settings;

	public:
		HistogramEngine():settings() {}
		HistogramEngine(QSettings const& parsedINI):settings(parsedINI) {}

		Settings const& GetSettings() const {return settings;}

		/*! @brief Sturges' rule binning of \p samples: (floor(1 + log2(L)), min, max)
		 *
		 *  When all samples are equal, low == high (which Histogram rejects;
		 *  see MakeHistograms for how that is handled).
		 *
		 *  \throws std::invalid_argument if \p samples is empty or has a non-finite value
		*/
		static BinSpecs BinningFromSamples(std::vector<real_t> const& samples);

		/*! @brief Fill a histogram with \p samples, then scale it to \p integral.
		 *
		 *  A histogram with no content can't be normalized; it is returned empty
		 *  (with a warning).
		 *
		 *  \throws std::invalid_argument if a sample is NaN or \p bins is not valid
		*/
		static Histogram Build(std::string const& name, std::vector<real_t> const& samples,
			BinSpecs const& bins, real_t const integral = real_t(1));

		/*! @brief Sum histograms with identical binning (or the first minus all the others).
		 *
		 *  The result takes the first histogram's name and has a unit scale factor.
		 *
		 *  \throws std::invalid_argument if \p histograms is empty
		 *  \throws PhenoTools::incompatible_binning if any binning differs from the first
		 *  (nbins exactly, edges within Settings::edgeTolerance)
		*/
		Histogram Sum(std::vector<Histogram> const& histograms, bool const subtract = false) const;

		//! @brief The 1-based bins whose content is exactly zero
		static std::vector<size_t> FindEmptyBins(Histogram const& histogram);

		/*! @brief Patch the empty bins of \p histogram.
		 *
		 *  Constant: each empty bin gets Settings::holeFill.
		 *  Linear: each empty bin between two non-empty bins is linearly interpolated
		 *  (in bin index) between them; the empty bins before the first / after the last
		 *  non-empty bin follow \p boundary. A histogram with no content is unchanged.
		*/
		void FillHoles(Histogram& histogram, FillMode const mode,
			BoundaryPolicy const boundary = BoundaryPolicy::Zero) const;

		////////////////////////////////////////////////////////////////

		typedef std::vector<std::pair<std::string, BinSpecs>> BinDictionary;

		/*! @brief The default binning of the standard features, keyed by a label substring.
		 *
		 *  The order matters; MatchBins takes the first key found in the label.
		*/
		static BinDictionary const& DefaultBins();

		//! @brief The binning of the first DefaultBins key contained in \p label (nullptr if none)
		static BinSpecs const* MatchBins(std::string const& label);

		/*! @brief One histogram per column of \p table, each scaled to Settings::integral
		 *
		 *  Missing values (NaN) are skipped. The binning comes from DefaultBins,
		 *  falling back to Sturges' rule (widened by 0.5 on each side when all values are equal).
		 *  A column with no values is skipped (with a warning).
		*/
		HistogramMap MakeHistograms(FeatureTable const& table) const;

		//! @brief The names of histograms with at least one empty bin
		static std::vector<std::string> HistogramsWithHoles(HistogramMap const& histograms);
};

#endif
