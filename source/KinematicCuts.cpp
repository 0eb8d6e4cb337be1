// Copyright (C) 2018 by Keith Pedersen (Keith.David.Pedersen@gmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "KinematicCuts.hpp"
#include <cmath>
#include <iostream>

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariant>

////////////////////////////////////////////////////////////////////////
// Window
////////////////////////////////////////////////////////////////////////

Window::Window(real_t const min_in, real_t const max_in):
min(min_in), max(max_in), set(true)
{
	if(std::isnan(min) or std::isnan(max) or (max <= min))
		throw std::invalid_argument("Window: empty window [" + std::to_string(min)
			+ ", " + std::to_string(max) + "]");
}

////////////////////////////////////////////////////////////////////////
// KinematicCut
////////////////////////////////////////////////////////////////////////

KinematicCut::KinematicCut(real_t const pt_min_in, real_t const pt_max_in,
	real_t const eta_min_in, real_t const eta_max_in):
pt_min(pt_min_in), pt_max(pt_max_in),
eta_min(eta_min_in), eta_max(eta_max_in),
isolation()
{
	// NaN fails both comparisons
	if(not(pt_max > pt_min))
		throw std::invalid_argument("KinematicCut: pt_max (" + std::to_string(pt_max)
			+ ") must exceed pt_min (" + std::to_string(pt_min) + ")");

	if(not(eta_max > eta_min))
		throw std::invalid_argument("KinematicCut: eta_max (" + std::to_string(eta_max)
			+ ") must exceed eta_min (" + std::to_string(eta_min) + ")");
}

////////////////////////////////////////////////////////////////////////

void KinematicCut::SetIsolation(real_t const iso_min, real_t const iso_max)
{
	isolation = Window(iso_min, iso_max);
}

////////////////////////////////////////////////////////////////////////
// KinematicCuts
////////////////////////////////////////////////////////////////////////

KinematicCut const& KinematicCuts::Get(Category const category) const
{
	auto const it = cuts.find(category);

	if(it == cuts.end())
		throw PhenoTools::missing_configuration("KinematicCuts: no cut configured for category ("
			+ CategoryKey(category) + ")");
	return it->second;
}

////////////////////////////////////////////////////////////////////////

KinematicCuts KinematicCuts::Default()
{
	KinematicCuts defaults;

	KinematicCut const lepton(10., std::numeric_limits<real_t>::infinity(), -2.5, 2.5);
	KinematicCut const jet(20., std::numeric_limits<real_t>::infinity(), -5., 5.);

	for(Category const category : {Category::Electron, Category::Muon,
		Category::Lepton, Category::Photon})
		defaults.Set(category, lepton);

	for(Category const category : {Category::LightJet, Category::BJet,
		Category::TauJet, Category::OtherJet})
		defaults.Set(category, jet);

	return defaults;
}

////////////////////////////////////////////////////////////////////////

namespace
{
	// Read group/key as a real_t, or return the default when the key is absent
	PhenoTools::real_t ReadBound(QSettings const& parsedINI, QString const& group,
		char const* const key, PhenoTools::real_t const defaultValue)
	{
		QString const fullKey = group + "/" + key;

		if(not parsedINI.contains(fullKey))
			return defaultValue;

		QString const text = parsedINI.value(fullKey).toString().trimmed();
		bool ok = false;
		PhenoTools::real_t const value = text.toDouble(&ok);

		if(not ok)
			throw std::invalid_argument("KinematicCuts::FromINI: ["
				+ group.toStdString() + "] " + key + " is not a number ("
				+ text.toStdString() + ")");
		return value;
	}
}

KinematicCuts KinematicCuts::FromINI(QSettings const& parsedINI)
{
	using limits = std::numeric_limits<real_t>;

	KinematicCuts fromFile;

	for(QString const& group : parsedINI.childGroups())
	{
		Category category;

		try
		{
			category = ParseCategory(group.toStdString());
		}
		catch(std::invalid_argument const&)
		{
			std::cerr << "KinematicCuts::FromINI: skipping unknown section ["
				<< group.toStdString() << "]" << std::endl;
			continue;
		}

		KinematicCut cut(
			ReadBound(parsedINI, group, "pt_min", real_t(0)),
			ReadBound(parsedINI, group, "pt_max", limits::infinity()),
			ReadBound(parsedINI, group, "eta_min", -limits::infinity()),
			ReadBound(parsedINI, group, "eta_max", limits::infinity()));

		if(parsedINI.contains(group + "/isolation_min")
			or parsedINI.contains(group + "/isolation_max"))
		{
			cut.SetIsolation(
				ReadBound(parsedINI, group, "isolation_min", -limits::infinity()),
				ReadBound(parsedINI, group, "isolation_max", limits::infinity()));
		}

		fromFile.Set(category, cut);
	}

	return fromFile;
}
