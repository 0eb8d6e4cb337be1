// Copyright (C) 2018 by Keith Pedersen (Keith.David.Pedersen@gmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "FeatureRow.hpp"
#include <limits>

////////////////////////////////////////////////////////////////////////
// FeatureRow
////////////////////////////////////////////////////////////////////////

std::vector<std::string> FeatureRow::Labels() const
{
	std::vector<std::string> labels;
	labels.reserve(entries.size());

	for(entry_t const& entry : entries)
		labels.push_back(entry.first);

	return labels;
}

////////////////////////////////////////////////////////////////////////

bool FeatureRow::Has(std::string const& label) const
{
	for(entry_t const& entry : entries)
	{
		if(entry.first == label)
			return true;
	}
	return false;
}

////////////////////////////////////////////////////////////////////////

FeatureRow::real_t FeatureRow::Get(std::string const& label) const
{
	for(entry_t const& entry : entries)
	{
		if(entry.first == label)
			return entry.second;
	}
	throw std::out_of_range("FeatureRow::Get: no feature labeled (" + label + ")");
}

////////////////////////////////////////////////////////////////////////
// FeatureRowBuilder
////////////////////////////////////////////////////////////////////////

constexpr size_t FeatureRowBuilder::featuresPerParticle;
constexpr size_t FeatureRowBuilder::featuresPerPair;

size_t FeatureRowBuilder::NumFeatures(size_t const nParticles)
{
	return featuresPerParticle * nParticles
		+ featuresPerPair * ((nParticles * (nParticles - 1)) / 2);
}

////////////////////////////////////////////////////////////////////////

FeatureRow FeatureRowBuilder::Build(ParticleVec const& particles)
{
	if(particles.empty())
		throw std::invalid_argument("FeatureRowBuilder::Build: no particles");

	FeatureRow row;

	for(auto i = particles.cbegin(); i not_eq particles.cend(); ++i)
	{
		std::string const n = "_{" + i->Name() + "}";

		row.Add("pT" + n + "(GeV)", i->Pt());
		row.Add("#eta" + n, i->Eta());
		row.Add("#phi" + n, i->Phi());
		row.Add("Energy" + n + "(GeV)", i->E());
		row.Add("Mass" + n + "(GeV)", i->M());

		for(auto j = i + 1; j not_eq particles.cend(); ++j)
		{
			std::string const ab = "_{" + i->Name() + j->Name() + "}";

			row.Add("#Delta{R}" + ab, i->DeltaR(*j));
			row.Add("#Delta{#eta}" + ab, i->DeltaEta(*j));
			row.Add("#Delta{#phi}" + ab, i->DeltaPhi(*j));
			row.Add("#Delta{pT}" + ab + "(GeV)", i->DeltaPtScalar(*j));
			row.Add("#Delta{#vec{pT}}" + ab + "(GeV)", i->DeltaPtVector(*j));
			row.Add("#Delta{#vec{p}}" + ab + "(GeV)", i->DeltaPVector(*j));
		}
	}

	return row;
}

////////////////////////////////////////////////////////////////////////
// FeatureTable
////////////////////////////////////////////////////////////////////////

void FeatureTable::AddColumns(FeatureRow const& row)
{
	for(auto const& entry : row)
	{
		if(columnIndex.count(entry.first) == 0)
		{
			columnIndex[entry.first] = columns.size();
			columns.push_back(entry.first);
		}
	}
}

////////////////////////////////////////////////////////////////////////

void FeatureTable::Append(FeatureRow const& row)
{
	AddColumns(row);

	rows.emplace_back();
	for(auto const& entry : row)
		rows.back()[entry.first] = entry.second;
}

////////////////////////////////////////////////////////////////////////

void FeatureTable::Concatenate(FeatureTable const& that)
{
	for(std::string const& label : that.columns)
	{
		if(columnIndex.count(label) == 0)
		{
			columnIndex[label] = columns.size();
			columns.push_back(label);
		}
	}

	// Copy first; that may be *this, and insert can't take a range of its own vector
	std::vector<std::map<std::string, real_t>> const incoming(that.rows);
	rows.insert(rows.end(), incoming.cbegin(), incoming.cend());
}

////////////////////////////////////////////////////////////////////////

std::vector<FeatureTable::real_t> FeatureTable::Column(std::string const& label) const
{
	if(not HasColumn(label))
		throw std::out_of_range("FeatureTable::Column: no column labeled (" + label + ")");

	std::vector<real_t> column;
	column.reserve(rows.size());

	for(auto const& row : rows)
	{
		auto const it = row.find(label);
		column.push_back((it == row.end()) ?
			std::numeric_limits<real_t>::quiet_NaN() : it->second);
	}

	return column;
}
