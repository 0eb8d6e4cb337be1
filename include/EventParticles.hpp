#ifndef EVENT_PARTICLES
#define EVENT_PARTICLES

// Copyright (C) 2018 by Keith Pedersen (Keith.David.Pedersen@gmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "PhenoTools.hpp"
#include "Particle.hpp"

#include "Pythia8/Pythia.h"
#include "Pythia8/Event.h"

/*! @file EventParticles.hpp
 *  @brief Converts a Pythia8 event record into categorized Particle's
 *  @author Copyright (C) 2018 Keith Pedersen (Keith.David.Pedersen@gmail.com, https://wwww.hepguy.com)
*/

/*! @brief Reads the particles of an in-memory event record.
 *
 *  The record is anything indexable by int which yields Pythia8::Particle
 *  (a Pythia8::Event, or a std::vector<Pythia8::Particle>).
 *  Each selected particle is categorized by its PDG ID.
 *  Neutrinos are not kept individually; their transverse momenta
 *  are vector-summed into a single Category::MissingET particle.
 *
 *  Each category is sorted by pT and named <prefix>_{i} (leading first),
 *  except MissingET, which is simply "MET".
*/
class EventParticles
{
	public:
		using real_t = PhenoTools::real_t;

		/*! @brief Which particles of the record to read.
		 *
		 *  FinalState: Pythia8::Particle::isFinal().
		 *  HardProcess: the outgoing particles of the hardest process (|status| == 23).
		*/
		enum class Selection {FinalState, HardProcess};

		//! @brief The category of a PDG ID (neutrinos map to MissingET)
		static Category CategoryOf(int const pdgID);

		//! @brief The charge of quarks and charged leptons (everything else is neutral)
		static real_t ChargeOf(int const pdgID);

		static bool IsNeutrino(int const pdgID);

		static bool Selected(Pythia8::Particle const& particle, Selection const selection);

		//! @brief Convert one particle (setting Attribute::PdgID); the name is its PDG ID
		static Particle Convert(Pythia8::Particle const& particle);

		//! @brief Sort each category by pT and name its particles <prefix>_{i}
		static void SortAndName(ParticleMap& particles);

		template<class record_t>
		static ParticleMap FromRecord(record_t const& record, Selection const selection)
		{
			ParticleMap particles;
			std::vector<std::pair<real_t, real_t>> missing;

			// Use a *signed* int as an index, because Pythia does
			for(int i = 0; i < int(record.size()); ++i)
			{
				Pythia8::Particle const& particle = record[i];

				if(not Selected(particle, selection))
					continue;

				if(IsNeutrino(particle.id()))
				{
					missing.emplace_back(particle.pT(), particle.phi());
				}
				else
				{
					Particle converted = Convert(particle);
					particles[converted.GetCategory()].push_back(std::move(converted));
				}
			}

			if(missing.size())
				particles[Category::MissingET].push_back(Particle::MissingET(missing));

			SortAndName(particles);
			return particles;
		}

		//! @brief Read the current event of a Pythia instance
		static ParticleMap FromPythia(Pythia8::Pythia const& pythia, Selection const selection)
		{
			return FromRecord(pythia.event, selection);
		}
};

#endif
