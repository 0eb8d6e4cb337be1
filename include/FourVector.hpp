#ifndef FOUR_VECTOR
#define FOUR_VECTOR

// Copyright (C) 2018 by Keith Pedersen (Keith.David.Pedersen@gmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "PhenoTools.hpp"

/*! @file FourVector.hpp
 *  @brief Defines the relativistic four-momentum used by Particle
 *  @author Copyright (C) 2018 Keith Pedersen (Keith.David.Pedersen@gmail.com, https://wwww.hepguy.com)
*/

/*! @brief A four-momentum in collider coordinates.
 *
 *  The longitudinal direction (z) is parallel to the colliding beams.
 *  Internally the momentum is stored Cartesian (E, px, py, pz),
 *  but it can be built from (and read as) the hadron-collider
 *  coordinates (pT, eta, phi, m), which is what detector readers supply.
 *
 *  The Cartesian form is the "ground truth"; pT, eta, phi and m
 *  are recomputed on every access (never cached), so an operation
 *  on the underlying 4-vector can never leave them stale.
 *
 *  NaN inputs are not guarded; they simply propagate.
*/
class FourVector
{
	public:
		using real_t = PhenoTools::real_t;
		using vec3_t = PhenoTools::vec3_t;
		using vec4_t = PhenoTools::vec4_t;

		/*! @brief The pseudorapidity returned for a purely longitudinal momentum (pT = 0).
		 *
		 *  A large, finite value (rather than infinity),
		 *  so that differences of eta remain finite.
		*/
		static constexpr real_t etaMax_longitudinal = real_t(1e10);

	private:
		vec4_t p4; //!< @brief (x0 = E, x1 = px, x2 = py, x3 = pz)

		static real_t LongitudinalMomentum(real_t const pt, real_t const eta);

	public:
		//! @brief The null four-vector
		FourVector():p4(real_t(0), vec3_t(), kdp::Vec4from2::Energy) {}

		explicit FourVector(vec4_t const& p4_in):p4(p4_in) {}

		//! @brief Build from Cartesian momentum and energy
		static FourVector PxPyPzE(real_t const px, real_t const py, real_t const pz, real_t const energy);

		/*! @brief Build from hadron-collider coordinates and mass (energy from the mass shell)
		 *
		 *  When pT = 0 the direction along the beam is not encoded by (pT, eta),
		 *  so pz is unrecoverable and is set to zero (likewise for PtEtaPhiE).
		*/
		static FourVector PtEtaPhiM(real_t const pt, real_t const eta, real_t const phi, real_t const mass);

		//! @brief Build from hadron-collider coordinates and energy
		static FourVector PtEtaPhiE(real_t const pt, real_t const eta, real_t const phi, real_t const energy);

		vec4_t const& p4_vec() const {return p4;}
		vec3_t p3() const {return p4.p();}

		real_t Px() const {return p4.x1;}
		real_t Py() const {return p4.x2;}
		real_t Pz() const {return p4.x3;}
		real_t E() const {return p4.x0;}

		real_t Pt() const; //!< @brief Transverse momentum
		real_t P() const; //!< @brief Magnitude of the 3-momentum

		/*! @brief Longitudinal momentum, sign(pz) * sqrt((p - pT)(p + pT))
		 *
		 *  Factoring the difference of squares keeps precision when pT ~= p.
		 *  A transverse vector has Pl() = 0 (never NaN).
		*/
		real_t Pl() const;

		/*! @brief The pseudorapidity asinh(pz / pT)
		 *
		 *  Returns \ref etaMax_longitudinal (with the sign of pz) when pT = 0,
		 *  or zero for the null vector.
		*/
		real_t Eta() const;

		real_t Phi() const; //!< @brief The azimuthal angle in (-pi, pi]

		/*! @brief The invariant mass sqrt((E - p)(E + p))
		 *
		 *  Rounding error can make a light-like vector slightly space-like;
		 *  such a vector is reported massless (never NaN).
		*/
		real_t M() const;

		FourVector& operator+=(FourVector const& that);
		FourVector operator+(FourVector const& that) const;
};

////////////////////////////////////////////////////////////////////////
// Binary metrics between two four-vectors
////////////////////////////////////////////////////////////////////////

//! @brief sqrt(DeltaEta**2 + DeltaPhi**2) (symmetric)
FourVector::real_t DeltaR(FourVector const& a, FourVector const& b);

//! @brief eta_a - eta_b (anti-symmetric)
FourVector::real_t DeltaEta(FourVector const& a, FourVector const& b);

//! @brief phi_a - phi_b, wrapped into (-pi, pi]
FourVector::real_t DeltaPhi(FourVector const& a, FourVector const& b);

//! @brief pT_a - pT_b
FourVector::real_t DeltaPtScalar(FourVector const& a, FourVector const& b);

//! @brief |pT_a - pT_b| using the transverse momentum vectors (symmetric)
FourVector::real_t DeltaPtVector(FourVector const& a, FourVector const& b);

//! @brief |p_a - p_b| using the full 3-momentum vectors (symmetric)
FourVector::real_t DeltaPVector(FourVector const& a, FourVector const& b);

#endif
