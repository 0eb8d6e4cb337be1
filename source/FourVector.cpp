// Copyright (C) 2018 by Keith Pedersen (Keith.David.Pedersen@gmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
// The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "FourVector.hpp"
#include "helperTools.hpp"
#include "kdp/kdpTools.hpp"
#include <cmath>

constexpr FourVector::real_t FourVector::etaMax_longitudinal;

////////////////////////////////////////////////////////////////////////
// FourVector
////////////////////////////////////////////////////////////////////////

FourVector FourVector::PxPyPzE(real_t const px, real_t const py, real_t const pz, real_t const energy)
{
	return FourVector(vec4_t(energy, vec3_t(px, py, pz), kdp::Vec4from2::Energy));
}

////////////////////////////////////////////////////////////////////////

FourVector::real_t FourVector::LongitudinalMomentum(real_t const pt, real_t const eta)
{
	// pz = pT sinh(eta) is exact at eta = 0 and keeps the sign of eta.
	// At pT = 0, sinh(etaMax_longitudinal) overflows and 0 * inf is NaN.
				GCC_IGNORE_PUSH(-Wfloat-equal)
	if(pt == real_t(0))
		return real_t(0);
				GCC_IGNORE_POP

	return pt * std::sinh(eta);
}

////////////////////////////////////////////////////////////////////////

FourVector FourVector::PtEtaPhiM(real_t const pt, real_t const eta, real_t const phi, real_t const mass)
{
	vec3_t const p3(pt * std::cos(phi), pt * std::sin(phi), LongitudinalMomentum(pt, eta));
	return FourVector(vec4_t(mass, p3, kdp::Vec4from2::Mass));
}

////////////////////////////////////////////////////////////////////////

FourVector FourVector::PtEtaPhiE(real_t const pt, real_t const eta, real_t const phi, real_t const energy)
{
	vec3_t const p3(pt * std::cos(phi), pt * std::sin(phi), LongitudinalMomentum(pt, eta));
	return FourVector(vec4_t(energy, p3, kdp::Vec4from2::Energy));
}

////////////////////////////////////////////////////////////////////////

FourVector::real_t FourVector::Pt() const
{
	return std::hypot(p4.x1, p4.x2);
}

////////////////////////////////////////////////////////////////////////

FourVector::real_t FourVector::P() const
{
	return p4.p().Mag();
}

////////////////////////////////////////////////////////////////////////

FourVector::real_t FourVector::Pl() const
{
	// P() and Pt() are computed differently, so for pz = 0 they can differ
	// by an ulp in the wrong direction
	real_t const pl2 = kdp::Diff2(P(), Pt());
	real_t const pl = (pl2 > real_t(0)) ? std::sqrt(pl2) : real_t(0);

	return std::copysign(pl, p4.x3);
}

////////////////////////////////////////////////////////////////////////

FourVector::real_t FourVector::Eta() const
{
	real_t const pt = Pt();
				GCC_IGNORE_PUSH(-Wfloat-equal)
	if(pt == real_t(0))
	{
		if(p4.x3 == real_t(0))
			return real_t(0);
		return std::copysign(etaMax_longitudinal, p4.x3);
	}
				GCC_IGNORE_POP

	return std::asinh(p4.x3 / pt);
}

////////////////////////////////////////////////////////////////////////

FourVector::real_t FourVector::Phi() const
{
	// atan2 returns [-pi, pi]; -pi only appears for py = -0. with px < 0
	return WrapPhi(std::atan2(p4.x2, p4.x1));
}

////////////////////////////////////////////////////////////////////////

FourVector::real_t FourVector::M() const
{
	real_t const mass2 = kdp::Diff2(p4.x0, P());

	return (mass2 > real_t(0)) ? std::sqrt(mass2) : real_t(0);
}

////////////////////////////////////////////////////////////////////////

FourVector& FourVector::operator+=(FourVector const& that)
{
	p4.x0 += that.p4.x0;
	p4.x1 += that.p4.x1;
	p4.x2 += that.p4.x2;
	p4.x3 += that.p4.x3;
	return *this;
}

////////////////////////////////////////////////////////////////////////

FourVector FourVector::operator+(FourVector const& that) const
{
	FourVector sum(*this);
	sum += that;
	return sum;
}

////////////////////////////////////////////////////////////////////////
// Binary metrics
////////////////////////////////////////////////////////////////////////

FourVector::real_t DeltaR(FourVector const& a, FourVector const& b)
{
	return std::sqrt(kdp::Squared(DeltaEta(a, b)) + kdp::Squared(DeltaPhi(a, b)));
}

////////////////////////////////////////////////////////////////////////

FourVector::real_t DeltaEta(FourVector const& a, FourVector const& b)
{
	return a.Eta() - b.Eta();
}

////////////////////////////////////////////////////////////////////////

FourVector::real_t DeltaPhi(FourVector const& a, FourVector const& b)
{
	return WrapPhi(a.Phi() - b.Phi());
}

////////////////////////////////////////////////////////////////////////

FourVector::real_t DeltaPtScalar(FourVector const& a, FourVector const& b)
{
	return a.Pt() - b.Pt();
}

////////////////////////////////////////////////////////////////////////

FourVector::real_t DeltaPtVector(FourVector const& a, FourVector const& b)
{
	// Only the transverse part of the 3-vector difference
	return std::hypot(a.Px() - b.Px(), a.Py() - b.Py());
}

////////////////////////////////////////////////////////////////////////

FourVector::real_t DeltaPVector(FourVector const& a, FourVector const& b)
{
	return (a.p3() - b.p3()).Mag();
}
