/* FILE: qdcommon.h
 *
 * Limb-level support shared by the Qd_Double and Qd_Quad classes:
 * special value checks, power-of-two scaling, and hexadecimal
 * character I/O of single limbs.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 */

#ifndef _QD_COMMON
#define _QD_COMMON

#include <cmath>
#include <string>

#include "qdport.h" // Constructed by build_port

/* End includes */

// NaN/Infinity/sign checks.  These are out-of-line on purpose: some
// optimizers fold x==0.0 followed by a sign test into a test on the
// constant 0.0, losing the sign of a negative zero.
bool Qd_IsFinite(double x);
bool Qd_IsPosInf(double x);
bool Qd_IsNegInf(double x);
bool Qd_IsNaN(double x);
bool Qd_IsZero(double x);
bool Qd_AreEqual(double x,double y); // False if either is NaN

bool Qd_SignBit(double x); // True for negative values, including -0.0

// Special value tables for multiplication and division.  NaN
// dominates, then infinity, then signed zero; signs combine by XOR.
//
//    a     b     a*b          a/b
//   ---   ---   ----------   ----------
//    0    Inf   NaN          signed 0
//    0     0    signed 0     NaN
//    0     x    signed 0     signed 0
//   Inf    0    NaN          signed Inf
//   Inf   Inf   signed Inf   NaN
//   Inf    x    signed Inf   signed Inf
//    x     0    signed 0     signed Inf
//    x    Inf   signed Inf   signed 0
//
// Here x is finite and nonzero.  If the result is special, stores the
// lead limb in result and returns true.  Otherwise returns false.
enum Qd_ValueClass { QD_CLASS_NAN, QD_CLASS_ZERO, QD_CLASS_INF,
                     QD_CLASS_FINITE };
bool Qd_SpecialProduct(Qd_ValueClass aclass,bool asign,
                       Qd_ValueClass bclass,bool bsign,double& result);
bool Qd_SpecialQuotient(Qd_ValueClass aclass,bool asign,
                        Qd_ValueClass bclass,bool bsign,double& result);

// Returns x * 2^m.  System ldexp is slow for small m and some
// implementations round subnormal results incorrectly; pow(2,m)
// overflows for |m| near the exponent range.  This version uses
// exponentiation by squaring, stopping short of overflow in base.
inline double
Qd_LdExp(double x,int m)
{
  if(m==0) return x;

  unsigned int n;
  double base;
  if(m>0) {
    n = m;
    if(n & 1) x *= 2.0;
    base = 2.0;
  } else {
    n = -1*m;
    if(n & 1) x *= 0.5;
    base = 0.5;
  }

  // Stop squaring before base^2 overflows.  Shift is
  // log_2(QD_DOUBLE_HUGE_EXP).
#if QD_DOUBLE_HUGE_EXP == 1024
  const unsigned int nstop = n >> 10;
#else
  const unsigned int nstop
    = n >> int(floor(log(double(QD_DOUBLE_HUGE_EXP))/log(2.0)));
#endif

  while( (n >>= 1u) > nstop) {
    base *= base;
    if(n & 1u) x *= base;
  }

  if(n>0u) {
    // base*base would overflow; finish with single multiplies
    x *= base;
    do {
      x *= base;
    } while( --n > 0u);
  }

  return x;
}

// Hexadecimal-binary ("hexbin") limb I/O.  Format is
//
//    s0xmmmmmmmmmmmmmmxbseee
//
// where the mantissa is an integer of QD_DOUBLE_MANTISSA_PRECISION bits
// in hex and eee is a power of two.  s is ' ' or '-'.  Non-finite values
// print as NaN, Inf, -Inf.  Hexbin output is exact and aligns
// column-wise in tables.
int Qd_HexBinaryFloatWidth();
std::string Qd_HexBinaryFloatFormat(double value);

// Reads a limb from any of
//   hexbin  (0x1Fxb-3), hexhex (1Fx-1), C99 hexfloat (0x1.fp+1),
//   Inf, -Inf, NaN, or decimal (strtod).
// Throws Qd_Exception on malformed hex input.
double Qd_ScanFloat(const char* cptr);

#endif /* _QD_COMMON */
