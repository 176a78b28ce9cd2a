/* FILE: doubledouble.h
 * Header file for Qd_Double class
 *
 *  A Qd_Double is an unevaluated sum of two doubles, hi + lo, with
 *  |lo| <= ulp(hi)/2.  This yields roughly 31 significant decimal
 *  digits using only native floating-point hardware.
 *
 *  Algorithms based on TJ Dekker, "A floating-point technique for
 *  extending the available precision," Numer. Math. 18, 224-242 (1971),
 *  and Y Hida, XS Li, DH Bailey, "Algorithms for quad-double precision
 *  floating point arithmetic," Proc. 15th IEEE Symposium on Computer
 *  Arithmetic, 155-162 (2001).
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 * NOTE: Code external to this package should NOT #include
 * this file directly.  Instead, use
 *     #include "qd.h"
 */

#ifndef _QD_DOUBLEDOUBLE
#define _QD_DOUBLEDOUBLE

#include <cstdint>

#include <iostream>
#include <string>

#include "qdcommon.h"

/* End includes */

#define QD_DOUBLEDOUBLE_PRECISION (2*QD_DOUBLE_MANTISSA_PRECISION+1)

////////////////////////////////////////////////////////////////////////
// Special values follow IEEE-754 semantics carried on the high limb:
// NaN is any value with a NaN limb, +/-Inf and +/-0 are (hi,0).  No
// arithmetic operation throws; edge cases produce these sentinels.

class Qd_Double {
 public:
  // Self check of the constant tables and transcendental functions.
  // Return value is 0 on success.
  static int QuickTest();

  // Number of decimal digits carried
  static const int DIGITS = 31;

  // Reference values
  static const Qd_Double ZERO;
  static const Qd_Double NEG_ZERO;
  static const Qd_Double ONE;
  static const Qd_Double QNAN;
  static const Qd_Double POS_INF;
  static const Qd_Double NEG_INF;
  static const Qd_Double EPSILON;     // 2^-104
  static const Qd_Double PI;
  static const Qd_Double TWO_PI;
  static const Qd_Double HALF_PI;
  static const Qd_Double QUARTER_PI;
  static const Qd_Double THREE_QUARTER_PI;
  static const Qd_Double E;
  static const Qd_Double LN2;
  static const Qd_Double LN10;
  static const Qd_Double SQRT2;
  static const Qd_Double INV_SQRT2;   // 1/sqrt(2)

  // Public constructors
  Qd_Double() : a0(0.0), a1(0.0) {}
  Qd_Double(double x) : a0(x), a1(0.0) {}
  Qd_Double(double xhi,double xlo);
  // Note: The (double,double) constructor normalizes.  Members that
  // already hold a normalized pair use FromLimbs() instead.

  // Integer constructors.  32-bit values are exact; 64-bit values are
  // exact too, since they fit in 106 bits.
  Qd_Double(int32_t ix) : a0(static_cast<double>(ix)), a1(0.0) {}
  Qd_Double(uint32_t ix) : a0(static_cast<double>(ix)), a1(0.0) {}
  Qd_Double(int64_t ix);
  Qd_Double(uint64_t ix);

  // Exact pair constructors, built on the error-free transforms.
  static Qd_Double FromLimbs(double hi,double lo); // No normalization
  static Qd_Double FromSum(double x,double y);     // x + y
  static Qd_Double FromDiff(double x,double y);    // x - y
  static Qd_Double FromProd(double x,double y);    // x * y
  static Qd_Double FromSquare(double x);           // x * x
  static Qd_Double FromQuot(double x,double y);    // x / y, correctly
                                                   // rounded to 2 limbs

  // Use default destructor, copy constructor, copy-assignment operator

  static int GetMantissaWidth() { return QD_DOUBLEDOUBLE_PRECISION; }

  double Hi() const { return a0; }
  double Lo() const { return a1; }

  // NB: No double cast operator, as that makes operations with mixed
  // types ambiguous.  Use DownConvert() or Hi().
  double DownConvert() const { return a0 + a1; }

  // Size of unit-in-the-last-place, relative to the lead bit of Hi().
  double ULP() const;

  // Difference from ref in units of refulp.  Returns absolute
  // difference if refulp is zero.
  double ComputeDiffULP(const Qd_Double& ref,double refulp) const;

  // Member operator functions
  Qd_Double& operator+=(const Qd_Double& x) {
    *this = *this + x;
    return *this;
  }
  Qd_Double& operator-=(const Qd_Double& x) {
    *this = *this - x;
    return *this;
  }
  Qd_Double& operator*=(const Qd_Double& x) {
    *this = *this * x;
    return *this;
  }
  Qd_Double& operator*=(double x) {
    *this = *this * x;
    return *this;
  }
  Qd_Double& operator/=(const Qd_Double& x) {
    *this = *this / x;
    return *this;
  }
  Qd_Double& operator/=(double x) {
    *this = *this / x;
    return *this;
  }

  // Value queries
  bool IsNaN() const;
  bool IsInfinite() const;
  bool IsFinite() const;
  bool IsZero() const { return (a0 == 0.0); }
  bool IsSignNegative() const { return Qd_SignBit(a0); }
  bool IsSignPositive() const { return !Qd_SignBit(a0); }
  bool IsPos() const { return (a0 > 0.0); }
  bool IsNeg() const { return (a0 < 0.0); }
  bool IsNormalized() const;

  // Comparisons.  Any comparison involving NaN is false, except !=.
  friend bool operator==(const Qd_Double& x,const Qd_Double& y);
  friend bool operator!=(const Qd_Double& x,const Qd_Double& y);
  friend bool operator<(const Qd_Double& x,const Qd_Double& y);
  friend bool operator<=(const Qd_Double& x,const Qd_Double& y);
  friend bool operator>(const Qd_Double& x,const Qd_Double& y);
  friend bool operator>=(const Qd_Double& x,const Qd_Double& y);

  // Friend operator functions
  friend Qd_Double operator-(const Qd_Double& x); // unary -
  friend Qd_Double operator+(const Qd_Double& x,const Qd_Double& y);
  friend Qd_Double operator+(const Qd_Double& x,double y);
  friend Qd_Double operator+(double x,const Qd_Double& y);
  friend Qd_Double operator-(const Qd_Double& x,const Qd_Double& y);
  friend Qd_Double operator-(const Qd_Double& x,double y);
  friend Qd_Double operator-(double x,const Qd_Double& y);
  friend Qd_Double operator*(const Qd_Double& x,const Qd_Double& y);
  friend Qd_Double operator*(const Qd_Double& x,double y);
  friend Qd_Double operator*(double x,const Qd_Double& y);
  friend Qd_Double operator/(const Qd_Double& x,const Qd_Double& y);
  friend Qd_Double operator/(const Qd_Double& x,double y);
  friend Qd_Double operator/(double x,const Qd_Double& y);

  // Algebraic functions
  friend Qd_Double sqr(const Qd_Double& x);    // x*x
  friend Qd_Double recip(const Qd_Double& x);  // 1/x
  friend Qd_Double sqrt(const Qd_Double& x);
  friend Qd_Double cbrt(const Qd_Double& x);
  friend Qd_Double nroot(const Qd_Double& x,int n);
  friend Qd_Double powi(const Qd_Double& x,int n);
  friend Qd_Double pow(const Qd_Double& x,const Qd_Double& y);
  friend Qd_Double fabs(const Qd_Double& x);
  friend Qd_Double ldexp(const Qd_Double& x,int m);
  friend Qd_Double floor(const Qd_Double& x);
  friend Qd_Double ceil(const Qd_Double& x);
  friend bool signbit(const Qd_Double& x); // True if x<=-0.0

  // Transcendental functions
  friend Qd_Double exp(const Qd_Double& x);
  friend Qd_Double log(const Qd_Double& x);   // Natural log
  friend Qd_Double log10(const Qd_Double& x);
  friend Qd_Double log2(const Qd_Double& x);
  friend Qd_Double log(const Qd_Double& x,const Qd_Double& base);
  friend void sincos(const Qd_Double& x,Qd_Double& sinx,Qd_Double& cosx);
  friend Qd_Double atan2(const Qd_Double& y,const Qd_Double& x);
  friend Qd_Double atan(const Qd_Double& x);

 private:
  double a0,a1;  // a0 is high word, a1 is low word

  // Replaces a non-finite lead limb's partner with 0, so overflow
  // yields (+/-Inf,0) rather than (Inf,NaN).
  static Qd_Double Finish(double hi,double lo);

  // Taylor series on |x| <= pi/32
  static void SinCosTaylor(const Qd_Double& x,
                           Qd_Double& sinx,Qd_Double& cosx);

  // Tables.  Raw doubles so they are ready before any static
  // constructor runs.
  static const double inv_fact[15][2];   // 1/3!, 1/4!, ..., 1/17!
  static const double sin_table[4][2];   // sin(k*pi/16), k=1,...,4
  static const double cos_table[4][2];   // cos(k*pi/16), k=1,...,4
  static const double pi16[2];           // pi/16
};

std::ostream& operator<<(std::ostream& os,const Qd_Double& x);

// Limbs in hexbin notation, "[hi,lo]".
std::string Qd_DebugString(const Qd_Double& x);

inline Qd_Double sin(const Qd_Double& x) {
  Qd_Double sinx,cosx;
  sincos(x,sinx,cosx);
  return sinx;
}

inline Qd_Double cos(const Qd_Double& x) {
  Qd_Double sinx,cosx;
  sincos(x,sinx,cosx);
  return cosx;
}

inline Qd_Double tan(const Qd_Double& x) {
  Qd_Double sinx,cosx;
  sincos(x,sinx,cosx);
  return sinx/cosx;
}

#endif // _QD_DOUBLEDOUBLE
