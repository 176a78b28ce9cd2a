/* FILE: quaddouble.h
 * Header file for Qd_Quad class
 *
 *  A Qd_Quad is an unevaluated sum of four doubles a[0] + ... + a[3],
 *  nonoverlapping and decreasing in magnitude, giving roughly 62
 *  significant decimal digits.
 *
 *  Algorithms based on Y Hida, XS Li, DH Bailey, "Algorithms for
 *  quad-double precision floating point arithmetic," Proc. 15th IEEE
 *  Symposium on Computer Arithmetic, 155-162 (2001).
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 * NOTE: Code external to this package should NOT #include
 * this file directly.  Instead, use
 *     #include "qd.h"
 */

#ifndef _QD_QUADDOUBLE
#define _QD_QUADDOUBLE

#include <cstdint>

#include <iostream>
#include <string>

#include "qdcommon.h"
#include "doubledouble.h"

/* End includes */

#define QD_QUADDOUBLE_PRECISION (4*QD_DOUBLE_MANTISSA_PRECISION+3)

////////////////////////////////////////////////////////////////////////
// Special values follow the Qd_Double conventions: NaN in a leading
// limb is NaN, +/-Inf and +/-0 are (x,0,0,0).

class Qd_Quad {
 public:
  // Self check; return value is 0 on success.
  static int QuickTest();

  static const int DIGITS = 62;

  static const Qd_Quad ZERO;
  static const Qd_Quad NEG_ZERO;
  static const Qd_Quad ONE;
  static const Qd_Quad QNAN;
  static const Qd_Quad POS_INF;
  static const Qd_Quad NEG_INF;
  static const Qd_Quad EPSILON;     // 2^-209
  static const Qd_Quad PI;
  static const Qd_Quad TWO_PI;
  static const Qd_Quad HALF_PI;
  static const Qd_Quad QUARTER_PI;
  static const Qd_Quad THREE_QUARTER_PI;
  static const Qd_Quad E;
  static const Qd_Quad LN2;
  static const Qd_Quad LN10;
  static const Qd_Quad SQRT2;
  static const Qd_Quad INV_SQRT2;

  Qd_Quad() { a[0] = a[1] = a[2] = a[3] = 0.0; }
  Qd_Quad(double x) { a[0] = x; a[1] = a[2] = a[3] = 0.0; }
  Qd_Quad(const Qd_Double& x) {
    a[0] = x.Hi();  a[1] = x.Lo();  a[2] = a[3] = 0.0;
  }
  Qd_Quad(double x0,double x1,double x2,double x3); // Renormalizes

  Qd_Quad(int32_t ix) {
    a[0] = static_cast<double>(ix);  a[1] = a[2] = a[3] = 0.0;
  }
  Qd_Quad(uint32_t ix) {
    a[0] = static_cast<double>(ix);  a[1] = a[2] = a[3] = 0.0;
  }
  Qd_Quad(int64_t ix);
  Qd_Quad(uint64_t ix);

  // Limbs must already be renormalized.
  static Qd_Quad FromLimbs(double x0,double x1,double x2,double x3);

  static int GetMantissaWidth() { return QD_QUADDOUBLE_PRECISION; }

  // Limb access, leading limb first
  double operator[](int i) const { return a[i]; }
  double Hi() const { return a[0]; }

  double DownConvert() const { return a[0] + a[1]; }
  Qd_Double ToDouble() const; // Rounds to two limbs

  double ULP() const;
  double ComputeDiffULP(const Qd_Quad& ref,double refulp) const;

  Qd_Quad& operator+=(const Qd_Quad& x) {
    *this = *this + x;
    return *this;
  }
  Qd_Quad& operator+=(double x) {
    *this = *this + x;
    return *this;
  }
  Qd_Quad& operator-=(const Qd_Quad& x) {
    *this = *this - x;
    return *this;
  }
  Qd_Quad& operator-=(double x) {
    *this = *this - x;
    return *this;
  }
  Qd_Quad& operator*=(const Qd_Quad& x) {
    *this = *this * x;
    return *this;
  }
  Qd_Quad& operator*=(double x) {
    *this = *this * x;
    return *this;
  }
  Qd_Quad& operator/=(const Qd_Quad& x) {
    *this = *this / x;
    return *this;
  }
  Qd_Quad& operator/=(double x) {
    *this = *this / x;
    return *this;
  }

  bool IsNaN() const;
  bool IsInfinite() const;
  bool IsFinite() const;
  bool IsZero() const { return (a[0] == 0.0); }
  bool IsSignNegative() const { return Qd_SignBit(a[0]); }
  bool IsSignPositive() const { return !Qd_SignBit(a[0]); }
  bool IsPos() const { return (a[0] > 0.0); }
  bool IsNeg() const { return (a[0] < 0.0); }
  bool IsNormalized() const;

  friend bool operator==(const Qd_Quad& x,const Qd_Quad& y);
  friend bool operator!=(const Qd_Quad& x,const Qd_Quad& y);
  friend bool operator<(const Qd_Quad& x,const Qd_Quad& y);
  friend bool operator<=(const Qd_Quad& x,const Qd_Quad& y);
  friend bool operator>(const Qd_Quad& x,const Qd_Quad& y);
  friend bool operator>=(const Qd_Quad& x,const Qd_Quad& y);

  friend Qd_Quad operator-(const Qd_Quad& x);
  friend Qd_Quad operator+(const Qd_Quad& x,const Qd_Quad& y);
  friend Qd_Quad operator+(const Qd_Quad& x,double y);
  friend Qd_Quad operator+(double x,const Qd_Quad& y);
  friend Qd_Quad operator-(const Qd_Quad& x,const Qd_Quad& y);
  friend Qd_Quad operator-(const Qd_Quad& x,double y);
  friend Qd_Quad operator-(double x,const Qd_Quad& y);
  friend Qd_Quad operator*(const Qd_Quad& x,const Qd_Quad& y);
  friend Qd_Quad operator*(const Qd_Quad& x,double y);
  friend Qd_Quad operator*(double x,const Qd_Quad& y);
  friend Qd_Quad operator/(const Qd_Quad& x,const Qd_Quad& y);
  friend Qd_Quad operator/(const Qd_Quad& x,double y);
  friend Qd_Quad operator/(double x,const Qd_Quad& y);

  friend Qd_Quad sqr(const Qd_Quad& x);
  friend Qd_Quad recip(const Qd_Quad& x);
  friend Qd_Quad sqrt(const Qd_Quad& x);
  friend Qd_Quad cbrt(const Qd_Quad& x);
  friend Qd_Quad nroot(const Qd_Quad& x,int n);
  friend Qd_Quad powi(const Qd_Quad& x,int n);
  friend Qd_Quad pow(const Qd_Quad& x,const Qd_Quad& y);
  friend Qd_Quad fabs(const Qd_Quad& x);
  friend Qd_Quad ldexp(const Qd_Quad& x,int m);
  friend Qd_Quad floor(const Qd_Quad& x);
  friend Qd_Quad ceil(const Qd_Quad& x);
  friend bool signbit(const Qd_Quad& x);

  friend Qd_Quad exp(const Qd_Quad& x);
  friend Qd_Quad log(const Qd_Quad& x);
  friend Qd_Quad log10(const Qd_Quad& x);
  friend Qd_Quad log2(const Qd_Quad& x);
  friend Qd_Quad log(const Qd_Quad& x,const Qd_Quad& base);
  friend void sincos(const Qd_Quad& x,Qd_Quad& sinx,Qd_Quad& cosx);
  friend Qd_Quad atan2(const Qd_Quad& y,const Qd_Quad& x);
  friend Qd_Quad atan(const Qd_Quad& x);

 private:
  double a[4];

  static Qd_Quad Finish(double x0,double x1,double x2,double x3);
  static Qd_Quad TableEntry(const double* limbs) {
    return FromLimbs(limbs[0],limbs[1],limbs[2],limbs[3]);
  }

  static void SinCosTaylor(const Qd_Quad& x,Qd_Quad& sinx,Qd_Quad& cosx);

  static const double inv_fact[30][4];   // 1/3!, 1/4!, ..., 1/32!
  static const double sin_table[4][4];   // sin(k*pi/16), k=1,...,4
  static const double cos_table[4][4];   // cos(k*pi/16), k=1,...,4
  static const double pi16[4];
};

std::ostream& operator<<(std::ostream& os,const Qd_Quad& x);

// Limbs in hexbin notation, "[a0,a1,a2,a3]".
std::string Qd_DebugString(const Qd_Quad& x);

inline Qd_Quad sin(const Qd_Quad& x) {
  Qd_Quad sinx,cosx;
  sincos(x,sinx,cosx);
  return sinx;
}

inline Qd_Quad cos(const Qd_Quad& x) {
  Qd_Quad sinx,cosx;
  sincos(x,sinx,cosx);
  return cosx;
}

inline Qd_Quad tan(const Qd_Quad& x) {
  Qd_Quad sinx,cosx;
  sincos(x,sinx,cosx);
  return sinx/cosx;
}

#endif // _QD_QUADDOUBLE
