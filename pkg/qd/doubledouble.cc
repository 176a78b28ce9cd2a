/* FILE: doubledouble.cc
 * Main source file for Qd_Double class
 *
 *  Algorithms based on TJ Dekker, "A floating-point technique for
 *  extending the available precision," Numer. Math. 18, 224-242 (1971),
 *  and Y Hida, XS Li, DH Bailey, "Algorithms for quad-double precision
 *  floating point arithmetic," Proc. 15th IEEE Symposium on Computer
 *  Arithmetic, 155-162 (2001).  The square root refinement is from
 *  AH Karp and P Markstein, "High-precision division and square root,"
 *  ACM TOMS 23, 561-589 (1997).
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 * ACCURACY ESTIMATES:
 *
 * For in-range inputs the algebraic operations (+, -, *, /, sqrt)
 * are accurate to about 2 ULP, where for result z with
 * 2^n <= |z| < 2^(n+1), 1 ULP = 2^(n-2*p) and p=53 is the double
 * precision.  exp and log are within a few ULP; atan2 and sincos
 * within about 4 ULP for arguments of modest size.
 */

// Every expression in the limb arithmetic must round exactly once.
// Contraction of a*b+c into an fma breaks the error-free transforms.
// (CMakeLists.txt also sets -ffp-contract=off, which covers the inline
// transforms in qdbasic.h.)
#if defined(__GNUC__) && !defined(__clang__) && !defined(__INTEL_COMPILER)
# pragma GCC optimize ("-ffp-contract=off")
#endif
#if defined(__INTEL_COMPILER) || defined(_MSC_VER)
# pragma fp_contract (off)
#endif

#include <cmath>
#include <cstdio>

#include <algorithm>
#include <string>

#include "doubledouble.h"
#include "qdbasic.h"
#include "qdexcept.h"
#include "qdmessages.h"

/* End includes */

// Pull in std:: math so double arguments resolve to the library
// versions, and Qd_Double arguments to the friends below.
using namespace std;

////////////////////////////////////////////////////////////////////////
// Tables

const double Qd_Double::inv_fact[15][2] = {
  { 1.6666666666666666e-01,  9.2518585385429707e-18 },  // 1/3!
  { 4.1666666666666664e-02,  2.3129646346357427e-18 },
  { 8.3333333333333332e-03,  1.1564823173178714e-19 },
  { 1.3888888888888889e-03, -5.3005439543735771e-20 },
  { 1.9841269841269841e-04,  1.7209558293420705e-22 },
  { 2.4801587301587302e-05,  2.1511947866775882e-23 },
  { 2.7557319223985893e-06, -1.8583932740464721e-22 },
  { 2.7557319223985888e-07,  2.3767714622250297e-23 },
  { 2.5052108385441720e-08, -1.4488140709359120e-24 },
  { 2.0876756987868100e-09, -1.2073450591132600e-25 },
  { 1.6059043836821613e-10,  1.2585294588752098e-26 },
  { 1.1470745597729725e-11,  2.0655512752830745e-28 },
  { 7.6471637318198164e-13,  7.0387287773345300e-30 },
  { 4.7794773323873853e-14,  4.3992054858340810e-31 },
  { 2.8114572543455206e-15,  1.6508842730861433e-31 }   // 1/17!
};

const double Qd_Double::sin_table[4][2] = {
  { 1.9509032201612828e-01, -7.9910790684617313e-18 },
  { 3.8268343236508978e-01, -1.0050772696461588e-17 },
  { 5.5557023301960218e-01,  4.7094109405616770e-17 },
  { 7.0710678118654757e-01, -4.8336466567264570e-17 }
};

const double Qd_Double::cos_table[4][2] = {
  { 9.8078528040323043e-01,  1.8546939997825006e-17 },
  { 9.2387953251128674e-01,  1.7645047084336677e-17 },
  { 8.3146961230254524e-01,  1.4073856984728024e-18 },
  { 7.0710678118654757e-01, -4.8336466567264570e-17 }
};

const double Qd_Double::pi16[2]
  = { 1.9634954084936207e-01, 7.6540424946709580e-18 };

////////////////////////////////////////////////////////////////////////
// Reference values

const Qd_Double Qd_Double::ZERO(0.0);
const Qd_Double Qd_Double::NEG_ZERO(Qd_Double::FromLimbs(-0.0,0.0));
const Qd_Double Qd_Double::ONE(1.0);
const Qd_Double Qd_Double::QNAN(Qd_Double::FromLimbs(QD_NAN,0.0));
const Qd_Double Qd_Double::POS_INF(Qd_Double::FromLimbs(QD_INFINITY,0.0));
const Qd_Double Qd_Double::NEG_INF(Qd_Double::FromLimbs(-QD_INFINITY,0.0));
const Qd_Double Qd_Double::EPSILON(QD_DD_EPS);
const Qd_Double Qd_Double::PI
  (Qd_Double::FromLimbs(3.1415926535897931e+00, 1.2246467991473532e-16));
const Qd_Double Qd_Double::TWO_PI
  (Qd_Double::FromLimbs(6.2831853071795862e+00, 2.4492935982947064e-16));
const Qd_Double Qd_Double::HALF_PI
  (Qd_Double::FromLimbs(1.5707963267948966e+00, 6.1232339957367660e-17));
const Qd_Double Qd_Double::QUARTER_PI
  (Qd_Double::FromLimbs(7.8539816339744828e-01, 3.0616169978683830e-17));
const Qd_Double Qd_Double::THREE_QUARTER_PI
  (Qd_Double::FromLimbs(2.3561944901923448e+00, 9.1848509936051484e-17));
const Qd_Double Qd_Double::E
  (Qd_Double::FromLimbs(2.7182818284590451e+00, 1.4456468917292502e-16));
const Qd_Double Qd_Double::LN2
  (Qd_Double::FromLimbs(6.9314718055994529e-01, 2.3190468138462996e-17));
const Qd_Double Qd_Double::LN10
  (Qd_Double::FromLimbs(2.3025850929940459e+00, -2.1707562233822494e-16));
const Qd_Double Qd_Double::SQRT2
  (Qd_Double::FromLimbs(1.4142135623730951e+00, -9.6672933134529135e-17));
const Qd_Double Qd_Double::INV_SQRT2
  (Qd_Double::FromLimbs(7.0710678118654757e-01, -4.8336466567264570e-17));

////////////////////////////////////////////////////////////////////////
// Constructors

Qd_Double::Qd_Double(double xhi,double xlo)
{
  Qd_TwoSum(xhi,xlo,a0,a1);
  if(!Qd_IsFinite(a0)) a1 = 0.0;
}

Qd_Double::Qd_Double(int64_t ix)
{ // Upper and lower 32 bits each convert to double exactly.
  const double hi = static_cast<double>(ix >> 32) * 4294967296.0;
  const double lo = static_cast<double>(ix & 0xFFFFFFFF);
  Qd_TwoSum(hi,lo,a0,a1);
}

Qd_Double::Qd_Double(uint64_t ix)
{
  const double hi = static_cast<double>(ix >> 32) * 4294967296.0;
  const double lo = static_cast<double>(ix & 0xFFFFFFFFu);
  Qd_TwoSum(hi,lo,a0,a1);
}

Qd_Double Qd_Double::FromLimbs(double hi,double lo)
{
  Qd_Double result;
  result.a0 = hi;
  result.a1 = lo;
  return result;
}

Qd_Double Qd_Double::Finish(double hi,double lo)
{
  if(!Qd_IsFinite(hi)) return FromLimbs(hi,0.0);
  return FromLimbs(hi,lo);
}

Qd_Double Qd_Double::FromSum(double x,double y)
{
  double u,v;
  Qd_TwoSum(x,y,u,v);
  return Finish(u,v);
}

Qd_Double Qd_Double::FromDiff(double x,double y)
{
  double u,v;
  Qd_TwoDiff(x,y,u,v);
  return Finish(u,v);
}

Qd_Double Qd_Double::FromProd(double x,double y)
{
  double u,v;
  Qd_TwoProd(x,y,u,v);
  return Finish(u,v);
}

Qd_Double Qd_Double::FromSquare(double x)
{
  double u,v;
  Qd_SquareProd(x,u,v);
  return Finish(u,v);
}

Qd_Double Qd_Double::FromQuot(double x,double y)
{
  double q1 = x/y;
  if(!Qd_IsFinite(q1) || !Qd_IsFinite(y) || y == 0.0) {
    return FromLimbs(q1,0.0);
  }
  // Remainder x - q1*y is exact as p + e
  double p,e;
  Qd_TwoProd(q1,y,p,e);
  double q2 = ((x - p) - e)/y;
  Qd_OrderedTwoSum(q1,q2,q1,q2);
  return FromLimbs(q1,q2);
}

////////////////////////////////////////////////////////////////////////
// Queries

bool Qd_Double::IsNaN() const
{
  return (Qd_IsNaN(a0) || Qd_IsNaN(a1));
}

bool Qd_Double::IsInfinite() const
{
  return (Qd_IsPosInf(a0) || Qd_IsNegInf(a0)
          || Qd_IsPosInf(a1) || Qd_IsNegInf(a1));
}

bool Qd_Double::IsFinite() const
{
  return (Qd_IsFinite(a0) && Qd_IsFinite(a1));
}

bool Qd_Double::IsNormalized() const
{
  if(!Qd_IsFinite(a0)) return (a1 == 0.0 || Qd_IsNaN(a0));
  double u,v;
  Qd_TwoSum(a0,a1,u,v);
  return (u == a0 && v == a1);
}

namespace {

Qd_ValueClass Classify(const Qd_Double& x)
{
  if(x.IsNaN()) return QD_CLASS_NAN;
  if(x.IsInfinite()) return QD_CLASS_INF;
  if(x.IsZero()) return QD_CLASS_ZERO;
  return QD_CLASS_FINITE;
}

Qd_ValueClass Classify(double x)
{
  if(Qd_IsNaN(x)) return QD_CLASS_NAN;
  if(!Qd_IsFinite(x)) return QD_CLASS_INF;
  if(x == 0.0) return QD_CLASS_ZERO;
  return QD_CLASS_FINITE;
}

} // namespace

double Qd_Double::ULP() const
{
  if(!IsFinite()) return QD_NAN;
  if(a0 == 0.0) return Qd_LdExp(1.0,QD_DOUBLE_VERYTINY_EXP);
  int exp;
  QD_FREXP(a0,&exp);  // 2^(exp-1) <= |a0| < 2^exp
  return Qd_LdExp(1.0,exp-1-2*QD_DOUBLE_MANTISSA_PRECISION);
}

double Qd_Double::ComputeDiffULP(const Qd_Double& ref,double refulp) const
{
  Qd_Double diff = fabs(*this - ref);
  if(refulp == 0.0) return diff.DownConvert();
  return (diff/refulp).DownConvert();
}

////////////////////////////////////////////////////////////////////////
// Comparison

bool operator==(const Qd_Double& x,const Qd_Double& y)
{
  return (x.a0 == y.a0 && x.a1 == y.a1);
}

bool operator!=(const Qd_Double& x,const Qd_Double& y)
{
  return !(x == y);
}

bool operator<(const Qd_Double& x,const Qd_Double& y)
{
  return (x.a0 < y.a0 || (x.a0 == y.a0 && x.a1 < y.a1));
}

bool operator<=(const Qd_Double& x,const Qd_Double& y)
{
  return (x.a0 < y.a0 || (x.a0 == y.a0 && x.a1 <= y.a1));
}

bool operator>(const Qd_Double& x,const Qd_Double& y)
{
  return (y < x);
}

bool operator>=(const Qd_Double& x,const Qd_Double& y)
{
  return (y <= x);
}

////////////////////////////////////////////////////////////////////////
// Arithmetic

Qd_Double operator-(const Qd_Double& x)
{
  return Qd_Double::FromLimbs(-x.a0,-x.a1);
}

Qd_Double operator+(const Qd_Double& x,const Qd_Double& y)
{
  if(x.IsNaN() || y.IsNaN()) return Qd_Double::QNAN;
  if(x.IsInfinite() || y.IsInfinite()) {
    // Inf + -Inf is NaN
    return Qd_Double::Finish(x.a0 + y.a0,0.0);
  }
  if(x.IsZero() && y.IsZero()) {
    // IEEE signed zero sum: -0 only if both are -0
    return Qd_Double::FromLimbs(x.a0 + y.a0,0.0);
  }
  double s1,s2,t1,t2;
  Qd_TwoSum(x.a0,y.a0,s1,s2);
  if(!Qd_IsFinite(s1)) return Qd_Double::FromLimbs(s1,0.0);
  Qd_TwoSum(x.a1,y.a1,t1,t2);
  s2 += t1;
  Qd_OrderedTwoSum(s1,s2,s1,s2);
  s2 += t2;
  Qd_OrderedTwoSum(s1,s2,s1,s2);
  return Qd_Double::Finish(s1,s2);
}

Qd_Double operator+(const Qd_Double& x,double y)
{
  return x + Qd_Double(y);
}

Qd_Double operator+(double x,const Qd_Double& y)
{
  return Qd_Double(x) + y;
}

Qd_Double operator-(const Qd_Double& x,const Qd_Double& y)
{
  return x + (-y);
}

Qd_Double operator-(const Qd_Double& x,double y)
{
  return x + Qd_Double(-y);
}

Qd_Double operator-(double x,const Qd_Double& y)
{
  return Qd_Double(x) + (-y);
}

Qd_Double operator*(const Qd_Double& x,const Qd_Double& y)
{
  double special;
  if(Qd_SpecialProduct(Classify(x),x.IsSignNegative(),
                       Classify(y),y.IsSignNegative(),special)) {
    return Qd_Double::FromLimbs(special,0.0);
  }
  double p,e;
  Qd_TwoProd(x.a0,y.a0,p,e);
  if(!Qd_IsFinite(p)) return Qd_Double::FromLimbs(p,0.0);
  e += (x.a0*y.a1 + x.a1*y.a0);
  Qd_OrderedTwoSum(p,e,p,e);
  return Qd_Double::Finish(p,e);
}

Qd_Double operator*(const Qd_Double& x,double y)
{
  double special;
  if(Qd_SpecialProduct(Classify(x),x.IsSignNegative(),
                       Classify(y),Qd_SignBit(y),special)) {
    return Qd_Double::FromLimbs(special,0.0);
  }
  double p,e;
  Qd_TwoProd(x.a0,y,p,e);
  if(!Qd_IsFinite(p)) return Qd_Double::FromLimbs(p,0.0);
  e += x.a1*y;
  Qd_OrderedTwoSum(p,e,p,e);
  return Qd_Double::Finish(p,e);
}

Qd_Double operator*(double x,const Qd_Double& y)
{
  return y*x;
}

Qd_Double operator/(const Qd_Double& x,const Qd_Double& y)
{
  double special;
  if(Qd_SpecialQuotient(Classify(x),x.IsSignNegative(),
                        Classify(y),y.IsSignNegative(),special)) {
    return Qd_Double::FromLimbs(special,0.0);
  }
  // Quotient estimate from the lead limbs, then two corrections
  // from the remainder.
  double q1 = x.a0/y.a0;
  if(!Qd_IsFinite(q1)) return Qd_Double::FromLimbs(q1,0.0);
  Qd_Double r = x - q1*y;
  double q2 = r.a0/y.a0;
  r -= q2*y;
  double q3 = r.a0/y.a0;
  Qd_OrderedTwoSum(q1,q2,q1,q2);
  return Qd_Double::FromLimbs(q1,q2) + q3;
}

Qd_Double operator/(const Qd_Double& x,double y)
{
  double special;
  if(Qd_SpecialQuotient(Classify(x),x.IsSignNegative(),
                        Classify(y),Qd_SignBit(y),special)) {
    return Qd_Double::FromLimbs(special,0.0);
  }
  double q1 = x.a0/y;
  if(!Qd_IsFinite(q1)) return Qd_Double::FromLimbs(q1,0.0);
  double p1,p2,s,e;
  Qd_TwoProd(q1,y,p1,p2);
  Qd_TwoDiff(x.a0,p1,s,e);
  e -= p2;
  e += x.a1;
  double q2 = (s + e)/y;
  Qd_OrderedTwoSum(q1,q2,q1,q2);
  return Qd_Double::Finish(q1,q2);
}

Qd_Double operator/(double x,const Qd_Double& y)
{
  return Qd_Double(x)/y;
}

////////////////////////////////////////////////////////////////////////
// Algebraic functions

Qd_Double sqr(const Qd_Double& x)
{
  double p,e;
  Qd_SquareProd(x.a0,p,e);
  if(!Qd_IsFinite(p)) return Qd_Double::FromLimbs(p,0.0);
  e = e + 2.0*x.a0*x.a1 + x.a1*x.a1;
  Qd_OrderedTwoSum(p,e,p,e);
  return Qd_Double::Finish(p,e);
}

Qd_Double recip(const Qd_Double& x)
{
  return 1.0/x;
}

Qd_Double fabs(const Qd_Double& x)
{
  if(x.IsSignNegative()) return -x;
  return x;
}

bool signbit(const Qd_Double& x)
{
  return x.IsSignNegative();
}

Qd_Double ldexp(const Qd_Double& x,int m)
{
  return Qd_Double::FromLimbs(Qd_LdExp(x.a0,m),Qd_LdExp(x.a1,m));
}

Qd_Double floor(const Qd_Double& x)
{
  double hi = floor(x.a0);
  double lo = 0.0;
  if(hi == x.a0) {
    // Lead limb is integral; floor carries on the low limb.
    lo = floor(x.a1);
    Qd_OrderedTwoSum(hi,lo,hi,lo);
  }
  return Qd_Double::Finish(hi,lo);
}

Qd_Double ceil(const Qd_Double& x)
{
  double hi = ceil(x.a0);
  double lo = 0.0;
  if(hi == x.a0) {
    lo = ceil(x.a1);
    Qd_OrderedTwoSum(hi,lo,hi,lo);
  }
  return Qd_Double::Finish(hi,lo);
}

Qd_Double sqrt(const Qd_Double& x)
{ // Karp-Markstein: with r ~= 1/sqrt(x) to double precision,
  //   sqrt(x) ~= x*r + (x - (x*r)^2)*r/2
  // One step doubles the number of correct digits, which is enough
  // starting from a double seed.
  if(x.IsNaN()) return Qd_Double::QNAN;
  if(x.IsZero()) return Qd_Double::ZERO;
  if(x.IsSignNegative()) return Qd_Double::QNAN;
  if(x.IsInfinite()) return Qd_Double::POS_INF;

  // Work on y = x*2^(-2k) in [0.25,2), so that neither the square of
  // the estimate nor the residual leaves the normal range.
  int e;
  QD_FREXP(x.a0,&e);
  const int k = e/2;
  const Qd_Double y = ldexp(x,-2*k);
  Qd_Double r = Qd_Double::FromQuot(1.0,sqrt(y.a0));
  Qd_Double ay = y*r;
  return ldexp(ay + (y - sqr(ay))*r*0.5,k);
}

Qd_Double cbrt(const Qd_Double& x)
{
  return nroot(x,3);
}

Qd_Double nroot(const Qd_Double& x,int n)
{ // Newton iteration on f(z) = z^(-n) - |x|, which converges to
  // |x|^(-1/n) without needing an n-th root in the derivative:
  //   z' = z + z*(1 - |x|*z^n)/n
  if(n <= 0) return Qd_Double::QNAN;
  if(n % 2 == 0 && x.IsSignNegative()) return Qd_Double::QNAN;
  if(n == 1) return x;
  if(n == 2) return sqrt(x);
  if(x.IsNaN()) return Qd_Double::QNAN;
  if(x.IsZero()) return Qd_Double::ZERO;
  if(x.IsInfinite()) return x;

  // Write |x| = m*2^(k*n) with m in (2^-n,2^n), so that z^n stays
  // well inside the double range, then root m.
  int e;
  QD_FREXP(x.a0,&e);
  const int k = e/n;
  const Qd_Double m = ldexp(fabs(x),-k*n);
  Qd_Double z(exp(-log(m.a0)/n));
  z += z*(1.0 - m*powi(z,n))/static_cast<double>(n);
  z = ldexp(recip(z),k);
  if(x.IsSignNegative()) z = -z;
  return z;
}

Qd_Double powi(const Qd_Double& x,int n)
{ // Binary exponentiation (square and multiply)
  if(n == 0) return Qd_Double::ONE;

  Qd_Double r = x;
  Qd_Double s = Qd_Double::ONE;
  // Magnitude as unsigned, which also covers INT_MIN
  unsigned int k = (n < 0 ? 0u - static_cast<unsigned int>(n)
                    : static_cast<unsigned int>(n));
  if(k > 1) {
    while(k > 0) {
      if(k % 2 == 1) s *= r;
      k /= 2;
      if(k > 0) r = sqr(r);
    }
  } else {
    s = r;
  }
  if(n < 0) return recip(s);
  return s;
}

Qd_Double pow(const Qd_Double& x,const Qd_Double& y)
{ // x^y = exp(y*log(x)), for x > 0
  if(x.IsZero()) {
    if(y.IsZero()) return Qd_Double::QNAN;
    if(y.IsSignPositive()) return Qd_Double::ZERO;
    return Qd_Double::POS_INF;
  }
  if(y.IsInfinite()) {
    if(x == Qd_Double::ONE) return Qd_Double::QNAN;
    if(y.IsSignPositive()) return Qd_Double::POS_INF;
    return Qd_Double::ZERO;
  }
  return exp(y*log(x));
}

////////////////////////////////////////////////////////////////////////
// Transcendental functions

Qd_Double exp(const Qd_Double& x)
{ // Pick m so |x - m*ln2| <= ln2/2, scale the remainder down by
  // k=512, sum the Taylor series for exp(r)-1, then undo the scaling by
  // squaring nine times with (1+s)^2 - 1 = 2s + s^2.  Finally
  // exp(x) = 2^m * (1 + s).
  if(x.a0 <= -600.0) return Qd_Double::ZERO;
  if(x.a0 > 708.0) return Qd_Double::POS_INF;
  if(x.IsNaN()) return Qd_Double::QNAN;
  if(x.IsZero()) return Qd_Double::ONE;
  if(x == Qd_Double::ONE) return Qd_Double::E;

  const double inv_k = 1.0/512.0;
  const double eps = inv_k*QD_DD_EPS;
  const double m = floor(x.a0/Qd_Double::LN2.a0 + 0.5);
  const Qd_Double r = (x - Qd_Double::LN2*m)*inv_k;

  Qd_Double p = sqr(r);
  Qd_Double s = r + p*0.5;
  p *= r;
  Qd_Double t
    = p*Qd_Double::FromLimbs(Qd_Double::inv_fact[0][0],
                             Qd_Double::inv_fact[0][1]);
  int i = 0;
  do {
    s += t;
    p *= r;
    ++i;
    t = p*Qd_Double::FromLimbs(Qd_Double::inv_fact[i][0],
                               Qd_Double::inv_fact[i][1]);
  } while(i < 5 && fabs(t.a0) > eps);
  s += t;

  for(int j=0;j<9;++j) s = s*2.0 + sqr(s);
  s += 1.0;

  return ldexp(s,static_cast<int>(m));
}

Qd_Double log(const Qd_Double& x)
{ // Newton iteration on f(z) = exp(z) - x:
  //   z' = z + x*exp(-z) - 1
  // seeded from the double log.
  if(x.IsNaN()) return Qd_Double::QNAN;
  if(x.IsSignNegative()) return Qd_Double::QNAN;
  if(x.IsZero()) return Qd_Double::NEG_INF;
  if(x.IsInfinite()) return Qd_Double::POS_INF;
  if(x == Qd_Double::ONE) return Qd_Double::ZERO;

  if(x.a0 > 1e250 || x.a0 < 1e-250) {
    // exp(-z) would leave the range of exp(); split off the power of
    // two and use log(x) = log(x*2^-m) + m*ln2.
    int m;
    QD_FREXP(x.a0,&m);
    return log(ldexp(x,-m)) + Qd_Double::LN2*static_cast<double>(m);
  }

  Qd_Double z(log(x.a0));
  int k = 0;
  if(z.a0 != 0.0) {
    QD_FREXP(z.a0,&k);  // 2^(k-1) <= |z| < 2^k
    k = max(k-1,0);
  }
  const double eps = Qd_LdExp(QD_DD_EPS,k+2);

  const int max_iterations = 20;
  for(int count=0;count<max_iterations;++count) {
    Qd_Double znext = z + x*exp(-z) - 1.0;
    if(fabs(z - znext) < eps) return znext;
    z = znext;
  }
  QD_THROW(Qd_Exception(__FILE__,__LINE__,"Qd_Double","log",512,
             "Newton iteration failed to converge after %d iterations"
             " (import value %.17g + %.17g)",max_iterations,x.a0,x.a1));
}

Qd_Double log10(const Qd_Double& x)
{
  return log(x)/Qd_Double::LN10;
}

Qd_Double log2(const Qd_Double& x)
{
  return log(x)/Qd_Double::LN2;
}

Qd_Double log(const Qd_Double& x,const Qd_Double& base)
{
  return log(x)/log(base);
}

void Qd_Double::SinCosTaylor(const Qd_Double& x,
                             Qd_Double& sinx,Qd_Double& cosx)
{
  if(x.IsZero()) {
    sinx = x;
    cosx = ONE;
    return;
  }
  const double thresh = 0.5*fabs(x.a0)*QD_DD_EPS;
  const Qd_Double xsq = -sqr(x);
  Qd_Double s = x;
  Qd_Double r = x;
  Qd_Double term;
  int i = 0;
  do {
    r *= xsq;
    term = r*FromLimbs(inv_fact[i][0],inv_fact[i][1]);
    s += term;
    i += 2;
  } while(i < 15 && fabs(term.a0) > thresh);
  sinx = s;
  cosx = sqrt(1.0 - sqr(s)); // cos > 0 for |x| <= pi/32
}

void sincos(const Qd_Double& x,Qd_Double& sinx,Qd_Double& cosx)
{ // Reduce mod 2pi, then mod pi/2 (quadrant j), then mod pi/16
  // (table index k).  The remainder t has |t| <= pi/32.
  if(!x.IsFinite()) {
    sinx = cosx = Qd_Double::QNAN;
    return;
  }
  if(x.IsZero()) {
    sinx = x;
    cosx = Qd_Double::ONE;
    return;
  }

  const Qd_Double z = floor(x/Qd_Double::TWO_PI + 0.5);
  const Qd_Double r = x - Qd_Double::TWO_PI*z;

  double q = floor(r.a0/Qd_Double::HALF_PI.a0 + 0.5);
  Qd_Double t = r - Qd_Double::HALF_PI*q;
  const int j = static_cast<int>(q);

  const Qd_Double pi16
    = Qd_Double::FromLimbs(Qd_Double::pi16[0],Qd_Double::pi16[1]);
  q = floor(t.a0/pi16.a0 + 0.5);
  t -= pi16*q;
  const int k = static_cast<int>(q);
  const int abs_k = abs(k);

  Qd_Double sin_t,cos_t;
  Qd_Double::SinCosTaylor(t,sin_t,cos_t);

  Qd_Double s,c;
  if(abs_k == 0) {
    s = sin_t;
    c = cos_t;
  } else {
    const Qd_Double u
      = Qd_Double::FromLimbs(Qd_Double::cos_table[abs_k-1][0],
                             Qd_Double::cos_table[abs_k-1][1]);
    const Qd_Double v
      = Qd_Double::FromLimbs(Qd_Double::sin_table[abs_k-1][0],
                             Qd_Double::sin_table[abs_k-1][1]);
    if(k > 0) {
      s = u*sin_t + v*cos_t;
      c = u*cos_t - v*sin_t;
    } else {
      s = u*sin_t - v*cos_t;
      c = u*cos_t + v*sin_t;
    }
  }

  if(j == 0) {
    sinx = s;
    cosx = c;
  } else if(j == 1) {
    sinx = c;
    cosx = -s;
  } else if(j == -1) {
    sinx = -c;
    cosx = s;
  } else {
    sinx = -s;
    cosx = -c;
  }
}

Qd_Double atan2(const Qd_Double& y,const Qd_Double& x)
{ // Newton iteration on the point (x,y)/r of the unit circle, from
  // a double seed.  Solve sin(z) = y/r when |x| > |y|, else
  // cos(z) = x/r, whichever has the larger derivative.  Three steps
  // take the double seed to full precision.
  if(x.IsZero()) {
    if(y.IsZero()) return Qd_Double::QNAN;
    if(y.IsSignPositive()) return Qd_Double::HALF_PI;
    return -Qd_Double::HALF_PI;
  }
  if(y.IsZero()) {
    if(x.IsSignPositive()) return Qd_Double::ZERO;
    return Qd_Double::PI;
  }
  if(y.IsInfinite()) {
    if(x.IsInfinite()) return Qd_Double::QNAN;
    if(y.IsSignPositive()) return Qd_Double::HALF_PI;
    return -Qd_Double::HALF_PI;
  }
  if(x.IsInfinite()) return Qd_Double::ZERO;
  if(x.IsNaN() || y.IsNaN()) return Qd_Double::QNAN;
  if(y == x) {
    if(y.IsSignPositive()) return Qd_Double::QUARTER_PI;
    return -Qd_Double::THREE_QUARTER_PI;
  }
  if(y == -x) {
    if(y.IsSignPositive()) return Qd_Double::THREE_QUARTER_PI;
    return -Qd_Double::QUARTER_PI;
  }

  // Scale both by a common power of two so the squares neither
  // overflow nor underflow.
  int e;
  QD_FREXP(fabs(x.a0) > fabs(y.a0) ? x.a0 : y.a0,&e);
  const Qd_Double xs = ldexp(x,-e);
  const Qd_Double ys = ldexp(y,-e);
  const Qd_Double r = sqrt(sqr(xs) + sqr(ys));
  const Qd_Double xx = xs/r;
  const Qd_Double yy = ys/r;

  Qd_Double z(atan2(y.a0,x.a0));
  Qd_Double sin_z,cos_z;
  if(fabs(xx.a0) > fabs(yy.a0)) {
    for(int i=0;i<3;++i) {
      sincos(z,sin_z,cos_z);
      z += (yy - sin_z)/cos_z;
    }
  } else {
    for(int i=0;i<3;++i) {
      sincos(z,sin_z,cos_z);
      z -= (xx - cos_z)/sin_z;
    }
  }
  return z;
}

Qd_Double atan(const Qd_Double& x)
{
  return atan2(x,Qd_Double::ONE);
}

////////////////////////////////////////////////////////////////////////
// Miscellaneous

std::string Qd_DebugString(const Qd_Double& x)
{
  return std::string("[") + Qd_HexBinaryFloatFormat(x.Hi())
    + std::string(",") + Qd_HexBinaryFloatFormat(x.Lo())
    + std::string("]");
}

int
Qd_Double::QuickTest()
{ // Checks identities tying the constant tables to the algorithms.
  // A failure here usually means the build allowed fma contraction or
  // extra intermediate precision.
  struct Check {
    const char* name;
    Qd_Double value;
    Qd_Double truth;
  };
  const Check checks[] = {
    { "exp(ln2)",     exp(LN2),           Qd_Double(2.0) },
    { "log(e)",       log(E),             ONE },
    { "sqrt(2)",      sqrt(Qd_Double(2.0)), SQRT2 },
    { "sin(pi/4)",    sin(QUARTER_PI),    INV_SQRT2 },
    { "cos(pi/4)",    cos(QUARTER_PI),    INV_SQRT2 },
    { "atan2(1,1)",   atan2(ONE,ONE),     QUARTER_PI },
    { "atan(1/2)+atan(1/3)",
                      atan(Qd_Double(0.5)) + atan(1.0/Qd_Double(3.0)),
                      QUARTER_PI },
    { "log(10)",      log(Qd_Double(10.0)), LN10 },
    { "cbrt(2)^3",    powi(cbrt(Qd_Double(2.0)),3), Qd_Double(2.0) }
  };
  const double allowed_ulps = 8.0;
  int errcount = 0;
  for(size_t i=0;i<sizeof(checks)/sizeof(checks[0]);++i) {
    const Check& chk = checks[i];
    const double diff = chk.value.ComputeDiffULP(chk.truth,chk.truth.ULP());
    if(!(diff <= allowed_ulps)) {
      ++errcount;
      Qd_Report::Log << Qd_LogSupport::GetLogMark()
                     << "Qd_Double::QuickTest failure, " << chk.name
                     << ": " << Qd_DebugString(chk.value)
                     << " TRUTH: " << Qd_DebugString(chk.truth)
                     << " (" << diff << " ULP)" << std::endl;
    }
  }
  return errcount;
}
