/* FILE: quaddouble.cc
 * Main source file for Qd_Quad class
 *
 *  Algorithms based on Y Hida, XS Li, DH Bailey, "Algorithms for
 *  quad-double precision floating point arithmetic," Proc. 15th IEEE
 *  Symposium on Computer Arithmetic, 155-162 (2001), and the
 *  accompanying QD library.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 * ACCURACY ESTIMATES:
 *
 * Addition is accurate to about 2 ULP, where 1 ULP = 2^(n-4*p) for
 * results in [2^n,2^(n+1)).  Multiplication drops the O(eps^4) terms
 * and so is good to a few ULP.  Transcendental functions are within
 * about 2^-205 relative for arguments of modest size.
 */

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

#include "quaddouble.h"
#include "qdbasic.h"
#include "qdexcept.h"
#include "qdmessages.h"

/* End includes */

using namespace std;

////////////////////////////////////////////////////////////////////////
// Tables

const double Qd_Quad::inv_fact[30][4] = {
  {  1.6666666666666666e-01,  9.2518585385429707e-18,
     5.1358131850326287e-34,  2.8509490240983419e-50 },  // 1/3!
  {  4.1666666666666664e-02,  2.3129646346357427e-18,
     1.2839532962581572e-34,  7.1273725602458547e-51 },
  {  8.3333333333333332e-03,  1.1564823173178714e-19,
     1.6049416203226965e-36,  2.2273039250768297e-53 },  // 1/5!
  {  1.3888888888888889e-03, -5.3005439543735771e-20,
    -1.7386867553495878e-36, -1.6333562117230084e-52 },
  {  1.9841269841269841e-04,  1.7209558293420705e-22,
     1.4926912391394127e-40,  1.2947032674600247e-58 },
  {  2.4801587301587302e-05,  2.1511947866775882e-23,
     1.8658640489242659e-41,  1.6183790843250309e-59 },
  {  2.7557319223985893e-06, -1.8583932740464721e-22,
     8.4917546048819929e-39, -5.7266164078942962e-55 },
  {  2.7557319223985888e-07,  2.3767714622250297e-23,
    -3.2631889033408829e-40,  1.6143511186040442e-56 },  // 1/10!
  {  2.5052108385441720e-08, -1.4488140709359120e-24,
     2.0426735146714455e-41, -8.4963267200716317e-58 },
  {  2.0876756987868100e-09, -1.2073450591132600e-25,
     1.7022279288928710e-42,  1.4160953215039670e-58 },
  {  1.6059043836821613e-10,  1.2585294588752098e-26,
    -5.3133460276298503e-43,  3.5402147259760553e-59 },
  {  1.1470745597729725e-11,  2.0655512752830745e-28,
     6.8890792324666460e-45,  5.7292000265510910e-61 },
  {  7.6471637318198164e-13,  7.0387287773345300e-30,
    -7.8275392771625834e-48,  1.9213864944379024e-64 },  // 1/15!
  {  4.7794773323873853e-14,  4.3992054858340813e-31,
    -4.8922120482266147e-49,  1.2008665590236890e-65 },
  {  2.8114572543455206e-15,  1.6508842730861433e-31,
    -2.8777717930744792e-50,  4.2711068925629355e-67 },
  {  1.5619206968586225e-16,  1.1910679660273754e-32,
    -4.5775060596299832e-49,  2.8749414234089960e-67 },
  {  8.2206352466243295e-18,  2.2141894119604265e-34,
    -1.5089140237741990e-50,  1.4007295151478155e-67 },
  {  4.1103176233121648e-19,  1.4412973378659527e-36,
    -5.2856275487898121e-53, -4.1476472563576568e-70 },  // 1/20!
  {  1.9572941063391263e-20, -1.3643503830087908e-36,
     1.3392348251125064e-53, -6.8210894241493312e-70 },
  {  8.8967913924505741e-22, -7.9114026148723762e-38,
    -3.1877976790570933e-54,  1.2705781017520566e-70 },
  {  3.8681701706306841e-23, -8.8431776554823438e-40,
     3.8718157106173247e-56, -1.9565257531522557e-72 },
  {  1.6117375710961184e-24, -3.6846573564509766e-41,
     1.6132565460905519e-57, -8.1521906381343993e-74 },
  {  6.4469502843844736e-26, -1.9330404233703465e-42,
    -1.5213023807039144e-58,  6.6437727372129575e-75 },  // 1/25!
  {  2.4795962632247976e-27, -1.2953730964765229e-43,
     6.4033901598499624e-60, -8.4602456277067459e-77 },
  {  9.1836898637955460e-29,  1.4303150396787322e-45,
    -8.5512267746505048e-62,  8.3814671002345383e-78 },
  {  3.2798892370698378e-30,  1.5117542744029879e-46,
     8.0585177195197159e-63, -9.0964805307109289e-81 },
  {  1.1309962886447716e-31,  1.0498015412959506e-47,
    -4.3461509293977952e-64, -4.9667798001400558e-81 },
  {  3.7699876288159054e-33,  2.5870347832750324e-49,
     3.2378900274256400e-66,  2.5612859105788573e-82 },  // 1/30!
  {  1.2161250415535179e-34,  5.5862905678888058e-51,
     6.6159485780827919e-68, -3.1620442289520859e-84 },
  {  3.8003907548547434e-36,  1.7457158024652518e-52,
     2.0674839306508725e-69, -9.8813882154752685e-86 }  // 1/32!
};

const double Qd_Quad::sin_table[4][4] = {
  {  1.9509032201612828e-01, -7.9910790684617313e-18,
     6.1846270024220713e-34, -3.5840270918032937e-50 },
  {  3.8268343236508978e-01, -1.0050772696461588e-17,
    -2.0605316302806695e-34, -1.2717724698085205e-50 },
  {  5.5557023301960218e-01,  4.7094109405616768e-17,
    -2.0640520383682921e-33,  1.2290163188567138e-49 },
  {  7.0710678118654757e-01, -4.8336466567264567e-17,
     2.0693376543497068e-33,  2.4677734957341755e-50 }
};

const double Qd_Quad::cos_table[4][4] = {
  {  9.8078528040323043e-01,  1.8546939997825006e-17,
    -1.0696564445530757e-33,  6.6668174475264961e-50 },
  {  9.2387953251128674e-01,  1.7645047084336677e-17,
    -5.0442537321586818e-34, -4.0478677716823890e-50 },
  {  8.3146961230254524e-01,  1.4073856984728024e-18,
     4.6951315383980835e-35, -2.0233881519382568e-52 },
  {  7.0710678118654757e-01, -4.8336466567264567e-17,
     2.0693376543497068e-33,  2.4677734957341755e-50 }
};

const double Qd_Quad::pi16[4]
  = {  1.9634954084936207e-01,  7.6540424946709575e-18,
      -1.8717311310739623e-34,  6.9528388803960330e-51 };


////////////////////////////////////////////////////////////////////////
// Reference values

const Qd_Quad Qd_Quad::ZERO(0.0);
const Qd_Quad Qd_Quad::NEG_ZERO(Qd_Quad::FromLimbs(-0.0,0.0,0.0,0.0));
const Qd_Quad Qd_Quad::ONE(1.0);
const Qd_Quad Qd_Quad::QNAN(Qd_Quad::FromLimbs(QD_NAN,0.0,0.0,0.0));
const Qd_Quad
Qd_Quad::POS_INF(Qd_Quad::FromLimbs(QD_INFINITY,0.0,0.0,0.0));
const Qd_Quad
Qd_Quad::NEG_INF(Qd_Quad::FromLimbs(-QD_INFINITY,0.0,0.0,0.0));
const Qd_Quad Qd_Quad::EPSILON(QD_QD_EPS);
const Qd_Quad Qd_Quad::PI
  (Qd_Quad::FromLimbs(3.1415926535897931e+00, 1.2246467991473532e-16,
                      -2.9947698097183397e-33, 1.1124542208633653e-49));
const Qd_Quad Qd_Quad::TWO_PI
  (Qd_Quad::FromLimbs(6.2831853071795862e+00, 2.4492935982947064e-16,
                      -5.9895396194366793e-33, 2.2249084417267306e-49));
const Qd_Quad Qd_Quad::HALF_PI
  (Qd_Quad::FromLimbs(1.5707963267948966e+00, 6.1232339957367660e-17,
                      -1.4973849048591698e-33, 5.5622711043168264e-50));
const Qd_Quad Qd_Quad::QUARTER_PI
  (Qd_Quad::FromLimbs(7.8539816339744828e-01, 3.0616169978683830e-17,
                      -7.4869245242958492e-34, 2.7811355521584132e-50));
const Qd_Quad Qd_Quad::THREE_QUARTER_PI
  (Qd_Quad::FromLimbs(2.3561944901923448e+00, 9.1848509936051484e-17,
                      3.9168984647504003e-33, -2.5867981632704864e-49));
const Qd_Quad Qd_Quad::E
  (Qd_Quad::FromLimbs(2.7182818284590451e+00, 1.4456468917292502e-16,
                      -2.1277171080381768e-33, 1.5156301598412191e-49));
const Qd_Quad Qd_Quad::LN2
  (Qd_Quad::FromLimbs(6.9314718055994529e-01, 2.3190468138462996e-17,
                      5.7077084384162121e-34, -3.5824322106018114e-50));
const Qd_Quad Qd_Quad::LN10
  (Qd_Quad::FromLimbs(2.3025850929940459e+00, -2.1707562233822494e-16,
                      -9.9842624544657766e-33, -4.0233574544502064e-49));
const Qd_Quad Qd_Quad::SQRT2
  (Qd_Quad::FromLimbs(1.4142135623730951e+00, -9.6672933134529135e-17,
                      4.1386753086994136e-33, 4.9355469914683509e-50));
const Qd_Quad Qd_Quad::INV_SQRT2
  (Qd_Quad::FromLimbs(7.0710678118654757e-01, -4.8336466567264567e-17,
                      2.0693376543497068e-33, 2.4677734957341755e-50));

////////////////////////////////////////////////////////////////////////
// Constructors

Qd_Quad::Qd_Quad(double x0,double x1,double x2,double x3)
{
  Qd_Renormalize(x0,x1,x2,x3);
  *this = Finish(x0,x1,x2,x3);
}

Qd_Quad::Qd_Quad(int64_t ix)
{
  const double hi = static_cast<double>(ix >> 32) * 4294967296.0;
  const double lo = static_cast<double>(ix & 0xFFFFFFFF);
  Qd_TwoSum(hi,lo,a[0],a[1]);
  a[2] = a[3] = 0.0;
}

Qd_Quad::Qd_Quad(uint64_t ix)
{
  const double hi = static_cast<double>(ix >> 32) * 4294967296.0;
  const double lo = static_cast<double>(ix & 0xFFFFFFFFu);
  Qd_TwoSum(hi,lo,a[0],a[1]);
  a[2] = a[3] = 0.0;
}

Qd_Quad Qd_Quad::FromLimbs(double x0,double x1,double x2,double x3)
{
  Qd_Quad result;
  result.a[0] = x0;
  result.a[1] = x1;
  result.a[2] = x2;
  result.a[3] = x3;
  return result;
}

Qd_Quad Qd_Quad::Finish(double x0,double x1,double x2,double x3)
{
  if(!Qd_IsFinite(x0)) return FromLimbs(x0,0.0,0.0,0.0);
  return FromLimbs(x0,x1,x2,x3);
}

Qd_Double Qd_Quad::ToDouble() const
{
  if(!Qd_IsFinite(a[0])) return Qd_Double::FromLimbs(a[0],0.0);
  double hi,lo;
  Qd_OrderedTwoSum(a[0],a[1]+a[2],hi,lo);
  return Qd_Double::FromLimbs(hi,lo);
}

////////////////////////////////////////////////////////////////////////
// Queries

bool Qd_Quad::IsNaN() const
{
  return (Qd_IsNaN(a[0]) || Qd_IsNaN(a[1]));
}

bool Qd_Quad::IsInfinite() const
{
  for(int i=0;i<4;++i) {
    if(Qd_IsPosInf(a[i]) || Qd_IsNegInf(a[i])) return true;
  }
  return false;
}

bool Qd_Quad::IsFinite() const
{
  return (Qd_IsFinite(a[0]) && Qd_IsFinite(a[1])
          && Qd_IsFinite(a[2]) && Qd_IsFinite(a[3]));
}

bool Qd_Quad::IsNormalized() const
{
  if(!Qd_IsFinite(a[0])) return true;
  double c0 = a[0], c1 = a[1], c2 = a[2], c3 = a[3];
  Qd_Renormalize(c0,c1,c2,c3);
  return (c0 == a[0] && c1 == a[1] && c2 == a[2] && c3 == a[3]);
}

namespace {

Qd_ValueClass Classify(const Qd_Quad& x)
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

double Qd_Quad::ULP() const
{
  if(!IsFinite()) return QD_NAN;
  if(a[0] == 0.0) return Qd_LdExp(1.0,QD_DOUBLE_VERYTINY_EXP);
  int exp;
  QD_FREXP(a[0],&exp);
  return Qd_LdExp(1.0,exp-1-4*QD_DOUBLE_MANTISSA_PRECISION);
}

double Qd_Quad::ComputeDiffULP(const Qd_Quad& ref,double refulp) const
{
  Qd_Quad diff = fabs(*this - ref);
  if(refulp == 0.0) return diff.DownConvert();
  return (diff/refulp).DownConvert();
}

////////////////////////////////////////////////////////////////////////
// Comparison

bool operator==(const Qd_Quad& x,const Qd_Quad& y)
{
  return (x.a[0] == y.a[0] && x.a[1] == y.a[1]
          && x.a[2] == y.a[2] && x.a[3] == y.a[3]);
}

bool operator!=(const Qd_Quad& x,const Qd_Quad& y)
{
  return !(x == y);
}

bool operator<(const Qd_Quad& x,const Qd_Quad& y)
{
  for(int i=0;i<3;++i) {
    if(x.a[i] < y.a[i]) return true;
    if(x.a[i] != y.a[i]) return false;
  }
  return (x.a[3] < y.a[3]);
}

bool operator<=(const Qd_Quad& x,const Qd_Quad& y)
{
  for(int i=0;i<3;++i) {
    if(x.a[i] < y.a[i]) return true;
    if(x.a[i] != y.a[i]) return false;
  }
  return (x.a[3] <= y.a[3]);
}

bool operator>(const Qd_Quad& x,const Qd_Quad& y)
{
  return (y < x);
}

bool operator>=(const Qd_Quad& x,const Qd_Quad& y)
{
  return (y <= x);
}

////////////////////////////////////////////////////////////////////////
// Arithmetic

Qd_Quad operator-(const Qd_Quad& x)
{
  return Qd_Quad::FromLimbs(-x.a[0],-x.a[1],-x.a[2],-x.a[3]);
}

Qd_Quad operator+(const Qd_Quad& x,const Qd_Quad& y)
{ // Merge the limbs of x and y by decreasing magnitude into a
  // double-length accumulator, emitting a limb each time it fills.
  if(x.IsNaN() || y.IsNaN()) return Qd_Quad::QNAN;
  if(x.IsInfinite() || y.IsInfinite()) {
    return Qd_Quad::Finish(x.a[0] + y.a[0],0.0,0.0,0.0);
  }
  if(x.IsZero() && y.IsZero()) {
    return Qd_Quad::FromLimbs(x.a[0] + y.a[0],0.0,0.0,0.0);
  }

  double z[4] = { 0.0, 0.0, 0.0, 0.0 };
  int i=0, j=0, k=0;
  double u,v;
  if(fabs(x.a[i]) > fabs(y.a[j])) u = x.a[i++];
  else                            u = y.a[j++];
  if(fabs(x.a[i]) > fabs(y.a[j])) v = x.a[i++];
  else                            v = y.a[j++];
  Qd_OrderedTwoSum(u,v,u,v);

  while(k < 4) {
    if(i >= 4 && j >= 4) {
      z[k] = u;
      if(k < 3) z[++k] = v;
      break;
    }
    double t;
    if(i >= 4)                           t = y.a[j++];
    else if(j >= 4)                      t = x.a[i++];
    else if(fabs(x.a[i]) > fabs(y.a[j])) t = x.a[i++];
    else                                 t = y.a[j++];
    const double s = Qd_Accumulate(u,v,t);
    if(s != 0.0) z[k++] = s;
  }

  // Leftovers are below the precision of the result
  for(;i<4;++i) z[3] += x.a[i];
  for(;j<4;++j) z[3] += y.a[j];

  Qd_Renormalize(z[0],z[1],z[2],z[3]);
  return Qd_Quad::Finish(z[0],z[1],z[2],z[3]);
}

Qd_Quad operator+(const Qd_Quad& x,double y)
{
  if(x.IsNaN() || Qd_IsNaN(y)) return Qd_Quad::QNAN;
  if(x.IsInfinite() || !Qd_IsFinite(y)) {
    return Qd_Quad::Finish(x.a[0] + y,0.0,0.0,0.0);
  }
  if(x.IsZero() && y == 0.0) {
    return Qd_Quad::FromLimbs(x.a[0] + y,0.0,0.0,0.0);
  }
  double c0,c1,c2,c3,e;
  Qd_TwoSum(x.a[0],y,c0,e);
  Qd_TwoSum(x.a[1],e,c1,e);
  Qd_TwoSum(x.a[2],e,c2,e);
  Qd_TwoSum(x.a[3],e,c3,e);
  Qd_Renormalize(c0,c1,c2,c3,e);
  return Qd_Quad::Finish(c0,c1,c2,c3);
}

Qd_Quad operator+(double x,const Qd_Quad& y)
{
  return y + x;
}

Qd_Quad operator-(const Qd_Quad& x,const Qd_Quad& y)
{
  return x + (-y);
}

Qd_Quad operator-(const Qd_Quad& x,double y)
{
  return x + (-y);
}

Qd_Quad operator-(double x,const Qd_Quad& y)
{
  return (-y) + x;
}

Qd_Quad operator*(const Qd_Quad& x,const Qd_Quad& y)
{ // Terms of order eps^4 and smaller are dropped.
  double special;
  if(Qd_SpecialProduct(Classify(x),x.IsSignNegative(),
                       Classify(y),y.IsSignNegative(),special)) {
    return Qd_Quad::FromLimbs(special,0.0,0.0,0.0);
  }
  const double* a = x.a;
  const double* b = y.a;

  // Order 1, eps and eps^2 products, with their errors
  double p0,p1,p2,p3,p4,p5;
  double q0,q1,q2,q3,q4,q5;
  Qd_TwoProd(a[0],b[0],p0,q0);
  Qd_TwoProd(a[0],b[1],p1,q1);
  Qd_TwoProd(a[1],b[0],p2,q2);
  Qd_TwoProd(a[0],b[2],p3,q3);
  Qd_TwoProd(a[1],b[1],p4,q4);
  Qd_TwoProd(a[2],b[0],p5,q5);

  Qd_ThreeSum(p1,p2,q0);

  // Six-three sum of p2, q1, q2, p3, p4, p5
  Qd_ThreeSum(p2,q1,q2);
  Qd_ThreeSum(p3,p4,p5);
  double s0,s1,s2,t0,t1;
  Qd_TwoSum(p2,p3,s0,t0);
  Qd_TwoSum(q1,p4,s1,t1);
  s2 = q2 + p5;
  Qd_TwoSum(s1,t0,s1,t0);
  s2 += (t0 + t1);

  // Order eps^3 terms
  s1 += a[0]*b[3] + a[1]*b[2] + a[2]*b[1] + a[3]*b[0] + q0 + q3 + q4 + q5;

  Qd_Renormalize(p0,p1,s0,s1,s2);
  return Qd_Quad::Finish(p0,p1,s0,s1);
}

Qd_Quad operator*(const Qd_Quad& x,double y)
{
  double special;
  if(Qd_SpecialProduct(Classify(x),x.IsSignNegative(),
                       Classify(y),Qd_SignBit(y),special)) {
    return Qd_Quad::FromLimbs(special,0.0,0.0,0.0);
  }
  double p0,p1,p2,p3,q0,q1,q2;
  Qd_TwoProd(x.a[0],y,p0,q0);
  Qd_TwoProd(x.a[1],y,p1,q1);
  Qd_TwoProd(x.a[2],y,p2,q2);
  p3 = x.a[3]*y;

  double s0 = p0;
  double s1,s2;
  Qd_TwoSum(q0,p1,s1,s2);
  Qd_ThreeSum(s2,q1,p2);
  Qd_ThreeSumTwo(q1,q2,p3);
  double s3 = q1;
  double s4 = q2 + p2;

  Qd_Renormalize(s0,s1,s2,s3,s4);
  return Qd_Quad::Finish(s0,s1,s2,s3);
}

Qd_Quad operator*(double x,const Qd_Quad& y)
{
  return y*x;
}

Qd_Quad operator/(const Qd_Quad& x,const Qd_Quad& y)
{ // Long division, one double quotient digit per step
  double special;
  if(Qd_SpecialQuotient(Classify(x),x.IsSignNegative(),
                        Classify(y),y.IsSignNegative(),special)) {
    return Qd_Quad::FromLimbs(special,0.0,0.0,0.0);
  }
  double q0 = x.a[0]/y.a[0];
  if(!Qd_IsFinite(q0)) return Qd_Quad::FromLimbs(q0,0.0,0.0,0.0);
  Qd_Quad r = x - y*q0;
  double q1 = r.a[0]/y.a[0];
  r -= y*q1;
  double q2 = r.a[0]/y.a[0];
  r -= y*q2;
  double q3 = r.a[0]/y.a[0];
  r -= y*q3;
  double q4 = r.a[0]/y.a[0];
  Qd_Renormalize(q0,q1,q2,q3,q4);
  return Qd_Quad::Finish(q0,q1,q2,q3);
}

Qd_Quad operator/(const Qd_Quad& x,double y)
{
  return x/Qd_Quad(y);
}

Qd_Quad operator/(double x,const Qd_Quad& y)
{
  return Qd_Quad(x)/y;
}

////////////////////////////////////////////////////////////////////////
// Algebraic functions

Qd_Quad sqr(const Qd_Quad& x)
{
  if(x.IsNaN()) return Qd_Quad::QNAN;
  if(x.IsInfinite()) return Qd_Quad::POS_INF;
  if(x.IsZero()) return Qd_Quad::ZERO;
  const double* a = x.a;

  double h0,h1,h2,h3,l0,l1,l2,l3;
  Qd_SquareProd(a[0],h0,l0);
  Qd_TwoProd(2.0*a[0],a[1],h1,l1);
  Qd_TwoProd(2.0*a[0],a[2],h2,l2);
  Qd_SquareProd(a[1],h3,l3);
  const double h4 = 2.0*a[0]*a[3];
  const double h5 = 2.0*a[1]*a[2];

  // Order eps terms
  double r0 = h0;
  double r1,s1;
  Qd_TwoSum(h1,l0,r1,s1);

  // Order eps^2 terms
  double b0,b1,c0,c1,d0,d1,e0,e1,f0,f1;
  Qd_TwoSum(s1,l1,b0,b1);
  Qd_TwoSum(h2,h3,c0,c1);
  Qd_TwoSum(b0,c0,d0,d1);
  Qd_TwoSum(b1,c1,e0,e1);
  Qd_TwoSum(d1,e0,f0,f1);
  double i0,i1,r2,j1,k0,k1;
  Qd_OrderedTwoSum(f0,e1+f1,i0,i1);
  Qd_OrderedTwoSum(d0,i0,r2,j1);
  Qd_OrderedTwoSum(i1,j1,k0,k1);

  // Order eps^3 terms
  double m0,m1,n0,n1,o0,o1,r3,q1;
  Qd_TwoSum(h4,h5,m0,m1);
  Qd_TwoSum(l2,l3,n0,n1);
  Qd_TwoSum(m0,n0,o0,o1);
  Qd_TwoSum(k0,o0,r3,q1);

  double r4 = m1 + n1 + o1 + k1 + q1;

  Qd_Renormalize(r0,r1,r2,r3,r4);
  return Qd_Quad::Finish(r0,r1,r2,r3);
}

Qd_Quad recip(const Qd_Quad& x)
{
  return 1.0/x;
}

Qd_Quad fabs(const Qd_Quad& x)
{
  if(x.IsSignNegative()) return -x;
  return x;
}

bool signbit(const Qd_Quad& x)
{
  return x.IsSignNegative();
}

Qd_Quad ldexp(const Qd_Quad& x,int m)
{
  return Qd_Quad::FromLimbs(Qd_LdExp(x.a[0],m),Qd_LdExp(x.a[1],m),
                            Qd_LdExp(x.a[2],m),Qd_LdExp(x.a[3],m));
}

Qd_Quad floor(const Qd_Quad& x)
{ // Lower limbs matter only while the limbs above are integral.
  double z0 = floor(x.a[0]);
  double z1 = 0.0, z2 = 0.0, z3 = 0.0;
  if(z0 == x.a[0]) {
    z1 = floor(x.a[1]);
    if(z1 == x.a[1]) {
      z2 = floor(x.a[2]);
      if(z2 == x.a[2]) z3 = floor(x.a[3]);
    }
    Qd_Renormalize(z0,z1,z2,z3);
  }
  return Qd_Quad::Finish(z0,z1,z2,z3);
}

Qd_Quad ceil(const Qd_Quad& x)
{
  double z0 = ceil(x.a[0]);
  double z1 = 0.0, z2 = 0.0, z3 = 0.0;
  if(z0 == x.a[0]) {
    z1 = ceil(x.a[1]);
    if(z1 == x.a[1]) {
      z2 = ceil(x.a[2]);
      if(z2 == x.a[2]) z3 = ceil(x.a[3]);
    }
    Qd_Renormalize(z0,z1,z2,z3);
  }
  return Qd_Quad::Finish(z0,z1,z2,z3);
}

Qd_Quad sqrt(const Qd_Quad& x)
{ // Newton iteration for 1/sqrt(x), r' = r + (1/2 - (x/2)*r^2)*r,
  // then sqrt(x) = x*r.  Three steps from a double seed.
  if(x.IsNaN()) return Qd_Quad::QNAN;
  if(x.IsZero()) return Qd_Quad::ZERO;
  if(x.IsSignNegative()) return Qd_Quad::QNAN;
  if(x.IsInfinite()) return Qd_Quad::POS_INF;

  // Iterate on y = x*2^(-2k) in [0.25,2); r^2 overflows for
  // subnormal x otherwise.
  int e;
  QD_FREXP(x.a[0],&e);
  const int k = e/2;
  const Qd_Quad y = ldexp(x,-2*k);
  Qd_Quad r(1.0/sqrt(y.a[0]));
  const Qd_Quad h = y*0.5;
  for(int i=0;i<3;++i) r += (0.5 - h*sqr(r))*r;
  return ldexp(r*y,k);
}

Qd_Quad cbrt(const Qd_Quad& x)
{
  return nroot(x,3);
}

Qd_Quad nroot(const Qd_Quad& x,int n)
{ // Same iteration as the Qd_Double version, three steps.
  if(n <= 0) return Qd_Quad::QNAN;
  if(n % 2 == 0 && x.IsSignNegative()) return Qd_Quad::QNAN;
  if(n == 1) return x;
  if(n == 2) return sqrt(x);
  if(x.IsNaN()) return Qd_Quad::QNAN;
  if(x.IsZero()) return Qd_Quad::ZERO;
  if(x.IsInfinite()) return x;

  // |x| = m*2^(k*n), m in (2^-n,2^n)
  int e;
  QD_FREXP(x.a[0],&e);
  const int k = e/n;
  const Qd_Quad m = ldexp(fabs(x),-k*n);
  const double dn = static_cast<double>(n);
  Qd_Quad z(exp(-log(m.a[0])/dn));
  for(int i=0;i<3;++i) z += z*(1.0 - m*powi(z,n))/dn;
  z = ldexp(recip(z),k);
  if(x.IsSignNegative()) z = -z;
  return z;
}

Qd_Quad powi(const Qd_Quad& x,int n)
{
  if(n == 0) return Qd_Quad::ONE;

  Qd_Quad r = x;
  Qd_Quad s = Qd_Quad::ONE;
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

Qd_Quad pow(const Qd_Quad& x,const Qd_Quad& y)
{
  if(x.IsZero()) {
    if(y.IsZero()) return Qd_Quad::QNAN;
    if(y.IsSignPositive()) return Qd_Quad::ZERO;
    return Qd_Quad::POS_INF;
  }
  if(y.IsInfinite()) {
    if(x == Qd_Quad::ONE) return Qd_Quad::QNAN;
    if(y.IsSignPositive()) return Qd_Quad::POS_INF;
    return Qd_Quad::ZERO;
  }
  return exp(y*log(x));
}

////////////////////////////////////////////////////////////////////////
// Transcendental functions

Qd_Quad exp(const Qd_Quad& x)
{ // Same reduction as Qd_Double exp: x = m*ln2 + 512*r.
  if(x.a[0] <= -600.0) return Qd_Quad::ZERO;
  if(x.a[0] > 708.0) return Qd_Quad::POS_INF;
  if(x.IsNaN()) return Qd_Quad::QNAN;
  if(x.IsZero()) return Qd_Quad::ONE;
  if(x == Qd_Quad::ONE) return Qd_Quad::E;

  const double inv_k = 1.0/512.0;
  const double eps = inv_k*QD_QD_EPS;
  const double m = floor(x.a[0]/Qd_Quad::LN2.a[0] + 0.5);
  const Qd_Quad r = (x - Qd_Quad::LN2*m)*inv_k;

  Qd_Quad p = sqr(r);
  Qd_Quad s = r + p*0.5;
  p *= r;
  Qd_Quad t = p*Qd_Quad::TableEntry(Qd_Quad::inv_fact[0]);
  int i = 0;
  do {
    s += t;
    p *= r;
    ++i;
    t = p*Qd_Quad::TableEntry(Qd_Quad::inv_fact[i]);
  } while(i < 29 && fabs(t.a[0]) > eps);
  s += t;

  for(int j=0;j<9;++j) s = s*2.0 + sqr(s);
  s += 1.0;

  return ldexp(s,static_cast<int>(m));
}

Qd_Quad log(const Qd_Quad& x)
{ // Newton iteration z' = z + x*exp(-z) - 1
  if(x.IsNaN()) return Qd_Quad::QNAN;
  if(x.IsSignNegative()) return Qd_Quad::QNAN;
  if(x.IsZero()) return Qd_Quad::NEG_INF;
  if(x.IsInfinite()) return Qd_Quad::POS_INF;
  if(x == Qd_Quad::ONE) return Qd_Quad::ZERO;

  if(x.a[0] > 1e250 || x.a[0] < 1e-250) {
    int m;
    QD_FREXP(x.a[0],&m);
    return log(ldexp(x,-m)) + Qd_Quad::LN2*static_cast<double>(m);
  }

  Qd_Quad z(log(x.a[0]));
  int k = 0;
  if(z.a[0] != 0.0) {
    QD_FREXP(z.a[0],&k);
    k = max(k-1,0);
  }
  const double eps = Qd_LdExp(QD_QD_EPS,k+2);

  const int max_iterations = 20;
  for(int count=0;count<max_iterations;++count) {
    Qd_Quad znext = z + x*exp(-z) - 1.0;
    if(fabs(z - znext) < eps) return znext;
    z = znext;
  }
  QD_THROW(Qd_Exception(__FILE__,__LINE__,"Qd_Quad","log",512,
             "Newton iteration failed to converge after %d iterations"
             " (import value %.17g + %.17g)",
             max_iterations,x.a[0],x.a[1]));
}

Qd_Quad log10(const Qd_Quad& x)
{
  return log(x)/Qd_Quad::LN10;
}

Qd_Quad log2(const Qd_Quad& x)
{
  return log(x)/Qd_Quad::LN2;
}

Qd_Quad log(const Qd_Quad& x,const Qd_Quad& base)
{
  return log(x)/log(base);
}

void Qd_Quad::SinCosTaylor(const Qd_Quad& x,Qd_Quad& sinx,Qd_Quad& cosx)
{
  if(x.IsZero()) {
    sinx = x;
    cosx = ONE;
    return;
  }
  const double thresh = 0.5*fabs(x.a[0])*QD_QD_EPS;
  const Qd_Quad xsq = -sqr(x);
  Qd_Quad s = x;
  Qd_Quad r = x;
  Qd_Quad term;
  int i = 0;
  do {
    r *= xsq;
    term = r*TableEntry(inv_fact[i]);
    s += term;
    i += 2;
  } while(i < 30 && fabs(term.a[0]) > thresh);
  sinx = s;
  cosx = sqrt(1.0 - sqr(s));
}

void sincos(const Qd_Quad& x,Qd_Quad& sinx,Qd_Quad& cosx)
{
  if(!x.IsFinite()) {
    sinx = cosx = Qd_Quad::QNAN;
    return;
  }
  if(x.IsZero()) {
    sinx = x;
    cosx = Qd_Quad::ONE;
    return;
  }

  const Qd_Quad z = floor(x/Qd_Quad::TWO_PI + 0.5);
  const Qd_Quad r = x - Qd_Quad::TWO_PI*z;

  double q = floor(r.a[0]/Qd_Quad::HALF_PI.a[0] + 0.5);
  Qd_Quad t = r - Qd_Quad::HALF_PI*q;
  const int j = static_cast<int>(q);

  const Qd_Quad pi16 = Qd_Quad::TableEntry(Qd_Quad::pi16);
  q = floor(t.a[0]/pi16.a[0] + 0.5);
  t -= pi16*q;
  const int k = static_cast<int>(q);
  const int abs_k = abs(k);

  Qd_Quad sin_t,cos_t;
  Qd_Quad::SinCosTaylor(t,sin_t,cos_t);

  Qd_Quad s,c;
  if(abs_k == 0) {
    s = sin_t;
    c = cos_t;
  } else {
    const Qd_Quad u = Qd_Quad::TableEntry(Qd_Quad::cos_table[abs_k-1]);
    const Qd_Quad v = Qd_Quad::TableEntry(Qd_Quad::sin_table[abs_k-1]);
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

Qd_Quad atan2(const Qd_Quad& y,const Qd_Quad& x)
{ // See the Qd_Double version.  Three Newton steps take the double
  // seed past 4*53 bits.
  if(x.IsZero()) {
    if(y.IsZero()) return Qd_Quad::QNAN;
    if(y.IsSignPositive()) return Qd_Quad::HALF_PI;
    return -Qd_Quad::HALF_PI;
  }
  if(y.IsZero()) {
    if(x.IsSignPositive()) return Qd_Quad::ZERO;
    return Qd_Quad::PI;
  }
  if(y.IsInfinite()) {
    if(x.IsInfinite()) return Qd_Quad::QNAN;
    if(y.IsSignPositive()) return Qd_Quad::HALF_PI;
    return -Qd_Quad::HALF_PI;
  }
  if(x.IsInfinite()) return Qd_Quad::ZERO;
  if(x.IsNaN() || y.IsNaN()) return Qd_Quad::QNAN;
  if(y == x) {
    if(y.IsSignPositive()) return Qd_Quad::QUARTER_PI;
    return -Qd_Quad::THREE_QUARTER_PI;
  }
  if(y == -x) {
    if(y.IsSignPositive()) return Qd_Quad::THREE_QUARTER_PI;
    return -Qd_Quad::QUARTER_PI;
  }

  // Common power of two scaling keeps the squares in range
  int e;
  QD_FREXP(fabs(x.a[0]) > fabs(y.a[0]) ? x.a[0] : y.a[0],&e);
  const Qd_Quad xs = ldexp(x,-e);
  const Qd_Quad ys = ldexp(y,-e);
  const Qd_Quad r = sqrt(sqr(xs) + sqr(ys));
  const Qd_Quad xx = xs/r;
  const Qd_Quad yy = ys/r;

  Qd_Quad z(atan2(y.a[0],x.a[0]));
  Qd_Quad sin_z,cos_z;
  if(fabs(xx.a[0]) > fabs(yy.a[0])) {
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

Qd_Quad atan(const Qd_Quad& x)
{
  return atan2(x,Qd_Quad::ONE);
}

////////////////////////////////////////////////////////////////////////
// Miscellaneous

std::string Qd_DebugString(const Qd_Quad& x)
{
  std::string result("[");
  for(int i=0;i<4;++i) {
    if(i>0) result += std::string(",");
    result += Qd_HexBinaryFloatFormat(x[i]);
  }
  result += std::string("]");
  return result;
}

int
Qd_Quad::QuickTest()
{
  struct Check {
    const char* name;
    Qd_Quad value;
    Qd_Quad truth;
  };
  const Qd_Quad two(2.0);
  const Check checks[] = {
    { "exp(ln2)",    exp(LN2),             two },
    { "log(e)",      log(E),               ONE },
    { "sqrt(2)",     sqrt(two),            SQRT2 },
    { "1/sqrt(2)",   recip(SQRT2),         INV_SQRT2 },
    { "sin(pi/4)",   sin(QUARTER_PI),      INV_SQRT2 },
    { "cos(pi/4)",   cos(QUARTER_PI),      INV_SQRT2 },
    { "atan2(1,1)",  atan2(ONE,ONE),       QUARTER_PI },
    { "atan(1/2)+atan(1/3)",
                     atan(Qd_Quad(0.5)) + atan(1.0/Qd_Quad(3.0)),
                     QUARTER_PI },
    { "log(10)",     log(Qd_Quad(10.0)),   LN10 },
    { "cbrt(2)^3",   powi(cbrt(two),3),    two }
  };
  const double allowed_ulps = 64.0;
  int errcount = 0;
  for(size_t i=0;i<sizeof(checks)/sizeof(checks[0]);++i) {
    const Check& chk = checks[i];
    const double diff = chk.value.ComputeDiffULP(chk.truth,chk.truth.ULP());
    if(!(diff <= allowed_ulps)) {
      ++errcount;
      Qd_Report::Log << Qd_LogSupport::GetLogMark()
                     << "Qd_Quad::QuickTest failure, " << chk.name
                     << ": " << Qd_DebugString(chk.value)
                     << " TRUTH: " << Qd_DebugString(chk.truth)
                     << " (" << diff << " ULP)" << std::endl;
    }
  }
  return errcount;
}
