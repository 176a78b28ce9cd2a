/* FILE: qdbasic.h                    -*-Mode: c++-*-
 *
 * Error-free transforms and renormalization on double limbs, shared
 * by the Qd_Double and Qd_Quad classes.
 *
 *  Algorithms based on TJ Dekker, "A floating-point technique for
 *  extending the available precision," Numer. Math. 18, 224-242 (1971),
 *  Jonathan Richard Shewchuk, "Adaptive precision floating-point
 *  arithmetic and fast robust geometric predicates," Discrete and
 *  Computational Geometry, 18, 305-363 (1997), and Y Hida, XS Li,
 *  DH Bailey, "Library for double-double and quad-double arithmetic,"
 *  (2007).
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 * NOTE: Every file that includes this header must be compiled with
 * floating-point contraction disabled (-ffp-contract=off) and without
 * value-unsafe optimizations (-ffast-math and the like).  Each
 * expression below must round exactly once, in double.
 */

#ifndef _QD_BASIC
#define _QD_BASIC

#include <cmath>

#include "qdcommon.h"

/* End includes */

////////////////////////////////////////////////////////////////////////
// Two term transforms.  Each returns u = fl(op) and v, the exact
// rounding error, so that u + v == op exactly.

// Requires |x| >= |y| (or x == 0).  With the ordering violated the
// result is finite but v is not exact.
inline void
Qd_OrderedTwoSum(double x,double y,double& u,double& v)
{
  u = x + y;
  double t1 = u - x;
  v = y - t1;
}

// Any ordering.  Branch free (Knuth).
inline void
Qd_TwoSum(double x,double y,double& u,double& v)
{
  u = x + y;
  double t1 = u - x;
  double t2 = u - t1;
  double t3 = y - t1;
  double t4 = x - t2;
  v = t4 + t3;
}

inline void
Qd_TwoDiff(double x,double y,double& u,double& v)
{
  u = x - y;
  double t1 = u - x;
  double t2 = u - t1;
  double t3 = y + t1;
  double t4 = x - t2;
  v = t4 - t3;
}

// Splits x into x0 + x1, each with at most half the mantissa bits.
// Values above QD_DD_SPLITMAX are scaled down first so the split
// multiplier can't overflow.
inline void
Qd_Split(double x,double& x0,double& x1)
{
  if(x > QD_DD_SPLITMAX || x < -QD_DD_SPLITMAX) {
    x *= 3.7252902984619140625e-09;  // 2^-28
    double t = QD_DD_SPLITMAGIC*x;
    x0 = t - (t - x);
    x1 = x - x0;
    x0 *= 268435456.0;  // 2^28
    x1 *= 268435456.0;
    return;
  }
  double t = QD_DD_SPLITMAGIC*x;
  x0 = t - (t - x);
  x1 = x - x0;
}

inline void
Qd_TwoProd(double x,double y,double& u,double& v)
{
  u = x*y;
#if QD_USE_FMA
  v = std::fma(x,y,-u);
#else
  double x0,x1,y0,y1;
  Qd_Split(x,x0,x1);
  Qd_Split(y,y0,y1);
  v = ((x0*y0 - u) + x0*y1 + x1*y0) + x1*y1;
#endif
}

// Square, with the two cross terms folded together.
inline void
Qd_SquareProd(double x,double& u,double& v)
{
  u = x*x;
#if QD_USE_FMA
  v = std::fma(x,x,-u);
#else
  double x0,x1;
  Qd_Split(x,x0,x1);
  v = ((x0*x0 - u) + 2.0*x0*x1) + x1*x1;
#endif
}

////////////////////////////////////////////////////////////////////////
// Three term helpers for the 4-limb class.

// On exit a+b+c holds the same sum, with a the leading term.
inline void
Qd_ThreeSum(double& a,double& b,double& c)
{
  double t1,t2,t3;
  Qd_TwoSum(a,b,t1,t2);
  Qd_TwoSum(c,t1,a,t3);
  Qd_TwoSum(t2,t3,b,c);
}

// As Qd_ThreeSum, but only the leading two terms are kept.
inline void
Qd_ThreeSumTwo(double& a,double& b,double c)
{
  double t1,t2,t3;
  Qd_TwoSum(a,b,t1,t2);
  Qd_TwoSum(c,t1,a,t3);
  b = t2 + t3;
}

// Adds t into the accumulator (u,v).  If the accumulator fills up
// (both parts nonzero after the add) the leading part is returned as a
// finished limb.  Otherwise the accumulator is repacked and 0.0 is
// returned.
inline double
Qd_Accumulate(double& u,double& v,double t)
{
  double s;
  Qd_TwoSum(v,t,s,v);
  Qd_TwoSum(u,s,s,u);
  const bool zu = (u != 0.0);
  const bool zv = (v != 0.0);
  if(zu && zv) return s;
  if(!zv) {
    v = u;
    u = s;
  } else {
    u = s;
  }
  return 0.0;
}

////////////////////////////////////////////////////////////////////////
// Renormalization.  Collapses an overlapping sequence of limbs into
// nonoverlapping, magnitude descending form.  Sequences with an
// infinite leading limb are left untouched.  For a given input the
// output is bit-identical on every call.

// Two limbs.  Requires |c0| >= |c1|.
inline void
Qd_Renormalize(double& c0,double& c1)
{
  double s;
  Qd_OrderedTwoSum(c0,c1,s,c1);
  c0 = s;
}

// Four limbs to four.
inline void
Qd_Renormalize(double& c0,double& c1,double& c2,double& c3)
{
  if(Qd_IsPosInf(c0) || Qd_IsNegInf(c0)) return;

  // Carry pass, least significant first
  double s0,s1,s2=0.0,s3=0.0;
  Qd_OrderedTwoSum(c2,c3,s0,c3);
  Qd_OrderedTwoSum(c1,s0,s0,c2);
  Qd_OrderedTwoSum(c0,s0,c0,c1);

  // Compress pass, skipping zero limbs
  s0 = c0;
  s1 = c1;
  if(s1 != 0.0) {
    Qd_OrderedTwoSum(s1,c2,s1,s2);
    if(s2 != 0.0) {
      Qd_OrderedTwoSum(s2,c3,s2,s3);
    } else {
      Qd_OrderedTwoSum(s1,c3,s1,s2);
    }
  } else {
    Qd_OrderedTwoSum(s0,c2,s0,s1);
    if(s1 != 0.0) {
      Qd_OrderedTwoSum(s1,c3,s1,s2);
    } else {
      Qd_OrderedTwoSum(s0,c3,s0,s1);
    }
  }
  c0 = s0;  c1 = s1;  c2 = s2;  c3 = s3;
}

// Five limbs to four.  Precision in c4 beyond what fits in the fourth
// output limb is dropped.
inline void
Qd_Renormalize(double& c0,double& c1,double& c2,double& c3,double& c4)
{
  if(Qd_IsPosInf(c0) || Qd_IsNegInf(c0)) return;

  double s0,s1,s2=0.0,s3=0.0;
  Qd_OrderedTwoSum(c3,c4,s0,c4);
  Qd_OrderedTwoSum(c2,s0,s0,c3);
  Qd_OrderedTwoSum(c1,s0,s0,c2);
  Qd_OrderedTwoSum(c0,s0,c0,c1);

  s0 = c0;
  s1 = c1;
  if(s1 != 0.0) {
    Qd_OrderedTwoSum(s1,c2,s1,s2);
    if(s2 != 0.0) {
      Qd_OrderedTwoSum(s2,c3,s2,s3);
      if(s3 != 0.0) {
        s3 += c4;
      } else {
        Qd_OrderedTwoSum(s2,c4,s2,s3);
      }
    } else {
      Qd_OrderedTwoSum(s1,c3,s1,s2);
      if(s2 != 0.0) {
        Qd_OrderedTwoSum(s2,c4,s2,s3);
      } else {
        Qd_OrderedTwoSum(s1,c4,s1,s2);
      }
    }
  } else {
    Qd_OrderedTwoSum(s0,c2,s0,s1);
    if(s1 != 0.0) {
      Qd_OrderedTwoSum(s1,c3,s1,s2);
      if(s2 != 0.0) {
        Qd_OrderedTwoSum(s2,c4,s2,s3);
      } else {
        Qd_OrderedTwoSum(s1,c4,s1,s2);
      }
    } else {
      Qd_OrderedTwoSum(s0,c3,s0,s1);
      if(s1 != 0.0) {
        Qd_OrderedTwoSum(s1,c4,s1,s2);
      } else {
        Qd_OrderedTwoSum(s0,c4,s0,s1);
      }
    }
  }
  c0 = s0;  c1 = s1;  c2 = s2;  c3 = s3;
}

#endif // _QD_BASIC
