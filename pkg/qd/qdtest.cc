/* FILE: qdtest.cc
 *  Development test file for Qd_Quad class.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 */

/***************************************************************
Reference values for the function tests are computed at run time with
Boost.Multiprecision cpp_bin_float at 300 bits, starting from the exact
value of each Qd_Quad input.  Errors are reported in units of the
quad-double epsilon, QD_QD_EPS = 2^-209, relative to a scale that
depends on the function:

  relative   |result - ref| / |ref|
  summands   |result - ref| / (|x| + |y|)    (add and subtract)
  unit       |result - ref| / max(1,|ref|)   (log and trig)
***************************************************************/

#include <cfloat>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <boost/multiprecision/cpp_bin_float.hpp>

#include "qd.h"
#include "qdbasic.h"

/* End includes */

using std::cerr;

typedef boost::multiprecision::number<
  boost::multiprecision::cpp_bin_float<300,
    boost::multiprecision::digit_base_2>,
  boost::multiprecision::et_off> BigFloat;

template <typename T, size_t N>
constexpr size_t ArraySize(T (&)[N]) { return N; }

BigFloat ToBig(const Qd_Quad& x)
{
  BigFloat sum = 0;
  for(int i=3;i>=0;--i) sum += BigFloat(x[i]);
  return sum;
}

Qd_Quad FromBig(BigFloat v)
{
  double limb[4];
  for(int i=0;i<4;++i) {
    limb[i] = v.convert_to<double>();
    v -= BigFloat(limb[i]);
  }
  return Qd_Quad(limb[0],limb[1],limb[2],limb[3]);
}

std::string QDWrite(const Qd_Quad& val)
{
  return Qd_DebugString(val);
}

////////////////////////////////////////////////////////////////////////
// Function table.  Each entry pairs a Qd_Quad routine with its Boost
// reference and the domain inputs are drawn from.

enum ErrorScale { ES_RELATIVE, ES_SUMMANDS, ES_UNIT };

typedef Qd_Quad (*QQD_2P)(const Qd_Quad&,const Qd_Quad&);
typedef BigFloat (*BIG_2P)(const BigFloat&,const BigFloat&);

Qd_Quad Add(const Qd_Quad& x,const Qd_Quad& y)      { return x + y; }
Qd_Quad Subtract(const Qd_Quad& x,const Qd_Quad& y) { return x - y; }
Qd_Quad Multiply(const Qd_Quad& x,const Qd_Quad& y) { return x * y; }
Qd_Quad MultiplyD(const Qd_Quad& x,const Qd_Quad& y) { return x * y[0]; }
Qd_Quad AddD(const Qd_Quad& x,const Qd_Quad& y)     { return x + y[0]; }
Qd_Quad Divide(const Qd_Quad& x,const Qd_Quad& y)   { return x / y; }
Qd_Quad Sqr(const Qd_Quad& x,const Qd_Quad&)        { return sqr(x); }
Qd_Quad Sqrt(const Qd_Quad& x,const Qd_Quad&)       { return sqrt(x); }
Qd_Quad Cbrt(const Qd_Quad& x,const Qd_Quad&)       { return cbrt(x); }
Qd_Quad Nroot5(const Qd_Quad& x,const Qd_Quad&)     { return nroot(x,5); }
Qd_Quad Powi7(const Qd_Quad& x,const Qd_Quad&)      { return powi(x,7); }
Qd_Quad Exp(const Qd_Quad& x,const Qd_Quad&)        { return exp(x); }
Qd_Quad Log(const Qd_Quad& x,const Qd_Quad&)        { return log(x); }
Qd_Quad Log10(const Qd_Quad& x,const Qd_Quad&)      { return log10(x); }
Qd_Quad Sin(const Qd_Quad& x,const Qd_Quad&)        { return sin(x); }
Qd_Quad Cos(const Qd_Quad& x,const Qd_Quad&)        { return cos(x); }
Qd_Quad Atan2(const Qd_Quad& y,const Qd_Quad& x)    { return atan2(y,x); }
Qd_Quad Pow(const Qd_Quad& x,const Qd_Quad& y)      { return pow(x,y); }

BigFloat RefAdd(const BigFloat& x,const BigFloat& y)      { return x + y; }
BigFloat RefSubtract(const BigFloat& x,const BigFloat& y) { return x - y; }
BigFloat RefMultiply(const BigFloat& x,const BigFloat& y) { return x * y; }
BigFloat RefDivide(const BigFloat& x,const BigFloat& y)   { return x / y; }
BigFloat RefSqr(const BigFloat& x,const BigFloat&)        { return x * x; }
BigFloat RefSqrt(const BigFloat& x,const BigFloat&)       { return sqrt(x); }
BigFloat RefCbrt(const BigFloat& x,const BigFloat&) {
  return pow(x,BigFloat(1)/3);
}
BigFloat RefNroot5(const BigFloat& x,const BigFloat&) {
  return pow(x,BigFloat(1)/5);
}
BigFloat RefPowi7(const BigFloat& x,const BigFloat&) {
  return x*x*x*x*x*x*x;
}
BigFloat RefExp(const BigFloat& x,const BigFloat&)   { return exp(x); }
BigFloat RefLog(const BigFloat& x,const BigFloat&)   { return log(x); }
BigFloat RefLog10(const BigFloat& x,const BigFloat&) { return log10(x); }
BigFloat RefSin(const BigFloat& x,const BigFloat&)   { return sin(x); }
BigFloat RefCos(const BigFloat& x,const BigFloat&)   { return cos(x); }
BigFloat RefAtan2(const BigFloat& y,const BigFloat& x) {
  return atan2(y,x);
}
BigFloat RefPow(const BigFloat& x,const BigFloat& y) { return pow(x,y); }

struct FuncInfo {
  const char* name;
  QQD_2P fptr;
  BIG_2P refptr;
  ErrorScale scale;
  double ulp_allowance;     // In units of QD_QD_EPS
  double xmin, xmax;        // Domain of x; log-uniform if xlog
  bool xlog;
  double ymin, ymax;        // Domain of y; unused if ymin == ymax
  bool ylog;
  bool randsign;            // Random sign on x and y
};

const FuncInfo func_array[] = {
  { "Add",      Add,      RefAdd,      ES_SUMMANDS,  8,
    1e-10, 1e10, true,  1e-10, 1e10, true, true },
  { "Subtract", Subtract, RefSubtract, ES_SUMMANDS,  8,
    1e-10, 1e10, true,  1e-10, 1e10, true, true },
  { "AddD",     AddD,     RefAdd,      ES_SUMMANDS,  8,
    1e-10, 1e10, true,  1e-10, 1e10, true, true },
  { "Multiply", Multiply, RefMultiply, ES_RELATIVE, 32,
    1e-50, 1e50, true,  1e-50, 1e50, true, true },
  { "MultiplyD",MultiplyD,RefMultiply, ES_RELATIVE, 32,
    1e-50, 1e50, true,  1e-50, 1e50, true, true },
  { "Divide",   Divide,   RefDivide,   ES_RELATIVE, 32,
    1e-50, 1e50, true,  1e-50, 1e50, true, true },
  { "Sqr",      Sqr,      RefSqr,      ES_RELATIVE, 32,
    1e-50, 1e50, true,  0, 0, false, true },
  { "Sqrt",     Sqrt,     RefSqrt,     ES_RELATIVE, 32,
    1e-50, 1e50, true,  0, 0, false, false },
  { "Cbrt",     Cbrt,     RefCbrt,     ES_RELATIVE, 64,
    1e-50, 1e50, true,  0, 0, false, false },
  { "Nroot5",   Nroot5,   RefNroot5,   ES_RELATIVE, 64,
    1e-50, 1e50, true,  0, 0, false, false },
  { "Powi7",    Powi7,    RefPowi7,    ES_RELATIVE, 128,
    1e-5, 1e5, true,  0, 0, false, true },
  { "Exp",      Exp,      RefExp,      ES_RELATIVE, 256,
    -100, 100, false, 0, 0, false, false },
  { "Log",      Log,      RefLog,      ES_UNIT,     128,
    1e-100, 1e100, true,  0, 0, false, false },
  { "Log10",    Log10,    RefLog10,    ES_UNIT,     128,
    1e-100, 1e100, true,  0, 0, false, false },
  { "Sin",      Sin,      RefSin,      ES_UNIT,     256,
    -20, 20, false, 0, 0, false, false },
  { "Cos",      Cos,      RefCos,      ES_UNIT,     256,
    -20, 20, false, 0, 0, false, false },
  { "Atan2",    Atan2,    RefAtan2,    ES_RELATIVE, 256,
    0.1, 10, true,  0.1, 10, true, true },
  { "Pow",      Pow,      RefPow,      ES_RELATIVE, 2048,
    0.1, 10, true,  -8, 8, false, false }
};

const FuncInfo* FindFuncInfo(const char* name)
{
  for(size_t i=0;i<ArraySize(func_array);++i) {
    if(strcmp(name,func_array[i].name)==0) return &(func_array[i]);
  }
  return 0;
}

// Random values with all four limbs populated
class QuadSource {
public:
  explicit QuadSource(unsigned int seed) : gen(seed), unif(0.0,1.0) {}
  double Uniform() { return unif(gen); }
  Qd_Quad Draw(double lo,double hi,bool logscale,bool randsign) {
    double x0;
    if(logscale) {
      x0 = std::exp(std::log(lo) + Uniform()*(std::log(hi)-std::log(lo)));
    } else {
      x0 = lo + Uniform()*(hi-lo);
    }
    if(randsign && Uniform()<0.5) x0 = -x0;
    const double x1 = std::ldexp(x0*(2*Uniform()-1),-54);
    const double x2 = std::ldexp(x0*(2*Uniform()-1),-107);
    const double x3 = std::ldexp(x0*(2*Uniform()-1),-160);
    return Qd_Quad(x0,x1,x2,x3);
  }
private:
  std::mt19937 gen;
  std::uniform_real_distribution<double> unif;
};

double ErrorInEps(const FuncInfo& fi,const Qd_Quad& x,const Qd_Quad& y,
                  const Qd_Quad& result,const BigFloat& ref)
{
  BigFloat denom;
  switch(fi.scale) {
  case ES_SUMMANDS:
    denom = abs(ToBig(x)) + abs(ToBig(y));
    break;
  case ES_UNIT:
    denom = abs(ref);
    if(denom < 1) denom = 1;
    break;
  default:
    denom = abs(ref);
  }
  BigFloat err = abs(ToBig(result) - ref)/denom;
  return err.convert_to<double>()/QD_QD_EPS;
}

int RefTest(const FuncInfo& fi,int point_count,double slack,int verbose,
            double& worst)
{
  QuadSource source(20261017u);
  int errcount = 0;
  worst = 0.0;
  for(int i=0;i<point_count;++i) {
    const Qd_Quad x = source.Draw(fi.xmin,fi.xmax,fi.xlog,fi.randsign);
    Qd_Quad y(1.0);
    if(fi.ymin != fi.ymax) {
      y = source.Draw(fi.ymin,fi.ymax,fi.ylog,fi.randsign);
    }
    if(fi.fptr == MultiplyD || fi.fptr == AddD) {
      y = Qd_Quad(y[0]);
    }
    const Qd_Quad result = fi.fptr(x,y);
    const BigFloat ref = fi.refptr(ToBig(x),ToBig(y));
    const double err = ErrorInEps(fi,x,y,result,ref);
    if(err > worst) worst = err;
    const bool normal = result.IsNormalized();
    if(!normal || !(err <= slack*fi.ulp_allowance)) {
      ++errcount;
      if(verbose) {
        cerr << "Func: " << fi.name << "\n";
        cerr << "   x: " << QDWrite(x) << "\n";
        if(fi.ymin != fi.ymax) cerr << "   y: " << QDWrite(y) << "\n";
        cerr << " Ref: " << QDWrite(FromBig(ref)) << "\n";
        cerr << "Test: " << QDWrite(result) << "\n";
        if(!normal) cerr << "Diff: ERROR: Unnormalized output\n";
        else        cerr << "Diff: " << err << " eps\n";
      }
    }
  }
  return errcount;
}

////////////////////////////////////////////////////////////////////////
// Roots and angles at the ends of the double range.  Inputs are single
// doubles, some subnormal; both Qd_Quad and Qd_Double results are
// checked against the reference for the exact input.

typedef Qd_Double (*DDD_2P)(const Qd_Double&,const Qd_Double&);

Qd_Double DSqrt(const Qd_Double& x,const Qd_Double&)   { return sqrt(x); }
Qd_Double DCbrt(const Qd_Double& x,const Qd_Double&)   { return cbrt(x); }
Qd_Double DNroot5(const Qd_Double& x,const Qd_Double&) { return nroot(x,5); }
Qd_Double DAtan2(const Qd_Double& y,const Qd_Double& x) {
  return atan2(y,x);
}

struct RangeCase {
  const char* func;         // Name in func_array
  DDD_2P dfunc;
  double x, y;
};

const double DD_RANGE_ALLOWANCE = 16; // In units of QD_DD_EPS

int RangeTest(int verbose,int& test_count)
{
  const double big = 0.9*DBL_MAX;
  const double tiny = std::ldexp(1.0,-1074);
  const RangeCase cases[] = {
    { "Sqrt",   DSqrt,   1e-300,   1 },
    { "Sqrt",   DSqrt,   1e300,    1 },
    { "Sqrt",   DSqrt,   1e-310,   1 },
    { "Sqrt",   DSqrt,   4e-320,   1 },
    { "Sqrt",   DSqrt,   tiny,     1 },
    { "Sqrt",   DSqrt,   2.2e-308, 1 },
    { "Sqrt",   DSqrt,   1e308,    1 },
    { "Sqrt",   DSqrt,   big,      1 },
    { "Cbrt",   DCbrt,   1e-300,   1 },
    { "Cbrt",   DCbrt,   1e300,    1 },
    { "Cbrt",   DCbrt,   1e-310,   1 },
    { "Cbrt",   DCbrt,   4e-320,   1 },
    { "Cbrt",   DCbrt,   1e308,    1 },
    { "Cbrt",   DCbrt,   big,      1 },
    { "Nroot5", DNroot5, 1e-300,   1 },
    { "Nroot5", DNroot5, 1e300,    1 },
    { "Nroot5", DNroot5, 1e-310,   1 },
    { "Nroot5", DNroot5, tiny,     1 },
    { "Nroot5", DNroot5, big,      1 },
    { "Atan2",  DAtan2,  1e200,    3e200 },
    { "Atan2",  DAtan2,  -1e-200,  3e-200 },
    { "Atan2",  DAtan2,  1e300,    -2e300 },
    { "Atan2",  DAtan2,  -1e-300,  -4e-300 },
    { "Atan2",  DAtan2,  5e-300,   5e-301 },
    { "Atan2",  DAtan2,  -3e-310,  -7e-310 },
    { "Atan2",  DAtan2,  big,      -0.5*big }
  };

  int errcount = 0;
  test_count = 0;
  for(size_t i=0;i<ArraySize(cases);++i) {
    const RangeCase& rc = cases[i];
    const FuncInfo* fi = FindFuncInfo(rc.func);
    if(fi == 0) {
      std::string msg = "Unknown range test function: ";
      msg += rc.func;
      throw msg;
    }
    const Qd_Quad x(rc.x);
    const Qd_Quad y(rc.y);
    const BigFloat ref = fi->refptr(ToBig(x),ToBig(y));

    const Qd_Quad qresult = fi->fptr(x,y);
    const double qerr = ErrorInEps(*fi,x,y,qresult,ref);
    ++test_count;
    if(!qresult.IsNormalized() || !(qerr <= fi->ulp_allowance)) {
      ++errcount;
      if(verbose) {
        cerr << "FAIL Qd_Quad " << fi->name << "("
             << Qd_HexBinaryFloatFormat(rc.x) << ","
             << Qd_HexBinaryFloatFormat(rc.y) << ")\n"
             << " Ref: " << QDWrite(FromBig(ref)) << "\n"
             << "Test: " << QDWrite(qresult) << "\n"
             << "Diff: " << qerr << " eps\n";
      }
    }

    const Qd_Double dresult = rc.dfunc(Qd_Double(rc.x),Qd_Double(rc.y));
    const BigFloat dbig = BigFloat(dresult.Hi()) + BigFloat(dresult.Lo());
    const BigFloat derr = abs(dbig - ref)/abs(ref);
    const double dd_err = derr.convert_to<double>()/QD_DD_EPS;
    ++test_count;
    if(!dresult.IsNormalized() || !(dd_err <= DD_RANGE_ALLOWANCE)) {
      ++errcount;
      if(verbose) {
        cerr << "FAIL Qd_Double " << fi->name << "("
             << Qd_HexBinaryFloatFormat(rc.x) << ","
             << Qd_HexBinaryFloatFormat(rc.y) << ")\n"
             << " Ref: " << QDWrite(FromBig(ref)) << "\n"
             << "Test: " << Qd_DebugString(dresult) << "\n"
             << "Diff: " << dd_err << " eps\n";
      }
    }
  }
  return errcount;
}

////////////////////////////////////////////////////////////////////////
// Literal and special value checks

Qd_Quad Dec(const char* str)
{
  Qd_Quad value;
  Qd_ParseError error;
  if(!Qd_Parse(str,value,error)) {
    std::string msg = "Bad decimal value \"";
    msg += str;
    msg += "\": ";
    msg += error.GetMessage();
    throw msg;
  }
  return value;
}

struct CloseCheck {
  const char* label;
  Qd_Quad value;
  const char* truth;
};

struct ExactCheck {
  const char* label;
  Qd_Quad value;
  Qd_Quad truth;
};

bool SameValue(const Qd_Quad& a,const Qd_Quad& b)
{
  if(a.IsNaN() || b.IsNaN()) return (a.IsNaN() && b.IsNaN());
  for(int i=0;i<4;++i) {
    if(!Qd_AreEqual(a[i],b[i])) return false;
  }
  return (Qd_SignBit(a[0]) == Qd_SignBit(b[0]));
}

int LiteralTest(int& test_count)
{
  const Qd_Quad NaN = Qd_Quad::QNAN;
  const Qd_Quad Inf = Qd_Quad::POS_INF;
  const Qd_Quad NegInf = Qd_Quad::NEG_INF;
  const Qd_Quad Zero = Qd_Quad::ZERO;
  const Qd_Quad NegZero = Qd_Quad::NEG_ZERO;
  const Qd_Quad One = Qd_Quad::ONE;

  const CloseCheck close_checks[] = {
    { "atan2(1,2)", atan2(Qd_Quad(1),Qd_Quad(2)),
      "0.4636476090008061162142562314612144020285370542861202638109330887" },
    { "atan2(1,-2)", atan2(Qd_Quad(1),Qd_Quad(-2)),
      "2.677945044588987122248387151818288482168632345088985557164011504" },
    { "atan2(-1,2)", atan2(Qd_Quad(-1),Qd_Quad(2)),
      "-0.4636476090008061162142562314612144020285370542861202638109330887"
    },
    { "atan2(-1,-2)", atan2(Qd_Quad(-1),Qd_Quad(-2)),
      "-2.677945044588987122248387151818288482168632345088985557164011504" },
    { "pi+e", Qd_Quad::PI + Qd_Quad::E,
      "5.859874482048838473822930854632165381954416493075065395941912220" },
    { "11.1^4.2", pow(Dec("11.1"),Dec("4.2")),
      "24567.24805421478199532529771567617705237167216222778116359595012" },
    { "pi^0.3", pow(Qd_Quad::PI,Dec("0.3")),
      "1.409759279075053716836003243441716711042960485535248677014414790" },
    { "0.2^3.1", pow(Dec("0.2"),Dec("3.1")),
      "0.006810719380166276826846127381721218763394637801309025289387144601"
    },
    { "0.2^-3.1", pow(Dec("0.2"),Dec("-3.1")),
      "146.8273678860023757393079582114873627092153773446718337101982774" },
    { "3^3.3", pow(Qd_Quad(3),Dec("3.3")),
      "37.54050759852955219310186595463382927684873090166843452920390518" },
    { "sqrt(2)", sqrt(Qd_Quad(2)),
      "1.414213562373095048801688724209698078569671875376948073176679738" },
    { "cbrt(2)", cbrt(Qd_Quad(2)),
      "1.259921049894873164767210607278228350570251464701507980081975112" },
    { "exp(2)", exp(Qd_Quad(2)),
      "7.389056098930650227230427460575007813180315570551847324087127823" },
    { "ln(7)", log(Qd_Quad(7)),
      "1.945910149055313305105352743443179729637084729581861188459390150" },
    { "log2(10)", log2(Qd_Quad(10)),
      "3.321928094887362347870319429489390175864831393024580612054756396" }
  };

  const ExactCheck exact_checks[] = {
    { "0^3", pow(Zero,Qd_Quad(3)), Zero },
    { "-0^3", pow(NegZero,Qd_Quad(3)), Zero },
    { "0^inf", pow(Zero,Inf), Zero },
    { "-0^inf", pow(NegZero,Inf), Zero },
    { "0^-2", pow(Zero,Qd_Quad(-2)), Inf },
    { "-0^-2", pow(NegZero,Qd_Quad(-2)), Inf },
    { "0^-inf", pow(Zero,NegInf), Inf },
    { "-0^-inf", pow(NegZero,NegInf), Inf },
    { "2^0", pow(Qd_Quad(2),Zero), One },
    { "2^-0", pow(Qd_Quad(2),NegZero), One },
    { "0^0", pow(Zero,Zero), NaN },
    { "-0^0", pow(NegZero,Zero), NaN },
    { "0^-0", pow(Zero,NegZero), NaN },
    { "-0^-0", pow(NegZero,NegZero), NaN },
    { "inf^0", pow(Inf,Zero), NaN },
    { "inf^-0", pow(Inf,NegZero), NaN },
    { "-inf^0", pow(NegInf,Zero), NaN },
    { "-inf^-0", pow(NegInf,NegZero), NaN },
    { "2^inf", pow(Qd_Quad(2),Inf), Inf },
    { "2^-inf", pow(Qd_Quad(2),NegInf), Zero },
    { "1^inf", pow(One,Inf), NaN },
    { "1^-inf", pow(One,NegInf), NaN },
    { "nan^3", pow(NaN,Qd_Quad(3)), NaN },
    { "3^nan", pow(Qd_Quad(3),NaN), NaN },
    { "-1^1", pow(-One,One), NaN },

    { "sqrt(-3)", sqrt(Qd_Quad(-3)), NaN },
    { "sqrt(0)", sqrt(Zero), Zero },
    { "sqrt(inf)", sqrt(Inf), Inf },
    { "exp(0)", exp(Zero), One },
    { "exp(-600)", exp(Qd_Quad(-600)), Zero },
    { "exp(710)", exp(Qd_Quad(710)), Inf },
    { "exp(1)", exp(One), Qd_Quad::E },
    { "ln(1)", log(One), Zero },
    { "ln(0)", log(Zero), NegInf },
    { "ln(-1)", log(-One), NaN },
    { "1/0", One/Zero, Inf },
    { "1/-0", One/NegZero, NegInf },
    { "0/0", Zero/Zero, NaN },
    { "0*inf", Zero*Inf, NaN },
    { "inf-inf", Inf - Inf, NaN },
    { "-0+-0", NegZero + NegZero, NegZero },
    { "atan2(0,0)", atan2(Zero,Zero), NaN },
    { "atan2(1,0)", atan2(One,Zero), Qd_Quad::HALF_PI },
    { "atan2(0,-1)", atan2(Zero,-One), Qd_Quad::PI },
    { "atan2(-inf,1)", atan2(NegInf,One), -Qd_Quad::HALF_PI },
    { "atan2(3,3)", atan2(Qd_Quad(3),Qd_Quad(3)), Qd_Quad::QUARTER_PI },
    { "atan2(-3,-3)", atan2(Qd_Quad(-3),Qd_Quad(-3)),
      -Qd_Quad::THREE_QUARTER_PI },
    { "powi(3,4)", powi(Qd_Quad(3),4), Qd_Quad(81) },
    { "floor(3-tiny)", floor(Qd_Quad(3.0,0.0,0.0,-1e-60)), Qd_Quad(2) },
    { "ceil(3+tiny)", ceil(Qd_Quad(3.0,0.0,0.0,1e-60)), Qd_Quad(4) },
    { "quad(double)", Qd_Quad(Qd_Double::PI).ToDouble(), Qd_Double::PI },
    { "quad(pi).todouble", Qd_Quad::PI.ToDouble(), Qd_Double::PI }
  };

  int errcount = 0;
  const int close_count = static_cast<int>(ArraySize(close_checks));
  for(int i=0;i<close_count;++i) {
    const CloseCheck& chk = close_checks[i];
    const Qd_Quad truth = Dec(chk.truth);
    const Qd_Quad diff = fabs(chk.value - truth);
    if(!(diff <= 1e-60*fabs(truth)) || !chk.value.IsNormalized()) {
      ++errcount;
      cerr << "FAIL " << chk.label << "\n"
           << "  Test: " << Qd_Format(chk.value,Qd_FormatSpec()) << "\n"
           << "   Ref: " << chk.truth << "\n"
           << "  Diff: " << diff[0] << "\n";
    }
  }
  const int exact_count = static_cast<int>(ArraySize(exact_checks));
  for(int i=0;i<exact_count;++i) {
    const ExactCheck& chk = exact_checks[i];
    if(!SameValue(chk.value,chk.truth)) {
      ++errcount;
      cerr << "FAIL " << chk.label << "\n"
           << "  Test: " << QDWrite(chk.value) << "\n"
           << "   Ref: " << QDWrite(chk.truth) << "\n";
    }
  }
  test_count = close_count + exact_count;
  return errcount;
}

////////////////////////////////////////////////////////////////////////
// Properties of the error-free transforms, renormalization, and
// function pairs.

// Unit in the last place of a double, for finite nonzero x.
double DoubleULP(double x)
{
  int exp;
  QD_FREXP(x,&exp);
  return Qd_LdExp(1.0,exp-QD_DOUBLE_MANTISSA_PRECISION);
}

int PropertyTest(int point_count,int& test_count)
{
  QuadSource source(4187u);
  int errcount = 0;
  test_count = 0;

  for(int i=0;i<point_count;++i) {
    const double a = source.Draw(1e-30,1e30,true,true)[0];
    const double b = source.Draw(1e-30,1e30,true,true)[0];

    double s,e;
    Qd_TwoSum(a,b,s,e);
    ++test_count;
    if(BigFloat(s) + BigFloat(e) != BigFloat(a) + BigFloat(b)
       || (s != 0.0 && !(std::fabs(e) <= 0.5*DoubleULP(s)))) {
      ++errcount;
      cerr << "FAIL two_sum(" << Qd_HexBinaryFloatFormat(a) << ","
           << Qd_HexBinaryFloatFormat(b) << ") = "
           << Qd_HexBinaryFloatFormat(s) << " + "
           << Qd_HexBinaryFloatFormat(e) << "\n";
    }

    double p;
    Qd_TwoProd(a,b,p,e);
    ++test_count;
    if(BigFloat(p) + BigFloat(e) != BigFloat(a) * BigFloat(b)) {
      ++errcount;
      cerr << "FAIL two_prod(" << Qd_HexBinaryFloatFormat(a) << ","
           << Qd_HexBinaryFloatFormat(b) << ") = "
           << Qd_HexBinaryFloatFormat(p) << " + "
           << Qd_HexBinaryFloatFormat(e) << "\n";
    }
  }

  for(int i=0;i<point_count;++i) {
    const Qd_Quad x = source.Draw(1e-30,1e30,true,false);
    const Qd_Quad y = source.Draw(1e-30,1e30,true,true);

    // Renormalizing a canonical sum leaves it unchanged
    const Qd_Quad sum = x + y;
    double c0 = sum[0], c1 = sum[1], c2 = sum[2], c3 = sum[3];
    Qd_Renormalize(c0,c1,c2,c3);
    ++test_count;
    if(c0 != sum[0] || c1 != sum[1] || c2 != sum[2] || c3 != sum[3]) {
      ++errcount;
      cerr << "FAIL renormalize " << QDWrite(sum) << " -> "
           << QDWrite(Qd_Quad::FromLimbs(c0,c1,c2,c3)) << "\n";
    }

    // sqrt(x)^2 == x
    const Qd_Quad root = sqrt(x);
    const Qd_Quad sq = sqr(root);
    ++test_count;
    if(!(fabs(sq - x) <= 16.0*QD_QD_EPS*x)) {
      ++errcount;
      cerr << "FAIL sqrt(x)^2, x = " << QDWrite(x)
           << ", sqrt(x)^2 = " << QDWrite(sq) << "\n";
    }

    // exp(log(x)) == x
    const Qd_Quad ex = exp(log(x));
    ++test_count;
    if(!(fabs(ex - x) <= 512.0*QD_QD_EPS*x)) {
      ++errcount;
      cerr << "FAIL exp(log(x)), x = " << QDWrite(x)
           << ", exp(log(x)) = " << QDWrite(ex) << "\n";
    }

    // sin^2 + cos^2 == 1
    Qd_Quad sinx,cosx;
    sincos(log(x),sinx,cosx);
    const Qd_Quad one = sqr(sinx) + sqr(cosx);
    ++test_count;
    if(!(fabs(one - 1.0) <= 64.0*QD_QD_EPS)) {
      ++errcount;
      cerr << "FAIL sin^2+cos^2, x = " << QDWrite(log(x))
           << ", sum = " << QDWrite(one) << "\n";
    }
  }
  return errcount;
}

////////////////////////////////////////////////////////////////////////

void Usage()
{
  fprintf(stderr,"Usage: qdtest quicktest\n");
  fprintf(stderr," or\n");
  fprintf(stderr,"       qdtest reftest [-slack amount] [-points count]"
          " [-verbose[=#]] [func ...]\n");
  fprintf(stderr," or\n");
  fprintf(stderr,"       qdtest literaltest\n");
  fprintf(stderr," or\n");
  fprintf(stderr,"       qdtest propertytest [-points count]\n");
  fprintf(stderr," or\n");
  fprintf(stderr,"       qdtest rangetest [-verbose[=#]]\n");
  fprintf(stderr,"Reference test functions---\n");
  size_t istop = ArraySize(func_array);
  for(size_t i=0;i<istop;++i) {
    fprintf(stderr,"%18s",func_array[i].name);
    if((i+1)%4==0 || (i+1)==istop) fputs("\n",stderr);
  }
  exit(1);
}

int ReportResult(int error_count,int test_count)
{
  if(error_count>0) {
    fprintf(stderr,"ERROR: %d/%d tests failed.\n",error_count,test_count);
    return 1;
  }
  printf("All %d tests passed.\n",test_count);
  return 0;
}

int wrapped_main(int argc,char** argv)
{
  if(argc<2) Usage();

  if(argc==2 && strcmp("quicktest",argv[1])==0) {
    if(Qd_Quad::QuickTest()) {
      fprintf(stderr,"QuickTest failure.\n");
      return 1;
    }
    printf("QuickTest passed.\n");
    return 0;
  }

  if(argc==2 && strcmp("literaltest",argv[1])==0) {
    int test_count = 0;
    const int error_count = LiteralTest(test_count);
    return ReportResult(error_count,test_count);
  }

  double slack = 1.0;
  int point_count = 100;
  int verbose = 1;
  std::vector<const FuncInfo*> funcs;
  for(int i=2;i<argc;++i) {
    if(strcmp("-slack",argv[i])==0 && i+1<argc) {
      char* endptr;
      slack = strtod(argv[++i],&endptr);
      if(*endptr != '\0' || slack<0.0) Usage();
    } else if(strcmp("-points",argv[i])==0 && i+1<argc) {
      point_count = atoi(argv[++i]);
      if(point_count<1) Usage();
    } else if(strncmp("-verbose",argv[i],8)==0) {
      verbose = 2;
      if(argv[i][8] == '=') verbose = atoi(argv[i]+9);
      else if(argv[i][8] != '\0') Usage();
    } else {
      const FuncInfo* fi = FindFuncInfo(argv[i]);
      if(fi == 0) Usage();
      funcs.push_back(fi);
    }
  }

  if(strcmp("propertytest",argv[1])==0) {
    if(!funcs.empty()) Usage();
    int test_count = 0;
    const int error_count = PropertyTest(point_count,test_count);
    return ReportResult(error_count,test_count);
  }

  if(strcmp("rangetest",argv[1])==0) {
    if(!funcs.empty()) Usage();
    int test_count = 0;
    const int error_count = RangeTest(verbose,test_count);
    return ReportResult(error_count,test_count);
  }

  if(strcmp("reftest",argv[1])==0) {
    if(funcs.empty()) {
      for(size_t i=0;i<ArraySize(func_array);++i) {
        funcs.push_back(&(func_array[i]));
      }
    }
    int error_count = 0;
    int test_count = 0;
    for(size_t i=0;i<funcs.size();++i) {
      double worst;
      const int errs = RefTest(*funcs[i],point_count,slack,verbose,worst);
      if(verbose>=2) {
        printf("%-10s max error %8.2f eps (allowed %6.0f)\n",
               funcs[i]->name,worst,slack*funcs[i]->ulp_allowance);
      }
      error_count += errs;
      test_count += point_count;
    }
    return ReportResult(error_count,test_count);
  }

  Usage();
  return 1;
}

int main(int argc,char** argv)
{
  try {
    return wrapped_main(argc,argv);
  } catch(const Qd_Exception& err) {
    std::string msg;
    cerr << err.ConstructMessage(msg);
  } catch(const char* msg) {
    cerr << msg;
  } catch(const std::string& msg) {
    cerr << msg;
  }
  cerr << "\n";
  return 9;
}
