/* FILE: build_port.cc
 *
 * This program probes the native double type and writes out the
 * platform specific header for the Qd extension, called qdport.h.
 * The build runs this program first, and then compiles the Qd C++
 * sources, which #include qdport.h for the floating-point limits and
 * for the selection between the fma and split implementations of the
 * exact product.
 *
 * The Qd sources must be compiled with the same floating-point
 * options as this program.  The compile line is passed in on the
 * command line so it can be recorded inside qdport.h.  In particular,
 * every limb operation relies on each double expression being rounded
 * exactly once.  If this program detects extra intermediate precision
 * (x87 style evaluation) it refuses to write the header.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 */

#include <cassert>

#include <cmath>
#include <cfloat>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

/* End includes */

////////////////////////////////////////////////////////////////////////
// Support code

int PrintDecimalDigits(int precision)
{ // Number of decimal digits needed to exactly specify a binary value
  // of precision bits.  See Steele and White, "How to print floating
  // point numbers accurately," ACM SIGPLAN NOTICES 39, 372-389 (2004).
  // From B^(N-1) > b^n with b=2, B=10:
  //
  //    N = 2 + floor(precision*log10(2))
  //
  if(precision == 53) return 17; // 8-byte IEEE float
  return 2 + int(floor(precision*log(2.)/log(10.)));
}

// Write val in scientific notation with enough digits to reproduce
// it exactly.
template <class floatType>
std::string NumberToString(floatType val,int digits)
{
  std::stringbuf strbuf;
  std::ostream ostrbuf(&strbuf);
  ostrbuf << std::scientific << std::setprecision(digits-1) << val;
  return strbuf.str();
}

unsigned int HasExtraDoublePrecisionTest()
{ // Returns non-zero if incorrect rounding was detected, which
  // presumably indicates double rounding through wider intermediates.
  // A zero return is suggestive, but not proof, of single rounding.
  const int n = DBL_MANT_DIG-1;
  volatile double t = pow(2.0,double(n))-1.0;
  double y = t*pow(2.0,double(-n-1));
  double x = t + pow(2.0,double(52));
  double za =  x + y;
  double zb = -x - y;
  double zc =  x - y;
  unsigned int error = 0;
  volatile double check = x;
  if(za !=  check) error |= 1;
  if(zb != -check) error |= 2;
  if(zc !=  check) error |= 4;
  return error;
}

unsigned int HasExtraDoublePrecision()
{ // Combine the run-time test with the C99 FLT_EVAL_METHOD claim.
  // Values 0 and 1 mean double expressions are evaluated in double.
  // Value 2 means everything goes through long double, which breaks
  // the error-free transforms.
  unsigned int extra_precision = HasExtraDoublePrecisionTest();
#ifdef FLT_EVAL_METHOD
  if(FLT_EVAL_METHOD==0 || FLT_EVAL_METHOD==1) {
    if(extra_precision) {
      fprintf(stderr,
              "\nWARNING: Macro FLT_EVAL_METHOD claims no extra"
              " intermediate precision,\n       but extra precision"
              " detected by HasExtraDoublePrecisionTest().\n");
    }
  } else if(FLT_EVAL_METHOD>=2) {
    if(!extra_precision && sizeof(double)!=sizeof(long double)) {
      fprintf(stderr,
      "\nWARNING: Macro FLT_EVAL_METHOD warns extra precision, although\n"
      "         HasExtraDoublePrecisionTest() didn't find it.\n");
      extra_precision = 8;
    }
  }
#endif // FLT_EVAL_METHOD
  return extra_precision;
}

// Check to see if std::fma(a,b,c) does one rounding or two.  Returns
// 0 if one rounding, 1 if more than one rounding, 2 if can't tell.
int CheckFmaRounding(double eps)
{
  if(std::numeric_limits<double>::radix != 2) return 2;
  assert(eps<1./64.);
  volatile double a = 1 + 8*eps;
  volatile double b = 1 + (1./64.);
  volatile double c = 7.*eps/16.;
  double d = std::fma(a,b,c);
  double correct = 1. + (1./64.) + 8*eps + eps;
  if(d != correct) return 1;
  return 0;
}

int MantissaWidth()
{
  volatile double test = 2.0;
  test /= 3.0; test -= 0.5;
  test *= 3;   test -= 0.5;
  if(test<0.0) test *= -1;
  return static_cast<int>(0.5-log(test)/log(2.));
}

void FloatExtremes(int& verytiny, int& tiny, int& giant)
{ // Power-of-two exponents for
  //   verytiny = smallest non-zero value
  //       tiny = smallest normal value
  //      giant = smallest non-representable power-of-two
  // computed directly rather than trusting DBL_MIN_EXP/DBL_MAX_EXP.
  int i;
  volatile double testa;
  volatile double testb;
  volatile double check;
  i = 0;  testa = 1.0;  testb = 2.0;
  while(testa < testb) {
    testa = testb;  testb *= 2.0;  ++i;
  }
  giant = i;

  i = 0;  testa = 1.0;  testb = 2.0;
  while(0.0 < testa && testa < testb) {
    testb = testa;  testa *= 0.5;  --i;
  }
  verytiny = i + 1;  // testb = 2**verytiny

  // Gradual underflow?
  testa = 4 * testb;
  testa += testb;
  testa /= 2;
  if(testa != 2*testb) {
    tiny = verytiny;
  } else {
    testa = 1.0;
    for(i=0;i>verytiny;--i) {
      check = testa + testb;
      if(check != testa) break;
      testa *= 0.5;
    }
    tiny = i;
  }
}

double PowerOfTwo(int n)
{ // Exact 2^n by repeated scaling, safe through the subnormal range.
  volatile double pot = 1.0;
  for(int i=0;i<n;++i)  pot *= 2.0;
  for(int i=0;i>n;--i)  pot *= 0.5;
  return pot;
}

void FloatMinMaxEpsilon
(int tiny_exp,int giant_exp,int mantissa_width,
 double& min, double& max, double& epsilon, double& pow_2_mantissa)
{
  min = PowerOfTwo(tiny_exp);
  volatile double maxtest = 1.0 - PowerOfTwo(-mantissa_width);
  for(int i=0;i<giant_exp;++i) maxtest *= 2;
  max = maxtest;
  pow_2_mantissa = PowerOfTwo(mantissa_width);
  epsilon = 2.0/pow_2_mantissa;
}

void MultiLimbSpecialValues
(int giant_exp, int mantissa_width,
 double& dd_splitmax, double& dd_epsilon, double& qd_epsilon)
{ // Limits for the 2 and 4 limb types built on double.
  //
  //   dd_splitmax = 2^(H-1-(p+1)/2), largest value Split() handles
  //                 without overflow
  //   dd_epsilon  = 2^(2-2p)  (2^-104 for IEEE double)
  //   qd_epsilon  = 2^(3-4p)  (2^-209 for IEEE double)
  dd_splitmax = PowerOfTwo(giant_exp - 1 - (mantissa_width+1)/2);
  dd_epsilon = PowerOfTwo(2 - 2*mantissa_width);
  qd_epsilon = PowerOfTwo(3 - 4*mantissa_width);
}

////////////////////////////////////////////////////////////////////////
// Header writer

void Usage()
{
  fprintf(stderr,"Usage: build_port [-o qdport.h] compile_cmd...\n");
  exit(1);
}

int main(int argc,char** argv)
{
  int argstart = 1;
  if(argc>2 && strcmp(argv[1],"-o")==0) {
    if(freopen(argv[2],"w",stdout) == NULL) {
      fprintf(stderr,"ERROR: Unable to open \"%s\" for writing.\n",
              argv[2]);
      return 4;
    }
    argstart = 3;
  }
  if(argc<=argstart) Usage();

  if(std::numeric_limits<double>::radix != 2) {
    fprintf(stderr,"ERROR: Qd requires a radix 2 double type.\n");
    return 2;
  }
  unsigned int extra_precision = HasExtraDoublePrecision();
  if(extra_precision) {
    fprintf(stderr,"ERROR: Extra intermediate precision detected"
            " in double arithmetic (code %u).\n"
            "       Rebuild with SSE2 (or equivalent) floating point.\n",
            extra_precision);
    return 3;
  }

  const int mantissa_width = MantissaWidth();
  if(mantissa_width != DBL_MANT_DIG) {
    fprintf(stderr,"WARNING: Computed mantissa width %d differs"
            " from DBL_MANT_DIG %d\n",mantissa_width,DBL_MANT_DIG);
  }
  int verytiny_exp, tiny_exp, giant_exp;
  FloatExtremes(verytiny_exp,tiny_exp,giant_exp);

  double min, max, epsilon, pow_2_mantissa;
  FloatMinMaxEpsilon(tiny_exp,giant_exp,mantissa_width,
                     min,max,epsilon,pow_2_mantissa);

  double dd_splitmax, dd_epsilon, qd_epsilon;
  MultiLimbSpecialValues(giant_exp,mantissa_width,
                         dd_splitmax,dd_epsilon,qd_epsilon);

  const int fma_check = CheckFmaRounding(epsilon);
  const int digits = PrintDecimalDigits(mantissa_width);

  std::string compile_cmd;
  for(int i=argstart;i<argc;++i) {
    if(i>argstart) compile_cmd += " ";
    compile_cmd += argv[i];
  }

  printf("/* FILE: qdport.h             -*-Mode: c++-*-\n"
         " *\n"
         " * Platform specific header for the Qd extension.\n"
         " * This is a machine-generated file.  DO NOT EDIT!\n"
         " *\n"
         " * Generated by build_port with compile command\n"
         " *   %s\n"
         " */\n\n",compile_cmd.c_str());

  printf("#ifndef _QD_PORT_H\n#define _QD_PORT_H\n\n");
  printf("#include <cmath>\n#include <cfloat>\n#include <limits>\n\n");

  printf("#define QD_FLT_RADIX %d\n",std::numeric_limits<double>::radix);
  printf("#define QD_HAVE_COPYSIGN 1\n");
  printf("#define QD_USE_FMA %d\n\n",(fma_check == 0 ? 1 : 0));

  printf("#define QD_DOUBLE_MANTISSA_PRECISION %d\n",mantissa_width);
  printf("#define QD_DOUBLE_DECIMAL_DIGITS %d\n",digits);
  printf("#define QD_DOUBLE_HUGE_EXP %d\n",giant_exp);
  printf("#define QD_DOUBLE_TINY_EXP %d\n",tiny_exp);
  printf("#define QD_DOUBLE_VERYTINY_EXP %d\n",verytiny_exp);
  printf("#define QD_DOUBLE_MAX %s\n",
         NumberToString(max,digits).c_str());
  printf("#define QD_DOUBLE_MIN %s\n",
         NumberToString(min,digits).c_str());
  printf("#define QD_DOUBLE_EPSILON %s\n",
         NumberToString(epsilon,digits).c_str());
  printf("#define QD_DOUBLE_POW_2_MANTISSA %s\n\n",
         NumberToString(pow_2_mantissa,digits).c_str());

  printf("#define QD_DD_SPLITMAGIC %s\n",
         NumberToString(PowerOfTwo((mantissa_width+1)/2)+1.0,digits).c_str());
  printf("#define QD_DD_SPLITMAX %s\n",
         NumberToString(dd_splitmax,digits).c_str());
  printf("#define QD_DD_EPS %s\n",
         NumberToString(dd_epsilon,digits).c_str());
  printf("#define QD_QD_EPS %s\n\n",
         NumberToString(qd_epsilon,digits).c_str());

  printf("inline double QD_FREXP(double x,int* exp)"
         " { return std::frexp(x,exp); }\n");
  printf("inline double QD_FLOOR(double x)"
         " { return std::floor(x); }\n");
  printf("inline double QD_CEIL(double x)"
         " { return std::ceil(x); }\n\n");

  printf("const double QD_INFINITY"
         " = std::numeric_limits<double>::infinity();\n");
  printf("const double QD_NAN"
         " = std::numeric_limits<double>::quiet_NaN();\n\n");

  printf("#endif // _QD_PORT_H\n");
  return 0;
}
