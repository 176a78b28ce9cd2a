/* FILE: iotest.cc
 *  Development test file for decimal formatting and parsing of
 *  Qd_Double and Qd_Quad, and for the Tcl command interface.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 */

#include <cmath>
#include <cstdio>
#include <cstring>

#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "qd.h"

/* End includes */

using std::cerr;

template <typename T, size_t N>
constexpr size_t ArraySize(T (&)[N]) { return N; }

////////////////////////////////////////////////////////////////////////
// Formatting

struct FormatCheck {
  double x;
  const char* spec;
  const char* expected;
};

const FormatCheck format_checks[] = {
  { 23.0,          ".3",       "23.000" },
  { 0.016777216,   ".3e",      "1.678e-2" },
  { 123456.0,      "*^+12e",   "*+1.23456e5*" },
  { 0.0,           "",         "0" },
  { 0.0,           ".2",       "0.00" },
  { -0.0,          ".2",       "-0.00" },
  { 0.0,           ".2e",      "0.00e0" },
  { 0.5,           "",         "0.5" },
  { 1.0,           "",         "1" },
  { 1e20,          "",         "100000000000000000000" },
  { 2.5,           ".0",       "3" },
  { -2.25,         ".1",       "-2.3" },
  { 9.99,          ".1",       "10.0" },
  { 0.05,          ".1",       "0.1" },
  { 0.04,          ".1",       "0.0" },
  { 0.001,         ".1",       "0.0" },
  { 3.5,           "<8.2",     "3.50    " },
  { 3.5,           "0>6.1",    "0003.5" },
  { 3.5,           "^7.1",     "  3.5  " },
  { 7.0,           "+.2",      "+7.00" },
  { 1250.0,        ".1E",      "1.3E3" },
  { -0.00123,      ".2e",      "-1.23e-3" },
  { HUGE_VAL,      "",         "inf" },
  { -HUGE_VAL,     "+",        "-inf" },
  { HUGE_VAL,      "+.3",      "+inf" },
  { NAN,           "+.3",      "NaN" },
  { NAN,           ">5",       "  NaN" },
};

template<class T>
int RunFormatChecks(const char* tname,int& test_count)
{
  int error_count = 0;
  for(size_t i=0;i<ArraySize(format_checks);++i) {
    const FormatCheck& check = format_checks[i];
    Qd_FormatSpec spec;
    ++test_count;
    if(!Qd_FormatSpec::Parse(check.spec,spec)) {
      fprintf(stderr,"ERROR: format spec \"%s\" rejected\n",check.spec);
      ++error_count;
      continue;
    }
    const std::string result = Qd_Format(T(check.x),spec);
    if(result.compare(check.expected) != 0) {
      fprintf(stderr,"ERROR: %s format \"%s\" of %.17g\n"
              "  result: \"%s\"\nexpected: \"%s\"\n",
              tname,check.spec,check.x,result.c_str(),check.expected);
      ++error_count;
    }
  }
  return error_count;
}

int FormatTest(int& test_count)
{
  int error_count = RunFormatChecks<Qd_Double>("double",test_count)
    + RunFormatChecks<Qd_Quad>("quad",test_count);

  const char* bad_specs[] = { "abc", ".", ".e", "10.3x", "+-3", "<<x" };
  for(size_t i=0;i<ArraySize(bad_specs);++i) {
    Qd_FormatSpec spec;
    spec.width = 99;
    ++test_count;
    if(Qd_FormatSpec::Parse(bad_specs[i],spec) || spec.width != 99) {
      fprintf(stderr,"ERROR: bad format spec \"%s\" accepted\n",
              bad_specs[i]);
      ++error_count;
    }
  }

  // Without a precision all significant digits are produced
  const Qd_FormatSpec plain;
  const std::string dd_third = Qd_Format(Qd_Double(1)/Qd_Double(3),plain);
  const std::string qd_third = Qd_Format(Qd_Quad(1)/Qd_Quad(3),plain);
  const std::string dd_expected = "0." + std::string(Qd_Double::DIGITS,'3');
  const std::string qd_expected = "0." + std::string(Qd_Quad::DIGITS,'3');
  test_count += 2;
  if(dd_third.compare(dd_expected) != 0) {
    fprintf(stderr,"ERROR: double 1/3 formats as \"%s\"\n",
            dd_third.c_str());
    ++error_count;
  }
  if(qd_third.compare(qd_expected) != 0) {
    fprintf(stderr,"ERROR: quad 1/3 formats as \"%s\"\n",
            qd_third.c_str());
    ++error_count;
  }
  return error_count;
}

////////////////////////////////////////////////////////////////////////
// Parsing

enum ParseOutcome { PARSE_OK, PARSE_EMPTY, PARSE_INVALID };

struct ParseCheck {
  const char* text;
  ParseOutcome outcome;
  double expected;  // Exact value of the lead limb when PARSE_OK
};

const ParseCheck parse_checks[] = {
  { "",              PARSE_EMPTY,   0.0 },
  { "   \t\n",       PARSE_EMPTY,   0.0 },
  { "1.2.3",         PARSE_INVALID, 0.0 },
  { "abc",           PARSE_INVALID, 0.0 },
  { "1e",            PARSE_INVALID, 0.0 },
  { "1e+",           PARSE_INVALID, 0.0 },
  { "1e5x",          PARSE_INVALID, 0.0 },
  { "--1",           PARSE_INVALID, 0.0 },
  { "1-",            PARSE_INVALID, 0.0 },
  { "1 2",           PARSE_INVALID, 0.0 },
  { "1e99999999999", PARSE_INVALID, 0.0 },
  { "nan",           PARSE_OK,      NAN },
  { "NaN",           PARSE_OK,      NAN },
  { "INF",           PARSE_OK,      HUGE_VAL },
  { "  -Inf ",       PARSE_OK,      -HUGE_VAL },
  { "1_000_000",     PARSE_OK,      1e6 },
  { "1.5e3",         PARSE_OK,      1500.0 },
  { "15E-1",         PARSE_OK,      1.5 },
  { "+2.5",          PARSE_OK,      2.5 },
  { "5.",            PARSE_OK,      5.0 },
  { "  42  ",        PARSE_OK,      42.0 },
  { "-0",            PARSE_OK,      -0.0 },
  { "0.0",           PARSE_OK,      0.0 },
  { "1e400",         PARSE_OK,      HUGE_VAL },
  { "-1e400",        PARSE_OK,      -HUGE_VAL },
  { "1e-400",        PARSE_OK,      0.0 },
  { "1e100000000",   PARSE_OK,      HUGE_VAL },
  { "0.5e2147483647", PARSE_OK,     HUGE_VAL },
  { "1.5e-2147483648", PARSE_OK,    0.0 },
  { "0.000e2147483647", PARSE_OK,   0.0 },
  { "-0e400",        PARSE_OK,      -0.0 },
  { "1e2147483648",  PARSE_INVALID, 0.0 },
};

bool SameValue(double x,double y)
{
  if(std::isnan(x) || std::isnan(y)) return std::isnan(x) && std::isnan(y);
  return x == y && std::signbit(x) == std::signbit(y);
}

template<class T>
int RunParseChecks(const char* tname,int& test_count)
{
  int error_count = 0;
  for(size_t i=0;i<ArraySize(parse_checks);++i) {
    const ParseCheck& check = parse_checks[i];
    ++test_count;
    const T sentinel(17.0);
    T result = sentinel;
    Qd_ParseError error;
    const bool ok = Qd_Parse(check.text,result,error);
    if(check.outcome == PARSE_OK) {
      if(!ok) {
        fprintf(stderr,"ERROR: %s parse \"%s\" failed: %s\n",
                tname,check.text,error.GetMessage());
        ++error_count;
      } else if(!SameValue(result.Hi(),check.expected)) {
        fprintf(stderr,"ERROR: %s parse \"%s\" gives %s\n",
                tname,check.text,Qd_DebugString(result).c_str());
        ++error_count;
      }
      continue;
    }
    const Qd_ParseError::Kind kind = (check.outcome == PARSE_EMPTY
                                      ? Qd_ParseError::EMPTY
                                      : Qd_ParseError::INVALID);
    if(ok) {
      fprintf(stderr,"ERROR: %s parse \"%s\" accepted\n",
              tname,check.text);
      ++error_count;
    } else if(error.GetKind() != kind) {
      fprintf(stderr,"ERROR: %s parse \"%s\" wrong error kind: %s\n",
              tname,check.text,error.GetMessage());
      ++error_count;
    } else if(result != sentinel) {
      fprintf(stderr,"ERROR: %s parse \"%s\" modified result\n",
              tname,check.text);
      ++error_count;
    }
  }
  return error_count;
}

// |x-y| relative to |x|, as a double.
template<class T>
double RelativeDiff(const T& x,const T& y)
{
  const T diff = x - y;
  if(x.IsZero()) return std::fabs(diff.Hi());
  return std::fabs(diff.Hi()/x.Hi());
}

template<class T>
int CheckClose(const char* label,const T& result,const T& expected,
               double reltol)
{
  const double rdiff = RelativeDiff(expected,result);
  if(!(rdiff <= reltol)) {
    fprintf(stderr,"ERROR: %s\n  result: %s\nexpected: %s\n"
            " reldiff: %g\n",label,Qd_DebugString(result).c_str(),
            Qd_DebugString(expected).c_str(),rdiff);
    return 1;
  }
  return 0;
}

int ParseTest(int& test_count)
{
  int error_count = RunParseChecks<Qd_Double>("double",test_count)
    + RunParseChecks<Qd_Quad>("quad",test_count);

  // Values that are not exact in binary
  Qd_ParseError error;
  Qd_Double dd;
  test_count += 4;
  if(!Qd_Parse("0.1",dd,error)) {
    fprintf(stderr,"ERROR: parse \"0.1\" failed\n");
    ++error_count;
  } else {
    error_count += CheckClose("parse 0.1",dd,Qd_Double(1)/Qd_Double(10),
                              4*Qd_Double::EPSILON.Hi());
  }
  if(!Qd_Parse(".5e-1",dd,error)) {
    fprintf(stderr,"ERROR: parse \".5e-1\" failed\n");
    ++error_count;
  } else {
    error_count += CheckClose("parse .5e-1",dd,Qd_Double(1)/Qd_Double(20),
                              4*Qd_Double::EPSILON.Hi());
  }
  Qd_Quad qd;
  if(!Qd_Parse("3.14159265358979323846264338327950288419716939937510"
               "58209749445923",qd,error)) {
    fprintf(stderr,"ERROR: parse of pi failed\n");
    ++error_count;
  } else {
    error_count += CheckClose("parse pi",qd,Qd_Quad::PI,
                              16*Qd_Quad::EPSILON.Hi());
  }
  if(!Qd_Parse("-1e-310",dd,error)) {
    fprintf(stderr,"ERROR: parse \"-1e-310\" failed\n");
    ++error_count;
  } else if(!(dd.Hi() < 0.0 && dd.Hi() > -2e-310)) {
    fprintf(stderr,"ERROR: parse \"-1e-310\" gives %s\n",
            Qd_DebugString(dd).c_str());
    ++error_count;
  }
  return error_count;
}

////////////////////////////////////////////////////////////////////////
// Format then parse

// With same_text the reformatted parse must also match the original
// text exactly.
template<class T>
int RoundTrip(const char* tname,const T& x,bool same_text,int& test_count)
{
  ++test_count;
  char buf[32];
  Qd_Snprintf(buf,sizeof(buf),".%de",T::DIGITS - 1);
  Qd_FormatSpec spec;
  Qd_FormatSpec::Parse(buf,spec);
  const std::string text = Qd_Format(x,spec);
  T y;
  Qd_ParseError error;
  if(!Qd_Parse(text,y,error)) {
    fprintf(stderr,"ERROR: %s round trip \"%s\" failed: %s\n",
            tname,text.c_str(),error.GetMessage());
    return 1;
  }
  // Decimal rounding at DIGITS plus parse error
  const std::string label = std::string(tname) + " round trip " + text;
  if(CheckClose(label.c_str(),y,x,1e3*T::EPSILON.Hi())) return 1;
  if(same_text) {
    ++test_count;
    const std::string retext = Qd_Format(y,spec);
    if(retext.compare(text) != 0) {
      fprintf(stderr,"ERROR: %s reformat \"%s\" of \"%s\"\n",
              tname,retext.c_str(),text.c_str());
      return 1;
    }
  }
  return 0;
}

// Random values over a wide exponent range, all limbs populated.
// Formatting the parsed text again must give the same text, and
// parsing that the same bits.  Precision is two digits short of
// DIGITS so that parse and format error stay far below half a unit in
// the last printed digit.
//
// Only exponent notation is swept.  Fixed notation prints every
// integer digit, so above about 1e31 (1e62 for Qd_Quad) the trailing
// digits are noise and the text need not survive a round trip.
Qd_Double RandomValue(std::mt19937& gen,Qd_Double*)
{
  std::uniform_real_distribution<double> unif(-1.0,1.0);
  std::uniform_int_distribution<int> pow2(-900,900);
  const double x0 = std::ldexp(1.0 + std::fabs(unif(gen)),pow2(gen))
    * (unif(gen) < 0 ? -1 : 1);
  return Qd_Double::FromSum(x0,std::ldexp(x0*unif(gen),-54));
}

Qd_Quad RandomValue(std::mt19937& gen,Qd_Quad*)
{
  std::uniform_real_distribution<double> unif(-1.0,1.0);
  std::uniform_int_distribution<int> pow2(-800,800);
  const double x0 = std::ldexp(1.0 + std::fabs(unif(gen)),pow2(gen))
    * (unif(gen) < 0 ? -1 : 1);
  return Qd_Quad(x0,std::ldexp(x0*unif(gen),-54),
                 std::ldexp(x0*unif(gen),-107),
                 std::ldexp(x0*unif(gen),-160));
}

template<class T>
int RoundTripSweep(const char* tname,int count,int& test_count)
{
  std::mt19937 gen(20261017u);
  char buf[32];
  Qd_Snprintf(buf,sizeof(buf),".%de",T::DIGITS - 3);
  Qd_FormatSpec spec;
  Qd_FormatSpec::Parse(buf,spec);
  int error_count = 0;
  for(int i=0;i<count;++i) {
    const T x = RandomValue(gen,static_cast<T*>(0));
    ++test_count;
    const std::string text = Qd_Format(x,spec);
    T y,z;
    Qd_ParseError error;
    if(!Qd_Parse(text,y,error)) {
      fprintf(stderr,"ERROR: %s sweep parse \"%s\" failed: %s\n",
              tname,text.c_str(),error.GetMessage());
      ++error_count;
      continue;
    }
    const std::string retext = Qd_Format(y,spec);
    if(retext.compare(text) != 0) {
      fprintf(stderr,"ERROR: %s sweep of %s\n  text: %s\nretext: %s\n",
              tname,Qd_DebugString(x).c_str(),text.c_str(),
              retext.c_str());
      ++error_count;
      continue;
    }
    if(!Qd_Parse(retext,z,error) || Qd_DebugString(z) != Qd_DebugString(y)) {
      fprintf(stderr,"ERROR: %s sweep reparse of \"%s\" changed bits\n",
              tname,retext.c_str());
      ++error_count;
    }
  }
  return error_count;
}

int RoundTripTest(int& test_count)
{ // The first three values have a small leading digit, which keeps
  // parse error well inside half a unit of the last decimal digit.
  int error_count = 0;
  const Qd_Double dd_values[] = {
    Qd_Double::PI, Qd_Double::E, Qd_Double(1)/Qd_Double(3),
    -Qd_Double(12345.678)/Qd_Double(7), Qd_Double(1e-100)/Qd_Double(3),
    sqrt(Qd_Double(2))*Qd_Double(1e250), Qd_Double::LN2
  };
  for(size_t i=0;i<ArraySize(dd_values);++i) {
    error_count += RoundTrip("double",dd_values[i],i<3,test_count);
  }
  const Qd_Quad qd_values[] = {
    Qd_Quad::PI, Qd_Quad::E, Qd_Quad(1)/Qd_Quad(3),
    -Qd_Quad(12345.678)/Qd_Quad(7), Qd_Quad(1e-100)/Qd_Quad(3),
    sqrt(Qd_Quad(2))*Qd_Quad(1e250), Qd_Quad::LN2
  };
  for(size_t i=0;i<ArraySize(qd_values);++i) {
    error_count += RoundTrip("quad",qd_values[i],i<3,test_count);
  }
  error_count += RoundTripSweep<Qd_Double>("double",2000,test_count);
  error_count += RoundTripSweep<Qd_Quad>("quad",2000,test_count);
  return error_count;
}

////////////////////////////////////////////////////////////////////////
// Digit extraction

template<class T>
int CheckDigits(const char* label,const T& x,int ndigits,
                const char* expected,int expected_exponent,
                int& test_count)
{
  ++test_count;
  std::vector<int> digits;
  int exponent = -999;
  Qd_ExtractDigits(x,ndigits,digits,exponent);
  std::string result;
  for(size_t i=0;i<digits.size();++i) {
    if(digits[i]<0 || digits[i]>9) {
      result += '?';
    } else {
      result += static_cast<char>('0' + digits[i]);
    }
  }
  if(result.compare(expected) != 0 || exponent != expected_exponent) {
    fprintf(stderr,"ERROR: digits of %s: \"%s\" e%d, expected \"%s\" e%d\n",
            label,result.c_str(),exponent,expected,expected_exponent);
    return 1;
  }
  return 0;
}

int DigitsTest(int& test_count)
{
  int error_count = 0;
  error_count += CheckDigits("123.5",Qd_Double(123.5),4,"1235",2,
                             test_count);
  error_count += CheckDigits("-42",Qd_Double(-42),2,"42",1,test_count);
  error_count += CheckDigits("9.996",Qd_Double(9996)/Qd_Double(1000),3,
                             "100",1,test_count);
  error_count += CheckDigits("0",Qd_Double(0.0),3,"000",0,test_count);
  error_count += CheckDigits("1 to 0 digits",Qd_Double(1),0,"",0,
                             test_count);
  error_count += CheckDigits("2^-20",Qd_Double(std::ldexp(1.0,-20)),7,
                             "9536743",-7,test_count);
  error_count += CheckDigits("1/7",Qd_Quad(1)/Qd_Quad(7),20,
                             "14285714285714285714",-1,test_count);
  error_count += CheckDigits("pi",Qd_Quad::PI,40,
                             "3141592653589793238462643383279502884197",
                             0,test_count);
  error_count += CheckDigits("1e300",Qd_Quad(1e300),3,"100",300,
                             test_count);
  return error_count;
}

////////////////////////////////////////////////////////////////////////
// Stream output

struct StreamCheck {
  double x;
  const char* expected;
  std::ios_base::fmtflags flags;
  int precision;
};

int StreamTest(int& test_count)
{
  const StreamCheck checks[] = {
    { 0.016777216, "1.67772e-2", std::ios_base::scientific, 5 },
    { 3.14159,     "3.14",       std::ios_base::fixed, 2 },
    { 0.5,         "0.5",        std::ios_base::fmtflags(0), 6 },
    { 0.5,         "+0.5",       std::ios_base::showpos, 6 },
    { 1250.0,      "1.3E3",
      std::ios_base::scientific | std::ios_base::uppercase, 1 },
  };
  int error_count = 0;
  for(size_t i=0;i<ArraySize(checks);++i) {
    for(int type=0;type<2;++type) {
      std::ostringstream os;
      os.flags(checks[i].flags);
      os << std::setprecision(checks[i].precision);
      if(type == 0) os << Qd_Double(checks[i].x);
      else          os << Qd_Quad(checks[i].x);
      ++test_count;
      if(os.str().compare(checks[i].expected) != 0) {
        fprintf(stderr,"ERROR: stream output of %s %g: \"%s\","
                " expected \"%s\"\n",(type == 0 ? "double" : "quad"),
                checks[i].x,os.str().c_str(),checks[i].expected);
        ++error_count;
      }
    }
  }

  // Log output reaches an added file once flushed
  const char* logname = "iotest_log.tmp";
  std::remove(logname);
  Qd_Report::Log.AddFile(logname);
  Qd_Report::Log << "log check " << Qd_Double(0.5) << std::endl;
  std::ifstream logfile(logname);
  std::string line;
  std::getline(logfile,line);
  logfile.close();
  std::remove(logname);
  ++test_count;
  if(line.compare("log check 0.5") != 0) {
    fprintf(stderr,"ERROR: log file line \"%s\"\n",line.c_str());
    ++error_count;
  }
  return error_count;
}

////////////////////////////////////////////////////////////////////////
// Tcl interface

struct TclCheck {
  const char* script;
  int code;
  const char* expected;  // Leading text of the interpreter result
};

int TclTest(int& test_count)
{
  const TclCheck checks[] = {
    { "Qd_Eval double sqrt 4",            TCL_OK,    "2" },
    { "Qd_Eval double add 0.5 0.25",      TCL_OK,    "0.75" },
    { "Qd_Eval double powi 2 10",         TCL_OK,    "1024" },
    { "Qd_Eval double nroot 27 3",        TCL_OK,    "3" },
    { "Qd_Eval quad div 1 4",             TCL_OK,    "0.25" },
    { "Qd_Eval double log 0",             TCL_OK,    "-inf" },
    { "Qd_Eval quad atan2 0 -1",          TCL_OK,    "3.14159265358979" },
    { "Qd_Format quad 23 .3",             TCL_OK,    "23.000" },
    { "Qd_Format double 0.016777216 .3e", TCL_OK,    "1.678e-2" },
    { "Qd_Format double 1.5 .x",          TCL_ERROR, "bad format spec" },
    { "Qd_Parse double 1.2.3",            TCL_ERROR,
      "bad number \"1.2.3\": invalid number literal" },
    { "Qd_Parse quad {}",                 TCL_ERROR,
      "bad number \"\": cannot parse number from empty string" },
    { "Qd_Eval triple sqrt 2",            TCL_ERROR, "bad type \"triple\"" },
    { "Qd_Eval double frob 2",            TCL_ERROR, "unknown operation" },
    { "Qd_Eval double sqrt",              TCL_ERROR, "wrong # args" },
    { "Qd_LogSupportInitPrefix iotest",   TCL_OK,    "" },
    { "Qd_LogSupportGetLogMark",          TCL_OK,    "[iotest " },
    { "Qd_LogSupportGetLogMark x",        TCL_ERROR,
      "Qd_LogSupportGetLogMark must be called with no arguments" },
    { "Qd_ReportAddLogFile",              TCL_ERROR,
      "Qd_ReportAddLogFile must be called with 1 argument" },
    { "Qd_ReportAddLogFile /nonexistent/dir/iotest.log", TCL_ERROR, "" },
    { "package present Qd",               TCL_OK,    QD_VERSION },
  };

  Tcl_Interp* interp = Tcl_CreateInterp();
  if(Qd_Init(interp) != TCL_OK) {
    fprintf(stderr,"ERROR: Qd_Init failed: %s\n",
            Tcl_GetStringResult(interp));
    Tcl_DeleteInterp(interp);
    ++test_count;
    return 1;
  }

  int error_count = 0;
  for(size_t i=0;i<ArraySize(checks);++i) {
    const TclCheck& check = checks[i];
    ++test_count;
    const int code = Tcl_Eval(interp,check.script);
    const std::string result = Tcl_GetStringResult(interp);
    if(code != check.code
       || result.compare(0,strlen(check.expected),check.expected) != 0) {
      fprintf(stderr,"ERROR: \"%s\" returns %d \"%s\"\n",
              check.script,code,result.c_str());
      ++error_count;
    }
  }

  // Parse returns one hexbin element per limb
  const char* limb_scripts[] = { "Qd_Parse double 0.1",
                                 "Qd_Parse quad 0.1" };
  const int limb_counts[] = { 2, 4 };
  for(int i=0;i<2;++i) {
    ++test_count;
    int listc = 0;
    const char** listv = NULL;
    if(Tcl_Eval(interp,limb_scripts[i]) != TCL_OK
       || Tcl_SplitList(interp,Tcl_GetStringResult(interp),
                        &listc,&listv) != TCL_OK) {
      fprintf(stderr,"ERROR: \"%s\" failed: %s\n",limb_scripts[i],
              Tcl_GetStringResult(interp));
      ++error_count;
      continue;
    }
    if(listc != limb_counts[i] || strncmp(listv[0],"0x",2) != 0) {
      fprintf(stderr,"ERROR: \"%s\" returns \"%s\"\n",limb_scripts[i],
              Tcl_GetStringResult(interp));
      ++error_count;
    }
    Tcl_Free((char *)listv);
  }

  if(Qd_GlobalInterpreter() == interp) Qd_SetGlobalInterpreter(NULL);
  Tcl_DeleteInterp(interp);
  return error_count;
}

////////////////////////////////////////////////////////////////////////

void Usage()
{
  fprintf(stderr,"Usage: iotest [format|parse|roundtrip|digits"
          "|stream|tcl|all]\n");
  exit(1);
}

int wrapped_main(int argc,char** argv)
{
  if(argc>2) Usage();
  const char* mode = (argc == 2 ? argv[1] : "all");
  const bool all = (strcmp(mode,"all") == 0);

  Tcl_FindExecutable(argv[0]);

  int test_count = 0;
  int error_count = 0;
  bool matched = all;
  if(all || strcmp(mode,"format") == 0) {
    error_count += FormatTest(test_count);
    matched = true;
  }
  if(all || strcmp(mode,"parse") == 0) {
    error_count += ParseTest(test_count);
    matched = true;
  }
  if(all || strcmp(mode,"roundtrip") == 0) {
    error_count += RoundTripTest(test_count);
    matched = true;
  }
  if(all || strcmp(mode,"digits") == 0) {
    error_count += DigitsTest(test_count);
    matched = true;
  }
  if(all || strcmp(mode,"stream") == 0) {
    error_count += StreamTest(test_count);
    matched = true;
  }
  if(all || strcmp(mode,"tcl") == 0) {
    error_count += TclTest(test_count);
    matched = true;
  }
  if(!matched) Usage();

  if(error_count>0) {
    fprintf(stderr,"ERROR: %d/%d tests failed.\n",error_count,test_count);
    return 1;
  }
  printf("All %d tests passed.\n",test_count);
  return 0;
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
