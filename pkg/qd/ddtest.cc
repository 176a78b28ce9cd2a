/* FILE: ddtest.cc
 *  Development test file for Qd_Double class.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 */

/***************************************************************
Reference values in the base test table are the correctly rounded
double-double representation of the exact result for the listed
inputs, written in hexbin notation (integer mantissa, power of two
exponent):

   0x10000000000000xb+000  =  2^52
  -0x1921FB54442D18xb-051  = -pi rounded to double

Use "showfloat" to convert between decimal and hexbin.
***************************************************************/

#include <cfloat>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <iostream>
#include <string>
#include <vector>

#include "qd.h"
#include "qdbasic.h"

/* End includes */

using std::cerr;

template <typename T, size_t N>
constexpr size_t ArraySize(T (&)[N]) { return N; }

std::string DDWrite(const Qd_Double& val)
{
  return Qd_DebugString(val);
}

typedef Qd_Double (*QDD_1P)(const Qd_Double&);
typedef Qd_Double (*QDD_2P)(const Qd_Double&,const Qd_Double&);

Qd_Double Add(const Qd_Double& x,const Qd_Double& y)
{
  return x + y;
}

Qd_Double Subtract(const Qd_Double& x,const Qd_Double& y)
{
  return x - y;
}

Qd_Double Multiply(const Qd_Double& x,const Qd_Double& y)
{
  return x * y;
}

Qd_Double Divide(const Qd_Double& x,const Qd_Double& y)
{
  return x / y;
}

Qd_Double Sqrt(const Qd_Double& x)  { return sqrt(x); }
Qd_Double Exp(const Qd_Double& x)   { return exp(x); }
Qd_Double Log(const Qd_Double& x)   { return log(x); }
Qd_Double Sin(const Qd_Double& x)   { return sin(x); }
Qd_Double Cos(const Qd_Double& x)   { return cos(x); }
Qd_Double Atan(const Qd_Double& x)  { return atan(x); }

struct FuncInfo {
  const char* name;
  void* fptr;
  enum FuncTypes { FT_INVALID, FT_DD, FT_DD_DD } func_type;
  double ulp_allowance; // Accuracy of func, in ULP

  FuncInfo() : name(0), fptr(0), func_type(FT_INVALID), ulp_allowance(0) {}
  FuncInfo(const char* in_name,void* in_fptr,FuncTypes in_func_type,
           double in_ulp_allowance)
    : name(in_name), fptr(in_fptr), func_type(in_func_type),
      ulp_allowance(in_ulp_allowance) {}
};

FuncInfo func_array[] = {
  FuncInfo("Add",reinterpret_cast<void*>(Add),FuncInfo::FT_DD_DD,4),
  FuncInfo("Subtract",reinterpret_cast<void*>(Subtract),
           FuncInfo::FT_DD_DD,4),
  FuncInfo("Multiply",reinterpret_cast<void*>(Multiply),
           FuncInfo::FT_DD_DD,4),
  FuncInfo("Divide",reinterpret_cast<void*>(Divide),FuncInfo::FT_DD_DD,4),
  FuncInfo("Sqrt",reinterpret_cast<void*>(Sqrt),FuncInfo::FT_DD,4),
  // Each of the nine squarings that undo the exp range reduction can
  // add an ulp or two; log takes one Newton step through exp.
  FuncInfo("Exp",reinterpret_cast<void*>(Exp),FuncInfo::FT_DD,32),
  FuncInfo("Log",reinterpret_cast<void*>(Log),FuncInfo::FT_DD,32),
  FuncInfo("Sin",reinterpret_cast<void*>(Sin),FuncInfo::FT_DD,64),
  FuncInfo("Cos",reinterpret_cast<void*>(Cos),FuncInfo::FT_DD,64),
  FuncInfo("Atan",reinterpret_cast<void*>(Atan),FuncInfo::FT_DD,32)
};

const FuncInfo* FindFuncInfo(const char* name)
{
  for(size_t i=0;i<ArraySize(func_array);++i) {
    if(strcmp(name,func_array[i].name)==0) return &(func_array[i]);
  }
  std::string errmsg = "Unknown test function: ";
  errmsg += name;
  throw errmsg;
}

////////////////////////////////////////////////////////////////////////
// Testing class
class DDTest {
public:
  DDTest(const char* funcname,
         const char* xhi,const char* xlo,
         const char* thi,const char* tlo)
    : func_info(FindFuncInfo(funcname)),
      x(Qd_ScanFloat(xhi),Qd_ScanFloat(xlo)),
      t(Qd_ScanFloat(thi),Qd_ScanFloat(tlo)) {
    if(func_info->func_type != FuncInfo::FT_DD) {
      std::string msg
        = "Error in DDTest: Wrong argument type/count for function ";
      msg += funcname;
      throw msg;
    }
  }

  DDTest(const char* funcname,
         const char* xhi,const char* xlo,
         const char* yhi,const char* ylo,
         const char* thi,const char* tlo)
    : func_info(FindFuncInfo(funcname)),
      x(Qd_ScanFloat(xhi),Qd_ScanFloat(xlo)),
      y(Qd_ScanFloat(yhi),Qd_ScanFloat(ylo)),
      t(Qd_ScanFloat(thi),Qd_ScanFloat(tlo)) {
    if(func_info->func_type != FuncInfo::FT_DD_DD) {
      std::string msg
        = "Error in DDTest: Wrong argument type/count for function ";
      msg += funcname;
      throw msg;
    }
  }

  void TestReport(const Qd_Double& result,
                  double result_error,const char* errstr=0) const;

  int Test() const;  // Returns 1 if func applied to x (or (x,y)) is
  /// within slack times the function allowance of t.  Otherwise 0.

  static double SetComparisonSlack(double slack) {
    // The allowance for each function is scaled by slack.  Setting
    // slack to 0.0 requires exact agreement with the reference.
    double old_setting = slack_factor;
    slack_factor = slack;
    return old_setting;
  }

  static int SetVerbose(int val) {
    int oldval = verbose; verbose = val; return oldval;
  }

private:
  const FuncInfo* func_info;
  Qd_Double x;
  Qd_Double y;
  Qd_Double t;
  static double slack_factor;
  static int verbose;
};

double DDTest::slack_factor = 1.0;
int DDTest::verbose = 1;

void DDTest::TestReport(const Qd_Double& result,
                        double result_error,const char* errstr) const
{
  cerr << "Func: " << func_info->name << "\n";
  cerr << "   x: " << DDWrite(x) << "\n";
  if(func_info->func_type == FuncInfo::FT_DD_DD) {
    cerr << "   y: " << DDWrite(y) << "\n";
  }
  cerr << " Ref: " << DDWrite(t) << "\n";
  cerr << "Test: " << DDWrite(result) << "\n";
  if(errstr==0) {
    cerr << "Diff: " << result_error << " ULP\n";
  } else {
    cerr << "Diff: " << errstr << "\n";
  }
}

int DDTest::Test() const
{
  Qd_Double result;
  switch(func_info->func_type) {
  case FuncInfo::FT_DD:
    result = reinterpret_cast<QDD_1P>(func_info->fptr)(x);
    break;
  case FuncInfo::FT_DD_DD:
    result = reinterpret_cast<QDD_2P>(func_info->fptr)(x,y);
    break;
  default:
    std::string msg = "Unsupported function type for function ";
    msg += func_info->name;
    throw msg;
  }

  if(!result.IsNormalized()) {
    if(verbose) TestReport(result,0.0,"ERROR: Unnormalized output");
    return 0;
  }
  if(t.IsNaN() && result.IsNaN()) return 1;
  if(t.IsNaN() || result.IsNaN()) {
    if(verbose) TestReport(result,0.0,"ERROR: NaN mismatch");
    return 0;
  }
  if(result == t) {
    if(verbose>=3) TestReport(result,0.0,"0 (exact match)");
    return 1;
  }
  const double result_error = result.ComputeDiffULP(t,t.ULP());
  // The NaN test guards against compilers that mishandle NaN
  // comparisons.
  if(!Qd_IsNaN(result_error)
     && std::fabs(result_error) <= slack_factor*func_info->ulp_allowance) {
    if(verbose>=3) TestReport(result,result_error);
    return 1;
  }
  if(verbose) TestReport(result,result_error);
  return 0;
}

// Inputs are random double-double values with a nonzero low limb.
static DDTest test_data[] = {
  {"Add","-0x111EB1326EBBCExb-034"," 0x1481AF93D36238xb-089",
   " 0x1D926A472F0087xb-034"," 0x1B8E46111E87AAxb-088",
   " 0x18E77229808973xb-035"," 0x173C776C20E318xb-090"},
  {"Add"," 0x1FD57837A92CC2xb-034"," 0x1ACB19AA253D90xb-091",
   "-0x1421363B6569F2xb-034"," 0x1AABCCF96EDA62xb-088",
   " 0x176883F88785A1xb-035","-0x1FACFD14C7DEC0xb-092"},
  {"Add"," 0x1F4F7A2E48EA56xb-034","-0x19F1057BB8A487xb-088",
   "-0x15A36611F7A5E9xb-033","-0x1736915EF0848Exb-088",
   "-0x17EEA3EB4CC2FAxb-035"," 0x1DB0D24AADADD6xb-089"},
  {"Add"," 0x1B6E9ACC15DCA6xb-034"," 0x1A3ED1B6992CC8xb-089",
   " 0x10F205A39378E4xb-040"," 0x12BE41DDDBA580xb-094",
   " 0x1BB262E2A42A8Axb-034","-0x1D2B3C3A77F60Cxb-089"},
  {"Subtract"," 0x10F0809667840Bxb-033","-0x162954596067A6xb-088",
   "-0x1F0CAD7CC66183xb-034"," 0x1D7E995BEEC7E4xb-088",
   " 0x103B6BAA655A66xb-032"," 0x18B0249561A0ECxb-089"},
  {"Subtract","-0x176CD7BF5A9FD9xb-033","-0x164038CFE8755Exb-088",
   "-0x1877F4374D8067xb-034","-0x18CB1188576BF2xb-089",
   "-0x1661BB4767BF4Bxb-034","-0x13B56017797ECAxb-089"},
  {"Subtract"," 0x11328D87D5AB55xb-036"," 0x121E3059EE1D20xb-092",
   " 0x19AC01362E455Cxb-033"," 0x1B1994D80AEE8Cxb-087",
   "-0x1785AF85338FF2xb-033"," 0x1AEEB9558904BAxb-088"},
  {"Multiply","-0x12118F3AB3FB1Dxb+013","-0x1A831A40194486xb-042",
   "-0x198394A3E3A05Cxb+012"," 0x1B0F08B7E2AB32xb-042",
   " 0x1CD0076BEAAA54xb+077","-0x1B7188C8BDC1AFxb+023"},
  {"Multiply"," 0x1285171DE3BD3Fxb+013","-0x1298E24A39B618xb-044",
   "-0x1A949B37F4BEC5xb+011","-0x1A64EE15174B9Axb-044",
   "-0x1EC448507B4993xb+076","-0x1B2A177CFF722Cxb+019"},
  {"Multiply"," 0x10A431EDD29506xb+014"," 0x1E30D8E24A7D38xb-040",
   " 0x161D4D336682DCxb+011","-0x1D22A676002C8Cxb-045",
   " 0x17003E8D26E11Cxb+077","-0x1B28A92A64216Axb+023"},
  {"Multiply"," 0x1D9EAD5B57CACExb+012"," 0x15A9BACD81C9D0xb-042",
   " 0x14161001DE0DECxb+010"," 0x1A6A8A0E4C1918xb-044",
   " 0x1297984156D7E9xb+075"," 0x18543CDAEE9083xb+019"},
  {"Divide","-0x150E9374AA6665xb+014","-0x1AC8468683EAB8xb-040",
   "-0x17E22A2070EB29xb+013","-0x1436190703BE16xb-041",
   " 0x1C3681E30E4D11xb-052","-0x1371EB6D07459Axb-106"},
  {"Divide"," 0x1DE05D45FE94E5xb+013","-0x18585B347CEDDFxb-041",
   " 0x1061319F14A7DAxb+014","-0x198969FBE80F4Exb-041",
   " 0x1D2F1552604FD4xb-053","-0x10228C5E0721E4xb-107"},
  {"Divide"," 0x15BFE9ADB33BAExb+013"," 0x17C614C4DB295Exb-041",
   "-0x1B24519D6DCD72xb+013","-0x1EB9FE753A9985xb-041",
   "-0x19A483CA7E7343xb-053","-0x1522CAB940CAFBxb-110"},
  {"Divide"," 0x135B66BD1D449Bxb+014"," 0x1B0BDF96D8837Exb-040",
   "-0x13F4AF07117BE3xb+013","-0x12EB8CE3B62FFCxb-042",
   "-0x1F0A34769906F3xb-052"," 0x11941A67510B58xb-107"},
  {"Sqrt"," 0x127873CEA8EB5Axb+046","-0x1A05B2E51FE34Cxb-010",
   " 0x1130E12AF3F628xb-003","-0x16DC40943A915Bxb-057"},
  {"Sqrt"," 0x162DC69FD71572xb+046","-0x1B3FBC28BC6BE0xb-012",
   " 0x12D677132AC04Axb-003"," 0x174B62D452F02Axb-057"},
  {"Sqrt"," 0x14C47F26392828xb+046"," 0x17376C6E7F6940xb-010",
   " 0x123A8410398C13xb-003","-0x140A0E85094193xb-059"},
  {"Sqrt"," 0x10C28BE9847184xb+047","-0x1E7901369FE34Dxb-007",
   " 0x1728968F8BF46Dxb-003","-0x146C27300FE17Fxb-058"},
  {"Exp","-0x1D8CC97CCB1117xb-048","-0x16799DFC922469xb-102",
   " 0x14A7BC716E3AB8xb-095"," 0x12AE171E5C9D5Dxb-149"},
  {"Exp","-0x10B26BFADECFC4xb-047"," 0x10A0609BD7324Exb-101",
   " 0x1C4CEF1230BE63xb-101"," 0x1BAD41F6833571xb-155"},
  {"Exp"," 0x1244510CFCF25Exb-052","-0x1CD197F06953BCxb-106",
   " 0x190E61A47BC0F2xb-051"," 0x1A24B711083814xb-106"},
  {"Exp"," 0x169A7018279CB2xb-047"," 0x1BB793349FF688xb-102",
   " 0x12A04CFC65A321xb+013","-0x1C3C99218A3C47xb-042"},
  {"Exp"," 0x1A38BB26D98566xb-052","-0x18D644145E0290xb-108",
   " 0x1498D406781597xb-050"," 0x1D5D68FF7E16B4xb-106"},
  {"Log"," 0x17803DC53295ADxb-018","-0x168655AF5DA80Cxb-072",
   " 0x17F3929DE85962xb-048","-0x16D79B90336E5Axb-102"},
  {"Log"," 0x1635D85054B1C7xb-014"," 0x15AC063E1B86E0xb-071",
   " 0x1AAAE55334E542xb-048","-0x1D2739F1A3C549xb-103"},
  {"Log"," 0x1BA2D394AA0C6Fxb-014","-0x10C775189B2AF6xb-068",
   " 0x1AE2D914B744BCxb-048"," 0x1CCF8C9E892623xb-102"},
  {"Log"," 0x16E41BA9D43122xb-015"," 0x15A4B4B16D5CA0xb-073",
   " 0x1A012DA6C91359xb-048","-0x16CE1228FFCC99xb-103"},
  {"Log"," 0x1658E52F6BAF8Fxb-013","-0x12463C6CFD30DExb-068",
   " 0x1B5DEA2C85800Cxb-048"," 0x184FC26E16F664xb-102"},
  {"Log"," 0x148153CB15AA31xb-052","-0x14199C9F0A8D94xb-108",
   " 0x1FC161CB9088D1xb-055"," 0x11F4DBEEF44235xb-109"},
  {"Log"," 0x15D96F8C479523xb-052","-0x10EC712BB004B0xb-107",
   " 0x13F0F91E81E811xb-054","-0x1D0533AC615A5Axb-108"},
  {"Sqrt"," 0x1F08BF59787F14xb-114"," 0x16BF6BE3D9452Cxb-168",
   " 0x164888329ACC00xb-083"," 0x1161B30CD6E0B9xb-137"},
  {"Sqrt"," 0x1ECAB4841EE70Fxb-113"," 0x19DD1C768E9418xb-169",
   " 0x1F63DD590ED8D5xb-083","-0x153EA44AD9BDE8xb-139"},
  {"Sin"," 0x10388764E4BE97xb-050","-0x18A678DF5E2628xb-107",
   "-0x1955BAC0DC4803xb-053"," 0x1AB0CC61C631D0xb-107"},
  {"Sin"," 0x12FAE7414CBF0Cxb-056"," 0x11EDAF0FC36F4Cxb-111",
   " 0x12F673FDC97210xb-056","-0x1B0BC1D163DF8Dxb-111"},
  {"Sin"," 0x15C29A295668E4xb-055","-0x15DA8AAAC31780xb-115",
   " 0x15A7CF0D77D956xb-055"," 0x1633BB267CA404xb-109"},
  {"Sin"," 0x12763E93256F9Bxb-051"," 0x12B13CBF23169Exb-105",
   " 0x17B2685B092983xb-053"," 0x11E07F5FB43515xb-107"},
  {"Sin"," 0x10CDDDA585F018xb-050"," 0x1C881E9B6C4478xb-105",
   "-0x1BE820030BFAA6xb-053","-0x148A01B0B8877Axb-107"},
  {"Cos"," 0x17B9FBB50F84A3xb-051"," 0x1A203CEF778690xb-105",
   "-0x1F81C39B251B75xb-053","-0x1DA10EE50E53A4xb-107"},
  {"Cos","-0x1C3D1E000CC4A1xb-050"," 0x163B3863E751C0xb-109",
   " 0x16D3EF8312B595xb-053","-0x109043259EC85Dxb-107"},
  {"Cos"," 0x1E93D1B4F4007Dxb-053","-0x137A1C33562004xb-109",
   " 0x127821526D4AFDxb-053"," 0x12A599B4F32A2Cxb-107"},
  {"Cos","-0x1825D13491BC64xb-052","-0x12A2C89767E188xb-109",
   " 0x1F802B5417BFE3xb-057"," 0x1F19F5ACE15FB0xb-111"},
  {"Atan"," 0x11E3D2B8BF45CBxb-043","-0x10DC8C4D684B00xb-100",
   " 0x191AD3AFBE2A5Fxb-052"," 0x12A17E14C77E4Dxb-106"},
  {"Atan"," 0x15877B8067097Dxb-043","-0x1AF11859AF3930xb-099",
   " 0x191C094E6BADC3xb-052","-0x106D6A22EDA869xb-107"},
  {"Atan","-0x18EF35E03ED7EFxb-044"," 0x14DDF8F29FB682xb-098",
   "-0x1917B6FFE4ABE2xb-052"," 0x1CC2F68F227788xb-106"},
  {"Atan","-0x1B3D8B69EAE722xb-044","-0x178C1023446351xb-098",
   "-0x1918957EE9B4AAxb-052","-0x11CB1399DB8DBDxb-109"}
};

////////////////////////////////////////////////////////////////////////
// Scenario tests.  Each check compares one computed value to either a
// decimal reference (relative tolerance) or an exact value.  NaN
// matches NaN, and zeros must agree in sign.

struct CloseCheck {
  const char* label;
  Qd_Double value;
  const char* truth;
};

struct ExactCheck {
  const char* label;
  Qd_Double value;
  Qd_Double truth;
};

Qd_Double Dec(const char* str)
{
  Qd_Double value;
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

int RunCloseChecks(const CloseCheck* checks,int count,double reltol)
{
  int errcount = 0;
  for(int i=0;i<count;++i) {
    const CloseCheck& chk = checks[i];
    const Qd_Double truth = Dec(chk.truth);
    const Qd_Double diff = fabs(chk.value - truth);
    if(!(diff <= reltol*fabs(truth)) || !chk.value.IsNormalized()) {
      ++errcount;
      cerr << "FAIL " << chk.label << "\n"
           << "  Test: " << Qd_Format(chk.value,Qd_FormatSpec()) << "\n"
           << "   Ref: " << chk.truth << "\n"
           << "  Diff: " << diff.Hi() << "\n";
    }
  }
  return errcount;
}

int RunExactChecks(const ExactCheck* checks,int count)
{
  int errcount = 0;
  for(int i=0;i<count;++i) {
    const ExactCheck& chk = checks[i];
    const Qd_Double& a = chk.value;
    const Qd_Double& b = chk.truth;
    bool match;
    if(a.IsNaN() || b.IsNaN()) {
      match = (a.IsNaN() && b.IsNaN());
    } else {
      match = (Qd_AreEqual(a.Hi(),b.Hi()) && Qd_AreEqual(a.Lo(),b.Lo())
               && Qd_SignBit(a.Hi()) == Qd_SignBit(b.Hi()));
    }
    if(!match) {
      ++errcount;
      cerr << "FAIL " << chk.label << "\n"
           << "  Test: " << DDWrite(a) << "\n"
           << "   Ref: " << DDWrite(b) << "\n";
    }
  }
  return errcount;
}

int ScenarioTest(int& test_count)
{
  const Qd_Double PI = Qd_Double::PI;
  const Qd_Double E = Qd_Double::E;
  const Qd_Double NaN = Qd_Double::QNAN;
  const Qd_Double Inf = Qd_Double::POS_INF;
  const Qd_Double NegInf = Qd_Double::NEG_INF;
  const Qd_Double Zero = Qd_Double::ZERO;
  const Qd_Double NegZero = Qd_Double::NEG_ZERO;
  const Qd_Double One = Qd_Double::ONE;

  const CloseCheck close_checks[] = {
    { "sqrt(pi)", sqrt(PI), "1.7724538509055160272981674833411" },
    { "sqrt(2317)", sqrt(Qd_Double(2317)),
      "48.135226186234961951944911890074" },
    { "exp(2)", exp(Qd_Double(2)),
      "7.3890560989306502272304274605750057" },
    { "ln(7)", log(Qd_Double(7)), "1.9459101490553133051053527434432" },
    { "pi*e", PI*E, "8.539734222673567065463550869547" },
    { "atan2(1,2)", atan2(Qd_Double(1),Qd_Double(2)),
      "0.46364760900080611621425623146121" },

    { "exp(1/16)", exp(Qd_Double(0.0625)),
      "1.0644944589178594295633905946428894" },
    { "exp(1/8)", exp(Qd_Double(0.125)),
      "1.1331484530668263168290072278117932" },
    { "exp(3/16)", exp(Qd_Double(0.1875)),
      "1.2062302494209807106555860104464342" },
    { "exp(1/4)", exp(Qd_Double(0.25)),
      "1.2840254166877414840734205680624368" },
    { "exp(-1/16)", exp(Qd_Double(-0.0625)),
      "0.93941306281347578611971082462230501" },
    { "exp(-1/8)", exp(Qd_Double(-0.125)),
      "0.88249690258459540286489214322905049" },
    { "exp(-3/16)", exp(Qd_Double(-0.1875)),
      "0.82902911818040034301464550934308218" },
    { "exp(-1/4)", exp(Qd_Double(-0.25)),
      "0.77880078307140486824517026697832046" },
    { "exp(pi)", exp(PI), "23.140692632779269005729086367948552" },
    { "exp(e)", exp(E), "15.154262241479264189760430272629902" },
    { "exp(-pi)", exp(-PI), "0.043213918263772249774417737171728016" },
    { "exp(-e)", exp(-E), "0.065988035845312537076790187596846535" },
    { "exp(2pi)", exp(Qd_Double::TWO_PI),
      "535.49165552476473650304932958904745" },
    { "exp(pi/2)", exp(Qd_Double::HALF_PI),
      "4.8104773809653516554730356667038329" },
    { "exp(sqrt2)", exp(Qd_Double::SQRT2),
      "4.113250378782927517173581815140309" },
    { "exp(1/sqrt2)", exp(Qd_Double::INV_SQRT2),
      "2.0281149816474724511081261127463503" },
    { "exp(ln(e))", exp(log(E)), "2.7182818284590452353602874713526625" },
    { "exp(10)", exp(Qd_Double(10)),
      "22026.465794806716516957900645284255" },
    { "exp(-9)", exp(Qd_Double(-9)),
      "0.00012340980408667954949763669073003385" },

    { "ln(pi)", log(PI), "1.1447298858494001741434273513531" },
    { "ln(e)", log(E), "1" },
    { "ln(2pi)", log(Qd_Double::TWO_PI),
      "1.8378770664093454835606594728112" },
    { "ln(pi/2)", log(Qd_Double::HALF_PI),
      "0.45158270528945486472619522989488" },
    { "ln(sqrt2)", log(Qd_Double::SQRT2),
      "0.34657359027997265470861606072909" },
    { "ln(1/sqrt2)", log(Qd_Double::INV_SQRT2),
      "-0.34657359027997265470861606072909" },
    { "ln(1e20)", log(Dec("1e20")),
      "46.051701859880913680359829093687287" },
    { "log10(42)", log10(Qd_Double(42)),
      "1.62324929039790046322098305657224" },
    { "log10(243)", log10(Qd_Double(243)),
      "2.38560627359831218647513951627558" },
    { "log10(10)", log10(Qd_Double(10)), "1" },
    { "log2(10)", log2(Qd_Double(10)), "3.32192809488736234787031942948939" },
    { "log(1024,2)", log(Qd_Double(1024),Qd_Double(2)), "10" },

    { "cbrt(2)", cbrt(Qd_Double(2)), "1.2599210498948731647672106072782" },
    { "nroot(-8,3)", nroot(Qd_Double(-8),3), "-2" },
    { "nroot(16,4)", nroot(Qd_Double(16),4), "2" },
    { "powi(3,-2)", powi(Qd_Double(3),-2),
      "0.11111111111111111111111111111111" },
    { "pow(2,1/2)", pow(Qd_Double(2),Qd_Double(0.5)),
      "1.4142135623730950488016887242097" },

    { "sin(pi/6)", sin(PI/6.0), "0.5" },
    { "cos(pi/3)", cos(PI/3.0), "0.5" },
    { "tan(pi/4)", tan(Qd_Double::QUARTER_PI), "1" },
    { "atan(1)", atan(One), "0.78539816339744830961566084581988" },
    { "atan2(1,-2)", atan2(Qd_Double(1),Qd_Double(-2)),
      "2.6779450445889871222483871518183" },
    { "atan2(-1,-2)", atan2(Qd_Double(-1),Qd_Double(-2)),
      "-2.6779450445889871222483871518183" }
  };
  // Large arguments lose a little to range reduction.  ln of very
  // small values passes through the power of two split.
  const CloseCheck wide_checks[] = {
    { "exp(150)", exp(Qd_Double(150)),
      "1.3937095806663796973183419371414568e+65" },
    { "exp(-140)", exp(Qd_Double(-140)),
      "1.5804200602736129648293184125529729e-61" },
    { "pow(11.1,4.2)",
      pow(Qd_Double(111)/Qd_Double(10),Qd_Double(42)/Qd_Double(10)),
      "24567.248054214781995325297715676" },
    { "ln(1e-290)", log(Dec("1e-290")),
      "-667.74967696827324836521752185847" },
    { "exp(700)", exp(Qd_Double(700)),
      "1.0142320547350045094553295952312673e+304" },
    { "exp(708)", exp(Qd_Double(708)),
      "3.0233831442760550147756219850967309e+307" },
    { "exp(1.000000000000000000001)",
      exp(Dec("1.000000000000000000001")),
      "2.7182818284590452353630057531811221" },
    { "exp(0.999999999999999999999)",
      exp(Dec("0.999999999999999999999")),
      "2.7182818284590452353575691895242041" }
  };

  // Roots and angles near the ends of the double range, including
  // subnormal inputs.  Inputs are exact doubles; references are the
  // correctly rounded results for those values.
  const double big = 0.9*DBL_MAX;
  const CloseCheck range_checks[] = {
    { "sqrt(1e-300)", sqrt(Qd_Double(1e-300)),
      "1.0000000000000000125295459176043797643533e-150" },
    { "sqrt(1e300)", sqrt(Qd_Double(1e300)),
      "1.0000000000000000262523801276022097797585e+150" },
    { "sqrt(1e-310)", sqrt(Qd_Double(1e-310)),
      "9.9999999999999847246637514488343178854133e-156" },
    { "sqrt(4e-320)", sqrt(Qd_Double(4e-320)),
      "1.9999888671516979275841360685503751956526e-160" },
    { "sqrt(2.2e-308)", sqrt(Qd_Double(2.2e-308)),
      "1.4832396974191326557367012783770415700556e-154" },
    { "sqrt(1e308)", sqrt(Qd_Double(1e308)),
      "1.0000000000000000054895318147202276936350e+154" },
    { "sqrt(0.9*DBL_MAX)", sqrt(Qd_Double(big)),
      "1.2719763446605774662318670134164161481251e+154" },
    { "cbrt(1e-310)", cbrt(Qd_Double(1e-310)),
      "4.6415888336127741656213989538777974008065e-104" },
    { "cbrt(1e308)", cbrt(Qd_Double(1e308)),
      "4.6415888336127789093968427328977819658549e+102" },
    { "cbrt(-1e-300)", cbrt(Qd_Double(-1e-300)),
      "-1.0000000000000000083530306117362531587923e-100" },
    { "cbrt(0.9*DBL_MAX)", cbrt(Qd_Double(big)),
      "5.4490319761795484061361642157209272143349e+102" },
    { "nroot(1e300,7)", nroot(Qd_Double(1e300),7),
      "7.1968567300115202532691838496787559910170e+42" },
    { "nroot(1e-310,5)", nroot(Qd_Double(1e-310),5),
      "9.9999999999999938898655005795309271233953e-63" },
    { "nroot(4e-320,4)", nroot(Qd_Double(4e-320),4),
      "1.4142096263113534356211471250010015800330e-80" },
    { "nroot(0.9*DBL_MAX,9)", nroot(Qd_Double(big),9),
      "1.7597046655120868545287019533494714925468e+34" },
    { "atan2(1e200,3e200)", atan2(Qd_Double(1e200),Qd_Double(3e200)),
      "3.2175055439664219340140461435866131902076e-1" },
    { "atan2(-1e-200,3e-200)",
      atan2(Qd_Double(-1e-200),Qd_Double(3e-200)),
      "-3.2175055439664219340140461435866131902076e-1" },
    { "atan2(1e300,-2e300)", atan2(Qd_Double(1e300),Qd_Double(-2e300)),
      "2.6779450445889871222483871518182884821686e+0" },
    { "atan2(5e-300,5e-301)",
      atan2(Qd_Double(5e-300),Qd_Double(5e-301)),
      "1.4711276743037345885700850535605050913405e+0" },
    { "atan2(-3e-310,-7e-310)",
      atan2(Qd_Double(-3e-310),Qd_Double(-7e-310)),
      "-2.7367008673047098151505704542700602676453e+0" }
  };

  const ExactCheck exact_checks[] = {
    { "sqrt(-3)", sqrt(Qd_Double(-3)), NaN },
    { "sqrt(0)", sqrt(Zero), Zero },
    { "sqrt(inf)", sqrt(Inf), Inf },
    { "sqrt(4)", sqrt(Qd_Double(4)), Qd_Double(2) },
    { "exp(-600)", exp(Qd_Double(-600)), Zero },
    { "exp(-710)", exp(Qd_Double(-710)), Zero },
    { "exp(710)", exp(Qd_Double(710)), Inf },
    { "exp(0)", exp(Zero), One },
    { "exp(-0)", exp(NegZero), One },
    { "exp(1)", exp(One), E },
    { "exp(inf)", exp(Inf), Inf },
    { "exp(-inf)", exp(NegInf), Zero },
    { "exp(nan)", exp(NaN), NaN },
    { "ln(-pi)", log(-PI), NaN },
    { "ln(1)", log(One), Zero },
    { "ln(0)", log(Zero), NegInf },
    { "ln(-0)", log(NegZero), NaN },
    { "ln(inf)", log(Inf), Inf },
    { "ln(-inf)", log(NegInf), NaN },
    { "ln(nan)", log(NaN), NaN },
    { "log10(1)", log10(One), Zero },
    { "log10(0)", log10(Zero), NegInf },
    { "log10(inf)", log10(Inf), Inf },
    { "log10(-inf)", log10(NegInf), NaN },

    { "1/0", One/Zero, Inf },
    { "-1/0", -One/Zero, NegInf },
    { "1/-0", One/NegZero, NegInf },
    { "0/0", Zero/Zero, NaN },
    { "inf/inf", Inf/Inf, NaN },
    { "1/inf", One/Inf, Zero },
    { "-1/inf", -One/Inf, NegZero },
    { "0*inf", Zero*Inf, NaN },
    { "inf*-2", Inf*Qd_Double(-2), NegInf },
    { "-0*3", NegZero*Qd_Double(3), NegZero },
    { "inf-inf", Inf - Inf, NaN },
    { "inf+1", Inf + One, Inf },
    { "-0+-0", NegZero + NegZero, NegZero },
    { "-0+0", NegZero + Zero, Zero },
    { "nan+1", NaN + One, NaN },

    { "pow(0,0)", pow(Zero,Zero), NaN },
    { "pow(0,2)", pow(Zero,Qd_Double(2)), Zero },
    { "pow(0,-2)", pow(Zero,Qd_Double(-2)), Inf },
    { "pow(1,inf)", pow(One,Inf), NaN },
    { "pow(1,-inf)", pow(One,NegInf), NaN },
    { "pow(2,inf)", pow(Qd_Double(2),Inf), Inf },
    { "pow(2,-inf)", pow(Qd_Double(2),NegInf), Zero },
    { "powi(2,10)", powi(Qd_Double(2),10), Qd_Double(1024) },
    { "powi(pi,0)", powi(PI,0), One },
    { "powi(pi,1)", powi(PI,1), PI },
    { "powi(1,INT_MIN)", powi(One,INT_MIN), One },
    { "powi(-1,INT_MIN)", powi(-One,INT_MIN), One },
    { "powi(2,INT_MIN)", powi(Qd_Double(2),INT_MIN), Zero },
    { "sqrt(2^-1074)", sqrt(Qd_Double(std::ldexp(1.0,-1074))),
      Qd_Double(std::ldexp(1.0,-537)) },
    { "nroot(-16,4)", nroot(Qd_Double(-16),4), NaN },
    { "nroot(0,5)", nroot(Zero,5), Zero },
    { "nroot(2,0)", nroot(Qd_Double(2),0), NaN },

    { "atan2(0,0)", atan2(Zero,Zero), NaN },
    { "atan2(1,0)", atan2(One,Zero), Qd_Double::HALF_PI },
    { "atan2(-1,0)", atan2(-One,Zero), -Qd_Double::HALF_PI },
    { "atan2(0,1)", atan2(Zero,One), Zero },
    { "atan2(0,-1)", atan2(Zero,-One), PI },
    { "atan2(inf,inf)", atan2(Inf,Inf), NaN },
    { "atan2(inf,1)", atan2(Inf,One), Qd_Double::HALF_PI },
    { "atan2(-inf,1)", atan2(NegInf,One), -Qd_Double::HALF_PI },
    { "atan2(1,inf)", atan2(One,Inf), Zero },
    { "atan2(2,2)", atan2(Qd_Double(2),Qd_Double(2)),
      Qd_Double::QUARTER_PI },
    { "atan2(-2,-2)", atan2(Qd_Double(-2),Qd_Double(-2)),
      -Qd_Double::THREE_QUARTER_PI },
    { "atan2(2,-2)", atan2(Qd_Double(2),Qd_Double(-2)),
      Qd_Double::THREE_QUARTER_PI },
    { "atan2(-2,2)", atan2(Qd_Double(-2),Qd_Double(2)),
      -Qd_Double::QUARTER_PI },
    { "sin(0)", sin(Zero), Zero },
    { "cos(0)", cos(Zero), One },
    { "sin(inf)", sin(Inf), NaN },

    { "floor(2-1e-20)", floor(Qd_Double(2.0,-1e-20)), One },
    { "ceil(2+1e-20)", ceil(Qd_Double(2.0,1e-20)), Qd_Double(3) },
    { "floor(-2.5)", floor(Qd_Double(-2.5)), Qd_Double(-3) },
    { "ceil(-2.5)", ceil(Qd_Double(-2.5)), Qd_Double(-2) },
    { "fabs(-pi)", fabs(-PI), PI },
    { "ldexp(pi,3)", ldexp(PI,3), PI*8.0 },
    { "2^60+1", Qd_Double((int64_t(1)<<60) + 1),
      Qd_Double::FromLimbs(1152921504606846976.0,1.0) },
    { "FromSum(1,2^-60)", Qd_Double::FromSum(1.0,std::ldexp(1.0,-60)),
      Qd_Double::FromLimbs(1.0,std::ldexp(1.0,-60)) },
    { "FromDiff(1,2^-60)", Qd_Double::FromDiff(1.0,std::ldexp(1.0,-60)),
      Qd_Double::FromLimbs(1.0,-std::ldexp(1.0,-60)) },
    { "FromProd(1+2^-52,1+2^-52)",
      Qd_Double::FromProd(1.0+std::ldexp(1.0,-52),1.0+std::ldexp(1.0,-52)),
      Qd_Double::FromLimbs(1.0+std::ldexp(1.0,-51),std::ldexp(1.0,-104)) },
    { "FromSquare(1+2^-52)",
      Qd_Double::FromSquare(1.0+std::ldexp(1.0,-52)),
      Qd_Double::FromLimbs(1.0+std::ldexp(1.0,-51),std::ldexp(1.0,-104)) },
    { "FromQuot(1,3)", Qd_Double::FromQuot(1.0,3.0),
      Qd_Double::FromLimbs(1.0/3.0,std::ldexp(1.0/3.0,-54)) },
    { "FromQuot(1,0)", Qd_Double::FromQuot(1.0,0.0), Inf }
  };

  const int close_count = static_cast<int>(ArraySize(close_checks));
  const int wide_count = static_cast<int>(ArraySize(wide_checks));
  const int range_count = static_cast<int>(ArraySize(range_checks));
  const int exact_count = static_cast<int>(ArraySize(exact_checks));
  test_count = close_count + wide_count + range_count + exact_count;
  return RunCloseChecks(close_checks,close_count,1e-30)
    + RunCloseChecks(wide_checks,wide_count,1e-28)
    + RunCloseChecks(range_checks,range_count,1e-29)
    + RunExactChecks(exact_checks,exact_count);
}

// Renormalizing a canonical double-double leaves it unchanged.
int RenormTest(int& test_count)
{
  int errcount = 0;
  test_count = 0;
  for(size_t i=0;i<ArraySize(func_array);++i) {
    const FuncInfo& fi = func_array[i];
    for(int k=1;k<=16;++k) {
      const Qd_Double x = Qd_Double::PI*static_cast<double>(k)/17.0;
      const Qd_Double y = Qd_Double::E/static_cast<double>(k);
      Qd_Double r;
      if(fi.func_type == FuncInfo::FT_DD) {
        r = reinterpret_cast<QDD_1P>(fi.fptr)(x);
      } else {
        r = reinterpret_cast<QDD_2P>(fi.fptr)(x,y);
      }
      double c0 = r.Hi();
      double c1 = r.Lo();
      Qd_Renormalize(c0,c1);
      ++test_count;
      if(c0 != r.Hi() || c1 != r.Lo()) {
        ++errcount;
        cerr << "FAIL renormalize " << fi.name << "(" << DDWrite(x)
             << "): " << DDWrite(r) << " -> "
             << DDWrite(Qd_Double::FromLimbs(c0,c1)) << "\n";
      }
    }
  }
  return errcount;
}

////////////////////////////////////////////////////////////////////////

void Usage()
{
  fprintf(stderr,"Usage: ddtest basetest [-slack amount] [-verbose[=#]]\n");
  fprintf(stderr," or\n");
  fprintf(stderr,"       ddtest quicktest\n");
  fprintf(stderr," or\n");
  fprintf(stderr,"       ddtest scenariotest\n");
  fprintf(stderr,"Base test functions---\n");
  size_t istop = ArraySize(func_array);
  for(size_t i=0;i<istop;++i) {
    fprintf(stderr,"%18s",func_array[i].name);
    if((i+1)%4==0 || (i+1)==istop) fputs("\n",stderr);
  }
  exit(1);
}

int wrapped_main(int argc,char** argv)
{
  if(argc<2) Usage();

  // Check for "quicktest" request
  if(argc==2 && strcmp("quicktest",argv[1])==0) {
    if(Qd_Double::QuickTest()) {
      fprintf(stderr,"QuickTest failure.\n");
      return 1;
    }
    printf("QuickTest passed.\n");
    return 0;
  }

  // Check for "scenariotest" request
  if(argc==2 && strcmp("scenariotest",argv[1])==0) {
    int scenario_count = 0;
    int renorm_count = 0;
    const int error_count
      = ScenarioTest(scenario_count) + RenormTest(renorm_count);
    const int test_count = scenario_count + renorm_count;
    if(error_count>0) {
      fprintf(stderr,"ERROR: %d/%d tests failed.\n",
              error_count,test_count);
      return 1;
    }
    printf("All %d tests passed.\n",test_count);
    return 0;
  }

  // Check for "basetest" request
  if(strcmp("basetest",argv[1])==0) {
    int verbose = 1;
    for(int i=2;i<argc;++i) {
      if(strcmp("-slack",argv[i])==0 && i+1<argc) {
        char* endptr;
        const double slack = strtod(argv[++i],&endptr);
        if(*endptr != '\0' || slack<0.0) Usage();
        DDTest::SetComparisonSlack(slack);
      } else if(strncmp("-verbose",argv[i],8)==0) {
        verbose = 2;
        if(argv[i][8] == '=') verbose = atoi(argv[i]+9);
        else if(argv[i][8] != '\0') Usage();
      } else {
        Usage();
      }
    }
    DDTest::SetVerbose(verbose);
    int error_count = 0;
    const int test_count = static_cast<int>(ArraySize(test_data));
    for(int i=0;i<test_count;++i) {
      if(!test_data[i].Test()) {
        fprintf(stderr,"Test #%d failed\n",i);
        ++error_count;
      } else if(verbose>=3) {
        fprintf(stderr,"Test #%d passed\n",i);
      }
    }
    if(error_count>0) {
      fprintf(stderr,"ERROR: %d/%d tests failed.\n",
              error_count,test_count);
      return 1;
    }
    printf("All %d tests passed.\n",test_count);
    return 0;
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
