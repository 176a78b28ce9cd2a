/* FILE: qdcommon.cc
 *
 * Limb-level support shared by the Qd_Double and Qd_Quad classes.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 */

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "qdcommon.h"
#include "qdexcept.h"
#include "qdmessages.h"

/* End includes */

////////////////////////////////////////////////////////////////////////
/// Start value safe block (associative floating point optimization
/// disallowed).
////////////////////////////////////////////////////////////////////////

// isnan/isinf/isfinite are unreliable under aggressive floating-point
// compiler options.  A volatile range check holds up.
bool Qd_IsFinite(double tx)
{
  volatile double x = tx;
  return (-QD_DOUBLE_MAX<=x && x<=QD_DOUBLE_MAX);
}

bool Qd_IsPosInf(double tx)
{
  volatile double x = tx;
  return (x == QD_INFINITY && !(x == -QD_INFINITY));
}

bool Qd_IsNegInf(double tx)
{
  volatile double x = tx;
  return (x == -QD_INFINITY && !(x == QD_INFINITY));
}

bool Qd_IsNaN(double x)
{
  return !(Qd_IsFinite(x) || Qd_IsPosInf(x) || Qd_IsNegInf(x));
}

bool Qd_IsZero(double x)
{
  return (Qd_IsFinite(x) && 0.0 == x);
}

bool Qd_AreEqual(double x,double y)
{
  if(Qd_IsNaN(x) || Qd_IsNaN(y)) return false;
  return (x == y);
}

bool Qd_SignBit(double x)
{ // The only bit differing between 1.0 and -1.0 is the sign bit.
  union BITS {
    double f;
    unsigned long long u;
  };
  BITS a = {1.0};
  BITS b = {-1.0};
  BITS c = { x };
  return ((a.u ^ b.u) & c.u) != 0;
}

////////////////////////////////////////////////////////////////////////
/// End value safe block
////////////////////////////////////////////////////////////////////////

namespace {

double SignedValue(double magnitude,bool negative)
{
  return (negative ? -magnitude : magnitude);
}

} // namespace

bool Qd_SpecialProduct(Qd_ValueClass aclass,bool asign,
                       Qd_ValueClass bclass,bool bsign,double& result)
{
  const bool negative = (asign != bsign);
  if(aclass == QD_CLASS_NAN || bclass == QD_CLASS_NAN) {
    result = QD_NAN;
  } else if(aclass == QD_CLASS_ZERO) {
    result = (bclass == QD_CLASS_INF ? QD_NAN : SignedValue(0.0,negative));
  } else if(aclass == QD_CLASS_INF) {
    result = (bclass == QD_CLASS_ZERO ? QD_NAN
              : SignedValue(QD_INFINITY,negative));
  } else if(bclass == QD_CLASS_ZERO) {
    result = SignedValue(0.0,negative);
  } else if(bclass == QD_CLASS_INF) {
    result = SignedValue(QD_INFINITY,negative);
  } else {
    return false;
  }
  return true;
}

bool Qd_SpecialQuotient(Qd_ValueClass aclass,bool asign,
                        Qd_ValueClass bclass,bool bsign,double& result)
{
  const bool negative = (asign != bsign);
  if(aclass == QD_CLASS_NAN || bclass == QD_CLASS_NAN) {
    result = QD_NAN;
  } else if(aclass == QD_CLASS_ZERO) {
    result = (bclass == QD_CLASS_ZERO ? QD_NAN : SignedValue(0.0,negative));
  } else if(aclass == QD_CLASS_INF) {
    result = (bclass == QD_CLASS_INF ? QD_NAN
              : SignedValue(QD_INFINITY,negative));
  } else if(bclass == QD_CLASS_ZERO) {
    result = SignedValue(QD_INFINITY,negative);
  } else if(bclass == QD_CLASS_INF) {
    result = SignedValue(0.0,negative);
  } else {
    return false;
  }
  return true;
}

namespace {

// Special value text, or empty string if value is finite.
std::string SpecialValueString(double value)
{
  if(Qd_IsFinite(value)) return std::string();
  if(Qd_IsPosInf(value)) return std::string("Inf");
  if(Qd_IsNegInf(value)) return std::string("-Inf");
  return std::string("NaN");
}

// Returns hex digit value of ch, or -1 if ch is not a hex digit.
int HexDigitValue(unsigned char ch)
{
  if('0'<=ch && ch<='9') return ch - '0';
  if('a'<=ch && ch<='f') return ch - 'a' + 10;
  if('A'<=ch && ch<='F') return ch - 'A' + 10;
  return -1;
}

// Scales value by 2^exponent in stages that can't over or underflow
// before the final multiply.
double ScaleByPowerOfTwo(double value,int exponent)
{
  while(exponent > QD_DOUBLE_HUGE_EXP-1) {
    value *= std::pow(2.0,double(QD_DOUBLE_HUGE_EXP-1));
    exponent -= QD_DOUBLE_HUGE_EXP-1;
  }
  while(exponent < QD_DOUBLE_TINY_EXP+1) {
    value *= std::pow(2.0,double(QD_DOUBLE_TINY_EXP+1));
    exponent -= QD_DOUBLE_TINY_EXP+1;
  }
  return value * std::pow(2.0,double(exponent));
}

// Skips leading junk, reads an optional sign and an optional "0x"
// prefix.  Returns pointer to first mantissa character.
const unsigned char* ScanHexPrefix(const unsigned char* ptr,int& sign)
{
  unsigned char ch;
  while((ch=*ptr) != 0x0 && ch!='+' && ch!='-' && HexDigitValue(ch)<0) {
    ++ptr;
  }
  sign = 1;
  if(ch=='-') {
    sign = -1;
    ++ptr;
  } else if(ch=='+') {
    ++ptr;
  }
  if(ptr[0] == '0' && (ptr[1] == 'x' || ptr[1] == 'X')) {
    ptr += 2;
  }
  return ptr;
}

// Hexhex (mmmxeee, power of 16) and hexbin (mmmxbeee, power of 2)
double ScanHexBinFloat(const char* cptr)
{
  int sign;
  const unsigned char* ptr
    = ScanHexPrefix(reinterpret_cast<const unsigned char*>(cptr),sign);

  double value = 0.0;
  int digit;
  while((digit = HexDigitValue(*ptr)) >= 0) {
    value = 16*value + digit;
    ++ptr;
  }

  int exponent = 0;
  if(*ptr=='x' || *ptr=='X') {
    ++ptr;
    if(*ptr=='b' || *ptr=='B') {
      exponent = atoi(reinterpret_cast<const char*>(ptr+1));
    } else {
      exponent = 4*atoi(reinterpret_cast<const char*>(ptr));
    }
  } else if(*ptr != '\0' && !isspace(*ptr)) {
    std::string errmsg = "Invalid hexbin float string: ";
    errmsg += cptr;
    QD_THROWEXCEPT("","ScanHexBinFloat",errmsg.c_str());
  }
  value = ScaleByPowerOfTwo(value,exponent);
  return (sign<0 ? -value : value);
}

// C99 hexfloat, 0x1.mmmpeee
double ScanC99HexFloat(const char* cptr)
{
  int sign;
  const unsigned char* ptr
    = ScanHexPrefix(reinterpret_cast<const unsigned char*>(cptr),sign);

  if(ptr[0] == '0') {
    // Zero; keep the sign.
    return std::copysign(0.0,double(sign));
  }
  if(ptr[0] != '1' || ptr[1] != '.') {
    std::string errmsg = "Invalid C99 hexfloat string: ";
    errmsg += cptr;
    QD_THROWEXCEPT("","ScanC99HexFloat",errmsg.c_str());
  }
  ptr += 2;

  double value = 1.0;
  int exponent = 0;
  int digit;
  while((digit = HexDigitValue(*ptr)) >= 0) {
    value = 16*value + digit;
    exponent -= 4;
    ++ptr;
  }
  if(*ptr=='p' || *ptr=='P') {
    exponent += atoi(reinterpret_cast<const char*>(ptr+1));
  }
  value = ScaleByPowerOfTwo(value,exponent);
  return (sign<0 ? -value : value);
}

} // namespace

int Qd_HexBinaryFloatWidth()
{
  return (QD_DOUBLE_MANTISSA_PRECISION+3)/4 + 6
    + (QD_DOUBLE_HUGE_EXP<3000 ? 3 : 4);
}

std::string Qd_HexBinaryFloatFormat(double value)
{
  std::string special = SpecialValueString(value);
  if(!special.empty()) return special;

  std::string result;
  int exp;
  double mantissa = QD_FREXP(value,&exp);
  if(!Qd_SignBit(value)) { // Qd_SignBit detects -0.0
    result += ' ';
  } else {
    result += '-';
    mantissa *= -1;
  }
  result += "0x";

  // If the precision isn't a multiple of 4, the first hex digit
  // carries the left-over bits.
  const int lead_bits = (QD_DOUBLE_MANTISSA_PRECISION%4 != 0
                         ? QD_DOUBLE_MANTISSA_PRECISION%4 : 4);
  mantissa = Qd_LdExp(mantissa,lead_bits);
  exp -= lead_bits;
  static const char hexdigits[] = "0123456789ABCDEF";
  for(int offset=0; 4*offset<QD_DOUBLE_MANTISSA_PRECISION; ++offset) {
    int ival = static_cast<int>(floor(mantissa));
    result += hexdigits[ival];
    mantissa = 16*(mantissa - ival);
    exp -= 4;
  }
  exp += 4;

  char buf[16];
  Qd_Snprintf(buf,sizeof(buf),
              (QD_DOUBLE_HUGE_EXP<3000 ? "xb%+04d" : "xb%+05d"),exp);
  result += buf;
  return result;
}

double Qd_ScanFloat(const char* cptr)
{
  const char* special = strstr(cptr,"Inf");
  if(special) {
    if(special>cptr && *(special-1) == '-') return -QD_INFINITY;
    return QD_INFINITY;
  }
  if(strstr(cptr,"NaN")) return QD_NAN;

  // C99 hexfloats also contain an 'x' (in the 0x prefix), so check
  // for 'p' first.
  if(strchr(cptr,'p') || strchr(cptr,'P')) {
    return ScanC99HexFloat(cptr);
  }
  if(strchr(cptr,'x') || strchr(cptr,'X')) {
    return ScanHexBinFloat(cptr);
  }
  return strtod(cptr,0);
}
