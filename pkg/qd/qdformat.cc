/* FILE: qdformat.cc
 *
 * Decimal string conversion for Qd_Double and Qd_Quad.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 */

#if defined(__GNUC__) && !defined(__clang__) && !defined(__INTEL_COMPILER)
# pragma GCC optimize ("-ffp-contract=off")
#endif
#if defined(__INTEL_COMPILER) || defined(_MSC_VER)
# pragma fp_contract (off)
#endif

#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

#include <algorithm>
#include <ostream>
#include <string>
#include <vector>

#include "qdformat.h"
#include "qdmessages.h"

/* End includes */

using namespace std;

const char* Qd_ParseError::GetMessage() const
{
  switch(kind) {
  case EMPTY:   return "cannot parse number from empty string";
  case INVALID: return "invalid number literal";
  }
  return "unknown parse error";
}

////////////////////////////////////////////////////////////////////////
// Format specification

namespace {

bool IsAlign(char ch)
{
  return (ch == '<' || ch == '>' || ch == '^');
}

// Reads a run of decimal digits starting at cptr.  Returns false if
// there are none or the value is unreasonably large.
bool ScanCount(const char*& cptr,int& value)
{
  if(!isdigit(static_cast<unsigned char>(*cptr))) return false;
  value = 0;
  while(isdigit(static_cast<unsigned char>(*cptr))) {
    value = 10*value + (*cptr - '0');
    if(value > 100000) return false;
    ++cptr;
  }
  return true;
}

} // namespace

bool Qd_FormatSpec::Parse(const char* str,Qd_FormatSpec& spec)
{
  if(str == 0) return false;
  Qd_FormatSpec result;
  const char* cptr = str;

  if(cptr[0] != '\0' && IsAlign(cptr[1])) {
    result.fill = cptr[0];
    result.align = cptr[1];
    cptr += 2;
  } else if(IsAlign(cptr[0])) {
    result.align = cptr[0];
    ++cptr;
  }

  if(*cptr == '+') {
    result.plus = true;
    ++cptr;
  }

  if(isdigit(static_cast<unsigned char>(*cptr))) {
    if(!ScanCount(cptr,result.width)) return false;
  }

  if(*cptr == '.') {
    ++cptr;
    if(!ScanCount(cptr,result.precision)) return false;
  }

  if(*cptr == 'e' || *cptr == 'E') {
    result.exponent = true;
    result.upper = (*cptr == 'E');
    ++cptr;
  }

  if(*cptr != '\0') return false;
  spec = result;
  return true;
}

////////////////////////////////////////////////////////////////////////
// Digit extraction

namespace {

// Scales r into [1,10) and returns the decimal exponent removed.
template<class T>
int CalculateExponent(T& r)
{
  // The lead limb estimate can be off by one either way.
  int exponent = static_cast<int>(floor(log10(fabs(r.Hi()))));
  const T ten(10.0);
  if(exponent < -300) {
    // 10^exponent would underflow
    r *= powi(ten,300);
    r /= powi(ten,exponent+300);
  } else if(exponent > 300) {
    r = ldexp(r,-53);
    r /= powi(ten,exponent);
    r = ldexp(r,53);
  } else {
    r /= powi(ten,exponent);
  }

  if(r >= ten) {
    r /= ten;
    ++exponent;
  } else if(r < T(1.0)) {
    r *= ten;
    --exponent;
  }
  return exponent;
}

template<class T>
void ExtractDigitsT(const T& x,int ndigits,
                    std::vector<int>& digits,int& exponent)
{
  digits.assign(ndigits > 0 ? ndigits : 0,0);
  exponent = 0;
  T r = fabs(x);
  if(r.IsZero() || ndigits < 1) return;

  exponent = CalculateExponent(r);

  // One extra digit for rounding.  A lower limb of opposite sign to the
  // leading limb can leave individual digits in [-9,9] or at 10.
  std::vector<int> d(ndigits+1);
  for(int i=0;i<=ndigits;++i) {
    const int digit = static_cast<int>(r.Hi());
    r -= static_cast<double>(digit);
    r *= 10.0;
    d[i] = digit;
  }

  for(int i=ndigits;i>0;--i) {
    if(d[i] < 0) {
      d[i] += 10;
      --d[i-1];
    } else if(d[i] > 9) {
      d[i] -= 10;
      ++d[i-1];
    }
  }

  if(d[ndigits] >= 5) {
    int i = ndigits - 1;
    ++d[i];
    while(i > 0 && d[i] > 9) {
      d[i] -= 10;
      ++d[--i];
    }
    if(d[0] > 9) {
      // All digits carried out; the value is now 10^(exponent+1)
      d[0] = 1;
      ++exponent;
    }
  }

  std::copy(d.begin(),d.begin()+ndigits,digits.begin());
}

////////////////////////////////////////////////////////////////////////
// Formatting

void PushZero(std::string& out,int precision)
{
  out += '0';
  if(precision > 0) {
    out += '.';
    out.append(precision,'0');
  }
}

void DropTrailingZeros(std::string& out)
{
  if(out.find('.') == std::string::npos) return;
  std::string::size_type end = out.find_last_not_of('0');
  if(out[end] == '.') --end;
  out.erase(end+1);
}

// Fixed notation digits of finite, nonzero |x|.  With precision < 0
// all T::DIGITS significant digits are produced and trailing
// fraction zeros dropped.
template<class T>
void PushFixed(std::string& out,const T& x,int precision)
{
  T r = fabs(x);
  const int exponent = CalculateExponent(r);
  const bool trim = (precision < 0);
  if(trim) precision = std::max(T::DIGITS - exponent - 1,0);

  const int ndigits = exponent + 1 + precision;
  if(ndigits < 0) {
    PushZero(out,precision);
    return;
  }
  std::vector<int> digits;
  int dexp;
  if(ndigits == 0) {
    // Only the rounding digit is significant
    ExtractDigitsT(x,1,digits,dexp);
    if(dexp > exponent || digits[0] >= 5) {
      if(precision == 0) {
        out += '1';
      } else {
        out += "0.";
        out.append(precision-1,'0');
        out += '1';
      }
    } else {
      PushZero(out,precision);
    }
    return;
  }

  ExtractDigitsT(x,ndigits,digits,dexp);
  if(dexp > exponent) digits.push_back(0); // Rounding gained a place

  // Digit i has place value 10^(dexp-i)
  if(dexp < 0) {
    out += '0';
  } else {
    for(int i=0;i<=dexp;++i) out += static_cast<char>('0' + digits[i]);
  }
  if(precision > 0) {
    out += '.';
    for(int j=1;j<=precision;++j) {
      const int i = dexp + j;
      out += (i < 0 ? '0' : static_cast<char>('0' + digits[i]));
    }
  }
  if(trim) DropTrailingZeros(out);
}

template<class T>
void PushExponent(std::string& out,const T& x,int precision,char marker)
{
  int exponent = 0;
  if(x.IsZero()) {
    PushZero(out,precision);
  } else {
    const int ndigits = (precision < 0 ? T::DIGITS - 1 : precision) + 1;
    std::vector<int> digits;
    ExtractDigitsT(x,ndigits,digits,exponent);
    out += static_cast<char>('0' + digits[0]);
    if(ndigits > 1) {
      out += '.';
      for(int i=1;i<ndigits;++i) out += static_cast<char>('0' + digits[i]);
    }
    if(precision < 0) DropTrailingZeros(out);
  }
  char buf[32];
  Qd_Snprintf(buf,sizeof(buf),"%c%d",marker,exponent);
  out += buf;
}

std::string AlignAndFill(const std::string& text,const Qd_FormatSpec& spec)
{
  const int pad = spec.width - static_cast<int>(text.size());
  if(pad <= 0) return text;
  switch(spec.align) {
  case '<':
    return text + std::string(pad,spec.fill);
  case '^':
    return std::string(pad/2,spec.fill) + text
      + std::string(pad - pad/2,spec.fill);
  default:
    break;
  }
  return std::string(pad,spec.fill) + text;
}

template<class T>
std::string FormatT(const T& x,const Qd_FormatSpec& spec)
{
  std::string out;
  if(x.IsNaN()) {
    out = "NaN";
  } else {
    if(x.IsSignNegative())  out += '-';
    else if(spec.plus)      out += '+';

    if(x.IsInfinite()) {
      out += "inf";
    } else if(spec.exponent) {
      PushExponent(out,x,spec.precision,(spec.upper ? 'E' : 'e'));
    } else if(x.IsZero()) {
      PushZero(out,spec.precision);
    } else {
      PushFixed(out,x,spec.precision);
    }
  }
  return AlignAndFill(out,spec);
}

Qd_FormatSpec StreamSpec(const std::ostream& os)
{
  Qd_FormatSpec spec;
  const std::ios_base::fmtflags flags = os.flags();
  if(flags & std::ios_base::showpos) spec.plus = true;
  const std::ios_base::fmtflags floatfield
    = flags & std::ios_base::floatfield;
  if(floatfield == std::ios_base::scientific) {
    spec.exponent = true;
    spec.upper = ((flags & std::ios_base::uppercase) != 0);
    spec.precision = static_cast<int>(os.precision());
  } else if(floatfield == std::ios_base::fixed) {
    spec.precision = static_cast<int>(os.precision());
  }
  return spec;
}

} // namespace

void Qd_ExtractDigits(const Qd_Double& x,int ndigits,
                      std::vector<int>& digits,int& exponent)
{
  ExtractDigitsT(x,ndigits,digits,exponent);
}

void Qd_ExtractDigits(const Qd_Quad& x,int ndigits,
                      std::vector<int>& digits,int& exponent)
{
  ExtractDigitsT(x,ndigits,digits,exponent);
}

std::string Qd_Format(const Qd_Double& x,const Qd_FormatSpec& spec)
{
  return FormatT(x,spec);
}

std::string Qd_Format(const Qd_Quad& x,const Qd_FormatSpec& spec)
{
  return FormatT(x,spec);
}

std::ostream& operator<<(std::ostream& os,const Qd_Double& x)
{
  return os << Qd_Format(x,StreamSpec(os));
}

std::ostream& operator<<(std::ostream& os,const Qd_Quad& x)
{
  return os << Qd_Format(x,StreamSpec(os));
}

////////////////////////////////////////////////////////////////////////
// Parsing

namespace {

// Signed decimal integer filling all of str, in int range.  The
// value is clamped to +/-EXPONENT_LIMIT, past which 10^value is 0 or
// inf in either type, so later digit count adjustments cannot
// overflow.
const int EXPONENT_LIMIT = 100000;

bool ScanExponent(const char* str,int& value)
{
  const char* cptr = str;
  if(*cptr == '+' || *cptr == '-') ++cptr;
  if(*cptr == '\0') return false;
  for(;*cptr != '\0';++cptr) {
    if(!isdigit(static_cast<unsigned char>(*cptr))) return false;
  }
  errno = 0;
  char* endptr;
  const long result = strtol(str,&endptr,10);
  if(errno != 0 || *endptr != '\0'
     || result < INT_MIN || result > INT_MAX) return false;
  if(result > EXPONENT_LIMIT)       value = EXPONENT_LIMIT;
  else if(result < -EXPONENT_LIMIT) value = -EXPONENT_LIMIT;
  else                              value = static_cast<int>(result);
  return true;
}

bool Fail(Qd_ParseError& error,Qd_ParseError::Kind kind)
{
  error = Qd_ParseError(kind);
  return false;
}

template<class T>
bool ParseT(const std::string& text,T& result,Qd_ParseError& error)
{
  const char* whitespace = " \t\n\v\f\r";
  const std::string::size_type start = text.find_first_not_of(whitespace);
  if(start == std::string::npos) return Fail(error,Qd_ParseError::EMPTY);
  const std::string::size_type stop = text.find_last_not_of(whitespace);
  const std::string str = text.substr(start,stop-start+1);

  std::string lower(str);
  for(std::string::size_type i=0;i<lower.size();++i) {
    const unsigned char ch = static_cast<unsigned char>(lower[i]);
    lower[i] = static_cast<char>(tolower(ch));
  }
  if(lower.compare("nan") == 0) {
    result = T::QNAN;
    return true;
  }
  if(lower.compare("inf") == 0) {
    result = T::POS_INF;
    return true;
  }
  if(lower.compare("-inf") == 0) {
    result = T::NEG_INF;
    return true;
  }

  T value(0.0);
  int digits = 0;
  int point = -1;   // Digit count at the decimal point
  int sign = 0;
  int exponent = 0;
  bool done = false;
  for(std::string::size_type i=0;i<str.size() && !done;++i) {
    const char ch = str[i];
    if('0' <= ch && ch <= '9') {
      value *= 10.0;
      value += static_cast<double>(ch - '0');
      ++digits;
      continue;
    }
    switch(ch) {
    case '.':
      if(point >= 0) return Fail(error,Qd_ParseError::INVALID);
      point = digits;
      break;
    case '-':
    case '+':
      if(sign != 0 || digits > 0) {
        return Fail(error,Qd_ParseError::INVALID);
      }
      sign = (ch == '-' ? -1 : 1);
      break;
    case 'e':
    case 'E':
      if(!ScanExponent(str.c_str()+i+1,exponent)) {
        return Fail(error,Qd_ParseError::INVALID);
      }
      done = true;
      break;
    case '_':
      break;
    default:
      return Fail(error,Qd_ParseError::INVALID);
    }
  }

  if(point >= 0) exponent -= digits - point;
  if(exponent != 0 && !value.IsZero()) {
    exponent = std::max(std::min(exponent,EXPONENT_LIMIT),
                        -EXPONENT_LIMIT);
    const T ten(10.0);
    if(exponent < -307) {
      // Two stages, so 10^exponent doesn't underflow before the
      // digits are scaled.
      const int adjust = exponent + 307;
      value *= powi(ten,adjust);
      exponent -= adjust;
    }
    value *= powi(ten,exponent);
  }
  if(sign == -1) value = -value;

  result = value;
  return true;
}

} // namespace

bool Qd_Parse(const std::string& text,Qd_Double& result,
              Qd_ParseError& error)
{
  return ParseT(text,result,error);
}

bool Qd_Parse(const std::string& text,Qd_Quad& result,
              Qd_ParseError& error)
{
  return ParseT(text,result,error);
}
