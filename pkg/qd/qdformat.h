/* FILE: qdformat.h                    -*-Mode: c++-*-
 *
 * Decimal string conversion for Qd_Double and Qd_Quad.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 * NOTE: Code external to this package should NOT #include
 * this file directly.  Instead, use
 *     #include "qd.h"
 */

#ifndef _QD_FORMAT
#define _QD_FORMAT

#include <string>
#include <vector>

#include "doubledouble.h"
#include "quaddouble.h"

/* End includes */

// Reason a string did not parse.
class Qd_ParseError {
public:
  enum Kind { EMPTY, INVALID };
  Qd_ParseError() : kind(INVALID) {}
  Qd_ParseError(Kind k) : kind(k) {}
  Kind GetKind() const { return kind; }
  const char* GetMessage() const;
private:
  Kind kind;
};

// Format request, parsed from
//
//    [[fill]align][+][width][.precision][e|E]
//
// where align is one of '<' (left), '>' (right) or '^' (center).
// Default is right alignment, space fill, no width, no precision and
// fixed notation.  Without a precision all DIGITS significant digits
// are produced and trailing fraction zeros are dropped.
struct Qd_FormatSpec {
  char fill;
  char align;       // '<', '>' or '^'
  bool plus;        // Force sign on non-negative values
  int width;        // Minimum field width; 0 for none
  int precision;    // Digits after the point; -1 for none
  bool exponent;    // Exponent notation, d.ddde<exp>
  bool upper;       // 'E' marker instead of 'e'

  Qd_FormatSpec()
    : fill(' '), align('>'), plus(false), width(0), precision(-1),
      exponent(false), upper(false) {}

  // Returns false, leaving spec unchanged, if str is malformed.
  static bool Parse(const char* str,Qd_FormatSpec& spec);
};

std::string Qd_Format(const Qd_Double& x,const Qd_FormatSpec& spec);
std::string Qd_Format(const Qd_Quad& x,const Qd_FormatSpec& spec);

// Leading significant decimal digits of |x|, ndigits of them, each in
// [0,9], and the decimal exponent of the first digit.  The value is
// approximately d0.d1d2... x 10^exponent, rounded at the last digit.
// Zero yields ndigits zeros and exponent 0.
void Qd_ExtractDigits(const Qd_Double& x,int ndigits,
                      std::vector<int>& digits,int& exponent);
void Qd_ExtractDigits(const Qd_Quad& x,int ndigits,
                      std::vector<int>& digits,int& exponent);

// String to value.  Accepts an optional sign, decimal digits with
// optional '_' separators, at most one point, and an optional e/E
// exponent; also "nan", "inf" and "-inf" in any case.  Leading and
// trailing white space is ignored.  On failure returns false, sets
// error and leaves result unchanged.
bool Qd_Parse(const std::string& text,Qd_Double& result,
              Qd_ParseError& error);
bool Qd_Parse(const std::string& text,Qd_Quad& result,
              Qd_ParseError& error);

#endif // _QD_FORMAT
