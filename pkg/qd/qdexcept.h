/* FILE: qdexcept.h                    -*-Mode: c++-*-
 *
 *   Exception object for internal failures in the Qd extension.
 *   Numeric edge cases never throw; see qd.h.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 */

#ifndef _QD_EXCEPT
#define _QD_EXCEPT

#include <cstdarg>
#include <cstddef>
#include <string>

/* End includes */     /* Optional directive to pimake */

#define QD_THROW(x) throw x

// Wrapper for throwing a pure string Qd_Exception (no formatting)
#define QD_THROWEXCEPT(class,func,errmsg) \
  QD_THROW(Qd_Exception(__FILE__,__LINE__,class,func,errmsg))

////////////////////////////////////////////////////////////////////////
// Sample usage:
//
//   QD_THROW(Qd_Exception(__FILE__,__LINE__,"Qd_Double","log",
//            256,"No convergence after %d iterations",count));
//
// The fifth argument, errmsg_size, must be large enough to hold the
// formatted message.  Any %s directive should carry a precision.
//
class Qd_Exception {
public:
  Qd_Exception
  (const char* file_in,      // File from which exception is thrown
   int lineno_in,            // Line number from which exception is thrown
   const char* classname_in, // Name of class throwing exception
   const char* funcname_in,  // Name of function throwing exception
   size_t errmsg_size,       // Buffer size needed to hold extd. error msg
   const char* errfmt,       // Format string for extended error message
   ...);                     // arguments for errfmt
  // Any of the char* may be NULL, in which case an empty string
  // is substituted.

  Qd_Exception
  (const char* file_in,
   int lineno_in,
   const char* classname_in,
   const char* funcname_in,
   const char* errmsg_in);

  virtual ~Qd_Exception() {}

  // Builds the generic "Error detected; ..." report into msg and
  // returns msg.c_str().
  const char* ConstructMessage(std::string& msg) const;

  // For routines that catch and rethrow, to add context.
  void PrependMessage(const char* prefix);
  void PostpendMessage(const char* suffix);

  const std::string& ErrMsg() const { return errmsg; }

private:
  std::string file;
  int         lineno;
  std::string classname; // Empty if thrown from outside a class.
  std::string funcname;
  std::string errmsg;
};

#endif // _QD_EXCEPT
