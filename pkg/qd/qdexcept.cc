/* FILE: qdexcept.cc                    -*-Mode: c++-*-
 *
 *   Exception object for internal failures in the Qd extension.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 */

#include <vector>

#include "qdexcept.h"
#include "qdmessages.h"

/* End includes */     /* Optional directive to pimake */

#define INT_DISPLAY_LENGTH_BOUND 256

namespace {
  std::string SafeString(const char* cptr) {
    return std::string(cptr == NULL ? "" : cptr);
  }
}

Qd_Exception::Qd_Exception
(const char* file_in,
 int lineno_in,
 const char* classname_in,
 const char* funcname_in,
 size_t errmsg_size,
 const char* errfmt,
 ...)
  : file(SafeString(file_in)), lineno(lineno_in),
    classname(SafeString(classname_in)), funcname(SafeString(funcname_in))
{
  if(errfmt != NULL) {
    errmsg_size += 15; // Slack for callers who miscount.
    std::vector<char> buf(errmsg_size);
    va_list arg_ptr;
    va_start(arg_ptr,errfmt);
    Qd_Vsnprintf(buf.data(),errmsg_size,errfmt,arg_ptr);
    va_end(arg_ptr);
    errmsg = buf.data();
  }
}

Qd_Exception::Qd_Exception
(const char* file_in,
 int lineno_in,
 const char* classname_in,
 const char* funcname_in,
 const char* errmsg_in)
  : file(SafeString(file_in)), lineno(lineno_in),
    classname(SafeString(classname_in)), funcname(SafeString(funcname_in)),
    errmsg(SafeString(errmsg_in))
{}

void Qd_Exception::PrependMessage(const char* prefix)
{
  errmsg.insert(0,SafeString(prefix));
}

void Qd_Exception::PostpendMessage(const char* suffix)
{
  errmsg.append(SafeString(suffix));
}

const char* Qd_Exception::ConstructMessage(std::string& msg) const
{
  std::vector<char> buf(file.size() + INT_DISPLAY_LENGTH_BOUND);
  Qd_Snprintf(buf.data(),buf.size(),
              "Error detected; refer to program source file %s, line %d, ",
              file.c_str(),lineno);
  msg = buf.data();
  if(!classname.empty()) {
    msg += "in class " + classname + ", member function " + funcname + ".";
  } else {
    msg += "in function " + funcname + ".";
  }
  msg += "\nERROR DETAILS: " + errmsg;
  return msg.c_str();
}
