/* FILE: qdmessages.h                    -*-Mode: c++-*-
 *
 *   Message formatting, error output and logging for the Qd extension.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 */

#ifndef _QD_MESSAGES
#define _QD_MESSAGES

#include <cstdarg>
#include <cstddef>
#include <ostream>
#include <string>

#include <tcl.h>

/* End includes */     /* Optional directive to pimake */

// Bounded formatting.  Both throw Qd_Exception if the output doesn't
// fit in n bytes.
int Qd_Snprintf(char *, size_t, const char *, ...);
int Qd_Vsnprintf(char *, size_t, const char *, va_list);

// Interpreter used by Qd_ErrorWrite.  Set by Qd_Init; may be NULL.
void Qd_SetGlobalInterpreter(Tcl_Interp* interp);
Tcl_Interp* Qd_GlobalInterpreter();

// Formatted write to the stderr channel of the global interpreter,
// or to C stderr if no interpreter is registered.
void Qd_ErrorWrite(const char *,...);

class Qd_LogSupport {
public:
  void static InitPrefix(const std::string& prefix) { log_prefix = prefix; }
  static std::string GetTimeStamp();
  static std::string GetLogMark(); // "[prefix timestamp] "
private:
  static std::string log_prefix;
};

namespace Qd_Report {
  // ostream copying output to std::clog and to any added log files.
  class LogStream : public std::ostream {
  public:
    LogStream();
    ~LogStream();
    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;
    void AddFile(const std::string& filename);
  private:
    class Buffer;
    Buffer* buf;
  };
  extern LogStream Log;
} // namespace Qd_Report

// Tcl interfaces
int QdLogSupportInitPrefixCmd(ClientData,Tcl_Interp*,int,const char**);
int QdLogSupportGetLogMarkCmd(ClientData,Tcl_Interp*,int,const char**);
int QdReportAddLogFileCmd(ClientData,Tcl_Interp*,int,const char**);

#endif /* _QD_MESSAGES */
