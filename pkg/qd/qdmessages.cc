/* FILE: qdmessages.cc                    -*-Mode: c++-*-
 *
 *   Message formatting, error output and logging for the Qd extension.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 */

#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <vector>

#include "qdexcept.h"
#include "qdmessages.h"

/* End includes */     /* Optional directive to pimake */

int
Qd_Vsnprintf(char *str, size_t n, const char *format, va_list ap)
{
  if(str==NULL) {
    QD_THROWEXCEPT("","Qd_Vsnprintf",
                   "Error in Qd_Vsnprintf; buffer pointer is NULL.");
  }
  if(format==NULL) {
    QD_THROWEXCEPT("","Qd_Vsnprintf",
                   "Error in Qd_Vsnprintf; format pointer is NULL.");
  }
  int result = vsnprintf(str,n,format,ap);
  if(result<0 || static_cast<size_t>(result)>=n) {
    QD_THROWEXCEPT("","Qd_Vsnprintf",
                   "Error in Qd_Vsnprintf; probably buffer overflow.");
  }
  return result;
}

int
Qd_Snprintf(char *str, size_t n, const char *format, ...)
{
  va_list arg_ptr;
  va_start(arg_ptr,format);
  int len = Qd_Vsnprintf(str,n,format,arg_ptr);
  va_end(arg_ptr);
  return len;
}

static Tcl_Interp* qd_global_interp = NULL;

void Qd_SetGlobalInterpreter(Tcl_Interp* interp)
{
  qd_global_interp = interp;
}

Tcl_Interp* Qd_GlobalInterpreter()
{
  return qd_global_interp;
}

void
Qd_ErrorWrite(const char *format, ...) {
  static char buf[4096];
  va_list arg_ptr;
  va_start(arg_ptr,format);
  Qd_Vsnprintf(buf, sizeof(buf), format, arg_ptr);
  va_end(arg_ptr);

  Tcl_Interp *interp = Qd_GlobalInterpreter();
  if(interp == NULL) {
    fprintf(stderr,"%s",buf);
    return;
  }

  Tcl_DString cmd;
  Tcl_DStringInit(&cmd);
  Tcl_DStringAppend(&cmd, "puts -nonewline stderr", -1);
  Tcl_DStringAppendElement(&cmd, buf);
  Tcl_InterpState saved = Tcl_SaveInterpState(interp, TCL_OK);
  if(Tcl_Eval(interp, Tcl_DStringValue(&cmd)) == TCL_ERROR) {
    Tcl_Channel chan = Tcl_GetStdChannel(TCL_STDERR);
    if(chan == NULL || Tcl_Write(chan, buf, -1) != int(strlen(buf))) {
      fprintf(stderr,"%s",buf);
    }
  }
  Tcl_RestoreInterpState(interp, saved);
  Tcl_DStringFree(&cmd);
}

// Qd_LogSupport
std::string Qd_LogSupport::log_prefix;

std::string
Qd_LogSupport::GetTimeStamp()
{
  using std::chrono::system_clock;
  using std::chrono::duration_cast;

  const system_clock::time_point now = system_clock::now();
  const std::chrono::milliseconds ms
    = duration_cast<std::chrono::milliseconds>(now.time_since_epoch())
    % 1000;

  char tfmt[32];
  Qd_Snprintf(tfmt,sizeof(tfmt),"%%H:%%M:%%S.%03d %%Y-%%m-%%d",
              static_cast<int>(ms.count()));

  std::time_t ct = system_clock::to_time_t(now);
  std::tm tinfo;
  localtime_r(&ct,&tinfo);
  char tbuf[32];
  std::strftime(tbuf,sizeof(tbuf),tfmt,&tinfo);
  return std::string(tbuf);
}

std::string
Qd_LogSupport::GetLogMark()
{
  return std::string("[") + log_prefix + std::string(" ")
    + GetTimeStamp() + std::string("] ");
}

////////////////////////////////////////////////////////////////////////
// Qd_Report::Log.  Unbuffered, so each character goes straight through
// overflow() to std::clog and the log files.
class Qd_Report::LogStream::Buffer : public std::streambuf {
public:
  std::vector< std::unique_ptr<std::filebuf> > files;
protected:
  virtual int overflow(int c) {
    if(c == EOF) return 0;
    const char ch = static_cast<char>(c);
    int status = c;
    if(std::clog.rdbuf()->sputc(ch) == EOF) status = EOF;
    for(auto it=files.begin();it!=files.end();++it) {
      if((*it)->sputc(ch) == EOF) status = EOF;
    }
    return status;
  }
  virtual int sync() {
    int status = std::clog.rdbuf()->pubsync();
    for(auto it=files.begin();it!=files.end();++it) {
      if((*it)->pubsync() != 0) status = -1;
    }
    return status;
  }
};

Qd_Report::LogStream::LogStream() : std::ostream(0), buf(new Buffer)
{
  rdbuf(buf);
}

Qd_Report::LogStream::~LogStream()
{
  rdbuf(0);
  delete buf;
}

void Qd_Report::LogStream::AddFile(const std::string& filename)
{
  std::unique_ptr<std::filebuf> pfile(new std::filebuf);
  if(!pfile->open(filename.c_str(),std::ios_base::out|std::ios_base::app)) {
    std::string errmsg = std::string("Unable to open file ") + filename;
    QD_THROWEXCEPT("Qd_Report","AddFile",errmsg.c_str());
  }
  buf->files.push_back(std::move(pfile));
}

Qd_Report::LogStream Qd_Report::Log;

////////////////////////////////////////////////////////////////////////
// Tcl wrappers

int
QdLogSupportInitPrefixCmd
(ClientData, Tcl_Interp *interp,
 int argc,const char **argv)
{
  Tcl_ResetResult(interp);
  if (argc != 2) {
    Tcl_AppendResult(interp, argv[0], " must be called with"
                     " 1 argument: prefix", (char *) NULL);
    return TCL_ERROR;
  }
  Qd_LogSupport::InitPrefix(std::string(argv[1]));
  return TCL_OK;
}

int
QdLogSupportGetLogMarkCmd
(ClientData, Tcl_Interp *interp,
 int argc,const char **argv)
{
  Tcl_ResetResult(interp);
  if (argc != 1) {
    Tcl_AppendResult(interp, argv[0], " must be called with"
                     " no arguments", (char *) NULL);
    return TCL_ERROR;
  }
  std::string mark = Qd_LogSupport::GetLogMark();
  Tcl_AppendResult(interp,mark.c_str(),(char *)NULL);
  return TCL_OK;
}

int
QdReportAddLogFileCmd
(ClientData, Tcl_Interp *interp,
 int argc,const char **argv)
{
  Tcl_ResetResult(interp);
  if (argc != 2) {
    Tcl_AppendResult(interp, argv[0], " must be called with"
                     " 1 argument: filename", (char *) NULL);
    return TCL_ERROR;
  }
  try {
    Qd_Report::Log.AddFile(std::string(argv[1]));
  } catch(const Qd_Exception& err) {
    std::string msg;
    Tcl_AppendResult(interp,err.ConstructMessage(msg),(char *)NULL);
    return TCL_ERROR;
  }
  return TCL_OK;
}
