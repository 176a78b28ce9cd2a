/* FILE: qd.cc                      -*-Mode: c++-*-
 *
 * The Qd extended precision extension.
 *
 * This extension provides double-double (Qd_Double) and quad-double
 * (Qd_Quad) floating point classes, and Tcl commands to evaluate,
 * format and parse values of either type.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 */

#include <cstring>

#include <string>

#include "qdint.h"

/* End includes */     // Optional directive to pimake

namespace {

// Parses text into value.  On failure leaves an error message in the
// interpreter result and returns false.
template<class T>
bool GetValue(Tcl_Interp* interp,const char* text,T& value)
{
  Qd_ParseError error;
  if(!Qd_Parse(text,value,error)) {
    Tcl_AppendResult(interp,"bad number \"",text,"\": ",
                     error.GetMessage(),(char *)NULL);
    return false;
  }
  return true;
}

template<class T>
bool UnaryOp(const char* op,const T& x,T& result)
{
  if(strcmp(op,"sqrt") == 0)        result = sqrt(x);
  else if(strcmp(op,"cbrt") == 0)   result = cbrt(x);
  else if(strcmp(op,"exp") == 0)    result = exp(x);
  else if(strcmp(op,"log") == 0)    result = log(x);
  else if(strcmp(op,"log10") == 0)  result = log10(x);
  else if(strcmp(op,"log2") == 0)   result = log2(x);
  else if(strcmp(op,"sin") == 0)    result = sin(x);
  else if(strcmp(op,"cos") == 0)    result = cos(x);
  else if(strcmp(op,"floor") == 0)  result = floor(x);
  else if(strcmp(op,"ceil") == 0)   result = ceil(x);
  else if(strcmp(op,"abs") == 0)    result = fabs(x);
  else return false;
  return true;
}

template<class T>
bool BinaryOp(const char* op,const T& x,const T& y,T& result)
{
  if(strcmp(op,"add") == 0)         result = x + y;
  else if(strcmp(op,"sub") == 0)    result = x - y;
  else if(strcmp(op,"mul") == 0)    result = x * y;
  else if(strcmp(op,"div") == 0)    result = x / y;
  else if(strcmp(op,"pow") == 0)    result = pow(x,y);
  else if(strcmp(op,"logb") == 0)   result = log(x,y);
  else if(strcmp(op,"atan2") == 0)  result = atan2(x,y);
  else return false;
  return true;
}

template<class T>
bool IntegerOp(const char* op,const T& x,int n,T& result)
{
  if(strcmp(op,"nroot") == 0)       result = nroot(x,n);
  else if(strcmp(op,"powi") == 0)   result = powi(x,n);
  else return false;
  return true;
}

// Qd_Eval type op x ?y?
template<class T>
int EvalCommand(Tcl_Interp* interp,int argc,const char** argv)
{
  const char* op = argv[2];
  T x,result;
  if(argc == 4) {
    if(!GetValue(interp,argv[3],x)) return TCL_ERROR;
    if(UnaryOp(op,x,result)) {
      Tcl_AppendResult(interp,Qd_Format(result,Qd_FormatSpec()).c_str(),
                       (char *)NULL);
      return TCL_OK;
    }
  } else if(argc == 5) {
    if(!GetValue(interp,argv[3],x)) return TCL_ERROR;
    int n;
    if(strcmp(op,"nroot") == 0 || strcmp(op,"powi") == 0) {
      if(Tcl_GetInt(interp,argv[4],&n) != TCL_OK) return TCL_ERROR;
      IntegerOp(op,x,n,result);
      Tcl_AppendResult(interp,Qd_Format(result,Qd_FormatSpec()).c_str(),
                       (char *)NULL);
      return TCL_OK;
    }
    T y;
    if(!GetValue(interp,argv[4],y)) return TCL_ERROR;
    if(BinaryOp(op,x,y,result)) {
      Tcl_AppendResult(interp,Qd_Format(result,Qd_FormatSpec()).c_str(),
                       (char *)NULL);
      return TCL_OK;
    }
  }
  Tcl_AppendResult(interp,"unknown operation or wrong # of operands"
                   " for \"",op,"\"",(char *)NULL);
  return TCL_ERROR;
}

// Qd_Format type value spec
template<class T>
int FormatCommand(Tcl_Interp* interp,const char* text,const char* spectext)
{
  T x;
  if(!GetValue(interp,text,x)) return TCL_ERROR;
  Qd_FormatSpec spec;
  if(!Qd_FormatSpec::Parse(spectext,spec)) {
    Tcl_AppendResult(interp,"bad format spec \"",spectext,"\"",
                     (char *)NULL);
    return TCL_ERROR;
  }
  Tcl_AppendResult(interp,Qd_Format(x,spec).c_str(),(char *)NULL);
  return TCL_OK;
}

void AppendLimb(Tcl_Interp* interp,double limb)
{
  std::string str = Qd_HexBinaryFloatFormat(limb);
  std::string::size_type start = str.find_first_not_of(' ');
  if(start != std::string::npos) str.erase(0,start);
  Tcl_AppendElement(interp,str.c_str());
}

// Resolves "double" or "quad".  Returns 2 or 4, or 0 after leaving an
// error message in interp.
int GetLimbCount(Tcl_Interp* interp,const char* type)
{
  if(strcmp(type,"double") == 0) return 2;
  if(strcmp(type,"quad") == 0)   return 4;
  Tcl_AppendResult(interp,"bad type \"",type,
                   "\": must be double or quad",(char *)NULL);
  return 0;
}

} // namespace

int QdEvalCmd(ClientData,Tcl_Interp* interp,int argc,const char** argv)
{
  static char buf[1024];
  Tcl_ResetResult(interp);
  if(argc<4 || argc>5) {
    Qd_Snprintf(buf,sizeof(buf),
                "wrong # args: should be \"%.100s type op x ?y?\"",argv[0]);
    Tcl_AppendResult(interp,buf,(char *)NULL);
    return TCL_ERROR;
  }
  try {
    switch(GetLimbCount(interp,argv[1])) {
    case 2:  return EvalCommand<Qd_Double>(interp,argc,argv);
    case 4:  return EvalCommand<Qd_Quad>(interp,argc,argv);
    default: break;
    }
  } catch(const Qd_Exception& err) {
    std::string msg;
    Tcl_ResetResult(interp);
    Tcl_AppendResult(interp,err.ConstructMessage(msg),(char *)NULL);
  }
  return TCL_ERROR;
}

int QdFormatCmd(ClientData,Tcl_Interp* interp,int argc,const char** argv)
{
  static char buf[1024];
  Tcl_ResetResult(interp);
  if(argc != 4) {
    Qd_Snprintf(buf,sizeof(buf),
                "wrong # args: should be \"%.100s type value spec\"",
                argv[0]);
    Tcl_AppendResult(interp,buf,(char *)NULL);
    return TCL_ERROR;
  }
  try {
    switch(GetLimbCount(interp,argv[1])) {
    case 2:  return FormatCommand<Qd_Double>(interp,argv[2],argv[3]);
    case 4:  return FormatCommand<Qd_Quad>(interp,argv[2],argv[3]);
    default: break;
    }
  } catch(const Qd_Exception& err) {
    std::string msg;
    Tcl_ResetResult(interp);
    Tcl_AppendResult(interp,err.ConstructMessage(msg),(char *)NULL);
  }
  return TCL_ERROR;
}

// Qd_Parse type value.  Returns the limbs in hexbin notation.
int QdParseCmd(ClientData,Tcl_Interp* interp,int argc,const char** argv)
{
  static char buf[1024];
  Tcl_ResetResult(interp);
  if(argc != 3) {
    Qd_Snprintf(buf,sizeof(buf),
                "wrong # args: should be \"%.100s type value\"",argv[0]);
    Tcl_AppendResult(interp,buf,(char *)NULL);
    return TCL_ERROR;
  }
  try {
    switch(GetLimbCount(interp,argv[1])) {
    case 2: {
      Qd_Double x;
      if(!GetValue(interp,argv[2],x)) return TCL_ERROR;
      AppendLimb(interp,x.Hi());
      AppendLimb(interp,x.Lo());
      return TCL_OK;
    }
    case 4: {
      Qd_Quad x;
      if(!GetValue(interp,argv[2],x)) return TCL_ERROR;
      for(int i=0;i<4;++i) AppendLimb(interp,x[i]);
      return TCL_OK;
    }
    default: break;
    }
  } catch(const Qd_Exception& err) {
    std::string msg;
    Tcl_ResetResult(interp);
    Tcl_AppendResult(interp,err.ConstructMessage(msg),(char *)NULL);
  }
  return TCL_ERROR;
}

int
Qd_RegisterCommand(Tcl_Interp* interp,const char* name,Tcl_CmdProc* cmd)
{
  if(Tcl_CreateCommand(interp,name,cmd,NULL,NULL)==NULL) {
    Tcl_ResetResult(interp);
    Tcl_AppendResult(interp, "Unable to register command ->",
                     name, "<- with Tcl interpreter", (char *) NULL);
    return TCL_ERROR;
  }
  return TCL_OK;
}

int
Qd_Init(Tcl_Interp *interp)
{
#define RETURN_TCL_ERROR                                       \
    Tcl_AddErrorInfo(interp, "\n    (in Qd_Init())");          \
    return TCL_ERROR

  if(Qd_GlobalInterpreter() == NULL) Qd_SetGlobalInterpreter(interp);

  if(Qd_RegisterCommand(interp,"Qd_Eval",QdEvalCmd) != TCL_OK
     || Qd_RegisterCommand(interp,"Qd_Format",QdFormatCmd) != TCL_OK
     || Qd_RegisterCommand(interp,"Qd_Parse",QdParseCmd) != TCL_OK
     || Qd_RegisterCommand(interp,"Qd_LogSupportInitPrefix",
                           QdLogSupportInitPrefixCmd) != TCL_OK
     || Qd_RegisterCommand(interp,"Qd_LogSupportGetLogMark",
                           QdLogSupportGetLogMarkCmd) != TCL_OK
     || Qd_RegisterCommand(interp,"Qd_ReportAddLogFile",
                           QdReportAddLogFileCmd) != TCL_OK) {
    RETURN_TCL_ERROR;
  }

  // Compiler options that allow fma contraction or extra precision
  // intermediates break the error-free transforms.
  int errcount = 0;
  try {
    errcount = Qd_Double::QuickTest() + Qd_Quad::QuickTest();
  } catch(const Qd_Exception& err) {
    std::string msg;
    Tcl_ResetResult(interp);
    Tcl_AppendResult(interp,err.ConstructMessage(msg),(char *)NULL);
    RETURN_TCL_ERROR;
  }
  if(errcount != 0) {
    Qd_ErrorWrite("WARNING: Qd self test reports %d error%s;"
                  " results may be inaccurate.\n",
                  errcount,(errcount == 1 ? "" : "s"));
  }

  if (Tcl_PkgProvide(interp, "Qd", QD_VERSION) != TCL_OK) {
    RETURN_TCL_ERROR;
  }

  return TCL_OK;

#undef RETURN_TCL_ERROR
}
