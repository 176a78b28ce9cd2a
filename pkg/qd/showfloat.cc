/* File: showfloat.cc
 *
 * Utility program for displaying extended precision values.  Each
 * argument is converted to Qd_Double and Qd_Quad and printed in full
 * decimal form, in exponent form, and as hexbin limbs.
 *
 * NOTICE: Please see the file ../../LICENSE
 *
 */

#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <string>

#include "qd.h"

/* End includes */

void Usage()
{
  fprintf(stderr,"Usage: showfloat value [value2 ...]\n");
  fprintf(stderr," where value is a decimal number, or a single double"
          " in hexfloat or hexbin format.\n");
  fprintf(stderr," Output is each value at double-double and quad-double"
          " precision.\n");
  exit(99);
}

// Decimal strings go through Qd_Parse at full precision.  Anything with
// a hex marker is read as one double.
template<class T>
bool ReadValue(const char* cptr,T& value)
{
  if(strchr(cptr,'x') || strchr(cptr,'X')
     || strchr(cptr,'p') || strchr(cptr,'P')) {
    value = T(Qd_ScanFloat(cptr));
    return true;
  }
  Qd_ParseError error;
  if(!Qd_Parse(cptr,value,error)) {
    fprintf(stderr,"Can't convert \"%s\": %s\n",cptr,error.GetMessage());
    return false;
  }
  return true;
}

template<class T>
void Show(const char* label,const T& value)
{
  Qd_FormatSpec fixed,sci;
  sci.exponent = true;
  printf("  %6s: %s\n",label,Qd_Format(value,fixed).c_str());
  printf("  %6s  %s\n","",Qd_Format(value,sci).c_str());
  printf("  %6s  %s\n","",Qd_DebugString(value).c_str());
}

int ShowFloatMain(int argc,char** argv)
{
  if(argc<2 || (argv[1][0]=='-' && argv[1][1]=='h')) {
    Usage();
  }
  int errcount = 0;
  for(int i=1;i<argc;++i) {
    Qd_Double dvalue;
    Qd_Quad qvalue;
    if(!ReadValue(argv[i],dvalue) || !ReadValue(argv[i],qvalue)) {
      ++errcount;
      continue;
    }
    printf("%s:\n",argv[i]);
    Show("double",dvalue);
    Show("quad",qvalue);
  }
  return (errcount == 0 ? 0 : 1);
}

int main(int argc,char** argv)
{
  int result = 1;
  try {
    result = ShowFloatMain(argc,argv);
  } catch(const Qd_Exception& err) {
    std::string msg;
    fprintf(stderr,"%s\n",err.ConstructMessage(msg));
  } catch(const std::string& errmsg) {
    fprintf(stderr,"ERROR: %s\n",errmsg.c_str());
  } catch(const char* errmsg) {
    fprintf(stderr,"ERROR: %s\n",errmsg);
  }
  return result;
}
