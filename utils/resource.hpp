// -*- mode: c++ -*-

#ifndef __UTILS__RESOURCE__HPP__
#define __UTILS__RESOURCE__HPP__ 1

#include <time.h>
#include <sys/time.h>
#include <sys/resource.h>

namespace utils
{
  // process cpu time and wall-clock time at construction
  struct resource
  {
  public:
    resource()
    {
      struct rusage  ruse;
      struct timeval utime;
      
      gettimeofday(&utime, NULL);
      getrusage(RUSAGE_SELF, &ruse);
      
      __cpu_time = (double(ruse.ru_utime.tv_sec + ruse.ru_stime.tv_sec)
		    + 1e-6 * (ruse.ru_utime.tv_usec + ruse.ru_stime.tv_usec));
      __user_time = double(utime.tv_sec) + 1e-6 * utime.tv_usec;
    }
    
  public:
    double cpu_time() const { return __cpu_time; }
    double user_time() const { return __user_time; }
    
  private:
    double __cpu_time;
    double __user_time;
  };
};

#endif
