// -*- mode: c++ -*-

#ifndef __ADDRLEX__JOIN_RULE__HPP__
#define __ADDRLEX__JOIN_RULE__HPP__ 1

#include <string>

#include <unicode/unistr.h>

#include <utils/icu_regex.hpp>

namespace addrlex
{
  // A pair of adjacent tokens fused into one token.
  // Both patterns must match the whole token, and must have at least one capture group.
  // The fused token is the first capture of the first token followed by the first capture of the second,
  // i.e. (B)RITISH (C)OLUMBIA yields BC
  class JoinRule
  {
  public:
    typedef utils::icu_regex   regex_type;
    typedef icu::UnicodeString string_type;
    
  public:
    JoinRule(const std::string& first, const std::string& second);
    
    static JoinRule create_join(const std::string& first, const std::string& second)
    {
      return JoinRule(first, second);
    }
    
  public:
    bool operator()(const string_type& first, const string_type& second, string_type& joined) const;
    bool operator()(const std::string& first, const std::string& second, std::string& joined) const;
    
    const regex_type& first() const { return __first; }
    const regex_type& second() const { return __second; }
    
  private:
    regex_type __first;
    regex_type __second;
  };
};

#endif
