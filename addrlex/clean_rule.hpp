// -*- mode: c++ -*-

#ifndef __ADDRLEX__CLEAN_RULE__HPP__
#define __ADDRLEX__CLEAN_RULE__HPP__ 1

#include <string>

#include <unicode/unistr.h>

#include <utils/icu_regex.hpp>

namespace addrlex
{
  // a sentence-wide substitution: every match of pattern is replaced by replacement.
  // Replacement is an ICU replacement template, thus, $n refers to the n-th capture.
  class CleanRule
  {
  public:
    typedef utils::icu_regex   regex_type;
    typedef icu::UnicodeString string_type;
    
  public:
    CleanRule(const std::string& pattern, const std::string& replacement, const bool case_insensitive=false)
      : __pattern(pattern, case_insensitive),
	__replacement(string_type::fromUTF8(replacement)) {}
    
  public:
    string_type& operator()(string_type& sentence) const
    {
      __pattern.replace_all(sentence, __replacement);
      return sentence;
    }
    
    std::string operator()(const std::string& sentence) const;
    
    const regex_type& pattern() const { return __pattern; }
    const string_type& replacement() const { return __replacement; }
    
  private:
    regex_type  __pattern;
    string_type __replacement;
  };
};

#endif
