// -*- mode: c++ -*-

#ifndef __ADDRLEX__POSTAL_JUNK__HPP__
#define __ADDRLEX__POSTAL_JUNK__HPP__ 1

#include <cstddef>
#include <string>
#include <vector>

#include <unicode/unistr.h>

#include <utils/icu_regex.hpp>

namespace addrlex
{
  // postal routing artifacts: postal codes, PO boxes, rural routes, general delivery etc.
  // Patterns are tried in insertion order, each against the sentence left by the previous ones,
  // and every match is deleted.
  class PostalJunk
  {
  public:
    typedef size_t    size_type;
    typedef ptrdiff_t difference_type;
    
    typedef utils::icu_regex       regex_type;
    typedef regex_type::string_type string_type;
    
    typedef std::vector<regex_type, std::allocator<regex_type> > pattern_set_type;
    
    typedef pattern_set_type::const_iterator const_iterator;
    typedef pattern_set_type::const_iterator iterator;
    
  public:
    PostalJunk() : patterns() {}
    
  public:
    // returns true if any pattern matched
    bool operator()(string_type& sentence) const;
    bool operator()(std::string& sentence) const;
    
    // patterns are always case insensitive
    PostalJunk& insert(const std::string& pattern)
    {
      patterns.push_back(regex_type(pattern, true));
      return *this;
    }
    
    const_iterator begin() const { return patterns.begin(); }
    const_iterator end() const { return patterns.end(); }
    
    size_type size() const { return patterns.size(); }
    bool empty() const { return patterns.empty(); }
    
  private:
    pattern_set_type patterns;
  };
};

#endif
