// -*- mode: c++ -*-

#ifndef __ADDRLEX__JOINER__HPP__
#define __ADDRLEX__JOINER__HPP__ 1

#include <vector>

#include <addrlex/join_rule.hpp>
#include <addrlex/tokenize.hpp>

namespace addrlex
{
  // join pass over a token sequence.
  // Adjacent pairs are examined from left to right, and the first matching rule fuses the pair.
  // A fused token is not examined again.
  class Joiner
  {
  public:
    typedef JoinRule rule_type;
    
    typedef std::vector<rule_type, std::allocator<rule_type> > rule_set_type;
    
  public:
    Joiner(const rule_set_type& __rules) : rules(__rules) {}
    
  public:
    void operator()(const token_set_type& source, token_set_type& joined) const;
    
  private:
    const rule_set_type& rules;
  };
};

#endif
