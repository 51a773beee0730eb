// -*- mode: c++ -*-

#ifndef __ADDRLEX__CLEANER__HPP__
#define __ADDRLEX__CLEANER__HPP__ 1

#include <cstddef>
#include <string>
#include <vector>

#include <addrlex/clean_rule.hpp>

namespace addrlex
{
  
  template <typename __Cleaner>
  struct __clean_rule_assign
  {
    typedef __Cleaner cleaner_type;
    typedef __clean_rule_assign<cleaner_type> self_type;
    
    __clean_rule_assign(cleaner_type& __owner) : owner(__owner) {}
    
    self_type& operator()(const char* pattern, const char* replacement, const bool insensitive=false)
    {
      return operator()(std::string(pattern), std::string(replacement), insensitive);
    }
    
    self_type& operator()(const std::string& pattern, const std::string& replacement, const bool insensitive=false)
    {
      owner.push_back(typename cleaner_type::rule_type(pattern, replacement, insensitive));
      return *this;
    }
    
    cleaner_type& owner;
  };
  
  // ordered chain of cleaning rules. Each rule rewrites the output of the previous one,
  // and each rule is applied exactly once per sentence.
  class Cleaner
  {
  public:
    typedef size_t    size_type;
    typedef ptrdiff_t difference_type;
    
    typedef CleanRule                   rule_type;
    typedef rule_type::string_type      string_type;
    typedef __clean_rule_assign<Cleaner> assign_type;
    
    typedef std::vector<rule_type, std::allocator<rule_type> > rule_set_type;
    
    typedef rule_set_type::const_iterator const_iterator;
    typedef rule_set_type::const_iterator iterator;
    
  public:
    Cleaner() : rules() {}
    
  public:
    string_type& operator()(string_type& sentence) const
    {
      const_iterator riter_end = rules.end();
      for (const_iterator riter = rules.begin(); riter != riter_end; ++ riter)
	riter->operator()(sentence);
      return sentence;
    }
    
    std::string operator()(const std::string& sentence) const;
    
    assign_type insert()
    {
      return assign_type(*this);
    }
    
    void push_back(const rule_type& x) { rules.push_back(x); }
    
    const_iterator begin() const { return rules.begin(); }
    const_iterator end() const { return rules.end(); }
    
    size_type size() const { return rules.size(); }
    bool empty() const { return rules.empty(); }
    void clear() { rules.clear(); }
    
  private:
    rule_set_type rules;
  };
  
};

#endif
