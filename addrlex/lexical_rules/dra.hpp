// -*- mode: c++ -*-

#ifndef __ADDRLEX__LEXICAL_RULES__DRA__HPP__
#define __ADDRLEX__LEXICAL_RULES__DRA__HPP__ 1

#include <addrlex/lexical_rules.hpp>
#include <addrlex/cleaner.hpp>
#include <addrlex/postal_junk.hpp>

// lexical rules for the British Columbia Digital Road Atlas

namespace addrlex
{
  namespace lexical_rules
  {
    class Dra : public addrlex::LexicalRules
    {
    public:
      static const char* const RE_WORD;
      static const char* const RE_AND;
      static const char* const RE_NUMBER;
      static const char* const RE_NUMBER_WITH_SUFFIX;
      static const char* const RE_NUMBER_WITH_OPTIONAL_SUFFIX;
      static const char* const RE_ORDINAL;
      static const char* const RE_UNIT_NUMBER;
      static const char* const RE_DIRECTIONAL;
      static const char* const RE_PROVINCE;
      static const char* const RE_SUFFIX;
      
    public:
      Dra();
      
    public:
      std::string clean_sentence(const std::string& sentence) const;
      std::string run_special_rules(const std::string& sentence) const;
      
      const join_rule_set_type& join_rules() const { return __join_rules; }
      const grammar_type& grammar() const { return __grammar; }
      
    private:
      Cleaner            __cleaner;
      PostalJunk         __postal;
      join_rule_set_type __join_rules;
      grammar_type       __grammar;
    };
  };
};

#endif
