// -*- mode: c++ -*-

#ifndef __ADDRLEX__LEXICAL_RULES__HPP__
#define __ADDRLEX__LEXICAL_RULES__HPP__ 1

#include <string>
#include <vector>

#include <addrlex/join_rule.hpp>
#include <addrlex/tokenize.hpp>

namespace addrlex
{
  // lexical restructuring rules of a jurisdiction/language.
  //
  // clean_sentence:    NFD decomposition followed by the ordered cleaning rules
  // run_special_rules: strip postal routing artifacts and append POSTAL_ADDRESS_ELEMENT when found
  // join:              fuse adjacent tokens by the join rules
  //
  // Instances are immutable after construction and may be shared by threads.
  class LexicalRules
  {
  public:
    typedef JoinRule join_rule_type;
    
    typedef std::vector<join_rule_type, std::allocator<join_rule_type> > join_rule_set_type;
    
    // named regex fragments for the tokenizer
    struct Grammar
    {
      std::string word;
      std::string conjunction;
      std::string number;
      std::string number_with_suffix;
      std::string number_with_optional_suffix;
      std::string ordinal;
      std::string unit_number;
      std::string directional;
      std::string province;
      std::string suffix;
    };
    
    typedef Grammar grammar_type;
    
  public:
    // reserved tokens
    static const char* const POSTAL_ADDRESS_ELEMENT;
    static const char* const FRONT_GATE;
    static const char* const OCCUPANT_SEPARATOR;
    
  public:
    LexicalRules() {}
    virtual ~LexicalRules() {}
    
  private:
    LexicalRules(const LexicalRules& x) {}
    LexicalRules& operator=(const LexicalRules& x) { return *this; }
    
  public:
    static const LexicalRules& create(const std::string& name);
    static const char* lists();
    
  public:
    virtual std::string clean_sentence(const std::string& sentence) const = 0;
    virtual std::string run_special_rules(const std::string& sentence) const = 0;
    
    virtual const join_rule_set_type& join_rules() const = 0;
    virtual const grammar_type& grammar() const = 0;
    
    void join(const token_set_type& tokens, token_set_type& joined) const;
    
    const std::string& algorithm() const { return __algorithm; }
    
  private:
    std::string __algorithm;
  };
};

#endif
