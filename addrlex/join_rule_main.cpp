#include <string>
#include <vector>
#include <stdexcept>
#include <algorithm>

#include "addrlex/join_rule.hpp"
#include "addrlex/joiner.hpp"
#include "addrlex/tokenize.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE join_rule_test

#include <boost/test/unit_test.hpp>

typedef addrlex::Joiner::rule_set_type rule_set_type;

static addrlex::token_set_type tokens(const std::string& sentence)
{
  addrlex::token_set_type tokenized;
  addrlex::tokenize(sentence, tokenized);
  return tokenized;
}

BOOST_AUTO_TEST_CASE(join_rule)
{
  const addrlex::JoinRule rule = addrlex::JoinRule::create_join("(?i)(B)RITISH", "(?i)(C)OLUMBIA");
  
  std::string joined;
  
  BOOST_CHECK(rule("BRITISH", "COLUMBIA", joined));
  BOOST_CHECK_EQUAL(joined, "BC");
  
  BOOST_CHECK(rule("british", "Columbia", joined));
  BOOST_CHECK_EQUAL(joined, "bC");
  
  joined = "untouched";
  BOOST_CHECK(! rule("COLUMBIA", "BRITISH", joined));
  BOOST_CHECK(! rule("BRITISHX", "COLUMBIA", joined));
  BOOST_CHECK(! rule("BRITISH", "COLUMBIAN", joined));
  BOOST_CHECK_EQUAL(joined, "untouched");
}

BOOST_AUTO_TEST_CASE(join_rule_invalid)
{
  BOOST_CHECK_THROW(addrlex::JoinRule rule("BRITISH", "(C)OLUMBIA"), std::runtime_error);
  BOOST_CHECK_THROW(addrlex::JoinRule rule("(B)RITISH", "COLUMBIA"), std::runtime_error);
  BOOST_CHECK_THROW(addrlex::JoinRule rule("", "(C)OLUMBIA"), std::runtime_error);
  BOOST_CHECK_THROW(addrlex::JoinRule rule("(B", "(C)"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(tokenize)
{
  const addrlex::token_set_type tokenized = tokens("  123  Main St /PJ");
  
  BOOST_CHECK_EQUAL(tokenized.size(), size_t(4));
  BOOST_CHECK_EQUAL(tokenized.front(), "123");
  BOOST_CHECK_EQUAL(tokenized.back(), "/PJ");
  BOOST_CHECK_EQUAL(addrlex::untokenize(tokenized), "123 Main St /PJ");
  
  BOOST_CHECK(tokens("").empty());
  BOOST_CHECK(tokens("   ").empty());
  BOOST_CHECK_EQUAL(addrlex::untokenize(addrlex::token_set_type()), "");
}

BOOST_AUTO_TEST_CASE(joiner)
{
  rule_set_type rules;
  rules.push_back(addrlex::JoinRule::create_join("(?i)(B)RITISH", "(?i)(C)OLUMBIA"));
  rules.push_back(addrlex::JoinRule::create_join("(?i)(C)OLUMBIE", "(?i)(B)RITANIQUE"));
  rules.push_back(addrlex::JoinRule::create_join("(?i)(C)", "(?i)(B)"));
  
  const addrlex::Joiner joiner(rules);
  
  addrlex::token_set_type joined;
  
  joiner(tokens("123 BRITISH COLUMBIA ST"), joined);
  BOOST_CHECK_EQUAL(addrlex::untokenize(joined), "123 BC ST");
  
  joiner(tokens("COLUMBIE BRITANIQUE"), joined);
  BOOST_CHECK_EQUAL(addrlex::untokenize(joined), "CB");
  
  joiner(tokens("X C B"), joined);
  BOOST_CHECK_EQUAL(addrlex::untokenize(joined), "X CB");
  
  // fused tokens are not joined again
  joiner(tokens("C B B"), joined);
  BOOST_CHECK_EQUAL(addrlex::untokenize(joined), "CB B");
  
  // only adjacent tokens
  joiner(tokens("BRITISH X COLUMBIA"), joined);
  BOOST_CHECK_EQUAL(addrlex::untokenize(joined), "BRITISH X COLUMBIA");
  
  joiner(tokens("BRITISH"), joined);
  BOOST_CHECK_EQUAL(addrlex::untokenize(joined), "BRITISH");
  
  joiner(tokens(""), joined);
  BOOST_CHECK(joined.empty());
  
  addrlex::token_set_type inplace = tokens("BRITISH COLUMBIA");
  joiner(inplace, inplace);
  BOOST_CHECK_EQUAL(addrlex::untokenize(inplace), "BC");
}

BOOST_AUTO_TEST_CASE(joiner_first_match)
{
  rule_set_type rules;
  rules.push_back(addrlex::JoinRule::create_join("(A)B", "(C)D"));
  rules.push_back(addrlex::JoinRule::create_join("(AB)", "(CD)"));
  
  const addrlex::Joiner joiner(rules);
  
  addrlex::token_set_type joined;
  
  joiner(tokens("AB CD"), joined);
  BOOST_CHECK_EQUAL(addrlex::untokenize(joined), "AC");
  
  // the joiner refers to the rules
  std::swap(rules.front(), rules.back());
  
  joiner(tokens("AB CD"), joined);
  BOOST_CHECK_EQUAL(addrlex::untokenize(joined), "ABCD");
}
