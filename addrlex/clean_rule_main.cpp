#include <string>
#include <stdexcept>

#include "addrlex/clean_rule.hpp"
#include "addrlex/cleaner.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE clean_rule_test

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_CASE(clean_rule)
{
  const addrlex::CleanRule ampersand("&", " and ");
  
  BOOST_CHECK_EQUAL(ampersand(std::string("A&B")), "A and B");
  BOOST_CHECK_EQUAL(ampersand(std::string("A & B & C")), "A  and  B  and  C");
  BOOST_CHECK_EQUAL(ampersand(std::string("AB")), "AB");
  BOOST_CHECK_EQUAL(ampersand(std::string()), "");
  
  const addrlex::CleanRule dash("([0-9])-", "$1 ");
  BOOST_CHECK_EQUAL(dash(std::string("12-34")), "12 34");
  
  const addrlex::CleanRule street("st", "X", true);
  BOOST_CHECK_EQUAL(street(std::string("St ST st")), "X X X");
  
  BOOST_CHECK_THROW(addrlex::CleanRule rule("[a-z", ""), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(cleaner_order)
{
  addrlex::Cleaner forward;
  forward.insert()
    ("a", "b")
    ("b", "c");
  
  addrlex::Cleaner backward;
  backward.insert()
    ("b", "c")
    ("a", "b");
  
  BOOST_CHECK_EQUAL(forward.size(), size_t(2));
  
  // each rule works on the output of the previous one
  BOOST_CHECK_EQUAL(forward(std::string("ab")), "cc");
  BOOST_CHECK_EQUAL(backward(std::string("ab")), "bc");
}

BOOST_AUTO_TEST_CASE(cleaner_once)
{
  addrlex::Cleaner cleaner;
  cleaner.insert()("a", "aa");
  
  // a rule does not re-examine its own output
  BOOST_CHECK_EQUAL(cleaner(std::string("a")), "aa");
  BOOST_CHECK_EQUAL(cleaner(std::string("aba")), "aabaa");
  
  const addrlex::Cleaner empty;
  BOOST_CHECK(empty.empty());
  BOOST_CHECK_EQUAL(empty(std::string("a b")), "a b");
}
