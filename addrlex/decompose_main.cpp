#include <string>

#include "addrlex/decompose.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE decompose_test

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_CASE(decompose)
{
  // precomposed e-acute into e + combining acute accent
  BOOST_CHECK_EQUAL(addrlex::decompose(std::string("Caf\xC3\xA9")), std::string("Cafe\xCC\x81"));
  BOOST_CHECK_EQUAL(addrlex::decompose(std::string("Cafe\xCC\x81")), std::string("Cafe\xCC\x81"));
  
  BOOST_CHECK_EQUAL(addrlex::decompose(std::string("123 Main St")), std::string("123 Main St"));
  BOOST_CHECK_EQUAL(addrlex::decompose(std::string()), std::string());
  
  // compatibility characters are left alone
  BOOST_CHECK_EQUAL(addrlex::decompose(std::string("\xC2\xBD")), std::string("\xC2\xBD"));
  BOOST_CHECK_EQUAL(addrlex::decompose(std::string("\xC3\xA6")), std::string("\xC3\xA6"));
  
  icu::UnicodeString usentence = icu::UnicodeString::fromUTF8("Soci\xC3\xA9t\xC3\xA9");
  addrlex::decompose(usentence);
  BOOST_CHECK_EQUAL(usentence.length(), 9);
}
