#include <string>

#include "addrlex/postal_junk.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE postal_junk_test

#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_CASE(postal_junk)
{
  addrlex::PostalJunk postal;
  postal.insert("\\bBOX\\s*[0-9]+\\b");
  
  BOOST_CHECK_EQUAL(postal.size(), size_t(1));
  
  std::string sentence("PO box 5 Main");
  BOOST_CHECK(postal(sentence));
  BOOST_CHECK_EQUAL(sentence, "PO  Main");
  
  std::string boxwood("12 BOXWOOD RD");
  BOOST_CHECK(! postal(boxwood));
  BOOST_CHECK_EQUAL(boxwood, "12 BOXWOOD RD");
  
  std::string many("BOX 1 BOX 2 X");
  BOOST_CHECK(postal(many));
  BOOST_CHECK_EQUAL(many, "  X");
}

BOOST_AUTO_TEST_CASE(postal_junk_cumulative)
{
  addrlex::PostalJunk postal;
  postal.insert("X").insert("BC");
  
  // the second pattern sees the sentence left by the first one
  std::string sentence("BXC");
  BOOST_CHECK(postal(sentence));
  BOOST_CHECK_EQUAL(sentence, "");
  
  std::string untouched("ABD");
  BOOST_CHECK(! postal(untouched));
  BOOST_CHECK_EQUAL(untouched, "ABD");
  
  const addrlex::PostalJunk empty;
  std::string nothing("BOX 5");
  BOOST_CHECK(! empty(nothing));
  BOOST_CHECK_EQUAL(nothing, "BOX 5");
}
