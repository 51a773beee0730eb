#include <string>
#include <stdexcept>

#include "utils/icu_regex.hpp"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE icu_regex_test

#include <boost/test/unit_test.hpp>

static std::string to_utf8(const icu::UnicodeString& x)
{
  std::string str;
  x.toUTF8String(str);
  return str;
}

BOOST_AUTO_TEST_CASE(compile)
{
  const std::string unbalanced("(BOX");
  const std::string lookbehind("(?<=[a-z]+)X");
  
  BOOST_CHECK_THROW(utils::icu_regex regex(unbalanced), std::runtime_error);
  BOOST_CHECK_THROW(utils::icu_regex regex(lookbehind), std::runtime_error);
  
  const utils::icu_regex regex(std::string("(a)(b)"));
  
  BOOST_CHECK(! regex.empty());
  BOOST_CHECK_EQUAL(regex.groups(), 2);
  BOOST_CHECK_EQUAL(regex.source(), "(a)(b)");
  
  const utils::icu_regex copied(regex);
  BOOST_CHECK_EQUAL(copied.source(), regex.source());
  
  const utils::icu_regex empty;
  BOOST_CHECK(empty.empty());
  BOOST_CHECK_EQUAL(empty.groups(), 0);
  BOOST_CHECK_EQUAL(utils::icu_regex(std::string("BRITISH")).groups(), 0);
  BOOST_CHECK_THROW(empty.find(icu::UnicodeString::fromUTF8("abc")), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(match)
{
  const utils::icu_regex sensitive(std::string("box"));
  const utils::icu_regex insensitive(std::string("box"), true);
  
  const icu::UnicodeString sentence = icu::UnicodeString::fromUTF8("PO BOX 5");
  
  BOOST_CHECK(! sensitive.find(sentence));
  BOOST_CHECK(insensitive.find(sentence));
  
  const utils::icu_regex british(std::string("(?i)(B)RITISH"));
  
  BOOST_CHECK(british.matches(icu::UnicodeString::fromUTF8("British")));
  BOOST_CHECK(! british.matches(icu::UnicodeString::fromUTF8("Britishx")));
  BOOST_CHECK(british.find(icu::UnicodeString::fromUTF8("Britishx")));
}

BOOST_AUTO_TEST_CASE(replace)
{
  const utils::icu_regex period(std::string("(?<=[a-z])\\.(?=[a-z])"));
  
  icu::UnicodeString data = icu::UnicodeString::fromUTF8("a.b c.");
  BOOST_CHECK(period.replace_all(data, icu::UnicodeString()));
  BOOST_CHECK_EQUAL(to_utf8(data), "ab c.");
  
  // no match: untouched
  BOOST_CHECK(! period.replace_all(data, icu::UnicodeString()));
  BOOST_CHECK_EQUAL(to_utf8(data), "ab c.");
  
  const utils::icu_regex digits(std::string("([0-9]+)-([0-9]+)"));
  
  icu::UnicodeString range = icu::UnicodeString::fromUTF8("10-12 and 3-4");
  BOOST_CHECK(digits.replace_all(range, icu::UnicodeString::fromUTF8("$2-$1")));
  BOOST_CHECK_EQUAL(to_utf8(range), "12-10 and 4-3");
}
