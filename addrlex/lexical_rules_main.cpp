#include <string>
#include <vector>
#include <stdexcept>
#include <algorithm>

#include "addrlex/lexical_rules.hpp"
#include "addrlex/lexical_rules/dra.hpp"
#include "addrlex/tokenize.hpp"

#include "utils/icu_regex.hpp"

#include <boost/thread.hpp>

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE lexical_rules_test

#include <boost/test/unit_test.hpp>

typedef std::vector<std::string, std::allocator<std::string> > sentence_set_type;

static const addrlex::LexicalRules& dra()
{
  return addrlex::LexicalRules::create("dra");
}

static std::string clean(const std::string& sentence)
{
  return dra().clean_sentence(sentence);
}

static std::string special(const std::string& sentence)
{
  return dra().run_special_rules(dra().clean_sentence(sentence));
}

static sentence_set_type samples()
{
  sentence_set_type sentences;
  sentences.push_back("O'Brien's Rd.");
  sentences.push_back("123--45 Main St");
  sentences.push_back("123 Main St, V8W 1P6");
  sentences.push_back("PO BOX 55 STN MAIN");
  sentences.push_back("PO BOX 55 STN MAIN -- 12");
  sentences.push_back("Caf\xC3\xA9 & Soci\xC3\xA9t\xC3\xA9");
  sentences.push_back("SMITH**JONES 1234 Main St");
  sentences.push_back("\xC3\x86gir \xC5\x93uvre 12\xC2\xBD Main");
  sentences.push_back("J.R.R. Rd, Victoria, British Columbia");
  sentences.push_back("RR 2 SITE 5 COMP 3, Smithers BC");
  sentences.push_back("123---45 * - ** Main");
  sentences.push_back("\xD0\x9C\xD0\xBE\xD1\x81\xD0\xBA\xD0\xB2\xD0\xB0");
  sentences.push_back("");
  sentences.push_back("   ");
  return sentences;
}

BOOST_AUTO_TEST_CASE(create)
{
  const addrlex::LexicalRules& rules = addrlex::LexicalRules::create("dra");
  
  BOOST_CHECK_EQUAL(&rules, &addrlex::LexicalRules::create("DRA"));
  BOOST_CHECK_EQUAL(rules.algorithm(), "dra");
  BOOST_CHECK(dynamic_cast<const addrlex::lexical_rules::Dra*>(&rules));
  
  BOOST_CHECK_THROW(addrlex::LexicalRules::create("nowhere"), std::runtime_error);
  
  BOOST_CHECK(std::string(addrlex::LexicalRules::lists()).find("dra") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(clean_punctuation)
{
  BOOST_CHECK_EQUAL(clean("O'Brien's Rd."), "OBriens Rd");
  BOOST_CHECK_EQUAL(clean("St. John"), "St John");
  BOOST_CHECK_EQUAL(clean("J.R.R. Rd"), "JRR Rd");
  BOOST_CHECK_EQUAL(clean("'A"), "A");
  BOOST_CHECK_EQUAL(clean("A&B"), "A and B");
  BOOST_CHECK_EQUAL(clean("123 Main St, Victoria"), "123 Main St Victoria");
  BOOST_CHECK_EQUAL(clean("12 1/2 Main"), "12 1/2 Main");
  BOOST_CHECK_EQUAL(clean("Main\tSt\n"), "Main St ");
}

BOOST_AUTO_TEST_CASE(clean_diacritics)
{
  BOOST_CHECK_EQUAL(clean("Caf\xC3\xA9 & Soci\xC3\xA9t\xC3\xA9"), "Cafe and Societe");
  
  // already decomposed input gives the same result
  BOOST_CHECK_EQUAL(clean("Cafe\xCC\x81 & Socie\xCC\x81te\xCC\x81"), "Cafe and Societe");
  
  BOOST_CHECK_EQUAL(clean("\xC3\x86gir \xC5\x93uvre \xC5\x92 \xC3\xA6"), "AEgir oeuvre OE ae");
  BOOST_CHECK_EQUAL(clean("123\xC2\xBD Main"), "123 1/2 Main");
  
  // letters without a Latin base are removed
  BOOST_CHECK_EQUAL(clean("\xD0\x9C\xD0\xBE\xD1\x81\xD0\xBA\xD0\xB2\xD0\xB0"), " ");
}

BOOST_AUTO_TEST_CASE(clean_front_gate)
{
  BOOST_CHECK_EQUAL(clean("123--45 Main St"), "123 /FG 45 Main St");
  BOOST_CHECK_EQUAL(clean("123 -- 45 Main St"), "123 /FG 45 Main St");
  BOOST_CHECK_EQUAL(clean("--12"), " /FG 12");
  
  BOOST_CHECK_EQUAL(clean("123-45 Main St"), "123 45 Main St");
  BOOST_CHECK_EQUAL(clean("123---45 Main St"), "123 45 Main St");
  BOOST_CHECK_EQUAL(clean("123----45 Main St"), "123 45 Main St");
  
  BOOST_CHECK_EQUAL(clean("SMITH**JONES"), "SMITH /OS JONES");
  BOOST_CHECK_EQUAL(clean("SMITH*JONES"), "SMITH JONES");
  BOOST_CHECK_EQUAL(clean("SMITH***JONES"), "SMITH JONES");
  
  BOOST_CHECK_EQUAL(clean("1--2**3"), "1 /FG 2 /OS 3");
}

BOOST_AUTO_TEST_CASE(clean_edge)
{
  BOOST_CHECK_EQUAL(clean(""), "");
  BOOST_CHECK_EQUAL(clean("   "), " ");
  BOOST_CHECK_EQUAL(clean("..."), " ");
  
  // malformed UTF-8 is replaced, then removed
  BOOST_CHECK_EQUAL(clean("12\xFF Main"), "12 Main");
}

BOOST_AUTO_TEST_CASE(clean_idempotent)
{
  const sentence_set_type sentences = samples();
  
  for (sentence_set_type::const_iterator siter = sentences.begin(); siter != sentences.end(); ++ siter) {
    const std::string cleaned = clean(*siter);
    
    BOOST_CHECK_EQUAL(clean(cleaned), cleaned);
  }
}

BOOST_AUTO_TEST_CASE(special_postal_code)
{
  const std::string stripped = special("123 Main St, V8W 1P6");
  
  BOOST_CHECK_EQUAL(stripped, "123 Main St  /PJ");
  BOOST_CHECK_EQUAL(stripped.substr(stripped.size() - 3), "/PJ");
  
  BOOST_CHECK_EQUAL(special("123 Main St v8w1p6"), "123 Main St  /PJ");
  BOOST_CHECK_EQUAL(special("123 Main St"), "123 Main St");
}

BOOST_AUTO_TEST_CASE(special_postal_box)
{
  BOOST_CHECK_EQUAL(special("PO BOX 55 STN MAIN"), " /PJ");
  BOOST_CHECK_EQUAL(special("MAILBAG 4 SMITHERS"), " SMITHERS /PJ");
  BOOST_CHECK_EQUAL(special("LCD 1 VICTORIA"), " VICTORIA /PJ");
  BOOST_CHECK_EQUAL(special("RURAL ROUTE 3"), " /PJ");
  BOOST_CHECK_EQUAL(special("GD STN MAIN VICTORIA"), " VICTORIA /PJ");
  BOOST_CHECK_EQUAL(special("GENERAL DELIVERY"), " /PJ");
  
  BOOST_CHECK_EQUAL(special("12 BOXWOOD RD"), "12 BOXWOOD RD");
}

BOOST_AUTO_TEST_CASE(special_route_bag)
{
  BOOST_CHECK_EQUAL(special("MR 4"), " /PJ");
  BOOST_CHECK_EQUAL(special("SS 2 STN MAIN"), " /PJ");
  BOOST_CHECK_EQUAL(special("RR 7 STN A"), " /PJ");
  BOOST_CHECK_EQUAL(special("BAG 7 X"), " X /PJ");
  
  BOOST_CHECK_EQUAL(special("SS 2 -- 12"), "SS 2 /FG 12");
  BOOST_CHECK_EQUAL(special("BAG 7 -- 12"), "BAG 7 /FG 12");
}

BOOST_AUTO_TEST_CASE(special_front_gate)
{
  // a front gate anywhere after the box suppresses it
  BOOST_CHECK_EQUAL(special("PO BOX 55 STN MAIN -- 12"), "PO BOX 55 STN MAIN /FG 12");
  BOOST_CHECK_EQUAL(special("RR 2 -- 12 Main St"), "RR 2 /FG 12 Main St");
  
  // but not a front gate before it
  BOOST_CHECK_EQUAL(special("-- 12 PO BOX 55"), " /FG 12  /PJ");
  
  // neither postal code nor general delivery care about front gates
  BOOST_CHECK_EQUAL(special("GENERAL DELIVERY -- 12"), " /FG 12 /PJ");
  BOOST_CHECK_EQUAL(special("V8W 1P6 -- 12"), " /FG 12 /PJ");
}

BOOST_AUTO_TEST_CASE(special_once)
{
  const std::string stripped = special("PO BOX 5 RR 2 V8W 1P6");
  
  addrlex::token_set_type tokens;
  addrlex::tokenize(stripped, tokens);
  
  BOOST_CHECK_EQUAL(tokens.size(), size_t(1));
  BOOST_CHECK_EQUAL(tokens.front(), "/PJ");
  
  // no more flags once flagged
  BOOST_CHECK_EQUAL(dra().run_special_rules(stripped), stripped);
}

BOOST_AUTO_TEST_CASE(join)
{
  const addrlex::LexicalRules& rules = dra();
  
  BOOST_CHECK_EQUAL(rules.join_rules().size(), size_t(3));
  
  addrlex::token_set_type tokens;
  addrlex::token_set_type joined;
  
  tokens.push_back("BRITISH");
  tokens.push_back("COLUMBIA");
  
  rules.join(tokens, joined);
  
  BOOST_CHECK_EQUAL(joined.size(), size_t(1));
  BOOST_CHECK_EQUAL(joined.front(), "BC");
}

BOOST_AUTO_TEST_CASE(pipeline)
{
  const addrlex::LexicalRules& rules = dra();
  
  const std::string stripped = special("1234 Main St, Victoria, British Columbia V8W 1P6");
  
  addrlex::token_set_type tokens;
  addrlex::token_set_type joined;
  
  addrlex::tokenize(stripped, tokens);
  rules.join(tokens, joined);
  
  BOOST_CHECK_EQUAL(addrlex::untokenize(joined), "1234 Main St Victoria BC /PJ");
}

BOOST_AUTO_TEST_CASE(grammar)
{
  typedef addrlex::lexical_rules::Dra dra_type;
  
  const addrlex::LexicalRules::grammar_type& grammar = dra().grammar();
  
  BOOST_CHECK_EQUAL(grammar.province, dra_type::RE_PROVINCE);
  BOOST_CHECK_EQUAL(grammar.directional, dra_type::RE_DIRECTIONAL);
  
  const utils::icu_regex unit_number(grammar.unit_number);
  
  BOOST_CHECK(unit_number.matches(icu::UnicodeString::fromUTF8("12A")));
  BOOST_CHECK(unit_number.matches(icu::UnicodeString::fromUTF8("A")));
  BOOST_CHECK(unit_number.matches(icu::UnicodeString::fromUTF8("A1")));
  BOOST_CHECK(! unit_number.matches(icu::UnicodeString::fromUTF8("AB")));
  
  const utils::icu_regex ordinal(grammar.ordinal);
  
  BOOST_CHECK(ordinal.matches(icu::UnicodeString::fromUTF8("th")));
  BOOST_CHECK(ordinal.matches(icu::UnicodeString::fromUTF8("IEME")));
  BOOST_CHECK(! ordinal.matches(icu::UnicodeString::fromUTF8("XX")));
  
  const utils::icu_regex province(grammar.province);
  
  BOOST_CHECK(province.matches(icu::UnicodeString::fromUTF8("BC")));
  BOOST_CHECK(! province.matches(icu::UnicodeString::fromUTF8("WA")));
}

struct Task
{
  Task(const sentence_set_type& __sentences,
       const sentence_set_type& __expected,
       int& __mismatch,
       boost::mutex& __mutex)
    : sentences(__sentences), expected(__expected), mismatch(__mismatch), mutex(__mutex) {}
  
  void operator()()
  {
    const addrlex::LexicalRules& rules = dra();
    
    int local = 0;
    for (int iter = 0; iter != 50; ++ iter)
      for (size_t i = 0; i != sentences.size(); ++ i)
	local += (rules.run_special_rules(rules.clean_sentence(sentences[i])) != expected[i]);
    
    boost::mutex::scoped_lock lock(mutex);
    mismatch += local;
  }
  
  const sentence_set_type& sentences;
  const sentence_set_type& expected;
  int& mismatch;
  boost::mutex& mutex;
};

BOOST_AUTO_TEST_CASE(concurrent)
{
  const sentence_set_type sentences = samples();
  
  sentence_set_type expected;
  for (size_t i = 0; i != sentences.size(); ++ i)
    expected.push_back(special(sentences[i]));
  
  int mismatch = 0;
  boost::mutex mutex;
  
  boost::thread_group workers;
  for (int i = 0; i != 8; ++ i)
    workers.add_thread(new boost::thread(Task(sentences, expected, mismatch, mutex)));
  workers.join_all();
  
  BOOST_CHECK_EQUAL(mismatch, 0);
}
