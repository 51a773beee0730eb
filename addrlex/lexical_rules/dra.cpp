#include "dra.hpp"

#include <addrlex/decompose.hpp>

#include <utils/icu_regex.hpp>

namespace addrlex
{
  namespace lexical_rules
  {
    const char* const Dra::RE_WORD                        = "[^0-9]+|[\\w]{9,}";
    const char* const Dra::RE_AND                         = "AND";
    const char* const Dra::RE_NUMBER                      = "\\d{1,8}";
    const char* const Dra::RE_NUMBER_WITH_SUFFIX          = "\\d{1,8}[a-zA-Z]";
    const char* const Dra::RE_NUMBER_WITH_OPTIONAL_SUFFIX = "\\d{1,8}([a-zA-Z])?";
    const char* const Dra::RE_ORDINAL                     = "(?i)(ST|TH|RD|ND|E|ER|RE|EME|ERE|IEME|IERE)";
    // a single letter, or an optional letter, digits and a letter following a digit
    const char* const Dra::RE_UNIT_NUMBER                 = "[a-zA-Z0-9]?\\d{0,8}((?<=\\d)[a-zA-Z])?";
    const char* const Dra::RE_DIRECTIONAL                 = "N|NW|NE|S|SE|SW|E|W";
    const char* const Dra::RE_PROVINCE                    = "BC|AB|YT|SK|MB|ON|QC|NB|NS|NL|NT|NU|PE";
    const char* const Dra::RE_SUFFIX                      = "[A-Z]|1/2";
    
    Dra::Dra()
    {
      const std::string front_gate         = std::string(" ") + FRONT_GATE + " ";
      const std::string occupant_separator = std::string(" ") + OCCUPANT_SEPARATOR + " ";
      
      // no match when a front gate follows anywhere in the sentence
      const std::string no_front_gate = std::string("(?!.*\\Q") + FRONT_GATE + "\\E)";
      
      __cleaner.insert()
	// periods and apostrophes between letters: squish letters together
	("(?<=[a-zA-Z]|^)[.'](?=[a-zA-Z]|$)", "")
	// diacritical marks split by NFD
	("\\p{Block=Combining_Diacritical_Marks}+", "")
	// ligatures, only a few seen in practice
	("\\u00E6", "ae")
	("\\u00C6", "AE")
	("\\u0152", "OE")
	("\\u0153", "oe")
	("\\u00BD", " 1/2")
	("&", " and ")
	// exactly two dashes/asterisks. Longer runs are removed below
	("(?<=[^-]|^)--(?=[^-]|$)", front_gate)
	("(?<=[^\\*]|^)\\*\\*(?=[^\\*]|$)", occupant_separator)
	// everything else, including apostrophes, periods and dashes
	("[^a-zA-Z0-9/]", " ")
	("\\s+", " ");
      
      __join_rules.push_back(JoinRule::create_join("(?i)(B)RITISH", "(?i)(C)OLUMBIA"));
      __join_rules.push_back(JoinRule::create_join("(?i)(C)OLUMBIE", "(?i)(B)RITANIQUE"));
      __join_rules.push_back(JoinRule::create_join("(?i)(C)", "(?i)(B)"));
      
      // postal code, e.g. V9K 1X9
      __postal.insert("\\b[ABCEGHJ-NPRSTVXY][0-9][ABCEGHJ-NPRSTV-Z]\\s*[0-9][ABCEGHJ-NPRSTV-Z][0-9]\\b");
      // postal box, e.g. PO BOX 12 STN ABC
      __postal.insert("\\b(PO\\s*)?BOX\\s*[0-9]+\\s*(STN\\s+[^\\s]*)?\\b" + no_front_gate);
      // mailbag, e.g. MAILBAG 12
      __postal.insert("\\b(((MAIL)?BAG)|LCD)\\s*[0-9]+\\b" + no_front_gate);
      // rural route, mail route and suburban service, e.g. RR 12
      __postal.insert("\\b(RR|MR|SS|RURAL ROUTE)\\s*[0-9]+\\s*(STN\\s+[^\\s]*)?\\b" + no_front_gate);
      // general delivery station, e.g. GD STN ABC
      __postal.insert("\\b(GD\\s*)?STN\\s+[^\\s]+\\b" + no_front_gate);
      __postal.insert("\\bGENERAL\\s+DELIVERY\\b");
      
      __grammar.word                        = RE_WORD;
      __grammar.conjunction                 = RE_AND;
      __grammar.number                      = RE_NUMBER;
      __grammar.number_with_suffix          = RE_NUMBER_WITH_SUFFIX;
      __grammar.number_with_optional_suffix = RE_NUMBER_WITH_OPTIONAL_SUFFIX;
      __grammar.ordinal                     = RE_ORDINAL;
      __grammar.unit_number                 = RE_UNIT_NUMBER;
      __grammar.directional                 = RE_DIRECTIONAL;
      __grammar.province                    = RE_PROVINCE;
      __grammar.suffix                      = RE_SUFFIX;
      
      // fragments are compiled by the tokenizer. Fail here, not there
      const char* fragments[] = {
	RE_WORD, RE_AND, RE_NUMBER, RE_NUMBER_WITH_SUFFIX, RE_NUMBER_WITH_OPTIONAL_SUFFIX,
	RE_ORDINAL, RE_UNIT_NUMBER, RE_DIRECTIONAL, RE_PROVINCE, RE_SUFFIX
      };
      for (size_t i = 0; i != sizeof(fragments) / sizeof(const char*); ++ i) {
	const std::string fragment(fragments[i]);
	const utils::icu_regex compiled(fragment);
      }
    }
    
    std::string Dra::clean_sentence(const std::string& sentence) const
    {
      icu::UnicodeString usentence = icu::UnicodeString::fromUTF8(sentence);
      
      decompose(usentence);
      __cleaner(usentence);
      
      std::string cleaned;
      usentence.toUTF8String(cleaned);
      return cleaned;
    }
    
    std::string Dra::run_special_rules(const std::string& sentence) const
    {
      // postal junk is removed, and a flag is put at the end where it is easy to find
      std::string special(sentence);
      
      if (__postal(special)) {
	special += ' ';
	special += POSTAL_ADDRESS_ELEMENT;
      }
      
      return special;
    }
  };
};
