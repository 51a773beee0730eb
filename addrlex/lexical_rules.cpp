#include <map>
#include <stdexcept>

#include "lexical_rules.hpp"
#include "joiner.hpp"

#include "lexical_rules/dra.hpp"

#include <boost/shared_ptr.hpp>
#include <boost/thread.hpp>
#include <boost/algorithm/string/case_conv.hpp>

namespace addrlex
{
  const char* const LexicalRules::POSTAL_ADDRESS_ELEMENT = "/PJ";
  const char* const LexicalRules::FRONT_GATE             = "/FG";
  const char* const LexicalRules::OCCUPANT_SEPARATOR     = "/OS";
  
  const char* LexicalRules::lists()
  {
    static const char* desc = "\
dra: British Columbia Digital Road Atlas (English and French)\n\
";
    return desc;
  }
  
  void LexicalRules::join(const token_set_type& tokens, token_set_type& joined) const
  {
    Joiner joiner(join_rules());
    
    joiner(tokens, joined);
  }
  
  typedef boost::shared_ptr<LexicalRules> lexical_rules_ptr_type;
  typedef std::map<std::string, lexical_rules_ptr_type, std::less<std::string>,
		   std::allocator<std::pair<const std::string, lexical_rules_ptr_type> > > lexical_rules_map_type;
  
  // rules are shared process-wide: they are immutable once constructed
  static boost::mutex           __lexical_rules_mutex;
  static lexical_rules_map_type __lexical_rules;
  
  const LexicalRules& LexicalRules::create(const std::string& parameter)
  {
    const std::string name = boost::algorithm::to_lower_copy(parameter);
    
    boost::mutex::scoped_lock lock(__lexical_rules_mutex);
    
    lexical_rules_map_type::iterator iter = __lexical_rules.find(name);
    if (iter != __lexical_rules.end())
      return *(iter->second);
    
    if (name == "dra") {
      iter = __lexical_rules.insert(std::make_pair(name, lexical_rules_ptr_type(new lexical_rules::Dra()))).first;
      iter->second->__algorithm = name;
    } else
      throw std::runtime_error("invalid lexical rules: " + parameter);
    
    return *(iter->second);
  }
};
