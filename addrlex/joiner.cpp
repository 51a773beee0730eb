#include "joiner.hpp"

namespace addrlex
{
  void Joiner::operator()(const token_set_type& source, token_set_type& joined) const
  {
    if (&source == &joined) {
      const token_set_type tokens(source);
      operator()(tokens, joined);
      return;
    }
    
    joined.clear();
    
    std::string fused;
    
    token_set_type::size_type pos = 0;
    while (pos != source.size()) {
      bool found = false;
      
      if (pos + 1 < source.size()) {
	rule_set_type::const_iterator riter_end = rules.end();
	for (rule_set_type::const_iterator riter = rules.begin(); riter != riter_end; ++ riter)
	  if (riter->operator()(source[pos], source[pos + 1], fused)) {
	    found = true;
	    break;
	  }
      }
      
      if (found) {
	joined.push_back(fused);
	pos += 2;
      } else {
	joined.push_back(source[pos]);
	++ pos;
      }
    }
  }
};
