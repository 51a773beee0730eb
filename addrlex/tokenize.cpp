#include "tokenize.hpp"

#include <boost/tokenizer.hpp>

namespace addrlex
{
  void tokenize(const std::string& sentence, token_set_type& tokens)
  {
    typedef boost::char_separator<char> separator_type;
    typedef boost::tokenizer<separator_type> tokenizer_type;
    
    tokens.clear();
    
    const separator_type separator(" \t\n\r\f\v");
    tokenizer_type tokenizer(sentence, separator);
    
    tokens.insert(tokens.end(), tokenizer.begin(), tokenizer.end());
  }
  
  std::string untokenize(const token_set_type& tokens)
  {
    std::string sentence;
    
    token_set_type::const_iterator titer_end = tokens.end();
    for (token_set_type::const_iterator titer = tokens.begin(); titer != titer_end; ++ titer) {
      if (titer != tokens.begin())
	sentence += ' ';
      sentence += *titer;
    }
    return sentence;
  }
};
