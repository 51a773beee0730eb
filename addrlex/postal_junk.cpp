#include "postal_junk.hpp"

namespace addrlex
{
  bool PostalJunk::operator()(string_type& sentence) const
  {
    const string_type empty;
    
    bool found = false;
    
    const_iterator piter_end = patterns.end();
    for (const_iterator piter = patterns.begin(); piter != piter_end; ++ piter)
      found |= piter->replace_all(sentence, empty);
    
    return found;
  }
  
  bool PostalJunk::operator()(std::string& sentence) const
  {
    string_type usentence = string_type::fromUTF8(sentence);
    
    if (! operator()(usentence))
      return false;
    
    sentence.clear();
    usentence.toUTF8String(sentence);
    return true;
  }
};
