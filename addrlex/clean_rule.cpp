#include "clean_rule.hpp"

namespace addrlex
{
  std::string CleanRule::operator()(const std::string& sentence) const
  {
    string_type usentence = string_type::fromUTF8(sentence);
    
    operator()(usentence);
    
    std::string cleaned;
    usentence.toUTF8String(cleaned);
    return cleaned;
  }
};
