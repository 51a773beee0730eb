#include "cleaner.hpp"

namespace addrlex
{
  std::string Cleaner::operator()(const std::string& sentence) const
  {
    string_type usentence = string_type::fromUTF8(sentence);
    
    operator()(usentence);
    
    std::string cleaned;
    usentence.toUTF8String(cleaned);
    return cleaned;
  }
};
