#include <stdexcept>

#include "join_rule.hpp"

namespace addrlex
{
  JoinRule::JoinRule(const std::string& first, const std::string& second)
  {
    if (first.empty() || second.empty())
      throw std::runtime_error("join rule: empty pattern?");
    
    __first  = regex_type(first);
    __second = regex_type(second);
    
    if (__first.groups() < 1)
      throw std::runtime_error("join rule: no capture group: " + first);
    if (__second.groups() < 1)
      throw std::runtime_error("join rule: no capture group: " + second);
  }

  static bool __capture(const JoinRule::regex_type& regex, const JoinRule::string_type& token, JoinRule::string_type& captured)
  {
    JoinRule::regex_type::matcher_ptr_type matcher(regex.matcher(token));
    
    UErrorCode status = U_ZERO_ERROR;
    if (! matcher->matches(status)) {
      if (U_FAILURE(status))
	throw std::runtime_error(std::string("RegexMatcher::matches(): ") + u_errorName(status));
      return false;
    }
    
    status = U_ZERO_ERROR;
    captured = matcher->group(1, status);
    if (U_FAILURE(status))
      throw std::runtime_error(std::string("RegexMatcher::group(): ") + u_errorName(status));
    
    return true;
  }
  
  bool JoinRule::operator()(const string_type& first, const string_type& second, string_type& joined) const
  {
    string_type captured_first;
    string_type captured_second;
    
    if (! __capture(__first, first, captured_first)) return false;
    if (! __capture(__second, second, captured_second)) return false;
    
    joined = captured_first;
    joined += captured_second;
    return true;
  }
  
  bool JoinRule::operator()(const std::string& first, const std::string& second, std::string& joined) const
  {
    string_type ujoined;
    
    if (! operator()(string_type::fromUTF8(first), string_type::fromUTF8(second), ujoined))
      return false;
    
    joined.clear();
    ujoined.toUTF8String(joined);
    return true;
  }
};
