// -*- mode: c++ -*-

#ifndef __ADDRLEX__TOKENIZE__HPP__
#define __ADDRLEX__TOKENIZE__HPP__ 1

#include <string>
#include <vector>

namespace addrlex
{
  typedef std::vector<std::string, std::allocator<std::string> > token_set_type;
  
  // split a cleaned sentence at white spaces
  void tokenize(const std::string& sentence, token_set_type& tokens);

  // concatenate tokens by a single space
  std::string untokenize(const token_set_type& tokens);
};

#endif
