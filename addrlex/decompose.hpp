// -*- mode: c++ -*-

#ifndef __ADDRLEX__DECOMPOSE__HPP__
#define __ADDRLEX__DECOMPOSE__HPP__ 1

#include <string>

#include <unicode/unistr.h>

// Unicode canonical decomposition (NFD).
// The cleaning rules assume decomposed input: precomposed accented letters are split into
// a base letter followed by combining marks, which are then removed by the diacritic rule.

namespace addrlex
{
  icu::UnicodeString& decompose(icu::UnicodeString& sentence);
  
  std::string decompose(const std::string& sentence);
};

#endif
