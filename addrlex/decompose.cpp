#include <stdexcept>

#include "decompose.hpp"

#include <unicode/normalizer2.h>

namespace addrlex
{
  static const icu::Normalizer2& nfd_instance()
  {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* normalizer = icu::Normalizer2::getNFDInstance(status);
    if (U_FAILURE(status) || ! normalizer)
      throw std::runtime_error(std::string("Normalizer2::getNFDInstance(): ") + u_errorName(status));
    return *normalizer;
  }
  
  icu::UnicodeString& decompose(icu::UnicodeString& sentence)
  {
    // the NFD instance is owned by ICU and is safe to share among threads
    static const icu::Normalizer2& normalizer = nfd_instance();
    
    if (sentence.isEmpty()) return sentence;
    
    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeString decomposed = normalizer.normalize(sentence, status);
    if (U_FAILURE(status))
      throw std::runtime_error(std::string("Normalizer2::normalize(): ") + u_errorName(status));
    
    sentence.swap(decomposed);
    return sentence;
  }
  
  std::string decompose(const std::string& sentence)
  {
    icu::UnicodeString usentence = icu::UnicodeString::fromUTF8(sentence);
    
    decompose(usentence);
    
    std::string decomposed;
    usentence.toUTF8String(decomposed);
    return decomposed;
  }
};
