// -*- mode: c++ -*-

#ifndef __UTILS__ICU_REGEX__HPP__
#define __UTILS__ICU_REGEX__HPP__ 1

#include <stdint.h>

#include <stdexcept>
#include <string>
#include <memory>

#include <unicode/unistr.h>
#include <unicode/regex.h>
#include <unicode/parseerr.h>

#include <boost/shared_ptr.hpp>
#include <boost/lexical_cast.hpp>

namespace utils
{

  // compiled ICU regular expression.
  // The compiled pattern is immutable and shared by copies. Every operation creates its own matcher,
  // thus, an icu_regex can be used from multiple threads at the same time.
  class icu_regex
  {
  public:
    typedef icu::UnicodeString   string_type;
    typedef icu::RegexPattern    pattern_type;
    typedef icu::RegexMatcher    matcher_type;

    typedef boost::shared_ptr<const pattern_type> pattern_ptr_type;
    typedef std::unique_ptr<matcher_type>         matcher_ptr_type;

  public:
    icu_regex() : pattern() {}
    icu_regex(const std::string& __pattern, const bool __case_insensitive=false)
      : pattern() { __initialize(string_type::fromUTF8(__pattern), __case_insensitive); }
    icu_regex(const string_type& __pattern, const bool __case_insensitive=false)
      : pattern() { __initialize(__pattern, __case_insensitive); }

  public:
    bool empty() const { return ! pattern; }

    int32_t groups() const
    {
      if (! pattern) return 0;
      
      UErrorCode status = U_ZERO_ERROR;
      matcher_ptr_type __matcher(pattern->matcher(status));
      if (U_FAILURE(status))
	throw std::runtime_error(std::string("RegexPattern::matcher(): ") + u_errorName(status));
      
      return __matcher->groupCount();
    }

    std::string source() const
    {
      std::string __source;
      if (pattern)
	pattern->pattern().toUTF8String(__source);
      return __source;
    }

    // matcher over data. data must outlive the matcher
    matcher_ptr_type matcher(const string_type& data) const
    {
      if (! pattern)
	throw std::runtime_error("icu_regex: no pattern?");

      UErrorCode status = U_ZERO_ERROR;
      matcher_ptr_type __matcher(pattern->matcher(data, status));
      if (U_FAILURE(status))
	throw std::runtime_error(std::string("RegexPattern::matcher(): ") + u_errorName(status));

      return __matcher;
    }

    // whole data matches?
    bool matches(const string_type& data) const
    {
      matcher_ptr_type __matcher(matcher(data));

      UErrorCode status = U_ZERO_ERROR;
      const bool result = __matcher->matches(status);
      if (U_FAILURE(status))
	throw std::runtime_error(std::string("RegexMatcher::matches(): ") + u_errorName(status));
      return result;
    }

    // any match in data?
    bool find(const string_type& data) const
    {
      return matcher(data)->find();
    }

    // replace all the matches in data by substitution. returns true when at least one match is found
    bool replace_all(string_type& data, const string_type& substitution) const
    {
      string_type replaced;
      {
	matcher_ptr_type __matcher(matcher(data));

	if (! __matcher->find()) return false;

	UErrorCode status = U_ZERO_ERROR;
	replaced = __matcher->replaceAll(substitution, status);
	if (U_FAILURE(status))
	  throw std::runtime_error(std::string("RegexMatcher::replaceAll(): ") + u_errorName(status));
      }

      data.swap(replaced);
      return true;
    }

  private:
    void __initialize(const string_type& __pattern, const bool __case_insensitive)
    {
      UErrorCode  status = U_ZERO_ERROR;
      UParseError status_parse;

      pattern_ptr_type __compiled(pattern_type::compile(__pattern, __case_insensitive ? UREGEX_CASE_INSENSITIVE : 0, status_parse, status));
      if (U_FAILURE(status)) {
	std::string __source;
	__pattern.toUTF8String(__source);

	throw std::runtime_error(std::string("RegexPattern::compile(): ") + u_errorName(status)
				 + " line: " + boost::lexical_cast<std::string>(status_parse.line)
				 + " offset: " + boost::lexical_cast<std::string>(status_parse.offset)
				 + " pattern: " + __source);
      }

      pattern = __compiled;
    }

  private:
    pattern_ptr_type pattern;
  };

};

#endif
