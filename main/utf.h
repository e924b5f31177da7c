#ifndef HC_UTF_H
#define HC_UTF_H

#include <string>

// Minimal UTF-8 checker: anything that isn't well-formed UTF-8 (stray continuation bytes, truncated or
// overlong sequences, surrogates, codepoints past U+10FFFF) is replaced by '?'. Valid text is untouched.

namespace utf8 {
	void process(std::string& str_in_out);
}

#endif
