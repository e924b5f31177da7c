#include "utf.h"

#include <stdint.h>

namespace utf8 {
	void process(std::string& str) {
		std::string out;
		out.reserve(str.size());

		size_t in = 0;
		while (in < str.size()) {
			uint8_t byte = str[in];

			if (!(byte & (1 << 7))) {
				out.push_back(byte);
				++in;
				continue;
			}

			int remain;
			uint32_t cur, smallest;
			if (byte >> 5 == 0b110) {
				remain = 1;
				cur = byte & 037;
				smallest = 0x80;
			}
			else if (byte >> 4 == 0b1110) {
				remain = 2;
				cur = byte & 017;
				smallest = 0x800;
			}
			else if (byte >> 3 == 0b11110) {
				remain = 3;
				cur = byte & 07;
				smallest = 0x10000;
			}
			else {
				// continuation byte without a start, or not a start at all
				out.push_back('?');
				++in;
				continue;
			}

			size_t end = in + 1;
			while (remain && end < str.size() && (uint8_t)str[end] >> 6 == 0b10) {
				cur <<= 6;
				cur |= (str[end] & 077);
				--remain;
				++end;
			}

			if (remain || cur < smallest || cur > 0x10FFFF || (cur >= 0xD800 && cur < 0xE000)) out.push_back('?');
			else out.append(str, in, end - in);

			in = end;
		}

		str.swap(out);
	}
}
