#include "json.h"
#include "utf.h"
#include <cerrno>

// Declared separately to provide a single address for these (they're compared by address not strcmp for obvious reasons)
const char * const json::PathNode::ROOT_NAME = "(root)";
const char * const json::PathNode::ANON_NAME = "(anon)";

namespace {
	void append_utf8(std::string& out, uint32_t cp) {
		if (cp < 0x80) {
			out.push_back((char)cp);
		}
		else if (cp < 0x800) {
			out.push_back((char)(0xC0 | (cp >> 6)));
			out.push_back((char)(0x80 | (cp & 0x3F)));
		}
		else if (cp < 0x10000) {
			out.push_back((char)(0xE0 | (cp >> 12)));
			out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
			out.push_back((char)(0x80 | (cp & 0x3F)));
		}
		else {
			out.push_back((char)(0xF0 | (cp >> 18)));
			out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
			out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
			out.push_back((char)(0x80 | (cp & 0x3F)));
		}
	}

	int hex_digit(char c) {
		if (c >= '0' && c <= '9') return c - '0';
		if (c >= 'a' && c <= 'f') return c - 'a' + 10;
		if (c >= 'A' && c <= 'F') return c - 'A' + 10;
		return -1;
	}
}

json::JSONParser::JSONParser(JSONCallback && c) : cb(std::move(c)) {
	push(PathNode{});
}

json::JSONParser::~JSONParser() {
	while (!stack.empty()) pop();
}

bool json::JSONParser::push(PathNode node) {
	// the callback only gets a uint8_t depth
	if (stack.size() >= 255) return false;
	nodes.push_back(node);
	stack.push_back(&nodes.back());
	return true;
}

void json::JSONParser::pop() {
	stack.pop_back();
	nodes.pop_back();
}

bool json::JSONParser::parse(const char *text) {
	return parse(text, strlen(text));
}

bool json::JSONParser::parse(const char *text, size_t size) {
	size_t head = 0;
	return parse([text, size, head]() mutable -> int16_t {
		if (head >= size) return -1;
		return (uint8_t)text[head++];
	});
}

bool json::JSONParser::parse(TextCallback && c) {
	this->tcb = std::move(c);
	this->need = true;
	this->temp = 0;

	while (!stack.empty()) pop();
	names.clear();
	push(PathNode{}); // root node

	return parse_value();
}

bool json::JSONParser::parse_value() {
	// PARSE VALUE: skips whitespace, then calls the correct function to parse a value. Assumes the context on the stack is set properly.
	if (!advance_whitespace()) return false;

	switch (peek()) {
		case '{':
			return parse_object();
		case '-':
		case '0':
		case '1':
		case '2':
		case '3':
		case '4':
		case '5':
		case '6':
		case '7':
		case '8':
		case '9':
			return parse_number();
		case '[':
			return parse_array();
		case '"':
			return parse_string();
		case 't':
		case 'f':
		case 'n':
			return parse_singleton();
		default:
			return false;
	}
}

bool json::JSONParser::parse_number() {
	char buf[48];
	size_t len = 0;
	bool isint = true;

	while (true) {
		char c = peek();
		if (c == '.' || c == 'e' || c == 'E') isint = false;
		else if (!((c >= '0' && c <= '9') || c == '-' || c == '+')) break;

		if (len + 1 >= sizeof buf) return false;
		buf[len++] = c;
		next();
	}
	buf[len] = 0;
	if (!len) return false;

	char * end = nullptr;
	if (isint) {
		errno = 0;
		long long integer = strtoll(buf, &end, 10);
		if (end == buf + len && errno != ERANGE) {
			Value v{(int64_t)integer};
			cb(stack.data(), depth(), v);
			return true;
		}
		// out of range integers fall back to a float
	}

	double whole = strtod(buf, &end);
	if (end != buf + len) return false;

	Value v{whole};
	cb(stack.data(), depth(), v);
	return true;
}

bool json::JSONParser::advance_whitespace() {
	while (peek() == ' ' ||
		   peek() == '\t' ||
		   peek() == '\r' ||
		   peek() == '\n') {
		if (next() == 0) {
			return false;
		}
	}
	return true;
}

bool json::JSONParser::read_hex4(uint32_t& out) {
	out = 0;
	for (int i = 0; i < 4; ++i) {
		int d = hex_digit(next());
		if (d < 0) return false;
		out = (out << 4) | d;
	}
	next();
	return true;
}

bool json::JSONParser::parse_unicode_escape(std::string& out) {
	uint32_t cp;
	if (!read_hex4(cp)) return false;

	if (cp >= 0xD800 && cp < 0xDC00) {
		// high surrogate, must be followed by the low half
		uint32_t low = 0;
		if (peek() != '\\' || next() != 'u' || !read_hex4(low)) return false;
		if (low < 0xDC00 || low >= 0xE000) return false;
		cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
	}
	else if (cp >= 0xDC00 && cp < 0xE000) {
		return false;
	}

	append_utf8(out, cp);
	return true;
}

bool json::JSONParser::parse_string_text(std::string& out) {
	if (peek() != '"') return false;

	next();
	while (peek() != '"') {
		if (peek() == 0) return false;

		if (peek() != '\\') {
			out.push_back(peek());
			next();
			continue;
		}

		switch (next()) {
			case 'b':
				out.push_back('\b');
				break;
			case 'f':
				out.push_back('\f');
				break;
			case 'n':
				out.push_back('\n');
				break;
			case 'r':
				out.push_back('\r');
				break;
			case 't':
				out.push_back('\t');
				break;
			case 'u':
				// leaves the input positioned after the escape
				if (!parse_unicode_escape(out)) return false;
				continue;
			case 0:
				return false;
			default:
				out.push_back(peek());
				break;
		}
		next();
	}
	next();

	return true;
}

bool json::JSONParser::parse_array() {
	bool anon_array_required = top().array;
	if (anon_array_required) {
		if (!push(PathNode{true})) return false;
	}
	else {
		top().array = true;
	}
	top().index = 0;

	while (peek() != 0) {
		next();
		if (!advance_whitespace()) return false;
		if (peek() == ']') break;
		if (!parse_value()) return false;
		if (!advance_whitespace()) return false;
		if (peek() == ',') ++top().index;
		else if (peek() == ']') break;
		else return false;
	}
	if (peek() != ']') return false;

	next();

	if (anon_array_required) {
		pop();
	}

	return true;
}

bool json::JSONParser::parse_object() {
	while (peek() != 0) {
		next();
		if (!advance_whitespace()) return false;
		if (peek() == '}') {
			break;
		}

		std::string key;
		if (!parse_string_text(key)) return false;
		names.push_back(std::move(key));
		if (!push(PathNode{names.back().c_str()})) {
			names.pop_back();
			return false;
		}

		bool ok = advance_whitespace() && peek() == ':';
		if (ok) {
			next();
			ok = parse_value();
		}
		pop();
		names.pop_back();

		if (!ok || !advance_whitespace()) return false;
		if (peek() == ',') continue;
		else if (peek() == '}') break;
		else return false;
	}
	if (peek() != '}') return false;

	next();
	cb(stack.data(), depth(), Value{Value::OBJ});
	return true;
}

bool json::JSONParser::parse_string() {
	std::string b;
	if (!parse_string_text(b)) return false;
	utf8::process(b);

	Value v{b.c_str()};
	cb(stack.data(), depth(), v);
	return true;
}

bool json::JSONParser::parse_singleton() {
	const char * word;
	Value v;

	switch (peek()) {
		case 't':
			word = "true";
			v = Value{true};
			break;
		case 'f':
			word = "false";
			v = Value{false};
			break;
		case 'n':
			word = "null";
			break;
		default:
			return false;
	}

	for (const char * c = word; *c; ++c) {
		if (peek() != *c) return false;
		next();
	}

	cb(stack.data(), depth(), v);
	return true;
}

char json::JSONParser::peek() {
	if (this->need) {
		auto x = tcb();
		temp = x < 0 ? 0 : (char)x;
		this->need = false;
	}

	return temp;
}

char json::JSONParser::next() {
	this->need = false;
	auto x = tcb();
	temp = x < 0 ? 0 : (char)x;
	return temp;
}
