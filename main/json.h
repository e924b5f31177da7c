#ifndef HC_JSON_H
#define HC_JSON_H

#include <cstdlib>
#include <cstdint>
#include <cstring>
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace json {
	struct PathNode {
		const char * name = nullptr;
		uint16_t index = 0;
		bool array = false;

		// constructs root
		PathNode() : name(ROOT_NAME) {}
		explicit PathNode(bool array) : name(ANON_NAME), array(array) {}
		explicit PathNode(const char * name_in) : name(name_in), index(0), array(false) {}

		inline bool is_array() const {return array && !is_root();}
		inline bool is_root() const {return name == ROOT_NAME;}
		inline bool is_anon() const {return name == ANON_NAME;}
		inline bool is_obj() const {return !array && !is_root();}

		// True if this node is the object key `key` (never true for root / anonymous nodes)
		inline bool is(const char * key) const {
			return !is_root() && !is_anon() && !strcmp(name, key);
		}

	private:
		static const char * const ROOT_NAME;
		static const char * const ANON_NAME;
	};

	struct Value {
		enum Type : uint8_t {
			STR,
			FLOAT,
			INT,
			BOOL,
			NONE,
			OBJ // technically a none, but called at the end of an object.
		} type;

		union {
			const char* str_val;
			double float_val;
			int64_t int_val;
			bool bool_val;
		};

		Value(Type t=NONE) : type(t), int_val(0) {}
		Value(double v) : type(FLOAT), float_val(v) {}
		Value(int64_t v) : type(INT), int_val(v) {}
		Value(bool b) : type(BOOL), bool_val(b) {}
		Value(const char * str) : type(STR), str_val(str) {}

		inline bool is_number() const {return type == FLOAT || type == INT;}
		inline double as_number() const {return type == FLOAT ? float_val : (double)int_val;}
	};

	typedef std::function<void (PathNode **, uint8_t, const Value&)> JSONCallback;
	// Returns the next byte of input, or -1 at end of input.
	typedef std::function<int16_t (void)> TextCallback;

	// Streaming parser: values are reported through the callback together with the path leading to them,
	// nothing is retained once the callback returns.
	struct JSONParser {
		JSONParser(JSONCallback && c);
		~JSONParser();

		JSONParser(const JSONParser&) = delete;
		JSONParser(JSONParser&&) = delete;

		JSONParser& operator=(const JSONParser&) = delete;
		JSONParser& operator=(JSONParser&&) = delete;

		bool parse(const char * text);
		bool parse(const char * text, size_t size);
		bool parse(TextCallback && c);

	private:
		PathNode& top() {
			return *stack.back();
		}

		uint8_t depth() const {
			return (uint8_t)stack.size();
		}

		bool push(PathNode node);
		void pop();

		bool parse_value();

		bool parse_object();
		bool parse_array();

		bool parse_string();
		bool parse_number();
		bool parse_singleton();

		bool parse_string_text(std::string& out);
		bool parse_unicode_escape(std::string& out);
		bool read_hex4(uint32_t& out);

		bool advance_whitespace();

		char peek();
		char next();

		char temp = 0;
		bool need = true;

		// Keys live in `names` for as long as their node is on the stack.
		std::vector<PathNode *> stack;
		std::deque<PathNode> nodes;
		std::deque<std::string> names;

		JSONCallback cb;
		TextCallback tcb;
	};
}

#endif
