#include "arguments.h"
#include "string.h"

using std::nullopt;
using std::optional;
using std::string;
using std::string_view;
using std::vector;

namespace {

// Accumulates one argument at a time and tracks the parenthesis depth
class ArgumentSplitter {
	vector<string> args_;
	string current_;
	int depth_ = 0;
	bool split_before_paren_;

public:
	explicit ArgumentSplitter(bool split_before_paren)
	   : split_before_paren_(split_before_paren) {}

	vector<string> split(string_view content) && {
		for (char c : content) {
			if (c == '(') {
				if (split_before_paren_ and depth_ == 0)
					flush();
				++depth_;
			} else if (c == ')') {
				--depth_; // may go negative, the caller checks the nesting
			} else if (c == ' ' and depth_ == 0) {
				flush();
				continue;
			}

			current_ += c;
		}

		flush();
		return std::move(args_);
	}

private:
	void flush() {
		auto arg = trim(current_);
		if (not arg.empty())
			args_.emplace_back(arg);
		current_.clear();
	}
};

bool is_operator_char(char c) noexcept {
	return (c == '+' or c == '-' or c == '*' or c == '/' or c == '^' or
	        c == '=' or c == '<' or c == '>');
}

bool is_tag_char(char c) noexcept {
	return ((c >= 'A' and c <= 'Z') or (c >= 'a' and c <= 'z') or
	        (c >= '0' and c <= '9') or c == '_');
}

// Returns the text between the tag and the closing parenthesis
string_view form_body(string_view form) noexcept {
	form = trim(form);
	if (form.empty() or form.front() != '(')
		return {};

	size_t pos = 1;
	if (pos < form.size() and form[pos] == '@') {
		++pos;
		while (pos < form.size() and is_tag_char(form[pos]))
			++pos;
	} else if (pos < form.size() and is_operator_char(form[pos])) {
		++pos;
	}

	size_t end = form.size();
	if (end > pos and form.back() == ')')
		--end;

	return trim(form.substr(pos, end - pos));
}

} // namespace

vector<string> split_top_level(string_view content) {
	return ArgumentSplitter(false).split(content);
}

vector<string> extract_arguments(string_view form) {
	return ArgumentSplitter(true).split(form_body(form));
}

vector<string> extract_operator_arguments(string_view form) {
	return ArgumentSplitter(false).split(form_body(form));
}

size_t find_matching_parenthesis(string_view text, size_t open) noexcept {
	if (open >= text.size() or text[open] != '(')
		return string_view::npos;

	int depth = 0;
	for (size_t i = open; i < text.size(); ++i) {
		if (text[i] == '(') {
			++depth;
		} else if (text[i] == ')' and --depth == 0) {
			return i;
		}
	}

	return string_view::npos;
}

optional<NestingError> check_nesting(string_view text) {
	vector<size_t> open_positions;
	for (size_t i = 0; i < text.size(); ++i) {
		if (text[i] == '(') {
			open_positions.emplace_back(i);
		} else if (text[i] == ')') {
			if (open_positions.empty())
				return NestingError {NestingError::Kind::UNEXPECTED_CLOSE, i};
			open_positions.pop_back();
		}
	}

	if (not open_positions.empty())
		return NestingError {NestingError::Kind::UNCLOSED,
		                     open_positions.back()};

	return nullopt;
}

string describe(const NestingError& error) {
	switch (error.kind) {
	case NestingError::Kind::UNEXPECTED_CLOSE:
		return "unmatched ')' at position " + std::to_string(error.position);
	case NestingError::Kind::UNCLOSED:
		return "unclosed '(' at position " + std::to_string(error.position);
	}

	return "unbalanced parentheses";
}
