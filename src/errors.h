#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

// Thrown (in strict mode) when parentheses of the input do not balance. The
// translation is still carried out, its best-effort result is kept here.
class MalformedInput : public std::runtime_error {
	std::string partial_result_;
	size_t position_;

public:
	MalformedInput(const std::string& what, std::string partial_result,
	               size_t position)
	   : std::runtime_error(what), partial_result_(std::move(partial_result)),
	     position_(position) {}

	const std::string& partial_result() const noexcept {
		return partial_result_;
	}

	size_t position() const noexcept { return position_; }
};

class RecursionLimitExceeded : public std::runtime_error {
	int limit_;

public:
	explicit RecursionLimitExceeded(int limit)
	   : std::runtime_error("expression nesting exceeds the limit of " +
	                        std::to_string(limit) + " levels"),
	     limit_(limit) {}

	int limit() const noexcept { return limit_; }
};

// Input longer than TranslatorConfig::max_input_length
class InputTooLong : public std::runtime_error {
	size_t length_;
	size_t limit_;

public:
	InputTooLong(size_t length, size_t limit)
	   : std::runtime_error("input of " + std::to_string(length) +
	                        " characters exceeds the limit of " +
	                        std::to_string(limit)),
	     length_(length), limit_(limit) {}

	size_t length() const noexcept { return length_; }

	size_t limit() const noexcept { return limit_; }
};
