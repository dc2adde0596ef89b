#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace http_retry {

class InvalidHeader : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

/**
 * Case-insensitive, multi-valued HTTP header map.
 * Names are stored lower-cased; values keep insertion order.
 */
class Headers {
public:
	using Entry = std::pair<std::string, std::string>;
	using const_iterator = std::vector<Entry>::const_iterator;

	Headers() = default;

	/**
	 * Build from raw header lines as collected by a libcurl header callback,
	 * e.g. "Content-Type: application/json\r\n".
	 * Status lines start a new header block, only the last block is kept.
	 * Lines that are not valid headers are skipped.
	 */
	static Headers parse(const std::vector<std::string>& lines);

	// First value for `name`
	std::optional<std::string_view> get(std::string_view name) const;
	std::vector<std::string_view> getAll(std::string_view name) const;
	bool contains(std::string_view name) const;

	// Number of values, not distinct names
	size_t size() const { return entries_.size(); }
	bool empty() const { return entries_.empty(); }

	const_iterator begin() const { return entries_.begin(); }
	const_iterator end() const { return entries_.end(); }

	// Replace every value of `name`, returns the previous first value. Throws InvalidHeader.
	std::optional<std::string> insert(std::string_view name, std::string_view value);
	// Add a value to `name`, returns true if `name` already had a value. Throws InvalidHeader.
	bool append(std::string_view name, std::string_view value);

	// Non-throwing variants, return false if name or value is invalid and
	// leave the map unchanged. Use insert()/append() to learn what was there.
	bool tryInsert(std::string_view name, std::string_view value);
	bool tryAppend(std::string_view name, std::string_view value);

	// Remove every value of `name`, returns the first one
	std::optional<std::string> remove(std::string_view name);

	static bool isValidName(std::string_view name);
	static bool isValidValue(std::string_view value);

private:
	static void validate(std::string_view name, std::string_view value);

	std::vector<Entry> entries_;
};

} // namespace http_retry
