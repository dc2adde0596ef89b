#include "Headers.hpp"
#include "utils.hpp"

#include <algorithm>

namespace http_retry {

bool Headers::isValidName(std::string_view name) {
	if (name.empty()) return false;
	return std::all_of(name.begin(), name.end(), util::isTokenChar);
}

bool Headers::isValidValue(std::string_view value) {
	// Control characters other than HTAB, and DEL
	return std::none_of(value.begin(), value.end(), [](char c) {
		unsigned char u = static_cast<unsigned char>(c);
		return (u < 0x20 && u != '\t') || u == 0x7f;
	});
}

void Headers::validate(std::string_view name, std::string_view value) {
	if (!isValidName(name))
		throw InvalidHeader("Headers: invalid header name '" + std::string(name) + "'");
	if (!isValidValue(value))
		throw InvalidHeader("Headers: invalid value for header '" + std::string(name) + "'");
}

Headers Headers::parse(const std::vector<std::string>& lines) {
	Headers headers;
	for (const auto& raw : lines) {
		std::string_view line = util::trim(raw);
		if (line.empty()) continue;

		// "HTTP/1.1 100 Continue" or a redirect starts a new block
		if (line.size() > 5 && line.substr(0, 5) == "HTTP/") {
			headers.entries_.clear();
			continue;
		}

		size_t colon = line.find(':');
		if (colon == std::string_view::npos) continue;

		std::string_view name = util::trim(line.substr(0, colon));
		std::string_view value = util::trim(line.substr(colon + 1));
		if (!isValidName(name) || !isValidValue(value)) continue;
		headers.append(name, value);
	}
	return headers;
}

std::optional<std::string_view> Headers::get(std::string_view name) const {
	for (const auto& entry : this->entries_)
		if (util::iequals(entry.first, name)) return std::string_view(entry.second);
	return std::nullopt;
}

std::vector<std::string_view> Headers::getAll(std::string_view name) const {
	std::vector<std::string_view> values;
	for (const auto& entry : this->entries_)
		if (util::iequals(entry.first, name)) values.emplace_back(entry.second);
	return values;
}

bool Headers::contains(std::string_view name) const {
	return this->get(name).has_value();
}

std::optional<std::string> Headers::insert(std::string_view name, std::string_view value) {
	validate(name, value);
	std::optional<std::string> previous = this->remove(name);
	this->entries_.emplace_back(util::tolower(name), std::string(value));
	return previous;
}

bool Headers::append(std::string_view name, std::string_view value) {
	validate(name, value);
	bool existed = this->contains(name);
	this->entries_.emplace_back(util::tolower(name), std::string(value));
	return existed;
}

bool Headers::tryInsert(std::string_view name, std::string_view value) {
	if (!isValidName(name) || !isValidValue(value)) return false;
	this->insert(name, value);
	return true;
}

bool Headers::tryAppend(std::string_view name, std::string_view value) {
	if (!isValidName(name) || !isValidValue(value)) return false;
	this->append(name, value);
	return true;
}

std::optional<std::string> Headers::remove(std::string_view name) {
	auto matches = [&](const Entry& entry) { return util::iequals(entry.first, name); };

	auto found = std::find_if(this->entries_.begin(), this->entries_.end(), matches);
	if (found == this->entries_.end()) return std::nullopt;

	std::optional<std::string> first(std::move(found->second));
	this->entries_.erase(std::remove_if(found, this->entries_.end(), matches), this->entries_.end());
	return first;
}

} // namespace http_retry
