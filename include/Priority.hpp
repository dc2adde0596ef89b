#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace http_retry {

/**
 * Opaque ordering key for retry classifiers.
 *
 * Classifiers run in ascending priority order and the last non-abstaining
 * opinion wins, so a higher priority means "evaluated later, can override".
 *
 * A Priority can only be obtained from defaultPriority(), from one of the
 * named built-in constants, or relative to another Priority through before()
 * and after(). Repeated chaining always yields a new value strictly between
 * the previous one and its neighbours, so new classifiers can be slotted in
 * anywhere indefinitely.
 */
class Priority {
public:
	// Same as defaultPriority()
	Priority() = default;

	static Priority defaultPriority();

	// Built-in classifier slots, highest first
	static Priority transientErrorClassifier();
	static Priority modeledAsRetryableClassifier();
	static Priority serviceErrorCodeClassifier();
	static Priority httpStatusCodeClassifier();

	// Strictly less than / greater than `other`
	static Priority before(const Priority& other);
	static Priority after(const Priority& other);

	bool operator==(const Priority& other) const { return compare(other) == 0; }
	bool operator!=(const Priority& other) const { return compare(other) != 0; }
	bool operator<(const Priority& other) const { return compare(other) < 0; }
	bool operator<=(const Priority& other) const { return compare(other) <= 0; }
	bool operator>(const Priority& other) const { return compare(other) > 0; }
	bool operator>=(const Priority& other) const { return compare(other) >= 0; }

	// Relative description, e.g. "default.before.before"
	std::string toString() const;

private:
	explicit Priority(std::vector<int8_t> path) : path_(std::move(path)) {}

	int compare(const Priority& other) const;

	// Each step is -1 (before) or +1 (after). Compared lexicographically with
	// missing trailing steps treated as 0.
	std::vector<int8_t> path_;
};

std::ostream& operator<<(std::ostream& os, const Priority& priority);

} // namespace http_retry
