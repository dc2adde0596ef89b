#include "Priority.hpp"

#include <algorithm>

namespace http_retry {

Priority Priority::defaultPriority() {
	return Priority();
}

Priority Priority::transientErrorClassifier() {
	return defaultPriority();
}

Priority Priority::modeledAsRetryableClassifier() {
	return before(transientErrorClassifier());
}

Priority Priority::serviceErrorCodeClassifier() {
	return before(modeledAsRetryableClassifier());
}

Priority Priority::httpStatusCodeClassifier() {
	return before(serviceErrorCodeClassifier());
}

Priority Priority::before(const Priority& other) {
	std::vector<int8_t> path(other.path_);
	path.push_back(-1);
	return Priority(std::move(path));
}

Priority Priority::after(const Priority& other) {
	std::vector<int8_t> path(other.path_);
	path.push_back(1);
	return Priority(std::move(path));
}

int Priority::compare(const Priority& other) const {
	size_t n = std::max(this->path_.size(), other.path_.size());
	for (size_t i = 0; i < n; ++i) {
		int8_t a = i < this->path_.size() ? this->path_[i] : 0;
		int8_t b = i < other.path_.size() ? other.path_[i] : 0;
		if (a != b) return a < b ? -1 : 1;
	}
	return 0;
}

std::string Priority::toString() const {
	std::string s("default");
	for (int8_t step : this->path_)
		s += step < 0 ? ".before" : ".after";
	return s;
}

std::ostream& operator<<(std::ostream& os, const Priority& priority) {
	return os << priority.toString();
}

} // namespace http_retry
