#include "ClassifierRegistry.hpp"

#include <algorithm>

namespace http_retry {

void ClassifierRegistry::sort(ClassifierSequence& classifiers) {
	std::stable_sort(classifiers.begin(), classifiers.end(), [](const SharedClassifier& a, const SharedClassifier& b) {
		return a->priority() < b->priority();
	});
}

void ClassifierRegistry::checkMutable(const char* operation) const {
	if (this->frozen_)
		throw ConfigFrozen(std::string("ClassifierRegistry::") + operation + ": registry is frozen");
}

ClassifierRegistry& ClassifierRegistry::add(SharedClassifier classifier) {
	checkMutable("add");
	if (!classifier) throw std::invalid_argument("ClassifierRegistry::add: null classifier");

	this->classifiers_.push_back(std::move(classifier));
	sort(this->classifiers_);
	return *this;
}

ClassifierRegistry& ClassifierRegistry::replaceAll(ClassifierSequence classifiers) {
	checkMutable("replaceAll");
	if (std::any_of(classifiers.begin(), classifiers.end(), [](const SharedClassifier& c) { return !c; }))
		throw std::invalid_argument("ClassifierRegistry::replaceAll: null classifier");

	this->classifiers_ = std::move(classifiers);
	this->replaced_ = true;
	sort(this->classifiers_);
	return *this;
}

ClassifierSequence ClassifierRegistry::merge(const ClassifierRegistry& lower, const ClassifierRegistry& upper) {
	if (upper.replacesLowerLayers()) return upper.classifiers_;

	ClassifierSequence merged;
	merged.reserve(lower.size() + upper.size());
	merged.insert(merged.end(), lower.classifiers_.begin(), lower.classifiers_.end());
	merged.insert(merged.end(), upper.classifiers_.begin(), upper.classifiers_.end());
	sort(merged);
	return merged;
}

} // namespace http_retry
