#pragma once

#include "Classifier.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace http_retry {

class ConfigFrozen : public std::logic_error {
public:
	using std::logic_error::logic_error;
};

/**
 * Classifiers registered on one configuration layer.
 *
 * Iteration order is always ascending priority, classifiers of equal
 * priority keep the order in which they were registered. Mutable until
 * freeze(), after which add() and replaceAll() throw ConfigFrozen.
 */
class ClassifierRegistry {
public:
	ClassifierRegistry() = default;

	// Append and re-sort. Throws std::invalid_argument on a null classifier.
	ClassifierRegistry& add(SharedClassifier classifier);

	/**
	 * Discard this layer's classifiers and install `classifiers` instead.
	 * The layer then also supersedes every lower layer when merged.
	 */
	ClassifierRegistry& replaceAll(ClassifierSequence classifiers);

	const ClassifierSequence& effectiveSequence() const { return classifiers_; }

	bool replacesLowerLayers() const { return replaced_; }

	void freeze() { frozen_ = true; }
	bool frozen() const { return frozen_; }

	size_t size() const { return classifiers_.size(); }
	bool empty() const { return classifiers_.empty(); }

	/**
	 * Effective sequence of `upper` layered on top of `lower`.
	 * If `upper` performed replaceAll() only its classifiers are used,
	 * otherwise both are combined with `lower` first among equal priorities.
	 */
	static ClassifierSequence merge(const ClassifierRegistry& lower, const ClassifierRegistry& upper);

private:
	void checkMutable(const char* operation) const;
	static void sort(ClassifierSequence& classifiers);

	ClassifierSequence classifiers_;
	bool replaced_ = false;
	bool frozen_ = false;
};

} // namespace http_retry
