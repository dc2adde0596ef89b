#pragma once

#include "Classifier.hpp"

#include <memory>
#include <string>
#include <vector>

namespace http_retry {

/**
 * Walk `classifiers` (ascending priority) over one attempt.
 *
 * Each non-abstaining opinion overwrites the running result, so the highest
 * priority classifier with an opinion wins. RetryForbidden stops the walk
 * immediately. Returns NoOpinion if every classifier abstains.
 */
ClassificationOutcome runClassifiers(const ClassifierSequence& classifiers, const AttemptContext& ctx);

/**
 * Frozen, priority-sorted classifier sequence for a client or a call.
 * Cheap to copy and safe to share between threads.
 */
class ClassifierChain {
public:
	// Empty chain, classifies everything as NoOpinion
	ClassifierChain();
	explicit ClassifierChain(ClassifierSequence sortedClassifiers);

	ClassificationOutcome classify(const AttemptContext& ctx) const;

	const ClassifierSequence& classifiers() const { return *classifiers_; }
	size_t size() const { return classifiers_->size(); }
	bool empty() const { return classifiers_->empty(); }

	// Classifier names in evaluation order
	std::vector<std::string> names() const;

private:
	std::shared_ptr<const ClassifierSequence> classifiers_;
};

} // namespace http_retry
