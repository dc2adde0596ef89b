#pragma once

#include "ClassificationOutcome.hpp"
#include "Priority.hpp"
#include "models.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace http_retry {

/**
 * A rule that inspects one finished attempt and renders a retry opinion.
 *
 * Implementations must be immutable after construction, must not block and
 * must not throw. A classifier that cannot decide returns nullopt (or
 * NoOpinion), which leaves the running result untouched.
 */
class ClassifyRetry {
public:
	virtual ~ClassifyRetry() = default;

	/**
	 * @param ctx        The finished attempt.
	 * @param preceding  Aggregate outcome of the lower priority classifiers
	 *                   evaluated so far in this run.
	 */
	virtual std::optional<ClassificationOutcome> classify(const AttemptContext& ctx,
	                                                      const ClassificationOutcome& preceding) const = 0;

	// Diagnostics only, never used for ordering or equality
	virtual std::string name() const = 0;

	virtual Priority priority() const { return Priority::defaultPriority(); }
};

using SharedClassifier = std::shared_ptr<const ClassifyRetry>;
using ClassifierSequence = std::vector<SharedClassifier>;

using ClassifyFn = std::function<std::optional<ClassificationOutcome>(const AttemptContext&, const ClassificationOutcome&)>;

/**
 * Classifier backed by a callable, for user rules that do not need a class
 * of their own. The callable must follow the ClassifyRetry contract.
 */
class FnClassifier : public ClassifyRetry {
public:
	FnClassifier(std::string name, Priority priority, ClassifyFn fn);

	std::optional<ClassificationOutcome> classify(const AttemptContext& ctx,
	                                              const ClassificationOutcome& preceding) const override;
	std::string name() const override { return name_; }
	Priority priority() const override { return priority_; }

private:
	std::string name_;
	Priority priority_;
	ClassifyFn fn_;
};

SharedClassifier makeClassifier(std::string name, Priority priority, ClassifyFn fn);
SharedClassifier makeClassifier(std::string name, ClassifyFn fn);

} // namespace http_retry
