#include "Classifier.hpp"

#include <stdexcept>

namespace http_retry {

FnClassifier::FnClassifier(std::string name, Priority priority, ClassifyFn fn)
	: name_(std::move(name)), priority_(std::move(priority)), fn_(std::move(fn)) {
	if (!this->fn_) throw std::invalid_argument("FnClassifier: '" + this->name_ + "' has no classify function");
}

std::optional<ClassificationOutcome> FnClassifier::classify(const AttemptContext& ctx,
                                                            const ClassificationOutcome& preceding) const {
	return this->fn_(ctx, preceding);
}

SharedClassifier makeClassifier(std::string name, Priority priority, ClassifyFn fn) {
	return std::make_shared<FnClassifier>(std::move(name), std::move(priority), std::move(fn));
}

SharedClassifier makeClassifier(std::string name, ClassifyFn fn) {
	return makeClassifier(std::move(name), Priority::defaultPriority(), std::move(fn));
}

} // namespace http_retry
