#include "ClassifierChain.hpp"
#include "Logging.hpp"

namespace http_retry {

ClassificationOutcome runClassifiers(const ClassifierSequence& classifiers, const AttemptContext& ctx) {
	auto log = logger();
	ClassificationOutcome result;

	for (const auto& classifier : classifiers) {
		std::optional<ClassificationOutcome> outcome = classifier->classify(ctx, result);
		if (!outcome || outcome->isNoOpinion()) continue;

		if (log->should_log(spdlog::level::trace)) {
			log->trace("classifier '{}' ({}) overrides {} with {}", classifier->name(),
					   classifier->priority().toString(), result.toString(), outcome->toString());
		}
		result = std::move(*outcome);

		if (result.isRetryForbidden()) {
			log->debug("retry forbidden by classifier '{}'", classifier->name());
			return result;
		}
	}

	if (log->should_log(spdlog::level::debug))
		log->debug("classified attempt as {}", result.toString());
	return result;
}

ClassifierChain::ClassifierChain()
	: classifiers_(std::make_shared<const ClassifierSequence>()) {}

ClassifierChain::ClassifierChain(ClassifierSequence sortedClassifiers)
	: classifiers_(std::make_shared<const ClassifierSequence>(std::move(sortedClassifiers))) {}

ClassificationOutcome ClassifierChain::classify(const AttemptContext& ctx) const {
	return runClassifiers(*this->classifiers_, ctx);
}

std::vector<std::string> ClassifierChain::names() const {
	std::vector<std::string> names;
	names.reserve(this->classifiers_->size());
	for (const auto& classifier : *this->classifiers_)
		names.push_back(classifier->name());
	return names;
}

} // namespace http_retry
