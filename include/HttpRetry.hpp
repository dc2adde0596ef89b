#pragma once

#include "ClassificationOutcome.hpp"
#include "Classifier.hpp"
#include "ClassifierChain.hpp"
#include "ClassifierRegistry.hpp"
#include "Classifiers.hpp"
#include "Headers.hpp"
#include "Logging.hpp"
#include "Priority.hpp"
#include "RetryConfig.hpp"
#include "models.hpp"
