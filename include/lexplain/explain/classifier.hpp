#pragma once

/** \file classifier.hpp
 *  \brief Adapter turning a vectorizer plus a probabilistic classifier into a PredictFn.
 *
 * Neither interface is implemented here; callers plug in their own models.
 */

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "lexplain/explain/neighborhood.hpp"

namespace lexplain::explain {

/** \brief Dense feature rows, one per document. */
using FeatureRows = std::vector<std::vector<double>>;

/** \brief Maps raw documents to feature rows. */
class Vectorizer {
public:
    virtual ~Vectorizer() = default;
    virtual auto transform(const std::vector<std::string>& documents) const -> FeatureRows = 0;
};

/** \brief Maps feature rows to class-probability rows. */
class ProbabilisticClassifier {
public:
    virtual ~ProbabilisticClassifier() = default;
    virtual auto predict_proba(const FeatureRows& rows) const -> ProbabilityMatrix = 0;
};

/** \brief predict_proba on raw text: classifier(vectorizer(documents)).
 *
 * Thread-safety: as safe as the wrapped components.
 */
class ClassifierPipeline {
public:
    ClassifierPipeline(std::shared_ptr<const Vectorizer> vectorizer,
                       std::shared_ptr<const ProbabilisticClassifier> classifier)
        : vectorizer_(std::move(vectorizer)), classifier_(std::move(classifier)) {}

    auto predict_proba(const std::vector<std::string>& documents) const -> ProbabilityMatrix {
        return classifier_->predict_proba(vectorizer_->transform(documents));
    }

    /** \brief PredictFn sharing ownership of both components. */
    auto as_predict_fn() const -> PredictFn {
        return [vectorizer = vectorizer_, classifier = classifier_](
                   const std::vector<std::string>& documents) {
            return classifier->predict_proba(vectorizer->transform(documents));
        };
    }

private:
    std::shared_ptr<const Vectorizer> vectorizer_;
    std::shared_ptr<const ProbabilisticClassifier> classifier_;
};

} // namespace lexplain::explain
