#ifndef GLMHMM_GLM_H
#define GLMHMM_GLM_H

#include <armadillo>

namespace glmhmm {

    // Negative weighted log-likelihood of a multinomial logistic regression
    // in the form expected by the ensmallen optimizers. The coordinates are
    // the (dimension, nclasses - 1) free weight columns; the logits of the
    // last category are x * reference_weights and stay fixed.
    class WeightedSoftmaxRegressionFunction {
        public:
            WeightedSoftmaxRegressionFunction(const arma::mat& x,
                    const arma::mat& y_onehot, const arma::vec& sample_weights,
                    const arma::vec& reference_weights,
                    double gaussian_prior);

            double Evaluate(const arma::mat& coordinates) const;

            void Gradient(const arma::mat& coordinates,
                    arma::mat& gradient) const;

            double EvaluateWithGradient(const arma::mat& coordinates,
                    arma::mat& gradient) const;

            // Hessian w.r.t. vectorise(coordinates) (column major).
            arma::mat Hessian(const arma::mat& coordinates) const;

            // Category probabilities (nobs, nclasses) for the given
            // coordinates.
            arma::mat Probabilities(const arma::mat& coordinates) const;

            // Appends the fixed reference column to the coordinates.
            arma::mat FullWeights(const arma::mat& coordinates) const;

        private:
            arma::mat logits(const arma::mat& coordinates) const;

            const arma::mat& x_;
            const arma::mat& y_onehot_;
            const arma::vec& sample_weights_;
            arma::vec reference_weights_;
            arma::vec reference_logits_;

            // Precision of the Gaussian prior (0 when there is no prior).
            double prior_precision_;
    };

};

#endif
