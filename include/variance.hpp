#ifndef GLMHMM_VARIANCE_H
#define GLMHMM_VARIANCE_H

#include <armadillo>
#include <algorithm>
#include <cmath>
#include <vector>

namespace glmhmm {

    // Data and fixed quantities of the likelihood differentiated by the
    // Laplace approximation.
    struct LaplaceProblem {
        LaplaceProblem(const arma::mat& x, const arma::ivec& y,
                const arma::cube& weights, const arma::vec& pi,
                const arma::uvec& sessions, double gaussian_prior);

        int nstates;
        int dimension;
        int nclasses;
        arma::mat x;
        arma::ivec y;

        // Logits of the reference category, (nobs, nstates).
        arma::mat reference_logits;
        arma::vec pi;
        arma::uvec sessions;
        double gaussian_prior;
    };

    // Builds the values the differentiable likelihood needs from doubles.
    // Specialized for the automatic differentiation scalar.
    template<typename Scalar>
    struct ParamTraits {
        static Scalar constant(double value, int nparams) {
            return Scalar(value);
        }

        static double value(const Scalar& s) {
            return s;
        }
    };

    // Number of unconstrained parameters: k (k - 1) transition entries and
    // k d (c - 1) weights.
    int numberFreeParams(int nstates, int dimension, int nclasses);

    // Flattens the first nstates - 1 columns of the transition matrix (row
    // major) followed by the weights of the first nclasses - 1 categories
    // (state, input dimension, category; category varies fastest).
    arma::vec flattenParams(const arma::mat& transition,
            const arma::cube& weights);

    // Negative log-likelihood of a GLM-HMM as a function of the flattened
    // parameters, plus sum(w^2) / (2 gaussian_prior^2) when gaussian_prior
    // is positive. Pure function with no branching on parameter values.
    template<typename Scalar>
    Scalar negativeLogLikelihood(const std::vector<Scalar>& params,
            const LaplaceProblem& problem) {
        using std::exp;
        using std::log;
        typedef ParamTraits<Scalar> traits;
        const int nparams = params.size();
        const int k = problem.nstates;
        const int d = problem.dimension;
        const int c = problem.nclasses;

        // Transition matrix. The last column closes every row to one.
        std::vector<std::vector<Scalar>> transition(k);
        for(int i = 0; i < k; i++) {
            Scalar row_sum = traits::constant(0.0, nparams);
            for(int j = 0; j < k - 1; j++) {
                transition[i].push_back(params[i * (k - 1) + j]);
                row_sum = row_sum + params[i * (k - 1) + j];
            }
            transition[i].push_back(traits::constant(1.0, nparams) - row_sum);
        }
        const int offset = k * (k - 1);

        Scalar ret = traits::constant(0.0, nparams);
        std::vector<Scalar> alpha(k, traits::constant(0.0, nparams));
        std::vector<Scalar> joint(k, traits::constant(0.0, nparams));
        std::vector<Scalar> logits(c, traits::constant(0.0, nparams));
        for(int s = 0; s + 1 < problem.sessions.n_elem; s++) {
            const int first = problem.sessions(s);
            const int last = problem.sessions(s + 1);
            for(int t = first; t < last; t++) {
                const int yt = problem.y(t);
                for(int i = 0; i < k; i++) {
                    for(int j = 0; j < c - 1; j++) {
                        Scalar logit = traits::constant(0.0, nparams);
                        for(int a = 0; a < d; a++) {
                            Scalar xa = traits::constant(problem.x(t, a),
                                    nparams);
                            logit = logit + xa * params[offset +
                                    (i * d + a) * (c - 1) + j];
                        }
                        logits[j] = logit;
                    }
                    logits[c - 1] = traits::constant(
                            problem.reference_logits(t, i), nparams);

                    // Softmax shifted by a constant for stability.
                    double shift = traits::value(logits[0]);
                    for(int j = 1; j < c; j++)
                        shift = std::max(shift, traits::value(logits[j]));
                    Scalar norm = traits::constant(0.0, nparams);
                    for(int j = 0; j < c; j++)
                        norm = norm + exp(logits[j] -
                                traits::constant(shift, nparams));
                    Scalar emission = exp(logits[yt] -
                            traits::constant(shift, nparams)) / norm;

                    if (t == first)
                        joint[i] = emission * traits::constant(
                                problem.pi(i), nparams);
                    else {
                        Scalar predictive = traits::constant(0.0, nparams);
                        for(int h = 0; h < k; h++)
                            predictive = predictive +
                                    alpha[h] * transition[h][i];
                        joint[i] = emission * predictive;
                    }
                }
                Scalar cs = traits::constant(0.0, nparams);
                for(int i = 0; i < k; i++)
                    cs = cs + joint[i];
                for(int i = 0; i < k; i++)
                    alpha[i] = joint[i] / cs;
                ret = ret - log(cs);
            }
        }

        if (problem.gaussian_prior > 0) {
            Scalar squares = traits::constant(0.0, nparams);
            for(int p = offset; p < nparams; p++)
                squares = squares + params[p] * params[p];
            double scale = 1.0 / (2 * problem.gaussian_prior *
                    problem.gaussian_prior);
            ret = ret + traits::constant(scale, nparams) * squares;
        }
        return ret;
    }

    // Hessian of negativeLogLikelihood at params by nested forward mode
    // automatic differentiation.
    arma::mat computeHessian(const LaplaceProblem& problem,
            const arma::vec& params);

    // Laplace approximation of the standard errors of the fitted
    // parameters, in the order given by flattenParams. Throws
    // SingularHessianError when the Hessian cannot be inverted.
    arma::vec computeVariance(const arma::mat& x, const arma::ivec& y,
            const arma::mat& transition, const arma::cube& weights,
            double gaussian_prior = 0);

    // As above with an explicit initial distribution (empty for uniform)
    // and session boundaries (empty for a single session).
    arma::vec computeVariance(const arma::mat& x, const arma::ivec& y,
            const arma::mat& transition, const arma::cube& weights,
            const arma::vec& pi, const arma::uvec& sessions,
            double gaussian_prior);

};

#endif
