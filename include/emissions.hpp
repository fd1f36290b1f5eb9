#ifndef GLMHMM_EMISSIONS_H
#define GLMHMM_EMISSIONS_H

#include <armadillo>
#include <random>
#include <utility>

namespace glmhmm {

    int sampleFromCategorical(const arma::rowvec& pmf, std::mt19937& rng);

    // Converts integer observations into an (nobs, nclasses) indicator
    // matrix.
    arma::mat oneHot(const arma::ivec& y, int nclasses);

    // Emission model of a GLM-HMM. Each hidden state owns a (dimension,
    // nclasses) weight matrix and the emission distribution at time t is a
    // deterministic function of the input x_t and those weights.
    class AbstractEmission {
        public:
            AbstractEmission(int dimension, int nclasses);

            virtual ~AbstractEmission() = default;

            int getDimension() const;

            int getNumberClasses() const;

            // Probability of every category for a single input row.
            virtual arma::rowvec compObs(const arma::rowvec& x,
                    const arma::mat& w) const = 0;

            // Same as compObs for every row of x. Returns (nobs, nclasses).
            virtual arma::mat compObsAll(const arma::mat& x,
                    const arma::mat& w) const;

            // Weighted maximum likelihood fit of one state's weights.
            // sample_weights are the posterior responsibilities of the
            // state, gaussian_prior the std. dev. of an optional zero mean
            // Gaussian prior over the weights (<= 0 means no prior).
            // Returns the updated weights and the (nobs, nclasses) emission
            // probabilities they induce.
            virtual std::pair<arma::mat, arma::mat> fitOneState(
                    const arma::mat& x, const arma::mat& w_init,
                    const arma::mat& y_onehot,
                    const arma::vec& sample_weights, double gaussian_prior,
                    bool compute_hessian) const = 0;

            // Returns a cube of dimensions (nobs, nstates, nclasses) where
            // entry (t, i, c) is the probability of category c at time t
            // under state i. weights has one slice per state.
            arma::cube likelihoodCube(const arma::mat& x,
                    const arma::cube& weights) const;

            int sampleFromState(const arma::rowvec& x, const arma::mat& w,
                    std::mt19937& rng) const;

        protected:
            void checkWeights(const arma::mat& w) const;

        private:
            int dimension_;
            int nclasses_;
    };


    // Multinomial logistic (softmax) link. The last category is the
    // reference one: its weight column is held fixed while fitting. With
    // two categories this is the Bernoulli/logistic GLM.
    class MultinomialLogitEmission : public AbstractEmission {
        public:
            MultinomialLogitEmission(int dimension, int nclasses);

            arma::rowvec compObs(const arma::rowvec& x,
                    const arma::mat& w) const;

            arma::mat compObsAll(const arma::mat& x, const arma::mat& w) const;

            std::pair<arma::mat, arma::mat> fitOneState(const arma::mat& x,
                    const arma::mat& w_init, const arma::mat& y_onehot,
                    const arma::vec& sample_weights, double gaussian_prior,
                    bool compute_hessian) const;

            // 0 means no limit.
            void setMaxIterations(int max_iterations);

            // 0 disables the Newton refinement.

            void setMaxNewtonSteps(int max_newton_steps);

        private:
            int max_iterations_;
            int max_newton_steps_;
    };

};

#endif
