#ifndef GLMHMM_H
#define GLMHMM_H

#include <armadillo>
#include <emissions.hpp>
#include <ForwardBackward.hpp>
#include <init_params.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <random>

namespace glmhmm {

    // Parameters of one EM iteration. phi (nobs, nstates, nclasses) caches
    // the emission probabilities induced by weights.
    struct FitState {
        arma::mat transition;
        arma::cube weights;
        arma::cube phi;
        arma::vec pi;
    };

    // E step output stitched over all the sessions of a sequence.
    struct Posteriors {
        arma::mat alpha;
        arma::mat beta;
        arma::vec cs;
        arma::mat gamma;

        // Pairwise posteriors, one cube per session.
        arma::field<arma::cube> zetas;
        arma::vec session_llikelihoods;
        double llikelihood;
    };

    struct FitResult {
        // Log-likelihood of every EM iteration, NaN for the iterations
        // that were not run.
        arma::vec lls;
        arma::mat transition;
        arma::cube weights;
        arma::vec pi;
        bool converged;
        int niter;
    };

    struct GLMHMMParams {
        arma::mat transition;
        arma::cube weights;
        arma::vec pi;
    };

    // Stopping rule of EM. LaggedImprovement stops once
    // lls(i - lag) + tol >= lls(i) for i > lag; ConsecutiveDelta stops once
    // |lls(i) - lls(i - 1)| < tol.
    class ConvergenceRule {
        public:
            enum class Comparison { LaggedImprovement, ConsecutiveDelta };

            ConvergenceRule(int lag = 5, Comparison comparison =
                    Comparison::LaggedImprovement);

            bool reached(const arma::vec& lls, int iteration, double tol)
                    const;

        private:
            int lag_;
            Comparison comparison_;
    };


    class GLMHMM {
        public:
            GLMHMM(std::shared_ptr<AbstractEmission> emission, int nstates);

            // Multinomial logit emissions with the given input dimension
            // and number of categories.
            GLMHMM(int nstates, int dimension, int nclasses);

            // Standard deviation of a zero mean Gaussian prior over the
            // weights. 0 means no prior.
            void setGaussianPrior(double sigma);

            // Refines every per state regression with Newton steps.
            void setComputeHessian(bool compute_hessian);

            void setConvergenceRule(const ConvergenceRule& rule);

            // Runs the E step of the sessions on an OpenMP worker pool.
            void setParallelSessions(bool parallel);

            // Runs the per state regressions on an OpenMP worker pool.
            void setParallelStates(bool parallel);

            std::shared_ptr<AbstractEmission> getEmission() const;

            GLMHMMParams generateParams(std::mt19937& rng,
                    const WeightPrior& weights = WeightPrior::uniform(-1, 1),
                    const TransitionPrior& transitions =
                    TransitionPrior::dirichlet(5, 1),
                    const StatePrior& states = StatePrior::uniform()) const;

            // Samples a sequence of nobs choices. The hidden states and the
            // inputs (integers in [-10, 10)) are returned by reference.
            arma::ivec generateData(const arma::mat& transition,
                    const arma::cube& weights, int nobs, std::mt19937& rng,
                    arma::ivec& states, arma::mat& inputs) const;

            // Fits the model with EM. An empty pi stands for the uniform
            // initial distribution and empty sessions for a single session.
            // temperature < 1 flattens the posteriors (annealed EM).
            FitResult fit(const arma::ivec& y, const arma::mat& x,
                    const arma::mat& transition, const arma::cube& weights,
                    const arma::vec& pi = arma::vec(),
                    bool fit_init_states = false, int max_iter = 250,
                    double tol = 1e-3, const arma::uvec& sessions =
                    arma::uvec(), double temperature = 1.0) const;

            // Runs fit once per temperature of the schedule, each run
            // starting where the previous one stopped.
            FitResult fitAnnealed(const arma::ivec& y, const arma::mat& x,
                    const arma::mat& transition, const arma::cube& weights,
                    const arma::vec& pi, bool fit_init_states,
                    const arma::vec& temperatures, int max_iter_per_step,
                    double tol, const arma::uvec& sessions = arma::uvec())
                    const;

            FitState initState(const arma::ivec& y, const arma::mat& x,
                    const arma::mat& transition, const arma::cube& weights,
                    const arma::vec& pi) const;

            // Forward-backward over every session. Empty sessions stand for
            // a single one.
            Posteriors eStep(const arma::ivec& y, const FitState& state,
                    const arma::uvec& sessions) const;

            // gammas are the (possibly tempered) responsibilities.
            FitState mStep(const arma::ivec& y, const arma::mat& x,
                    const FitState& state, const Posteriors& posteriors,
                    const arma::mat& gammas, const arma::uvec& sessions,
                    bool fit_init_states) const;

            arma::mat updateTransitions(const arma::field<arma::cube>& zetas,
                    const arma::mat& transition) const;

            void updateObservations(const arma::ivec& y, const arma::mat& x,
                    const arma::cube& weights, const arma::mat& gammas,
                    arma::cube& new_weights, arma::cube& new_phi) const;

            arma::vec updateInitStates(const arma::mat& gammas,
                    const arma::uvec& sessions, const arma::vec& pi) const;

            double loglikelihood(const arma::ivec& y, const arma::mat& x,
                    const arma::mat& transition, const arma::cube& weights,
                    const arma::vec& pi = arma::vec(),
                    const arma::uvec& sessions = arma::uvec()) const;

            // Laplace approximation of the standard errors of the
            // unconstrained transition and weight parameters.
            arma::vec computeVariance(const arma::mat& x, const arma::ivec& y,
                    const arma::mat& transition, const arma::cube& weights,
                    double gaussian_prior = 0) const;

            // Returns a json representation of a fit.
            nlohmann::json to_stream(const FitResult& result) const;

        protected:
            void checkShapes(const arma::ivec& y, const arma::mat& x,
                    const arma::mat& transition, const arma::cube& weights,
                    const arma::vec& pi) const;

            std::shared_ptr<AbstractEmission> emission_;
            int nstates_;
            double gaussian_prior_;
            bool compute_hessian_;
            ConvergenceRule convergence_rule_;
            bool parallel_sessions_;
            bool parallel_states_;
    };

};

#endif
