#ifndef GLMHMM_INIT_PARAMS_H
#define GLMHMM_INIT_PARAMS_H

#include <armadillo>
#include <emissions.hpp>
#include <random>

namespace glmhmm {

    // Distribution of the rows of a transition matrix.
    struct TransitionPrior {
        enum class Kind { Uniform, Dirichlet };

        // Row i ~ Dirichlet(alpha_full + alpha_diag * e_i).
        struct DirichletParams {
            double alpha_diag;
            double alpha_full;
        };

        static TransitionPrior uniform();

        static TransitionPrior dirichlet(double alpha_diag = 5,
                double alpha_full = 1);

        Kind kind;
        DirichletParams dirichlet_params;
    };

    // Distribution of the regression weights. The weight column of the
    // reference (last) category is always zero.
    struct WeightPrior {
        enum class Kind { Uniform, Normal, GLMNoise };

        struct UniformParams {
            double low;
            double high;
        };

        struct NormalParams {
            double mean;
            double stddev;
        };

        // A single GLM is fitted to (inputs, outputs) and every state gets
        // its weights plus independent Gaussian noise.
        struct GLMNoiseParams {
            arma::mat inputs;
            arma::ivec outputs;
            double stddev;
        };

        static WeightPrior uniform(double low = -1, double high = 1);

        static WeightPrior normal(double mean, double stddev);

        static WeightPrior glmNoise(const arma::mat& inputs,
                const arma::ivec& outputs, double stddev);

        Kind kind;
        UniformParams uniform_params;
        NormalParams normal_params;
        GLMNoiseParams glm_noise_params;
    };

    // Distribution of the initial state.
    struct StatePrior {
        enum class Kind { Uniform, Dirichlet };

        static StatePrior uniform();

        static StatePrior dirichlet(double alpha);

        Kind kind;
        double alpha;
    };

    arma::mat initTransitions(int nstates, const TransitionPrior& prior,
            std::mt19937& rng);

    // Returns a (dimension, nclasses, nstates) cube.
    arma::cube initWeights(int nstates, const AbstractEmission& emission,
            const WeightPrior& prior, std::mt19937& rng);

    arma::vec initStates(int nstates, const StatePrior& prior,
            std::mt19937& rng);

    arma::vec sampleDirichlet(const arma::vec& alphas, std::mt19937& rng);

};

#endif
