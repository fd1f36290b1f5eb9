#include <errors.hpp>
#include <init_params.hpp>
#include <string>
#include <utility>

using namespace arma;
using namespace std;

namespace glmhmm {

    TransitionPrior TransitionPrior::uniform() {
        TransitionPrior ret;
        ret.kind = Kind::Uniform;
        ret.dirichlet_params = {0.0, 1.0};
        return ret;
    }

    TransitionPrior TransitionPrior::dirichlet(double alpha_diag,
            double alpha_full) {
        if (alpha_full <= 0 || alpha_diag < 0)
            throw InvalidDistributionError("Dirichlet concentrations must be "
                    "positive");
        TransitionPrior ret;
        ret.kind = Kind::Dirichlet;
        ret.dirichlet_params = {alpha_diag, alpha_full};
        return ret;
    }

    WeightPrior WeightPrior::uniform(double low, double high) {
        if (!(low < high))
            throw InvalidDistributionError("uniform weights need low < high");
        WeightPrior ret;
        ret.kind = Kind::Uniform;
        ret.uniform_params = {low, high};
        return ret;
    }

    WeightPrior WeightPrior::normal(double mean, double stddev) {
        if (stddev < 0)
            throw InvalidDistributionError("negative standard deviation");
        WeightPrior ret;
        ret.kind = Kind::Normal;
        ret.normal_params = {mean, stddev};
        return ret;
    }

    WeightPrior WeightPrior::glmNoise(const mat& inputs, const ivec& outputs,
            double stddev) {
        if (stddev < 0)
            throw InvalidDistributionError("negative standard deviation");
        if (inputs.n_rows != outputs.n_elem)
            throw ShapeMismatchError("GLM inputs and outputs differ in "
                    "length");
        WeightPrior ret;
        ret.kind = Kind::GLMNoise;
        ret.glm_noise_params.inputs = inputs;
        ret.glm_noise_params.outputs = outputs;
        ret.glm_noise_params.stddev = stddev;
        return ret;
    }

    StatePrior StatePrior::uniform() {
        StatePrior ret;
        ret.kind = Kind::Uniform;
        ret.alpha = 1.0;
        return ret;
    }

    StatePrior StatePrior::dirichlet(double alpha) {
        if (alpha <= 0)
            throw InvalidDistributionError("Dirichlet concentration must be "
                    "positive");
        StatePrior ret;
        ret.kind = Kind::Dirichlet;
        ret.alpha = alpha;
        return ret;
    }

    vec sampleDirichlet(const vec& alphas, mt19937& rng) {
        vec ret(alphas.n_elem);
        for(int i = 0; i < alphas.n_elem; i++) {
            gamma_distribution<double> g(alphas(i), 1.0);
            ret(i) = g(rng);
        }
        double total = accu(ret);

        // All the draws can underflow for tiny concentrations.
        if (total <= 0)
            return ones<vec>(alphas.n_elem) / alphas.n_elem;
        return ret / total;
    }

    mat initTransitions(int nstates, const TransitionPrior& prior,
            mt19937& rng) {
        switch (prior.kind) {
            case TransitionPrior::Kind::Uniform:
                return ones<mat>(nstates, nstates) / nstates;
            case TransitionPrior::Kind::Dirichlet: {
                mat ret(nstates, nstates);
                for(int i = 0; i < nstates; i++) {
                    vec alphas(nstates);
                    alphas.fill(prior.dirichlet_params.alpha_full);
                    alphas(i) += prior.dirichlet_params.alpha_diag;
                    ret.row(i) = sampleDirichlet(alphas, rng).t();
                }
                return ret;
            }
        }
        throw InvalidDistributionError("unknown transition prior tag " +
                to_string(static_cast<int>(prior.kind)));
    }

    cube initWeights(int nstates, const AbstractEmission& emission,
            const WeightPrior& prior, mt19937& rng) {
        int dimension = emission.getDimension();
        int nclasses = emission.getNumberClasses();
        cube ret(dimension, nclasses, nstates, fill::zeros);
        switch (prior.kind) {
            case WeightPrior::Kind::Uniform: {
                uniform_real_distribution<double> unif(
                        prior.uniform_params.low, prior.uniform_params.high);
                for(int i = 0; i < nstates; i++)
                    for(int c = 0; c < nclasses - 1; c++)
                        for(int j = 0; j < dimension; j++)
                            ret(j, c, i) = unif(rng);
                return ret;
            }
            case WeightPrior::Kind::Normal: {
                const WeightPrior::NormalParams& params = prior.normal_params;
                normal_distribution<double> normal(params.mean,
                        params.stddev > 0 ? params.stddev : 1.0);
                for(int i = 0; i < nstates; i++)
                    for(int c = 0; c < nclasses - 1; c++)
                        for(int j = 0; j < dimension; j++)
                            ret(j, c, i) = (params.stddev > 0) ?
                                    normal(rng) : params.mean;
                return ret;
            }
            case WeightPrior::Kind::GLMNoise: {
                const WeightPrior::GLMNoiseParams& params =
                        prior.glm_noise_params;
                mat y_onehot = oneHot(params.outputs, nclasses);
                vec unit_weights = ones<vec>(params.inputs.n_rows);
                mat w_init(dimension, nclasses, fill::zeros);
                pair<mat, mat> glm = emission.fitOneState(params.inputs,
                        w_init, y_onehot, unit_weights, 0.0, false);
                normal_distribution<double> noise(0.0,
                        params.stddev > 0 ? params.stddev : 1.0);
                for(int i = 0; i < nstates; i++) {
                    ret.slice(i) = glm.first;
                    if (params.stddev == 0)
                        continue;
                    for(int c = 0; c < nclasses - 1; c++)
                        for(int j = 0; j < dimension; j++)
                            ret(j, c, i) += noise(rng);
                }
                return ret;
            }
        }
        throw InvalidDistributionError("unknown weight prior tag " +
                to_string(static_cast<int>(prior.kind)));
    }

    vec initStates(int nstates, const StatePrior& prior, mt19937& rng) {
        switch (prior.kind) {
            case StatePrior::Kind::Uniform:
                return ones<vec>(nstates) / nstates;
            case StatePrior::Kind::Dirichlet:
                return sampleDirichlet(ones<vec>(nstates) * prior.alpha, rng);
        }
        throw InvalidDistributionError("unknown state prior tag " +
                to_string(static_cast<int>(prior.kind)));
    }

};
