#include <algorithm>
#include <armadillo>
#include <emissions.hpp>
#include <ensmallen.hpp>
#include <errors.hpp>
#include <ForwardBackward.hpp>
#include <GLM.hpp>
#include <cmath>
#include <string>

#define MIN_TOTAL_WEIGHT 1e-10

using namespace arma;
using namespace std;

namespace glmhmm {

    int sampleFromCategorical(const rowvec& pmf, mt19937& rng) {
        rowvec prefixsum(pmf);
        for(int i = 1; i < pmf.n_elem; i++)
            prefixsum(i) += prefixsum(i - 1);
        uniform_real_distribution<double> unif(0.0, prefixsum(pmf.n_elem - 1));
        int ret = lower_bound(prefixsum.begin(), prefixsum.end(), unif(rng)) -
                prefixsum.begin();
        return min(ret, (int) pmf.n_elem - 1);
    }

    mat oneHot(const ivec& y, int nclasses) {
        mat ret(y.n_elem, nclasses, fill::zeros);
        for(int t = 0; t < y.n_elem; t++) {
            if (y(t) < 0 || y(t) >= nclasses)
                throw ShapeMismatchError("observation " + to_string(y(t)) +
                        " at t = " + to_string(t) + " is not in [0, " +
                        to_string(nclasses) + ")");
            ret(t, y(t)) = 1.0;
        }
        return ret;
    }


    /**
     * Abstract emission implementation.
     */
    AbstractEmission::AbstractEmission(int dimension, int nclasses) :
            dimension_(dimension), nclasses_(nclasses) {
        if (dimension_ < 1)
            throw ShapeMismatchError("the input dimension must be positive");
        if (nclasses_ < 2)
            throw ShapeMismatchError("at least two categories are required");
    }

    int AbstractEmission::getDimension() const {
        return dimension_;
    }

    int AbstractEmission::getNumberClasses() const {
        return nclasses_;
    }

    void AbstractEmission::checkWeights(const mat& w) const {
        if (w.n_rows != dimension_ || w.n_cols != nclasses_)
            throw ShapeMismatchError("state weights are " +
                    to_string(w.n_rows) + " x " + to_string(w.n_cols) +
                    " but expected " + to_string(dimension_) + " x " +
                    to_string(nclasses_));
    }

    mat AbstractEmission::compObsAll(const mat& x, const mat& w) const {
        mat ret(x.n_rows, nclasses_);
        for(int t = 0; t < x.n_rows; t++)
            ret.row(t) = compObs(x.row(t), w);
        return ret;
    }

    cube AbstractEmission::likelihoodCube(const mat& x, const cube& weights)
            const {
        if (x.n_cols != dimension_)
            throw ShapeMismatchError("inputs have " + to_string(x.n_cols) +
                    " columns but the emission dimension is " +
                    to_string(dimension_));
        int nstates = weights.n_slices;
        cube phi(x.n_rows, nstates, nclasses_);
        for(int i = 0; i < nstates; i++) {
            mat p = compObsAll(x, weights.slice(i));
            for(int c = 0; c < nclasses_; c++)
                phi.slice(c).col(i) = p.col(c);
        }
        return phi;
    }

    int AbstractEmission::sampleFromState(const rowvec& x, const mat& w,
            mt19937& rng) const {
        return sampleFromCategorical(compObs(x, w), rng);
    }


    /**
     * MultinomialLogitEmission implementation.
     */
    MultinomialLogitEmission::MultinomialLogitEmission(int dimension,
            int nclasses) : AbstractEmission(dimension, nclasses),
            max_iterations_(1000), max_newton_steps_(20) {}

    rowvec MultinomialLogitEmission::compObs(const rowvec& x, const mat& w)
            const {
        checkWeights(w);
        vec logits = (x * w).t();
        return exp(logits - logsumexp(logits)).t();
    }

    mat MultinomialLogitEmission::compObsAll(const mat& x, const mat& w)
            const {
        checkWeights(w);
        mat ret = x * w;
        ret.each_col() -= max(ret, 1);
        ret = exp(ret);
        ret.each_col() /= sum(ret, 1);
        return ret;
    }

    pair<mat, mat> MultinomialLogitEmission::fitOneState(const mat& x,
            const mat& w_init, const mat& y_onehot, const vec& sample_weights,
            double gaussian_prior, bool compute_hessian) const {
        checkWeights(w_init);
        int nclasses = getNumberClasses();
        if (x.n_cols != getDimension() || y_onehot.n_cols != nclasses)
            throw ShapeMismatchError("regression inputs or outputs do not "
                    "match the emission model");

        // A state without posterior mass keeps its weights.
        if (accu(sample_weights) < MIN_TOTAL_WEIGHT)
            return make_pair(w_init, compObsAll(x, w_init));

        WeightedSoftmaxRegressionFunction f(x, y_onehot, sample_weights,
                w_init.col(nclasses - 1), gaussian_prior);
        mat coordinates = w_init.cols(0, nclasses - 2);
        ens::L_BFGS lbfgs;
        lbfgs.MaxIterations() = max_iterations_;
        lbfgs.Optimize(f, coordinates);

        // Refining the L-BFGS solution with damped Newton steps.
        for(int i = 0; compute_hessian && i < max_newton_steps_; i++) {
            mat gradient;
            double current = f.EvaluateWithGradient(coordinates, gradient);
            if (norm(vectorise(gradient)) < 1e-8)
                break;
            vec step;
            if (!solve(step, f.Hessian(coordinates), vectorise(gradient)))
                break;
            double step_size = 1.0;
            bool improved = false;
            mat candidate;
            while (step_size > 1e-8 && !improved) {
                candidate = coordinates - step_size * reshape(step,
                        size(coordinates));
                improved = f.Evaluate(candidate) < current;
                step_size *= 0.5;
            }
            if (!improved)
                break;
            coordinates = candidate;
        }

        if (!coordinates.is_finite())
            throw GLMHMMError("the weighted regression diverged");
        return make_pair(f.FullWeights(coordinates),
                f.Probabilities(coordinates));
    }

    void MultinomialLogitEmission::setMaxIterations(int max_iterations) {
        if (max_iterations < 0)
            throw GLMHMMError("negative number of L-BFGS iterations");
        max_iterations_ = max_iterations;
    }

    void MultinomialLogitEmission::setMaxNewtonSteps(int max_newton_steps) {
        if (max_newton_steps < 0)
            throw GLMHMMError("negative number of Newton steps");
        max_newton_steps_ = max_newton_steps;
    }

};
