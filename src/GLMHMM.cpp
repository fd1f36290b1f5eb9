#include <armadillo>
#include <errors.hpp>
#include <ForwardBackward.hpp>
#include <GLMHMM.hpp>
#include <cmath>
#include <exception>
#include <mlpack/core.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <variance.hpp>
#include <vector>

using namespace arma;
using namespace std;
using json = nlohmann::json;
using mlpack::Log;

namespace glmhmm {

    /**
     * ConvergenceRule implementation.
     */
    ConvergenceRule::ConvergenceRule(int lag, Comparison comparison) :
            lag_(lag), comparison_(comparison) {
        if (lag_ < 1)
            throw GLMHMMError("the convergence lag must be positive");
    }

    bool ConvergenceRule::reached(const vec& lls, int iteration, double tol)
            const {
        switch (comparison_) {
            case Comparison::LaggedImprovement:
                return iteration > lag_ &&
                        lls(iteration - lag_) + tol >= lls(iteration);
            case Comparison::ConsecutiveDelta:
                return iteration > 0 &&
                        fabs(lls(iteration) - lls(iteration - 1)) < tol;
        }
        return false;
    }


    /**
     * GLMHMM implementation.
     */
    GLMHMM::GLMHMM(shared_ptr<AbstractEmission> emission, int nstates) :
            emission_(emission), nstates_(nstates), gaussian_prior_(0.0),
            compute_hessian_(false), parallel_sessions_(false),
            parallel_states_(false) {
        if (!emission_)
            throw GLMHMMError("an emission model is required");
        if (nstates_ < 1)
            throw ShapeMismatchError("the number of states must be positive");
    }

    GLMHMM::GLMHMM(int nstates, int dimension, int nclasses) : GLMHMM(
            make_shared<MultinomialLogitEmission>(dimension, nclasses),
            nstates) {}

    void GLMHMM::setGaussianPrior(double sigma) {
        gaussian_prior_ = sigma;
    }

    void GLMHMM::setComputeHessian(bool compute_hessian) {
        compute_hessian_ = compute_hessian;
    }

    void GLMHMM::setConvergenceRule(const ConvergenceRule& rule) {
        convergence_rule_ = rule;
    }

    void GLMHMM::setParallelSessions(bool parallel) {
        parallel_sessions_ = parallel;
    }

    void GLMHMM::setParallelStates(bool parallel) {
        parallel_states_ = parallel;
    }

    shared_ptr<AbstractEmission> GLMHMM::getEmission() const {
        return emission_;
    }

    GLMHMMParams GLMHMM::generateParams(mt19937& rng,
            const WeightPrior& weights, const TransitionPrior& transitions,
            const StatePrior& states) const {
        GLMHMMParams ret;
        ret.transition = initTransitions(nstates_, transitions, rng);
        ret.weights = initWeights(nstates_, *emission_, weights, rng);
        ret.pi = initStates(nstates_, states, rng);
        return ret;
    }

    ivec GLMHMM::generateData(const mat& transition, const cube& weights,
            int nobs, mt19937& rng, ivec& states, mat& inputs) const {
        checkShapes(ivec(), mat(0, emission_->getDimension()), transition,
                weights, vec());
        uniform_int_distribution<int> first_state(0, nstates_ - 1);
        uniform_int_distribution<int> input_values(-10, 9);
        inputs = mat(nobs, emission_->getDimension());
        inputs.imbue([&]() { return (double) input_values(rng); });
        states = ivec(nobs);
        ivec ret(nobs);
        int z = first_state(rng);
        for(int t = 0; t < nobs; t++) {
            states(t) = z;
            ret(t) = emission_->sampleFromState(inputs.row(t),
                    weights.slice(z), rng);
            z = sampleFromCategorical(transition.row(z), rng);
        }
        return ret;
    }

    void GLMHMM::checkShapes(const ivec& y, const mat& x,
            const mat& transition, const cube& weights, const vec& pi) const {
        int dimension = emission_->getDimension();
        int nclasses = emission_->getNumberClasses();
        if (x.n_rows != y.n_elem)
            throw ShapeMismatchError("x has " + to_string(x.n_rows) +
                    " rows but y has " + to_string(y.n_elem) + " entries");
        if (x.n_cols != dimension)
            throw ShapeMismatchError("x has " + to_string(x.n_cols) +
                    " columns but the input dimension is " +
                    to_string(dimension));
        if (transition.n_rows != nstates_ || transition.n_cols != nstates_)
            throw ShapeMismatchError("transition matrix is " +
                    to_string(transition.n_rows) + " x " +
                    to_string(transition.n_cols) + " for " +
                    to_string(nstates_) + " states");
        if (weights.n_rows != dimension || weights.n_cols != nclasses ||
                weights.n_slices != nstates_)
            throw ShapeMismatchError("weights are " +
                    to_string(weights.n_rows) + " x " +
                    to_string(weights.n_cols) + " x " +
                    to_string(weights.n_slices) + " but expected " +
                    to_string(dimension) + " x " + to_string(nclasses) +
                    " x " + to_string(nstates_));
        if (!pi.is_empty() && pi.n_elem != nstates_)
            throw ShapeMismatchError("initial distribution has " +
                    to_string(pi.n_elem) + " entries for " +
                    to_string(nstates_) + " states");
        if (y.n_elem > 0 && (y.min() < 0 || y.max() >= nclasses))
            throw ShapeMismatchError("observations must lie in [0, " +
                    to_string(nclasses) + ")");
    }

    FitState GLMHMM::initState(const ivec& y, const mat& x,
            const mat& transition, const cube& weights, const vec& pi) const {
        checkShapes(y, x, transition, weights, pi);
        FitState ret;
        ret.transition = transition;
        ret.weights = weights;
        ret.phi = emission_->likelihoodCube(x, weights);
        ret.pi = pi.is_empty() ? vec(ones<vec>(nstates_) / nstates_) : pi;
        return ret;
    }

    Posteriors GLMHMM::eStep(const ivec& y, const FitState& state,
            const uvec& boundaries) const {
        int nobs = y.n_elem;
        uvec sessions = validateSessions(boundaries, nobs);
        int nsessions = sessions.n_elem - 1;
        int nclasses = state.phi.n_slices;
        field<mat> alphas(nsessions), betas(nsessions), gammas(nsessions);
        field<vec> css(nsessions);
        Posteriors ret;
        ret.zetas = field<cube>(nsessions);
        ret.session_llikelihoods = zeros<vec>(nsessions);
        vector<exception_ptr> errors(nsessions);

        // Sessions only share the read-only parameters.
        #pragma omp parallel for schedule(dynamic) if(parallel_sessions_)
        for(int s = 0; s < nsessions; s++) {
            try {
                int first = sessions(s);
                int last = sessions(s + 1) - 1;
                ivec y_s = y.subvec(first, last);
                cube phi_s = state.phi.subcube(first, 0, 0, last,
                        nstates_ - 1, nclasses - 1);
                ret.session_llikelihoods(s) = forwardPass(y_s,
                        state.transition, phi_s, state.pi, alphas(s), css(s));
                backwardPass(y_s, state.transition, phi_s, alphas(s), css(s),
                        betas(s), gammas(s), ret.zetas(s));
            } catch (...) {
                errors[s] = current_exception();
            }
        }
        for(int s = 0; s < nsessions; s++) {
            if (!errors[s])
                continue;
            try {
                rethrow_exception(errors[s]);
            } catch (const exception& e) {
                throw FitError(e.what(), -1, s, -1);
            }
        }

        // Stitching the sessions back into full length arrays.
        ret.alpha = mat(nobs, nstates_);
        ret.beta = mat(nobs, nstates_);
        ret.gamma = mat(nobs, nstates_);
        ret.cs = vec(nobs);
        for(int s = 0; s < nsessions; s++) {
            int first = sessions(s);
            int last = sessions(s + 1) - 1;
            ret.alpha.rows(first, last) = alphas(s);
            ret.beta.rows(first, last) = betas(s);
            ret.gamma.rows(first, last) = gammas(s);
            ret.cs.subvec(first, last) = css(s);
        }
        ret.llikelihood = accu(ret.session_llikelihoods);
        return ret;
    }

    mat GLMHMM::updateTransitions(const field<cube>& zetas,
            const mat& transition) const {
        mat counts(nstates_, nstates_, fill::zeros);
        for(const cube& zeta : zetas) {
            if (zeta.n_slices == 0)
                continue;
            cube session_counts = sum(zeta, 2);
            counts += session_counts.slice(0);
        }
        mat ret(transition);
        for(int i = 0; i < nstates_; i++) {
            double total = accu(counts.row(i));

            // Handling the case when a state is never left.
            if (total > 0)
                ret.row(i) = counts.row(i) / total;
        }
        return ret;
    }

    void GLMHMM::updateObservations(const ivec& y, const mat& x,
            const cube& weights, const mat& gammas, cube& new_weights,
            cube& new_phi) const {
        int nobs = y.n_elem;
        int nclasses = emission_->getNumberClasses();
        mat y_onehot = oneHot(y, nclasses);
        field<mat> w_init(nstates_), fitted_w(nstates_), fitted_phi(nstates_);
        field<vec> sample_weights(nstates_);
        for(int i = 0; i < nstates_; i++) {
            w_init(i) = weights.slice(i);
            sample_weights(i) = gammas.col(i);
        }
        vector<exception_ptr> errors(nstates_);

        // Every state writes only its own slot.
        #pragma omp parallel for schedule(dynamic) if(parallel_states_)
        for(int i = 0; i < nstates_; i++) {
            try {
                pair<mat, mat> fitted = emission_->fitOneState(x, w_init(i),
                        y_onehot, sample_weights(i), gaussian_prior_,
                        compute_hessian_);
                fitted_w(i) = fitted.first;
                fitted_phi(i) = fitted.second;
            } catch (...) {
                errors[i] = current_exception();
            }
        }
        for(int i = 0; i < nstates_; i++) {
            if (!errors[i])
                continue;
            try {
                rethrow_exception(errors[i]);
            } catch (const exception& e) {
                throw FitError(e.what(), -1, -1, i);
            }
        }

        new_weights = cube(size(weights));
        new_phi = cube(nobs, nstates_, nclasses);
        for(int i = 0; i < nstates_; i++) {
            new_weights.slice(i) = fitted_w(i);
            for(int c = 0; c < nclasses; c++)
                new_phi.slice(c).col(i) = fitted_phi(i).col(c);
        }
    }

    vec GLMHMM::updateInitStates(const mat& gammas, const uvec& sessions,
            const vec& pi) const {
        vec ret(nstates_, fill::zeros);
        for(int s = 0; s + 1 < sessions.n_elem; s++)
            ret += gammas.row(sessions(s)).t();
        double total = accu(ret);
        if (!(total > 0))
            return pi;
        return ret / total;
    }

    FitState GLMHMM::mStep(const ivec& y, const mat& x, const FitState& state,
            const Posteriors& posteriors, const mat& gammas,
            const uvec& sessions, bool fit_init_states) const {
        FitState ret;
        ret.transition = updateTransitions(posteriors.zetas,
                state.transition);
        updateObservations(y, x, state.weights, gammas, ret.weights, ret.phi);
        ret.pi = fit_init_states ? updateInitStates(gammas, sessions,
                state.pi) : state.pi;
        return ret;
    }

    FitResult GLMHMM::fit(const ivec& y, const mat& x, const mat& transition,
            const cube& weights, const vec& pi, bool fit_init_states,
            int max_iter, double tol, const uvec& sessions,
            double temperature) const {
        if (max_iter < 1)
            throw GLMHMMError("max_iter must be positive");
        FitState state = initState(y, x, transition, weights, pi);
        uvec sess = validateSessions(sessions, y.n_elem);
        FitResult ret;
        ret.lls = vec(max_iter);
        ret.lls.fill(datum::nan);
        ret.converged = false;
        ret.niter = 0;
        for(int i = 0; i < max_iter && !ret.converged; i++) {
            Posteriors posteriors;
            try {
                posteriors = eStep(y, state, sess);
            } catch (const FitError& e) {
                throw FitError(e.getCause(), i, e.getSession(), -1);
            }
            double current_llikelihood = posteriors.llikelihood;
            ret.lls(i) = current_llikelihood;
            ret.niter = i + 1;
            if (i > 0) {
                double diff = current_llikelihood - ret.lls(i - 1);
                Log::Info << "EM iteration " << i << " marginal "
                        "log-likelihood: " << current_llikelihood <<
                        ". Diff: " << diff << endl;
                if (diff < -tol && temperature == 1.0)
                    Log::Warn << "The log-likelihood decreased probably due "
                            "to numerical errors." << endl;
            } else
                Log::Info << "EM iteration 0 marginal log-likelihood: " <<
                        current_llikelihood << endl;

            // Tempering the posteriors (deterministic annealing).
            mat gammas = (temperature == 1.0) ? posteriors.gamma :
                    mat(pow(posteriors.gamma, temperature));
            try {
                state = mStep(y, x, state, posteriors, gammas, sess,
                        fit_init_states);
            } catch (const FitError& e) {
                throw FitError(e.getCause(), i, -1, e.getState());
            }
            ret.converged = convergence_rule_.reached(ret.lls, i, tol);
        }

        Log::Info << "Stopped because of " << ((ret.converged) ?
                "convergence." : "max iter.") << endl;
        if (!ret.converged)
            Log::Warn << "NonConvergedWarning: EM did not satisfy the "
                    "tolerance " << tol << " within " << max_iter <<
                    " iterations." << endl;
        ret.transition = state.transition;
        ret.weights = state.weights;
        ret.pi = state.pi;
        return ret;
    }

    FitResult GLMHMM::fitAnnealed(const ivec& y, const mat& x,
            const mat& transition, const cube& weights, const vec& pi,
            bool fit_init_states, const vec& temperatures,
            int max_iter_per_step, double tol, const uvec& sessions) const {
        if (temperatures.is_empty())
            throw GLMHMMError("the annealing schedule is empty");
        FitResult ret;
        ret.transition = transition;
        ret.weights = weights;
        ret.pi = pi;
        vector<double> lls;
        for(double temperature : temperatures) {
            Log::Info << "Annealing temperature: " << temperature << endl;
            FitResult step = fit(y, x, ret.transition, ret.weights, ret.pi,
                    fit_init_states, max_iter_per_step, tol, sessions,
                    temperature);
            for(int i = 0; i < step.niter; i++)
                lls.push_back(step.lls(i));
            ret.transition = step.transition;
            ret.weights = step.weights;
            ret.pi = step.pi;
            ret.converged = step.converged;
        }
        ret.lls = conv_to<vec>::from(lls);
        ret.niter = lls.size();
        return ret;
    }

    double GLMHMM::loglikelihood(const ivec& y, const mat& x,
            const mat& transition, const cube& weights, const vec& pi,
            const uvec& sessions) const {
        FitState state = initState(y, x, transition, weights, pi);
        return eStep(y, state, sessions).llikelihood;
    }

    vec GLMHMM::computeVariance(const mat& x, const ivec& y,
            const mat& transition, const cube& weights,
            double gaussian_prior) const {
        checkShapes(y, x, transition, weights, vec());
        return glmhmm::computeVariance(x, y, transition, weights,
                gaussian_prior);
    }

    json GLMHMM::to_stream(const FitResult& result) const {
        json ret;
        ret["nstates"] = nstates_;
        ret["dimension"] = emission_->getDimension();
        ret["nclasses"] = emission_->getNumberClasses();
        ret["initial_pmf"] = conv_to<vector<double>>::from(result.pi);
        ret["converged"] = result.converged;
        ret["niter"] = result.niter;
        ret["lls"] = conv_to<vector<double>>::from(
                result.lls.head(result.niter));

        // Taking care of the serialization of armadillo matrices.
        vector<vector<double>> transition_v;
        for(int i = 0; i < nstates_; i++)
            transition_v.push_back(conv_to<vector<double>>::from(
                    result.transition.row(i)));
        ret["transition"] = transition_v;
        vector<vector<vector<double>>> weights_v;
        for(int i = 0; i < nstates_; i++) {
            vector<vector<double>> state_weights;
            for(int j = 0; j < result.weights.n_rows; j++)
                state_weights.push_back(conv_to<vector<double>>::from(
                        result.weights.slice(i).row(j)));
            weights_v.push_back(state_weights);
        }
        ret["weights"] = weights_v;
        return ret;
    }

};
