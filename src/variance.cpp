#include <errors.hpp>
#include <ForwardBackward.hpp>
#include <mlpack/core.hpp>
#include <Eigen/Core>
#include <unsupported/Eigen/AutoDiff>
#include <variance.hpp>
#include <string>

#define MIN_RCOND 1e-12

using namespace arma;
using namespace std;

namespace glmhmm {

    // First order scalar; its value and gradient are themselves
    // differentiated by the outer scalar to get second derivatives.
    typedef Eigen::AutoDiffScalar<Eigen::VectorXd> GradientScalar;
    typedef Eigen::Matrix<GradientScalar, Eigen::Dynamic, 1> GradientVector;
    typedef Eigen::AutoDiffScalar<GradientVector> HessianScalar;

    template<>
    struct ParamTraits<HessianScalar> {
        static HessianScalar constant(double value, int nparams) {
            GradientVector derivatives(nparams);
            for(int i = 0; i < nparams; i++)
                derivatives(i) = GradientScalar(0.0,
                        Eigen::VectorXd::Zero(nparams));
            return HessianScalar(GradientScalar(value,
                    Eigen::VectorXd::Zero(nparams)), derivatives);
        }

        static double value(const HessianScalar& s) {
            return s.value().value();
        }
    };

    LaplaceProblem::LaplaceProblem(const mat& x, const ivec& y,
            const cube& weights, const vec& pi, const uvec& sessions,
            double gaussian_prior) : nstates(weights.n_slices),
            dimension(weights.n_rows), nclasses(weights.n_cols), x(x), y(y),
            gaussian_prior(gaussian_prior) {
        if (x.n_rows != y.n_elem)
            throw ShapeMismatchError("x has " + to_string(x.n_rows) +
                    " rows but y has " + to_string(y.n_elem) + " entries");
        if (x.n_cols != dimension)
            throw ShapeMismatchError("x has " + to_string(x.n_cols) +
                    " columns but the weights expect " +
                    to_string(dimension));
        if (nclasses < 2)
            throw ShapeMismatchError("at least two categories are required");
        if (y.n_elem > 0 && (y.min() < 0 || y.max() >= nclasses))
            throw ShapeMismatchError("observations must lie in [0, " +
                    to_string(nclasses) + ")");
        this->sessions = validateSessions(sessions, y.n_elem);
        if (pi.is_empty())
            this->pi = ones<vec>(nstates) / nstates;
        else if (pi.n_elem != nstates)
            throw ShapeMismatchError("initial distribution has " +
                    to_string(pi.n_elem) + " entries for " +
                    to_string(nstates) + " states");
        else
            this->pi = pi;
        reference_logits = mat(x.n_rows, nstates);
        for(int i = 0; i < nstates; i++)
            reference_logits.col(i) = x * weights.slice(i).col(nclasses - 1);
    }

    int numberFreeParams(int nstates, int dimension, int nclasses) {
        return nstates * (nstates - 1) + nstates * dimension * (nclasses - 1);
    }

    vec flattenParams(const mat& transition, const cube& weights) {
        int nstates = transition.n_rows;
        int dimension = weights.n_rows;
        int nclasses = weights.n_cols;
        if (transition.n_cols != nstates || weights.n_slices != nstates)
            throw ShapeMismatchError("transition matrix and weights disagree "
                    "on the number of states");
        vec ret(numberFreeParams(nstates, dimension, nclasses));
        int idx = 0;
        for(int i = 0; i < nstates; i++)
            for(int j = 0; j < nstates - 1; j++)
                ret(idx++) = transition(i, j);
        for(int i = 0; i < nstates; i++)
            for(int a = 0; a < dimension; a++)
                for(int c = 0; c < nclasses - 1; c++)
                    ret(idx++) = weights(a, c, i);
        return ret;
    }

    mat computeHessian(const LaplaceProblem& problem, const vec& params) {
        int nparams = params.n_elem;
        vector<HessianScalar> ad_params;
        for(int i = 0; i < nparams; i++) {
            GradientVector derivatives(nparams);
            for(int j = 0; j < nparams; j++)
                derivatives(j) = GradientScalar(i == j ? 1.0 : 0.0,
                        Eigen::VectorXd::Zero(nparams));
            ad_params.push_back(HessianScalar(GradientScalar(params(i),
                    Eigen::VectorXd::Unit(nparams, i)), derivatives));
        }
        HessianScalar f = negativeLogLikelihood(ad_params, problem);
        mat ret(nparams, nparams);
        for(int i = 0; i < nparams; i++)
            for(int j = 0; j < nparams; j++)
                ret(i, j) = f.derivatives()(i).derivatives()(j);

        // Symmetrizing away rounding differences.
        return 0.5 * (ret + ret.t());
    }

    vec computeVariance(const mat& x, const ivec& y, const mat& transition,
            const cube& weights, double gaussian_prior) {
        return computeVariance(x, y, transition, weights, vec(), uvec(),
                gaussian_prior);
    }

    vec computeVariance(const mat& x, const ivec& y, const mat& transition,
            const cube& weights, const vec& pi, const uvec& sessions,
            double gaussian_prior) {
        LaplaceProblem problem(x, y, weights, pi, sessions, gaussian_prior);
        vec params = flattenParams(transition, weights);
        mat hessian = computeHessian(problem, params);
        if (!hessian.is_finite())
            throw SingularHessianError("the Hessian has non finite entries");
        double reciprocal_condition = rcond(hessian);
        if (!(reciprocal_condition >= MIN_RCOND))
            throw SingularHessianError("reciprocal condition number " +
                    to_string(reciprocal_condition) + " for " +
                    to_string(params.n_elem) + " parameters and " +
                    to_string(y.n_elem) + " observations");
        mat covariance;
        if (!inv(covariance, hessian))
            throw SingularHessianError("inversion failed");
        vec variances = covariance.diag();
        if (any(variances < 0))
            mlpack::Log::Warn << "Negative variances in the Laplace "
                    "approximation: the parameters are not at a maximum of "
                    "the likelihood." << endl;
        return sqrt(variances);
    }

};
