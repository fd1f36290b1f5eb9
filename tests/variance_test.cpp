#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE Variance
#include <boost/test/unit_test.hpp>
#include <errors.hpp>
#include <GLMHMM.hpp>
#include <variance.hpp>
#include <cmath>
#include <random>
#include <vector>

#define EPSILON 1e-9

using namespace arma;
using namespace glmhmm;
using namespace std;

mat transition = {{0.85, 0.15},
                  {0.25, 0.75}};

cube buildWeights() {
    cube w(2, 3, 2, fill::zeros);
    w.slice(0) = {{0.6, -0.4, 0.0}, {0.2, 0.3, 0.0}};
    w.slice(1) = {{-0.5, 0.3, 0.0}, {-0.1, 0.4, 0.0}};
    return w;
}

void sampleData(const GLMHMM& model, int nobs, unsigned int seed, mat& x,
        ivec& y) {
    mt19937 rng(seed);
    ivec states;
    y = model.generateData(transition, buildWeights(), nobs, rng, states, x);
}

double evaluate(const vec& params, const LaplaceProblem& problem) {
    vector<double> p = conv_to<vector<double>>::from(params);
    return negativeLogLikelihood(p, problem);
}

BOOST_AUTO_TEST_CASE( FlattenedOrdering ) {
    mat a = {{0.7, 0.2, 0.1},
             {0.3, 0.3, 0.4},
             {0.1, 0.1, 0.8}};
    cube w(2, 3, 3, fill::zeros);
    for(int i = 0; i < 3; i++)
        w.slice(i) = {{10.0 * i + 1, 10.0 * i + 2, 0.0},
                      {10.0 * i + 3, 10.0 * i + 4, 0.0}};
    vec params = flattenParams(a, w);
    BOOST_REQUIRE_EQUAL(params.n_elem, numberFreeParams(3, 2, 3));
    vec expected = {0.7, 0.2, 0.3, 0.3, 0.1, 0.1,
                    1, 2, 3, 4, 11, 12, 13, 14, 21, 22, 23, 24};
    BOOST_CHECK(approx_equal(params, expected, "absdiff", 0.0));
}

BOOST_AUTO_TEST_CASE( LikelihoodMatchesForwardPass ) {
    GLMHMM model(2, 2, 3);
    mat x;
    ivec y;
    sampleData(model, 200, 41, x, y);
    cube w = buildWeights();
    vec params = flattenParams(transition, w);

    LaplaceProblem single(x, y, w, vec(), uvec(), 0.0);
    double expected = model.loglikelihood(y, x, transition, w);
    BOOST_CHECK(fabs(evaluate(params, single) + expected) < 1e-8);

    uvec sessions = {0, 60, 200};
    vec pi = {0.4, 0.6};
    LaplaceProblem split(x, y, w, pi, sessions, 0.0);
    expected = model.loglikelihood(y, x, transition, w, pi, sessions);
    BOOST_CHECK(fabs(evaluate(params, split) + expected) < 1e-8);

    // The prior adds sum(w^2) / (2 sigma^2) over the free weights.
    double sigma = 2.0;
    LaplaceProblem penalized(x, y, w, vec(), uvec(), sigma);
    vec free_weights = params.tail(params.n_elem - 2);
    double penalty = accu(square(free_weights)) / (2 * sigma * sigma);
    BOOST_CHECK(fabs(evaluate(params, penalized) - evaluate(params, single) -
            penalty) < 1e-8);
}

BOOST_AUTO_TEST_CASE( HessianMatchesFiniteDifferences ) {
    GLMHMM model(2, 2, 3);
    mat x;
    ivec y;
    sampleData(model, 30, 42, x, y);
    cube w = buildWeights();
    LaplaceProblem problem(x, y, w, vec(), uvec(), 1.5);
    vec params = flattenParams(transition, w);
    mat hessian = computeHessian(problem, params);
    BOOST_REQUIRE_EQUAL(hessian.n_rows, params.n_elem);
    BOOST_CHECK(approx_equal(hessian, hessian.t(), "absdiff", EPSILON));

    double h = 1e-4;
    int nparams = params.n_elem;
    mat numeric(nparams, nparams);
    for(int i = 0; i < nparams; i++)
        for(int j = 0; j < nparams; j++) {
            vec pp = params, pm = params, mp = params, mm = params;
            pp(i) += h; pp(j) += h;
            pm(i) += h; pm(j) -= h;
            mp(i) -= h; mp(j) += h;
            mm(i) -= h; mm(j) -= h;
            numeric(i, j) = (evaluate(pp, problem) - evaluate(pm, problem) -
                    evaluate(mp, problem) + evaluate(mm, problem)) /
                    (4 * h * h);
        }
    BOOST_CHECK(approx_equal(hessian, numeric, "both", 1e-3, 1e-3));
}

BOOST_AUTO_TEST_CASE( StandardErrorsOfAFit ) {
    GLMHMM model(2, 2, 3);
    mat x;
    ivec y;
    sampleData(model, 2000, 43, x, y);
    FitResult result = model.fit(y, x, transition, buildWeights(), vec(),
            false, 250, 1e-4);
    vec errors = model.computeVariance(x, y, result.transition,
            result.weights);
    BOOST_CHECK_EQUAL(errors.n_elem, numberFreeParams(2, 2, 3));
    BOOST_CHECK(errors.is_finite());
    BOOST_CHECK(all(errors > 0));

    // The prior only adds curvature.
    vec shrunk = model.computeVariance(x, y, result.transition,
            result.weights, 0.5);
    BOOST_CHECK(shrunk.is_finite());
    BOOST_CHECK(all(shrunk <= errors + 1e-12));
    BOOST_CHECK(any(shrunk < errors));
}

BOOST_AUTO_TEST_CASE( SingularHessian ) {
    GLMHMM model(5, 2, 2);
    mt19937 rng(44);
    GLMHMMParams params = model.generateParams(rng);
    ivec states;
    mat x;
    ivec y = model.generateData(params.transition, params.weights, 2, rng,
            states, x);

    // Two observations cannot identify 30 parameters. The curvature is
    // finite but rank deficient.
    LaplaceProblem problem(x, y, params.weights, vec(), uvec(), 0.0);
    mat hessian = computeHessian(problem, flattenParams(params.transition,
            params.weights));
    BOOST_CHECK(hessian.is_finite());
    BOOST_CHECK(rank(hessian) < hessian.n_rows);
    BOOST_CHECK_THROW(model.computeVariance(x, y, params.transition,
            params.weights), SingularHessianError);
}

BOOST_AUTO_TEST_CASE( ShapesAreChecked ) {
    GLMHMM model(2, 2, 3);
    mat x;
    ivec y;
    sampleData(model, 20, 45, x, y);
    BOOST_CHECK_THROW(model.computeVariance(x.cols(0, 0), y, transition,
            buildWeights()), ShapeMismatchError);
    BOOST_CHECK_THROW(computeVariance(x, y, transition, buildWeights(),
            vec({1.0}), uvec(), 0.0), ShapeMismatchError);
    uvec bad_sessions = {0, 25};
    BOOST_CHECK_THROW(computeVariance(x, y, transition, buildWeights(),
            vec(), bad_sessions, 0.0), ShapeMismatchError);
}
