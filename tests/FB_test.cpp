#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE ForwardBackward
#include <boost/test/unit_test.hpp>
#include <emissions.hpp>
#include <errors.hpp>
#include <ForwardBackward.hpp>
#include <cmath>

#define EPSILON 1e-9

using namespace arma;
using namespace glmhmm;
using namespace std;

mat transition = {{0.8, 0.1, 0.1},
                  {0.2, 0.7, 0.1},
                  {0.3, 0.3, 0.4}};

vec pi = {0.5, 0.3, 0.2};

int nstates = transition.n_rows;

int nclasses = 3;

// Emission weights (dimension 2, 3 categories), one slice per state.
cube buildWeights() {
    cube w(2, 3, 3, fill::zeros);
    w.slice(0) = {{1.0, -0.5, 0.0}, {0.3, 0.2, 0.0}};
    w.slice(1) = {{-1.0, 0.5, 0.0}, {0.1, -0.4, 0.0}};
    w.slice(2) = {{0.0, 1.5, 0.0}, {-0.7, 0.0, 0.0}};
    return w;
}

mat buildInputs(int nobs) {
    mat x(nobs, 2);
    for(int t = 0; t < nobs; t++) {
        x(t, 0) = sin(0.7 * t) * 3;
        x(t, 1) = 1.0;
    }
    return x;
}

ivec buildObservations(int nobs) {
    ivec y(nobs);
    for(int t = 0; t < nobs; t++)
        y(t) = (t * 7 + t / 3) % nclasses;
    return y;
}

// Sums the joint probability of y over every hidden state sequence.
double bruteForceLikelihood(const ivec& y, const cube& phi, mat& marginals) {
    int nobs = y.n_elem;
    int nseqs = 1;
    for(int t = 0; t < nobs; t++)
        nseqs *= nstates;
    marginals = zeros<mat>(nobs, nstates);
    double total = 0;
    for(int code = 0; code < nseqs; code++) {
        ivec z(nobs);
        int rest = code;
        for(int t = 0; t < nobs; t++) {
            z(t) = rest % nstates;
            rest /= nstates;
        }
        double p = pi(z(0)) * phi(0, z(0), y(0));
        for(int t = 1; t < nobs; t++)
            p *= transition(z(t - 1), z(t)) * phi(t, z(t), y(t));
        total += p;
        for(int t = 0; t < nobs; t++)
            marginals(t, z(t)) += p;
    }
    marginals /= total;
    return total;
}

BOOST_AUTO_TEST_CASE( ForwardMatchesBruteForce ) {
    int nobs = 6;
    MultinomialLogitEmission emission(2, nclasses);
    cube phi = emission.likelihoodCube(buildInputs(nobs), buildWeights());
    ivec y = buildObservations(nobs);
    mat alpha;
    vec cs;
    double llikelihood = forwardPass(y, transition, phi, pi, alpha, cs);
    mat expected_gamma;
    double expected = bruteForceLikelihood(y, phi, expected_gamma);
    BOOST_CHECK(fabs(llikelihood - log(expected)) < EPSILON);
    BOOST_CHECK(all(cs > 0));

    mat beta, gamma;
    cube zeta;
    backwardPass(y, transition, phi, alpha, cs, beta, gamma, zeta);
    BOOST_CHECK(approx_equal(gamma, expected_gamma, "absdiff", EPSILON));
}

BOOST_AUTO_TEST_CASE( PosteriorsAreNormalized ) {
    int nobs = 200;
    MultinomialLogitEmission emission(2, nclasses);
    cube phi = emission.likelihoodCube(buildInputs(nobs), buildWeights());
    ivec y = buildObservations(nobs);
    mat alpha, beta, gamma;
    vec cs;
    cube zeta;
    forwardPass(y, transition, phi, pi, alpha, cs);
    backwardPass(y, transition, phi, alpha, cs, beta, gamma, zeta);
    BOOST_CHECK_EQUAL(zeta.n_slices, nobs - 1);
    for(int t = 0; t < nobs; t++) {
        BOOST_CHECK(fabs(accu(alpha.row(t)) - 1.0) < EPSILON);
        BOOST_CHECK(fabs(accu(gamma.row(t)) - 1.0) < EPSILON);
    }

    // Marginalizing the pairwise posteriors gives back gamma.
    for(int t = 0; t < nobs - 1; t++) {
        BOOST_CHECK(fabs(accu(zeta.slice(t)) - 1.0) < EPSILON);
        vec from = sum(zeta.slice(t), 1);
        rowvec to = sum(zeta.slice(t), 0);
        BOOST_CHECK(approx_equal(from, vec(gamma.row(t).t()), "absdiff",
                EPSILON));
        BOOST_CHECK(approx_equal(to, rowvec(gamma.row(t + 1)), "absdiff",
                EPSILON));
    }
    uvec states = posteriorStates(gamma);
    BOOST_CHECK_EQUAL(states.n_elem, nobs);
    BOOST_CHECK(states.max() < nstates);
}

BOOST_AUTO_TEST_CASE( EmptyPiIsUniform ) {
    int nobs = 20;
    MultinomialLogitEmission emission(2, nclasses);
    cube phi = emission.likelihoodCube(buildInputs(nobs), buildWeights());
    ivec y = buildObservations(nobs);
    mat alpha, alpha_uniform;
    vec cs, cs_uniform;
    double ll = forwardPass(y, transition, phi, vec(), alpha, cs);
    double ll_uniform = forwardPass(y, transition, phi,
            ones<vec>(nstates) / nstates, alpha_uniform, cs_uniform);
    BOOST_CHECK(fabs(ll - ll_uniform) < EPSILON);
}

BOOST_AUTO_TEST_CASE( UnderflowIsReported ) {
    int nobs = 4;
    cube phi(nobs, nstates, nclasses, fill::zeros);
    phi.slice(0).fill(1.0);
    ivec y = {0, 0, 1, 0};
    mat alpha;
    vec cs;
    try {
        forwardPass(y, transition, phi, pi, alpha, cs);
        BOOST_ERROR("forwardPass should have thrown");
    } catch (const NumericalUnderflowError& e) {
        BOOST_CHECK_EQUAL(e.getTimeStep(), 2);
    }
}

BOOST_AUTO_TEST_CASE( ShapeChecks ) {
    cube phi(5, nstates, nclasses, fill::ones);
    ivec y = {0, 1, 2, 0};
    mat alpha;
    vec cs;
    BOOST_CHECK_THROW(forwardPass(y, transition, phi, pi, alpha, cs),
            ShapeMismatchError);
    ivec y_out_of_range = {0, 1, 2, 3, 0};
    BOOST_CHECK_THROW(forwardPass(y_out_of_range, transition, phi, pi, alpha,
            cs), ShapeMismatchError);
}

BOOST_AUTO_TEST_CASE( SessionBoundaries ) {
    uvec by_default = validateSessions(uvec(), 10);
    BOOST_CHECK_EQUAL(by_default.n_elem, 2);
    BOOST_CHECK_EQUAL(by_default(0), 0);
    BOOST_CHECK_EQUAL(by_default(1), 10);
    uvec valid = {0, 4, 10};
    BOOST_CHECK_NO_THROW(validateSessions(valid, 10));
    uvec not_ending = {0, 4, 9};
    BOOST_CHECK_THROW(validateSessions(not_ending, 10), ShapeMismatchError);
    uvec not_starting = {1, 4, 10};
    BOOST_CHECK_THROW(validateSessions(not_starting, 10), ShapeMismatchError);
    uvec repeated = {0, 4, 4, 10};
    BOOST_CHECK_THROW(validateSessions(repeated, 10), ShapeMismatchError);
}

BOOST_AUTO_TEST_CASE( StableSoftmax ) {
    vec large = {1000.0, 1000.0};
    BOOST_CHECK(fabs(logsumexp(large) - (1000.0 + log(2.0))) < EPSILON);
    vec impossible(3);
    impossible.fill(-datum::inf);
    BOOST_CHECK(logsumexp(impossible) == -datum::inf);

    // Logits far beyond the range of exp still give the plain softmax.
    MultinomialLogitEmission emission(2, nclasses);
    mat w = {{900.0, 899.0, 0.0},
             {2.0, 0.0, 0.0}};
    rowvec x = {1.0, 0.5};
    rowvec logits = x * w;
    rowvec shifted = exp(logits - logits.max());
    rowvec expected = shifted / accu(shifted);
    rowvec p = emission.compObs(x, w);
    BOOST_CHECK(p.is_finite());
    BOOST_CHECK(approx_equal(p, expected, "absdiff", EPSILON));
    BOOST_CHECK(approx_equal(emission.compObsAll(mat(x), w), mat(p),
            "absdiff", EPSILON));
}
