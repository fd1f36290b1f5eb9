#include <ForwardBackward.hpp>
#include <errors.hpp>
#include <cassert>
#include <string>

using namespace arma;
using namespace std;

namespace glmhmm {

    double logsumexp(const vec& c) {
        // computes log(sum_ i(exp(x_i))) with the so called log-sum-exp trick.
        double maxv = c.max();

        // Handling the special case of all being -inf.
        if (maxv == -datum::inf)
            return maxv;

        double sum = 0.0;
        for(int i = 0; i < c.n_elem; i++)
            sum += exp(c(i) - maxv);
        return maxv + log(sum);
    }

    uvec validateSessions(const uvec& sessions, int nobs) {
        if (sessions.is_empty()) {
            uvec ret = {0, (uword) nobs};
            return ret;
        }
        if (sessions.n_elem < 2 || sessions(0) != 0 ||
                sessions(sessions.n_elem - 1) != nobs)
            throw ShapeMismatchError("session boundaries must start at 0 and "
                    "end at " + to_string(nobs));
        for(int s = 1; s < sessions.n_elem; s++)
            if (sessions(s) <= sessions(s - 1))
                throw ShapeMismatchError("session boundaries must be strictly "
                        "increasing (boundary " + to_string(s) + ")");
        return sessions;
    }

    void safety_checks(const ivec& y, const mat& transition, const cube& phi,
            const vec& pi) {
        int nstates = transition.n_rows;
        int nobs = y.n_elem;
        if (transition.n_rows != transition.n_cols)
            throw ShapeMismatchError("transition matrix is not square");
        if (phi.n_rows != nobs || phi.n_cols != nstates)
            throw ShapeMismatchError("emission cube is " +
                    to_string(phi.n_rows) + " x " + to_string(phi.n_cols) +
                    " but expected " + to_string(nobs) + " x " +
                    to_string(nstates));
        if (!pi.is_empty() && pi.n_elem != nstates)
            throw ShapeMismatchError("initial distribution has " +
                    to_string(pi.n_elem) + " entries for " +
                    to_string(nstates) + " states");
        if (nobs == 0)
            throw ShapeMismatchError("empty observation sequence");
        if (y.min() < 0 || y.max() >= (sword) phi.n_slices)
            throw ShapeMismatchError("observations must lie in [0, " +
                    to_string(phi.n_slices) + ")");
    }

    double forwardPass(const ivec& y, const mat& transition, const cube& phi,
            const vec& pi, mat& alpha, vec& cs) {
        safety_checks(y, transition, phi, pi);
        int nstates = transition.n_rows;
        int nobs = y.n_elem;
        vec pi0 = pi;
        if (pi0.is_empty())
            pi0 = ones<vec>(nstates) / nstates;
        alpha = zeros<mat>(nobs, nstates);
        cs = zeros<vec>(nobs);

        // First time step.
        rowvec joint(nstates);
        for(int i = 0; i < nstates; i++)
            joint(i) = phi(0, i, y(0)) * pi0(i);
        cs(0) = sum(joint);
        if (cs(0) == 0)
            throw NumericalUnderflowError(0);
        alpha.row(0) = joint / cs(0);

        // Forward recursion.
        for(int t = 1; t < nobs; t++) {
            rowvec predictive = alpha.row(t - 1) * transition;
            for(int i = 0; i < nstates; i++)
                joint(i) = phi(t, i, y(t)) * predictive(i);
            cs(t) = sum(joint);
            if (cs(t) == 0)
                throw NumericalUnderflowError(t);
            alpha.row(t) = joint / cs(t);
        }
        return accu(log(cs));
    }

    void backwardPass(const ivec& y, const mat& transition, const cube& phi,
            const mat& alpha, const vec& cs, mat& beta, mat& gamma,
            cube& zeta) {
        int nstates = transition.n_rows;
        int nobs = y.n_elem;
        assert(alpha.n_rows == nobs && alpha.n_cols == nstates);
        assert(cs.n_elem == nobs);
        beta = zeros<mat>(nobs, nstates);
        zeta = zeros<cube>(nstates, nstates, nobs > 1 ? nobs - 1 : 0);

        // Backward pass base case.
        beta.row(nobs - 1).fill(1.0);

        // Backward recursion. zeta(i, j, t) is proportional to
        // alpha(t, i) A(i, j) phi(t+1, j, y_{t+1}) beta(t+1, j).
        rowvec weighted(nstates);
        for(int t = nobs - 2; t >= 0; t--) {
            for(int j = 0; j < nstates; j++)
                weighted(j) = phi(t + 1, j, y(t + 1)) * beta(t + 1, j);
            beta.row(t) = weighted * transition.t() / cs(t + 1);
            zeta.slice(t) = (alpha.row(t).t() * weighted) % transition /
                    cs(t + 1);
        }
        gamma = alpha % beta;
    }

    uvec posteriorStates(const mat& gamma) {
        return index_max(gamma, 1);
    }

};
