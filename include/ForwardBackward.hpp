#ifndef GLMHMM_FORWARDBACKWARD_H
#define GLMHMM_FORWARDBACKWARD_H

#include <armadillo>

namespace glmhmm {

    double logsumexp(const arma::vec& c);

    // Returns the session boundaries to use for a sequence of nobs steps.
    // An empty vector stands for the single session [0, nobs]. Throws
    // ShapeMismatchError unless the boundaries start at 0, end at nobs
    // and are strictly increasing.
    arma::uvec validateSessions(const arma::uvec& sessions, int nobs);

    // Scaled forward recursion over one session. phi is (nobs, nstates,
    // nclasses); alpha is filled as (nobs, nstates) and cs as the per step
    // normalizers. An empty pi stands for the uniform distribution.
    // Returns the log-likelihood of the session.
    double forwardPass(const arma::ivec& y, const arma::mat& transition,
            const arma::cube& phi, const arma::vec& pi, arma::mat& alpha,
            arma::vec& cs);

    // Scaled backward recursion using the output of forwardPass. gamma
    // holds the smoothed posteriors (nobs, nstates) and zeta the pairwise
    // posteriors (nstates, nstates, nobs - 1) where zeta(i, j, t) is
    // P(z_t = i, z_{t+1} = j | y).
    void backwardPass(const arma::ivec& y, const arma::mat& transition,
            const arma::cube& phi, const arma::mat& alpha, const arma::vec& cs,
            arma::mat& beta, arma::mat& gamma, arma::cube& zeta);

    // Most probable state at every time step.
    arma::uvec posteriorStates(const arma::mat& gamma);

};

#endif
