#ifndef GLMHMM_ERRORS_H
#define GLMHMM_ERRORS_H

#include <stdexcept>
#include <string>

namespace glmhmm {

    class GLMHMMError : public std::runtime_error {
        public:
            explicit GLMHMMError(const std::string& message) :
                    std::runtime_error(message) {}
    };

    // Dimensions of y, x, A, w (or session boundaries) do not agree.
    class ShapeMismatchError : public GLMHMMError {
        public:
            explicit ShapeMismatchError(const std::string& message) :
                    GLMHMMError("Shape mismatch: " + message) {}
    };

    // Unknown distribution tag passed to a parameter generator.
    class InvalidDistributionError : public GLMHMMError {
        public:
            explicit InvalidDistributionError(const std::string& message) :
                    GLMHMMError("Invalid distribution: " + message) {}
    };

    // Every state gives zero probability to the observed symbol.
    class NumericalUnderflowError : public GLMHMMError {
        public:
            explicit NumericalUnderflowError(int t) : GLMHMMError(
                    "Numerical underflow: forward normalizer is zero at t = "
                    + std::to_string(t)), t_(t) {}

            int getTimeStep() const {
                return t_;
            }

        private:
            int t_;
    };

    class SingularHessianError : public GLMHMMError {
        public:
            explicit SingularHessianError(const std::string& message) :
                    GLMHMMError("Singular Hessian: " + message) {}
    };

    // Failure inside one EM iteration. iteration, session and state are -1
    // when the failure is not tied to one of them.
    class FitError : public GLMHMMError {
        public:
            FitError(const std::string& cause, int iteration, int session,
                    int state) : GLMHMMError(describe(cause, iteration,
                    session, state)), cause_(cause), iteration_(iteration),
                    session_(session), state_(state) {}

            const std::string& getCause() const {
                return cause_;
            }

            int getIteration() const {
                return iteration_;
            }

            int getSession() const {
                return session_;
            }

            int getState() const {
                return state_;
            }

        private:
            static std::string describe(const std::string& cause,
                    int iteration, int session, int state) {
                std::string ret = "EM";
                if (iteration >= 0)
                    ret += " iteration " + std::to_string(iteration);
                if (session >= 0)
                    ret += ", session " + std::to_string(session);
                if (state >= 0)
                    ret += ", state " + std::to_string(state);
                return ret + ": " + cause;
            }

            std::string cause_;
            int iteration_;
            int session_;
            int state_;
    };

};

#endif
