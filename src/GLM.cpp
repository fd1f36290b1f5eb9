#include <GLM.hpp>
#include <errors.hpp>

using namespace arma;
using namespace std;

namespace glmhmm {

    WeightedSoftmaxRegressionFunction::WeightedSoftmaxRegressionFunction(
            const mat& x, const mat& y_onehot, const vec& sample_weights,
            const vec& reference_weights, double gaussian_prior) : x_(x),
            y_onehot_(y_onehot), sample_weights_(sample_weights),
            reference_weights_(reference_weights), prior_precision_(0.0) {
        if (y_onehot_.n_rows != x_.n_rows ||
                sample_weights_.n_elem != x_.n_rows)
            throw ShapeMismatchError("regression inputs, outputs and sample "
                    "weights must have the same number of rows");
        if (reference_weights_.n_elem != x_.n_cols)
            throw ShapeMismatchError("reference weights do not match the "
                    "input dimension");
        if (y_onehot_.n_cols < 2)
            throw ShapeMismatchError("at least two categories are required");
        reference_logits_ = x_ * reference_weights_;
        if (gaussian_prior > 0)
            prior_precision_ = 1.0 / (gaussian_prior * gaussian_prior);
    }

    mat WeightedSoftmaxRegressionFunction::logits(const mat& coordinates)
            const {
        mat ret = join_horiz(x_ * coordinates, reference_logits_);

        // Shifting every row by its maximum for numerical stability.
        ret.each_col() -= max(ret, 1);
        return ret;
    }

    mat WeightedSoftmaxRegressionFunction::Probabilities(
            const mat& coordinates) const {
        mat ret = exp(logits(coordinates));
        ret.each_col() /= sum(ret, 1);
        return ret;
    }

    mat WeightedSoftmaxRegressionFunction::FullWeights(
            const mat& coordinates) const {
        return join_horiz(coordinates, reference_weights_);
    }

    double WeightedSoftmaxRegressionFunction::Evaluate(
            const mat& coordinates) const {
        mat l = logits(coordinates);
        vec lse = log(sum(exp(l), 1));
        l.each_col() -= lse;
        double ret = -dot(sum(y_onehot_ % l, 1), sample_weights_);
        if (prior_precision_ > 0)
            ret += 0.5 * prior_precision_ * accu(square(coordinates));
        return ret;
    }

    void WeightedSoftmaxRegressionFunction::Gradient(const mat& coordinates,
            mat& gradient) const {
        EvaluateWithGradient(coordinates, gradient);
    }

    double WeightedSoftmaxRegressionFunction::EvaluateWithGradient(
            const mat& coordinates, mat& gradient) const {
        int nfree = coordinates.n_cols;
        mat l = logits(coordinates);
        vec lse = log(sum(exp(l), 1));
        l.each_col() -= lse;
        double ret = -dot(sum(y_onehot_ % l, 1), sample_weights_);

        // d/dW of the negative log-likelihood is -X^T diag(g) (Y - P).
        mat residual = y_onehot_.cols(0, nfree - 1) -
                exp(l.cols(0, nfree - 1));
        residual.each_col() %= sample_weights_;
        gradient = -x_.t() * residual;
        if (prior_precision_ > 0) {
            ret += 0.5 * prior_precision_ * accu(square(coordinates));
            gradient += prior_precision_ * coordinates;
        }
        return ret;
    }

    mat WeightedSoftmaxRegressionFunction::Hessian(const mat& coordinates)
            const {
        int dimension = x_.n_cols;
        int nfree = coordinates.n_cols;
        mat p = Probabilities(coordinates);
        mat ret(dimension * nfree, dimension * nfree, fill::zeros);
        for(int j = 0; j < nfree; j++) {
            for(int l = j; l < nfree; l++) {
                vec diag_terms = p.col(j) % ((j == l ? 1.0 : 0.0) - p.col(l));
                diag_terms %= sample_weights_;
                mat xw = x_;
                xw.each_col() %= diag_terms;
                mat block = x_.t() * xw;
                ret.submat(j * dimension, l * dimension,
                        (j + 1) * dimension - 1, (l + 1) * dimension - 1) =
                        block;
                if (l != j)
                    ret.submat(l * dimension, j * dimension,
                            (l + 1) * dimension - 1, (j + 1) * dimension - 1) =
                            block.t();
            }
        }
        if (prior_precision_ > 0)
            ret.diag() += prior_precision_;
        return ret;
    }

};
