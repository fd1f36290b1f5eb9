#include <armadillo>
#include <boost/program_options.hpp>
#include <emissions.hpp>
#include <errors.hpp>
#include <GLMHMM.hpp>
#include <init_params.hpp>
#include <iostream>
#include <memory>
#include <mlpack/core.hpp>
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variance.hpp>
#include <vector>

using namespace arma;
using namespace glmhmm;
using namespace std;
using json = nlohmann::json;
namespace po = boost::program_options;


vector<vector<double>> matToVector(const mat& m) {
    vector<vector<double>> ret;
    for(int i = 0; i < m.n_rows; i++)
        ret.push_back(conv_to<vector<double>>::from(m.row(i)));
    return ret;
}

// Parses a comma separated list of temperatures, e.g. "0.2,0.5,1".
vec parseSchedule(const string& schedule) {
    vector<double> ret;
    stringstream ss(schedule);
    string item;
    while (getline(ss, item, ','))
        ret.push_back(stod(item));
    return conv_to<vec>::from(ret);
}

int main(int argc, char *argv[]) {
    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Produce help message")
        ("nobs,n", po::value<int>()->default_value(5000), "Number of "
                "observations to sample")
        ("nstates,k", po::value<int>()->default_value(3), "Number of hidden "
                "states")
        ("dimension,d", po::value<int>()->default_value(2), "Input dimension")
        ("nclasses,c", po::value<int>()->default_value(3), "Number of "
                "categories of the observations")
        ("seed", po::value<unsigned int>()->default_value(0), "Random seed")
        ("maxiter", po::value<int>()->default_value(250), "Maximum number of "
                "EM iterations")
        ("tol", po::value<double>()->default_value(1e-3), "Convergence "
                "tolerance on the log-likelihood")
        ("nsessions", po::value<int>()->default_value(1), "Number of equally"
                " sized sessions the sequence is split into")
        ("temperatures", po::value<string>(), "Comma separated annealing "
                "schedule. If set, the fit is annealed")
        ("prior", po::value<double>()->default_value(0.0), "Std. dev. of the "
                "Gaussian prior over the weights. 0 means no prior")
        ("hessian", "Refine the regressions with Newton steps")
        ("lbfgs_iters", po::value<int>()->default_value(1000), "Maximum "
                "number of L-BFGS iterations per state regression")
        ("newton_steps", po::value<int>()->default_value(20), "Maximum "
                "number of Newton steps when --hessian is set")
        ("parallel", "Run sessions and states on OpenMP threads")
        ("fitpi", "Learn the initial state distribution")
        ("variance", "Compute Laplace standard errors of the fit")
        ("verbose,v", "Print the EM trace");
    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
    if (vm.count("help")) {
        cout << desc << endl;
        return 0;
    }
    mlpack::Log::Info.ignoreInput = !vm.count("verbose");
    int nobs = vm["nobs"].as<int>();
    int nstates = vm["nstates"].as<int>();
    int dimension = vm["dimension"].as<int>();
    int nclasses = vm["nclasses"].as<int>();
    int nsessions = vm["nsessions"].as<int>();
    if (nobs < 1 || nsessions < 1 || nsessions > nobs) {
        cerr << "Invalid number of observations or sessions" << endl;
        return 1;
    }
    mt19937 rng(vm["seed"].as<unsigned int>());

    try {
        auto emission = make_shared<MultinomialLogitEmission>(dimension,
                nclasses);
        emission->setMaxIterations(vm["lbfgs_iters"].as<int>());
        emission->setMaxNewtonSteps(vm["newton_steps"].as<int>());
        GLMHMM model(emission, nstates);
        model.setGaussianPrior(vm["prior"].as<double>());
        model.setComputeHessian(vm.count("hessian") > 0);
        model.setParallelSessions(vm.count("parallel") > 0);
        model.setParallelStates(vm.count("parallel") > 0);

        // Sampling the ground truth and a random starting point.
        GLMHMMParams true_params = model.generateParams(rng);
        ivec states;
        mat inputs;
        ivec y = model.generateData(true_params.transition,
                true_params.weights, nobs, rng, states, inputs);
        GLMHMMParams init = model.generateParams(rng);
        uvec sessions = conv_to<uvec>::from(round(linspace<vec>(0, nobs,
                nsessions + 1)));

        FitResult result;
        bool fit_pi = vm.count("fitpi") > 0;
        int maxiter = vm["maxiter"].as<int>();
        double tol = vm["tol"].as<double>();
        if (vm.count("temperatures"))
            result = model.fitAnnealed(y, inputs, init.transition,
                    init.weights, init.pi, fit_pi, parseSchedule(
                    vm["temperatures"].as<string>()), maxiter, tol,
                    sessions);
        else
            result = model.fit(y, inputs, init.transition, init.weights,
                    init.pi, fit_pi, maxiter, tol, sessions);

        json summary;
        summary["true_transition"] = matToVector(true_params.transition);
        summary["fit"] = model.to_stream(result);
        summary["loglikelihood"] = model.loglikelihood(y, inputs,
                result.transition, result.weights, result.pi, sessions);
        if (vm.count("variance")) {
            vec errors = computeVariance(inputs, y, result.transition,
                    result.weights, result.pi, sessions,
                    vm["prior"].as<double>());
            summary["standard_errors"] = conv_to<vector<double>>::from(
                    errors);
        }
        cout << summary.dump(4) << endl;
    } catch (const invalid_argument& e) {
        cerr << "Invalid annealing schedule: " << e.what() << endl;
        return 1;
    } catch (const SingularHessianError& e) {
        cerr << e.what() << endl;
        return 2;
    } catch (const GLMHMMError& e) {
        cerr << e.what() << endl;
        return 1;
    }
    return 0;
}
