#include <cstddef>
#include <cstdint>
#include <cmath>
#include <iostream>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <city_generator.hpp>
#include <tsp_instance.hpp>
#include <tsp_solvers.hpp>
#include <tsp_solution.hpp>
#include <tsp_utils.hpp>
#include <mixed_integer_program.hpp>

/**
 * Entfernt die Optionen (Parameter der Form --foo=bar) aus dem Vector der Argumente und gibt die Optionen als std::map
 * zurück
 * @param args Enthält vor dem Aufruf alle Argumente, nach dem Aufruf nur noch solche, die keine Optionen sind
 * @return die Optionen
 */
std::map<std::string, std::string> parseArgs(std::vector<std::string>& args) {
	std::map<std::string, std::string> ret;
	auto it = args.begin();
	while (it != args.end()) {
		std::string arg = *it;
		if (arg.size() > 3 && arg[0] == '-' && arg[1] == '-') {
			arg = arg.substr(2);
			std::pair<std::string, std::string> option = tsp_util::splitOption(arg);
			if (option.first.empty()) {
				throw InputError("Invalid argument: --" + arg + ", expected --key=value");
			}
			ret[option.first] = option.second;
			it = args.erase(it);
		} else {
			++it;
		}
	}
	return ret;
}

/**
 * Liest den Wert der angegebenen Option aus, entfernt ihn aus der map und gibt ihn zurück
 * @tparam T Der Typ des Wertes der Option
 * @param options Alle Optionen
 * @param key Der Name der Option
 * @param defaultVal Der Standardwert (falls die Option nicht angegeben wurde)
 * @return Den Wert der Option
 */
template<typename T>
T getOption(std::map<std::string, std::string>& options, const std::string& key, T defaultVal) {
	auto it = options.find(key);
	if (it == options.end()) {
		return defaultVal;
	}
	std::string retString = it->second;
	options.erase(it);
	std::stringstream valStream(retString);
	T ret;
	valStream >> ret;
	if (!valStream) {
		throw InputError(retString + " is not a valid value for " + key);
	}
	return ret;
}

/**
 * Liest eine Instanz im TSPLIB-Format aus der angegebenen Datei
 */
TSPInstance readInstance(const std::string& fileName) {
	std::ifstream in(fileName);
	if (!in) {
		throw InputError("File does not exist: " + fileName);
	}
	return TSPInstance(in);
}

SubtourEncoding parseEncoding(const std::string& name) {
	if (name == "indicator") {
		return SubtourEncoding::indicator;
	} else if (name == "bigm") {
		return SubtourEncoding::big_m;
	}
	throw InputError("Unknown MTZ encoding: " + name + ", expected indicator or bigm");
}

int main(int argc, char **argv) {
	try {
		std::vector<std::string> args(argv + 1, argv + argc);
		std::map<std::string, std::string> options = parseArgs(args);

		const std::string noWarmStart = "<none>";
		const std::string nearestNeighbor = "<nn>";
		std::string warmStart = getOption<std::string>(options, "warmStart", nearestNeighbor);
		tspsolvers::MipOptions mipOptions;
		mipOptions.solver.timeLimit = getOption(options, "timeLimit", mipOptions.solver.timeLimit);
		mipOptions.solver.relativeGap = getOption(options, "gap", mipOptions.solver.relativeGap);
		mipOptions.solver.threads = getOption(options, "threads", mipOptions.solver.threads);
		mipOptions.solver.verbose = getOption(options, "verbose", mipOptions.solver.verbose);
		mipOptions.anchor = getOption(options, "anchor", mipOptions.anchor);
		mipOptions.encoding = parseEncoding(getOption<std::string>(options, "mtz", "indicator"));
		auto randomCount = getOption<city_id>(options, "random", 0);
		auto seed = getOption<std::uint32_t>(options, "seed", 42);
		auto size = getOption(options, "size", 100.0);
		auto expectedValue = getOption(options, "expectedResult", 0.0);
		if (!options.empty()) {
			std::cerr << "Found unknown options:" << std::endl;
			for (const auto& entry:options) {
				std::cerr << "--" << entry.first << "=" << entry.second << std::endl;
			}
			return 1;
		}
		const std::size_t inputArgs = randomCount > 0 ? 0 : 1;
		if (args.size() != inputArgs && args.size() != inputArgs + 1) {
			std::cerr << "Arguments: [options] <input file name> [<output file name>]" << std::endl;
			std::cerr << "       or: [options] --random=<city count> [<output file name>]" << std::endl;
			return 1;
		}

		if (randomCount > 0) {
			std::cout << "Generating " << randomCount << " random cities with seed " << seed << std::endl;
		}
		const TSPInstance inst = randomCount > 0
								 ? TSPInstance(citygen::generateCities(randomCount, size, seed),
											   "random" + std::to_string(randomCount))
								 : readInstance(args[0]);

		TSPSolution initial;
		if (warmStart == nearestNeighbor) {
			initial = tspsolvers::solveNearestNeighbor(inst, mipOptions.anchor);
			std::cout << "Nearest neighbor tour has cost " << initial.getCost() << std::endl;
		} else if (warmStart != noWarmStart) {
			std::ifstream boundIn(warmStart);
			if (!boundIn) {
				std::cerr << "Warm start file does not exist: " << warmStart << std::endl;
				return 1;
			}
			initial = TSPSolution(inst, boundIn);
		}

		SharedCplexEnv env = MixedIntegerProgram::openCPLEX();
		SolveResult result = tspsolvers::solveMIP(inst, initial.isValid() ? &initial : nullptr, env, mipOptions);
		if (!result.hasSolution()) {
			std::cerr << "No tour found, status " << toString(result.status) << std::endl;
			return 2;
		}

		bool outputToConsole = args.size() == inputArgs;
		if (!outputToConsole) {
			std::ofstream out(args[inputArgs]);
			if (out) {
				result.tour.write(out);
				out.close();
			} else {
				std::cout << "Could not create/write to output file: " << args[inputArgs]
						  << ", printing to console instead" << std::endl;
				outputToConsole = true;
			}
		}
		if (outputToConsole) {
			result.tour.write(std::cout);
		}
		if (expectedValue > 0 && std::abs(result.tour.getCost() - expectedValue) > 1e-6 * expectedValue) {
			std::cerr << "Found tour of cost " << result.tour.getCost() << ", but expected cost " << expectedValue
					  << std::endl;
		}
	} catch (const ExtractionValidationError& err) {
		std::cerr << "Error: " << err.what() << " (solver objective " << err.getObjective() << ", "
				  << err.getPartialTour().size() << " cities reached from the anchor)" << std::endl;
		return 1;
	} catch (const std::runtime_error& err) {
		std::cerr << "Error: " << err.what() << std::endl;
		return 1;
	} catch (const std::invalid_argument& err) {
		std::cerr << "Error: " << err.what() << std::endl;
		return 1;
	}
}
