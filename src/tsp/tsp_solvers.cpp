#include <iostream>
#include <chrono>
#include <limits>
#include <vector>
#include <stdexcept>
#include <cstddef>
#include <string>
#include <tsp_solution.hpp>
#include <tsp_solvers.hpp>
#include <tsp_mip_data.hpp>
#include <mixed_integer_program.hpp>

bool SolveResult::hasSolution() const {
	return status == MipStatus::optimal || status == MipStatus::feasible_suboptimal;
}

namespace tspsolvers {

	/**
	 * Berechnet eine Tour, indem vom Anker aus immer die nächste noch nicht besuchte Stadt angefahren wird. Bei
	 * gleichen Distanzen wird die Stadt mit dem kleinsten Index gewählt.
	 */
	TSPSolution solveNearestNeighbor(const TSPInstance& inst, city_id anchor) {
		inst.checkCity(anchor);
		const city_id n = inst.getCityCount();
		std::vector<bool> visited(static_cast<std::size_t>(n), false);
		std::vector<city_id> order;
		order.reserve(visited.size());
		city_id current = anchor;
		visited[current] = true;
		order.push_back(current);
		while (static_cast<city_id>(order.size()) < n) {
			city_id nearest = TSPInstance::invalid_city;
			cost_t nearestDist = std::numeric_limits<cost_t>::max();
			for (city_id candidate = 0; candidate < n; ++candidate) {
				if (!visited[candidate] && inst.getDistance(current, candidate) < nearestDist) {
					nearest = candidate;
					nearestDist = inst.getDistance(current, candidate);
				}
			}
			if (nearest == TSPInstance::invalid_city) {
				//Nur möglich, wenn alle verbleibenden Distanzen unendlich sind
				throw std::runtime_error("No reachable unvisited city from " + std::to_string(current));
			}
			visited[nearest] = true;
			order.push_back(nearest);
			current = nearest;
		}
		return TSPSolution(inst, order);
	}

	/**
	 * Löst eine TSP-Instanz exakt mit dem MTZ-Modell
	 * @param inst Die zu lösende TSP-Instanz
	 * @param initial Eine Startlösung für den Solver, oder nullptr falls ohne eine solche gearbeitet werden soll
	 * @param env Die zu verwendende CPLEX-Umgebung
	 * @param options Abbruchkriterien, Anker und Kodierung der MTZ-Bedingungen
	 * @return Status und, falls vorhanden, die beste gefundene Tour
	 */
	SolveResult solveMIP(const TSPInstance& inst, const TSPSolution *initial, const SharedCplexEnv& env,
						 const MipOptions& options) {
		options.solver.check();
		TspMipData data(inst, options.anchor, options.encoding);
		if (initial != nullptr && (!initial->isValid() ||
								   initial->getOrder().size() != static_cast<std::size_t>(inst.getCityCount()))) {
			throw InputError("Warm start tour does not match the instance");
		}
		MixedIntegerProgram mip(env, inst.getName(), MixedIntegerProgram::minimize);
		data.setupMIP(mip);
		std::cout << "Built model with " << mip.getVariableCount() << " variables, " << mip.getConstraintCount()
				  << " constraints and " << mip.getIndicatorCount() << " indicator constraints" << std::endl;
		if (initial != nullptr) {
			std::cout << "Using warm start with cost " << initial->getCost() << std::endl;
			data.addWarmStart(mip, *initial);
		}

		auto start = std::chrono::steady_clock::now();
		MixedIntegerProgram::Solution sol = mip.solve(options.solver);
		std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
		std::cout << "MIP solver took " << elapsed.count() << " seconds, status " << toString(sol.getStatus())
				  << std::endl;

		SolveResult result;
		result.status = sol.getStatus();
		if (result.status == MipStatus::infeasible) {
			throw ModelInconsistencyError("MIP solver reported the TSP model for " + inst.getName() +
										  " as infeasible", result.status);
		}
		if (!result.hasSolution()) {
			std::cout << "No tour found within " << options.solver.timeLimit << " seconds" << std::endl;
			return result;
		}
		result.objective = sol.getValue();
		result.relativeGap = sol.getRelativeGap();
		const std::vector<double>& values = sol.getVector();
		result.arcValues.assign(values.begin(), values.begin() + data.getArcVariableCount());
		result.orderValues.assign(values.begin() + data.getArcVariableCount(), values.end());
		try {
			result.tour = TSPSolution(inst, values, data, result.objective, result.status);
		} catch (const ExtractionValidationError&) {
			std::cerr << "Solver returned an invalid tour (status " << toString(result.status) << ", objective "
					  << result.objective << ", relative gap " << result.relativeGap << ")" << std::endl;
			throw;
		}
		std::cout << "Found tour of cost " << result.tour.getCost() << ", relative gap " << result.relativeGap
				  << std::endl;
		return result;
	}
}
