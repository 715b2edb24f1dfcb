#include <cstdint>
#include <limits>
#include <string>
#include <vector>
#include <city_generator.hpp>
#include <mixed_integer_program.hpp>
#include <tsp_instance.hpp>
#include <tsp_solution.hpp>
#include <tsp_solvers.hpp>
#include <tsp_utils.hpp>
#include "test_checks.hpp"

namespace {
	/**
	 * Prüft ein Ergebnis, das wegen des Zeitlimits abgebrochen wurde. Eine Lösung muss eine gültige Tour sein, die
	 * nicht schlechter ist als upperBound.
	 */
	void checkInterrupted(TestChecks& checks, const TSPInstance& inst, const SolveResult& result, double upperBound,
						  const std::string& name) {
		checks.check(result.status == MipStatus::feasible_suboptimal ||
					 result.status == MipStatus::timed_out_no_solution,
					 name + ": status " + toString(result.status) + " after the time limit");
		if (result.hasSolution()) {
			checks.check(tsp_util::isPermutation(result.tour.getOrder(), inst.getCityCount()),
						 name + ": incumbent is a tour");
			checks.check(result.tour.getCost() <= upperBound * (1 + 1e-6), name + ": incumbent is not worse");
			checks.check(result.relativeGap >= 0, name + ": gap is reported");
		} else {
			checks.check(!result.tour.isValid(), name + ": no tour without a solution");
			checks.check(result.arcValues.empty() && result.orderValues.empty(), name + ": no values without a solution");
		}
	}
}

int main() {
	TestChecks checks("time_limit_test");
	SharedCplexEnv env = MixedIntegerProgram::openCPLEX();

	//Mit 70 Städten kann CPLEX in 0.05 Sekunden keine Optimalität beweisen
	TSPInstance large(citygen::generateCities(70, 1000, 11), "random70");
	tspsolvers::MipOptions shortRun;
	shortRun.solver.timeLimit = 0.05;
	shortRun.solver.threads = 1;

	SolveResult cold = tspsolvers::solveMIP(large, nullptr, env, shortRun);
	checkInterrupted(checks, large, cold, std::numeric_limits<double>::max(), "without warm start");

	TSPSolution nearest = tspsolvers::solveNearestNeighbor(large);
	SolveResult warm = tspsolvers::solveMIP(large, &nearest, env, shortRun);
	checkInterrupted(checks, large, warm, nearest.getCost(), "nearest neighbor warm start");
	if (warm.hasSolution()) {
		checks.check(warm.tour.getOrder().front() == shortRun.anchor, "incumbent starts at the anchor");
	}

	shortRun.encoding = SubtourEncoding::big_m;
	SolveResult bigM = tspsolvers::solveMIP(large, &nearest, env, shortRun);
	checkInterrupted(checks, large, bigM, nearest.getCost(), "big-M with nearest neighbor warm start");

	//Eine große relative Lücke erlaubt einen frühen Abbruch mit einer Lösung höchstens doppelter Länge
	TSPInstance medium(citygen::generateCities(10, 100, 5), "random10");
	tspsolvers::MipOptions exact;
	exact.solver.timeLimit = 120;
	exact.solver.relativeGap = 0;
	SolveResult optimum = tspsolvers::solveMIP(medium, nullptr, env, exact);
	tspsolvers::MipOptions loose = exact;
	loose.solver.relativeGap = 0.5;
	SolveResult coarse = tspsolvers::solveMIP(medium, nullptr, env, loose);
	if (checks.check(optimum.hasSolution() && coarse.hasSolution(), "both gaps give a solution")) {
		checks.check(coarse.status == MipStatus::optimal || coarse.status == MipStatus::feasible_suboptimal,
					 "gap 0.5 status");
		checks.check(coarse.tour.getCost() >= optimum.tour.getCost() * (1 - 1e-6), "not better than the optimum");
		checks.check(coarse.tour.getCost() <= 2 * optimum.tour.getCost() * (1 + 1e-6), "within the relative gap");
		checks.check(coarse.relativeGap <= 0.5 + 1e-6, "reported gap within the limit");
	}
	return checks.exitCode();
}
