#include <cstdint>
#include <string>
#include <vector>
#include <city_generator.hpp>
#include <tsp_instance.hpp>
#include <tsp_solution.hpp>
#include <tsp_solvers.hpp>
#include <tsp_utils.hpp>
#include "test_checks.hpp"

int main() {
	TestChecks checks("nearest_neighbor_test");

	for (city_id n = 2; n <= 40; n += 3) {
		for (std::uint32_t seed = 1; seed <= 5; ++seed) {
			TSPInstance inst(citygen::generateCities(n, 1000, seed));
			for (city_id anchor:{0, n - 1, n / 2}) {
				TSPSolution tour = tspsolvers::solveNearestNeighbor(inst, anchor);
				std::string name = "n=" + std::to_string(n) + ", seed=" + std::to_string(seed) + ", anchor=" +
								   std::to_string(anchor);
				checks.check(tsp_util::isPermutation(tour.getOrder(), n), name + " is a permutation");
				checks.check(tour.getOrder().front() == anchor, name + " starts at the anchor");
			}
		}
	}

	//Beide Nachbarn von 0 haben Abstand 10, die Stadt mit kleinerem Index gewinnt
	TSPInstance square({{0, 0}, {0, 10}, {10, 10}, {10, 0}});
	TSPSolution squareTour = tspsolvers::solveNearestNeighbor(square);
	checks.check(squareTour.getOrder() == std::vector<city_id>({0, 1, 2, 3}), "square tie-break");
	checks.checkNear(squareTour.getCost(), 40, "square tour cost");
	TSPSolution fromTwo = tspsolvers::solveNearestNeighbor(square, 2);
	checks.check(fromTwo.getOrder() == std::vector<city_id>({2, 1, 0, 3}), "square tie-break from anchor 2");

	TSPInstance line({{0, 0}, {1, 0}, {-1, 0}, {5, 0}});
	TSPSolution lineTour = tspsolvers::solveNearestNeighbor(line);
	checks.check(lineTour.getOrder() == std::vector<city_id>({0, 1, 2, 3}), "line tie-break");
	checks.checkNear(lineTour.getCost(), 1 + 2 + 6 + 5, "line tour cost");

	TSPInstance pair({{0, 0}, {3, 4}});
	TSPSolution pairTour = tspsolvers::solveNearestNeighbor(pair, 1);
	checks.check(pairTour.getOrder() == std::vector<city_id>({1, 0}), "two city tour");
	checks.checkNear(pairTour.getCost(), 10, "two city round trip");

	checks.checkThrows<InputError>([&square] { tspsolvers::solveNearestNeighbor(square, 4); }, "anchor too large");
	checks.checkThrows<InputError>([&square] { tspsolvers::solveNearestNeighbor(square, -1); }, "negative anchor");
	return checks.exitCode();
}
