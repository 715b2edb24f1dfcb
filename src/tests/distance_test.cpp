#include <cmath>
#include <limits>
#include <vector>
#include <tsp_instance.hpp>
#include <tsp_errors.hpp>
#include "test_checks.hpp"

int main() {
	TestChecks checks("distance_test");

	TSPInstance pair({{0, 0}, {3, 4}});
	checks.check(pair.getCityCount() == 2, "two cities are accepted");
	checks.check(pair.getArcCount() == 2, "two cities have two arcs");
	checks.checkNear(pair.getDistance(0, 1), 5, "distance (0,0) -> (3,4)");
	checks.checkNear(pair.getDistance(1, 0), 5, "distance (3,4) -> (0,0)");
	checks.checkNear(pair.getDistance(Arc(1, 1)), 0, "distance of a city to itself");

	TSPInstance square({{0, 0}, {0, 10}, {10, 10}, {10, 0}});
	checks.check(square.getArcCount() == 12, "four cities have n*(n-1) arcs");
	checks.check(square.isSymmetric(), "euclidean instance is symmetric");
	for (city_id a = 0; a < square.getCityCount(); ++a) {
		for (city_id b = 0; b < square.getCityCount(); ++b) {
			const City& ca = square.getCity(a);
			const City& cb = square.getCity(b);
			double expected = std::sqrt((ca.x - cb.x) * (ca.x - cb.x) + (ca.y - cb.y) * (ca.y - cb.y));
			checks.checkNear(square.getDistance(a, b), expected,
							 "square distance " + std::to_string(a) + " -> " + std::to_string(b));
		}
	}

	checks.checkThrows<InputError>([] { TSPInstance(std::vector<City>{}); }, "zero cities");
	checks.checkThrows<InputError>([] { TSPInstance(std::vector<City>{{1, 2}}); }, "one city");
	checks.checkThrows<InputError>([] {
		TSPInstance(std::vector<City>{{0, 0}, {std::numeric_limits<double>::quiet_NaN(), 1}});
	}, "NaN coordinate");
	checks.checkThrows<InputError>([] {
		TSPInstance(std::vector<City>{{0, 0}, {std::numeric_limits<double>::infinity(), 1}});
	}, "infinite coordinate");
	checks.checkThrows<InputError>([&square] { square.getDistance(0, 4); }, "target index out of range");
	checks.checkThrows<InputError>([&square] { square.getDistance(-1, 2); }, "source index out of range");
	checks.checkThrows<InputError>([&square] { square.getCity(7); }, "city index out of range");

	TSPInstance oneWay(std::vector<std::vector<cost_t>>{{0, 1, 5}, {2, 0, 1}, {3, 4, 0}}, "asymmetric");
	checks.check(!oneWay.isSymmetric(), "explicit matrix keeps its direction");
	checks.checkNear(oneWay.getDistance(0, 2), 5, "explicit distance 0 -> 2");
	checks.checkNear(oneWay.getDistance(2, 0), 3, "explicit distance 2 -> 0");
	checks.check(!oneWay.hasCoordinates(), "explicit instance has no coordinates");
	checks.checkThrows<InputError>([&oneWay] { oneWay.getCity(0); }, "coordinates of an explicit instance");
	checks.checkThrows<InputError>([] {
		TSPInstance(std::vector<std::vector<cost_t>>{{0, 1}, {1}}, "ragged");
	}, "ragged distance matrix");
	checks.checkThrows<InputError>([] {
		TSPInstance(std::vector<std::vector<cost_t>>{{0, -1}, {1, 0}}, "negative");
	}, "negative distance");
	checks.checkThrows<InputError>([] {
		TSPInstance(std::vector<std::vector<cost_t>>{{0}}, "single");
	}, "explicit matrix with one city");
	return checks.exitCode();
}
